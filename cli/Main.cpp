/*
 * Copyright (c) 2014, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Command.hpp"
#include "Config.hpp"
#include "../otpcore/util/Debug.hpp"
#include <iostream>
#include <getopt.h>

using namespace otpcore;

/**
 * The main program body.
 */
static Status run(int argc, char *argv[])
{
    // Parse out the command-line options:
    std::string configFile;
    std::string secret;
    bool wantHelp = false;

    static const struct option long_options[] =
    {
        {"config",      required_argument, nullptr, 'c'},
        {"secret",      required_argument, nullptr, 's'},
        {"help",        no_argument,       nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };
    opterr = 0;
    int c;
    while (-1 != (c = getopt_long(argc, argv, "c:hs:", long_options, nullptr)))
    {
        switch (c)
        {
        case 'c':
            configFile = optarg;
            break;
        case 'h':
            wantHelp = true;
            break;
        case 's':
            secret = optarg;
            break;
        case '?':
            if (optopt == 'c')
                return OTP_ERROR(OTP_CC_Error, "-c requires a settings file");
            else if (optopt == 's')
                return OTP_ERROR(OTP_CC_Error, "-s requires a base32 secret");
            else
                return OTP_ERROR(OTP_CC_Error, "Unknown option '-" +
                                 std::string(1, static_cast<char>(optopt)) + "'");
        default:
            return OTP_ERROR(OTP_CC_Error, "Bad option parsing");
        }
    }

    // At this point, all non-option arguments should be out of the list:
    argc -= optind;
    argv += optind;

    // Find the command:
    if (argc < 1)
    {
        std::cout << "otp-cli " << OTP_VERSION << std::endl;
        CommandRegistry::print();
        return Status();
    }
    const auto commandName = argv[0];
    --argc;
    ++argv;

    Command *command = CommandRegistry::find(commandName);
    if (!command)
        return OTP_ERROR(OTP_CC_Error,
                         "unknown command " + std::string(commandName));

    // If the user wants help, just print the string and return:
    if (wantHelp)
    {
        std::cout << helpString(*command) << std::endl;
        return Status();
    }

    // Populate the session up to the required level:
    Session session;
    if (InitLevel::config <= command->level())
    {
        session.configPath = configFile.empty() ? configPath() : configFile;

        ConfigJson json;
        OTP_CHECK(configLoad(json, session.configPath, !configFile.empty()));
        OTP_CHECK(configApply(session, json));
        if (json.logFileOk())
            debugInitialize(json.logFile()).log();
    }
    if (InitLevel::secret <= command->level())
    {
        if (!secret.empty())
            session.secret = secret;
        if (session.secret.empty())
            return OTP_ERROR(OTP_CC_Error, "No secret given, " +
                             helpString(*command));
    }

    // Invoke the command:
    Status s = (*command)(session, argc, argv);

    // Clean up:
    debugTerminate();
    return s;
}

int main(int argc, char *argv[])
{
    Status s = run(argc, argv);
    if (!s)
        std::cerr << s << std::endl;
    return s ? 0 : 1;
}
