/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef CLI_COMMAND_HPP
#define CLI_COMMAND_HPP

#include "../otpcore/crypto/Crypto.hpp"
#include "../otpcore/otp/TimeStep.hpp"
#include "../otpcore/util/Status.hpp"
#include <memory>

/**
 * Different levels of information that can be populated in the session.
 */
enum class InitLevel
{
    none = 0,   // Nothing needed beyond the arguments
    config,     // Settings from the config file
    secret      // Config settings plus a shared secret
};

/**
 * The main function fills this in as needed,
 * giving the commands access to the settings they need.
 */
struct Session
{
    std::string configPath;

    std::string secret;
    std::string issuer;
    std::string account;
    unsigned digits = OTP_DEFAULT_DIGITS;
    unsigned period = OTP_DEFAULT_PERIOD;
    otpcore::HashType algorithm = otpcore::HashType::sha1;
    otpcore::OtpSkew skew;
};

/**
 * The function prototype for commands.
 */
#define COMMAND_PROTO \
    operator ()(Session &session, int argc, char *argv[])

/**
 * Abstract base class for commands.
 */
class Command
{
public:
    virtual ~Command();
    virtual otpcore::Status COMMAND_PROTO = 0;
    virtual InitLevel level() const = 0;
    virtual const char *name() const = 0;
    virtual const char *help() const = 0;
};

/**
 * Inserts a new command in to the global command list.
 */
class CommandRegistry
{
public:
    CommandRegistry(const char *name, Command *c);

    /**
     * Finds a command in the global list.
     */
    static Command *
    find(const std::string &name);

    /**
     * Prints the list of commands.
     */
    static void
    print();
};

/**
 * Registers and defines new command.
 * Should be followed by the command implementation in curly braces.
 */
#define COMMAND(LEVEL, NAME, TEXT, HELP) \
    class NAME: public Command { \
        otpcore::Status COMMAND_PROTO override; \
        InitLevel level() const override { return LEVEL; } \
        const char *name() const override { return TEXT; } \
        const char *help() const override { return HELP; } \
    } implement##NAME; \
    CommandRegistry register##NAME(TEXT, &implement##NAME); \
    otpcore::Status NAME::COMMAND_PROTO

/**
 * Builds a documentation string for a command.
 */
std::string
helpString(const Command &command);

#endif
