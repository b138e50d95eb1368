/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../Command.hpp"
#include "../Config.hpp"
#include "../../otpcore/otp/Otp.hpp"
#include "../../otpcore/otp/Provisioning.hpp"
#include <iostream>
#include <errno.h>
#include <stdlib.h>

using namespace otpcore;

/**
 * Parses a non-negative decimal command-line argument.
 */
static Status
parseCount(uint64_t &result, const char *text)
{
    char *end = nullptr;
    errno = 0;
    const auto value = strtoull(text, &end, 10);
    if (!*text || *end || '-' == *text || errno)
        return OTP_ERROR(OTP_CC_ParseError,
                         "Not a number: " + std::string(text));
    result = value;
    return Status();
}

COMMAND(InitLevel::config, OtpNew, "new",
        " <issuer> <account>")
{
    if (argc != 2)
        return OTP_ERROR(OTP_CC_Error, helpString(*this));
    const auto issuer = argv[0];
    const auto account = argv[1];

    std::string secret;
    OTP_CHECK(randomSecret(secret));

    UrlOptions options;
    if (OTP_DEFAULT_DIGITS != session.digits)
        options.digits = session.digits;
    if (OTP_DEFAULT_PERIOD != session.period)
        options.period = session.period;
    options.algorithm = session.algorithm;

    std::string url;
    OTP_CHECK(totpUrl(url, issuer, account, secret, options));

    ConfigJson json;
    OTP_CHECK(configLoad(json, session.configPath, false));
    OTP_CHECK(json.secretSet(secret.c_str()));
    OTP_CHECK(json.issuerSet(issuer));
    OTP_CHECK(json.accountSet(account));
    OTP_CHECK(configSave(json, session.configPath));

    std::cout << "secret: " << secret << std::endl;
    std::cout << "url: " << url << std::endl;

    return Status();
}

COMMAND(InitLevel::config, OtpImport, "import",
        " <otpauth-uri>")
{
    if (argc != 1)
        return OTP_ERROR(OTP_CC_Error, helpString(*this));

    UrlInfo info;
    OTP_CHECK(totpUrlDecode(info, argv[0]));

    ConfigJson json;
    OTP_CHECK(configLoad(json, session.configPath, false));
    OTP_CHECK(json.secretSet(info.secret.c_str()));
    OTP_CHECK(json.issuerSet(info.issuer.c_str()));
    OTP_CHECK(json.accountSet(info.account.c_str()));
    OTP_CHECK(json.algorithmSet(hashTypeName(info.options.algorithm)));
    OTP_CHECK(json.digitsSet(info.options.digits ?
        info.options.digits : OTP_DEFAULT_DIGITS));
    OTP_CHECK(json.periodSet(info.options.period ?
        info.options.period : OTP_DEFAULT_PERIOD));

    // Refuse settings the next run could not load:
    Session check;
    OTP_CHECK(configApply(check, json));
    OTP_CHECK(configSave(json, session.configPath));

    std::cout << "issuer: " << info.issuer << std::endl;
    std::cout << "account: " << info.account << std::endl;

    return Status();
}

COMMAND(InitLevel::secret, OtpCode, "code",
        " [<counter>]")
{
    if (argc > 1)
        return OTP_ERROR(OTP_CC_Error, helpString(*this));

    std::string code;
    if (argc == 1)
    {
        uint64_t counter;
        OTP_CHECK(parseCount(counter, argv[0]));

        HotpOptions options;
        options.digits = session.digits;
        options.algorithm = session.algorithm;
        OTP_CHECK(hotpGenerate(code, counter, session.secret, options));
    }
    else
    {
        TotpOptions options;
        options.digits = session.digits;
        options.algorithm = session.algorithm;
        options.period = session.period;
        OTP_CHECK(totpGenerate(code, session.secret, options));
    }
    std::cout << code << std::endl;

    return Status();
}

COMMAND(InitLevel::secret, OtpVerify, "verify",
        " <code> [<counter>]")
{
    if (argc < 1 || argc > 2)
        return OTP_ERROR(OTP_CC_Error, helpString(*this));
    const auto code = argv[0];

    TotpVerifyOptions options;
    options.digits = session.digits;
    options.algorithm = session.algorithm;
    options.period = session.period;
    options.skew = session.skew;

    bool valid = false;
    if (argc == 2)
    {
        uint64_t counter;
        OTP_CHECK(parseCount(counter, argv[1]));
        OTP_CHECK(hotpVerify(valid, code, counter, session.secret, options));
    }
    else
    {
        if (!options.skew.left && !options.skew.right)
            OTP_CHECK(skewAllowance(options.skew, options.period));
        OTP_CHECK(totpVerify(valid, code, session.secret, options));
    }
    std::cout << (valid ? "valid" : "invalid") << std::endl;

    return Status();
}

COMMAND(InitLevel::config, OtpTimeLeft, "time-left",
        "")
{
    if (argc != 0)
        return OTP_ERROR(OTP_CC_Error, helpString(*this));

    unsigned seconds;
    OTP_CHECK(timeLeft(seconds, session.period));
    std::cout << seconds << std::endl;

    return Status();
}

COMMAND(InitLevel::none, OtpBackup, "backup",
        " [<bytes>] [<group-by>] [<count>]")
{
    if (argc > 3)
        return OTP_ERROR(OTP_CC_Error, helpString(*this));

    uint64_t bytes = 10;
    uint64_t groupBy = 4;
    uint64_t count = 8;
    if (argc > 0)
        OTP_CHECK(parseCount(bytes, argv[0]));
    if (argc > 1)
        OTP_CHECK(parseCount(groupBy, argv[1]));
    if (argc > 2)
        OTP_CHECK(parseCount(count, argv[2]));
    if (1024 < bytes || 8 < groupBy || 1024 < count)
        return OTP_ERROR(OTP_CC_InvalidArgument, "Backup code options out of range");

    std::vector<std::string> codes;
    OTP_CHECK(backupCodes(codes, count, bytes, groupBy));
    for (const auto &code: codes)
        std::cout << code << std::endl;

    return Status();
}
