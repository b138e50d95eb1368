/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * The otp-cli settings file.
 */

#ifndef CLI_CONFIG_HPP
#define CLI_CONFIG_HPP

#include "Command.hpp"
#include "../otpcore/json/JsonObject.hpp"

struct ConfigJson:
    public otpcore::JsonObject
{
    OTP_JSON_CONSTRUCTORS(ConfigJson, JsonObject)

    OTP_JSON_STRING(secret, "secret", nullptr)
    OTP_JSON_STRING(issuer, "issuer", nullptr)
    OTP_JSON_STRING(account, "account", nullptr)
    OTP_JSON_STRING(algorithm, "algorithm", "SHA-1")
    OTP_JSON_STRING(logFile, "logFile", nullptr)
    OTP_JSON_INTEGER(digits, "digits", OTP_DEFAULT_DIGITS)
    OTP_JSON_INTEGER(period, "period", OTP_DEFAULT_PERIOD)
    OTP_JSON_INTEGER(skewLeft, "skewLeft", 0)
    OTP_JSON_INTEGER(skewRight, "skewRight", 0)
};

/**
 * The default settings file location, under $HOME.
 */
std::string
configPath();

/**
 * Loads the settings file.
 * A missing file is only an error if `required` is set,
 * and leaves the settings empty.
 */
otpcore::Status
configLoad(ConfigJson &result, const std::string &path, bool required);

/**
 * Copies the settings into the session, checking their ranges.
 */
otpcore::Status
configApply(Session &session, const ConfigJson &json);

/**
 * Writes the settings file, creating its directory if needed.
 */
otpcore::Status
configSave(const ConfigJson &json, const std::string &path);

#endif
