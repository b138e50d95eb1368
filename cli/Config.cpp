/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Config.hpp"
#include "../otpcore/util/Debug.hpp"
#include "../otpcore/util/FileIO.hpp"
#include <initializer_list>
#include <stdlib.h>
#include <string.h>

using namespace otpcore;

std::string
configPath()
{
    // Mac: ~/Library/Application Support/otpcore/otpcore.conf
    // Unix: ~/.config/otpcore/otpcore.conf
    const char *home = getenv("HOME");
    if (!home || !strlen(home))
        home = "/";

#ifdef MAC_OSX
    return std::string(home) + "/Library/Application Support/otpcore/otpcore.conf";
#else
    return std::string(home) + "/.config/otpcore/otpcore.conf";
#endif
}

Status
configLoad(ConfigJson &result, const std::string &path, bool required)
{
    if (!required && !fileExists(path))
    {
        OTP_DebugLog("No settings file at %s", path.c_str());
        result.reset();
        return Status();
    }

    ConfigJson json;
    OTP_CHECK(json.load(path));
    OTP_CHECK(json.objectOk());

    result = json;
    return Status();
}

/**
 * Settings are optional, but must have the right type when present.
 */
static Status
configTypeOk(const ConfigJson &json, const char *key, json_type type)
{
    json_t *value = json_object_get(json.get(), key);
    if (value && type != json_typeof(value))
        return OTP_ERROR(OTP_CC_JSONError, "Bad JSON value for " + std::string(key));
    return Status();
}

Status
configApply(Session &session, const ConfigJson &json)
{
    for (auto key: {"secret", "issuer", "account", "algorithm", "logFile"})
        OTP_CHECK(configTypeOk(json, key, JSON_STRING));
    for (auto key: {"digits", "period", "skewLeft", "skewRight"})
        OTP_CHECK(configTypeOk(json, key, JSON_INTEGER));

    if (json.secretOk())
        session.secret = json.secret();
    if (json.issuerOk())
        session.issuer = json.issuer();
    if (json.accountOk())
        session.account = json.account();

    OTP_CHECK(hashTypeDecode(session.algorithm, json.algorithm()));

    const auto digits = json.digits();
    if (digits < OTP_MIN_DIGITS || OTP_MAX_DIGITS < digits)
        return OTP_ERROR(OTP_CC_InvalidCodeLength,
                         "Bad digits setting " + std::to_string(digits));
    session.digits = digits;

    const auto period = json.period();
    if (period < 1 || 86400 < period)
        return OTP_ERROR(OTP_CC_InvalidPeriod,
                         "Bad period setting " + std::to_string(period));
    session.period = period;

    const auto skewLeft = json.skewLeft();
    const auto skewRight = json.skewRight();
    if (skewLeft < 0 || skewRight < 0 ||
        OTP_MAX_SKEW < skewLeft || OTP_MAX_SKEW < skewRight)
        return OTP_ERROR(OTP_CC_JSONError, "Bad skew setting");
    session.skew.left = skewLeft;
    session.skew.right = skewRight;

    return Status();
}

Status
configSave(const ConfigJson &json, const std::string &path)
{
    // Create any missing directories above the file:
    for (auto slash = path.find('/', 1);
            std::string::npos != slash;
            slash = path.find('/', slash + 1))
    {
        OTP_CHECK(fileEnsureDir(path.substr(0, slash)));
    }

    OTP_CHECK(json.save(path));
    return Status();
}
