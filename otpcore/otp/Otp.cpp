/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Otp.hpp"
#include "../crypto/OtpKey.hpp"
#include <algorithm>
#include <limits>

namespace otpcore {

static Status
checkStep(bool &result, const OtpKey &key, const std::string &code,
    uint64_t counter, unsigned digits, HashType algorithm)
{
    std::string expected;
    OTP_CHECK(key.hotp(expected, counter, digits, algorithm));
    result = equalConstTime(expected, code);
    return Status();
}

Status
hotpGenerate(std::string &result, uint64_t counter,
    const std::string &secret, const HotpOptions &options)
{
    OtpKey key;
    OTP_CHECK(key.decodeBase32(secret));
    OTP_CHECK(key.hotp(result, counter, options.digits, options.algorithm));
    return Status();
}

Status
hotpVerify(bool &result, const std::string &code, uint64_t counter,
    const std::string &secret, const HotpVerifyOptions &options)
{
    if (code.size() < OTP_MIN_DIGITS || OTP_MAX_DIGITS < code.size())
        return OTP_ERROR(OTP_CC_InvalidCodeLength,
                         "Code length must be between 6 and 10 digits, got " +
                         std::to_string(code.size()));

    if (options.strictDigits)
    {
        if (!options.digits)
            return OTP_ERROR(OTP_CC_InvalidCodeLength,
                             "Strict digits needs an expected digit count");

        if (code.size() != options.digits)
        {
            result = false;
            return Status();
        }
    }

    if (OTP_MAX_SKEW < options.skew.left || OTP_MAX_SKEW < options.skew.right)
        return OTP_ERROR(OTP_CC_InvalidArgument,
                         "Skew window is limited to " +
                         std::to_string(OTP_MAX_SKEW) + " steps each way");

    OtpKey key;
    OTP_CHECK(key.decodeBase32(secret));

    const unsigned digits = code.size();
    const uint64_t max = std::numeric_limits<uint64_t>::max();
    const uint64_t steps = std::max(options.skew.left, options.skew.right);

    // Order: counter, counter - 1, counter + 1, counter - 2, counter + 2...
    // Steps that would leave the range of uint64_t are left out.
    bool match;
    OTP_CHECK(checkStep(match, key, code, counter, digits, options.algorithm));
    for (uint64_t i = 1; i <= steps && !match; ++i)
    {
        if (i <= options.skew.left && i <= counter)
            OTP_CHECK(checkStep(match, key, code, counter - i, digits,
                options.algorithm));
        if (!match && i <= options.skew.right && i <= max - counter)
            OTP_CHECK(checkStep(match, key, code, counter + i, digits,
                options.algorithm));
    }

    result = match;
    return Status();
}

Status
totpGenerate(std::string &result, const std::string &secret,
    const TotpOptions &options)
{
    uint64_t counter;
    OTP_CHECK(timeCounter(counter, options.period, options.now));
    return hotpGenerate(result, counter, secret, options);
}

Status
totpVerify(bool &result, const std::string &code, const std::string &secret,
    const TotpVerifyOptions &options)
{
    uint64_t counter;
    OTP_CHECK(timeCounter(counter, options.period, options.now));
    return hotpVerify(result, code, counter, secret, options);
}

} // namespace otpcore
