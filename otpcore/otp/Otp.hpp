/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Generation and verification of one-time passwords from base32 secrets.
 *
 * Verification never limits the number of attempts.
 * Callers must count failures per identity and lock out brute-forcing.
 */

#ifndef OTPCORE_OTP_OTP_HPP
#define OTPCORE_OTP_OTP_HPP

#include "TimeStep.hpp"
#include "../crypto/Crypto.hpp"
#include <string>

namespace otpcore {

struct HotpOptions
{
    unsigned digits = OTP_DEFAULT_DIGITS;
    HashType algorithm = HashType::sha1;
};

struct HotpVerifyOptions
{
    /**
     * Expected code length, or 0 for "whatever length was presented".
     * Required when strictDigits is set.
     */
    unsigned digits = 0;
    bool strictDigits = false;
    HashType algorithm = HashType::sha1;
    OtpSkew skew;
};

struct TotpOptions:
    public HotpOptions
{
    unsigned period = OTP_DEFAULT_PERIOD;
    TimeSource now;
};

struct TotpVerifyOptions:
    public HotpVerifyOptions
{
    unsigned period = OTP_DEFAULT_PERIOD;
    TimeSource now;
};

/**
 * Generates the counter-based code for a base32 secret.
 */
Status
hotpGenerate(std::string &result, uint64_t counter,
    const std::string &secret, const HotpOptions &options=HotpOptions());

/**
 * Checks a presented code against the counters in the skew window.
 * A code that is well-formed but wrong gives `result == false`;
 * a code that is not 6 to 10 characters long is an error.
 * Counters are tried in the order c, c-1, c+1, c-2, c+2...
 * Either side of the window may span at most OTP_MAX_SKEW steps.
 */
Status
hotpVerify(bool &result, const std::string &code, uint64_t counter,
    const std::string &secret,
    const HotpVerifyOptions &options=HotpVerifyOptions());

Status
totpGenerate(std::string &result, const std::string &secret,
    const TotpOptions &options=TotpOptions());

Status
totpVerify(bool &result, const std::string &code, const std::string &secret,
    const TotpVerifyOptions &options=TotpVerifyOptions());

} // namespace otpcore

#endif
