/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "TimeStep.hpp"

namespace otpcore {

time_t
systemTime()
{
    return time(nullptr);
}

/**
 * Reads the clock, refusing times before the epoch.
 */
static Status
readClock(uint64_t &result, unsigned period, const TimeSource &now)
{
    if (!period)
        return OTP_ERROR(OTP_CC_InvalidPeriod, "The period must be positive");

    const time_t t = now ? now() : systemTime();
    if (t < 0)
        return OTP_ERROR(OTP_CC_InvalidPeriod, "The clock is before 1970");

    result = static_cast<uint64_t>(t);
    return Status();
}

Status
timeCounter(uint64_t &result, unsigned period, const TimeSource &now)
{
    uint64_t t;
    OTP_CHECK(readClock(t, period, now));
    result = t / period;
    return Status();
}

Status
timeLeft(unsigned &result, unsigned period, const TimeSource &now)
{
    uint64_t t;
    OTP_CHECK(readClock(t, period, now));
    result = period - static_cast<unsigned>(t % period);
    return Status();
}

Status
skewAllowance(OtpSkew &result, unsigned period, unsigned threshold,
    const TimeSource &now)
{
    unsigned remaining;
    OTP_CHECK(timeLeft(remaining, period, now));
    const unsigned elapsed = period - remaining;

    result.left = elapsed < threshold ? 1 : 0;
    result.right = remaining < threshold ? 1 : 0;
    return Status();
}

} // namespace otpcore
