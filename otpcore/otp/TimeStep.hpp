/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Wall-clock helpers for the time-based password layer.
 */

#ifndef OTPCORE_OTP_TIME_STEP_HPP
#define OTPCORE_OTP_TIME_STEP_HPP

#include "../util/Status.hpp"
#include <functional>
#include <time.h>

namespace otpcore {

/**
 * Returns the current Unix time in seconds.
 * Tests substitute their own function to pin the clock.
 * An empty TimeSource means the system clock.
 */
typedef std::function<time_t ()> TimeSource;

time_t
systemTime();

/**
 * Steps to search before and after a reference counter.
 */
struct OtpSkew
{
    unsigned left = 0;
    unsigned right = 0;
};

/**
 * Derives the TOTP counter, floor(now / period).
 */
Status
timeCounter(uint64_t &result, unsigned period,
    const TimeSource &now=TimeSource());

/**
 * Seconds remaining before the next period starts, in (0, period].
 */
Status
timeLeft(unsigned &result, unsigned period=OTP_DEFAULT_PERIOD,
    const TimeSource &now=TimeSource());

/**
 * Recommends one extra step of skew on whichever side of the period
 * boundary is closer than `threshold` seconds, and none otherwise.
 */
Status
skewAllowance(OtpSkew &result, unsigned period=OTP_DEFAULT_PERIOD,
    unsigned threshold=OTP_DEFAULT_SKEW_THRESHOLD,
    const TimeSource &now=TimeSource());

} // namespace otpcore

#endif
