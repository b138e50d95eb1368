/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../otpcore/otp/TimeStep.hpp"
#include <catch2/catch.hpp>

static otpcore::TimeSource
fixedTime(time_t t)
{
    return [t]() { return t; };
}

TEST_CASE("Time counter", "[otp][time]")
{
    uint64_t counter;
    REQUIRE(otpcore::timeCounter(counter, 30, fixedTime(59)));
    REQUIRE(counter == 1);
    REQUIRE(otpcore::timeCounter(counter, 30, fixedTime(60)));
    REQUIRE(counter == 2);
    REQUIRE(otpcore::timeCounter(counter, 60, fixedTime(1234567890)));
    REQUIRE(counter == 20576131);

    REQUIRE(otpcore::timeCounter(counter, 0, fixedTime(59)).value() ==
            OTP_CC_InvalidPeriod);
    REQUIRE(otpcore::timeCounter(counter, 30, fixedTime(-1)).value() ==
            OTP_CC_InvalidPeriod);

    // The real clock works too:
    REQUIRE(otpcore::timeCounter(counter, 30));
    REQUIRE(0 < counter);
}

TEST_CASE("Time left in the period", "[otp][time]")
{
    unsigned left;

    REQUIRE(otpcore::timeLeft(left, 30, fixedTime(0)));
    REQUIRE(left == 30);
    REQUIRE(otpcore::timeLeft(left, 30, fixedTime(1)));
    REQUIRE(left == 29);
    REQUIRE(otpcore::timeLeft(left, 30, fixedTime(59)));
    REQUIRE(left == 1);
    REQUIRE(otpcore::timeLeft(left, 60, fixedTime(90)));
    REQUIRE(left == 30);

    REQUIRE(otpcore::timeLeft(left, 0, fixedTime(5)).value() ==
            OTP_CC_InvalidPeriod);

    REQUIRE(otpcore::timeLeft(left));
    REQUIRE(0 < left);
    REQUIRE(left <= 30);
}

TEST_CASE("Skew allowance near period edges", "[otp][time]")
{
    otpcore::OtpSkew skew;

    SECTION("start of the period")
    {
        REQUIRE(otpcore::skewAllowance(skew, 30, 10, fixedTime(3)));
        REQUIRE(skew.left == 1);
        REQUIRE(skew.right == 0);
    }
    SECTION("middle of the period")
    {
        REQUIRE(otpcore::skewAllowance(skew, 30, 10, fixedTime(15)));
        REQUIRE(skew.left == 0);
        REQUIRE(skew.right == 0);
    }
    SECTION("end of the period")
    {
        REQUIRE(otpcore::skewAllowance(skew, 30, 10, fixedTime(25)));
        REQUIRE(skew.left == 0);
        REQUIRE(skew.right == 1);
    }
    SECTION("threshold edges")
    {
        // 10 seconds elapsed is not under the threshold:
        REQUIRE(otpcore::skewAllowance(skew, 30, 10, fixedTime(10)));
        REQUIRE(skew.left == 0);
        // 10 seconds remaining is not either:
        REQUIRE(otpcore::skewAllowance(skew, 30, 10, fixedTime(20)));
        REQUIRE(skew.right == 0);
    }
    SECTION("short period")
    {
        REQUIRE(otpcore::skewAllowance(skew, 15, 10, fixedTime(7)));
        REQUIRE(skew.left == 1);
        REQUIRE(skew.right == 1);
    }
    SECTION("bad period")
    {
        REQUIRE(otpcore::skewAllowance(skew, 0, 10, fixedTime(7)).value() ==
                OTP_CC_InvalidPeriod);
    }
}
