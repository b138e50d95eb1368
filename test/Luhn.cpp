/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../otpcore/util/Luhn.hpp"
#include <catch2/catch.hpp>

TEST_CASE("Luhn checksum", "[util][luhn]")
{
    unsigned checksum;
    REQUIRE(otpcore::luhnChecksum(checksum, "123456"));
    REQUIRE(checksum == 6);
    REQUIRE(otpcore::luhnChecksum(checksum, "7992739871"));
    REQUIRE(checksum == 3);
    REQUIRE(otpcore::luhnChecksum(checksum, "0"));
    REQUIRE(checksum == 0);

    auto s = otpcore::luhnChecksum(checksum, "12a456");
    REQUIRE_FALSE(s);
    REQUIRE(s.value() == OTP_CC_ParseError);
}

TEST_CASE("Luhn verification", "[util][luhn]")
{
    REQUIRE(otpcore::luhnVerify("1234566"));
    REQUIRE(otpcore::luhnVerify("79927398713"));
    REQUIRE_FALSE(otpcore::luhnVerify("79927398710"));
    REQUIRE_FALSE(otpcore::luhnVerify("1234567"));

    // Bad input is just invalid:
    REQUIRE_FALSE(otpcore::luhnVerify(""));
    REQUIRE_FALSE(otpcore::luhnVerify("0"));
    REQUIRE_FALSE(otpcore::luhnVerify("12x4566"));
    REQUIRE_FALSE(otpcore::luhnVerify("123456x"));
}
