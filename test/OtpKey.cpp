/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../otpcore/crypto/OtpKey.hpp"
#include "../otpcore/crypto/Encoding.hpp"
#include <catch2/catch.hpp>

TEST_CASE("RFC 4226 test vectors", "[crypto][otp]" )
{
    std::string secretData = "12345678901234567890";
    otpcore::OtpKey key(secretData);

    const char *cases[] =
    {
        "755224",
        "287082",
        "359152",
        "969429",
        "338314",
        "254676",
        "287922",
        "162583",
        "399871",
        "520489"
    };
    int i = 0;
    for (auto test: cases)
    {
        std::string code;
        REQUIRE(key.hotp(code, i));
        REQUIRE(code == test);
        ++i;
    }
}

TEST_CASE("Ten-digit HOTP codes", "[crypto][otp]" )
{
    std::string secretData = "12345678901234567890";
    otpcore::OtpKey key(secretData);

    std::string code;
    REQUIRE(key.hotp(code, 0, 10));
    REQUIRE(code == "1284755224");
    REQUIRE(key.hotp(code, 1, 10));
    REQUIRE(code == "1094287082");
    REQUIRE(key.hotp(code, 2, 10));
    REQUIRE(code == "0137359152");
}

TEST_CASE("Leading zeros in OTP output", "[crypto][otp]" )
{
    otpcore::OtpKey key;
    REQUIRE(key.decodeBase32("AAAAAAAAAAAAAAAA"));

    std::string code;
    REQUIRE(key.hotp(code, 2));
    REQUIRE(code == "073348");
    REQUIRE(key.hotp(code, 9));
    REQUIRE(code == "003773");
}

TEST_CASE("Short secrets are refused", "[crypto][otp]" )
{
    otpcore::OtpKey key;
    REQUIRE(key.decodeBase32("AAAAAAAA"));
    REQUIRE(key.key().size() == 5);

    std::string code = "unchanged";
    auto s = key.hotp(code, 0);
    REQUIRE_FALSE(s);
    REQUIRE(s.value() == OTP_CC_WeakSecret);
    REQUIRE(code == "unchanged");

    otpcore::OtpKey empty;
    REQUIRE(empty.hotp(code, 0).value() == OTP_CC_WeakSecret);
}

TEST_CASE("OTP digit range", "[crypto][otp]" )
{
    std::string secretData = "12345678901234567890";
    otpcore::OtpKey key(secretData);

    std::string code;
    REQUIRE(key.hotp(code, 1, 7));
    REQUIRE(code == "4287082");
    REQUIRE(key.hotp(code, 1, 8));
    REQUIRE(code == "94287082");

    REQUIRE(key.hotp(code, 1, 5).value() == OTP_CC_InvalidCodeLength);
    REQUIRE(key.hotp(code, 1, 11).value() == OTP_CC_InvalidCodeLength);
    REQUIRE(key.hotp(code, 1, 0).value() == OTP_CC_InvalidCodeLength);
}

TEST_CASE("OTP key creation", "[crypto][otp]" )
{
    otpcore::OtpKey key;
    REQUIRE(key.create());
    REQUIRE(key.key().size() == OTP_DEFAULT_SECRET_BYTES);

    const auto text = key.encodeBase32();
    REQUIRE(text.size() == 16);

    otpcore::OtpKey copy;
    REQUIRE(copy.decodeBase32(text));
    REQUIRE(otpcore::toString(copy.key()) == otpcore::toString(key.key()));

    std::string code;
    REQUIRE(key.hotp(code, 0));
    REQUIRE(code.size() == 6);
}
