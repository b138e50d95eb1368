/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../otpcore/crypto/Encoding.hpp"
#include <catch2/catch.hpp>

TEST_CASE("RFC 4648 base32 test vectors", "[crypto][base32]")
{
    struct TestCase
    {
        const char *data;
        const char *text;
    };
    TestCase cases[] =
    {
        {"", ""},
        {"f", "MY======"},
        {"fo", "MZXQ===="},
        {"foo", "MZXW6==="},
        {"foob", "MZXW6YQ="},
        {"fooba", "MZXW6YTB"},
        {"foobar", "MZXW6YTBOI======"}
    };

    // Encoding:
    for (auto &test: cases)
        REQUIRE(test.text == otpcore::base32Encode(std::string(test.data)));

    // Decoding:
    for (auto &test: cases)
    {
        otpcore::DataChunk result;
        REQUIRE(otpcore::base32Decode(result, test.text));
        REQUIRE(otpcore::toString(result) == test.data);
    }
}

TEST_CASE("Unpadded base32", "[crypto][base32]")
{
    REQUIRE(otpcore::base32Encode(std::string("f"), false) == "MY");
    REQUIRE(otpcore::base32Encode(std::string("foobar"), false) == "MZXW6YTBOI");
    REQUIRE(otpcore::base32Encode(std::string(""), false) == "");

    otpcore::DataChunk result;
    REQUIRE(otpcore::base32Decode(result, "MZXW6YTBOI"));
    REQUIRE(otpcore::toString(result) == "foobar");
}

TEST_CASE("Base32 decoding is case-insensitive", "[crypto][base32]")
{
    otpcore::DataChunk upper, lower, mixed;
    REQUIRE(otpcore::base32Decode(upper, "JBSWY3DPEHPK3PXP"));
    REQUIRE(otpcore::base32Decode(lower, "jbswy3dpehpk3pxp"));
    REQUIRE(otpcore::base32Decode(mixed, "JbSwY3dPeHpK3pXp"));
    REQUIRE(upper.size() == 10);
    REQUIRE(upper == lower);
    REQUIRE(upper == mixed);
}

TEST_CASE("Base32 decoding stops at padding", "[crypto][base32]")
{
    otpcore::DataChunk result;
    REQUIRE(otpcore::base32Decode(result, "MZXW6==="));
    REQUIRE(otpcore::toString(result) == "foo");

    // Anything after the first '=' is ignored:
    REQUIRE(otpcore::base32Decode(result, "MZXW6===garbage!"));
    REQUIRE(otpcore::toString(result) == "foo");

    REQUIRE(otpcore::base32Decode(result, "===="));
    REQUIRE(result.empty());
}

TEST_CASE("Bad base32 strings", "[crypto][base32]")
{
    otpcore::DataChunk result = {1, 2, 3};

    // Illegal characters:
    for (auto text: {"A0AAAAAA", "A1AAAAAA", "A8AAAAAA", "A9AAAAAA",
                     "AA AAAAA", "AA-AAAAA", "AA\xc3\xa9" "AAAA"})
    {
        auto s = otpcore::base32Decode(result, text);
        REQUIRE_FALSE(s);
        REQUIRE(s.value() == OTP_CC_Base32Error);
    }

    // The result is untouched on failure:
    REQUIRE(result == otpcore::DataChunk({1, 2, 3}));
}

TEST_CASE("Base32 output alphabet", "[crypto][base32]")
{
    otpcore::DataChunk data;
    for (unsigned i = 0; i < 256; ++i)
        data.push_back(i);

    const auto text = otpcore::base32Encode(data);
    REQUIRE(text.size() % 8 == 0);
    for (auto c: text)
    {
        const bool letter = 'A' <= c && c <= 'Z';
        const bool digit = '2' <= c && c <= '7';
        REQUIRE((letter || digit || '=' == c));
    }

    REQUIRE(text.substr(0, 16) == "AAAQEAYEAUDAOCAJ");
}

TEST_CASE("Base32 round trip", "[crypto][base32]")
{
    otpcore::DataChunk data;
    for (unsigned size = 0; size < 40; ++size)
    {
        otpcore::DataChunk decoded;
        REQUIRE(otpcore::base32Decode(decoded, otpcore::base32Encode(data)));
        REQUIRE(decoded == data);
        REQUIRE(otpcore::base32Decode(decoded,
                                      otpcore::base32Encode(data, false)));
        REQUIRE(decoded == data);

        data.push_back(static_cast<uint8_t>(size * 37 + 11));
    }
}
