/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../otpcore/crypto/Crypto.hpp"
#include "../otpcore/crypto/Random.hpp"
#include <catch2/catch.hpp>
#include <iomanip>
#include <sstream>

static std::string
hexString(otpcore::DataSlice data)
{
    std::ostringstream out;
    out << std::hex << std::setfill('0');
    for (auto c: data)
        out << std::setw(2) << static_cast<unsigned>(c);
    return out.str();
}

TEST_CASE("HMAC test vectors", "[crypto][hmac]")
{
    const std::string key = "Jefe";
    const std::string data = "what do ya want for nothing?";
    otpcore::DataChunk mac;

    SECTION("SHA-1")
    {
        REQUIRE(otpcore::hmac(mac, otpcore::HashType::sha1, key, data));
        REQUIRE(hexString(mac) == "effcdf6ae5eb2fa2d27416d5f184df9c259a7c79");
    }
    SECTION("SHA-256")
    {
        REQUIRE(otpcore::hmac(mac, otpcore::HashType::sha256, key, data));
        REQUIRE(hexString(mac) ==
                "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
    }
    SECTION("SHA-512")
    {
        REQUIRE(otpcore::hmac(mac, otpcore::HashType::sha512, key, data));
        REQUIRE(hexString(mac) ==
                "164b7a7bfcf819e2e395fbe73b56e0a387bd64222e831fd610270cd7ea250554"
                "9758bf75c05a994a6d034f65f8f0e6fdcaeab1a34d4a6b4b636e070a38bce737");
    }
}

TEST_CASE("Hash names", "[crypto][hmac]")
{
    otpcore::HashType type;
    REQUIRE(otpcore::hashTypeDecode(type, "SHA-256"));
    REQUIRE(type == otpcore::HashType::sha256);
    REQUIRE(otpcore::hashTypeDecode(type, "sha512"));
    REQUIRE(type == otpcore::HashType::sha512);
    REQUIRE(otpcore::hashTypeDecode(type, "Sha1"));
    REQUIRE(type == otpcore::HashType::sha1);

    auto s = otpcore::hashTypeDecode(type, "MD5");
    REQUIRE_FALSE(s);
    REQUIRE(s.value() == OTP_CC_InvalidArgument);

    REQUIRE(std::string(otpcore::hashTypeName(otpcore::HashType::sha1)) == "SHA-1");
    REQUIRE(std::string(otpcore::hashTypeName(otpcore::HashType::sha512)) == "SHA-512");
}

TEST_CASE("Constant-time comparison", "[crypto]")
{
    REQUIRE(otpcore::equalConstTime(std::string("287082"), std::string("287082")));
    REQUIRE_FALSE(otpcore::equalConstTime(std::string("287082"), std::string("287083")));
    REQUIRE_FALSE(otpcore::equalConstTime(std::string("287082"), std::string("28708")));
    REQUIRE(otpcore::equalConstTime(std::string(), std::string()));
}

TEST_CASE("Random data", "[crypto][random]")
{
    otpcore::DataChunk a, b;
    REQUIRE(otpcore::randomData(a, 32));
    REQUIRE(otpcore::randomData(b, 32));
    REQUIRE(a.size() == 32);
    REQUIRE(a != b);

    REQUIRE(otpcore::randomData(a, 0));
    REQUIRE(a.empty());
}
