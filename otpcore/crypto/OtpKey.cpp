/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "OtpKey.hpp"
#include "Encoding.hpp"
#include "Random.hpp"
#include <sstream>

namespace otpcore {

OtpKey::~OtpKey()
{
    dataClear(key_);
}

Status
OtpKey::create(size_t keySize)
{
    DataChunk key;
    OTP_CHECK(randomData(key, keySize));
    dataClear(key_);
    key_ = std::move(key);
    return Status();
}

Status
OtpKey::decodeBase32(const std::string &key)
{
    DataChunk out;
    OTP_CHECK(base32Decode(out, key));
    dataClear(key_);
    key_ = std::move(out);
    return Status();
}

Status
OtpKey::hotp(std::string &result, uint64_t counter,
    unsigned digits, HashType type) const
{
    if (key_.size() < OTP_MIN_SECRET_BYTES)
        return OTP_ERROR(OTP_CC_WeakSecret, "Secret too short: " +
                         std::to_string(key_.size()) + " bytes (minimum " +
                         std::to_string(OTP_MIN_SECRET_BYTES) + ")");
    if (digits < OTP_MIN_DIGITS || OTP_MAX_DIGITS < digits)
        return OTP_ERROR(OTP_CC_InvalidCodeLength,
                         "Digit count must be between 6 and 10, got " +
                         std::to_string(digits));

    // Do HMAC(key_, counter):
    DataArray<8> cb =
    {{
        static_cast<uint8_t>(counter >> 56),
        static_cast<uint8_t>(counter >> 48),
        static_cast<uint8_t>(counter >> 40),
        static_cast<uint8_t>(counter >> 32),
        static_cast<uint8_t>(counter >> 24),
        static_cast<uint8_t>(counter >> 16),
        static_cast<uint8_t>(counter >> 8),
        static_cast<uint8_t>(counter)
    }};
    DataChunk mac;
    OTP_CHECK(hmac(mac, type, key_, cb));

    // Calculate the truncated output:
    unsigned offset = mac.back() & 0xf;
    uint32_t p =
        (static_cast<uint32_t>(mac[offset]) << 24) |
        (static_cast<uint32_t>(mac[offset + 1]) << 16) |
        (static_cast<uint32_t>(mac[offset + 2]) << 8) |
        static_cast<uint32_t>(mac[offset + 3]);
    p &= 0x7fffffff;

    // Format as a fixed-width decimal number:
    std::stringstream ss;
    ss.width(digits);
    ss.fill('0');
    ss << p;
    auto s = ss.str();
    s.erase(0, s.size() - digits);

    result = s;
    return Status();
}

std::string
OtpKey::encodeBase32(bool padding) const
{
    return base32Encode(key_, padding);
}

} // namespace otpcore
