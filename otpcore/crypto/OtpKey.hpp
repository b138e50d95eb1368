/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef OTPCORE_CRYPTO_OTPKEY_HPP
#define OTPCORE_CRYPTO_OTPKEY_HPP

#include "Crypto.hpp"
#include "../util/Data.hpp"
#include "../util/Status.hpp"

namespace otpcore {

/**
 * Implements the HOTP algorithm defined by rfc4226.
 * The rfc6238 time-based layer lives in otp/Otp.hpp.
 */
class OtpKey
{
public:
    OtpKey() {}
    OtpKey(DataSlice key): key_(key.begin(), key.end()) {}
    ~OtpKey();

    /**
     * Initializes the key with random data.
     */
    Status
    create(size_t keySize=OTP_DEFAULT_SECRET_BYTES);

    /**
     * Initializes the key with a base32-encoded string.
     */
    Status
    decodeBase32(const std::string &key);

    /**
     * Produces a counter-based password.
     * Fails if the key is shorter than OTP_MIN_SECRET_BYTES,
     * or if digits is outside OTP_MIN_DIGITS..OTP_MAX_DIGITS.
     */
    Status
    hotp(std::string &result, uint64_t counter,
        unsigned digits=OTP_DEFAULT_DIGITS, HashType type=HashType::sha1) const;

    /**
     * Encodes the key as a base32 string.
     */
    std::string
    encodeBase32(bool padding=false) const;

    /**
     * Obtains access to the underlying binary key.
     */
    DataSlice
    key() const { return key_; }

private:
    DataChunk key_;
};

} // namespace otpcore

#endif
