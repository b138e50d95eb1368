/*
 * Copyright (c) 2014, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * OpenSSL keyed-hash wrappers.
 */

#ifndef OTPCORE_CRYPTO_CRYPTO_HPP
#define OTPCORE_CRYPTO_CRYPTO_HPP

#include "../util/Data.hpp"
#include "../util/Status.hpp"

namespace otpcore {

/**
 * Hash functions available for HMAC.
 */
enum class HashType
{
    sha1,
    sha256,
    sha512
};

/**
 * Returns the rfc6238 name for a hash ("SHA-1", "SHA-256", "SHA-512").
 */
const char *
hashTypeName(HashType type);

/**
 * Parses a hash name. Accepts "SHA-1" and "SHA1" spellings in any case.
 */
Status
hashTypeDecode(HashType &result, const std::string &name);

/**
 * Computes HMAC(type, key, data).
 * The result is 20, 32 or 64 bytes long depending on the hash.
 */
Status
hmac(DataChunk &result, HashType type, DataSlice key, DataSlice data);

/**
 * Compares two buffers in time that depends only on their length.
 */
bool
equalConstTime(DataSlice a, DataSlice b);

} // namespace otpcore

#endif
