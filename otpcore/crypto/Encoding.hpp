/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef OTPCORE_CRYPTO_ENCODING_HPP
#define OTPCORE_CRYPTO_ENCODING_HPP

#include "../util/Data.hpp"
#include "../util/Status.hpp"

namespace otpcore {

/**
 * Encodes data into a base-32 string according to rfc4648.
 * @param padding Pad the output with '=' to a multiple of 8 characters.
 * Empty input always gives an empty string.
 */
std::string
base32Encode(DataSlice data, bool padding=true);

/**
 * Decodes a base-32 string as defined by rfc4648.
 * Letters may be in either case, and decoding stops at the first '='.
 * Trailing bits that do not fill a byte are dropped.
 * The result is untouched on failure.
 */
Status
base32Decode(DataChunk &result, const std::string &in);

} // namespace otpcore

#endif
