/*
 * Copyright (c) 2014, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef OTPCORE_CRYPTO_RANDOM_HPP
#define OTPCORE_CRYPTO_RANDOM_HPP

#include "../util/Data.hpp"
#include "../util/Status.hpp"

namespace otpcore {

/**
 * Fills a buffer with bytes from the OpenSSL CSPRNG.
 */
Status
randomData(DataChunk &result, size_t size);

} // namespace otpcore

#endif
