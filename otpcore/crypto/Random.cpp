/*
 * Copyright (c) 2014, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Random.hpp"
#include <openssl/rand.h>

namespace otpcore {

Status
randomData(DataChunk &result, size_t size)
{
    DataChunk out(size);

    if (size && RAND_bytes(out.data(), static_cast<int>(size)) != 1)
        return OTP_ERROR(OTP_CC_SysError, "Random data generation failed");

    result = std::move(out);
    return Status();
}

} // namespace otpcore
