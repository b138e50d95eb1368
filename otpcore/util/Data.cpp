/*
 * Copyright (c) 2014, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Data.hpp"
#include <openssl/crypto.h>

namespace otpcore {

std::string
toString(DataSlice slice)
{
    return std::string(reinterpret_cast<const char *>(slice.data()), slice.size());
}

void
dataClear(DataChunk &data)
{
    if (!data.empty())
        OPENSSL_cleanse(data.data(), data.size());
    data.clear();
}

} // namespace otpcore
