/*
 * Copyright (c) 2014, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Crypto.hpp"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <algorithm>

namespace otpcore {

static const EVP_MD *
hashTypeMd(HashType type)
{
    switch (type)
    {
    case HashType::sha256:
        return EVP_sha256();
    case HashType::sha512:
        return EVP_sha512();
    case HashType::sha1:
    default:
        return EVP_sha1();
    }
}

const char *
hashTypeName(HashType type)
{
    switch (type)
    {
    case HashType::sha256:
        return "SHA-256";
    case HashType::sha512:
        return "SHA-512";
    case HashType::sha1:
    default:
        return "SHA-1";
    }
}

Status
hashTypeDecode(HashType &result, const std::string &name)
{
    // Normalize to uppercase without dashes:
    std::string clean;
    for (auto c: name)
    {
        if ('-' == c)
            continue;
        if ('a' <= c && c <= 'z')
            c = c - 'a' + 'A';
        clean += c;
    }

    if ("SHA1" == clean)
        result = HashType::sha1;
    else if ("SHA256" == clean)
        result = HashType::sha256;
    else if ("SHA512" == clean)
        result = HashType::sha512;
    else
        return OTP_ERROR(OTP_CC_InvalidArgument,
                         "Unsupported hash algorithm " + name);

    return Status();
}

Status
hmac(DataChunk &result, HashType type, DataSlice key, DataSlice data)
{
    DataChunk out(EVP_MAX_MD_SIZE);
    unsigned int size = 0;

    // OpenSSL rejects a NULL key pointer, even for empty keys:
    static const uint8_t emptyKey[1] = {0};
    const uint8_t *keyData = key.empty() ? emptyKey : key.data();

    if (!HMAC(hashTypeMd(type), keyData, static_cast<int>(key.size()),
              data.data(), data.size(), out.data(), &size))
        return OTP_ERROR(OTP_CC_SysError, "HMAC computation failed");

    out.resize(size);
    result = std::move(out);
    return Status();
}

bool
equalConstTime(DataSlice a, DataSlice b)
{
    if (a.size() != b.size())
        return false;
    if (a.empty())
        return true;
    return 0 == CRYPTO_memcmp(a.data(), b.data(), a.size());
}

} // namespace otpcore
