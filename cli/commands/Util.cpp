/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../Command.hpp"
#include "../../otpcore/crypto/Encoding.hpp"
#include "../../otpcore/util/Luhn.hpp"
#include <iostream>

using namespace otpcore;

COMMAND(InitLevel::none, Base32Encode, "base32-encode",
        " <text>")
{
    if (argc != 1)
        return OTP_ERROR(OTP_CC_Error, helpString(*this));

    std::cout << base32Encode(std::string(argv[0])) << std::endl;

    return Status();
}

COMMAND(InitLevel::none, Base32Decode, "base32-decode",
        " <base32>")
{
    if (argc != 1)
        return OTP_ERROR(OTP_CC_Error, helpString(*this));

    DataChunk data;
    OTP_CHECK(base32Decode(data, argv[0]));
    std::cout << toString(data) << std::endl;

    return Status();
}

COMMAND(InitLevel::none, LuhnChecksum, "luhn",
        " <digits>")
{
    if (argc != 1)
        return OTP_ERROR(OTP_CC_Error, helpString(*this));
    const std::string digits = argv[0];

    unsigned checksum;
    OTP_CHECK(luhnChecksum(checksum, digits));
    std::cout << "check digit: " << checksum << std::endl;
    std::cout << digits << checksum << std::endl;

    return Status();
}
