/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Encoding.hpp"
#include <array>

namespace otpcore {

static const char base32Sym[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";

/**
 * Maps each ASCII character to its 5-bit value, or -1 if it is not
 * part of the alphabet. Lowercase letters map like uppercase ones.
 */
static std::array<int8_t, 256>
base32Table()
{
    std::array<int8_t, 256> table;
    table.fill(-1);
    for (int i = 0; i < 32; ++i)
    {
        const auto c = static_cast<unsigned char>(base32Sym[i]);
        table[c] = i;
        if ('A' <= c && c <= 'Z')
            table[c - 'A' + 'a'] = i;
    }
    return table;
}

std::string
base32Encode(DataSlice data, bool padding)
{
    std::string out;
    auto chunks = (data.size() + 4) / 5; // Rounding up
    out.reserve(8 * chunks);

    auto i = data.begin();
    uint16_t buffer = 0; // Bits waiting to be written out, MSB first
    int bits = 0; // Number of bits currently in the buffer
    while (i != data.end() || 0 < bits)
    {
        // Reload the buffer if we need more bits:
        if (i != data.end() && bits < 5)
        {
            buffer |= *i++ << (8 - bits);
            bits += 8;
        }

        // Write out 5 most-significant bits in the buffer:
        out += base32Sym[buffer >> 11];
        buffer <<= 5;
        bits -= 5;
    }

    // Pad the final string to a multiple of 8 characters long:
    if (padding)
        out.append(-out.size() % 8, '=');
    return out;
}

Status
base32Decode(DataChunk &result, const std::string &in)
{
    static const auto table = base32Table();

    DataChunk out;
    out.reserve(5 * (in.size() + 7) / 8);

    uint16_t buffer = 0; // Bits waiting to be written out, MSB first
    int bits = 0; // Number of bits currently in the buffer
    for (size_t i = 0; i < in.size(); ++i)
    {
        // Padding marks the end of the data:
        if ('=' == in[i])
            break;

        // Read one character from the string:
        int value = table[static_cast<unsigned char>(in[i])];
        if (value < 0)
            return OTP_ERROR(OTP_CC_Base32Error,
                             "Invalid base32 character '" + std::string(1, in[i]) +
                             "' at position " + std::to_string(i));

        // Append the bits to the buffer:
        buffer |= value << (11 - bits);
        bits += 5;

        // Write out some bits if the buffer has a byte's worth:
        if (8 <= bits)
        {
            out.push_back(buffer >> 8);
            buffer <<= 8;
            bits -= 8;
        }
    }

    // Any extra bits are dropped (rfc4648 decoders can be liberal here).
    result = std::move(out);
    return Status();
}

} // namespace otpcore
