/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Luhn.hpp"

namespace otpcore {

// Digit sums of 2 * d for d = 0..9:
static const unsigned luhnDoubled[] = {0, 2, 4, 6, 8, 1, 3, 5, 7, 9};

Status
luhnChecksum(unsigned &result, const std::string &digits)
{
    unsigned sum = 0;
    bool doubled = true; // The rightmost payload digit gets doubled
    for (auto i = digits.rbegin(); i != digits.rend(); ++i)
    {
        if (*i < '0' || '9' < *i)
            return OTP_ERROR(OTP_CC_ParseError,
                             "Not a decimal digit: " + std::string(1, *i));

        const unsigned d = *i - '0';
        sum += doubled ? luhnDoubled[d] : d;
        doubled = !doubled;
    }

    result = (10 - sum % 10) % 10;
    return Status();
}

bool
luhnVerify(const std::string &digits)
{
    if (digits.size() < 2)
        return false;

    const char last = digits.back();
    if (last < '0' || '9' < last)
        return false;

    unsigned checksum;
    if (!luhnChecksum(checksum, digits.substr(0, digits.size() - 1)))
        return false;

    return checksum == static_cast<unsigned>(last - '0');
}

} // namespace otpcore
