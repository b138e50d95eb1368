/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef OTPCORE_UTIL_LUHN_HPP
#define OTPCORE_UTIL_LUHN_HPP

#include "Status.hpp"

namespace otpcore {

/**
 * Computes the Luhn check digit to append to a string of decimal digits.
 */
Status
luhnChecksum(unsigned &result, const std::string &digits);

/**
 * Returns true if the final digit is the Luhn check digit of the rest.
 * Strings shorter than two digits, or with non-digits, never pass.
 */
bool
luhnVerify(const std::string &digits);

} // namespace otpcore

#endif
