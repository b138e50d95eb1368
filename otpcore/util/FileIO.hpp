/*
 * Copyright (c) 2014, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Filesystem access functions
 */

#ifndef OTPCORE_UTIL_FILE_IO_HPP
#define OTPCORE_UTIL_FILE_IO_HPP

#include "Status.hpp"
#include <string>

namespace otpcore {

/**
 * Creates a directory if it does not already exist.
 * The parent directory must already exist.
 */
Status
fileEnsureDir(const std::string &dir);

/**
 * Returns true if the path exists.
 */
bool
fileExists(const std::string &path);

} // namespace otpcore

#endif
