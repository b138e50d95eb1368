/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef OTPCORE_UTIL_DEBUG_HPP
#define OTPCORE_UTIL_DEBUG_HPP

#include "Status.hpp"

namespace otpcore {

/**
 * Starts mirroring log output to a file.
 * An existing file at that path is moved aside to `<path>.prev`.
 * An empty path leaves file logging off.
 */
Status
debugInitialize(const std::string &logPath);

void
debugTerminate();

void OTP_DebugLog(const char *format, ...)
#ifdef __GNUC__
    __attribute__((format(printf, 1, 2)))
#endif
    ;

} // namespace otpcore

#endif
