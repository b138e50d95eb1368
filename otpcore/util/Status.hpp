/*
 *  Copyright (c) 2015, AirBitz, Inc.
 *  All rights reserved.
 */
#ifndef OTPCORE_UTIL_STATUS_HPP
#define OTPCORE_UTIL_STATUS_HPP

// We need tOTP_CC and tOTP_Error:
#include "../../src/OTP.h"
#include <ostream>
#include <string>

namespace otpcore {

/**
 * Describes the results of calling a core function,
 * which can be either success or failure.
 */
class Status
{
public:
    /**
     * Constructs a success status.
     */
    Status();

    /**
     * Constructs an error status.
     */
    Status(tOTP_CC value, std::string message,
        const char *file, const char *function, size_t line);

    // Read accessors:
    tOTP_CC value()             const { return value_; }
    std::string message()       const { return message_; }
    std::string file()          const { return file_; }
    std::string function()      const { return function_; }
    size_t line()               const { return line_; }

    /**
     * Returns true if the status code represents success.
     */
    explicit operator bool() const { return value_ == OTP_CC_Ok; }

    /**
     * Writes the error to the debug log, if it is one.
     * Returns the status unchanged, so calls can be chained.
     */
    const Status &log() const;

    /**
     * Unpacks this status into a tOTP_Error structure.
     */
    void toError(tOTP_Error &error) const;

private:
    // Error information:
    tOTP_CC value_;
    std::string message_;

    // Error location:
    const char *file_;
    const char *function_;
    size_t line_;
};

std::ostream &operator<<(std::ostream &output, const Status &s);

/**
 * Constructs an error status using the current source location.
 */
#define OTP_ERROR(value, message) \
    Status(value, message, __FILE__, __FUNCTION__, __LINE__)

/**
 * Checks a status code, and returns if it represents an error.
 */
#define OTP_CHECK(f) \
    do { \
        Status s = (f); \
        if (!s) return s; \
    } while (false)

/**
 * Use when a C API function calls a new-style otpcore::Status function.
 * The enclosing function needs `cc` and `pError` variables
 * and an `exit` label.
 */
#define OTP_CHECK_NEW(f) \
    do { \
        Status s = (f); \
        if (!s) { \
            if (pError) \
                s.toError(*pError); \
            cc = s.value(); \
            goto exit; \
        } \
    } while (false)

} // namespace otpcore

#endif
