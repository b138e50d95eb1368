/*
 *  Copyright (c) 2015, AirBitz, Inc.
 *  All rights reserved.
 */
#include "Status.hpp"
#include "Debug.hpp"
#include <sstream>
#include <string.h>

namespace otpcore {

Status::Status() :
    value_(OTP_CC_Ok),
    file_(""),
    function_(""),
    line_(0)
{
}

Status::Status(tOTP_CC value, std::string message,
    const char *file, const char *function, size_t line) :
    value_(value),
    message_(message),
    file_(file),
    function_(function),
    line_(line)
{
}

const Status &
Status::log() const
{
    if (!*this)
    {
        std::stringstream ss;
        ss << *this;
        OTP_DebugLog("%s", ss.str().c_str());
    }
    return *this;
}

void Status::toError(tOTP_Error &error) const
{
    error.code = value_;
    strncpy(error.szDescription, message_.c_str(), OTP_MAX_STRING_LENGTH);
    strncpy(error.szSourceFunc, function_, OTP_MAX_STRING_LENGTH);
    strncpy(error.szSourceFile, file_, OTP_MAX_STRING_LENGTH);
    error.nSourceLine = line_;

    error.szDescription[OTP_MAX_STRING_LENGTH] = 0;
    error.szSourceFunc[OTP_MAX_STRING_LENGTH] = 0;
    error.szSourceFile[OTP_MAX_STRING_LENGTH] = 0;
}

std::ostream &operator<<(std::ostream &output, const Status &s)
{
    output <<
        s.file() << ":" << s.line() << ": " << s.function() <<
        " returned error " << s.value() << " (" << s.message() << ")";
    return output;
}

} // namespace otpcore
