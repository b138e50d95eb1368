/*
 * Copyright (c) 2014, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "FileIO.hpp"
#include <sys/stat.h>
#include <unistd.h>

namespace otpcore {

Status
fileEnsureDir(const std::string &dir)
{
    if (!fileExists(dir))
    {
        if (mkdir(dir.c_str(), S_IRWXU))
            return OTP_ERROR(OTP_CC_SysError, "Could not create directory " + dir);
    }

    return Status();
}

bool
fileExists(const std::string &path)
{
    return 0 == access(path.c_str(), F_OK);
}

} // namespace otpcore
