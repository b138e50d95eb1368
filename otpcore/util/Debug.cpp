/*
 *  Copyright (c) 2015, AirBitz, Inc.
 *  All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Debug.hpp"
#include "FileIO.hpp"
#include <stdarg.h>
#include <stdio.h>
#include <time.h>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <vector>

namespace otpcore {

#define MAX_LOG_SIZE (1 << 19) // Max size 512 KiB

static std::mutex gDebugMutex;
static FILE *gLogFile = nullptr;
static std::string gLogPath;

/**
 * Moves the current log aside and opens a fresh one.
 * Must be called with gDebugMutex held.
 */
static Status
debugLogRotate()
{
    if (gLogFile)
        fclose(gLogFile);
    gLogFile = nullptr;

    const auto oldPath = gLogPath + ".prev";
    if (fileExists(gLogPath))
        rename(gLogPath.c_str(), oldPath.c_str());

    gLogFile = fopen(gLogPath.c_str(), "w");
    if (!gLogFile)
        return OTP_ERROR(OTP_CC_SysError, "Cannot open " + gLogPath);

    return Status();
}

Status
debugInitialize(const std::string &logPath)
{
    std::lock_guard<std::mutex> lock(gDebugMutex);
    gLogPath = logPath;
    if (!gLogPath.empty())
        OTP_CHECK(debugLogRotate());

    return Status();
}

void
debugTerminate()
{
    std::lock_guard<std::mutex> lock(gDebugMutex);
    if (gLogFile)
        fclose(gLogFile);
    gLogFile = nullptr;
    gLogPath.clear();
}

void OTP_DebugLog(const char *format, ...)
{
#ifdef DEBUG
    time_t t = time(nullptr);
    struct tm utc;
    gmtime_r(&t, &utc);

    std::stringstream date;
    date << std::setfill('0');
    date << std::setw(4) << utc.tm_year + 1900 << '-';
    date << std::setw(2) << utc.tm_mon + 1 << '-';
    date << std::setw(2) << utc.tm_mday << ' ';
    date << std::setw(2) << utc.tm_hour << ':';
    date << std::setw(2) << utc.tm_min << ':';
    date << std::setw(2) << utc.tm_sec << " OTP_Log: ";

    // Get the message length:
    va_list args;
    va_start(args, format);
    char temp[1];
    int size = vsnprintf(temp, sizeof(temp), format, args);
    va_end(args);
    if (size < 0)
        return;

    // Format the message:
    va_start(args, format);
    std::vector<char> message(size + 1);
    vsnprintf(message.data(), message.size(), format, args);
    va_end(args);

    // Put the pieces together:
    std::string out = date.str();
    out.append(message.begin(), message.end() - 1);
    if (out.back() != '\n')
        out.append(1, '\n');

    fputs(out.c_str(), stderr);

    std::lock_guard<std::mutex> lock(gDebugMutex);
    if (gLogFile && MAX_LOG_SIZE < ftell(gLogFile))
    {
        // Cannot go through Status::log here, since we hold the lock:
        Status s = debugLogRotate();
        if (!s)
        {
            std::stringstream ss;
            ss << s << '\n';
            fputs(ss.str().c_str(), stderr);
        }
    }

    if (gLogFile)
    {
        fwrite(out.c_str(), 1, out.size(), gLogFile);
        fflush(gLogFile);
    }
#else
    (void)format;
#endif
}

} // namespace otpcore
