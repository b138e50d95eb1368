/*
 *  Copyright (c) 2014, Airbitz
 *  All rights reserved.
 *
 *  Redistribution and use in source and binary forms are permitted provided that
 *  the following conditions are met:
 *
 *  1. Redistributions of source code must retain the above copyright notice, this
 *  list of conditions and the following disclaimer.
 *  2. Redistributions in binary form must reproduce the above copyright notice,
 *  this list of conditions and the following disclaimer in the documentation
 *  and/or other materials provided with the distribution.
 *  3. Redistribution or use of modified source code requires the express written
 *  permission of Airbitz Inc.
 *
 *  THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS" AND
 *  ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED
 *  WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
 *  DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT OWNER OR CONTRIBUTORS BE LIABLE FOR
 *  ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES
 *  (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES;
 *  LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND
 *  ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
 *  (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 *  SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 *
 *  The views and conclusions contained in the software and documentation are those
 *  of the authors and should not be interpreted as representing official policies,
 *  either expressed or implied, of the Airbitz Project.
 */
/**
 * @file
 * One-time password core public API.
 * C callers only use functions found in this file.
 */

#ifndef OTP_h
#define OTP_h

#include <stdbool.h>
#include <stdint.h>

/** The maximum buffer length for default strings in the system */
#define OTP_MAX_STRING_LENGTH 256

#define OTP_VERSION "1.0.0"

/** Shortest secret key accepted for code generation, in bytes */
#define OTP_MIN_SECRET_BYTES 10

/** Code length limits. Only 6 and 8 work with most authenticator apps. */
#define OTP_MIN_DIGITS 6
#define OTP_MAX_DIGITS 10

#define OTP_DEFAULT_DIGITS 6
#define OTP_DEFAULT_PERIOD 30
#define OTP_DEFAULT_SKEW_THRESHOLD 10

/** Widest verification window on either side of the current counter */
#define OTP_MAX_SKEW 100
#define OTP_DEFAULT_SECRET_BYTES 10

#ifdef __cplusplus
extern "C" {
#endif

/**
 * OTP Core Condition Codes
 *
 * All OTP Core functions return this code.
 * OTP_CC_Ok indicates that there was no issue.
 */
typedef enum eOTP_CC
{
    /** The function completed without an error */
    OTP_CC_Ok = 0,
    /** An error occured */
    OTP_CC_Error = 1,
    /** Unexpected NULL pointer */
    OTP_CC_NULLPtr = 2,
    /** A system call or OpenSSL primitive failed */
    OTP_CC_SysError = 3,
    /** JSON parsing or typing error */
    OTP_CC_JSONError = 4,
    /** A string could not be parsed */
    OTP_CC_ParseError = 5,
    /** The secret is not valid base32 */
    OTP_CC_Base32Error = 6,
    /** The secret is shorter than OTP_MIN_SECRET_BYTES */
    OTP_CC_WeakSecret = 7,
    /** The code or digit count is outside OTP_MIN_DIGITS..OTP_MAX_DIGITS */
    OTP_CC_InvalidCodeLength = 8,
    /** The TOTP period is zero, or the clock is before the epoch */
    OTP_CC_InvalidPeriod = 9,
    /** Some other argument is out of range */
    OTP_CC_InvalidArgument = 10
} tOTP_CC;

/**
 * OTP Core Error Structure
 *
 * This structure contains the detailed information associated
 * with an error.
 * All OTP Core functions offer the option of passing
 * a pointer to this structure to be filled out in the event of
 * error.
 */
typedef struct sOTP_Error
{
    /** The condition code code */
    tOTP_CC code;
    /** String containing a description of the error */
    char szDescription[OTP_MAX_STRING_LENGTH + 1];
    /** String containing the function in which the error occurred */
    char szSourceFunc[OTP_MAX_STRING_LENGTH + 1];
    /** String containing the source file in which the error occurred */
    char szSourceFile[OTP_MAX_STRING_LENGTH + 1];
    /** Line number in the source file in which the error occurred */
    int  nSourceLine;
} tOTP_Error;

/**
 * Keyed-hash function used to derive codes.
 */
typedef enum eOTP_Algorithm
{
    OTP_Algorithm_SHA1 = 0,
    OTP_Algorithm_SHA256,
    OTP_Algorithm_SHA512
} tOTP_Algorithm;

/**
 * Verification settings.
 * Passing NULL wherever one of these is expected selects the defaults:
 * no digit pinning, SHA-1, OTP_DEFAULT_PERIOD, and no skew.
 */
typedef struct sOTP_VerifyOptions
{
    /** Expected code length, or 0 to accept any valid length */
    unsigned int    digits;
    /** Reject codes whose length differs from digits */
    bool            bStrictDigits;
    tOTP_Algorithm  algorithm;
    /** TOTP period in seconds (ignored for HOTP) */
    unsigned int    period;
    /** Extra steps to check before the reference counter, up to OTP_MAX_SKEW */
    unsigned int    skewLeft;
    /** Extra steps to check after the reference counter, up to OTP_MAX_SKEW */
    unsigned int    skewRight;
} tOTP_VerifyOptions;

tOTP_CC OTP_Initialize(const char *szLogPath,
                       tOTP_Error *pError);

void OTP_Terminate(void);

tOTP_CC OTP_Base32Encode(const unsigned char *pData,
                         unsigned int dataLength,
                         bool bPadding,
                         char **pszResult,
                         tOTP_Error *pError);

tOTP_CC OTP_Base32Decode(const char *szText,
                         unsigned char **ppData,
                         unsigned int *pDataLength,
                         tOTP_Error *pError);

tOTP_CC OTP_HotpGenerate(uint64_t counter,
                         const char *szSecret,
                         unsigned int digits,
                         tOTP_Algorithm algorithm,
                         char **pszCode,
                         tOTP_Error *pError);

tOTP_CC OTP_HotpVerify(const char *szCode,
                       uint64_t counter,
                       const char *szSecret,
                       const tOTP_VerifyOptions *pOptions,
                       bool *pbValid,
                       tOTP_Error *pError);

tOTP_CC OTP_TotpGenerate(const char *szSecret,
                         unsigned int digits,
                         unsigned int period,
                         tOTP_Algorithm algorithm,
                         char **pszCode,
                         tOTP_Error *pError);

tOTP_CC OTP_TotpVerify(const char *szCode,
                       const char *szSecret,
                       const tOTP_VerifyOptions *pOptions,
                       bool *pbValid,
                       tOTP_Error *pError);

tOTP_CC OTP_RandomSecret(unsigned int byteLength,
                         char **pszSecret,
                         tOTP_Error *pError);

tOTP_CC OTP_TotpTimeLeft(unsigned int period,
                         unsigned int *pSeconds,
                         tOTP_Error *pError);

tOTP_CC OTP_TotpSkewAllowance(unsigned int period,
                              unsigned int threshold,
                              unsigned int *pSkewLeft,
                              unsigned int *pSkewRight,
                              tOTP_Error *pError);

tOTP_CC OTP_TotpUrl(const char *szIssuer,
                    const char *szAccount,
                    const char *szSecret,
                    unsigned int digits,
                    unsigned int period,
                    tOTP_Algorithm algorithm,
                    char **pszUrl,
                    tOTP_Error *pError);

tOTP_CC OTP_BackupCodes(unsigned int count,
                        unsigned int byteLength,
                        unsigned int groupBy,
                        char ***paszCodes,
                        unsigned int *pCount,
                        tOTP_Error *pError);

tOTP_CC OTP_LuhnChecksum(const char *szDigits,
                         unsigned int *pChecksum,
                         tOTP_Error *pError);

tOTP_CC OTP_LuhnVerify(const char *szDigits,
                       bool *pbValid,
                       tOTP_Error *pError);

void OTP_FreeString(char *sz);

void OTP_FreeData(unsigned char *pData, unsigned int dataLength);

void OTP_FreeStringArray(char **aszStrings,
                         unsigned int count);

#ifdef __cplusplus
}
#endif

#endif
