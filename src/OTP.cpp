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
 * C wrappers around the otpcore library.
 */

#include "OTP.h"
#include "../otpcore/crypto/Encoding.hpp"
#include "../otpcore/otp/Otp.hpp"
#include "../otpcore/otp/Provisioning.hpp"
#include "../otpcore/util/Debug.hpp"
#include "../otpcore/util/Luhn.hpp"
#include <openssl/crypto.h>
#include <stdlib.h>
#include <string.h>

using namespace otpcore;

#define OTP_SET_ERR_CODE(err, set_code) \
    if (err != NULL) { \
        err->code = set_code; \
    }

#define OTP_RET_ERROR(err, desc) \
    { \
        OTP_CHECK_NEW(OTP_ERROR(err, desc)); \
    }

#define OTP_CHECK_ASSERT(assert, err, desc) \
    { \
        if (!(assert)) \
        { \
            OTP_RET_ERROR(err, desc); \
        } \
    }

#define OTP_CHECK_NULL(arg) \
    { \
        OTP_CHECK_ASSERT(arg != NULL, OTP_CC_NULLPtr, "NULL pointer"); \
    }

#define OTP_PROLOG() \
    OTP_DebugLog("%s called", __FUNCTION__); \
    tOTP_CC cc = OTP_CC_Ok; \
    OTP_SET_ERR_CODE(pError, OTP_CC_Ok);

/**
 * Copies a string into malloc'ed memory for a C caller.
 */
static Status
stringCopy(char *&result, const std::string &string)
{
    result = strdup(string.c_str());
    if (!result)
        return OTP_ERROR(OTP_CC_SysError, "Out of memory");
    return Status();
}

static HashType
hashType(tOTP_Algorithm algorithm)
{
    switch (algorithm)
    {
    case OTP_Algorithm_SHA256:
        return HashType::sha256;
    case OTP_Algorithm_SHA512:
        return HashType::sha512;
    case OTP_Algorithm_SHA1:
    default:
        return HashType::sha1;
    }
}

/**
 * Translates the C options into the C++ structure.
 */
static void
verifyOptions(TotpVerifyOptions &result, const tOTP_VerifyOptions *pOptions)
{
    if (!pOptions)
        return;

    result.digits = pOptions->digits;
    result.strictDigits = pOptions->bStrictDigits;
    result.algorithm = hashType(pOptions->algorithm);
    if (pOptions->period)
        result.period = pOptions->period;
    result.skew.left = pOptions->skewLeft;
    result.skew.right = pOptions->skewRight;
}

tOTP_CC OTP_Initialize(const char *szLogPath,
                       tOTP_Error *pError)
{
    OTP_PROLOG();

    OTP_CHECK_NEW(debugInitialize(szLogPath ? szLogPath : ""));

exit:
    return cc;
}

void OTP_Terminate()
{
    debugTerminate();
}

tOTP_CC OTP_Base32Encode(const unsigned char *pData,
                         unsigned int dataLength,
                         bool bPadding,
                         char **pszResult,
                         tOTP_Error *pError)
{
    OTP_PROLOG();
    OTP_CHECK_NULL(pszResult);
    OTP_CHECK_ASSERT(pData || !dataLength, OTP_CC_NULLPtr, "NULL data");

    {
        DataSlice data(pData, pData + dataLength);
        OTP_CHECK_NEW(stringCopy(*pszResult, base32Encode(data, bPadding)));
    }

exit:
    return cc;
}

tOTP_CC OTP_Base32Decode(const char *szText,
                         unsigned char **ppData,
                         unsigned int *pDataLength,
                         tOTP_Error *pError)
{
    OTP_PROLOG();
    OTP_CHECK_NULL(szText);
    OTP_CHECK_NULL(ppData);
    OTP_CHECK_NULL(pDataLength);

    {
        DataChunk data;
        OTP_CHECK_NEW(base32Decode(data, szText));

        // malloc(0) may return NULL, so always allocate a byte:
        *ppData = static_cast<unsigned char *>(malloc(data.size() + 1));
        OTP_CHECK_ASSERT(*ppData, OTP_CC_SysError, "Out of memory");
        if (!data.empty())
            memcpy(*ppData, data.data(), data.size());
        *pDataLength = data.size();
        dataClear(data);
    }

exit:
    return cc;
}

tOTP_CC OTP_HotpGenerate(uint64_t counter,
                         const char *szSecret,
                         unsigned int digits,
                         tOTP_Algorithm algorithm,
                         char **pszCode,
                         tOTP_Error *pError)
{
    OTP_PROLOG();
    OTP_CHECK_NULL(szSecret);
    OTP_CHECK_NULL(pszCode);

    {
        HotpOptions options;
        if (digits)
            options.digits = digits;
        options.algorithm = hashType(algorithm);

        std::string code;
        OTP_CHECK_NEW(hotpGenerate(code, counter, szSecret, options));
        OTP_CHECK_NEW(stringCopy(*pszCode, code));
    }

exit:
    return cc;
}

tOTP_CC OTP_HotpVerify(const char *szCode,
                       uint64_t counter,
                       const char *szSecret,
                       const tOTP_VerifyOptions *pOptions,
                       bool *pbValid,
                       tOTP_Error *pError)
{
    OTP_PROLOG();
    OTP_CHECK_NULL(szCode);
    OTP_CHECK_NULL(szSecret);
    OTP_CHECK_NULL(pbValid);

    {
        TotpVerifyOptions options;
        verifyOptions(options, pOptions);

        OTP_CHECK_NEW(hotpVerify(*pbValid, szCode, counter, szSecret, options));
    }

exit:
    return cc;
}

tOTP_CC OTP_TotpGenerate(const char *szSecret,
                         unsigned int digits,
                         unsigned int period,
                         tOTP_Algorithm algorithm,
                         char **pszCode,
                         tOTP_Error *pError)
{
    OTP_PROLOG();
    OTP_CHECK_NULL(szSecret);
    OTP_CHECK_NULL(pszCode);

    {
        TotpOptions options;
        if (digits)
            options.digits = digits;
        if (period)
            options.period = period;
        options.algorithm = hashType(algorithm);

        std::string code;
        OTP_CHECK_NEW(totpGenerate(code, szSecret, options));
        OTP_CHECK_NEW(stringCopy(*pszCode, code));
    }

exit:
    return cc;
}

tOTP_CC OTP_TotpVerify(const char *szCode,
                       const char *szSecret,
                       const tOTP_VerifyOptions *pOptions,
                       bool *pbValid,
                       tOTP_Error *pError)
{
    OTP_PROLOG();
    OTP_CHECK_NULL(szCode);
    OTP_CHECK_NULL(szSecret);
    OTP_CHECK_NULL(pbValid);

    {
        TotpVerifyOptions options;
        verifyOptions(options, pOptions);

        OTP_CHECK_NEW(totpVerify(*pbValid, szCode, szSecret, options));
    }

exit:
    return cc;
}

tOTP_CC OTP_RandomSecret(unsigned int byteLength,
                         char **pszSecret,
                         tOTP_Error *pError)
{
    OTP_PROLOG();
    OTP_CHECK_NULL(pszSecret);

    {
        std::string secret;
        OTP_CHECK_NEW(randomSecret(secret, byteLength));
        OTP_CHECK_NEW(stringCopy(*pszSecret, secret));
    }

exit:
    return cc;
}

tOTP_CC OTP_TotpTimeLeft(unsigned int period,
                         unsigned int *pSeconds,
                         tOTP_Error *pError)
{
    OTP_PROLOG();
    OTP_CHECK_NULL(pSeconds);

    OTP_CHECK_NEW(timeLeft(*pSeconds, period));

exit:
    return cc;
}

tOTP_CC OTP_TotpSkewAllowance(unsigned int period,
                              unsigned int threshold,
                              unsigned int *pSkewLeft,
                              unsigned int *pSkewRight,
                              tOTP_Error *pError)
{
    OTP_PROLOG();
    OTP_CHECK_NULL(pSkewLeft);
    OTP_CHECK_NULL(pSkewRight);

    {
        OtpSkew skew;
        OTP_CHECK_NEW(skewAllowance(skew, period, threshold));
        *pSkewLeft = skew.left;
        *pSkewRight = skew.right;
    }

exit:
    return cc;
}

tOTP_CC OTP_TotpUrl(const char *szIssuer,
                    const char *szAccount,
                    const char *szSecret,
                    unsigned int digits,
                    unsigned int period,
                    tOTP_Algorithm algorithm,
                    char **pszUrl,
                    tOTP_Error *pError)
{
    OTP_PROLOG();
    OTP_CHECK_NULL(szIssuer);
    OTP_CHECK_NULL(szAccount);
    OTP_CHECK_NULL(szSecret);
    OTP_CHECK_NULL(pszUrl);

    {
        UrlOptions options;
        options.digits = digits;
        options.period = period;
        options.algorithm = hashType(algorithm);

        std::string url;
        OTP_CHECK_NEW(totpUrl(url, szIssuer, szAccount, szSecret, options));
        OTP_CHECK_NEW(stringCopy(*pszUrl, url));
    }

exit:
    return cc;
}

tOTP_CC OTP_BackupCodes(unsigned int count,
                        unsigned int byteLength,
                        unsigned int groupBy,
                        char ***paszCodes,
                        unsigned int *pCount,
                        tOTP_Error *pError)
{
    OTP_PROLOG();
    char **aszCodes = NULL;
    OTP_CHECK_NULL(paszCodes);
    OTP_CHECK_NULL(pCount);

    {
        std::vector<std::string> codes;
        OTP_CHECK_NEW(backupCodes(codes, count, byteLength, groupBy));

        aszCodes = static_cast<char **>(calloc(codes.size() + 1, sizeof(char *)));
        OTP_CHECK_ASSERT(aszCodes, OTP_CC_SysError, "Out of memory");
        for (size_t i = 0; i < codes.size(); ++i)
            OTP_CHECK_NEW(stringCopy(aszCodes[i], codes[i]));

        *paszCodes = aszCodes;
        *pCount = codes.size();
        aszCodes = NULL;
    }

exit:
    OTP_FreeStringArray(aszCodes, count);
    return cc;
}

tOTP_CC OTP_LuhnChecksum(const char *szDigits,
                         unsigned int *pChecksum,
                         tOTP_Error *pError)
{
    OTP_PROLOG();
    OTP_CHECK_NULL(szDigits);
    OTP_CHECK_NULL(pChecksum);

    OTP_CHECK_NEW(luhnChecksum(*pChecksum, szDigits));

exit:
    return cc;
}

tOTP_CC OTP_LuhnVerify(const char *szDigits,
                       bool *pbValid,
                       tOTP_Error *pError)
{
    OTP_PROLOG();
    OTP_CHECK_NULL(szDigits);
    OTP_CHECK_NULL(pbValid);

    *pbValid = luhnVerify(szDigits);

exit:
    return cc;
}

void OTP_FreeString(char *sz)
{
    if (sz)
    {
        OPENSSL_cleanse(sz, strlen(sz));
        free(sz);
    }
}

void OTP_FreeData(unsigned char *pData, unsigned int dataLength)
{
    if (pData)
    {
        OPENSSL_cleanse(pData, dataLength);
        free(pData);
    }
}

void OTP_FreeStringArray(char **aszStrings,
                         unsigned int count)
{
    if (aszStrings)
    {
        for (unsigned i = 0; i < count; ++i)
            OTP_FreeString(aszStrings[i]);
        free(aszStrings);
    }
}
