/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../src/OTP.h"
#include <catch2/catch.hpp>
#include <limits.h>
#include <string.h>

TEST_CASE("C API code generation", "[api]")
{
    tOTP_Error error;
    char *szCode = NULL;

    REQUIRE(OTP_CC_Ok == OTP_HotpGenerate(42, "JBSWY3DPEHPK3PXP", 0,
                                          OTP_Algorithm_SHA1, &szCode, &error));
    REQUIRE(OTP_CC_Ok == error.code);
    REQUIRE(std::string(szCode) == "090604");
    OTP_FreeString(szCode);

    REQUIRE(OTP_CC_Ok == OTP_HotpGenerate(42, "JBSWY3DPEHPK3PXP", 8,
                                          OTP_Algorithm_SHA1, &szCode, &error));
    REQUIRE(std::string(szCode) == "79090604");
    OTP_FreeString(szCode);

    REQUIRE(OTP_CC_Ok == OTP_TotpGenerate("JBSWY3DPEHPK3PXP", 0, 0,
                                          OTP_Algorithm_SHA256, &szCode, &error));
    REQUIRE(strlen(szCode) == 6);
    OTP_FreeString(szCode);
}

TEST_CASE("C API verification", "[api]")
{
    tOTP_Error error;
    bool valid = false;

    REQUIRE(OTP_CC_Ok == OTP_HotpVerify("090604", 42, "JBSWY3DPEHPK3PXP",
                                        NULL, &valid, &error));
    REQUIRE(valid);

    tOTP_VerifyOptions options;
    memset(&options, 0, sizeof(options));
    options.skewLeft = 1;
    REQUIRE(OTP_CC_Ok == OTP_HotpVerify("090604", 43, "JBSWY3DPEHPK3PXP",
                                        &options, &valid, &error));
    REQUIRE(valid);

    options.skewLeft = 0;
    REQUIRE(OTP_CC_Ok == OTP_HotpVerify("090604", 43, "JBSWY3DPEHPK3PXP",
                                        &options, &valid, &error));
    REQUIRE_FALSE(valid);

    options.bStrictDigits = true;
    REQUIRE(OTP_CC_InvalidCodeLength ==
            OTP_HotpVerify("090604", 42, "JBSWY3DPEHPK3PXP",
                           &options, &valid, &error));
    REQUIRE(OTP_CC_InvalidCodeLength == error.code);

    memset(&options, 0, sizeof(options));
    options.skewLeft = UINT_MAX;
    options.skewRight = UINT_MAX;
    REQUIRE(OTP_CC_InvalidArgument ==
            OTP_HotpVerify("000000", 5, "JBSWY3DPEHPK3PXP",
                           &options, &valid, &error));
    REQUIRE(OTP_CC_InvalidArgument == error.code);
    REQUIRE(OTP_CC_InvalidArgument ==
            OTP_TotpVerify("000000", "JBSWY3DPEHPK3PXP",
                           &options, &valid, &error));

    char *szCode = NULL;
    REQUIRE(OTP_CC_Ok == OTP_TotpGenerate("JBSWY3DPEHPK3PXP", 0, 0,
                                          OTP_Algorithm_SHA1, &szCode, &error));
    memset(&options, 0, sizeof(options));
    options.skewLeft = 1;
    REQUIRE(OTP_CC_Ok == OTP_TotpVerify(szCode, "JBSWY3DPEHPK3PXP",
                                        &options, &valid, &error));
    REQUIRE(valid);
    OTP_FreeString(szCode);
}

TEST_CASE("C API error reporting", "[api]")
{
    tOTP_Error error;
    char *szCode = NULL;

    SECTION("null pointers")
    {
        REQUIRE(OTP_CC_NULLPtr == OTP_HotpGenerate(0, NULL, 6,
                                                   OTP_Algorithm_SHA1,
                                                   &szCode, &error));
        REQUIRE(OTP_CC_NULLPtr == error.code);
        REQUIRE(std::string(error.szDescription) == "NULL pointer");
        REQUIRE(std::string(error.szSourceFunc) == "OTP_HotpGenerate");
        REQUIRE(0 < error.nSourceLine);

        REQUIRE(OTP_CC_NULLPtr == OTP_LuhnVerify("123", NULL, &error));
    }
    SECTION("weak secret")
    {
        REQUIRE(OTP_CC_WeakSecret == OTP_HotpGenerate(0, "JBSWY3DP", 6,
                                                      OTP_Algorithm_SHA1,
                                                      &szCode, &error));
        REQUIRE(OTP_CC_WeakSecret == error.code);
        REQUIRE(NULL == szCode);
    }
    SECTION("bad base32")
    {
        unsigned char *pData = NULL;
        unsigned int size = 0;
        REQUIRE(OTP_CC_Base32Error == OTP_Base32Decode("MZXW1===", &pData,
                                                       &size, &error));
        REQUIRE(OTP_CC_Base32Error == error.code);
    }
    SECTION("bad period")
    {
        unsigned int seconds;
        REQUIRE(OTP_CC_InvalidPeriod == OTP_TotpTimeLeft(0, &seconds, &error));
    }
    SECTION("no error structure")
    {
        REQUIRE(OTP_CC_NULLPtr == OTP_HotpGenerate(0, NULL, 6,
                                                   OTP_Algorithm_SHA1,
                                                   &szCode, NULL));
    }
}

TEST_CASE("C API base32", "[api]")
{
    tOTP_Error error;
    char *szText = NULL;

    const unsigned char data[] = {'f', 'o', 'o', 'b', 'a', 'r'};
    REQUIRE(OTP_CC_Ok == OTP_Base32Encode(data, sizeof(data), true,
                                          &szText, &error));
    REQUIRE(std::string(szText) == "MZXW6YTBOI======");

    unsigned char *pData = NULL;
    unsigned int size = 0;
    REQUIRE(OTP_CC_Ok == OTP_Base32Decode(szText, &pData, &size, &error));
    REQUIRE(6 == size);
    REQUIRE(0 == memcmp(pData, data, size));

    OTP_FreeData(pData, size);
    OTP_FreeString(szText);

    REQUIRE(OTP_CC_Ok == OTP_Base32Encode(NULL, 0, true, &szText, &error));
    REQUIRE(std::string(szText) == "");
    OTP_FreeString(szText);
}

TEST_CASE("C API provisioning", "[api]")
{
    tOTP_Error error;

    char *szSecret = NULL;
    REQUIRE(OTP_CC_Ok == OTP_RandomSecret(10, &szSecret, &error));
    REQUIRE(16 == strlen(szSecret));

    char *szUrl = NULL;
    REQUIRE(OTP_CC_Ok == OTP_TotpUrl("My App", "alice", szSecret, 0, 0,
                                     OTP_Algorithm_SHA1, &szUrl, &error));
    REQUIRE(std::string(szUrl) == "otpauth://totp/My%20App:alice?secret=" +
            std::string(szSecret) + "&issuer=My%20App");
    OTP_FreeString(szUrl);
    OTP_FreeString(szSecret);

    char **aszCodes = NULL;
    unsigned int count = 0;
    REQUIRE(OTP_CC_Ok == OTP_BackupCodes(4, 10, 4, &aszCodes, &count, &error));
    REQUIRE(4 == count);
    for (unsigned i = 0; i < count; ++i)
        REQUIRE(19 == strlen(aszCodes[i]));
    OTP_FreeStringArray(aszCodes, count);

    REQUIRE(OTP_CC_InvalidArgument ==
            OTP_BackupCodes(4, 10, 5, &aszCodes, &count, &error));
}

TEST_CASE("C API time helpers", "[api]")
{
    tOTP_Error error;

    unsigned int seconds = 0;
    REQUIRE(OTP_CC_Ok == OTP_TotpTimeLeft(30, &seconds, &error));
    REQUIRE(0 < seconds);
    REQUIRE(seconds <= 30);

    unsigned int left = 5, right = 5;
    REQUIRE(OTP_CC_Ok == OTP_TotpSkewAllowance(30, 10, &left, &right, &error));
    REQUIRE(left <= 1);
    REQUIRE(right <= 1);
}

TEST_CASE("C API Luhn", "[api]")
{
    tOTP_Error error;

    unsigned int checksum = 0;
    REQUIRE(OTP_CC_Ok == OTP_LuhnChecksum("123456", &checksum, &error));
    REQUIRE(6 == checksum);
    REQUIRE(OTP_CC_ParseError == OTP_LuhnChecksum("12345x", &checksum, &error));

    bool valid = false;
    REQUIRE(OTP_CC_Ok == OTP_LuhnVerify("1234566", &valid, &error));
    REQUIRE(valid);
}
