/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Provisioning.hpp"
#include "../crypto/Encoding.hpp"
#include "../crypto/OtpKey.hpp"
#include "../util/Uri.hpp"
#include <errno.h>
#include <stdlib.h>

namespace otpcore {

/**
 * Reads a decimal URI parameter.
 */
static Status
parseParameter(unsigned &result, const std::string &name,
    const std::string &text)
{
    char *end = nullptr;
    errno = 0;
    const auto value = strtoul(text.c_str(), &end, 10);
    if (text.empty() || *end || '-' == text[0] || errno || 100000 < value)
        return OTP_ERROR(OTP_CC_ParseError,
                         "Bad " + name + " parameter: " + text);
    result = value;
    return Status();
}

Status
randomSecret(std::string &result, size_t byteLength)
{
    OtpKey key;
    OTP_CHECK(key.create(byteLength));
    result = key.encodeBase32(false);
    return Status();
}

Status
totpUrl(std::string &result, const std::string &issuer,
    const std::string &account, const std::string &secret,
    const UrlOptions &options)
{
    if (std::string::npos != issuer.find(':') ||
        std::string::npos != account.find(':'))
        return OTP_ERROR(OTP_CC_InvalidArgument,
                         "The issuer and account cannot contain ':'");
    if (options.digits &&
        (options.digits < OTP_MIN_DIGITS || OTP_MAX_DIGITS < options.digits))
        return OTP_ERROR(OTP_CC_InvalidCodeLength,
                         "Digit count must be between 6 and 10, got " +
                         std::to_string(options.digits));

    // The secret must at least be readable:
    DataChunk key;
    OTP_CHECK(base32Decode(key, secret));
    dataClear(key);

    Uri uri;
    uri.schemeSet("otpauth");
    uri.authoritySet("totp");
    uri.pathSet("/" + issuer + ":" + account);
    uri.queryAppend("secret", secret);
    uri.queryAppend("issuer", issuer);
    if (HashType::sha1 != options.algorithm)
    {
        // The URI format spells these without dashes:
        std::string name = hashTypeName(options.algorithm);
        name.erase(name.find('-'), 1);
        uri.queryAppend("algorithm", name);
    }
    if (options.digits)
        uri.queryAppend("digits", std::to_string(options.digits));
    if (options.period)
        uri.queryAppend("period", std::to_string(options.period));

    result = uri.encode();
    return Status();
}

Status
totpUrlDecode(UrlInfo &result, const std::string &url)
{
    Uri uri;
    if (!uri.decode(url))
        return OTP_ERROR(OTP_CC_ParseError, "Malformed URI");
    if ("otpauth" != uri.scheme())
        return OTP_ERROR(OTP_CC_ParseError, "Not an otpauth URI");
    if (!uri.authorityOk() || "totp" != uri.authority())
        return OTP_ERROR(OTP_CC_ParseError, "Only totp URI's are supported");

    UrlInfo out;

    // Label:
    auto label = uri.path();
    if (!label.empty() && '/' == label[0])
        label.erase(0, 1);
    const auto colon = label.find(':');
    if (std::string::npos == colon)
    {
        out.account = label;
    }
    else
    {
        out.issuer = label.substr(0, colon);
        out.account = label.substr(colon + 1);
    }
    if (out.account.empty())
        return OTP_ERROR(OTP_CC_ParseError, "The URI has no account name");

    // Parameters:
    auto query = uri.queryDecode();
    auto i = query.find("secret");
    if (!uri.queryOk() || query.end() == i || i->second.empty())
        return OTP_ERROR(OTP_CC_ParseError, "The URI has no secret");
    out.secret = i->second;
    DataChunk key;
    OTP_CHECK(base32Decode(key, out.secret));
    dataClear(key);

    i = query.find("issuer");
    if (query.end() != i)
    {
        if (std::string::npos != colon && out.issuer != i->second)
            return OTP_ERROR(OTP_CC_InvalidArgument,
                             "The label and issuer parameter disagree");
        out.issuer = i->second;
    }

    i = query.find("algorithm");
    if (query.end() != i)
        OTP_CHECK(hashTypeDecode(out.options.algorithm, i->second));

    i = query.find("digits");
    if (query.end() != i)
    {
        OTP_CHECK(parseParameter(out.options.digits, "digits", i->second));
        if (out.options.digits < OTP_MIN_DIGITS ||
            OTP_MAX_DIGITS < out.options.digits)
            return OTP_ERROR(OTP_CC_InvalidCodeLength,
                             "Digit count must be between 6 and 10, got " +
                             i->second);
    }

    i = query.find("period");
    if (query.end() != i)
    {
        OTP_CHECK(parseParameter(out.options.period, "period", i->second));
        if (!out.options.period)
            return OTP_ERROR(OTP_CC_InvalidPeriod, "The period cannot be 0");
    }

    result = std::move(out);
    return Status();
}

Status
backupCode(std::string &result, size_t byteLength, unsigned groupBy)
{
    if (1 != groupBy && 4 != groupBy && 8 != groupBy)
        return OTP_ERROR(OTP_CC_InvalidArgument,
                         "Backup codes group by 1, 4 or 8 characters");

    std::string secret;
    OTP_CHECK(randomSecret(secret, byteLength));

    std::string out;
    out.reserve(secret.size() + secret.size() / groupBy);
    for (size_t i = 0; i < secret.size(); ++i)
    {
        if (1 < groupBy && i && 0 == i % groupBy)
            out += '-';
        out += secret[i];
    }

    result = std::move(out);
    return Status();
}

Status
backupCodes(std::vector<std::string> &result, size_t count,
    size_t byteLength, unsigned groupBy)
{
    std::vector<std::string> out;
    out.reserve(count);
    for (size_t i = 0; i < count; ++i)
    {
        std::string code;
        OTP_CHECK(backupCode(code, byteLength, groupBy));
        out.push_back(code);
    }

    result = std::move(out);
    return Status();
}

} // namespace otpcore
