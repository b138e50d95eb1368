/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Helpers for handing secrets to users: fresh secrets,
 * otpauth:// URI's for authenticator apps, and paper backup codes.
 */

#ifndef OTPCORE_OTP_PROVISIONING_HPP
#define OTPCORE_OTP_PROVISIONING_HPP

#include "../crypto/Crypto.hpp"
#include <string>
#include <vector>

namespace otpcore {

/**
 * Creates a random base32 secret without padding.
 * The default 10 bytes gives 16 characters.
 */
Status
randomSecret(std::string &result, size_t byteLength=OTP_DEFAULT_SECRET_BYTES);

/**
 * Optional otpauth:// URI parameters.
 * Parameters at their zero / SHA-1 values are left out of the URI,
 * since authenticator apps assume those defaults.
 * SHA-1 doubles as "unset", so asking for it explicitly
 * still gives a URI without an algorithm parameter.
 */
struct UrlOptions
{
    unsigned digits = 0;
    unsigned period = 0;
    HashType algorithm = HashType::sha1;
};

/**
 * Builds the otpauth://totp/issuer:account?secret=...&issuer=... URI
 * that authenticator apps read from QR codes.
 * The ':' in the label separates the issuer from the account,
 * so neither one may contain a colon, escaped or not.
 * Such names give OTP_CC_InvalidArgument.
 */
Status
totpUrl(std::string &result, const std::string &issuer,
    const std::string &account, const std::string &secret,
    const UrlOptions &options=UrlOptions());

/**
 * The contents of an otpauth://totp/ URI.
 */
struct UrlInfo
{
    std::string issuer;
    std::string account;
    std::string secret;
    UrlOptions options;
};

/**
 * Reads an otpauth://totp/ URI, such as one scanned from another
 * service's QR code.
 * The label issuer and the `issuer` parameter must agree when both
 * are present. The secret is required and must be valid base32.
 */
Status
totpUrlDecode(UrlInfo &result, const std::string &url);

/**
 * Creates a single paper backup code.
 * @param groupBy 1 for no grouping, or 4 or 8 to put a dash
 * between each group of that many characters.
 */
Status
backupCode(std::string &result, size_t byteLength, unsigned groupBy=1);

Status
backupCodes(std::vector<std::string> &result, size_t count,
    size_t byteLength, unsigned groupBy=1);

} // namespace otpcore

#endif
