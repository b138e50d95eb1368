/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef OTPCORE_UTIL_URI_HPP
#define OTPCORE_UTIL_URI_HPP

#include <map>
#include <string>

namespace otpcore {

/**
 * A parsed URI according to RFC 3986.
 */
class Uri
{
public:
    /**
     * Decodes a URI from a string.
     */
    bool decode(const std::string &in);
    std::string encode() const;

    /**
     * Returns the lowercased URI scheme.
     */
    std::string scheme() const;
    void schemeSet(const std::string &scheme);

    /**
     * Obtains the unescaped authority part, if any.
     * For otpauth URI's, this is the password type ("totp" or "hotp").
     */
    std::string authority() const;
    bool authorityOk() const;
    void authoritySet(const std::string &authority);

    /**
     * Obtains the unescaped path part.
     */
    std::string path() const;
    void pathSet(const std::string &path);

    /**
     * Returns the unescaped query string, if any.
     */
    std::string query() const;
    bool queryOk() const;

    typedef std::map<std::string, std::string> QueryMap;

    /**
     * Interprets the query string as a sequence of key-value pairs.
     * All query strings are valid, so this function cannot fail.
     * The results are unescaped. Both keys and values can be zero-length,
     * and if the same key is appears multiple times, the final one wins.
     */
    QueryMap queryDecode() const;

    /**
     * Adds a key-value pair to the end of the query string.
     * Unlike a QueryMap, this keeps parameters in insertion order.
     */
    void queryAppend(const std::string &key, const std::string &value);

    /**
     * Escapes every character outside the RFC 3986 unreserved set,
     * the same way as JavaScript's encodeURIComponent.
     */
    static std::string escapeComponent(const std::string &in);

private:
    // All parts are stored with their original escaping:
    std::string scheme_;
    std::string authority_;
    std::string path_;
    std::string query_;

    bool authorityOk_ = false;
    bool queryOk_ = false;
};

} // namespace otpcore

#endif
