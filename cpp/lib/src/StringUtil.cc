/** \file    StringUtil.cc
 *  \brief   Implementation of string utility functions.
 *  \author  Dr. Johannes Ruscheinski
 *  \author  Dr. Gordon W. Paynter
 *
 *  \copyright 2002-2009 Project iVia.
 *  \copyright 2002-2009 The Regents of The University of California.
 *  \copyright 2015-2026 Universitätsbibliothek Tübingen.  All rights reserved.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU Affero General Public License as
 *  published by the Free Software Foundation, either version 3 of the
 *  License, or (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Affero General Public License for more details.
 *
 *  You should have received a copy of the GNU Affero General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#include "StringUtil.h"
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <openssl/sha.h>


namespace StringUtil {


std::string ToLower(std::string * const s) {
    for (auto &ch : *s)
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));

    return *s;
}


std::string Trim(const std::string &trim_set, std::string * const s) {
    const auto first(s->find_first_not_of(trim_set));
    if (first == std::string::npos) {
        s->clear();
        return *s;
    }

    const auto last(s->find_last_not_of(trim_set));
    *s = s->substr(first, last - first + 1);
    return *s;
}


std::string &ReplaceString(const std::string &old_text, const std::string &new_text, std::string * const s) {
    if (unlikely(old_text.empty()))
        throw std::runtime_error("in StringUtil::ReplaceString: \"old_text\" must not be empty!");

    std::string::size_type start_pos(0);
    while ((start_pos = s->find(old_text, start_pos)) != std::string::npos) {
        s->replace(start_pos, old_text.length(), new_text);
        start_pos += new_text.length();
    }

    return *s;
}


bool ToUnsigned(const std::string &s, unsigned * const n, const unsigned base) {
    uint64_t n64;
    if (not ToUInt64T(s, &n64, base) or n64 > UINT32_MAX)
        return false;

    *n = static_cast<unsigned>(n64);
    return true;
}


bool ToUInt64T(const std::string &s, uint64_t * const n, const unsigned base) {
    auto ch(s.cbegin());
    while (ch != s.cend() and std::isspace(static_cast<unsigned char>(*ch)))
        ++ch;
    if (unlikely(ch == s.cend() or *ch == '-'))
        return false;

    char *end_ptr;
    errno = 0;
    const unsigned long long temp(std::strtoull(s.c_str(), &end_ptr, static_cast<int>(base)));
    if (*end_ptr != '\0' or errno != 0)
        return false;

    *n = static_cast<uint64_t>(temp);
    return true;
}


uint64_t ToUInt64T(const std::string &s, const unsigned base) {
    uint64_t n;
    if (unlikely(not ToUInt64T(s, &n, base)))
        throw std::runtime_error("in StringUtil::ToUInt64T: can't convert \"" + s + "\"!");

    return n;
}


bool ToInt64T(const std::string &s, int64_t * const n, const unsigned base) {
    if (s.empty() or std::isspace(static_cast<unsigned char>(s[0])))
        return false;

    char *end_ptr;
    errno = 0;
    const long long temp(std::strtoll(s.c_str(), &end_ptr, static_cast<int>(base)));
    if (*end_ptr != '\0' or errno != 0)
        return false;

    *n = static_cast<int64_t>(temp);
    return true;
}


bool ToDouble(const std::string &s, double * const n) {
    if (s.empty())
        return false;

    char *end_ptr;
    errno = 0;
    *n = std::strtod(s.c_str(), &end_ptr);
    return *end_ptr == '\0' and errno == 0;
}


std::string ToHexString(const std::string &s) {
    static const char HEX_DIGITS[] = "0123456789abcdef";

    std::string hex_string;
    hex_string.reserve(s.length() * 2);
    for (const unsigned char ch : s) {
        hex_string += HEX_DIGITS[ch >> 4u];
        hex_string += HEX_DIGITS[ch & 0xFu];
    }

    return hex_string;
}


namespace {


int Base64CharToValue(const char ch) {
    if (ch >= 'A' and ch <= 'Z')
        return ch - 'A';
    if (ch >= 'a' and ch <= 'z')
        return ch - 'a' + 26;
    if (ch >= '0' and ch <= '9')
        return ch - '0' + 52;
    if (ch == '+')
        return 62;
    if (ch == '/')
        return 63;
    return -1;
}


} // unnamed namespace


bool Base64Decode(const std::string &encoded, std::string * const decoded) {
    decoded->clear();

    unsigned accumulator(0), bit_count(0);
    for (const char ch : encoded) {
        if (ch == '=')
            break;
        const int value(Base64CharToValue(ch));
        if (value == -1)
            return false;

        accumulator = (accumulator << 6u) | static_cast<unsigned>(value);
        bit_count += 6;
        if (bit_count >= 8) {
            bit_count -= 8;
            *decoded += static_cast<char>((accumulator >> bit_count) & 0xFFu);
        }
    }

    return true;
}


std::string Sha256(const std::string &s) {
    char cryptographic_hash[SHA256_DIGEST_LENGTH];
    ::SHA256(reinterpret_cast<const unsigned char *>(s.c_str()), s.length(), reinterpret_cast<unsigned char *>(cryptographic_hash));

    return std::string(cryptographic_hash, SHA256_DIGEST_LENGTH);
}


} // namespace StringUtil
