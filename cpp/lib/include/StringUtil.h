/** \file    StringUtil.h
 *  \brief   Declarations for string utility functions.
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
#pragma once


#include <stdexcept>
#include <string>
#include <cinttypes>
#include <strings.h>
#include "util.h"


namespace StringUtil {


/** \brief  Converts "s" to lowercase in place.
 *  \return The converted string.
 */
std::string ToLower(std::string * const s);
inline std::string ToLower(const std::string &s) {
    std::string temp_s(s);
    return ToLower(&temp_s);
}


/** \brief  Removes all leading and trailing characters contained in "trim_set" from "s".
 *  \return The trimmed string.
 */
std::string Trim(const std::string &trim_set, std::string * const s);
inline std::string Trim(const std::string &s, const std::string &trim_set) {
    std::string temp_s(s);
    return Trim(trim_set, &temp_s);
}


inline std::string TrimWhite(std::string * const s) {
    return Trim(" \t\n\v\f\r", s);
}


inline std::string TrimWhite(const std::string &s) {
    std::string temp_s(s);
    return TrimWhite(&temp_s);
}


inline bool StartsWith(const std::string &s, const std::string &prefix, const bool ignore_case = false) {
    if (prefix.length() > s.length())
        return false;
    return ignore_case ? ::strncasecmp(s.c_str(), prefix.c_str(), prefix.length()) == 0
                       : s.compare(0, prefix.length(), prefix) == 0;
}


/** \brief  Replaces all occurrences of "old_text" in "*s" with "new_text".
 *  \return The modified string.
 */
std::string &ReplaceString(const std::string &old_text, const std::string &new_text, std::string * const s);


bool ToUnsigned(const std::string &s, unsigned * const n, const unsigned base = 10);
bool ToUInt64T(const std::string &s, uint64_t * const n, const unsigned base = 10);
bool ToInt64T(const std::string &s, int64_t * const n, const unsigned base = 10);
bool ToDouble(const std::string &s, double * const n);


//* \throws std::runtime_error if "s" can't be converted.
uint64_t ToUInt64T(const std::string &s, const unsigned base = 10);


/** \brief  Split a string around a delimiter.
 *  \param  source                     The string to split.
 *  \param  delimiter                  The character to split around.
 *  \param  container                  A list to return the resulting fields in.
 *  \param  suppress_empty_components  If true we will not return empty fields.
 *  \return The number of extracted "fields".
 */
template <typename InsertableContainer>
unsigned Split(const std::string &source, const char delimiter, InsertableContainer * const container,
               const bool suppress_empty_components = true) {
    container->clear();
    if (source.empty())
        return 0;

    unsigned count(0);
    std::string::size_type start(0);
    for (;;) {
        const auto next_delimiter(source.find(delimiter, start));
        const std::string field(source.substr(start, next_delimiter == std::string::npos ? std::string::npos : next_delimiter - start));
        if (not suppress_empty_components or not field.empty()) {
            container->insert(container->end(), field);
            ++count;
        }
        if (next_delimiter == std::string::npos)
            return count;
        start = next_delimiter + 1;
    }
}


/** \brief  Converts binary data to a lowercase hexadecimal string. */
std::string ToHexString(const std::string &s);


/** \brief  Decodes standard Base64, ignoring trailing padding.
 *  \return False if "encoded" contains characters outside the Base64 alphabet.
 */
bool Base64Decode(const std::string &encoded, std::string * const decoded);


/** \brief  Computes the binary SHA-256 digest of "s". */
std::string Sha256(const std::string &s);


} // namespace StringUtil
