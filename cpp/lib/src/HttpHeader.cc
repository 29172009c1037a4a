/** \file    HttpHeader.cc
 *  \brief   Implementation of class HttpHeader.
 *  \author  Dr. Johannes Ruscheinski
 *  \author  Artur Kedzierski
 *
 *  \copyright 2002-2008 Project iVia.
 *  \copyright 2002-2008 The Regents of The University of California.
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
#include "HttpHeader.h"
#include <algorithm>
#include <list>
#include <cstring>
#include "StringUtil.h"


namespace {


// a Boolean predicate class
class StartsWith {
    std::string prefix_;

public:
    explicit StartsWith(const std::string &prefix): prefix_(prefix) { }
    bool operator()(const std::string &s) const { return ::strncasecmp(prefix_.c_str(), s.c_str(), prefix_.length()) == 0; }
};


// Returns the trimmed value of the first header line named "field_name" or the empty string.
std::string GetFieldValue(const std::list<std::string> &lines, const std::string &field_name) {
    const auto line(std::find_if(lines.cbegin(), lines.cend(), StartsWith(field_name + ":")));
    if (line == lines.cend())
        return "";

    return StringUtil::TrimWhite(line->substr(field_name.length() + 1));
}


} // unnamed namespace


HttpHeader::HttpHeader(const std::string &header): content_length_(0) {
    // Some Web servers incorrectly use '\n' instead of '\r\n'.
    std::string normalised_header(header);
    StringUtil::ReplaceString("\r\n", "\n", &normalised_header);

    std::list<std::string> lines;
    StringUtil::Split(normalised_header, '\n', &lines, /* suppress_empty_components = */ true);
    if (lines.empty())
        return;

    last_modified_ = GetFieldValue(lines, "Last-Modified");
    etag_ = GetFieldValue(lines, "ETag");
    digest_ = GetFieldValue(lines, "Digest");
    x_checksum_sha256_ = GetFieldValue(lines, "X-Checksum-Sha256");

    const std::string content_length(GetFieldValue(lines, "Content-Length"));
    if (not content_length.empty() and not StringUtil::ToUInt64T(content_length, &content_length_))
        content_length_ = 0;
}


std::string HttpHeader::getSha256Digest() const {
    if (not x_checksum_sha256_.empty())
        return StringUtil::ToLower(x_checksum_sha256_);

    // The Digest header may list several algorithms, e.g. "MD5=...,SHA-256=...".
    std::list<std::string> digests;
    StringUtil::Split(digest_, ',', &digests);
    for (const auto &digest : digests) {
        const std::string trimmed_digest(StringUtil::TrimWhite(digest));
        if (not StringUtil::StartsWith(trimmed_digest, "SHA-256=", /* ignore_case = */ true))
            continue;

        std::string binary_digest;
        if (StringUtil::Base64Decode(trimmed_digest.substr(__builtin_strlen("SHA-256=")), &binary_digest) and binary_digest.length() == 32)
            return StringUtil::ToHexString(binary_digest);
    }

    return "";
}

