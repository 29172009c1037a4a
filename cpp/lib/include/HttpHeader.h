/** \file    HttpHeader.h
 *  \brief   Definition of class HttpHeader.
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
#pragma once


#include <string>
#include <cinttypes>


/** \class  HttpHeader
 *  \brief  Holds and allows access to the information in a HTTP response header.
 *  \note   Only the final header of a redirect chain should be passed to the constructor.  libcurl's pseudo headers for
 *          file:// URLs, which lack a status line, are accepted as well.
 */
class HttpHeader {
    uint64_t content_length_;
    std::string last_modified_, etag_, digest_, x_checksum_sha256_;

public:
    HttpHeader(): content_length_(0) { }
    explicit HttpHeader(const std::string &header);

    //* \return The raw Last-Modified value, e.g. "Tue, 01 Oct 2024 08:12:44 GMT", or the empty string.
    const std::string &getLastModified() const { return last_modified_; }

    //* \return The ETag including its quotes or the empty string.
    const std::string &getETag() const { return etag_; }

    //* \return 0 if there was no Content-Length header.
    uint64_t getContentLength() const { return content_length_; }

    /** \brief  Extracts an advertised SHA-256 digest, either from "Digest: SHA-256=<base64>" (RFC 3230) or from
     *          "X-Checksum-Sha256: <hex>".
     *  \return The lowercase hex digest or the empty string if none was advertised.
     */
    std::string getSha256Digest() const;
};
