/** \file   DumpSource.h
 *  \brief  Access to the origin that publishes the Open Library dump files.
 *
 *  \copyright 2026 Universitätsbibliothek Tübingen.  All rights reserved.
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
#include "Downloader.h"


namespace OLSync {


// What a metadata-only request tells us about a remote file.
struct RemoteFileInfo {
    uint64_t size_; // 0 if unknown
    std::string last_modified_;
    std::string etag_;
    std::string sha256_; // lowercase hex or empty

public:
    RemoteFileInfo(): size_(0) { }

    //* \return The Last-Modified value if we have one, else the ETag, else the empty string.
    std::string getChangeSignature() const;
};


class DumpSource {
public:
    virtual ~DumpSource() = default;

    //* \throws TransientError, FatalError or CancelledError.
    virtual RemoteFileInfo probe(const std::string &url) = 0;

    /** \brief  Retrieves "url" into "local_path".
     *  \param  resume_offset  If non-zero, the number of bytes already present in "local_path" and the body is appended.
     *  \return The offset that was actually used.  0 if the origin ignored the range request and "local_path" was
     *          rewritten from scratch.
     *  \throws TransientError, FatalError or CancelledError.
     */
    virtual uint64_t download(const std::string &url, const std::string &local_path, const uint64_t resume_offset) = 0;
};


// The origin is anything libcurl can talk to, in practice HTTPS and, for local mirrors, file:// URLs.
class HttpDumpSource : public DumpSource {
    Downloader::Params downloader_params_;
    unsigned probe_time_limit_;    // ms
    unsigned download_time_limit_; // ms, 0 means no limit

public:
    explicit HttpDumpSource(const Downloader::Params &downloader_params = Downloader::Params(),
                            const unsigned probe_time_limit = Downloader::DEFAULT_TIME_LIMIT, const unsigned download_time_limit = 0)
        : downloader_params_(downloader_params), probe_time_limit_(probe_time_limit), download_time_limit_(download_time_limit) { }

    RemoteFileInfo probe(const std::string &url) override;
    uint64_t download(const std::string &url, const std::string &local_path, const uint64_t resume_offset) override;
};


} // namespace OLSync
