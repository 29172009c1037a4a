/** \file   DumpSource.cc
 *  \brief  Implementation of the HTTP dump source.
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
#include "DumpSource.h"
#include "HttpHeader.h"
#include "SyncTypes.h"
#include "util.h"


namespace OLSync {


std::string RemoteFileInfo::getChangeSignature() const {
    return last_modified_.empty() ? etag_ : last_modified_;
}


RemoteFileInfo HttpDumpSource::probe(const std::string &url) {
    Downloader downloader(downloader_params_);
    if (not downloader.head(url, probe_time_limit_))
        ThrowTransferError(downloader, PROBING, "HEAD request for \"" + url + "\"");

    const HttpHeader http_header(downloader.getMessageHeaderObject());
    RemoteFileInfo remote_file_info;
    remote_file_info.size_ = http_header.getContentLength();
    remote_file_info.last_modified_ = http_header.getLastModified();
    remote_file_info.etag_ = http_header.getETag();
    remote_file_info.sha256_ = http_header.getSha256Digest();

    LOG_DEBUG("\"" + url + "\": size=" + std::to_string(remote_file_info.size_) + ", Last-Modified=\""
              + remote_file_info.last_modified_ + "\", ETag=\"" + remote_file_info.etag_ + "\"");
    return remote_file_info;
}


uint64_t HttpDumpSource::download(const std::string &url, const std::string &local_path, const uint64_t resume_offset) {
    Downloader downloader(downloader_params_);
    if (not downloader.downloadToFile(url, local_path, resume_offset, download_time_limit_))
        ThrowTransferError(downloader, FETCHING, "downloading \"" + url + "\"");

    if (resume_offset > 0 and downloader.restartedFromScratch()) {
        LOG_INFO("\"" + url + "\" does not support range requests, downloaded the whole file");
        return 0;
    }

    return resume_offset;
}


} // namespace OLSync
