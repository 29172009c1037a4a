/** \file   DatasetPublisher.h
 *  \brief  Publishes converted segments and, only if that succeeded, records the new version in the manifest.
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
#include <vector>
#include <cinttypes>
#include "DatasetStore.h"
#include "ManifestStore.h"
#include "RetryPolicy.h"
#include "SyncTypes.h"


namespace OLSync {


struct PublishOptions {
    bool upload_manifest_;
    bool upload_raw_dump_;
    uint64_t max_upload_chunk_size_; // Raw dumps larger than this are uploaded as .part0, .part1, ...

public:
    PublishOptions(): upload_manifest_(true), upload_raw_dump_(false), max_upload_chunk_size_(5ull * 1024ull * 1024ull * 1024ull) { }
    PublishOptions(const bool upload_manifest, const bool upload_raw_dump, const uint64_t max_upload_chunk_size)
        : upload_manifest_(upload_manifest), upload_raw_dump_(upload_raw_dump), max_upload_chunk_size_(max_upload_chunk_size) { }
};


class DatasetPublisher {
    DatasetStore * const dataset_store_;
    ManifestStore * const manifest_store_;
    const RetryPolicy &retry_policy_;
    PublishOptions options_;

public:
    static const std::string MANIFEST_DATASET_PATH;
    static const std::string SUCCESS_MARKER_NAME;
public:
    DatasetPublisher(DatasetStore * const dataset_store, ManifestStore * const manifest_store, const RetryPolicy &retry_policy,
                     const PublishOptions &options = PublishOptions())
        : dataset_store_(dataset_store), manifest_store_(manifest_store), retry_policy_(retry_policy), options_(options) { }

    /** \brief  Uploads "segment_paths" under GetArtifactPrefix(descriptor), followed by a success marker that lists them.
     *          Only if all of that worked is the manifest entry for the source replaced.
     *  \param  error_message  Set if we return false.
     *  \return False if anything up to and including the manifest commit failed.  The manifest is unchanged in that case.
     *  \throws CancelledError.
     */
    bool publish(const SourceDescriptor &descriptor, const std::vector<std::string> &segment_paths, const FetchResult &fetch_result,
                 const uint64_t row_count, const uint64_t skipped_count, std::string * const error_message);

    //* \return E.g. "authors/9f86d081884c7d65", derived from the category and the change signature.
    static std::string GetArtifactPrefix(const SourceDescriptor &descriptor);

    /** \brief  Uploads the fetched dump to raw/<name>, split into chunks if it is large, and then raw/<name>.json.
     *  \throws SyncError's.
     */
    void uploadRawDump(const SourceDescriptor &descriptor, const FetchResult &fetch_result);
private:
    void uploadFile(const std::string &local_path, const std::string &remote_path);
    void uploadData(const std::string &data, const std::string &remote_path);
};


} // namespace OLSync
