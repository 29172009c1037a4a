/** \file   DatasetPublisher.cc
 *  \brief  Implementation of class DatasetPublisher.
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
#include "DatasetPublisher.h"
#include <algorithm>
#include <fstream>
#include "FileUtil.h"
#include "RemoteFetcher.h"
#include "StringUtil.h"
#include "TimeUtil.h"
#include "util.h"


namespace OLSync {


const std::string DatasetPublisher::MANIFEST_DATASET_PATH("metadata/ol_sync_manifest.json");
const std::string DatasetPublisher::SUCCESS_MARKER_NAME("_SUCCESS.json");


std::string DatasetPublisher::GetArtifactPrefix(const SourceDescriptor &descriptor) {
    return CategoryToString(descriptor.category_) + "/" + StringUtil::ToHexString(StringUtil::Sha256(descriptor.signature_)).substr(0, 16);
}


void DatasetPublisher::uploadFile(const std::string &local_path, const std::string &remote_path) {
    retry_policy_.run("uploading " + remote_path, PUBLISHING, [&]() { dataset_store_->upload(local_path, remote_path); });
}


void DatasetPublisher::uploadData(const std::string &data, const std::string &remote_path) {
    retry_policy_.run("uploading " + remote_path, PUBLISHING, [&]() { dataset_store_->uploadData(data, remote_path); });
}


bool DatasetPublisher::publish(const SourceDescriptor &descriptor, const std::vector<std::string> &segment_paths,
                               const FetchResult &fetch_result, const uint64_t row_count, const uint64_t skipped_count,
                               std::string * const error_message)
{
    const std::string artifact_prefix(GetArtifactPrefix(descriptor));
    std::vector<std::string> remote_segment_paths;
    try {
        for (const auto &segment_path : segment_paths) {
            CheckForCancellation(PUBLISHING);
            const std::string remote_segment_path(artifact_prefix + "/" + FileUtil::GetBasename(segment_path));
            uploadFile(segment_path, remote_segment_path);
            remote_segment_paths.emplace_back(remote_segment_path);
        }

        nlohmann::json success_marker;
        success_marker["source"] = descriptor.name_;
        success_marker["signature"] = fetch_result.signature_;
        success_marker["content_sha256"] = fetch_result.content_sha256_;
        success_marker["row_count"] = row_count;
        success_marker["segments"] = remote_segment_paths;
        success_marker["created"] = TimeUtil::GetCurrentDateAndTime(TimeUtil::ZULU_FORMAT, TimeUtil::UTC);
        CheckForCancellation(PUBLISHING);
        uploadData(success_marker.dump(2), artifact_prefix + "/" + SUCCESS_MARKER_NAME);
    } catch (const CancelledError &) {
        throw;
    } catch (const SyncError &x) {
        *error_message = x.what();
        LOG_WARNING("publishing " + descriptor.name_ + " to " + dataset_store_->getDescription() + " failed: " + *error_message);
        return false;
    }
    LOG_INFO("published " + std::to_string(remote_segment_paths.size()) + " segment(s) of " + descriptor.name_ + " under \""
             + artifact_prefix + "\"");

    if (options_.upload_raw_dump_) {
        try {
            uploadRawDump(descriptor, fetch_result);
        } catch (const CancelledError &) {
            throw;
        } catch (const SyncError &x) {
            LOG_WARNING("the raw backup of " + descriptor.name_ + " failed: " + std::string(x.what()));
        }
    }

    ManifestEntry entry;
    manifest_store_->lookup(descriptor.name_, &entry); // Keeps members we don't know about.
    entry.source_last_modified_ = fetch_result.signature_;
    entry.content_sha256_ = fetch_result.content_sha256_;
    entry.remote_size_ = fetch_result.size_;
    entry.last_synced_ = TimeUtil::GetCurrentDateAndTime(TimeUtil::ZULU_FORMAT, TimeUtil::UTC);
    entry.artifact_ = artifact_prefix;
    entry.segments_ = remote_segment_paths;
    entry.row_count_ = row_count;
    entry.skipped_count_ = skipped_count;
    try {
        manifest_store_->commit(descriptor.name_, entry);
    } catch (const FatalError &x) {
        *error_message = x.what();
        LOG_WARNING(*error_message);
        return false;
    }

    if (options_.upload_manifest_) {
        try {
            uploadData(manifest_store_->toString(), MANIFEST_DATASET_PATH);
        } catch (const CancelledError &) {
            LOG_WARNING("the upload of the manifest was cancelled, the local copy is up to date");
        } catch (const SyncError &x) {
            LOG_WARNING("failed to upload the manifest to " + dataset_store_->getDescription() + ": " + std::string(x.what()));
        }
    }

    return true;
}


namespace {


void CopyChunk(std::ifstream &input, const std::string &chunk_path, const uint64_t chunk_size) {
    std::ofstream output(chunk_path, std::ios::binary | std::ios::trunc);
    if (not output)
        throw FatalError(PUBLISHING, "can't open \"" + chunk_path + "\" for writing");

    std::vector<char> buffer(1024 * 1024);
    uint64_t remaining(chunk_size);
    while (remaining > 0 and input) {
        input.read(buffer.data(), static_cast<std::streamsize>(std::min<uint64_t>(buffer.size(), remaining)));
        const std::streamsize count(input.gcount());
        if (count <= 0)
            break;
        output.write(buffer.data(), count);
        remaining -= static_cast<uint64_t>(count);
    }

    if (not output)
        throw FatalError(PUBLISHING, "failed to write \"" + chunk_path + "\"");
}


} // unnamed namespace


void DatasetPublisher::uploadRawDump(const SourceDescriptor &descriptor, const FetchResult &fetch_result) {
    const std::string raw_path("raw/" + descriptor.name_);
    std::vector<std::string> remote_chunk_paths;

    if (fetch_result.size_ <= options_.max_upload_chunk_size_) {
        uploadFile(fetch_result.local_path_, raw_path);
        remote_chunk_paths.emplace_back(raw_path);
    } else {
        std::ifstream input(fetch_result.local_path_, std::ios::binary);
        if (not input)
            throw FatalError(PUBLISHING, "can't open \"" + fetch_result.local_path_ + "\" for reading");

        const uint64_t chunk_count((fetch_result.size_ + options_.max_upload_chunk_size_ - 1) / options_.max_upload_chunk_size_);
        for (uint64_t chunk_no(0); chunk_no < chunk_count; ++chunk_no) {
            CheckForCancellation(PUBLISHING);
            const std::string chunk_suffix(".part" + std::to_string(chunk_no));
            const std::string chunk_path(fetch_result.local_path_ + chunk_suffix);
            const FileUtil::AutoDeleteFile chunk_deleter(chunk_path);
            CopyChunk(input, chunk_path, options_.max_upload_chunk_size_);
            uploadFile(chunk_path, raw_path + chunk_suffix);
            remote_chunk_paths.emplace_back(raw_path + chunk_suffix);
        }
    }

    nlohmann::json backup_metadata;
    backup_metadata["signature"] = fetch_result.signature_;
    backup_metadata["sha256"] = fetch_result.content_sha256_;
    backup_metadata["size"] = fetch_result.size_;
    backup_metadata["chunks"] = remote_chunk_paths;
    uploadData(backup_metadata.dump(2), RemoteFetcher::GetRawBackupMetadataPath(descriptor.name_));

    LOG_INFO("backed up " + descriptor.name_ + " in " + std::to_string(remote_chunk_paths.size()) + " chunk(s)");
}


} // namespace OLSync
