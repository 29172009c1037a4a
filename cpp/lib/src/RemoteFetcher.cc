/** \file   RemoteFetcher.cc
 *  \brief  Implementation of class RemoteFetcher.
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
#include "RemoteFetcher.h"
#include <fstream>
#include "FileUtil.h"
#include "util.h"


namespace OLSync {


namespace {


std::string GetFetchResultPath(const std::string &local_path) {
    return local_path + ".fetch.json";
}


} // unnamed namespace


RemoteFetcher::RemoteFetcher(DumpSource * const dump_source, const ManifestStore &manifest_store, const RetryPolicy &retry_policy,
                             const std::string &download_directory, DatasetStore * const backup_store)
    : dump_source_(dump_source), manifest_store_(manifest_store), retry_policy_(retry_policy), download_directory_(download_directory),
      backup_store_(backup_store)
{
}


SourceDescriptor RemoteFetcher::probe(const std::string &name, const Category category, const std::string &url) const {
    const RemoteFileInfo remote_file_info(
        retry_policy_.run("probing " + url, PROBING, [&]() { return dump_source_->probe(url); }));

    const std::string signature(remote_file_info.getChangeSignature());
    if (signature.empty())
        throw FatalError(PROBING, "\"" + url + "\" advertises neither a Last-Modified date nor an ETag");

    return SourceDescriptor(name, category, url, remote_file_info.size_, signature, remote_file_info.sha256_);
}


bool RemoteFetcher::needsFetch(const SourceDescriptor &descriptor) const {
    ManifestEntry entry;
    if (not manifest_store_.lookup(descriptor.name_, &entry)) {
        LOG_INFO(descriptor.name_ + " has never been synchronised");
        return true;
    }

    if (entry.source_last_modified_ != descriptor.signature_) {
        LOG_INFO(descriptor.name_ + " changed from \"" + entry.source_last_modified_ + "\" to \"" + descriptor.signature_ + "\"");
        return true;
    }

    if (entry.content_sha256_.empty()) {
        LOG_INFO(descriptor.name_ + " has no recorded content hash");
        return true;
    }

    return false;
}


FetchResult RemoteFetcher::fetch(const SourceDescriptor &descriptor) {
    if (not FileUtil::IsDirectory(download_directory_) and not FileUtil::MakeDirectory(download_directory_, /* recursive = */ true))
        throw FatalError(FETCHING, "can't create \"" + download_directory_ + "\"");

    FetchResult previous_fetch_result;
    if (LoadFetchResult(download_directory_, descriptor.name_, &previous_fetch_result)) {
        if (previous_fetch_result.signature_ == descriptor.signature_
            and FileUtil::GetFileSize(previous_fetch_result.local_path_) == static_cast<off_t>(previous_fetch_result.size_))
        {
            LOG_INFO("reusing the existing download of " + descriptor.name_);
            return previous_fetch_result;
        }
        RemoveDownload(previous_fetch_result);
    }

    try {
        return retry_policy_.run("downloading " + descriptor.url_, FETCHING, [&]() { return downloadOnce(descriptor); });
    } catch (const CancelledError &) {
        throw;
    } catch (const SyncError &x) {
        LOG_WARNING("giving up on " + descriptor.url_ + ": " + std::string(x.what()));
        try {
            FetchResult fetch_result;
            if (recoverFromBackup(descriptor, &fetch_result))
                return fetch_result;
        } catch (const CancelledError &) {
            throw;
        } catch (const SyncError &recovery_error) {
            LOG_WARNING("recovery of " + descriptor.name_ + " from the backup failed: " + std::string(recovery_error.what()));
        }
        throw;
    }
}


FetchResult RemoteFetcher::downloadOnce(const SourceDescriptor &descriptor) {
    const std::string part_path(getLocalPath(descriptor.name_) + ".part");
    const std::string part_signature_path(part_path + ".signature");

    uint64_t resume_offset(0);
    std::string part_signature;
    if (FileUtil::Exists(part_path) and FileUtil::ReadString(part_signature_path, &part_signature)
        and part_signature == descriptor.signature_)
    {
        const off_t part_size(FileUtil::GetFileSize(part_path));
        if (part_size > 0)
            resume_offset = static_cast<uint64_t>(part_size);
    }
    if (descriptor.remote_size_ > 0 and resume_offset > descriptor.remote_size_)
        resume_offset = 0;

    if (resume_offset == 0) {
        FileUtil::DeleteFile(part_path);
        if (not FileUtil::WriteString(part_signature_path, descriptor.signature_))
            throw FatalError(FETCHING, "can't write \"" + part_signature_path + "\"");
    } else
        LOG_INFO("resuming the download of " + descriptor.name_ + " at byte " + std::to_string(resume_offset));

    if (descriptor.remote_size_ == 0 or resume_offset < descriptor.remote_size_) {
        try {
            dump_source_->download(descriptor.url_, part_path, resume_offset);
        } catch (const FatalError &) {
            // Don't resume a partial download that the origin refuses to continue.
            if (resume_offset > 0) {
                FileUtil::DeleteFile(part_path);
                FileUtil::DeleteFile(part_signature_path);
            }
            throw;
        }
    }
    CheckForCancellation(FETCHING);

    const off_t actual_size(FileUtil::GetFileSize(part_path));
    if (actual_size < 0)
        throw TransientError(FETCHING, "download of " + descriptor.url_ + " produced no file");
    if (descriptor.remote_size_ > 0 and static_cast<uint64_t>(actual_size) != descriptor.remote_size_) {
        FileUtil::DeleteFile(part_path);
        FileUtil::DeleteFile(part_signature_path);
        throw IntegrityError(FETCHING, "size mismatch for " + descriptor.name_ + ": expected " + std::to_string(descriptor.remote_size_)
                             + " bytes, got " + std::to_string(actual_size));
    }

    const std::string content_sha256(FileUtil::ComputeSha256(part_path));
    if (not descriptor.advertised_sha256_.empty() and content_sha256 != descriptor.advertised_sha256_) {
        FileUtil::DeleteFile(part_path);
        FileUtil::DeleteFile(part_signature_path);
        throw IntegrityError(FETCHING, "SHA-256 mismatch for " + descriptor.name_ + ": expected " + descriptor.advertised_sha256_
                             + ", got " + content_sha256);
    }

    FileUtil::DeleteFile(part_signature_path);
    return storeFetchResult(descriptor, part_path, content_sha256, /* recovered_from_backup = */ false);
}


FetchResult RemoteFetcher::storeFetchResult(const SourceDescriptor &descriptor, const std::string &part_path,
                                            const std::string &content_sha256, const bool recovered_from_backup)
{
    FetchResult fetch_result;
    fetch_result.local_path_ = getLocalPath(descriptor.name_);
    fetch_result.signature_ = descriptor.signature_;
    fetch_result.content_sha256_ = content_sha256;
    fetch_result.size_ = static_cast<uint64_t>(FileUtil::GetFileSize(part_path));
    fetch_result.recovered_from_backup_ = recovered_from_backup;

    if (not FileUtil::RenameFile(part_path, fetch_result.local_path_))
        throw FatalError(FETCHING, "can't rename \"" + part_path + "\" to \"" + fetch_result.local_path_ + "\"");
    if (not FileUtil::WriteStringAtomic(GetFetchResultPath(fetch_result.local_path_), fetch_result.toJson().dump(2)))
        throw FatalError(FETCHING, "can't write \"" + GetFetchResultPath(fetch_result.local_path_) + "\"");

    LOG_INFO("fetched " + descriptor.name_ + " (" + std::to_string(fetch_result.size_) + " bytes, SHA-256 " + content_sha256 + ")");
    return fetch_result;
}


// The backup consists of raw/<name>.json, which records the signature, hash and chunk list, and the chunks themselves.
bool RemoteFetcher::recoverFromBackup(const SourceDescriptor &descriptor, FetchResult * const fetch_result) {
    if (backup_store_ == nullptr)
        return false;

    const std::string metadata_path(getLocalPath(descriptor.name_) + ".backup.json");
    const FileUtil::AutoDeleteFile metadata_deleter(metadata_path);
    if (not backup_store_->download(GetRawBackupMetadataPath(descriptor.name_), metadata_path)) {
        LOG_INFO("no raw backup of " + descriptor.name_ + " in " + backup_store_->getDescription());
        return false;
    }

    std::string metadata_contents;
    if (not FileUtil::ReadString(metadata_path, &metadata_contents))
        throw FatalError(FETCHING, "can't read \"" + metadata_path + "\"");
    nlohmann::json metadata(nlohmann::json::parse(metadata_contents, nullptr, /* allow_exceptions = */ false));
    if (not metadata.is_object() or not metadata["signature"].is_string() or not metadata["sha256"].is_string()
        or not metadata["chunks"].is_array())
        throw FatalError(FETCHING, "malformed raw backup metadata for " + descriptor.name_);

    if (metadata["signature"].get<std::string>() != descriptor.signature_) {
        LOG_INFO("the raw backup of " + descriptor.name_ + " is of version \"" + metadata["signature"].get<std::string>()
                 + "\", not \"" + descriptor.signature_ + "\"");
        return false;
    }

    const std::string part_path(getLocalPath(descriptor.name_) + ".part");
    const std::string chunk_path(part_path + ".chunk");
    const FileUtil::AutoDeleteFile chunk_deleter(chunk_path);
    {
        std::ofstream part(part_path, std::ios::binary | std::ios::trunc);
        if (not part)
            throw FatalError(FETCHING, "can't open \"" + part_path + "\" for writing");

        for (const auto &chunk : metadata["chunks"]) {
            CheckForCancellation(FETCHING);
            if (not chunk.is_string())
                throw FatalError(FETCHING, "malformed chunk list in the raw backup metadata for " + descriptor.name_);
            const std::string remote_chunk_path(chunk.get<std::string>());
            const bool found(retry_policy_.run("downloading " + remote_chunk_path + " from the backup", FETCHING,
                                               [&]() { return backup_store_->download(remote_chunk_path, chunk_path); }));
            if (not found)
                throw FatalError(FETCHING, "backup chunk \"" + remote_chunk_path + "\" is missing");

            std::ifstream chunk_input(chunk_path, std::ios::binary);
            part << chunk_input.rdbuf();
            if (not part)
                throw FatalError(FETCHING, "failed to append \"" + chunk_path + "\" to \"" + part_path + "\"");
        }
    }

    const std::string content_sha256(FileUtil::ComputeSha256(part_path));
    if (content_sha256 != metadata["sha256"].get<std::string>()
        or (not descriptor.advertised_sha256_.empty() and content_sha256 != descriptor.advertised_sha256_))
    {
        FileUtil::DeleteFile(part_path);
        throw IntegrityError(FETCHING, "the raw backup of " + descriptor.name_ + " failed verification");
    }

    *fetch_result = storeFetchResult(descriptor, part_path, content_sha256, /* recovered_from_backup = */ true);
    LOG_WARNING("recovered " + descriptor.name_ + " from the raw backup in " + backup_store_->getDescription());
    return true;
}


bool RemoteFetcher::LoadFetchResult(const std::string &download_directory, const std::string &name, FetchResult * const fetch_result) {
    const std::string local_path(download_directory + "/" + name);
    std::string fetch_result_contents;
    if (not FileUtil::Exists(local_path) or not FileUtil::ReadString(GetFetchResultPath(local_path), &fetch_result_contents))
        return false;

    const nlohmann::json fetch_result_json(nlohmann::json::parse(fetch_result_contents, nullptr, /* allow_exceptions = */ false));
    if (fetch_result_json.is_discarded()) {
        LOG_WARNING("ignoring the unparsable \"" + GetFetchResultPath(local_path) + "\"");
        return false;
    }

    try {
        *fetch_result = FetchResult::FromJson(fetch_result_json);
    } catch (const std::runtime_error &x) {
        LOG_WARNING("ignoring \"" + GetFetchResultPath(local_path) + "\": " + std::string(x.what()));
        return false;
    }
    fetch_result->local_path_ = local_path;

    return true;
}


void RemoteFetcher::RemoveDownload(const FetchResult &fetch_result) {
    if (not FileUtil::DeleteFile(fetch_result.local_path_) and FileUtil::Exists(fetch_result.local_path_))
        LOG_WARNING("failed to delete \"" + fetch_result.local_path_ + "\"");
    FileUtil::DeleteFile(GetFetchResultPath(fetch_result.local_path_));
}


} // namespace OLSync
