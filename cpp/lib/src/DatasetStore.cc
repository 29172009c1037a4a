/** \file   DatasetStore.cc
 *  \brief  Implementations of the dataset stores.
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
#include "DatasetStore.h"
#include <cerrno>
#include <cstring>
#include "FileUtil.h"
#include "StringUtil.h"
#include "SyncTypes.h"
#include "util.h"


namespace OLSync {


namespace {


// Rejects absolute paths and paths that would escape the dataset root.
void CheckRemotePath(const std::string &remote_path) {
    if (remote_path.empty() or remote_path[0] == '/')
        throw FatalError(PUBLISHING, "invalid dataset path \"" + remote_path + "\"!");

    std::vector<std::string> path_components;
    StringUtil::Split(remote_path, '/', &path_components);
    for (const auto &path_component : path_components) {
        if (path_component == "..")
            throw FatalError(PUBLISHING, "invalid dataset path \"" + remote_path + "\"!");
    }
}


} // unnamed namespace


HttpDatasetStore::HttpDatasetStore(const std::string &base_url, const std::string &dataset_id, const std::string &auth_token,
                                   const Downloader::Params &downloader_params, const unsigned time_limit)
    : base_url_(base_url), dataset_id_(dataset_id), downloader_params_(downloader_params), time_limit_(time_limit)
{
    StringUtil::Trim("/", &base_url_);
    if (not auth_token.empty())
        downloader_params_.additional_headers_.emplace_back("Authorization: Bearer " + auth_token);
}


std::string HttpDatasetStore::getUrl(const std::string &remote_path) const {
    return base_url_ + "/" + dataset_id_ + "/" + remote_path;
}


void HttpDatasetStore::upload(const std::string &local_path, const std::string &remote_path) {
    CheckRemotePath(remote_path);

    Downloader downloader(downloader_params_);
    if (not downloader.putFile(getUrl(remote_path), local_path, time_limit_))
        ThrowTransferError(downloader, PUBLISHING, "uploading \"" + local_path + "\" to \"" + getUrl(remote_path) + "\"");
    LOG_DEBUG("uploaded \"" + local_path + "\" to \"" + getUrl(remote_path) + "\"");
}


void HttpDatasetStore::uploadData(const std::string &data, const std::string &remote_path) {
    CheckRemotePath(remote_path);

    Downloader downloader(downloader_params_);
    if (not downloader.putData(getUrl(remote_path), data, time_limit_ == 0 ? Downloader::DEFAULT_TIME_LIMIT : time_limit_))
        ThrowTransferError(downloader, PUBLISHING, "uploading " + std::to_string(data.size()) + " bytes to \"" + getUrl(remote_path) + "\"");
}


bool HttpDatasetStore::download(const std::string &remote_path, const std::string &local_path) {
    CheckRemotePath(remote_path);

    Downloader downloader(downloader_params_);
    if (downloader.downloadToFile(getUrl(remote_path), local_path, /* resume_offset = */ 0, time_limit_))
        return true;

    if (downloader.getResponseCode() == 404) {
        FileUtil::DeleteFile(local_path);
        return false;
    }
    ThrowTransferError(downloader, FETCHING, "downloading \"" + getUrl(remote_path) + "\"");
}


LocalDirectoryDatasetStore::LocalDirectoryDatasetStore(const std::string &root_directory): root_directory_(root_directory) {
    if (not FileUtil::IsDirectory(root_directory_) and not FileUtil::MakeDirectory(root_directory_, /* recursive = */ true))
        throw std::runtime_error("in LocalDirectoryDatasetStore::LocalDirectoryDatasetStore: can't create \"" + root_directory_ + "\"!");
}


std::string LocalDirectoryDatasetStore::prepareTarget(const std::string &remote_path) const {
    CheckRemotePath(remote_path);

    const std::string target_path(root_directory_ + "/" + remote_path);
    const std::string target_directory(FileUtil::GetDirname(target_path));
    if (not FileUtil::IsDirectory(target_directory) and not FileUtil::MakeDirectory(target_directory, /* recursive = */ true))
        throw FatalError(PUBLISHING, "can't create \"" + target_directory + "\" (" + std::string(std::strerror(errno)) + ")");

    return target_path;
}


void LocalDirectoryDatasetStore::upload(const std::string &local_path, const std::string &remote_path) {
    const std::string target_path(prepareTarget(remote_path));
    const std::string staging_path(target_path + ".staging");
    if (not FileUtil::CopyFile(local_path, staging_path)) {
        FileUtil::DeleteFile(staging_path);
        throw FatalError(PUBLISHING, "failed to copy \"" + local_path + "\" to \"" + staging_path + "\"");
    }
    if (not FileUtil::RenameFile(staging_path, target_path))
        throw FatalError(PUBLISHING, "failed to rename \"" + staging_path + "\" to \"" + target_path + "\"");
}


void LocalDirectoryDatasetStore::uploadData(const std::string &data, const std::string &remote_path) {
    const std::string target_path(prepareTarget(remote_path));
    if (not FileUtil::WriteStringAtomic(target_path, data))
        throw FatalError(PUBLISHING, "failed to write \"" + target_path + "\" (" + std::string(std::strerror(errno)) + ")");
}


bool LocalDirectoryDatasetStore::download(const std::string &remote_path, const std::string &local_path) {
    CheckRemotePath(remote_path);

    const std::string source_path(root_directory_ + "/" + remote_path);
    if (not FileUtil::Exists(source_path))
        return false;
    if (not FileUtil::CopyFile(source_path, local_path))
        throw FatalError(FETCHING, "failed to copy \"" + source_path + "\" to \"" + local_path + "\"");

    return true;
}


} // namespace OLSync
