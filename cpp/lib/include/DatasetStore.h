/** \file   DatasetStore.h
 *  \brief  The remote dataset repository that converted segments, raw dump backups and the manifest are published to.
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
#include "Downloader.h"


namespace OLSync {


/** \brief  Paths passed to the member functions are relative to the dataset root, e.g. "authors/0a1b2c3d/part-00000.parquet".
 *  \note   All member functions throw TransientError's for conditions that may go away on their own and FatalError's for
 *          everything else.
 */
class DatasetStore {
public:
    virtual ~DatasetStore() = default;

    virtual void upload(const std::string &local_path, const std::string &remote_path) = 0;
    virtual void uploadData(const std::string &data, const std::string &remote_path) = 0;

    //* \return False if "remote_path" does not exist in the store.
    virtual bool download(const std::string &remote_path, const std::string &local_path) = 0;

    virtual std::string getDescription() const = 0;
};


// Talks to an HTTP dataset service that accepts PUT and GET requests for <base_url>/<dataset_id>/<remote_path>.
class HttpDatasetStore : public DatasetStore {
    std::string base_url_;
    std::string dataset_id_;
    Downloader::Params downloader_params_;
    unsigned time_limit_; // ms, 0 means no limit

public:
    /** \param auth_token  If non-empty, sent as a bearer token with every request.
     */
    HttpDatasetStore(const std::string &base_url, const std::string &dataset_id, const std::string &auth_token,
                     const Downloader::Params &downloader_params = Downloader::Params(), const unsigned time_limit = 0);

    void upload(const std::string &local_path, const std::string &remote_path) override;
    void uploadData(const std::string &data, const std::string &remote_path) override;
    bool download(const std::string &remote_path, const std::string &local_path) override;
    std::string getDescription() const override { return base_url_ + "/" + dataset_id_; }

    std::string getUrl(const std::string &remote_path) const;
};


// Stores the dataset in a local directory tree.  Files are staged under a temporary name and then renamed into place.
class LocalDirectoryDatasetStore : public DatasetStore {
    std::string root_directory_;

public:
    explicit LocalDirectoryDatasetStore(const std::string &root_directory);

    void upload(const std::string &local_path, const std::string &remote_path) override;
    void uploadData(const std::string &data, const std::string &remote_path) override;
    bool download(const std::string &remote_path, const std::string &local_path) override;
    std::string getDescription() const override { return root_directory_; }
private:
    std::string prepareTarget(const std::string &remote_path) const;
};


} // namespace OLSync
