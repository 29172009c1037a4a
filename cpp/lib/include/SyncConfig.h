/** \file   SyncConfig.h
 *  \brief  Configuration of the Open Library dump synchronisation.
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


#include <memory>
#include <string>
#include <vector>
#include <cinttypes>
#include "ColumnarWriter.h"
#include "DatasetStore.h"
#include "Downloader.h"
#include "IniFile.h"
#include "RetryPolicy.h"
#include "SyncTypes.h"


namespace OLSync {


struct SourceConfig {
    std::string name_; // Also the key in the manifest.
    Category category_;
    std::string url_;
    bool enabled_;

public:
    SourceConfig(const Category category, const std::string &url, const bool enabled = true)
        : name_(GetDumpFileName(category)), category_(category), url_(url), enabled_(enabled) { }
};


struct SyncConfig {
    // [Global]
    std::string work_dir_;
    std::string manifest_path_;
    bool keep_downloads_;
    bool dry_run_;

    // [Remote]
    std::string user_agent_;
    unsigned timeout_ms_;         // Per request, 0 means no limit.  Probes always have a limit.
    unsigned connect_timeout_ms_;
    bool ignore_ssl_certificates_;

    // [Retry]
    unsigned max_attempts_;
    unsigned initial_delay_ms_;
    double backoff_factor_;
    unsigned max_delay_ms_;

    // [Columnar]
    WriterOptions writer_options_;

    // [DatasetStore]
    std::string store_type_; // "http" or "local"
    std::string base_url_;
    std::string dataset_id_;
    std::string token_env_variable_;
    std::string local_directory_;
    bool upload_raw_dumps_;
    uint64_t max_upload_chunk_size_;
    bool upload_manifest_;

    // [authors], [editions], [works]
    std::vector<SourceConfig> sources_;

public:
    //* \brief Creates a configuration with all defaults.
    SyncConfig();

    //* \brief Overrides our defaults with whatever is set in "ini_file".  Invalid settings abort the program.
    void load(const IniFile &ini_file);

    RetryPolicy getRetryPolicy() const;
    Downloader::Params getDownloaderParams() const;
    std::string getDownloadDirectory() const { return work_dir_ + "/downloads"; }

    //* \return nullptr if there is no source with the given category or dump file name.
    const SourceConfig *lookupSource(const std::string &name_or_category) const;
};


/** \brief  Creates the dataset store selected by "config".
 *  \note   The access token for the HTTP store is read from the environment variable named in the configuration.
 */
std::unique_ptr<DatasetStore> CreateDatasetStore(const SyncConfig &config);


} // namespace OLSync
