/** \file   SyncConfig.cc
 *  \brief  Loading of the synchronisation configuration.
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
#include "SyncConfig.h"
#include <cstdlib>
#include "util.h"


namespace OLSync {


SyncConfig::SyncConfig()
    : work_dir_("/tmp/ol_dump_sync"), manifest_path_("ol_sync_manifest.json"), keep_downloads_(false), dry_run_(false),
      user_agent_(Downloader::DEFAULT_USER_AGENT_STRING), timeout_ms_(0), connect_timeout_ms_(30000), ignore_ssl_certificates_(false),
      max_attempts_(RetryPolicy::DEFAULT_MAX_ATTEMPTS), initial_delay_ms_(RetryPolicy::DEFAULT_INITIAL_DELAY), backoff_factor_(2.0),
      max_delay_ms_(RetryPolicy::DEFAULT_MAX_DELAY), store_type_("local"), dataset_id_("openlibrary"),
      token_env_variable_("HF_TOKEN"), local_directory_("/tmp/ol_dump_sync/dataset"), upload_raw_dumps_(false),
      max_upload_chunk_size_(5ull * 1024ull * 1024ull * 1024ull), upload_manifest_(true)
{
    for (const auto category : GetAllCategories())
        sources_.emplace_back(category, GetDefaultDumpUrl(category));
}


void SyncConfig::load(const IniFile &ini_file) {
    work_dir_ = ini_file.getString("Global", "work_dir", work_dir_);
    manifest_path_ = ini_file.getString("Global", "manifest_path", manifest_path_);
    keep_downloads_ = ini_file.getBool("Global", "keep_downloads", keep_downloads_);
    dry_run_ = ini_file.getBool("Global", "dry_run", dry_run_);

    user_agent_ = ini_file.getString("Remote", "user_agent", user_agent_);
    timeout_ms_ = ini_file.getUnsigned("Remote", "timeout_ms", timeout_ms_);
    connect_timeout_ms_ = ini_file.getUnsigned("Remote", "connect_timeout_ms", connect_timeout_ms_);
    ignore_ssl_certificates_ = ini_file.getBool("Remote", "ignore_ssl_certificates", ignore_ssl_certificates_);

    max_attempts_ = ini_file.getUnsigned("Retry", "max_attempts", max_attempts_);
    if (max_attempts_ == 0)
        LOG_ERROR("\"max_attempts\" in section [Retry] of \"" + ini_file.getFilename() + "\" must be at least 1!");
    initial_delay_ms_ = ini_file.getUnsigned("Retry", "initial_delay_ms", initial_delay_ms_);
    backoff_factor_ = ini_file.getDouble("Retry", "backoff_factor", backoff_factor_);
    if (backoff_factor_ < 1.0)
        LOG_ERROR("\"backoff_factor\" in section [Retry] of \"" + ini_file.getFilename() + "\" must not be less than 1!");
    max_delay_ms_ = ini_file.getUnsigned("Retry", "max_delay_ms", max_delay_ms_);

    writer_options_.max_rows_per_segment_ = ini_file.getUint64T("Columnar", "max_rows_per_segment", writer_options_.max_rows_per_segment_);
    writer_options_.max_bytes_per_segment_ =
        ini_file.getUint64T("Columnar", "max_bytes_per_segment", writer_options_.max_bytes_per_segment_);
    if (writer_options_.max_rows_per_segment_ == 0 or writer_options_.max_bytes_per_segment_ == 0)
        LOG_ERROR("the segment limits in section [Columnar] of \"" + ini_file.getFilename() + "\" must be positive!");
    writer_options_.compression_ = ini_file.getString("Columnar", "compression", writer_options_.compression_);
    if (not IsValidCompression(writer_options_.compression_))
        LOG_ERROR("unsupported compression \"" + writer_options_.compression_ + "\" in \"" + ini_file.getFilename() + "\"!");

    store_type_ = ini_file.getString("DatasetStore", "type", store_type_);
    if (store_type_ != "http" and store_type_ != "local")
        LOG_ERROR("unknown dataset store type \"" + store_type_ + "\" in \"" + ini_file.getFilename() + "\"!");
    base_url_ = ini_file.getString("DatasetStore", "base_url", base_url_);
    if (store_type_ == "http" and base_url_.empty())
        LOG_ERROR("an HTTP dataset store requires \"base_url\" in section [DatasetStore] of \"" + ini_file.getFilename() + "\"!");
    dataset_id_ = ini_file.getString("DatasetStore", "dataset_id", dataset_id_);
    token_env_variable_ = ini_file.getString("DatasetStore", "token_env_variable", token_env_variable_);
    local_directory_ = ini_file.getString("DatasetStore", "local_directory", local_directory_);
    upload_raw_dumps_ = ini_file.getBool("DatasetStore", "upload_raw_dumps", upload_raw_dumps_);
    max_upload_chunk_size_ = ini_file.getUint64T("DatasetStore", "max_upload_chunk_size", max_upload_chunk_size_);
    if (max_upload_chunk_size_ == 0)
        LOG_ERROR("\"max_upload_chunk_size\" in section [DatasetStore] of \"" + ini_file.getFilename() + "\" must be positive!");
    upload_manifest_ = ini_file.getBool("DatasetStore", "upload_manifest", upload_manifest_);

    for (auto &source : sources_) {
        const std::string section_name(CategoryToString(source.category_));
        source.url_ = ini_file.getString(section_name, "url", source.url_);
        source.enabled_ = ini_file.getBool(section_name, "enabled", source.enabled_);
    }
}


RetryPolicy SyncConfig::getRetryPolicy() const {
    return RetryPolicy(max_attempts_, initial_delay_ms_, backoff_factor_, max_delay_ms_);
}


Downloader::Params SyncConfig::getDownloaderParams() const {
    Downloader::Params params(user_agent_, connect_timeout_ms_);
    params.ignore_ssl_certificates_ = ignore_ssl_certificates_;
    params.cancellation_flag_ = GetCancellationFlag();
    return params;
}


const SourceConfig *SyncConfig::lookupSource(const std::string &name_or_category) const {
    Category category;
    if (not StringToCategory(name_or_category, &category))
        return nullptr;

    for (const auto &source : sources_) {
        if (source.category_ == category)
            return &source;
    }

    return nullptr;
}


std::unique_ptr<DatasetStore> CreateDatasetStore(const SyncConfig &config) {
    if (config.store_type_ == "local")
        return std::unique_ptr<DatasetStore>(new LocalDirectoryDatasetStore(config.local_directory_));

    const char * const token(std::getenv(config.token_env_variable_.c_str()));
    if (token == nullptr)
        LOG_WARNING("$" + config.token_env_variable_ + " is not set, uploads to " + config.base_url_ + " will be anonymous");

    return std::unique_ptr<DatasetStore>(new HttpDatasetStore(config.base_url_, config.dataset_id_, token == nullptr ? "" : token,
                                                              config.getDownloaderParams(), config.timeout_ms_));
}


} // namespace OLSync
