/** \file   SyncTypes.h
 *  \brief  Types shared by all stages of the Open Library dump synchronisation.
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


#include <atomic>
#include <stdexcept>
#include <string>
#include <vector>
#include <cinttypes>
#include <nlohmann/json.hpp>


class Downloader;


namespace OLSync {


enum Category { AUTHORS, EDITIONS, WORKS };


const std::vector<Category> &GetAllCategories();


//* \return "authors", "editions" or "works".  Also the name of the category's directory in the dataset.
std::string CategoryToString(const Category category);


bool StringToCategory(const std::string &category_candidate, Category * const category);


//* \return E.g. "ol_dump_authors_latest.txt.gz".  The file name doubles as the source name in the manifest.
std::string GetDumpFileName(const Category category);


//* \return E.g. "/type/author".
std::string GetTypeTag(const Category category);


std::string GetDefaultDumpUrl(const Category category);


// The pipeline stage at which an error occurred.
enum Stage { PROBING, FETCHING, PARSING, MAPPING, WRITING, PUBLISHING, COMMITTING };


std::string StageToString(const Stage stage);


class SyncError : public std::runtime_error {
    Stage stage_;

public:
    SyncError(const Stage stage, const std::string &message): std::runtime_error(message), stage_(stage) { }

    inline Stage getStage() const { return stage_; }
};


// Errors that may go away if the operation is simply repeated.
class RetryableError : public SyncError {
public:
    RetryableError(const Stage stage, const std::string &message): SyncError(stage, message) { }
};


// Network failures, timeouts, HTTP 5xx and 429 responses.
class TransientError : public RetryableError {
public:
    TransientError(const Stage stage, const std::string &message): RetryableError(stage, message) { }
};


// A transfer completed but the size or checksum did not match.
class IntegrityError : public RetryableError {
public:
    IntegrityError(const Stage stage, const std::string &message): RetryableError(stage, message) { }
};


class FatalError : public SyncError {
public:
    FatalError(const Stage stage, const std::string &message): SyncError(stage, message) { }
};


class CancelledError : public SyncError {
public:
    explicit CancelledError(const Stage stage): SyncError(stage, "cancelled during " + StageToString(stage)) { }
};


/** \brief Installs SIGINT and SIGTERM handlers that set the process-wide cancellation flag. */
void InstallCancellationHandlers();


void RequestCancellation();
void ResetCancellation();
bool CancellationRequested();


//* \return The flag that is set by the signal handlers, suitable for Downloader::Params.
const std::atomic<bool> *GetCancellationFlag();


//* \throws CancelledError if cancellation has been requested.
void CheckForCancellation(const Stage stage);


/** \brief  Identifies one remote dump file and the version of it that is currently published by the origin.
 *  \note   Produced by probing the remote and never modified afterwards.
 */
struct SourceDescriptor {
    std::string name_;
    Category category_;
    std::string url_;
    uint64_t remote_size_;          // 0 if not advertised
    std::string signature_;         // Last-Modified or, as a fallback, the ETag
    std::string advertised_sha256_; // lowercase hex or empty

public:
    SourceDescriptor(): category_(AUTHORS), remote_size_(0) { }
    SourceDescriptor(const std::string &name, const Category category, const std::string &url, const uint64_t remote_size,
                     const std::string &signature, const std::string &advertised_sha256 = "")
        : name_(name), category_(category), url_(url), remote_size_(remote_size), signature_(signature),
          advertised_sha256_(advertised_sha256) { }
};


// A verified local copy of a dump file.
struct FetchResult {
    std::string local_path_;
    std::string signature_;
    std::string content_sha256_;
    uint64_t size_;
    bool recovered_from_backup_;

public:
    FetchResult(): size_(0), recovered_from_backup_(false) { }

    nlohmann::json toJson() const;

    //* \throws std::runtime_error if "json_obj" lacks required members.
    static FetchResult FromJson(const nlohmann::json &json_obj);
};


// One decoded dump line.
struct RawRecord {
    std::string type_;
    std::string key_;
    std::string revision_;
    std::string last_modified_;
    nlohmann::json json_;
    uint64_t line_no_;

public:
    RawRecord(): line_no_(0) { }
};


/** \brief  Converts a failed Downloader request into the matching exception.
 *  \note   Cancellation becomes a CancelledError, connection problems, timeouts, HTTP 408, 429 and 5xx a TransientError
 *          and everything else, e.g. a 404 or 403, a FatalError.
 */
[[noreturn]] void ThrowTransferError(const Downloader &downloader, const Stage stage, const std::string &what);


} // namespace OLSync
