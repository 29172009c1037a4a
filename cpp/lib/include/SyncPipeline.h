/** \file   SyncPipeline.h
 *  \brief  Drives each dump source from probing to a published and committed artifact.
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
#include "DumpSource.h"
#include "ManifestStore.h"
#include "RetryPolicy.h"
#include "SyncConfig.h"
#include "SyncTypes.h"


namespace OLSync {


// SOURCE_PUBLISHED is terminal for a given signature.  Any failure before the manifest commit returns a source to
// SOURCE_UNSEEN.
enum SourceState { SOURCE_UNSEEN, SOURCE_FETCHING, SOURCE_FETCHED, SOURCE_PARSING, SOURCE_WRITING, SOURCE_PUBLISHING, SOURCE_PUBLISHED };


std::string SourceStateToString(const SourceState source_state);


struct SourceReport {
    std::string source_name_;
    SourceState final_state_;
    bool success_;
    bool changed_;     // False if the source was already up to date.
    bool dry_run_;
    Stage failed_stage_;
    std::string error_message_;
    std::string signature_;
    uint64_t rows_written_;
    uint64_t skipped_count_;   // Malformed lines plus records without a key.
    uint64_t foreign_count_;
    std::vector<std::string> segments_;
    bool recovered_from_backup_;

public:
    explicit SourceReport(const std::string &source_name)
        : source_name_(source_name), final_state_(SOURCE_UNSEEN), success_(false), changed_(false), dry_run_(false),
          failed_stage_(PROBING), rows_written_(0), skipped_count_(0), foreign_count_(0), recovered_from_backup_(false) { }

    std::string toString() const;
};


/** \class  SyncPipeline
 *  \brief  Processes sources sequentially.  Failures are isolated per source and reported, cancellation ends the run.
 */
class SyncPipeline {
    const SyncConfig &config_;
    ManifestStore * const manifest_store_;
    DumpSource * const dump_source_;
    DatasetStore * const dataset_store_;
    RetryPolicy retry_policy_;

public:
    SyncPipeline(const SyncConfig &config, ManifestStore * const manifest_store, DumpSource * const dump_source,
                 DatasetStore * const dataset_store);

    void setRetryPolicy(const RetryPolicy &retry_policy) { retry_policy_ = retry_policy; }

    /** \brief  Probes the source and, if it changed since the last publication, makes sure there is a verified local copy.
     *  \param  fetch_result  Only set if the report says the source changed and we're not in dry-run mode.
     *  \throws CancelledError.
     */
    SourceReport ensureLocalArtifact(const SourceConfig &source, FetchResult * const fetch_result);

    /** \brief  Converts a local copy into segments, publishes them and commits the manifest.
     *  \note   Nothing happens if the manifest already records the same signature and content hash.
     *  \throws CancelledError.
     */
    SourceReport processLocalArtifact(const SourceConfig &source, const FetchResult &fetch_result);

    //* \brief Like the above, for the copy left in the download directory by an earlier ensureLocalArtifact() call.
    SourceReport processLocalArtifact(const SourceConfig &source);

    /** \brief  ensureLocalArtifact() followed, if needed, by processLocalArtifact().  Unless downloads are to be kept
     *          the local copy is removed afterwards.
     */
    SourceReport runOne(const SourceConfig &source);

    //* \brief Calls runOne() for each enabled source.
    std::vector<SourceReport> runAll();
private:
    void recordFailure(const SyncError &sync_error, SourceReport * const report) const;
};


} // namespace OLSync
