/** \file   SyncPipeline.cc
 *  \brief  Implementation of class SyncPipeline.
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
#include "SyncPipeline.h"
#include <memory>
#include "ColumnarWriter.h"
#include "DatasetPublisher.h"
#include "DumpParser.h"
#include "FileUtil.h"
#include "RemoteFetcher.h"
#include "SchemaMapper.h"
#include "util.h"


namespace OLSync {


std::string SourceStateToString(const SourceState source_state) {
    switch (source_state) {
    case SOURCE_UNSEEN:
        return "UNSEEN";
    case SOURCE_FETCHING:
        return "FETCHING";
    case SOURCE_FETCHED:
        return "FETCHED";
    case SOURCE_PARSING:
        return "PARSING";
    case SOURCE_WRITING:
        return "WRITING";
    case SOURCE_PUBLISHING:
        return "PUBLISHING";
    case SOURCE_PUBLISHED:
        return "PUBLISHED";
    }

    LOG_ERROR("unknown source state " + std::to_string(source_state) + "!");
}


std::string SourceReport::toString() const {
    if (not success_)
        return source_name_ + ": failed during " + StageToString(failed_stage_) + ": " + error_message_ + " ("
               + std::to_string(skipped_count_) + " records skipped)";

    if (not changed_)
        return source_name_ + ": up to date (\"" + signature_ + "\")";

    if (dry_run_)
        return source_name_ + ": would be synchronised to \"" + signature_ + "\"";

    if (final_state_ == SOURCE_FETCHED)
        return source_name_ + ": fetched \"" + signature_ + "\"" + (recovered_from_backup_ ? " from the raw backup" : "");

    return source_name_ + ": published " + std::to_string(rows_written_) + " rows in " + std::to_string(segments_.size())
           + " segment(s), " + std::to_string(skipped_count_) + " records skipped, new signature \"" + signature_ + "\"";
}


namespace {


void SetState(const SourceState new_state, SourceReport * const report) {
    LOG_DEBUG(report->source_name_ + ": " + SourceStateToString(report->final_state_) + " -> " + SourceStateToString(new_state));
    report->final_state_ = new_state;
}


// Also called on the failure path, where the counts cover the records read before the failure.
void UpdateSkipCounts(const DumpRecordProducer * const record_producer, const SchemaMapper &schema_mapper,
                      SourceReport * const report)
{
    if (record_producer == nullptr)
        return;

    const ParseStatistics &parse_statistics(record_producer->getStatistics());
    report->skipped_count_ = parse_statistics.malformed_count_ + schema_mapper.getSkippedCount();
    report->foreign_count_ = parse_statistics.foreign_count_;
}


} // unnamed namespace


SyncPipeline::SyncPipeline(const SyncConfig &config, ManifestStore * const manifest_store, DumpSource * const dump_source,
                           DatasetStore * const dataset_store)
    : config_(config), manifest_store_(manifest_store), dump_source_(dump_source), dataset_store_(dataset_store),
      retry_policy_(config.getRetryPolicy())
{
}


void SyncPipeline::recordFailure(const SyncError &sync_error, SourceReport * const report) const {
    report->success_ = false;
    report->failed_stage_ = sync_error.getStage();
    report->error_message_ = sync_error.what();
    SetState(SOURCE_UNSEEN, report);
    LOG_WARNING(report->toString());
}


SourceReport SyncPipeline::ensureLocalArtifact(const SourceConfig &source, FetchResult * const fetch_result) {
    SourceReport report(source.name_);
    report.dry_run_ = config_.dry_run_;

    try {
        RemoteFetcher fetcher(dump_source_, *manifest_store_, retry_policy_, config_.getDownloadDirectory(), dataset_store_);
        const SourceDescriptor descriptor(fetcher.probe(source.name_, source.category_, source.url_));
        report.signature_ = descriptor.signature_;

        if (not fetcher.needsFetch(descriptor)) {
            report.success_ = true;
            SetState(SOURCE_PUBLISHED, &report);
            LOG_INFO(report.toString());
            return report;
        }

        report.changed_ = true;
        if (config_.dry_run_) {
            report.success_ = true;
            LOG_INFO(report.toString());
            return report;
        }

        SetState(SOURCE_FETCHING, &report);
        *fetch_result = fetcher.fetch(descriptor);
        report.recovered_from_backup_ = fetch_result->recovered_from_backup_;
        SetState(SOURCE_FETCHED, &report);
        report.success_ = true;
    } catch (const CancelledError &) {
        throw;
    } catch (const SyncError &x) {
        recordFailure(x, &report);
    }

    return report;
}


SourceReport SyncPipeline::processLocalArtifact(const SourceConfig &source, const FetchResult &fetch_result) {
    SourceReport report(source.name_);
    report.signature_ = fetch_result.signature_;
    report.recovered_from_backup_ = fetch_result.recovered_from_backup_;
    report.dry_run_ = config_.dry_run_;
    SetState(SOURCE_FETCHED, &report);

    ManifestEntry entry;
    if (manifest_store_->lookup(source.name_, &entry) and entry.source_last_modified_ == fetch_result.signature_
        and entry.content_sha256_ == fetch_result.content_sha256_)
    {
        report.success_ = true;
        SetState(SOURCE_PUBLISHED, &report);
        LOG_INFO(report.toString());
        return report;
    }

    report.changed_ = true;
    if (config_.dry_run_) {
        report.success_ = true;
        LOG_INFO(report.toString());
        return report;
    }

    const SourceDescriptor descriptor(source.name_, source.category_, source.url_, fetch_result.size_, fetch_result.signature_);
    std::unique_ptr<DumpRecordProducer> record_producer;
    SchemaMapper schema_mapper(source.category_);
    try {
        if (not FileUtil::IsDirectory(config_.work_dir_) and not FileUtil::MakeDirectory(config_.work_dir_, /* recursive = */ true))
            throw FatalError(WRITING, "can't create \"" + config_.work_dir_ + "\"");
        const FileUtil::AutoTempDirectory scratch_directory(config_.work_dir_ + "/" + CategoryToString(source.category_) + "_segments_");

        SetState(SOURCE_PARSING, &report);
        record_producer = Parse(fetch_result.local_path_, source.category_);
        ColumnarWriter columnar_writer(source.category_, scratch_directory.getDirectoryPath(), config_.writer_options_);

        SetState(SOURCE_WRITING, &report);
        RawRecord raw_record;
        MappedRecord mapped_record(source.category_);
        while (record_producer->next(&raw_record)) {
            if (schema_mapper.map(raw_record, &mapped_record))
                columnar_writer.add(mapped_record);
        }
        const std::vector<std::string> segment_paths(columnar_writer.finish());

        const ParseStatistics &parse_statistics(record_producer->getStatistics());
        report.rows_written_ = columnar_writer.getRowsWritten();
        UpdateSkipCounts(record_producer.get(), schema_mapper, &report);
        LOG_INFO(source.name_ + ": read " + std::to_string(parse_statistics.lines_read_) + " lines, "
                 + std::to_string(parse_statistics.malformed_count_) + " malformed, " + std::to_string(parse_statistics.foreign_count_)
                 + " foreign, " + std::to_string(schema_mapper.getSkippedCount()) + " without a key");

        SetState(SOURCE_PUBLISHING, &report);
        DatasetPublisher publisher(dataset_store_, manifest_store_, retry_policy_,
                                   PublishOptions(config_.upload_manifest_, config_.upload_raw_dumps_, config_.max_upload_chunk_size_));
        std::string error_message;
        if (not publisher.publish(descriptor, segment_paths, fetch_result, report.rows_written_, report.skipped_count_,
                                  &error_message))
            throw FatalError(PUBLISHING, error_message);

        if (manifest_store_->lookup(source.name_, &entry))
            report.segments_ = entry.segments_;
        SetState(SOURCE_PUBLISHED, &report);
        report.success_ = true;
        LOG_INFO(report.toString());
    } catch (const CancelledError &) {
        throw;
    } catch (const SyncError &x) {
        UpdateSkipCounts(record_producer.get(), schema_mapper, &report);
        recordFailure(x, &report);
    }

    return report;
}


SourceReport SyncPipeline::processLocalArtifact(const SourceConfig &source) {
    FetchResult fetch_result;
    if (not RemoteFetcher::LoadFetchResult(config_.getDownloadDirectory(), source.name_, &fetch_result)) {
        SourceReport report(source.name_);
        recordFailure(FatalError(FETCHING, "no complete download in \"" + config_.getDownloadDirectory() + "\""), &report);
        return report;
    }

    return processLocalArtifact(source, fetch_result);
}


SourceReport SyncPipeline::runOne(const SourceConfig &source) {
    FetchResult fetch_result;
    const SourceReport fetch_report(ensureLocalArtifact(source, &fetch_result));
    if (not fetch_report.success_ or not fetch_report.changed_ or config_.dry_run_)
        return fetch_report;

    const SourceReport report(processLocalArtifact(source, fetch_result));
    if (not config_.keep_downloads_)
        RemoteFetcher::RemoveDownload(fetch_result);

    return report;
}


std::vector<SourceReport> SyncPipeline::runAll() {
    std::vector<SourceReport> reports;
    for (const auto &source : config_.sources_) {
        if (not source.enabled_) {
            LOG_DEBUG("skipping the disabled source " + source.name_);
            continue;
        }

        CheckForCancellation(PROBING);
        reports.emplace_back(runOne(source));
    }

    return reports;
}


} // namespace OLSync
