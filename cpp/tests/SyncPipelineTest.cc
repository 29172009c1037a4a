/** \brief Test cases for SyncPipeline
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
#include <set>
#include <string>
#include <vector>
#include "ColumnarWriter.h"
#include "DatasetPublisher.h"
#include "DatasetStore.h"
#include "FileUtil.h"
#include "ManifestStore.h"
#include "RemoteFetcher.h"
#include "RetryPolicy.h"
#include "SyncConfig.h"
#include "SyncPipeline.h"
#include "SyncTestUtil.h"
#include "SyncTypes.h"
#include "UnitTest.h"


namespace {


const std::string AUTHORS_URL("https://openlibrary.org/data/ol_dump_authors_latest.txt.gz");
const std::string WORKS_URL("https://openlibrary.org/data/ol_dump_works_latest.txt.gz");
const std::string AUTHORS_NAME("ol_dump_authors_latest.txt.gz");
const std::string S1("Tue, 30 Sep 2025 10:00:00 GMT");
const std::string S2("Fri, 31 Oct 2025 10:00:00 GMT");


// "author_count" authors, every 50th line of which is malformed.
std::string MakeAuthorsDumpWithMalformedLines(const unsigned first_author_no, const unsigned author_count) {
    std::vector<std::string> lines;
    for (unsigned author_no(first_author_no); author_no < first_author_no + author_count; ++author_no) {
        if ((author_no - first_author_no) % 50 == 49)
            lines.emplace_back("/type/author\t/authors/OL" + std::to_string(author_no) + "A\t1\tnot enough columns");
        else
            lines.emplace_back(SyncTestUtil::MakeAuthorLine(author_no, "Author " + std::to_string(author_no)));
    }
    return SyncTestUtil::MakeDump(lines);
}


OLSync::SyncConfig MakeConfig(const std::string &root_directory) {
    OLSync::SyncConfig config;
    config.work_dir_ = root_directory + "/work";
    config.manifest_path_ = root_directory + "/manifest.json";
    config.local_directory_ = root_directory + "/dataset";
    config.writer_options_ = OLSync::WriterOptions(50, 1024 * 1024 * 1024, "snappy");
    config.sources_.clear();
    config.sources_.emplace_back(OLSync::AUTHORS, AUTHORS_URL);
    return config;
}


class TestEnvironment {
public:
    FileUtil::AutoTempDirectory temp_directory_;
    OLSync::SyncConfig config_;
    OLSync::ManifestStore manifest_store_;
    SyncTestUtil::FakeDumpSource dump_source_;
    OLSync::LocalDirectoryDatasetStore local_store_;
    SyncTestUtil::FlakyDatasetStore dataset_store_;

public:
    TestEnvironment()
        : temp_directory_("/tmp/SyncPipelineTest"), config_(MakeConfig(temp_directory_.getDirectoryPath())),
          manifest_store_(config_.manifest_path_), local_store_(config_.local_directory_), dataset_store_(&local_store_) { }

    OLSync::SyncPipeline makePipeline() {
        OLSync::SyncPipeline pipeline(config_, &manifest_store_, &dump_source_, &dataset_store_);
        pipeline.setRetryPolicy(SyncTestUtil::MakeImpatientRetryPolicy());
        return pipeline;
    }

    OLSync::SourceReport runAuthors() {
        OLSync::SyncPipeline pipeline(makePipeline());
        return pipeline.runOne(config_.sources_.front());
    }

    OLSync::ManifestEntry getCommittedEntry() const {
        const OLSync::ManifestStore manifest_store(config_.manifest_path_);
        OLSync::ManifestEntry entry;
        manifest_store.lookup(AUTHORS_NAME, &entry);
        return entry;
    }

    std::vector<OLSync::MappedRecord> readPublishedRecords(const OLSync::ManifestEntry &entry) const {
        std::vector<OLSync::MappedRecord> mapped_records;
        for (const auto &segment : entry.segments_) {
            const std::vector<OLSync::MappedRecord> segment_records(OLSync::ReadSegment(config_.local_directory_ + "/" + segment,
                                                                                         OLSync::AUTHORS));
            mapped_records.insert(mapped_records.end(), segment_records.cbegin(), segment_records.cend());
        }
        return mapped_records;
    }
};


} // unnamed namespace


TEST(FirstRunPublishesEveryValidRecord) {
    TestEnvironment environment;
    environment.dump_source_.publish(AUTHORS_URL, MakeAuthorsDumpWithMalformedLines(1, 120), S1);

    const OLSync::SourceReport report(environment.runAuthors());
    CHECK_TRUE(report.success_);
    CHECK_TRUE(report.changed_);
    CHECK_EQ(report.final_state_, OLSync::SOURCE_PUBLISHED);
    CHECK_EQ(report.rows_written_, 118u);
    CHECK_EQ(report.skipped_count_, 2u);
    CHECK_EQ(report.segments_.size(), 3u);

    const OLSync::ManifestEntry entry(environment.getCommittedEntry());
    CHECK_EQ(entry.source_last_modified_, S1);
    CHECK_EQ(entry.content_sha256_, SyncTestUtil::Sha256Hex(MakeAuthorsDumpWithMalformedLines(1, 120)));
    CHECK_EQ(entry.row_count_, 118u);
    CHECK_EQ(entry.skipped_count_, 2u);
    CHECK_TRUE(FileUtil::Exists(environment.config_.local_directory_ + "/" + entry.artifact_ + "/"
                                + OLSync::DatasetPublisher::SUCCESS_MARKER_NAME));
    CHECK_TRUE(FileUtil::Exists(environment.config_.local_directory_ + "/" + OLSync::DatasetPublisher::MANIFEST_DATASET_PATH));

    // Every valid record was published exactly once.
    const std::vector<OLSync::MappedRecord> mapped_records(environment.readPublishedRecords(entry));
    std::set<std::string> keys;
    for (const auto &mapped_record : mapped_records)
        keys.emplace(mapped_record.getValue("key").getText());
    CHECK_EQ(mapped_records.size(), 118u);
    CHECK_EQ(keys.size(), 118u);
    CHECK_TRUE(keys.find("/authors/OL1A") != keys.end());
    CHECK_TRUE(keys.find("/authors/OL50A") == keys.end()); // The malformed line.

    // The complete download is removed after a successful run.
    CHECK_FALSE(FileUtil::Exists(environment.config_.getDownloadDirectory() + "/" + AUTHORS_NAME));
}


TEST(UnchangedSourcesAreNotRepublished) {
    TestEnvironment environment;
    environment.dump_source_.publish(AUTHORS_URL, SyncTestUtil::MakeAuthorsDump(1, 30), S1);
    environment.runAuthors();
    const std::string manifest_before(environment.manifest_store_.toString());
    const size_t upload_count(environment.dataset_store_.uploaded_paths_.size());

    const OLSync::SourceReport report(environment.runAuthors());
    CHECK_TRUE(report.success_);
    CHECK_FALSE(report.changed_);
    CHECK_EQ(environment.dump_source_.download_count_, 1u);
    CHECK_EQ(environment.dataset_store_.uploaded_paths_.size(), upload_count);
    CHECK_EQ(environment.manifest_store_.toString(), manifest_before);
}


TEST(NewVersionsArePublishedUnderANewArtifact) {
    TestEnvironment environment;
    environment.dump_source_.publish(AUTHORS_URL, SyncTestUtil::MakeAuthorsDump(1, 30), S1);
    environment.runAuthors();
    const OLSync::ManifestEntry first_entry(environment.getCommittedEntry());

    environment.dump_source_.publish(AUTHORS_URL, SyncTestUtil::MakeAuthorsDump(1, 75), S2);
    const OLSync::SourceReport report(environment.runAuthors());
    CHECK_TRUE(report.success_);
    CHECK_TRUE(report.changed_);
    CHECK_EQ(report.signature_, S2);

    const OLSync::ManifestEntry second_entry(environment.getCommittedEntry());
    CHECK_EQ(second_entry.source_last_modified_, S2);
    CHECK_EQ(second_entry.row_count_, 75u);
    CHECK_NE(second_entry.artifact_, first_entry.artifact_);
    CHECK_EQ(environment.readPublishedRecords(second_entry).size(), 75u);

    // The earlier artifact is left alone.
    CHECK_EQ(environment.readPublishedRecords(first_entry).size(), 30u);
}


TEST(FailedPublicationLeavesTheManifestUnchanged) {
    TestEnvironment environment;
    environment.dump_source_.publish(AUTHORS_URL, SyncTestUtil::MakeAuthorsDump(1, 30), S1);
    environment.runAuthors();

    environment.dump_source_.publish(AUTHORS_URL, SyncTestUtil::MakeAuthorsDump(1, 40), S2);
    environment.dataset_store_.fail_all_uploads_ = true;
    const OLSync::SourceReport failed_report(environment.runAuthors());
    CHECK_FALSE(failed_report.success_);
    CHECK_EQ(failed_report.failed_stage_, OLSync::PUBLISHING);
    CHECK_EQ(failed_report.final_state_, OLSync::SOURCE_UNSEEN);

    OLSync::ManifestEntry entry;
    CHECK_TRUE(environment.manifest_store_.lookup(AUTHORS_NAME, &entry));
    CHECK_EQ(entry.source_last_modified_, S1);
    CHECK_EQ(environment.getCommittedEntry().source_last_modified_, S1);

    // The next run picks the new version up.
    environment.dataset_store_.fail_all_uploads_ = false;
    const OLSync::SourceReport report(environment.runAuthors());
    CHECK_TRUE(report.success_);
    CHECK_EQ(environment.getCommittedEntry().source_last_modified_, S2);
    CHECK_EQ(environment.getCommittedEntry().row_count_, 40u);
}


// The segments reach the store but the success marker never does.
TEST(PartiallyPublishedVersionsAreNotCommitted) {
    TestEnvironment environment;
    environment.dump_source_.publish(AUTHORS_URL, SyncTestUtil::MakeAuthorsDump(1, 30), S1);
    environment.runAuthors();
    const OLSync::ManifestEntry first_entry(environment.getCommittedEntry());

    environment.dump_source_.publish(AUTHORS_URL, SyncTestUtil::MakeAuthorsDump(1, 120), S2);
    environment.dataset_store_.fail_uploads_matching_ = OLSync::DatasetPublisher::SUCCESS_MARKER_NAME;
    const size_t upload_count(environment.dataset_store_.uploaded_paths_.size());
    const OLSync::SourceReport failed_report(environment.runAuthors());
    CHECK_FALSE(failed_report.success_);
    CHECK_EQ(failed_report.failed_stage_, OLSync::PUBLISHING);

    unsigned new_segment_count(0);
    for (size_t i(upload_count); i < environment.dataset_store_.uploaded_paths_.size(); ++i) {
        if (environment.dataset_store_.uploaded_paths_[i].find(".parquet") != std::string::npos)
            ++new_segment_count;
    }
    CHECK_EQ(new_segment_count, 3u);

    OLSync::ManifestEntry entry;
    CHECK_TRUE(environment.manifest_store_.lookup(AUTHORS_NAME, &entry));
    CHECK_EQ(entry.source_last_modified_, S1);
    CHECK_EQ(entry.artifact_, first_entry.artifact_);
    CHECK_EQ(environment.getCommittedEntry().source_last_modified_, S1);
    CHECK_EQ(environment.getCommittedEntry().row_count_, 30u);

    environment.dataset_store_.fail_uploads_matching_.clear();
    const OLSync::SourceReport report(environment.runAuthors());
    CHECK_TRUE(report.success_);
    const OLSync::ManifestEntry second_entry(environment.getCommittedEntry());
    CHECK_EQ(second_entry.source_last_modified_, S2);
    CHECK_EQ(second_entry.row_count_, 120u);
    CHECK_EQ(environment.readPublishedRecords(second_entry).size(), 120u);
    CHECK_TRUE(FileUtil::Exists(environment.config_.local_directory_ + "/" + second_entry.artifact_ + "/"
                                + OLSync::DatasetPublisher::SUCCESS_MARKER_NAME));
}


TEST(TransientUploadFailuresAreRetried) {
    TestEnvironment environment;
    environment.dump_source_.publish(AUTHORS_URL, SyncTestUtil::MakeAuthorsDump(1, 10), S1);
    environment.dataset_store_.failing_uploads_ = 2;

    const OLSync::SourceReport report(environment.runAuthors());
    CHECK_TRUE(report.success_);
    CHECK_EQ(environment.dataset_store_.failing_uploads_, 0u);
    CHECK_EQ(environment.getCommittedEntry().source_last_modified_, S1);
}


TEST(ManifestUploadFailuresAreNotFatal) {
    TestEnvironment environment;
    environment.dump_source_.publish(AUTHORS_URL, SyncTestUtil::MakeAuthorsDump(1, 10), S1);
    environment.dataset_store_.fail_uploads_matching_ = OLSync::DatasetPublisher::MANIFEST_DATASET_PATH;

    const OLSync::SourceReport report(environment.runAuthors());
    CHECK_TRUE(report.success_);
    CHECK_EQ(environment.getCommittedEntry().source_last_modified_, S1);
    CHECK_FALSE(FileUtil::Exists(environment.config_.local_directory_ + "/" + OLSync::DatasetPublisher::MANIFEST_DATASET_PATH));
}


TEST(DryRunsChangeNothing) {
    TestEnvironment environment;
    environment.config_.dry_run_ = true;
    environment.dump_source_.publish(AUTHORS_URL, SyncTestUtil::MakeAuthorsDump(1, 10), S1);

    const OLSync::SourceReport report(environment.runAuthors());
    CHECK_TRUE(report.success_);
    CHECK_TRUE(report.changed_);
    CHECK_TRUE(report.dry_run_);
    CHECK_EQ(environment.dump_source_.download_count_, 0u);
    CHECK_TRUE(environment.dataset_store_.uploaded_paths_.empty());
    CHECK_FALSE(FileUtil::Exists(environment.config_.manifest_path_));
    CHECK_FALSE(FileUtil::Exists(environment.config_.getDownloadDirectory()));
}


TEST(FailuresAreIsolatedPerSource) {
    TestEnvironment environment;
    environment.config_.sources_.emplace_back(OLSync::WORKS, WORKS_URL);
    environment.config_.sources_.emplace_back(OLSync::EDITIONS, "https://openlibrary.org/data/ol_dump_editions_latest.txt.gz",
                                              /* enabled = */ false);
    environment.dump_source_.publish(AUTHORS_URL, SyncTestUtil::MakeAuthorsDump(1, 10), S1);

    OLSync::SyncPipeline pipeline(environment.makePipeline());
    const std::vector<OLSync::SourceReport> reports(pipeline.runAll());
    CHECK_EQ(reports.size(), 2u);
    CHECK_TRUE(reports[0].success_);
    CHECK_FALSE(reports[1].success_);
    CHECK_EQ(reports[1].failed_stage_, OLSync::PROBING);
    CHECK_EQ(environment.getCommittedEntry().source_last_modified_, S1);
}


TEST(FetchAndConvertCanRunSeparately) {
    TestEnvironment environment;
    environment.dump_source_.publish(AUTHORS_URL, SyncTestUtil::MakeAuthorsDump(1, 20), S1);
    const OLSync::SourceConfig &source(environment.config_.sources_.front());
    OLSync::SyncPipeline pipeline(environment.makePipeline());

    OLSync::FetchResult fetch_result;
    const OLSync::SourceReport fetch_report(pipeline.ensureLocalArtifact(source, &fetch_result));
    CHECK_TRUE(fetch_report.success_);
    CHECK_EQ(fetch_report.final_state_, OLSync::SOURCE_FETCHED);
    CHECK_FALSE(FileUtil::Exists(environment.config_.manifest_path_));

    const OLSync::SourceReport convert_report(pipeline.processLocalArtifact(source));
    CHECK_TRUE(convert_report.success_);
    CHECK_EQ(convert_report.rows_written_, 20u);
    CHECK_EQ(environment.getCommittedEntry().content_sha256_, fetch_result.content_sha256_);

    // Converting the same download again is a no-op.
    const size_t upload_count(environment.dataset_store_.uploaded_paths_.size());
    const OLSync::SourceReport second_convert_report(pipeline.processLocalArtifact(source));
    CHECK_TRUE(second_convert_report.success_);
    CHECK_FALSE(second_convert_report.changed_);
    CHECK_EQ(environment.dataset_store_.uploaded_paths_.size(), upload_count);
}


TEST(ConvertWithoutADownloadFails) {
    TestEnvironment environment;
    OLSync::SyncPipeline pipeline(environment.makePipeline());
    const OLSync::SourceReport report(pipeline.processLocalArtifact(environment.config_.sources_.front()));
    CHECK_FALSE(report.success_);
    CHECK_EQ(report.failed_stage_, OLSync::FETCHING);
}


TEST(RawBackupsAllowRecoveryWhenTheOriginFails) {
    const std::string dump(SyncTestUtil::MakeAuthorsDump(1, 200));
    TestEnvironment environment;
    environment.config_.upload_raw_dumps_ = true;
    environment.config_.max_upload_chunk_size_ = dump.size() / 3 + 1;
    environment.dump_source_.publish(AUTHORS_URL, dump, S1);
    CHECK_TRUE(environment.runAuthors().success_);
    CHECK_TRUE(FileUtil::Exists(environment.config_.local_directory_ + "/raw/" + AUTHORS_NAME + ".part2"));
    CHECK_TRUE(FileUtil::Exists(environment.config_.local_directory_ + "/"
                                + OLSync::RemoteFetcher::GetRawBackupMetadataPath(AUTHORS_NAME)));

    // Start over with an empty manifest and an origin that refuses to serve the dump.
    FileUtil::DeleteFile(environment.config_.manifest_path_);
    OLSync::ManifestStore empty_manifest_store(environment.config_.manifest_path_);
    environment.dump_source_.fatal_download_failure_ = true;
    OLSync::SyncPipeline pipeline(environment.config_, &empty_manifest_store, &environment.dump_source_, &environment.dataset_store_);
    pipeline.setRetryPolicy(SyncTestUtil::MakeImpatientRetryPolicy());

    const OLSync::SourceReport report(pipeline.runOne(environment.config_.sources_.front()));
    CHECK_TRUE(report.success_);
    CHECK_TRUE(report.recovered_from_backup_);
    CHECK_EQ(report.rows_written_, 200u);
    OLSync::ManifestEntry entry;
    CHECK_TRUE(empty_manifest_store.lookup(AUTHORS_NAME, &entry));
    CHECK_EQ(entry.content_sha256_, SyncTestUtil::Sha256Hex(dump));
}


TEST(CancellationAbortsTheRun) {
    TestEnvironment environment;
    environment.dump_source_.publish(AUTHORS_URL, SyncTestUtil::MakeAuthorsDump(1, 10), S1);
    OLSync::SyncPipeline pipeline(environment.makePipeline());

    OLSync::RequestCancellation();
    CHECK_THROWS(pipeline.runAll(), OLSync::CancelledError);
    OLSync::ResetCancellation();
    CHECK_FALSE(FileUtil::Exists(environment.config_.manifest_path_));
}


TEST(TruncatedDumpsReportTheLinesSkippedBeforeTheFailure) {
    const std::string dump(MakeAuthorsDumpWithMalformedLines(1, 5000));
    TestEnvironment environment;
    environment.dump_source_.publish(AUTHORS_URL, dump.substr(0, dump.size() / 2), S1);

    const OLSync::SourceReport report(environment.runAuthors());
    CHECK_FALSE(report.success_);
    CHECK_EQ(report.failed_stage_, OLSync::PARSING);
    CHECK_TRUE(report.skipped_count_ > 0u);
    CHECK_FALSE(FileUtil::Exists(environment.config_.manifest_path_));
}


TEST(CancellationWhileParsingLeavesNoScratchFiles) {
    TestEnvironment environment;
    environment.config_.writer_options_ = OLSync::WriterOptions(100000, 1024 * 1024 * 1024, "snappy");
    environment.dump_source_.publish(AUTHORS_URL, SyncTestUtil::MakeAuthorsDump(1, 5000), S1);
    const OLSync::SourceConfig &source(environment.config_.sources_.front());
    OLSync::SyncPipeline pipeline(environment.makePipeline());

    OLSync::FetchResult fetch_result;
    CHECK_TRUE(pipeline.ensureLocalArtifact(source, &fetch_result).success_);

    OLSync::RequestCancellation();
    bool cancelled(false);
    try {
        pipeline.processLocalArtifact(source);
    } catch (const OLSync::CancelledError &x) {
        cancelled = true;
        CHECK_EQ(x.getStage(), OLSync::PARSING);
    }
    OLSync::ResetCancellation();
    CHECK_TRUE(cancelled);

    CHECK_FALSE(FileUtil::Exists(environment.config_.manifest_path_));
    CHECK_TRUE(environment.dataset_store_.uploaded_paths_.empty());
    std::vector<std::string> scratch_directories;
    CHECK_EQ(FileUtil::GetFileNameList("authors_segments_", &scratch_directories, environment.config_.work_dir_), 0u);
    CHECK_TRUE(FileUtil::Exists(fetch_result.local_path_));
}


// A cancelled run keeps the complete download so that the next run can reuse it.
TEST(CancelledRunsKeepTheDownload) {
    TestEnvironment environment;
    environment.dump_source_.publish(AUTHORS_URL, SyncTestUtil::MakeAuthorsDump(1, 10), S1);
    environment.dataset_store_.failing_uploads_ = 1;
    OLSync::SyncPipeline pipeline(environment.makePipeline());
    OLSync::RetryPolicy retry_policy(SyncTestUtil::MakeImpatientRetryPolicy());
    retry_policy.setSleeper([](const unsigned /*delay*/, const OLSync::Stage /*stage*/) { OLSync::RequestCancellation(); });
    pipeline.setRetryPolicy(retry_policy);

    bool cancelled(false);
    try {
        pipeline.runOne(environment.config_.sources_.front());
    } catch (const OLSync::CancelledError &x) {
        cancelled = true;
        CHECK_EQ(x.getStage(), OLSync::PUBLISHING);
    }
    OLSync::ResetCancellation();
    CHECK_TRUE(cancelled);
    CHECK_TRUE(FileUtil::Exists(environment.config_.getDownloadDirectory() + "/" + AUTHORS_NAME));
    CHECK_FALSE(FileUtil::Exists(environment.config_.manifest_path_));

    const OLSync::SourceReport report(environment.runAuthors());
    CHECK_TRUE(report.success_);
    CHECK_EQ(environment.dump_source_.download_count_, 1u);
    CHECK_EQ(environment.getCommittedEntry().row_count_, 10u);
    CHECK_FALSE(FileUtil::Exists(environment.config_.getDownloadDirectory() + "/" + AUTHORS_NAME));
}


TEST_MAIN(SyncPipeline)
