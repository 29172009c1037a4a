/** \brief Test cases for RemoteFetcher
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
#include <string>
#include "DatasetStore.h"
#include "FileUtil.h"
#include "ManifestStore.h"
#include "RemoteFetcher.h"
#include "SyncTestUtil.h"
#include "SyncTypes.h"
#include "UnitTest.h"


namespace {


const std::string DUMP_URL("https://openlibrary.org/data/ol_dump_authors_latest.txt.gz");
const std::string DUMP_NAME("ol_dump_authors_latest.txt.gz");
const std::string S1("Tue, 30 Sep 2025 10:00:00 GMT");
const std::string S2("Fri, 31 Oct 2025 10:00:00 GMT");


} // unnamed namespace


TEST(NeedsFetchFollowsTheManifest) {
    const FileUtil::AutoTempDirectory temp_directory("/tmp/RemoteFetcherTest");
    OLSync::ManifestStore manifest_store(temp_directory.getDirectoryPath() + "/manifest.json");
    SyncTestUtil::FakeDumpSource dump_source;
    const OLSync::RetryPolicy retry_policy(SyncTestUtil::MakeImpatientRetryPolicy());
    const OLSync::RemoteFetcher fetcher(&dump_source, manifest_store, retry_policy, temp_directory.getDirectoryPath() + "/downloads");

    const OLSync::SourceDescriptor descriptor(DUMP_NAME, OLSync::AUTHORS, DUMP_URL, 100, S1);
    CHECK_TRUE(fetcher.needsFetch(descriptor));

    OLSync::ManifestEntry entry;
    entry.source_last_modified_ = S1;
    manifest_store.commit(DUMP_NAME, entry);
    CHECK_TRUE(fetcher.needsFetch(descriptor)); // No content hash recorded.

    entry.content_sha256_ = "00ff";
    manifest_store.commit(DUMP_NAME, entry);
    CHECK_FALSE(fetcher.needsFetch(descriptor));
    CHECK_TRUE(fetcher.needsFetch(OLSync::SourceDescriptor(DUMP_NAME, OLSync::AUTHORS, DUMP_URL, 100, S2)));
}


TEST(ProbeUsesLastModifiedThenETag) {
    const FileUtil::AutoTempDirectory temp_directory("/tmp/RemoteFetcherTest");
    const OLSync::ManifestStore manifest_store(temp_directory.getDirectoryPath() + "/manifest.json");
    SyncTestUtil::FakeDumpSource dump_source;
    dump_source.publish(DUMP_URL, "data", S1);
    dump_source.url_to_file_map_[DUMP_URL].etag_ = "\"abc\"";
    const OLSync::RetryPolicy retry_policy(SyncTestUtil::MakeImpatientRetryPolicy());
    const OLSync::RemoteFetcher fetcher(&dump_source, manifest_store, retry_policy, temp_directory.getDirectoryPath());

    CHECK_EQ(fetcher.probe(DUMP_NAME, OLSync::AUTHORS, DUMP_URL).signature_, S1);

    dump_source.url_to_file_map_[DUMP_URL].last_modified_.clear();
    const OLSync::SourceDescriptor descriptor(fetcher.probe(DUMP_NAME, OLSync::AUTHORS, DUMP_URL));
    CHECK_EQ(descriptor.signature_, "\"abc\"");
    CHECK_EQ(descriptor.remote_size_, 4u);

    dump_source.url_to_file_map_[DUMP_URL].etag_.clear();
    CHECK_THROWS(fetcher.probe(DUMP_NAME, OLSync::AUTHORS, DUMP_URL), OLSync::FatalError);
    CHECK_THROWS(fetcher.probe(DUMP_NAME, OLSync::AUTHORS, DUMP_URL + ".missing"), OLSync::FatalError);
}


TEST(InterruptedDownloadsAreResumed) {
    const std::string dump(SyncTestUtil::MakeAuthorsDump(1, 200));
    const FileUtil::AutoTempDirectory temp_directory("/tmp/RemoteFetcherTest");
    const OLSync::ManifestStore manifest_store(temp_directory.getDirectoryPath() + "/manifest.json");
    SyncTestUtil::FakeDumpSource dump_source;
    dump_source.publish(DUMP_URL, dump, S1);
    dump_source.transient_download_failures_ = 1;
    const OLSync::RetryPolicy retry_policy(SyncTestUtil::MakeImpatientRetryPolicy());
    OLSync::RemoteFetcher fetcher(&dump_source, manifest_store, retry_policy, temp_directory.getDirectoryPath() + "/downloads");

    const OLSync::FetchResult fetch_result(fetcher.fetch(fetcher.probe(DUMP_NAME, OLSync::AUTHORS, DUMP_URL)));
    CHECK_EQ(dump_source.download_count_, 2u);
    CHECK_EQ(dump_source.resume_offsets_[0], 0u);
    CHECK_EQ(dump_source.resume_offsets_[1], dump.size() / 2);
    CHECK_EQ(fetch_result.size_, dump.size());
    CHECK_EQ(fetch_result.content_sha256_, SyncTestUtil::Sha256Hex(dump));
    CHECK_EQ(fetch_result.signature_, S1);
    CHECK_FALSE(FileUtil::Exists(fetch_result.local_path_ + ".part"));

    std::string local_contents;
    CHECK_TRUE(FileUtil::ReadString(fetch_result.local_path_, &local_contents));
    CHECK_TRUE(local_contents == dump);
}


TEST(PartialDownloadsOfAnotherVersionAreDiscarded) {
    const std::string dump(SyncTestUtil::MakeAuthorsDump(1, 50));
    const FileUtil::AutoTempDirectory temp_directory("/tmp/RemoteFetcherTest");
    const std::string download_directory(temp_directory.getDirectoryPath() + "/downloads");
    FileUtil::MakeDirectory(download_directory);
    FileUtil::WriteString(download_directory + "/" + DUMP_NAME + ".part", "stale bytes of an older version");
    FileUtil::WriteString(download_directory + "/" + DUMP_NAME + ".part.signature", S1);

    const OLSync::ManifestStore manifest_store(temp_directory.getDirectoryPath() + "/manifest.json");
    SyncTestUtil::FakeDumpSource dump_source;
    dump_source.publish(DUMP_URL, dump, S2);
    const OLSync::RetryPolicy retry_policy(SyncTestUtil::MakeImpatientRetryPolicy());
    OLSync::RemoteFetcher fetcher(&dump_source, manifest_store, retry_policy, download_directory);

    const OLSync::FetchResult fetch_result(fetcher.fetch(fetcher.probe(DUMP_NAME, OLSync::AUTHORS, DUMP_URL)));
    CHECK_EQ(dump_source.resume_offsets_.size(), 1u);
    CHECK_EQ(dump_source.resume_offsets_[0], 0u);
    CHECK_EQ(fetch_result.content_sha256_, SyncTestUtil::Sha256Hex(dump));
}


TEST(IntegrityFailuresAreRetried) {
    const std::string dump(SyncTestUtil::MakeAuthorsDump(1, 100));
    const FileUtil::AutoTempDirectory temp_directory("/tmp/RemoteFetcherTest");
    const OLSync::ManifestStore manifest_store(temp_directory.getDirectoryPath() + "/manifest.json");
    SyncTestUtil::FakeDumpSource dump_source;
    dump_source.publish(DUMP_URL, dump, S1);
    dump_source.truncated_downloads_ = 2;
    const OLSync::RetryPolicy retry_policy(SyncTestUtil::MakeImpatientRetryPolicy(3));
    OLSync::RemoteFetcher fetcher(&dump_source, manifest_store, retry_policy, temp_directory.getDirectoryPath() + "/downloads");

    const OLSync::FetchResult fetch_result(fetcher.fetch(fetcher.probe(DUMP_NAME, OLSync::AUTHORS, DUMP_URL)));
    CHECK_EQ(dump_source.download_count_, 3u);
    CHECK_EQ(fetch_result.size_, dump.size());
}


TEST(AdvertisedChecksumsAreVerified) {
    const std::string dump(SyncTestUtil::MakeAuthorsDump(1, 10));
    const FileUtil::AutoTempDirectory temp_directory("/tmp/RemoteFetcherTest");
    const OLSync::ManifestStore manifest_store(temp_directory.getDirectoryPath() + "/manifest.json");
    SyncTestUtil::FakeDumpSource dump_source;
    dump_source.publish(DUMP_URL, dump, S1);
    dump_source.url_to_file_map_[DUMP_URL].advertised_sha256_ = SyncTestUtil::Sha256Hex("something else");
    const OLSync::RetryPolicy retry_policy(SyncTestUtil::MakeImpatientRetryPolicy(2));
    OLSync::RemoteFetcher fetcher(&dump_source, manifest_store, retry_policy, temp_directory.getDirectoryPath() + "/downloads");

    const OLSync::SourceDescriptor descriptor(fetcher.probe(DUMP_NAME, OLSync::AUTHORS, DUMP_URL));
    CHECK_THROWS(fetcher.fetch(descriptor), OLSync::IntegrityError);
    CHECK_EQ(dump_source.download_count_, 2u);
    CHECK_FALSE(FileUtil::Exists(fetcher.getLocalPath(DUMP_NAME)));
}


TEST(CompleteDownloadsAreReused) {
    const std::string dump(SyncTestUtil::MakeAuthorsDump(1, 10));
    const FileUtil::AutoTempDirectory temp_directory("/tmp/RemoteFetcherTest");
    const std::string download_directory(temp_directory.getDirectoryPath() + "/downloads");
    const OLSync::ManifestStore manifest_store(temp_directory.getDirectoryPath() + "/manifest.json");
    SyncTestUtil::FakeDumpSource dump_source;
    dump_source.publish(DUMP_URL, dump, S1);
    const OLSync::RetryPolicy retry_policy(SyncTestUtil::MakeImpatientRetryPolicy());
    OLSync::RemoteFetcher fetcher(&dump_source, manifest_store, retry_policy, download_directory);

    const OLSync::SourceDescriptor descriptor(fetcher.probe(DUMP_NAME, OLSync::AUTHORS, DUMP_URL));
    fetcher.fetch(descriptor);
    const OLSync::FetchResult fetch_result(fetcher.fetch(descriptor));
    CHECK_EQ(dump_source.download_count_, 1u);

    OLSync::FetchResult loaded_fetch_result;
    CHECK_TRUE(OLSync::RemoteFetcher::LoadFetchResult(download_directory, DUMP_NAME, &loaded_fetch_result));
    CHECK_EQ(loaded_fetch_result.content_sha256_, fetch_result.content_sha256_);

    OLSync::RemoteFetcher::RemoveDownload(loaded_fetch_result);
    CHECK_FALSE(OLSync::RemoteFetcher::LoadFetchResult(download_directory, DUMP_NAME, &loaded_fetch_result));
}


TEST(FailingOriginsFallBackToTheRawBackup) {
    const std::string dump(SyncTestUtil::MakeAuthorsDump(1, 300));
    const size_t half(dump.size() / 2);
    const FileUtil::AutoTempDirectory temp_directory("/tmp/RemoteFetcherTest");
    OLSync::LocalDirectoryDatasetStore backup_store(temp_directory.getDirectoryPath() + "/dataset");
    backup_store.uploadData(dump.substr(0, half), "raw/" + DUMP_NAME + ".part0");
    backup_store.uploadData(dump.substr(half), "raw/" + DUMP_NAME + ".part1");
    nlohmann::json backup_metadata;
    backup_metadata["signature"] = S1;
    backup_metadata["sha256"] = SyncTestUtil::Sha256Hex(dump);
    backup_metadata["size"] = dump.size();
    backup_metadata["chunks"] = { "raw/" + DUMP_NAME + ".part0", "raw/" + DUMP_NAME + ".part1" };
    backup_store.uploadData(backup_metadata.dump(), OLSync::RemoteFetcher::GetRawBackupMetadataPath(DUMP_NAME));

    const OLSync::ManifestStore manifest_store(temp_directory.getDirectoryPath() + "/manifest.json");
    SyncTestUtil::FakeDumpSource dump_source;
    dump_source.publish(DUMP_URL, dump, S1);
    dump_source.fatal_download_failure_ = true;
    const OLSync::RetryPolicy retry_policy(SyncTestUtil::MakeImpatientRetryPolicy());
    OLSync::RemoteFetcher fetcher(&dump_source, manifest_store, retry_policy, temp_directory.getDirectoryPath() + "/downloads",
                                  &backup_store);

    const OLSync::SourceDescriptor descriptor(fetcher.probe(DUMP_NAME, OLSync::AUTHORS, DUMP_URL));
    const OLSync::FetchResult fetch_result(fetcher.fetch(descriptor));
    CHECK_TRUE(fetch_result.recovered_from_backup_);
    CHECK_EQ(fetch_result.content_sha256_, SyncTestUtil::Sha256Hex(dump));
    CHECK_EQ(fetch_result.size_, dump.size());

    // A backup of another version must not be used.
    dump_source.publish(DUMP_URL, dump, S2);
    dump_source.fatal_download_failure_ = true;
    OLSync::RemoteFetcher::RemoveDownload(fetch_result);
    CHECK_THROWS(fetcher.fetch(fetcher.probe(DUMP_NAME, OLSync::AUTHORS, DUMP_URL)), OLSync::FatalError);
}


TEST(RefusedResumptionsStartOverOnTheNextAttempt) {
    const std::string dump(SyncTestUtil::MakeAuthorsDump(1, 50));
    const FileUtil::AutoTempDirectory temp_directory("/tmp/RemoteFetcherTest");
    const std::string download_directory(temp_directory.getDirectoryPath() + "/downloads");
    const std::string part_path(download_directory + "/" + DUMP_NAME + ".part");
    FileUtil::MakeDirectory(download_directory);
    FileUtil::WriteString(part_path, dump.substr(0, 100));
    FileUtil::WriteString(part_path + ".signature", S1);

    const OLSync::ManifestStore manifest_store(temp_directory.getDirectoryPath() + "/manifest.json");
    SyncTestUtil::FakeDumpSource dump_source;
    dump_source.publish(DUMP_URL, dump, S1);
    dump_source.fatal_download_failure_ = true;
    const OLSync::RetryPolicy retry_policy(SyncTestUtil::MakeImpatientRetryPolicy());
    OLSync::RemoteFetcher fetcher(&dump_source, manifest_store, retry_policy, download_directory);

    CHECK_THROWS(fetcher.fetch(fetcher.probe(DUMP_NAME, OLSync::AUTHORS, DUMP_URL)), OLSync::FatalError);
    CHECK_EQ(dump_source.resume_offsets_.size(), 1u);
    CHECK_EQ(dump_source.resume_offsets_[0], 100u);
    CHECK_FALSE(FileUtil::Exists(part_path));
    CHECK_FALSE(FileUtil::Exists(part_path + ".signature"));

    dump_source.fatal_download_failure_ = false;
    const OLSync::FetchResult fetch_result(fetcher.fetch(fetcher.probe(DUMP_NAME, OLSync::AUTHORS, DUMP_URL)));
    CHECK_EQ(dump_source.resume_offsets_.back(), 0u);
    CHECK_EQ(fetch_result.content_sha256_, SyncTestUtil::Sha256Hex(dump));
}


TEST(NonStringBackupChunksAreRejected) {
    const std::string dump(SyncTestUtil::MakeAuthorsDump(1, 20));
    const FileUtil::AutoTempDirectory temp_directory("/tmp/RemoteFetcherTest");
    OLSync::LocalDirectoryDatasetStore backup_store(temp_directory.getDirectoryPath() + "/dataset");
    nlohmann::json backup_metadata;
    backup_metadata["signature"] = S1;
    backup_metadata["sha256"] = SyncTestUtil::Sha256Hex(dump);
    backup_metadata["chunks"] = nlohmann::json::array({ 1 });
    backup_store.uploadData(backup_metadata.dump(), OLSync::RemoteFetcher::GetRawBackupMetadataPath(DUMP_NAME));

    const OLSync::ManifestStore manifest_store(temp_directory.getDirectoryPath() + "/manifest.json");
    SyncTestUtil::FakeDumpSource dump_source;
    dump_source.publish(DUMP_URL, dump, S1);
    dump_source.fatal_download_failure_ = true;
    const OLSync::RetryPolicy retry_policy(SyncTestUtil::MakeImpatientRetryPolicy());
    OLSync::RemoteFetcher fetcher(&dump_source, manifest_store, retry_policy, temp_directory.getDirectoryPath() + "/downloads",
                                  &backup_store);

    bool sync_error_thrown(false);
    try {
        fetcher.fetch(fetcher.probe(DUMP_NAME, OLSync::AUTHORS, DUMP_URL));
    } catch (const OLSync::SyncError &sync_error) {
        sync_error_thrown = true;
        CHECK_EQ(sync_error.getStage(), OLSync::FETCHING);
    }
    CHECK_TRUE(sync_error_thrown);
}


TEST_MAIN(RemoteFetcher)
