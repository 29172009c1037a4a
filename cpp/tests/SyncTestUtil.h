/** \file   SyncTestUtil.h
 *  \brief  In-process stand-ins for the dump origin and the dataset store, plus helpers for building dump files.
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


#include <map>
#include <string>
#include <vector>
#include "DatasetStore.h"
#include "DumpSource.h"
#include "FileUtil.h"
#include "GzStream.h"
#include "RetryPolicy.h"
#include "StringUtil.h"
#include "SyncTypes.h"


namespace SyncTestUtil {


// Serves dump files from memory.  Failures can be injected per URL.
class FakeDumpSource : public OLSync::DumpSource {
public:
    struct RemoteFile {
        std::string contents_;
        std::string last_modified_;
        std::string etag_;
        std::string advertised_sha256_;
        bool advertise_size_;
        bool supports_ranges_;

    public:
        RemoteFile(): advertise_size_(true), supports_ranges_(true) { }
    };

    std::map<std::string, RemoteFile> url_to_file_map_;
    unsigned transient_download_failures_;  // The next N downloads fail with a TransientError.
    unsigned truncated_downloads_;          // The next N downloads deliver only half of the data.
    bool fatal_download_failure_;           // Downloads fail with a FatalError, e.g. a 404.
    unsigned probe_count_, download_count_;
    std::vector<uint64_t> resume_offsets_;

public:
    FakeDumpSource(): transient_download_failures_(0), truncated_downloads_(0), fatal_download_failure_(false), probe_count_(0),
                      download_count_(0) { }

    void publish(const std::string &url, const std::string &contents, const std::string &last_modified) {
        RemoteFile remote_file;
        remote_file.contents_ = contents;
        remote_file.last_modified_ = last_modified;
        url_to_file_map_[url] = remote_file;
    }

    OLSync::RemoteFileInfo probe(const std::string &url) override {
        ++probe_count_;
        const auto url_and_file(url_to_file_map_.find(url));
        if (url_and_file == url_to_file_map_.end())
            throw OLSync::FatalError(OLSync::PROBING, "404 for " + url);

        OLSync::RemoteFileInfo remote_file_info;
        remote_file_info.size_ = url_and_file->second.advertise_size_ ? url_and_file->second.contents_.size() : 0;
        remote_file_info.last_modified_ = url_and_file->second.last_modified_;
        remote_file_info.etag_ = url_and_file->second.etag_;
        remote_file_info.sha256_ = url_and_file->second.advertised_sha256_;
        return remote_file_info;
    }

    uint64_t download(const std::string &url, const std::string &local_path, const uint64_t resume_offset) override {
        ++download_count_;
        resume_offsets_.emplace_back(resume_offset);
        const auto url_and_file(url_to_file_map_.find(url));
        if (url_and_file == url_to_file_map_.end() or fatal_download_failure_)
            throw OLSync::FatalError(OLSync::FETCHING, "404 for " + url);

        const std::string &contents(url_and_file->second.contents_);
        if (transient_download_failures_ > 0) {
            --transient_download_failures_;
            // Simulate a connection that drops after delivering part of the body.
            std::string partial_body(contents.substr(resume_offset, (contents.size() - resume_offset) / 2));
            std::string existing;
            if (resume_offset > 0)
                FileUtil::ReadString(local_path, &existing);
            FileUtil::WriteString(local_path, existing + partial_body);
            throw OLSync::TransientError(OLSync::FETCHING, "connection reset while downloading " + url);
        }

        const uint64_t effective_offset(url_and_file->second.supports_ranges_ ? resume_offset : 0);
        std::string body(contents.substr(effective_offset));
        if (truncated_downloads_ > 0) {
            --truncated_downloads_;
            body.resize(body.size() / 2);
        }

        std::string existing;
        if (effective_offset > 0)
            FileUtil::ReadString(local_path, &existing);
        FileUtil::WriteString(local_path, existing + body);
        return effective_offset;
    }
};


// Wraps a real store and makes uploads fail on demand.
class FlakyDatasetStore : public OLSync::DatasetStore {
    OLSync::DatasetStore * const store_;

public:
    unsigned failing_uploads_;   // The next N uploads fail with a TransientError.
    bool fail_all_uploads_;
    std::string fail_uploads_matching_; // Uploads whose remote path contains this always fail.
    std::vector<std::string> uploaded_paths_;

public:
    explicit FlakyDatasetStore(OLSync::DatasetStore * const store)
        : store_(store), failing_uploads_(0), fail_all_uploads_(false) { }

    void upload(const std::string &local_path, const std::string &remote_path) override {
        maybeFail(remote_path);
        store_->upload(local_path, remote_path);
        uploaded_paths_.emplace_back(remote_path);
    }

    void uploadData(const std::string &data, const std::string &remote_path) override {
        maybeFail(remote_path);
        store_->uploadData(data, remote_path);
        uploaded_paths_.emplace_back(remote_path);
    }

    bool download(const std::string &remote_path, const std::string &local_path) override {
        return store_->download(remote_path, local_path);
    }

    std::string getDescription() const override { return "flaky " + store_->getDescription(); }
private:
    void maybeFail(const std::string &remote_path) {
        if (fail_all_uploads_ or (not fail_uploads_matching_.empty() and remote_path.find(fail_uploads_matching_) != std::string::npos))
            throw OLSync::TransientError(OLSync::PUBLISHING, "HTTP 503 for " + remote_path);
        if (failing_uploads_ > 0) {
            --failing_uploads_;
            throw OLSync::TransientError(OLSync::PUBLISHING, "HTTP 503 for " + remote_path);
        }
    }
};


inline std::string MakeAuthorLine(const unsigned author_no, const std::string &name, const unsigned revision = 1) {
    const std::string key("/authors/OL" + std::to_string(author_no) + "A");
    return "/type/author\t" + key + "\t" + std::to_string(revision) + "\t2021-03-04T05:06:07.123456\t"
           + "{\"key\": \"" + key + "\", \"name\": \"" + name + "\", \"revision\": " + std::to_string(revision)
           + ", \"type\": {\"key\": \"/type/author\"}, \"last_modified\": {\"type\": \"/type/datetime\", \"value\": "
             "\"2021-03-04T05:06:07.123456\"}}";
}


inline std::string MakeDump(const std::vector<std::string> &lines) {
    std::string dump;
    for (const auto &line : lines)
        dump += line + "\n";
    return GzStream::CompressString(dump, GzStream::GZIP);
}


inline std::string MakeAuthorsDump(const unsigned first_author_no, const unsigned author_count) {
    std::vector<std::string> lines;
    for (unsigned author_no(first_author_no); author_no < first_author_no + author_count; ++author_no)
        lines.emplace_back(MakeAuthorLine(author_no, "Author " + std::to_string(author_no)));
    return MakeDump(lines);
}


inline std::string Sha256Hex(const std::string &data) {
    return StringUtil::ToHexString(StringUtil::Sha256(data));
}


// A policy that does not sleep between attempts.
inline OLSync::RetryPolicy MakeImpatientRetryPolicy(const unsigned max_attempts = 3) {
    OLSync::RetryPolicy retry_policy(max_attempts, /* initial_delay = */ 1, /* backoff_factor = */ 2.0, /* max_delay = */ 10);
    retry_policy.setSleeper([](const unsigned /*delay*/, const OLSync::Stage /*stage*/) { });
    return retry_policy;
}


} // namespace SyncTestUtil
