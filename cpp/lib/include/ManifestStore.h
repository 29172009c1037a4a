/** \file   ManifestStore.h
 *  \brief  Durable record of the last successfully synchronised version of each dump source.
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
#include <cinttypes>
#include <nlohmann/json.hpp>


namespace OLSync {


/** \brief  What we know about the last published version of a single source.
 *  \note   Members we don't know about, e.g. those written by a newer version of this program, are carried along in
 *          "unknown_members_" and written back unchanged.
 */
struct ManifestEntry {
    std::string source_last_modified_; // The change signature that was published.
    std::string content_sha256_;
    uint64_t remote_size_;
    std::string last_synced_;          // ISO 8601, UTC
    std::string artifact_;             // Dataset directory of the published segments, e.g. "authors/9f86d081884c7d65".
    std::vector<std::string> segments_;
    uint64_t row_count_;
    uint64_t skipped_count_;
    nlohmann::json unknown_members_;

public:
    ManifestEntry(): remote_size_(0), row_count_(0), skipped_count_(0), unknown_members_(nlohmann::json::object()) { }

    nlohmann::json toJson() const;
    static ManifestEntry FromJson(const nlohmann::json &json_obj);
};


class ManifestStore {
    std::string path_;
    std::map<std::string, ManifestEntry> source_name_to_entry_map_;
    nlohmann::json other_top_level_members_;

public:
    /** \brief  Loads the manifest from "path".  A missing file yields an empty manifest.
     *  \throws std::runtime_error if the file exists but can't be read or parsed.  We never silently start over since
     *          that would trigger a full resynchronisation of all sources.
     */
    explicit ManifestStore(const std::string &path);

    inline const std::string &getPath() const { return path_; }

    //* \return False if we have no entry for "source_name".
    bool lookup(const std::string &source_name, ManifestEntry * const entry) const;

    std::vector<std::string> getSourceNames() const;

    /** \brief  Durably records "entry" for "source_name".  Either the old or the new manifest will be found on disk
     *          after a crash, never a mixture of the two.
     *  \throws FatalError if the manifest could not be written, in which case our in-memory state is left unchanged.
     */
    void commit(const std::string &source_name, const ManifestEntry &entry);

    //* \return The serialised manifest, exactly as it is stored on disk.
    std::string toString() const;

private:
    std::string serialise(const std::map<std::string, ManifestEntry> &source_name_to_entry_map) const;
};


} // namespace OLSync
