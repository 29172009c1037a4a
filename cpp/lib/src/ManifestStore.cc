/** \file   ManifestStore.cc
 *  \brief  Implementation of the sync manifest.
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
#include "ManifestStore.h"
#include <cerrno>
#include <cstring>
#include "FileUtil.h"
#include "SyncTypes.h"
#include "util.h"


namespace OLSync {


namespace {


const std::vector<std::string> KNOWN_ENTRY_MEMBERS{
    "source_last_modified", "content_sha256", "remote_size", "last_synced", "artifact", "segments",
    "row_count", "skipped_count"
};


bool IsKnownEntryMember(const std::string &member_name) {
    for (const auto &known_member : KNOWN_ENTRY_MEMBERS) {
        if (known_member == member_name)
            return true;
    }

    return false;
}


std::string GetOptionalString(const nlohmann::json &json_obj, const std::string &member_name) {
    const auto member(json_obj.find(member_name));
    if (member == json_obj.end() or not member->is_string())
        return "";
    return member->get<std::string>();
}


uint64_t GetOptionalUnsigned(const nlohmann::json &json_obj, const std::string &member_name) {
    const auto member(json_obj.find(member_name));
    if (member == json_obj.end() or not member->is_number_unsigned())
        return 0;
    return member->get<uint64_t>();
}


} // unnamed namespace


nlohmann::json ManifestEntry::toJson() const {
    nlohmann::json json_obj(unknown_members_.is_object() ? unknown_members_ : nlohmann::json::object());
    json_obj["source_last_modified"] = source_last_modified_;
    json_obj["content_sha256"] = content_sha256_;
    json_obj["remote_size"] = remote_size_;
    json_obj["last_synced"] = last_synced_;
    json_obj["artifact"] = artifact_;
    json_obj["segments"] = segments_;
    json_obj["row_count"] = row_count_;
    json_obj["skipped_count"] = skipped_count_;
    return json_obj;
}


ManifestEntry ManifestEntry::FromJson(const nlohmann::json &json_obj) {
    ManifestEntry entry;
    entry.source_last_modified_ = GetOptionalString(json_obj, "source_last_modified");
    entry.content_sha256_ = GetOptionalString(json_obj, "content_sha256");
    entry.remote_size_ = GetOptionalUnsigned(json_obj, "remote_size");
    entry.last_synced_ = GetOptionalString(json_obj, "last_synced");
    entry.artifact_ = GetOptionalString(json_obj, "artifact");
    entry.row_count_ = GetOptionalUnsigned(json_obj, "row_count");
    entry.skipped_count_ = GetOptionalUnsigned(json_obj, "skipped_count");

    const auto segments(json_obj.find("segments"));
    if (segments != json_obj.end() and segments->is_array()) {
        for (const auto &segment : *segments) {
            if (segment.is_string())
                entry.segments_.emplace_back(segment.get<std::string>());
        }
    }

    for (auto member(json_obj.cbegin()); member != json_obj.cend(); ++member) {
        if (not IsKnownEntryMember(member.key()))
            entry.unknown_members_[member.key()] = member.value();
    }

    return entry;
}


ManifestStore::ManifestStore(const std::string &path): path_(path), other_top_level_members_(nlohmann::json::object()) {
    if (not FileUtil::Exists(path_)) {
        LOG_INFO("no manifest found at \"" + path_ + "\", starting with an empty one");
        return;
    }

    std::string manifest_contents;
    if (not FileUtil::ReadString(path_, &manifest_contents))
        throw std::runtime_error("in ManifestStore::ManifestStore: failed to read \"" + path_ + "\"!");

    nlohmann::json manifest_json;
    try {
        manifest_json = nlohmann::json::parse(manifest_contents);
    } catch (const nlohmann::json::parse_error &x) {
        throw std::runtime_error("in ManifestStore::ManifestStore: \"" + path_ + "\" is not valid JSON: " + std::string(x.what()));
    }
    if (not manifest_json.is_object())
        throw std::runtime_error("in ManifestStore::ManifestStore: \"" + path_ + "\" does not contain a JSON object!");

    for (auto member(manifest_json.cbegin()); member != manifest_json.cend(); ++member) {
        if (member->is_object())
            source_name_to_entry_map_[member.key()] = ManifestEntry::FromJson(member.value());
        else
            other_top_level_members_[member.key()] = member.value();
    }

    LOG_DEBUG("loaded " + std::to_string(source_name_to_entry_map_.size()) + " manifest entries from \"" + path_ + "\"");
}


bool ManifestStore::lookup(const std::string &source_name, ManifestEntry * const entry) const {
    const auto source_name_and_entry(source_name_to_entry_map_.find(source_name));
    if (source_name_and_entry == source_name_to_entry_map_.cend())
        return false;

    *entry = source_name_and_entry->second;
    return true;
}


std::vector<std::string> ManifestStore::getSourceNames() const {
    std::vector<std::string> source_names;
    for (const auto &source_name_and_entry : source_name_to_entry_map_)
        source_names.emplace_back(source_name_and_entry.first);
    return source_names;
}


void ManifestStore::commit(const std::string &source_name, const ManifestEntry &entry) {
    auto new_source_name_to_entry_map(source_name_to_entry_map_);
    new_source_name_to_entry_map[source_name] = entry;

    if (not FileUtil::WriteStringAtomic(path_, serialise(new_source_name_to_entry_map)))
        throw FatalError(COMMITTING, "failed to write the manifest \"" + path_ + "\" (" + std::string(std::strerror(errno)) + ")");

    source_name_to_entry_map_.swap(new_source_name_to_entry_map);
    LOG_INFO("committed \"" + source_name + "\" with signature \"" + entry.source_last_modified_ + "\" to the manifest");
}


std::string ManifestStore::toString() const {
    return serialise(source_name_to_entry_map_);
}


std::string ManifestStore::serialise(const std::map<std::string, ManifestEntry> &source_name_to_entry_map) const {
    nlohmann::json manifest_json(other_top_level_members_);
    for (const auto &source_name_and_entry : source_name_to_entry_map)
        manifest_json[source_name_and_entry.first] = source_name_and_entry.second.toJson();

    return manifest_json.dump(2) + "\n";
}


} // namespace OLSync
