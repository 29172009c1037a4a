/** \file   SyncTypes.cc
 *  \brief  Implementation of the types shared by all synchronisation stages.
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
#include "SyncTypes.h"
#include <csignal>
#include <cstring>
#include "Downloader.h"
#include "util.h"


namespace OLSync {


const std::vector<Category> &GetAllCategories() {
    static const std::vector<Category> all_categories{ AUTHORS, EDITIONS, WORKS };
    return all_categories;
}


std::string CategoryToString(const Category category) {
    switch (category) {
    case AUTHORS:
        return "authors";
    case EDITIONS:
        return "editions";
    case WORKS:
        return "works";
    }

    LOG_ERROR("unknown category " + std::to_string(category) + "!");
}


bool StringToCategory(const std::string &category_candidate, Category * const category) {
    for (const auto candidate : GetAllCategories()) {
        if (CategoryToString(candidate) == category_candidate or GetDumpFileName(candidate) == category_candidate) {
            *category = candidate;
            return true;
        }
    }

    return false;
}


std::string GetDumpFileName(const Category category) {
    return "ol_dump_" + CategoryToString(category) + "_latest.txt.gz";
}


std::string GetTypeTag(const Category category) {
    switch (category) {
    case AUTHORS:
        return "/type/author";
    case EDITIONS:
        return "/type/edition";
    case WORKS:
        return "/type/work";
    }

    LOG_ERROR("unknown category " + std::to_string(category) + "!");
}


std::string GetDefaultDumpUrl(const Category category) {
    return "https://openlibrary.org/data/" + GetDumpFileName(category);
}


std::string StageToString(const Stage stage) {
    switch (stage) {
    case PROBING:
        return "probing";
    case FETCHING:
        return "fetching";
    case PARSING:
        return "parsing";
    case MAPPING:
        return "mapping";
    case WRITING:
        return "writing";
    case PUBLISHING:
        return "publishing";
    case COMMITTING:
        return "committing";
    }

    LOG_ERROR("unknown stage " + std::to_string(stage) + "!");
}


namespace {


std::atomic<bool> cancellation_requested(false);


void CancellationSignalHandler(int /*signal_no*/) {
    cancellation_requested.store(true);
}


} // unnamed namespace


void InstallCancellationHandlers() {
    struct sigaction new_action;
    std::memset(&new_action, 0, sizeof new_action);
    new_action.sa_handler = CancellationSignalHandler;
    ::sigemptyset(&new_action.sa_mask);

    if (::sigaction(SIGINT, &new_action, nullptr) != 0 or ::sigaction(SIGTERM, &new_action, nullptr) != 0)
        LOG_ERROR("failed to install the SIGINT/SIGTERM handlers!");
}


void RequestCancellation() {
    cancellation_requested.store(true);
}


void ResetCancellation() {
    cancellation_requested.store(false);
}


bool CancellationRequested() {
    return cancellation_requested.load();
}


const std::atomic<bool> *GetCancellationFlag() {
    return &cancellation_requested;
}


void CheckForCancellation(const Stage stage) {
    if (unlikely(cancellation_requested.load()))
        throw CancelledError(stage);
}


nlohmann::json FetchResult::toJson() const {
    nlohmann::json json_obj;
    json_obj["local_path"] = local_path_;
    json_obj["signature"] = signature_;
    json_obj["sha256"] = content_sha256_;
    json_obj["size"] = size_;
    json_obj["recovered_from_backup"] = recovered_from_backup_;
    return json_obj;
}


FetchResult FetchResult::FromJson(const nlohmann::json &json_obj) {
    if (not json_obj.is_object())
        throw std::runtime_error("in FetchResult::FromJson: fetch record is not a JSON object!");
    for (const auto &required_member : { "local_path", "signature", "sha256" }) {
        const auto member(json_obj.find(required_member));
        if (member == json_obj.end() or not member->is_string())
            throw std::runtime_error("in FetchResult::FromJson: missing or non-string \"" + std::string(required_member) + "\"!");
    }

    FetchResult fetch_result;
    fetch_result.local_path_ = json_obj.at("local_path").get<std::string>();
    fetch_result.signature_ = json_obj.at("signature").get<std::string>();
    fetch_result.content_sha256_ = json_obj.at("sha256").get<std::string>();
    fetch_result.size_ = json_obj.value("size", static_cast<uint64_t>(0));
    fetch_result.recovered_from_backup_ = json_obj.value("recovered_from_backup", false);
    return fetch_result;
}


void ThrowTransferError(const Downloader &downloader, const Stage stage, const std::string &what) {
    if (downloader.wasCancelled())
        throw CancelledError(stage);

    const unsigned response_code(downloader.getResponseCode());
    const std::string message(what + " failed: " + downloader.getLastErrorMessage()
                              + (response_code == 0 ? "" : " (HTTP " + std::to_string(response_code) + ")"));
    if (response_code == 0 or response_code == 408 or response_code == 429 or response_code >= 500)
        throw TransientError(stage, message);

    throw FatalError(stage, message);
}


} // namespace OLSync
