/** \file   Downloader.cc
 *  \brief  Implementation of class Downloader.
 *  \author Dr. Johannes Ruscheinski (johannes.ruscheinski@uni-tuebingen.de)
 *
 *  \copyright 2005-2008 Project iVia.
 *  \copyright 2005-2008 The Regents of The University of California.
 *  \copyright 2015-2026 Universitätsbibliothek Tübingen.  All rights reserved.
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
#include "Downloader.h"
#include <algorithm>
#include <stdexcept>
#include <cerrno>
#include <cstring>
#include <unistd.h>
#include "FileUtil.h"
#include "StringUtil.h"


namespace {


int GlobalInit() {
    if (unlikely(::curl_global_init(CURL_GLOBAL_ALL) != 0)) {
        const std::string error_message("curl_global_init(3) failed!\n");
        const ssize_t dummy = ::write(STDERR_FILENO, error_message.c_str(), error_message.length());
        (void)dummy;
        ::_exit(EXIT_FAILURE);
    }

    return 0;
}


int dummy(GlobalInit());


void SplitHttpHeaders(std::string possible_combo_headers, std::vector<std::string> * const individual_headers) {
    individual_headers->clear();
    if (possible_combo_headers.empty())
        return;

    // Sometimes we get HTTP headers that end in LF/LF sequences:
    StringUtil::ReplaceString("\r\n", "\n", &possible_combo_headers);

    std::string::size_type start(0);
    for (;;) {
        const auto end(possible_combo_headers.find("\n\n", start));
        if (end == std::string::npos) {
            if (start < possible_combo_headers.length())
                individual_headers->emplace_back(possible_combo_headers.substr(start));
            return;
        }
        if (end > start)
            individual_headers->emplace_back(possible_combo_headers.substr(start, end - start + 2));
        start = end + 2;
    }
}


} // unnamed namespace


const std::string Downloader::DEFAULT_USER_AGENT_STRING("ol_dump_sync/1.0 (libcurl)");
const long Downloader::DEFAULT_MAX_REDIRECTS;
const unsigned Downloader::DEFAULT_TIME_LIMIT;


Downloader::Downloader(const Params &params)
    : easy_handle_(nullptr), params_(params), curl_error_code_(CURLE_OK), additional_http_headers_(nullptr), output_file_(nullptr),
      upload_file_(nullptr), upload_data_offset_(0), resume_offset_(0), restarted_from_scratch_(false), body_seen_(false) {
    init();
}


Downloader::~Downloader() {
    if (additional_http_headers_ != nullptr)
        ::curl_slist_free_all(additional_http_headers_);
    if (likely(easy_handle_ != nullptr))
        ::curl_easy_cleanup(easy_handle_);
}


void Downloader::init() {
    easy_handle_ = ::curl_easy_init();
    if (unlikely(easy_handle_ == nullptr))
        throw std::runtime_error("in Downloader::init: curl_easy_init() failed!");

    if (params_.debugging_) {
        curlEasySetopt(CURLOPT_VERBOSE, 1L, "Downloader::init:CURLOPT_VERBOSE");
        curlEasySetopt(CURLOPT_DEBUGFUNCTION, DebugFunction, "Downloader::init:CURLOPT_DEBUGFUNCTION");
        curlEasySetopt(CURLOPT_DEBUGDATA, reinterpret_cast<void *>(this), "Downloader::init:CURLOPT_DEBUGDATA");
    }

    curlEasySetopt(CURLOPT_HEADER, 0L, "Downloader::init:CURLOPT_HEADER");
    curlEasySetopt(CURLOPT_NOSIGNAL, 1L, "Downloader::init:CURLOPT_NOSIGNAL");
    curlEasySetopt(CURLOPT_WRITEFUNCTION, WriteFunction, "Downloader::init:CURLOPT_WRITEFUNCTION");
    curlEasySetopt(CURLOPT_WRITEDATA, reinterpret_cast<void *>(this), "Downloader::init:CURLOPT_WRITEDATA");
    curlEasySetopt(CURLOPT_HEADERFUNCTION, HeaderFunction, "Downloader::init:CURLOPT_HEADERFUNCTION");
    curlEasySetopt(CURLOPT_HEADERDATA, reinterpret_cast<void *>(this), "Downloader::init:CURLOPT_HEADERDATA");
    curlEasySetopt(CURLOPT_READFUNCTION, ReadFunction, "Downloader::init:CURLOPT_READFUNCTION");
    curlEasySetopt(CURLOPT_READDATA, reinterpret_cast<void *>(this), "Downloader::init:CURLOPT_READDATA");
    curlEasySetopt(CURLOPT_FAILONERROR, 1L, "Downloader::init:CURLOPT_FAILONERROR");
    curlEasySetopt(CURLOPT_ERRORBUFFER, error_buffer_, "Downloader::init:CURLOPT_ERRORBUFFER");

    curlEasySetopt(CURLOPT_FOLLOWLOCATION, params_.follow_redirects_ ? 1L : 0L, "Downloader::init:CURLOPT_FOLLOWLOCATION");
    curlEasySetopt(CURLOPT_MAXREDIRS, DEFAULT_MAX_REDIRECTS, "Downloader::init:CURLOPT_MAXREDIRS");
    curlEasySetopt(CURLOPT_USERAGENT, params_.user_agent_.c_str(), "Downloader::init:CURLOPT_USERAGENT");
    curlEasySetopt(CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(params_.connect_timeout_), "Downloader::init:CURLOPT_CONNECTTIMEOUT_MS");
    if (params_.low_speed_time_ > 0) {
        curlEasySetopt(CURLOPT_LOW_SPEED_LIMIT, 1L, "Downloader::init:CURLOPT_LOW_SPEED_LIMIT");
        curlEasySetopt(CURLOPT_LOW_SPEED_TIME, static_cast<long>(params_.low_speed_time_), "Downloader::init:CURLOPT_LOW_SPEED_TIME");
    }

    if (params_.ignore_ssl_certificates_) {
        curlEasySetopt(CURLOPT_SSL_VERIFYPEER, 0L, "Downloader::init:CURLOPT_SSL_VERIFYPEER");
        curlEasySetopt(CURLOPT_SSL_VERIFYHOST, 0L, "Downloader::init:CURLOPT_SSL_VERIFYHOST");
    }

    if (params_.cancellation_flag_ != nullptr) {
        curlEasySetopt(CURLOPT_NOPROGRESS, 0L, "Downloader::init:CURLOPT_NOPROGRESS");
        curlEasySetopt(CURLOPT_XFERINFOFUNCTION, ProgressFunction, "Downloader::init:CURLOPT_XFERINFOFUNCTION");
        curlEasySetopt(CURLOPT_XFERINFODATA, reinterpret_cast<void *>(this), "Downloader::init:CURLOPT_XFERINFODATA");
    } else
        curlEasySetopt(CURLOPT_NOPROGRESS, 1L, "Downloader::init:CURLOPT_NOPROGRESS");

    for (const auto &additional_header : params_.additional_headers_)
        additional_http_headers_ = ::curl_slist_append(additional_http_headers_, additional_header.c_str());
    if (additional_http_headers_ != nullptr)
        curlEasySetopt(CURLOPT_HTTPHEADER, additional_http_headers_, "Downloader::init:CURLOPT_HTTPHEADER");
}


void Downloader::resetRequestState() {
    last_error_message_.clear();
    error_buffer_[0] = '\0';
    concatenated_headers_.clear();
    output_file_ = nullptr;
    upload_file_ = nullptr;
    upload_data_.clear();
    upload_data_offset_ = 0;
    resume_offset_ = 0;
    restarted_from_scratch_ = false;
    body_seen_ = false;

    // CURLOPT_HTTPGET also resets CURLOPT_NOBODY and CURLOPT_UPLOAD:
    curlEasySetopt(CURLOPT_HTTPGET, 1L, "Downloader::resetRequestState:CURLOPT_HTTPGET");
    curlEasySetopt(CURLOPT_RANGE, static_cast<const char *>(nullptr), "Downloader::resetRequestState:CURLOPT_RANGE");
}


bool Downloader::performRequest(const std::string &url, const unsigned time_limit) {
    curlEasySetopt(CURLOPT_URL, url.c_str(), "Downloader::performRequest:CURLOPT_URL");
    curlEasySetopt(CURLOPT_TIMEOUT_MS, static_cast<long>(time_limit), "Downloader::performRequest:CURLOPT_TIMEOUT_MS");

    curl_error_code_ = ::curl_easy_perform(easy_handle_);
    if (curl_error_code_ != CURLE_OK and error_buffer_[0] != '\0')
        last_error_message_ = error_buffer_;
    return curl_error_code_ == CURLE_OK;
}


bool Downloader::head(const std::string &url, const unsigned time_limit) {
    resetRequestState();
    curlEasySetopt(CURLOPT_NOBODY, 1L, "Downloader::head:CURLOPT_NOBODY");
    return performRequest(url, time_limit);
}


bool Downloader::downloadToFile(const std::string &url, const std::string &output_filename, const uint64_t resume_offset,
                                const unsigned time_limit) {
    resetRequestState();

    output_file_ = std::fopen(output_filename.c_str(), resume_offset > 0 ? "ab" : "wb");
    if (output_file_ == nullptr) {
        last_error_message_ = "can't open \"" + output_filename + "\" for writing! (" + std::string(std::strerror(errno)) + ")";
        return false;
    }

    // With CURLOPT_RESUME_FROM_LARGE libcurl aborts with CURLE_RANGE_ERROR when the server ignores the range.  A plain
    // Range header lets writeFunction() detect a 200 response and start over.
    resume_offset_ = resume_offset;
    if (resume_offset > 0)
        curlEasySetopt(CURLOPT_RANGE, (std::to_string(resume_offset) + "-").c_str(), "Downloader::downloadToFile:CURLOPT_RANGE");

    bool success(performRequest(url, time_limit));
    if (not success and resume_offset > 0 and curl_error_code_ == CURLE_RANGE_ERROR) {
        LOG_WARNING("range request for \"" + url + "\" failed, restarting the download from byte 0");
        if (std::fflush(output_file_) != 0 or ::ftruncate(::fileno(output_file_), 0) != 0 or std::fseek(output_file_, 0, SEEK_SET) != 0) {
            last_error_message_ = "can't truncate \"" + output_filename + "\"! (" + std::string(std::strerror(errno)) + ")";
            std::fclose(output_file_);
            output_file_ = nullptr;
            return false;
        }

        last_error_message_.clear();
        error_buffer_[0] = '\0';
        concatenated_headers_.clear();
        resume_offset_ = 0;
        body_seen_ = false;
        curlEasySetopt(CURLOPT_RANGE, static_cast<const char *>(nullptr), "Downloader::downloadToFile:CURLOPT_RANGE");
        success = performRequest(url, time_limit);
        restarted_from_scratch_ = true;
    }

    if (std::fclose(output_file_) != 0 and success) {
        last_error_message_ = "failed to close \"" + output_filename + "\"! (" + std::string(std::strerror(errno)) + ")";
        success = false;
    }
    output_file_ = nullptr;

    return success;
}


bool Downloader::putFile(const std::string &url, const std::string &path, const unsigned time_limit) {
    resetRequestState();

    const off_t file_size(FileUtil::GetFileSize(path));
    upload_file_ = std::fopen(path.c_str(), "rb");
    if (upload_file_ == nullptr or file_size < 0) {
        last_error_message_ = "can't open \"" + path + "\" for reading!";
        if (upload_file_ != nullptr)
            std::fclose(upload_file_);
        upload_file_ = nullptr;
        return false;
    }

    curlEasySetopt(CURLOPT_UPLOAD, 1L, "Downloader::putFile:CURLOPT_UPLOAD");
    curlEasySetopt(CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(file_size), "Downloader::putFile:CURLOPT_INFILESIZE_LARGE");
    const bool success(performRequest(url, time_limit));
    std::fclose(upload_file_);
    upload_file_ = nullptr;

    return success;
}


bool Downloader::putData(const std::string &url, const std::string &data, const unsigned time_limit) {
    resetRequestState();
    upload_data_ = data;

    curlEasySetopt(CURLOPT_UPLOAD, 1L, "Downloader::putData:CURLOPT_UPLOAD");
    curlEasySetopt(CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(data.size()), "Downloader::putData:CURLOPT_INFILESIZE_LARGE");
    return performRequest(url, time_limit);
}


std::string Downloader::getMessageHeader() const {
    std::vector<std::string> headers;
    SplitHttpHeaders(concatenated_headers_, &headers);
    return headers.empty() ? "" : headers.back();
}


const std::string &Downloader::getLastErrorMessage() const {
    if (curl_error_code_ != CURLE_OK and last_error_message_.empty())
        last_error_message_ = ::curl_easy_strerror(curl_error_code_);

    return last_error_message_;
}


unsigned Downloader::getResponseCode() const {
    long response_code(0);
    if (::curl_easy_getinfo(easy_handle_, CURLINFO_RESPONSE_CODE, &response_code) != CURLE_OK)
        return 0;

    return static_cast<unsigned>(response_code);
}


size_t Downloader::writeFunction(void *data, size_t size, size_t nmemb) {
    const size_t total_size(size * nmemb);
    if (output_file_ == nullptr) // Response bodies of HEAD and PUT requests are of no interest.
        return total_size;

    if (not body_seen_) {
        body_seen_ = true;

        // The server ignored our Range request and sends the whole resource:
        if (resume_offset_ > 0 and getResponseCode() == 200) {
            LOG_WARNING("server ignored the range request, restarting the download from byte 0");
            restarted_from_scratch_ = true;
            if (std::fflush(output_file_) != 0 or ::ftruncate(::fileno(output_file_), 0) != 0
                or std::fseek(output_file_, 0, SEEK_SET) != 0)
                return 0;
        }
    }

    return std::fwrite(data, 1, total_size, output_file_);
}


size_t Downloader::WriteFunction(void *data, size_t size, size_t nmemb, void *this_pointer) {
    Downloader * const downloader(reinterpret_cast<Downloader *>(this_pointer));
    return downloader->writeFunction(data, size, nmemb);
}


size_t Downloader::headerFunction(void *data, size_t size, size_t nmemb) {
    const size_t total_size(size * nmemb);
    concatenated_headers_.append(reinterpret_cast<char *>(data), total_size);
    return total_size;
}


size_t Downloader::HeaderFunction(void *data, size_t size, size_t nmemb, void *this_pointer) {
    Downloader * const downloader(reinterpret_cast<Downloader *>(this_pointer));
    return downloader->headerFunction(data, size, nmemb);
}


size_t Downloader::readFunction(char *buffer, size_t size, size_t nitems) {
    const size_t max_size(size * nitems);
    if (upload_file_ != nullptr) {
        const size_t actual(std::fread(buffer, 1, max_size, upload_file_));
        if (actual == 0 and std::ferror(upload_file_))
            return CURL_READFUNC_ABORT;
        return actual;
    }

    const size_t actual(std::min(max_size, upload_data_.size() - upload_data_offset_));
    std::memcpy(buffer, upload_data_.data() + upload_data_offset_, actual);
    upload_data_offset_ += actual;
    return actual;
}


size_t Downloader::ReadFunction(char *buffer, size_t size, size_t nitems, void *this_pointer) {
    Downloader * const downloader(reinterpret_cast<Downloader *>(this_pointer));
    return downloader->readFunction(buffer, size, nitems);
}


int Downloader::ProgressFunction(void *this_pointer, curl_off_t /*dltotal*/, curl_off_t /*dlnow*/, curl_off_t /*ultotal*/,
                                 curl_off_t /*ulnow*/) {
    const Downloader * const downloader(reinterpret_cast<const Downloader *>(this_pointer));
    return downloader->params_.cancellation_flag_->load() ? 1 : 0;
}


void Downloader::debugFunction(curl_infotype infotype, char *data, size_t size) {
    switch (infotype) {
    case CURLINFO_TEXT:
        LOG_DEBUG("informational text: " + std::string(data, size));
        break;
    case CURLINFO_HEADER_IN:
        LOG_DEBUG("received header:\n" + std::string(data, size));
        break;
    case CURLINFO_HEADER_OUT:
        LOG_DEBUG("sent header:\n" + std::string(data, size));
        break;
    default:
        break;
    }
}


int Downloader::DebugFunction(CURL * /* handle */, curl_infotype infotype, char *data, size_t size, void *this_pointer) {
    Downloader * const downloader(reinterpret_cast<Downloader *>(this_pointer));
    downloader->debugFunction(infotype, data, size);

    return 0;
}
