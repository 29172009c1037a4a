/** \file   Downloader.h
 *  \brief  Functions for downloading and uploading of web resources.
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
#pragma once


#include <atomic>
#include <string>
#include <vector>
#include <cinttypes>
#include <cstdio>
#include <curl/curl.h>
#include "HttpHeader.h"
#include "util.h"


/** \class  Downloader
 *  \brief  Implements an object that can probe, download and upload HTTP(S) resources.
 *  \note   All request functions return false on failure, in which case getLastErrorMessage() explains what went wrong.
 *          HTTP error statuses (>= 400) are failures; getResponseCode() reports the status in either case.
 */
class Downloader {
    CURL *easy_handle_;

public:
    static const long DEFAULT_MAX_REDIRECTS = 10;
    static const std::string DEFAULT_USER_AGENT_STRING;
    static const unsigned DEFAULT_TIME_LIMIT = 20000; // In ms.

    struct Params {
        std::string user_agent_;
        unsigned connect_timeout_;  // In ms.
        unsigned low_speed_time_;   // Abort transfers slower than 1 byte/s for this many seconds.  0 disables the check.
        bool follow_redirects_;
        bool ignore_ssl_certificates_;
        bool debugging_;
        std::vector<std::string> additional_headers_;
        const std::atomic<bool> *cancellation_flag_; // If non-null, a transfer is aborted as soon as the flag becomes true.

    public:
        explicit Params(const std::string &user_agent = DEFAULT_USER_AGENT_STRING, const unsigned connect_timeout = 30000,
                        const unsigned low_speed_time = 120, const bool follow_redirects = true,
                        const bool ignore_ssl_certificates = false, const bool debugging = false,
                        const std::vector<std::string> &additional_headers = {}, const std::atomic<bool> *cancellation_flag = nullptr)
            : user_agent_(user_agent), connect_timeout_(connect_timeout), low_speed_time_(low_speed_time),
              follow_redirects_(follow_redirects), ignore_ssl_certificates_(ignore_ssl_certificates), debugging_(debugging),
              additional_headers_(additional_headers), cancellation_flag_(cancellation_flag) { }
    };

private:
    Params params_;
    CURLcode curl_error_code_;
    mutable std::string last_error_message_;
    std::string concatenated_headers_;
    char error_buffer_[CURL_ERROR_SIZE];
    curl_slist *additional_http_headers_;
    FILE *output_file_;  // Non-null while downloading to a file.
    FILE *upload_file_;  // Non-null while uploading from a file.
    std::string upload_data_;
    size_t upload_data_offset_;
    uint64_t resume_offset_;
    bool restarted_from_scratch_, body_seen_;

public:
    explicit Downloader(const Params &params = Params());
    Downloader(const Downloader &rhs) = delete;
    virtual ~Downloader();

    /** \brief  Issues a HEAD request.
     *  \param  time_limit  Max. time for the entire request in ms.  0 means no limit.
     */
    bool head(const std::string &url, const unsigned time_limit = DEFAULT_TIME_LIMIT);

    /** \brief  Streams a GET response into "output_filename".
     *  \param  resume_offset  If non-zero, the existing file is appended to and a Range request starting at this offset
     *                         is issued.  Should the server ignore the Range, the file is truncated and the download
     *                         restarts from byte 0, see restartedFromScratch().
     *  \param  time_limit     Max. time for the entire request in ms.  0 means no limit.
     */
    bool downloadToFile(const std::string &url, const std::string &output_filename, const uint64_t resume_offset = 0,
                        const unsigned time_limit = 0);

    //* \brief Issues a PUT request whose body are the contents of "path".
    bool putFile(const std::string &url, const std::string &path, const unsigned time_limit = 0);

    //* \brief Issues a PUT request whose body is "data".
    bool putData(const std::string &url, const std::string &data, const unsigned time_limit = DEFAULT_TIME_LIMIT);

    //* \return The last of the headers received for the most recent request, i.e. the one after any redirects.
    std::string getMessageHeader() const;
    HttpHeader getMessageHeaderObject() const { return HttpHeader(getMessageHeader()); }

    const std::string &getLastErrorMessage() const;

    //* \return The HTTP status of the most recent request or 0 if no response was received.
    unsigned getResponseCode() const;

    //* \return True if the last downloadToFile() asked for a Range but received the whole resource.
    bool restartedFromScratch() const { return restarted_from_scratch_; }

    //* \return True if the last transfer was aborted through the cancellation flag.
    bool wasCancelled() const { return curl_error_code_ == CURLE_ABORTED_BY_CALLBACK; }

private:
    void init();
    void resetRequestState();
    bool performRequest(const std::string &url, const unsigned time_limit);
    size_t writeFunction(void *data, size_t size, size_t nmemb);
    static size_t WriteFunction(void *data, size_t size, size_t nmemb, void *this_pointer);
    size_t headerFunction(void *data, size_t size, size_t nmemb);
    static size_t HeaderFunction(void *data, size_t size, size_t nmemb, void *this_pointer);
    size_t readFunction(char *buffer, size_t size, size_t nitems);
    static size_t ReadFunction(char *buffer, size_t size, size_t nitems, void *this_pointer);
    static int ProgressFunction(void *this_pointer, curl_off_t dltotal, curl_off_t dlnow, curl_off_t ultotal, curl_off_t ulnow);
    void debugFunction(curl_infotype infotype, char *data, size_t size);
    static int DebugFunction(CURL *handle, curl_infotype infotype, char *data, size_t size, void *this_pointer);
    template <typename OptionType>
    void curlEasySetopt(const CURLoption option, OptionType value, const std::string &caller_info) {
        if ((curl_error_code_ = ::curl_easy_setopt(easy_handle_, option, value)) != CURLE_OK)
            LOG_ERROR("curl_easy_setopt(" + caller_info + ") failed!");
    }
};
