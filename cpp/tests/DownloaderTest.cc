/** \brief Test cases for the resumable downloads of Downloader
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
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <cstdlib>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include "Downloader.h"
#include "FileUtil.h"
#include "UnitTest.h"


namespace {


// A minimal HTTP/1.1 server on the loopback interface that answers every request with "200 OK" and the whole body,
// whatever Range header the client sent.
class RangeIgnoringHttpServer {
    int listen_fd_;
    unsigned short port_;
    std::string body_;
    std::thread thread_;
    mutable std::mutex mutex_;
    std::vector<std::string> requests_;

public:
    explicit RangeIgnoringHttpServer(const std::string &body);
    ~RangeIgnoringHttpServer();

    std::string getUrl() const { return "http://127.0.0.1:" + std::to_string(port_) + "/ol_dump_authors_latest.txt.gz"; }
    std::vector<std::string> getRequests() const;
private:
    void serve();
};


RangeIgnoringHttpServer::RangeIgnoringHttpServer(const std::string &body): listen_fd_(-1), port_(0), body_(body) {
    listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (listen_fd_ == -1)
        throw std::runtime_error("socket(2) failed!");

    struct sockaddr_in address = {};
    address.sin_family = AF_INET;
    address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    address.sin_port = 0;
    socklen_t address_length(sizeof(address));
    if (::bind(listen_fd_, reinterpret_cast<struct sockaddr *>(&address), sizeof(address)) != 0
        or ::getsockname(listen_fd_, reinterpret_cast<struct sockaddr *>(&address), &address_length) != 0
        or ::listen(listen_fd_, 4) != 0)
    {
        ::close(listen_fd_);
        throw std::runtime_error("can't listen on the loopback interface!");
    }
    port_ = ntohs(address.sin_port);

    thread_ = std::thread(&RangeIgnoringHttpServer::serve, this);
}


RangeIgnoringHttpServer::~RangeIgnoringHttpServer() {
    ::shutdown(listen_fd_, SHUT_RDWR); // Makes accept(2) return.
    thread_.join();
    ::close(listen_fd_);
}


std::vector<std::string> RangeIgnoringHttpServer::getRequests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
}


void RangeIgnoringHttpServer::serve() {
    for (;;) {
        const int connection_fd(::accept(listen_fd_, nullptr, nullptr));
        if (connection_fd == -1)
            return;

        std::string request;
        char buffer[4096];
        while (request.find("\r\n\r\n") == std::string::npos) {
            const ssize_t count(::read(connection_fd, buffer, sizeof(buffer)));
            if (count <= 0)
                break;
            request.append(buffer, static_cast<size_t>(count));
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.emplace_back(request);
        }

        const std::string response("HTTP/1.1 200 OK\r\nContent-Type: application/gzip\r\nContent-Length: "
                                   + std::to_string(body_.size()) + "\r\nConnection: close\r\n\r\n" + body_);
        size_t written(0);
        while (written < response.size()) {
            const ssize_t count(::write(connection_fd, response.data() + written, response.size() - written));
            if (count <= 0)
                break;
            written += static_cast<size_t>(count);
        }
        ::close(connection_fd);
    }
}


std::string MakeBody() {
    std::string body;
    for (unsigned i(0); i < 20000; ++i)
        body += static_cast<char>('a' + i % 26);
    return body;
}


// libcurl would otherwise send requests for our loopback server to a proxy configured in the environment.
void BypassProxies() {
    for (const char * const variable : { "http_proxy", "HTTP_PROXY", "all_proxy", "ALL_PROXY" })
        ::unsetenv(variable);
}


} // unnamed namespace


TEST(ServersIgnoringRangesRestartTheDownload) {
    BypassProxies();
    const std::string body(MakeBody());
    const RangeIgnoringHttpServer server(body);
    const FileUtil::AutoTempDirectory temp_directory("/tmp/DownloaderTest");
    const std::string part_path(temp_directory.getDirectoryPath() + "/ol_dump_authors_latest.txt.gz.part");
    FileUtil::WriteString(part_path, body.substr(0, 100));

    Downloader downloader;
    CHECK_TRUE(downloader.downloadToFile(server.getUrl(), part_path, /* resume_offset = */ 100));
    CHECK_TRUE(downloader.restartedFromScratch());

    std::string contents;
    CHECK_TRUE(FileUtil::ReadString(part_path, &contents));
    CHECK_EQ(contents.size(), body.size());
    CHECK_TRUE(contents == body);

    const std::vector<std::string> requests(server.getRequests());
    CHECK_FALSE(requests.empty());
    CHECK_TRUE(requests.front().find("Range: bytes=100-") != std::string::npos);
}


TEST(FileUrlsAreResumed) {
    const std::string body(MakeBody());
    const FileUtil::AutoTempDirectory temp_directory("/tmp/DownloaderTest");
    const std::string source_path(temp_directory.getDirectoryPath() + "/ol_dump_works_latest.txt.gz");
    const std::string part_path(source_path + ".part");
    FileUtil::WriteString(source_path, body);
    FileUtil::WriteString(part_path, body.substr(0, 1000));

    Downloader downloader;
    CHECK_TRUE(downloader.downloadToFile("file://" + source_path, part_path, /* resume_offset = */ 1000));
    CHECK_FALSE(downloader.restartedFromScratch());

    std::string contents;
    CHECK_TRUE(FileUtil::ReadString(part_path, &contents));
    CHECK_EQ(contents.size(), body.size());
    CHECK_TRUE(contents == body);
}


TEST(FreshDownloadsReplaceExistingFiles) {
    BypassProxies();
    const std::string body(MakeBody());
    const RangeIgnoringHttpServer server(body);
    const FileUtil::AutoTempDirectory temp_directory("/tmp/DownloaderTest");
    const std::string part_path(temp_directory.getDirectoryPath() + "/ol_dump_editions_latest.txt.gz.part");
    FileUtil::WriteString(part_path, "left over from an older version");

    Downloader downloader;
    CHECK_TRUE(downloader.downloadToFile(server.getUrl(), part_path));
    CHECK_FALSE(downloader.restartedFromScratch());

    std::string contents;
    CHECK_TRUE(FileUtil::ReadString(part_path, &contents));
    CHECK_TRUE(contents == body);
    CHECK_TRUE(server.getRequests().front().find("Range:") == std::string::npos);
}


TEST_MAIN(Downloader)
