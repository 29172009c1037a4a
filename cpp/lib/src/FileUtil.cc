/** \file    FileUtil.cc
 *  \brief   Implementation of file related utility classes and functions.
 *  \author  Dr. Gordon W. Paynter
 *  \author  Dr. Johannes Ruscheinski
 *
 *  \copyright 2002-2008 Project iVia.
 *  \copyright 2002-2008 The Regents of The University of California.
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
#include "FileUtil.h"
#include <fstream>
#include <memory>
#include <stdexcept>
#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <dirent.h>
#include <fcntl.h>
#include <openssl/evp.h>
#include <sys/stat.h>
#include <unistd.h>
#include "StringUtil.h"
#include "util.h"


namespace FileUtil {


AutoDeleteFile::~AutoDeleteFile() {
    if (not path_.empty() and Exists(path_) and not DeleteFile(path_))
        LOG_WARNING("failed to delete \"" + path_ + "\"!");
}


AutoTempDirectory::AutoTempDirectory(const std::string &path_prefix, const bool remove_when_out_of_scope)
    : remove_when_out_of_scope_(remove_when_out_of_scope) {
    std::string path_template(path_prefix + "XXXXXX");
    const char * const path(::mkdtemp(const_cast<char *>(path_template.c_str())));
    if (path == nullptr)
        LOG_ERROR("mkdtemp(3) for path prefix \"" + path_prefix + "\" failed!");
    char resolved_path[PATH_MAX];
    if (unlikely(::realpath(path, resolved_path) == nullptr))
        LOG_ERROR("realpath(3) for path \"" + std::string(path) + "\" failed!");
    path_ = resolved_path;
}


AutoTempDirectory::~AutoTempDirectory() {
    if (remove_when_out_of_scope_ and IsDirectory(path_) and not RemoveDirectory(path_))
        LOG_WARNING("can't remove \"" + path_ + "\"!");
}


bool WriteString(const std::string &path, const std::string &data) {
    std::ofstream output(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (output.fail())
        return false;

    output.write(data.data(), static_cast<std::streamsize>(data.size()));
    output.close();
    return not output.fail();
}


bool WriteStringAtomic(const std::string &path, const std::string &data) {
    std::string temp_path(path + ".tmpXXXXXX");
    const int fd(::mkstemp(const_cast<char *>(temp_path.c_str())));
    if (fd == -1)
        return false;

    const char *cp(data.data());
    size_t remaining(data.size());
    while (remaining > 0) {
        const ssize_t written(::write(fd, cp, remaining));
        if (written == -1) {
            if (errno == EINTR)
                continue;
            const int saved_errno(errno);
            ::close(fd);
            ::unlink(temp_path.c_str());
            errno = saved_errno;
            return false;
        }
        cp += written;
        remaining -= static_cast<size_t>(written);
    }

    if (::fsync(fd) != 0 or ::fchmod(fd, 0644) != 0) {
        const int saved_errno(errno);
        ::close(fd);
        ::unlink(temp_path.c_str());
        errno = saved_errno;
        return false;
    }
    if (::close(fd) != 0 or ::rename(temp_path.c_str(), path.c_str()) != 0) {
        const int saved_errno(errno);
        ::unlink(temp_path.c_str());
        errno = saved_errno;
        return false;
    }

    // Make the rename itself durable:
    const int dir_fd(::open(GetDirname(path).c_str(), O_RDONLY | O_DIRECTORY));
    if (dir_fd != -1) {
        ::fsync(dir_fd);
        ::close(dir_fd);
    }

    return true;
}


bool ReadString(const std::string &path, std::string * const data) {
    std::ifstream input(path, std::ios::in | std::ios::binary);
    if (input.fail())
        return false;

    data->assign(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
    return not input.bad();
}


off_t GetFileSize(const std::string &path) {
    struct stat stat_buf;
    if (::stat(path.c_str(), &stat_buf) == -1)
        return -1;

    return stat_buf.st_size;
}


bool Exists(const std::string &path) {
    return ::access(path.c_str(), F_OK) == 0;
}


bool IsDirectory(const std::string &dir_name) {
    struct stat statbuf;
    if (::stat(dir_name.c_str(), &statbuf) != 0)
        return false;

    return S_ISDIR(statbuf.st_mode);
}


bool DeleteFile(const std::string &path) {
    return ::unlink(path.c_str()) == 0;
}


bool RenameFile(const std::string &old_name, const std::string &new_name) {
    return ::rename(old_name.c_str(), new_name.c_str()) == 0;
}


bool CopyFile(const std::string &from_path, const std::string &to_path) {
    std::ifstream input(from_path, std::ios::in | std::ios::binary);
    if (input.fail())
        return false;
    std::ofstream output(to_path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (output.fail())
        return false;

    char buffer[64 * 1024];
    while (input) {
        input.read(buffer, sizeof buffer);
        if (input.gcount() > 0)
            output.write(buffer, input.gcount());
    }
    if (input.bad())
        return false;

    output.close();
    return not output.fail();
}


bool MakeDirectory(const std::string &path, const bool recursive, const mode_t mode) {
    if (not recursive)
        return ::mkdir(path.c_str(), mode) == 0 or (errno == EEXIST and IsDirectory(path));

    std::string partial_path;
    std::vector<std::string> components;
    StringUtil::Split(path, '/', &components, /* suppress_empty_components = */ true);
    if (not path.empty() and path[0] == '/')
        partial_path = "/";
    for (const auto &component : components) {
        partial_path += component;
        if (::mkdir(partial_path.c_str(), mode) != 0 and errno != EEXIST)
            return false;
        partial_path += '/';
    }

    return IsDirectory(path);
}


size_t GetFileNameList(const std::string &filename_prefix, std::vector<std::string> * const filenames,
                       const std::string &directory_to_scan)
{
    if (unlikely(filename_prefix.find('/') != std::string::npos))
        throw std::runtime_error("in FileUtil::GetFileNameList: filename prefix contained a slash!");

    DIR * const dir_handle(::opendir(directory_to_scan.c_str()));
    if (unlikely(dir_handle == nullptr))
        throw std::runtime_error("in FileUtil::GetFileNameList: can't open \"" + directory_to_scan + "\"!");

    struct dirent *entry;
    while ((entry = ::readdir(dir_handle)) != nullptr) {
        if (std::strcmp(entry->d_name, ".") == 0 or std::strcmp(entry->d_name, "..") == 0)
            continue;
        if (StringUtil::StartsWith(entry->d_name, filename_prefix))
            filenames->emplace_back(entry->d_name);
    }
    ::closedir(dir_handle);

    return filenames->size();
}


bool RemoveDirectory(const std::string &dir_name) {
    DIR * const dir_handle(::opendir(dir_name.c_str()));
    if (unlikely(dir_handle == nullptr))
        return false;

    bool success(true);
    struct dirent *entry;
    while ((entry = ::readdir(dir_handle)) != nullptr) {
        if (std::strcmp(entry->d_name, ".") == 0 or std::strcmp(entry->d_name, "..") == 0)
            continue;

        const std::string path(dir_name + "/" + entry->d_name);
        if (IsDirectory(path)) {
            if (not RemoveDirectory(path))
                success = false;
        } else if (::unlink(path.c_str()) != 0)
            success = false;
    }
    ::closedir(dir_handle);

    return ::rmdir(dir_name.c_str()) == 0 and success;
}


void DirnameAndBasename(const std::string &path, std::string * const dirname, std::string * const basename) {
    const auto last_slash_pos(path.rfind('/'));
    if (last_slash_pos == std::string::npos) {
        dirname->clear();
        *basename = path;
    } else {
        *dirname = (last_slash_pos == 0) ? "/" : path.substr(0, last_slash_pos);
        *basename = path.substr(last_slash_pos + 1);
    }
}


std::string GetBasename(const std::string &path) {
    std::string dirname, basename;
    DirnameAndBasename(path, &dirname, &basename);
    return basename;
}


std::string GetDirname(const std::string &path) {
    std::string dirname, basename;
    DirnameAndBasename(path, &dirname, &basename);
    return dirname.empty() ? "." : dirname;
}


std::string ComputeSha256(const std::string &path) {
    std::ifstream input(path, std::ios::in | std::ios::binary);
    if (input.fail())
        throw std::runtime_error("in FileUtil::ComputeSha256: can't open \"" + path + "\" for reading!");

    std::unique_ptr<EVP_MD_CTX, decltype(&::EVP_MD_CTX_free)> context(::EVP_MD_CTX_new(), ::EVP_MD_CTX_free);
    if (unlikely(context == nullptr or ::EVP_DigestInit_ex(context.get(), ::EVP_sha256(), nullptr) != 1))
        throw std::runtime_error("in FileUtil::ComputeSha256: failed to initialise the digest context!");

    char buffer[64 * 1024];
    while (input) {
        input.read(buffer, sizeof buffer);
        if (input.gcount() > 0 and ::EVP_DigestUpdate(context.get(), buffer, static_cast<size_t>(input.gcount())) != 1)
            throw std::runtime_error("in FileUtil::ComputeSha256: EVP_DigestUpdate failed!");
    }
    if (input.bad())
        throw std::runtime_error("in FileUtil::ComputeSha256: read error on \"" + path + "\"!");

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned digest_length(0);
    if (::EVP_DigestFinal_ex(context.get(), digest, &digest_length) != 1)
        throw std::runtime_error("in FileUtil::ComputeSha256: EVP_DigestFinal_ex failed!");

    return StringUtil::ToHexString(std::string(reinterpret_cast<const char *>(digest), digest_length));
}


} // namespace FileUtil
