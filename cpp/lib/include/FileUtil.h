/** \file    FileUtil.h
 *  \brief   Declaration of file-related utility functions.
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
#pragma once


#include <string>
#include <vector>
#include <sys/types.h>


namespace FileUtil {


/** \class AutoDeleteFile
 *  \brief Deletes the file specified in the constructor in the destructor unless release() has been called.
 */
class AutoDeleteFile {
    std::string path_;

public:
    explicit AutoDeleteFile(const std::string &path): path_(path) { }
    AutoDeleteFile(const AutoDeleteFile &rhs) = delete;
    ~AutoDeleteFile();

    const std::string &getFilePath() const { return path_; }

    //* After calling this the file will be left alone by the destructor.
    void release() { path_.clear(); }
};


/** \class AutoTempDirectory
 *  \brief Creates a temp directory and removes it, including all of its contents, when going out of scope.
 */
class AutoTempDirectory {
    std::string path_;
    bool remove_when_out_of_scope_;

public:
    explicit AutoTempDirectory(const std::string &path_prefix = "/tmp/ATD", const bool remove_when_out_of_scope = true);
    AutoTempDirectory(const AutoTempDirectory &rhs) = delete;
    ~AutoTempDirectory();

    const std::string &getDirectoryPath() const { return path_; }
};


bool WriteString(const std::string &path, const std::string &data);


/** \brief  Replaces "path" with "data" such that readers either see the old or the new contents.
 *  \note   The data are written to a temporary file in the same directory, fsync'ed and then renamed.  On failure the
 *          original file is untouched and the temporary file has been removed.
 *  \return False on failure, in which case errno is set.
 */
bool WriteStringAtomic(const std::string &path, const std::string &data);


bool ReadString(const std::string &path, std::string * const data);


/** \return The size of the file or -1 if it doesn't exist. */
off_t GetFileSize(const std::string &path);


bool Exists(const std::string &path);


bool IsDirectory(const std::string &dir_name);


bool DeleteFile(const std::string &path);


bool RenameFile(const std::string &old_name, const std::string &new_name);


//* \note Overwrites "to_path" if it exists.
bool CopyFile(const std::string &from_path, const std::string &to_path);


bool MakeDirectory(const std::string &path, const bool recursive = false, const mode_t mode = 0755);


/** \brief  Collects the names of the entries in "directory_to_scan" that start with "filename_prefix".
 *  \return The number of names in "filenames" after the scan.
 *  \throws std::runtime_error if "filename_prefix" contains a slash or the directory can't be opened.
 */
size_t GetFileNameList(const std::string &filename_prefix, std::vector<std::string> * const filenames,
                       const std::string &directory_to_scan = ".");


//* \brief Recursively deletes "dir_name".
bool RemoveDirectory(const std::string &dir_name);


void DirnameAndBasename(const std::string &path, std::string * const dirname, std::string * const basename);


std::string GetBasename(const std::string &path);


std::string GetDirname(const std::string &path);


/** \brief  Computes the SHA-256 digest of a file's contents without loading the file into memory.
 *  \return The lowercase hex digest.
 *  \throws std::runtime_error if the file can't be read.
 */
std::string ComputeSha256(const std::string &path);


} // namespace FileUtil
