/** \file   DumpParser.h
 *  \brief  Incremental reading of gzipped Open Library dump files.
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


#include <fstream>
#include <memory>
#include <string>
#include <vector>
#include "GzStream.h"
#include "SyncTypes.h"


namespace OLSync {


/** \class  GzippedLineReader
 *  \brief  Reads lines from a gzip file, which may consist of several concatenated members, using fixed-size buffers.
 */
class GzippedLineReader {
    std::string path_;
    std::ifstream input_;
    GzStream gz_stream_;
    std::vector<char> compressed_buffer_, decompressed_buffer_;
    size_t compressed_start_, compressed_end_;
    size_t decompressed_start_, decompressed_end_;
    bool input_exhausted_, in_member_;
    uint64_t line_no_;

public:
    static constexpr size_t BUFFER_SIZE = 64 * 1024;
public:
    //* \throws std::runtime_error if "path" can't be opened.
    explicit GzippedLineReader(const std::string &path);

    /** \brief  Reads the next line without the terminating newline.
     *  \return False at the end of the input.
     *  \throws std::runtime_error if the compressed data are corrupt or truncated.
     */
    bool getLine(std::string * const line);

    //* \return The 1-based number of the last line returned by getLine().
    inline uint64_t getLineNo() const { return line_no_; }
private:
    bool fillDecompressedBuffer();
    bool refillCompressedBuffer();
};


// A forward-only, finite sequence of records.
class RecordProducer {
public:
    virtual ~RecordProducer() = default;

    //* \return False if there are no more records.
    virtual bool next(RawRecord * const raw_record) = 0;
};


struct ParseStatistics {
    uint64_t lines_read_;
    uint64_t malformed_count_; // Wrong number of columns, invalid JSON or JSON that's not an object.
    uint64_t foreign_count_;   // Records whose type tag does not belong to the category of the dump.

public:
    ParseStatistics(): lines_read_(0), malformed_count_(0), foreign_count_(0) { }
};


class DumpRecordProducer : public RecordProducer {
    GzippedLineReader line_reader_;
    std::string expected_type_tag_;
    ParseStatistics statistics_;

public:
    /** \param expected_type_tag  If non-empty, records with other types are skipped and counted as foreign.
     *  \throws FatalError if "path" can't be opened.
     */
    DumpRecordProducer(const std::string &path, const std::string &expected_type_tag);

    /** \throws FatalError if the gzip data are corrupt or truncated and CancelledError if cancellation was
     *          requested.  Cancellation is checked every CANCELLATION_CHECK_INTERVAL lines.
     */
    bool next(RawRecord * const raw_record) override;

    inline const ParseStatistics &getStatistics() const { return statistics_; }

    static constexpr uint64_t CANCELLATION_CHECK_INTERVAL = 4096;
};


/** \brief  Splits a dump line into its five tab-separated columns, type, key, revision, last_modified and JSON.
 *  \return False if the line is malformed.
 */
bool ParseDumpLine(const std::string &line, RawRecord * const raw_record);


std::unique_ptr<DumpRecordProducer> Parse(const std::string &local_path, const Category category);


} // namespace OLSync
