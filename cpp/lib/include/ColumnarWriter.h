/** \file   ColumnarWriter.h
 *  \brief  Batches mapped records and writes them as independent Parquet segments.
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


#include <string>
#include <vector>
#include <cinttypes>
#include "SchemaMapper.h"
#include "SyncTypes.h"


namespace OLSync {


struct WriterOptions {
    uint64_t max_rows_per_segment_;
    uint64_t max_bytes_per_segment_; // Estimated in-memory size of a batch.
    std::string compression_;        // "snappy", "zstd", "gzip" or "none"

public:
    WriterOptions(): max_rows_per_segment_(500000), max_bytes_per_segment_(256ull * 1024ull * 1024ull), compression_("snappy") { }
    WriterOptions(const uint64_t max_rows_per_segment, const uint64_t max_bytes_per_segment, const std::string &compression)
        : max_rows_per_segment_(max_rows_per_segment), max_bytes_per_segment_(max_bytes_per_segment), compression_(compression) { }
};


bool IsValidCompression(const std::string &compression);


/** \class  ColumnarWriter
 *  \brief  Writes "part-00000.parquet", "part-00001.parquet" etc. into an output directory.
 *  \note   A segment is written whenever the current batch reaches the row or the byte limit and once more for the
 *          remainder when finish() is called.  Each segment is first written under a temporary name and then renamed
 *          so that a segment that exists is always complete.
 */
class ColumnarWriter {
    Category category_;
    std::string output_directory_;
    WriterOptions options_;
    std::vector<MappedRecord> batch_;
    uint64_t batch_size_in_bytes_;
    uint64_t rows_written_;
    size_t max_observed_batch_size_;
    std::vector<std::string> segment_paths_;
    bool finished_;

public:
    //* \throws std::runtime_error if the compression is not supported or a size limit is zero.
    ColumnarWriter(const Category category, const std::string &output_directory, const WriterOptions &options);

    //* \throws FatalError if a segment could not be written.
    void add(const MappedRecord &mapped_record);

    /** \brief  Flushes the remaining records.  If no records were added at all, an empty segment is written.
     *  \return The paths of all segments in the order they were written.
     */
    const std::vector<std::string> &finish();

    inline uint64_t getRowsWritten() const { return rows_written_; }
    inline size_t getFlushCount() const { return segment_paths_.size(); }
    inline size_t getMaxObservedBatchSize() const { return max_observed_batch_size_; }
private:
    void flush();
};


//* \return E.g. "part-00042.parquet".
std::string GetSegmentName(const unsigned segment_no);


/** \brief  Reads a segment written by a ColumnarWriter.
 *  \throws FatalError if the file can't be read or does not match the schema of "category".
 */
std::vector<MappedRecord> ReadSegment(const std::string &path, const Category category);


} // namespace OLSync
