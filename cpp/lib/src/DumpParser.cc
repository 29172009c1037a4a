/** \file   DumpParser.cc
 *  \brief  Implementation of the dump file parser.
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
#include "DumpParser.h"
#include <cstring>
#include "util.h"


namespace OLSync {


constexpr size_t GzippedLineReader::BUFFER_SIZE;
constexpr uint64_t DumpRecordProducer::CANCELLATION_CHECK_INTERVAL;


GzippedLineReader::GzippedLineReader(const std::string &path)
    : path_(path), input_(path, std::ios::binary), gz_stream_(GzStream::GUNZIP), compressed_buffer_(BUFFER_SIZE),
      decompressed_buffer_(BUFFER_SIZE), compressed_start_(0), compressed_end_(0), decompressed_start_(0), decompressed_end_(0),
      input_exhausted_(false), in_member_(false), line_no_(0)
{
    if (not input_)
        throw std::runtime_error("in GzippedLineReader::GzippedLineReader: can't open \"" + path_ + "\" for reading!");
}


bool GzippedLineReader::refillCompressedBuffer() {
    if (input_exhausted_)
        return false;

    input_.read(compressed_buffer_.data(), static_cast<std::streamsize>(compressed_buffer_.size()));
    if (input_.bad())
        throw std::runtime_error("in GzippedLineReader::refillCompressedBuffer: read error on \"" + path_ + "\"!");

    compressed_start_ = 0;
    compressed_end_ = static_cast<size_t>(input_.gcount());
    if (compressed_end_ == 0) {
        input_exhausted_ = true;
        return false;
    }

    return true;
}


bool GzippedLineReader::fillDecompressedBuffer() {
    unsigned bytes_consumed, bytes_produced;
    for (;;) {
        if (compressed_start_ == compressed_end_ and not refillCompressedBuffer()) {
            if (not in_member_)
                return false;

            // zlib may still be holding output for us.  If it can't make progress the file is truncated.
            try {
                const bool more(gz_stream_.decompress(compressed_buffer_.data(), 0, decompressed_buffer_.data(),
                                                      static_cast<unsigned>(decompressed_buffer_.size()), &bytes_consumed,
                                                      &bytes_produced));
                if (not more)
                    in_member_ = false;
            } catch (const std::runtime_error &) {
                throw std::runtime_error("in GzippedLineReader::fillDecompressedBuffer: \"" + path_ + "\" is truncated!");
            }
            if (bytes_produced == 0 and in_member_)
                throw std::runtime_error("in GzippedLineReader::fillDecompressedBuffer: \"" + path_ + "\" is truncated!");
        } else {
            in_member_ = true;
            const bool more(gz_stream_.decompress(compressed_buffer_.data() + compressed_start_,
                                                  static_cast<unsigned>(compressed_end_ - compressed_start_),
                                                  decompressed_buffer_.data(), static_cast<unsigned>(decompressed_buffer_.size()),
                                                  &bytes_consumed, &bytes_produced));
            compressed_start_ += bytes_consumed;
            if (not more) { // End of a gzip member.  Another one may follow.
                in_member_ = false;
                gz_stream_.reset();
            }
        }

        if (bytes_produced > 0) {
            decompressed_start_ = 0;
            decompressed_end_ = bytes_produced;
            return true;
        }
    }
}


bool GzippedLineReader::getLine(std::string * const line) {
    line->clear();
    bool seen_any_data(false);
    for (;;) {
        if (decompressed_start_ == decompressed_end_ and not fillDecompressedBuffer()) {
            if (not seen_any_data)
                return false;
            ++line_no_; // Last line w/o a terminating newline.
            return true;
        }

        seen_any_data = true;
        const char * const start(decompressed_buffer_.data() + decompressed_start_);
        const size_t available(decompressed_end_ - decompressed_start_);
        const char * const newline(reinterpret_cast<const char *>(std::memchr(start, '\n', available)));
        if (newline != nullptr) {
            line->append(start, newline - start);
            decompressed_start_ += (newline - start) + 1;
            ++line_no_;
            return true;
        }

        line->append(start, available);
        decompressed_start_ = decompressed_end_;
    }
}


bool ParseDumpLine(const std::string &line, RawRecord * const raw_record) {
    std::vector<std::string> columns;
    size_t column_start(0);
    for (;;) {
        const size_t tab_pos(line.find('\t', column_start));
        if (tab_pos == std::string::npos) {
            columns.emplace_back(line.substr(column_start));
            break;
        }
        columns.emplace_back(line.substr(column_start, tab_pos - column_start));
        column_start = tab_pos + 1;
    }
    if (columns.size() != 5)
        return false;

    nlohmann::json json_obj(nlohmann::json::parse(columns[4], nullptr, /* allow_exceptions = */ false));
    if (json_obj.is_discarded() or not json_obj.is_object())
        return false;

    raw_record->type_ = columns[0];
    raw_record->key_ = columns[1];
    raw_record->revision_ = columns[2];
    raw_record->last_modified_ = columns[3];
    raw_record->json_ = std::move(json_obj);

    return true;
}


DumpRecordProducer::DumpRecordProducer(const std::string &path, const std::string &expected_type_tag)
    : line_reader_(path), expected_type_tag_(expected_type_tag)
{
}


bool DumpRecordProducer::next(RawRecord * const raw_record) {
    std::string line;
    for (;;) {
        try {
            if (not line_reader_.getLine(&line))
                return false;
        } catch (const std::runtime_error &x) {
            throw FatalError(PARSING, x.what());
        }

        ++statistics_.lines_read_;
        if (line_reader_.getLineNo() % CANCELLATION_CHECK_INTERVAL == 0)
            CheckForCancellation(PARSING);

        if (not ParseDumpLine(line, raw_record)) {
            ++statistics_.malformed_count_;
            LOG_DEBUG("skipping malformed line " + std::to_string(line_reader_.getLineNo()));
            continue;
        }

        if (not expected_type_tag_.empty() and raw_record->type_ != expected_type_tag_) {
            ++statistics_.foreign_count_;
            continue;
        }

        raw_record->line_no_ = line_reader_.getLineNo();
        return true;
    }
}


std::unique_ptr<DumpRecordProducer> Parse(const std::string &local_path, const Category category) {
    try {
        return std::unique_ptr<DumpRecordProducer>(new DumpRecordProducer(local_path, GetTypeTag(category)));
    } catch (const std::runtime_error &x) {
        throw FatalError(PARSING, x.what());
    }
}


} // namespace OLSync
