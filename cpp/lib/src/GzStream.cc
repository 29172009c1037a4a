/** \file    GzStream.cc
 *  \brief   Implementation of class GzStream.
 *  \author  Dr. Johannes Ruscheinski
 *  \author  Dr. Gordon W. Paynter
 *
 *  \copyright 2002-2009 Project iVia.
 *  \copyright 2002-2009 The Regents of The University of California.
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
#include "GzStream.h"
#include <cstring>
#include "util.h"


GzStream::GzStream(const Type type, const unsigned compression_level): type_(type) {
    std::memset(&stream_, '\0', sizeof stream_);

    if (type_ == COMPRESS or type == GZIP) {
        const int retcode(::deflateInit2(&stream_, static_cast<int>(compression_level), Z_DEFLATED,
                                         /* windowBits = */ type == COMPRESS ? 15 : (15 + 16),
                                         /* Max. memLevel for highest speed = */ 9, Z_DEFAULT_STRATEGY));
        switch (retcode) {
        case Z_STREAM_ERROR:
            throw std::runtime_error("GzStream::GzStream: invalid compression level (should be >= 1 and <= 9)!");
        case Z_MEM_ERROR:
            ::deflateEnd(&stream_);
            throw std::runtime_error("GzStream::GzStream: not enough memory for deflation!");
        case Z_VERSION_ERROR:
            throw std::runtime_error("GzStream::GzStream: invalid library version for deflation!");
        case Z_OK:
            return;
        default:
            throw std::runtime_error("in GzStream::GzStream: unknown error code " + std::to_string(retcode) + " for deflateInit2()!");
        }
    } else { // assume type_ == DECOMPRESS or type == GUNZIP
        const int retcode(::inflateInit2(&stream_, /* windowBits = */ type == DECOMPRESS ? 15 : (15 + 16)));
        switch (retcode) {
        case Z_MEM_ERROR:
            ::inflateEnd(&stream_);
            throw std::runtime_error("GzStream::GzStream: not enough memory for inflation!");
        case Z_VERSION_ERROR:
            throw std::runtime_error("GzStream::GzStream: invalid library version for inflation!");
        case Z_OK:
            return;
        default:
            throw std::runtime_error("in GzStream::GzStream: unknown error code " + std::to_string(retcode) + " for inflateInit2()!");
        }
    }
}


GzStream::~GzStream() {
    if (type_ == COMPRESS or type_ == GZIP)
        ::deflateEnd(&stream_);
    else
        ::inflateEnd(&stream_);
}


bool GzStream::compress(const char * const input_data, unsigned input_data_size, char * const output_data, unsigned output_data_size,
                        unsigned * const bytes_consumed, unsigned * const bytes_produced) {
    stream_.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(input_data));
    stream_.avail_in = (input_data == nullptr) ? 0 : input_data_size;
    stream_.next_out = reinterpret_cast<Bytef *>(output_data);
    stream_.avail_out = output_data_size;
    const int flush((input_data == nullptr) ? Z_FINISH : Z_NO_FLUSH);
    const int retval(::deflate(&stream_, flush));
    *bytes_consumed = ((input_data == nullptr) ? 0 : input_data_size) - stream_.avail_in;
    *bytes_produced = output_data_size - stream_.avail_out;

    switch (retval) {
    case Z_OK:
        return true;
    case Z_STREAM_END:
        return false;
    case Z_STREAM_ERROR:
        throw std::runtime_error("in GzStream::compress: inconsistent stream state!");
    case Z_BUF_ERROR:
        throw std::runtime_error("in GzStream::compress: no progress possible!");
    }

    throw std::runtime_error("in GzStream::compress: we should *never* get here (return code = " + std::to_string(retval) + ")!");
}


bool GzStream::decompress(const char * const input_data, unsigned input_data_size, char * const output_data,
                          unsigned output_data_size, unsigned * const bytes_consumed, unsigned * const bytes_produced) {
    stream_.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(input_data));
    stream_.avail_in = (input_data == nullptr) ? 0 : input_data_size;
    stream_.next_out = reinterpret_cast<Bytef *>(output_data);
    stream_.avail_out = output_data_size;
    const int flush((input_data == nullptr) ? Z_FINISH : Z_NO_FLUSH);
    const int retval(::inflate(&stream_, flush));
    *bytes_consumed = ((input_data == nullptr) ? 0 : input_data_size) - stream_.avail_in;
    *bytes_produced = output_data_size - stream_.avail_out;

    switch (retval) {
    case Z_OK:
        return true;
    case Z_STREAM_END:
        return false;
    case Z_NEED_DICT:
    case Z_DATA_ERROR:
        throw std::runtime_error("in GzStream::decompress: invalid or corrupt compressed data! ("
                                 + std::string(stream_.msg == nullptr ? "no details" : stream_.msg) + ")");
    case Z_MEM_ERROR:
        throw std::runtime_error("in GzStream::decompress: out of memory!");
    case Z_STREAM_ERROR:
        throw std::runtime_error("in GzStream::decompress: inconsistent stream state!");
    case Z_BUF_ERROR:
        throw std::runtime_error("in GzStream::decompress: no progress possible!");
    }

    throw std::runtime_error("in GzStream::decompress: we should *never* get here (return code = " + std::to_string(retval) + ")!");
}


void GzStream::reset() {
    if (unlikely(type_ != DECOMPRESS and type_ != GUNZIP))
        throw std::runtime_error("in GzStream::reset: only decompressing streams can be reset!");
    if (unlikely(::inflateReset(&stream_) != Z_OK))
        throw std::runtime_error("in GzStream::reset: inflateReset() failed!");
}


std::string GzStream::CompressString(const std::string &input, const Type type) {
    if (unlikely(type != GzStream::COMPRESS and type != GzStream::GZIP))
        throw std::runtime_error("in GzStream::CompressString: type must be either GzStream::COMPRESS or GzStream::GZIP!");

    std::string compressed_output;
    GzStream stream(type);
    const size_t input_length(input.length());
    char compressed_data[10000];
    unsigned bytes_consumed, bytes_produced;
    size_t total_processed(0);

    while (total_processed < input_length) {
        stream.compress(input.c_str() + total_processed, static_cast<unsigned>(input_length - total_processed), compressed_data,
                        sizeof(compressed_data), &bytes_consumed, &bytes_produced);
        compressed_output.append(compressed_data, bytes_produced);
        total_processed += bytes_consumed;
    }

    // Flush whatever is still buffered:
    bool more(true);
    while (more) {
        more = stream.compress(nullptr, 0, compressed_data, sizeof(compressed_data), &bytes_consumed, &bytes_produced);
        compressed_output.append(compressed_data, bytes_produced);
    }

    return compressed_output;
}
