/** \file    GzStream.h
 *  \brief   A thin wrapper around the low-level facilities of zlib.
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
#pragma once


#include <stdexcept>
#include <string>
#include <zlib.h>


#ifdef GZIP
#undef GZIP
#endif
#ifdef GUNZIP
#undef GUNZIP
#endif


/** \class  GzStream
 *  \brief  A wrapper around the low-level facilities of zlib.
 */
class GzStream {
    z_stream stream_;

public:
    enum Type { COMPRESS, DECOMPRESS, GZIP, GUNZIP };

private:
    Type type_;

public:
    explicit GzStream(const Type type, const unsigned compression_level = 9);
    GzStream(const GzStream &rhs) = delete;
    GzStream &operator=(const GzStream &rhs) = delete;
    ~GzStream();

    /** \brief  Compresses bytes taken from "input_data" and deposits the compressed output into "output_data".
     *  \param  input_data       The data that are to be compressed.
     *  \param  input_data_size  The size of "input_data" to be processed.
     *  \param  output_data      Where to put the compressed data.
     *  \param  output_data_size The available space in "output_data".
     *  \param  bytes_consumed   The actual number for bytes from "input_data" that have been compressed.
     *  \param  bytes_produced   The length of the compressed output "output_data" actually used.
     *  \return Returns true if more compressed data can be retrieved and false otherwise.
     *  \note   After passing in all data to be compressed you must call "compress" with "input_data" set to
     *          nullptr and retrieve "output_data" until "compress" returns false.
     */
    bool compress(const char * const input_data, unsigned input_data_size, char * const output_data, unsigned output_data_size,
                  unsigned * const bytes_consumed, unsigned * const bytes_produced);

    /** \brief  Decompresses bytes taken from "input_data" and deposits the decompressed output into "output_data."
     *  \return Returns false when the end of the current compressed stream (gzip member) has been reached, else true.
     *  \throws std::runtime_error if the input is not valid compressed data.
     */
    bool decompress(const char * const input_data, unsigned input_data_size, char * const output_data, unsigned output_data_size,
                    unsigned * const bytes_consumed, unsigned * const bytes_produced);

    //* \brief Prepares a decompressing stream for the next gzip member of a multi-member file.
    void reset();

    /** \brief   Compress a string.
     *  \param   input  The string to compress.
     *  \param   type   Must be either COMPRESS or GZIP.
     *  \return  The compressed string.
     */
    static std::string CompressString(const std::string &input, const Type type = COMPRESS);
};
