/** \file   ColumnarWriter.cc
 *  \brief  Implementation of the Parquet segment writer and reader.
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
#include "ColumnarWriter.h"
#include <algorithm>
#include <cstdio>
#include <arrow/api.h>
#include <arrow/io/file.h>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/writer.h>
#include <parquet/properties.h>
#include "FileUtil.h"
#include "util.h"


namespace OLSync {


namespace {


void CheckStatus(const arrow::Status &status, const std::string &what) {
    if (unlikely(not status.ok()))
        throw FatalError(WRITING, what + ": " + status.ToString());
}


bool StringToCompression(const std::string &compression, parquet::Compression::type * const compression_type) {
    if (compression == "snappy")
        *compression_type = parquet::Compression::SNAPPY;
    else if (compression == "zstd")
        *compression_type = parquet::Compression::ZSTD;
    else if (compression == "gzip")
        *compression_type = parquet::Compression::GZIP;
    else if (compression == "none")
        *compression_type = parquet::Compression::UNCOMPRESSED;
    else
        return false;

    return true;
}


std::shared_ptr<arrow::DataType> GetArrowType(const ColumnType column_type) {
    switch (column_type) {
    case STRING:
        return arrow::utf8();
    case STRING_LIST:
        return arrow::list(arrow::utf8());
    case INT64:
        return arrow::int64();
    case TIMESTAMP:
        return arrow::timestamp(arrow::TimeUnit::MILLI, "UTC");
    }

    LOG_ERROR("unknown column type " + std::to_string(column_type) + "!");
}


std::shared_ptr<arrow::Schema> GetArrowSchema(const Category category) {
    std::vector<std::shared_ptr<arrow::Field>> fields;
    for (const auto &column_spec : GetSchema(category))
        fields.emplace_back(arrow::field(column_spec.name_, GetArrowType(column_spec.type_), /* nullable = */ not column_spec.required_));
    return std::make_shared<arrow::Schema>(fields);
}


std::shared_ptr<arrow::Array> BuildStringColumn(const std::vector<MappedRecord> &batch, const size_t column_index) {
    arrow::StringBuilder builder;
    for (const auto &mapped_record : batch) {
        const ColumnValue &value(mapped_record.values_[column_index]);
        CheckStatus(value.isNull() ? builder.AppendNull() : builder.Append(value.getText()), "appending a string");
    }

    std::shared_ptr<arrow::Array> array;
    CheckStatus(builder.Finish(&array), "finishing a string column");
    return array;
}


std::shared_ptr<arrow::Array> BuildStringListColumn(const std::vector<MappedRecord> &batch, const size_t column_index) {
    arrow::MemoryPool * const pool(arrow::default_memory_pool());
    arrow::ListBuilder list_builder(pool, std::make_shared<arrow::StringBuilder>(pool));
    auto * const string_builder(static_cast<arrow::StringBuilder *>(list_builder.value_builder()));

    for (const auto &mapped_record : batch) {
        const ColumnValue &value(mapped_record.values_[column_index]);
        if (value.isNull()) {
            CheckStatus(list_builder.AppendNull(), "appending a null list");
            continue;
        }

        CheckStatus(list_builder.Append(), "starting a list");
        for (const auto &element : value.getList())
            CheckStatus(string_builder->Append(element), "appending a list element");
    }

    std::shared_ptr<arrow::Array> array;
    CheckStatus(list_builder.Finish(&array), "finishing a list column");
    return array;
}


template<typename Builder> std::shared_ptr<arrow::Array> BuildNumericColumn(Builder * const builder,
                                                                            const std::vector<MappedRecord> &batch,
                                                                            const size_t column_index)
{
    for (const auto &mapped_record : batch) {
        const ColumnValue &value(mapped_record.values_[column_index]);
        CheckStatus(value.isNull() ? builder->AppendNull() : builder->Append(value.getNumber()), "appending a number");
    }

    std::shared_ptr<arrow::Array> array;
    CheckStatus(builder->Finish(&array), "finishing a numeric column");
    return array;
}


std::shared_ptr<arrow::Array> BuildColumn(const std::vector<MappedRecord> &batch, const size_t column_index,
                                          const ColumnSpec &column_spec)
{
    switch (column_spec.type_) {
    case STRING:
        return BuildStringColumn(batch, column_index);
    case STRING_LIST:
        return BuildStringListColumn(batch, column_index);
    case INT64: {
        arrow::Int64Builder builder;
        return BuildNumericColumn(&builder, batch, column_index);
    }
    case TIMESTAMP: {
        arrow::TimestampBuilder builder(GetArrowType(TIMESTAMP), arrow::default_memory_pool());
        return BuildNumericColumn(&builder, batch, column_index);
    }
    }

    LOG_ERROR("unknown column type " + std::to_string(column_spec.type_) + "!");
}


void WriteParquetFile(const arrow::Table &table, const std::string &path, const parquet::Compression::type compression) {
    auto output_result(arrow::io::FileOutputStream::Open(path));
    if (not output_result.ok())
        throw FatalError(WRITING, "can't open \"" + path + "\" for writing: " + output_result.status().ToString());
    std::shared_ptr<arrow::io::FileOutputStream> output(output_result.ValueOrDie());

    parquet::WriterProperties::Builder properties_builder;
    properties_builder.compression(compression);
    const std::shared_ptr<parquet::WriterProperties> properties(properties_builder.build());
    const std::shared_ptr<parquet::ArrowWriterProperties> arrow_properties(
        parquet::ArrowWriterProperties::Builder().store_schema()->build());

    const int64_t chunk_size(std::max<int64_t>(1, table.num_rows()));
    CheckStatus(parquet::arrow::WriteTable(table, arrow::default_memory_pool(), output, chunk_size, properties, arrow_properties),
                "writing \"" + path + "\"");
    CheckStatus(output->Close(), "closing \"" + path + "\"");
}


} // unnamed namespace


bool IsValidCompression(const std::string &compression) {
    parquet::Compression::type compression_type;
    return StringToCompression(compression, &compression_type);
}


std::string GetSegmentName(const unsigned segment_no) {
    char segment_name[64];
    std::snprintf(segment_name, sizeof segment_name, "part-%05u.parquet", segment_no);
    return segment_name;
}


ColumnarWriter::ColumnarWriter(const Category category, const std::string &output_directory, const WriterOptions &options)
    : category_(category), output_directory_(output_directory), options_(options), batch_size_in_bytes_(0), rows_written_(0),
      max_observed_batch_size_(0), finished_(false)
{
    if (not IsValidCompression(options_.compression_))
        throw std::runtime_error("in ColumnarWriter::ColumnarWriter: unsupported compression \"" + options_.compression_ + "\"!");
    if (options_.max_rows_per_segment_ == 0 or options_.max_bytes_per_segment_ == 0)
        throw std::runtime_error("in ColumnarWriter::ColumnarWriter: segment limits must be positive!");
}


void ColumnarWriter::add(const MappedRecord &mapped_record) {
    if (unlikely(finished_))
        throw std::runtime_error("in ColumnarWriter::add: called after finish()!");
    if (unlikely(mapped_record.category_ != category_))
        throw std::runtime_error("in ColumnarWriter::add: record of the wrong category!");

    batch_.emplace_back(mapped_record);
    batch_size_in_bytes_ += mapped_record.estimatedSize();
    max_observed_batch_size_ = std::max(max_observed_batch_size_, batch_.size());

    if (batch_.size() >= options_.max_rows_per_segment_ or batch_size_in_bytes_ >= options_.max_bytes_per_segment_)
        flush();
}


const std::vector<std::string> &ColumnarWriter::finish() {
    if (not finished_) {
        if (not batch_.empty() or segment_paths_.empty())
            flush();
        finished_ = true;
    }

    return segment_paths_;
}


void ColumnarWriter::flush() {
    CheckForCancellation(WRITING);

    const auto &schema(GetSchema(category_));
    std::vector<std::shared_ptr<arrow::Array>> arrays;
    for (size_t column_index(0); column_index < schema.size(); ++column_index)
        arrays.emplace_back(BuildColumn(batch_, column_index, schema[column_index]));
    const std::shared_ptr<arrow::Table> table(
        arrow::Table::Make(GetArrowSchema(category_), arrays, static_cast<int64_t>(batch_.size())));

    const std::string segment_path(output_directory_ + "/" + GetSegmentName(static_cast<unsigned>(segment_paths_.size())));
    const std::string temp_path(segment_path + ".tmp");
    FileUtil::AutoDeleteFile temp_file_deleter(temp_path);
    parquet::Compression::type compression_type(parquet::Compression::UNCOMPRESSED);
    StringToCompression(options_.compression_, &compression_type); // Validated by our constructor.
    WriteParquetFile(*table, temp_path, compression_type);
    if (not FileUtil::RenameFile(temp_path, segment_path))
        throw FatalError(WRITING, "can't rename \"" + temp_path + "\" to \"" + segment_path + "\"");
    temp_file_deleter.release();

    LOG_INFO("wrote " + std::to_string(batch_.size()) + " " + CategoryToString(category_) + " records to \"" + segment_path + "\"");
    segment_paths_.emplace_back(segment_path);
    rows_written_ += batch_.size();
    batch_.clear();
    batch_size_in_bytes_ = 0;
}


namespace {


template<typename ArrayType> void ReadNumericColumn(const arrow::ChunkedArray &chunked_array, const size_t column_index,
                                                    std::vector<MappedRecord> * const mapped_records)
{
    size_t row(0);
    for (const auto &chunk : chunked_array.chunks()) {
        const auto &numbers(static_cast<const ArrayType &>(*chunk));
        for (int64_t i(0); i < numbers.length(); ++i, ++row)
            (*mapped_records)[row].values_[column_index] = numbers.IsNull(i) ? ColumnValue::Null() : ColumnValue::Number(numbers.Value(i));
    }
}


void ReadStringColumn(const arrow::ChunkedArray &chunked_array, const size_t column_index,
                      std::vector<MappedRecord> * const mapped_records)
{
    size_t row(0);
    for (const auto &chunk : chunked_array.chunks()) {
        const auto &strings(static_cast<const arrow::StringArray &>(*chunk));
        for (int64_t i(0); i < strings.length(); ++i, ++row)
            (*mapped_records)[row].values_[column_index] = strings.IsNull(i) ? ColumnValue::Null() : ColumnValue::Text(strings.GetString(i));
    }
}


void ReadStringListColumn(const arrow::ChunkedArray &chunked_array, const size_t column_index,
                          std::vector<MappedRecord> * const mapped_records)
{
    size_t row(0);
    for (const auto &chunk : chunked_array.chunks()) {
        const auto &lists(static_cast<const arrow::ListArray &>(*chunk));
        const auto &elements(static_cast<const arrow::StringArray &>(*lists.values()));
        for (int64_t i(0); i < lists.length(); ++i, ++row) {
            if (lists.IsNull(i)) {
                (*mapped_records)[row].values_[column_index] = ColumnValue::Null();
                continue;
            }

            std::vector<std::string> list;
            for (int64_t j(lists.value_offset(i)); j < lists.value_offset(i) + lists.value_length(i); ++j)
                list.emplace_back(elements.GetString(j));
            (*mapped_records)[row].values_[column_index] = ColumnValue::List(list);
        }
    }
}


} // unnamed namespace


std::vector<MappedRecord> ReadSegment(const std::string &path, const Category category) {
    auto input_result(arrow::io::ReadableFile::Open(path));
    if (not input_result.ok())
        throw FatalError(WRITING, "can't open \"" + path + "\": " + input_result.status().ToString());

    parquet::arrow::FileReaderBuilder reader_builder;
    CheckStatus(reader_builder.Open(input_result.ValueOrDie()), "opening \"" + path + "\"");
    std::unique_ptr<parquet::arrow::FileReader> reader;
    CheckStatus(reader_builder.Build(&reader), "creating a reader for \"" + path + "\"");
    std::shared_ptr<arrow::Table> table;
    CheckStatus(reader->ReadTable(&table), "reading \"" + path + "\"");

    const auto &schema(GetSchema(category));
    if (static_cast<size_t>(table->num_columns()) != schema.size())
        throw FatalError(WRITING, "\"" + path + "\" has " + std::to_string(table->num_columns()) + " columns, expected "
                         + std::to_string(schema.size()));

    std::vector<MappedRecord> mapped_records(static_cast<size_t>(table->num_rows()), MappedRecord(category));
    for (size_t column_index(0); column_index < schema.size(); ++column_index) {
        const auto &field(table->schema()->field(static_cast<int>(column_index)));
        if (field->name() != schema[column_index].name_ or not field->type()->Equals(GetArrowType(schema[column_index].type_)))
            throw FatalError(WRITING, "column " + std::to_string(column_index) + " of \"" + path + "\" does not match the "
                             + CategoryToString(category) + " schema");

        const arrow::ChunkedArray &chunked_array(*table->column(static_cast<int>(column_index)));
        switch (schema[column_index].type_) {
        case STRING:
            ReadStringColumn(chunked_array, column_index, &mapped_records);
            break;
        case STRING_LIST:
            ReadStringListColumn(chunked_array, column_index, &mapped_records);
            break;
        case INT64:
            ReadNumericColumn<arrow::Int64Array>(chunked_array, column_index, &mapped_records);
            break;
        case TIMESTAMP:
            ReadNumericColumn<arrow::TimestampArray>(chunked_array, column_index, &mapped_records);
            break;
        }
    }

    return mapped_records;
}


} // namespace OLSync
