/** \brief Test cases for ColumnarWriter
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
#include <string>
#include <vector>
#include "ColumnarWriter.h"
#include "FileUtil.h"
#include "SchemaMapper.h"
#include "SyncTypes.h"
#include "UnitTest.h"


static OLSync::MappedRecord MakeWork(const unsigned work_no) {
    OLSync::MappedRecord mapped_record(OLSync::WORKS);
    mapped_record.setValue("key", OLSync::ColumnValue::Text("/works/OL" + std::to_string(work_no) + "W"));
    mapped_record.setValue("title", OLSync::ColumnValue::Text("Title " + std::to_string(work_no)));
    mapped_record.setValue("revision", OLSync::ColumnValue::Number(work_no % 7));
    mapped_record.setValue("subjects", OLSync::ColumnValue::List({ "Fiction", "Subject " + std::to_string(work_no) }));
    return mapped_record;
}


static std::vector<OLSync::MappedRecord> ReadAllSegments(const std::vector<std::string> &segment_paths) {
    std::vector<OLSync::MappedRecord> mapped_records;
    for (const auto &segment_path : segment_paths) {
        const std::vector<OLSync::MappedRecord> segment_records(OLSync::ReadSegment(segment_path, OLSync::WORKS));
        mapped_records.insert(mapped_records.end(), segment_records.cbegin(), segment_records.cend());
    }
    return mapped_records;
}


TEST(BatchesAreBoundedByRowCount) {
    const FileUtil::AutoTempDirectory temp_directory("/tmp/ColumnarWriterTest");
    OLSync::ColumnarWriter columnar_writer(OLSync::WORKS, temp_directory.getDirectoryPath(),
                                           OLSync::WriterOptions(100, 1024 * 1024 * 1024, "snappy"));
    for (unsigned work_no(0); work_no < 1050; ++work_no)
        columnar_writer.add(MakeWork(work_no));
    const std::vector<std::string> segment_paths(columnar_writer.finish());

    CHECK_EQ(columnar_writer.getRowsWritten(), 1050u);
    CHECK_EQ(segment_paths.size(), 11u);
    CHECK_EQ(columnar_writer.getFlushCount(), 11u);
    CHECK_LE(columnar_writer.getMaxObservedBatchSize(), 100u);
    CHECK_EQ(FileUtil::GetBasename(segment_paths[10]), "part-00010.parquet");

    const std::vector<OLSync::MappedRecord> mapped_records(ReadAllSegments(segment_paths));
    CHECK_EQ(mapped_records.size(), 1050u);
    CHECK_EQ(mapped_records[0].getValue("key").getText(), "/works/OL0W");
    CHECK_EQ(mapped_records[1049].getValue("key").getText(), "/works/OL1049W");
    CHECK_TRUE(OLSync::ReadSegment(segment_paths[10], OLSync::WORKS).size() == 50u);
}


TEST(BatchesAreBoundedByEstimatedSize) {
    const uint64_t record_size(MakeWork(1).estimatedSize());
    const FileUtil::AutoTempDirectory temp_directory("/tmp/ColumnarWriterTest");
    OLSync::ColumnarWriter columnar_writer(OLSync::WORKS, temp_directory.getDirectoryPath(),
                                           OLSync::WriterOptions(1000000, 10 * record_size, "zstd"));
    for (unsigned work_no(0); work_no < 500; ++work_no)
        columnar_writer.add(MakeWork(work_no));
    columnar_writer.finish();

    CHECK_EQ(columnar_writer.getRowsWritten(), 500u);
    CHECK_LE(columnar_writer.getMaxObservedBatchSize(), 11u);
    CHECK_GE(columnar_writer.getFlushCount(), 45u);
}


TEST(ValuesAndNullsSurviveARoundTrip) {
    OLSync::MappedRecord full_record(OLSync::WORKS);
    full_record.setValue("key", OLSync::ColumnValue::Text("/works/OL1W"));
    full_record.setValue("title", OLSync::ColumnValue::Text("Kafka am Strand"));
    full_record.setValue("subtitle", OLSync::ColumnValue::Text(""));
    full_record.setValue("author_keys", OLSync::ColumnValue::List({ "/authors/OL1A", "/authors/OL2A" }));
    full_record.setValue("subjects", OLSync::ColumnValue::List({}));
    full_record.setValue("first_publish_date", OLSync::ColumnValue::Text("2002"));
    full_record.setValue("description", OLSync::ColumnValue::Text("Über Katzen und Zeit."));
    full_record.setValue("covers", OLSync::ColumnValue::List({ "12345" }));
    full_record.setValue("revision", OLSync::ColumnValue::Number(-3));
    full_record.setValue("created", OLSync::ColumnValue::Number(1199145600000LL));
    full_record.setValue("last_modified", OLSync::ColumnValue::Number(1643767322500LL));

    OLSync::MappedRecord sparse_record(OLSync::WORKS);
    sparse_record.setValue("key", OLSync::ColumnValue::Text("/works/OL2W"));

    const FileUtil::AutoTempDirectory temp_directory("/tmp/ColumnarWriterTest");
    OLSync::ColumnarWriter columnar_writer(OLSync::WORKS, temp_directory.getDirectoryPath(), OLSync::WriterOptions());
    columnar_writer.add(full_record);
    columnar_writer.add(sparse_record);
    const std::vector<std::string> segment_paths(columnar_writer.finish());
    CHECK_EQ(segment_paths.size(), 1u);

    const std::vector<OLSync::MappedRecord> mapped_records(ReadAllSegments(segment_paths));
    CHECK_EQ(mapped_records.size(), 2u);
    CHECK_TRUE(mapped_records[0] == full_record);
    CHECK_TRUE(mapped_records[1] == sparse_record);
    CHECK_TRUE(mapped_records[1].getValue("covers").isNull());
    CHECK_FALSE(mapped_records[0].getValue("subjects").isNull());
}


TEST(EmptyInputYieldsOneEmptySegment) {
    const FileUtil::AutoTempDirectory temp_directory("/tmp/ColumnarWriterTest");
    OLSync::ColumnarWriter columnar_writer(OLSync::WORKS, temp_directory.getDirectoryPath(), OLSync::WriterOptions());
    const std::vector<std::string> segment_paths(columnar_writer.finish());

    CHECK_EQ(segment_paths.size(), 1u);
    CHECK_EQ(columnar_writer.getRowsWritten(), 0u);
    CHECK_TRUE(OLSync::ReadSegment(segment_paths[0], OLSync::WORKS).empty());
    CHECK_FALSE(FileUtil::Exists(segment_paths[0] + ".tmp"));
}


TEST(SegmentsOfAnotherCategoryAreRejected) {
    const FileUtil::AutoTempDirectory temp_directory("/tmp/ColumnarWriterTest");
    OLSync::ColumnarWriter columnar_writer(OLSync::WORKS, temp_directory.getDirectoryPath(), OLSync::WriterOptions());
    columnar_writer.add(MakeWork(1));
    const std::vector<std::string> segment_paths(columnar_writer.finish());

    CHECK_THROWS(OLSync::ReadSegment(segment_paths[0], OLSync::EDITIONS), OLSync::FatalError);
}


TEST(InvalidOptionsAreRejected) {
    CHECK_TRUE(OLSync::IsValidCompression("gzip"));
    CHECK_FALSE(OLSync::IsValidCompression("lzma"));
    CHECK_THROWS(OLSync::ColumnarWriter(OLSync::WORKS, "/tmp", OLSync::WriterOptions(100, 100, "lzma")), std::runtime_error);
    CHECK_THROWS(OLSync::ColumnarWriter(OLSync::WORKS, "/tmp", OLSync::WriterOptions(0, 100, "none")), std::runtime_error);
}


TEST_MAIN(ColumnarWriter)
