#include <gtest/gtest.h>

#include <stdexcept>

#include "include/record_io.hpp"
#include "include/temp_dir.hpp"
#include "test_utils.hpp"

using namespace linesort;
using namespace linesort::test;

class RecordIoTest : public ::testing::Test {
protected:
    TempDirectory dir;
};

TEST_F(RecordIoTest, ReadsLastRowWithoutSeparator) {
    write_text(dir.file("in.txt"), "a\nb\nc");
    RowBuffer rows;
    EXPECT_EQ(read_rows_from_file(dir.file("in.txt"), '\n', 16, rows), 3u);
    EXPECT_EQ(rows, (RowBuffer{"a", "b", "c"}));
}

TEST_F(RecordIoTest, TrailingSeparatorDoesNotAddARow) {
    write_text(dir.file("in.txt"), "a\nb\n");
    RowBuffer rows;
    EXPECT_EQ(read_rows_from_file(dir.file("in.txt"), '\n', 16, rows), 2u);
}

TEST_F(RecordIoTest, KeepsEmptyRows) {
    write_text(dir.file("in.txt"), "a\n\nb\n");
    RowBuffer rows;
    read_rows_from_file(dir.file("in.txt"), '\n', DEFAULT_IO_BUFFER_SIZE, rows);
    EXPECT_EQ(rows, (RowBuffer{"a", "", "b"}));
}

TEST_F(RecordIoTest, UsesCustomSeparator) {
    write_text(dir.file("in.txt"), "x;y\nz;w");
    RowBuffer rows;
    read_rows_from_file(dir.file("in.txt"), ';', 4, rows);
    EXPECT_EQ(rows, (RowBuffer{"x", "y\nz", "w"}));
}

TEST_F(RecordIoTest, ReadKeepsBufferCapacity) {
    write_text(dir.file("in.txt"), "1\n2\n3\n");
    RowBuffer rows;
    rows.reserve(100);
    rows.push_back("stale");
    read_rows_from_file(dir.file("in.txt"), '\n', 16, rows);
    EXPECT_EQ(rows.size(), 3u);
    EXPECT_GE(rows.capacity(), 100u);
}

TEST_F(RecordIoTest, WriterTerminatesEveryRow) {
    write_rows_to_file(dir.file("out.txt"), RowBuffer{"b", "", "a"}, '\n', 2);
    EXPECT_EQ(read_text(dir.file("out.txt")), "b\n\na\n");
}

TEST_F(RecordIoTest, WriterCountsRows) {
    LineWriter writer(dir.file("out.txt"), '|');
    writer.write("one");
    writer.write("two");
    writer.close();
    EXPECT_EQ(writer.rows_written(), 2u);
    EXPECT_EQ(read_text(dir.file("out.txt")), "one|two|");
}

TEST_F(RecordIoTest, ReaderStreamsRowsOneByOne) {
    write_text(dir.file("in.txt"), "first\nsecond\n");
    LineReader reader(dir.file("in.txt"), '\n', 3);
    Row row;
    ASSERT_TRUE(reader.next(row));
    EXPECT_EQ(row, "first");
    ASSERT_TRUE(reader.next(row));
    EXPECT_EQ(row, "second");
    EXPECT_FALSE(reader.next(row));
}

TEST_F(RecordIoTest, MissingFileThrows) {
    EXPECT_THROW(LineReader(dir.file("missing.txt"), '\n'), std::runtime_error);
}

TEST_F(RecordIoTest, UnwritablePathThrows) {
    EXPECT_THROW(LineWriter(dir.file("no/such/dir/out.txt"), '\n'), std::runtime_error);
}
