#ifndef LINESORT_RECORD_IO_HPP
#define LINESORT_RECORD_IO_HPP

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <vector>

#include "record.hpp"

namespace linesort {

constexpr size_t DEFAULT_IO_BUFFER_SIZE = 64 * 1024; // 64KB

/**
 * Sequential reader of separator-delimited rows with its own stream buffer.
 * A trailing record without separator is still returned as a row.
 */
class LineReader {
public:
    LineReader(const std::filesystem::path& path, char separator, size_t buffer_size = DEFAULT_IO_BUFFER_SIZE);

    LineReader(const LineReader&) = delete;
    LineReader& operator=(const LineReader&) = delete;

    // Reads the next row into row. Returns false at end of file, throws on read errors.
    bool next(Row& row);

private:
    std::vector<char> buffer_; // must outlive in_
    std::ifstream in_;
    std::filesystem::path path_;
    char separator_;
};

/**
 * Streaming writer, every row is followed by the separator.
 * Throws std::runtime_error as soon as the underlying stream fails.
 */
class LineWriter {
public:
    LineWriter(const std::filesystem::path& path, char separator, size_t buffer_size = DEFAULT_IO_BUFFER_SIZE);

    LineWriter(const LineWriter&) = delete;
    LineWriter& operator=(const LineWriter&) = delete;

    void write(const Row& row);

    // Flush and close, reporting failures (the destructor closes silently)
    void close();

    size_t rows_written() const { return rows_written_; }

private:
    std::vector<char> buffer_;
    std::ofstream out_;
    std::filesystem::path path_;
    char separator_;
    size_t rows_written_ = 0;
};

// Load all rows of a file into rows (cleared first, capacity kept). Returns the row count.
size_t read_rows_from_file(const std::filesystem::path& path, char separator, size_t buffer_size, RowBuffer& rows);

// Write rows to a file, each one terminated by the separator
void write_rows_to_file(const std::filesystem::path& path, const RowBuffer& rows, char separator, size_t buffer_size);

} // namespace linesort

#endif // LINESORT_RECORD_IO_HPP
