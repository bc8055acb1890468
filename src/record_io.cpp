#include "include/record_io.hpp"

#include <stdexcept>
#include <string>

namespace linesort {

LineReader::LineReader(const std::filesystem::path& path, char separator, size_t buffer_size)
    : buffer_(buffer_size), path_(path), separator_(separator) {
    // the buffer has to be installed before the file is opened
    if (!buffer_.empty()) {
        in_.rdbuf()->pubsetbuf(buffer_.data(), static_cast<std::streamsize>(buffer_.size()));
    }
    in_.open(path, std::ios::binary);
    if (!in_.is_open()) {
        throw std::runtime_error("Failed to open file for reading: " + path.string());
    }
}

bool LineReader::next(Row& row) {
    if (std::getline(in_, row, separator_)) {
        return true;
    }
    if (in_.bad()) {
        throw std::runtime_error("Failed to read from file: " + path_.string());
    }
    return false;
}

LineWriter::LineWriter(const std::filesystem::path& path, char separator, size_t buffer_size)
    : buffer_(buffer_size), path_(path), separator_(separator) {
    if (!buffer_.empty()) {
        out_.rdbuf()->pubsetbuf(buffer_.data(), static_cast<std::streamsize>(buffer_.size()));
    }
    out_.open(path, std::ios::binary | std::ios::trunc);
    if (!out_.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + path.string());
    }
}

void LineWriter::write(const Row& row) {
    out_.write(row.data(), static_cast<std::streamsize>(row.size()));
    out_.put(separator_);
    if (!out_) {
        throw std::runtime_error("Failed to write to file: " + path_.string());
    }
    ++rows_written_;
}

void LineWriter::close() {
    if (!out_.is_open()) return;
    out_.flush();
    if (!out_) {
        throw std::runtime_error("Failed to flush file: " + path_.string());
    }
    out_.close();
    if (out_.fail()) {
        throw std::runtime_error("Failed to close file: " + path_.string());
    }
}

size_t read_rows_from_file(const std::filesystem::path& path, char separator, size_t buffer_size, RowBuffer& rows) {
    rows.clear();
    LineReader reader(path, separator, buffer_size);
    Row row;
    while (reader.next(row)) {
        rows.push_back(std::move(row));
        row.clear();
    }
    return rows.size();
}

void write_rows_to_file(const std::filesystem::path& path, const RowBuffer& rows, char separator, size_t buffer_size) {
    LineWriter writer(path, separator, buffer_size);
    for (const auto& row : rows) {
        writer.write(row);
    }
    writer.close();
}

} // namespace linesort
