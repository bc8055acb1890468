#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "chunking.hpp"

namespace fs = std::filesystem;

namespace linesort {

std::string unsorted_chunk_name(size_t index) {
    return std::to_string(index) + ".unsorted";
}

size_t count_rows(const char* data, size_t size, char separator) {
    if (size == 0) return 0;
    size_t rows = static_cast<size_t>(std::count(data, data + size, separator));
    if (data[size - 1] != separator) ++rows;
    return rows;
}

namespace {

void write_chunk(const fs::path& path,
                 const std::vector<char>& buffer,
                 size_t buffer_bytes,
                 const std::vector<char>& overflow,
                 size_t write_buffer_size) {
    std::vector<char> stream_buffer(write_buffer_size);
    std::ofstream out;
    out.rdbuf()->pubsetbuf(stream_buffer.data(), static_cast<std::streamsize>(stream_buffer.size()));
    out.open(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("Failed to open output chunk file: " + path.string());
    }

    out.write(buffer.data(), static_cast<std::streamsize>(buffer_bytes));
    if (!overflow.empty()) {
        out.write(overflow.data(), static_cast<std::streamsize>(overflow.size()));
    }
    out.close();
    if (!out) {
        throw std::runtime_error("Failed to write chunk file: " + path.string());
    }
}

} // namespace

SplitResult split_into_chunks(std::istream& input,
                              uint64_t total_bytes,
                              const SplitOptions& options,
                              const TempDirectory& temp_dir,
                              const CancellationToken& token,
                              ProgressReporter& progress) {
    if (options.chunk_size_bytes == 0) {
        throw std::invalid_argument("Chunk size must be greater than zero");
    }

    SplitResult result;
    std::vector<char> buffer(options.chunk_size_bytes);
    std::vector<char> overflow;
    uint64_t bytes_consumed = 0;

    while (true) {
        token.throw_if_cancelled();

        input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const size_t bytes_read = static_cast<size_t>(input.gcount());
        if (input.bad()) {
            throw std::runtime_error("Failed to read input stream");
        }
        if (bytes_read == 0) break;

        // Alignment: the chunk ends on a separator or at end of input
        overflow.clear();
        if (buffer[bytes_read - 1] != options.separator) {
            char c;
            while (input.get(c)) {
                overflow.push_back(c);
                if (c == options.separator) break;
            }
            if (input.bad()) {
                throw std::runtime_error("Failed to read input stream");
            }
        }

        const size_t index = result.chunks.size() + 1;
        const fs::path chunk_path = temp_dir.file(unsorted_chunk_name(index));
        write_chunk(chunk_path, buffer, bytes_read, overflow, options.output_buffer_size);

        size_t rows = count_rows(buffer.data(), bytes_read, options.separator);
        if (!overflow.empty()) {
            // the buffer's last record continues in the overflow and was already counted once
            rows += count_rows(overflow.data(), overflow.size(), options.separator) - 1;
        }
        result.max_rows_per_chunk = std::max(result.max_rows_per_chunk, rows);

        const uint64_t chunk_bytes = bytes_read + overflow.size();
        result.chunks.push_back({
            .index = index,
            .path  = chunk_path,
            .bytes = chunk_bytes,
            .rows  = rows
        });

        bytes_consumed += chunk_bytes;
        if (total_bytes > 0) {
            progress.report(static_cast<double>(bytes_consumed) / static_cast<double>(total_bytes));
        }
    }

    progress.complete();
    return result;
}

SplitResult split_file_into_chunks(const fs::path& input_file,
                                   const SplitOptions& options,
                                   const TempDirectory& temp_dir,
                                   const CancellationToken& token,
                                   ProgressReporter& progress) {
    std::ifstream in(input_file, std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open input file: " + input_file.string());
    }
    const uint64_t total_bytes = fs::file_size(input_file);
    return split_into_chunks(in, total_bytes, options, temp_dir, token, progress);
}

} // namespace linesort
