#include "chunk_sort.hpp"

#include <algorithm>
#include <atomic>
#include <filesystem>

#include "../include/record_io.hpp"

namespace fs = std::filesystem;

namespace linesort {

std::string sorted_chunk_name(size_t index) {
    return std::to_string(index) + ".sorted";
}

void sort_rows(RowBuffer& rows, const RowCompare& compare) {
    std::stable_sort(rows.begin(), rows.end(), compare);
}

ChunkSorter::ChunkSorter(const SortPhaseOptions& options, char separator, TaskExecutor& executor)
    : options_(options), separator_(separator), executor_(executor) {}

ChunkFile ChunkSorter::sort_chunk(const ChunkFile& chunk, RowBuffer& rows, const TempDirectory& temp_dir) const {
    read_rows_from_file(chunk.path, separator_, options_.input_buffer_size, rows);
    sort_rows(rows, options_.compare);

    const fs::path sorted_path = temp_dir.file(sorted_chunk_name(chunk.index));
    write_rows_to_file(sorted_path, rows, separator_, options_.output_buffer_size);

    ChunkFile sorted{
        .index = chunk.index,
        .path  = sorted_path,
        .bytes = fs::file_size(sorted_path),
        .rows  = rows.size()
    };

    // the unsorted chunk is fully consumed once its sorted copy is on disk
    fs::remove(chunk.path);
    return sorted;
}

std::vector<ChunkFile> ChunkSorter::sort_chunks(const std::vector<ChunkFile>& unsorted_chunks,
                                                size_t max_rows_per_chunk,
                                                const TempDirectory& temp_dir,
                                                ProgressReporter& progress) {
    std::vector<ChunkFile> sorted_chunks(unsorted_chunks.size());
    if (unsorted_chunks.empty()) {
        progress.complete();
        return sorted_chunks;
    }

    RowBufferPool pool(std::max<size_t>(max_rows_per_chunk, 1), options_.parallelism);
    std::atomic<size_t> completed{0};
    const double total = static_cast<double>(unsorted_chunks.size());

    executor_.run(unsorted_chunks.size(), options_.parallelism, [&](size_t i) {
        {
            auto lease = pool.lease();
            // slot i keeps the sequence order whatever the completion order
            sorted_chunks[i] = sort_chunk(unsorted_chunks[i], lease.rows(), temp_dir);
        }
        const size_t done = completed.fetch_add(1) + 1;
        progress.report(static_cast<double>(done) / total);
    });

    buffers_allocated_ = pool.allocated();
    progress.complete();
    return sorted_chunks;
}

} // namespace linesort
