#ifndef LINESORT_CHUNK_SORT_HPP
#define LINESORT_CHUNK_SORT_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "../include/buffer_pool.hpp"
#include "../include/executor.hpp"
#include "../include/options.hpp"
#include "../include/progress.hpp"
#include "../include/record.hpp"
#include "../include/temp_dir.hpp"

namespace linesort {

// Name of the sorted chunk with the given sequence index
std::string sorted_chunk_name(size_t index);

// Stable in-memory sort of a row array
void sort_rows(RowBuffer& rows, const RowCompare& compare);

/**
 * Sorts every unsorted chunk independently, at most options.parallelism at a time.
 * Each worker leases a row buffer from a pool sized to max_rows_per_chunk,
 * writes <index>.sorted and deletes the unsorted chunk.
 */
class ChunkSorter {
public:
    ChunkSorter(const SortPhaseOptions& options, char separator, TaskExecutor& executor);

    // Returns the sorted chunks in the same (sequence) order as the input
    std::vector<ChunkFile> sort_chunks(const std::vector<ChunkFile>& unsorted_chunks,
                                       size_t max_rows_per_chunk,
                                       const TempDirectory& temp_dir,
                                       ProgressReporter& progress);

    // Buffers allocated by the pool of the last sort_chunks call
    size_t buffers_allocated() const { return buffers_allocated_; }

private:
    ChunkFile sort_chunk(const ChunkFile& chunk, RowBuffer& rows, const TempDirectory& temp_dir) const;

    const SortPhaseOptions& options_;
    char separator_;
    TaskExecutor& executor_;
    size_t buffers_allocated_ = 0;
};

} // namespace linesort

#endif // LINESORT_CHUNK_SORT_HPP
