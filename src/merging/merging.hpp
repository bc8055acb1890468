#ifndef LINESORT_MERGING_HPP
#define LINESORT_MERGING_HPP

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "../include/cancellation.hpp"
#include "../include/executor.hpp"
#include "../include/options.hpp"
#include "../include/progress.hpp"
#include "../include/record.hpp"
#include "../include/temp_dir.hpp"

namespace linesort {

/**
 * Merges multiple sorted files into a single sorted output file.
 *
 * One reader and one RowCursor per input; the smallest cursor is picked from a
 * binary heap. Equal rows are written in input-file order. The token is checked
 * before every row written.
 *
 * @param sorted_files Sorted input files, in sequence order
 * @param output_file Created or truncated
 * @return Number of rows written
 */
size_t merge_sorted_files(const std::vector<std::filesystem::path>& sorted_files,
                          const std::filesystem::path& output_file,
                          const RowCompare& compare,
                          char separator,
                          const MergeOptions& options,
                          const CancellationToken& token);

// Name of a chunk produced by a merge pass
std::string merge_chunk_name(size_t position, const std::string& pass_token);

/**
 * Progress denominator for the merge phase: chunk_count plus the successive
 * quotients chunk_count / fan_in, / fan_in ... until the quotient is zero.
 * An approximation of the chunks materialised over all passes.
 */
size_t estimate_total_chunks(size_t chunk_count, size_t fan_in);

// Move a file, falling back to copy + remove across filesystems
void move_file(const std::filesystem::path& from, const std::filesystem::path& to);

/**
 * Iterative k-way merge: groups of fan_in consecutive chunks are merged pass
 * after pass (groups of a pass run concurrently, at most fan_in at a time)
 * until one chunk is left, which becomes the output. Two chunks or fewer are
 * merged straight into the output.
 */
class MultiPassMerger {
public:
    MultiPassMerger(const MergeOptions& options,
                    const RowCompare& compare,
                    char separator,
                    size_t fan_in,
                    TaskExecutor& executor);

    void merge(std::vector<ChunkFile> chunks,
               const std::filesystem::path& output_file,
               const TempDirectory& temp_dir,
               const CancellationToken& token,
               ProgressReporter& progress);

    // Passes that wrote intermediate files during the last merge()
    size_t passes() const { return passes_; }

private:
    ChunkFile merge_group(const std::vector<ChunkFile>& group,
                          size_t position,
                          const std::string& pass_token,
                          const TempDirectory& temp_dir,
                          const CancellationToken& token) const;

    const MergeOptions& options_;
    const RowCompare& compare_;
    char separator_;
    size_t fan_in_;
    TaskExecutor& executor_;
    size_t passes_ = 0;
};

} // namespace linesort

#endif // LINESORT_MERGING_HPP
