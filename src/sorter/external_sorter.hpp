#ifndef LINESORT_EXTERNAL_SORTER_HPP
#define LINESORT_EXTERNAL_SORTER_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>

#include "../include/cancellation.hpp"
#include "../include/executor.hpp"
#include "../include/options.hpp"
#include "../include/temp_dir.hpp"

namespace linesort {

struct SortStats {
    uint64_t input_bytes = 0;
    size_t chunks = 0;              // unsorted chunks written by the split phase
    size_t max_rows_per_chunk = 0;
    size_t merge_passes = 0;        // passes that wrote intermediate files
    size_t sort_buffers = 0;        // row buffers allocated by the pool
    bool single_pass = false;       // input small enough to be sorted in memory
    double split_seconds = 0.0;
    double sort_seconds = 0.0;
    double merge_seconds = 0.0;

    double total_seconds() const { return split_seconds + sort_seconds + merge_seconds; }
};

/**
 * External merge sort of a separator-delimited record file.
 *
 * Phases: split the input into chunks, sort the chunks in parallel, merge them
 * pass by pass into the output. An input not larger than one chunk is sorted in
 * memory instead. All intermediate files are created in a TempDirectory.
 */
class ExternalSorter {
public:
    // @throws std::invalid_argument when options.validate() fails
    explicit ExternalSorter(SortOptions options);

    /**
     * Sort input_file into output_file using a scratch directory under options.temp_root,
     * removed before returning (also on failure).
     * @throws SortCancelled when token is cancelled during split or merge
     */
    SortStats sort_file(const std::filesystem::path& input_file,
                        const std::filesystem::path& output_file,
                        const CancellationToken& token);

    // Same, with a scratch directory owned by the caller
    SortStats sort_file(const std::filesystem::path& input_file,
                        const std::filesystem::path& output_file,
                        const TempDirectory& temp_dir,
                        const CancellationToken& token);

    const SortOptions& options() const { return options_; }

private:
    void sort_single_file(const std::filesystem::path& input_file, const std::filesystem::path& output_file);

    SortOptions options_;
    std::unique_ptr<TaskExecutor> executor_;
};

} // namespace linesort

#endif // LINESORT_EXTERNAL_SORTER_HPP
