#include "external_sorter.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>

#include "../chunking/chunking.hpp"
#include "../include/progress.hpp"
#include "../include/record_io.hpp"
#include "../merging/merging.hpp"
#include "../sorting/chunk_sort.hpp"

namespace fs = std::filesystem;

namespace linesort {

namespace {

using Clock = std::chrono::steady_clock;

double seconds_since(Clock::time_point start) {
    return std::chrono::duration<double>(Clock::now() - start).count();
}

} // namespace

ExternalSorter::ExternalSorter(SortOptions options)
    : options_(std::move(options)) {
    options_.validate();
    executor_ = make_executor(options_.backend);
}

SortStats ExternalSorter::sort_file(const fs::path& input_file,
                                    const fs::path& output_file,
                                    const CancellationToken& token) {
    TempDirectory temp_dir(options_.temp_root);
    return sort_file(input_file, output_file, temp_dir, token);
}

void ExternalSorter::sort_single_file(const fs::path& input_file, const fs::path& output_file) {
    RowBuffer rows;
    read_rows_from_file(input_file, options_.split.separator, options_.sort.input_buffer_size, rows);
    sort_rows(rows, options_.sort.compare);
    write_rows_to_file(output_file, rows, options_.split.separator, options_.sort.output_buffer_size);
}

SortStats ExternalSorter::sort_file(const fs::path& input_file,
                                    const fs::path& output_file,
                                    const TempDirectory& temp_dir,
                                    const CancellationToken& token) {
    if (!fs::exists(input_file)) {
        throw std::runtime_error("Input file not found: " + input_file.string());
    }

    SortStats stats;
    stats.input_bytes = fs::file_size(input_file);

    ProgressReporter split_progress(options_.split.progress);
    ProgressReporter sort_progress(options_.sort.progress);
    ProgressReporter merge_progress(options_.merge.progress);

    if (options_.verbose) {
        std::cout << "[LOG] External sort: input=" << input_file << " (" << stats.input_bytes << " bytes)"
                  << ", output=" << output_file
                  << ", chunk size=" << options_.split.chunk_size_bytes << " bytes"
                  << ", threads=" << options_.sort.parallelism
                  << ", backend=" << executor_->name() << std::endl;
    }

    token.throw_if_cancelled();

    // Small input: one in-memory sort, nothing to split or merge
    if (stats.input_bytes <= options_.split.chunk_size_bytes) {
        stats.single_pass = true;
        split_progress.complete();

        auto t1 = Clock::now();
        sort_single_file(input_file, output_file);
        stats.sort_seconds = seconds_since(t1);

        sort_progress.complete();
        merge_progress.complete();
        if (options_.verbose) {
            std::cout << "[TIMING] Single pass sort time: " << stats.sort_seconds << " s" << std::endl;
        }
        return stats;
    }

    // Splitting
    auto t1 = Clock::now();
    SplitResult split = split_file_into_chunks(input_file, options_.split, temp_dir, token, split_progress);
    stats.split_seconds = seconds_since(t1);
    stats.chunks = split.chunks.size();
    stats.max_rows_per_chunk = split.max_rows_per_chunk;
    if (options_.verbose) {
        std::cout << "[LOG] Created " << stats.chunks << " chunk files, max "
                  << stats.max_rows_per_chunk << " rows per chunk" << std::endl;
        std::cout << "[TIMING] Chunking time: " << stats.split_seconds << " s" << std::endl;
    }

    // Sorting
    t1 = Clock::now();
    ChunkSorter sorter(options_.sort, options_.split.separator, *executor_);
    std::vector<ChunkFile> sorted_chunks =
        sorter.sort_chunks(split.chunks, split.max_rows_per_chunk, temp_dir, sort_progress);
    stats.sort_seconds = seconds_since(t1);
    stats.sort_buffers = sorter.buffers_allocated();
    if (options_.verbose) {
        std::cout << "[TIMING] Sorting time: " << stats.sort_seconds << " s" << std::endl;
    }

    // Merging
    t1 = Clock::now();
    MultiPassMerger merger(options_.merge, options_.sort.compare, options_.split.separator,
                           options_.fan_in(), *executor_);
    merger.merge(std::move(sorted_chunks), output_file, temp_dir, token, merge_progress);
    stats.merge_seconds = seconds_since(t1);
    stats.merge_passes = merger.passes();
    if (options_.verbose) {
        std::cout << "[LOG] Merged in " << stats.merge_passes << " intermediate passes" << std::endl;
        std::cout << "[TIMING] Merging time: " << stats.merge_seconds << " s" << std::endl;
        std::cout << "[TIMING] Total time: " << stats.total_seconds() << " s" << std::endl;
    }

    return stats;
}

} // namespace linesort
