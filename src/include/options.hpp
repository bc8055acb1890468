#ifndef LINESORT_OPTIONS_HPP
#define LINESORT_OPTIONS_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

#include "compare.hpp"
#include "progress.hpp"
#include "record_io.hpp"

namespace linesort {

constexpr uint64_t DEFAULT_CHUNK_SIZE = 64 * 1024 * 1024; // 64MB
constexpr size_t DEFAULT_PARALLELISM = 4;

struct SplitOptions {
    uint64_t chunk_size_bytes = DEFAULT_CHUNK_SIZE; // target size of one unsorted chunk
    char separator = '\n';
    size_t output_buffer_size = DEFAULT_IO_BUFFER_SIZE;
    ProgressCallback progress;
};

struct SortPhaseOptions {
    size_t parallelism = DEFAULT_PARALLELISM; // also the merge fan-in
    RowCompare compare = lexicographic_less;
    size_t input_buffer_size = DEFAULT_IO_BUFFER_SIZE;
    size_t output_buffer_size = DEFAULT_IO_BUFFER_SIZE;
    ProgressCallback progress;
};

struct MergeOptions {
    size_t input_buffer_size = DEFAULT_IO_BUFFER_SIZE;  // per chunk reader
    size_t output_buffer_size = DEFAULT_IO_BUFFER_SIZE;
    ProgressCallback progress;
};

enum class Backend {
    OpenMP,
    FastFlow
};

// "omp" / "openmp" or "ff" / "fastflow", throws std::invalid_argument otherwise
Backend parse_backend(const std::string& name);
const char* backend_name(Backend backend);

struct SortOptions {
    SplitOptions split;
    SortPhaseOptions sort;
    MergeOptions merge;
    Backend backend = Backend::OpenMP;
    std::filesystem::path temp_root; // empty: std::filesystem::temp_directory_path()
    bool verbose = false;

    // Number of chunks merged by one merge task. At least 2 so every pass shrinks the chunk count.
    size_t fan_in() const { return sort.parallelism < 2 ? 2 : sort.parallelism; }

    // @throws std::invalid_argument on an unusable configuration
    void validate() const;
};

} // namespace linesort

#endif // LINESORT_OPTIONS_HPP
