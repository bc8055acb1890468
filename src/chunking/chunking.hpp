#ifndef LINESORT_CHUNKING_HPP
#define LINESORT_CHUNKING_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <string>
#include <vector>

#include "../include/cancellation.hpp"
#include "../include/options.hpp"
#include "../include/progress.hpp"
#include "../include/record.hpp"
#include "../include/temp_dir.hpp"

namespace linesort {

struct SplitResult {
    std::vector<ChunkFile> chunks;  // in input order, indices 1..n
    size_t max_rows_per_chunk = 0;  // sizes the sort buffer pool
};

// Name of the unsorted chunk with the given sequence index
std::string unsorted_chunk_name(size_t index);

// Number of rows in a chunk: separators, plus one for a last record without separator
size_t count_rows(const char* data, size_t size, char separator);

/**
 * Reads the input once, front to back, and writes it into chunk files of about
 * chunk_size_bytes. A chunk is extended byte by byte past the target size until
 * the next separator so no record is ever split between two chunks.
 *
 * @param input Stream positioned at the first byte
 * @param total_bytes Input size, used only for progress (bytes consumed / total_bytes)
 * @param options Chunk size, separator and write buffer size
 * @param temp_dir Where the <index>.unsorted files are created
 * @param token Checked before every chunk
 * @param progress Reported after every chunk and with 1 at the end
 * @return The chunks in input order and the largest row count seen
 */
SplitResult split_into_chunks(std::istream& input,
                              uint64_t total_bytes,
                              const SplitOptions& options,
                              const TempDirectory& temp_dir,
                              const CancellationToken& token,
                              ProgressReporter& progress);

// Same as above, reading from a file
SplitResult split_file_into_chunks(const std::filesystem::path& input_file,
                                   const SplitOptions& options,
                                   const TempDirectory& temp_dir,
                                   const CancellationToken& token,
                                   ProgressReporter& progress);

} // namespace linesort

#endif // LINESORT_CHUNKING_HPP
