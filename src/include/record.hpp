#ifndef LINESORT_RECORD_HPP
#define LINESORT_RECORD_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace linesort {

// A single record: the bytes between two separators, never interpreted by the engine
using Row = std::string;

// Row array reused across chunks (see RowBufferPool)
using RowBuffer = std::vector<Row>;

// Strict weak ordering over rows ("less than"). Must be a total order on row values.
using RowCompare = std::function<bool(const Row&, const Row&)>;

// The currently buffered row of one open chunk during a merge
struct RowCursor {
    Row value;
    size_t reader; // index of the chunk reader that produced value
};

// A chunk file on disk
// - index: 1-based sequence index (split/sort) or position index (merge passes)
// - rows: number of records in the file
struct ChunkFile {
    size_t index;
    std::filesystem::path path;
    uint64_t bytes;
    size_t rows;
};

} // namespace linesort

#endif // LINESORT_RECORD_HPP
