#include "filegen.hpp"

#include <random>
#include <stdexcept>
#include <string>

#include "../include/record_io.hpp"

namespace linesort {

namespace {

size_t checked_min_length(size_t min_len, size_t max_len) {
    if (min_len > max_len) {
        throw std::invalid_argument("Invalid row length range: " + std::to_string(min_len) + " > " +
                                    std::to_string(max_len));
    }
    return min_len;
}

class RowGenerator {
public:
    RowGenerator(uint64_t seed, size_t min_len, size_t max_len)
        : rng_(seed), length_(checked_min_length(min_len, max_len), max_len), pick_(0, sizeof(charset) - 2) {}

    Row next() {
        Row row(length_(rng_), ' ');
        for (auto& c : row) {
            c = charset[pick_(rng_)];
        }
        return row;
    }

private:
    static constexpr char charset[] =
        "0123456789"
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "abcdefghijklmnopqrstuvwxyz";

    std::mt19937_64 rng_;
    std::uniform_int_distribution<size_t> length_;
    std::uniform_int_distribution<size_t> pick_;
};

} // namespace

/**
 * Generate a file with a specific number of rows
 *
 * Each row has a random length in [min_len, max_len] and random characters
 * from [0-9A-Za-z]. The same seed always produces the same file.
 */
void FileGenerator::generateFile(const std::string& filename, size_t num_rows, size_t min_len, size_t max_len) {
    RowGenerator generator(seed_, min_len, max_len);
    LineWriter writer(filename, separator_);
    for (size_t i = 0; i < num_rows; ++i) {
        writer.write(generator.next());
    }
    writer.close();
}

/**
 * Generate a file with rows until it reaches a certain byte size
 *
 * The last row may overshoot target_size_bytes by at most max_len + 1 bytes.
 */
void FileGenerator::generateFileBySize(const std::string& filename, uint64_t target_size_bytes, size_t min_len, size_t max_len) {
    RowGenerator generator(seed_, min_len, max_len);
    LineWriter writer(filename, separator_);
    uint64_t written = 0;
    while (written < target_size_bytes) {
        Row row = generator.next();
        writer.write(row);
        written += row.size() + 1;
    }
    writer.close();
}

/**
 * Validate that an output file is sorted
 *
 * Reads the file from start to finish and checks that no row is less than
 * the previous one. Stops at the first row out of order.
 */
VerifyResult verify_sorted_output(const std::string& filename, const RowCompare& compare, char separator) {
    LineReader reader(filename, separator);
    VerifyResult result;

    Row prev, curr;
    bool first = true;
    while (reader.next(curr)) {
        if (!first && compare(curr, prev)) {
            result.sorted = false;
            result.first_unsorted_row = result.rows;
            return result;
        }
        prev.swap(curr);
        first = false;
        ++result.rows;
    }
    return result;
}

} // namespace linesort
