#ifndef LINESORT_FILEGEN_HPP
#define LINESORT_FILEGEN_HPP

#include <cstddef>
#include <cstdint>
#include <string>

#include "../include/record.hpp"

namespace linesort {

class FileGenerator {
public:
    explicit FileGenerator(uint64_t seed = 42, char separator = '\n') : seed_(seed), separator_(separator) {}

    // Write num_rows random alphanumeric rows of min_len..max_len bytes
    void generateFile(const std::string& filename, size_t num_rows, size_t min_len = 8, size_t max_len = 64);

    // Write random rows until the file reaches about target_size_bytes
    void generateFileBySize(const std::string& filename, uint64_t target_size_bytes, size_t min_len = 8, size_t max_len = 64);

private:
    uint64_t seed_;
    char separator_;
};

struct VerifyResult {
    bool sorted = true;
    size_t rows = 0;
    size_t first_unsorted_row = 0; // valid when !sorted
};

// Check that every row is not less than the previous one under compare
VerifyResult verify_sorted_output(const std::string& filename, const RowCompare& compare, char separator = '\n');

} // namespace linesort

#endif // LINESORT_FILEGEN_HPP
