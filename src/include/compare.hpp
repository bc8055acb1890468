#ifndef LINESORT_COMPARE_HPP
#define LINESORT_COMPARE_HPP

#include <string>

#include "record.hpp"

namespace linesort {

// Byte-wise comparison (the default order)
bool lexicographic_less(const Row& a, const Row& b);

// ASCII case-folded comparison, equal folds ordered byte-wise
bool case_insensitive_less(const Row& a, const Row& b);

// Compares the leading number of each row (rows without one come first),
// equal numbers ordered byte-wise
bool numeric_less(const Row& a, const Row& b);

/**
 * Build a comparison by name: "lexicographic", "case-insensitive" or "numeric".
 * @throws std::invalid_argument for an unknown name
 */
RowCompare make_row_compare(const std::string& name, bool reverse = false);

} // namespace linesort

#endif // LINESORT_COMPARE_HPP
