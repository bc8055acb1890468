#include "include/compare.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <optional>
#include <stdexcept>

namespace linesort {

namespace {

unsigned char fold(unsigned char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<unsigned char>(c - 'A' + 'a') : c;
}

// Leading number of a row, leading blanks skipped
std::optional<double> leading_number(const Row& row) {
    const char* first = row.data();
    const char* last = row.data() + row.size();
    while (first != last && (*first == ' ' || *first == '\t')) ++first;
    if (first != last && *first == '+') ++first;

    double value = 0.0;
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr == first || std::isnan(value)) {
        return std::nullopt;
    }
    return value;
}

} // namespace

bool lexicographic_less(const Row& a, const Row& b) {
    // std::string compares through char_traits<char>, which is byte-wise unsigned
    return a < b;
}

bool case_insensitive_less(const Row& a, const Row& b) {
    const size_t n = std::min(a.size(), b.size());
    for (size_t i = 0; i < n; ++i) {
        unsigned char ca = fold(static_cast<unsigned char>(a[i]));
        unsigned char cb = fold(static_cast<unsigned char>(b[i]));
        if (ca != cb) return ca < cb;
    }
    if (a.size() != b.size()) return a.size() < b.size();
    return a < b;
}

bool numeric_less(const Row& a, const Row& b) {
    auto na = leading_number(a);
    auto nb = leading_number(b);
    if (na.has_value() != nb.has_value()) {
        return !na.has_value();
    }
    if (na && *na != *nb) {
        return *na < *nb;
    }
    return a < b;
}

RowCompare make_row_compare(const std::string& name, bool reverse) {
    RowCompare base;
    if (name == "lexicographic") {
        base = lexicographic_less;
    } else if (name == "case-insensitive") {
        base = case_insensitive_less;
    } else if (name == "numeric") {
        base = numeric_less;
    } else {
        throw std::invalid_argument("Unknown comparison: " + name);
    }

    if (!reverse) return base;
    return [base](const Row& a, const Row& b) { return base(b, a); };
}

} // namespace linesort
