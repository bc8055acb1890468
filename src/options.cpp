#include "include/options.hpp"

#include <stdexcept>

namespace linesort {

Backend parse_backend(const std::string& name) {
    if (name == "omp" || name == "openmp") return Backend::OpenMP;
    if (name == "ff" || name == "fastflow") return Backend::FastFlow;
    throw std::invalid_argument("Unknown backend: " + name + " (expected omp or ff)");
}

const char* backend_name(Backend backend) {
    switch (backend) {
        case Backend::OpenMP: return "OpenMP";
        case Backend::FastFlow: return "FastFlow";
    }
    return "unknown";
}

void SortOptions::validate() const {
    if (split.chunk_size_bytes == 0) {
        throw std::invalid_argument("Chunk size must be greater than zero");
    }
    if (sort.parallelism == 0) {
        throw std::invalid_argument("Parallelism must be at least 1");
    }
    if (!sort.compare) {
        throw std::invalid_argument("A comparison function is required");
    }
    if (split.output_buffer_size == 0 || sort.input_buffer_size == 0 || sort.output_buffer_size == 0 ||
        merge.input_buffer_size == 0 || merge.output_buffer_size == 0) {
        throw std::invalid_argument("IO buffer sizes must be greater than zero");
    }
}

} // namespace linesort
