#include "../include/temp_dir.hpp"

#include <iostream>
#include <random>
#include <stdexcept>
#include <system_error>

#include <unistd.h>

namespace fs = std::filesystem;

namespace linesort {

std::string random_token(size_t length) {
    static const char digits[] = "0123456789abcdef";
    static thread_local std::mt19937_64 rng(std::random_device{}());
    std::uniform_int_distribution<int> pick(0, 15);

    std::string token;
    token.reserve(length);
    for (size_t i = 0; i < length; ++i) {
        token += digits[pick(rng)];
    }
    return token;
}

TempDirectory::TempDirectory(const fs::path& root) {
    fs::path base = root.empty() ? fs::temp_directory_path() : root;
    fs::create_directories(base);

    // create_directory returns false when the name is taken, try another token
    for (int attempt = 0; attempt < 16; ++attempt) {
        fs::path candidate = base / ("linesort_" + std::to_string(getpid()) + "_" + random_token());
        if (fs::create_directory(candidate)) {
            path_ = candidate;
            return;
        }
    }
    throw std::runtime_error("Failed to create a temporary directory under " + base.string());
}

TempDirectory::~TempDirectory() {
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        std::cerr << "Warning: Failed to delete temp directory " << path_ << ": " << ec.message() << std::endl;
    }
}

size_t TempDirectory::entry_count() const {
    size_t count = 0;
    for (auto it = fs::directory_iterator(path_); it != fs::directory_iterator(); ++it) {
        ++count;
    }
    return count;
}

} // namespace linesort
