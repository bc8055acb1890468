#ifndef LINESORT_TEMP_DIR_HPP
#define LINESORT_TEMP_DIR_HPP

#include <filesystem>
#include <string>

namespace linesort {

/**
 * Scratch directory owned by one sort run.
 * Created as <root>/linesort_<pid>_<random> and removed with all its content
 * when the object goes out of scope, whether the run succeeded or not.
 */
class TempDirectory {
public:
    // root empty: std::filesystem::temp_directory_path()
    explicit TempDirectory(const std::filesystem::path& root = {});
    ~TempDirectory();

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    const std::filesystem::path& path() const { return path_; }

    std::filesystem::path file(const std::string& name) const { return path_ / name; }

    // Number of entries currently inside the directory
    size_t entry_count() const;

private:
    std::filesystem::path path_;
};

// Random lowercase hex string, used to keep directory and pass file names unique
std::string random_token(size_t length = 8);

} // namespace linesort

#endif // LINESORT_TEMP_DIR_HPP
