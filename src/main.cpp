#include <algorithm>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "include/cancellation.hpp"
#include "include/compare.hpp"
#include "include/options.hpp"
#include "filegen/filegen.hpp"
#include "sorter/external_sorter.hpp"

namespace fs = std::filesystem;
using namespace linesort;

namespace {

CancellationToken g_cancel;

void on_interrupt(int) {
    g_cancel.request_cancel();
}

void print_usage(const std::string& prog_name) {
    std::cout << "\n========================================\n";
    std::cout << " linesort - External MergeSort for text records\n";
    std::cout << "========================================\n\n";
    std::cout << "Usage:\n";
    std::cout << "  " << prog_name << " sort <input_file> <output_file> [chunk_MB] [num_threads] [options]\n";
    std::cout << "  " << prog_name << " generate <file> <num_rows> [min_len] [max_len] [seed]\n";
    std::cout << "  " << prog_name << " generate <file> --size-mb <n> [min_len] [max_len] [seed]\n";
    std::cout << "  " << prog_name << " verify <file> [--compare name] [--reverse] [--separator c]\n\n";

    std::cout << "Sort options:\n";
    std::cout << "  chunk_MB               Target chunk size in MB (default: 64)\n";
    std::cout << "  num_threads            Parallel sort workers and merge fan-in (default: 4, 0 = all cores)\n";
    std::cout << "  --chunk-bytes <n>      Target chunk size in bytes (overrides chunk_MB)\n";
    std::cout << "  --backend <omp|ff>     Parallel runtime: OpenMP (default) or FastFlow\n";
    std::cout << "  --compare <name>       lexicographic (default), case-insensitive, numeric\n";
    std::cout << "  --reverse              Sort in descending order\n";
    std::cout << "  --separator <c>        Record separator (default: \\n)\n";
    std::cout << "  --buffer-kb <n>        Size of every read/write buffer in KB (default: 64)\n";
    std::cout << "  --temp-dir <dir>       Where the scratch directory is created (default: system temp)\n";
    std::cout << "  --quiet                No progress or timing output\n\n";

    std::cout << "Examples:\n";
    std::cout << "  " << prog_name << " generate words.txt 10000000\n";
    std::cout << "  " << prog_name << " generate words.txt --size-mb 500\n";
    std::cout << "  " << prog_name << " sort words.txt words_sorted.txt 128 8\n";
    std::cout << "  " << prog_name << " verify words_sorted.txt\n\n";
}

char parse_separator(const std::string& value) {
    if (value == "\\n") return '\n';
    if (value == "\\t") return '\t';
    if (value == "\\0") return '\0';
    if (value.size() == 1) return value[0];
    throw std::invalid_argument("Separator must be a single character: " + value);
}

// Prints one progress line per phase on stderr
class ProgressPrinter {
public:
    ProgressCallback channel(const std::string& phase) {
        return [this, phase](double fraction) {
            std::lock_guard<std::mutex> lock(mutex_);
            std::cerr << "\r[" << std::left << std::setw(5) << phase << "] "
                      << std::right << std::setw(3) << static_cast<int>(fraction * 100) << "%";
            if (fraction >= 1.0) std::cerr << std::endl;
        };
    }

private:
    std::mutex mutex_;
};

// Splits argv into positional arguments and --flag value pairs
struct CommandLine {
    std::vector<std::string> positional;
    std::vector<std::pair<std::string, std::string>> flags;

    CommandLine(int argc, char* argv[], int first) {
        for (int i = first; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--reverse" || arg == "--quiet") {
                flags.emplace_back(arg, "");
            } else if (arg.rfind("--", 0) == 0) {
                if (i + 1 >= argc) throw std::invalid_argument("Missing value for " + arg);
                flags.emplace_back(arg, argv[++i]);
            } else {
                positional.push_back(arg);
            }
        }
    }
};

int run_sort(const CommandLine& cmd) {
    if (cmd.positional.size() < 2) {
        std::cerr << "Error: sort needs an input and an output file\n";
        return 1;
    }
    const fs::path input_file = cmd.positional[0];
    const fs::path output_file = cmd.positional[1];
    if (!fs::exists(input_file)) {
        std::cerr << "Error: Input file not found: " << input_file << "\n";
        return 1;
    }

    SortOptions options;
    if (cmd.positional.size() >= 3) {
        options.split.chunk_size_bytes = std::stoull(cmd.positional[2]) * 1024 * 1024;
    }
    size_t threads = DEFAULT_PARALLELISM;
    if (cmd.positional.size() >= 4) {
        threads = std::stoul(cmd.positional[3]);
    }
    if (threads == 0) {
        threads = std::max(1u, std::thread::hardware_concurrency());
    }
    options.sort.parallelism = threads;

    std::string compare_name = "lexicographic";
    bool reverse = false;
    bool quiet = false;
    for (const auto& [flag, value] : cmd.flags) {
        if (flag == "--chunk-bytes") {
            options.split.chunk_size_bytes = std::stoull(value);
        } else if (flag == "--backend") {
            options.backend = parse_backend(value);
        } else if (flag == "--compare") {
            compare_name = value;
        } else if (flag == "--reverse") {
            reverse = true;
        } else if (flag == "--separator") {
            options.split.separator = parse_separator(value);
        } else if (flag == "--buffer-kb") {
            const size_t bytes = std::stoul(value) * 1024;
            options.split.output_buffer_size = bytes;
            options.sort.input_buffer_size = bytes;
            options.sort.output_buffer_size = bytes;
            options.merge.input_buffer_size = bytes;
            options.merge.output_buffer_size = bytes;
        } else if (flag == "--temp-dir") {
            options.temp_root = value;
        } else if (flag == "--quiet") {
            quiet = true;
        } else {
            throw std::invalid_argument("Unknown option: " + flag);
        }
    }
    options.sort.compare = make_row_compare(compare_name, reverse);
    options.verbose = !quiet;

    ProgressPrinter printer;
    if (!quiet) {
        options.split.progress = printer.channel("split");
        options.sort.progress = printer.channel("sort");
        options.merge.progress = printer.channel("merge");
    }

    ExternalSorter sorter(std::move(options));
    std::signal(SIGINT, on_interrupt);

    try {
        SortStats stats = sorter.sort_file(input_file, output_file, g_cancel);
        if (!quiet) {
            std::cout << "Sort completed in " << stats.total_seconds() << " seconds"
                      << " (chunks=" << stats.chunks
                      << ", merge passes=" << stats.merge_passes
                      << ", single pass=" << (stats.single_pass ? "yes" : "no") << ")\n";
        }
    } catch (const SortCancelled&) {
        std::cerr << "\nSort cancelled, output " << output_file << " may be incomplete\n";
        return 130;
    }
    return 0;
}

int run_generate(const CommandLine& cmd) {
    uint64_t size_mb = 0;
    for (const auto& [flag, value] : cmd.flags) {
        if (flag == "--size-mb") size_mb = std::stoull(value);
        else throw std::invalid_argument("Unknown option: " + flag);
    }

    // with --size-mb the row count is left out: <file> [min_len] [max_len] [seed]
    const size_t first_length_arg = size_mb > 0 ? 1 : 2;
    if (cmd.positional.size() < first_length_arg) {
        std::cerr << "Error: generate needs a file name and a row count (or --size-mb)\n";
        return 1;
    }
    const std::string filename = cmd.positional[0];
    auto optional_arg = [&](size_t offset, uint64_t fallback) -> uint64_t {
        const size_t pos = first_length_arg + offset;
        return cmd.positional.size() > pos ? std::stoull(cmd.positional[pos]) : fallback;
    };
    const size_t min_len = optional_arg(0, 8);
    const size_t max_len = optional_arg(1, 64);
    const uint64_t seed = optional_arg(2, 42);

    FileGenerator gen(seed);
    if (size_mb > 0) {
        gen.generateFileBySize(filename, size_mb * 1024 * 1024, min_len, max_len);
        std::cout << "Generated file: " << filename << " of about " << size_mb << " MB\n";
        return 0;
    }

    const size_t num_rows = std::stoull(cmd.positional[1]);
    gen.generateFile(filename, num_rows, min_len, max_len);
    std::cout << "Generated file: " << filename << " with " << num_rows << " rows\n";
    return 0;
}

int run_verify(const CommandLine& cmd) {
    if (cmd.positional.empty()) {
        std::cerr << "Error: verify needs a file name\n";
        return 1;
    }
    std::string compare_name = "lexicographic";
    bool reverse = false;
    char separator = '\n';
    for (const auto& [flag, value] : cmd.flags) {
        if (flag == "--compare") compare_name = value;
        else if (flag == "--reverse") reverse = true;
        else if (flag == "--separator") separator = parse_separator(value);
        else throw std::invalid_argument("Unknown option: " + flag);
    }

    VerifyResult result = verify_sorted_output(cmd.positional[0], make_row_compare(compare_name, reverse), separator);
    if (!result.sorted) {
        std::cerr << "Sort verification failed at row " << result.first_unsorted_row << std::endl;
        return 1;
    }
    std::cout << "Verification PASSED! Total rows: " << result.rows << std::endl;
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    const std::string command = argv[1];
    try {
        CommandLine cmd(argc, argv, 2);
        if (command == "sort") return run_sort(cmd);
        if (command == "generate") return run_generate(cmd);
        if (command == "verify") return run_verify(cmd);
        if (command == "help" || command == "--help") {
            print_usage(argv[0]);
            return 0;
        }
        std::cerr << "Unknown command: " << command << "\n";
        print_usage(argv[0]);
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
