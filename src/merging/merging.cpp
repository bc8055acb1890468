#include "merging.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <system_error>

#include "../include/record_io.hpp"

namespace fs = std::filesystem;

namespace linesort {

namespace {

// Orders the heap so that the smallest row (then the lowest reader) is on top
struct CursorGreater {
    const RowCompare* compare;

    bool operator()(const RowCursor& a, const RowCursor& b) const {
        if ((*compare)(b.value, a.value)) return true;
        if ((*compare)(a.value, b.value)) return false;
        return a.reader > b.reader;
    }
};

} // namespace

size_t merge_sorted_files(const std::vector<fs::path>& sorted_files,
                          const fs::path& output_file,
                          const RowCompare& compare,
                          char separator,
                          const MergeOptions& options,
                          const CancellationToken& token) {
    std::vector<std::unique_ptr<LineReader>> readers;
    readers.reserve(sorted_files.size());
    std::vector<RowCursor> heap;
    heap.reserve(sorted_files.size());

    // prime one cursor per reader with its first row
    for (size_t i = 0; i < sorted_files.size(); ++i) {
        readers.push_back(std::make_unique<LineReader>(sorted_files[i], separator, options.input_buffer_size));
        RowCursor cursor{Row(), i};
        if (readers[i]->next(cursor.value)) {
            heap.push_back(std::move(cursor));
        }
    }

    const CursorGreater greater{&compare};
    std::make_heap(heap.begin(), heap.end(), greater);

    LineWriter writer(output_file, separator, options.output_buffer_size);
    while (!heap.empty()) {
        token.throw_if_cancelled();

        std::pop_heap(heap.begin(), heap.end(), greater);
        RowCursor& smallest = heap.back();
        writer.write(smallest.value);

        if (readers[smallest.reader]->next(smallest.value)) {
            std::push_heap(heap.begin(), heap.end(), greater);
        } else {
            heap.pop_back(); // reader exhausted
        }
    }
    writer.close();
    return writer.rows_written();
}

std::string merge_chunk_name(size_t position, const std::string& pass_token) {
    return std::to_string(position) + "_" + pass_token + ".sorted";
}

size_t estimate_total_chunks(size_t chunk_count, size_t fan_in) {
    if (fan_in < 2) {
        throw std::invalid_argument("Merge fan-in must be at least 2");
    }
    size_t total = chunk_count;
    for (size_t quotient = chunk_count / fan_in; quotient > 0; quotient /= fan_in) {
        total += quotient;
    }
    return total;
}

void move_file(const fs::path& from, const fs::path& to) {
    std::error_code ec;
    fs::rename(from, to, ec);
    if (!ec) return;
    if (ec != std::errc::cross_device_link) {
        throw fs::filesystem_error("Failed to move file", from, to, ec);
    }
    fs::copy_file(from, to, fs::copy_options::overwrite_existing);
    fs::remove(from);
}

MultiPassMerger::MultiPassMerger(const MergeOptions& options,
                                 const RowCompare& compare,
                                 char separator,
                                 size_t fan_in,
                                 TaskExecutor& executor)
    : options_(options), compare_(compare), separator_(separator), fan_in_(fan_in), executor_(executor) {
    if (fan_in_ < 2) {
        throw std::invalid_argument("Merge fan-in must be at least 2");
    }
}

ChunkFile MultiPassMerger::merge_group(const std::vector<ChunkFile>& group,
                                       size_t position,
                                       const std::string& pass_token,
                                       const TempDirectory& temp_dir,
                                       const CancellationToken& token) const {
    const fs::path out_file = temp_dir.file(merge_chunk_name(position, pass_token));

    // a lone chunk only moves to its slot in the next pass
    if (group.size() == 1) {
        move_file(group.front().path, out_file);
        return {
            .index = position,
            .path  = out_file,
            .bytes = group.front().bytes,
            .rows  = group.front().rows
        };
    }

    std::vector<fs::path> inputs;
    inputs.reserve(group.size());
    for (const auto& chunk : group) {
        inputs.push_back(chunk.path);
    }
    const size_t rows = merge_sorted_files(inputs, out_file, compare_, separator_, options_, token);
    return {
        .index = position,
        .path  = out_file,
        .bytes = fs::file_size(out_file),
        .rows  = rows
    };
}

void MultiPassMerger::merge(std::vector<ChunkFile> chunks,
                            const fs::path& output_file,
                            const TempDirectory& temp_dir,
                            const CancellationToken& token,
                            ProgressReporter& progress) {
    passes_ = 0;
    const size_t total_chunks = estimate_total_chunks(chunks.size(), fan_in_);
    size_t chunks_processed = 0;

    while (true) {
        // final run: merge what is left straight into the output
        if (chunks.size() <= 2) {
            std::vector<fs::path> inputs;
            for (const auto& chunk : chunks) {
                inputs.push_back(chunk.path);
            }
            merge_sorted_files(inputs, output_file, compare_, separator_, options_, token);
            for (const auto& chunk : chunks) {
                fs::remove(chunk.path);
            }
            progress.complete();
            return;
        }

        token.throw_if_cancelled();

        const size_t group_count = (chunks.size() + fan_in_ - 1) / fan_in_;
        const std::string pass_token = random_token();
        std::vector<ChunkFile> produced(group_count);

        executor_.run(group_count, fan_in_, [&](size_t g) {
            const size_t start = g * fan_in_;
            const size_t end = std::min(start + fan_in_, chunks.size());
            std::vector<ChunkFile> group(chunks.begin() + start, chunks.begin() + end);
            produced[g] = merge_group(group, g + 1, pass_token, temp_dir, token);
        });
        ++passes_;

        // moved chunks are already gone, remove() just reports false for them
        for (const auto& chunk : chunks) {
            fs::remove(chunk.path);
        }

        chunks_processed += chunks.size();
        progress.report(static_cast<double>(chunks_processed) / static_cast<double>(total_chunks));

        std::sort(produced.begin(), produced.end(),
                  [](const ChunkFile& a, const ChunkFile& b) { return a.index < b.index; });
        chunks = std::move(produced);

        if (chunks.size() == 1) {
            move_file(chunks.front().path, output_file);
            progress.complete();
            return;
        }
    }
}

} // namespace linesort
