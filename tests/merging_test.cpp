#include <gtest/gtest.h>

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include "include/compare.hpp"
#include "include/executor.hpp"
#include "include/temp_dir.hpp"
#include "merging/merging.hpp"
#include "sorting/chunk_sort.hpp"
#include "test_utils.hpp"

using namespace linesort;
using namespace linesort::test;

namespace fs = std::filesystem;

class MergingTest : public ::testing::Test {
protected:
    fs::path write_sorted(const std::string& name, std::vector<std::string> rows) {
        rows = sorted_copy(std::move(rows));
        fs::path path = scratch.file(name);
        write_text(path, join_rows(rows));
        return path;
    }

    // count sorted chunk files with about rows_per_chunk random rows each
    std::vector<ChunkFile> make_chunks(size_t count, size_t rows_per_chunk, std::vector<std::string>& all_rows) {
        std::vector<ChunkFile> chunks;
        for (size_t i = 1; i <= count; ++i) {
            auto rows = random_rows(rows_per_chunk + i % 3, 1000 + i);
            all_rows.insert(all_rows.end(), rows.begin(), rows.end());
            fs::path path = write_sorted(sorted_chunk_name(i), rows);
            chunks.push_back({i, path, fs::file_size(path), rows.size()});
        }
        return chunks;
    }

    TempDirectory scratch;
    TempDirectory out_dir;
    MergeOptions options;
    RowCompare compare = lexicographic_less;
    CancellationToken token;
};

TEST_F(MergingTest, MergesSortedFilesIntoOneSortedFile) {
    std::vector<fs::path> inputs = {
        write_sorted("a", {"delta", "alpha", "kilo"}),
        write_sorted("b", {"bravo", "zulu"}),
        write_sorted("c", {"charlie", "echo", "alpha", "yankee"}),
    };
    const size_t rows = merge_sorted_files(inputs, out_dir.file("out.txt"), compare, '\n', options, token);

    EXPECT_EQ(rows, 9u);
    EXPECT_EQ(read_text(out_dir.file("out.txt")),
              "alpha\nalpha\nbravo\ncharlie\ndelta\necho\nkilo\nyankee\nzulu\n");
}

TEST_F(MergingTest, SkipsEmptyInputs) {
    std::vector<fs::path> inputs = {
        write_sorted("empty", {}),
        write_sorted("b", {"y", "x"}),
    };
    EXPECT_EQ(merge_sorted_files(inputs, out_dir.file("out.txt"), compare, '\n', options, token), 2u);
    EXPECT_EQ(read_text(out_dir.file("out.txt")), "x\ny\n");
}

TEST_F(MergingTest, NoInputsGiveAnEmptyOutput) {
    EXPECT_EQ(merge_sorted_files({}, out_dir.file("out.txt"), compare, '\n', options, token), 0u);
    EXPECT_TRUE(fs::exists(out_dir.file("out.txt")));
    EXPECT_EQ(fs::file_size(out_dir.file("out.txt")), 0u);
}

TEST_F(MergingTest, EqualRowsComeOutInInputFileOrder) {
    // only the first character takes part in the comparison
    RowCompare by_first = [](const Row& a, const Row& b) { return a.substr(0, 1) < b.substr(0, 1); };
    write_text(scratch.file("0"), "k-first\nz-0\n");
    write_text(scratch.file("1"), "k-second\n");
    write_text(scratch.file("2"), "a-2\nk-third\n");

    std::vector<fs::path> inputs = {scratch.file("0"), scratch.file("1"), scratch.file("2")};
    merge_sorted_files(inputs, out_dir.file("out.txt"), by_first, '\n', options, token);
    EXPECT_EQ(read_text(out_dir.file("out.txt")), "a-2\nk-first\nk-second\nk-third\nz-0\n");
}

TEST_F(MergingTest, CancellationStopsTheMerge) {
    std::vector<fs::path> inputs = {write_sorted("a", {"1", "2"}), write_sorted("b", {"3"})};
    token.request_cancel();
    EXPECT_THROW(merge_sorted_files(inputs, out_dir.file("out.txt"), compare, '\n', options, token), SortCancelled);
}

TEST_F(MergingTest, MissingInputThrows) {
    std::vector<fs::path> inputs = {scratch.file("missing")};
    EXPECT_THROW(merge_sorted_files(inputs, out_dir.file("out.txt"), compare, '\n', options, token), std::runtime_error);
}

TEST_F(MergingTest, ComparisonFailurePropagates) {
    RowCompare failing = [](const Row&, const Row&) -> bool { throw std::domain_error("bad compare"); };
    std::vector<fs::path> inputs = {write_sorted("a", {"1"}), write_sorted("b", {"2"})};
    EXPECT_THROW(merge_sorted_files(inputs, out_dir.file("out.txt"), failing, '\n', options, token), std::domain_error);
}

TEST(EstimateTotalChunksTest, AccumulatesQuotients) {
    EXPECT_EQ(estimate_total_chunks(8, 2), 15u);  // 8 + 4 + 2 + 1
    EXPECT_EQ(estimate_total_chunks(10, 3), 14u); // 10 + 3 + 1
    EXPECT_EQ(estimate_total_chunks(3, 4), 3u);
    EXPECT_EQ(estimate_total_chunks(0, 2), 0u);
    EXPECT_THROW(estimate_total_chunks(8, 1), std::invalid_argument);
}

TEST(MergeChunkNameTest, CarriesPositionAndPassToken) {
    EXPECT_EQ(merge_chunk_name(3, "abcd1234"), "3_abcd1234.sorted");
}

class MultiPassMergerTest : public MergingTest, public ::testing::WithParamInterface<Backend> {
protected:
    std::unique_ptr<TaskExecutor> executor = make_executor(GetParam());
};

TEST_P(MultiPassMergerTest, MergesManyChunksInSeveralPasses) {
    std::vector<std::string> all_rows;
    auto chunks = make_chunks(7, 20, all_rows);

    ProgressLog log;
    ProgressReporter progress(log.callback());
    MultiPassMerger merger(options, compare, '\n', 2, *executor);
    merger.merge(chunks, out_dir.file("out.txt"), scratch, token, progress);

    EXPECT_EQ(split_rows(read_text(out_dir.file("out.txt"))), sorted_copy(all_rows));
    EXPECT_GE(merger.passes(), 2u);
    EXPECT_TRUE(log.monotonic_and_complete());
    EXPECT_EQ(scratch.entry_count(), 0u) << "intermediate chunks left behind";
}

TEST_P(MultiPassMergerTest, FanInLargerThanChunkCountEndsWithARename) {
    std::vector<std::string> all_rows;
    auto chunks = make_chunks(3, 10, all_rows);

    ProgressReporter progress;
    MultiPassMerger merger(options, compare, '\n', 4, *executor);
    merger.merge(chunks, out_dir.file("out.txt"), scratch, token, progress);

    EXPECT_EQ(split_rows(read_text(out_dir.file("out.txt"))), sorted_copy(all_rows));
    EXPECT_EQ(merger.passes(), 1u);
    EXPECT_EQ(scratch.entry_count(), 0u);
}

TEST_P(MultiPassMergerTest, TwoChunksAreMergedStraightIntoTheOutput) {
    std::vector<std::string> all_rows;
    auto chunks = make_chunks(2, 10, all_rows);

    ProgressLog log;
    ProgressReporter progress(log.callback());
    MultiPassMerger merger(options, compare, '\n', 2, *executor);
    merger.merge(chunks, out_dir.file("out.txt"), scratch, token, progress);

    EXPECT_EQ(split_rows(read_text(out_dir.file("out.txt"))), sorted_copy(all_rows));
    EXPECT_EQ(merger.passes(), 0u);
    EXPECT_EQ(log.values(), (std::vector<double>{1.0}));
}

TEST_P(MultiPassMergerTest, SingleChunkIsCopiedToTheOutput) {
    std::vector<std::string> all_rows;
    auto chunks = make_chunks(1, 5, all_rows);

    ProgressReporter progress;
    MultiPassMerger merger(options, compare, '\n', 2, *executor);
    merger.merge(chunks, out_dir.file("out.txt"), scratch, token, progress);

    EXPECT_EQ(split_rows(read_text(out_dir.file("out.txt"))), sorted_copy(all_rows));
    EXPECT_EQ(scratch.entry_count(), 0u);
}

TEST_P(MultiPassMergerTest, CancelledAfterFirstPass) {
    std::vector<std::string> all_rows;
    auto chunks = make_chunks(8, 10, all_rows);

    ProgressReporter progress([this](double value) {
        if (value < 1.0) token.request_cancel();
    });
    MultiPassMerger merger(options, compare, '\n', 2, *executor);
    EXPECT_THROW(merger.merge(chunks, out_dir.file("out.txt"), scratch, token, progress), SortCancelled);
    EXPECT_EQ(merger.passes(), 1u);
}

TEST_P(MultiPassMergerTest, RejectsFanInBelowTwo) {
    EXPECT_THROW(MultiPassMerger(options, compare, '\n', 1, *executor), std::invalid_argument);
}

INSTANTIATE_TEST_SUITE_P(Backends, MultiPassMergerTest,
                         ::testing::Values(Backend::OpenMP, Backend::FastFlow),
                         [](const ::testing::TestParamInfo<Backend>& info) {
                             return std::string(backend_name(info.param));
                         });
