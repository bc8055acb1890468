#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include "include/progress.hpp"
#include "test_utils.hpp"

using namespace linesort;
using namespace linesort::test;

TEST(ProgressTest, ClampsAndDropsRegressions) {
    ProgressLog log;
    ProgressReporter reporter(log.callback());
    reporter.report(0.5);
    reporter.report(0.25);
    reporter.report(-1.0);
    reporter.report(1.5);

    EXPECT_EQ(log.values(), (std::vector<double>{0.5, 1.0}));
    EXPECT_DOUBLE_EQ(reporter.last(), 1.0);
}

TEST(ProgressTest, RepeatedValuesAreForwarded) {
    ProgressLog log;
    ProgressReporter reporter(log.callback());
    reporter.report(0.5);
    reporter.report(0.5);
    reporter.complete();
    reporter.complete();

    EXPECT_EQ(log.values(), (std::vector<double>{0.5, 0.5, 1.0, 1.0}));
    EXPECT_TRUE(log.monotonic_and_complete());
}

TEST(ProgressTest, WorksWithoutCallback) {
    ProgressReporter reporter;
    reporter.report(0.3);
    reporter.complete();
    EXPECT_DOUBLE_EQ(reporter.last(), 1.0);
}

TEST(ProgressTest, ConcurrentReportsStayMonotonic) {
    ProgressLog log;
    ProgressReporter reporter(log.callback());

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&reporter, t] {
            for (int i = 0; i < 200; ++i) {
                reporter.report(static_cast<double>((i * 8 + t) % 997) / 997.0);
            }
        });
    }
    for (auto& th : threads) th.join();
    reporter.complete();

    EXPECT_TRUE(log.monotonic_and_complete());
}

TEST(ProgressTest, CallbackNeverRunsConcurrently) {
    // plain ints, the reporter's lock is the only synchronisation
    int inside = 0;
    int overlaps = 0;
    ProgressReporter reporter([&](double) {
        if (++inside > 1) ++overlaps;
        std::this_thread::yield();
        --inside;
    });

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&reporter, t] {
            for (int i = 0; i < 100; ++i) {
                reporter.report(static_cast<double>(i * 4 + t) / 400.0);
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(overlaps, 0);
}

TEST(ProgressTest, CallbackMayReportToAnotherReporter) {
    ProgressLog outer_log;
    ProgressReporter outer(outer_log.callback());
    ProgressReporter inner([&outer](double value) { outer.report(value / 2.0); });

    inner.report(0.5);
    inner.complete();

    EXPECT_EQ(outer_log.values(), (std::vector<double>{0.25, 0.5}));
}
