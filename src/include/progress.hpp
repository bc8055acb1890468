#ifndef LINESORT_PROGRESS_HPP
#define LINESORT_PROGRESS_HPP

#include <functional>
#include <mutex>

namespace linesort {

// Receives fractions in [0, 1]
using ProgressCallback = std::function<void(double)>;

/**
 * Wraps a progress callback for one phase.
 * Safe to call from several workers: calls are serialised, values are clamped
 * to [0, 1] and a value lower than the last reported one is dropped, so the
 * callback only ever sees a non-decreasing sequence.
 * The callback runs with the reporter's lock held and must not call back into
 * the same reporter.
 */
class ProgressReporter {
public:
    explicit ProgressReporter(ProgressCallback callback = {}) : callback_(std::move(callback)) {}

    void report(double fraction) {
        if (fraction < 0.0) fraction = 0.0;
        if (fraction > 1.0) fraction = 1.0;

        std::lock_guard<std::mutex> lock(mutex_);
        if (fraction < last_) return;
        last_ = fraction;
        if (callback_) callback_(fraction);
    }

    void complete() { report(1.0); }

    double last() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_;
    }

private:
    ProgressCallback callback_;
    mutable std::mutex mutex_;
    double last_ = 0.0;
};

} // namespace linesort

#endif // LINESORT_PROGRESS_HPP
