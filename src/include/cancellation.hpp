#ifndef LINESORT_CANCELLATION_HPP
#define LINESORT_CANCELLATION_HPP

#include <atomic>
#include <stdexcept>

namespace linesort {

// Thrown when a sort observes a cancellation request
class SortCancelled : public std::runtime_error {
public:
    SortCancelled() : std::runtime_error("external sort cancelled") {}
};

// Cooperative cancellation signal shared by the caller and one sort run.
// request_cancel() is lock-free and may be called from a signal handler.
class CancellationToken {
public:
    void request_cancel() noexcept { cancelled_.store(true, std::memory_order_relaxed); }

    bool is_cancelled() const noexcept { return cancelled_.load(std::memory_order_relaxed); }

    void throw_if_cancelled() const {
        if (is_cancelled()) throw SortCancelled();
    }

private:
    std::atomic<bool> cancelled_{false};
};

} // namespace linesort

#endif // LINESORT_CANCELLATION_HPP
