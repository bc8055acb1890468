#ifndef LINESORT_EXECUTOR_HPP
#define LINESORT_EXECUTOR_HPP

#include <cstddef>
#include <functional>
#include <memory>

#include "options.hpp"

namespace linesort {

/**
 * Runs a batch of independent tasks with bounded parallelism.
 *
 * run() calls task(i) for every i in [0, count), with at most `concurrency`
 * tasks in flight, and returns once all of them are done. Once a task throws,
 * tasks not started yet are skipped; the first exception is rethrown on the
 * calling thread after the parallel section has ended.
 */
class TaskExecutor {
public:
    using Task = std::function<void(size_t)>;

    virtual ~TaskExecutor() = default;

    virtual void run(size_t count, size_t concurrency, const Task& task) = 0;

    virtual const char* name() const = 0;
};

std::unique_ptr<TaskExecutor> make_executor(Backend backend);

} // namespace linesort

#endif // LINESORT_EXECUTOR_HPP
