#ifndef LINESORT_FF_EXECUTOR_HPP
#define LINESORT_FF_EXECUTOR_HPP

#include "../include/executor.hpp"

namespace linesort {

/**
 * Runs tasks on a FastFlow farm:
 * - TaskEmitter streams the task ids to the workers
 * - TaskWorker (one per allowed concurrent task) runs task(i)
 * - TaskCollector counts completed tasks
 */
class FastFlowExecutor : public TaskExecutor {
public:
    void run(size_t count, size_t concurrency, const Task& task) override;

    const char* name() const override { return "FastFlow"; }
};

} // namespace linesort

#endif // LINESORT_FF_EXECUTOR_HPP
