#ifndef LINESORT_OMP_EXECUTOR_HPP
#define LINESORT_OMP_EXECUTOR_HPP

#include "../include/executor.hpp"

namespace linesort {

// Tasks are spread over an OpenMP team with dynamic scheduling, one task per iteration
class OpenMPExecutor : public TaskExecutor {
public:
    void run(size_t count, size_t concurrency, const Task& task) override;

    const char* name() const override { return "OpenMP"; }
};

} // namespace linesort

#endif // LINESORT_OMP_EXECUTOR_HPP
