#include "omp_executor.hpp"

#include <algorithm>
#include <atomic>
#include <exception>

#include <omp.h>

namespace linesort {

void OpenMPExecutor::run(size_t count, size_t concurrency, const Task& task) {
    if (count == 0) return;

    const int num_threads = static_cast<int>(std::max<size_t>(1, std::min(count, concurrency)));
    const long iterations = static_cast<long>(count);

    // exceptions must not escape the parallel region, keep the first one and rethrow it afterwards
    std::exception_ptr failure;
    std::atomic<bool> failed{false};

    #pragma omp parallel for num_threads(num_threads) schedule(dynamic, 1)
    for (long i = 0; i < iterations; ++i) {
        if (failed.load(std::memory_order_relaxed)) continue;
        try {
            task(static_cast<size_t>(i));
        } catch (...) {
            #pragma omp critical(linesort_task_failure)
            {
                if (!failure) failure = std::current_exception();
            }
            failed.store(true, std::memory_order_relaxed);
        }
    }

    if (failure) std::rethrow_exception(failure);
}

} // namespace linesort
