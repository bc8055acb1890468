#include "include/executor.hpp"

#include "fastflow/ff_executor.hpp"
#include "openmp/omp_executor.hpp"

namespace linesort {

std::unique_ptr<TaskExecutor> make_executor(Backend backend) {
    switch (backend) {
        case Backend::FastFlow:
            return std::make_unique<FastFlowExecutor>();
        case Backend::OpenMP:
            break;
    }
    return std::make_unique<OpenMPExecutor>();
}

} // namespace linesort
