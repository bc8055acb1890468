#include "ff_executor.hpp"

#include <ff/ff.hpp>
#include <ff/farm.hpp>

#include <algorithm>
#include <atomic>
#include <exception>
#include <memory>
#include <mutex>
#include <numeric>
#include <stdexcept>
#include <string>
#include <vector>

namespace linesort {

using namespace ff;

namespace {

// Failure shared by all the workers of one farm run
struct FarmFailure {
    std::mutex mutex;
    std::exception_ptr error;
    std::atomic<bool> failed{false};

    void record(std::exception_ptr e) {
        std::lock_guard<std::mutex> lock(mutex);
        if (!error) error = e;
        failed.store(true, std::memory_order_relaxed);
    }
};

// ------------------------
// FastFlow Node: Task Emitter
// ------------------------
// Sends a pointer to every task id, the ids live in the executor's vector for the whole run
class TaskEmitter : public ff_node {
public:
    explicit TaskEmitter(std::vector<size_t>& ids) : ids_(ids) {}

    void* svc(void*) override {
        for (auto& id : ids_) {
            ff_send_out(&id);
        }
        return EOS;
    }

private:
    std::vector<size_t>& ids_;
};

// ------------------------
// FastFlow Node: Task Worker
// ------------------------
class TaskWorker : public ff_node {
public:
    TaskWorker(const TaskExecutor::Task& task, FarmFailure& failure) : task_(task), failure_(failure) {}

    void* svc(void* task_ptr) override {
        // after a failure the remaining ids are drained without running them
        if (failure_.failed.load(std::memory_order_relaxed)) return GO_ON;

        const size_t id = *static_cast<size_t*>(task_ptr);
        try {
            task_(id);
        } catch (...) {
            failure_.record(std::current_exception());
            return GO_ON;
        }
        return task_ptr; // to the collector
    }

private:
    const TaskExecutor::Task& task_;
    FarmFailure& failure_;
};

// ------------------------
// FastFlow Node: Task Collector
// ------------------------
class TaskCollector : public ff_node {
public:
    void* svc(void*) override {
        ++completed_;
        return GO_ON;
    }

    size_t completed() const { return completed_; }

private:
    size_t completed_ = 0;
};

} // namespace

void FastFlowExecutor::run(size_t count, size_t concurrency, const Task& task) {
    if (count == 0) return;

    std::vector<size_t> ids(count);
    std::iota(ids.begin(), ids.end(), size_t{0});

    FarmFailure failure;
    TaskEmitter emitter(ids);
    TaskCollector collector;

    const size_t num_workers = std::max<size_t>(1, std::min(count, concurrency));
    std::vector<std::unique_ptr<TaskWorker>> workers;
    std::vector<ff_node*> workers_v;
    for (size_t i = 0; i < num_workers; ++i) {
        workers.push_back(std::make_unique<TaskWorker>(task, failure));
        workers_v.push_back(workers.back().get());
    }

    // Set up FastFlow farm
    ff_farm farm;
    farm.add_emitter(&emitter);
    farm.add_workers(workers_v);
    farm.add_collector(&collector);

    if (farm.run_and_wait_end() < 0) {
        throw std::runtime_error("FastFlow farm execution failed");
    }

    if (failure.error) std::rethrow_exception(failure.error);

    if (collector.completed() != count) {
        throw std::runtime_error("FastFlow farm completed " + std::to_string(collector.completed()) +
                                 " of " + std::to_string(count) + " tasks");
    }
}

} // namespace linesort
