#include "../include/buffer_pool.hpp"

#include <stdexcept>

namespace linesort {

RowBufferPool::RowBufferPool(size_t row_capacity, size_t max_buffers)
    : row_capacity_(row_capacity), max_buffers_(max_buffers) {
    if (max_buffers_ == 0) {
        throw std::invalid_argument("RowBufferPool needs room for at least one buffer");
    }
    free_.reserve(max_buffers_);
}

std::unique_ptr<RowBuffer> RowBufferPool::acquire() {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        available_.wait(lock, [this] { return !free_.empty() || allocated_ < max_buffers_; });

        if (!free_.empty()) {
            auto buffer = std::move(free_.back());
            free_.pop_back();
            return buffer;
        }
        ++allocated_; // reserve the slot, allocate outside the lock
    }

    try {
        auto buffer = std::make_unique<RowBuffer>();
        buffer->reserve(row_capacity_);
        return buffer;
    } catch (...) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            --allocated_;
        }
        available_.notify_one();
        throw;
    }
}

void RowBufferPool::release(std::unique_ptr<RowBuffer> buffer) {
    if (!buffer) return;
    buffer->clear();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        free_.push_back(std::move(buffer));
    }
    available_.notify_one();
}

size_t RowBufferPool::allocated() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return allocated_;
}

} // namespace linesort
