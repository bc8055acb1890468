#ifndef LINESORT_BUFFER_POOL_HPP
#define LINESORT_BUFFER_POOL_HPP

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

#include "record.hpp"

namespace linesort {

/**
 * Fixed-capacity pool of row buffers shared by the sort workers.
 *
 * Every buffer reserves row_capacity rows. At most max_buffers exist at once:
 * acquire() hands out a free buffer, allocates a new one when none is free and
 * the limit is not reached yet, and blocks otherwise. The lock is never held
 * while allocating.
 */
class RowBufferPool {
public:
    // RAII handle returning its buffer to the pool
    class Lease {
    public:
        Lease(RowBufferPool& pool, std::unique_ptr<RowBuffer> buffer)
            : pool_(&pool), buffer_(std::move(buffer)) {}
        Lease(Lease&& other) noexcept = default;
        Lease& operator=(Lease&&) = delete;
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        ~Lease() {
            if (buffer_) pool_->release(std::move(buffer_));
        }

        RowBuffer& rows() { return *buffer_; }

    private:
        RowBufferPool* pool_;
        std::unique_ptr<RowBuffer> buffer_;
    };

    RowBufferPool(size_t row_capacity, size_t max_buffers);

    RowBufferPool(const RowBufferPool&) = delete;
    RowBufferPool& operator=(const RowBufferPool&) = delete;

    std::unique_ptr<RowBuffer> acquire();

    // Clears the rows (capacity is kept) and makes the buffer available again
    void release(std::unique_ptr<RowBuffer> buffer);

    Lease lease() { return Lease(*this, acquire()); }

    size_t row_capacity() const { return row_capacity_; }
    size_t max_buffers() const { return max_buffers_; }

    // Buffers created so far (never more than max_buffers)
    size_t allocated() const;

private:
    const size_t row_capacity_;
    const size_t max_buffers_;

    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::vector<std::unique_ptr<RowBuffer>> free_;
    size_t allocated_ = 0;
};

} // namespace linesort

#endif // LINESORT_BUFFER_POOL_HPP
