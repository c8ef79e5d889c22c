/* SPDX-FileCopyrightText: 2025 zit Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "zit/tensor/gpu/buffer_pool.hpp"
#include "zit/logger.hpp"
#include "zit/tensor/tensor_error.hpp"
#include <bit>
#include <limits>
#include <string>

namespace zit::core {

    PooledBuffer& PooledBuffer::operator=(PooledBuffer&& other) noexcept {
        if (this != &other) {
            reset();
            pool_ = std::exchange(other.pool_, nullptr);
            buffer_ = std::exchange(other.buffer_, DeviceBuffer{});
        }
        return *this;
    }

    PooledBuffer::~PooledBuffer() {
        reset();
    }

    void PooledBuffer::reset() noexcept {
        if (pool_ && buffer_) {
            try {
                pool_->release(buffer_);
            } catch (const TensorError& e) {
                LOG_ERROR("Failed to return pooled buffer {}: {}", buffer_.ptr, e.what());
            }
        }
        pool_ = nullptr;
        buffer_ = DeviceBuffer{};
    }

    BufferPool::BufferPool(DeviceAllocator& allocator, const size_t max_cached_bytes)
        : allocator_(allocator),
          max_cached_bytes_(max_cached_bytes) {
        LOG_DEBUG("BufferPool created on {} allocator (cache cap: {} bytes)",
                  allocator_.name(), max_cached_bytes_);
    }

    BufferPool::~BufferPool() {
        shutdown();
    }

    size_t BufferPool::bucket_size(const size_t bytes) {
        if (bytes <= 1)
            return 1;
        if (bytes > (std::numeric_limits<size_t>::max() >> 1) + 1) {
            throw_tensor_error(ErrorCode::OutOfMemory,
                               "buffer request of " + std::to_string(bytes) + " bytes has no power-of-two bucket");
        }
        return std::bit_ceil(bytes);
    }

    PooledBuffer BufferPool::acquire(const size_t bytes) {
        return PooledBuffer(this, acquire_raw(bytes));
    }

    DeviceBuffer BufferPool::acquire_raw(const size_t bytes) {
        const size_t bucket = bucket_size(bytes);

        std::lock_guard lock(mutex_);
        if (shutdown_) {
            throw_tensor_error(ErrorCode::BackendError, "buffer pool used after shutdown");
        }

        auto it = cache_.find(bucket);
        if (it != cache_.end() && !it->second.empty()) {
            void* ptr = it->second.back();
            it->second.pop_back();
            outstanding_[ptr] = bucket;
            stats_.hits++;
            stats_.cached_buffers--;
            stats_.cached_bytes -= bucket;
            stats_.outstanding_buffers++;
            stats_.outstanding_bytes += bucket;
            LOG_TRACE("BufferPool hit: {} bytes from bucket {}", bytes, bucket);
            return DeviceBuffer{ptr, bucket};
        }

        void* ptr = allocator_.allocate(bucket);
        if (!ptr && stats_.cached_bytes > 0) {
            // Cached buffers of other sizes may be holding the memory we need
            LOG_DEBUG("BufferPool allocation of {} bytes failed, trimming cache and retrying", bucket);
            trim_locked();
            ptr = allocator_.allocate(bucket);
        }
        if (!ptr) {
            throw_tensor_error(ErrorCode::OutOfMemory,
                               "device allocation of " + std::to_string(bucket) + " bytes failed on " +
                                   std::string(allocator_.name()));
        }

        outstanding_[ptr] = bucket;
        stats_.misses++;
        stats_.outstanding_buffers++;
        stats_.outstanding_bytes += bucket;
        LOG_TRACE("BufferPool miss: allocated bucket {} for {} bytes", bucket, bytes);
        return DeviceBuffer{ptr, bucket};
    }

    void BufferPool::release(const DeviceBuffer buffer) {
        if (!buffer)
            return;

        std::lock_guard lock(mutex_);
        auto it = outstanding_.find(buffer.ptr);
        if (it == outstanding_.end()) {
            throw_tensor_error(ErrorCode::BackendError,
                               "buffer returned to a pool that does not own it (or returned twice)");
        }
        const size_t bucket = it->second;
        outstanding_.erase(it);
        stats_.outstanding_buffers--;
        stats_.outstanding_bytes -= bucket;

        if (shutdown_ || (max_cached_bytes_ > 0 && stats_.cached_bytes + bucket > max_cached_bytes_)) {
            allocator_.deallocate(buffer.ptr);
            LOG_TRACE("BufferPool freed bucket {} (cache full or shut down)", bucket);
            return;
        }

        cache_[bucket].push_back(buffer.ptr);
        stats_.cached_buffers++;
        stats_.cached_bytes += bucket;
    }

    size_t BufferPool::trim_locked() {
        size_t freed_bytes = 0;
        size_t freed_buffers = 0;
        for (auto& [bucket, buffers] : cache_) {
            for (void* ptr : buffers) {
                allocator_.deallocate(ptr);
                freed_bytes += bucket;
                freed_buffers++;
            }
        }
        cache_.clear();
        stats_.cached_buffers = 0;
        stats_.cached_bytes = 0;
        stats_.trimmed_bytes += freed_bytes;

        if (freed_buffers > 0) {
            LOG_DEBUG("BufferPool trimmed {} buffers ({} bytes)", freed_buffers, freed_bytes);
        }
        return freed_bytes;
    }

    void BufferPool::trim() {
        std::lock_guard lock(mutex_);
        trim_locked();
    }

    void BufferPool::shutdown() {
        std::lock_guard lock(mutex_);
        if (shutdown_)
            return;
        shutdown_ = true;

        trim_locked();
        if (!outstanding_.empty()) {
            LOG_ERROR("BufferPool shut down with {} buffers ({} bytes) still outstanding",
                      stats_.outstanding_buffers, stats_.outstanding_bytes);
        }
        LOG_DEBUG("BufferPool shut down (hits: {}, misses: {})", stats_.hits, stats_.misses);
    }

    BufferPoolStats BufferPool::stats() const {
        std::lock_guard lock(mutex_);
        return stats_;
    }

    bool BufferPool::is_shutdown() const {
        std::lock_guard lock(mutex_);
        return shutdown_;
    }

} // namespace zit::core
