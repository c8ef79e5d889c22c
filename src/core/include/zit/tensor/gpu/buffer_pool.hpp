/* SPDX-FileCopyrightText: 2025 zit Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "zit/export.hpp"
#include <cstddef>
#include <mutex>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace zit::core {

    // Raw device memory source behind a BufferPool
    class ZIT_CORE_API DeviceAllocator {
    public:
        virtual ~DeviceAllocator() = default;

        // Returns nullptr when the device is out of memory
        virtual void* allocate(size_t bytes) = 0;
        virtual void deallocate(void* ptr) noexcept = 0;
        virtual std::string_view name() const = 0;
    };

    struct DeviceBuffer {
        void* ptr = nullptr;
        size_t capacity = 0;

        explicit operator bool() const noexcept { return ptr != nullptr; }
    };

    class BufferPool;

    // Pool buffer returned to its pool when the handle goes out of scope
    class ZIT_CORE_API PooledBuffer {
    public:
        PooledBuffer() = default;
        PooledBuffer(BufferPool* pool, DeviceBuffer buffer)
            : pool_(pool),
              buffer_(buffer) {}

        PooledBuffer(const PooledBuffer&) = delete;
        PooledBuffer& operator=(const PooledBuffer&) = delete;

        PooledBuffer(PooledBuffer&& other) noexcept
            : pool_(std::exchange(other.pool_, nullptr)),
              buffer_(std::exchange(other.buffer_, DeviceBuffer{})) {}

        PooledBuffer& operator=(PooledBuffer&& other) noexcept;

        ~PooledBuffer();

        void* get() const noexcept { return buffer_.ptr; }
        template <typename T>
        T* as() const noexcept { return static_cast<T*>(buffer_.ptr); }
        size_t capacity() const noexcept { return buffer_.capacity; }
        const DeviceBuffer& buffer() const noexcept { return buffer_; }

        // Hands the buffer back to the pool now
        void reset() noexcept;

    private:
        BufferPool* pool_ = nullptr;
        DeviceBuffer buffer_;
    };

    struct BufferPoolStats {
        size_t hits = 0;
        size_t misses = 0;
        size_t cached_buffers = 0;
        size_t cached_bytes = 0;
        size_t outstanding_buffers = 0;
        size_t outstanding_bytes = 0;
        size_t trimmed_bytes = 0;
    };

    // Free device buffers bucketed by the next power of two of the requested size.
    // A returned buffer is pushed on its bucket and handed out again on the next
    // request of that bucket.
    class ZIT_CORE_API BufferPool {
    public:
        // max_cached_bytes == 0 keeps every returned buffer
        explicit BufferPool(DeviceAllocator& allocator, size_t max_cached_bytes = 0);
        ~BufferPool();

        BufferPool(const BufferPool&) = delete;
        BufferPool& operator=(const BufferPool&) = delete;

        static size_t bucket_size(size_t bytes);

        // Throws TensorError(OutOfMemory) when the allocator fails, BackendError after shutdown
        PooledBuffer acquire(size_t bytes);
        DeviceBuffer acquire_raw(size_t bytes);

        // Throws TensorError(BackendError) for a buffer this pool did not hand out
        void release(DeviceBuffer buffer);

        // Frees every cached buffer; outstanding buffers are untouched
        void trim();
        void shutdown();

        BufferPoolStats stats() const;
        bool is_shutdown() const;
        size_t max_cached_bytes() const noexcept { return max_cached_bytes_; }

    private:
        size_t trim_locked();

        DeviceAllocator& allocator_;
        const size_t max_cached_bytes_;

        mutable std::mutex mutex_;
        std::unordered_map<size_t, std::vector<void*>> cache_;
        std::unordered_map<void*, size_t> outstanding_;
        BufferPoolStats stats_;
        bool shutdown_ = false;
    };

} // namespace zit::core
