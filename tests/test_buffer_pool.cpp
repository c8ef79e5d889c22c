/* SPDX-FileCopyrightText: 2025 zit Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "test_helpers.hpp"
#include "zit/tensor/gpu/buffer_pool.hpp"
#include <gtest/gtest.h>

using namespace zit::core;
using zit::test::CountingDeviceAllocator;

class BufferPoolTest : public ::testing::Test {
protected:
    CountingDeviceAllocator device;
};

TEST_F(BufferPoolTest, BucketsAreNextPowerOfTwo) {
    EXPECT_EQ(BufferPool::bucket_size(0), 1u);
    EXPECT_EQ(BufferPool::bucket_size(1), 1u);
    EXPECT_EQ(BufferPool::bucket_size(3), 4u);
    EXPECT_EQ(BufferPool::bucket_size(64), 64u);
    EXPECT_EQ(BufferPool::bucket_size(65), 128u);
    EXPECT_EQ(BufferPool::bucket_size(1000), 1024u);
}

TEST_F(BufferPoolTest, AllocatesBucketSize) {
    BufferPool pool(device);
    auto buf = pool.acquire(100);
    EXPECT_NE(buf.get(), nullptr);
    EXPECT_EQ(buf.capacity(), 128u);
    EXPECT_EQ(device.last_request, 128u);
}

TEST_F(BufferPoolTest, ReturnedBufferIsReusedForSameSize) {
    BufferPool pool(device);
    void* first = nullptr;
    {
        auto buf = pool.acquire(4096);
        first = buf.get();
    }
    auto again = pool.acquire(4096);
    EXPECT_EQ(again.get(), first);
    EXPECT_EQ(device.allocations, 1u);

    const auto stats = pool.stats();
    EXPECT_EQ(stats.hits, 1u);
    EXPECT_EQ(stats.misses, 1u);
}

TEST_F(BufferPoolTest, SizesInSameBucketShareBuffers) {
    BufferPool pool(device);
    void* first = nullptr;
    {
        auto buf = pool.acquire(600);
        first = buf.get();
    }
    auto again = pool.acquire(1000);
    EXPECT_EQ(again.get(), first);
}

TEST_F(BufferPoolTest, OutstandingBuffersAreNeverSharedOut) {
    BufferPool pool(device);
    auto a = pool.acquire(256);
    auto b = pool.acquire(256);
    EXPECT_NE(a.get(), b.get());
    EXPECT_EQ(pool.stats().outstanding_buffers, 2u);
}

TEST_F(BufferPoolTest, DoubleReturnIsRejected) {
    BufferPool pool(device);
    const DeviceBuffer raw = pool.acquire_raw(32);
    pool.release(raw);
    try {
        pool.release(raw);
        FAIL() << "expected BackendError";
    } catch (const TensorError& e) {
        EXPECT_EQ(e.code(), ErrorCode::BackendError);
    }
}

TEST_F(BufferPoolTest, ForeignBufferIsRejected) {
    BufferPool pool(device);
    int not_pooled = 0;
    EXPECT_THROW(pool.release(DeviceBuffer{&not_pooled, 4}), TensorError);
}

TEST_F(BufferPoolTest, HandleReturnsOnExceptionPath) {
    BufferPool pool(device);
    try {
        auto a = pool.acquire(64);
        auto b = pool.acquire(64);
        throw TensorError(ErrorCode::BackendError, "simulated launch failure");
    } catch (const TensorError&) {
    }
    EXPECT_EQ(pool.stats().outstanding_buffers, 0u);
    EXPECT_EQ(pool.stats().cached_buffers, 2u);
}

TEST_F(BufferPoolTest, MovedHandleReturnsOnce) {
    BufferPool pool(device);
    {
        auto a = pool.acquire(16);
        auto b = std::move(a);
        EXPECT_EQ(a.get(), nullptr);
        PooledBuffer c;
        c = std::move(b);
        EXPECT_NE(c.get(), nullptr);
    }
    EXPECT_EQ(pool.stats().cached_buffers, 1u);
    EXPECT_EQ(pool.stats().outstanding_buffers, 0u);
}

TEST_F(BufferPoolTest, TrimFreesCachedBuffers) {
    BufferPool pool(device);
    {
        auto a = pool.acquire(100);
        auto b = pool.acquire(5000);
    }
    auto held = pool.acquire(10);
    EXPECT_EQ(device.live_buffers(), 3u);

    pool.trim();
    EXPECT_EQ(device.live_buffers(), 1u);
    EXPECT_EQ(pool.stats().cached_bytes, 0u);
    EXPECT_EQ(pool.stats().trimmed_bytes, 128u + 8192u);
}

TEST_F(BufferPoolTest, CacheCapFreesOverflow) {
    BufferPool pool(device, 1024);
    {
        auto a = pool.acquire(1024);
        auto b = pool.acquire(1024);
    }
    EXPECT_EQ(pool.stats().cached_bytes, 1024u);
    EXPECT_EQ(device.live_buffers(), 1u);
}

TEST_F(BufferPoolTest, AllocationFailureRetriesAfterTrim) {
    BufferPool pool(device);
    {
        auto a = pool.acquire(64);
    }
    device.fail_next = true;
    auto b = pool.acquire(4096);
    EXPECT_NE(b.get(), nullptr);
    EXPECT_EQ(pool.stats().cached_buffers, 0u);
}

TEST_F(BufferPoolTest, AllocationFailureIsOutOfMemory) {
    BufferPool pool(device);
    device.fail_next = true;
    try {
        (void)pool.acquire(64);
        FAIL() << "expected OutOfMemory";
    } catch (const TensorError& e) {
        EXPECT_EQ(e.code(), ErrorCode::OutOfMemory);
    }
}

TEST_F(BufferPoolTest, ShutdownFreesEverythingAndRejectsAcquire) {
    BufferPool pool(device);
    {
        auto a = pool.acquire(64);
    }
    auto held = pool.acquire_raw(128);
    pool.shutdown();
    EXPECT_TRUE(pool.is_shutdown());
    EXPECT_EQ(device.live_buffers(), 1u);
    EXPECT_THROW((void)pool.acquire(64), TensorError);

    // Late returns are freed rather than cached
    pool.release(held);
    EXPECT_EQ(device.live_buffers(), 0u);
}

TEST_F(BufferPoolTest, DestructorFreesCache) {
    {
        BufferPool pool(device);
        auto a = pool.acquire(64);
        auto b = pool.acquire(64);
    }
    EXPECT_EQ(device.live_buffers(), 0u);
    EXPECT_EQ(device.deallocations, 2u);
}
