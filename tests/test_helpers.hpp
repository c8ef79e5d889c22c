/* SPDX-FileCopyrightText: 2025 zit Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "zit/tensor.hpp"
#include <cstdlib>
#include <gtest/gtest.h>
#include <random>
#include <unordered_map>
#include <vector>

namespace zit::test {

    // Host allocator that records live allocations so tests can assert nothing leaks
    class CountingAllocator final : public core::Allocator {
    public:
        void* allocate(size_t bytes) override {
            ++allocations;
            if (bytes == 0)
                return nullptr;
            void* ptr = inner_.allocate(bytes);
            live_[ptr] = bytes;
            return ptr;
        }

        void deallocate(void* ptr, size_t bytes) noexcept override {
            ++deallocations;
            if (!ptr)
                return;
            live_.erase(ptr);
            inner_.deallocate(ptr, bytes);
        }

        size_t live_buffers() const { return live_.size(); }

        size_t allocations = 0;
        size_t deallocations = 0;

    private:
        core::HostAllocator inner_;
        std::unordered_map<void*, size_t> live_;
    };

    // Stand-in device memory for BufferPool tests
    class CountingDeviceAllocator final : public core::DeviceAllocator {
    public:
        void* allocate(size_t bytes) override {
            if (fail_next) {
                fail_next = false;
                return nullptr;
            }
            ++allocations;
            last_request = bytes;
            void* ptr = std::malloc(bytes);
            live_[ptr] = bytes;
            return ptr;
        }

        void deallocate(void* ptr) noexcept override {
            ++deallocations;
            live_.erase(ptr);
            std::free(ptr);
        }

        std::string_view name() const override { return "counting"; }

        size_t live_buffers() const { return live_.size(); }

        size_t allocations = 0;
        size_t deallocations = 0;
        size_t last_request = 0;
        bool fail_next = false;

    private:
        std::unordered_map<void*, size_t> live_;
    };

    // One context for the whole test binary; initialized on first use
    inline core::GpuContext& shared_gpu_context() {
        static core::GpuContext context;
        static const bool initialized = context.init();
        (void)initialized;
        return context;
    }

    template <typename T>
    std::vector<T> random_values(size_t n, unsigned seed = 42) {
        std::mt19937 gen(seed);
        std::vector<T> values(n);
        if constexpr (std::is_floating_point_v<T>) {
            std::uniform_real_distribution<T> dist(T(-2), T(2));
            for (auto& v : values)
                v = dist(gen);
        } else {
            std::uniform_int_distribution<int> dist(-9, 9);
            for (auto& v : values)
                v = static_cast<T>(dist(gen));
        }
        return values;
    }

    template <typename T>
    std::vector<T> iota_values(size_t n, T start = T(1)) {
        std::vector<T> values(n);
        for (size_t i = 0; i < n; ++i)
            values[i] = static_cast<T>(start + static_cast<T>(i));
        return values;
    }

    template <core::Container C>
    void expect_near(const C& actual, const C& expected, double tol, const char* what) {
        ASSERT_EQ(actual.shape(), expected.shape()) << what;
        for (size_t i = 0; i < actual.size(); ++i) {
            EXPECT_NEAR(static_cast<double>(actual[i]), static_cast<double>(expected[i]), tol)
                << what << " at flat index " << i;
        }
    }

    template <core::Container C>
    void expect_equal(const C& actual, const C& expected, const char* what) {
        ASSERT_EQ(actual.shape(), expected.shape()) << what;
        for (size_t i = 0; i < actual.size(); ++i) {
            EXPECT_EQ(actual[i], expected[i]) << what << " at flat index " << i;
        }
    }

} // namespace zit::test
