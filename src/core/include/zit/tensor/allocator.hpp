/* SPDX-FileCopyrightText: 2025 zit Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "zit/export.hpp"
#include <cstddef>

namespace zit::core {

    // Raw host buffer allocation used by the containers and the tensor context.
    class ZIT_CORE_API Allocator {
    public:
        virtual ~Allocator() = default;

        // Throws TensorError(OutOfMemory) on failure; zero bytes yields nullptr
        virtual void* allocate(size_t bytes) = 0;
        virtual void deallocate(void* ptr, size_t bytes) noexcept = 0;
        // New buffer holding a copy of the first `bytes` of `src`
        virtual void* duplicate(const void* src, size_t bytes);
    };

    // 64-byte aligned heap allocator
    class ZIT_CORE_API HostAllocator final : public Allocator {
    public:
        static constexpr size_t kAlignment = 64;

        void* allocate(size_t bytes) override;
        void deallocate(void* ptr, size_t bytes) noexcept override;
    };

    ZIT_CORE_API Allocator& default_allocator();

} // namespace zit::core
