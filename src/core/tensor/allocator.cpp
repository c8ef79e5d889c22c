/* SPDX-FileCopyrightText: 2025 zit Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "zit/tensor/allocator.hpp"
#include "zit/logger.hpp"
#include "zit/tensor/tensor_error.hpp"
#include <cstring>
#include <new>
#include <string>

namespace zit::core {

    void* Allocator::duplicate(const void* src, const size_t bytes) {
        void* dst = allocate(bytes);
        if (bytes > 0)
            std::memcpy(dst, src, bytes);
        return dst;
    }

    void* HostAllocator::allocate(const size_t bytes) {
        if (bytes == 0)
            return nullptr;

        void* ptr = ::operator new(bytes, std::align_val_t{kAlignment}, std::nothrow);
        if (!ptr) {
            throw_tensor_error(ErrorCode::OutOfMemory,
                               "host allocation of " + std::to_string(bytes) + " bytes failed");
        }
        LOG_TRACE("host alloc {} bytes at {}", bytes, ptr);
        return ptr;
    }

    void HostAllocator::deallocate(void* ptr, size_t /*bytes*/) noexcept {
        if (!ptr)
            return;
        ::operator delete(ptr, std::align_val_t{kAlignment});
    }

    Allocator& default_allocator() {
        static HostAllocator instance;
        return instance;
    }

} // namespace zit::core
