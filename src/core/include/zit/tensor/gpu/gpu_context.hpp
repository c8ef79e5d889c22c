/* SPDX-FileCopyrightText: 2025 zit Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "zit/export.hpp"
#include "zit/tensor/gpu/buffer_pool.hpp"
#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

// cudaStream_t is CUstream_st*
struct CUstream_st;

namespace zit::core {

    struct GpuOptions {
        bool enabled = true;
        int device_index = 0;
        size_t max_cached_bytes = 0; // 0 = unbounded pool cache
    };

    enum class GpuKernel : uint8_t {
        Add,
        Subtract,
        Multiply,
        Divide,
        ScalarMultiply,
        VectorDot,
        VectorNorm,
        MatrixVectorMultiply,
        MatrixMultiply,
        MatrixTranspose,
        Count
    };

    inline constexpr size_t kGpuKernelCount = static_cast<size_t>(GpuKernel::Count);

    ZIT_CORE_API std::string_view gpu_kernel_name(GpuKernel kernel);

    struct KernelPipeline {
        const void* function = nullptr;
        int max_threads_per_block = 0;

        explicit operator bool() const noexcept { return function != nullptr; }
    };

    // Device, stream, kernel pipelines and buffer pool shared by GpuBackend instances.
    // Constructed and owned by the caller; not safe for concurrent use.
    class ZIT_CORE_API GpuContext {
    public:
        explicit GpuContext(GpuOptions options = {});
        ~GpuContext();

        GpuContext(const GpuContext&) = delete;
        GpuContext& operator=(const GpuContext&) = delete;

        // Idempotent. Returns false when no usable device exists (callers then get the
        // CPU fallback). Throws TensorError(BackendError) if the device is present but
        // stream creation or kernel validation fails.
        bool init();
        // Releases pool, pipelines, stream and device state. Safe when not initialized.
        void shutdown();

        bool is_initialized() const noexcept { return initialized_; }
        // Checks for a CUDA device without initializing anything
        static bool is_available();

        const GpuOptions& options() const noexcept { return options_; }
        const std::string& device_name() const noexcept { return device_name_; }
        int device_index() const noexcept { return options_.device_index; }

        // The following throw TensorError(BackendError) when the context is not initialized
        BufferPool& pool();
        CUstream_st* stream() const;
        const KernelPipeline& pipeline(GpuKernel kernel) const;

    private:
        void ensure_initialized(std::string_view what) const;
        void build_pipelines();

        GpuOptions options_;
        bool initialized_ = false;
        std::string device_name_;
        CUstream_st* stream_ = nullptr;
        std::array<KernelPipeline, kGpuKernelCount> pipelines_{};
        std::unique_ptr<DeviceAllocator> device_allocator_;
        std::unique_ptr<BufferPool> pool_;
    };

} // namespace zit::core
