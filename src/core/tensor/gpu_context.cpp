/* SPDX-FileCopyrightText: 2025 zit Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "zit/tensor/gpu/gpu_context.hpp"
#include "zit/logger.hpp"
#include "zit/tensor/tensor_error.hpp"

#ifdef ZIT_WITH_CUDA
#include "internal/tensor_kernels.hpp"
#include "zit/cuda_debug.hpp"
#include <cuda_runtime.h>
#endif

namespace zit::core {

    std::string_view gpu_kernel_name(const GpuKernel kernel) {
        switch (kernel) {
        case GpuKernel::Add: return "add";
        case GpuKernel::Subtract: return "subtract";
        case GpuKernel::Multiply: return "multiply";
        case GpuKernel::Divide: return "divide";
        case GpuKernel::ScalarMultiply: return "scalar_multiply";
        case GpuKernel::VectorDot: return "vector_dot";
        case GpuKernel::VectorNorm: return "vector_norm";
        case GpuKernel::MatrixVectorMultiply: return "matrix_vector_multiply";
        case GpuKernel::MatrixMultiply: return "matrix_multiply";
        case GpuKernel::MatrixTranspose: return "matrix_transpose";
        case GpuKernel::Count: break;
        }
        return "unknown";
    }

#ifdef ZIT_WITH_CUDA
    namespace {

        class CudaDeviceAllocator final : public DeviceAllocator {
        public:
            void* allocate(const size_t bytes) override {
                void* ptr = nullptr;
                const cudaError_t err = cudaMalloc(&ptr, bytes);
                if (err != cudaSuccess) {
                    LOG_WARN("cudaMalloc failed for {} bytes: {}", bytes, cudaGetErrorString(err));
                    cudaGetLastError();
                    return nullptr;
                }
                return ptr;
            }

            void deallocate(void* ptr) noexcept override {
                if (ptr)
                    CHECK_CUDA(cudaFree(ptr));
            }

            std::string_view name() const override { return "cuda"; }
        };

    } // namespace
#endif

    GpuContext::GpuContext(GpuOptions options)
        : options_(options) {}

    GpuContext::~GpuContext() {
        shutdown();
    }

    bool GpuContext::is_available() {
#ifdef ZIT_WITH_CUDA
        int count = 0;
        const cudaError_t err = cudaGetDeviceCount(&count);
        if (err != cudaSuccess) {
            cudaGetLastError();
            return false;
        }
        return count > 0;
#else
        return false;
#endif
    }

    bool GpuContext::init() {
        if (initialized_)
            return true;

        if (!options_.enabled) {
            LOG_INFO("GPU backend disabled by configuration, using CPU fallback");
            return false;
        }

#ifdef ZIT_WITH_CUDA
        int count = 0;
        const cudaError_t count_err = cudaGetDeviceCount(&count);
        if (count_err != cudaSuccess || count == 0) {
            cudaGetLastError();
            LOG_WARN("No CUDA device available ({}), GPU operations fall back to CPU",
                     count_err != cudaSuccess ? cudaGetErrorString(count_err) : "device count is 0");
            return false;
        }
        if (options_.device_index < 0 || options_.device_index >= count) {
            throw_tensor_error(ErrorCode::BackendError,
                               "CUDA device index " + std::to_string(options_.device_index) + " out of range (" +
                                   std::to_string(count) + " devices)");
        }

        CHECK_CUDA_THROW(cudaSetDevice(options_.device_index));

        cudaDeviceProp props{};
        CHECK_CUDA_THROW(cudaGetDeviceProperties(&props, options_.device_index));
        device_name_ = props.name;

        build_pipelines();

        cudaStream_t stream = nullptr;
        const cudaError_t stream_err = cudaStreamCreateWithFlags(&stream, cudaStreamNonBlocking);
        if (stream_err != cudaSuccess) {
            pipelines_ = {};
            CHECK_CUDA_THROW(stream_err);
        }
        stream_ = stream;

        device_allocator_ = std::make_unique<CudaDeviceAllocator>();
        pool_ = std::make_unique<BufferPool>(*device_allocator_, options_.max_cached_bytes);
        initialized_ = true;

        LOG_INFO("GPU context initialized on device {} ({}, sm_{}{})",
                 options_.device_index, device_name_, props.major, props.minor);
        return true;
#else
        LOG_WARN("Built without CUDA support, GPU operations fall back to CPU");
        return false;
#endif
    }

    void GpuContext::build_pipelines() {
#ifdef ZIT_WITH_CUDA
        for (size_t i = 0; i < kGpuKernelCount; ++i) {
            const auto kernel = static_cast<GpuKernel>(i);
            const void* function = tensor_kernels::kernel_function(kernel);
            if (!function) {
                pipelines_ = {};
                throw_tensor_error(ErrorCode::BackendError,
                                   "no kernel compiled for pipeline '" + std::string(gpu_kernel_name(kernel)) + "'");
            }

            cudaFuncAttributes attrs{};
            const cudaError_t err = cudaFuncGetAttributes(&attrs, function);
            if (err != cudaSuccess) {
                pipelines_ = {};
                cudaGetLastError();
                throw_tensor_error(ErrorCode::BackendError,
                                   "kernel '" + std::string(gpu_kernel_name(kernel)) +
                                       "' is not loadable on this device: " + cudaGetErrorString(err));
            }

            pipelines_[i] = KernelPipeline{function, attrs.maxThreadsPerBlock};
            LOG_DEBUG("Pipeline '{}' ready (max {} threads/block, {} registers)",
                      gpu_kernel_name(kernel), attrs.maxThreadsPerBlock, attrs.numRegs);
        }
#endif
    }

    void GpuContext::shutdown() {
        if (!initialized_)
            return;

        if (pool_) {
            pool_->shutdown();
            pool_.reset();
        }
        device_allocator_.reset();
        pipelines_ = {};

#ifdef ZIT_WITH_CUDA
        if (stream_) {
            CHECK_CUDA(cudaStreamSynchronize(stream_));
            CHECK_CUDA(cudaStreamDestroy(stream_));
        }
#endif
        stream_ = nullptr;
        initialized_ = false;
        LOG_INFO("GPU context on device {} shut down", options_.device_index);
    }

    void GpuContext::ensure_initialized(const std::string_view what) const {
        if (!initialized_) {
            throw_tensor_error(ErrorCode::BackendError,
                               std::string(what) + " requested from an uninitialized GPU context");
        }
    }

    BufferPool& GpuContext::pool() {
        ensure_initialized("buffer pool");
        return *pool_;
    }

    CUstream_st* GpuContext::stream() const {
        ensure_initialized("stream");
        return stream_;
    }

    const KernelPipeline& GpuContext::pipeline(const GpuKernel kernel) const {
        ensure_initialized("pipeline");
        const auto index = static_cast<size_t>(kernel);
        if (index >= kGpuKernelCount || !pipelines_[index]) {
            throw_tensor_error(ErrorCode::BackendError,
                               "missing pipeline '" + std::string(gpu_kernel_name(kernel)) + "'");
        }
        return pipelines_[index];
    }

} // namespace zit::core
