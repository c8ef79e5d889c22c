/* SPDX-FileCopyrightText: 2025 zit Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "zit/tensor/gpu/gpu_backend.hpp"
#include "zit/tensor/tensor_error.hpp"

#ifdef ZIT_WITH_CUDA
#include "internal/tensor_kernels.hpp"
#include "zit/cuda_debug.hpp"
#include <algorithm>
#include <cuda_runtime.h>
#endif

namespace zit::core::gpu_ops {

#ifdef ZIT_WITH_CUDA
    namespace {

        using tensor_kernels::kBlockSize;
        using tensor_kernels::kMaxGridX;
        using tensor_kernels::kMaxGridY;
        using tensor_kernels::kTile;

        unsigned grid_1d(const size_t n) {
            const size_t blocks = (n + kBlockSize - 1) / kBlockSize;
            return static_cast<unsigned>(std::min<size_t>(blocks, kMaxGridX));
        }

        // Both axes clamped; the matrix kernels stride over whatever the grid does not cover
        dim3 grid_2d(const size_t columns, const size_t rows) {
            return dim3(static_cast<unsigned>(std::min<size_t>((columns + kTile - 1) / kTile, kMaxGridX)),
                        static_cast<unsigned>(std::min<size_t>((rows + kTile - 1) / kTile, kMaxGridY)));
        }

        void launch(GpuContext& ctx, const GpuKernel kernel, const dim3 grid, const dim3 block, void** args) {
            const KernelPipeline& pipeline = ctx.pipeline(kernel);
            if (static_cast<int>(block.x * block.y * block.z) > pipeline.max_threads_per_block) {
                throw_tensor_error(ErrorCode::BackendError,
                                   "pipeline '" + std::string(gpu_kernel_name(kernel)) + "' supports at most " +
                                       std::to_string(pipeline.max_threads_per_block) + " threads per block");
            }
            CHECK_CUDA_THROW(cudaLaunchKernel(pipeline.function, grid, block, args, 0, ctx.stream()));
        }

        void upload(GpuContext& ctx, const PooledBuffer& dst, const float* src, const size_t count) {
            CHECK_CUDA_THROW(cudaMemcpyAsync(dst.get(), src, count * sizeof(float),
                                             cudaMemcpyHostToDevice, ctx.stream()));
        }

        void download(GpuContext& ctx, float* dst, const PooledBuffer& src, const size_t count) {
            CHECK_CUDA_THROW(cudaMemcpyAsync(dst, src.get(), count * sizeof(float),
                                             cudaMemcpyDeviceToHost, ctx.stream()));
            CHECK_CUDA_THROW(cudaStreamSynchronize(ctx.stream()));
        }

    } // namespace

    void elementwise(GpuContext& ctx, const GpuKernel kernel,
                     const float* a, const float* b, float* out, const size_t n) {
        auto& pool = ctx.pool();
        auto da = pool.acquire(n * sizeof(float));
        auto db = pool.acquire(n * sizeof(float));
        auto dout = pool.acquire(n * sizeof(float));

        upload(ctx, da, a, n);
        upload(ctx, db, b, n);

        const float* pa = da.as<float>();
        const float* pb = db.as<float>();
        float* pout = dout.as<float>();
        size_t count = n;
        void* args[] = {&pa, &pb, &pout, &count};
        launch(ctx, kernel, dim3(grid_1d(n)), dim3(kBlockSize), args);

        download(ctx, out, dout, n);
    }

    void scalar_multiply(GpuContext& ctx, const float* a, float scalar, float* out, const size_t n) {
        auto& pool = ctx.pool();
        auto da = pool.acquire(n * sizeof(float));
        auto dout = pool.acquire(n * sizeof(float));

        upload(ctx, da, a, n);

        const float* pa = da.as<float>();
        float* pout = dout.as<float>();
        size_t count = n;
        void* args[] = {&pa, &scalar, &pout, &count};
        launch(ctx, GpuKernel::ScalarMultiply, dim3(grid_1d(n)), dim3(kBlockSize), args);

        download(ctx, out, dout, n);
    }

    float vector_dot(GpuContext& ctx, const float* a, const float* b, const size_t n) {
        auto& pool = ctx.pool();
        auto da = pool.acquire(n * sizeof(float));
        auto db = pool.acquire(n * sizeof(float));
        auto dresult = pool.acquire(sizeof(float));

        upload(ctx, da, a, n);
        upload(ctx, db, b, n);

        const float* pa = da.as<float>();
        const float* pb = db.as<float>();
        float* presult = dresult.as<float>();
        size_t count = n;
        void* args[] = {&pa, &pb, &presult, &count};
        launch(ctx, GpuKernel::VectorDot, dim3(1), dim3(kBlockSize), args);

        float result = 0.0f;
        download(ctx, &result, dresult, 1);
        return result;
    }

    float vector_norm(GpuContext& ctx, const float* a, const size_t n) {
        auto& pool = ctx.pool();
        auto da = pool.acquire(n * sizeof(float));
        auto dresult = pool.acquire(sizeof(float));

        upload(ctx, da, a, n);

        const float* pa = da.as<float>();
        float* presult = dresult.as<float>();
        size_t count = n;
        void* args[] = {&pa, &presult, &count};
        launch(ctx, GpuKernel::VectorNorm, dim3(1), dim3(kBlockSize), args);

        float result = 0.0f;
        download(ctx, &result, dresult, 1);
        return result;
    }

    void matrix_vector_multiply(GpuContext& ctx, const float* m, const float* v, float* out,
                                const size_t rows, const size_t cols) {
        auto& pool = ctx.pool();
        auto dm = pool.acquire(rows * cols * sizeof(float));
        auto dv = pool.acquire(cols * sizeof(float));
        auto dout = pool.acquire(rows * sizeof(float));

        upload(ctx, dm, m, rows * cols);
        upload(ctx, dv, v, cols);

        const float* pm = dm.as<float>();
        const float* pv = dv.as<float>();
        float* pout = dout.as<float>();
        size_t r = rows;
        size_t c = cols;
        void* args[] = {&pm, &pv, &pout, &r, &c};
        launch(ctx, GpuKernel::MatrixVectorMultiply, dim3(grid_1d(rows)), dim3(kBlockSize), args);

        download(ctx, out, dout, rows);
    }

    void matrix_multiply(GpuContext& ctx, const float* a, const float* b, float* out,
                         const size_t m, const size_t k, const size_t n) {
        auto& pool = ctx.pool();
        auto da = pool.acquire(m * k * sizeof(float));
        auto db = pool.acquire(k * n * sizeof(float));
        auto dout = pool.acquire(m * n * sizeof(float));

        upload(ctx, da, a, m * k);
        upload(ctx, db, b, k * n);

        const float* pa = da.as<float>();
        const float* pb = db.as<float>();
        float* pout = dout.as<float>();
        size_t dm = m;
        size_t dk = k;
        size_t dn = n;
        void* args[] = {&pa, &pb, &pout, &dm, &dk, &dn};
        launch(ctx, GpuKernel::MatrixMultiply, grid_2d(n, m), dim3(kTile, kTile), args);

        download(ctx, out, dout, m * n);
    }

    void matrix_transpose(GpuContext& ctx, const float* src, float* dst, const size_t rows, const size_t cols) {
        auto& pool = ctx.pool();
        auto dsrc = pool.acquire(rows * cols * sizeof(float));
        auto ddst = pool.acquire(rows * cols * sizeof(float));

        upload(ctx, dsrc, src, rows * cols);

        const float* psrc = dsrc.as<float>();
        float* pdst = ddst.as<float>();
        size_t r = rows;
        size_t c = cols;
        void* args[] = {&psrc, &pdst, &r, &c};
        launch(ctx, GpuKernel::MatrixTranspose, grid_2d(cols, rows), dim3(kTile, kTile), args);

        download(ctx, dst, ddst, rows * cols);
    }

#else

    namespace {
        [[noreturn]] void no_device(const std::string_view operation) {
            throw_tensor_error(ErrorCode::BackendError,
                               std::string(operation) + ": built without CUDA support");
        }
    } // namespace

    void elementwise(GpuContext&, GpuKernel, const float*, const float*, float*, size_t) {
        no_device("elementwise");
    }

    void scalar_multiply(GpuContext&, const float*, float, float*, size_t) {
        no_device("scalar_multiply");
    }

    float vector_dot(GpuContext&, const float*, const float*, size_t) {
        no_device("vector_dot");
    }

    float vector_norm(GpuContext&, const float*, size_t) {
        no_device("vector_norm");
    }

    void matrix_vector_multiply(GpuContext&, const float*, const float*, float*, size_t, size_t) {
        no_device("matrix_vector_multiply");
    }

    void matrix_multiply(GpuContext&, const float*, const float*, float*, size_t, size_t, size_t) {
        no_device("matrix_multiply");
    }

    void matrix_transpose(GpuContext&, const float*, float*, size_t, size_t) {
        no_device("matrix_transpose");
    }

#endif

} // namespace zit::core::gpu_ops
