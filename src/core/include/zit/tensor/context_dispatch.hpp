/* SPDX-FileCopyrightText: 2025 zit Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "zit/logger.hpp"
#include "zit/parameters.hpp"
#include "zit/tensor/allocator.hpp"
#include "zit/tensor/cpu_backend.hpp"
#include "zit/tensor/gpu/gpu_backend.hpp"
#include "zit/tensor/gpu/gpu_context.hpp"
#include "zit/tensor/simd_backend.hpp"
#include "zit/tensor/tensor_context.hpp"
#include "zit/tensor/tensor_error.hpp"
#include <concepts>
#include <functional>
#include <string>
#include <type_traits>

namespace zit::core {

    // Callable with every context kind, returning the same type for each
    template <typename Fn>
    concept ContextVisitor =
        std::invocable<Fn&, TensorContext<CpuBackend>&> &&
        std::invocable<Fn&, TensorContext<SimdBackend>&> &&
        std::invocable<Fn&, TensorContext<GpuBackend>&> &&
        std::same_as<std::invoke_result_t<Fn&, TensorContext<CpuBackend>&>,
                     std::invoke_result_t<Fn&, TensorContext<SimdBackend>&>> &&
        std::same_as<std::invoke_result_t<Fn&, TensorContext<CpuBackend>&>,
                     std::invoke_result_t<Fn&, TensorContext<GpuBackend>&>>;

    // Builds the TensorContext named by params.backend and calls `fn` with it.
    // `gpu` is only touched for BackendKind::Gpu; an uninitialized context gives the
    // CPU fallback, same as constructing GpuBackend directly.
    template <ContextVisitor Fn>
    std::invoke_result_t<Fn&, TensorContext<CpuBackend>&> with_context(
        const param::ContextParameters& params, GpuContext& gpu, Fn&& fn,
        Allocator& allocator = default_allocator()) {
        switch (params.backend) {
        case param::BackendKind::Cpu: {
            TensorContext<CpuBackend> ctx(CpuBackend{}, allocator);
            return std::invoke(fn, ctx);
        }
        case param::BackendKind::Simd: {
            TensorContext<SimdBackend> ctx(SimdBackend{}, allocator);
            return std::invoke(fn, ctx);
        }
        case param::BackendKind::Gpu: {
            TensorContext<GpuBackend> ctx(GpuBackend(gpu), allocator);
            return std::invoke(fn, ctx);
        }
        }
        throw_tensor_error(ErrorCode::UnsupportedOperation,
                           "unknown backend kind " + std::to_string(static_cast<int>(params.backend)));
    }

    // Same, but owns the device: for BackendKind::Gpu a GpuContext is built from
    // params.gpu, initialized, and shut down once `fn` returns or throws.
    template <ContextVisitor Fn>
    std::invoke_result_t<Fn&, TensorContext<CpuBackend>&> with_context(
        const param::ContextParameters& params, Fn&& fn, Allocator& allocator = default_allocator()) {
        GpuContext gpu(params.gpu.to_options());
        if (params.backend == param::BackendKind::Gpu && !gpu.init()) {
            LOG_DEBUG("GPU context unavailable, backend 'gpu' runs on the CPU");
        }
        return with_context(params, gpu, std::forward<Fn>(fn), allocator);
    }

} // namespace zit::core
