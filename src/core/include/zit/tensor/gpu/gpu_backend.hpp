/* SPDX-FileCopyrightText: 2025 zit Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "zit/export.hpp"
#include "zit/logger.hpp"
#include "zit/tensor/cpu_backend.hpp"
#include "zit/tensor/gpu/gpu_context.hpp"
#include "zit/tensor/tensor_functors.hpp"
#include <concepts>
#include <optional>
#include <string_view>

namespace zit::core {

    // f32 device round trips: pooled device buffers, copy in, launch the pipeline
    // kernel, synchronize the context stream, copy out. Callers have already
    // validated shapes and skipped empty inputs.
    namespace gpu_ops {
        ZIT_CORE_API void elementwise(GpuContext& ctx, GpuKernel kernel,
                                      const float* a, const float* b, float* out, size_t n);
        ZIT_CORE_API void scalar_multiply(GpuContext& ctx, const float* a, float scalar, float* out, size_t n);
        ZIT_CORE_API float vector_dot(GpuContext& ctx, const float* a, const float* b, size_t n);
        ZIT_CORE_API float vector_norm(GpuContext& ctx, const float* a, size_t n);
        ZIT_CORE_API void matrix_vector_multiply(GpuContext& ctx, const float* m, const float* v, float* out,
                                                 size_t rows, size_t cols);
        ZIT_CORE_API void matrix_multiply(GpuContext& ctx, const float* a, const float* b, float* out,
                                          size_t m, size_t k, size_t n);
        ZIT_CORE_API void matrix_transpose(GpuContext& ctx, const float* src, float* dst,
                                           size_t rows, size_t cols);
    } // namespace gpu_ops

    template <typename Fn>
    constexpr std::optional<GpuKernel> binary_kernel_for() {
        if constexpr (std::same_as<Fn, ops::Add>)
            return GpuKernel::Add;
        else if constexpr (std::same_as<Fn, ops::Subtract>)
            return GpuKernel::Subtract;
        else if constexpr (std::same_as<Fn, ops::Multiply>)
            return GpuKernel::Multiply;
        else if constexpr (std::same_as<Fn, ops::Divide>)
            return GpuKernel::Divide;
        else
            return std::nullopt;
    }

    // Runs f32 work on the device when its context is initialized. Everything else
    // (other element types, map, functors without a kernel, uninitialized context)
    // goes to CpuBackend with identical semantics.
    class GpuBackend {
    public:
        explicit GpuBackend(GpuContext& context)
            : context_(&context) {}

        static constexpr std::string_view name() { return "gpu"; }

        GpuContext& context() const noexcept { return *context_; }

        template <Container C, typename Fn>
        void op(const C& a, const C& b, C& out, Fn fn) const {
            using T = typename C::value_type;
            if constexpr (std::same_as<T, float> && binary_kernel_for<Fn>().has_value()) {
                if (device_ready()) {
                    ensure_equal_shape(a, b);
                    ensure_equal_shape(a, out);
                    if (!a.empty()) {
                        gpu_ops::elementwise(*context_, *binary_kernel_for<Fn>(),
                                             a.data(), b.data(), out.data(), a.size());
                    }
                    return;
                }
            }
            note_fallback("op");
            cpu_.op(a, b, out, fn);
        }

        // No device kernel exists for arbitrary host callables
        template <Container C, typename Fn>
        void map(const C& a, C& out, Fn fn) const {
            note_fallback("map");
            cpu_.map(a, out, fn);
        }

        template <Container C>
        void scalar_multiply(const C& a, const typename C::value_type scalar, C& out) const {
            using T = typename C::value_type;
            if constexpr (std::same_as<T, float>) {
                if (device_ready()) {
                    ensure_equal_shape(a, out);
                    if (!a.empty()) {
                        gpu_ops::scalar_multiply(*context_, a.data(), scalar, out.data(), a.size());
                    }
                    return;
                }
            }
            note_fallback("scalar_multiply");
            cpu_.scalar_multiply(a, scalar, out);
        }

        template <Numeric T>
        T vector_dot(const Vector<T>& a, const Vector<T>& b) const {
            if constexpr (std::same_as<T, float>) {
                if (device_ready()) {
                    ensure_equal_shape(a, b);
                    if (a.empty())
                        return 0.0f;
                    return gpu_ops::vector_dot(*context_, a.data(), b.data(), a.length());
                }
            }
            note_fallback("vector_dot");
            return cpu_.vector_dot(a, b);
        }

        template <Numeric T>
        T vector_norm(const Vector<T>& v) const {
            if constexpr (std::same_as<T, float>) {
                if (device_ready()) {
                    if (v.empty())
                        return 0.0f;
                    return gpu_ops::vector_norm(*context_, v.data(), v.length());
                }
            }
            note_fallback("vector_norm");
            return cpu_.vector_norm(v);
        }

        template <Numeric T>
        void matrix_vector_multiply(const Matrix<T>& m, const Vector<T>& v, Vector<T>& out) const {
            if constexpr (std::same_as<T, float>) {
                if (device_ready()) {
                    ensure_matrix_vector_shapes(m, v, out);
                    if (m.rows() == 0)
                        return;
                    if (m.columns() == 0) {
                        out.fill(0.0f);
                        return;
                    }
                    gpu_ops::matrix_vector_multiply(*context_, m.data(), v.data(), out.data(),
                                                    m.rows(), m.columns());
                    return;
                }
            }
            note_fallback("matrix_vector_multiply");
            cpu_.matrix_vector_multiply(m, v, out);
        }

        template <Numeric T>
        void matrix_multiply(const Matrix<T>& a, const Matrix<T>& b, Matrix<T>& out) const {
            if constexpr (std::same_as<T, float>) {
                if (device_ready()) {
                    ensure_matrix_multiply_shapes(a, b, out);
                    if (out.empty())
                        return;
                    if (a.columns() == 0) {
                        out.fill(0.0f);
                        return;
                    }
                    gpu_ops::matrix_multiply(*context_, a.data(), b.data(), out.data(),
                                             a.rows(), a.columns(), b.columns());
                    return;
                }
            }
            note_fallback("matrix_multiply");
            cpu_.matrix_multiply(a, b, out);
        }

        template <Numeric T>
        void matrix_transpose(const Matrix<T>& m, Matrix<T>& out) const {
            if constexpr (std::same_as<T, float>) {
                if (device_ready()) {
                    ensure_transpose_shapes(m, out);
                    if (m.empty())
                        return;
                    gpu_ops::matrix_transpose(*context_, m.data(), out.data(), m.rows(), m.columns());
                    return;
                }
            }
            note_fallback("matrix_transpose");
            cpu_.matrix_transpose(m, out);
        }

    private:
        bool device_ready() const noexcept { return context_->is_initialized(); }

        static void note_fallback(const std::string_view operation) {
            LOG_TRACE("gpu {}: running on CPU fallback", operation);
        }

        GpuContext* context_;
        CpuBackend cpu_;
    };

} // namespace zit::core
