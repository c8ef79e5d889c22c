/* SPDX-FileCopyrightText: 2025 zit Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "zit/tensor/cpu_backend.hpp"
#include "zit/tensor/simd_lane.hpp"
#include <algorithm>
#include <string_view>

namespace zit::core {

    // Processes kChunkSize elements per step with vector-extension lanes. Indices past
    // the last full chunk are handled by a scalar loop over the remainder only.
    // Callables that do not opt in through simd::lane_capable, lambdas included, run the
    // scalar loop over the full range.
    class SimdBackend {
    public:
        static constexpr std::string_view name() { return "simd"; }

        template <Container C, typename Fn>
        void op(const C& a, const C& b, C& out, Fn fn) const {
            using T = typename C::value_type;
            ensure_equal_shape(a, b);
            ensure_equal_shape(a, out);

            const T* ad = a.data();
            const T* bd = b.data();
            T* od = out.data();
            const size_t n = a.size();
            size_t i = 0;
            if constexpr (simd::LaneBinaryOp<Fn, T>) {
                for (; i + simd::kChunkSize <= n; i += simd::kChunkSize) {
                    simd::store<T>(od + i, fn(simd::load<T>(ad + i), simd::load<T>(bd + i)));
                }
            }
            for (; i < n; ++i) {
                od[i] = fn(ad[i], bd[i]);
            }
        }

        template <Container C, typename Fn>
        void map(const C& a, C& out, Fn fn) const {
            using T = typename C::value_type;
            ensure_equal_shape(a, out);

            const T* ad = a.data();
            T* od = out.data();
            const size_t n = a.size();
            size_t i = 0;
            if constexpr (simd::LaneUnaryOp<Fn, T>) {
                for (; i + simd::kChunkSize <= n; i += simd::kChunkSize) {
                    simd::store<T>(od + i, fn(simd::load<T>(ad + i)));
                }
            }
            for (; i < n; ++i) {
                od[i] = fn(ad[i]);
            }
        }

        template <Container C>
        void scalar_multiply(const C& a, const typename C::value_type scalar, C& out) const {
            using T = typename C::value_type;
            ensure_equal_shape(a, out);

            const T* ad = a.data();
            T* od = out.data();
            const size_t n = a.size();
            size_t i = 0;
            if constexpr (simd::Lanable<T>) {
                const auto factor = simd::splat<T>(scalar);
                for (; i + simd::kChunkSize <= n; i += simd::kChunkSize) {
                    simd::store<T>(od + i, simd::load<T>(ad + i) * factor);
                }
            }
            for (; i < n; ++i) {
                od[i] = ad[i] * scalar;
            }
        }

        template <Numeric T>
        T vector_dot(const Vector<T>& a, const Vector<T>& b) const {
            ensure_equal_shape(a, b);
            return dot_range(a.data(), b.data(), a.length());
        }

        template <Numeric T>
        T vector_norm(const Vector<T>& v) const {
            return sqrt_element(dot_range(v.data(), v.data(), v.length()));
        }

        template <Numeric T>
        void matrix_vector_multiply(const Matrix<T>& m, const Vector<T>& v, Vector<T>& out) const {
            ensure_matrix_vector_shapes(m, v, out);

            const size_t rows = m.rows();
            const size_t cols = m.columns();
            const T* md = m.data();
            const T* vd = v.data();
            T* od = out.data();

            if (cols < simd::kChunkSize) {
                for (size_t i = 0; i < rows; ++i) {
                    T sum = 0;
                    for (size_t j = 0; j < cols; ++j) {
                        sum += md[i * cols + j] * vd[j];
                    }
                    od[i] = sum;
                }
                return;
            }

            for (size_t i = 0; i < rows; ++i) {
                od[i] = dot_range(md + i * cols, vd, cols);
            }
        }

        template <Numeric T>
        void matrix_multiply(const Matrix<T>& a, const Matrix<T>& b, Matrix<T>& out) const {
            ensure_matrix_multiply_shapes(a, b, out);

            const size_t m = a.rows();
            const size_t k_dim = a.columns();
            const size_t n = b.columns();
            const T* ad = a.data();
            const T* bd = b.data();
            T* od = out.data();

            out.fill(T{0});

            // out[i, :] += a[i, l] * b[l, :]
            for (size_t i = 0; i < m; ++i) {
                T* out_row = od + i * n;
                for (size_t l = 0; l < k_dim; ++l) {
                    const T s = ad[i * k_dim + l];
                    const T* b_row = bd + l * n;
                    size_t j = 0;
                    if constexpr (simd::Lanable<T>) {
                        const auto broadcast = simd::splat<T>(s);
                        for (; j + simd::kChunkSize <= n; j += simd::kChunkSize) {
                            simd::store<T>(out_row + j,
                                           simd::load<T>(out_row + j) + broadcast * simd::load<T>(b_row + j));
                        }
                    }
                    for (; j < n; ++j) {
                        out_row[j] += s * b_row[j];
                    }
                }
            }
        }

        template <Numeric T>
        void matrix_transpose(const Matrix<T>& m, Matrix<T>& out) const {
            ensure_transpose_shapes(m, out);

            const size_t rows = m.rows();
            const size_t cols = m.columns();
            const T* src = m.data();
            T* dst = out.data();

            if (rows == 0 || cols == 0)
                return;

            if (rows == 1 && cols == 1) {
                dst[0] = src[0];
                return;
            }

            if (rows <= simd::kSmallDimension || cols <= simd::kSmallDimension) {
                for (size_t i = 0; i < rows; ++i) {
                    for (size_t j = 0; j < cols; ++j) {
                        dst[j * rows + i] = src[i * cols + j];
                    }
                }
                return;
            }

            for (size_t ib = 0; ib < rows; ib += simd::kTransposeBlock) {
                const size_t i_end = std::min(ib + simd::kTransposeBlock, rows);
                for (size_t jb = 0; jb < cols; jb += simd::kTransposeBlock) {
                    const size_t j_end = std::min(jb + simd::kTransposeBlock, cols);
                    for (size_t i = ib; i < i_end; ++i) {
                        const T* src_row = src + i * cols;
                        size_t j = jb;
                        if constexpr (simd::Lanable<T>) {
                            for (; j + simd::kChunkSize <= j_end; j += simd::kChunkSize) {
                                const auto chunk = simd::load<T>(src_row + j);
                                for (size_t k = 0; k < simd::kChunkSize; ++k) {
                                    dst[(j + k) * rows + i] = chunk[k];
                                }
                            }
                        }
                        for (; j < j_end; ++j) {
                            dst[j * rows + i] = src_row[j];
                        }
                    }
                }
            }
        }

    private:
        // Lane accumulator over full chunks, horizontal sum, then the scalar remainder
        template <Numeric T>
        static T dot_range(const T* a, const T* b, const size_t n) {
            T sum = 0;
            size_t i = 0;
            if constexpr (simd::Lanable<T>) {
                if (n >= simd::kChunkSize) {
                    auto acc = simd::splat<T>(T{0});
                    for (; i + simd::kChunkSize <= n; i += simd::kChunkSize) {
                        acc += simd::load<T>(a + i) * simd::load<T>(b + i);
                    }
                    sum = simd::horizontal_sum<T>(acc);
                }
            }
            for (; i < n; ++i) {
                sum += a[i] * b[i];
            }
            return sum;
        }
    };

} // namespace zit::core
