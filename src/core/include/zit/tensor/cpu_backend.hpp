/* SPDX-FileCopyrightText: 2025 zit Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "zit/tensor/containers.hpp"
#include "zit/tensor/shape_check.hpp"
#include <cmath>
#include <string_view>
#include <type_traits>

namespace zit::core {

    // ============= CPU Helpers =============

    template <typename T, typename OutT, typename Op>
    void apply_unary_cpu(const T* input, OutT* output, size_t n, Op op) {
        for (size_t i = 0; i < n; ++i) {
            output[i] = op(input[i]);
        }
    }

    template <typename T, typename OutputT, typename Op>
    void apply_binary_cpu(const T* a, const T* b, OutputT* c, size_t n, Op op) {
        for (size_t i = 0; i < n; ++i) {
            c[i] = op(a[i], b[i]);
        }
    }

    template <Numeric T>
    T sqrt_element(const T value) {
        if constexpr (std::is_floating_point_v<T>) {
            return std::sqrt(value);
        } else {
            return static_cast<T>(std::sqrt(static_cast<double>(value)));
        }
    }

    // ============= Matrix operand checks =============

    template <Numeric T>
    void ensure_matrix_vector_shapes(const Matrix<T>& m, const Vector<T>& v, const Vector<T>& out) {
        if (m.columns() != v.length()) {
            throw_tensor_error(ErrorCode::ShapeMismatch,
                               "matrix_vector_multiply: " + shape_string(m) + " cannot multiply vector of length " +
                                   std::to_string(v.length()));
        }
        if (out.length() != m.rows()) {
            throw_tensor_error(ErrorCode::ShapeMismatch,
                               "matrix_vector_multiply: output length " + std::to_string(out.length()) +
                                   ", expected " + std::to_string(m.rows()));
        }
        if (out.length() > 0 && out.data() == v.data()) {
            throw_tensor_error(ErrorCode::UnsupportedOperation, "matrix_vector_multiply: output aliases the input vector");
        }
    }

    template <Numeric T>
    void ensure_matrix_multiply_shapes(const Matrix<T>& a, const Matrix<T>& b, const Matrix<T>& out) {
        if (a.columns() != b.rows()) {
            throw_tensor_error(ErrorCode::ShapeMismatch,
                               "matrix_multiply: inner dimensions differ: " + shape_string(a) + " x " + shape_string(b));
        }
        if (out.rows() != a.rows() || out.columns() != b.columns()) {
            throw_tensor_error(ErrorCode::ShapeMismatch,
                               "matrix_multiply: output is " + shape_string(out) + ", expected Matrix[" +
                                   std::to_string(a.rows()) + ", " + std::to_string(b.columns()) + "]");
        }
        if (!out.empty() && (out.data() == a.data() || out.data() == b.data())) {
            throw_tensor_error(ErrorCode::UnsupportedOperation, "matrix_multiply: output aliases an input");
        }
    }

    template <Numeric T>
    void ensure_transpose_shapes(const Matrix<T>& m, const Matrix<T>& out) {
        if (out.rows() != m.columns() || out.columns() != m.rows()) {
            throw_tensor_error(ErrorCode::ShapeMismatch,
                               "matrix_transpose: output is " + shape_string(out) + ", expected Matrix[" +
                                   std::to_string(m.columns()) + ", " + std::to_string(m.rows()) + "]");
        }
        if (m.size() > 1 && out.data() == m.data()) {
            throw_tensor_error(ErrorCode::UnsupportedOperation, "matrix_transpose: output aliases the input");
        }
    }

    // Plain loops over row-major buffers. Reference results for the other backends.
    class CpuBackend {
    public:
        static constexpr std::string_view name() { return "cpu"; }

        template <Container C, typename Fn>
        void op(const C& a, const C& b, C& out, Fn fn) const {
            ensure_equal_shape(a, b);
            ensure_equal_shape(a, out);
            apply_binary_cpu(a.data(), b.data(), out.data(), a.size(), fn);
        }

        template <Container C, typename Fn>
        void map(const C& a, C& out, Fn fn) const {
            ensure_equal_shape(a, out);
            apply_unary_cpu(a.data(), out.data(), a.size(), fn);
        }

        template <Container C>
        void scalar_multiply(const C& a, const typename C::value_type scalar, C& out) const {
            ensure_equal_shape(a, out);
            const auto* src = a.data();
            auto* dst = out.data();
            for (size_t i = 0; i < a.size(); ++i) {
                dst[i] = src[i] * scalar;
            }
        }

        template <Numeric T>
        T vector_dot(const Vector<T>& a, const Vector<T>& b) const {
            ensure_equal_shape(a, b);
            T sum = 0;
            for (size_t i = 0; i < a.length(); ++i) {
                sum += a[i] * b[i];
            }
            return sum;
        }

        template <Numeric T>
        T vector_norm(const Vector<T>& v) const {
            T sum = 0;
            for (size_t i = 0; i < v.length(); ++i) {
                sum += v[i] * v[i];
            }
            return sqrt_element(sum);
        }

        template <Numeric T>
        void matrix_vector_multiply(const Matrix<T>& m, const Vector<T>& v, Vector<T>& out) const {
            ensure_matrix_vector_shapes(m, v, out);
            const size_t cols = m.columns();
            const T* md = m.data();
            for (size_t i = 0; i < m.rows(); ++i) {
                T sum = 0;
                for (size_t j = 0; j < cols; ++j) {
                    sum += md[i * cols + j] * v[j];
                }
                out[i] = sum;
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
            for (size_t i = 0; i < m; ++i) {
                for (size_t j = 0; j < n; ++j) {
                    T sum = 0;
                    for (size_t k = 0; k < k_dim; ++k) {
                        sum += ad[i * k_dim + k] * bd[k * n + j];
                    }
                    od[i * n + j] = sum;
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
            for (size_t i = 0; i < rows; ++i) {
                for (size_t j = 0; j < cols; ++j) {
                    dst[j * rows + i] = src[i * cols + j];
                }
            }
        }
    };

} // namespace zit::core
