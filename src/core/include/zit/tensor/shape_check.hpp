/* SPDX-FileCopyrightText: 2025 zit Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "zit/tensor/containers.hpp"
#include <span>
#include <string>

namespace zit::core {

    inline std::string shape_string(std::span<const size_t> shape) {
        std::string s = "[";
        for (size_t i = 0; i < shape.size(); ++i) {
            if (i > 0)
                s += ", ";
            s += std::to_string(shape[i]);
        }
        s += "]";
        return s;
    }

    template <Container C>
    std::string shape_string(const C& c) {
        const auto shape = c.shape();
        return std::string(container_traits<C>::kind) + shape_string(std::span<const size_t>(shape));
    }

    // ============= ensure_equal_shape =============
    // Runs before any operand data is read or written.

    template <Numeric T>
    void ensure_equal_shape(const Tensor<T>& a, const Tensor<T>& b) {
        if (a.shape() != b.shape()) {
            throw_tensor_error(ErrorCode::ShapeMismatch,
                               "tensor shapes differ: " + shape_string(a) + " vs " + shape_string(b));
        }
    }

    template <Numeric T>
    void ensure_equal_shape(const Matrix<T>& a, const Matrix<T>& b) {
        if (a.rows() != b.rows() || a.columns() != b.columns()) {
            throw_tensor_error(ErrorCode::ShapeMismatch,
                               "matrix shapes differ: " + shape_string(a) + " vs " + shape_string(b));
        }
    }

    template <Numeric T>
    void ensure_equal_shape(const Vector<T>& a, const Vector<T>& b) {
        if (a.length() != b.length()) {
            throw_tensor_error(ErrorCode::LengthMismatch,
                               "vector lengths differ: " + std::to_string(a.length()) + " vs " +
                                   std::to_string(b.length()));
        }
    }

    // Different container kinds or element types never share a shape
    template <Container A, Container B>
        requires(!std::same_as<A, B>)
    void ensure_equal_shape(const A& a, const B& b) {
        throw_tensor_error(ErrorCode::InvalidType,
                           "cannot compare " + shape_string(a) + " with " + shape_string(b));
    }

    template <Container A, Container B>
    bool same_shape(const A& a, const B& b) {
        if constexpr (std::same_as<A, B>) {
            return a.shape() == b.shape();
        } else {
            return false;
        }
    }

} // namespace zit::core
