/* SPDX-FileCopyrightText: 2025 zit Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "zit/tensor/containers.hpp"
#include "zit/tensor/tensor_functors.hpp"
#include <concepts>
#include <string_view>

namespace zit::core {

    // Capability set every compute backend provides. All operations write into
    // caller-supplied outputs and never allocate container storage.
    template <typename B, typename T>
    concept BackendFor = Numeric<T> && requires(B& backend,
                                                const Tensor<T>& ct, Tensor<T>& t,
                                                const Matrix<T>& cm, Matrix<T>& m,
                                                const Vector<T>& cv, Vector<T>& v,
                                                const T scalar) {
        { B::name() } -> std::convertible_to<std::string_view>;
        backend.op(ct, ct, t, ops::Add{});
        backend.op(cm, cm, m, ops::Multiply{});
        backend.op(cv, cv, v, ops::Subtract{});
        backend.map(ct, t, ops::Negate{});
        backend.map(cv, v, ops::Square{});
        backend.scalar_multiply(cm, scalar, m);
        { backend.vector_dot(cv, cv) } -> std::same_as<T>;
        { backend.vector_norm(cv) } -> std::same_as<T>;
        backend.matrix_vector_multiply(cm, cv, v);
        backend.matrix_multiply(cm, cm, m);
        backend.matrix_transpose(cm, m);
    };

    // Backend usable with the element types the containers are most often built on
    template <typename B>
    concept Backend = BackendFor<B, float> && BackendFor<B, double> && BackendFor<B, int>;

} // namespace zit::core
