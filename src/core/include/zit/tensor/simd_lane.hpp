/* SPDX-FileCopyrightText: 2025 zit Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "zit/tensor/numeric.hpp"
#include <concepts>
#include <cstring>
#include <type_traits>

namespace zit::core::simd {

    // Elements processed per SIMD step
    inline constexpr size_t kChunkSize = 16;
    // Edge of the square tiles used by the blocked transpose
    inline constexpr size_t kTransposeBlock = 32;
    // Matrices with a dimension at or below this skip blocking
    inline constexpr size_t kSmallDimension = 4;

    // Element types GCC/Clang vector extensions accept
    template <typename T>
    concept Lanable = Numeric<T> && !std::same_as<std::remove_cv_t<T>, long double>;

    template <typename T>
    struct Lane;

    template <Lanable T>
    struct Lane<T> {
        typedef T type __attribute__((vector_size(sizeof(T) * kChunkSize)));
    };

    template <typename T>
    using lane_t = typename Lane<T>::type;

    // Callables opt in to lane evaluation with a nested `lane_capable_tag` type or by
    // specializing this trait. Everything else runs element by element; a generic
    // lambda is never instantiated with a lane since its body may only compile for scalars.
    template <typename Fn>
    struct lane_capable : std::bool_constant<requires { typename Fn::lane_capable_tag; }> {};

    template <typename Fn>
    inline constexpr bool lane_capable_v = lane_capable<std::remove_cvref_t<Fn>>::value;

    template <typename Fn, typename T>
    concept LaneBinaryOp = Lanable<T> && lane_capable_v<Fn> &&
                           std::is_invocable_r_v<lane_t<T>, Fn&, const lane_t<T>&, const lane_t<T>&>;

    template <typename Fn, typename T>
    concept LaneUnaryOp = Lanable<T> && lane_capable_v<Fn> &&
                          std::is_invocable_r_v<lane_t<T>, Fn&, const lane_t<T>&>;

    // Unaligned load/store through memcpy
    template <Lanable T>
    inline lane_t<T> load(const T* src) {
        lane_t<T> v;
        std::memcpy(&v, src, sizeof(v));
        return v;
    }

    template <Lanable T>
    inline void store(T* dst, const lane_t<T>& v) {
        std::memcpy(dst, &v, sizeof(v));
    }

    template <Lanable T>
    inline lane_t<T> splat(const T value) {
        lane_t<T> v;
        for (size_t k = 0; k < kChunkSize; ++k)
            v[k] = value;
        return v;
    }

    template <Lanable T>
    inline T horizontal_sum(const lane_t<T>& v) {
        T sum = 0;
        for (size_t k = 0; k < kChunkSize; ++k)
            sum += v[k];
        return sum;
    }

} // namespace zit::core::simd
