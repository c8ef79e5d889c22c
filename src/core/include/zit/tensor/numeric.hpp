/* SPDX-FileCopyrightText: 2025 zit Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <concepts>
#include <cstddef>
#include <span>
#include <string_view>
#include <type_traits>

namespace zit::core {

    template <typename T>
    concept Numeric = std::is_arithmetic_v<T> && !std::same_as<std::remove_cv_t<T>, bool>;

    template <Numeric T>
    constexpr std::string_view numeric_name() {
        if constexpr (std::same_as<T, float>)
            return "f32";
        else if constexpr (std::same_as<T, double>)
            return "f64";
        else if constexpr (std::is_floating_point_v<T>)
            return "float";
        else if constexpr (std::is_signed_v<T>)
            return sizeof(T) == 1 ? "i8" : sizeof(T) == 2 ? "i16"
                                       : sizeof(T) == 4   ? "i32"
                                                          : "i64";
        else
            return sizeof(T) == 1 ? "u8" : sizeof(T) == 2 ? "u16"
                                       : sizeof(T) == 4   ? "u32"
                                                          : "u64";
    }

    // Product of an empty shape is 1 (rank-0 holds one element)
    inline size_t shape_product(std::span<const size_t> shape) {
        size_t n = 1;
        for (const size_t d : shape)
            n *= d;
        return n;
    }

} // namespace zit::core
