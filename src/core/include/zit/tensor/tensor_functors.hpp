/* SPDX-FileCopyrightText: 2025 zit Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

// Element functors shared by every backend. Templated on the operand type so the
// same functor applies to a scalar element and to a whole SIMD lane; the tag
// marks them as safe to evaluate on lanes.
namespace zit::core::ops {

    struct Add {
        using lane_capable_tag = void;
        template <typename V>
        constexpr V operator()(const V& a, const V& b) const { return a + b; }
    };

    struct Subtract {
        using lane_capable_tag = void;
        template <typename V>
        constexpr V operator()(const V& a, const V& b) const { return a - b; }
    };

    struct Multiply {
        using lane_capable_tag = void;
        template <typename V>
        constexpr V operator()(const V& a, const V& b) const { return a * b; }
    };

    struct Divide {
        using lane_capable_tag = void;
        template <typename V>
        constexpr V operator()(const V& a, const V& b) const { return a / b; }
    };

    struct Negate {
        using lane_capable_tag = void;
        template <typename V>
        constexpr V operator()(const V& a) const { return -a; }
    };

    struct Square {
        using lane_capable_tag = void;
        template <typename V>
        constexpr V operator()(const V& a) const { return a * a; }
    };

} // namespace zit::core::ops
