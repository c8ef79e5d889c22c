/* SPDX-FileCopyrightText: 2025 zit Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "zit/tensor/allocator.hpp"
#include "zit/tensor/backend.hpp"
#include "zit/tensor/containers.hpp"
#include "zit/tensor/context_dispatch.hpp"
#include "zit/tensor/cpu_backend.hpp"
#include "zit/tensor/gpu/gpu_backend.hpp"
#include "zit/tensor/gpu/gpu_context.hpp"
#include "zit/tensor/shape_check.hpp"
#include "zit/tensor/simd_backend.hpp"
#include "zit/tensor/tensor_context.hpp"
#include "zit/tensor/tensor_error.hpp"
#include "zit/tensor/tensor_functors.hpp"

namespace zit::core {

    static_assert(Backend<CpuBackend>);
    static_assert(Backend<SimdBackend>);
    static_assert(Backend<GpuBackend>);

} // namespace zit::core
