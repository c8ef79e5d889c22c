/* SPDX-FileCopyrightText: 2025 zit Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "zit/tensor/gpu/gpu_context.hpp"

// Device kernels for the f32 GPU path. Launched through cudaLaunchKernel with the
// function pointers recorded in the GpuContext pipeline table.
//
// Kernel signatures (argument order matters for the launch argument arrays):
//   Add/Subtract/Multiply/Divide  (const float* a, const float* b, float* out, size_t n)
//   ScalarMultiply                (const float* a, float scalar, float* out, size_t n)
//   VectorDot                     (const float* a, const float* b, float* result, size_t n)
//   VectorNorm                    (const float* a, float* result, size_t n)
//   MatrixVectorMultiply          (const float* m, const float* v, float* out, size_t rows, size_t cols)
//   MatrixMultiply                (const float* a, const float* b, float* out, size_t m, size_t k, size_t n)
//   MatrixTranspose               (const float* src, float* dst, size_t rows, size_t cols)
namespace zit::core::tensor_kernels {

    // Threads per block for 1D launches and for the single-block reductions
    inline constexpr unsigned kBlockSize = 256;
    // Edge of the 2D thread blocks used by matrix kernels
    inline constexpr unsigned kTile = 16;
    // Grid sizes used for launches; kernels grid-stride past them
    inline constexpr unsigned kMaxGridX = 65535;
    inline constexpr unsigned kMaxGridY = 65535;

    // Host stub of the kernel implementing `kernel`, nullptr if none is compiled in
    const void* kernel_function(GpuKernel kernel);

} // namespace zit::core::tensor_kernels
