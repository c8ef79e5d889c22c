/* SPDX-FileCopyrightText: 2025 zit Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "zit/logger.hpp"
#include "zit/tensor/tensor_error.hpp"
#include <cuda_runtime.h>
#include <source_location>
#include <string>

namespace zit::core::debug {

    inline std::string cuda_error_message(const cudaError_t err, const char* file, const int line, const char* expr) {
        return std::string("CUDA error at ") + file + ":" + std::to_string(line) +
               " - " + cudaGetErrorName(err) + ": " + cudaGetErrorString(err) +
               " (" + expr + ")";
    }

    inline bool check_cuda_error(const cudaError_t err, const char* file, const int line, const char* expr,
                                 const std::source_location loc = std::source_location::current()) {
        if (err != cudaSuccess) {
            ::zit::core::Logger::get().log_internal(
                ::zit::core::LogLevel::Error, loc, cuda_error_message(err, file, line, expr));
            return false;
        }
        return true;
    }

    // Clears the sticky error state, then raises BackendError
    inline void throw_on_cuda_error(const cudaError_t err, const char* file, const int line, const char* expr) {
        if (err != cudaSuccess) {
            cudaGetLastError();
            throw_tensor_error(ErrorCode::BackendError, cuda_error_message(err, file, line, expr));
        }
    }

} // namespace zit::core::debug

#define CHECK_CUDA(call) \
    zit::core::debug::check_cuda_error((call), __FILE__, __LINE__, #call)

#define CHECK_CUDA_THROW(call) \
    zit::core::debug::throw_on_cuda_error((call), __FILE__, __LINE__, #call)
