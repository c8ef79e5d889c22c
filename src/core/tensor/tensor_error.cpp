/* SPDX-FileCopyrightText: 2025 zit Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "zit/tensor/tensor_error.hpp"
#include "zit/logger.hpp"

namespace zit::core {

    std::string_view error_code_name(const ErrorCode code) {
        switch (code) {
        case ErrorCode::ShapeMismatch: return "ShapeMismatch";
        case ErrorCode::LengthMismatch: return "LengthMismatch";
        case ErrorCode::InvalidDimensions: return "InvalidDimensions";
        case ErrorCode::OutOfBounds: return "OutOfBounds";
        case ErrorCode::InvalidType: return "InvalidType";
        case ErrorCode::BackendError: return "BackendError";
        case ErrorCode::OutOfMemory: return "OutOfMemory";
        case ErrorCode::UnsupportedOperation: return "UnsupportedOperation";
        }
        return "Unknown";
    }

    TensorError::TensorError(const ErrorCode code, const std::string& msg)
        : std::runtime_error(std::string(error_code_name(code)) + ": " + msg),
          code_(code) {}

    void throw_tensor_error(const ErrorCode code, const std::string& msg) {
        LOG_ERROR("{}: {}", error_code_name(code), msg);
        throw TensorError(code, msg);
    }

} // namespace zit::core
