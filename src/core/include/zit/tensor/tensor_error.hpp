/* SPDX-FileCopyrightText: 2025 zit Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "zit/export.hpp"
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace zit::core {

    enum class ErrorCode : uint8_t {
        ShapeMismatch,
        LengthMismatch,
        InvalidDimensions,
        OutOfBounds,
        InvalidType,
        BackendError,
        OutOfMemory,
        UnsupportedOperation
    };

    ZIT_CORE_API std::string_view error_code_name(ErrorCode code);

    class ZIT_CORE_API TensorError : public std::runtime_error {
    public:
        TensorError(ErrorCode code, const std::string& msg);

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

    // Logs the message at error level, then throws TensorError
    [[noreturn]] ZIT_CORE_API void throw_tensor_error(ErrorCode code, const std::string& msg);

} // namespace zit::core
