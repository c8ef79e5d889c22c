/* SPDX-FileCopyrightText: 2025 zit Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "zit/export.hpp"
#include "zit/tensor/gpu/gpu_context.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace zit::core {
    namespace param {

        enum class BackendKind : uint8_t {
            Cpu,
            Simd,
            Gpu
        };

        // Throws TensorError(UnsupportedOperation) for names other than cpu, simd and gpu
        ZIT_CORE_API BackendKind parse_backend_kind(std::string_view name);
        ZIT_CORE_API std::string_view backend_kind_name(BackendKind kind);

        struct ZIT_CORE_API LoggingParameters {
            std::string level = "info";
            std::string file;                          // empty = console only
            std::string filter;                        // message filter, '*' wildcards
            std::vector<std::string> disabled_modules; // core, tensor, backend, gpu, memory, config

            nlohmann::json to_json() const;
            static LoggingParameters from_json(const nlohmann::json& j);
        };

        struct ZIT_CORE_API GpuParameters {
            bool enabled = true;
            int device_index = 0;
            size_t max_cached_bytes = 256ULL * 1024 * 1024;

            GpuOptions to_options() const;

            nlohmann::json to_json() const;
            static GpuParameters from_json(const nlohmann::json& j);
        };

        struct ZIT_CORE_API ContextParameters {
            BackendKind backend = BackendKind::Simd;
            LoggingParameters logging;
            GpuParameters gpu;

            nlohmann::json to_json() const;
            static ContextParameters from_json(const nlohmann::json& j);
        };

        // Missing keys keep their defaults
        ZIT_CORE_API std::expected<ContextParameters, std::string> read_context_parameters(const std::filesystem::path& path);

        ZIT_CORE_API std::expected<void, std::string> save_context_parameters(
            const ContextParameters& params,
            const std::filesystem::path& output_path);

        // Initializes the global Logger from the logging section
        ZIT_CORE_API void apply_logging(const LoggingParameters& params);

    } // namespace param
} // namespace zit::core
