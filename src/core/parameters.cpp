/* SPDX-FileCopyrightText: 2025 zit Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "zit/parameters.hpp"
#include "zit/logger.hpp"
#include "zit/tensor/tensor_error.hpp"
#include <fstream>
#include <nlohmann/json.hpp>
#include <optional>
#include <sstream>

namespace zit::core {
    namespace param {
        namespace {
            std::expected<nlohmann::json, std::string> read_json_file(const std::filesystem::path& path) {
                if (!std::filesystem::exists(path)) {
                    return std::unexpected(fmt::format("Config file not found: {}", path.string()));
                }

                std::ifstream file(path, std::ios::binary);
                if (!file.is_open()) {
                    return std::unexpected(fmt::format("Cannot open config: {}", path.string()));
                }

                try {
                    std::stringstream buffer;
                    buffer << file.rdbuf();
                    return nlohmann::json::parse(buffer.str());
                } catch (const nlohmann::json::parse_error& e) {
                    return std::unexpected(fmt::format("JSON parse error in {}: {}", path.string(), e.what()));
                }
            }

            std::optional<LogModule> parse_log_module(const std::string_view name) {
                if (name == "core")
                    return LogModule::Core;
                if (name == "tensor")
                    return LogModule::Tensor;
                if (name == "backend")
                    return LogModule::Backend;
                if (name == "gpu")
                    return LogModule::Gpu;
                if (name == "memory")
                    return LogModule::Memory;
                if (name == "config")
                    return LogModule::Config;
                return std::nullopt;
            }
        } // namespace

        BackendKind parse_backend_kind(const std::string_view name) {
            if (name == "cpu")
                return BackendKind::Cpu;
            if (name == "simd")
                return BackendKind::Simd;
            if (name == "gpu")
                return BackendKind::Gpu;
            throw_tensor_error(ErrorCode::UnsupportedOperation,
                               "unknown backend '" + std::string(name) + "' (expected cpu, simd or gpu)");
        }

        std::string_view backend_kind_name(const BackendKind kind) {
            switch (kind) {
            case BackendKind::Cpu: return "cpu";
            case BackendKind::Simd: return "simd";
            case BackendKind::Gpu: return "gpu";
            }
            return "simd";
        }

        nlohmann::json LoggingParameters::to_json() const {
            nlohmann::json json;
            json["level"] = level;
            json["file"] = file;
            json["filter"] = filter;
            json["disabled_modules"] = disabled_modules;
            return json;
        }

        LoggingParameters LoggingParameters::from_json(const nlohmann::json& j) {
            LoggingParameters params;
            if (j.contains("level")) {
                params.level = j["level"].get<std::string>();
            }
            if (j.contains("file")) {
                params.file = j["file"].get<std::string>();
            }
            if (j.contains("filter")) {
                params.filter = j["filter"].get<std::string>();
            }
            if (j.contains("disabled_modules")) {
                params.disabled_modules.clear();
                for (const auto& module : j["disabled_modules"]) {
                    params.disabled_modules.push_back(module.get<std::string>());
                }
            }
            return params;
        }

        GpuOptions GpuParameters::to_options() const {
            return GpuOptions{
                .enabled = enabled,
                .device_index = device_index,
                .max_cached_bytes = max_cached_bytes};
        }

        nlohmann::json GpuParameters::to_json() const {
            nlohmann::json json;
            json["enabled"] = enabled;
            json["device_index"] = device_index;
            json["max_cached_bytes"] = max_cached_bytes;
            return json;
        }

        GpuParameters GpuParameters::from_json(const nlohmann::json& j) {
            GpuParameters params;
            if (j.contains("enabled")) {
                params.enabled = j["enabled"].get<bool>();
            }
            if (j.contains("device_index")) {
                params.device_index = j["device_index"].get<int>();
                if (params.device_index < 0) {
                    throw_tensor_error(ErrorCode::UnsupportedOperation,
                                       "gpu.device_index must be non-negative, got " + std::to_string(params.device_index));
                }
            }
            if (j.contains("max_cached_bytes")) {
                params.max_cached_bytes = j["max_cached_bytes"].get<size_t>();
            }
            return params;
        }

        nlohmann::json ContextParameters::to_json() const {
            nlohmann::json json;
            json["backend"] = std::string(backend_kind_name(backend));
            json["logging"] = logging.to_json();
            json["gpu"] = gpu.to_json();
            return json;
        }

        ContextParameters ContextParameters::from_json(const nlohmann::json& j) {
            ContextParameters params;
            if (j.contains("backend")) {
                params.backend = parse_backend_kind(j["backend"].get<std::string>());
            }
            if (j.contains("logging")) {
                params.logging = LoggingParameters::from_json(j["logging"]);
            }
            if (j.contains("gpu")) {
                params.gpu = GpuParameters::from_json(j["gpu"]);
            }
            return params;
        }

        std::expected<ContextParameters, std::string> read_context_parameters(const std::filesystem::path& path) {
            auto json_result = read_json_file(path);
            if (!json_result) {
                return std::unexpected(json_result.error());
            }

            const auto& json = *json_result;
            // Accept both flat and nested {"context": {...}} layouts
            const auto& ctx_json = json.contains("context") ? json["context"] : json;

            try {
                auto params = ContextParameters::from_json(ctx_json);
                LOG_DEBUG("Loaded context parameters from {} (backend: {})",
                          path.string(), backend_kind_name(params.backend));
                return params;
            } catch (const std::exception& e) {
                return std::unexpected(fmt::format("Error parsing context parameters: {}", e.what()));
            }
        }

        std::expected<void, std::string> save_context_parameters(
            const ContextParameters& params,
            const std::filesystem::path& output_path) {
            try {
                const std::filesystem::path filepath = (output_path.extension() == ".json")
                                                           ? output_path
                                                           : output_path / "context_config.json";
                std::ofstream file(filepath, std::ios::binary | std::ios::trunc);
                if (!file.is_open()) {
                    return std::unexpected(fmt::format("Cannot write: {}", filepath.string()));
                }

                file << params.to_json().dump(4);
                LOG_INFO("Saved config: {}", filepath.string());
                return {};
            } catch (const std::exception& e) {
                return std::unexpected(fmt::format("Error saving context parameters: {}", e.what()));
            }
        }

        void apply_logging(const LoggingParameters& params) {
            auto& logger = Logger::get();
            logger.init(parse_log_level(params.level), params.file, params.filter);
            for (const auto& name : params.disabled_modules) {
                if (const auto module = parse_log_module(name)) {
                    logger.enable_module(*module, false);
                } else {
                    LOG_WARN("Unknown log module '{}' in configuration, ignoring", name);
                }
            }
        }

    } // namespace param
} // namespace zit::core
