/* SPDX-FileCopyrightText: 2025 zit Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "zit/logger.hpp"
#include <cstdio>
#include <ctime>
#include <mutex>
#include <spdlog/sinks/base_sink.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>
#include <vector>

namespace zit::core {

    namespace {

        // Console sink rendering "[hh:mm:ss.mmm] [level] file:line  message", Performance logs in magenta
        template <typename Mutex>
        class performance_color_sink : public spdlog::sinks::base_sink<Mutex> {
        public:
            performance_color_sink() {
                colors_[spdlog::level::trace] = "\033[37m";
                colors_[spdlog::level::debug] = "\033[36m";
                colors_[spdlog::level::info] = "\033[32m";
                colors_[spdlog::level::warn] = "\033[33m";
                colors_[spdlog::level::err] = "\033[31m";
                colors_[spdlog::level::critical] = "\033[1;31m";
                colors_[spdlog::level::off] = "\033[0m";
            }

        protected:
            void sink_it_(const spdlog::details::log_msg& msg) override {
                const auto time_t_val = std::chrono::system_clock::to_time_t(msg.time);
                std::tm tm{};
                localtime_r(&time_t_val, &tm);
                const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                                        msg.time.time_since_epoch())
                                        .count() %
                                    1000;

                std::string_view full_path(msg.source.filename ? msg.source.filename : "");
                const auto last_slash = full_path.find_last_of("/\\");
                const std::string_view filename = (last_slash != std::string_view::npos)
                                                      ? full_path.substr(last_slash + 1)
                                                      : full_path;

                std::string_view payload(msg.payload.data(), msg.payload.size());
                std::string_view label;
                std::string_view color;
                if (payload.starts_with(kPerfPrefix)) {
                    payload.remove_prefix(kPerfPrefix.size());
                    label = "perf";
                    color = kPerfColor;
                } else {
                    label = level_label(msg.level);
                    color = colors_[static_cast<size_t>(msg.level)];
                }

                const std::string formatted = fmt::format(
                    "[{:02d}:{:02d}:{:02d}.{:03d}] {}[{}]{} {}:{}  {}\n",
                    tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(millis),
                    color, label, kResetColor,
                    filename, msg.source.line, payload);

                std::FILE* stream = msg.level >= spdlog::level::err ? stderr : stdout;
                std::fwrite(formatted.data(), 1, formatted.size(), stream);
            }

            void flush_() override {
                std::fflush(stdout);
                std::fflush(stderr);
            }

        private:
            static std::string_view level_label(spdlog::level::level_enum level) {
                switch (level) {
                case spdlog::level::trace: return "trace";
                case spdlog::level::debug: return "debug";
                case spdlog::level::info: return "info";
                case spdlog::level::warn: return "warn";
                case spdlog::level::err: return "error";
                case spdlog::level::critical: return "critical";
                default: return "info";
                }
            }

            static constexpr std::string_view kPerfPrefix = "[PERF] ";
            static constexpr std::string_view kPerfColor = "\033[95m";
            static constexpr std::string_view kResetColor = "\033[0m";

            std::array<std::string_view, 7> colors_{};
        };

        using performance_color_sink_mt = performance_color_sink<std::mutex>;

        constexpr spdlog::level::level_enum to_spdlog_level(const LogLevel level) {
            switch (level) {
            case LogLevel::Trace: return spdlog::level::trace;
            case LogLevel::Debug: return spdlog::level::debug;
            case LogLevel::Info: return spdlog::level::info;
            case LogLevel::Performance: return spdlog::level::info;
            case LogLevel::Warn: return spdlog::level::warn;
            case LogLevel::Error: return spdlog::level::err;
            case LogLevel::Critical: return spdlog::level::critical;
            case LogLevel::Off: return spdlog::level::off;
            }
            return spdlog::level::info;
        }

        // '*' matches any run of characters; a pattern without '*' matches as a substring
        bool matches_filter(std::string_view text, std::string_view pattern) {
            if (pattern.empty())
                return true;
            if (pattern.find('*') == std::string_view::npos)
                return text.find(pattern) != std::string_view::npos;

            size_t t = 0;
            size_t p = 0;
            size_t star = std::string_view::npos;
            size_t resume = 0;
            while (t < text.size()) {
                if (p < pattern.size() && pattern[p] == '*') {
                    star = p++;
                    resume = t;
                } else if (p < pattern.size() && pattern[p] == text[t]) {
                    ++p;
                    ++t;
                } else if (star != std::string_view::npos) {
                    p = star + 1;
                    t = ++resume;
                } else {
                    return false;
                }
            }
            while (p < pattern.size() && pattern[p] == '*')
                ++p;
            return p == pattern.size();
        }

    } // namespace

    LogLevel parse_log_level(const std::string_view name, const LogLevel fallback) {
        if (name == "trace")
            return LogLevel::Trace;
        if (name == "debug")
            return LogLevel::Debug;
        if (name == "info")
            return LogLevel::Info;
        if (name == "perf" || name == "performance")
            return LogLevel::Performance;
        if (name == "warn" || name == "warning")
            return LogLevel::Warn;
        if (name == "error")
            return LogLevel::Error;
        if (name == "critical")
            return LogLevel::Critical;
        if (name == "off")
            return LogLevel::Off;
        return fallback;
    }

    std::string_view log_level_name(const LogLevel level) {
        switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Performance: return "perf";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Critical: return "critical";
        case LogLevel::Off: return "off";
        }
        return "info";
    }

    LogModule detect_log_module(const std::string_view path) {
        if (path.find("/gpu") != std::string_view::npos || path.find("gpu_") != std::string_view::npos ||
            path.find("kernels") != std::string_view::npos)
            return LogModule::Gpu;
        if (path.find("buffer_pool") != std::string_view::npos ||
            path.find("allocator") != std::string_view::npos)
            return LogModule::Memory;
        if (path.find("backend") != std::string_view::npos)
            return LogModule::Backend;
        if (path.find("parameters") != std::string_view::npos)
            return LogModule::Config;
        if (path.find("tensor") != std::string_view::npos)
            return LogModule::Tensor;
        if (path.find("core") != std::string_view::npos)
            return LogModule::Core;
        return LogModule::Unknown;
    }

    struct Logger::Impl {
        std::shared_ptr<spdlog::logger> logger;
        std::string filter_pattern;
        std::mutex mutex;
    };

    Logger::Logger() : impl_(std::make_unique<Impl>()) {
        for (size_t i = 0; i < static_cast<size_t>(LogModule::Count); ++i) {
            module_enabled_[i] = true;
            module_level_[i] = static_cast<uint8_t>(LogLevel::Trace);
        }
    }

    Logger::~Logger() = default;

    Logger& Logger::get() {
        static Logger instance;
        return instance;
    }

    void Logger::init(const LogLevel console_level, const std::string& log_file, const std::string& filter_pattern) {
        std::lock_guard lock(impl_->mutex);

        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<performance_color_sink_mt>());

        if (!log_file.empty()) {
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, true);
            file_sink->set_level(spdlog::level::trace);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %s:%# %v");
            sinks.push_back(file_sink);
        }

        impl_->logger = std::make_shared<spdlog::logger>("zit", sinks.begin(), sinks.end());
        impl_->logger->set_level(spdlog::level::trace);
        impl_->filter_pattern = filter_pattern;

        global_level_ = static_cast<uint8_t>(console_level);

        for (size_t i = 0; i < static_cast<size_t>(LogModule::Count); ++i) {
            module_enabled_[i] = true;
            module_level_[i] = static_cast<uint8_t>(LogLevel::Trace);
        }
    }

    void Logger::log(const LogLevel level, const std::source_location& loc, const std::string_view msg) {
        std::shared_ptr<spdlog::logger> logger;
        {
            std::lock_guard lock(impl_->mutex);
            if (!impl_->logger)
                return;
            if (!matches_filter(msg, impl_->filter_pattern))
                return;
            logger = impl_->logger;
        }

        const auto module_idx = static_cast<size_t>(detect_log_module(loc.file_name()));
        if (!module_enabled_[module_idx] ||
            static_cast<uint8_t>(level) < module_level_[module_idx]) {
            return;
        }

        // Performance level shows only Performance logs; otherwise Performance logs are hidden
        const auto global_lvl = static_cast<LogLevel>(global_level_.load());
        if (global_lvl == LogLevel::Performance) {
            if (level != LogLevel::Performance)
                return;
        } else {
            if (level == LogLevel::Performance)
                return;
            if (static_cast<uint8_t>(level) < global_level_)
                return;
        }

        const spdlog::source_loc source{loc.file_name(), static_cast<int>(loc.line()), loc.function_name()};
        if (level == LogLevel::Performance) {
            logger->log(source, to_spdlog_level(level), "[PERF] {}", msg);
        } else {
            logger->log(source, to_spdlog_level(level), "{}", msg);
        }
    }

    void Logger::enable_module(const LogModule module, const bool enabled) {
        module_enabled_[static_cast<size_t>(module)] = enabled;
    }

    void Logger::set_module_level(const LogModule module, const LogLevel level) {
        module_level_[static_cast<size_t>(module)] = static_cast<uint8_t>(level);
    }

    void Logger::set_level(const LogLevel level) {
        global_level_ = static_cast<uint8_t>(level);
    }

    void Logger::flush() {
        std::lock_guard lock(impl_->mutex);
        if (impl_->logger)
            impl_->logger->flush();
    }

    ScopedTimer::ScopedTimer(std::string name, const LogLevel level, const std::source_location loc)
        : start_(std::chrono::high_resolution_clock::now()),
          name_(std::move(name)),
          level_(level),
          loc_(loc) {}

    ScopedTimer::~ScopedTimer() {
        const auto duration = std::chrono::high_resolution_clock::now() - start_;
        const auto ms = std::chrono::duration<double, std::milli>(duration).count();
        Logger::get().log_internal(level_, loc_, "{} took {:.2f}ms", name_, ms);
    }

} // namespace zit::core
