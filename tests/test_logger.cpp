/* SPDX-FileCopyrightText: 2025 zit Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "zit/logger.hpp"
#include "zit/tensor/tensor_error.hpp"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>

using namespace zit::core;

namespace fs = std::filesystem;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved_level_ = Logger::get().level();
        log_path_ = fs::temp_directory_path() /
                    ("zit_logger_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()) + ".log");
        fs::remove(log_path_);
    }

    void TearDown() override {
        // Drop the file sink and restore the console level used by the rest of the run
        Logger::get().init(saved_level_);
        std::error_code ec;
        fs::remove(log_path_, ec);
    }

    std::string read_log() {
        Logger::get().flush();
        std::ifstream file(log_path_);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    LogLevel saved_level_ = LogLevel::Info;
    fs::path log_path_;
};

TEST_F(LoggerTest, ParsesLevelNames) {
    EXPECT_EQ(parse_log_level("trace"), LogLevel::Trace);
    EXPECT_EQ(parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("perf"), LogLevel::Performance);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("off"), LogLevel::Off);
    EXPECT_EQ(parse_log_level("verbose"), LogLevel::Info);
    EXPECT_EQ(parse_log_level("verbose", LogLevel::Error), LogLevel::Error);

    for (const auto level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info, LogLevel::Performance,
                             LogLevel::Warn, LogLevel::Error, LogLevel::Critical, LogLevel::Off}) {
        EXPECT_EQ(parse_log_level(log_level_name(level), LogLevel::Off), level);
    }
}

TEST_F(LoggerTest, DetectsModuleFromPath) {
    EXPECT_EQ(detect_log_module("src/core/tensor/gpu_backend.cpp"), LogModule::Gpu);
    EXPECT_EQ(detect_log_module("src/core/tensor/kernels/tensor_kernels.cu"), LogModule::Gpu);
    EXPECT_EQ(detect_log_module("src/core/tensor/buffer_pool.cpp"), LogModule::Memory);
    EXPECT_EQ(detect_log_module("src/core/include/zit/tensor/simd_backend.hpp"), LogModule::Backend);
    EXPECT_EQ(detect_log_module("src/core/parameters.cpp"), LogModule::Config);
    EXPECT_EQ(detect_log_module("src/core/tensor/tensor_error.cpp"), LogModule::Tensor);
    EXPECT_EQ(detect_log_module("src/core/logger.cpp"), LogModule::Core);
    EXPECT_EQ(detect_log_module("main.cpp"), LogModule::Unknown);
}

TEST_F(LoggerTest, LevelGatesMessages) {
    auto& logger = Logger::get();
    logger.set_level(LogLevel::Warn);
    EXPECT_FALSE(logger.is_enabled(LogLevel::Info));
    EXPECT_TRUE(logger.is_enabled(LogLevel::Warn));
    EXPECT_TRUE(logger.is_enabled(LogLevel::Critical));
    EXPECT_EQ(logger.level(), LogLevel::Warn);
}

TEST_F(LoggerTest, FileSinkReceivesFormattedMessages) {
    Logger::get().init(LogLevel::Debug, log_path_.string());
    LOG_DEBUG("dot of {} elements", 17);
    LOG_TRACE("below the threshold");

    const auto contents = read_log();
    EXPECT_NE(contents.find("dot of 17 elements"), std::string::npos);
    EXPECT_NE(contents.find("[debug]"), std::string::npos);
    EXPECT_EQ(contents.find("below the threshold"), std::string::npos);
}

TEST_F(LoggerTest, FilterPatternDropsNonMatchingMessages) {
    Logger::get().init(LogLevel::Info, log_path_.string(), "pool*");
    LOG_INFO("pool trimmed 128 bytes");
    LOG_INFO("context ready");

    const auto contents = read_log();
    EXPECT_NE(contents.find("pool trimmed"), std::string::npos);
    EXPECT_EQ(contents.find("context ready"), std::string::npos);
}

TEST_F(LoggerTest, DisabledModuleIsSilent) {
    auto& logger = Logger::get();
    logger.init(LogLevel::Info, log_path_.string());
    logger.enable_module(LogModule::Unknown, false);
    LOG_INFO("muted module");
    logger.enable_module(LogModule::Unknown, true);
    LOG_INFO("audible module");

    const auto contents = read_log();
    EXPECT_EQ(contents.find("muted module"), std::string::npos);
    EXPECT_NE(contents.find("audible module"), std::string::npos);
}

TEST_F(LoggerTest, PerformanceLevelShowsOnlyTimings) {
    Logger::get().init(LogLevel::Performance, log_path_.string());
    {
        LOG_TIMER("matrix_multiply");
    }
    LOG_INFO("regular message");

    const auto contents = read_log();
    EXPECT_NE(contents.find("[PERF] matrix_multiply took"), std::string::npos);
    EXPECT_EQ(contents.find("regular message"), std::string::npos);
}

TEST_F(LoggerTest, SingletonIsSharedWithCoreLibrary) {
#ifndef ZIT_CORE_SHARED
    FAIL() << "zit_core consumers should be built against the shared library";
#endif
    // Level set here is the one the library's own logging sees
    auto& logger = Logger::get();
    logger.init(LogLevel::Debug, log_path_.string());
    EXPECT_THROW(throw_tensor_error(ErrorCode::InvalidDimensions, "raised inside zit_core"), TensorError);

    const auto contents = read_log();
    EXPECT_NE(contents.find("raised inside zit_core"), std::string::npos);
}
