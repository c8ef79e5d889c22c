/* SPDX-FileCopyrightText: 2025 zit Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "test_helpers.hpp"
#include "zit/tensor.hpp"
#include <cmath>
#include <gtest/gtest.h>
#include <limits>
#include <tuple>
#include <vector>

using namespace zit::core;
using zit::test::expect_equal;
using zit::test::expect_near;
using zit::test::iota_values;
using zit::test::random_values;

namespace {
    const std::vector<size_t> kLengths = {0, 1, 15, 16, 17, 255, 256, 257, 4099};
} // namespace

// ===== Context lifecycle (no device required) =====

TEST(GpuContextTest, DisabledContextStaysUninitialized) {
    GpuContext context(GpuOptions{.enabled = false});
    EXPECT_FALSE(context.init());
    EXPECT_FALSE(context.is_initialized());
    EXPECT_NO_THROW(context.shutdown());
}

TEST(GpuContextTest, ResourcesRequireInitialization) {
    GpuContext context(GpuOptions{.enabled = false});
    context.init();
    try {
        (void)context.pool();
        FAIL() << "expected BackendError";
    } catch (const TensorError& e) {
        EXPECT_EQ(e.code(), ErrorCode::BackendError);
    }
    EXPECT_THROW((void)context.stream(), TensorError);
    EXPECT_THROW((void)context.pipeline(GpuKernel::Add), TensorError);
}

TEST(GpuContextTest, InitIsIdempotentAndShutdownReleases) {
    GpuContext context;
    const bool first = context.init();
    EXPECT_EQ(context.init(), first);
    EXPECT_EQ(context.is_initialized(), first);
    EXPECT_EQ(first, GpuContext::is_available());

    context.shutdown();
    EXPECT_FALSE(context.is_initialized());
    context.shutdown();
    EXPECT_FALSE(context.is_initialized());
}

TEST(GpuContextTest, KernelNamesCoverEveryPipeline) {
    for (size_t i = 0; i < kGpuKernelCount; ++i) {
        EXPECT_NE(gpu_kernel_name(static_cast<GpuKernel>(i)), "unknown") << "kernel " << i;
    }
}

// ===== CPU fallback (uninitialized context) =====

class GpuFallbackTest : public ::testing::Test {
protected:
    GpuContext context{GpuOptions{.enabled = false}};
    GpuBackend gpu{context};
    CpuBackend cpu;
};

TEST_F(GpuFallbackTest, MatrixMultiplyReferenceResult) {
    auto a = Matrix<float>::from_data({1, 2, 3, 4, 5, 6}, 2, 3);
    auto b = Matrix<float>::from_data({7, 8, 9, 10, 11, 12}, 3, 2);
    auto out = Matrix<float>::zeros(2, 2);
    gpu.matrix_multiply(a, b, out);
    EXPECT_FLOAT_EQ(out.at(0, 0), 58.0f);
    EXPECT_FLOAT_EQ(out.at(0, 1), 64.0f);
    EXPECT_FLOAT_EQ(out.at(1, 0), 139.0f);
    EXPECT_FLOAT_EQ(out.at(1, 1), 154.0f);
}

TEST_F(GpuFallbackTest, AllOperationsMatchCpu) {
    auto a = Vector<float>::from_data(random_values<float>(33, 1));
    auto b = Vector<float>::from_data(random_values<float>(33, 2));
    auto expected = Vector<float>::zeros(33);
    auto actual = Vector<float>::zeros(33);

    cpu.op(a, b, expected, ops::Divide{});
    gpu.op(a, b, actual, ops::Divide{});
    expect_equal(actual, expected, "divide");

    cpu.map(a, expected, ops::Square{});
    gpu.map(a, actual, ops::Square{});
    expect_equal(actual, expected, "map");

    cpu.scalar_multiply(a, -2.0f, expected);
    gpu.scalar_multiply(a, -2.0f, actual);
    expect_equal(actual, expected, "scalar_multiply");

    EXPECT_FLOAT_EQ(gpu.vector_dot(a, b), cpu.vector_dot(a, b));
    EXPECT_FLOAT_EQ(gpu.vector_norm(a), cpu.vector_norm(a));
}

TEST_F(GpuFallbackTest, NonFloatTypesUseCpu) {
    auto m = Matrix<double>::from_data({1, 2, 3, 4}, 2, 2);
    auto out = Matrix<double>::zeros(2, 2);
    gpu.matrix_transpose(m, out);
    EXPECT_DOUBLE_EQ(out.at(0, 1), 3.0);

    auto v = Vector<int>::from_data({3, 4});
    EXPECT_EQ(gpu.vector_norm(v), 5);
}

TEST_F(GpuFallbackTest, ErrorsMatchCpu) {
    auto a = Vector<float>::zeros(3);
    auto b = Vector<float>::zeros(4);
    try {
        (void)gpu.vector_dot(a, b);
        FAIL() << "expected LengthMismatch";
    } catch (const TensorError& e) {
        EXPECT_EQ(e.code(), ErrorCode::LengthMismatch);
    }

    auto m = Matrix<float>::zeros(2, 3);
    auto bad = Matrix<float>::zeros(2, 3);
    EXPECT_THROW(gpu.matrix_transpose(m, bad), TensorError);
}

// ===== Device path (skipped without a CUDA device) =====

class GpuDeviceTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!zit::test::shared_gpu_context().is_initialized()) {
            GTEST_SKIP() << "No CUDA device available";
        }
    }

    GpuBackend gpu{zit::test::shared_gpu_context()};
    CpuBackend cpu;
};

TEST_F(GpuDeviceTest, MatrixMultiplyReferenceResult) {
    auto a = Matrix<float>::from_data({1, 2, 3, 4, 5, 6}, 2, 3);
    auto b = Matrix<float>::from_data({7, 8, 9, 10, 11, 12}, 3, 2);
    auto out = Matrix<float>::zeros(2, 2);
    gpu.matrix_multiply(a, b, out);
    EXPECT_FLOAT_EQ(out.at(0, 0), 58.0f);
    EXPECT_FLOAT_EQ(out.at(0, 1), 64.0f);
    EXPECT_FLOAT_EQ(out.at(1, 0), 139.0f);
    EXPECT_FLOAT_EQ(out.at(1, 1), 154.0f);
}

TEST_F(GpuDeviceTest, ElementwiseMatchesCpu) {
    for (const size_t n : kLengths) {
        auto a = Vector<float>::from_data(random_values<float>(n, 3));
        auto b = Vector<float>::from_data(random_values<float>(n, 4));
        auto expected = Vector<float>::zeros(n);
        auto actual = Vector<float>::zeros(n);

        cpu.op(a, b, expected, ops::Add{});
        gpu.op(a, b, actual, ops::Add{});
        expect_near(actual, expected, 1e-6, "add");

        cpu.op(a, b, expected, ops::Multiply{});
        gpu.op(a, b, actual, ops::Multiply{});
        expect_near(actual, expected, 1e-6, "multiply");

        cpu.scalar_multiply(a, 3.0f, expected);
        gpu.scalar_multiply(a, 3.0f, actual);
        expect_near(actual, expected, 1e-6, "scalar_multiply");
    }
}

TEST_F(GpuDeviceTest, ScalarMultiplyByZeroKeepsNaN) {
    auto a = Vector<float>::from_data({1.0f, std::numeric_limits<float>::quiet_NaN(), -2.0f});
    auto out = Vector<float>::zeros(3);
    gpu.scalar_multiply(a, 0.0f, out);
    EXPECT_FLOAT_EQ(out[0], 0.0f);
    EXPECT_TRUE(std::isnan(out[1]));
    EXPECT_FLOAT_EQ(std::abs(out[2]), 0.0f);
}

TEST_F(GpuDeviceTest, ReductionsMatchCpu) {
    for (const size_t n : kLengths) {
        auto a = Vector<float>::from_data(random_values<float>(n, 5));
        auto b = Vector<float>::from_data(random_values<float>(n, 6));
        const float tol = 1e-4f * static_cast<float>(n + 1);
        EXPECT_NEAR(gpu.vector_dot(a, b), cpu.vector_dot(a, b), tol) << "dot length " << n;
        EXPECT_NEAR(gpu.vector_norm(a), cpu.vector_norm(a), tol) << "norm length " << n;
    }

    auto v = Vector<float>::from_data({3, 4});
    EXPECT_FLOAT_EQ(gpu.vector_norm(v), 5.0f);
}

TEST_F(GpuDeviceTest, MatrixProductsMatchCpu) {
    const std::vector<std::tuple<size_t, size_t, size_t>> shapes = {
        {1, 1, 1}, {3, 15, 4}, {16, 16, 16}, {17, 33, 9}, {64, 40, 70}};
    for (const auto& [m, k, n] : shapes) {
        auto a = Matrix<float>::from_data(random_values<float>(m * k, 7), m, k);
        auto b = Matrix<float>::from_data(random_values<float>(k * n, 8), k, n);
        auto expected = Matrix<float>::zeros(m, n);
        auto actual = Matrix<float>::zeros(m, n);
        cpu.matrix_multiply(a, b, expected);
        gpu.matrix_multiply(a, b, actual);
        expect_near(actual, expected, 1e-4, "matrix_multiply");

        auto v = Vector<float>::from_data(random_values<float>(k, 9));
        auto mv_expected = Vector<float>::zeros(m);
        auto mv_actual = Vector<float>::zeros(m);
        cpu.matrix_vector_multiply(a, v, mv_expected);
        gpu.matrix_vector_multiply(a, v, mv_actual);
        expect_near(mv_actual, mv_expected, 1e-4, "matrix_vector_multiply");
    }
}

TEST_F(GpuDeviceTest, TransposeIsInvolutive) {
    for (const auto& [rows, cols] : std::vector<std::pair<size_t, size_t>>{{0, 0}, {1, 1}, {3, 5}, {33, 65}}) {
        auto m = Matrix<float>::from_data(random_values<float>(rows * cols, 10), rows, cols);
        auto t = Matrix<float>::zeros(cols, rows);
        auto back = Matrix<float>::zeros(rows, cols);
        gpu.matrix_transpose(m, t);
        gpu.matrix_transpose(t, back);
        expect_equal(back, m, "transpose twice");
    }
}

TEST_F(GpuDeviceTest, TallMatricesExceedingOneGridPass) {
    // More rows than a single launch grid covers along y
    const size_t rows = (size_t{1} << 20) + 17;
    auto column = Matrix<float>::from_data(iota_values<float>(rows), rows, 1);
    auto row = Matrix<float>::zeros(1, rows);
    gpu.matrix_transpose(column, row);
    for (size_t i = 0; i < rows; i += 4099) {
        ASSERT_FLOAT_EQ(row.at(0, i), column.at(i, 0)) << "column " << i;
    }
    EXPECT_FLOAT_EQ(row.at(0, rows - 1), column.at(rows - 1, 0));

    auto tall = Matrix<float>::from_data(random_values<float>(rows * 3, 21), rows, 3);
    auto weights = Matrix<float>::from_data({1, 0, 0, 1, 1, -1}, 3, 2);
    auto gpu_out = Matrix<float>::zeros(rows, 2);
    auto cpu_out = Matrix<float>::zeros(rows, 2);
    gpu.matrix_multiply(tall, weights, gpu_out);
    cpu.matrix_multiply(tall, weights, cpu_out);
    expect_near(gpu_out, cpu_out, 1e-4, "tall matrix multiply");
}

TEST_F(GpuDeviceTest, PoolBuffersAreReturnedAfterEachCall) {
    auto& pool = zit::test::shared_gpu_context().pool();
    auto a = Vector<float>::from_data(random_values<float>(100, 11));
    auto b = Vector<float>::from_data(random_values<float>(100, 12));
    auto out = Vector<float>::zeros(100);

    gpu.op(a, b, out, ops::Subtract{});
    EXPECT_EQ(pool.stats().outstanding_buffers, 0u);

    const auto misses = pool.stats().misses;
    gpu.op(a, b, out, ops::Subtract{});
    EXPECT_EQ(pool.stats().misses, misses) << "second call should be served from the pool";

    auto wrong = Vector<float>::zeros(99);
    EXPECT_THROW(gpu.op(a, b, wrong, ops::Add{}), TensorError);
    EXPECT_EQ(pool.stats().outstanding_buffers, 0u);
}
