/* SPDX-FileCopyrightText: 2025 zit Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "test_helpers.hpp"
#include "zit/parameters.hpp"
#include "zit/tensor.hpp"
#include <gtest/gtest.h>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

using namespace zit::core;
using namespace zit::core::param;
using zit::test::CountingAllocator;

namespace {
    // Runs the same product on whichever context the parameters select
    struct MultiplyAndName {
        std::string operator()(auto& ctx) const {
            auto a = ctx.template matrix_from_data<float>({1, 2, 3, 4, 5, 6}, 2, 3);
            auto b = ctx.template matrix_from_data<float>({7, 8, 9, 10, 11, 12}, 3, 2);
            auto c = ctx.matrix_multiply(a, b);
            EXPECT_FLOAT_EQ(c.at(0, 0), 58.0f);
            EXPECT_FLOAT_EQ(c.at(1, 1), 154.0f);
            return std::string(ctx.backend_name());
        }
    };
} // namespace

static_assert(ContextVisitor<MultiplyAndName>);
static_assert(!ContextVisitor<decltype([](TensorContext<CpuBackend>&) {})>);

class ContextDispatchTest : public ::testing::TestWithParam<std::pair<BackendKind, std::string_view>> {
protected:
    void TearDown() override {
        EXPECT_EQ(alloc.live_buffers(), 0u);
    }

    CountingAllocator alloc;
};

TEST_P(ContextDispatchTest, SharedGpuContextSelectsConfiguredBackend) {
    const auto [kind, name] = GetParam();
    ContextParameters params;
    params.backend = kind;

    const auto used = with_context(params, zit::test::shared_gpu_context(), MultiplyAndName{}, alloc);
    EXPECT_EQ(used, name);
}

TEST_P(ContextDispatchTest, OwnedGpuContextSelectsConfiguredBackend) {
    const auto [kind, name] = GetParam();
    ContextParameters params;
    params.backend = kind;
    params.gpu.max_cached_bytes = 1 << 20;

    const auto used = with_context(params, MultiplyAndName{}, alloc);
    EXPECT_EQ(used, name);
}

INSTANTIATE_TEST_SUITE_P(
    AllBackends, ContextDispatchTest,
    ::testing::Values(std::pair<BackendKind, std::string_view>{BackendKind::Cpu, "cpu"},
                      std::pair<BackendKind, std::string_view>{BackendKind::Simd, "simd"},
                      std::pair<BackendKind, std::string_view>{BackendKind::Gpu, "gpu"}),
    [](const auto& info) { return std::string(info.param.second); });

TEST(ContextDispatch, DisabledGpuStillRunsThroughGpuBackend) {
    ContextParameters params;
    params.backend = BackendKind::Gpu;
    params.gpu.enabled = false;

    bool device_used = true;
    with_context(params, [&](auto& ctx) {
        if constexpr (std::same_as<typename std::remove_cvref_t<decltype(ctx)>::backend_type, GpuBackend>) {
            device_used = ctx.backend().context().is_initialized();
        }
        auto v = ctx.template vector_from_data<float>({3, 4});
        EXPECT_FLOAT_EQ(ctx.vector_norm(v), 5.0f);
    });
    EXPECT_FALSE(device_used);
}

TEST(ContextDispatch, UnknownKindIsRejected) {
    ContextParameters params;
    params.backend = static_cast<BackendKind>(7);
    try {
        with_context(params, zit::test::shared_gpu_context(), [](auto&) {});
        FAIL() << "expected UnsupportedOperation";
    } catch (const TensorError& e) {
        EXPECT_EQ(e.code(), ErrorCode::UnsupportedOperation);
    }
}
