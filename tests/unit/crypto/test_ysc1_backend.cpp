/**
 * @file test_ysc1_backend.cpp
 * @brief YSC1 backend parity tests
 *
 * Every vector backend available on the running CPU must produce blocks
 * byte-identical to the scalar backend, both through the internal block
 * functions and through full contexts.
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <gtest/gtest.h>
#include <cstring>
#include <limits>
#include <random>
#include <string>
#include <vector>

#include "ysc1/ysc1.h"
#include "ysc1/internal/permutation_impl.h"

using namespace ysc1::internal;

class Ysc1BackendTest : public ::testing::TestWithParam<ysc1_backend_t> {
protected:
    void SetUp() override {
        if (!ysc1_backend_available(GetParam())) {
            GTEST_SKIP() << ysc1_backend_name(GetParam()) << " backend not available";
        }
    }
};

// ============================================================================
// Block Function Parity
// ============================================================================

TEST_P(Ysc1BackendTest, BlockFunctionMatchesScalar) {
    KeystreamBlockFn fn = backend_fn(GetParam());
    ASSERT_NE(fn, nullptr);

    std::mt19937_64 rng(20260101);
    const uint32_t rounds[] = {1, 8, 10, 20};

    for (int t = 0; t < 128; t++) {
        uint64_t state[YSC1_STATE_WORDS];
        for (auto& w : state) w = rng();
        uint64_t counter = rng();
        if (t == 0) counter = 0;
        if (t == 1) counter = std::numeric_limits<uint64_t>::max();

        const uint64_t saved[YSC1_STATE_WORDS] = {
            state[0], state[1], state[2], state[3], state[4], state[5], state[6], state[7],
            state[8], state[9], state[10], state[11], state[12], state[13], state[14], state[15]
        };

        for (uint32_t r : rounds) {
            uint8_t expected[YSC1_BLOCK_SIZE], actual[YSC1_BLOCK_SIZE];
            keystream_block_soft(state, counter, r, expected);
            fn(state, counter, r, actual);
            ASSERT_EQ(0, std::memcmp(expected, actual, YSC1_BLOCK_SIZE))
                << "trial " << t << ", rounds " << r;
        }
        EXPECT_EQ(0, std::memcmp(state, saved, sizeof(saved))) << "state modified";
    }
}

// ============================================================================
// Context Parity
// ============================================================================

TEST_P(Ysc1BackendTest, ContextMatchesScalar) {
    std::mt19937_64 rng(0x59534331);
    const ysc1_variant_t variants[] = {YSC1_VARIANT_512, YSC1_VARIANT_1024};

    for (int t = 0; t < 100; t++) {
        const ysc1_variant_t variant = variants[t % 2];
        const size_t key_len = variant == YSC1_VARIANT_512 ? YSC1_512_KEY_SIZE : YSC1_1024_KEY_SIZE;

        std::vector<uint8_t> key(key_len), nonce(YSC1_MAX_NONCE_SIZE);
        for (auto& b : key) b = static_cast<uint8_t>(rng());
        for (auto& b : nonce) b = static_cast<uint8_t>(rng());
        const uint64_t counter = rng() >> 1;
        const size_t len = 1 + static_cast<size_t>(rng() % 300);

        ysc1_ctx_t soft, vec;
        ASSERT_EQ(ysc1_init_with_backend(&soft, variant, key.data(), key.size(), nonce.data(),
                                         nonce.size(), YSC1_BACKEND_SOFT), YSC1_SUCCESS);
        ASSERT_EQ(ysc1_init_with_backend(&vec, variant, key.data(), key.size(), nonce.data(),
                                         nonce.size(), GetParam()), YSC1_SUCCESS);
        EXPECT_EQ(ysc1_get_backend(&soft), YSC1_BACKEND_SOFT);
        EXPECT_EQ(ysc1_get_backend(&vec), GetParam());

        ASSERT_EQ(ysc1_set_block_pos(&soft, counter), YSC1_SUCCESS);
        ASSERT_EQ(ysc1_set_block_pos(&vec, counter), YSC1_SUCCESS);

        std::vector<uint8_t> a(len, 0), b(len, 0);
        ASSERT_EQ(ysc1_crypt(&soft, a.data(), len, a.data()), YSC1_SUCCESS);
        ASSERT_EQ(ysc1_crypt(&vec, b.data(), len, b.data()), YSC1_SUCCESS);
        EXPECT_EQ(a, b) << "trial " << t;

        ysc1_clear(&soft);
        ysc1_clear(&vec);
    }
}

INSTANTIATE_TEST_SUITE_P(
    Backends, Ysc1BackendTest,
    ::testing::Values(YSC1_BACKEND_SOFT, YSC1_BACKEND_SSE2, YSC1_BACKEND_AVX2),
    [](const ::testing::TestParamInfo<ysc1_backend_t>& info) {
        return std::string(ysc1_backend_name(info.param));
    });

// ============================================================================
// Selection
// ============================================================================

TEST(Ysc1BackendSelectionTest, AutoResolvesToConcreteBackend) {
    std::vector<uint8_t> key(YSC1_512_KEY_SIZE, 1), nonce(YSC1_512_NONCE_SIZE, 2);
    ysc1_ctx_t ctx;
    ASSERT_EQ(ysc1_init(&ctx, YSC1_VARIANT_512, key.data(), key.size(),
                        nonce.data(), nonce.size()), YSC1_SUCCESS);

    const ysc1_backend_t chosen = ysc1_get_backend(&ctx);
    EXPECT_NE(chosen, YSC1_BACKEND_AUTO);
    EXPECT_TRUE(ysc1_backend_available(chosen));
    EXPECT_EQ(chosen, probe_backend());
#ifdef YSC1_FORCE_SOFT
    EXPECT_EQ(chosen, YSC1_BACKEND_SOFT);
#endif
    ysc1_clear(&ctx);
}

TEST(Ysc1BackendSelectionTest, ScalarAlwaysAvailable) {
    EXPECT_TRUE(ysc1_backend_available(YSC1_BACKEND_SOFT));
    EXPECT_TRUE(ysc1_backend_available(YSC1_BACKEND_AUTO));
    EXPECT_NE(backend_fn(YSC1_BACKEND_SOFT), nullptr);
    EXPECT_EQ(backend_fn(YSC1_BACKEND_AUTO), nullptr);
}

TEST(Ysc1BackendSelectionTest, AvailabilityFollowsCpuFeatures) {
    const auto features = ysc1::cpu::CPUFeatures::detect();
    if (ysc1_backend_available(YSC1_BACKEND_AVX2)) {
        EXPECT_TRUE(features.has_avx2);
    }
    if (ysc1_backend_available(YSC1_BACKEND_SSE2)) {
        EXPECT_TRUE(features.has_sse2);
    }
}
