/**
 * @file test_cpu_features.cpp
 * @brief CPU feature detection and security primitive tests
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <gtest/gtest.h>
#include <array>
#include <vector>

#include "ysc1/core/cpu_features.h"
#include "ysc1/core/security.h"

using ysc1::cpu::CPUFeatures;

// ============================================================================
// CPU Features
// ============================================================================

TEST(CPUFeaturesTest, DetectIsStable) {
    const CPUFeatures a = CPUFeatures::detect();
    const CPUFeatures b = CPUFeatures::detect();
    EXPECT_EQ(a.has_sse2, b.has_sse2);
    EXPECT_EQ(a.has_avx2, b.has_avx2);
    EXPECT_EQ(a.to_string(), b.to_string());
}

TEST(CPUFeaturesTest, FeatureHierarchy) {
    const CPUFeatures f = CPUFeatures::detect();
    if (f.has_avx2) {
        EXPECT_TRUE(f.has_avx);
    }
#if defined(__x86_64__) || defined(_M_X64)
    EXPECT_TRUE(f.has_sse2);
#endif
    EXPECT_FALSE(f.is_intel && f.is_amd);
}

TEST(CPUFeaturesTest, ToStringNotEmpty) {
    const std::string s = CPUFeatures::detect().to_string();
    EXPECT_FALSE(s.empty());
    EXPECT_NE(s.back(), ' ');
}

// ============================================================================
// Security Primitives
// ============================================================================

TEST(SecurityTest, SecureZero) {
    std::vector<uint8_t> buf(100, 0xab);
    ysc1_secure_zero(buf.data(), buf.size());
    for (uint8_t b : buf) {
        EXPECT_EQ(b, 0);
    }
    ysc1_secure_zero(nullptr, 10);
}

TEST(SecurityTest, SecureCompare) {
    std::array<uint8_t, 32> a{}, b{};
    a.fill(7);
    b.fill(7);
    EXPECT_EQ(ysc1_secure_compare(a.data(), b.data(), a.size()), 1);
    EXPECT_TRUE(ysc1::secure_compare(a, b));

    b[31] ^= 1;
    EXPECT_EQ(ysc1_secure_compare(a.data(), b.data(), a.size()), 0);
    EXPECT_FALSE(ysc1::secure_compare(a, b));
    EXPECT_EQ(ysc1_secure_compare(nullptr, b.data(), b.size()), 0);
}

TEST(SecurityTest, RandomBytes) {
    std::vector<uint8_t> a(64, 0), b(64, 0);
    ASSERT_EQ(ysc1_random_bytes(a.data(), a.size()), YSC1_SUCCESS);
    ASSERT_EQ(ysc1_random_bytes(b.data(), b.size()), YSC1_SUCCESS);
    EXPECT_NE(a, b);
    EXPECT_NE(a, std::vector<uint8_t>(64, 0));

    EXPECT_EQ(ysc1_random_bytes(nullptr, 16), YSC1_ERROR_INVALID_PARAM);
    EXPECT_EQ(ysc1_random_bytes(a.data(), 0), YSC1_SUCCESS);
}
