/**
 * @file test_ysc1_permutation.cpp
 * @brief YSC1 permutation unit tests
 *
 * Tests for the building blocks of the 1024-bit permutation:
 * - Round primitive F
 * - Lai-Massey quad mixer
 * - Diagonal permutation
 * - Full permutation round against a fixed regression vector
 * - Key/nonce schedule placement
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <gtest/gtest.h>
#include <cstring>
#include <vector>

#include "ysc1/internal/permutation_impl.h"

using namespace ysc1::internal;

// ============================================================================
// Round Primitive F
// ============================================================================

TEST(Ysc1PermutationTest, RoundF_KnownValues) {
    EXPECT_EQ(round_f(0x0000000000000000ULL), 0x0000000000000000ULL);
    EXPECT_EQ(round_f(0x0000000000000001ULL), 0x0040084008020841ULL);
    EXPECT_EQ(round_f(0x0123456789abcdefULL), 0xc59e097b9b9e0b3bULL);
    EXPECT_EQ(round_f(0xffffffffffffffffULL), 0x0000080008000041ULL);
    EXPECT_EQ(round_f(0x8000000000000000ULL), 0x8020042004010420ULL);
}

TEST(Ysc1PermutationTest, RoundF_MatchesDefinition) {
    uint64_t x = 0x243f6a8885a308d3ULL;
    for (int i = 0; i < 64; i++) {
        uint64_t y = x + YSC1_ROTL64(x, 11);
        uint64_t z = y ^ YSC1_ROTL64(y, 27);
        EXPECT_EQ(round_f(x), z + YSC1_ROTL64(z, 43));
        x = x * 6364136223846793005ULL + 1442695040888963407ULL;
    }
}

// ============================================================================
// Quad Mixer
// ============================================================================

TEST(Ysc1PermutationTest, QuadMix_KnownValues) {
    uint64_t x[4] = {1, 2, 3, 4};
    quad_mix(x);
    EXPECT_EQ(x[0], 0x6ULL);
    EXPECT_EQ(x[1], 0x2ULL);
    EXPECT_EQ(x[2], 0x0080108010041083ULL);
    EXPECT_EQ(x[3], 0x01803180300c3188ULL);

    uint64_t zero[4] = {0, 0, 0, 0};
    quad_mix(zero);
    for (uint64_t w : zero) {
        EXPECT_EQ(w, 0ULL);
    }
}

TEST(Ysc1PermutationTest, QuadMix_LaiMasseyStructure) {
    // out2 = x0 + t0 and out3 = x1 + t1 with t = F of the XOR differences
    uint64_t x[4] = {0x0123456789abcdefULL, 0xfedcba9876543210ULL,
                     0x0f1e2d3c4b5a6978ULL, 0x8796a5b4c3d2e1f0ULL};
    const uint64_t t0 = round_f(x[0] ^ x[2]);
    const uint64_t t1 = round_f(x[1] ^ x[3]);
    const uint64_t y0 = x[0] + t0, y1 = x[1] + t1;
    const uint64_t y2 = x[2] + t0, y3 = x[3] + t1;

    quad_mix(x);
    EXPECT_EQ(x[0], y0 ^ y2);
    EXPECT_EQ(x[1], y1 ^ y3);
    EXPECT_EQ(x[2], y0);
    EXPECT_EQ(x[3], y1);
}

// ============================================================================
// Diagonal Permutation
// ============================================================================

TEST(Ysc1PermutationTest, DiagonalPermute_Relabels) {
    uint64_t s[YSC1_STATE_WORDS];
    for (size_t i = 0; i < YSC1_STATE_WORDS; i++) {
        s[i] = 100 + i;
    }
    diagonal_permute(s);

    const uint64_t expected[YSC1_STATE_WORDS] = {
        100, 105, 110, 115, 104, 109, 114, 103,
        108, 113, 102, 107, 112, 101, 106, 111
    };
    for (size_t i = 0; i < YSC1_STATE_WORDS; i++) {
        EXPECT_EQ(s[i], expected[i]) << "word " << i;
    }
}

TEST(Ysc1PermutationTest, DiagonalPermute_IsBijection) {
    bool seen[YSC1_STATE_WORDS] = {false};
    for (size_t i = 0; i < YSC1_STATE_WORDS; i++) {
        ASSERT_LT(DIAGONAL_PERM[i], static_cast<size_t>(YSC1_STATE_WORDS));
        EXPECT_FALSE(seen[DIAGONAL_PERM[i]]);
        seen[DIAGONAL_PERM[i]] = true;
    }
}

TEST(Ysc1PermutationTest, DiagonalPermute_FourthPowerIsIdentity) {
    uint64_t s[YSC1_STATE_WORDS];
    for (size_t i = 0; i < YSC1_STATE_WORDS; i++) {
        s[i] = i * 0x1111111111111111ULL;
    }
    for (int r = 0; r < 4; r++) {
        diagonal_permute(s);
    }
    for (size_t i = 0; i < YSC1_STATE_WORDS; i++) {
        EXPECT_EQ(s[i], i * 0x1111111111111111ULL);
    }
}

// ============================================================================
// Permutation Round
// ============================================================================

TEST(Ysc1PermutationTest, PermutationRound_FixedVector) {
    uint64_t s[YSC1_STATE_WORDS];
    for (size_t i = 0; i < YSC1_STATE_WORDS; i++) {
        s[i] = static_cast<uint64_t>(i + 1) * 0x9E3779B97F4A7C15ULL;
    }
    EXPECT_EQ(s[0], 0x9e3779b97f4a7c15ULL);
    EXPECT_EQ(s[15], 0xe3779b97f4a7c150ULL);

    permutation_round(s);

    const uint64_t expected[YSC1_STATE_WORDS] = {
        0x44913393076d186aULL, 0x44b113fd02f5087aULL, 0xcdb037c0ea0d5d13ULL, 0x6539f21bb18c0905ULL,
        0xc4af0c9501753876ULL, 0x5c910d7d07ed385eULL, 0x959a764b1456a524ULL, 0x06d531a6efd20c8fULL,
        0xc7af1cf302af082eULL, 0xc491179501ad082aULL, 0x1e57e438747e52a5ULL, 0x956b14459330bc2cULL,
        0x47931ff506bd386aULL, 0x459114bf01b50836ULL, 0x4c20def9f3fa652eULL, 0x90353d072cac273bULL
    };
    for (size_t i = 0; i < YSC1_STATE_WORDS; i++) {
        EXPECT_EQ(s[i], expected[i]) << "word " << i;
    }
}

TEST(Ysc1PermutationTest, PermutationRound_ZeroIsFixedPoint) {
    uint64_t s[YSC1_STATE_WORDS] = {0};
    permute(s, 20);
    for (uint64_t w : s) {
        EXPECT_EQ(w, 0ULL);
    }
}

TEST(Ysc1PermutationTest, Permute_EqualsRepeatedRounds) {
    uint64_t a[YSC1_STATE_WORDS], b[YSC1_STATE_WORDS];
    for (size_t i = 0; i < YSC1_STATE_WORDS; i++) {
        a[i] = b[i] = 0x0123456789abcdefULL ^ (i << 40) ^ i;
    }
    permute(a, 10);
    for (int r = 0; r < 10; r++) {
        permutation_round(b);
    }
    EXPECT_EQ(0, std::memcmp(a, b, sizeof(a)));
}

// ============================================================================
// Variant Table and Key Schedule
// ============================================================================

TEST(Ysc1PermutationTest, VariantTable) {
    const VariantParams* v512 = find_variant(YSC1_VARIANT_512);
    ASSERT_NE(v512, nullptr);
    EXPECT_EQ(v512->key_words, 8u);
    EXPECT_EQ(v512->nonce_words, 8u);
    EXPECT_EQ(v512->init_rounds, 16u);
    EXPECT_EQ(v512->keystream_rounds, 8u);

    const VariantParams* v1024 = find_variant(YSC1_VARIANT_1024);
    ASSERT_NE(v1024, nullptr);
    EXPECT_EQ(v1024->key_words, 16u);
    EXPECT_EQ(v1024->nonce_words, 8u);
    EXPECT_EQ(v1024->init_rounds, 20u);
    EXPECT_EQ(v1024->keystream_rounds, 10u);

    EXPECT_EQ(find_variant(0), nullptr);
    EXPECT_EQ(find_variant(256), nullptr);
    EXPECT_EQ(find_variant(2048), nullptr);
}

TEST(Ysc1PermutationTest, KeySchedule_512_KnownState) {
    std::vector<uint8_t> key(64), nonce(64);
    for (size_t i = 0; i < 64; i++) {
        key[i] = static_cast<uint8_t>(i);
        nonce[i] = static_cast<uint8_t>(64 + i);
    }

    uint64_t state[YSC1_STATE_WORDS];
    key_schedule(*find_variant(YSC1_VARIANT_512), key.data(), nonce.data(), state);

    const uint64_t expected[YSC1_STATE_WORDS] = {
        0xea286324308f60baULL, 0x55b1f61593676845ULL, 0xb8c2d61d2126a166ULL, 0xca6977bd7e54f0a9ULL,
        0x1a1e59870f8872d4ULL, 0xdc48bdeb7aba00afULL, 0x136ad027b1674905ULL, 0x55806ee480f8e240ULL,
        0x7087e19a3f11fd2eULL, 0xfe6a4aa3ba19d817ULL, 0xd4ef8bff4a787174ULL, 0xe407f2020b30c7bcULL,
        0x5f35a386d0a14f5aULL, 0x6733695de2362884ULL, 0x92e709aa0c222ca0ULL, 0xcb4bff5c00b88826ULL
    };
    for (size_t i = 0; i < YSC1_STATE_WORDS; i++) {
        EXPECT_EQ(state[i], expected[i]) << "word " << i;
    }
}

TEST(Ysc1PermutationTest, KeySchedule_1024_KnownState) {
    std::vector<uint8_t> key(128), nonce(64);
    for (size_t i = 0; i < 128; i++) {
        key[i] = static_cast<uint8_t>(i);
    }
    for (size_t i = 0; i < 64; i++) {
        nonce[i] = static_cast<uint8_t>(128 + i);
    }

    uint64_t state[YSC1_STATE_WORDS];
    key_schedule(*find_variant(YSC1_VARIANT_1024), key.data(), nonce.data(), state);

    const uint64_t expected[YSC1_STATE_WORDS] = {
        0x9d0cdfb54cd02454ULL, 0x85788e7aa56a27c0ULL, 0xf18e690f64f07ea9ULL, 0x769f71ba9701435bULL,
        0x281c5a295c3d0004ULL, 0xaf732f684294299fULL, 0x42ab7c8771baab1fULL, 0x7f1fe262a37395bbULL,
        0xf8963ed2d3a39e33ULL, 0xbfc762d50d54e0d2ULL, 0x676a0aa54c9323a8ULL, 0x49c4fa56e6c18f6dULL,
        0xe68760c26048e327ULL, 0x18453cba43ba4a6dULL, 0x29df44c18b1ddc96ULL, 0x53f854b5ee86712bULL
    };
    for (size_t i = 0; i < YSC1_STATE_WORDS; i++) {
        EXPECT_EQ(state[i], expected[i]) << "word " << i;
    }
}

TEST(Ysc1PermutationTest, KeySchedule_CounterSlotIgnoresInput) {
    // Word 12 is cleared before the init rounds, so input bytes landing there
    // do not influence the state: nonce word 4 for YSC1-512.
    std::vector<uint8_t> key(64, 0x11), nonce_a(64, 0x22), nonce_b(64, 0x22);
    nonce_b[32] ^= 0x01;

    uint64_t a[YSC1_STATE_WORDS], b[YSC1_STATE_WORDS];
    const VariantParams& p = *find_variant(YSC1_VARIANT_512);
    key_schedule(p, key.data(), nonce_a.data(), a);
    key_schedule(p, key.data(), nonce_b.data(), b);
    EXPECT_EQ(0, std::memcmp(a, b, sizeof(a)));

    nonce_b[32] ^= 0x01;
    nonce_b[0] ^= 0x01;
    key_schedule(p, key.data(), nonce_b.data(), b);
    EXPECT_NE(0, std::memcmp(a, b, sizeof(a)));
}
