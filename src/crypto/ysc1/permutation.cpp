/**
 * @file permutation.cpp
 * @brief YSC1 1024-bit ARX Lai-Massey permutation and key schedule
 *
 * State layout: 16 x 64-bit words, mixed as four quadruples
 * {0-3}, {4-7}, {8-11}, {12-15}, then relabeled by the diagonal
 * permutation. All arithmetic is modulo 2^64 with no data-dependent
 * branches or table lookups.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "ysc1/internal/permutation_impl.h"
#include "ysc1/core/security.h"
#include <cstring>

namespace ysc1 {
namespace internal {

namespace {

// KEY_WORDS, NONCE_WORDS, INIT_ROUNDS, KEYSTREAM_ROUNDS
const VariantParams VARIANT_TABLE[] = {
    { YSC1_VARIANT_512,   8, 8, 16,  8 },
    { YSC1_VARIANT_1024, 16, 8, 20, 10 },
};

static inline uint64_t load64_le(const uint8_t* p) {
    return static_cast<uint64_t>(p[0])       | (static_cast<uint64_t>(p[1]) << 8) |
           (static_cast<uint64_t>(p[2]) << 16) | (static_cast<uint64_t>(p[3]) << 24) |
           (static_cast<uint64_t>(p[4]) << 32) | (static_cast<uint64_t>(p[5]) << 40) |
           (static_cast<uint64_t>(p[6]) << 48) | (static_cast<uint64_t>(p[7]) << 56);
}

static inline uint64_t f_word(uint64_t x) {
    uint64_t y = x + YSC1_ROTL64(x, R1);
    uint64_t z = y ^ YSC1_ROTL64(y, R2);
    return z + YSC1_ROTL64(z, R3);
}

static inline void mix(uint64_t& x0, uint64_t& x1, uint64_t& x2, uint64_t& x3) {
    const uint64_t t0 = f_word(x0 ^ x2);
    const uint64_t t1 = f_word(x1 ^ x3);
    const uint64_t y0 = x0 + t0;
    const uint64_t y1 = x1 + t1;
    const uint64_t y2 = x2 + t0;
    const uint64_t y3 = x3 + t1;
    x0 = y0 ^ y2;
    x1 = y1 ^ y3;
    x2 = y0;
    x3 = y1;
}

static inline void round_inplace(uint64_t s[YSC1_STATE_WORDS]) {
    mix(s[0],  s[1],  s[2],  s[3]);
    mix(s[4],  s[5],  s[6],  s[7]);
    mix(s[8],  s[9],  s[10], s[11]);
    mix(s[12], s[13], s[14], s[15]);

    uint64_t tmp[YSC1_STATE_WORDS];
    std::memcpy(tmp, s, sizeof(tmp));
    for (size_t i = 0; i < YSC1_STATE_WORDS; i++) {
        s[i] = tmp[DIAGONAL_PERM[i]];
    }
}

} // anonymous namespace

const VariantParams* find_variant(int variant) noexcept {
    for (const auto& p : VARIANT_TABLE) {
        if (static_cast<int>(p.variant) == variant) {
            return &p;
        }
    }
    return nullptr;
}

uint64_t round_f(uint64_t x) noexcept {
    return f_word(x);
}

void quad_mix(uint64_t x[4]) noexcept {
    mix(x[0], x[1], x[2], x[3]);
}

void diagonal_permute(uint64_t s[YSC1_STATE_WORDS]) noexcept {
    uint64_t tmp[YSC1_STATE_WORDS];
    std::memcpy(tmp, s, sizeof(tmp));
    for (size_t i = 0; i < YSC1_STATE_WORDS; i++) {
        s[i] = tmp[DIAGONAL_PERM[i]];
    }
}

void permutation_round(uint64_t s[YSC1_STATE_WORDS]) noexcept {
    round_inplace(s);
}

void permute(uint64_t s[YSC1_STATE_WORDS], uint32_t rounds) noexcept {
    for (uint32_t r = 0; r < rounds; r++) {
        round_inplace(s);
    }
}

void key_schedule(const VariantParams& params,
                  const uint8_t* key,
                  const uint8_t* nonce,
                  uint64_t state[YSC1_STATE_WORDS]) noexcept {
    std::memset(state, 0, YSC1_STATE_WORDS * sizeof(uint64_t));

    for (size_t i = 0; i < params.key_words; i++) {
        state[i] = load64_le(key + 8 * i);
    }

    // Nonce goes after the key when both fit, otherwise it is folded in
    if (params.key_words + params.nonce_words <= YSC1_STATE_WORDS) {
        for (size_t i = 0; i < params.nonce_words; i++) {
            state[params.key_words + i] = load64_le(nonce + 8 * i);
        }
    } else {
        for (size_t i = 0; i < params.nonce_words; i++) {
            state[i] ^= load64_le(nonce + 8 * i);
        }
    }

    state[YSC1_COUNTER_WORD] = 0;

    permute(state, params.init_rounds);
}

} // namespace internal
} // namespace ysc1
