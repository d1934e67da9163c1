/**
 * @file backend_avx2.cpp
 * @brief AVX2 keystream backend (4 x 64-bit lanes)
 *
 * Same column layout as the SSE2 backend, one __m256i per column:
 * - A = {x0, x4, x8, x12}, B = {x1, x5, x9, x13}
 * - C = {x2, x6, x10, x14}, D = {x3, x7, x11, x15}
 *
 * The quad mix runs on all four quadruples at once and the diagonal
 * permutation is a lane rotation of B, C and D by 1, 2 and 3.
 *
 * This file is compiled with -mavx2 and is only called after runtime
 * detection confirmed AVX2 support. It uses no inline helpers from shared
 * headers.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "ysc1/internal/permutation_impl.h"
#include "ysc1/core/security.h"
#include <cstring>

#ifdef YSC1_HAS_AVX2_BACKEND

#include <immintrin.h>

namespace ysc1 {
namespace internal {

namespace {

#define ROTL256(x, n) _mm256_or_si256(_mm256_slli_epi64((x), (n)), _mm256_srli_epi64((x), 64 - (n)))

static inline __m256i f_avx2(__m256i x) {
    __m256i y = _mm256_add_epi64(x, ROTL256(x, 11));
    __m256i z = _mm256_xor_si256(y, ROTL256(y, 27));
    return _mm256_add_epi64(z, ROTL256(z, 43));
}

static inline void round_avx2(__m256i& a, __m256i& b, __m256i& c, __m256i& d) {
    const __m256i t0 = f_avx2(_mm256_xor_si256(a, c));
    const __m256i t1 = f_avx2(_mm256_xor_si256(b, d));
    const __m256i y0 = _mm256_add_epi64(a, t0);
    const __m256i y1 = _mm256_add_epi64(b, t1);
    const __m256i y2 = _mm256_add_epi64(c, t0);
    const __m256i y3 = _mm256_add_epi64(d, t1);

    a = _mm256_xor_si256(y0, y2);
    b = _mm256_xor_si256(y1, y3);
    c = y0;
    d = y1;

    // Diagonal permutation: column n rotates its lanes left by n
    b = _mm256_permute4x64_epi64(b, _MM_SHUFFLE(0, 3, 2, 1));
    c = _mm256_permute4x64_epi64(c, _MM_SHUFFLE(1, 0, 3, 2));
    d = _mm256_permute4x64_epi64(d, _MM_SHUFFLE(2, 1, 0, 3));
}

} // anonymous namespace

void keystream_block_avx2(const uint64_t state[YSC1_STATE_WORDS], uint64_t counter,
                          uint32_t rounds, uint8_t out[YSC1_BLOCK_SIZE]) noexcept {
    alignas(32) uint64_t x[YSC1_STATE_WORDS];
    std::memcpy(x, state, sizeof(x));
    x[YSC1_COUNTER_WORD] = counter;

    // Rows are quadruples; transpose into columns
    const __m256i r0 = _mm256_load_si256(reinterpret_cast<const __m256i*>(x + 0));
    const __m256i r1 = _mm256_load_si256(reinterpret_cast<const __m256i*>(x + 4));
    const __m256i r2 = _mm256_load_si256(reinterpret_cast<const __m256i*>(x + 8));
    const __m256i r3 = _mm256_load_si256(reinterpret_cast<const __m256i*>(x + 12));

    const __m256i t0 = _mm256_unpacklo_epi64(r0, r1);  // x0 x4 x2 x6
    const __m256i t1 = _mm256_unpackhi_epi64(r0, r1);  // x1 x5 x3 x7
    const __m256i t2 = _mm256_unpacklo_epi64(r2, r3);  // x8 x12 x10 x14
    const __m256i t3 = _mm256_unpackhi_epi64(r2, r3);  // x9 x13 x11 x15

    __m256i a = _mm256_permute2x128_si256(t0, t2, 0x20);
    __m256i b = _mm256_permute2x128_si256(t1, t3, 0x20);
    __m256i c = _mm256_permute2x128_si256(t0, t2, 0x31);
    __m256i d = _mm256_permute2x128_si256(t1, t3, 0x31);

    for (uint32_t r = 0; r < rounds; r++) {
        round_avx2(a, b, c, d);
    }

    // Output words 0..7 = lane 0 of A..D, then lane 1 of A..D
    const __m256i lo_ab = _mm256_unpacklo_epi64(a, b);
    const __m256i lo_cd = _mm256_unpacklo_epi64(c, d);
    const __m256i hi_ab = _mm256_unpackhi_epi64(a, b);
    const __m256i hi_cd = _mm256_unpackhi_epi64(c, d);

    _mm256_storeu_si256(reinterpret_cast<__m256i*>(out),
                        _mm256_permute2x128_si256(lo_ab, lo_cd, 0x20));
    _mm256_storeu_si256(reinterpret_cast<__m256i*>(out + 32),
                        _mm256_permute2x128_si256(hi_ab, hi_cd, 0x20));

    ysc1_secure_zero(x, sizeof(x));
}

#undef ROTL256

} // namespace internal
} // namespace ysc1

#endif // YSC1_HAS_AVX2_BACKEND
