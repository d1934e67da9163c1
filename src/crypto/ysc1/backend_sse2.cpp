/**
 * @file backend_sse2.cpp
 * @brief SSE2 keystream backend (2 x 64-bit lanes)
 *
 * Column layout: column c holds words {c, 4+c, 8+c, 12+c}, i.e. lane q of
 * every column belongs to quadruple q. One round then becomes the quad mix
 * applied column-wise (A, B, C, D = columns 0..3) followed by rotating the
 * lanes of column c left by c, which is the diagonal permutation.
 *
 * A 4-lane column is held as a (lo, hi) pair of __m128i.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include "ysc1/internal/permutation_impl.h"
#include "ysc1/core/security.h"
#include <cstring>

#ifdef YSC1_HAS_SSE2_BACKEND

#include <emmintrin.h>

namespace ysc1 {
namespace internal {

namespace {

#define ROTL128(x, n) _mm_or_si128(_mm_slli_epi64((x), (n)), _mm_srli_epi64((x), 64 - (n)))

struct Col {
    __m128i lo;  // lanes 0, 1
    __m128i hi;  // lanes 2, 3
};

static inline __m128i f_vec(__m128i x) {
    __m128i y = _mm_add_epi64(x, ROTL128(x, 11));
    __m128i z = _mm_xor_si128(y, ROTL128(y, 27));
    return _mm_add_epi64(z, ROTL128(z, 43));
}

static inline void mix_half(__m128i& a, __m128i& b, __m128i& c, __m128i& d) {
    const __m128i t0 = f_vec(_mm_xor_si128(a, c));
    const __m128i t1 = f_vec(_mm_xor_si128(b, d));
    const __m128i y0 = _mm_add_epi64(a, t0);
    const __m128i y1 = _mm_add_epi64(b, t1);
    const __m128i y2 = _mm_add_epi64(c, t0);
    const __m128i y3 = _mm_add_epi64(d, t1);
    a = _mm_xor_si128(y0, y2);
    b = _mm_xor_si128(y1, y3);
    c = y0;
    d = y1;
}

// Lane rotations: new lane q = old lane (q + n) % 4
static inline void rot_lanes_1(Col& v) {
    const __m128i lo = _mm_or_si128(_mm_srli_si128(v.lo, 8), _mm_slli_si128(v.hi, 8));
    const __m128i hi = _mm_or_si128(_mm_srli_si128(v.hi, 8), _mm_slli_si128(v.lo, 8));
    v.lo = lo;
    v.hi = hi;
}

static inline void rot_lanes_2(Col& v) {
    const __m128i t = v.lo;
    v.lo = v.hi;
    v.hi = t;
}

static inline void rot_lanes_3(Col& v) {
    const __m128i lo = _mm_or_si128(_mm_srli_si128(v.hi, 8), _mm_slli_si128(v.lo, 8));
    const __m128i hi = _mm_or_si128(_mm_srli_si128(v.lo, 8), _mm_slli_si128(v.hi, 8));
    v.lo = lo;
    v.hi = hi;
}

static inline Col load_col(const uint64_t* x, size_t c) {
    Col v;
    v.lo = _mm_set_epi64x(static_cast<long long>(x[4 + c]), static_cast<long long>(x[c]));
    v.hi = _mm_set_epi64x(static_cast<long long>(x[12 + c]), static_cast<long long>(x[8 + c]));
    return v;
}

} // anonymous namespace

void keystream_block_sse2(const uint64_t state[YSC1_STATE_WORDS], uint64_t counter,
                          uint32_t rounds, uint8_t out[YSC1_BLOCK_SIZE]) noexcept {
    uint64_t x[YSC1_STATE_WORDS];
    std::memcpy(x, state, sizeof(x));
    x[YSC1_COUNTER_WORD] = counter;

    Col a = load_col(x, 0);
    Col b = load_col(x, 1);
    Col c = load_col(x, 2);
    Col d = load_col(x, 3);

    for (uint32_t r = 0; r < rounds; r++) {
        mix_half(a.lo, b.lo, c.lo, d.lo);
        mix_half(a.hi, b.hi, c.hi, d.hi);
        rot_lanes_1(b);
        rot_lanes_2(c);
        rot_lanes_3(d);
    }

    // Words 0..3 are lane 0 of A..D, words 4..7 are lane 1
    _mm_storeu_si128(reinterpret_cast<__m128i*>(out +  0), _mm_unpacklo_epi64(a.lo, b.lo));
    _mm_storeu_si128(reinterpret_cast<__m128i*>(out + 16), _mm_unpacklo_epi64(c.lo, d.lo));
    _mm_storeu_si128(reinterpret_cast<__m128i*>(out + 32), _mm_unpackhi_epi64(a.lo, b.lo));
    _mm_storeu_si128(reinterpret_cast<__m128i*>(out + 48), _mm_unpackhi_epi64(c.lo, d.lo));

    ysc1_secure_zero(x, sizeof(x));
}

#undef ROTL128

} // namespace internal
} // namespace ysc1

#endif // YSC1_HAS_SSE2_BACKEND
