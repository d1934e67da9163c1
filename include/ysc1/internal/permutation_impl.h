/**
 * @file permutation_impl.h
 * @brief Internal interface of the YSC1 permutation and keystream backends
 *
 * Not part of the public API. Shared by the scalar core, the vector
 * backends, the backend selector and the unit tests.
 *
 * Keep this header free of inline functions: backend_avx2.cpp is compiled
 * with -mavx2 and must not emit COMDAT copies shared with other TUs.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#ifndef YSC1_INTERNAL_PERMUTATION_IMPL_H
#define YSC1_INTERNAL_PERMUTATION_IMPL_H

#include "ysc1/core/common.h"
#include "ysc1/crypto/stream_cipher.h"

#if defined(__x86_64__) || defined(_M_X64)
#define YSC1_HAS_SSE2_BACKEND 1
#endif

// YSC1_HAS_AVX2_BACKEND is defined by the build when backend_avx2.cpp is
// compiled with AVX2 code generation enabled.

namespace ysc1 {
namespace internal {

// Rotation amounts of the round primitive
constexpr unsigned R1 = 11;
constexpr unsigned R2 = 27;
constexpr unsigned R3 = 43;

// new[i] = old[DIAGONAL_PERM[i]]
constexpr size_t DIAGONAL_PERM[YSC1_STATE_WORDS] = {
    0, 5, 10, 15, 4, 9, 14, 3, 8, 13, 2, 7, 12, 1, 6, 11
};

/**
 * @brief Fixed parameters of one security profile
 */
struct VariantParams {
    ysc1_variant_t variant;
    size_t key_words;
    size_t nonce_words;
    uint32_t init_rounds;
    uint32_t keystream_rounds;
};

/**
 * @brief Look up a variant in the closed descriptor table
 * @return Descriptor, or nullptr for an unknown variant
 */
YSC1_API const VariantParams* find_variant(int variant) noexcept;

// ============================================================================
// Scalar permutation
// ============================================================================

/** F(x): y = x + rotl(x,11); z = y ^ rotl(y,27); return z + rotl(z,43) */
YSC1_API uint64_t round_f(uint64_t x) noexcept;

/** Lai-Massey mix of one quadruple, in place */
YSC1_API void quad_mix(uint64_t x[4]) noexcept;

/** Apply the diagonal relabeling through a scratch copy */
YSC1_API void diagonal_permute(uint64_t s[YSC1_STATE_WORDS]) noexcept;

/** Four quad mixes followed by one diagonal permutation */
YSC1_API void permutation_round(uint64_t s[YSC1_STATE_WORDS]) noexcept;

/** Run permutation_round @p rounds times */
YSC1_API void permute(uint64_t s[YSC1_STATE_WORDS], uint32_t rounds) noexcept;

/**
 * @brief Build the initial state from key and nonce and run the init rounds
 *
 * Key and nonce lengths must already match @p params.
 */
YSC1_API void key_schedule(const VariantParams& params,
                  const uint8_t* key,
                  const uint8_t* nonce,
                  uint64_t state[YSC1_STATE_WORDS]) noexcept;

// ============================================================================
// Keystream backends
// ============================================================================

/**
 * @brief Narrow backend interface
 *
 * Produces the keystream block for @p counter: the state with word 12
 * replaced by the counter, permuted @p rounds times, words 0..7 encoded
 * little-endian into @p out. The state itself is never modified.
 */
using KeystreamBlockFn = void (*)(const uint64_t state[YSC1_STATE_WORDS],
                                  uint64_t counter,
                                  uint32_t rounds,
                                  uint8_t out[YSC1_BLOCK_SIZE]);

YSC1_API void keystream_block_soft(const uint64_t state[YSC1_STATE_WORDS], uint64_t counter,
                          uint32_t rounds, uint8_t out[YSC1_BLOCK_SIZE]) noexcept;

#ifdef YSC1_HAS_SSE2_BACKEND
YSC1_API void keystream_block_sse2(const uint64_t state[YSC1_STATE_WORDS], uint64_t counter,
                          uint32_t rounds, uint8_t out[YSC1_BLOCK_SIZE]) noexcept;
#endif

#ifdef YSC1_HAS_AVX2_BACKEND
YSC1_API void keystream_block_avx2(const uint64_t state[YSC1_STATE_WORDS], uint64_t counter,
                          uint32_t rounds, uint8_t out[YSC1_BLOCK_SIZE]) noexcept;
#endif

/**
 * @brief Whether @p backend is compiled in and supported by this CPU
 *
 * YSC1_BACKEND_AUTO is always available.
 */
YSC1_API bool backend_available(ysc1_backend_t backend) noexcept;

/**
 * @brief Best backend for this process (probed once, then cached)
 */
YSC1_API ysc1_backend_t probe_backend() noexcept;

/**
 * @brief Resolve a concrete backend id to its block function
 * @return Function pointer, or nullptr if the backend is not compiled in
 */
YSC1_API KeystreamBlockFn backend_fn(int backend) noexcept;

} // namespace internal
} // namespace ysc1

#endif // YSC1_INTERNAL_PERMUTATION_IMPL_H
