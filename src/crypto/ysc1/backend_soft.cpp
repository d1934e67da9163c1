/**
 * @file backend_soft.cpp
 * @brief Portable scalar keystream backend
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include "ysc1/internal/permutation_impl.h"
#include "ysc1/core/security.h"
#include <cstring>

namespace ysc1 {
namespace internal {

static inline void store64_le(uint8_t* p, uint64_t v) {
    p[0] = static_cast<uint8_t>(v);
    p[1] = static_cast<uint8_t>(v >> 8);
    p[2] = static_cast<uint8_t>(v >> 16);
    p[3] = static_cast<uint8_t>(v >> 24);
    p[4] = static_cast<uint8_t>(v >> 32);
    p[5] = static_cast<uint8_t>(v >> 40);
    p[6] = static_cast<uint8_t>(v >> 48);
    p[7] = static_cast<uint8_t>(v >> 56);
}

void keystream_block_soft(const uint64_t state[YSC1_STATE_WORDS], uint64_t counter,
                          uint32_t rounds, uint8_t out[YSC1_BLOCK_SIZE]) noexcept {
    uint64_t x[YSC1_STATE_WORDS];
    std::memcpy(x, state, sizeof(x));
    x[YSC1_COUNTER_WORD] = counter;

    permute(x, rounds);

    for (size_t i = 0; i < YSC1_BLOCK_SIZE / 8; i++) {
        store64_le(out + 8 * i, x[i]);
    }

    ysc1_secure_zero(x, sizeof(x));
}

} // namespace internal
} // namespace ysc1
