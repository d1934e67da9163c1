/**
 * @file types.h
 * @brief Type definitions for the ysc1 library
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#ifndef YSC1_CORE_TYPES_H
#define YSC1_CORE_TYPES_H

#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus

#include <vector>
#include <array>

namespace ysc1 {

// Byte vector
using ByteVec = std::vector<uint8_t>;

// Byte array templates
template<size_t N>
using ByteArray = std::array<uint8_t, N>;

} // namespace ysc1

#endif // __cplusplus

#endif // YSC1_CORE_TYPES_H
