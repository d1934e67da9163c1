/**
 * @file ysc1.h
 * @brief ysc1 - YSC1 Lai-Massey Stream Cipher Library
 *
 * Unified header for the library.
 *
 * Modules:
 * - Core: error codes, secure memory, CSPRNG, CPU feature detection
 * - Crypto: YSC1-512 / YSC1-1024 keystream generator (C ABI + C++ API)
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef YSC1_H
#define YSC1_H

// ============================================================================
// Version Information
// ============================================================================

#include "ysc1/version.h"

// ============================================================================
// Core Modules
// ============================================================================

#include "ysc1/core/common.h"
#include "ysc1/core/types.h"
#include "ysc1/core/security.h"

#ifdef __cplusplus
#include "ysc1/core/cpu_features.h"
#endif

// ============================================================================
// Cryptographic Modules
// ============================================================================

#include "ysc1/crypto/stream_cipher.h"   // ysc1_ctx_t, StreamCipher<KEY_BITS>

// ============================================================================
// Quick Start Examples
// ============================================================================

/**
 * @example stream_example.cpp
 * @code
 * #include "ysc1/ysc1.h"
 *
 * auto key = ysc1::Ysc1_1024::generateKey();
 * auto nonce = ysc1::Ysc1_1024::generateNonce();
 *
 * ysc1::Ysc1_1024 enc(key, nonce);
 * ysc1::ByteVec ct = enc.process(plaintext);
 *
 * // Random access: decrypt starting at byte 4096
 * ysc1::Ysc1_1024 dec(key, nonce);
 * dec.seek_bytes(4096);
 * dec.apply_keystream(ct.data() + 4096, ct.size() - 4096);
 * @endcode
 */

#endif // YSC1_H
