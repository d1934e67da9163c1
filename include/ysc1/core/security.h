/**
 * @file security.h
 * @brief Security primitives for ysc1 - Side-channel resistant operations
 *
 * This header provides security-critical functions including:
 * - Secure memory zeroing for key and state scrubbing
 * - Constant-time comparison
 * - Cryptographically secure random number generation
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef YSC1_CORE_SECURITY_H
#define YSC1_CORE_SECURITY_H

#include "ysc1/core/common.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Secure memory zeroing
 *
 * Zeros memory in a way the compiler is not allowed to optimize away.
 *
 * @param ptr Pointer to memory to zero
 * @param len Number of bytes to zero
 */
YSC1_API void ysc1_secure_zero(void* ptr, size_t len);

/**
 * @brief Constant-time memory comparison
 *
 * @param a First memory region
 * @param b Second memory region
 * @param len Number of bytes to compare
 * @return 1 if equal, 0 if different
 */
YSC1_API int ysc1_secure_compare(const void* a, const void* b, size_t len);

/**
 * @brief Cryptographically secure random bytes
 *
 * Uses the platform CSPRNG:
 * - Windows: BCryptGenRandom
 * - Linux: getrandom() syscall, falling back to /dev/urandom
 * - macOS: SecRandomCopyBytes
 *
 * @param buf Buffer to fill
 * @param len Number of bytes
 * @return YSC1_SUCCESS or YSC1_ERROR_RANDOM_FAILED
 */
YSC1_API ysc1_error_t ysc1_random_bytes(void* buf, size_t len);

#ifdef __cplusplus
} // extern "C"

namespace ysc1 {

/**
 * @brief Constant-time comparison for C++ containers
 */
template<typename Container>
bool secure_compare(const Container& a, const Container& b) {
    if (a.size() != b.size()) return false;
    return ysc1_secure_compare(a.data(), b.data(),
                               a.size() * sizeof(typename Container::value_type)) == 1;
}

} // namespace ysc1

#endif // __cplusplus

#endif // YSC1_CORE_SECURITY_H
