/**
 * @file common.h
 * @brief Common definitions and utility macros for the ysc1 library
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#ifndef YSC1_CORE_COMMON_H
#define YSC1_CORE_COMMON_H

#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================================
// Platform detection
// ============================================================================
#if defined(_WIN32) || defined(_WIN64)
    #define YSC1_PLATFORM_WINDOWS 1
    #define YSC1_PLATFORM_NAME "Windows"
#elif defined(__linux__)
    #define YSC1_PLATFORM_LINUX 1
    #define YSC1_PLATFORM_NAME "Linux"
#elif defined(__APPLE__)
    #define YSC1_PLATFORM_MACOS 1
    #define YSC1_PLATFORM_NAME "macOS"
#else
    #define YSC1_PLATFORM_UNKNOWN 1
    #define YSC1_PLATFORM_NAME "Unknown"
#endif

// ============================================================================
// Export/Import macros for shared library
// ============================================================================
#ifdef YSC1_PLATFORM_WINDOWS
    #ifdef YSC1_SHARED_LIBRARY
        #ifdef YSC1_BUILDING
            #define YSC1_API __declspec(dllexport)
        #else
            #define YSC1_API __declspec(dllimport)
        #endif
    #else
        #define YSC1_API
    #endif
#else
    #ifdef YSC1_SHARED_LIBRARY
        #define YSC1_API __attribute__((visibility("default")))
    #else
        #define YSC1_API
    #endif
#endif

// ============================================================================
// Error codes
// ============================================================================
typedef enum {
    YSC1_SUCCESS = 0,
    YSC1_ERROR_INVALID_PARAM = -1,
    YSC1_ERROR_INVALID_KEY = -2,          // Key length does not match the variant
    YSC1_ERROR_INVALID_NONCE = -3,        // Nonce length does not match the variant
    YSC1_ERROR_NOT_SUPPORTED = -4,        // Requested backend unavailable
    YSC1_ERROR_COUNTER_EXHAUSTED = -5,    // Block counter would wrap past 2^64-1
    YSC1_ERROR_RANDOM_FAILED = -6,        // CSPRNG failure
    YSC1_ERROR_INTERNAL = -7
} ysc1_error_t;

// Sizes
#define YSC1_BLOCK_SIZE          64
#define YSC1_STATE_WORDS         16
#define YSC1_COUNTER_WORD        12

#define YSC1_512_KEY_SIZE        64
#define YSC1_512_NONCE_SIZE      64
#define YSC1_1024_KEY_SIZE       128
#define YSC1_1024_NONCE_SIZE     64
#define YSC1_MAX_KEY_SIZE        128
#define YSC1_MAX_NONCE_SIZE      64

// Utility macros
#define YSC1_MIN(a, b) ((a) < (b) ? (a) : (b))

// Rotate operations (n must be in 1..63)
#define YSC1_ROTL64(x, n) ((uint64_t)(((x) << (n)) | ((x) >> (64 - (n)))))

/**
 * @brief Get error message for error code
 * @param error Error code
 * @return Human-readable error message
 */
YSC1_API const char* ysc1_error_string(ysc1_error_t error);

/**
 * @brief Library version string ("major.minor.patch")
 */
YSC1_API const char* ysc1_version(void);

/**
 * @brief Name of the platform the library was built for
 */
YSC1_API const char* ysc1_platform(void);

#ifdef __cplusplus
}
#endif

#endif // YSC1_CORE_COMMON_H
