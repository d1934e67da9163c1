/**
 * @file cpu_features.h
 * @brief CPU Feature Detection API
 *
 * Runtime detection of SIMD capabilities used to pick the keystream backend.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef YSC1_CORE_CPU_FEATURES_H
#define YSC1_CORE_CPU_FEATURES_H

#include "ysc1/core/common.h"
#include <string>

namespace ysc1 {
namespace cpu {

/**
 * @brief CPU feature flags detected at runtime
 *
 * AVX/AVX2 are only reported when the OS also saves the YMM registers
 * (OSXSAVE + XCR0), so a true flag means the instructions are usable.
 */
struct YSC1_API CPUFeatures {
    // x86_64 features
    bool has_sse2    = false;  ///< SSE2 (baseline for x86_64)
    bool has_ssse3   = false;  ///< SSSE3
    bool has_sse41   = false;  ///< SSE4.1
    bool has_avx     = false;  ///< AVX 256-bit SIMD (OS support checked)
    bool has_avx2    = false;  ///< AVX2 with integer ops (OS support checked)
    bool has_avx512f = false;  ///< AVX-512 Foundation

    // ARM64 features
    bool has_neon = false;     ///< ARM NEON SIMD

    // CPU vendor
    bool is_intel = false;
    bool is_amd   = false;

    /**
     * @brief Detect CPU features using CPUID/getauxval
     * @return Populated CPUFeatures struct
     */
    static CPUFeatures detect() noexcept;

    /**
     * @brief Get human-readable feature string
     * @return Space-separated feature names
     */
    std::string to_string() const;
};

} // namespace cpu
} // namespace ysc1

#endif // YSC1_CORE_CPU_FEATURES_H
