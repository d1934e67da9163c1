/**
 * @file cpu_features.cpp
 * @brief CPU Feature Detection for Runtime SIMD Dispatch
 *
 * Detects SSE2/SSSE3/SSE4.1/AVX/AVX2/AVX-512F using the CPUID instruction on
 * x86_64, or getauxval on ARM.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include "ysc1/core/cpu_features.h"
#include <cstdint>
#include <cstring>

#if defined(_MSC_VER)
    #include <intrin.h>
    #include <immintrin.h>
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(__x86_64__) || defined(__i386__)
        #include <cpuid.h>
    #endif
#endif

#if defined(__linux__) && (defined(__aarch64__) || defined(__arm__))
    #include <sys/auxv.h>
    #include <asm/hwcap.h>
#endif

namespace ysc1 {
namespace cpu {

namespace {

#if defined(__x86_64__) || defined(_M_X64)
/**
 * @brief x86_64 CPUID wrapper
 * @param leaf CPUID function (EAX input)
 * @param subleaf CPUID sub-function (ECX input)
 * @param regs Output: [EAX, EBX, ECX, EDX]
 */
inline void cpuid(uint32_t leaf, uint32_t subleaf, uint32_t regs[4]) {
#if defined(_MSC_VER)
    __cpuidex(reinterpret_cast<int*>(regs), static_cast<int>(leaf), static_cast<int>(subleaf));
#elif defined(__GNUC__) || defined(__clang__)
    __cpuid_count(leaf, subleaf, regs[0], regs[1], regs[2], regs[3]);
#else
    std::memset(regs, 0, 4 * sizeof(uint32_t));
#endif
}

/**
 * @brief Read XCR0 (which register states the OS saves on context switch)
 */
inline uint64_t read_xcr0() {
#if defined(_MSC_VER)
    return _xgetbv(0);
#elif defined(__GNUC__) || defined(__clang__)
    uint32_t eax = 0, edx = 0;
    __asm__ __volatile__("xgetbv" : "=a"(eax), "=d"(edx) : "c"(0));
    return (static_cast<uint64_t>(edx) << 32) | eax;
#else
    return 0;
#endif
}
#endif

} // anonymous namespace

CPUFeatures CPUFeatures::detect() noexcept {
    CPUFeatures features{};

#if defined(__x86_64__) || defined(_M_X64)
    uint32_t regs[4];

    cpuid(0, 0, regs);
    const uint32_t max_leaf = regs[0];

    char vendor[13] = {0};
    std::memcpy(vendor, &regs[1], 4);     // EBX
    std::memcpy(vendor + 4, &regs[3], 4); // EDX
    std::memcpy(vendor + 8, &regs[2], 4); // ECX
    if (std::strcmp(vendor, "GenuineIntel") == 0) {
        features.is_intel = true;
    } else if (std::strcmp(vendor, "AuthenticAMD") == 0) {
        features.is_amd = true;
    }

    if (max_leaf < 1) {
        return features;
    }

    // Leaf 1
    cpuid(1, 0, regs);
    features.has_sse2  = (regs[3] & (1u << 26)) != 0;  // EDX bit 26
    features.has_ssse3 = (regs[2] & (1u << 9))  != 0;  // ECX bit 9
    features.has_sse41 = (regs[2] & (1u << 19)) != 0;  // ECX bit 19

    const bool cpu_avx = (regs[2] & (1u << 28)) != 0;  // ECX bit 28
    const bool osxsave = (regs[2] & (1u << 27)) != 0;  // ECX bit 27
    bool os_ymm = false;
    bool os_zmm = false;
    if (osxsave) {
        const uint64_t xcr0 = read_xcr0();
        os_ymm = (xcr0 & 0x6) == 0x6;     // XMM | YMM
        os_zmm = (xcr0 & 0xe6) == 0xe6;   // XMM | YMM | opmask | ZMM
    }
    features.has_avx = cpu_avx && os_ymm;

    // Leaf 7, subleaf 0
    if (max_leaf >= 7) {
        cpuid(7, 0, regs);
        features.has_avx2    = features.has_avx && (regs[1] & (1u << 5)) != 0;   // EBX bit 5
        features.has_avx512f = os_zmm && (regs[1] & (1u << 16)) != 0;            // EBX bit 16
    }

#elif defined(__aarch64__) || defined(_M_ARM64)
#if defined(__linux__)
    unsigned long hwcaps = getauxval(AT_HWCAP);
    features.has_neon = (hwcaps & HWCAP_ASIMD) != 0;
#else
    // Advanced SIMD is mandatory on AArch64
    features.has_neon = true;
#endif
#endif

    return features;
}

std::string CPUFeatures::to_string() const {
    std::string result;

#if defined(__x86_64__) || defined(_M_X64)
    if (is_intel) result += "Intel ";
    if (is_amd) result += "AMD ";

    if (has_sse2) result += "SSE2 ";
    if (has_ssse3) result += "SSSE3 ";
    if (has_sse41) result += "SSE4.1 ";
    if (has_avx) result += "AVX ";
    if (has_avx2) result += "AVX2 ";
    if (has_avx512f) result += "AVX512F ";
#elif defined(__aarch64__) || defined(_M_ARM64)
    result += "ARM64 ";
    if (has_neon) result += "NEON ";
#endif

    if (result.empty()) {
        return "Generic CPU (no SIMD)";
    }

    // Remove trailing space
    result.pop_back();
    return result;
}

} // namespace cpu
} // namespace ysc1
