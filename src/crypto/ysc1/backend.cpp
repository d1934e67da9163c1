/**
 * @file backend.cpp
 * @brief Keystream backend selection
 *
 * CPU capabilities are probed once per process; each cipher context then
 * stores the backend id it was built with and never probes again.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include "ysc1/internal/permutation_impl.h"
#include "ysc1/core/cpu_features.h"

namespace ysc1 {
namespace internal {

namespace {

/**
 * @brief Cached CPU capability probe (thread-safe static initialization)
 */
class BackendDetector {
public:
    static const BackendDetector& instance() {
        static const BackendDetector detector;
        return detector;
    }

    bool sse2() const { return sse2_; }
    bool avx2() const { return avx2_; }
    ysc1_backend_t best() const { return best_; }

private:
    BackendDetector() {
        const cpu::CPUFeatures features = cpu::CPUFeatures::detect();
#ifdef YSC1_HAS_SSE2_BACKEND
        sse2_ = features.has_sse2;
#endif
#ifdef YSC1_HAS_AVX2_BACKEND
        avx2_ = features.has_avx2;
#endif
        (void)features;

#if defined(YSC1_FORCE_SOFT)
        best_ = YSC1_BACKEND_SOFT;
#else
        if (avx2_) {
            best_ = YSC1_BACKEND_AVX2;
        } else if (sse2_) {
            best_ = YSC1_BACKEND_SSE2;
        } else {
            best_ = YSC1_BACKEND_SOFT;
        }
#endif
    }

    bool sse2_ = false;
    bool avx2_ = false;
    ysc1_backend_t best_ = YSC1_BACKEND_SOFT;
};

} // anonymous namespace

bool backend_available(ysc1_backend_t backend) noexcept {
    switch (backend) {
        case YSC1_BACKEND_AUTO:
        case YSC1_BACKEND_SOFT:
            return true;
        case YSC1_BACKEND_SSE2:
            return BackendDetector::instance().sse2();
        case YSC1_BACKEND_AVX2:
            return BackendDetector::instance().avx2();
        default:
            return false;
    }
}

ysc1_backend_t probe_backend() noexcept {
    return BackendDetector::instance().best();
}

KeystreamBlockFn backend_fn(int backend) noexcept {
    switch (backend) {
        case YSC1_BACKEND_SOFT:
            return keystream_block_soft;
#ifdef YSC1_HAS_SSE2_BACKEND
        case YSC1_BACKEND_SSE2:
            return keystream_block_sse2;
#endif
#ifdef YSC1_HAS_AVX2_BACKEND
        case YSC1_BACKEND_AVX2:
            return keystream_block_avx2;
#endif
        default:
            return nullptr;
    }
}

} // namespace internal
} // namespace ysc1
