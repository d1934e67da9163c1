/**
 * @file benchmark_common.hpp
 * @brief Common utilities for ysc1 benchmarks with ratio comparison
 *
 * Provides unified benchmark output format with:
 * - Timing statistics (avg, min)
 * - Throughput in MB/s
 * - Ratio against the OpenSSL baseline
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef YSC1_BENCHMARK_COMMON_HPP
#define YSC1_BENCHMARK_COMMON_HPP

#include <iostream>
#include <iomanip>
#include <string>
#include <functional>
#include <vector>
#include <algorithm>
#include <numeric>
#include <chrono>

namespace ysc1_bench {

using Clock = std::chrono::high_resolution_clock;
using Duration = std::chrono::duration<double, std::milli>;

/**
 * @brief Benchmark result containing timing data
 */
struct BenchmarkResult {
    double avg_ms;          ///< Average time in milliseconds
    double min_ms;          ///< Minimum time in milliseconds
    bool valid;             ///< Whether benchmark completed successfully

    BenchmarkResult() : avg_ms(0), min_ms(0), valid(false) {}
    BenchmarkResult(double avg, double min_t) : avg_ms(avg), min_ms(min_t), valid(true) {}
};

/**
 * @brief Throughput in MB/s for @p bytes processed in @p ms
 */
inline double throughput_mbps(size_t bytes, double ms) {
    return (static_cast<double>(bytes) / (1024.0 * 1024.0)) / (ms / 1000.0);
}

/**
 * @brief Run benchmark and return result with statistics
 *
 * @param warmup_iters Number of warmup iterations
 * @param bench_iters Number of benchmark iterations
 * @param benchmark_func Function returning execution time in ms, or < 0 on error
 */
inline BenchmarkResult run_benchmark_ex(
    size_t warmup_iters,
    size_t bench_iters,
    const std::function<double()>& benchmark_func
) {
    std::vector<double> times;
    times.reserve(bench_iters);

    for (size_t i = 0; i < warmup_iters; ++i) {
        if (benchmark_func() < 0) return BenchmarkResult();
    }

    for (size_t i = 0; i < bench_iters; ++i) {
        double t = benchmark_func();
        if (t < 0) return BenchmarkResult();
        times.push_back(t);
    }

    double avg = std::accumulate(times.begin(), times.end(), 0.0) /
                 static_cast<double>(times.size());
    double min_t = *std::min_element(times.begin(), times.end());
    return BenchmarkResult(avg, min_t);
}

/**
 * @brief Print benchmark result with throughput in MB/s
 */
inline void print_throughput_result(
    const std::string& name,
    const std::string& impl,
    const BenchmarkResult& result,
    size_t data_size
) {
    if (!result.valid) {
        std::cout << std::left << std::setw(25) << name
                  << std::setw(12) << impl
                  << "  (benchmark failed)" << std::endl;
        return;
    }

    std::cout << std::left << std::setw(25) << name
              << std::setw(12) << impl
              << std::right << std::fixed << std::setprecision(3)
              << std::setw(10) << result.avg_ms << " ms"
              << std::setw(10) << result.min_ms << " ms"
              << std::setw(10) << std::setprecision(2)
              << throughput_mbps(data_size, result.avg_ms) << " MB/s"
              << std::endl;
}

/**
 * @brief Print time ratio against the OpenSSL baseline
 *
 * ratio = openssl_time / ysc1_time, so ratio > 1.0 means ysc1 is faster.
 */
inline void print_time_ratio(double ysc1_time, double openssl_time) {
    if (openssl_time <= 0 || ysc1_time <= 0) {
        std::cout << std::left << std::setw(25) << "  ==> Ratio"
                  << std::setw(12) << ""
                  << "  (comparison not available)" << std::endl;
        return;
    }

    double ratio = openssl_time / ysc1_time;
    const char* status = ratio >= 1.0 ? "FASTER" : "SLOWER";

    std::cout << std::left << std::setw(25) << "  ==> Ratio"
              << std::setw(12) << ""
              << std::right << std::fixed << std::setprecision(2)
              << std::setw(8) << ratio * 100.0 << "%"
              << " of OpenSSL ChaCha20 (" << ratio << "x " << status << ")"
              << std::endl;
}

} // namespace ysc1_bench

#endif // YSC1_BENCHMARK_COMMON_HPP
