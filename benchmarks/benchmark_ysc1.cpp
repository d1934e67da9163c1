/**
 * @file benchmark_ysc1.cpp
 * @brief YSC1 Keystream Throughput Benchmark: ysc1 backends vs OpenSSL ChaCha20
 *
 * Measures keystream application throughput for both variants on every
 * backend available on this CPU, with OpenSSL ChaCha20 (EVP_chacha20) as
 * the reference stream cipher.
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <iostream>
#include <iomanip>
#include <string>
#include <vector>

#include <openssl/evp.h>
#include <openssl/rand.h>

#include "ysc1/ysc1.h"
#include "benchmark_common.hpp"

using ysc1_bench::Clock;
using ysc1_bench::Duration;
using ysc1_bench::BenchmarkResult;

// Benchmark configuration
constexpr size_t WARMUP_ITERATIONS = 10;
constexpr size_t BENCHMARK_ITERATIONS = 100;
constexpr size_t CHACHA_KEY_SIZE = 32;
constexpr size_t CHACHA_IV_SIZE = 16;

// Test data sizes
const std::vector<size_t> TEST_SIZES = {
    1024,            // 1 KB
    4096,            // 4 KB
    16384,           // 16 KB
    65536,           // 64 KB
    1024 * 1024      // 1 MB
};

/**
 * @brief Fill buffer from the OpenSSL RNG
 */
static bool generate_random(uint8_t* buf, size_t len) {
    return RAND_bytes(buf, static_cast<int>(len)) == 1;
}

/**
 * @brief OpenSSL ChaCha20 keystream application
 */
static double benchmark_openssl_chacha20(
    const std::vector<uint8_t>& input,
    const uint8_t* key,
    const uint8_t* iv,
    std::vector<uint8_t>& output
) {
    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) return -1.0;

    output.resize(input.size());
    int len = 0;
    bool ok = true;

    auto start = Clock::now();

    ok = ok && EVP_EncryptInit_ex(ctx, EVP_chacha20(), nullptr, key, iv) == 1;
    ok = ok && EVP_EncryptUpdate(ctx, output.data(), &len, input.data(),
                                 static_cast<int>(input.size())) == 1;
    ok = ok && EVP_EncryptFinal_ex(ctx, output.data() + len, &len) == 1;

    auto end = Clock::now();
    Duration elapsed = end - start;

    EVP_CIPHER_CTX_free(ctx);
    return ok ? elapsed.count() : -1.0;
}

/**
 * @brief ysc1 keystream application (context setup included)
 */
static double benchmark_ysc1(
    ysc1_variant_t variant,
    ysc1_backend_t backend,
    const std::vector<uint8_t>& input,
    const uint8_t* key,
    size_t key_len,
    const uint8_t* nonce,
    std::vector<uint8_t>& output
) {
    output.resize(input.size());
    ysc1_ctx_t ctx;

    auto start = Clock::now();

    ysc1_error_t err = ysc1_init_with_backend(&ctx, variant, key, key_len,
                                              nonce, YSC1_MAX_NONCE_SIZE, backend);
    if (err == YSC1_SUCCESS) {
        err = ysc1_crypt(&ctx, input.data(), input.size(), output.data());
    }

    auto end = Clock::now();
    Duration elapsed = end - start;

    ysc1_clear(&ctx);
    return err == YSC1_SUCCESS ? elapsed.count() : -1.0;
}

static std::string size_label(size_t data_size) {
    if (data_size >= 1024 * 1024) {
        return std::to_string(data_size / (1024 * 1024)) + " MB";
    }
    return std::to_string(data_size / 1024) + " KB";
}

/**
 * @brief Main YSC1 benchmark function
 */
static int benchmark_ysc1_all() {
    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "  YSC1 Keystream Benchmark" << std::endl;
    std::cout << std::string(70, '=') << std::endl;
    std::cout << "CPU: " << ysc1::cpu::CPUFeatures::detect().to_string() << std::endl;

    uint8_t key[YSC1_MAX_KEY_SIZE];
    uint8_t nonce[YSC1_MAX_NONCE_SIZE];
    uint8_t chacha_key[CHACHA_KEY_SIZE];
    uint8_t chacha_iv[CHACHA_IV_SIZE];
    if (!generate_random(key, sizeof(key)) || !generate_random(nonce, sizeof(nonce)) ||
        !generate_random(chacha_key, sizeof(chacha_key)) ||
        !generate_random(chacha_iv, sizeof(chacha_iv))) {
        std::cerr << "Error: RAND_bytes failed" << std::endl;
        return 1;
    }

    const ysc1_backend_t backends[] = {
        YSC1_BACKEND_SOFT, YSC1_BACKEND_SSE2, YSC1_BACKEND_AVX2
    };
    const ysc1_variant_t variants[] = { YSC1_VARIANT_512, YSC1_VARIANT_1024 };

    for (size_t data_size : TEST_SIZES) {
        std::cout << "\n--- Data Size: " << size_label(data_size) << " ---" << std::endl;
        std::cout << std::left << std::setw(25) << "Operation"
                  << std::setw(12) << "Impl"
                  << std::right << std::setw(13) << "Avg"
                  << std::setw(13) << "Min"
                  << std::setw(15) << "Throughput"
                  << std::endl;
        std::cout << std::string(78, '-') << std::endl;

        std::vector<uint8_t> input(data_size);
        std::vector<uint8_t> output;
        if (!generate_random(input.data(), data_size)) {
            std::cerr << "Error: RAND_bytes failed" << std::endl;
            return 1;
        }

        BenchmarkResult openssl = ysc1_bench::run_benchmark_ex(
            WARMUP_ITERATIONS, BENCHMARK_ITERATIONS,
            [&]() { return benchmark_openssl_chacha20(input, chacha_key, chacha_iv, output); });
        ysc1_bench::print_throughput_result("ChaCha20", "OpenSSL", openssl, data_size);

        for (ysc1_variant_t variant : variants) {
            const size_t key_len = variant == YSC1_VARIANT_512 ? YSC1_512_KEY_SIZE : YSC1_1024_KEY_SIZE;
            const std::string name = "YSC1-" + std::to_string(static_cast<int>(variant));

            for (ysc1_backend_t backend : backends) {
                if (!ysc1_backend_available(backend)) {
                    continue;
                }
                BenchmarkResult r = ysc1_bench::run_benchmark_ex(
                    WARMUP_ITERATIONS, BENCHMARK_ITERATIONS,
                    [&]() {
                        return benchmark_ysc1(variant, backend, input, key, key_len, nonce, output);
                    });
                ysc1_bench::print_throughput_result(name, ysc1_backend_name(backend), r, data_size);
                if (r.valid && openssl.valid) {
                    ysc1_bench::print_time_ratio(r.avg_ms, openssl.avg_ms);
                }
            }
        }
    }

    ysc1_secure_zero(key, sizeof(key));
    return 0;
}

int main() {
    std::cout << "ysc1 " << ysc1_version() << " benchmark (" << ysc1_platform() << ")" << std::endl;
    return benchmark_ysc1_all();
}
