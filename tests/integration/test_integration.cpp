/**
 * @file test_integration.cpp
 * @brief Integration tests for the ysc1 library
 *
 * Tests cross-module interactions and real-world usage scenarios:
 * - Library information
 * - Key generation feeding the cipher
 * - Streaming encryption with random-access decryption
 * - C ABI and C++ API interoperability
 * - Every backend producing the same ciphertext
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <cstring>
#include <string>
#include <vector>

#include "ysc1/ysc1.h"

// ============================================================================
// Library Information
// ============================================================================

TEST(IntegrationTest, LibraryInformation) {
    const char* version = ysc1_version();
    ASSERT_NE(version, nullptr);
    EXPECT_STREQ(version, YSC1_VERSION_STRING);
    EXPECT_TRUE(YSC1_VERSION_AT_LEAST(1, 0, 0));

    const char* platform = ysc1_platform();
    ASSERT_NE(platform, nullptr);
    EXPECT_STREQ(platform, YSC1_PLATFORM_NAME);
}

// ============================================================================
// End-to-End Workflows
// ============================================================================

TEST(IntegrationTest, GeneratedKeysEncryptDecrypt) {
    for (int i = 0; i < 3; ++i) {
        auto key = ysc1::Ysc1_1024::generateKey();
        auto nonce = ysc1::Ysc1_1024::generateNonce();

        std::string message = "Attack at dawn, message #" + std::to_string(i);
        ysc1::ByteVec pt(message.begin(), message.end());

        ysc1::Ysc1_1024 enc(key, nonce);
        ysc1::ByteVec ct = enc.process(pt);
        ASSERT_EQ(ct.size(), pt.size());
        EXPECT_NE(ct, pt);

        ysc1::Ysc1_1024 dec(key, nonce);
        EXPECT_EQ(dec.process(ct), pt);
    }
}

TEST(IntegrationTest, StreamingWithRandomAccess) {
    auto key = ysc1::Ysc1_512::generateKey();
    auto nonce = ysc1::Ysc1_512::generateNonce();

    // A "file" of 64 KiB + change, encrypted in uneven chunks
    ysc1::ByteVec file(65536 + 321);
    for (size_t i = 0; i < file.size(); ++i) {
        file[i] = static_cast<uint8_t>((i * 131) ^ (i >> 8));
    }

    ysc1::ByteVec ct = file;
    ysc1::Ysc1_512 enc(key, nonce);
    size_t off = 0;
    size_t chunk = 1;
    while (off < ct.size()) {
        size_t n = std::min(chunk, ct.size() - off);
        enc.apply_keystream(ct.data() + off, n);
        off += n;
        chunk = chunk * 3 + 1;
    }
    EXPECT_EQ(enc.current_byte_position(), file.size());

    // Decrypt an arbitrary window without touching the rest
    const size_t window_start = 40000 + 17;
    const size_t window_len = 5000;
    ysc1::Ysc1_512 dec(key, nonce);
    dec.seek_bytes(window_start);
    ysc1::ByteVec window(ct.begin() + window_start, ct.begin() + window_start + window_len);
    dec.apply_keystream(window);
    EXPECT_TRUE(std::equal(window.begin(), window.end(), file.begin() + window_start));
}

TEST(IntegrationTest, CAndCppInteroperate) {
    ysc1::ByteVec key(YSC1_1024_KEY_SIZE), nonce(YSC1_1024_NONCE_SIZE);
    ASSERT_EQ(ysc1_random_bytes(key.data(), key.size()), YSC1_SUCCESS);
    ASSERT_EQ(ysc1_random_bytes(nonce.data(), nonce.size()), YSC1_SUCCESS);

    ysc1::ByteVec pt(1000, 0x3c);
    ysc1::ByteVec ct(pt.size());
    ASSERT_EQ(ysc1_xor(YSC1_VARIANT_1024, key.data(), key.size(), nonce.data(), nonce.size(),
                       pt.data(), pt.size(), ct.data()), YSC1_SUCCESS);

    ysc1::Ysc1_1024 cipher(key, nonce);
    EXPECT_EQ(cipher.process(ct), pt);
}

TEST(IntegrationTest, AllBackendsAgree) {
    ysc1::ByteVec key(YSC1_512_KEY_SIZE), nonce(YSC1_512_NONCE_SIZE);
    ASSERT_EQ(ysc1_random_bytes(key.data(), key.size()), YSC1_SUCCESS);
    ASSERT_EQ(ysc1_random_bytes(nonce.data(), nonce.size()), YSC1_SUCCESS);
    ysc1::ByteVec pt(4096 + 33, 0);

    ysc1::Ysc1_512 reference(key, nonce, ysc1::Backend::Soft);
    EXPECT_EQ(reference.backend(), ysc1::Backend::Soft);
    const ysc1::ByteVec expected = reference.process(pt);

    const ysc1::Backend backends[] = {
        ysc1::Backend::Auto, ysc1::Backend::Sse2, ysc1::Backend::Avx2
    };
    for (ysc1::Backend b : backends) {
        if (!ysc1_backend_available(static_cast<ysc1_backend_t>(b))) {
            continue;
        }
        ysc1::Ysc1_512 cipher(key, nonce, b);
        EXPECT_NE(cipher.backend(), ysc1::Backend::Auto);
        EXPECT_EQ(cipher.process(pt), expected)
            << ysc1_backend_name(static_cast<ysc1_backend_t>(b));
    }
}

TEST(IntegrationTest, DistinctNoncesDistinctStreams) {
    auto key = ysc1::Ysc1_512::generateKey();
    auto n1 = ysc1::Ysc1_512::generateNonce();
    auto n2 = n1;
    n2[0] ^= 0x01;

    ysc1::ByteVec zeros(256, 0);
    ysc1::Ysc1_512 a(key, n1);
    ysc1::Ysc1_512 b(key, n2);
    EXPECT_NE(a.process(zeros), b.process(zeros));
}

TEST(IntegrationTest, ErrorStringsForEveryCode) {
    const ysc1_error_t codes[] = {
        YSC1_SUCCESS, YSC1_ERROR_INVALID_PARAM, YSC1_ERROR_INVALID_KEY,
        YSC1_ERROR_INVALID_NONCE, YSC1_ERROR_NOT_SUPPORTED, YSC1_ERROR_COUNTER_EXHAUSTED,
        YSC1_ERROR_RANDOM_FAILED, YSC1_ERROR_INTERNAL
    };
    for (ysc1_error_t c : codes) {
        EXPECT_STRNE(ysc1_error_string(c), "Unknown error") << static_cast<int>(c);
    }
}
