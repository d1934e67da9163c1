/**
 * @file cli_utils.h
 * @brief Common utility functions for ysc1 CLI commands
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#ifndef YSC1_CLI_UTILS_H
#define YSC1_CLI_UTILS_H

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "ysc1/crypto/stream_cipher.h"

namespace ysc1 {
namespace cli {

/**
 * @brief Read file into byte vector
 */
inline std::vector<unsigned char> read_file(const std::string& filename) {
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open input file: " + filename);
    }
    return std::vector<unsigned char>(
        std::istreambuf_iterator<char>(file),
        std::istreambuf_iterator<char>()
    );
}

/**
 * @brief Write byte vector to file
 */
inline void write_file(const std::string& filename, const std::vector<unsigned char>& data) {
    std::ofstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open output file: " + filename);
    }
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!file) {
        throw std::runtime_error("Failed to write output file: " + filename);
    }
}

/**
 * @brief Convert bytes to hex string
 */
inline std::string bytes_to_hex(const unsigned char* data, size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<unsigned int>(data[i]);
    }
    return oss.str();
}

/**
 * @brief Convert hex string to bytes
 * @throws std::invalid_argument on odd length or non-hex characters
 */
inline std::vector<unsigned char> hex_to_bytes(const std::string& hex) {
    if (hex.length() % 2 != 0) {
        throw std::invalid_argument("Hex string has odd length");
    }
    auto nibble = [](char c) -> unsigned int {
        if (c >= '0' && c <= '9') return static_cast<unsigned int>(c - '0');
        if (c >= 'a' && c <= 'f') return static_cast<unsigned int>(c - 'a' + 10);
        if (c >= 'A' && c <= 'F') return static_cast<unsigned int>(c - 'A' + 10);
        throw std::invalid_argument(std::string("Invalid hex character: ") + c);
    };

    std::vector<unsigned char> bytes;
    bytes.reserve(hex.length() / 2);
    for (size_t i = 0; i < hex.length(); i += 2) {
        bytes.push_back(static_cast<unsigned char>((nibble(hex[i]) << 4) | nibble(hex[i + 1])));
    }
    return bytes;
}

/**
 * @brief Parse "512" / "1024"
 */
inline ysc1_variant_t parse_variant(const std::string& s) {
    if (s == "512") return YSC1_VARIANT_512;
    if (s == "1024") return YSC1_VARIANT_1024;
    throw std::invalid_argument("Invalid variant '" + s + "' (expected 512 or 1024)");
}

/**
 * @brief Parse "auto" / "soft" / "sse2" / "avx2"
 */
inline ysc1_backend_t parse_backend(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), ::tolower);
    if (s == "auto") return YSC1_BACKEND_AUTO;
    if (s == "soft") return YSC1_BACKEND_SOFT;
    if (s == "sse2") return YSC1_BACKEND_SSE2;
    if (s == "avx2") return YSC1_BACKEND_AVX2;
    throw std::invalid_argument("Invalid backend '" + s + "' (expected auto, soft, sse2 or avx2)");
}

/**
 * @brief Parse an unsigned decimal 64-bit value
 */
inline uint64_t parse_u64(const std::string& s, const char* what) {
    if (s.empty() || !std::all_of(s.begin(), s.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; })) {
        throw std::invalid_argument(std::string("Invalid ") + what + ": " + s);
    }
    try {
        return static_cast<uint64_t>(std::stoull(s));
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(std::string(what) + " out of range: " + s);
    }
}

/**
 * @brief Initialize a context or throw with the library's error text
 */
inline void init_context(ysc1_ctx_t* ctx, ysc1_variant_t variant,
                         const std::vector<unsigned char>& key,
                         const std::vector<unsigned char>& nonce,
                         ysc1_backend_t backend) {
    ysc1_error_t err = ysc1_init_with_backend(ctx, variant, key.data(), key.size(),
                                              nonce.data(), nonce.size(), backend);
    if (err != YSC1_SUCCESS) {
        throw std::runtime_error(std::string("Failed to initialize YSC1 context: ") +
                                 ysc1_error_string(err));
    }
}

} // namespace cli
} // namespace ysc1

#endif // YSC1_CLI_UTILS_H
