/**
 * @file cmd_keystream.cpp
 * @brief keystream subcommand: dump raw keystream blocks as hex
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include <iostream>
#include <string>

#include "ysc1/crypto/stream_cipher.h"
#include "ysc1/core/security.h"
#include "cli_utils.h"

void print_keystream_help() {
    std::cout << "\nUsage: ysc1 keystream [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -key <hex>        Key (required)\n";
    std::cout << "  -nonce <hex>      Nonce (required)\n";
    std::cout << "  -variant <v>      512 or 1024 (default: 1024)\n";
    std::cout << "  -blocks <n>       Number of 64-byte blocks (default: 1)\n";
    std::cout << "  -start <n>        Block position to seek to first (default: 0)\n";
    std::cout << "  -backend <b>      auto, soft, sse2, avx2 (default: auto)\n";
    std::cout << "  --help            Show this help message\n\n";
}

int cmd_keystream(int argc, char* argv[]) {
    std::string key_hex, nonce_hex;
    std::string variant_str = "1024", backend_str = "auto", blocks_str = "1", start_str = "0";

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        if (arg == "-key" && i + 1 < argc) {
            key_hex = argv[++i];
        } else if (arg == "-nonce" && i + 1 < argc) {
            nonce_hex = argv[++i];
        } else if (arg == "-variant" && i + 1 < argc) {
            variant_str = argv[++i];
        } else if (arg == "-blocks" && i + 1 < argc) {
            blocks_str = argv[++i];
        } else if (arg == "-start" && i + 1 < argc) {
            start_str = argv[++i];
        } else if (arg == "-backend" && i + 1 < argc) {
            backend_str = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_keystream_help();
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_keystream_help();
            return 1;
        }
    }

    if (key_hex.empty() || nonce_hex.empty()) {
        std::cerr << "Error: Missing required arguments (-key, -nonce)\n";
        print_keystream_help();
        return 1;
    }

    ysc1_ctx_t ctx;
    try {
        const ysc1_variant_t variant = ysc1::cli::parse_variant(variant_str);
        const ysc1_backend_t backend = ysc1::cli::parse_backend(backend_str);
        const uint64_t blocks = ysc1::cli::parse_u64(blocks_str, "block count");
        const uint64_t start = ysc1::cli::parse_u64(start_str, "start block");

        auto key = ysc1::cli::hex_to_bytes(key_hex);
        auto nonce = ysc1::cli::hex_to_bytes(nonce_hex);
        ysc1::cli::init_context(&ctx, variant, key, nonce, backend);
        ysc1_secure_zero(key.data(), key.size());

        ysc1_error_t err = ysc1_set_block_pos(&ctx, start);
        uint8_t block[YSC1_BLOCK_SIZE];
        for (uint64_t b = 0; err == YSC1_SUCCESS && b < blocks; ++b) {
            err = ysc1_keystream_block(&ctx, block);
            if (err == YSC1_SUCCESS) {
                std::cout << ysc1::cli::bytes_to_hex(block, sizeof(block)) << "\n";
            }
        }
        ysc1_secure_zero(block, sizeof(block));
        ysc1_clear(&ctx);

        if (err != YSC1_SUCCESS) {
            throw std::runtime_error(std::string("Keystream generation failed: ") +
                                     ysc1_error_string(err));
        }
    } catch (const std::exception& e) {
        ysc1_clear(&ctx);
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
