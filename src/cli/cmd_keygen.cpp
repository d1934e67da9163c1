/**
 * @file cmd_keygen.cpp
 * @brief keygen subcommand: random key and nonce from the OS CSPRNG
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include <iostream>
#include <string>
#include <vector>

#include "ysc1/crypto/stream_cipher.h"
#include "ysc1/core/security.h"
#include "cli_utils.h"

void print_keygen_help() {
    std::cout << "\nUsage: ysc1 keygen [-variant 512|1024]\n\n";
    std::cout << "Prints a random key and nonce as hex, one per line.\n\n";
}

int cmd_keygen(int argc, char* argv[]) {
    std::string variant_str = "1024";

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "-variant" && i + 1 < argc) {
            variant_str = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_keygen_help();
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_keygen_help();
            return 1;
        }
    }

    try {
        const ysc1_variant_t variant = ysc1::cli::parse_variant(variant_str);
        const size_t key_len = variant == YSC1_VARIANT_512 ? YSC1_512_KEY_SIZE : YSC1_1024_KEY_SIZE;

        std::vector<unsigned char> key(key_len);
        std::vector<unsigned char> nonce(YSC1_MAX_NONCE_SIZE);
        if (ysc1_random_bytes(key.data(), key.size()) != YSC1_SUCCESS ||
            ysc1_random_bytes(nonce.data(), nonce.size()) != YSC1_SUCCESS) {
            throw std::runtime_error("RNG failed");
        }

        std::cout << "key=" << ysc1::cli::bytes_to_hex(key.data(), key.size()) << "\n";
        std::cout << "nonce=" << ysc1::cli::bytes_to_hex(nonce.data(), nonce.size()) << "\n";
        ysc1_secure_zero(key.data(), key.size());
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
