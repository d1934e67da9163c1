/**
 * @file cmd_crypt.cpp
 * @brief encrypt / decrypt subcommands for the ysc1 CLI
 *
 * XORs a file with the YSC1 keystream. Encryption and decryption are the
 * same operation; both names are accepted for readability.
 *
 * Usage:
 *   ysc1 encrypt -in plain.bin -out cipher.bin -key <hex> -nonce <hex>
 *   ysc1 decrypt -in cipher.bin -out plain.bin -key <hex> -nonce <hex> -offset 4096
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

using ysc1::cli::read_file;
using ysc1::cli::write_file;
using ysc1::cli::hex_to_bytes;

/**
 * @brief Print encrypt/decrypt help
 */
void print_crypt_help(const std::string& command) {
    std::cout << "\nUsage: ysc1 " << command << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -in <file>        Input file path (required)\n";
    std::cout << "  -out <file>       Output file path (required)\n";
    std::cout << "  -key <hex>        Key, 128 hex chars (512) or 256 hex chars (1024)\n";
    std::cout << "  -nonce <hex>      Nonce, 128 hex chars\n";
    std::cout << "  -variant <v>      512 or 1024 (default: 1024)\n";
    std::cout << "  -offset <bytes>   Start at this keystream byte offset (default: 0)\n";
    std::cout << "  -backend <b>      auto, soft, sse2, avx2 (default: auto)\n";
    std::cout << "  --help            Show this help message\n\n";
    std::cout << "Examples:\n";
    std::cout << "  ysc1 keygen -variant 512\n";
    std::cout << "  ysc1 " << command << " -in data.bin -out data.out -variant 512 -key <hex> -nonce <hex>\n\n";
}

/**
 * @brief encrypt / decrypt subcommand handler
 */
int cmd_crypt(const std::string& command, int argc, char* argv[]) {
    std::string input_file, output_file, key_hex, nonce_hex;
    std::string variant_str = "1024", backend_str = "auto", offset_str = "0";

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        if (arg == "-in" && i + 1 < argc) {
            input_file = argv[++i];
        } else if (arg == "-out" && i + 1 < argc) {
            output_file = argv[++i];
        } else if (arg == "-key" && i + 1 < argc) {
            key_hex = argv[++i];
        } else if (arg == "-nonce" && i + 1 < argc) {
            nonce_hex = argv[++i];
        } else if (arg == "-variant" && i + 1 < argc) {
            variant_str = argv[++i];
        } else if (arg == "-offset" && i + 1 < argc) {
            offset_str = argv[++i];
        } else if (arg == "-backend" && i + 1 < argc) {
            backend_str = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_crypt_help(command);
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_crypt_help(command);
            return 1;
        }
    }

    if (input_file.empty() || output_file.empty() || key_hex.empty() || nonce_hex.empty()) {
        std::cerr << "Error: Missing required arguments (-in, -out, -key, -nonce)\n";
        print_crypt_help(command);
        return 1;
    }

    ysc1_ctx_t ctx;
    try {
        const ysc1_variant_t variant = ysc1::cli::parse_variant(variant_str);
        const ysc1_backend_t backend = ysc1::cli::parse_backend(backend_str);
        const uint64_t offset = ysc1::cli::parse_u64(offset_str, "offset");

        auto key = hex_to_bytes(key_hex);
        auto nonce = hex_to_bytes(nonce_hex);

        ysc1::cli::init_context(&ctx, variant, key, nonce, backend);
        ysc1_secure_zero(key.data(), key.size());

        auto data = read_file(input_file);
        std::cout << "Read " << data.size() << " bytes from " << input_file << "\n";
        std::cout << "Using YSC1-" << static_cast<int>(variant) << " ("
                  << ysc1_backend_name(ysc1_get_backend(&ctx)) << " backend)\n";

        ysc1_error_t err = ysc1_seek_bytes(&ctx, offset);
        if (err == YSC1_SUCCESS) {
            err = ysc1_crypt(&ctx, data.data(), data.size(), data.data());
        }
        ysc1_clear(&ctx);
        if (err != YSC1_SUCCESS) {
            throw std::runtime_error(std::string("Keystream application failed: ") +
                                     ysc1_error_string(err));
        }

        write_file(output_file, data);
        std::cout << "Wrote " << data.size() << " bytes to " << output_file << "\n";
    } catch (const std::exception& e) {
        ysc1_clear(&ctx);
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
