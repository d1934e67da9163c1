/**
 * @file ysc1_main.cpp
 * @brief ysc1 Command-Line Interface - Main Entry Point
 *
 * Usage:
 *   ysc1 <command> [options]
 *
 * Commands:
 *   encrypt      XOR a file with the YSC1 keystream
 *   decrypt      Same operation as encrypt
 *   keystream    Dump raw keystream blocks as hex
 *   keygen       Generate a random key and nonce
 *   info         CPU features and available backends
 *   version      Display version information
 *   help         Show help message
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include <iostream>
#include <string>
#include <algorithm>
#include <cctype>

#include "ysc1/ysc1.h"

// Subcommand handlers (forward declarations)
int cmd_crypt(const std::string& command, int argc, char* argv[]);
int cmd_keystream(int argc, char* argv[]);
int cmd_keygen(int argc, char* argv[]);
void cmd_info();
void cmd_version();
void cmd_help();

/**
 * @brief Print general usage information
 */
void print_usage() {
    std::cout << "\nUsage: ysc1 <command> [options]\n\n";
    std::cout << "Available Commands:\n";
    std::cout << "  encrypt      Encrypt a file (XOR with YSC1 keystream)\n";
    std::cout << "  decrypt      Decrypt a file (same as encrypt)\n";
    std::cout << "  keystream    Print raw keystream blocks as hex\n";
    std::cout << "  keygen       Generate a random key and nonce\n";
    std::cout << "  info         Show CPU features and keystream backends\n";
    std::cout << "  version      Display version and build information\n";
    std::cout << "  help         Show this help message\n\n";
    std::cout << "Examples:\n";
    std::cout << "  ysc1 keygen -variant 1024\n";
    std::cout << "  ysc1 encrypt -in file.txt -out file.enc -key <hex> -nonce <hex>\n";
    std::cout << "  ysc1 keystream -variant 512 -key <hex> -nonce <hex> -blocks 4\n\n";
    std::cout << "For command-specific help, use: ysc1 <command> --help\n\n";
}

/**
 * @brief Display version information
 */
void cmd_version() {
    std::cout << "\n";
    std::cout << YSC1_LIBRARY_NAME << " - " << YSC1_DESCRIPTION << "\n";
    std::cout << "\n";
    std::cout << "Version:      " << ysc1_version() << "\n";
    std::cout << "Release Date: " << YSC1_RELEASE_DATE << "\n";
    std::cout << "Build Type:   " << YSC1_BUILD_TYPE << "\n";
    std::cout << "Platform:     " << ysc1_platform() << "\n";
    std::cout << "License:      Apache License 2.0\n";
    std::cout << "\n";
    std::cout << "Variants:\n";
    std::cout << "  - YSC1-512  (64-byte key, 64-byte nonce, 16/8 rounds)\n";
    std::cout << "  - YSC1-1024 (128-byte key, 64-byte nonce, 20/10 rounds)\n";
    std::cout << "\n";
}

/**
 * @brief Display CPU features and backend availability
 */
void cmd_info() {
    const auto features = ysc1::cpu::CPUFeatures::detect();
    const ysc1_backend_t backends[] = {
        YSC1_BACKEND_SOFT, YSC1_BACKEND_SSE2, YSC1_BACKEND_AVX2
    };

    std::cout << "\nCPU Features: " << features.to_string() << "\n\n";
    std::cout << "Keystream Backends:\n";
    for (ysc1_backend_t b : backends) {
        std::cout << "  " << ysc1_backend_name(b) << "\t"
                  << (ysc1_backend_available(b) ? "available" : "unavailable") << "\n";
    }

    // Report what AUTO resolves to by building a throwaway context
    uint8_t key[YSC1_512_KEY_SIZE] = {0};
    uint8_t nonce[YSC1_512_NONCE_SIZE] = {0};
    ysc1_ctx_t ctx;
    if (ysc1_init(&ctx, YSC1_VARIANT_512, key, sizeof(key), nonce, sizeof(nonce)) == YSC1_SUCCESS) {
        std::cout << "  auto\t-> " << ysc1_backend_name(ysc1_get_backend(&ctx)) << "\n";
        ysc1_clear(&ctx);
    }
    std::cout << "\n";
}

/**
 * @brief Display help message (alias for print_usage)
 */
void cmd_help() {
    print_usage();
}

/**
 * @brief Main entry point
 */
int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 0;
    }

    std::string command(argv[1]);
    std::transform(command.begin(), command.end(), command.begin(), ::tolower);

    if (command == "encrypt" || command == "decrypt") {
        return cmd_crypt(command, argc - 1, argv + 1);
    }
    else if (command == "keystream") {
        return cmd_keystream(argc - 1, argv + 1);
    }
    else if (command == "keygen") {
        return cmd_keygen(argc - 1, argv + 1);
    }
    else if (command == "info") {
        cmd_info();
        return 0;
    }
    else if (command == "version" || command == "-v" || command == "--version") {
        cmd_version();
        return 0;
    }
    else if (command == "help" || command == "-h" || command == "--help") {
        cmd_help();
        return 0;
    }
    else {
        std::cerr << "\nError: Unknown command '" << command << "'\n";
        print_usage();
        return 1;
    }
}
