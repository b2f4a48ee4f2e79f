/**
 * @file polymac_main.cpp
 * @brief polymac Command-Line Interface - Main Entry Point
 *
 * Usage:
 *   polymac <command> [options]
 *
 * Commands:
 *   mac          Compute a Poly1305 tag
 *   verify       Check a Poly1305 tag
 *   kat          Run known-answer test vectors
 *   benchmark    Performance benchmark vs OpenSSL
 *   version      Display version information
 *   help         Show help message
 *
 * @author polymac Development Team
 * @date 2026-10-19
 * @copyright Apache License 2.0
 */

#include <iostream>
#include <string>
#include <algorithm>
#include <cctype>

#include "polymac/polymac.h"

// Subcommand handlers (forward declarations)
int cmd_mac(int argc, char* argv[]);
int cmd_verify(int argc, char* argv[]);
int cmd_kat(int argc, char* argv[]);
int cmd_benchmark(int argc, char* argv[], const char* program);
void cmd_version();
void cmd_help();

/**
 * @brief Print general usage information
 */
void print_usage() {
    std::cout << "\nUsage: polymac <command> [options]\n\n";
    std::cout << "Available Commands:\n";
    std::cout << "  mac          Compute a Poly1305 one-time authenticator\n";
    std::cout << "  verify       Verify a Poly1305 tag (constant-time)\n";
    std::cout << "  kat          Run known-answer vectors from a file\n";
    std::cout << "  benchmark    Run performance benchmark (polymac vs OpenSSL)\n";
    std::cout << "  version      Display version and build information\n";
    std::cout << "  help         Show this help message\n\n";
    std::cout << "Examples:\n";
    std::cout << "  polymac mac -key <64 hex digits> -in file.bin\n";
    std::cout << "  polymac verify -key <64 hex digits> -tag <32 hex digits> -in file.bin\n";
    std::cout << "  polymac kat -in poly1305_vectors.txt\n\n";
    std::cout << "For command-specific help, use: polymac <command> --help\n\n";
}

/**
 * @brief Display version information
 */
void cmd_version() {
    std::cout << "\n";
    std::cout << POLYMAC_LIBRARY_NAME << " - " << POLYMAC_DESCRIPTION << "\n";
    std::cout << "\n";
    std::cout << "Version:      " << polymac_version() << "\n";
    std::cout << "Release Date: " << POLYMAC_RELEASE_DATE << "\n";
    std::cout << "Build Type:   " << POLYMAC_BUILD_TYPE << "\n";
    std::cout << "Platform:     " << polymac_platform() << "\n";
    std::cout << "License:      Apache License 2.0\n";
    std::cout << "\n";
    std::cout << "Algorithm:\n";
    std::cout << "  - Poly1305 (RFC 8439), 32-byte key, 16-byte tag\n";
    std::cout << "\n";
#ifdef POLYMAC_BENCHMARK_HAS_OPENSSL
    std::cout << "Dependencies:\n";
    std::cout << "  - OpenSSL 3 (for benchmarking)\n";
    std::cout << "\n";
#endif
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

    // Case-insensitive matching
    std::transform(command.begin(), command.end(), command.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (command == "mac" || command == "poly1305") {
        return cmd_mac(argc - 1, argv + 1);
    }
    else if (command == "verify") {
        return cmd_verify(argc - 1, argv + 1);
    }
    else if (command == "kat" || command == "selftest") {
        return cmd_kat(argc - 1, argv + 1);
    }
    else if (command == "benchmark" || command == "bench") {
        return cmd_benchmark(argc - 1, argv + 1, argv[0]);
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
