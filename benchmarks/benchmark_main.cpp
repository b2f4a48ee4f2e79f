/**
 * @file benchmark_main.cpp
 * @brief polymac vs OpenSSL Performance Benchmark
 *
 * Usage:
 *   polymac_benchmark [mode]
 *
 * Modes:
 *   all     - One-shot and streaming (default)
 *   oneshot - Whole buffer in one update
 *   stream  - Buffer fed in small chunks
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <iostream>
#include <string>
#include <algorithm>
#include <cctype>
#include <set>

#include <openssl/crypto.h>

#include "polymac/polymac.h"

int benchmark_poly1305(bool oneshot, bool stream);

/**
 * @brief Print usage help
 */
static void print_usage(const char* program_name) {
    std::cout << "\nUsage: " << program_name << " [mode]\n\n";
    std::cout << "Modes:\n";
    std::cout << "  all     - One-shot and streaming (default)\n";
    std::cout << "  oneshot - Whole buffer in one update\n";
    std::cout << "  stream  - Buffer fed in 13-byte chunks\n";
}

/**
 * @brief Main benchmark entry point
 */
int main(int argc, char* argv[]) {
    std::string mode = "all";
    if (argc > 1) {
        mode = argv[1];
        std::transform(mode.begin(), mode.end(), mode.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    }

    std::set<std::string> valid_modes = {"all", "oneshot", "stream", "help", "-h", "--help"};
    if (valid_modes.find(mode) == valid_modes.end()) {
        std::cerr << "Error: Unknown mode '" << mode << "'\n";
        print_usage(argv[0]);
        return 1;
    }

    if (mode == "help" || mode == "-h" || mode == "--help") {
        print_usage(argv[0]);
        return 0;
    }

    std::cout << "\n";
    std::cout << "+======================================================================+\n";
    std::cout << "|              polymac vs OpenSSL Poly1305 Benchmark                   |\n";
    std::cout << "+======================================================================+\n";
    std::cout << "\npolymac Version: " << polymac_version() << " (" << polymac_platform() << ")\n";
    std::cout << "OpenSSL Version: " << OpenSSL_version(OPENSSL_VERSION) << "\n";
    std::cout << "Test Data Sizes: 1KB, 64KB, 1MB\n";

    int failures = benchmark_poly1305(mode != "stream", mode != "oneshot");
    if (failures != 0) {
        std::cerr << "\n" << failures << " size(s) failed the tag cross-check\n";
        return 1;
    }
    return 0;
}
