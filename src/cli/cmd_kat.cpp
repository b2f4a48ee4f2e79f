/**
 * @file cmd_kat.cpp
 * @brief Known-answer test subcommand for polymac CLI
 *
 * Reads conformance vectors, one per line:
 *   <message-hex> <key-hex> <expected-tag-hex>
 * A message of "-" stands for the empty message; '#' starts a comment.
 *
 * Usage:
 *   polymac kat -in tests/data/poly1305_vectors.txt
 *
 * @author polymac Development Team
 * @date 2026-10-19
 */

#include <iostream>
#include <fstream>
#include <sstream>
#include <string>

#include "polymac/crypto/poly1305.h"
#include "polymac/core/security.h"
#include "polymac/utils/encoding.h"

/**
 * @brief Print kat subcommand help
 */
void print_kat_help() {
    std::cout << "\nUsage: polymac kat [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -in <file>         Vector file (required)\n";
    std::cout << "  -v                 Print every vector, not only failures\n";
    std::cout << "  --help             Show this help message\n\n";
    std::cout << "Vector format (one per line, whitespace separated):\n";
    std::cout << "  <message-hex|-> <key-hex> <expected-tag-hex>\n\n";
}

/**
 * @brief Run a single vector
 * @return true if the computed tag equals the expected tag
 */
static bool run_vector(const std::string& msg_hex,
                       const std::string& key_hex,
                       const std::string& tag_hex,
                       std::string& computed_hex) {
    polymac::ByteVec message;
    if (msg_hex != "-") {
        message = polymac::encoding::hexDecode(msg_hex);
    }
    polymac::ByteVec key = polymac::encoding::hexDecode(key_hex);
    polymac::ByteVec expected = polymac::encoding::hexDecode(tag_hex);

    polymac::Poly1305 mac(key);
    mac.write(message);
    polymac::ByteVec actual = mac.sum();

    computed_hex = polymac::encoding::hexEncode(actual);
    return actual.size() == expected.size() &&
           polymac_secure_compare(actual.data(), expected.data(), actual.size()) == 1;
}

/**
 * @brief kat subcommand handler
 */
int cmd_kat(int argc, char* argv[]) {
    std::string input_file;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        if (arg == "-in" && i + 1 < argc) {
            input_file = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            print_kat_help();
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_kat_help();
            return 1;
        }
    }

    if (input_file.empty()) {
        std::cerr << "Error: Missing required argument (-in)\n";
        print_kat_help();
        return 1;
    }

    std::ifstream file(input_file);
    if (!file.is_open()) {
        std::cerr << "Error: Failed to open vector file: " << input_file << "\n";
        return 1;
    }

    size_t passed = 0;
    size_t failed = 0;
    size_t line_no = 0;
    std::string line;

    while (std::getline(file, line)) {
        ++line_no;

        size_t hash = line.find('#');
        if (hash != std::string::npos) {
            line.erase(hash);
        }

        std::istringstream fields(line);
        std::string msg_hex, key_hex, tag_hex, extra;
        if (!(fields >> msg_hex)) {
            continue;  // blank or comment-only
        }
        if (!(fields >> key_hex >> tag_hex) || (fields >> extra)) {
            std::cerr << "line " << line_no << ": expected 3 fields\n";
            ++failed;
            continue;
        }

        try {
            std::string computed;
            bool ok = run_vector(msg_hex, key_hex, tag_hex, computed);
            if (ok) {
                ++passed;
                if (verbose) {
                    std::cout << "line " << line_no << ": PASS " << computed << "\n";
                }
            } else {
                ++failed;
                std::cout << "line " << line_no << ": FAIL expected " << tag_hex
                          << ", got " << computed << "\n";
            }
        } catch (const std::exception& e) {
            ++failed;
            std::cout << "line " << line_no << ": ERROR " << e.what() << "\n";
        }
    }

    std::cout << passed << " passed, " << failed << " failed\n";
    return (failed == 0 && passed > 0) ? 0 : 1;
}
