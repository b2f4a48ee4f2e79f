/**
 * @file cmd_mac.cpp
 * @brief MAC and verify subcommands for polymac CLI
 *
 * Usage:
 *   polymac mac -key <hex> -in file.bin
 *   polymac mac -key <hex> -text "Hello world!" -binary > tag.bin
 *   polymac verify -key <hex> -tag <hex> -hex 48656c6c6f
 *
 * @author polymac Development Team
 * @date 2026-10-19
 */

#include <iostream>
#include <string>
#include <cstring>

#include "polymac/crypto/poly1305.h"
#include "polymac/core/security.h"

// Use shared CLI utilities
#include "cli_utils.h"
using polymac::cli::bytes_to_hex;
using polymac::cli::parse_key_hex;
using polymac::cli::write_file_to;

/**
 * @brief Options shared by the mac and verify subcommands
 */
struct MacOptions {
    std::string key_hex;
    std::string tag_hex;
    std::string input_file;
    std::string message_hex;
    std::string message_text;
    bool has_hex = false;
    bool has_text = false;
    bool binary_output = false;
    bool verbose = false;
    bool help = false;
};

/**
 * @brief Print mac subcommand help
 */
void print_mac_help() {
    std::cout << "\nUsage: polymac mac [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -key <hex>         32-byte one-time key, 64 hex digits (required)\n";
    std::cout << "  -in <file>         Authenticate file contents\n";
    std::cout << "  -hex <hex>         Authenticate hex-encoded message\n";
    std::cout << "  -text <string>     Authenticate literal string\n";
    std::cout << "  -binary            Output raw 16-byte tag\n";
    std::cout << "  -v                 Print processing details to stderr\n";
    std::cout << "  --help             Show this help message\n\n";
    std::cout << "Exactly one of -in, -hex or -text is required.\n";
    std::cout << "NEVER authenticate two messages with the same key.\n\n";
    std::cout << "Examples:\n";
    std::cout << "  polymac mac -key 85d6...f51b -in document.pdf\n";
    std::cout << "  polymac mac -key 85d6...f51b -text \"Cryptographic Forum Research Group\"\n\n";
}

/**
 * @brief Print verify subcommand help
 */
void print_verify_help() {
    std::cout << "\nUsage: polymac verify [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -key <hex>         32-byte one-time key, 64 hex digits (required)\n";
    std::cout << "  -tag <hex>         Expected 16-byte tag, 32 hex digits (required)\n";
    std::cout << "  -in <file>         Message file\n";
    std::cout << "  -hex <hex>         Hex-encoded message\n";
    std::cout << "  -text <string>     Literal message\n";
    std::cout << "  -v                 Print processing details to stderr\n";
    std::cout << "  --help             Show this help message\n\n";
    std::cout << "Exit status: 0 if the tag matches, 1 otherwise.\n\n";
}

/**
 * @brief Parse mac/verify arguments
 * @return false on unknown option or missing value
 */
static bool parse_mac_options(int argc, char* argv[], MacOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        if (arg == "-key" && i + 1 < argc) {
            opts.key_hex = argv[++i];
        } else if (arg == "-tag" && i + 1 < argc) {
            opts.tag_hex = argv[++i];
        } else if (arg == "-in" && i + 1 < argc) {
            opts.input_file = argv[++i];
        } else if (arg == "-hex" && i + 1 < argc) {
            opts.message_hex = argv[++i];
            opts.has_hex = true;
        } else if (arg == "-text" && i + 1 < argc) {
            opts.message_text = argv[++i];
            opts.has_text = true;
        } else if (arg == "-binary") {
            opts.binary_output = true;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return false;
        }
    }
    return true;
}

/**
 * @brief Check that exactly one message source was given
 */
static bool has_single_source(const MacOptions& opts) {
    int sources = (opts.input_file.empty() ? 0 : 1) +
                  (opts.has_hex ? 1 : 0) +
                  (opts.has_text ? 1 : 0);
    return sources == 1;
}

/**
 * @brief Feed the selected message source into mac
 * @return Message length in bytes
 */
static size_t absorb_message(polymac::Poly1305& mac, const MacOptions& opts) {
    if (!opts.input_file.empty()) {
        return write_file_to(mac, opts.input_file);
    }
    if (opts.has_hex) {
        return mac.write(polymac::encoding::hexDecode(opts.message_hex));
    }
    return mac.write(reinterpret_cast<const uint8_t*>(opts.message_text.data()),
                     opts.message_text.size());
}

/**
 * @brief Compute the tag for the options' key and message
 */
static polymac::Poly1305Tag compute_tag(const MacOptions& opts) {
    polymac::ByteVec key = parse_key_hex(opts.key_hex);
    polymac::Poly1305 mac(key);
    polymac_secure_zero(key.data(), key.size());

    size_t length = absorb_message(mac, opts);
    if (opts.verbose) {
        std::cerr << "[poly1305] absorbed " << length << " bytes ("
                  << (length / polymac::Poly1305::BLOCK_SIZE) << " full blocks, "
                  << (length % polymac::Poly1305::BLOCK_SIZE) << " trailing)\n";
    }
    return mac.tag();
}

/**
 * @brief mac subcommand handler
 */
int cmd_mac(int argc, char* argv[]) {
    MacOptions opts;
    if (!parse_mac_options(argc, argv, opts)) {
        print_mac_help();
        return 1;
    }
    if (opts.help) {
        print_mac_help();
        return 0;
    }

    if (opts.key_hex.empty() || !has_single_source(opts)) {
        std::cerr << "Error: Missing required arguments (-key and one of -in/-hex/-text)\n";
        print_mac_help();
        return 1;
    }

    try {
        polymac::Poly1305Tag tag = compute_tag(opts);

        if (opts.binary_output) {
            std::cout.write(reinterpret_cast<const char*>(tag.data()),
                            static_cast<std::streamsize>(tag.size()));
        } else {
            std::cout << bytes_to_hex(tag.data(), tag.size()) << "\n";
        }
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

/**
 * @brief verify subcommand handler
 */
int cmd_verify(int argc, char* argv[]) {
    MacOptions opts;
    if (!parse_mac_options(argc, argv, opts)) {
        print_verify_help();
        return 1;
    }
    if (opts.help) {
        print_verify_help();
        return 0;
    }

    if (opts.key_hex.empty() || opts.tag_hex.empty() || !has_single_source(opts)) {
        std::cerr << "Error: Missing required arguments (-key, -tag and one of -in/-hex/-text)\n";
        print_verify_help();
        return 1;
    }

    try {
        polymac::ByteVec expected = polymac::encoding::hexDecode(opts.tag_hex);
        if (expected.size() != polymac::Poly1305::TAG_SIZE) {
            std::cerr << "Error: Tag must be " << polymac::Poly1305::TAG_SIZE << " bytes\n";
            return 1;
        }

        polymac::Poly1305Tag computed = compute_tag(opts);
        bool ok = polymac_secure_compare(computed.data(), expected.data(),
                                         computed.size()) == 1;

        std::cout << (ok ? "Verified OK" : "Verification FAILED") << "\n";
        return ok ? 0 : 1;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
