/**
 * @file cli_utils.h
 * @brief Common utility functions for polymac CLI commands
 *
 * @author polymac Development Team
 * @date 2026-10-19
 */

#ifndef POLYMAC_CLI_UTILS_H
#define POLYMAC_CLI_UTILS_H

#include <fstream>
#include <iostream>
#include <vector>
#include <string>
#include <stdexcept>

#include "polymac/crypto/poly1305.h"
#include "polymac/utils/encoding.h"

namespace polymac {
namespace cli {

/** Read size used when streaming files into the MAC */
constexpr size_t FILE_CHUNK_SIZE = 64 * 1024;

/**
 * @brief Stream a file into a Poly1305 instance chunk by chunk
 * @return Number of bytes absorbed
 */
inline size_t write_file_to(Poly1305& mac, const std::string& filename) {
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open input file: " + filename);
    }

    std::vector<char> chunk(FILE_CHUNK_SIZE);
    size_t total = 0;
    while (file) {
        file.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        std::streamsize got = file.gcount();
        if (got <= 0) {
            break;
        }
        total += mac.write(reinterpret_cast<const uint8_t*>(chunk.data()),
                           static_cast<size_t>(got));
    }
    if (file.bad()) {
        throw std::runtime_error("Failed to read input file: " + filename);
    }
    return total;
}

/**
 * @brief Parse a hex-encoded Poly1305 key
 * @throws std::runtime_error if the key is not valid hex
 */
inline ByteVec parse_key_hex(const std::string& hex) {
    try {
        return encoding::hexDecode(hex);
    } catch (const encoding::EncodingError&) {
        throw std::runtime_error("Key is not valid hex");
    }
}

/**
 * @brief Convert bytes to hex string
 */
inline std::string bytes_to_hex(const unsigned char* data, size_t len) {
    return encoding::hexEncode(data, len);
}

} // namespace cli
} // namespace polymac

#endif // POLYMAC_CLI_UTILS_H
