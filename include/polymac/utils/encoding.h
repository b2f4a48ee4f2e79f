/**
 * @file encoding.h
 * @brief Hexadecimal encoding utilities
 *
 * Used by the command-line tool and the test-vector loaders:
 * - Lowercase hex encoding
 * - Hex decoding with validation (optional 0x prefix)
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef POLYMAC_UTILS_ENCODING_H
#define POLYMAC_UTILS_ENCODING_H

#include "polymac/core/common.h"
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================================
// Hexadecimal Encoding/Decoding (C API)
// ============================================================================

/**
 * @brief Encode binary data to hexadecimal string (lowercase)
 *
 * @param data Input binary data
 * @param len Length of input data
 * @param hex Output buffer (must be at least len*2+1 bytes)
 * @param hex_size Size of output buffer
 * @return Number of characters written (excluding null terminator), 0 on error
 */
POLYMAC_API size_t polymac_hex_encode(const uint8_t* data, size_t len, char* hex, size_t hex_size);

/**
 * @brief Decode hexadecimal string to binary data
 *
 * @param hex Input hex string (may contain 0x prefix)
 * @param hex_len Length of hex string (0 for null-terminated)
 * @param data Output buffer
 * @param data_size Size of output buffer
 * @return Number of bytes written, 0 on error
 */
POLYMAC_API size_t polymac_hex_decode(const char* hex, size_t hex_len, uint8_t* data, size_t data_size);

/**
 * @brief Get hex character value (0-15), returns -1 for invalid
 */
POLYMAC_API int polymac_hex_char_value(char c);

#ifdef __cplusplus
}
#endif

// ============================================================================
// C++ API
// ============================================================================
#ifdef __cplusplus

#include "polymac/core/types.h"
#include <string>
#include <stdexcept>

namespace polymac {
namespace encoding {

/**
 * @brief Encoding exception for invalid input
 */
class EncodingError : public std::runtime_error {
public:
    explicit EncodingError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Encode bytes to lowercase hex string
 */
std::string hexEncode(const ByteVec& data);
std::string hexEncode(const uint8_t* data, size_t len);

/**
 * @brief Decode hex string to bytes
 * @throws EncodingError on odd length or non-hex characters
 */
ByteVec hexDecode(const std::string& hex);

/**
 * @brief Check if string is valid hex
 */
bool isValidHex(const std::string& str) noexcept;

} // namespace encoding
} // namespace polymac

#endif // __cplusplus

#endif // POLYMAC_UTILS_ENCODING_H
