/**
 * @file poly1305.h
 * @brief Poly1305 One-Time Authenticator (RFC 8439 Section 2.5)
 *
 * Streaming MAC over an arbitrary-length byte stream under a 256-bit key:
 * - Incremental update with arbitrary chunk sizes
 * - Non-destructive finalization (the tag may be read repeatedly)
 * - Reset with the stored key or with a fresh key
 * - Constant-time final reduction and tag verification
 *
 * @warning A key MUST authenticate at most one message. Two tags under the
 *          same key reveal enough to forge tags for other messages.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef POLYMAC_CRYPTO_POLY1305_H
#define POLYMAC_CRYPTO_POLY1305_H

#include "polymac/core/common.h"
#include "polymac/core/types.h"
#include "polymac/internal/poly1305_impl.h"

#ifdef __cplusplus
extern "C" {
#endif

/* ============================================================================
 * Poly1305 One-Time Authenticator
 * ============================================================================ */

/**
 * @brief Poly1305 streaming context
 */
typedef struct {
    polymac_poly1305_engine_t engine;              // Accumulator engine
    uint8_t key[POLYMAC_POLY1305_KEY_SIZE];        // Key kept for reset
    uint8_t buffer[POLYMAC_POLY1305_BLOCK_SIZE];   // Partial block buffer
    size_t buffer_len;                             // Bytes in buffer (0..15)
} polymac_poly1305_ctx_t;

/**
 * @brief Initialize Poly1305 context with a one-time key
 *
 * @param ctx Poly1305 context
 * @param key One-time key
 * @param key_len Key length, must be exactly 32
 * @return POLYMAC_SUCCESS, POLYMAC_ERROR_INVALID_KEY_LENGTH or
 *         POLYMAC_ERROR_INVALID_PARAM
 */
POLYMAC_API polymac_error_t polymac_poly1305_init(
    polymac_poly1305_ctx_t* ctx,
    const uint8_t* key,
    size_t key_len
);

/**
 * @brief Absorb message bytes
 *
 * Any chunking of a message produces the same tag. Zero-length updates are
 * allowed (data may then be NULL).
 *
 * @param ctx Initialized Poly1305 context
 * @param data Input data
 * @param len Data length
 * @return POLYMAC_SUCCESS or POLYMAC_ERROR_INVALID_PARAM
 */
POLYMAC_API polymac_error_t polymac_poly1305_update(
    polymac_poly1305_ctx_t* ctx,
    const uint8_t* data,
    size_t len
);

/**
 * @brief Compute the tag for the bytes absorbed so far
 *
 * Does not modify the context: it can be called again, and further updates
 * continue the same message.
 *
 * @param ctx Poly1305 context
 * @param tag 16-byte output tag
 * @return POLYMAC_SUCCESS or POLYMAC_ERROR_INVALID_PARAM
 */
POLYMAC_API polymac_error_t polymac_poly1305_final(
    const polymac_poly1305_ctx_t* ctx,
    uint8_t tag[POLYMAC_POLY1305_TAG_SIZE]
);

/**
 * @brief Re-key the context and discard all absorbed data
 *
 * On error the context is left unchanged.
 *
 * @param ctx Poly1305 context
 * @param key New one-time key
 * @param key_len Key length, must be exactly 32
 */
POLYMAC_API polymac_error_t polymac_poly1305_reset(
    polymac_poly1305_ctx_t* ctx,
    const uint8_t* key,
    size_t key_len
);

/**
 * @brief One-shot Poly1305 MAC
 *
 * @param key One-time key
 * @param key_len Key length, must be exactly 32
 * @param data Input data
 * @param len Data length
 * @param tag 16-byte output tag
 * @return POLYMAC_SUCCESS or error code
 */
POLYMAC_API polymac_error_t polymac_poly1305(
    const uint8_t* key,
    size_t key_len,
    const uint8_t* data,
    size_t len,
    uint8_t tag[POLYMAC_POLY1305_TAG_SIZE]
);

/**
 * @brief Verify Poly1305 tag (constant-time)
 *
 * @return POLYMAC_SUCCESS or POLYMAC_ERROR_AUTH_FAILED
 */
POLYMAC_API polymac_error_t polymac_poly1305_verify(
    const uint8_t* key,
    size_t key_len,
    const uint8_t* data,
    size_t len,
    const uint8_t tag[POLYMAC_POLY1305_TAG_SIZE]
);

/**
 * @brief Clear Poly1305 context
 */
POLYMAC_API void polymac_poly1305_clear(polymac_poly1305_ctx_t* ctx);

#ifdef __cplusplus
}
#endif

// C++ Interface
#ifdef __cplusplus

#include <stdexcept>
#include <string>

namespace polymac {

/**
 * @brief Raised when a key is not exactly 32 bytes long
 */
class InvalidKeyLength : public std::invalid_argument {
public:
    explicit InvalidKeyLength(size_t actual)
        : std::invalid_argument("poly1305: invalid key length " +
                                std::to_string(actual) + " (expected 32)"),
          actual_(actual) {}

    size_t actual() const noexcept { return actual_; }

private:
    size_t actual_;
};

/**
 * @brief Poly1305 streaming MAC
 *
 * One instance authenticates one message. Not thread-safe; independent
 * instances share no state.
 */
class Poly1305 {
public:
    static constexpr size_t KEY_SIZE = POLYMAC_POLY1305_KEY_SIZE;
    static constexpr size_t BLOCK_SIZE = POLYMAC_POLY1305_BLOCK_SIZE;
    static constexpr size_t TAG_SIZE = POLYMAC_POLY1305_TAG_SIZE;

    /**
     * @brief Construct with a 256-bit one-time key
     * @throws InvalidKeyLength if key is not 32 bytes
     */
    explicit Poly1305(const ByteVec& key);
    Poly1305(const uint8_t* key, size_t key_len);

    ~Poly1305();

    // Disable copy
    Poly1305(const Poly1305&) = delete;
    Poly1305& operator=(const Poly1305&) = delete;

    // Enable move
    Poly1305(Poly1305&&) noexcept;
    Poly1305& operator=(Poly1305&&) noexcept;

    /**
     * @brief Absorb more message bytes
     * @return Number of bytes consumed (always len)
     */
    size_t write(const uint8_t* data, size_t len);
    size_t write(const ByteVec& data);

    /**
     * @brief Append the current tag to prefix
     *
     * Leaves the running state untouched.
     *
     * @return prefix followed by the 16-byte tag
     */
    ByteVec sum(const ByteVec& prefix = {}) const;

    /**
     * @brief Current tag as a fixed-size array
     */
    Poly1305Tag tag() const;

    /**
     * @brief Constant-time comparison of the current tag with expected
     */
    bool verify(const Poly1305Tag& expected) const;

    /**
     * @brief Restart with the key given at construction (or last reset)
     */
    void reset();

    /**
     * @brief Restart with a fresh key
     * @throws InvalidKeyLength if key is not 32 bytes (state unchanged)
     */
    void reset(const ByteVec& key);

    static constexpr size_t blockSize() { return BLOCK_SIZE; }
    static constexpr size_t size() { return TAG_SIZE; }

    /**
     * @brief One-shot MAC
     * @throws InvalidKeyLength if key is not 32 bytes
     */
    static Poly1305Tag mac(const ByteVec& key, const ByteVec& message);

private:
    polymac_poly1305_ctx_t ctx_;
};

} // namespace polymac

#endif // __cplusplus

#endif // POLYMAC_CRYPTO_POLY1305_H
