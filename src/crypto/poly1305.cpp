/**
 * @file poly1305.cpp
 * @brief Poly1305 Streaming Adapter
 *
 * Buffers caller bytes into 16-byte blocks for the accumulator engine,
 * pads the trailing partial block and exposes the C ABI and C++ class.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "polymac/crypto/poly1305.h"
#include "polymac/core/security.h"
#include <cstring>
#include <stdexcept>

extern "C" {

polymac_error_t polymac_poly1305_init(polymac_poly1305_ctx_t* ctx,
                                      const uint8_t* key,
                                      size_t key_len) {
    if (!ctx) {
        return POLYMAC_ERROR_INVALID_PARAM;
    }
    if (key_len != POLYMAC_POLY1305_KEY_SIZE) {
        return POLYMAC_ERROR_INVALID_KEY_LENGTH;
    }
    if (!key) {
        return POLYMAC_ERROR_INVALID_PARAM;
    }

    memset(ctx, 0, sizeof(polymac_poly1305_ctx_t));
    memcpy(ctx->key, key, POLYMAC_POLY1305_KEY_SIZE);
    polymac_poly1305_engine_init(&ctx->engine, ctx->key);

    return POLYMAC_SUCCESS;
}

polymac_error_t polymac_poly1305_update(polymac_poly1305_ctx_t* ctx,
                                        const uint8_t* data,
                                        size_t len) {
    if (!ctx) {
        return POLYMAC_ERROR_INVALID_PARAM;
    }
    if (len == 0) {
        return POLYMAC_SUCCESS;
    }
    if (!data) {
        return POLYMAC_ERROR_INVALID_PARAM;
    }

    size_t offset = 0;

    // Fill buffer if partial
    if (ctx->buffer_len > 0) {
        size_t need = POLYMAC_POLY1305_BLOCK_SIZE - ctx->buffer_len;
        size_t use = POLYMAC_MIN(len, need);

        memcpy(&ctx->buffer[ctx->buffer_len], data, use);
        ctx->buffer_len += use;
        offset = use;

        if (ctx->buffer_len < POLYMAC_POLY1305_BLOCK_SIZE) {
            return POLYMAC_SUCCESS;
        }
        polymac_poly1305_engine_blocks(&ctx->engine, ctx->buffer,
                                       POLYMAC_POLY1305_BLOCK_SIZE, 0);
        ctx->buffer_len = 0;
    }

    // Process full blocks straight from the caller's memory
    size_t remaining = len - offset;
    size_t whole = remaining & ~(size_t)(POLYMAC_POLY1305_BLOCK_SIZE - 1);
    if (whole > 0) {
        polymac_poly1305_engine_blocks(&ctx->engine, &data[offset], whole, 0);
        offset += whole;
    }

    // Buffer remaining
    if (offset < len) {
        memcpy(ctx->buffer, &data[offset], len - offset);
        ctx->buffer_len = len - offset;
    }

    return POLYMAC_SUCCESS;
}

polymac_error_t polymac_poly1305_final(const polymac_poly1305_ctx_t* ctx,
                                       uint8_t tag[POLYMAC_POLY1305_TAG_SIZE]) {
    if (!ctx || !tag) {
        return POLYMAC_ERROR_INVALID_PARAM;
    }

    if (ctx->buffer_len == 0) {
        polymac_poly1305_engine_finish(&ctx->engine, tag);
        return POLYMAC_SUCCESS;
    }

    // Absorb the padded partial block into a snapshot of the engine
    polymac_poly1305_engine_t snapshot = ctx->engine;
    uint8_t block[POLYMAC_POLY1305_BLOCK_SIZE];

    memcpy(block, ctx->buffer, ctx->buffer_len);
    block[ctx->buffer_len] = 1;
    for (size_t i = ctx->buffer_len + 1; i < POLYMAC_POLY1305_BLOCK_SIZE; i++) {
        block[i] = 0;
    }

    polymac_poly1305_engine_blocks(&snapshot, block, POLYMAC_POLY1305_BLOCK_SIZE, 1);
    polymac_poly1305_engine_finish(&snapshot, tag);

    polymac_secure_zero(&snapshot, sizeof(snapshot));
    polymac_secure_zero(block, sizeof(block));

    return POLYMAC_SUCCESS;
}

polymac_error_t polymac_poly1305_reset(polymac_poly1305_ctx_t* ctx,
                                       const uint8_t* key,
                                       size_t key_len) {
    if (!ctx) {
        return POLYMAC_ERROR_INVALID_PARAM;
    }
    if (key_len != POLYMAC_POLY1305_KEY_SIZE) {
        return POLYMAC_ERROR_INVALID_KEY_LENGTH;
    }
    if (!key) {
        return POLYMAC_ERROR_INVALID_PARAM;
    }

    // key may alias ctx->key
    uint8_t fresh[POLYMAC_POLY1305_KEY_SIZE];
    memcpy(fresh, key, POLYMAC_POLY1305_KEY_SIZE);

    polymac_poly1305_clear(ctx);
    memcpy(ctx->key, fresh, POLYMAC_POLY1305_KEY_SIZE);
    polymac_poly1305_engine_init(&ctx->engine, ctx->key);

    polymac_secure_zero(fresh, sizeof(fresh));
    return POLYMAC_SUCCESS;
}

polymac_error_t polymac_poly1305(const uint8_t* key,
                                 size_t key_len,
                                 const uint8_t* data,
                                 size_t len,
                                 uint8_t tag[POLYMAC_POLY1305_TAG_SIZE]) {
    polymac_poly1305_ctx_t ctx;
    polymac_error_t err;

    err = polymac_poly1305_init(&ctx, key, key_len);
    if (err != POLYMAC_SUCCESS) {
        return err;
    }

    err = polymac_poly1305_update(&ctx, data, len);
    if (err != POLYMAC_SUCCESS) {
        polymac_poly1305_clear(&ctx);
        return err;
    }

    err = polymac_poly1305_final(&ctx, tag);
    polymac_poly1305_clear(&ctx);

    return err;
}

polymac_error_t polymac_poly1305_verify(const uint8_t* key,
                                        size_t key_len,
                                        const uint8_t* data,
                                        size_t len,
                                        const uint8_t tag[POLYMAC_POLY1305_TAG_SIZE]) {
    if (!tag) {
        return POLYMAC_ERROR_INVALID_PARAM;
    }

    uint8_t computed_tag[POLYMAC_POLY1305_TAG_SIZE];

    polymac_error_t err = polymac_poly1305(key, key_len, data, len, computed_tag);
    if (err != POLYMAC_SUCCESS) {
        return err;
    }

    int equal = polymac_secure_compare(tag, computed_tag, POLYMAC_POLY1305_TAG_SIZE);
    polymac_secure_zero(computed_tag, sizeof(computed_tag));

    return equal ? POLYMAC_SUCCESS : POLYMAC_ERROR_AUTH_FAILED;
}

void polymac_poly1305_clear(polymac_poly1305_ctx_t* ctx) {
    if (ctx) {
        polymac_secure_zero(ctx, sizeof(polymac_poly1305_ctx_t));
    }
}

}  // extern "C"

// ============================================================================
// C++ Implementation
// ============================================================================

namespace polymac {

Poly1305::Poly1305(const ByteVec& key)
    : Poly1305(key.data(), key.size()) {}

Poly1305::Poly1305(const uint8_t* key, size_t key_len) {
    if (key_len != KEY_SIZE) {
        throw InvalidKeyLength(key_len);
    }
    if (!key) {
        throw std::invalid_argument("Key cannot be null");
    }
    if (polymac_poly1305_init(&ctx_, key, key_len) != POLYMAC_SUCCESS) {
        throw std::runtime_error("Poly1305 initialization failed");
    }
}

Poly1305::~Poly1305() {
    polymac_poly1305_clear(&ctx_);
}

Poly1305::Poly1305(Poly1305&& other) noexcept {
    ctx_ = other.ctx_;
    polymac_poly1305_clear(&other.ctx_);
}

Poly1305& Poly1305::operator=(Poly1305&& other) noexcept {
    if (this != &other) {
        polymac_poly1305_clear(&ctx_);
        ctx_ = other.ctx_;
        polymac_poly1305_clear(&other.ctx_);
    }
    return *this;
}

size_t Poly1305::write(const uint8_t* data, size_t len) {
    if (len == 0) {
        return 0;
    }
    if (!data) {
        throw std::invalid_argument("Data cannot be null");
    }
    if (polymac_poly1305_update(&ctx_, data, len) != POLYMAC_SUCCESS) {
        throw std::runtime_error("Poly1305 update failed");
    }
    return len;
}

size_t Poly1305::write(const ByteVec& data) {
    return write(data.data(), data.size());
}

ByteVec Poly1305::sum(const ByteVec& prefix) const {
    Poly1305Tag t = tag();

    ByteVec out;
    out.reserve(prefix.size() + TAG_SIZE);
    out.insert(out.end(), prefix.begin(), prefix.end());
    out.insert(out.end(), t.begin(), t.end());
    return out;
}

Poly1305Tag Poly1305::tag() const {
    Poly1305Tag t;
    if (polymac_poly1305_final(&ctx_, t.data()) != POLYMAC_SUCCESS) {
        throw std::runtime_error("Poly1305 finalization failed");
    }
    return t;
}

bool Poly1305::verify(const Poly1305Tag& expected) const {
    Poly1305Tag computed = tag();
    bool equal = secure_compare(computed, expected);
    polymac_secure_zero(computed.data(), computed.size());
    return equal;
}

void Poly1305::reset() {
    if (polymac_poly1305_reset(&ctx_, ctx_.key, KEY_SIZE) != POLYMAC_SUCCESS) {
        throw std::runtime_error("Poly1305 reset failed");
    }
}

void Poly1305::reset(const ByteVec& key) {
    if (key.size() != KEY_SIZE) {
        throw InvalidKeyLength(key.size());
    }
    if (polymac_poly1305_reset(&ctx_, key.data(), key.size()) != POLYMAC_SUCCESS) {
        throw std::runtime_error("Poly1305 reset failed");
    }
}

Poly1305Tag Poly1305::mac(const ByteVec& key, const ByteVec& message) {
    Poly1305 h(key);
    h.write(message);
    return h.tag();
}

} // namespace polymac
