/**
 * @file benchmark_poly1305.cpp
 * @brief Poly1305 Performance Benchmark: polymac vs OpenSSL
 *
 * Modes:
 * - One-shot: whole buffer in a single update
 * - Streaming: buffer fed in 13-byte chunks to exercise the partial block path
 *
 * Every size is cross-checked: both libraries must produce the same tag.
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wconversion"
#pragma GCC diagnostic ignored "-Wsign-conversion"
#endif

#include <iostream>
#include <iomanip>
#include <vector>
#include <array>
#include <cstring>

// OpenSSL headers
#include <openssl/evp.h>
#include <openssl/rand.h>

#include "polymac/polymac.h"
#include "benchmark_common.hpp"

using namespace polymac_bench;

// Test data sizes
static const std::vector<size_t> TEST_SIZES = {
    1024,              // 1 KB
    64 * 1024,         // 64 KB
    1024 * 1024        // 1 MB
};

constexpr size_t STREAM_CHUNK = 13;

/**
 * @brief Generate random bytes using OpenSSL
 */
static bool generate_random(uint8_t* buf, size_t len) {
    return RAND_bytes(buf, static_cast<int>(len)) == 1;
}

// ============================================================================
// OpenSSL
// ============================================================================

/**
 * @brief OpenSSL Poly1305 through the EVP_MAC interface
 * @return false on any OpenSSL error
 */
static bool openssl_poly1305(EVP_MAC* mac_impl,
                             const uint8_t* key,
                             const uint8_t* data,
                             size_t len,
                             size_t chunk,
                             uint8_t tag[16]) {
    EVP_MAC_CTX* ctx = EVP_MAC_CTX_new(mac_impl);
    if (!ctx) {
        return false;
    }

    bool ok = EVP_MAC_init(ctx, key, 32, nullptr) == 1;
    for (size_t off = 0; ok && off < len; off += chunk) {
        size_t n = (len - off < chunk) ? len - off : chunk;
        ok = EVP_MAC_update(ctx, data + off, n) == 1;
    }

    size_t out_len = 0;
    ok = ok && EVP_MAC_final(ctx, tag, &out_len, 16) == 1 && out_len == 16;

    EVP_MAC_CTX_free(ctx);
    return ok;
}

static BenchmarkResult benchmark_openssl(EVP_MAC* mac_impl,
                                         const uint8_t* key,
                                         const uint8_t* data,
                                         size_t data_size,
                                         size_t chunk) {
    uint8_t tag[16];
    return run_benchmark_ex(data_size, [&]() {
        auto start = Clock::now();
        bool ok = openssl_poly1305(mac_impl, key, data, data_size, chunk, tag);
        auto end = Clock::now();
        return ok ? Duration(end - start).count() : -1.0;
    });
}

// ============================================================================
// polymac
// ============================================================================

static bool polymac_stream(const uint8_t* key,
                           const uint8_t* data,
                           size_t len,
                           size_t chunk,
                           uint8_t tag[16]) {
    polymac_poly1305_ctx_t ctx;
    if (polymac_poly1305_init(&ctx, key, 32) != POLYMAC_SUCCESS) {
        return false;
    }

    bool ok = true;
    for (size_t off = 0; ok && off < len; off += chunk) {
        size_t n = (len - off < chunk) ? len - off : chunk;
        ok = polymac_poly1305_update(&ctx, data + off, n) == POLYMAC_SUCCESS;
    }
    ok = ok && polymac_poly1305_final(&ctx, tag) == POLYMAC_SUCCESS;

    polymac_poly1305_clear(&ctx);
    return ok;
}

static BenchmarkResult benchmark_polymac(const uint8_t* key,
                                         const uint8_t* data,
                                         size_t data_size,
                                         size_t chunk) {
    uint8_t tag[16];
    return run_benchmark_ex(data_size, [&]() {
        auto start = Clock::now();
        bool ok = polymac_stream(key, data, data_size, chunk, tag);
        auto end = Clock::now();
        return ok ? Duration(end - start).count() : -1.0;
    });
}

// ============================================================================
// Main Benchmark Function
// ============================================================================

/**
 * @brief Run the Poly1305 benchmark for all sizes
 *
 * @param oneshot Include the single-update mode
 * @param stream Include the chunked mode
 * @return Number of sizes where the tags disagreed or a run failed
 */
int benchmark_poly1305(bool oneshot, bool stream) {
    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "  polymac Poly1305 Benchmark vs OpenSSL" << std::endl;
    std::cout << std::string(70, '=') << std::endl;

    EVP_MAC* mac_impl = EVP_MAC_fetch(nullptr, "POLY1305", nullptr);
    if (!mac_impl) {
        std::cerr << "OpenSSL does not provide POLY1305" << std::endl;
        return 1;
    }

    std::array<uint8_t, 32> key;
    if (!generate_random(key.data(), key.size())) {
        EVP_MAC_free(mac_impl);
        std::cerr << "RAND_bytes failed" << std::endl;
        return 1;
    }

    int failures = 0;

    for (size_t data_size : TEST_SIZES) {
        std::cout << "\n--- Data Size: " << format_size(data_size) << " ---" << std::endl;
        std::cout << std::left << std::setw(25) << "Algorithm"
                  << std::setw(15) << "Implementation"
                  << std::right << std::setw(15) << "Throughput"
                  << std::setw(13) << "Avg Time"
                  << std::endl;
        std::cout << std::string(68, '-') << std::endl;

        std::vector<uint8_t> data(data_size);
        if (!generate_random(data.data(), data_size)) {
            ++failures;
            continue;
        }

        // Tags must agree before timings mean anything
        uint8_t ssl_tag[16];
        uint8_t pm_tag[16];
        bool ssl_ok = openssl_poly1305(mac_impl, key.data(), data.data(),
                                       data_size, STREAM_CHUNK, ssl_tag);
        bool pm_ok = polymac_stream(key.data(), data.data(), data_size,
                                    data_size, pm_tag);
        if (!ssl_ok || !pm_ok || std::memcmp(ssl_tag, pm_tag, 16) != 0) {
            std::cout << "  TAG MISMATCH: " << polymac::encoding::hexEncode(pm_tag, 16)
                      << " vs " << polymac::encoding::hexEncode(ssl_tag, 16) << std::endl;
            ++failures;
            continue;
        }

        if (oneshot) {
            BenchmarkResult ssl = benchmark_openssl(mac_impl, key.data(), data.data(),
                                                    data_size, data_size);
            BenchmarkResult pm = benchmark_polymac(key.data(), data.data(),
                                                   data_size, data_size);
            print_result("Poly1305", "OpenSSL", ssl);
            print_result("Poly1305", "polymac", pm);
            print_ratio(pm, ssl);
        }

        if (stream) {
            BenchmarkResult ssl = benchmark_openssl(mac_impl, key.data(), data.data(),
                                                    data_size, STREAM_CHUNK);
            BenchmarkResult pm = benchmark_polymac(key.data(), data.data(),
                                                   data_size, STREAM_CHUNK);
            print_result("Poly1305 (13B chunks)", "OpenSSL", ssl);
            print_result("Poly1305 (13B chunks)", "polymac", pm);
            print_ratio(pm, ssl);
        }
    }

    EVP_MAC_free(mac_impl);

    std::cout << "\nIterations per test: " << BENCHMARK_ITERATIONS << std::endl;
    std::cout << "Warmup iterations: " << WARMUP_ITERATIONS << std::endl;
    std::cout << "Ratio > 1.0x means polymac is faster than OpenSSL" << std::endl;

    return failures;
}

#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif
