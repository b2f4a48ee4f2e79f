/**
 * @file benchmark_common.hpp
 * @brief Common utilities for polymac benchmarks with ratio comparison
 *
 * Provides unified benchmark output format with:
 * - Throughput and average time per run
 * - OpenSSL vs polymac ratio comparison
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef POLYMAC_BENCHMARK_COMMON_HPP
#define POLYMAC_BENCHMARK_COMMON_HPP

#include <iostream>
#include <iomanip>
#include <string>
#include <functional>
#include <vector>
#include <algorithm>
#include <numeric>
#include <chrono>

namespace polymac_bench {

using Clock = std::chrono::high_resolution_clock;
using Duration = std::chrono::duration<double, std::milli>;

// Benchmark configuration
constexpr size_t WARMUP_ITERATIONS = 10;
constexpr size_t BENCHMARK_ITERATIONS = 100;

/**
 * @brief Benchmark result containing timing and throughput data
 */
struct BenchmarkResult {
    double avg_ms;          ///< Average time in milliseconds
    double min_ms;          ///< Minimum time in milliseconds
    double throughput;      ///< Throughput in MB/s
    bool valid;             ///< Whether benchmark completed successfully

    BenchmarkResult() : avg_ms(0), min_ms(0), throughput(0), valid(false) {}
    BenchmarkResult(double avg, double min_t, double tp)
        : avg_ms(avg), min_ms(min_t), throughput(tp), valid(true) {}
};

/**
 * @brief Calculate throughput in MB/s
 */
inline double calculate_throughput(size_t bytes, double ms) {
    return (static_cast<double>(bytes) / (1024.0 * 1024.0)) / (ms / 1000.0);
}

/**
 * @brief Format size string
 */
inline std::string format_size(size_t bytes) {
    if (bytes >= 1024 * 1024) {
        return std::to_string(bytes / (1024 * 1024)) + " MB";
    }
    return std::to_string(bytes / 1024) + " KB";
}

/**
 * @brief Run benchmark and return result with statistics
 *
 * @param data_size Bytes processed per call, for throughput
 * @param benchmark_func Function returning execution time in ms, or a
 *                       negative value on failure
 */
inline BenchmarkResult run_benchmark_ex(
    size_t data_size,
    std::function<double()> benchmark_func
) {
    std::vector<double> times;
    times.reserve(BENCHMARK_ITERATIONS);

    // Warmup
    for (size_t i = 0; i < WARMUP_ITERATIONS; ++i) {
        double t = benchmark_func();
        if (t < 0) return BenchmarkResult();  // Error during warmup
    }

    // Benchmark
    for (size_t i = 0; i < BENCHMARK_ITERATIONS; ++i) {
        double t = benchmark_func();
        if (t < 0) return BenchmarkResult();  // Error during benchmark
        times.push_back(t);
    }

    double avg = std::accumulate(times.begin(), times.end(), 0.0) /
                 static_cast<double>(times.size());
    double min_t = *std::min_element(times.begin(), times.end());

    return BenchmarkResult(avg, min_t, calculate_throughput(data_size, avg));
}

/**
 * @brief Print benchmark result line
 */
inline void print_result(
    const std::string& name,
    const std::string& impl,
    const BenchmarkResult& result
) {
    if (!result.valid) {
        std::cout << std::left << std::setw(25) << name
                  << std::setw(15) << impl
                  << "  (benchmark failed)" << std::endl;
        return;
    }

    std::cout << std::left << std::setw(25) << name
              << std::setw(15) << impl
              << std::right << std::fixed << std::setprecision(2)
              << std::setw(10) << result.throughput << " MB/s"
              << std::setprecision(3)
              << std::setw(10) << result.avg_ms << " ms"
              << std::endl;
}

/**
 * @brief Print throughput ratio between polymac and OpenSSL
 *
 * ratio = polymac_throughput / openssl_throughput, so a ratio above 1.0
 * means polymac is faster.
 */
inline void print_ratio(const BenchmarkResult& polymac, const BenchmarkResult& openssl) {
    if (!polymac.valid || !openssl.valid ||
        polymac.throughput <= 0 || openssl.throughput <= 0) {
        std::cout << std::left << std::setw(25) << "  ==> Ratio"
                  << std::setw(15) << ""
                  << "  (comparison not available)" << std::endl;
        return;
    }

    double ratio = polymac.throughput / openssl.throughput;
    const char* status = ratio >= 1.0 ? "FASTER" : "SLOWER";
    const char* symbol = ratio >= 1.0 ? "+" : "";
    double diff_percent = (ratio - 1.0) * 100.0;

    std::cout << std::left << std::setw(25) << "  ==> Ratio"
              << std::setw(15) << ""
              << std::right << std::fixed << std::setprecision(2)
              << std::setw(10) << ratio << "x"
              << "    (" << symbol << std::setprecision(1) << diff_percent << "% " << status << ")"
              << std::endl;
}

} // namespace polymac_bench

#endif // POLYMAC_BENCHMARK_COMMON_HPP
