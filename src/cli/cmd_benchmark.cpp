/**
 * @file cmd_benchmark.cpp
 * @brief Benchmark subcommand implementation for polymac CLI
 *
 * Runs the polymac vs OpenSSL Poly1305 benchmark
 *
 * Usage:
 *   polymac benchmark
 *
 * @author polymac Development Team
 * @date 2026-10-19
 */

#include <iostream>
#include <string>
#include <cstdlib>
#include <filesystem>

/**
 * @brief Print benchmark subcommand help
 */
void print_benchmark_help() {
    std::cout << "\nUsage: polymac benchmark [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --help         Show this help message\n\n";
    std::cout << "Description:\n";
    std::cout << "  Measures Poly1305 throughput of polymac against OpenSSL\n";
    std::cout << "  and cross-checks that both produce identical tags.\n\n";
    std::cout << "  Test data sizes: 1KB, 64KB, 1MB\n";
    std::cout << "  Iterations: 100 (warmup: 10)\n\n";
}

#ifdef POLYMAC_BENCHMARK_HAS_OPENSSL
/**
 * @brief Find benchmark executable path relative to CLI
 */
static std::string find_benchmark_executable(const char* program) {
    namespace fs = std::filesystem;

    std::error_code ec;
    fs::path exe_dir = fs::absolute(program, ec).parent_path();
    if (ec) {
        return "";
    }

    // Same directory as the CLI
    fs::path benchmark_path = exe_dir / "polymac_benchmark";
    if (fs::exists(benchmark_path, ec)) {
        return benchmark_path.string();
    }

    // Build tree layout
    benchmark_path = exe_dir / "bin" / "polymac_benchmark";
    if (fs::exists(benchmark_path, ec)) {
        return benchmark_path.string();
    }

    return "";
}
#endif

/**
 * @brief Benchmark subcommand handler
 *
 * @param program Path the CLI was started with, used to locate the
 *                benchmark executable
 */
int cmd_benchmark(int argc, char* argv[], const char* program) {
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        if (arg == "--help" || arg == "-h") {
            print_benchmark_help();
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_benchmark_help();
            return 1;
        }
    }

#ifdef POLYMAC_BENCHMARK_HAS_OPENSSL
    std::cout << "\nRunning polymac vs OpenSSL Poly1305 Benchmark...\n\n";

    std::string benchmark_exe = find_benchmark_executable(program);
    if (benchmark_exe.empty()) {
        std::cerr << "Error: Benchmark executable not found\n";
        std::cerr << "Make sure polymac_benchmark is in the same directory as polymac\n";
        return 1;
    }

    int status = std::system(benchmark_exe.c_str());
    return status == 0 ? 0 : 1;
#else
    (void)program;
    std::cerr << "Error: Benchmarks not available - OpenSSL not found during build\n";
    std::cerr << "Rebuild with POLYMAC_BUILD_BENCHMARKS=ON and OpenSSL available\n";
    return 1;
#endif
}
