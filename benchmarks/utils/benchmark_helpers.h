/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef CUSTODY_UPLOAD_BENCHMARKS_BENCHMARK_HELPERS_H
#define CUSTODY_UPLOAD_BENCHMARKS_BENCHMARK_HELPERS_H

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

namespace custody::upload::benchmark {

/**
 * @brief Generate random binary data
 * @param size Size in bytes
 * @param seed Random seed
 */
inline auto generate_random_data(std::size_t size, uint32_t seed = 42)
    -> std::vector<std::byte> {
    std::vector<std::byte> data(size);
    std::mt19937 gen(seed);
    std::uniform_int_distribution<int> dis(0, 255);
    for (auto& byte : data) {
        byte = static_cast<std::byte>(dis(gen));
    }
    return data;
}

/**
 * @brief Size constants for benchmarks
 */
namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;

// Typical captured unit sizes
constexpr std::size_t small_unit = 64 * KB;
constexpr std::size_t default_unit = 1 * MB;
constexpr std::size_t large_unit = 4 * MB;
}  // namespace sizes

}  // namespace custody::upload::benchmark

#endif  // CUSTODY_UPLOAD_BENCHMARKS_BENCHMARK_HELPERS_H
