/**
 * @file bench_chunk_chain.cpp
 * @brief Benchmarks for chain of custody hashing and Merkle roots
 */

#include <benchmark/benchmark.h>

#include <custody/upload/core/checksum.h>
#include <custody/upload/core/chunk_chain.h>

#include "utils/benchmark_helpers.h"

#include <string>
#include <vector>

namespace custody::upload::benchmark {

/**
 * @brief Append units to a chain (hash + link)
 */
static void BM_ChunkChain_Append(::benchmark::State& state) {
    const auto unit_size = static_cast<std::size_t>(state.range(0));
    auto data = generate_random_data(unit_size);

    chunk_chain chain;
    for (auto _ : state) {
        auto entry = chain.append(chain.size(), data);
        if (!entry) {
            state.SkipWithError("Failed to append unit");
            return;
        }
        ::benchmark::DoNotOptimize(entry.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(unit_size) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Verify the links of a chain of N entries
 */
static void BM_ChunkChain_Verify(::benchmark::State& state) {
    const auto count = static_cast<std::size_t>(state.range(0));
    auto data = generate_random_data(sizes::KB);

    chunk_chain chain;
    for (std::size_t i = 0; i < count; ++i) {
        if (!chain.append(i, data)) {
            state.SkipWithError("Failed to build chain");
            return;
        }
    }

    for (auto _ : state) {
        ::benchmark::DoNotOptimize(chain.verify_integrity());
    }

    state.SetItemsProcessed(static_cast<int64_t>(count) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Merkle root over N leaves
 */
static void BM_MerkleRoot(::benchmark::State& state) {
    const auto count = static_cast<std::size_t>(state.range(0));

    std::vector<std::string> leaves;
    leaves.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        leaves.push_back(checksum::sha256(std::to_string(i)));
    }

    for (auto _ : state) {
        auto root = compute_merkle_root(leaves);
        if (!root) {
            state.SkipWithError("Failed to compute root");
            return;
        }
        ::benchmark::DoNotOptimize(root.value());
    }

    state.SetItemsProcessed(static_cast<int64_t>(count) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_ChunkChain_Append)
    ->Arg(static_cast<int64_t>(sizes::small_unit))
    ->Arg(static_cast<int64_t>(sizes::default_unit))
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_ChunkChain_Verify)
    ->Arg(100)
    ->Arg(1000)
    ->Arg(10000)
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_MerkleRoot)
    ->Arg(16)
    ->Arg(1000)
    ->Arg(10000)
    ->Unit(::benchmark::kMicrosecond);

}  // namespace custody::upload::benchmark
