/**
 * @file bench_block_assembly.cpp
 * @brief Benchmarks for unit buffering, block assembly and part digests
 */

#include <benchmark/benchmark.h>

#include <custody/upload/core/checksum.h>
#include <custody/upload/session/chunk_accumulator.h>
#include <custody/upload/session/upload_session.h>

#include "utils/benchmark_helpers.h"

#include <memory>
#include <string>

namespace custody::upload::benchmark {

namespace {

/**
 * @brief Backend that grants every request immediately
 */
class null_upload_api : public upload_api {
public:
    auto start(const std::string& capture_id, const std::string&)
        -> result<start_response> override {
        return start_response{"bench-session", capture_id, "bench/" + capture_id};
    }

    auto negotiate_part(const negotiate_request& request)
        -> result<negotiate_response> override {
        negotiate_response response;
        response.authorization_url =
            "https://bench.invalid/part-" + std::to_string(request.part_number);
        return response;
    }

    auto complete(const complete_request&) -> result<complete_response> override {
        return complete_response{"https://bench.invalid/object", "bench/object"};
    }

    auto cancel(const std::string&, const std::string&) -> result<void> override {
        return {};
    }
};

/**
 * @brief Transport that accepts bytes without sending them
 */
class null_part_transport : public part_transport {
public:
    auto put(const std::string&, std::span<const std::byte>, const http_headers&)
        -> result<http_response> override {
        http_response response;
        response.status_code = 200;
        response.headers["ETag"] = "\"bench\"";
        return response;
    }
};

}  // namespace

/**
 * @brief Buffer units until the threshold, then assemble one block
 */
static void BM_Accumulator_AssembleBlock(::benchmark::State& state) {
    const auto unit_size = static_cast<std::size_t>(state.range(0));
    const auto units_per_block = (min_part_size + unit_size - 1) / unit_size;

    auto data = generate_random_data(unit_size);
    auto hash = checksum::sha256(data);

    for (auto _ : state) {
        chunk_accumulator accumulator;
        for (std::size_t i = 0; i < units_per_block; ++i) {
            accumulator.add(pending_unit{data, hash, std::nullopt});
        }

        auto block = chunk_accumulator::assemble(accumulator.drain());
        if (!block) {
            state.SkipWithError("Failed to assemble block");
            return;
        }
        ::benchmark::DoNotOptimize(block.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(unit_size * units_per_block) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief SHA-256 hex digest of a part
 */
static void BM_Checksum_SHA256(::benchmark::State& state) {
    auto data = generate_random_data(static_cast<std::size_t>(state.range(0)));

    for (auto _ : state) {
        auto hash = checksum::sha256(data);
        ::benchmark::DoNotOptimize(hash);
    }

    state.SetBytesProcessed(static_cast<int64_t>(data.size()) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Base64 SHA-256 digest sent in the checksum header
 */
static void BM_Checksum_SHA256_Base64(::benchmark::State& state) {
    auto data = generate_random_data(static_cast<std::size_t>(state.range(0)));

    for (auto _ : state) {
        auto digest = checksum::sha256_base64(data);
        ::benchmark::DoNotOptimize(digest);
    }

    state.SetBytesProcessed(static_cast<int64_t>(data.size()) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Session overhead per part with a backend that does no I/O
 */
static void BM_Session_AddUnitThroughput(::benchmark::State& state) {
    const auto unit_size = static_cast<std::size_t>(state.range(0));
    auto data = generate_random_data(unit_size);
    auto hash = checksum::sha256(data);

    auto built = upload_session::builder()
                     .with_api(std::make_shared<null_upload_api>())
                     .with_transport(std::make_shared<null_part_transport>())
                     .build();
    if (!built) {
        state.SkipWithError("Failed to build session");
        return;
    }
    auto& session = built.value();
    if (!session.initiate("bench-capture")) {
        state.SkipWithError("Failed to initiate session");
        return;
    }

    for (auto _ : state) {
        if (!session.add_unit(data, hash, std::nullopt)) {
            state.SkipWithError("Failed to add unit");
            return;
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(unit_size) *
                            static_cast<int64_t>(state.iterations()));
}

// Block assembly benchmarks
BENCHMARK(BM_Accumulator_AssembleBlock)
    ->Arg(static_cast<int64_t>(sizes::small_unit))
    ->Arg(static_cast<int64_t>(sizes::default_unit))
    ->Arg(static_cast<int64_t>(sizes::large_unit))
    ->Unit(::benchmark::kMillisecond);

// SHA-256 benchmarks
BENCHMARK(BM_Checksum_SHA256)
    ->Arg(static_cast<int64_t>(sizes::small_unit))
    ->Arg(static_cast<int64_t>(sizes::default_unit))
    ->Arg(static_cast<int64_t>(min_part_size))
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_Checksum_SHA256_Base64)
    ->Arg(static_cast<int64_t>(sizes::default_unit))
    ->Arg(static_cast<int64_t>(min_part_size))
    ->Unit(::benchmark::kMicrosecond);

// Session benchmarks
BENCHMARK(BM_Session_AddUnitThroughput)
    ->Arg(static_cast<int64_t>(sizes::small_unit))
    ->Arg(static_cast<int64_t>(sizes::default_unit))
    ->Unit(::benchmark::kMicrosecond);

}  // namespace custody::upload::benchmark
