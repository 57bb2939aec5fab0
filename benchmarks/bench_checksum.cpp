/**
 * @file bench_checksum.cpp
 * @brief Benchmarks for MD5 digests used for transfer verification
 */

#include <benchmark/benchmark.h>

#include <kcenon/transfer_engine/core/checksum.h>

#include <algorithm>
#include <cstddef>
#include <random>
#include <span>
#include <vector>

namespace kcenon::transfer_engine::benchmark {

namespace {

constexpr int64_t KB = 1024;
constexpr int64_t MB = 1024 * KB;

auto random_bytes(std::size_t size) -> std::vector<std::byte> {
    std::vector<std::byte> data(size);
    std::mt19937 gen(42);
    std::uniform_int_distribution<int> dis(0, 255);
    for (auto& b : data) {
        b = static_cast<std::byte>(dis(gen));
    }
    return data;
}

}  // namespace

/**
 * @brief One-shot digest of a buffer
 */
static void BM_Checksum_MD5(::benchmark::State& state) {
    auto data = random_bytes(static_cast<std::size_t>(state.range(0)));

    for (auto _ : state) {
        auto digest = checksum::md5(std::span<const std::byte>(data));
        ::benchmark::DoNotOptimize(digest);
    }

    state.SetBytesProcessed(state.range(0) * static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Streamed digest in transfer-sized chunks
 */
static void BM_Checksum_MD5_Streamed(::benchmark::State& state) {
    const auto total = static_cast<std::size_t>(state.range(0));
    const auto chunk = static_cast<std::size_t>(state.range(1));
    auto data = random_bytes(total);

    for (auto _ : state) {
        md5_hasher hasher;
        for (std::size_t offset = 0; offset < total; offset += chunk) {
            auto len = std::min(chunk, total - offset);
            if (!hasher.update(std::span<const std::byte>(data.data() + offset, len))) {
                state.SkipWithError("md5 update failed");
                return;
            }
        }
        auto digest = hasher.finalize();
        if (!digest) {
            state.SkipWithError("md5 finalize failed");
            return;
        }
        ::benchmark::DoNotOptimize(digest.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(total) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_Checksum_MD5)
    ->Arg(1 * KB)
    ->Arg(64 * KB)
    ->Arg(1 * MB)
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_Checksum_MD5_Streamed)
    ->Args({8 * MB, 64 * KB})
    ->Args({8 * MB, 256 * KB})
    ->Args({8 * MB, 1 * MB})
    ->Unit(::benchmark::kMillisecond);

}  // namespace kcenon::transfer_engine::benchmark
