/**
 * @file bench_manifest_append.cpp
 * @brief Benchmarks for durable manifest appends and resume loading
 */

#include <benchmark/benchmark.h>

#include <kcenon/transfer_engine/core/logging.h>
#include <kcenon/transfer_engine/manifest/manifest_store.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace kcenon::transfer_engine::benchmark {

namespace {

/**
 * @brief Owns a scratch manifest path for one benchmark run
 */
class scratch_manifest {
public:
    scratch_manifest() {
        dir_ = std::filesystem::temp_directory_path() /
               ("transfer_engine_bench_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(dir_);
        get_logger().set_level(log_level::error);
    }

    ~scratch_manifest() {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    scratch_manifest(const scratch_manifest&) = delete;
    scratch_manifest& operator=(const scratch_manifest&) = delete;

    [[nodiscard]] auto path() const -> std::filesystem::path { return dir_ / "manifest.csv"; }

private:
    std::filesystem::path dir_;
};

auto sample_entry(int index) -> manifest_entry {
    manifest_entry entry;
    entry.source = "s3://bucket/photos/2025/img_" + std::to_string(index) + ".jpg";
    entry.destination = "/backup/photos/2025/img_" + std::to_string(index) + ".jpg";
    entry.start_time = std::chrono::system_clock::now();
    entry.end_time = entry.start_time;
    entry.md5 = "9e107d9d372bb6826bd81d3542a419d6";
    entry.source_size = 1048576;
    entry.bytes_transferred = 1048576;
    entry.status = transfer_status::ok;
    return entry;
}

}  // namespace

/**
 * @brief Row serialization without I/O
 */
static void BM_Manifest_FormatRow(::benchmark::State& state) {
    auto entry = sample_entry(7);
    entry.description = "range=0-8388608; retries=2";

    for (auto _ : state) {
        auto row = entry.to_csv_row();
        ::benchmark::DoNotOptimize(row);
    }
}

/**
 * @brief Appends from N threads, each row written and fsynced
 */
static void BM_Manifest_Append(::benchmark::State& state) {
    const auto threads = static_cast<int>(state.range(0));
    constexpr int rows_per_thread = 16;

    scratch_manifest scratch;
    auto store = manifest_store::open(scratch.path());
    if (!store) {
        state.SkipWithError("cannot open manifest");
        return;
    }
    auto& manifest = *store.value();

    for (auto _ : state) {
        std::vector<std::thread> writers;
        std::atomic<bool> failed{false};
        for (int t = 0; t < threads; ++t) {
            writers.emplace_back([&manifest, &failed, t] {
                for (int i = 0; i < rows_per_thread; ++i) {
                    if (!manifest.append(sample_entry(t * rows_per_thread + i))) {
                        failed = true;
                    }
                }
            });
        }
        for (auto& w : writers) {
            w.join();
        }
        if (failed) {
            state.SkipWithError("append failed");
            return;
        }
    }

    state.SetItemsProcessed(static_cast<int64_t>(threads) * rows_per_thread *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Building the resume set from an existing manifest
 */
static void BM_Manifest_LoadCompleted(::benchmark::State& state) {
    const auto rows = static_cast<int>(state.range(0));

    scratch_manifest scratch;
    {
        auto store = manifest_store::open(scratch.path());
        if (!store) {
            state.SkipWithError("cannot open manifest");
            return;
        }
        for (int i = 0; i < rows; ++i) {
            if (!store.value()->append(sample_entry(i))) {
                state.SkipWithError("append failed");
                return;
            }
        }
    }

    for (auto _ : state) {
        auto completed = manifest_store::load_completed(scratch.path());
        if (!completed) {
            state.SkipWithError("load failed");
            return;
        }
        ::benchmark::DoNotOptimize(completed.value());
    }

    state.SetItemsProcessed(static_cast<int64_t>(rows) * static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_Manifest_FormatRow);

BENCHMARK(BM_Manifest_Append)
    ->Arg(1)
    ->Arg(4)
    ->Arg(16)
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

BENCHMARK(BM_Manifest_LoadCompleted)
    ->Arg(1000)
    ->Arg(10000)
    ->Unit(::benchmark::kMillisecond);

}  // namespace kcenon::transfer_engine::benchmark
