/**
 * @file bench_progress_reporter.cpp
 * @brief Benchmarks for contended progress reporting
 */

#include <benchmark/benchmark.h>

#include <kcenon/transfer_engine/progress/progress_reporter.h>

#include <chrono>
#include <thread>
#include <vector>

namespace kcenon::transfer_engine::benchmark {

/**
 * @brief Per-chunk reports from N workers while the ticker aggregates
 */
static void BM_ProgressReporter_ContendedReports(::benchmark::State& state) {
    const auto workers = static_cast<int>(state.range(0));
    constexpr uint64_t reports_per_worker = 10000;
    constexpr uint64_t unit_size = reports_per_worker * 256 * 1024;

    for (auto _ : state) {
        progress_config config;
        config.tick_interval = std::chrono::milliseconds(10);
        progress_reporter reporter(config);
        if (!reporter.start()) {
            state.SkipWithError("cannot start reporter");
            return;
        }

        std::vector<std::thread> threads;
        for (int w = 0; w < workers; ++w) {
            unit_id id{static_cast<uint64_t>(w)};
            reporter.register_unit(id, unit_size);
            threads.emplace_back([&reporter, id] {
                for (uint64_t i = 1; i <= reports_per_worker; ++i) {
                    reporter.report(id, i * 256 * 1024, unit_size);
                }
                reporter.complete_unit(id, transfer_status::ok, unit_size);
            });
        }
        for (auto& t : threads) {
            t.join();
        }
        reporter.stop();
        auto final_snapshot = reporter.snapshot();
        ::benchmark::DoNotOptimize(final_snapshot);
    }

    state.SetItemsProcessed(static_cast<int64_t>(workers) *
                            static_cast<int64_t>(reports_per_worker) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Snapshot cost with many registered units
 */
static void BM_ProgressReporter_Snapshot(::benchmark::State& state) {
    const auto units = static_cast<uint64_t>(state.range(0));

    progress_config config;
    config.tick_interval = std::chrono::milliseconds(60000);
    progress_reporter reporter(config);
    for (uint64_t u = 0; u < units; ++u) {
        reporter.register_unit(unit_id{u}, 1024);
        reporter.report(unit_id{u}, 512);
    }

    for (auto _ : state) {
        auto snap = reporter.snapshot();
        ::benchmark::DoNotOptimize(snap);
    }
}

BENCHMARK(BM_ProgressReporter_ContendedReports)
    ->Arg(1)
    ->Arg(4)
    ->Arg(16)
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

BENCHMARK(BM_ProgressReporter_Snapshot)
    ->Arg(100)
    ->Arg(10000)
    ->Unit(::benchmark::kMicrosecond);

}  // namespace kcenon::transfer_engine::benchmark
