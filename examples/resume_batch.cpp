/**
 * @file resume_batch.cpp
 * @brief Interrupted batch resumed from its manifest
 *
 * This example demonstrates:
 * - Running a batch between two in-memory object stores
 * - Simulating a permanent per-object failure and a transient one
 * - Reading the CSV manifest the batch produced
 * - Re-running in resume mode so only unfinished work is repeated
 */

#include <kcenon/transfer_engine/transfer_engine.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <set>
#include <string>
#include <vector>

using namespace kcenon::transfer_engine;

namespace {

constexpr int object_count = 8;

auto object_name(int index) -> std::string {
    return "photos/img_" + std::to_string(index) + ".jpg";
}

void fill_source(memory_storage_backend& store) {
    for (int i = 0; i < object_count; ++i) {
        std::string content(static_cast<std::size_t>(4096 * (i + 1)), static_cast<char>('a' + i));
        store.put_object(object_name(i), content, {{"content-type", "image/jpeg"}});
    }
}

auto make_requests() -> std::vector<transfer_request> {
    std::vector<transfer_request> requests;
    for (int i = 0; i < object_count; ++i) {
        requests.emplace_back(object_name(i), "backup/" + object_name(i));
    }
    return requests;
}

void print_manifest(const std::filesystem::path& path) {
    auto entries = manifest_store::read_entries(path);
    if (!entries) {
        std::cerr << "Cannot read manifest: " << entries.error().describe() << std::endl;
        return;
    }
    std::cout << "Manifest " << path << " (" << entries.value().size() << " rows):" << std::endl;
    for (const auto& entry : entries.value()) {
        std::cout << "  " << std::setw(24) << std::left << entry.source << " "
                  << std::setw(6) << to_string(entry.status) << " "
                  << std::setw(8) << std::right << entry.bytes_transferred << "  "
                  << entry.description << std::endl;
    }
    std::cout << std::endl;
}

}  // namespace

int main() {
    get_logger().set_level(log_level::warn);

    auto source = std::make_shared<memory_storage_backend>();
    auto destination = std::make_shared<memory_storage_backend>();
    fill_source(*source);

    auto manifest = std::filesystem::temp_directory_path() / "transfer_engine_resume_batch.csv";
    std::error_code ec;
    std::filesystem::remove(manifest, ec);

    std::cout << "========================================" << std::endl;
    std::cout << "     Resume Batch Example" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << std::endl;

    // The first run cannot read object 5 at all, and object 2 times out
    // once before succeeding.
    std::atomic<bool> source_broken{true};
    std::atomic<int> timeouts_left{1};
    auto runner = std::make_shared<unit_runner>(source, destination);
    auto flaky = [&](const transfer_unit& unit, unit_context& ctx) -> transfer_result {
        auto now = std::chrono::system_clock::now();
        if (source_broken.load() && unit.source() == object_name(5)) {
            return transfer_result::make_error(
                unit, error(error_code::permission_denied, "access denied"), 0, now, now);
        }
        if (unit.source() == object_name(2) && timeouts_left.fetch_sub(1) > 0) {
            return transfer_result::make_error(unit, error(error_code::connection_timeout), 0,
                                               now, now);
        }
        return runner->run(unit, ctx);
    };

    retry_policy retry;
    retry.initial_delay = std::chrono::milliseconds(50);
    retry.max_delay = std::chrono::milliseconds(200);

    std::cout << "[1/2] Copying " << object_count << " objects..." << std::endl;
    {
        auto coordinator = batch_coordinator::builder(source, destination)
                               .with_max_concurrency(3)
                               .with_retry_policy(retry)
                               .with_manifest(manifest)
                               .with_unit_function(flaky)
                               .build();
        if (!coordinator) {
            std::cerr << "Error: " << coordinator.error().describe() << std::endl;
            return 1;
        }

        auto summary = coordinator.value().run(make_requests());
        if (!summary) {
            std::cerr << "Batch aborted: " << summary.error().describe() << std::endl;
            return 2;
        }
        std::cout << summary.value().format_summary() << std::endl;
    }
    print_manifest(manifest);

    // Access is restored; only the failed object is copied again.
    source_broken = false;

    std::cout << "[2/2] Resuming..." << std::endl;
    std::set<std::string> executed;
    std::mutex executed_mutex;
    auto coordinator = batch_coordinator::builder(source, destination)
                           .with_max_concurrency(3)
                           .with_retry_policy(retry)
                           .with_manifest(manifest)
                           .with_resume(true)
                           .with_unit_function(flaky)
                           .with_result_observer([&](const transfer_result& result) {
                               if (result.status != transfer_status::skipped) {
                                   std::lock_guard<std::mutex> lock(executed_mutex);
                                   executed.insert(result.unit.source());
                               }
                           })
                           .build();
    if (!coordinator) {
        std::cerr << "Error: " << coordinator.error().describe() << std::endl;
        return 1;
    }

    auto summary = coordinator.value().run(make_requests());
    if (!summary) {
        std::cerr << "Batch aborted: " << summary.error().describe() << std::endl;
        return 2;
    }
    std::cout << summary.value().format_summary() << std::endl;

    std::cout << "Objects copied during resume:";
    for (const auto& name : executed) {
        std::cout << " " << name;
    }
    std::cout << std::endl << std::endl;
    print_manifest(manifest);

    std::cout << "Destination holds " << destination->object_count() << " objects" << std::endl;
    return summary.value().exit_code();
}
