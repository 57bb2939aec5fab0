/**
 * @file batch_coordinator.h
 * @brief Drives a batch of transfer requests to completion
 */

#ifndef KCENON_TRANSFER_ENGINE_BATCH_BATCH_COORDINATOR_H
#define KCENON_TRANSFER_ENGINE_BATCH_BATCH_COORDINATOR_H

#include <kcenon/transfer_engine/backend/storage_backend.h>
#include <kcenon/transfer_engine/core/range_splitter.h>
#include <kcenon/transfer_engine/core/transfer_unit.h>
#include <kcenon/transfer_engine/core/types.h>
#include <kcenon/transfer_engine/core/unit_runner.h>
#include <kcenon/transfer_engine/executor/task_executor.h>
#include <kcenon/transfer_engine/progress/progress_reporter.h>

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::transfer_engine {

/**
 * @brief One (source, destination) pair requested by the caller
 */
struct transfer_request {
    std::string source;
    std::string destination;
    std::optional<uint64_t> expected_size;
    std::optional<std::string> content_hash;
    metadata_map metadata;

    /// Pre-split range; the coordinator does not split such requests again
    std::optional<byte_range> range;

    transfer_request() = default;

    transfer_request(std::string src, std::string dst)
        : source(std::move(src)), destination(std::move(dst)) {}
};

/**
 * @brief Pull-style request stream; nullopt marks the end
 */
using request_source = std::function<std::optional<transfer_request>()>;

/**
 * @brief Complete configuration of a batch
 */
struct batch_config {
    executor_config executor;
    runner_config runner;
    progress_config progress;

    /// Display hook for progress snapshots
    progress_callback on_progress;

    /// Receives every terminal unit result, including resumed skips
    result_observer on_result;

    /// Manifest file; no manifest is written when absent
    std::optional<std::filesystem::path> manifest_path;

    /// Elide units the manifest records as completed
    bool resume = false;

    /// Split large sources into byte ranges
    std::optional<range_split_policy> split;

    [[nodiscard]] auto validate() const -> result<void> {
        if (auto r = executor.validate(); !r) return r;
        if (auto r = runner.validate(); !r) return r;
        if (auto r = progress.validate(); !r) return r;
        if (split) {
            if (auto r = split->validate(); !r) return r;
        }
        if (resume && !manifest_path) {
            return unexpected(
                error(error_code::invalid_configuration, "resume requires a manifest path"));
        }
        return {};
    }
};

/**
 * @brief A unit that ended in error
 */
struct failed_transfer {
    std::string source;
    std::string destination;
    std::optional<byte_range> range;
    error err;
    uint32_t retries = 0;
};

/**
 * @brief Outcome of a batch that ran to completion or was cancelled
 */
struct batch_summary {
    uint64_t total_units = 0;
    uint64_t ok = 0;
    uint64_t skipped = 0;          ///< Includes units elided by resume
    uint64_t resumed = 0;          ///< Units elided because the manifest had them
    uint64_t errors = 0;
    uint64_t not_started = 0;      ///< Dropped by cancellation before running
    uint64_t retries = 0;
    uint64_t bytes_transferred = 0;
    uint64_t assembled = 0;        ///< Split objects verified after all ranges landed
    std::chrono::milliseconds duration{0};
    bool cancelled = false;
    std::vector<failed_transfer> failures;

    /**
     * @brief Process exit code: 0 only when nothing failed or was left out
     */
    [[nodiscard]] auto exit_code() const -> int {
        return errors == 0 && not_started == 0 && !cancelled ? 0 : 1;
    }

    [[nodiscard]] auto all_succeeded() const -> bool { return exit_code() == 0; }

    /**
     * @brief Multi-line report listing failed pairs with their error detail
     */
    [[nodiscard]] auto format_summary() const -> std::string;
};

/**
 * @brief Batch driver
 *
 * Turns requests into units (splitting large objects when configured),
 * elides completed work in resume mode, and runs the rest on a
 * task_executor with manifest and progress attached. Once every range
 * of a split object succeeded, the assembled object is checked for size
 * and content hash and recorded as one more manifest row.
 *
 * Errors for individual units are recorded in the summary and the
 * manifest. Batch-fatal errors (backend probe, authentication,
 * unreachable destination, manifest corrupt or unwritable) cancel the
 * batch and are returned as an error.
 *
 * @code
 * auto coordinator = batch_coordinator::builder(source, destination)
 *     .with_max_concurrency(8)
 *     .with_manifest("/var/tmp/copy.csv")
 *     .with_resume(true)
 *     .build();
 * if (!coordinator) {
 *     return unexpected(coordinator.error());
 * }
 *
 * auto summary = coordinator.value().run(requests);
 * if (summary) {
 *     std::cout << summary.value().format_summary();
 * }
 * @endcode
 */
class batch_coordinator {
public:
    /**
     * @brief Fluent construction with validation
     */
    class builder {
    public:
        builder(std::shared_ptr<storage_backend> source,
                std::shared_ptr<storage_backend> destination);

        auto with_config(batch_config config) -> builder&;

        auto with_max_concurrency(std::size_t workers) -> builder&;

        auto with_retry_policy(retry_policy policy) -> builder&;

        auto with_max_pending(std::size_t limit) -> builder&;

        auto with_manifest(std::filesystem::path path) -> builder&;

        auto with_resume(bool enable) -> builder&;

        auto with_range_split(range_split_policy policy) -> builder&;

        auto with_chunk_size(std::size_t size) -> builder&;

        auto with_checksum_verification(bool enable) -> builder&;

        auto with_no_clobber(bool enable) -> builder&;

        auto with_progress_callback(progress_callback callback) -> builder&;

        auto with_progress_interval(std::chrono::milliseconds interval) -> builder&;

        auto with_result_observer(result_observer observer) -> builder&;

        /**
         * @brief Replace unit execution (the unit_runner by default)
         */
        auto with_unit_function(unit_function execute) -> builder&;

        [[nodiscard]] auto build() -> result<batch_coordinator>;

    private:
        std::shared_ptr<storage_backend> source_;
        std::shared_ptr<storage_backend> destination_;
        batch_config config_;
        unit_function execute_;
    };

    batch_coordinator(batch_coordinator&&) noexcept;
    auto operator=(batch_coordinator&&) noexcept -> batch_coordinator&;
    ~batch_coordinator();

    batch_coordinator(const batch_coordinator&) = delete;
    auto operator=(const batch_coordinator&) -> batch_coordinator& = delete;

    /**
     * @brief Run a batch from a list of requests
     */
    [[nodiscard]] auto run(const std::vector<transfer_request>& requests)
        -> result<batch_summary>;

    /**
     * @brief Run a batch from a request stream consumed as it is produced
     *
     * An exception thrown by the stream stops the batch with internal_error.
     */
    [[nodiscard]] auto run(request_source next) -> result<batch_summary>;

    /**
     * @brief Stop the running batch (user interrupt)
     *
     * The current run() returns a summary with cancelled set. Called
     * while no batch is running, it cancels the next run() up front.
     */
    void cancel();

    [[nodiscard]] auto config() const -> const batch_config&;

private:
    batch_coordinator(batch_config config, std::shared_ptr<storage_backend> source,
                      std::shared_ptr<storage_backend> destination, unit_function execute);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::transfer_engine

#endif  // KCENON_TRANSFER_ENGINE_BATCH_BATCH_COORDINATOR_H
