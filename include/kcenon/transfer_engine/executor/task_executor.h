/**
 * @file task_executor.h
 * @brief Bounded-concurrency execution of transfer units with retries
 */

#ifndef KCENON_TRANSFER_ENGINE_EXECUTOR_TASK_EXECUTOR_H
#define KCENON_TRANSFER_ENGINE_EXECUTOR_TASK_EXECUTOR_H

#include <kcenon/transfer_engine/core/cancellation_token.h>
#include <kcenon/transfer_engine/core/transfer_unit.h>
#include <kcenon/transfer_engine/core/types.h>
#include <kcenon/transfer_engine/core/unit_runner.h>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>

namespace kcenon::transfer_engine {

class manifest_store;
class progress_reporter;

/**
 * @brief Exponential backoff between attempts of a unit
 */
struct retry_policy {
    uint32_t max_retries = 3;
    std::chrono::milliseconds initial_delay{1000};
    std::chrono::milliseconds max_delay{32000};
    double backoff_multiplier = 2.0;

    /**
     * @brief Delay before the given retry (1 = first retry)
     */
    [[nodiscard]] auto delay_for(uint32_t retry) const -> std::chrono::milliseconds {
        if (retry == 0) {
            return std::chrono::milliseconds{0};
        }
        auto delay = static_cast<double>(initial_delay.count());
        for (uint32_t i = 1; i < retry; ++i) {
            delay *= backoff_multiplier;
            if (delay >= static_cast<double>(max_delay.count())) {
                return max_delay;
            }
        }
        auto capped = std::min(delay, static_cast<double>(max_delay.count()));
        return std::chrono::milliseconds{static_cast<int64_t>(capped)};
    }

    [[nodiscard]] auto validate() const -> result<void> {
        if (initial_delay.count() < 0 || max_delay.count() < 0) {
            return unexpected(
                error(error_code::invalid_configuration, "retry delays must not be negative"));
        }
        if (max_delay < initial_delay) {
            return unexpected(error(error_code::invalid_configuration,
                                    "maximum retry delay is below the initial delay"));
        }
        if (backoff_multiplier < 1.0) {
            return unexpected(
                error(error_code::invalid_configuration, "backoff multiplier must be >= 1"));
        }
        return {};
    }
};

/**
 * @brief Predicate over a unit error
 */
using error_classifier = std::function<bool(const error&)>;

/**
 * @brief Executes one attempt of a unit
 */
using unit_function = std::function<transfer_result(const transfer_unit&, unit_context&)>;

/**
 * @brief Receives every terminal result exactly once
 */
using result_observer = std::function<void(const transfer_result&)>;

/**
 * @brief Configuration for the task executor
 */
struct executor_config {
    /// Maximum number of units executing at once
    std::size_t max_concurrency = 4;

    retry_policy retry;

    /// Errors worth another attempt (default: transient error codes)
    error_classifier retryable_classifier;

    /// Errors that cancel the whole batch (default: batch-fatal error codes)
    error_classifier fatal_classifier;

    /// Queue bound; submit() blocks while full (0 = unbounded)
    std::size_t max_pending = 0;

    [[nodiscard]] auto validate() const -> result<void> {
        if (max_concurrency == 0) {
            return unexpected(
                error(error_code::invalid_configuration, "max_concurrency must be positive"));
        }
        return retry.validate();
    }
};

/**
 * @brief Where terminal results go, in this order
 */
struct executor_sinks {
    std::shared_ptr<manifest_store> manifest;
    std::shared_ptr<progress_reporter> progress;
    result_observer on_result;
};

/**
 * @brief Executor counters
 */
struct executor_statistics {
    uint64_t submitted = 0;
    uint64_t completed = 0;
    uint64_t retried = 0;        ///< Attempts repeated after a retryable error
    uint64_t dropped = 0;        ///< Queued units discarded by cancellation
    uint64_t ok = 0;
    uint64_t skipped = 0;
    uint64_t failed = 0;
    uint64_t bytes_transferred = 0;
    std::size_t executing = 0;
    std::size_t peak_executing = 0;
};

/**
 * @brief Runs transfer units on a bounded worker pool
 *
 * - never more than max_concurrency units execute at once
 * - a unit identity is never executed twice concurrently; a duplicate
 *   submission waits in the queue until the running one has finished
 * - retryable errors are retried with exponential backoff on the same
 *   worker, which keeps the identity reserved while it waits
 * - each terminal result is forwarded once: manifest, then progress, then
 *   the observer; a manifest failure cancels the batch
 * - a fatal error cancels the batch; queued units are dropped and running
 *   units stop at their next chunk boundary
 *
 * @code
 * executor_config config;
 * config.max_concurrency = 8;
 *
 * auto executor = task_executor::create(config,
 *     [&](const transfer_unit& unit, unit_context& ctx) {
 *         return runner.run(unit, ctx);
 *     });
 * if (!executor) {
 *     return unexpected(executor.error());
 * }
 * for (auto& unit : units) {
 *     executor.value()->submit(std::move(unit));
 * }
 * executor.value()->close();
 * auto finished = executor.value()->wait();
 * @endcode
 */
class task_executor {
public:
    /**
     * @brief Validate the configuration and start the workers
     */
    [[nodiscard]] static auto create(executor_config config, unit_function execute,
                                     executor_sinks sinks = {})
        -> result<std::unique_ptr<task_executor>>;

    /**
     * @brief Cancels outstanding work and joins the workers
     */
    ~task_executor();

    task_executor(const task_executor&) = delete;
    auto operator=(const task_executor&) -> task_executor& = delete;
    task_executor(task_executor&&) = delete;
    auto operator=(task_executor&&) -> task_executor& = delete;

    /**
     * @brief Queue a unit
     *
     * Blocks while the queue is at max_pending.
     *
     * @return The id used for progress events, or executor_closed after
     *         close() or cancel()
     */
    [[nodiscard]] auto submit(transfer_unit unit) -> result<unit_id>;

    /**
     * @brief Signal end of input; workers exit once the queue drains
     */
    void close();

    /**
     * @brief Close, drain and join the workers
     * @return The first fatal error, if any
     */
    [[nodiscard]] auto wait() -> result<void>;

    /**
     * @brief Stop the batch
     *
     * Queued units are dropped. Running units observe the token and finish
     * with an error. The first reason given wins.
     */
    void cancel(error reason = error(error_code::transfer_cancelled));

    [[nodiscard]] auto is_cancelled() const -> bool;

    [[nodiscard]] auto cancellation() const -> cancellation_token;

    [[nodiscard]] auto statistics() const -> executor_statistics;

    [[nodiscard]] auto config() const -> const executor_config&;

private:
    task_executor(executor_config config, unit_function execute, executor_sinks sinks);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::transfer_engine

#endif  // KCENON_TRANSFER_ENGINE_EXECUTOR_TASK_EXECUTOR_H
