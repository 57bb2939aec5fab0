/**
 * @file progress_reporter.h
 * @brief Aggregated batch progress with its own ticker thread
 */

#ifndef KCENON_TRANSFER_ENGINE_PROGRESS_PROGRESS_REPORTER_H
#define KCENON_TRANSFER_ENGINE_PROGRESS_PROGRESS_REPORTER_H

#include <kcenon/transfer_engine/core/statistics_collector.h>
#include <kcenon/transfer_engine/core/transfer_unit.h>
#include <kcenon/transfer_engine/core/types.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace kcenon::transfer_engine {

/**
 * @brief Configuration for progress aggregation
 */
struct progress_config {
    /// Aggregation and display interval
    std::chrono::milliseconds tick_interval{500};

    /// Log a status line at info level on every tick
    bool log_progress = false;

    /// Statistics window used for rate and ETA
    statistics_collector::config statistics;

    [[nodiscard]] auto validate() const -> result<void> {
        if (tick_interval.count() <= 0) {
            return unexpected(
                error(error_code::invalid_configuration, "tick interval must be positive"));
        }
        if (statistics.rate_window_size == 0) {
            return unexpected(
                error(error_code::invalid_configuration, "rate window must not be empty"));
        }
        return {};
    }
};

/**
 * @brief Aggregate view of a running batch
 */
struct progress_snapshot {
    uint64_t bytes_transferred = 0;     ///< Completed plus in-flight bytes
    uint64_t completed_bytes = 0;       ///< Bytes folded from finished units
    std::optional<uint64_t> total_bytes;  ///< Known only when every unit has a total
    std::size_t registered_units = 0;
    std::size_t in_flight_units = 0;
    std::size_t completed_units = 0;
    uint64_t units_ok = 0;
    uint64_t units_skipped = 0;
    uint64_t units_failed = 0;
    double current_rate = 0.0;          ///< bytes/sec
    double average_rate = 0.0;          ///< bytes/sec
    std::chrono::milliseconds elapsed{0};
    std::optional<std::chrono::milliseconds> estimated_remaining;

    [[nodiscard]] auto completion_percentage() const -> std::optional<double> {
        if (!total_bytes) return std::nullopt;
        if (*total_bytes == 0) return completed_units == registered_units ? 100.0 : 0.0;
        auto percent = static_cast<double>(bytes_transferred) /
                       static_cast<double>(*total_bytes) * 100.0;
        return percent > 100.0 ? 100.0 : percent;
    }

    [[nodiscard]] auto remaining_units() const -> std::size_t {
        return registered_units > completed_units ? registered_units - completed_units : 0;
    }
};

/**
 * @brief Display hook invoked on the ticker thread
 */
using progress_callback = std::function<void(const progress_snapshot&)>;

/**
 * @brief Collects per-unit byte counts and publishes batch progress
 *
 * report() only stores the latest count for the unit under a short lock;
 * the ticker thread folds pending events into the aggregate. Counts for a
 * unit never move backwards, so a retried unit restarting from zero does not
 * lower the batch total. The aggregate is monotonic.
 *
 * @code
 * progress_reporter reporter(progress_config{}, [](const progress_snapshot& s) {
 *     std::cerr << format_progress_line(s) << "\r";
 * });
 * reporter.start();
 * reporter.register_unit(id, 1024);
 * reporter.report(id, 512, 1024);
 * reporter.complete_unit(id, transfer_status::ok, 1024);
 * reporter.stop();
 * @endcode
 */
class progress_reporter {
public:
    explicit progress_reporter(progress_config config = {}, progress_callback callback = {});

    ~progress_reporter();

    progress_reporter(const progress_reporter&) = delete;
    auto operator=(const progress_reporter&) -> progress_reporter& = delete;
    progress_reporter(progress_reporter&&) = delete;
    auto operator=(progress_reporter&&) -> progress_reporter& = delete;

    /**
     * @brief Start the ticker thread
     * @return already_running when running
     */
    [[nodiscard]] auto start() -> result<void>;

    /**
     * @brief Stop the ticker, fold remaining events and publish a final snapshot
     */
    void stop();

    [[nodiscard]] auto is_running() const -> bool;

    /**
     * @brief Announce a unit and its expected size (nullopt when unknown)
     */
    void register_unit(unit_id id, std::optional<uint64_t> total);

    /**
     * @brief Record the cumulative byte count of one unit
     *
     * Never blocks on aggregation; later events for the same unit replace
     * earlier ones until the next tick.
     */
    void report(unit_id id, uint64_t bytes_so_far, std::optional<uint64_t> total = std::nullopt);

    /**
     * @brief Fold a finished unit into the completed accumulator
     */
    void complete_unit(unit_id id, transfer_status status, uint64_t final_bytes);

    /**
     * @brief Aggregate pending events and return the current view
     */
    [[nodiscard]] auto snapshot() const -> progress_snapshot;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Render bytes with a binary unit, e.g. "1.50 MiB"
 */
[[nodiscard]] auto format_bytes(uint64_t bytes) -> std::string;

/**
 * @brief Render a duration as HH:MM:SS
 */
[[nodiscard]] auto format_duration(std::chrono::milliseconds value) -> std::string;

/**
 * @brief Human-readable status line for a snapshot
 *
 * Example: "Completed 12.00 MiB/40.00 MiB (30.0%) with 3 unit(s) remaining,
 * 4.00 MiB/s, ETA 00:00:07"
 */
[[nodiscard]] auto format_progress_line(const progress_snapshot& snapshot) -> std::string;

}  // namespace kcenon::transfer_engine

#endif  // KCENON_TRANSFER_ENGINE_PROGRESS_PROGRESS_REPORTER_H
