/**
 * @file statistics_collector.h
 * @brief Throughput statistics for batch progress monitoring
 *
 * Tracks aggregate batch progress and derives transfer rate and ETA from a
 * moving window of samples.
 */

#ifndef KCENON_TRANSFER_ENGINE_CORE_STATISTICS_COLLECTOR_H
#define KCENON_TRANSFER_ENGINE_CORE_STATISTICS_COLLECTOR_H

#include <kcenon/transfer_engine/core/transfer_unit.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>

namespace kcenon::transfer_engine {

using duration = std::chrono::milliseconds;

/**
 * @brief Statistics collector for batch progress monitoring
 *
 * Thread-safe. Fed with the aggregate byte count by the progress reporter;
 * computes the current (windowed) and average rate and an ETA when the batch
 * total is known.
 *
 * @code
 * statistics_collector stats;
 * stats.start(total_bytes);
 *
 * // On every aggregation tick
 * stats.record_progress(bytes_so_far);
 *
 * auto rate = stats.get_transfer_rate();
 * auto eta = stats.get_eta();
 * @endcode
 */
class statistics_collector {
public:
    /**
     * @brief Configuration for statistics collection
     */
    struct config {
        std::size_t rate_window_size = 10;      ///< Number of samples for moving average
        duration rate_sample_interval{100};     ///< Interval between rate samples
        duration min_eta_update_interval{500};  ///< Minimum interval between ETA updates
    };

    /**
     * @brief Snapshot of current statistics
     */
    struct snapshot {
        uint64_t bytes_transferred = 0;
        std::optional<uint64_t> total_bytes;
        uint64_t units_ok = 0;
        uint64_t units_skipped = 0;
        uint64_t units_failed = 0;
        double current_rate = 0.0;              ///< bytes/sec over the sample window
        double average_rate = 0.0;              ///< bytes/sec since start
        duration elapsed{0};
        std::optional<duration> estimated_remaining;
    };

    statistics_collector();

    explicit statistics_collector(config cfg);

    statistics_collector(const statistics_collector&) = delete;
    auto operator=(const statistics_collector&) -> statistics_collector& = delete;
    statistics_collector(statistics_collector&&) noexcept;
    auto operator=(statistics_collector&&) noexcept -> statistics_collector&;

    ~statistics_collector();

    /**
     * @brief Start statistics collection
     * @param total_bytes Batch total when known
     */
    void start(std::optional<uint64_t> total_bytes = std::nullopt);

    void stop();

    void reset();

    [[nodiscard]] auto is_active() const noexcept -> bool;

    /**
     * @brief Record the aggregate number of bytes moved so far
     *
     * Values lower than a previous record are ignored.
     */
    void record_progress(uint64_t bytes_so_far);

    /**
     * @brief Record the terminal status of one unit
     */
    void record_unit(transfer_status status);

    /**
     * @brief Update the batch total (nullopt when some unit size is unknown)
     */
    void set_total_bytes(std::optional<uint64_t> total_bytes);

    [[nodiscard]] auto get_transfer_rate() const -> double;

    [[nodiscard]] auto get_average_rate() const -> double;

    /**
     * @brief Estimated time remaining; nullopt without a known total or rate
     */
    [[nodiscard]] auto get_eta() const -> std::optional<duration>;

    [[nodiscard]] auto get_elapsed() const -> duration;

    [[nodiscard]] auto get_bytes_transferred() const -> uint64_t;

    [[nodiscard]] auto get_snapshot() const -> snapshot;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::transfer_engine

#endif  // KCENON_TRANSFER_ENGINE_CORE_STATISTICS_COLLECTOR_H
