/**
 * @file progress_reporter.cpp
 * @brief Implementation of batch progress aggregation
 */

#include <kcenon/transfer_engine/progress/progress_reporter.h>

#include <kcenon/transfer_engine/core/logging.h>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstdio>
#include <exception>
#include <iterator>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace kcenon::transfer_engine {

namespace {

struct pending_report {
    uint64_t bytes = 0;
    std::optional<uint64_t> total;
};

struct pending_completion {
    unit_id id;
    transfer_status status;
    uint64_t final_bytes;
};

struct unit_progress {
    uint64_t bytes = 0;
    std::optional<uint64_t> total;
};

}  // namespace

struct progress_reporter::impl {
    progress_config config;
    progress_callback callback;

    // Event intake; held only long enough to store one event.
    mutable std::mutex pending_mutex;
    std::unordered_map<unit_id, pending_report> pending_reports;
    std::vector<pending_completion> pending_completions;
    std::vector<std::pair<unit_id, std::optional<uint64_t>>> pending_registrations;

    // Aggregate state, owned by whoever holds state_mutex.
    mutable std::mutex state_mutex;
    std::unordered_map<unit_id, unit_progress> in_flight;
    std::unordered_map<unit_id, std::optional<uint64_t>> totals;
    std::size_t unknown_totals = 0;
    uint64_t known_total = 0;
    uint64_t completed_bytes = 0;
    std::size_t completed_units = 0;
    uint64_t last_aggregate = 0;
    statistics_collector stats;

    std::atomic<bool> running{false};
    std::thread ticker;
    std::condition_variable ticker_cv;
    std::mutex ticker_mutex;

    impl(progress_config cfg, progress_callback cb)
        : config(std::move(cfg)), callback(std::move(cb)), stats(config.statistics) {}

    void set_total(unit_id id, std::optional<uint64_t> total) {
        auto it = totals.find(id);
        if (it == totals.end()) {
            totals.emplace(id, total);
            if (total) {
                known_total += *total;
            } else {
                ++unknown_totals;
            }
            return;
        }
        if (!it->second && total) {
            it->second = total;
            known_total += *total;
            --unknown_totals;
        }
    }

    /**
     * @brief Fold pending events into the aggregate; caller holds state_mutex
     */
    void drain_locked() {
        std::unordered_map<unit_id, pending_report> reports;
        std::vector<pending_completion> completions;
        std::vector<std::pair<unit_id, std::optional<uint64_t>>> registrations;
        {
            std::lock_guard<std::mutex> lock(pending_mutex);
            reports.swap(pending_reports);
            completions.swap(pending_completions);
            registrations.swap(pending_registrations);
        }

        for (const auto& [id, total] : registrations) {
            set_total(id, total);
        }

        for (const auto& [id, report] : reports) {
            set_total(id, report.total);
            auto& unit = in_flight[id];
            unit.bytes = std::max(unit.bytes, report.bytes);
            if (report.total) {
                unit.total = report.total;
            }
        }

        for (const auto& completion : completions) {
            uint64_t folded = completion.final_bytes;
            auto it = in_flight.find(completion.id);
            if (it != in_flight.end()) {
                folded = std::max(folded, it->second.bytes);
                in_flight.erase(it);
            }
            auto registered = totals.find(completion.id);
            if (registered != totals.end() && registered->second) {
                folded = std::min(folded, *registered->second);
            }
            // A finished unit's size is known from here on.
            set_total(completion.id, folded);
            completed_bytes += folded;
            ++completed_units;
            stats.record_unit(completion.status);
        }

        uint64_t aggregate = completed_bytes;
        for (const auto& [id, unit] : in_flight) {
            aggregate += unit.bytes;
        }
        last_aggregate = std::max(last_aggregate, aggregate);

        stats.set_total_bytes(current_total_locked());
        stats.record_progress(last_aggregate);
    }

    [[nodiscard]] auto current_total_locked() const -> std::optional<uint64_t> {
        if (totals.empty() || unknown_totals > 0) {
            return std::nullopt;
        }
        return known_total;
    }

    [[nodiscard]] auto snapshot_locked() const -> progress_snapshot {
        auto stat = stats.get_snapshot();

        progress_snapshot s;
        s.bytes_transferred = last_aggregate;
        s.completed_bytes = completed_bytes;
        s.total_bytes = current_total_locked();
        s.registered_units = totals.size();
        s.in_flight_units = in_flight.size();
        s.completed_units = completed_units;
        s.units_ok = stat.units_ok;
        s.units_skipped = stat.units_skipped;
        s.units_failed = stat.units_failed;
        s.current_rate = stat.current_rate;
        s.average_rate = stat.average_rate;
        s.elapsed = stat.elapsed;
        s.estimated_remaining = stat.estimated_remaining;
        return s;
    }

    auto tick() -> progress_snapshot {
        std::lock_guard<std::mutex> lock(state_mutex);
        drain_locked();
        return snapshot_locked();
    }

    void publish(const progress_snapshot& s) {
        if (config.log_progress) {
            TE_LOG_INFO(log_category::progress, format_progress_line(s));
        }
        if (callback) {
            try {
                callback(s);
            } catch (const std::exception& e) {
                TE_LOG_WARN(log_category::progress,
                            std::string("progress callback threw: ") + e.what());
            }
        }
    }

    void run_ticker() {
        while (running.load()) {
            {
                std::unique_lock<std::mutex> lock(ticker_mutex);
                ticker_cv.wait_for(lock, config.tick_interval,
                                   [this] { return !running.load(); });
            }
            if (!running.load()) {
                break;
            }
            publish(tick());
        }
    }
};

progress_reporter::progress_reporter(progress_config config, progress_callback callback)
    : impl_(std::make_unique<impl>(std::move(config), std::move(callback))) {}

progress_reporter::~progress_reporter() {
    if (impl_ && impl_->running.load()) {
        stop();
    }
}

auto progress_reporter::start() -> result<void> {
    auto valid = impl_->config.validate();
    if (!valid) {
        return valid;
    }
    if (impl_->running.exchange(true)) {
        return unexpected(
            error(error_code::already_running, "progress reporter is already running"));
    }

    {
        std::lock_guard<std::mutex> lock(impl_->state_mutex);
        impl_->stats.start(impl_->current_total_locked());
    }

    TE_LOG_DEBUG(log_category::progress,
                 "progress ticker started, interval " +
                     std::to_string(impl_->config.tick_interval.count()) + "ms");

    impl_->ticker = std::thread([this]() { impl_->run_ticker(); });
    return {};
}

void progress_reporter::stop() {
    if (!impl_->running.exchange(false)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(impl_->ticker_mutex);
    }
    impl_->ticker_cv.notify_all();
    if (impl_->ticker.joinable()) {
        impl_->ticker.join();
    }

    progress_snapshot final_snapshot;
    {
        std::lock_guard<std::mutex> lock(impl_->state_mutex);
        impl_->drain_locked();
        impl_->stats.stop();
        final_snapshot = impl_->snapshot_locked();
    }
    impl_->publish(final_snapshot);

    TE_LOG_DEBUG(log_category::progress, "progress ticker stopped: " +
                                             format_progress_line(final_snapshot));
}

auto progress_reporter::is_running() const -> bool {
    return impl_->running.load();
}

void progress_reporter::register_unit(unit_id id, std::optional<uint64_t> total) {
    std::lock_guard<std::mutex> lock(impl_->pending_mutex);
    impl_->pending_registrations.emplace_back(id, total);
}

void progress_reporter::report(unit_id id, uint64_t bytes_so_far, std::optional<uint64_t> total) {
    std::lock_guard<std::mutex> lock(impl_->pending_mutex);
    auto& pending = impl_->pending_reports[id];
    pending.bytes = std::max(pending.bytes, bytes_so_far);
    if (total) {
        pending.total = total;
    }
}

void progress_reporter::complete_unit(unit_id id, transfer_status status, uint64_t final_bytes) {
    std::lock_guard<std::mutex> lock(impl_->pending_mutex);
    impl_->pending_completions.push_back({id, status, final_bytes});
}

auto progress_reporter::snapshot() const -> progress_snapshot {
    return impl_->tick();
}

// ============================================================================
// Formatting
// ============================================================================

auto format_bytes(uint64_t bytes) -> std::string {
    static constexpr const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB", "PiB"};
    if (bytes < 1024) {
        return std::to_string(bytes) + " B";
    }
    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < std::size(units)) {
        value /= 1024.0;
        ++unit;
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f %s", value, units[unit]);
    return buf;
}

auto format_duration(std::chrono::milliseconds value) -> std::string {
    auto total_seconds = std::max<int64_t>(0, value.count() / 1000);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld",
                  static_cast<long long>(total_seconds / 3600),
                  static_cast<long long>((total_seconds / 60) % 60),
                  static_cast<long long>(total_seconds % 60));
    return buf;
}

auto format_progress_line(const progress_snapshot& snapshot) -> std::string {
    std::string line = "Completed " + format_bytes(snapshot.bytes_transferred);
    if (snapshot.total_bytes) {
        line += "/" + format_bytes(*snapshot.total_bytes);
    }
    if (auto percent = snapshot.completion_percentage()) {
        char buf[16];
        std::snprintf(buf, sizeof(buf), " (%.1f%%)", *percent);
        line += buf;
    }
    line += " with " + std::to_string(snapshot.remaining_units()) + " unit(s) remaining";

    auto rate = snapshot.current_rate > 0.0 ? snapshot.current_rate : snapshot.average_rate;
    line += ", " + format_bytes(static_cast<uint64_t>(rate)) + "/s";

    if (snapshot.estimated_remaining) {
        line += ", ETA " + format_duration(*snapshot.estimated_remaining);
    }
    if (snapshot.units_failed > 0) {
        line += ", " + std::to_string(snapshot.units_failed) + " failed";
    }
    return line;
}

}  // namespace kcenon::transfer_engine
