/**
 * @file statistics_collector.cpp
 * @brief Implementation of batch throughput statistics
 */

#include "kcenon/transfer_engine/core/statistics_collector.h"

#include <atomic>
#include <deque>
#include <mutex>

namespace kcenon::transfer_engine {

namespace {

using steady_time = std::chrono::steady_clock::time_point;

/**
 * @brief Rate sample for moving average calculation
 */
struct rate_sample {
    steady_time timestamp;
    uint64_t bytes;
};

constexpr uint64_t no_total = UINT64_MAX;

}  // namespace

struct statistics_collector::impl {
    config cfg;

    std::atomic<bool> active{false};
    steady_time start_time;
    steady_time stop_time;

    std::atomic<uint64_t> bytes_transferred{0};
    std::atomic<uint64_t> total_bytes{no_total};
    std::atomic<uint64_t> units_ok{0};
    std::atomic<uint64_t> units_skipped{0};
    std::atomic<uint64_t> units_failed{0};

    mutable std::mutex rate_mutex;
    std::deque<rate_sample> rate_samples;
    steady_time last_sample_time;

    mutable std::mutex eta_mutex;
    steady_time last_eta_update;
    std::optional<duration> cached_eta;

    impl() : cfg{} {}
    explicit impl(config c) : cfg(std::move(c)) {}

    auto now_or_stop() const -> steady_time {
        return active.load() ? std::chrono::steady_clock::now() : stop_time;
    }

    void update_rate_samples(uint64_t current_bytes) {
        auto now = std::chrono::steady_clock::now();
        std::lock_guard<std::mutex> lock(rate_mutex);

        auto since_sample = std::chrono::duration_cast<duration>(now - last_sample_time);
        if (since_sample < cfg.rate_sample_interval && !rate_samples.empty()) {
            return;
        }

        rate_samples.push_back({now, current_bytes});
        while (rate_samples.size() > cfg.rate_window_size) {
            rate_samples.pop_front();
        }
        last_sample_time = now;
    }

    [[nodiscard]] auto calculate_current_rate() const -> double {
        std::lock_guard<std::mutex> lock(rate_mutex);

        if (rate_samples.size() < 2) {
            return 0.0;
        }

        const auto& oldest = rate_samples.front();
        const auto& newest = rate_samples.back();

        auto time_diff = std::chrono::duration_cast<std::chrono::milliseconds>(
            newest.timestamp - oldest.timestamp);

        if (time_diff.count() == 0) {
            return 0.0;
        }

        auto bytes_diff = newest.bytes - oldest.bytes;
        return static_cast<double>(bytes_diff) * 1000.0 /
               static_cast<double>(time_diff.count());
    }

    [[nodiscard]] auto calculate_average_rate() const -> double {
        auto elapsed =
            std::chrono::duration_cast<std::chrono::milliseconds>(now_or_stop() - start_time);

        if (elapsed.count() <= 0) {
            return 0.0;
        }

        return static_cast<double>(bytes_transferred.load()) * 1000.0 /
               static_cast<double>(elapsed.count());
    }

    [[nodiscard]] auto calculate_eta() const -> std::optional<duration> {
        uint64_t total = total_bytes.load();
        if (total == no_total) {
            return std::nullopt;
        }

        uint64_t transferred = bytes_transferred.load();
        if (transferred >= total) {
            return duration{0};
        }

        double rate = calculate_current_rate();
        if (rate <= 0.0) {
            rate = calculate_average_rate();
        }
        if (rate <= 0.0) {
            return std::nullopt;
        }

        uint64_t remaining = total - transferred;
        return duration{static_cast<int64_t>(static_cast<double>(remaining) * 1000.0 / rate)};
    }
};

statistics_collector::statistics_collector()
    : impl_(std::make_unique<impl>()) {}

statistics_collector::statistics_collector(config cfg)
    : impl_(std::make_unique<impl>(std::move(cfg))) {}

statistics_collector::statistics_collector(statistics_collector&&) noexcept = default;
auto statistics_collector::operator=(statistics_collector&&) noexcept
    -> statistics_collector& = default;
statistics_collector::~statistics_collector() = default;

void statistics_collector::start(std::optional<uint64_t> total_bytes) {
    set_total_bytes(total_bytes);
    impl_->start_time = std::chrono::steady_clock::now();
    impl_->stop_time = impl_->start_time;
    impl_->active.store(true);

    {
        std::lock_guard<std::mutex> lock(impl_->rate_mutex);
        impl_->rate_samples.clear();
        impl_->rate_samples.push_back({impl_->start_time, impl_->bytes_transferred.load()});
        impl_->last_sample_time = impl_->start_time;
    }

    std::lock_guard<std::mutex> lock(impl_->eta_mutex);
    impl_->last_eta_update = impl_->start_time;
    impl_->cached_eta.reset();
}

void statistics_collector::stop() {
    if (impl_->active.exchange(false)) {
        impl_->stop_time = std::chrono::steady_clock::now();
    }
}

void statistics_collector::reset() {
    impl_->active.store(false);
    impl_->bytes_transferred.store(0);
    impl_->total_bytes.store(no_total);
    impl_->units_ok.store(0);
    impl_->units_skipped.store(0);
    impl_->units_failed.store(0);

    {
        std::lock_guard<std::mutex> lock(impl_->rate_mutex);
        impl_->rate_samples.clear();
    }

    std::lock_guard<std::mutex> lock(impl_->eta_mutex);
    impl_->cached_eta.reset();
}

auto statistics_collector::is_active() const noexcept -> bool {
    return impl_->active.load();
}

void statistics_collector::record_progress(uint64_t bytes_so_far) {
    auto current = impl_->bytes_transferred.load();
    while (bytes_so_far > current &&
           !impl_->bytes_transferred.compare_exchange_weak(current, bytes_so_far)) {
    }
    impl_->update_rate_samples(impl_->bytes_transferred.load());
}

void statistics_collector::record_unit(transfer_status status) {
    switch (status) {
        case transfer_status::ok:
            impl_->units_ok.fetch_add(1);
            break;
        case transfer_status::skipped:
            impl_->units_skipped.fetch_add(1);
            break;
        case transfer_status::error:
            impl_->units_failed.fetch_add(1);
            break;
    }
}

void statistics_collector::set_total_bytes(std::optional<uint64_t> total_bytes) {
    impl_->total_bytes.store(total_bytes.value_or(no_total));
}

auto statistics_collector::get_transfer_rate() const -> double {
    return impl_->calculate_current_rate();
}

auto statistics_collector::get_average_rate() const -> double {
    return impl_->calculate_average_rate();
}

auto statistics_collector::get_eta() const -> std::optional<duration> {
    auto now = std::chrono::steady_clock::now();

    std::lock_guard<std::mutex> lock(impl_->eta_mutex);
    auto since_update = std::chrono::duration_cast<duration>(now - impl_->last_eta_update);

    if (impl_->cached_eta && since_update < impl_->cfg.min_eta_update_interval) {
        return impl_->cached_eta;
    }

    impl_->cached_eta = impl_->calculate_eta();
    impl_->last_eta_update = now;
    return impl_->cached_eta;
}

auto statistics_collector::get_elapsed() const -> duration {
    return std::chrono::duration_cast<duration>(impl_->now_or_stop() - impl_->start_time);
}

auto statistics_collector::get_bytes_transferred() const -> uint64_t {
    return impl_->bytes_transferred.load();
}

auto statistics_collector::get_snapshot() const -> snapshot {
    snapshot s;
    s.bytes_transferred = impl_->bytes_transferred.load();
    auto total = impl_->total_bytes.load();
    if (total != no_total) {
        s.total_bytes = total;
    }
    s.units_ok = impl_->units_ok.load();
    s.units_skipped = impl_->units_skipped.load();
    s.units_failed = impl_->units_failed.load();
    s.current_rate = get_transfer_rate();
    s.average_rate = get_average_rate();
    s.elapsed = get_elapsed();
    s.estimated_remaining = get_eta();
    return s;
}

}  // namespace kcenon::transfer_engine
