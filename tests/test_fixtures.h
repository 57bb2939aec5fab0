/**
 * @file test_fixtures.h
 * @brief Shared fixtures and fault-injecting backend for tests
 */

#ifndef KCENON_TRANSFER_ENGINE_TEST_FIXTURES_H
#define KCENON_TRANSFER_ENGINE_TEST_FIXTURES_H

#include <gtest/gtest.h>

#include <kcenon/transfer_engine/transfer_engine.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <random>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace kcenon::transfer_engine::test {

/**
 * @brief Test fixture for temporary directory management
 */
class TempDirectoryFixture : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("transfer_engine_test_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto create_test_file(const std::string& name, std::size_t size)
        -> std::filesystem::path {
        auto path = test_dir_ / name;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream file(path, std::ios::binary);

        std::mt19937 gen(42);  // Fixed seed for reproducibility
        std::uniform_int_distribution<> dis(0, 255);

        for (std::size_t i = 0; i < size; ++i) {
            char byte = static_cast<char>(dis(gen));
            file.write(&byte, 1);
        }

        return path;
    }

    auto write_file(const std::string& name, const std::string& content)
        -> std::filesystem::path {
        auto path = test_dir_ / name;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream file(path, std::ios::binary);
        file << content;
        return path;
    }

    static auto read_file(const std::filesystem::path& path) -> std::string {
        std::ifstream file(path, std::ios::binary);
        std::ostringstream oss;
        oss << file.rdbuf();
        return oss.str();
    }

    std::filesystem::path test_dir_;
};

/**
 * @brief Deterministic content of the given size
 */
inline auto make_content(std::size_t size, char seed = 'a') -> std::string {
    std::string content(size, '\0');
    for (std::size_t i = 0; i < size; ++i) {
        content[i] = static_cast<char>(seed + static_cast<char>(i % 26));
    }
    return content;
}

inline auto to_bytes(std::string_view text) -> std::vector<std::byte> {
    std::vector<std::byte> bytes(text.size());
    if (!text.empty()) {
        std::memcpy(bytes.data(), text.data(), text.size());
    }
    return bytes;
}

/**
 * @brief Silences console logging and records messages for a test
 */
class log_capture {
public:
    struct record {
        log_level level;
        std::string category;
        std::string message;
    };

    explicit log_capture(log_level level = log_level::debug) {
        auto& logger = get_logger();
        previous_level_ = logger.get_level();
        logger.set_console_output(false);
        logger.set_level(level);
        logger.set_callback([this](log_level lvl, std::string_view category,
                                   std::string_view message, const transfer_log_context*) {
            std::lock_guard<std::mutex> lock(mutex_);
            records_.push_back({lvl, std::string(category), std::string(message)});
        });
    }

    ~log_capture() {
        auto& logger = get_logger();
        logger.set_callback(nullptr);
        logger.set_console_output(true);
        logger.set_level(previous_level_);
    }

    log_capture(const log_capture&) = delete;
    log_capture& operator=(const log_capture&) = delete;

    [[nodiscard]] auto records() const -> std::vector<record> {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_;
    }

    [[nodiscard]] auto contains(log_level level, std::string_view needle) const -> bool {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::any_of(records_.begin(), records_.end(), [&](const record& r) {
            return r.level == level && r.message.find(needle) != std::string::npos;
        });
    }

private:
    log_level previous_level_;
    mutable std::mutex mutex_;
    std::vector<record> records_;
};

/**
 * @brief Backend wrapper that injects failures and measures concurrency
 *
 * Faults are keyed by locator and consumed one per call.
 */
class fault_injecting_backend : public storage_backend {
public:
    explicit fault_injecting_backend(std::shared_ptr<storage_backend> inner)
        : inner_(std::move(inner)) {}

    [[nodiscard]] auto name() const -> std::string_view override { return "faulty"; }

    [[nodiscard]] auto probe() -> result<void> override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (probe_error_) {
            return unexpected(*probe_error_);
        }
        return inner_->probe();
    }

    [[nodiscard]] auto stat(const std::string& locator) -> result<object_stat> override {
        if (auto e = take_fault(stat_faults_, locator)) {
            return unexpected(*e);
        }
        return inner_->stat(locator);
    }

    [[nodiscard]] auto open_read_stream(const std::string& locator, uint64_t start,
                                        std::optional<uint64_t> end)
        -> result<std::unique_ptr<read_stream>> override {
        if (auto e = take_fault(read_faults_, locator)) {
            return unexpected(*e);
        }
        auto active = ++active_reads_;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            peak_reads_ = std::max(peak_reads_, active);
            ++reads_by_locator_[locator];
        }
        auto delay = read_delay_;
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        auto stream = inner_->open_read_stream(locator, start, end);
        --active_reads_;
        return stream;
    }

    [[nodiscard]] auto open_write_stream(const std::string& locator, const write_options& options)
        -> result<std::unique_ptr<write_stream>> override {
        if (auto e = take_fault(write_faults_, locator)) {
            return unexpected(*e);
        }
        return inner_->open_write_stream(locator, options);
    }

    void fail_stat(const std::string& locator, error e, int times = 1) {
        add_fault(stat_faults_, locator, std::move(e), times);
    }

    void fail_read(const std::string& locator, error e, int times = 1) {
        add_fault(read_faults_, locator, std::move(e), times);
    }

    void fail_write(const std::string& locator, error e, int times = 1) {
        add_fault(write_faults_, locator, std::move(e), times);
    }

    void set_probe_error(std::optional<error> e) {
        std::lock_guard<std::mutex> lock(mutex_);
        probe_error_ = std::move(e);
    }

    /**
     * @brief Hold every open_read_stream() for this long
     */
    void set_read_delay(std::chrono::milliseconds delay) { read_delay_ = delay; }

    [[nodiscard]] auto peak_concurrent_reads() const -> int {
        std::lock_guard<std::mutex> lock(mutex_);
        return peak_reads_;
    }

    [[nodiscard]] auto read_count(const std::string& locator) const -> int {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = reads_by_locator_.find(locator);
        return it == reads_by_locator_.end() ? 0 : it->second;
    }

private:
    struct fault {
        error err;
        int remaining = 0;
    };

    void add_fault(std::map<std::string, fault>& faults, const std::string& locator, error e,
                   int times) {
        std::lock_guard<std::mutex> lock(mutex_);
        faults[locator] = fault{std::move(e), times};
    }

    auto take_fault(std::map<std::string, fault>& faults, const std::string& locator)
        -> std::optional<error> {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = faults.find(locator);
        if (it == faults.end() || it->second.remaining == 0) {
            return std::nullopt;
        }
        if (it->second.remaining > 0) {
            --it->second.remaining;
        }
        return it->second.err;
    }

    std::shared_ptr<storage_backend> inner_;
    mutable std::mutex mutex_;
    std::map<std::string, fault> stat_faults_;
    std::map<std::string, fault> read_faults_;
    std::map<std::string, fault> write_faults_;
    std::optional<error> probe_error_;
    std::chrono::milliseconds read_delay_{0};
    std::atomic<int> active_reads_{0};
    int peak_reads_ = 0;
    std::map<std::string, int> reads_by_locator_;
};

/**
 * @brief Retry policy without waiting, for fast tests
 */
inline auto immediate_retry(uint32_t max_retries = 3) -> retry_policy {
    retry_policy policy;
    policy.max_retries = max_retries;
    policy.initial_delay = std::chrono::milliseconds{0};
    policy.max_delay = std::chrono::milliseconds{0};
    return policy;
}

}  // namespace kcenon::transfer_engine::test

#endif  // KCENON_TRANSFER_ENGINE_TEST_FIXTURES_H
