// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <kcenon/transfer_engine/config/feature_flags.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

#if TRANSFER_ENGINE_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::transfer_engine {

/**
 * @brief Log categories for the transfer engine
 */
struct log_category {
    static constexpr std::string_view coordinator = "transfer_engine.coordinator";
    static constexpr std::string_view executor = "transfer_engine.executor";
    static constexpr std::string_view unit = "transfer_engine.unit";
    static constexpr std::string_view manifest = "transfer_engine.manifest";
    static constexpr std::string_view progress = "transfer_engine.progress";
    static constexpr std::string_view backend = "transfer_engine.backend";
};

/**
 * @brief Log levels for the transfer engine
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

namespace detail {

inline auto escape_json(std::string_view input) -> std::string {
    std::string output;
    output.reserve(input.size() + 16);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b";  break;
            case '\f': output += "\\f";  break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

/**
 * @brief UTC timestamp, e.g. 2025-01-31T08:15:02.123Z
 */
inline auto iso8601_utc_now() -> std::string {
    auto now = std::chrono::system_clock::now();
    auto time_t_val = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
#if defined(_WIN32)
    gmtime_s(&tm_buf, &time_t_val);
#else
    gmtime_r(&time_t_val, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count()
        << 'Z';
    return oss.str();
}

}  // namespace detail

/**
 * @brief Structured log context for a transfer unit
 */
struct transfer_log_context {
    std::optional<uint64_t> unit_id;
    std::string source;
    std::string destination;
    std::optional<uint64_t> bytes_transferred;
    std::optional<uint64_t> total_bytes;
    std::optional<uint32_t> attempt;
    std::optional<uint64_t> duration_ms;
    std::optional<std::string> error_message;

    /**
     * @brief Convert context to a JSON object string
     */
    [[nodiscard]] auto to_json() const -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_field = [&](const char* name, std::string_view value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << detail::escape_json(value) << "\"";
            first = false;
        };
        auto add_uint = [&](const char* name, uint64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (unit_id) add_uint("unit_id", *unit_id);
        if (!source.empty()) add_field("source", source);
        if (!destination.empty()) add_field("destination", destination);
        if (bytes_transferred) add_uint("bytes_transferred", *bytes_transferred);
        if (total_bytes) add_uint("total_bytes", *total_bytes);
        if (attempt) add_uint("attempt", *attempt);
        if (duration_ms) add_uint("duration_ms", *duration_ms);
        if (error_message) add_field("error_message", *error_message);

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Complete structured log entry
 */
struct structured_log_entry {
    std::string timestamp;
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<transfer_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;

    [[nodiscard]] auto to_json() const -> std::string {
        std::ostringstream oss;
        oss << "{";
        oss << "\"timestamp\":\"" << timestamp << "\"";
        oss << ",\"level\":\"" << log_level_to_string(level) << "\"";
        oss << ",\"category\":\"" << category << "\"";
        oss << ",\"message\":\"" << detail::escape_json(message) << "\"";

        if (context) {
            auto ctx_json = context->to_json();
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }

        if (source_file) {
            oss << ",\"source_location\":{\"file\":\"" << detail::escape_json(*source_file) << "\"";
            if (source_line) {
                oss << ",\"line\":" << *source_line;
            }
            oss << "}";
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,   ///< Traditional text format
    json    ///< JSON format for structured logging
};

/**
 * @brief Transfer engine logging facility
 *
 * Routes records to kcenon logger_system when the build enables it and to
 * stderr otherwise. A callback can observe every record that passes the
 * level filter.
 */
class transfer_engine_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view,
                                            std::string_view, const transfer_log_context*)>;

    transfer_engine_logger() = default;
    ~transfer_engine_logger() = default;

    transfer_engine_logger(const transfer_engine_logger&) = delete;
    transfer_engine_logger& operator=(const transfer_engine_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times - subsequent calls are no-ops.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if TRANSFER_ENGINE_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(kcenon::logger::log_level::info)
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            logger_ = std::move(result.value());
        }
#endif
    }

    void shutdown() {
#if TRANSFER_ENGINE_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#if TRANSFER_ENGINE_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        output_format_ = format;
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return output_format_;
    }

    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    /**
     * @brief Suppress console/logger_system output (callbacks still fire)
     */
    void set_console_output(bool enabled) { console_output_.store(enabled); }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const transfer_log_context* context = nullptr,
             const char* file = nullptr,
             int line = 0) {
        if (!is_enabled(level)) return;

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, message, context);
            }
        }

        if (!console_output_.load()) return;

        auto format = get_output_format();
        std::string rendered;
        if (format == log_output_format::json) {
            structured_log_entry entry;
            entry.timestamp = detail::iso8601_utc_now();
            entry.level = level;
            entry.category = std::string(category);
            entry.message = std::string(message);
            if (context) entry.context = *context;
            if (file) entry.source_file = file;
            if (line > 0) entry.source_line = line;
            rendered = entry.to_json();
        } else {
            std::ostringstream oss;
#if !TRANSFER_ENGINE_USE_LOGGER_SYSTEM
            oss << detail::iso8601_utc_now() << " [" << log_level_to_string(level) << "] ";
#endif
            oss << "[" << category << "] " << message;
            if (context) {
                oss << " " << context->to_json();
            }
            rendered = oss.str();
        }

#if TRANSFER_ENGINE_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->log(to_logger_level(level), rendered);
            return;
        }
#endif
        output_to_stderr(rendered);
    }

    void flush() {
#if TRANSFER_ENGINE_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    static void output_to_stderr(const std::string& msg) {
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << msg << "\n";
    }

#if TRANSFER_ENGINE_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> console_output_{true};
    log_callback callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    mutable std::mutex config_mutex_;
};

/**
 * @brief Get global logger instance
 */
inline transfer_engine_logger& get_logger() {
    static transfer_engine_logger instance;
    return instance;
}

#define TE_LOG(level, category, message) \
    kcenon::transfer_engine::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__)

#define TE_LOG_CTX(level, category, message, context) \
    kcenon::transfer_engine::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__)

#define TE_LOG_TRACE(category, message) \
    TE_LOG(kcenon::transfer_engine::log_level::trace, category, message)

#define TE_LOG_DEBUG(category, message) \
    TE_LOG(kcenon::transfer_engine::log_level::debug, category, message)

#define TE_LOG_INFO(category, message) \
    TE_LOG(kcenon::transfer_engine::log_level::info, category, message)

#define TE_LOG_WARN(category, message) \
    TE_LOG(kcenon::transfer_engine::log_level::warn, category, message)

#define TE_LOG_ERROR(category, message) \
    TE_LOG(kcenon::transfer_engine::log_level::error, category, message)

#define TE_LOG_FATAL(category, message) \
    TE_LOG(kcenon::transfer_engine::log_level::fatal, category, message)

#define TE_LOG_DEBUG_CTX(category, message, ctx) \
    TE_LOG_CTX(kcenon::transfer_engine::log_level::debug, category, message, ctx)

#define TE_LOG_INFO_CTX(category, message, ctx) \
    TE_LOG_CTX(kcenon::transfer_engine::log_level::info, category, message, ctx)

#define TE_LOG_WARN_CTX(category, message, ctx) \
    TE_LOG_CTX(kcenon::transfer_engine::log_level::warn, category, message, ctx)

#define TE_LOG_ERROR_CTX(category, message, ctx) \
    TE_LOG_CTX(kcenon::transfer_engine::log_level::error, category, message, ctx)

}  // namespace kcenon::transfer_engine
