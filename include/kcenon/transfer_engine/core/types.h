/**
 * @file types.h
 * @brief Core type definitions for transfer_engine_system
 */

#ifndef KCENON_TRANSFER_ENGINE_CORE_TYPES_H
#define KCENON_TRANSFER_ENGINE_CORE_TYPES_H

#include <kcenon/transfer_engine/core/error_codes.h>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::transfer_engine {

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }

    /**
     * @brief Render as "<code description>: <message>"
     */
    [[nodiscard]] auto describe() const -> std::string {
        auto base = std::string(to_string(code));
        if (message.empty() || message == base) {
            return base;
        }
        return base + ": " + message;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * Contains either a value of type T or an error, similar to std::expected.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

/**
 * @brief Identifier assigned to a transfer unit when it enters the executor
 *
 * Used as the key for progress events. Not persisted.
 */
struct unit_id {
    uint64_t value;

    unit_id() : value(0) {}
    explicit unit_id(uint64_t v) : value(v) {}

    [[nodiscard]] auto operator==(const unit_id& other) const -> bool = default;
    [[nodiscard]] auto operator<(const unit_id& other) const -> bool {
        return value < other.value;
    }
};

}  // namespace kcenon::transfer_engine

template <>
struct std::hash<kcenon::transfer_engine::unit_id> {
    auto operator()(const kcenon::transfer_engine::unit_id& id) const noexcept -> std::size_t {
        return std::hash<uint64_t>{}(id.value);
    }
};

#endif  // KCENON_TRANSFER_ENGINE_CORE_TYPES_H
