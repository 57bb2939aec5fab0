/**
 * @file error_codes.h
 * @brief Error codes for transfer_engine_system (-700 to -799 range)
 *
 * Error codes follow the -700 to -799 range as per ecosystem convention.
 * The ranges double as the error taxonomy: unit-scoped permanent errors,
 * transient (retryable) errors, cancellation, and batch-fatal errors.
 */

#ifndef KCENON_TRANSFER_ENGINE_CORE_ERROR_CODES_H
#define KCENON_TRANSFER_ENGINE_CORE_ERROR_CODES_H

#include <cstdint>
#include <string_view>

namespace kcenon::transfer_engine {

/**
 * @brief Error codes for transfer operations (-700 to -799)
 *
 * Error code ranges:
 * - -700 to -719: Unit-scoped permanent errors (never retried)
 * - -720 to -739: Transient errors (retryable)
 * - -740 to -749: Cancellation
 * - -760 to -779: Batch-fatal errors
 * - -780 to -799: Configuration and internal errors
 */
enum class error_code : int32_t {
    success = 0,

    // Unit-scoped permanent errors (-700 to -719)
    object_not_found = -700,
    permission_denied = -701,
    checksum_mismatch = -702,
    invalid_range = -703,
    source_read_error = -704,
    destination_write_error = -705,
    destination_exists = -706,

    // Transient errors (-720 to -739)
    transient_error = -720,
    connection_timeout = -721,
    service_unavailable = -722,
    rate_limited = -723,
    incomplete_transfer = -724,
    connection_reset = -725,

    // Cancellation (-740 to -749)
    transfer_cancelled = -740,

    // Batch-fatal errors (-760 to -779)
    fatal_error = -760,
    authentication_failed = -761,
    destination_unreachable = -762,
    manifest_corrupt = -763,
    manifest_write_failed = -764,

    // Configuration and internal errors (-780 to -799)
    invalid_configuration = -780,
    invalid_argument = -781,
    executor_closed = -782,
    internal_error = -790,
    not_initialized = -791,
    already_running = -792,
};

/**
 * @brief Convert error_code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) noexcept -> std::string_view {
    switch (code) {
        case error_code::success: return "success";

        case error_code::object_not_found: return "object not found";
        case error_code::permission_denied: return "permission denied";
        case error_code::checksum_mismatch: return "checksum mismatch";
        case error_code::invalid_range: return "invalid byte range";
        case error_code::source_read_error: return "source read error";
        case error_code::destination_write_error: return "destination write error";
        case error_code::destination_exists: return "destination already exists";

        case error_code::transient_error: return "transient backend error";
        case error_code::connection_timeout: return "connection timeout";
        case error_code::service_unavailable: return "service temporarily unavailable";
        case error_code::rate_limited: return "request rate limited";
        case error_code::incomplete_transfer: return "incomplete transfer";
        case error_code::connection_reset: return "connection reset by peer";

        case error_code::transfer_cancelled: return "transfer cancelled";

        case error_code::fatal_error: return "fatal backend error";
        case error_code::authentication_failed: return "authentication failed";
        case error_code::destination_unreachable: return "destination unreachable";
        case error_code::manifest_corrupt: return "manifest file is corrupt";
        case error_code::manifest_write_failed: return "manifest write failed";

        case error_code::invalid_configuration: return "invalid configuration";
        case error_code::invalid_argument: return "invalid argument";
        case error_code::executor_closed: return "executor is not accepting work";
        case error_code::internal_error: return "internal error";
        case error_code::not_initialized: return "not initialized";
        case error_code::already_running: return "already running";
        default: return "unknown error";
    }
}

/**
 * @brief Check if error code is a unit-scoped permanent error
 */
[[nodiscard]] constexpr auto is_unit_error(int32_t code) noexcept -> bool {
    return code <= -700 && code >= -719;
}

/**
 * @brief Check if error code is a transient error that may succeed on retry
 */
[[nodiscard]] constexpr auto is_retryable_error(int32_t code) noexcept -> bool {
    return code <= -720 && code >= -739;
}

/**
 * @brief Check if error code is a cancellation
 */
[[nodiscard]] constexpr auto is_cancellation_error(int32_t code) noexcept -> bool {
    return code <= -740 && code >= -749;
}

/**
 * @brief Check if error code aborts the whole batch
 */
[[nodiscard]] constexpr auto is_batch_fatal_error(int32_t code) noexcept -> bool {
    return code <= -760 && code >= -779;
}

/**
 * @brief Check if error code is a configuration or internal error
 */
[[nodiscard]] constexpr auto is_internal_error(int32_t code) noexcept -> bool {
    return code <= -780 && code >= -799;
}

[[nodiscard]] constexpr auto is_unit_error(error_code code) noexcept -> bool {
    return is_unit_error(static_cast<int32_t>(code));
}

[[nodiscard]] constexpr auto is_retryable_error(error_code code) noexcept -> bool {
    return is_retryable_error(static_cast<int32_t>(code));
}

[[nodiscard]] constexpr auto is_cancellation_error(error_code code) noexcept -> bool {
    return is_cancellation_error(static_cast<int32_t>(code));
}

[[nodiscard]] constexpr auto is_batch_fatal_error(error_code code) noexcept -> bool {
    return is_batch_fatal_error(static_cast<int32_t>(code));
}

}  // namespace kcenon::transfer_engine

#endif  // KCENON_TRANSFER_ENGINE_CORE_ERROR_CODES_H
