/**
 * @file unit_runner.h
 * @brief Execution of a single transfer unit
 *
 * The runner streams one object (or one byte range of it) from a source
 * backend to a destination backend in fixed-size chunks. It never throws;
 * every failure is returned as a transfer_result with status error. It does
 * not retry and does not write the manifest.
 */

#ifndef KCENON_TRANSFER_ENGINE_CORE_UNIT_RUNNER_H
#define KCENON_TRANSFER_ENGINE_CORE_UNIT_RUNNER_H

#include <kcenon/transfer_engine/backend/storage_backend.h>
#include <kcenon/transfer_engine/core/cancellation_token.h>
#include <kcenon/transfer_engine/core/transfer_unit.h>

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>

namespace kcenon::transfer_engine {

/**
 * @brief Configuration for unit execution
 */
struct runner_config {
    /// Default chunk size (256KB)
    static constexpr std::size_t default_chunk_size = 256 * 1024;

    /// Maximum allowed chunk size (64MB)
    static constexpr std::size_t max_chunk_size = 64 * 1024 * 1024;

    /// Bytes moved per read/write step; progress is reported per chunk
    std::size_t chunk_size = default_chunk_size;

    /// Verify content_hash of whole-object units after the copy
    bool verify_checksum = true;

    /// Skip units whose destination already exists
    bool no_clobber = false;

    [[nodiscard]] auto validate() const -> result<void> {
        if (chunk_size == 0) {
            return unexpected(
                error(error_code::invalid_configuration, "chunk size must be positive"));
        }
        if (chunk_size > max_chunk_size) {
            return unexpected(error(
                error_code::invalid_configuration,
                "chunk size too large (maximum: " + std::to_string(max_chunk_size) + ")"));
        }
        return {};
    }
};

/**
 * @brief Progress sink for one unit
 *
 * Receives the cumulative bytes of this unit only and the unit total when
 * known.
 */
using progress_sink = std::function<void(uint64_t bytes_so_far, std::optional<uint64_t> total)>;

/**
 * @brief Per-execution context handed to the runner
 */
struct unit_context {
    /// Zero-based attempt number
    uint32_t attempt = 0;

    /// Observed at every chunk boundary
    cancellation_token cancel;

    /// Optional progress callback
    progress_sink on_progress;
};

/**
 * @brief Streams transfer units between two backends
 *
 * @code
 * auto source = std::make_shared<local_storage_backend>();
 * auto destination = std::make_shared<memory_storage_backend>();
 * unit_runner runner(source, destination);
 *
 * unit_context ctx;
 * auto result = runner.run(unit, ctx);
 * if (result.is_error()) {
 *     std::cerr << result.err->describe() << "\n";
 * }
 * @endcode
 */
class unit_runner {
public:
    unit_runner(std::shared_ptr<storage_backend> source,
                std::shared_ptr<storage_backend> destination,
                runner_config config = {});

    /**
     * @brief Execute one unit to completion
     *
     * Behavior:
     * - no_clobber with an existing destination: skipped, source not read
     * - ranged unit starting at or past the object size: OK, nothing streamed
     * - otherwise the range (or the whole object) is streamed chunk by chunk;
     *   ranged units write at their offset without truncating
     * - a stream that ends short fails with incomplete_transfer
     * - content_hash of whole-object units is checked against the
     *   destination digest, or the streamed digest when the destination
     *   reports none; partial data is left in place on mismatch
     */
    [[nodiscard]] auto run(const transfer_unit& unit, unit_context& ctx) const
        -> transfer_result;

    [[nodiscard]] auto config() const -> const runner_config& { return config_; }

    [[nodiscard]] auto source() const -> const std::shared_ptr<storage_backend>& {
        return source_;
    }

    [[nodiscard]] auto destination() const -> const std::shared_ptr<storage_backend>& {
        return destination_;
    }

private:
    [[nodiscard]] auto run_unchecked(const transfer_unit& unit, unit_context& ctx) const
        -> transfer_result;

    std::shared_ptr<storage_backend> source_;
    std::shared_ptr<storage_backend> destination_;
    runner_config config_;
};

}  // namespace kcenon::transfer_engine

#endif  // KCENON_TRANSFER_ENGINE_CORE_UNIT_RUNNER_H
