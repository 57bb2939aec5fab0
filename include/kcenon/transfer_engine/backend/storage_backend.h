/**
 * @file storage_backend.h
 * @brief Storage backend abstraction used by transfer units
 *
 * A backend resolves locator strings to objects and exposes ranged,
 * streaming reads and offset writes. The engine is backend-agnostic: a
 * local filesystem, an in-memory object store or a remote object store all
 * plug in through this interface.
 */

#ifndef KCENON_TRANSFER_ENGINE_BACKEND_STORAGE_BACKEND_H
#define KCENON_TRANSFER_ENGINE_BACKEND_STORAGE_BACKEND_H

#include <kcenon/transfer_engine/core/transfer_unit.h>
#include <kcenon/transfer_engine/core/types.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace kcenon::transfer_engine {

/**
 * @brief Object attributes reported by a backend
 */
struct object_stat {
    /// Total object size in bytes
    uint64_t size = 0;

    /// MD5 digest (lowercase hex), when the backend tracks one
    std::optional<std::string> md5;
};

/**
 * @brief Options for opening a write stream
 */
struct write_options {
    /// Byte offset the first write lands at
    uint64_t offset = 0;

    /// Replace existing content; ranged writes keep it
    bool truncate = true;

    /// Destination-side properties to attach to the object
    metadata_map metadata;
};

/**
 * @brief Streaming read of one object (or one range of it)
 */
class read_stream {
public:
    virtual ~read_stream() = default;

    /**
     * @brief Read the next bytes into buffer
     * @return Number of bytes read; 0 at end of stream
     */
    [[nodiscard]] virtual auto read(std::span<std::byte> buffer) -> result<std::size_t> = 0;

    [[nodiscard]] virtual auto bytes_read() const -> uint64_t = 0;
};

/**
 * @brief Streaming write of one object (or one range of it)
 */
class write_stream {
public:
    virtual ~write_stream() = default;

    /**
     * @brief Write data chunk to the stream
     * @return Number of bytes accepted
     */
    [[nodiscard]] virtual auto write(std::span<const std::byte> data) -> result<std::size_t> = 0;

    [[nodiscard]] virtual auto flush() -> result<void> = 0;

    /**
     * @brief Finish the write and make the object visible
     *
     * Data written before a failed close() may remain at the destination.
     */
    [[nodiscard]] virtual auto close() -> result<void> = 0;

    [[nodiscard]] virtual auto bytes_written() const -> uint64_t = 0;
};

/**
 * @brief Storage backend interface
 *
 * Implementations classify their failures into the engine's error codes:
 * object_not_found and permission_denied for unit-scoped errors, the
 * transient range for retryable errors, and the batch-fatal range for
 * authentication or reachability failures.
 */
class storage_backend {
public:
    virtual ~storage_backend() = default;

    [[nodiscard]] virtual auto name() const -> std::string_view = 0;

    /**
     * @brief Batch-level connectivity and credential check
     *
     * Called once before any unit runs. A failure here aborts the batch.
     */
    [[nodiscard]] virtual auto probe() -> result<void> { return {}; }

    [[nodiscard]] virtual auto stat(const std::string& locator) -> result<object_stat> = 0;

    /**
     * @brief Check if an object exists
     *
     * The default maps object_not_found from stat() to false.
     */
    [[nodiscard]] virtual auto exists(const std::string& locator) -> result<bool> {
        auto st = stat(locator);
        if (st) {
            return true;
        }
        if (st.error().code == error_code::object_not_found) {
            return false;
        }
        return unexpected(st.error());
    }

    /**
     * @brief Open a read stream over [start, end)
     * @param end Exclusive end offset; absent reads to the end of the object
     */
    [[nodiscard]] virtual auto open_read_stream(const std::string& locator,
                                                uint64_t start,
                                                std::optional<uint64_t> end)
        -> result<std::unique_ptr<read_stream>> = 0;

    [[nodiscard]] virtual auto open_write_stream(const std::string& locator,
                                                 const write_options& options)
        -> result<std::unique_ptr<write_stream>> = 0;

    /**
     * @brief Backend-specific retry classification
     *
     * The default uses the transient error range.
     */
    [[nodiscard]] virtual auto is_retryable(const struct error& e) const -> bool {
        return is_retryable_error(e.code);
    }
};

}  // namespace kcenon::transfer_engine

#endif  // KCENON_TRANSFER_ENGINE_BACKEND_STORAGE_BACKEND_H
