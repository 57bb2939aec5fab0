/**
 * @file transfer_unit.h
 * @brief Transfer unit and transfer result data structures
 *
 * A transfer unit is the smallest schedulable piece of copy work: copy the
 * object at a source locator to a destination locator, optionally restricted
 * to a half-open byte range. Units are immutable once created.
 */

#ifndef KCENON_TRANSFER_ENGINE_CORE_TRANSFER_UNIT_H
#define KCENON_TRANSFER_ENGINE_CORE_TRANSFER_UNIT_H

#include <kcenon/transfer_engine/core/types.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace kcenon::transfer_engine {

using time_point = std::chrono::system_clock::time_point;

/**
 * @brief Opaque destination-side properties carried through unchanged
 */
using metadata_map = std::map<std::string, std::string>;

/**
 * @brief Half-open byte interval [start, end)
 */
struct byte_range {
    uint64_t start = 0;
    uint64_t end = 0;

    byte_range() = default;
    byte_range(uint64_t s, uint64_t e) : start(s), end(e) {}

    [[nodiscard]] auto size() const noexcept -> uint64_t {
        return end > start ? end - start : 0;
    }

    [[nodiscard]] auto empty() const noexcept -> bool { return end <= start; }

    [[nodiscard]] auto operator==(const byte_range&) const -> bool = default;

    [[nodiscard]] auto operator<(const byte_range& other) const -> bool {
        return start != other.start ? start < other.start : end < other.end;
    }

    /**
     * @brief Render as "<start>-<end>"
     */
    [[nodiscard]] auto to_string() const -> std::string;

    /**
     * @brief Parse "<start>-<end>"
     */
    [[nodiscard]] static auto parse(std::string_view text) -> std::optional<byte_range>;
};

/**
 * @brief Deduplication key of a transfer unit
 *
 * Two units with the same identity must never execute concurrently, and the
 * identity is what the manifest is checked against on resume.
 */
struct unit_identity {
    std::string source;
    std::string destination;
    std::optional<byte_range> range;

    [[nodiscard]] auto operator==(const unit_identity&) const -> bool = default;

    [[nodiscard]] auto operator<(const unit_identity& other) const -> bool;

    [[nodiscard]] auto to_string() const -> std::string;
};

/**
 * @brief Immutable unit of transfer work
 *
 * Created through create(), which rejects empty locators, empty or inverted
 * ranges and malformed content hashes.
 *
 * @code
 * auto unit = transfer_unit::create("file:///data/a.bin", "mem://bucket/a.bin");
 * if (!unit) {
 *     std::cerr << unit.error().message << "\n";
 * }
 * @endcode
 */
class transfer_unit {
public:
    /**
     * @brief Create a validated transfer unit
     * @param source Source locator
     * @param destination Destination locator
     * @param range Optional byte range; absent means the whole object
     * @param expected_size Total size of the source object, if known
     * @param content_hash Expected MD5 of the source object (hex)
     * @param metadata Destination-side properties
     */
    [[nodiscard]] static auto create(std::string source,
                                     std::string destination,
                                     std::optional<byte_range> range = std::nullopt,
                                     std::optional<uint64_t> expected_size = std::nullopt,
                                     std::optional<std::string> content_hash = std::nullopt,
                                     metadata_map metadata = {}) -> result<transfer_unit>;

    [[nodiscard]] auto source() const noexcept -> const std::string& { return source_; }
    [[nodiscard]] auto destination() const noexcept -> const std::string& {
        return destination_;
    }
    [[nodiscard]] auto range() const noexcept -> const std::optional<byte_range>& {
        return range_;
    }
    [[nodiscard]] auto expected_size() const noexcept -> std::optional<uint64_t> {
        return expected_size_;
    }
    [[nodiscard]] auto content_hash() const noexcept -> const std::optional<std::string>& {
        return content_hash_;
    }
    [[nodiscard]] auto metadata() const noexcept -> const metadata_map& { return metadata_; }

    [[nodiscard]] auto is_ranged() const noexcept -> bool { return range_.has_value(); }

    [[nodiscard]] auto identity() const -> unit_identity;

    /**
     * @brief Number of bytes this unit is expected to move
     *
     * For a ranged unit this is the part of the range that lies inside the
     * object (requires a known object size unless the range is used as-is).
     * For a whole-object unit it is expected_size.
     *
     * @param object_size Authoritative total size, overriding expected_size
     */
    [[nodiscard]] auto expected_length(std::optional<uint64_t> object_size = std::nullopt) const
        -> std::optional<uint64_t>;

private:
    transfer_unit() = default;

    std::string source_;
    std::string destination_;
    std::optional<byte_range> range_;
    std::optional<uint64_t> expected_size_;
    std::optional<std::string> content_hash_;
    metadata_map metadata_;
};

/**
 * @brief Terminal status of a transfer unit
 */
enum class transfer_status {
    ok,
    skipped,
    error,
};

[[nodiscard]] constexpr auto to_string(transfer_status status) noexcept -> std::string_view {
    switch (status) {
        case transfer_status::ok:
            return "OK";
        case transfer_status::skipped:
            return "skip";
        case transfer_status::error:
            return "error";
        default:
            return "unknown";
    }
}

/**
 * @brief Outcome of executing one transfer unit
 */
struct transfer_result {
    transfer_unit unit;
    transfer_status status = transfer_status::ok;
    uint64_t bytes_transferred = 0;
    time_point start_time;
    time_point end_time;
    std::optional<struct error> err;        // present only when status == error
    uint32_t retries = 0;                   // failed attempts before this result
    std::optional<std::string> md5;         // digest computed while streaming
    std::optional<uint64_t> source_size;    // size reported by the source
    std::string description;

    explicit transfer_result(transfer_unit u) : unit(std::move(u)) {}

    [[nodiscard]] auto is_ok() const noexcept -> bool { return status == transfer_status::ok; }
    [[nodiscard]] auto is_error() const noexcept -> bool {
        return status == transfer_status::error;
    }

    [[nodiscard]] auto elapsed() const -> std::chrono::milliseconds {
        return std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
    }

    [[nodiscard]] static auto make_ok(transfer_unit unit, uint64_t bytes,
                                      time_point start, time_point end) -> transfer_result;

    [[nodiscard]] static auto make_skipped(transfer_unit unit, std::string description,
                                           time_point when) -> transfer_result;

    [[nodiscard]] static auto make_error(transfer_unit unit, struct error e, uint64_t bytes,
                                         time_point start, time_point end) -> transfer_result;
};

}  // namespace kcenon::transfer_engine

template <>
struct std::hash<kcenon::transfer_engine::unit_identity> {
    auto operator()(const kcenon::transfer_engine::unit_identity& id) const noexcept
        -> std::size_t {
        std::size_t seed = std::hash<std::string>{}(id.source);
        auto combine = [&seed](std::size_t h) {
            seed ^= h + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        };
        combine(std::hash<std::string>{}(id.destination));
        if (id.range) {
            combine(std::hash<uint64_t>{}(id.range->start));
            combine(std::hash<uint64_t>{}(id.range->end));
        }
        return seed;
    }
};

#endif  // KCENON_TRANSFER_ENGINE_CORE_TRANSFER_UNIT_H
