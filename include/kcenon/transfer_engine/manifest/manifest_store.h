/**
 * @file manifest_store.h
 * @brief Durable, append-only record of transfer results
 *
 * The manifest is a CSV file with one row per terminal unit result. It is
 * the authority for resume: pairs whose last row is OK or skip are not
 * scheduled again.
 *
 * Format:
 * @code
 * Source,Destination,Start,End,Md5,Source Size,Bytes Transferred,Result,Description
 * file:///data/a,mem://bkt/a,2025-01-31T08:15:02.123456Z,2025-01-31T08:15:02.200000Z,...,OK,
 * @endcode
 *
 * - Result is one of OK, error, skip
 * - Bytes Transferred is 0 unless Result is OK
 * - Start and End are ISO-8601 UTC with a trailing Z
 * - absent values are empty fields
 * - fields containing separators, quotes or newlines are quoted (RFC 4180)
 * - ranged units carry "range=<start>-<end>" in Description, retried units
 *   carry "retries=<n>"
 * - a split object gets one more row without a range once all of its
 *   ranges are in place and verified
 * - Source or Destination may be empty for requests rejected before they
 *   became units
 */

#ifndef KCENON_TRANSFER_ENGINE_MANIFEST_MANIFEST_STORE_H
#define KCENON_TRANSFER_ENGINE_MANIFEST_MANIFEST_STORE_H

#include <kcenon/transfer_engine/core/transfer_unit.h>
#include <kcenon/transfer_engine/core/types.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

namespace kcenon::transfer_engine {

/**
 * @brief Exact header line of a manifest file (without newline)
 */
inline constexpr std::string_view manifest_header =
    "Source,Destination,Start,End,Md5,Source Size,Bytes Transferred,Result,Description";

/**
 * @brief One manifest row
 */
struct manifest_entry {
    std::string source;
    std::string destination;
    std::optional<time_point> start_time;
    std::optional<time_point> end_time;
    std::optional<std::string> md5;
    std::optional<uint64_t> source_size;
    uint64_t bytes_transferred = 0;
    transfer_status status = transfer_status::ok;
    std::string description;

    /**
     * @brief Build the row recorded for a terminal result
     */
    [[nodiscard]] static auto from_result(const transfer_result& outcome) -> manifest_entry;

    /**
     * @brief Serialize as one CSV record terminated by '\n'
     */
    [[nodiscard]] auto to_csv_row() const -> std::string;

    /**
     * @brief Byte range recorded in the description, if any
     */
    [[nodiscard]] auto range() const -> std::optional<byte_range>;

    /**
     * @brief Retry count recorded in the description (0 when absent)
     */
    [[nodiscard]] auto retries() const -> uint32_t;

    /**
     * @brief Build an entry from parsed CSV fields
     * @return manifest_corrupt when the field count or a value is invalid
     */
    [[nodiscard]] static auto from_fields(const std::vector<std::string>& fields)
        -> result<manifest_entry>;
};

/**
 * @brief Work already completed according to a manifest
 */
struct completed_set {
    /// Whole-object pairs whose last row is OK or skip
    std::set<std::pair<std::string, std::string>> pairs;

    /// Ranged units whose last row is OK or skip
    std::unordered_set<unit_identity> ranges;

    [[nodiscard]] auto contains(const std::string& source,
                                const std::string& destination) const -> bool {
        return pairs.count({source, destination}) > 0;
    }

    /**
     * @brief Check a unit; a completed pair also covers all of its ranges
     */
    [[nodiscard]] auto contains(const transfer_unit& unit) const -> bool {
        if (contains(unit.source(), unit.destination())) {
            return true;
        }
        return unit.is_ranged() && ranges.count(unit.identity()) > 0;
    }

    [[nodiscard]] auto empty() const -> bool { return pairs.empty() && ranges.empty(); }
};

/**
 * @brief Append-only manifest writer
 *
 * Owns the open file for its lifetime. append() is serialized by an
 * internal mutex and returns only after the row has been written with a
 * single write() and fsync()ed.
 *
 * @code
 * auto manifest = manifest_store::open("/var/tmp/batch.csv");
 * if (!manifest) {
 *     return unexpected(manifest.error());
 * }
 * auto appended = manifest.value()->append(result);
 * @endcode
 */
class manifest_store {
public:
    /**
     * @brief Open or create a manifest
     *
     * Creates the file with its header when absent or empty. Fails with
     * manifest_corrupt when an existing header differs. A trailing partial
     * row is terminated so the next row starts on its own line.
     */
    [[nodiscard]] static auto open(const std::filesystem::path& path)
        -> result<std::unique_ptr<manifest_store>>;

    ~manifest_store();

    manifest_store(const manifest_store&) = delete;
    auto operator=(const manifest_store&) -> manifest_store& = delete;
    manifest_store(manifest_store&&) = delete;
    auto operator=(manifest_store&&) -> manifest_store& = delete;

    /**
     * @brief Durably append the row for a terminal result
     * @return manifest_write_failed when the row could not be persisted
     */
    [[nodiscard]] auto append(const transfer_result& outcome) -> result<void>;

    [[nodiscard]] auto append(const manifest_entry& entry) -> result<void>;

    [[nodiscard]] auto path() const -> const std::filesystem::path&;

    [[nodiscard]] auto rows_appended() const -> uint64_t;

    /**
     * @brief Scan a manifest and collect completed work
     *
     * The last row for a pair (or ranged identity) wins, and a whole-object
     * row also supersedes the earlier range rows of its pair. Malformed rows
     * are skipped with a warning. A missing file yields an empty set.
     */
    [[nodiscard]] static auto load_completed(const std::filesystem::path& path)
        -> result<completed_set>;

    /**
     * @brief Read all well-formed rows in file order
     */
    [[nodiscard]] static auto read_entries(const std::filesystem::path& path)
        -> result<std::vector<manifest_entry>>;

private:
    manifest_store();

    struct impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Format a time point as ISO-8601 UTC, e.g. 2025-01-31T08:15:02.123456Z
 */
[[nodiscard]] auto format_iso8601(time_point tp) -> std::string;

/**
 * @brief Parse an ISO-8601 UTC timestamp produced by format_iso8601
 */
[[nodiscard]] auto parse_iso8601(std::string_view text) -> std::optional<time_point>;

/**
 * @brief Quote a CSV field when it contains separators, quotes or newlines
 */
[[nodiscard]] auto csv_escape(std::string_view field) -> std::string;

}  // namespace kcenon::transfer_engine

#endif  // KCENON_TRANSFER_ENGINE_MANIFEST_MANIFEST_STORE_H
