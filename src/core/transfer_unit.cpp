/**
 * @file transfer_unit.cpp
 * @brief Implementation of transfer unit validation and helpers
 */

#include <kcenon/transfer_engine/core/transfer_unit.h>

#include <algorithm>
#include <cctype>
#include <charconv>

namespace kcenon::transfer_engine {

namespace {

auto is_hex_digest(std::string_view text) -> bool {
    return text.size() == 32 && std::all_of(text.begin(), text.end(), [](char c) {
               return std::isxdigit(static_cast<unsigned char>(c)) != 0;
           });
}

auto parse_uint(std::string_view text) -> std::optional<uint64_t> {
    if (text.empty()) {
        return std::nullopt;
    }
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

// ============================================================================
// byte_range
// ============================================================================

auto byte_range::to_string() const -> std::string {
    return std::to_string(start) + "-" + std::to_string(end);
}

auto byte_range::parse(std::string_view text) -> std::optional<byte_range> {
    auto dash = text.find('-');
    if (dash == std::string_view::npos) {
        return std::nullopt;
    }
    auto s = parse_uint(text.substr(0, dash));
    auto e = parse_uint(text.substr(dash + 1));
    if (!s || !e) {
        return std::nullopt;
    }
    return byte_range{*s, *e};
}

// ============================================================================
// unit_identity
// ============================================================================

auto unit_identity::operator<(const unit_identity& other) const -> bool {
    if (source != other.source) return source < other.source;
    if (destination != other.destination) return destination < other.destination;
    return range < other.range;
}

auto unit_identity::to_string() const -> std::string {
    std::string out = source + " -> " + destination;
    if (range) {
        out += " [" + range->to_string() + ")";
    }
    return out;
}

// ============================================================================
// transfer_unit
// ============================================================================

auto transfer_unit::create(std::string source,
                           std::string destination,
                           std::optional<byte_range> range,
                           std::optional<uint64_t> expected_size,
                           std::optional<std::string> content_hash,
                           metadata_map metadata) -> result<transfer_unit> {
    if (source.empty()) {
        return unexpected(error(error_code::invalid_argument, "source locator is empty"));
    }
    if (destination.empty()) {
        return unexpected(error(error_code::invalid_argument, "destination locator is empty"));
    }
    if (range && range->empty()) {
        return unexpected(
            error(error_code::invalid_range, "byte range is empty: " + range->to_string()));
    }
    if (content_hash) {
        if (!is_hex_digest(*content_hash)) {
            return unexpected(error(error_code::invalid_argument,
                                    "content hash is not an MD5 hex digest: " + *content_hash));
        }
        std::transform(content_hash->begin(), content_hash->end(), content_hash->begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    }

    transfer_unit unit;
    unit.source_ = std::move(source);
    unit.destination_ = std::move(destination);
    unit.range_ = range;
    unit.expected_size_ = expected_size;
    unit.content_hash_ = std::move(content_hash);
    unit.metadata_ = std::move(metadata);
    return unit;
}

auto transfer_unit::identity() const -> unit_identity {
    return unit_identity{source_, destination_, range_};
}

auto transfer_unit::expected_length(std::optional<uint64_t> object_size) const
    -> std::optional<uint64_t> {
    auto total = object_size ? object_size : expected_size_;
    if (!range_) {
        return total;
    }
    if (!total) {
        return range_->size();
    }
    if (range_->start >= *total) {
        return 0;
    }
    return std::min(range_->end, *total) - range_->start;
}

// ============================================================================
// transfer_result
// ============================================================================

auto transfer_result::make_ok(transfer_unit unit, uint64_t bytes,
                              time_point start, time_point end) -> transfer_result {
    transfer_result r(std::move(unit));
    r.status = transfer_status::ok;
    r.bytes_transferred = bytes;
    r.start_time = start;
    r.end_time = end;
    return r;
}

auto transfer_result::make_skipped(transfer_unit unit, std::string description,
                                   time_point when) -> transfer_result {
    transfer_result r(std::move(unit));
    r.status = transfer_status::skipped;
    r.start_time = when;
    r.end_time = when;
    r.description = std::move(description);
    return r;
}

auto transfer_result::make_error(transfer_unit unit, struct error e, uint64_t bytes,
                                 time_point start, time_point end) -> transfer_result {
    transfer_result r(std::move(unit));
    r.status = transfer_status::error;
    r.bytes_transferred = bytes;
    r.start_time = start;
    r.end_time = end;
    r.err = std::move(e);
    return r;
}

}  // namespace kcenon::transfer_engine
