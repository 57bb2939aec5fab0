/**
 * @file manifest_store.cpp
 * @brief Implementation of the append-only CSV manifest
 */

#include <kcenon/transfer_engine/manifest/manifest_store.h>

#include <kcenon/transfer_engine/core/logging.h>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <charconv>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <fstream>
#include <map>
#include <mutex>
#include <sstream>

namespace kcenon::transfer_engine {

namespace {

constexpr std::size_t manifest_field_count = 9;
constexpr std::string_view range_key = "range=";
constexpr std::string_view retries_key = "retries=";
constexpr std::string_view description_separator = "; ";

struct csv_record {
    std::vector<std::string> fields;
    bool terminated = false;
    std::size_t line = 0;
};

/**
 * @brief Split CSV text into records (RFC 4180 quoting, CRLF tolerated)
 */
auto parse_csv(std::string_view text) -> std::vector<csv_record> {
    std::vector<csv_record> records;
    csv_record current;
    std::string field;
    bool in_quotes = false;
    bool field_quoted = false;
    std::size_t line = 1;
    current.line = line;

    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                if (c == '\n') ++line;
                field += c;
            }
            continue;
        }

        if (c == '"' && field.empty() && !field_quoted) {
            in_quotes = true;
            field_quoted = true;
        } else if (c == ',') {
            current.fields.push_back(std::move(field));
            field.clear();
            field_quoted = false;
        } else if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
            // CRLF: the '\n' ends the record
        } else if (c == '\n') {
            current.fields.push_back(std::move(field));
            field.clear();
            field_quoted = false;
            current.terminated = true;
            records.push_back(std::move(current));
            current = csv_record{};
            current.line = ++line;
        } else {
            field += c;
        }
    }

    if (!current.fields.empty() || !field.empty() || in_quotes || field_quoted) {
        current.fields.push_back(std::move(field));
        current.terminated = false;
        records.push_back(std::move(current));
    }
    return records;
}

auto split_header() -> std::vector<std::string> {
    std::vector<std::string> names;
    std::string_view rest = manifest_header;
    while (true) {
        auto comma = rest.find(',');
        names.emplace_back(rest.substr(0, comma));
        if (comma == std::string_view::npos) break;
        rest.remove_prefix(comma + 1);
    }
    return names;
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

auto parse_status(std::string_view text) -> std::optional<transfer_status> {
    if (text == "OK") return transfer_status::ok;
    if (text == "error") return transfer_status::error;
    if (text == "skip") return transfer_status::skipped;
    return std::nullopt;
}

/**
 * @brief Find "<key><value>" among the "; "-separated description parts
 */
auto find_description_value(std::string_view description, std::string_view key)
    -> std::optional<std::string_view> {
    std::size_t pos = 0;
    while (pos <= description.size()) {
        auto next = description.find(description_separator, pos);
        auto part = description.substr(
            pos, next == std::string_view::npos ? std::string_view::npos : next - pos);
        if (part.substr(0, key.size()) == key) {
            return part.substr(key.size());
        }
        if (next == std::string_view::npos) break;
        pos = next + description_separator.size();
    }
    return std::nullopt;
}

auto errno_message(const std::string& what, const std::filesystem::path& path) -> std::string {
    return what + " '" + path.string() + "': " + std::strerror(errno);
}

/**
 * @brief write() the whole buffer, retrying on EINTR and short writes
 */
auto write_all(int fd, std::string_view data) -> bool {
    while (!data.empty()) {
        auto written = ::write(fd, data.data(), data.size());
        if (written < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data.remove_prefix(static_cast<std::size_t>(written));
    }
    return true;
}

auto read_file(const std::filesystem::path& path) -> result<std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected(error(error_code::manifest_corrupt,
                                "cannot read manifest: " + path.string()));
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    if (file.bad()) {
        return unexpected(error(error_code::manifest_corrupt,
                                "cannot read manifest: " + path.string()));
    }
    return oss.str();
}

auto header_matches(const csv_record& record) -> bool {
    static const auto expected = split_header();
    return record.fields == expected;
}

}  // namespace

// ============================================================================
// Free helpers
// ============================================================================

auto format_iso8601(time_point tp) -> std::string {
    auto time_t_val = std::chrono::system_clock::to_time_t(tp);
    auto since_epoch = tp.time_since_epoch();
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(since_epoch) -
                  std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    if (micros.count() < 0) {
        micros += std::chrono::seconds(1);
        time_t_val -= 1;
    }

    std::tm tm_buf{};
    gmtime_r(&time_t_val, &tm_buf);

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06lldZ",
                  tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<long long>(micros.count()));
    return buf;
}

auto parse_iso8601(std::string_view text) -> std::optional<time_point> {
    if (text.size() < 20 || text.back() != 'Z') {
        return std::nullopt;
    }

    std::tm tm_buf{};
    int consumed = 0;
    std::string copy(text);
    if (std::sscanf(copy.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &tm_buf.tm_year, &tm_buf.tm_mon,
                    &tm_buf.tm_mday, &tm_buf.tm_hour, &tm_buf.tm_min, &tm_buf.tm_sec,
                    &consumed) != 6) {
        return std::nullopt;
    }
    tm_buf.tm_year -= 1900;
    tm_buf.tm_mon -= 1;

    std::chrono::microseconds fraction{0};
    std::string_view rest = text.substr(static_cast<std::size_t>(consumed));
    if (!rest.empty() && rest.front() == '.') {
        rest.remove_prefix(1);
        auto digits = rest.substr(0, rest.size() - 1);
        if (digits.empty() || digits.size() > 9) {
            return std::nullopt;
        }
        auto value = parse_uint(digits);
        if (!value) {
            return std::nullopt;
        }
        uint64_t scaled = *value;
        for (auto n = digits.size(); n < 6; ++n) scaled *= 10;
        for (auto n = digits.size(); n > 6; --n) scaled /= 10;
        fraction = std::chrono::microseconds(static_cast<int64_t>(scaled));
    } else if (rest != "Z") {
        return std::nullopt;
    }

    auto seconds = timegm(&tm_buf);
    if (seconds == static_cast<time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::time_point_cast<time_point::duration>(
        std::chrono::system_clock::from_time_t(seconds) + fraction);
}

auto csv_escape(std::string_view field) -> std::string {
    if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
        return std::string(field);
    }
    std::string out;
    out.reserve(field.size() + 2);
    out += '"';
    for (char c : field) {
        if (c == '"') {
            out += '"';
        }
        out += c;
    }
    out += '"';
    return out;
}

// ============================================================================
// manifest_entry
// ============================================================================

auto manifest_entry::from_result(const transfer_result& outcome) -> manifest_entry {
    manifest_entry entry;
    entry.source = outcome.unit.source();
    entry.destination = outcome.unit.destination();
    entry.start_time = outcome.start_time;
    entry.end_time = outcome.end_time;
    entry.md5 = outcome.md5;
    entry.source_size = outcome.source_size ? outcome.source_size : outcome.unit.expected_size();
    entry.status = outcome.status;
    entry.bytes_transferred = outcome.status == transfer_status::ok ? outcome.bytes_transferred : 0;

    std::vector<std::string> parts;
    if (outcome.err) {
        parts.push_back(outcome.err->describe());
    }
    if (!outcome.description.empty()) {
        parts.push_back(outcome.description);
    }
    if (outcome.unit.range()) {
        parts.push_back(std::string(range_key) + outcome.unit.range()->to_string());
    }
    if (outcome.retries > 0) {
        parts.push_back(std::string(retries_key) + std::to_string(outcome.retries));
    }
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) entry.description += description_separator;
        entry.description += parts[i];
    }
    return entry;
}

auto manifest_entry::to_csv_row() const -> std::string {
    std::string row;
    row.reserve(source.size() + destination.size() + description.size() + 128);
    row += csv_escape(source);
    row += ',';
    row += csv_escape(destination);
    row += ',';
    if (start_time) row += format_iso8601(*start_time);
    row += ',';
    if (end_time) row += format_iso8601(*end_time);
    row += ',';
    if (md5) row += csv_escape(*md5);
    row += ',';
    if (source_size) row += std::to_string(*source_size);
    row += ',';
    row += std::to_string(status == transfer_status::ok ? bytes_transferred : 0);
    row += ',';
    row += to_string(status);
    row += ',';
    row += csv_escape(description);
    row += '\n';
    return row;
}

auto manifest_entry::range() const -> std::optional<byte_range> {
    auto value = find_description_value(description, range_key);
    if (!value) {
        return std::nullopt;
    }
    return byte_range::parse(*value);
}

auto manifest_entry::retries() const -> uint32_t {
    auto value = find_description_value(description, retries_key);
    if (!value) {
        return 0;
    }
    auto parsed = parse_uint(*value);
    return parsed ? static_cast<uint32_t>(*parsed) : 0;
}

auto manifest_entry::from_fields(const std::vector<std::string>& fields)
    -> result<manifest_entry> {
    if (fields.size() != manifest_field_count) {
        return unexpected(error(error_code::manifest_corrupt,
                                "expected " + std::to_string(manifest_field_count) +
                                    " fields, found " + std::to_string(fields.size())));
    }

    manifest_entry entry;
    // Empty locators are legal: rejected requests are recorded as they came in.
    entry.source = fields[0];
    entry.destination = fields[1];

    if (!fields[2].empty()) {
        entry.start_time = parse_iso8601(fields[2]);
        if (!entry.start_time) {
            return unexpected(error(error_code::manifest_corrupt, "bad Start: " + fields[2]));
        }
    }
    if (!fields[3].empty()) {
        entry.end_time = parse_iso8601(fields[3]);
        if (!entry.end_time) {
            return unexpected(error(error_code::manifest_corrupt, "bad End: " + fields[3]));
        }
    }
    if (!fields[4].empty()) {
        entry.md5 = fields[4];
    }
    if (!fields[5].empty()) {
        entry.source_size = parse_uint(fields[5]);
        if (!entry.source_size) {
            return unexpected(
                error(error_code::manifest_corrupt, "bad Source Size: " + fields[5]));
        }
    }
    auto bytes = fields[6].empty() ? std::optional<uint64_t>(0) : parse_uint(fields[6]);
    if (!bytes) {
        return unexpected(
            error(error_code::manifest_corrupt, "bad Bytes Transferred: " + fields[6]));
    }
    entry.bytes_transferred = *bytes;

    auto status = parse_status(fields[7]);
    if (!status) {
        return unexpected(error(error_code::manifest_corrupt, "bad Result: " + fields[7]));
    }
    entry.status = *status;
    entry.description = fields[8];
    return entry;
}

// ============================================================================
// manifest_store::impl
// ============================================================================

struct manifest_store::impl {
    std::filesystem::path path;
    int fd = -1;
    std::mutex write_mutex;
    uint64_t rows = 0;

    ~impl() {
        if (fd >= 0) {
            ::close(fd);
        }
    }

    auto durable_write(std::string_view data) -> result<void> {
        if (!write_all(fd, data)) {
            return unexpected(
                error(error_code::manifest_write_failed, errno_message("write failed", path)));
        }
        if (::fsync(fd) != 0) {
            return unexpected(
                error(error_code::manifest_write_failed, errno_message("fsync failed", path)));
        }
        return {};
    }

    /**
     * @brief Read the first line of the file (without the newline)
     */
    auto read_first_line(uint64_t file_size) -> result<std::string> {
        std::string line;
        char buf[512];
        off_t offset = 0;
        while (static_cast<uint64_t>(offset) < file_size && line.size() < 64 * 1024) {
            auto got = ::pread(fd, buf, sizeof(buf), offset);
            if (got < 0) {
                if (errno == EINTR) continue;
                return unexpected(error(error_code::manifest_corrupt,
                                        errno_message("cannot read header", path)));
            }
            if (got == 0) break;
            std::string_view chunk(buf, static_cast<std::size_t>(got));
            auto newline = chunk.find('\n');
            if (newline != std::string_view::npos) {
                line.append(chunk.substr(0, newline));
                break;
            }
            line.append(chunk);
            offset += got;
        }
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        return line;
    }

    auto last_byte(uint64_t file_size) -> result<char> {
        char c = 0;
        while (true) {
            auto got = ::pread(fd, &c, 1, static_cast<off_t>(file_size - 1));
            if (got < 0 && errno == EINTR) continue;
            if (got != 1) {
                return unexpected(error(error_code::manifest_corrupt,
                                        errno_message("cannot read manifest tail", path)));
            }
            return c;
        }
    }
};

// ============================================================================
// manifest_store
// ============================================================================

manifest_store::manifest_store() : impl_(std::make_unique<impl>()) {}

manifest_store::~manifest_store() = default;

auto manifest_store::open(const std::filesystem::path& path)
    -> result<std::unique_ptr<manifest_store>> {
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return unexpected(error(error_code::manifest_write_failed,
                                    "cannot create manifest directory: " + ec.message()));
        }
    }

    std::unique_ptr<manifest_store> store(new manifest_store());
    auto& state = *store->impl_;
    state.path = path;
    state.fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (state.fd < 0) {
        return unexpected(
            error(error_code::manifest_write_failed, errno_message("cannot open manifest", path)));
    }

    struct stat st {};
    if (::fstat(state.fd, &st) != 0) {
        return unexpected(
            error(error_code::manifest_write_failed, errno_message("cannot stat manifest", path)));
    }
    auto file_size = static_cast<uint64_t>(st.st_size);

    if (file_size == 0) {
        auto written = state.durable_write(std::string(manifest_header) + "\n");
        if (!written) {
            return unexpected(written.error());
        }
        TE_LOG_INFO(log_category::manifest, "created manifest " + path.string());
        return store;
    }

    auto first_line = state.read_first_line(file_size);
    if (!first_line) {
        return unexpected(first_line.error());
    }
    if (first_line.value() != manifest_header) {
        TE_LOG_ERROR(log_category::manifest, "unexpected manifest header in " + path.string());
        return unexpected(error(error_code::manifest_corrupt,
                                "unexpected header in " + path.string() + ": " +
                                    first_line.value()));
    }

    auto tail = state.last_byte(file_size);
    if (!tail) {
        return unexpected(tail.error());
    }
    if (tail.value() != '\n') {
        TE_LOG_WARN(log_category::manifest,
                    "terminating partial trailing row in " + path.string());
        auto written = state.durable_write("\n");
        if (!written) {
            return unexpected(written.error());
        }
    }

    TE_LOG_INFO(log_category::manifest, "opened manifest " + path.string());
    return store;
}

auto manifest_store::append(const transfer_result& outcome) -> result<void> {
    return append(manifest_entry::from_result(outcome));
}

auto manifest_store::append(const manifest_entry& entry) -> result<void> {
    auto row = entry.to_csv_row();

    std::lock_guard<std::mutex> lock(impl_->write_mutex);
    auto written = impl_->durable_write(row);
    if (!written) {
        TE_LOG_ERROR(log_category::manifest, written.error().describe());
        return written;
    }
    ++impl_->rows;
    return {};
}

auto manifest_store::path() const -> const std::filesystem::path& {
    return impl_->path;
}

auto manifest_store::rows_appended() const -> uint64_t {
    std::lock_guard<std::mutex> lock(impl_->write_mutex);
    return impl_->rows;
}

auto manifest_store::read_entries(const std::filesystem::path& path)
    -> result<std::vector<manifest_entry>> {
    std::vector<manifest_entry> entries;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return entries;
    }

    auto content = read_file(path);
    if (!content) {
        return unexpected(content.error());
    }
    if (content.value().empty()) {
        return entries;
    }

    auto records = parse_csv(content.value());
    if (records.empty() || !header_matches(records.front())) {
        return unexpected(error(error_code::manifest_corrupt,
                                "unexpected header in " + path.string()));
    }

    for (std::size_t i = 1; i < records.size(); ++i) {
        const auto& record = records[i];
        if (record.fields.size() == 1 && record.fields.front().empty()) {
            continue;
        }
        if (!record.terminated) {
            TE_LOG_WARN(log_category::manifest,
                        "skipping partial row at line " + std::to_string(record.line) +
                            " of " + path.string());
            continue;
        }
        auto entry = manifest_entry::from_fields(record.fields);
        if (!entry) {
            TE_LOG_WARN(log_category::manifest,
                        "skipping malformed row at line " + std::to_string(record.line) +
                            " of " + path.string() + ": " + entry.error().message);
            continue;
        }
        entries.push_back(std::move(entry.value()));
    }
    return entries;
}

auto manifest_store::load_completed(const std::filesystem::path& path)
    -> result<completed_set> {
    auto entries = read_entries(path);
    if (!entries) {
        return unexpected(entries.error());
    }

    using pair_key = std::pair<std::string, std::string>;
    std::map<pair_key, transfer_status> last_pair;
    std::map<pair_key, std::map<byte_range, transfer_status>> last_range;

    for (const auto& entry : entries.value()) {
        pair_key key{entry.source, entry.destination};
        auto range = entry.range();
        if (range) {
            last_range[key][*range] = entry.status;
        } else {
            // A whole-object row supersedes every earlier range row of the pair.
            last_pair[key] = entry.status;
            last_range.erase(key);
        }
    }

    auto done = [](transfer_status s) {
        return s == transfer_status::ok || s == transfer_status::skipped;
    };

    completed_set completed;
    for (const auto& [pair, status] : last_pair) {
        if (done(status)) {
            completed.pairs.insert(pair);
        }
    }
    for (const auto& [pair, ranges] : last_range) {
        for (const auto& [range, status] : ranges) {
            if (done(status)) {
                completed.ranges.insert(unit_identity{pair.first, pair.second, range});
            }
        }
    }

    TE_LOG_INFO(log_category::manifest,
                "loaded " + std::to_string(entries.value().size()) + " rows from " +
                    path.string() + ", " + std::to_string(completed.pairs.size()) +
                    " completed objects, " + std::to_string(completed.ranges.size()) +
                    " completed ranges");
    return completed;
}

}  // namespace kcenon::transfer_engine
