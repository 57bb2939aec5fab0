/**
 * @file local_storage_backend.cpp
 * @brief Implementation of the filesystem storage backend
 */

#include <kcenon/transfer_engine/backend/local_storage_backend.h>

#include <kcenon/transfer_engine/core/checksum.h>
#include <kcenon/transfer_engine/core/logging.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>

namespace kcenon::transfer_engine {

namespace {

constexpr std::string_view file_scheme = "file://";

/**
 * @brief Map an errno value from a failed open to an engine error
 */
auto classify_errno(int err, const std::string& what, const std::filesystem::path& path)
    -> error {
    auto detail = what + " '" + path.string() + "': " + std::strerror(err);
    switch (err) {
        case ENOENT:
        case ENOTDIR:
            return error(error_code::object_not_found, detail);
        case EACCES:
        case EPERM:
        case EROFS:
            return error(error_code::permission_denied, detail);
        case EINTR:
        case EAGAIN:
        case EBUSY:
        case EMFILE:
        case ENFILE:
            return error(error_code::transient_error, detail);
        case ENOSPC:
            return error(error_code::destination_write_error, detail);
        default:
            return error(error_code::source_read_error, detail);
    }
}

class local_read_stream : public read_stream {
public:
    local_read_stream(std::ifstream file, std::filesystem::path path, uint64_t remaining)
        : file_(std::move(file)), path_(std::move(path)), remaining_(remaining) {}

    [[nodiscard]] auto read(std::span<std::byte> buffer) -> result<std::size_t> override {
        if (remaining_ == 0 || buffer.empty()) {
            return std::size_t{0};
        }
        auto want = static_cast<std::size_t>(
            std::min<uint64_t>(remaining_, static_cast<uint64_t>(buffer.size())));
        file_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(want));
        auto got = static_cast<std::size_t>(file_.gcount());
        if (file_.bad()) {
            return unexpected(
                error(error_code::source_read_error, "read failed: " + path_.string()));
        }
        if (got < want) {
            // Short file: the object shrank after stat, stop here.
            remaining_ = 0;
        } else {
            remaining_ -= got;
        }
        bytes_read_ += got;
        return got;
    }

    [[nodiscard]] auto bytes_read() const -> uint64_t override { return bytes_read_; }

private:
    std::ifstream file_;
    std::filesystem::path path_;
    uint64_t remaining_;
    uint64_t bytes_read_ = 0;
};

class local_write_stream : public write_stream {
public:
    local_write_stream(std::fstream file, std::filesystem::path path)
        : file_(std::move(file)), path_(std::move(path)) {}

    ~local_write_stream() override {
        if (file_.is_open()) {
            file_.close();
        }
    }

    [[nodiscard]] auto write(std::span<const std::byte> data) -> result<std::size_t> override {
        if (!file_.is_open()) {
            return unexpected(
                error(error_code::destination_write_error, "stream closed: " + path_.string()));
        }
        file_.write(reinterpret_cast<const char*>(data.data()),
                    static_cast<std::streamsize>(data.size()));
        if (!file_) {
            return unexpected(
                error(error_code::destination_write_error, "write failed: " + path_.string()));
        }
        bytes_written_ += data.size();
        return data.size();
    }

    [[nodiscard]] auto flush() -> result<void> override {
        if (file_.is_open()) {
            file_.flush();
            if (!file_) {
                return unexpected(error(error_code::destination_write_error,
                                        "flush failed: " + path_.string()));
            }
        }
        return {};
    }

    [[nodiscard]] auto close() -> result<void> override {
        if (!file_.is_open()) {
            return {};
        }
        file_.close();
        if (file_.fail()) {
            return unexpected(
                error(error_code::destination_write_error, "close failed: " + path_.string()));
        }
        return {};
    }

    [[nodiscard]] auto bytes_written() const -> uint64_t override { return bytes_written_; }

private:
    std::fstream file_;
    std::filesystem::path path_;
    uint64_t bytes_written_ = 0;
};

}  // namespace

local_storage_backend::local_storage_backend(local_backend_config config)
    : config_(config) {}

auto local_storage_backend::to_path(const std::string& locator) -> std::filesystem::path {
    std::string_view view(locator);
    if (view.substr(0, file_scheme.size()) == file_scheme) {
        view.remove_prefix(file_scheme.size());
    }
    return std::filesystem::path(std::string(view));
}

auto local_storage_backend::stat(const std::string& locator) -> result<object_stat> {
    auto path = to_path(locator);
    std::error_code ec;
    auto status = std::filesystem::status(path, ec);
    if (ec || !std::filesystem::exists(status)) {
        if (ec && ec != std::errc::no_such_file_or_directory) {
            return unexpected(classify_errno(ec.value(), "cannot stat", path));
        }
        return unexpected(
            error(error_code::object_not_found, "no such file: " + path.string()));
    }
    if (std::filesystem::is_directory(status)) {
        return unexpected(
            error(error_code::object_not_found, "is a directory: " + path.string()));
    }

    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return unexpected(classify_errno(ec.value(), "cannot stat", path));
    }

    object_stat st;
    st.size = size;
    if (config_.compute_md5_on_stat) {
        auto digest = checksum::md5_file(path);
        if (!digest) {
            return unexpected(digest.error());
        }
        st.md5 = digest.value();
    }
    return st;
}

auto local_storage_backend::open_read_stream(const std::string& locator,
                                             uint64_t start,
                                             std::optional<uint64_t> end)
    -> result<std::unique_ptr<read_stream>> {
    auto st = stat(locator);
    if (!st) {
        return unexpected(st.error());
    }

    auto path = to_path(locator);
    auto size = st.value().size;
    auto stop = end ? std::min(*end, size) : size;
    uint64_t remaining = stop > start ? stop - start : 0;

    errno = 0;
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected(classify_errno(errno != 0 ? errno : EIO, "cannot open", path));
    }
    if (start > 0 && remaining > 0) {
        file.seekg(static_cast<std::streamoff>(start));
        if (!file) {
            return unexpected(error(error_code::invalid_range,
                                    "cannot seek to " + std::to_string(start) + " in " +
                                        path.string()));
        }
    }

    TE_LOG_TRACE(log_category::backend, "opened read stream " + path.string());
    return std::unique_ptr<read_stream>(
        std::make_unique<local_read_stream>(std::move(file), path, remaining));
}

auto local_storage_backend::open_write_stream(const std::string& locator,
                                              const write_options& options)
    -> result<std::unique_ptr<write_stream>> {
    auto path = to_path(locator);

    if (config_.create_parent_directories && path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return unexpected(classify_errno(ec.value(), "cannot create directory",
                                             path.parent_path()));
        }
    }

    // Ranged writes must keep bytes written by sibling ranges, so they only
    // create the file and never truncate it.
    {
        errno = 0;
        auto mode = options.truncate ? std::ios::binary | std::ios::trunc
                                     : std::ios::binary | std::ios::app;
        std::ofstream create(path, mode);
        if (!create) {
            return unexpected(classify_errno(errno != 0 ? errno : EIO, "cannot create", path));
        }
    }

    errno = 0;
    std::fstream file(path, std::ios::binary | std::ios::in | std::ios::out);
    if (!file) {
        return unexpected(classify_errno(errno != 0 ? errno : EIO, "cannot open", path));
    }
    if (options.offset > 0) {
        file.seekp(static_cast<std::streamoff>(options.offset));
        if (!file) {
            return unexpected(error(error_code::destination_write_error,
                                    "cannot seek to " + std::to_string(options.offset) +
                                        " in " + path.string()));
        }
    }

    TE_LOG_TRACE(log_category::backend, "opened write stream " + path.string());
    return std::unique_ptr<write_stream>(
        std::make_unique<local_write_stream>(std::move(file), path));
}

}  // namespace kcenon::transfer_engine
