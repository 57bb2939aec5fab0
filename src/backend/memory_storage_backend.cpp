/**
 * @file memory_storage_backend.cpp
 * @brief Implementation of the in-process object store backend
 */

#include <kcenon/transfer_engine/backend/memory_storage_backend.h>

#include <kcenon/transfer_engine/core/checksum.h>

#include <algorithm>
#include <cstring>
#include <functional>
#include <map>
#include <mutex>

namespace kcenon::transfer_engine {

namespace {

struct stored_object {
    std::vector<std::byte> data;
    std::string md5;
    metadata_map metadata;
};

}  // namespace

struct memory_storage_backend::impl {
    std::string name;
    mutable std::mutex mutex;
    std::map<std::string, std::shared_ptr<const stored_object>> objects;
    std::optional<struct error> probe_error;

    void commit(const std::string& locator, const std::vector<std::byte>& data,
                uint64_t offset, bool truncate, const metadata_map& metadata) {
        std::lock_guard<std::mutex> lock(mutex);
        auto next = std::make_shared<stored_object>();
        auto it = objects.find(locator);
        if (!truncate && it != objects.end()) {
            next->data = it->second->data;
            next->metadata = it->second->metadata;
        }
        auto end = offset + data.size();
        if (next->data.size() < end) {
            next->data.resize(static_cast<std::size_t>(end));
        }
        std::copy(data.begin(), data.end(),
                  next->data.begin() + static_cast<std::ptrdiff_t>(offset));
        for (const auto& [key, value] : metadata) {
            next->metadata[key] = value;
        }
        next->md5 = checksum::md5(std::span<const std::byte>(next->data));
        objects[locator] = std::move(next);
    }
};

namespace {

class memory_read_stream : public read_stream {
public:
    memory_read_stream(std::shared_ptr<const stored_object> object, uint64_t start, uint64_t stop)
        : object_(std::move(object)), position_(start), stop_(stop) {}

    [[nodiscard]] auto read(std::span<std::byte> buffer) -> result<std::size_t> override {
        if (position_ >= stop_) {
            return std::size_t{0};
        }
        auto count = static_cast<std::size_t>(
            std::min<uint64_t>(stop_ - position_, static_cast<uint64_t>(buffer.size())));
        std::memcpy(buffer.data(), object_->data.data() + position_, count);
        position_ += count;
        bytes_read_ += count;
        return count;
    }

    [[nodiscard]] auto bytes_read() const -> uint64_t override { return bytes_read_; }

private:
    std::shared_ptr<const stored_object> object_;
    uint64_t position_;
    uint64_t stop_;
    uint64_t bytes_read_ = 0;
};

class memory_write_stream : public write_stream {
public:
    using commit_fn = std::function<void(const std::vector<std::byte>&)>;

    memory_write_stream(commit_fn commit, std::string locator)
        : commit_(std::move(commit)), locator_(std::move(locator)) {}

    [[nodiscard]] auto write(std::span<const std::byte> data) -> result<std::size_t> override {
        if (closed_) {
            return unexpected(
                error(error_code::destination_write_error, "stream closed: " + locator_));
        }
        buffer_.insert(buffer_.end(), data.begin(), data.end());
        return data.size();
    }

    [[nodiscard]] auto flush() -> result<void> override { return {}; }

    [[nodiscard]] auto close() -> result<void> override {
        if (closed_) {
            return {};
        }
        closed_ = true;
        commit_(buffer_);
        return {};
    }

    [[nodiscard]] auto bytes_written() const -> uint64_t override { return buffer_.size(); }

private:
    commit_fn commit_;
    std::string locator_;
    std::vector<std::byte> buffer_;
    bool closed_ = false;
};

}  // namespace

memory_storage_backend::memory_storage_backend(std::string name)
    : impl_(std::make_shared<impl>()) {
    impl_->name = std::move(name);
}

memory_storage_backend::~memory_storage_backend() = default;

auto memory_storage_backend::name() const -> std::string_view { return impl_->name; }

auto memory_storage_backend::probe() -> result<void> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->probe_error) {
        return unexpected(*impl_->probe_error);
    }
    return {};
}

auto memory_storage_backend::stat(const std::string& locator) -> result<object_stat> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->objects.find(locator);
    if (it == impl_->objects.end()) {
        return unexpected(error(error_code::object_not_found, "no such object: " + locator));
    }
    object_stat st;
    st.size = it->second->data.size();
    st.md5 = it->second->md5;
    return st;
}

auto memory_storage_backend::open_read_stream(const std::string& locator,
                                              uint64_t start,
                                              std::optional<uint64_t> end)
    -> result<std::unique_ptr<read_stream>> {
    std::shared_ptr<const stored_object> object;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        auto it = impl_->objects.find(locator);
        if (it == impl_->objects.end()) {
            return unexpected(error(error_code::object_not_found, "no such object: " + locator));
        }
        object = it->second;
    }
    uint64_t size = object->data.size();
    auto stop = end ? std::min(*end, size) : size;
    auto first = std::min(start, stop);
    return std::unique_ptr<read_stream>(
        std::make_unique<memory_read_stream>(std::move(object), first, stop));
}

auto memory_storage_backend::open_write_stream(const std::string& locator,
                                               const write_options& options)
    -> result<std::unique_ptr<write_stream>> {
    auto commit = [state = impl_, locator, options](const std::vector<std::byte>& data) {
        state->commit(locator, data, options.offset, options.truncate, options.metadata);
    };
    return std::unique_ptr<write_stream>(
        std::make_unique<memory_write_stream>(std::move(commit), locator));
}

void memory_storage_backend::put_object(const std::string& locator, std::string_view content,
                                        metadata_map metadata) {
    auto bytes = std::as_bytes(std::span<const char>(content.data(), content.size()));
    std::vector<std::byte> data(bytes.begin(), bytes.end());
    impl_->commit(locator, data, 0, true, metadata);
}

auto memory_storage_backend::get_object(const std::string& locator) const
    -> std::optional<std::string> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->objects.find(locator);
    if (it == impl_->objects.end()) {
        return std::nullopt;
    }
    const auto& data = it->second->data;
    return std::string(reinterpret_cast<const char*>(data.data()), data.size());
}

auto memory_storage_backend::get_metadata(const std::string& locator) const
    -> std::optional<metadata_map> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->objects.find(locator);
    if (it == impl_->objects.end()) {
        return std::nullopt;
    }
    return it->second->metadata;
}

auto memory_storage_backend::contains(const std::string& locator) const -> bool {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->objects.count(locator) > 0;
}

auto memory_storage_backend::object_count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->objects.size();
}

auto memory_storage_backend::list_objects() const -> std::vector<std::string> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    std::vector<std::string> keys;
    keys.reserve(impl_->objects.size());
    for (const auto& [key, object] : impl_->objects) {
        keys.push_back(key);
    }
    return keys;
}

void memory_storage_backend::remove_object(const std::string& locator) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->objects.erase(locator);
}

void memory_storage_backend::set_probe_error(std::optional<struct error> e) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->probe_error = std::move(e);
}

}  // namespace kcenon::transfer_engine
