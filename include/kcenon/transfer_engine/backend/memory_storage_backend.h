/**
 * @file memory_storage_backend.h
 * @brief In-process object store backend
 */

#ifndef KCENON_TRANSFER_ENGINE_BACKEND_MEMORY_STORAGE_BACKEND_H
#define KCENON_TRANSFER_ENGINE_BACKEND_MEMORY_STORAGE_BACKEND_H

#include <kcenon/transfer_engine/backend/storage_backend.h>

#include <memory>
#include <string>
#include <vector>

namespace kcenon::transfer_engine {

/**
 * @brief Object store held in memory
 *
 * Behaves like a remote object store: writes become visible when the write
 * stream is closed and stat() reports the MD5 digest of the stored content.
 * Used for dry runs and tests.
 *
 * @note Thread-safe: All public methods are safe to call from multiple threads.
 */
class memory_storage_backend : public storage_backend {
public:
    explicit memory_storage_backend(std::string name = "memory");
    ~memory_storage_backend() override;

    memory_storage_backend(const memory_storage_backend&) = delete;
    memory_storage_backend& operator=(const memory_storage_backend&) = delete;

    [[nodiscard]] auto name() const -> std::string_view override;

    [[nodiscard]] auto probe() -> result<void> override;

    [[nodiscard]] auto stat(const std::string& locator) -> result<object_stat> override;

    [[nodiscard]] auto open_read_stream(const std::string& locator,
                                        uint64_t start,
                                        std::optional<uint64_t> end)
        -> result<std::unique_ptr<read_stream>> override;

    [[nodiscard]] auto open_write_stream(const std::string& locator,
                                         const write_options& options)
        -> result<std::unique_ptr<write_stream>> override;

    /**
     * @brief Store an object directly
     */
    void put_object(const std::string& locator, std::string_view content,
                    metadata_map metadata = {});

    /**
     * @brief Get a copy of an object's content
     */
    [[nodiscard]] auto get_object(const std::string& locator) const
        -> std::optional<std::string>;

    [[nodiscard]] auto get_metadata(const std::string& locator) const
        -> std::optional<metadata_map>;

    [[nodiscard]] auto contains(const std::string& locator) const -> bool;

    [[nodiscard]] auto object_count() const -> std::size_t;

    [[nodiscard]] auto list_objects() const -> std::vector<std::string>;

    void remove_object(const std::string& locator);

    /**
     * @brief Make probe() fail with the given error (nullopt clears it)
     */
    void set_probe_error(std::optional<struct error> e);

private:
    struct impl;
    std::shared_ptr<impl> impl_;
};

}  // namespace kcenon::transfer_engine

#endif  // KCENON_TRANSFER_ENGINE_BACKEND_MEMORY_STORAGE_BACKEND_H
