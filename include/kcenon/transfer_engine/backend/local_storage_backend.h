/**
 * @file local_storage_backend.h
 * @brief Filesystem storage backend
 */

#ifndef KCENON_TRANSFER_ENGINE_BACKEND_LOCAL_STORAGE_BACKEND_H
#define KCENON_TRANSFER_ENGINE_BACKEND_LOCAL_STORAGE_BACKEND_H

#include <kcenon/transfer_engine/backend/storage_backend.h>

#include <filesystem>

namespace kcenon::transfer_engine {

/**
 * @brief Local backend configuration
 */
struct local_backend_config {
    /// Create missing parent directories when opening a write stream
    bool create_parent_directories = true;

    /// Compute MD5 of the file in stat(); costs a full read per call
    bool compute_md5_on_stat = false;
};

/**
 * @brief Storage backend over the local filesystem
 *
 * Locators are plain paths or file:// URLs.
 */
class local_storage_backend : public storage_backend {
public:
    explicit local_storage_backend(local_backend_config config = {});
    ~local_storage_backend() override = default;

    [[nodiscard]] auto name() const -> std::string_view override { return "local"; }

    [[nodiscard]] auto stat(const std::string& locator) -> result<object_stat> override;

    [[nodiscard]] auto open_read_stream(const std::string& locator,
                                        uint64_t start,
                                        std::optional<uint64_t> end)
        -> result<std::unique_ptr<read_stream>> override;

    [[nodiscard]] auto open_write_stream(const std::string& locator,
                                         const write_options& options)
        -> result<std::unique_ptr<write_stream>> override;

    /**
     * @brief Convert a locator into a filesystem path
     *
     * "file:///tmp/a" and "/tmp/a" both resolve to "/tmp/a".
     */
    [[nodiscard]] static auto to_path(const std::string& locator) -> std::filesystem::path;

private:
    local_backend_config config_;
};

}  // namespace kcenon::transfer_engine

#endif  // KCENON_TRANSFER_ENGINE_BACKEND_LOCAL_STORAGE_BACKEND_H
