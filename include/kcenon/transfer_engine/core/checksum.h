/**
 * @file checksum.h
 * @brief MD5 digest utilities for transfer integrity verification
 */

#ifndef KCENON_TRANSFER_ENGINE_CORE_CHECKSUM_H
#define KCENON_TRANSFER_ENGINE_CORE_CHECKSUM_H

#include <kcenon/transfer_engine/core/types.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace kcenon::transfer_engine {

/**
 * @brief Incremental MD5 hasher backed by OpenSSL EVP
 *
 * Data is fed chunk by chunk while a unit streams, so the digest of a whole
 * object is available when the last chunk has been written.
 *
 * @code
 * md5_hasher hasher;
 * hasher.update(chunk1);
 * hasher.update(chunk2);
 * auto digest = hasher.finalize();   // "9e107d9d372bb6826bd81d3542a419d6"
 * @endcode
 */
class md5_hasher {
public:
    md5_hasher();
    ~md5_hasher();

    md5_hasher(const md5_hasher&) = delete;
    auto operator=(const md5_hasher&) -> md5_hasher& = delete;
    md5_hasher(md5_hasher&&) noexcept;
    auto operator=(md5_hasher&&) noexcept -> md5_hasher&;

    /**
     * @brief Feed data into the digest
     * @return false if the hasher was already finalized or OpenSSL failed
     */
    auto update(std::span<const std::byte> data) -> bool;

    /**
     * @brief Finish the digest
     * @return Lowercase hex digest, or error if OpenSSL failed
     *
     * The hasher cannot be updated after finalize().
     */
    [[nodiscard]] auto finalize() -> result<std::string>;

    [[nodiscard]] auto bytes_hashed() const noexcept -> uint64_t;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Checksum utilities
 */
class checksum {
public:
    /**
     * @brief Calculate MD5 of data
     * @return Lowercase hex digest
     */
    [[nodiscard]] static auto md5(std::span<const std::byte> data) -> std::string;

    [[nodiscard]] static auto md5(std::string_view data) -> std::string;

    /**
     * @brief Calculate MD5 of a file
     * @param path Path to the file
     * @return Lowercase hex digest, or object_not_found if it cannot be opened
     */
    [[nodiscard]] static auto md5_file(const std::filesystem::path& path)
        -> result<std::string>;

    /**
     * @brief Compare two hex digests ignoring case
     */
    [[nodiscard]] static auto digests_equal(std::string_view lhs, std::string_view rhs)
        -> bool;
};

}  // namespace kcenon::transfer_engine

#endif  // KCENON_TRANSFER_ENGINE_CORE_CHECKSUM_H
