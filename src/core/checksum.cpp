/**
 * @file checksum.cpp
 * @brief Implementation of MD5 checksum utilities
 */

#include <kcenon/transfer_engine/core/checksum.h>

#include <openssl/err.h>
#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>

namespace kcenon::transfer_engine {

namespace {

auto get_openssl_error() -> std::string {
    unsigned long err = ERR_get_error();
    if (err == 0) {
        return "Unknown OpenSSL error";
    }
    std::array<char, 256> buffer{};
    ERR_error_string_n(err, buffer.data(), buffer.size());
    return std::string(buffer.data());
}

auto digest_to_hex(const unsigned char* digest, unsigned int length) -> std::string {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string out;
    out.reserve(static_cast<std::size_t>(length) * 2);
    for (unsigned int i = 0; i < length; ++i) {
        out += hex_chars[(digest[i] >> 4) & 0x0F];
        out += hex_chars[digest[i] & 0x0F];
    }
    return out;
}

/**
 * @brief RAII wrapper for EVP_MD_CTX
 */
class evp_md_ctx_wrapper {
public:
    evp_md_ctx_wrapper() : ctx_(EVP_MD_CTX_new()) {}

    ~evp_md_ctx_wrapper() {
        if (ctx_) {
            EVP_MD_CTX_free(ctx_);
        }
    }

    evp_md_ctx_wrapper(const evp_md_ctx_wrapper&) = delete;
    auto operator=(const evp_md_ctx_wrapper&) -> evp_md_ctx_wrapper& = delete;

    [[nodiscard]] auto get() const -> EVP_MD_CTX* { return ctx_; }
    [[nodiscard]] explicit operator bool() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_;
};

}  // namespace

// ============================================================================
// md5_hasher
// ============================================================================

struct md5_hasher::impl {
    evp_md_ctx_wrapper ctx;
    bool ready = false;
    bool finalized = false;
    uint64_t bytes = 0;

    impl() {
        if (ctx && EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) == 1) {
            ready = true;
        }
    }
};

md5_hasher::md5_hasher() : impl_(std::make_unique<impl>()) {}

md5_hasher::~md5_hasher() = default;

md5_hasher::md5_hasher(md5_hasher&&) noexcept = default;

auto md5_hasher::operator=(md5_hasher&&) noexcept -> md5_hasher& = default;

auto md5_hasher::update(std::span<const std::byte> data) -> bool {
    if (!impl_ || !impl_->ready || impl_->finalized) {
        return false;
    }
    if (data.empty()) {
        return true;
    }
    if (EVP_DigestUpdate(impl_->ctx.get(), data.data(), data.size()) != 1) {
        impl_->ready = false;
        return false;
    }
    impl_->bytes += data.size();
    return true;
}

auto md5_hasher::finalize() -> result<std::string> {
    if (!impl_ || !impl_->ready) {
        return unexpected(error(error_code::internal_error,
                                "md5 context unavailable: " + get_openssl_error()));
    }
    if (impl_->finalized) {
        return unexpected(error(error_code::internal_error, "md5 already finalized"));
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(impl_->ctx.get(), digest.data(), &length) != 1) {
        return unexpected(error(error_code::internal_error, get_openssl_error()));
    }
    impl_->finalized = true;
    return digest_to_hex(digest.data(), length);
}

auto md5_hasher::bytes_hashed() const noexcept -> uint64_t {
    return impl_ ? impl_->bytes : 0;
}

// ============================================================================
// checksum
// ============================================================================

auto checksum::md5(std::span<const std::byte> data) -> std::string {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    if (EVP_Digest(data.data(), data.size(), digest.data(), &length, EVP_md5(), nullptr) != 1) {
        return {};
    }
    return digest_to_hex(digest.data(), length);
}

auto checksum::md5(std::string_view data) -> std::string {
    return md5(std::as_bytes(std::span<const char>(data.data(), data.size())));
}

auto checksum::md5_file(const std::filesystem::path& path) -> result<std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected(
            error(error_code::object_not_found, "cannot open file: " + path.string()));
    }

    md5_hasher hasher;
    std::array<char, 64 * 1024> buffer{};
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto bytes_read = file.gcount();
        if (bytes_read > 0) {
            hasher.update(std::as_bytes(
                std::span<const char>(buffer.data(), static_cast<std::size_t>(bytes_read))));
        }
    }
    if (file.bad()) {
        return unexpected(
            error(error_code::source_read_error, "read failed: " + path.string()));
    }
    return hasher.finalize();
}

auto checksum::digests_equal(std::string_view lhs, std::string_view rhs) -> bool {
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
               return std::tolower(static_cast<unsigned char>(a)) ==
                      std::tolower(static_cast<unsigned char>(b));
           });
}

}  // namespace kcenon::transfer_engine
