/**
 * @file checksum.cpp
 * @brief Implementation of checksum utilities
 */

#include <custody/upload/core/checksum.h>

#include <iomanip>
#include <sstream>

#include <openssl/evp.h>
#include <openssl/sha.h>

namespace custody::upload {

namespace {

constexpr const char* BASE64_CHARS =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

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

    [[nodiscard]] auto valid() const -> bool { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_;
};

}  // namespace

// ============================================================================
// checksum
// ============================================================================

auto checksum::sha256_digest(std::span<const std::byte> data) -> std::vector<uint8_t> {
    std::vector<uint8_t> digest(SHA256_DIGEST_LENGTH);
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest.data());
    return digest;
}

auto checksum::sha256(std::span<const std::byte> data) -> std::string {
    auto digest = sha256_digest(data);
    return to_hex(digest);
}

auto checksum::sha256(std::string_view text) -> std::string {
    return sha256(std::as_bytes(std::span<const char>(text.data(), text.size())));
}

auto checksum::sha256_base64(std::span<const std::byte> data) -> std::string {
    auto digest = sha256_digest(data);
    return base64_encode(digest);
}

auto checksum::base64_encode(std::span<const uint8_t> data) -> std::string {
    std::string result;
    result.reserve(((data.size() + 2) / 3) * 4);

    for (std::size_t i = 0; i < data.size(); i += 3) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        if (i + 1 < data.size()) n |= static_cast<uint32_t>(data[i + 1]) << 8;
        if (i + 2 < data.size()) n |= static_cast<uint32_t>(data[i + 2]);

        result += BASE64_CHARS[(n >> 18) & 0x3F];
        result += BASE64_CHARS[(n >> 12) & 0x3F];
        result += (i + 1 < data.size()) ? BASE64_CHARS[(n >> 6) & 0x3F] : '=';
        result += (i + 2 < data.size()) ? BASE64_CHARS[n & 0x3F] : '=';
    }

    return result;
}

auto checksum::to_hex(std::span<const uint8_t> data) -> std::string {
    std::ostringstream oss;
    for (auto byte : data) {
        oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(byte);
    }
    return oss.str();
}

auto checksum::is_sha256_hex(std::string_view value) -> bool {
    if (value.size() != sha256_digest_size * 2) {
        return false;
    }
    for (char c : value) {
        bool digit = c >= '0' && c <= '9';
        bool lower = c >= 'a' && c <= 'f';
        bool upper = c >= 'A' && c <= 'F';
        if (!digit && !lower && !upper) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// sha256_hasher
// ============================================================================

class sha256_hasher::impl {
public:
    impl() { reset(); }

    auto update(std::span<const std::byte> data) -> result<void> {
        if (!ready_) {
            return unexpected{error{error_code::internal_error, "SHA-256 context not initialized"}};
        }
        if (data.empty()) {
            return {};
        }
        if (EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) != 1) {
            return unexpected{error{error_code::internal_error, "EVP_DigestUpdate failed"}};
        }
        return {};
    }

    auto finalize() -> result<std::string> {
        if (!ready_) {
            return unexpected{error{error_code::internal_error, "SHA-256 context not initialized"}};
        }

        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int length = 0;
        if (EVP_DigestFinal_ex(ctx_.get(), digest, &length) != 1) {
            reset();
            return unexpected{error{error_code::internal_error, "EVP_DigestFinal_ex failed"}};
        }

        auto hex = checksum::to_hex(std::span<const uint8_t>(digest, length));
        reset();
        return hex;
    }

private:
    void reset() {
        ready_ = ctx_.valid() && EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) == 1;
    }

    evp_md_ctx_wrapper ctx_;
    bool ready_ = false;
};

sha256_hasher::sha256_hasher() : impl_(std::make_unique<impl>()) {}

sha256_hasher::~sha256_hasher() = default;

sha256_hasher::sha256_hasher(sha256_hasher&&) noexcept = default;

auto sha256_hasher::operator=(sha256_hasher&&) noexcept -> sha256_hasher& = default;

auto sha256_hasher::update(std::span<const std::byte> data) -> result<void> {
    return impl_->update(data);
}

auto sha256_hasher::finalize() -> result<std::string> {
    return impl_->finalize();
}

}  // namespace custody::upload
