/**
 * @file encryption_key.cpp
 * @brief Symmetric key value type implementation
 */

#include "secure_drive/encryption/encryption_key.h"

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <array>

namespace secure_drive {

void secure_zero(std::span<std::byte> data) noexcept {
    if (!data.empty()) {
        OPENSSL_cleanse(data.data(), data.size());
    }
}

encryption_key::encryption_key(std::vector<std::byte> material,
                               std::chrono::system_clock::time_point created_at)
    : material_(std::move(material)), created_at_(created_at) {}

encryption_key::~encryption_key() {
    scrub();
}

encryption_key::encryption_key(encryption_key&& other) noexcept
    : material_(std::move(other.material_)), created_at_(other.created_at_) {
    other.material_.clear();
}

auto encryption_key::operator=(encryption_key&& other) noexcept -> encryption_key& {
    if (this != &other) {
        scrub();
        material_ = std::move(other.material_);
        created_at_ = other.created_at_;
        other.material_.clear();
    }
    return *this;
}

auto encryption_key::from_bytes(
    std::span<const std::byte> material,
    std::chrono::system_clock::time_point created_at) -> result<encryption_key> {
    if (material.size() != AES_256_KEY_SIZE) {
        return unexpected(error(error_code::key_corrupt,
                                "Invalid key length: expected " +
                                std::to_string(AES_256_KEY_SIZE) + " bytes, got " +
                                std::to_string(material.size())));
    }
    return encryption_key(std::vector<std::byte>(material.begin(), material.end()),
                          created_at);
}

auto encryption_key::fingerprint() const -> std::string {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_len = 0;
    if (material_.empty() ||
        EVP_Digest(material_.data(), material_.size(), digest.data(), &digest_len,
                   EVP_sha256(), nullptr) != 1) {
        return {};
    }

    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(16);
    for (unsigned int i = 0; i < 8 && i < digest_len; ++i) {
        result.push_back(hex_chars[digest[i] >> 4]);
        result.push_back(hex_chars[digest[i] & 0x0F]);
    }
    return result;
}

auto encryption_key::equals(const encryption_key& other) const -> bool {
    if (material_.size() != other.material_.size()) {
        return false;
    }
    return CRYPTO_memcmp(material_.data(), other.material_.data(), material_.size()) == 0;
}

void encryption_key::scrub() noexcept {
    secure_zero(material_);
    material_.clear();
}

}  // namespace secure_drive
