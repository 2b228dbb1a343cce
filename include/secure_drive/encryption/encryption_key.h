/**
 * @file encryption_key.h
 * @brief Symmetric key value type with scrubbing on destruction
 */

#ifndef SECURE_DRIVE_ENCRYPTION_ENCRYPTION_KEY_H
#define SECURE_DRIVE_ENCRYPTION_ENCRYPTION_KEY_H

#include <chrono>
#include <cstddef>
#include <span>
#include <string>
#include <vector>

#include "secure_drive/core/types.h"
#include "secure_drive/encryption/encryption_config.h"

namespace secure_drive {

/**
 * @brief AES-256 key material
 *
 * Move-only. The material is always exactly AES_256_KEY_SIZE bytes and is
 * zeroed with OPENSSL_cleanse when the key is destroyed or overwritten.
 */
class encryption_key {
public:
    /**
     * @brief Create a key from raw material
     * @param material Key bytes; any length other than 32 is rejected
     * @param created_at Creation time of the key
     * @return Key, or key_corrupt on a length mismatch
     */
    [[nodiscard]] static auto from_bytes(
        std::span<const std::byte> material,
        std::chrono::system_clock::time_point created_at =
            std::chrono::system_clock::now()) -> result<encryption_key>;

    ~encryption_key();

    encryption_key(const encryption_key&) = delete;
    auto operator=(const encryption_key&) -> encryption_key& = delete;
    encryption_key(encryption_key&& other) noexcept;
    auto operator=(encryption_key&& other) noexcept -> encryption_key&;

    /**
     * @brief Key material; valid only while this key is alive
     */
    [[nodiscard]] auto bytes() const noexcept -> std::span<const std::byte> {
        return material_;
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return material_.size(); }

    [[nodiscard]] auto created_at() const noexcept -> std::chrono::system_clock::time_point {
        return created_at_;
    }

    /**
     * @brief Non-secret identifier: hex of the first 8 bytes of SHA-256(key)
     */
    [[nodiscard]] auto fingerprint() const -> std::string;

    /**
     * @brief Constant-time comparison of key material
     */
    [[nodiscard]] auto equals(const encryption_key& other) const -> bool;

private:
    encryption_key(std::vector<std::byte> material,
                   std::chrono::system_clock::time_point created_at);

    void scrub() noexcept;

    std::vector<std::byte> material_;
    std::chrono::system_clock::time_point created_at_;
};

/**
 * @brief Zero a buffer in a way the optimizer cannot remove
 */
void secure_zero(std::span<std::byte> data) noexcept;

}  // namespace secure_drive

#endif  // SECURE_DRIVE_ENCRYPTION_ENCRYPTION_KEY_H
