/**
 * @file encryption_config.h
 * @brief Encryption constants and configuration types
 *
 * This file defines the fixed parameters of the container format and the
 * tunables of the codec and key store.
 */

#ifndef SECURE_DRIVE_ENCRYPTION_ENCRYPTION_CONFIG_H
#define SECURE_DRIVE_ENCRYPTION_ENCRYPTION_CONFIG_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace secure_drive {

/// AES-256 key size in bytes
constexpr std::size_t AES_256_KEY_SIZE = 32;

/// AES block size in bytes
constexpr std::size_t AES_BLOCK_SIZE = 16;

/// CBC initialization vector size in bytes (one block)
constexpr std::size_t AES_CBC_IV_SIZE = AES_BLOCK_SIZE;

/// Default plaintext chunk size for streaming (8 KiB)
constexpr std::size_t DEFAULT_CODEC_CHUNK_SIZE = 8 * 1024;

/// Extension appended to encrypted files
constexpr std::string_view CONTAINER_EXTENSION = ".encrypted";

/// Suffix of a container that is still being written
constexpr std::string_view PARTIAL_SUFFIX = ".part";

/// Name of the only supported cipher
constexpr std::string_view CIPHER_NAME = "aes-256-cbc";

/**
 * @brief Stream codec configuration
 */
struct codec_config {
    /// Plaintext bytes read per chunk; bounds codec memory use
    std::size_t chunk_size = DEFAULT_CODEC_CHUNK_SIZE;

    [[nodiscard]] auto is_valid() const -> bool {
        return chunk_size > 0 && chunk_size <= 64 * 1024 * 1024;
    }
};

/**
 * @brief Key store configuration
 */
struct key_store_config {
    /// Logical name of the persisted key in the storage backend
    std::string key_name = "encryption.key";

    /// Reject keys whose storage is readable by group or others
    bool enforce_owner_only = true;
};

}  // namespace secure_drive

#endif  // SECURE_DRIVE_ENCRYPTION_ENCRYPTION_CONFIG_H
