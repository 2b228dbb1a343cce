/**
 * @file key_store.h
 * @brief Lifecycle management of the symmetric encryption key
 *
 * The key store is the sole owner of the active key. It generates, loads,
 * persists, regenerates and invalidates it, and hands out scoped leases to
 * the code that encrypts with it.
 */

#ifndef SECURE_DRIVE_ENCRYPTION_KEY_STORE_H
#define SECURE_DRIVE_ENCRYPTION_KEY_STORE_H

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "secure_drive/core/types.h"
#include "secure_drive/encryption/encryption_config.h"
#include "secure_drive/encryption/encryption_key.h"
#include "secure_drive/encryption/key_storage.h"
#include "secure_drive/encryption/random_source.h"

namespace secure_drive {

/**
 * @brief Non-secret description of the active key
 */
struct key_info {
    std::string algorithm{CIPHER_NAME};
    std::size_t key_bits = AES_256_KEY_SIZE * 8;
    std::chrono::system_clock::time_point created_at;
    std::string fingerprint;
    std::string location;

    /// Set when this call wrote the key but could not restrict access to it
    std::optional<std::string> warning;
};

/**
 * @brief Outcome of writing a key to storage
 */
struct persist_report {
    /// Whether owner-only access could be applied
    bool access_restricted = true;

    /// Set when access could not be restricted; the key was still written
    std::optional<std::string> warning;
};

class key_store;

/**
 * @brief Scoped read-only access to the active key
 *
 * While any lease is alive the key store refuses to regenerate, invalidate
 * or replace the key, so the referenced key stays valid. The key store must
 * outlive every lease it hands out.
 */
class key_lease {
public:
    ~key_lease();

    key_lease(const key_lease&) = delete;
    auto operator=(const key_lease&) -> key_lease& = delete;
    key_lease(key_lease&& other) noexcept;
    auto operator=(key_lease&& other) noexcept -> key_lease&;

    [[nodiscard]] auto key() const -> const encryption_key& { return *key_; }

    [[nodiscard]] auto fingerprint() const -> const std::string& { return fingerprint_; }

private:
    friend class key_store;
    key_lease(key_store* owner, const encryption_key* key, std::string fingerprint);

    void release() noexcept;

    key_store* owner_;
    const encryption_key* key_;
    std::string fingerprint_;
};

/**
 * @brief Key store for the single active encryption key
 *
 * Key corruption and permission problems are always reported to the caller
 * and never resolved by silently generating a replacement, since that would
 * make every existing container undecryptable.
 *
 * @code
 * auto store = key_store::create(
 *     file_key_storage::create(file_key_storage::default_directory()));
 *
 * auto info = store->get_or_create();
 * if (!info) {
 *     // key_corrupt / key_insecure_storage: ask the user what to do
 * }
 * @endcode
 */
class key_store {
public:
    /**
     * @brief Create a key store
     * @param storage Persistence backend
     * @param config Key name and policy
     * @param random Random source; the OpenSSL source when null
     */
    [[nodiscard]] static auto create(
        std::unique_ptr<key_storage_interface> storage,
        key_store_config config = {},
        std::shared_ptr<random_source> random = nullptr) -> std::unique_ptr<key_store>;

    ~key_store();

    key_store(const key_store&) = delete;
    auto operator=(const key_store&) -> key_store& = delete;
    key_store(key_store&&) = delete;
    auto operator=(key_store&&) -> key_store& = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * @brief Generate a new key without installing or persisting it
     * @return New key, or key_generation_failed when the random source fails
     */
    [[nodiscard]] auto generate() -> result<encryption_key>;

    /**
     * @brief Load the persisted key and make it the active key
     * @return key_not_found, key_insecure_storage or key_corrupt on failure
     */
    [[nodiscard]] auto load() -> result<key_info>;

    /**
     * @brief Return the active key, loading or creating it on first use
     *
     * Only a missing key leads to generation. Corrupt or insecure storage is
     * returned as an error. A freshly generated key whose storage could not
     * be restricted is still returned, with key_info::warning set.
     */
    [[nodiscard]] auto get_or_create() -> result<key_info>;

    /**
     * @brief Write a key to storage and restrict access to the owner
     * @return Report whose warning is set when permissions could not be applied
     */
    [[nodiscard]] auto persist(const encryption_key& key) -> result<persist_report>;

    /**
     * @brief Replace the active key with a newly generated, persisted one
     *
     * Containers produced with the previous key can no longer be decrypted.
     * Rejected with key_in_use while a lease is outstanding. key_info::warning
     * carries the persist warning, if any.
     */
    [[nodiscard]] auto regenerate() -> result<key_info>;

    /**
     * @brief Scrub and drop the in-memory key; storage is untouched
     */
    [[nodiscard]] auto invalidate() -> result<void>;

    // ========================================================================
    // Import / export
    // ========================================================================

    /**
     * @brief Adopt a key from a Base64 key file, persisting it as the active key
     */
    [[nodiscard]] auto import_key(const std::filesystem::path& path) -> result<key_info>;

    /**
     * @brief Write the active key to a Base64 key file readable only by the owner
     */
    [[nodiscard]] auto export_key(const std::filesystem::path& path) -> result<persist_report>;

    // ========================================================================
    // Access
    // ========================================================================

    /**
     * @brief Lease the active key for the duration of a batch
     * @return key_not_loaded when no key is active
     */
    [[nodiscard]] auto lease() -> result<key_lease>;

    [[nodiscard]] auto is_initialized() const -> bool;

    [[nodiscard]] auto info() const -> std::optional<key_info>;

    [[nodiscard]] auto active_leases() const -> std::size_t;

    [[nodiscard]] auto config() const -> const key_store_config&;

private:
    key_store(std::unique_ptr<key_storage_interface> storage,
              key_store_config config,
              std::shared_ptr<random_source> random);

    friend class key_lease;
    void release_lease() noexcept;

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace secure_drive

#endif  // SECURE_DRIVE_ENCRYPTION_KEY_STORE_H
