/**
 * @file key_storage.h
 * @brief Key persistence backends
 *
 * A key storage backend is a byte-addressable store addressed by logical
 * name. Backends that live on a shared machine must be able to restrict read
 * access to the owner and to report whether that restriction is in place.
 */

#ifndef SECURE_DRIVE_ENCRYPTION_KEY_STORAGE_H
#define SECURE_DRIVE_ENCRYPTION_KEY_STORAGE_H

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "secure_drive/core/types.h"

namespace secure_drive {

/**
 * @brief Key material read back from a storage backend
 */
struct stored_key {
    /// Decoded key bytes; length is validated by the key store, not here
    std::vector<std::byte> material;

    /// Time the material was last written, when the backend knows it
    std::optional<std::chrono::system_clock::time_point> stored_at;
};

/**
 * @brief Key storage backend interface
 */
class key_storage_interface {
public:
    virtual ~key_storage_interface() = default;

    key_storage_interface(const key_storage_interface&) = delete;
    auto operator=(const key_storage_interface&) -> key_storage_interface& = delete;
    key_storage_interface(key_storage_interface&&) noexcept = default;
    auto operator=(key_storage_interface&&) noexcept -> key_storage_interface& = default;

    /**
     * @brief Store key material, replacing any previous value
     * @param name Logical key name
     * @param material Raw key bytes
     * @return key_persist_failed when the backend cannot be written
     */
    [[nodiscard]] virtual auto store(
        const std::string& name,
        std::span<const std::byte> material) -> result<void> = 0;

    /**
     * @brief Read key material
     * @param name Logical key name
     * @return Stored material; key_not_found when absent, key_corrupt when the
     *         stored value cannot be decoded
     */
    [[nodiscard]] virtual auto retrieve(const std::string& name) -> result<stored_key> = 0;

    [[nodiscard]] virtual auto remove(const std::string& name) -> result<void> = 0;

    [[nodiscard]] virtual auto exists(const std::string& name) -> bool = 0;

    /**
     * @brief Restrict read access to the owning user
     * @return Error when the platform refuses the permission change
     */
    [[nodiscard]] virtual auto restrict_access(const std::string& name) -> result<void> = 0;

    /**
     * @brief Check that no one other than the owner can read the value
     * @return true when access is owner-only or the backend has no notion of
     *         other readers
     */
    [[nodiscard]] virtual auto is_access_restricted(const std::string& name) -> result<bool> = 0;

    /**
     * @brief Human-readable location of the value, for diagnostics
     */
    [[nodiscard]] virtual auto location(const std::string& name) const -> std::string = 0;

protected:
    key_storage_interface() = default;
};

/**
 * @brief In-memory key storage (non-persistent)
 *
 * Stores keys in memory with secure zeroing on removal and destruction.
 * Suitable for tests and ephemeral sessions.
 */
class memory_key_storage : public key_storage_interface {
public:
    [[nodiscard]] static auto create() -> std::unique_ptr<memory_key_storage>;

    ~memory_key_storage() override;

    memory_key_storage(const memory_key_storage&) = delete;
    auto operator=(const memory_key_storage&) -> memory_key_storage& = delete;
    memory_key_storage(memory_key_storage&&) noexcept;
    auto operator=(memory_key_storage&&) noexcept -> memory_key_storage&;

    [[nodiscard]] auto store(
        const std::string& name,
        std::span<const std::byte> material) -> result<void> override;

    [[nodiscard]] auto retrieve(const std::string& name) -> result<stored_key> override;

    [[nodiscard]] auto remove(const std::string& name) -> result<void> override;

    [[nodiscard]] auto exists(const std::string& name) -> bool override;

    [[nodiscard]] auto restrict_access(const std::string& name) -> result<void> override;

    [[nodiscard]] auto is_access_restricted(const std::string& name) -> result<bool> override;

    [[nodiscard]] auto location(const std::string& name) const -> std::string override;

private:
    memory_key_storage();

    struct impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Directory-backed key storage
 *
 * Each key is a file named after its logical name holding the Base64
 * encoding of the material. Writes go to a temporary file that is renamed
 * into place, so a crash never leaves a truncated key file.
 *
 * @code
 * auto storage = file_key_storage::create(file_key_storage::default_directory());
 * auto store = key_store::create(std::move(storage));
 * @endcode
 */
class file_key_storage : public key_storage_interface {
public:
    /**
     * @brief Create storage rooted at a directory
     * @param directory Directory holding key files; created on first store
     */
    [[nodiscard]] static auto create(std::filesystem::path directory)
        -> std::unique_ptr<file_key_storage>;

    /**
     * @brief Default key directory: $HOME/.securedrive
     */
    [[nodiscard]] static auto default_directory() -> std::filesystem::path;

    ~file_key_storage() override;

    file_key_storage(const file_key_storage&) = delete;
    auto operator=(const file_key_storage&) -> file_key_storage& = delete;
    file_key_storage(file_key_storage&&) noexcept;
    auto operator=(file_key_storage&&) noexcept -> file_key_storage&;

    [[nodiscard]] auto store(
        const std::string& name,
        std::span<const std::byte> material) -> result<void> override;

    [[nodiscard]] auto retrieve(const std::string& name) -> result<stored_key> override;

    [[nodiscard]] auto remove(const std::string& name) -> result<void> override;

    [[nodiscard]] auto exists(const std::string& name) -> bool override;

    [[nodiscard]] auto restrict_access(const std::string& name) -> result<void> override;

    [[nodiscard]] auto is_access_restricted(const std::string& name) -> result<bool> override;

    [[nodiscard]] auto location(const std::string& name) const -> std::string override;

    [[nodiscard]] auto directory() const -> const std::filesystem::path&;

private:
    explicit file_key_storage(std::filesystem::path directory);

    struct impl;
    std::unique_ptr<impl> impl_;
};

// ============================================================================
// Key file helpers
// ============================================================================

/**
 * @brief Base64-encode key material (single line, no newline)
 */
[[nodiscard]] auto encode_key_material(std::span<const std::byte> material) -> std::string;

/**
 * @brief Decode Base64 key text; surrounding whitespace is ignored
 * @return Decoded bytes, or key_corrupt for malformed input
 */
[[nodiscard]] auto decode_key_material(std::string_view text) -> result<std::vector<std::byte>>;

/**
 * @brief Write Base64 key material to a file atomically
 */
[[nodiscard]] auto write_key_file(const std::filesystem::path& path,
                                  std::span<const std::byte> material) -> result<void>;

/**
 * @brief Read and decode a Base64 key file
 * @return key_not_found if absent, key_corrupt if not a regular file or not
 *         valid Base64
 */
[[nodiscard]] auto read_key_file(const std::filesystem::path& path) -> result<stored_key>;

/**
 * @brief Set a file to owner-read-only (0400)
 */
[[nodiscard]] auto restrict_file_to_owner(const std::filesystem::path& path) -> result<void>;

/**
 * @brief Check that neither group nor others may read a file
 */
[[nodiscard]] auto is_owner_only(const std::filesystem::path& path) -> result<bool>;

}  // namespace secure_drive

#endif  // SECURE_DRIVE_ENCRYPTION_KEY_STORAGE_H
