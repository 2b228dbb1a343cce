/**
 * @file key_storage.cpp
 * @brief Key persistence backend implementations
 */

#include "secure_drive/encryption/key_storage.h"

#include "secure_drive/core/logging.h"
#include "secure_drive/encryption/encryption_key.h"

#include <openssl/evp.h>

#include <cstdlib>
#include <fstream>
#include <iterator>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <system_error>

namespace secure_drive {

namespace fs = std::filesystem;

namespace {

auto is_base64_space(char c) -> bool {
    return c == ' ' || c == '\n' || c == '\r' || c == '\t';
}

}  // namespace

// ============================================================================
// Key file helpers
// ============================================================================

auto encode_key_material(std::span<const std::byte> material) -> std::string {
    if (material.empty()) {
        return {};
    }
    std::string encoded(4 * ((material.size() + 2) / 3) + 1, '\0');
    int len = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(encoded.data()),
                              reinterpret_cast<const unsigned char*>(material.data()),
                              static_cast<int>(material.size()));
    encoded.resize(static_cast<std::size_t>(len));
    return encoded;
}

auto decode_key_material(std::string_view text) -> result<std::vector<std::byte>> {
    while (!text.empty() && is_base64_space(text.front())) text.remove_prefix(1);
    while (!text.empty() && is_base64_space(text.back())) text.remove_suffix(1);

    if (text.empty() || text.size() % 4 != 0) {
        return unexpected(error(error_code::key_corrupt, "Key file is not valid Base64"));
    }

    std::vector<std::byte> decoded(text.size() / 4 * 3);
    int len = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(decoded.data()),
                              reinterpret_cast<const unsigned char*>(text.data()),
                              static_cast<int>(text.size()));
    if (len < 0) {
        secure_zero(decoded);
        return unexpected(error(error_code::key_corrupt, "Key file is not valid Base64"));
    }

    // EVP_DecodeBlock counts padding characters as zero bytes
    std::size_t padding = 0;
    if (text.back() == '=') ++padding;
    if (text.size() >= 2 && text[text.size() - 2] == '=') ++padding;

    auto actual = static_cast<std::size_t>(len) - padding;
    secure_zero(std::span<std::byte>(decoded).subspan(actual));
    decoded.resize(actual);
    return decoded;
}

auto write_key_file(const fs::path& path,
                    std::span<const std::byte> material) -> result<void> {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return unexpected(error(error_code::key_persist_failed,
                                    "Cannot create key directory " +
                                    path.parent_path().string() + ": " + ec.message()));
        }
    }

    auto temp_path = path;
    temp_path += ".tmp";

    // A leftover from an interrupted write may be read-only or group-readable
    fs::remove(temp_path, ec);
    if (ec) {
        return unexpected(error(error_code::key_persist_failed,
                                "Cannot remove stale " + temp_path.string() + ": " +
                                ec.message()));
    }

    // Restrict the file while it is still empty, before any key byte lands
    {
        std::ofstream created(temp_path, std::ios::binary | std::ios::trunc);
        if (!created) {
            return unexpected(error(error_code::key_persist_failed,
                                    "Cannot create " + temp_path.string()));
        }
    }
    fs::permissions(temp_path, fs::perms::owner_read | fs::perms::owner_write,
                    fs::perm_options::replace, ec);
    if (ec) {
        SD_LOG_WARN(log_category::key_store,
                    "Cannot restrict " + temp_path.string() + " before writing: " +
                    ec.message());
        ec.clear();
    }

    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            fs::remove(temp_path, ec);
            return unexpected(error(error_code::key_persist_failed,
                                    "Cannot open " + temp_path.string() + " for writing"));
        }
        std::string encoded = encode_key_material(material);
        out.write(encoded.data(), static_cast<std::streamsize>(encoded.size()));
        out.flush();
        secure_zero(std::as_writable_bytes(std::span<char>(encoded)));
        if (!out) {
            out.close();
            fs::remove(temp_path, ec);
            return unexpected(error(error_code::key_persist_failed,
                                    "Failed writing " + temp_path.string()));
        }
    }

    fs::rename(temp_path, path, ec);
    if (ec) {
        std::error_code cleanup_ec;
        fs::remove(temp_path, cleanup_ec);
        return unexpected(error(error_code::key_persist_failed,
                                "Cannot move key into place at " + path.string() +
                                ": " + ec.message()));
    }
    return {};
}

auto read_key_file(const fs::path& path) -> result<stored_key> {
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (ec || !fs::exists(status)) {
        return unexpected(error(error_code::key_not_found,
                                "No key file at " + path.string()));
    }
    if (!fs::is_regular_file(status)) {
        return unexpected(error(error_code::key_corrupt,
                                path.string() + " is not a regular file"));
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return unexpected(error(error_code::key_corrupt,
                                "Cannot read key file " + path.string()));
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    auto decoded = decode_key_material(text);
    secure_zero(std::as_writable_bytes(std::span<char>(text)));
    if (!decoded) {
        return unexpected(error(decoded.error().code,
                                decoded.error().message + ": " + path.string()));
    }

    stored_key key;
    key.material = std::move(decoded.value());

    auto write_time = fs::last_write_time(path, ec);
    if (!ec) {
        key.stored_at = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
            std::chrono::file_clock::to_sys(write_time));
    }
    return key;
}

auto restrict_file_to_owner(const fs::path& path) -> result<void> {
    std::error_code ec;
    fs::permissions(path, fs::perms::owner_read, fs::perm_options::replace, ec);
    if (ec) {
        return unexpected(error(error_code::key_persist_failed,
                                "Cannot restrict permissions on " + path.string() +
                                ": " + ec.message()));
    }
    return {};
}

auto is_owner_only(const fs::path& path) -> result<bool> {
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (ec) {
        return unexpected(error(error_code::key_not_found,
                                "Cannot stat " + path.string() + ": " + ec.message()));
    }
    if (status.permissions() == fs::perms::unknown) {
        return true;
    }
    auto others = fs::perms::group_read | fs::perms::others_read;
    return (status.permissions() & others) == fs::perms::none;
}

// ============================================================================
// memory_key_storage::impl
// ============================================================================

struct memory_key_storage::impl {
    mutable std::shared_mutex mutex;
    std::map<std::string, stored_key> keys;

    ~impl() {
        std::unique_lock lock(mutex);
        for (auto& [name, key] : keys) {
            secure_zero(key.material);
        }
        keys.clear();
    }
};

// ============================================================================
// memory_key_storage
// ============================================================================

memory_key_storage::memory_key_storage()
    : impl_(std::make_unique<impl>()) {}

memory_key_storage::~memory_key_storage() = default;

memory_key_storage::memory_key_storage(memory_key_storage&&) noexcept = default;
auto memory_key_storage::operator=(memory_key_storage&&) noexcept
    -> memory_key_storage& = default;

auto memory_key_storage::create() -> std::unique_ptr<memory_key_storage> {
    return std::unique_ptr<memory_key_storage>(new memory_key_storage());
}

auto memory_key_storage::store(
    const std::string& name,
    std::span<const std::byte> material) -> result<void> {
    if (name.empty()) {
        return unexpected(error(error_code::invalid_configuration, "Empty key name"));
    }

    std::unique_lock lock(impl_->mutex);
    auto& slot = impl_->keys[name];
    secure_zero(slot.material);
    slot.material.assign(material.begin(), material.end());
    slot.stored_at = std::chrono::system_clock::now();
    return {};
}

auto memory_key_storage::retrieve(const std::string& name) -> result<stored_key> {
    std::shared_lock lock(impl_->mutex);

    auto it = impl_->keys.find(name);
    if (it == impl_->keys.end()) {
        return unexpected(error(error_code::key_not_found, "Key not found: " + name));
    }
    return it->second;
}

auto memory_key_storage::remove(const std::string& name) -> result<void> {
    std::unique_lock lock(impl_->mutex);

    auto it = impl_->keys.find(name);
    if (it == impl_->keys.end()) {
        return unexpected(error(error_code::key_not_found, "Key not found: " + name));
    }

    secure_zero(it->second.material);
    impl_->keys.erase(it);
    return {};
}

auto memory_key_storage::exists(const std::string& name) -> bool {
    std::shared_lock lock(impl_->mutex);
    return impl_->keys.count(name) > 0;
}

auto memory_key_storage::restrict_access(const std::string& name) -> result<void> {
    if (!exists(name)) {
        return unexpected(error(error_code::key_not_found, "Key not found: " + name));
    }
    return {};
}

auto memory_key_storage::is_access_restricted(const std::string& name) -> result<bool> {
    if (!exists(name)) {
        return unexpected(error(error_code::key_not_found, "Key not found: " + name));
    }
    return true;
}

auto memory_key_storage::location(const std::string& name) const -> std::string {
    return "memory:" + name;
}

// ============================================================================
// file_key_storage
// ============================================================================

struct file_key_storage::impl {
    fs::path directory;
    std::mutex mutex;

    explicit impl(fs::path dir) : directory(std::move(dir)) {}

    [[nodiscard]] auto path_for(const std::string& name) const -> fs::path {
        return directory / name;
    }
};

file_key_storage::file_key_storage(fs::path directory)
    : impl_(std::make_unique<impl>(std::move(directory))) {}

file_key_storage::~file_key_storage() = default;

file_key_storage::file_key_storage(file_key_storage&&) noexcept = default;
auto file_key_storage::operator=(file_key_storage&&) noexcept
    -> file_key_storage& = default;

auto file_key_storage::create(fs::path directory) -> std::unique_ptr<file_key_storage> {
    return std::unique_ptr<file_key_storage>(new file_key_storage(std::move(directory)));
}

auto file_key_storage::default_directory() -> fs::path {
    const char* home = std::getenv("HOME");
#if defined(_WIN32)
    if (home == nullptr) {
        home = std::getenv("USERPROFILE");
    }
#endif
    fs::path base = home != nullptr ? fs::path(home) : fs::current_path();
    return base / ".securedrive";
}

auto file_key_storage::store(
    const std::string& name,
    std::span<const std::byte> material) -> result<void> {
    if (name.empty()) {
        return unexpected(error(error_code::invalid_configuration, "Empty key name"));
    }
    std::lock_guard lock(impl_->mutex);
    return write_key_file(impl_->path_for(name), material);
}

auto file_key_storage::retrieve(const std::string& name) -> result<stored_key> {
    std::lock_guard lock(impl_->mutex);
    return read_key_file(impl_->path_for(name));
}

auto file_key_storage::remove(const std::string& name) -> result<void> {
    std::lock_guard lock(impl_->mutex);
    std::error_code ec;
    if (!fs::remove(impl_->path_for(name), ec)) {
        if (ec) {
            return unexpected(error(error_code::key_persist_failed,
                                    "Cannot remove key file: " + ec.message()));
        }
        return unexpected(error(error_code::key_not_found, "Key not found: " + name));
    }
    return {};
}

auto file_key_storage::exists(const std::string& name) -> bool {
    std::lock_guard lock(impl_->mutex);
    std::error_code ec;
    return fs::exists(impl_->path_for(name), ec);
}

auto file_key_storage::restrict_access(const std::string& name) -> result<void> {
    std::lock_guard lock(impl_->mutex);
    return restrict_file_to_owner(impl_->path_for(name));
}

auto file_key_storage::is_access_restricted(const std::string& name) -> result<bool> {
    std::lock_guard lock(impl_->mutex);
    return is_owner_only(impl_->path_for(name));
}

auto file_key_storage::location(const std::string& name) const -> std::string {
    return impl_->path_for(name).string();
}

auto file_key_storage::directory() const -> const fs::path& {
    return impl_->directory;
}

}  // namespace secure_drive
