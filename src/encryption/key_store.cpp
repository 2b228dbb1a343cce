/**
 * @file key_store.cpp
 * @brief Encryption key lifecycle implementation
 */

#include "secure_drive/encryption/key_store.h"

#include "secure_drive/core/logging.h"

#include <mutex>
#include <vector>

namespace secure_drive {

namespace {

auto key_context(const std::string& fingerprint, const std::string& location)
    -> transfer_log_context {
    transfer_log_context ctx;
    ctx.key_fingerprint = fingerprint;
    ctx.filename = location;
    return ctx;
}

auto key_in_use_error(const char* operation) -> unexpected {
    return unexpected(error(error_code::key_in_use,
                            std::string("Cannot ") + operation +
                            " the key while a batch is using it"));
}

}  // namespace

// ============================================================================
// key_lease
// ============================================================================

key_lease::key_lease(key_store* owner, const encryption_key* key, std::string fingerprint)
    : owner_(owner), key_(key), fingerprint_(std::move(fingerprint)) {}

key_lease::~key_lease() {
    release();
}

key_lease::key_lease(key_lease&& other) noexcept
    : owner_(other.owner_), key_(other.key_), fingerprint_(std::move(other.fingerprint_)) {
    other.owner_ = nullptr;
    other.key_ = nullptr;
}

auto key_lease::operator=(key_lease&& other) noexcept -> key_lease& {
    if (this != &other) {
        release();
        owner_ = other.owner_;
        key_ = other.key_;
        fingerprint_ = std::move(other.fingerprint_);
        other.owner_ = nullptr;
        other.key_ = nullptr;
    }
    return *this;
}

void key_lease::release() noexcept {
    if (owner_ != nullptr) {
        owner_->release_lease();
        owner_ = nullptr;
        key_ = nullptr;
    }
}

// ============================================================================
// key_store::impl
// ============================================================================

struct key_store::impl {
    std::unique_ptr<key_storage_interface> storage;
    key_store_config cfg;
    std::shared_ptr<random_source> random;

    mutable std::mutex mutex;
    std::optional<encryption_key> active;
    std::string fingerprint;
    std::size_t leases = 0;

    impl(std::unique_ptr<key_storage_interface> s,
         key_store_config c,
         std::shared_ptr<random_source> r)
        : storage(std::move(s)), cfg(std::move(c)), random(std::move(r)) {}

    [[nodiscard]] auto location() const -> std::string {
        return storage->location(cfg.key_name);
    }

    [[nodiscard]] auto make_info() const -> key_info {
        key_info info;
        info.created_at = active->created_at();
        info.fingerprint = fingerprint;
        info.location = location();
        return info;
    }

    void install(encryption_key key) {
        fingerprint = key.fingerprint();
        if (active) {
            *active = std::move(key);
        } else {
            active.emplace(std::move(key));
        }
    }

    auto generate_key() -> result<encryption_key> {
        std::vector<std::byte> material(AES_256_KEY_SIZE);
        auto filled = random->fill(material);
        if (!filled) {
            secure_zero(material);
            return unexpected(error(error_code::key_generation_failed,
                                    filled.error().message));
        }
        auto key = encryption_key::from_bytes(material);
        secure_zero(material);
        return key;
    }

    auto load_persisted() -> result<key_info> {
        const auto& name = cfg.key_name;
        if (!storage->exists(name)) {
            return unexpected(error(error_code::key_not_found,
                                    "No key stored at " + location()));
        }

        if (cfg.enforce_owner_only) {
            auto restricted = storage->is_access_restricted(name);
            if (!restricted) {
                return unexpected(restricted.error());
            }
            if (!restricted.value()) {
                SD_LOG_ERROR(log_category::key_store,
                             "Key storage is readable by other users: " + location());
                return unexpected(error(error_code::key_insecure_storage,
                                        "Key at " + location() +
                                        " is readable by other users; restrict it to the owner"));
            }
        }

        auto stored = storage->retrieve(name);
        if (!stored) {
            SD_LOG_ERROR(log_category::key_store, stored.error().message);
            return unexpected(stored.error());
        }

        auto& material = stored.value().material;
        auto key = encryption_key::from_bytes(
            material, stored.value().stored_at.value_or(std::chrono::system_clock::now()));
        secure_zero(material);
        if (!key) {
            SD_LOG_ERROR(log_category::key_store,
                         key.error().message + " at " + location());
            return unexpected(error(error_code::key_corrupt,
                                    key.error().message + " at " + location()));
        }

        install(std::move(key.value()));
        auto ctx = key_context(fingerprint, location());
        SD_LOG_INFO_CTX(log_category::key_store, "Encryption key loaded", ctx);
        return make_info();
    }

    auto persist_key(const encryption_key& key) -> result<persist_report> {
        const auto& name = cfg.key_name;
        auto stored = storage->store(name, key.bytes());
        if (!stored) {
            SD_LOG_ERROR(log_category::key_store, stored.error().message);
            return unexpected(stored.error());
        }

        persist_report report;
        auto restricted = storage->restrict_access(name);
        if (!restricted) {
            report.access_restricted = false;
            report.warning = restricted.error().message;
            SD_LOG_WARN(log_category::key_store,
                        "Key saved but access could not be restricted: " +
                        restricted.error().message);
        }

        auto ctx = key_context(key.fingerprint(), location());
        SD_LOG_INFO_CTX(log_category::key_store, "Encryption key saved", ctx);
        return report;
    }
};

// ============================================================================
// key_store
// ============================================================================

key_store::key_store(std::unique_ptr<key_storage_interface> storage,
                     key_store_config config,
                     std::shared_ptr<random_source> random)
    : impl_(std::make_unique<impl>(std::move(storage), std::move(config),
                                   random ? std::move(random) : default_random_source())) {}

key_store::~key_store() = default;

auto key_store::create(
    std::unique_ptr<key_storage_interface> storage,
    key_store_config config,
    std::shared_ptr<random_source> random) -> std::unique_ptr<key_store> {
    if (!storage) {
        return nullptr;
    }
    get_logger().initialize();
    return std::unique_ptr<key_store>(
        new key_store(std::move(storage), std::move(config), std::move(random)));
}

auto key_store::generate() -> result<encryption_key> {
    return impl_->generate_key();
}

auto key_store::load() -> result<key_info> {
    std::lock_guard lock(impl_->mutex);
    if (impl_->leases > 0) {
        return key_in_use_error("reload");
    }
    return impl_->load_persisted();
}

auto key_store::get_or_create() -> result<key_info> {
    std::lock_guard lock(impl_->mutex);
    if (impl_->active) {
        return impl_->make_info();
    }

    auto loaded = impl_->load_persisted();
    if (loaded || loaded.error().code != error_code::key_not_found) {
        return loaded;
    }

    SD_LOG_INFO(log_category::key_store,
                "No encryption key found, generating a new one at " + impl_->location());

    auto key = impl_->generate_key();
    if (!key) {
        return unexpected(key.error());
    }

    auto persisted = impl_->persist_key(key.value());
    if (!persisted) {
        return unexpected(persisted.error());
    }

    impl_->install(std::move(key.value()));
    auto info = impl_->make_info();
    info.warning = std::move(persisted.value().warning);
    return info;
}

auto key_store::persist(const encryption_key& key) -> result<persist_report> {
    std::lock_guard lock(impl_->mutex);
    return impl_->persist_key(key);
}

auto key_store::regenerate() -> result<key_info> {
    std::lock_guard lock(impl_->mutex);
    if (impl_->leases > 0) {
        return key_in_use_error("regenerate");
    }

    auto key = impl_->generate_key();
    if (!key) {
        return unexpected(key.error());
    }

    auto persisted = impl_->persist_key(key.value());
    if (!persisted) {
        return unexpected(persisted.error());
    }

    std::string previous = impl_->active ? impl_->fingerprint : std::string("none");
    impl_->install(std::move(key.value()));

    SD_LOG_WARN(log_category::key_store,
                "Encryption key regenerated; files encrypted with the previous key (" +
                previous + ") can no longer be decrypted");
    auto info = impl_->make_info();
    info.warning = std::move(persisted.value().warning);
    return info;
}

auto key_store::invalidate() -> result<void> {
    std::lock_guard lock(impl_->mutex);
    if (impl_->leases > 0) {
        return key_in_use_error("invalidate");
    }
    if (impl_->active) {
        impl_->active.reset();
        impl_->fingerprint.clear();
        SD_LOG_INFO(log_category::key_store, "Encryption key removed from memory");
    }
    return {};
}

auto key_store::import_key(const std::filesystem::path& path) -> result<key_info> {
    std::lock_guard lock(impl_->mutex);
    if (impl_->leases > 0) {
        return key_in_use_error("import");
    }

    auto stored = read_key_file(path);
    if (!stored) {
        return unexpected(stored.error());
    }

    auto key = encryption_key::from_bytes(stored.value().material);
    secure_zero(stored.value().material);
    if (!key) {
        return unexpected(error(error_code::key_corrupt,
                                key.error().message + " in " + path.string()));
    }

    auto persisted = impl_->persist_key(key.value());
    if (!persisted) {
        return unexpected(persisted.error());
    }

    impl_->install(std::move(key.value()));
    SD_LOG_INFO(log_category::key_store, "Encryption key imported from " + path.string());
    auto info = impl_->make_info();
    info.warning = std::move(persisted.value().warning);
    return info;
}

auto key_store::export_key(const std::filesystem::path& path) -> result<persist_report> {
    std::lock_guard lock(impl_->mutex);
    if (!impl_->active) {
        return unexpected(error(error_code::key_not_loaded, "No active key to export"));
    }

    auto written = write_key_file(path, impl_->active->bytes());
    if (!written) {
        return unexpected(written.error());
    }

    persist_report report;
    auto restricted = restrict_file_to_owner(path);
    if (!restricted) {
        report.access_restricted = false;
        report.warning = restricted.error().message;
        SD_LOG_WARN(log_category::key_store,
                    "Exported key file could not be restricted: " + restricted.error().message);
    }

    SD_LOG_INFO(log_category::key_store, "Encryption key exported to " + path.string());
    return report;
}

auto key_store::lease() -> result<key_lease> {
    std::lock_guard lock(impl_->mutex);
    if (!impl_->active) {
        return unexpected(error(error_code::key_not_loaded, "No active encryption key"));
    }
    ++impl_->leases;
    return key_lease(this, &*impl_->active, impl_->fingerprint);
}

auto key_store::is_initialized() const -> bool {
    std::lock_guard lock(impl_->mutex);
    return impl_->active.has_value();
}

auto key_store::info() const -> std::optional<key_info> {
    std::lock_guard lock(impl_->mutex);
    if (!impl_->active) {
        return std::nullopt;
    }
    return impl_->make_info();
}

auto key_store::active_leases() const -> std::size_t {
    std::lock_guard lock(impl_->mutex);
    return impl_->leases;
}

auto key_store::config() const -> const key_store_config& {
    return impl_->cfg;
}

void key_store::release_lease() noexcept {
    std::lock_guard lock(impl_->mutex);
    if (impl_->leases > 0) {
        --impl_->leases;
    }
}

}  // namespace secure_drive
