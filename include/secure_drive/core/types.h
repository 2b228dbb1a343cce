/**
 * @file types.h
 * @brief Core type definitions for secure_drive
 */

#ifndef SECURE_DRIVE_CORE_TYPES_H
#define SECURE_DRIVE_CORE_TYPES_H

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace secure_drive {

/**
 * @brief Error codes for key, codec and transfer operations
 *
 * Error code ranges:
 * - -100 to -119: Key errors
 * - -120 to -139: Container errors
 * - -140 to -159: File I/O errors
 * - -160 to -179: Transport errors
 * - -180 to -189: Cancellation
 * - -190 to -199: Orchestration and configuration errors
 * - -200 to -219: Internal errors
 */
enum class error_code {
    success = 0,

    // Key errors (-100 to -119)
    key_not_found = -100,
    key_corrupt = -101,
    key_insecure_storage = -102,
    key_generation_failed = -103,
    key_not_loaded = -104,
    key_in_use = -105,
    key_persist_failed = -106,

    // Container errors (-120 to -139)
    malformed_container = -120,
    authentication_or_padding_failure = -121,
    crypto_failure = -122,

    // File I/O errors (-140 to -159)
    file_not_found = -140,
    source_unreadable = -141,
    destination_unwritable = -142,
    disk_full = -143,

    // Transport errors (-160 to -179)
    transport_network_error = -160,
    transport_quota_exceeded = -161,
    transport_auth_expired = -162,
    transport_rejected = -163,

    // Cancellation (-180 to -189)
    cancelled = -180,

    // Orchestration and configuration errors (-190 to -199)
    invalid_configuration = -190,
    invalid_state_transition = -191,
    batch_not_found = -192,
    batch_already_started = -193,
    batch_not_finished = -194,
    timeout = -195,

    // Internal errors (-200 to -219)
    internal_error = -200,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::key_not_found:
            return "key not found";
        case error_code::key_corrupt:
            return "key corrupt";
        case error_code::key_insecure_storage:
            return "key storage readable by other users";
        case error_code::key_generation_failed:
            return "key generation failed";
        case error_code::key_not_loaded:
            return "no active key";
        case error_code::key_in_use:
            return "key in use by an active batch";
        case error_code::key_persist_failed:
            return "key persist failed";
        case error_code::malformed_container:
            return "malformed container";
        case error_code::authentication_or_padding_failure:
            return "authentication or padding failure";
        case error_code::crypto_failure:
            return "cipher failure";
        case error_code::file_not_found:
            return "file not found";
        case error_code::source_unreadable:
            return "source unreadable";
        case error_code::destination_unwritable:
            return "destination unwritable";
        case error_code::disk_full:
            return "disk full";
        case error_code::transport_network_error:
            return "network error";
        case error_code::transport_quota_exceeded:
            return "quota exceeded";
        case error_code::transport_auth_expired:
            return "authorization expired";
        case error_code::transport_rejected:
            return "upload rejected";
        case error_code::cancelled:
            return "cancelled";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::invalid_state_transition:
            return "invalid state transition";
        case error_code::batch_not_found:
            return "batch not found";
        case error_code::batch_already_started:
            return "batch already started";
        case error_code::batch_not_finished:
            return "batch not finished";
        case error_code::timeout:
            return "timeout";
        case error_code::internal_error:
            return "internal error";
        default:
            return "unknown error";
    }
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * A simple Result type similar to std::expected (C++23).
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

/**
 * @brief Unique identifier for a transfer job
 */
struct job_id {
    uint64_t value;

    job_id() : value(0) {}
    explicit job_id(uint64_t v) : value(v) {}

    [[nodiscard]] auto operator==(const job_id& other) const -> bool = default;
    [[nodiscard]] auto operator<(const job_id& other) const -> bool {
        return value < other.value;
    }
};

/**
 * @brief Unique identifier for a batch of transfer jobs
 */
struct batch_id {
    uint64_t value;

    batch_id() : value(0) {}
    explicit batch_id(uint64_t v) : value(v) {}

    [[nodiscard]] auto operator==(const batch_id& other) const -> bool = default;
    [[nodiscard]] auto operator<(const batch_id& other) const -> bool {
        return value < other.value;
    }
};

}  // namespace secure_drive

// Hash support for identifiers
template <>
struct std::hash<secure_drive::job_id> {
    auto operator()(const secure_drive::job_id& id) const noexcept -> std::size_t {
        return std::hash<uint64_t>{}(id.value);
    }
};

template <>
struct std::hash<secure_drive::batch_id> {
    auto operator()(const secure_drive::batch_id& id) const noexcept -> std::size_t {
        return std::hash<uint64_t>{}(id.value);
    }
};

#endif  // SECURE_DRIVE_CORE_TYPES_H
