/**
 * @file error_codes.h
 * @brief Error classification helpers for secure_drive
 *
 * Groups the numeric ranges of error_code into failure kinds so callers can
 * branch on the kind of failure instead of matching message text.
 */

#ifndef SECURE_DRIVE_CORE_ERROR_CODES_H
#define SECURE_DRIVE_CORE_ERROR_CODES_H

#include <cstdint>
#include <string_view>

#include "secure_drive/core/types.h"

namespace secure_drive {

/**
 * @brief Failure kinds
 */
enum class error_kind {
    none,
    key,            ///< Key missing, corrupt, insecure or busy
    container,      ///< Malformed container or failed decryption
    io,             ///< Local file system failure
    transport,      ///< Failure reported by the upload client
    cancellation,   ///< Cooperative cancellation, not a failure
    configuration,  ///< Orchestration or configuration misuse
    internal
};

[[nodiscard]] constexpr auto to_string(error_kind kind) noexcept -> std::string_view {
    switch (kind) {
        case error_kind::none: return "none";
        case error_kind::key: return "key";
        case error_kind::container: return "container";
        case error_kind::io: return "io";
        case error_kind::transport: return "transport";
        case error_kind::cancellation: return "cancellation";
        case error_kind::configuration: return "configuration";
        case error_kind::internal: return "internal";
    }
    return "unknown";
}

[[nodiscard]] constexpr auto is_key_error(error_code code) noexcept -> bool {
    auto v = static_cast<int32_t>(code);
    return v <= -100 && v >= -119;
}

[[nodiscard]] constexpr auto is_container_error(error_code code) noexcept -> bool {
    auto v = static_cast<int32_t>(code);
    return v <= -120 && v >= -139;
}

[[nodiscard]] constexpr auto is_io_error(error_code code) noexcept -> bool {
    auto v = static_cast<int32_t>(code);
    return v <= -140 && v >= -159;
}

[[nodiscard]] constexpr auto is_transport_error(error_code code) noexcept -> bool {
    auto v = static_cast<int32_t>(code);
    return v <= -160 && v >= -179;
}

[[nodiscard]] constexpr auto is_cancellation(error_code code) noexcept -> bool {
    auto v = static_cast<int32_t>(code);
    return v <= -180 && v >= -189;
}

[[nodiscard]] constexpr auto is_config_error(error_code code) noexcept -> bool {
    auto v = static_cast<int32_t>(code);
    return v <= -190 && v >= -199;
}

/**
 * @brief Classify an error code
 */
[[nodiscard]] constexpr auto kind_of(error_code code) noexcept -> error_kind {
    if (code == error_code::success) return error_kind::none;
    if (is_key_error(code)) return error_kind::key;
    if (is_container_error(code)) return error_kind::container;
    if (is_io_error(code)) return error_kind::io;
    if (is_transport_error(code)) return error_kind::transport;
    if (is_cancellation(code)) return error_kind::cancellation;
    if (is_config_error(code)) return error_kind::configuration;
    return error_kind::internal;
}

[[nodiscard]] inline auto kind_of(const error& err) noexcept -> error_kind {
    return kind_of(err.code);
}

/**
 * @brief Check if an upload failure is worth resubmitting as-is
 *
 * Network failures are transient; quota and authorization failures need user
 * action first.
 */
[[nodiscard]] constexpr auto is_retryable(error_code code) noexcept -> bool {
    switch (code) {
        case error_code::transport_network_error:
        case error_code::timeout:
            return true;
        default:
            return false;
    }
}

}  // namespace secure_drive

#endif  // SECURE_DRIVE_CORE_ERROR_CODES_H
