/**
 * @file random_source.h
 * @brief Random byte source used for keys and initialization vectors
 */

#ifndef SECURE_DRIVE_ENCRYPTION_RANDOM_SOURCE_H
#define SECURE_DRIVE_ENCRYPTION_RANDOM_SOURCE_H

#include <cstddef>
#include <memory>
#include <span>

#include "secure_drive/core/types.h"

namespace secure_drive {

/**
 * @brief Source of random bytes
 *
 * Production code uses openssl_random_source. Tests inject deterministic
 * sources so IV and key values are reproducible.
 */
class random_source {
public:
    virtual ~random_source() = default;

    /**
     * @brief Fill a buffer with random bytes
     * @param buffer Destination buffer
     * @return Error when the source cannot supply enough entropy
     */
    [[nodiscard]] virtual auto fill(std::span<std::byte> buffer) -> result<void> = 0;
};

/**
 * @brief Cryptographically secure source backed by OpenSSL RAND_bytes
 */
class openssl_random_source : public random_source {
public:
    [[nodiscard]] auto fill(std::span<std::byte> buffer) -> result<void> override;
};

/**
 * @brief Shared default secure source
 */
[[nodiscard]] auto default_random_source() -> std::shared_ptr<random_source>;

}  // namespace secure_drive

#endif  // SECURE_DRIVE_ENCRYPTION_RANDOM_SOURCE_H
