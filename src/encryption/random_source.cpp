/**
 * @file random_source.cpp
 * @brief OpenSSL-backed random source
 */

#include "secure_drive/encryption/random_source.h"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <array>
#include <climits>

namespace secure_drive {

auto openssl_random_source::fill(std::span<std::byte> buffer) -> result<void> {
    if (buffer.empty()) {
        return {};
    }
    if (buffer.size() > static_cast<std::size_t>(INT_MAX)) {
        return unexpected(error(error_code::internal_error, "Random request too large"));
    }

    if (RAND_bytes(reinterpret_cast<unsigned char*>(buffer.data()),
                   static_cast<int>(buffer.size())) != 1) {
        std::array<char, 256> message{};
        ERR_error_string_n(ERR_get_error(), message.data(), message.size());
        return unexpected(error(error_code::key_generation_failed,
                                std::string("RAND_bytes failed: ") + message.data()));
    }
    return {};
}

auto default_random_source() -> std::shared_ptr<random_source> {
    static auto instance = std::make_shared<openssl_random_source>();
    return instance;
}

}  // namespace secure_drive
