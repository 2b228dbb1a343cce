/**
 * @file stream_codec.cpp
 * @brief Streaming AES-256-CBC container codec implementation
 */

#include "secure_drive/encryption/stream_codec.h"

#include "secure_drive/core/logging.h"

#include <openssl/err.h>
#include <openssl/evp.h>

#include <array>
#include <chrono>
#include <fstream>
#include <system_error>
#include <vector>

namespace secure_drive {

namespace fs = std::filesystem;

namespace {

/**
 * @brief Get OpenSSL error message
 */
auto get_openssl_error() -> std::string {
    unsigned long err = ERR_get_error();
    if (err == 0) {
        return "Unknown OpenSSL error";
    }
    std::array<char, 256> buffer{};
    ERR_error_string_n(err, buffer.data(), buffer.size());
    return std::string(buffer.data());
}

/**
 * @brief RAII wrapper for EVP_CIPHER_CTX
 *
 * The context holds the expanded key schedule; EVP_CIPHER_CTX_free scrubs it.
 */
class evp_cipher_ctx_wrapper {
public:
    evp_cipher_ctx_wrapper() : ctx_(EVP_CIPHER_CTX_new()) {}

    ~evp_cipher_ctx_wrapper() {
        if (ctx_) {
            EVP_CIPHER_CTX_free(ctx_);
        }
    }

    evp_cipher_ctx_wrapper(const evp_cipher_ctx_wrapper&) = delete;
    auto operator=(const evp_cipher_ctx_wrapper&) -> evp_cipher_ctx_wrapper& = delete;

    [[nodiscard]] auto get() const -> EVP_CIPHER_CTX* { return ctx_; }
    [[nodiscard]] explicit operator bool() const { return ctx_ != nullptr; }

private:
    EVP_CIPHER_CTX* ctx_;
};

/**
 * @brief Chunk buffers that are scrubbed on every exit path
 */
struct chunk_buffers {
    std::vector<std::byte> input;
    std::vector<std::byte> output;

    explicit chunk_buffers(std::size_t chunk_size)
        : input(chunk_size), output(chunk_size + AES_BLOCK_SIZE) {}

    ~chunk_buffers() {
        secure_zero(input);
        secure_zero(output);
    }

    chunk_buffers(const chunk_buffers&) = delete;
    auto operator=(const chunk_buffers&) -> chunk_buffers& = delete;

    [[nodiscard]] auto in() -> unsigned char* {
        return reinterpret_cast<unsigned char*>(input.data());
    }
    [[nodiscard]] auto out() -> unsigned char* {
        return reinterpret_cast<unsigned char*>(output.data());
    }
};

auto write_bytes(std::ostream& destination, const std::byte* data, std::size_t size) -> bool {
    if (size == 0) {
        return static_cast<bool>(destination);
    }
    destination.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    return static_cast<bool>(destination);
}

auto partial_path(const fs::path& destination) -> fs::path {
    auto part = destination;
    part += std::string(PARTIAL_SUFFIX);
    return part;
}

void discard_partial(const fs::path& part) {
    std::error_code ec;
    fs::remove(part, ec);
    if (ec) {
        SD_LOG_WARN(log_category::codec,
                    "Could not remove partial output " + part.string() + ": " + ec.message());
    }
}

/**
 * @brief Refine a write failure into disk_full when the volume has no room left
 */
auto classify_write_failure(const fs::path& destination, const error& err,
                            std::size_t needed) -> error {
    if (err.code != error_code::destination_unwritable) {
        return err;
    }
    std::error_code ec;
    auto directory = destination.has_parent_path() ? destination.parent_path() : fs::path(".");
    auto info = fs::space(directory, ec);
    if (!ec && info.available < needed) {
        return error(error_code::disk_full, "No space left on device for " + destination.string());
    }
    return err;
}

auto open_source(const fs::path& source, std::ifstream& stream) -> result<void> {
    std::error_code ec;
    auto status = fs::status(source, ec);
    if (ec || !fs::exists(status)) {
        return unexpected(error(error_code::file_not_found,
                                "Source file not found: " + source.string()));
    }
    if (!fs::is_regular_file(status)) {
        return unexpected(error(error_code::source_unreadable,
                                "Source is not a regular file: " + source.string()));
    }
    stream.open(source, std::ios::binary);
    if (!stream) {
        return unexpected(error(error_code::source_unreadable,
                                "Cannot open source file: " + source.string()));
    }
    return {};
}

auto open_partial(const fs::path& destination, std::ofstream& stream) -> result<void> {
    std::error_code ec;
    if (destination.has_parent_path() && !fs::exists(destination.parent_path(), ec)) {
        fs::create_directories(destination.parent_path(), ec);
        if (ec) {
            return unexpected(error(error_code::destination_unwritable,
                                    "Cannot create output directory " +
                                    destination.parent_path().string() + ": " + ec.message()));
        }
    }
    stream.open(partial_path(destination), std::ios::binary | std::ios::trunc);
    if (!stream) {
        return unexpected(error(error_code::destination_unwritable,
                                "Cannot open output file: " + partial_path(destination).string()));
    }
    return {};
}

using stream_operation = std::function<result<uint64_t>(std::istream&, std::ostream&)>;

/**
 * @brief Run a stream operation between two files with atomic publish
 */
auto run_atomic(const fs::path& source,
                const fs::path& destination,
                std::size_t chunk_size,
                const stream_operation& operation) -> result<uint64_t> {
    std::ifstream in;
    auto opened = open_source(source, in);
    if (!opened) {
        return unexpected(opened.error());
    }

    std::ofstream out;
    auto created = open_partial(destination, out);
    if (!created) {
        return unexpected(created.error());
    }

    auto part = partial_path(destination);
    auto processed = operation(in, out);
    if (processed) {
        out.close();
        if (out.fail()) {
            processed = unexpected(error(error_code::destination_unwritable,
                                         "Failed to flush " + part.string()));
        }
    } else {
        out.close();
    }

    if (!processed) {
        discard_partial(part);
        return unexpected(classify_write_failure(destination, processed.error(), chunk_size));
    }

    std::error_code ec;
    fs::rename(part, destination, ec);
    if (ec) {
        discard_partial(part);
        return unexpected(error(error_code::destination_unwritable,
                                "Cannot move output into place at " + destination.string() +
                                ": " + ec.message()));
    }
    return processed;
}

}  // namespace

// ============================================================================
// stream_codec::impl
// ============================================================================

struct stream_codec::impl {
    codec_config config;
    std::shared_ptr<random_source> random;

    impl(const codec_config& cfg, std::shared_ptr<random_source> rnd)
        : config(cfg), random(std::move(rnd)) {}

    auto encrypt(std::istream& source, std::ostream& destination,
                 const encryption_key& key, const chunk_callback& on_chunk) -> result<uint64_t> {
        if (key.size() != AES_256_KEY_SIZE) {
            return unexpected(error(error_code::key_corrupt, "Key has invalid length"));
        }

        std::array<std::byte, AES_CBC_IV_SIZE> iv{};
        auto filled = random->fill(iv);
        if (!filled) {
            return unexpected(error(error_code::crypto_failure,
                                    "Failed to generate IV: " + filled.error().message));
        }

        evp_cipher_ctx_wrapper ctx;
        if (!ctx) {
            return unexpected(error(error_code::crypto_failure, "Failed to create cipher context"));
        }
        if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr,
                               reinterpret_cast<const unsigned char*>(key.bytes().data()),
                               reinterpret_cast<const unsigned char*>(iv.data())) != 1) {
            return unexpected(error(error_code::crypto_failure, get_openssl_error()));
        }

        if (!write_bytes(destination, iv.data(), iv.size())) {
            return unexpected(error(error_code::destination_unwritable, "Failed to write IV"));
        }

        chunk_buffers buffers(config.chunk_size);
        uint64_t consumed = 0;

        for (;;) {
            source.read(reinterpret_cast<char*>(buffers.input.data()),
                        static_cast<std::streamsize>(config.chunk_size));
            auto n = source.gcount();
            if (source.bad()) {
                return unexpected(error(error_code::source_unreadable,
                                        "Read failed after " + std::to_string(consumed) + " bytes"));
            }

            if (n > 0) {
                int out_len = 0;
                if (EVP_EncryptUpdate(ctx.get(), buffers.out(), &out_len,
                                      buffers.in(), static_cast<int>(n)) != 1) {
                    return unexpected(error(error_code::crypto_failure, get_openssl_error()));
                }
                if (!write_bytes(destination, buffers.output.data(),
                                 static_cast<std::size_t>(out_len))) {
                    return unexpected(error(error_code::destination_unwritable,
                                            "Write failed after " + std::to_string(consumed) +
                                            " plaintext bytes"));
                }
                consumed += static_cast<uint64_t>(n);

                if (on_chunk && !on_chunk(consumed)) {
                    return unexpected(error(error_code::cancelled, "Encryption cancelled"));
                }
            }

            if (!source) {
                break;
            }
        }

        int final_len = 0;
        if (EVP_EncryptFinal_ex(ctx.get(), buffers.out(), &final_len) != 1) {
            return unexpected(error(error_code::crypto_failure, get_openssl_error()));
        }
        if (!write_bytes(destination, buffers.output.data(), static_cast<std::size_t>(final_len))) {
            return unexpected(error(error_code::destination_unwritable, "Failed to write final block"));
        }

        destination.flush();
        if (!destination) {
            return unexpected(error(error_code::destination_unwritable, "Failed to flush output"));
        }
        return consumed;
    }

    auto decrypt(std::istream& source, std::ostream& destination,
                 const encryption_key& key, const chunk_callback& on_chunk) -> result<uint64_t> {
        if (key.size() != AES_256_KEY_SIZE) {
            return unexpected(error(error_code::key_corrupt, "Key has invalid length"));
        }

        std::array<std::byte, AES_CBC_IV_SIZE> iv{};
        source.read(reinterpret_cast<char*>(iv.data()), static_cast<std::streamsize>(iv.size()));
        if (source.bad()) {
            return unexpected(error(error_code::source_unreadable, "Failed to read container"));
        }
        auto iv_read = source.gcount();
        if (iv_read != static_cast<std::streamsize>(iv.size())) {
            return unexpected(error(error_code::malformed_container,
                                    "Container too short: " + std::to_string(iv_read) +
                                    " bytes, IV needs " + std::to_string(iv.size())));
        }

        evp_cipher_ctx_wrapper ctx;
        if (!ctx) {
            return unexpected(error(error_code::crypto_failure, "Failed to create cipher context"));
        }
        if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr,
                               reinterpret_cast<const unsigned char*>(key.bytes().data()),
                               reinterpret_cast<const unsigned char*>(iv.data())) != 1) {
            return unexpected(error(error_code::crypto_failure, get_openssl_error()));
        }

        chunk_buffers buffers(config.chunk_size);
        uint64_t produced = 0;

        while (source) {
            source.read(reinterpret_cast<char*>(buffers.input.data()),
                        static_cast<std::streamsize>(config.chunk_size));
            auto n = source.gcount();
            if (source.bad()) {
                return unexpected(error(error_code::source_unreadable,
                                        "Read failed after " + std::to_string(produced) + " bytes"));
            }
            if (n == 0) {
                break;
            }

            int out_len = 0;
            if (EVP_DecryptUpdate(ctx.get(), buffers.out(), &out_len,
                                  buffers.in(), static_cast<int>(n)) != 1) {
                return unexpected(error(error_code::crypto_failure, get_openssl_error()));
            }
            if (!write_bytes(destination, buffers.output.data(), static_cast<std::size_t>(out_len))) {
                return unexpected(error(error_code::destination_unwritable,
                                        "Write failed after " + std::to_string(produced) + " bytes"));
            }
            produced += static_cast<uint64_t>(out_len);

            if (on_chunk && !on_chunk(produced)) {
                return unexpected(error(error_code::cancelled, "Decryption cancelled"));
            }
        }

        int final_len = 0;
        if (EVP_DecryptFinal_ex(ctx.get(), buffers.out(), &final_len) != 1) {
            ERR_clear_error();
            return unexpected(error(error_code::authentication_or_padding_failure,
                                    "Decryption failed: wrong key or corrupted container"));
        }
        if (!write_bytes(destination, buffers.output.data(), static_cast<std::size_t>(final_len))) {
            return unexpected(error(error_code::destination_unwritable, "Failed to write final block"));
        }
        produced += static_cast<uint64_t>(final_len);

        destination.flush();
        if (!destination) {
            return unexpected(error(error_code::destination_unwritable, "Failed to flush output"));
        }
        return produced;
    }
};

// ============================================================================
// stream_codec
// ============================================================================

stream_codec::stream_codec(const codec_config& config, std::shared_ptr<random_source> random)
    : impl_(std::make_unique<impl>(config, random ? std::move(random) : default_random_source())) {}

stream_codec::~stream_codec() = default;

stream_codec::stream_codec(stream_codec&&) noexcept = default;
auto stream_codec::operator=(stream_codec&&) noexcept -> stream_codec& = default;

auto stream_codec::create(
    const codec_config& config,
    std::shared_ptr<random_source> random) -> std::unique_ptr<stream_codec> {
    if (!config.is_valid()) {
        return nullptr;
    }
    return std::unique_ptr<stream_codec>(new stream_codec(config, std::move(random)));
}

auto stream_codec::encrypt(std::istream& source,
                           std::ostream& destination,
                           const encryption_key& key,
                           const chunk_callback& on_chunk) -> result<uint64_t> {
    return impl_->encrypt(source, destination, key, on_chunk);
}

auto stream_codec::decrypt(std::istream& source,
                           std::ostream& destination,
                           const encryption_key& key,
                           const chunk_callback& on_chunk) -> result<uint64_t> {
    return impl_->decrypt(source, destination, key, on_chunk);
}

auto stream_codec::encrypt_file(const fs::path& source,
                                const fs::path& destination,
                                const encryption_key& key,
                                const chunk_callback& on_chunk) -> result<uint64_t> {
    auto start = std::chrono::steady_clock::now();

    auto consumed = run_atomic(source, destination, impl_->config.chunk_size,
        [&](std::istream& in, std::ostream& out) {
            return impl_->encrypt(in, out, key, on_chunk);
        });

    transfer_log_context ctx;
    ctx.filename = source.string();
    if (!consumed) {
        ctx.error_message = consumed.error().message;
        if (consumed.error().code == error_code::cancelled) {
            SD_LOG_DEBUG_CTX(log_category::codec, "Encryption cancelled", ctx);
        } else {
            SD_LOG_WARN_CTX(log_category::codec, "Encryption failed", ctx);
        }
        return consumed;
    }

    ctx.bytes_processed = consumed.value();
    ctx.duration_ms = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count());
    SD_LOG_DEBUG_CTX(log_category::codec, "File encrypted", ctx);
    return consumed;
}

auto stream_codec::decrypt_file(const fs::path& source,
                                const fs::path& destination,
                                const encryption_key& key,
                                const chunk_callback& on_chunk) -> result<uint64_t> {
    auto produced = run_atomic(source, destination, impl_->config.chunk_size,
        [&](std::istream& in, std::ostream& out) {
            return impl_->decrypt(in, out, key, on_chunk);
        });

    if (!produced) {
        transfer_log_context ctx;
        ctx.filename = source.string();
        ctx.error_message = produced.error().message;
        SD_LOG_WARN_CTX(log_category::codec, "Decryption failed", ctx);
    }
    return produced;
}

auto stream_codec::is_container(const fs::path& path) -> bool {
    if (path.extension().string() != CONTAINER_EXTENSION) {
        return false;
    }
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return false;
    }
    auto size = fs::file_size(path, ec);
    return !ec && size >= AES_CBC_IV_SIZE;
}

auto stream_codec::is_container(std::istream& stream) -> bool {
    auto position = stream.tellg();
    std::array<char, AES_CBC_IV_SIZE> head{};
    stream.read(head.data(), static_cast<std::streamsize>(head.size()));
    bool long_enough = stream.gcount() == static_cast<std::streamsize>(head.size());

    stream.clear();
    if (position != std::streampos(-1)) {
        stream.seekg(position);
    }
    return long_enough;
}

auto stream_codec::container_path_for(const fs::path& source,
                                      const fs::path& directory) -> fs::path {
    auto name = source.filename().string() + std::string(CONTAINER_EXTENSION);
    if (directory.empty()) {
        return source.parent_path() / name;
    }
    return directory / name;
}

auto stream_codec::config() const -> const codec_config& {
    return impl_->config;
}

}  // namespace secure_drive
