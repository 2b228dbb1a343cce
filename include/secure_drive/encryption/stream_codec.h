/**
 * @file stream_codec.h
 * @brief Streaming AES-256-CBC container codec
 *
 * Container layout:
 * @code
 * +----------------+-----------------------------------------------+
 * | IV (16 bytes)  | AES-256-CBC ciphertext, PKCS#7 padded          |
 * +----------------+-----------------------------------------------+
 * @endcode
 *
 * CBC with PKCS#7 padding cannot tell a wrong key from a corrupted
 * container: both surface as authentication_or_padding_failure. A corrupted
 * container whose last block happens to decrypt to valid padding is
 * accepted and yields wrong plaintext; this mode gives no integrity
 * guarantee beyond the padding check.
 */

#ifndef SECURE_DRIVE_ENCRYPTION_STREAM_CODEC_H
#define SECURE_DRIVE_ENCRYPTION_STREAM_CODEC_H

#include <cstdint>
#include <filesystem>
#include <functional>
#include <istream>
#include <memory>
#include <ostream>

#include "secure_drive/core/types.h"
#include "secure_drive/encryption/encryption_config.h"
#include "secure_drive/encryption/encryption_key.h"
#include "secure_drive/encryption/random_source.h"

namespace secure_drive {

/**
 * @brief Called after each chunk with the cumulative plaintext byte count
 *
 * Returning false aborts the operation with error_code::cancelled. The
 * callback may block, which parks the codec between chunks.
 */
using chunk_callback = std::function<bool(uint64_t bytes_processed)>;

/**
 * @brief Streaming container encoder/decoder
 *
 * The codec keeps no key state: every call receives the key by reference
 * and drops every copy of it (including the cipher context) before
 * returning. Memory use is bounded by the configured chunk size regardless
 * of input size.
 *
 * @code
 * auto codec = stream_codec::create();
 * auto consumed = codec->encrypt_file("report.pdf", "report.pdf.encrypted",
 *                                     lease.key());
 * @endcode
 */
class stream_codec {
public:
    /**
     * @brief Create a codec
     * @param config Chunking configuration
     * @param random IV source; the OpenSSL source when null
     */
    [[nodiscard]] static auto create(
        const codec_config& config = {},
        std::shared_ptr<random_source> random = nullptr) -> std::unique_ptr<stream_codec>;

    ~stream_codec();

    stream_codec(const stream_codec&) = delete;
    auto operator=(const stream_codec&) -> stream_codec& = delete;
    stream_codec(stream_codec&&) noexcept;
    auto operator=(stream_codec&&) noexcept -> stream_codec&;

    // ========================================================================
    // Stream operations
    // ========================================================================

    /**
     * @brief Encrypt a stream into a container
     * @param source Plaintext input
     * @param destination Container output; receives the IV first
     * @param key Key used for this call only
     * @param on_chunk Optional progress/abort hook
     * @return Plaintext bytes consumed
     *
     * On failure the destination may hold a partial container; discarding it
     * is the caller's job. encrypt_file() does so automatically.
     */
    [[nodiscard]] auto encrypt(std::istream& source,
                               std::ostream& destination,
                               const encryption_key& key,
                               const chunk_callback& on_chunk = {}) -> result<uint64_t>;

    /**
     * @brief Decrypt a container stream
     * @return Plaintext bytes written; malformed_container if the IV is
     *         incomplete, authentication_or_padding_failure on a bad final
     *         block
     *
     * On failure the destination may hold unauthenticated plaintext.
     */
    [[nodiscard]] auto decrypt(std::istream& source,
                               std::ostream& destination,
                               const encryption_key& key,
                               const chunk_callback& on_chunk = {}) -> result<uint64_t>;

    // ========================================================================
    // File operations
    // ========================================================================

    /**
     * @brief Encrypt a file into a container file atomically
     *
     * Output is written to "<destination>.part" and renamed into place after a
     * successful flush. Every failure, including cancellation, removes the
     * partial file, so the destination either holds a complete container or
     * is untouched.
     */
    [[nodiscard]] auto encrypt_file(const std::filesystem::path& source,
                                    const std::filesystem::path& destination,
                                    const encryption_key& key,
                                    const chunk_callback& on_chunk = {}) -> result<uint64_t>;

    /**
     * @brief Decrypt a container file atomically
     *
     * Plaintext is only moved into place after the padding check passed.
     */
    [[nodiscard]] auto decrypt_file(const std::filesystem::path& source,
                                    const std::filesystem::path& destination,
                                    const encryption_key& key,
                                    const chunk_callback& on_chunk = {}) -> result<uint64_t>;

    // ========================================================================
    // Container helpers
    // ========================================================================

    /**
     * @brief Structural check of a container file
     *
     * Heuristic only: true when the file name ends in ".encrypted" and the
     * file is at least one IV long. Both are required, so a valid container
     * stored under another name yields false; use the stream overload to
     * check content alone. Says nothing about key or integrity.
     */
    [[nodiscard]] static auto is_container(const std::filesystem::path& path) -> bool;

    /**
     * @brief Structural check of a container stream
     *
     * Heuristic only: true when at least one IV worth of bytes can be read.
     * The stream position is restored afterwards.
     */
    [[nodiscard]] static auto is_container(std::istream& stream) -> bool;

    /**
     * @brief Exact container size for a plaintext size
     */
    [[nodiscard]] static constexpr auto container_size(uint64_t plaintext_size) -> uint64_t {
        return AES_CBC_IV_SIZE + (plaintext_size / AES_BLOCK_SIZE + 1) * AES_BLOCK_SIZE;
    }

    /**
     * @brief Container path for a source file
     * @param source Plaintext file
     * @param directory Output directory; the source's directory when empty
     */
    [[nodiscard]] static auto container_path_for(
        const std::filesystem::path& source,
        const std::filesystem::path& directory = {}) -> std::filesystem::path;

    [[nodiscard]] auto config() const -> const codec_config&;

private:
    stream_codec(const codec_config& config, std::shared_ptr<random_source> random);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace secure_drive

#endif  // SECURE_DRIVE_ENCRYPTION_STREAM_CODEC_H
