/**
 * @file upload_client.h
 * @brief Remote storage interface used by the transfer orchestrator
 *
 * The orchestrator only sees containers and display names. Authentication,
 * retries and the wire protocol belong to the implementation.
 */

#ifndef SECURE_DRIVE_TRANSFER_UPLOAD_CLIENT_H
#define SECURE_DRIVE_TRANSFER_UPLOAD_CLIENT_H

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "secure_drive/core/types.h"

namespace secure_drive {

/**
 * @brief Upload progress reported by an upload client
 */
struct upload_progress {
    /// Bytes uploaded so far
    uint64_t bytes_transferred = 0;

    /// Total bytes to upload
    uint64_t total_bytes = 0;

    [[nodiscard]] auto percentage() const -> double {
        if (total_bytes == 0) return 0.0;
        return static_cast<double>(bytes_transferred) /
               static_cast<double>(total_bytes) * 100.0;
    }
};

/**
 * @brief Progress hook passed to upload(); may be called from the calling thread only
 */
using upload_progress_callback = std::function<void(const upload_progress&)>;

/**
 * @brief Remote object metadata
 */
struct remote_file {
    /// Identifier assigned by the remote side
    std::string remote_id;

    /// Name shown to the user
    std::string display_name;

    /// Stored size in bytes (container size)
    uint64_t size = 0;

    /// Upload timestamp
    std::chrono::system_clock::time_point uploaded_at;
};

/**
 * @brief Remote storage client
 *
 * Failures are reported with the transport error codes:
 * transport_network_error, transport_quota_exceeded, transport_auth_expired,
 * transport_rejected. An implementation that throws is tolerated by the
 * orchestrator, which records the exception as a job failure.
 *
 * upload() is not interruptible; a pause or cancel requested during an
 * upload takes effect when it returns.
 */
class upload_client_interface {
public:
    virtual ~upload_client_interface() = default;

    /**
     * @brief Upload a container
     * @param container_path Complete container file
     * @param display_name Remote name
     * @param on_progress Optional progress hook
     * @return Remote identifier of the stored object
     */
    [[nodiscard]] virtual auto upload(
        const std::filesystem::path& container_path,
        const std::string& display_name,
        const upload_progress_callback& on_progress = {}) -> result<std::string> = 0;

    /**
     * @brief List stored objects
     */
    [[nodiscard]] virtual auto list() -> result<std::vector<remote_file>> = 0;

    /**
     * @brief Delete a stored object
     */
    [[nodiscard]] virtual auto remove(const std::string& remote_id) -> result<void> = 0;

    /**
     * @brief Download a stored object to a local file
     */
    [[nodiscard]] virtual auto download(
        const std::string& remote_id,
        const std::filesystem::path& destination) -> result<void> = 0;
};

/**
 * @brief Upload client that stores containers in a local directory
 *
 * Remote ids are sequential ("obj-1", "obj-2", ...). Used by the example
 * program and by integration tests.
 */
class directory_upload_client : public upload_client_interface {
public:
    /**
     * @brief Create a client rooted at a directory, creating it if needed
     * @return destination_unwritable when the directory cannot be created
     */
    [[nodiscard]] static auto create(const std::filesystem::path& root)
        -> result<std::unique_ptr<directory_upload_client>>;

    ~directory_upload_client() override;

    directory_upload_client(const directory_upload_client&) = delete;
    auto operator=(const directory_upload_client&) -> directory_upload_client& = delete;

    [[nodiscard]] auto upload(
        const std::filesystem::path& container_path,
        const std::string& display_name,
        const upload_progress_callback& on_progress = {}) -> result<std::string> override;

    [[nodiscard]] auto list() -> result<std::vector<remote_file>> override;

    [[nodiscard]] auto remove(const std::string& remote_id) -> result<void> override;

    [[nodiscard]] auto download(
        const std::string& remote_id,
        const std::filesystem::path& destination) -> result<void> override;

    [[nodiscard]] auto root() const -> const std::filesystem::path&;

private:
    explicit directory_upload_client(std::filesystem::path root);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace secure_drive

#endif  // SECURE_DRIVE_TRANSFER_UPLOAD_CLIENT_H
