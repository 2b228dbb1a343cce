/**
 * @file transfer_job.h
 * @brief State machine for one file's encrypt-then-upload job
 */

#ifndef SECURE_DRIVE_TRANSFER_TRANSFER_JOB_H
#define SECURE_DRIVE_TRANSFER_TRANSFER_JOB_H

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "secure_drive/core/types.h"
#include "secure_drive/transfer/transfer_types.h"

namespace secure_drive {

/**
 * @brief One file moving through encryption and upload
 *
 * Jobs are owned and mutated by the orchestrator's worker; everything else
 * sees snapshot() copies. State changes go through transition_to(), which
 * rejects anything is_valid_transition() does not allow.
 */
class transfer_job {
public:
    /**
     * @brief Create a pending job
     * @param id Job identifier
     * @param source Plaintext file
     * @param display_name Remote name; "<filename>.encrypted" when empty
     * @param total_bytes Declared plaintext size
     */
    transfer_job(job_id id,
                 std::filesystem::path source,
                 std::string display_name,
                 uint64_t total_bytes);

    /**
     * @brief Create a fresh pending job from a failed one
     *
     * The new job keeps the source, display name and declared size. When
     * the failed job's container is still on disk it is carried over so the
     * new job can upload it without encrypting again.
     *
     * @return invalid_state_transition unless @p failed is in the failed state
     */
    [[nodiscard]] static auto resubmit(const transfer_job& failed, job_id new_id)
        -> result<transfer_job>;

    /**
     * @brief Default remote name for a source file
     */
    [[nodiscard]] static auto default_display_name(const std::filesystem::path& source)
        -> std::string;

    // ========================================================================
    // State machine
    // ========================================================================

    /**
     * @brief Move to a new state
     * @return invalid_state_transition when the move is not allowed
     */
    [[nodiscard]] auto transition_to(job_state next) -> result<void>;

    /**
     * @brief Move to failed and keep the error
     */
    [[nodiscard]] auto fail(error err) -> result<void>;

    /**
     * @brief Move to completed and keep the remote id
     */
    [[nodiscard]] auto complete(std::string remote_id) -> result<void>;

    // ========================================================================
    // Progress
    // ========================================================================

    void set_bytes_processed(uint64_t bytes) noexcept { bytes_processed_ = bytes; }

    void set_encrypted(uint64_t bytes) noexcept { bytes_encrypted_ = bytes; }

    void set_uploaded(uint64_t bytes) noexcept { bytes_uploaded_ = bytes; }

    void set_container(std::filesystem::path container) { container_ = std::move(container); }

    void clear_container() noexcept { container_.reset(); }

    // ========================================================================
    // Accessors
    // ========================================================================

    [[nodiscard]] auto id() const noexcept -> job_id { return id_; }

    [[nodiscard]] auto source() const -> const std::filesystem::path& { return source_; }

    [[nodiscard]] auto display_name() const -> const std::string& { return display_name_; }

    [[nodiscard]] auto state() const noexcept -> job_state { return state_; }

    [[nodiscard]] auto total_bytes() const noexcept -> uint64_t { return total_bytes_; }

    [[nodiscard]] auto bytes_processed() const noexcept -> uint64_t { return bytes_processed_; }

    [[nodiscard]] auto container() const -> const std::optional<std::filesystem::path>& {
        return container_;
    }

    [[nodiscard]] auto last_error() const -> const std::optional<error>& { return last_error_; }

    [[nodiscard]] auto remote_id() const -> const std::optional<std::string>& { return remote_id_; }

    /**
     * @brief Whether the job was resubmitted with an intact container
     */
    [[nodiscard]] auto reuses_container() const noexcept -> bool { return reuses_container_; }

    [[nodiscard]] auto snapshot() const -> transfer_job_snapshot;

    [[nodiscard]] auto to_result() const -> job_result;

private:
    job_id id_;
    std::filesystem::path source_;
    std::string display_name_;
    job_state state_ = job_state::pending;
    uint64_t total_bytes_ = 0;
    uint64_t bytes_processed_ = 0;
    uint64_t bytes_encrypted_ = 0;
    uint64_t bytes_uploaded_ = 0;
    std::optional<std::filesystem::path> container_;
    std::optional<error> last_error_;
    std::optional<std::string> remote_id_;
    bool reuses_container_ = false;
    std::chrono::system_clock::time_point created_at_;
    std::optional<std::chrono::system_clock::time_point> started_at_;
    std::optional<std::chrono::system_clock::time_point> finished_at_;
};

}  // namespace secure_drive

#endif  // SECURE_DRIVE_TRANSFER_TRANSFER_JOB_H
