/**
 * @file transfer_types.h
 * @brief Job, batch and progress types for the transfer pipeline
 */

#ifndef SECURE_DRIVE_TRANSFER_TRANSFER_TYPES_H
#define SECURE_DRIVE_TRANSFER_TRANSFER_TYPES_H

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "secure_drive/core/types.h"

namespace secure_drive {

/**
 * @brief Lifecycle state of one file's encrypt-then-upload job
 *
 * @code
 * pending -> encrypting -> encrypted -> uploading -> completed
 *               |                           |
 *               +--> failed <---------------+
 * any non-terminal state -> cancelled
 * @endcode
 */
enum class job_state {
    pending,      ///< Waiting in the batch queue
    encrypting,   ///< Codec is producing the container
    encrypted,    ///< Container complete, upload not started
    uploading,    ///< Upload client call in progress
    completed,    ///< Uploaded; remote id known
    failed,       ///< Encryption or upload failed
    cancelled     ///< Stopped by batch cancellation
};

[[nodiscard]] constexpr auto to_string(job_state state) noexcept -> const char* {
    switch (state) {
        case job_state::pending: return "pending";
        case job_state::encrypting: return "encrypting";
        case job_state::encrypted: return "encrypted";
        case job_state::uploading: return "uploading";
        case job_state::completed: return "completed";
        case job_state::failed: return "failed";
        case job_state::cancelled: return "cancelled";
        default: return "unknown";
    }
}

[[nodiscard]] constexpr auto is_terminal(job_state state) noexcept -> bool {
    return state == job_state::completed ||
           state == job_state::failed ||
           state == job_state::cancelled;
}

/**
 * @brief Check whether a job may move from one state to another
 *
 * Transitions only move forward; a terminal state is never left.
 */
[[nodiscard]] constexpr auto is_valid_transition(job_state from, job_state to) noexcept -> bool {
    if (is_terminal(from)) {
        return false;
    }
    if (to == job_state::cancelled) {
        return true;
    }
    switch (from) {
        case job_state::pending:
            return to == job_state::encrypting;
        case job_state::encrypting:
            return to == job_state::encrypted || to == job_state::failed;
        case job_state::encrypted:
            return to == job_state::uploading;
        case job_state::uploading:
            return to == job_state::completed || to == job_state::failed;
        default:
            return false;
    }
}

/**
 * @brief Read-only copy of a job's state
 */
struct transfer_job_snapshot {
    job_id id;
    std::filesystem::path source;
    std::string display_name;
    job_state state = job_state::pending;
    uint64_t bytes_processed = 0;   ///< Progress within the current stage
    uint64_t total_bytes = 0;       ///< Declared plaintext size
    uint64_t bytes_encrypted = 0;
    uint64_t bytes_uploaded = 0;
    std::optional<std::filesystem::path> container;
    std::optional<error> last_error;
    std::optional<std::string> remote_id;
    std::chrono::system_clock::time_point created_at;
    std::optional<std::chrono::system_clock::time_point> started_at;
    std::optional<std::chrono::system_clock::time_point> finished_at;
};

/**
 * @brief Batch lifecycle
 */
enum class batch_status {
    pending,     ///< Submitted, not started
    queued,      ///< Started, waiting for the worker
    running,
    paused,      ///< Worker parked at a chunk or job boundary
    completed,   ///< Every job reached a terminal state
    cancelled
};

[[nodiscard]] constexpr auto to_string(batch_status status) noexcept -> const char* {
    switch (status) {
        case batch_status::pending: return "pending";
        case batch_status::queued: return "queued";
        case batch_status::running: return "running";
        case batch_status::paused: return "paused";
        case batch_status::completed: return "completed";
        case batch_status::cancelled: return "cancelled";
        default: return "unknown";
    }
}

[[nodiscard]] constexpr auto is_finished(batch_status status) noexcept -> bool {
    return status == batch_status::completed || status == batch_status::cancelled;
}

/**
 * @brief A file to encrypt and upload
 */
struct upload_entry {
    std::filesystem::path source;

    /// Remote name; "<filename>.encrypted" when empty
    std::string display_name;
};

/**
 * @brief Immutable progress snapshot published after every update
 *
 * Sequence numbers are strictly increasing within a batch; byte and file
 * counts never decrease.
 */
struct progress_snapshot {
    batch_id batch;
    uint64_t sequence = 0;
    batch_status status = batch_status::pending;
    std::size_t files_completed = 0;
    std::size_t files_failed = 0;
    std::size_t files_cancelled = 0;
    std::size_t files_total = 0;
    uint64_t bytes_transferred = 0;
    uint64_t bytes_total = 0;
    double throughput_bytes_per_sec = 0.0;
    std::optional<std::chrono::seconds> eta;   ///< std::nullopt while unknown
    std::chrono::milliseconds elapsed{0};
    std::string current_file_name;
    std::optional<job_state> current_file_status;

    [[nodiscard]] auto files_finished() const noexcept -> std::size_t {
        return files_completed + files_failed + files_cancelled;
    }

    [[nodiscard]] auto completion_percentage() const noexcept -> double {
        if (bytes_total == 0) return 0.0;
        return static_cast<double>(bytes_transferred) /
               static_cast<double>(bytes_total) * 100.0;
    }
};

/**
 * @brief Final outcome of one job
 */
struct job_result {
    job_id id;
    std::filesystem::path source;
    std::string display_name;
    job_state final_state = job_state::pending;
    std::optional<error> failure;
    std::optional<std::string> remote_id;
    std::optional<std::filesystem::path> container;
    uint64_t bytes = 0;
};

/**
 * @brief Per-job report of a finished batch
 *
 * There is no single pass/fail flag: callers inspect each job.
 */
struct batch_report {
    batch_id batch;
    batch_status status = batch_status::completed;
    std::vector<job_result> jobs;
    uint64_t bytes_transferred = 0;
    std::chrono::milliseconds elapsed{0};

    [[nodiscard]] auto count(job_state state) const noexcept -> std::size_t {
        std::size_t n = 0;
        for (const auto& job : jobs) {
            if (job.final_state == state) ++n;
        }
        return n;
    }

    [[nodiscard]] auto completed_count() const noexcept -> std::size_t {
        return count(job_state::completed);
    }

    [[nodiscard]] auto failed_count() const noexcept -> std::size_t {
        return count(job_state::failed);
    }

    [[nodiscard]] auto cancelled_count() const noexcept -> std::size_t {
        return count(job_state::cancelled);
    }

    [[nodiscard]] auto all_succeeded() const noexcept -> bool {
        return !jobs.empty() && completed_count() == jobs.size();
    }
};

}  // namespace secure_drive

#endif  // SECURE_DRIVE_TRANSFER_TRANSFER_TYPES_H
