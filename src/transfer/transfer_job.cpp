/**
 * @file transfer_job.cpp
 * @brief Transfer job state machine implementation
 */

#include "secure_drive/transfer/transfer_job.h"

#include "secure_drive/encryption/encryption_config.h"

#include <system_error>

namespace secure_drive {

transfer_job::transfer_job(job_id id,
                           std::filesystem::path source,
                           std::string display_name,
                           uint64_t total_bytes)
    : id_(id),
      source_(std::move(source)),
      display_name_(std::move(display_name)),
      total_bytes_(total_bytes),
      created_at_(std::chrono::system_clock::now()) {
    if (display_name_.empty()) {
        display_name_ = default_display_name(source_);
    }
}

auto transfer_job::resubmit(const transfer_job& failed, job_id new_id)
    -> result<transfer_job> {
    if (failed.state_ != job_state::failed) {
        return unexpected(error(error_code::invalid_state_transition,
                                "Only failed jobs can be resubmitted; job " +
                                std::to_string(failed.id_.value) + " is " +
                                to_string(failed.state_)));
    }

    transfer_job job(new_id, failed.source_, failed.display_name_, failed.total_bytes_);
    if (failed.container_) {
        std::error_code ec;
        if (std::filesystem::is_regular_file(*failed.container_, ec)) {
            job.container_ = failed.container_;
            job.bytes_encrypted_ = failed.bytes_encrypted_;
            job.reuses_container_ = true;
        }
    }
    return job;
}

auto transfer_job::default_display_name(const std::filesystem::path& source) -> std::string {
    return source.filename().string() + std::string(CONTAINER_EXTENSION);
}

auto transfer_job::transition_to(job_state next) -> result<void> {
    if (!is_valid_transition(state_, next)) {
        return unexpected(error(error_code::invalid_state_transition,
                                std::string("Job ") + std::to_string(id_.value) +
                                ": invalid transition " + to_string(state_) +
                                " -> " + to_string(next)));
    }

    auto now = std::chrono::system_clock::now();
    if (state_ == job_state::pending && !started_at_) {
        started_at_ = now;
    }
    if (is_terminal(next)) {
        finished_at_ = now;
    }
    if (next != state_) {
        bytes_processed_ = 0;
    }
    state_ = next;
    return {};
}

auto transfer_job::fail(error err) -> result<void> {
    auto moved = transition_to(job_state::failed);
    if (!moved) {
        return moved;
    }
    last_error_ = std::move(err);
    return {};
}

auto transfer_job::complete(std::string remote_id) -> result<void> {
    auto moved = transition_to(job_state::completed);
    if (!moved) {
        return moved;
    }
    remote_id_ = std::move(remote_id);
    return {};
}

auto transfer_job::snapshot() const -> transfer_job_snapshot {
    transfer_job_snapshot snap;
    snap.id = id_;
    snap.source = source_;
    snap.display_name = display_name_;
    snap.state = state_;
    snap.bytes_processed = bytes_processed_;
    snap.total_bytes = total_bytes_;
    snap.bytes_encrypted = bytes_encrypted_;
    snap.bytes_uploaded = bytes_uploaded_;
    snap.container = container_;
    snap.last_error = last_error_;
    snap.remote_id = remote_id_;
    snap.created_at = created_at_;
    snap.started_at = started_at_;
    snap.finished_at = finished_at_;
    return snap;
}

auto transfer_job::to_result() const -> job_result {
    job_result res;
    res.id = id_;
    res.source = source_;
    res.display_name = display_name_;
    res.final_state = state_;
    res.failure = last_error_;
    res.remote_id = remote_id_;
    res.container = container_;
    res.bytes = bytes_encrypted_ + bytes_uploaded_;
    return res;
}

}  // namespace secure_drive
