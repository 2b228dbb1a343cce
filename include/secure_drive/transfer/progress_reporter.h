/**
 * @file progress_reporter.h
 * @brief Progress sinks for batch snapshots
 *
 * The orchestrator publishes an immutable progress_snapshot by value after
 * every update. Reporters decide how snapshots reach the consumer: a queue
 * drained by another thread, a direct callback, or the log.
 */

#ifndef SECURE_DRIVE_TRANSFER_PROGRESS_REPORTER_H
#define SECURE_DRIVE_TRANSFER_PROGRESS_REPORTER_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "secure_drive/transfer/transfer_types.h"

namespace secure_drive {

/**
 * @brief Progress sink interface
 *
 * publish() is called one snapshot at a time, in sequence order, with no
 * orchestrator lock held. It usually runs on the worker thread; snapshots
 * produced by submit(), start() or cancel() may be delivered on the calling
 * thread. Control calls such as pause() and cancel() are allowed from
 * publish(); wait() on a running batch is not, it would block the worker.
 */
class progress_reporter {
public:
    virtual ~progress_reporter() = default;

    virtual void publish(progress_snapshot snapshot) = 0;
};

// ============================================================================
// queued_progress_reporter
// ============================================================================

/**
 * @brief Thread-safe FIFO channel of snapshots
 *
 * With a capacity set, a full queue drops its oldest snapshot of a running
 * batch to make room. Snapshots of finished batches are never dropped, so
 * the final state of each batch always reaches the consumer.
 *
 * @code
 * auto queue = std::make_shared<queued_progress_reporter>();
 * // worker side: orchestrator publishes
 * // UI side:
 * while (auto snap = queue->wait_pop(std::chrono::milliseconds{100})) {
 *     render(*snap);
 * }
 * @endcode
 */
class queued_progress_reporter : public progress_reporter {
public:
    /**
     * @param capacity Maximum queued snapshots; 0 means unbounded
     */
    explicit queued_progress_reporter(std::size_t capacity = 0);
    ~queued_progress_reporter() override;

    queued_progress_reporter(const queued_progress_reporter&) = delete;
    auto operator=(const queued_progress_reporter&) -> queued_progress_reporter& = delete;

    void publish(progress_snapshot snapshot) override;

    /**
     * @brief Pop the oldest snapshot without blocking
     */
    [[nodiscard]] auto try_pop() -> std::optional<progress_snapshot>;

    /**
     * @brief Pop the oldest snapshot, waiting up to @p timeout
     * @return std::nullopt on timeout or when closed and empty
     */
    [[nodiscard]] auto wait_pop(std::chrono::milliseconds timeout)
        -> std::optional<progress_snapshot>;

    /**
     * @brief Remove and return every queued snapshot in order
     */
    [[nodiscard]] auto drain() -> std::vector<progress_snapshot>;

    /**
     * @brief Stop accepting snapshots and wake waiting consumers
     */
    void close();

    [[nodiscard]] auto is_closed() const -> bool;

    [[nodiscard]] auto size() const -> std::size_t;

    /**
     * @brief Number of snapshots dropped to respect the capacity
     */
    [[nodiscard]] auto dropped_count() const -> uint64_t;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

// ============================================================================
// callback_progress_reporter
// ============================================================================

/**
 * @brief Forwards each snapshot to a callback on the worker thread
 */
class callback_progress_reporter : public progress_reporter {
public:
    using callback = std::function<void(const progress_snapshot&)>;

    explicit callback_progress_reporter(callback cb);

    void publish(progress_snapshot snapshot) override;

private:
    callback callback_;
};

// ============================================================================
// logging_progress_reporter
// ============================================================================

/**
 * @brief Logs snapshots through the transfer logger
 *
 * Only job-level changes are logged (batch status, current file or its
 * state, finished file counts); byte-level updates are skipped.
 */
class logging_progress_reporter : public progress_reporter {
public:
    logging_progress_reporter();
    ~logging_progress_reporter() override;

    logging_progress_reporter(const logging_progress_reporter&) = delete;
    auto operator=(const logging_progress_reporter&) -> logging_progress_reporter& = delete;

    void publish(progress_snapshot snapshot) override;

    /**
     * @brief Number of snapshots that produced a log record
     */
    [[nodiscard]] auto logged_count() const -> uint64_t;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

// ============================================================================
// Formatting
// ============================================================================

/**
 * @brief Human-readable size: "512 B", "1.5 KB", "3.2 MB", "1.0 GB"
 */
[[nodiscard]] auto format_bytes(uint64_t bytes) -> std::string;

/**
 * @brief Remaining time as MM:SS, or "--:--" when unknown
 */
[[nodiscard]] auto format_eta(std::optional<std::chrono::seconds> eta) -> std::string;

/**
 * @brief One-line summary of a snapshot for status bars and logs
 */
[[nodiscard]] auto format_progress(const progress_snapshot& snapshot) -> std::string;

}  // namespace secure_drive

#endif  // SECURE_DRIVE_TRANSFER_PROGRESS_REPORTER_H
