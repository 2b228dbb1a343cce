/**
 * @file transfer_orchestrator.h
 * @brief Sequential encrypt-then-upload batch runner
 */

#ifndef SECURE_DRIVE_TRANSFER_TRANSFER_ORCHESTRATOR_H
#define SECURE_DRIVE_TRANSFER_TRANSFER_ORCHESTRATOR_H

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <vector>

#include "secure_drive/core/statistics_collector.h"
#include "secure_drive/core/types.h"
#include "secure_drive/encryption/encryption_config.h"
#include "secure_drive/encryption/key_store.h"
#include "secure_drive/encryption/random_source.h"
#include "secure_drive/transfer/progress_reporter.h"
#include "secure_drive/transfer/transfer_types.h"
#include "secure_drive/transfer/upload_client.h"

namespace secure_drive {

class transfer_orchestrator;

/**
 * @brief Handle for controlling and observing one batch
 *
 * Copyable. The orchestrator that issued the handle must outlive it and must
 * not be moved while handles are in use.
 *
 * @code
 * auto batch = orchestrator.submit(files);
 * if (batch.has_value()) {
 *     auto& handle = batch.value();
 *     (void)handle.start();
 *
 *     auto report = handle.wait();
 *     for (const auto& job : report.value().jobs) {
 *         // inspect job.final_state / job.failure
 *     }
 * }
 * @endcode
 */
class batch_handle {
public:
    /**
     * @brief Default constructor (invalid handle)
     */
    batch_handle();

    batch_handle(batch_id id, transfer_orchestrator* owner);

    batch_handle(const batch_handle&) = default;
    batch_handle(batch_handle&&) noexcept = default;
    auto operator=(const batch_handle&) -> batch_handle& = default;
    auto operator=(batch_handle&&) noexcept -> batch_handle& = default;

    [[nodiscard]] auto id() const noexcept -> batch_id;

    [[nodiscard]] auto is_valid() const noexcept -> bool;

    [[nodiscard]] auto start() -> result<void>;

    [[nodiscard]] auto pause() -> result<void>;

    [[nodiscard]] auto resume() -> result<void>;

    [[nodiscard]] auto cancel() -> result<void>;

    [[nodiscard]] auto wait() -> result<batch_report>;

    [[nodiscard]] auto wait_for(std::chrono::milliseconds timeout) -> result<batch_report>;

    [[nodiscard]] auto progress() const -> result<progress_snapshot>;

    [[nodiscard]] auto jobs() const -> result<std::vector<transfer_job_snapshot>>;

    [[nodiscard]] auto status() const -> result<batch_status>;

private:
    batch_id id_;
    transfer_orchestrator* owner_;
};

/**
 * @brief Runs batches of files through encryption and upload
 *
 * One background worker processes started batches in start order and the
 * jobs of a batch in submission order: each file is encrypted into a
 * container, then uploaded. A job that fails is recorded and the batch moves
 * on to the next one.
 *
 * Pause and cancel are cooperative. They are observed after every codec
 * chunk, between the encryption and upload stages, and between jobs. An
 * upload call in progress is not interrupted: a pause or cancel issued
 * during an upload takes effect once the upload client returns.
 *
 * The active key is leased from the key store when a batch starts and
 * released when it finishes, so the key cannot be regenerated under a
 * running batch.
 *
 * @code
 * auto orchestrator = transfer_orchestrator::builder()
 *     .with_key_store(store)
 *     .with_upload_client(client)
 *     .with_progress_reporter(queue)
 *     .build();
 * @endcode
 */
class transfer_orchestrator {
public:
    /**
     * @brief Builder for transfer_orchestrator
     */
    class builder {
    public:
        builder();

        /**
         * @brief Set the key store (required)
         */
        auto with_key_store(std::shared_ptr<key_store> store) -> builder&;

        /**
         * @brief Set the upload client (required)
         */
        auto with_upload_client(std::shared_ptr<upload_client_interface> client) -> builder&;

        /**
         * @brief Set the progress sink (optional)
         */
        auto with_progress_reporter(std::shared_ptr<progress_reporter> reporter) -> builder&;

        /**
         * @brief Set codec chunking (default: 8 KiB chunks)
         */
        auto with_codec_config(const codec_config& config) -> builder&;

        /**
         * @brief Set the IV source used by the codec (default: OpenSSL)
         */
        auto with_random_source(std::shared_ptr<random_source> random) -> builder&;

        /**
         * @brief Write containers to this directory instead of beside each source
         */
        auto with_staging_directory(const std::filesystem::path& directory) -> builder&;

        /**
         * @brief Minimum interval between throughput samples (default: 500ms)
         */
        auto with_throughput_interval(std::chrono::milliseconds interval) -> builder&;

        /**
         * @brief Number of samples in the throughput window (default: 10)
         */
        auto with_throughput_window(std::size_t samples) -> builder&;

        /**
         * @brief Delete each container after a successful upload (default: false)
         */
        auto with_remove_container_after_upload(bool remove) -> builder&;

        /**
         * @brief Replace the steady clock used for throughput and elapsed time
         */
        auto with_clock(clock_source clock) -> builder&;

        /**
         * @brief Build the orchestrator and start its worker
         * @return invalid_configuration when a required collaborator is missing
         *         or a setting is out of range
         */
        [[nodiscard]] auto build() -> result<transfer_orchestrator>;

    private:
        std::shared_ptr<key_store> keys_;
        std::shared_ptr<upload_client_interface> uploader_;
        std::shared_ptr<progress_reporter> reporter_;
        std::shared_ptr<random_source> random_;
        codec_config codec_;
        std::optional<std::filesystem::path> staging_;
        std::chrono::milliseconds throughput_interval_{500};
        std::size_t throughput_window_ = 10;
        bool remove_after_upload_ = false;
        clock_source clock_;
    };

    transfer_orchestrator(const transfer_orchestrator&) = delete;
    auto operator=(const transfer_orchestrator&) -> transfer_orchestrator& = delete;
    transfer_orchestrator(transfer_orchestrator&&) noexcept;
    auto operator=(transfer_orchestrator&&) noexcept -> transfer_orchestrator&;

    /**
     * @brief Cancel unfinished batches and join the worker
     */
    ~transfer_orchestrator();

    // ========================================================================
    // Batch creation
    // ========================================================================

    /**
     * @brief Create a pending batch with one job per entry
     *
     * Sizes are taken from the file system now. A file that cannot be sized
     * declares 0 bytes and fails when its encryption starts.
     *
     * @return invalid_configuration when @p files is empty
     */
    [[nodiscard]] auto submit(std::span<const upload_entry> files) -> result<batch_handle>;

    /**
     * @brief Create a pending batch using default display names
     */
    [[nodiscard]] auto submit(const std::vector<std::filesystem::path>& files)
        -> result<batch_handle>;

    /**
     * @brief Create a pending batch retrying every failed job of a finished batch
     *
     * Jobs whose container survived the failed upload upload it again without
     * re-encrypting.
     *
     * @return batch_not_finished while @p id is still running,
     *         invalid_state_transition when it has no failed jobs
     */
    [[nodiscard]] auto resubmit_failed(batch_id id) -> result<batch_handle>;

    // ========================================================================
    // Control
    // ========================================================================

    /**
     * @brief Lease the key and queue the batch for the worker
     * @return Key errors (key_not_loaded) without starting the batch,
     *         batch_already_started when started before
     */
    [[nodiscard]] auto start(batch_id id) -> result<void>;

    [[nodiscard]] auto pause(batch_id id) -> result<void>;

    [[nodiscard]] auto resume(batch_id id) -> result<void>;

    /**
     * @brief Cancel the batch
     *
     * A batch that never started is cancelled immediately. Otherwise the
     * job in flight stops at its next chunk boundary (an upload in progress
     * still completes) and every unfinished job becomes cancelled.
     */
    [[nodiscard]] auto cancel(batch_id id) -> result<void>;

    // ========================================================================
    // Observation
    // ========================================================================

    /**
     * @brief Block until the batch finishes
     * @return batch_not_finished when the batch was never started
     */
    [[nodiscard]] auto wait(batch_id id) -> result<batch_report>;

    /**
     * @brief Block until the batch finishes or the timeout elapses
     * @return timeout error when the batch is still running
     */
    [[nodiscard]] auto wait_for(batch_id id, std::chrono::milliseconds timeout)
        -> result<batch_report>;

    /**
     * @brief Most recently published snapshot of the batch
     */
    [[nodiscard]] auto progress(batch_id id) const -> result<progress_snapshot>;

    [[nodiscard]] auto jobs(batch_id id) const -> result<std::vector<transfer_job_snapshot>>;

    [[nodiscard]] auto status(batch_id id) const -> result<batch_status>;

    /**
     * @brief Identifiers of every batch known to the orchestrator
     */
    [[nodiscard]] auto batches() const -> std::vector<batch_id>;

private:
    struct config;
    explicit transfer_orchestrator(config cfg);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace secure_drive

#endif  // SECURE_DRIVE_TRANSFER_TRANSFER_ORCHESTRATOR_H
