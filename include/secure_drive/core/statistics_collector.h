/**
 * @file statistics_collector.h
 * @brief Throughput and ETA bookkeeping for a batch run
 *
 * This file defines the statistics_collector class used by the transfer
 * orchestrator to turn a stream of byte counts into throughput and ETA
 * figures that do not jitter from chunk to chunk.
 */

#ifndef SECURE_DRIVE_CORE_STATISTICS_COLLECTOR_H
#define SECURE_DRIVE_CORE_STATISTICS_COLLECTOR_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

namespace secure_drive {

using duration = std::chrono::milliseconds;
using time_point = std::chrono::steady_clock::time_point;

/**
 * @brief Source of the current time; replaceable for deterministic tests
 */
using clock_source = std::function<time_point()>;

/**
 * @brief Statistics collector for batch progress
 *
 * Throughput is recomputed at most once per sample interval over a sliding
 * window of samples. Between samples the last computed rate is reported.
 *
 * @code
 * statistics_collector stats;
 * stats.start(total_bytes);
 *
 * stats.record_bytes(chunk_size);
 *
 * auto rate = stats.get_transfer_rate();
 * auto eta = stats.get_eta();  // std::nullopt while the rate is unknown
 * @endcode
 */
class statistics_collector {
public:
    struct config {
        std::size_t rate_window_size = 10;      ///< Number of samples in the sliding window
        duration rate_sample_interval{500};     ///< Minimum interval between rate samples
        clock_source clock;                     ///< Defaults to steady_clock::now
    };

    struct snapshot {
        uint64_t bytes_transferred = 0;
        uint64_t bytes_abandoned = 0;           ///< Declared bytes that will never be processed
        uint64_t total_bytes = 0;
        double current_rate = 0.0;              ///< Bytes per second over the sample window
        double average_rate = 0.0;              ///< Bytes per second since start
        duration elapsed{0};
        std::optional<std::chrono::seconds> eta;
    };

    statistics_collector();
    explicit statistics_collector(config cfg);

    statistics_collector(const statistics_collector&) = delete;
    auto operator=(const statistics_collector&) -> statistics_collector& = delete;
    statistics_collector(statistics_collector&&) noexcept;
    auto operator=(statistics_collector&&) noexcept -> statistics_collector&;

    ~statistics_collector();

    /**
     * @brief Start collection
     * @param total_bytes Total bytes the run is expected to process
     */
    void start(uint64_t total_bytes);

    void stop();

    void reset();

    [[nodiscard]] auto is_active() const noexcept -> bool;

    /**
     * @brief Record processed bytes and take a rate sample if one is due
     */
    void record_bytes(uint64_t bytes);

    /**
     * @brief Record declared bytes that will not be processed
     *
     * Used for failed and cancelled jobs so the ETA only covers remaining work.
     */
    void record_abandoned(uint64_t bytes);

    /**
     * @brief Take a rate sample if the sample interval has elapsed
     *
     * Called without new bytes, this lets the rate decay while work stalls.
     */
    void update();

    /**
     * @brief Stop sampling while the run is parked
     *
     * The rate drops to 0 and the ETA becomes unknown until resume().
     */
    void suspend();

    /**
     * @brief Restart sampling after suspend()
     *
     * The window restarts at the current time, so time spent suspended does
     * not count against the rate.
     */
    void resume();

    [[nodiscard]] auto is_suspended() const -> bool;

    /**
     * @brief Current throughput in bytes per second
     * @return Rate computed at the last sample, 0.0 before two samples exist
     */
    [[nodiscard]] auto get_transfer_rate() const -> double;

    [[nodiscard]] auto get_average_rate() const -> double;

    /**
     * @brief Estimated time until all remaining bytes are processed
     * @return Remaining time, or std::nullopt when throughput is zero
     */
    [[nodiscard]] auto get_eta() const -> std::optional<std::chrono::seconds>;

    [[nodiscard]] auto get_elapsed() const -> duration;

    [[nodiscard]] auto get_completion_percentage() const -> double;

    [[nodiscard]] auto get_bytes_transferred() const -> uint64_t;

    [[nodiscard]] auto get_remaining_bytes() const -> uint64_t;

    [[nodiscard]] auto get_snapshot() const -> snapshot;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace secure_drive

#endif  // SECURE_DRIVE_CORE_STATISTICS_COLLECTOR_H
