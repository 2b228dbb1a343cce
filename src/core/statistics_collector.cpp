/**
 * @file statistics_collector.cpp
 * @brief Implementation of throughput and ETA bookkeeping
 */

#include "secure_drive/core/statistics_collector.h"

#include <atomic>
#include <cmath>
#include <deque>
#include <mutex>

namespace secure_drive {

/**
 * @brief Rate sample for the sliding window
 */
struct rate_sample {
    time_point timestamp;
    uint64_t bytes;
};

struct statistics_collector::impl {
    config cfg;

    std::atomic<bool> active{false};
    bool started{false};
    time_point start_time;
    time_point stop_time;

    std::atomic<uint64_t> bytes_transferred{0};
    std::atomic<uint64_t> bytes_abandoned{0};
    std::atomic<uint64_t> total_bytes{0};

    mutable std::mutex rate_mutex;
    std::deque<rate_sample> rate_samples;
    time_point last_sample_time;
    double current_rate{0.0};
    bool suspended{false};

    impl() : cfg{} {}
    explicit impl(config c) : cfg(std::move(c)) {}

    [[nodiscard]] auto now() const -> time_point {
        return cfg.clock ? cfg.clock() : std::chrono::steady_clock::now();
    }

    void update_rate_samples() {
        auto current = now();

        std::lock_guard<std::mutex> lock(rate_mutex);
        if (suspended) {
            return;
        }
        auto elapsed_since_sample =
            std::chrono::duration_cast<duration>(current - last_sample_time);
        if (elapsed_since_sample < cfg.rate_sample_interval) {
            return;
        }

        rate_samples.push_back({current, bytes_transferred.load()});
        while (rate_samples.size() > cfg.rate_window_size) {
            rate_samples.pop_front();
        }
        last_sample_time = current;
        current_rate = window_rate();
    }

    [[nodiscard]] auto window_rate() const -> double {
        if (rate_samples.size() < 2) {
            return 0.0;
        }

        const auto& oldest = rate_samples.front();
        const auto& newest = rate_samples.back();

        auto time_diff = std::chrono::duration_cast<std::chrono::milliseconds>(
            newest.timestamp - oldest.timestamp);
        if (time_diff.count() <= 0) {
            return 0.0;
        }

        auto bytes_diff = newest.bytes - oldest.bytes;
        return static_cast<double>(bytes_diff) * 1000.0 /
               static_cast<double>(time_diff.count());
    }

    [[nodiscard]] auto elapsed() const -> duration {
        if (!started) {
            return duration{0};
        }
        auto end = active.load() ? now() : stop_time;
        return std::chrono::duration_cast<duration>(end - start_time);
    }

    [[nodiscard]] auto remaining() const -> uint64_t {
        uint64_t done = bytes_transferred.load() + bytes_abandoned.load();
        uint64_t total = total_bytes.load();
        return done >= total ? 0 : total - done;
    }
};

statistics_collector::statistics_collector()
    : impl_(std::make_unique<impl>()) {}

statistics_collector::statistics_collector(config cfg)
    : impl_(std::make_unique<impl>(std::move(cfg))) {}

statistics_collector::statistics_collector(statistics_collector&&) noexcept = default;
auto statistics_collector::operator=(statistics_collector&&) noexcept
    -> statistics_collector& = default;
statistics_collector::~statistics_collector() = default;

void statistics_collector::start(uint64_t total_bytes) {
    impl_->total_bytes.store(total_bytes);
    impl_->start_time = impl_->now();
    impl_->started = true;
    impl_->active.store(true);

    std::lock_guard<std::mutex> lock(impl_->rate_mutex);
    impl_->rate_samples.clear();
    impl_->rate_samples.push_back({impl_->start_time, impl_->bytes_transferred.load()});
    impl_->last_sample_time = impl_->start_time;
    impl_->current_rate = 0.0;
    impl_->suspended = false;
}

void statistics_collector::stop() {
    if (impl_->active.exchange(false)) {
        impl_->stop_time = impl_->now();
    }
}

void statistics_collector::reset() {
    impl_->active.store(false);
    impl_->bytes_transferred.store(0);
    impl_->bytes_abandoned.store(0);
    impl_->total_bytes.store(0);
    impl_->started = false;

    std::lock_guard<std::mutex> lock(impl_->rate_mutex);
    impl_->rate_samples.clear();
    impl_->current_rate = 0.0;
    impl_->suspended = false;
}

auto statistics_collector::is_active() const noexcept -> bool {
    return impl_->active.load();
}

void statistics_collector::record_bytes(uint64_t bytes) {
    impl_->bytes_transferred.fetch_add(bytes);
    impl_->update_rate_samples();
}

void statistics_collector::record_abandoned(uint64_t bytes) {
    impl_->bytes_abandoned.fetch_add(bytes);
}

void statistics_collector::update() {
    if (impl_->active.load()) {
        impl_->update_rate_samples();
    }
}

void statistics_collector::suspend() {
    std::lock_guard<std::mutex> lock(impl_->rate_mutex);
    impl_->suspended = true;
    impl_->rate_samples.clear();
    impl_->current_rate = 0.0;
}

void statistics_collector::resume() {
    auto current = impl_->now();

    std::lock_guard<std::mutex> lock(impl_->rate_mutex);
    if (!impl_->suspended) {
        return;
    }
    impl_->suspended = false;
    impl_->rate_samples.clear();
    impl_->rate_samples.push_back({current, impl_->bytes_transferred.load()});
    impl_->last_sample_time = current;
}

auto statistics_collector::is_suspended() const -> bool {
    std::lock_guard<std::mutex> lock(impl_->rate_mutex);
    return impl_->suspended;
}

auto statistics_collector::get_transfer_rate() const -> double {
    std::lock_guard<std::mutex> lock(impl_->rate_mutex);
    return impl_->current_rate;
}

auto statistics_collector::get_average_rate() const -> double {
    auto elapsed = impl_->elapsed();
    if (elapsed.count() <= 0) {
        return 0.0;
    }
    return static_cast<double>(impl_->bytes_transferred.load()) * 1000.0 /
           static_cast<double>(elapsed.count());
}

auto statistics_collector::get_eta() const -> std::optional<std::chrono::seconds> {
    uint64_t remaining = impl_->remaining();
    if (remaining == 0) {
        return std::chrono::seconds{0};
    }

    double rate = get_transfer_rate();
    if (rate <= 0.0) {
        return std::nullopt;
    }

    auto secs = std::ceil(static_cast<double>(remaining) / rate);
    return std::chrono::seconds{static_cast<int64_t>(secs)};
}

auto statistics_collector::get_elapsed() const -> duration {
    return impl_->elapsed();
}

auto statistics_collector::get_completion_percentage() const -> double {
    uint64_t total = impl_->total_bytes.load();
    if (total == 0) {
        return 0.0;
    }
    return static_cast<double>(impl_->bytes_transferred.load()) /
           static_cast<double>(total) * 100.0;
}

auto statistics_collector::get_bytes_transferred() const -> uint64_t {
    return impl_->bytes_transferred.load();
}

auto statistics_collector::get_remaining_bytes() const -> uint64_t {
    return impl_->remaining();
}

auto statistics_collector::get_snapshot() const -> snapshot {
    snapshot s;
    s.bytes_transferred = impl_->bytes_transferred.load();
    s.bytes_abandoned = impl_->bytes_abandoned.load();
    s.total_bytes = impl_->total_bytes.load();
    s.current_rate = get_transfer_rate();
    s.average_rate = get_average_rate();
    s.elapsed = get_elapsed();
    s.eta = get_eta();
    return s;
}

}  // namespace secure_drive
