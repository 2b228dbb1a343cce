/**
 * @file progress_reporter.cpp
 * @brief Progress reporter implementations
 */

#include "secure_drive/transfer/progress_reporter.h"

#include "secure_drive/core/logging.h"

#include <algorithm>
#include <condition_variable>
#include <cstdio>
#include <deque>
#include <iterator>
#include <mutex>

namespace secure_drive {

// ============================================================================
// queued_progress_reporter
// ============================================================================

struct queued_progress_reporter::impl {
    std::size_t capacity;
    mutable std::mutex mutex;
    std::condition_variable cv;
    std::deque<progress_snapshot> queue;
    bool closed = false;
    uint64_t dropped = 0;

    explicit impl(std::size_t cap) : capacity(cap) {}

    // Called with the mutex held and the queue at capacity
    void make_room() {
        auto it = std::find_if(queue.begin(), queue.end(), [](const progress_snapshot& s) {
            return !is_finished(s.status);
        });
        if (it != queue.end()) {
            queue.erase(it);
            ++dropped;
        }
    }
};

queued_progress_reporter::queued_progress_reporter(std::size_t capacity)
    : impl_(std::make_unique<impl>(capacity)) {}

queued_progress_reporter::~queued_progress_reporter() = default;

void queued_progress_reporter::publish(progress_snapshot snapshot) {
    {
        std::lock_guard lock(impl_->mutex);
        if (impl_->closed) {
            return;
        }
        if (impl_->capacity > 0 && impl_->queue.size() >= impl_->capacity) {
            impl_->make_room();
        }
        impl_->queue.push_back(std::move(snapshot));
    }
    impl_->cv.notify_one();
}

auto queued_progress_reporter::try_pop() -> std::optional<progress_snapshot> {
    std::lock_guard lock(impl_->mutex);
    if (impl_->queue.empty()) {
        return std::nullopt;
    }
    auto snapshot = std::move(impl_->queue.front());
    impl_->queue.pop_front();
    return snapshot;
}

auto queued_progress_reporter::wait_pop(std::chrono::milliseconds timeout)
    -> std::optional<progress_snapshot> {
    std::unique_lock lock(impl_->mutex);
    bool ready = impl_->cv.wait_for(lock, timeout, [this] {
        return !impl_->queue.empty() || impl_->closed;
    });
    if (!ready || impl_->queue.empty()) {
        return std::nullopt;
    }
    auto snapshot = std::move(impl_->queue.front());
    impl_->queue.pop_front();
    return snapshot;
}

auto queued_progress_reporter::drain() -> std::vector<progress_snapshot> {
    std::lock_guard lock(impl_->mutex);
    std::vector<progress_snapshot> out(std::make_move_iterator(impl_->queue.begin()),
                                       std::make_move_iterator(impl_->queue.end()));
    impl_->queue.clear();
    return out;
}

void queued_progress_reporter::close() {
    {
        std::lock_guard lock(impl_->mutex);
        impl_->closed = true;
    }
    impl_->cv.notify_all();
}

auto queued_progress_reporter::is_closed() const -> bool {
    std::lock_guard lock(impl_->mutex);
    return impl_->closed;
}

auto queued_progress_reporter::size() const -> std::size_t {
    std::lock_guard lock(impl_->mutex);
    return impl_->queue.size();
}

auto queued_progress_reporter::dropped_count() const -> uint64_t {
    std::lock_guard lock(impl_->mutex);
    return impl_->dropped;
}

// ============================================================================
// callback_progress_reporter
// ============================================================================

callback_progress_reporter::callback_progress_reporter(callback cb)
    : callback_(std::move(cb)) {}

void callback_progress_reporter::publish(progress_snapshot snapshot) {
    if (callback_) {
        callback_(snapshot);
    }
}

// ============================================================================
// logging_progress_reporter
// ============================================================================

struct logging_progress_reporter::impl {
    std::mutex mutex;
    std::optional<batch_id> last_batch;
    batch_status last_status = batch_status::pending;
    std::size_t last_finished = 0;
    std::string last_file;
    std::optional<job_state> last_file_status;
    uint64_t logged = 0;

    [[nodiscard]] auto is_job_level_change(const progress_snapshot& s) const -> bool {
        return !last_batch || !(*last_batch == s.batch) ||
               last_status != s.status ||
               last_finished != s.files_finished() ||
               last_file != s.current_file_name ||
               last_file_status != s.current_file_status;
    }

    void remember(const progress_snapshot& s) {
        last_batch = s.batch;
        last_status = s.status;
        last_finished = s.files_finished();
        last_file = s.current_file_name;
        last_file_status = s.current_file_status;
    }
};

logging_progress_reporter::logging_progress_reporter()
    : impl_(std::make_unique<impl>()) {
    get_logger().initialize();
}

logging_progress_reporter::~logging_progress_reporter() = default;

void logging_progress_reporter::publish(progress_snapshot snapshot) {
    {
        std::lock_guard lock(impl_->mutex);
        if (!impl_->is_job_level_change(snapshot)) {
            return;
        }
        impl_->remember(snapshot);
        ++impl_->logged;
    }

    transfer_log_context ctx;
    ctx.batch_id = snapshot.batch.value;
    ctx.filename = snapshot.current_file_name;
    ctx.file_size = snapshot.bytes_total;
    ctx.bytes_processed = snapshot.bytes_transferred;
    ctx.state = to_string(snapshot.status);
    ctx.progress_percent = snapshot.completion_percentage();
    ctx.throughput_bps = snapshot.throughput_bytes_per_sec;
    ctx.duration_ms = static_cast<uint64_t>(snapshot.elapsed.count());

    SD_LOG_INFO_CTX(log_category::progress, format_progress(snapshot), ctx);
}

auto logging_progress_reporter::logged_count() const -> uint64_t {
    std::lock_guard lock(impl_->mutex);
    return impl_->logged;
}

// ============================================================================
// Formatting
// ============================================================================

auto format_bytes(uint64_t bytes) -> std::string {
    constexpr double kb = 1024.0;
    constexpr double mb = kb * 1024.0;
    constexpr double gb = mb * 1024.0;

    if (bytes < 1024) {
        return std::to_string(bytes) + " B";
    }

    char buffer[32];
    auto value = static_cast<double>(bytes);
    if (bytes < 1024ULL * 1024) {
        std::snprintf(buffer, sizeof(buffer), "%.1f KB", value / kb);
    } else if (bytes < 1024ULL * 1024 * 1024) {
        std::snprintf(buffer, sizeof(buffer), "%.1f MB", value / mb);
    } else {
        std::snprintf(buffer, sizeof(buffer), "%.1f GB", value / gb);
    }
    return buffer;
}

auto format_eta(std::optional<std::chrono::seconds> eta) -> std::string {
    if (!eta || eta->count() < 0) {
        return "--:--";
    }
    auto total = eta->count();
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%02lld:%02lld",
                  static_cast<long long>(total / 60),
                  static_cast<long long>(total % 60));
    return buffer;
}

auto format_progress(const progress_snapshot& snapshot) -> std::string {
    std::string line = "Batch " + std::to_string(snapshot.batch.value) + " " +
                       to_string(snapshot.status) + ": " +
                       std::to_string(snapshot.files_finished()) + "/" +
                       std::to_string(snapshot.files_total) + " files, " +
                       format_bytes(snapshot.bytes_transferred) + " of " +
                       format_bytes(snapshot.bytes_total) + ", " +
                       format_bytes(static_cast<uint64_t>(snapshot.throughput_bytes_per_sec)) +
                       "/s, ETA " + format_eta(snapshot.eta);
    if (snapshot.files_failed > 0) {
        line += ", " + std::to_string(snapshot.files_failed) + " failed";
    }
    if (!snapshot.current_file_name.empty() && snapshot.current_file_status) {
        line += " [" + snapshot.current_file_name + ": " +
                to_string(*snapshot.current_file_status) + "]";
    }
    return line;
}

}  // namespace secure_drive
