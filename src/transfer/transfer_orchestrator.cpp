/**
 * @file transfer_orchestrator.cpp
 * @brief Batch runner implementation
 */

#include "secure_drive/transfer/transfer_orchestrator.h"

#include "secure_drive/core/logging.h"
#include "secure_drive/encryption/stream_codec.h"
#include "secure_drive/transfer/transfer_job.h"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <system_error>
#include <thread>
#include <unordered_map>

namespace secure_drive {

namespace {

auto batch_missing(batch_id id) -> unexpected {
    return unexpected(error(error_code::batch_not_found,
                            "Batch not found: " + std::to_string(id.value)));
}

/**
 * @brief Declared work of a job: plaintext bytes plus container bytes
 */
struct job_budget {
    uint64_t encrypt = 0;
    uint64_t upload = 0;
};

auto budget_for(uint64_t plaintext_size) -> job_budget {
    return {plaintext_size, stream_codec::container_size(plaintext_size)};
}

}  // namespace

// ============================================================================
// batch_handle
// ============================================================================

batch_handle::batch_handle() : id_(), owner_(nullptr) {}

batch_handle::batch_handle(batch_id id, transfer_orchestrator* owner)
    : id_(id), owner_(owner) {}

auto batch_handle::id() const noexcept -> batch_id {
    return id_;
}

auto batch_handle::is_valid() const noexcept -> bool {
    return owner_ != nullptr && id_.value != 0;
}

auto batch_handle::start() -> result<void> {
    if (!is_valid()) return batch_missing(id_);
    return owner_->start(id_);
}

auto batch_handle::pause() -> result<void> {
    if (!is_valid()) return batch_missing(id_);
    return owner_->pause(id_);
}

auto batch_handle::resume() -> result<void> {
    if (!is_valid()) return batch_missing(id_);
    return owner_->resume(id_);
}

auto batch_handle::cancel() -> result<void> {
    if (!is_valid()) return batch_missing(id_);
    return owner_->cancel(id_);
}

auto batch_handle::wait() -> result<batch_report> {
    if (!is_valid()) return batch_missing(id_);
    return owner_->wait(id_);
}

auto batch_handle::wait_for(std::chrono::milliseconds timeout) -> result<batch_report> {
    if (!is_valid()) return batch_missing(id_);
    return owner_->wait_for(id_, timeout);
}

auto batch_handle::progress() const -> result<progress_snapshot> {
    if (!is_valid()) return batch_missing(id_);
    return owner_->progress(id_);
}

auto batch_handle::jobs() const -> result<std::vector<transfer_job_snapshot>> {
    if (!is_valid()) return batch_missing(id_);
    return owner_->jobs(id_);
}

auto batch_handle::status() const -> result<batch_status> {
    if (!is_valid()) return batch_missing(id_);
    return owner_->status(id_);
}

// ============================================================================
// Internal state
// ============================================================================

struct transfer_orchestrator::config {
    std::shared_ptr<key_store> keys;
    std::shared_ptr<upload_client_interface> uploader;
    std::shared_ptr<progress_reporter> reporter;
    std::unique_ptr<stream_codec> codec;
    std::optional<std::filesystem::path> staging;
    std::chrono::milliseconds throughput_interval{500};
    std::size_t throughput_window = 10;
    bool remove_after_upload = false;
    clock_source clock;
};

/**
 * @brief Run state of one batch; guarded by impl::mutex
 */
struct batch_context {
    batch_id id;
    std::vector<transfer_job> jobs;
    std::vector<job_budget> budgets;
    batch_status status = batch_status::pending;
    bool pause_requested = false;
    bool cancel_requested = false;
    std::optional<key_lease> lease;
    statistics_collector stats;
    uint64_t bytes_total = 0;
    uint64_t sequence = 0;
    std::optional<std::size_t> current;
    progress_snapshot latest;
    std::optional<batch_report> report;

    explicit batch_context(batch_id bid, statistics_collector::config stats_cfg)
        : id(bid), stats(std::move(stats_cfg)) {}
};

struct transfer_orchestrator::impl {
    config cfg;

    mutable std::mutex mutex;
    std::condition_variable work_cv;   ///< Worker wake-up, pause and resume
    std::condition_variable done_cv;   ///< Batch completion

    // Snapshots waiting for the reporter. The thread that sets publishing
    // drains the outbox, so delivery is serialized and in emit order.
    std::deque<progress_snapshot> outbox;
    bool publishing = false;

    std::unordered_map<batch_id, std::unique_ptr<batch_context>> batches;
    std::deque<batch_id> run_queue;
    uint64_t next_batch_id = 1;
    uint64_t next_job_id = 1;
    bool stopping = false;
    std::thread worker;

    explicit impl(config c) : cfg(std::move(c)) {}

    [[nodiscard]] auto find(batch_id id) const -> batch_context* {
        auto it = batches.find(id);
        return it == batches.end() ? nullptr : it->second.get();
    }

    [[nodiscard]] auto stats_config() const -> statistics_collector::config {
        statistics_collector::config sc;
        sc.rate_window_size = cfg.throughput_window;
        sc.rate_sample_interval = cfg.throughput_interval;
        sc.clock = cfg.clock;
        return sc;
    }

    [[nodiscard]] auto container_for(const transfer_job& job) const -> std::filesystem::path {
        if (!cfg.staging) {
            return stream_codec::container_path_for(job.source());
        }
        auto name = std::to_string(job.id().value) + "_" +
                    job.source().filename().string() + std::string(CONTAINER_EXTENSION);
        return *cfg.staging / name;
    }

    // ========================================================================
    // Batch creation (mutex held)
    // ========================================================================

    auto create_batch(std::vector<transfer_job> jobs) -> batch_context& {
        batch_id id(next_batch_id++);
        auto ctx = std::make_unique<batch_context>(id, stats_config());
        for (const auto& job : jobs) {
            auto budget = budget_for(job.total_bytes());
            ctx->budgets.push_back(budget);
            ctx->bytes_total += budget.encrypt + budget.upload;
        }
        ctx->jobs = std::move(jobs);
        auto& ref = *ctx;
        batches.emplace(id, std::move(ctx));
        return ref;
    }

    // ========================================================================
    // Snapshots (mutex held)
    // ========================================================================

    auto make_snapshot(batch_context& ctx) -> progress_snapshot {
        progress_snapshot snap;
        snap.batch = ctx.id;
        snap.sequence = ++ctx.sequence;
        snap.status = ctx.status;
        snap.files_total = ctx.jobs.size();
        for (const auto& job : ctx.jobs) {
            switch (job.state()) {
                case job_state::completed: ++snap.files_completed; break;
                case job_state::failed: ++snap.files_failed; break;
                case job_state::cancelled: ++snap.files_cancelled; break;
                default: break;
            }
        }
        snap.bytes_total = ctx.bytes_total;
        ctx.stats.update();
        snap.bytes_transferred = ctx.stats.get_bytes_transferred();
        snap.throughput_bytes_per_sec = ctx.stats.get_transfer_rate();
        snap.elapsed = ctx.stats.get_elapsed();
        if (ctx.status == batch_status::pending || ctx.status == batch_status::queued ||
            ctx.status == batch_status::paused) {
            snap.eta = std::nullopt;
        } else {
            snap.eta = ctx.stats.get_eta();
        }
        if (ctx.current) {
            const auto& job = ctx.jobs[*ctx.current];
            snap.current_file_name = job.source().filename().string();
            snap.current_file_status = job.state();
        }
        ctx.latest = snap;
        return snap;
    }

    /**
     * @brief Publish a new snapshot of the batch
     *
     * Called and returns with @p lock held; the lock is released while the
     * reporter runs. When another thread is already publishing, the snapshot
     * is queued and delivered by that thread.
     */
    void emit(batch_context& ctx, std::unique_lock<std::mutex>& lock) {
        auto snap = make_snapshot(ctx);
        if (!cfg.reporter) {
            return;
        }
        outbox.push_back(std::move(snap));
        if (publishing) {
            return;
        }

        publishing = true;
        while (!outbox.empty()) {
            auto next = std::move(outbox.front());
            outbox.pop_front();
            lock.unlock();
            try {
                cfg.reporter->publish(std::move(next));
            } catch (const std::exception& e) {
                SD_LOG_WARN(log_category::progress,
                            std::string("Progress reporter threw: ") + e.what());
            }
            lock.lock();
        }
        publishing = false;
    }

    // ========================================================================
    // Pause / cancel (mutex held)
    // ========================================================================

    /**
     * @brief Park while the batch is paused
     * @return false when the batch has been cancelled
     */
    auto wait_if_paused(batch_context& ctx, std::unique_lock<std::mutex>& lock) -> bool {
        if (ctx.pause_requested && !ctx.cancel_requested) {
            ctx.status = batch_status::paused;
            ctx.stats.suspend();
            SD_LOG_INFO(log_category::orchestrator,
                        "Batch " + std::to_string(ctx.id.value) + " paused");
            emit(ctx, lock);
            work_cv.wait(lock, [&ctx] { return !ctx.pause_requested || ctx.cancel_requested; });
            ctx.stats.resume();
            if (!ctx.cancel_requested) {
                ctx.status = batch_status::running;
                SD_LOG_INFO(log_category::orchestrator,
                            "Batch " + std::to_string(ctx.id.value) + " resumed");
                emit(ctx, lock);
            }
        }
        return !ctx.cancel_requested;
    }

    // ========================================================================
    // Byte accounting (mutex held)
    // ========================================================================

    /**
     * @brief Credit stage progress, capped at the stage's declared bytes
     */
    static void credit(batch_context& ctx, uint64_t& counted, uint64_t processed,
                       uint64_t declared) {
        auto capped = std::min(processed, declared);
        if (capped > counted) {
            ctx.stats.record_bytes(capped - counted);
            counted = capped;
        }
    }

    // ========================================================================
    // Job execution (worker thread, mutex held on entry and exit)
    // ========================================================================

    void log_job(log_level level, const transfer_job& job, batch_id bid,
                 const std::string& message) {
        transfer_log_context ctx;
        ctx.batch_id = bid.value;
        ctx.job_id = job.id().value;
        ctx.filename = job.source().string();
        ctx.file_size = job.total_bytes();
        ctx.state = to_string(job.state());
        if (job.remote_id()) {
            ctx.remote_id = *job.remote_id();
        }
        if (job.last_error()) {
            ctx.error_message = job.last_error()->message;
        }
        SD_LOG_CTX(level, log_category::job, message, ctx);
    }

    void cancel_job(batch_context& ctx, transfer_job& job, uint64_t unprocessed) {
        if (is_terminal(job.state())) {
            return;
        }
        (void)job.transition_to(job_state::cancelled);
        if (job.container()) {
            std::error_code ec;
            std::filesystem::remove(*job.container(), ec);
            job.clear_container();
        }
        ctx.stats.record_abandoned(unprocessed);
        log_job(log_level::info, job, ctx.id, "Job cancelled");
    }

    void fail_job(batch_context& ctx, transfer_job& job, error err, uint64_t unprocessed) {
        (void)job.fail(std::move(err));
        ctx.stats.record_abandoned(unprocessed);
        log_job(log_level::warn, job, ctx.id, "Job failed");
    }

    auto encrypt_stage(batch_context& ctx, std::size_t index,
                       std::unique_lock<std::mutex>& lock) -> bool {
        auto& job = ctx.jobs[index];
        const auto budget = ctx.budgets[index];

        (void)job.transition_to(job_state::encrypting);
        emit(ctx, lock);

        if (job.reuses_container()) {
            uint64_t counted = 0;
            credit(ctx, counted, budget.encrypt, budget.encrypt);
            (void)job.transition_to(job_state::encrypted);
            log_job(log_level::debug, job, ctx.id, "Reusing existing container");
            emit(ctx, lock);
            return true;
        }

        auto container = container_for(job);
        job.set_container(container);

        uint64_t counted = 0;
        auto on_chunk = [this, &ctx, &job, &counted, budget](uint64_t processed) -> bool {
            std::unique_lock chunk_lock(mutex);
            credit(ctx, counted, processed, budget.encrypt);
            job.set_bytes_processed(processed);
            emit(ctx, chunk_lock);
            return wait_if_paused(ctx, chunk_lock);
        };

        lock.unlock();
        auto consumed = cfg.codec->encrypt_file(job.source(), container, ctx.lease->key(),
                                                on_chunk);
        lock.lock();

        if (!consumed) {
            job.clear_container();
            uint64_t unprocessed = budget.encrypt - counted + budget.upload;
            if (consumed.error().code == error_code::cancelled || ctx.cancel_requested) {
                cancel_job(ctx, job, unprocessed);
            } else {
                fail_job(ctx, job, consumed.error(), unprocessed);
            }
            emit(ctx, lock);
            return false;
        }

        credit(ctx, counted, budget.encrypt, budget.encrypt);
        job.set_encrypted(consumed.value());
        (void)job.transition_to(job_state::encrypted);
        log_job(log_level::debug, job, ctx.id, "Encrypted " + format_bytes(consumed.value()));
        emit(ctx, lock);
        return true;
    }

    void upload_stage(batch_context& ctx, std::size_t index,
                      std::unique_lock<std::mutex>& lock) {
        auto& job = ctx.jobs[index];
        const auto budget = ctx.budgets[index];

        if (!wait_if_paused(ctx, lock)) {
            cancel_job(ctx, job, budget.upload);
            emit(ctx, lock);
            return;
        }

        (void)job.transition_to(job_state::uploading);
        emit(ctx, lock);

        auto container = *job.container();
        uint64_t counted = 0;
        auto on_progress = [this, &ctx, &job, &counted, budget](const upload_progress& p) {
            std::unique_lock progress_lock(mutex);
            credit(ctx, counted, p.bytes_transferred, budget.upload);
            job.set_bytes_processed(p.bytes_transferred);
            job.set_uploaded(p.bytes_transferred);
            emit(ctx, progress_lock);
        };

        lock.unlock();
        result<std::string> uploaded = unexpected(error(error_code::internal_error));
        try {
            uploaded = cfg.uploader->upload(container, job.display_name(), on_progress);
        } catch (const std::exception& e) {
            uploaded = unexpected(error(error_code::internal_error,
                                        std::string("Upload client threw: ") + e.what()));
        }
        lock.lock();

        if (!uploaded) {
            fail_job(ctx, job, uploaded.error(), budget.upload - counted);
            emit(ctx, lock);
            return;
        }

        credit(ctx, counted, budget.upload, budget.upload);
        (void)job.complete(uploaded.value());
        if (cfg.remove_after_upload) {
            std::error_code ec;
            std::filesystem::remove(container, ec);
            job.clear_container();
        }
        log_job(log_level::info, job, ctx.id, "Job completed");
        emit(ctx, lock);
    }

    void run_job(batch_context& ctx, std::size_t index, std::unique_lock<std::mutex>& lock) {
        ctx.current = index;
        if (encrypt_stage(ctx, index, lock)) {
            upload_stage(ctx, index, lock);
        }
    }

    // ========================================================================
    // Batch execution
    // ========================================================================

    void finalize(batch_context& ctx, std::unique_lock<std::mutex>& lock) {
        for (std::size_t i = 0; i < ctx.jobs.size(); ++i) {
            auto& job = ctx.jobs[i];
            if (!is_terminal(job.state())) {
                cancel_job(ctx, job, ctx.budgets[i].encrypt + ctx.budgets[i].upload);
            }
        }

        ctx.status = ctx.cancel_requested ? batch_status::cancelled : batch_status::completed;
        ctx.stats.stop();
        ctx.lease.reset();

        batch_report report;
        report.batch = ctx.id;
        report.status = ctx.status;
        report.bytes_transferred = ctx.stats.get_bytes_transferred();
        report.elapsed = ctx.stats.get_elapsed();
        report.jobs.reserve(ctx.jobs.size());
        for (const auto& job : ctx.jobs) {
            report.jobs.push_back(job.to_result());
        }

        SD_LOG_INFO(log_category::orchestrator,
                    "Batch " + std::to_string(ctx.id.value) + " " + to_string(ctx.status) +
                    ": " + std::to_string(report.completed_count()) + " completed, " +
                    std::to_string(report.failed_count()) + " failed, " +
                    std::to_string(report.cancelled_count()) + " cancelled");

        // Waiters observe the report only after the final snapshot went out
        emit(ctx, lock);
        ctx.report = std::move(report);
        done_cv.notify_all();
    }

    void run_batch(batch_context& ctx, std::unique_lock<std::mutex>& lock) {
        ctx.status = batch_status::running;
        ctx.stats.start(ctx.bytes_total);
        SD_LOG_INFO(log_category::orchestrator,
                    "Batch " + std::to_string(ctx.id.value) + " running: " +
                    std::to_string(ctx.jobs.size()) + " files, " +
                    format_bytes(ctx.bytes_total) + " of work");
        emit(ctx, lock);

        for (std::size_t i = 0; i < ctx.jobs.size(); ++i) {
            if (!wait_if_paused(ctx, lock)) {
                break;
            }
            run_job(ctx, i, lock);
        }

        finalize(ctx, lock);
    }

    void worker_loop() {
        std::unique_lock lock(mutex);
        while (true) {
            work_cv.wait(lock, [this] { return stopping || !run_queue.empty(); });
            if (run_queue.empty()) {
                break;
            }

            auto id = run_queue.front();
            run_queue.pop_front();
            auto* ctx = find(id);
            if (ctx == nullptr || ctx->report) {
                continue;
            }
            run_batch(*ctx, lock);
        }
    }

    void shutdown() {
        {
            std::unique_lock lock(mutex);
            stopping = true;
            std::vector<batch_context*> never_started;
            for (auto& [id, ctx] : batches) {
                if (ctx->report) {
                    continue;
                }
                ctx->cancel_requested = true;
                if (ctx->status == batch_status::pending) {
                    never_started.push_back(ctx.get());
                }
            }
            // finalize() releases the lock while publishing
            for (auto* ctx : never_started) {
                finalize(*ctx, lock);
            }
        }
        work_cv.notify_all();
        if (worker.joinable()) {
            worker.join();
        }
    }
};

// ============================================================================
// builder
// ============================================================================

transfer_orchestrator::builder::builder() = default;

auto transfer_orchestrator::builder::with_key_store(std::shared_ptr<key_store> store)
    -> builder& {
    keys_ = std::move(store);
    return *this;
}

auto transfer_orchestrator::builder::with_upload_client(
    std::shared_ptr<upload_client_interface> client) -> builder& {
    uploader_ = std::move(client);
    return *this;
}

auto transfer_orchestrator::builder::with_progress_reporter(
    std::shared_ptr<progress_reporter> reporter) -> builder& {
    reporter_ = std::move(reporter);
    return *this;
}

auto transfer_orchestrator::builder::with_codec_config(const codec_config& config)
    -> builder& {
    codec_ = config;
    return *this;
}

auto transfer_orchestrator::builder::with_random_source(std::shared_ptr<random_source> random)
    -> builder& {
    random_ = std::move(random);
    return *this;
}

auto transfer_orchestrator::builder::with_staging_directory(
    const std::filesystem::path& directory) -> builder& {
    staging_ = directory;
    return *this;
}

auto transfer_orchestrator::builder::with_throughput_interval(
    std::chrono::milliseconds interval) -> builder& {
    throughput_interval_ = interval;
    return *this;
}

auto transfer_orchestrator::builder::with_throughput_window(std::size_t samples) -> builder& {
    throughput_window_ = samples;
    return *this;
}

auto transfer_orchestrator::builder::with_remove_container_after_upload(bool remove)
    -> builder& {
    remove_after_upload_ = remove;
    return *this;
}

auto transfer_orchestrator::builder::with_clock(clock_source clock) -> builder& {
    clock_ = std::move(clock);
    return *this;
}

auto transfer_orchestrator::builder::build() -> result<transfer_orchestrator> {
    if (!keys_) {
        return unexpected(error(error_code::invalid_configuration, "A key store is required"));
    }
    if (!uploader_) {
        return unexpected(error(error_code::invalid_configuration,
                                "An upload client is required"));
    }
    if (!codec_.is_valid()) {
        return unexpected(error(error_code::invalid_configuration,
                                "Chunk size must be between 1 byte and 64 MiB"));
    }
    if (throughput_interval_.count() <= 0) {
        return unexpected(error(error_code::invalid_configuration,
                                "Throughput interval must be positive"));
    }
    if (throughput_window_ < 2) {
        return unexpected(error(error_code::invalid_configuration,
                                "Throughput window needs at least two samples"));
    }
    if (staging_) {
        std::error_code ec;
        std::filesystem::create_directories(*staging_, ec);
        if (ec || !std::filesystem::is_directory(*staging_, ec)) {
            return unexpected(error(error_code::invalid_configuration,
                                    "Staging directory is not usable: " + staging_->string()));
        }
    }

    config cfg;
    cfg.keys = keys_;
    cfg.uploader = uploader_;
    cfg.reporter = reporter_;
    cfg.codec = stream_codec::create(codec_, random_);
    if (!cfg.codec) {
        return unexpected(error(error_code::invalid_configuration, "Failed to create codec"));
    }
    cfg.staging = staging_;
    cfg.throughput_interval = throughput_interval_;
    cfg.throughput_window = throughput_window_;
    cfg.remove_after_upload = remove_after_upload_;
    cfg.clock = clock_;

    return transfer_orchestrator{std::move(cfg)};
}

// ============================================================================
// transfer_orchestrator
// ============================================================================

transfer_orchestrator::transfer_orchestrator(config cfg)
    : impl_(std::make_unique<impl>(std::move(cfg))) {
    get_logger().initialize();
    auto* state = impl_.get();
    impl_->worker = std::thread([state] { state->worker_loop(); });
}

transfer_orchestrator::transfer_orchestrator(transfer_orchestrator&&) noexcept = default;

auto transfer_orchestrator::operator=(transfer_orchestrator&& other) noexcept
    -> transfer_orchestrator& {
    if (this != &other) {
        if (impl_) {
            impl_->shutdown();
        }
        impl_ = std::move(other.impl_);
    }
    return *this;
}

transfer_orchestrator::~transfer_orchestrator() {
    if (impl_) {
        impl_->shutdown();
    }
}

auto transfer_orchestrator::submit(std::span<const upload_entry> files)
    -> result<batch_handle> {
    if (files.empty()) {
        return unexpected(error(error_code::invalid_configuration, "No files specified"));
    }

    std::vector<transfer_job> jobs;
    jobs.reserve(files.size());

    std::unique_lock lock(impl_->mutex);
    for (const auto& entry : files) {
        std::error_code ec;
        auto size = std::filesystem::file_size(entry.source, ec);
        if (ec) {
            size = 0;
        }
        jobs.emplace_back(job_id(impl_->next_job_id++), entry.source, entry.display_name, size);
    }

    auto& ctx = impl_->create_batch(std::move(jobs));
    auto id = ctx.id;
    SD_LOG_INFO(log_category::orchestrator,
                "Batch " + std::to_string(id.value) + " submitted with " +
                std::to_string(files.size()) + " files");
    impl_->emit(ctx, lock);
    return batch_handle(id, this);
}

auto transfer_orchestrator::submit(const std::vector<std::filesystem::path>& files)
    -> result<batch_handle> {
    std::vector<upload_entry> entries;
    entries.reserve(files.size());
    for (const auto& path : files) {
        entries.push_back(upload_entry{path, {}});
    }
    return submit(std::span<const upload_entry>(entries));
}

auto transfer_orchestrator::resubmit_failed(batch_id id) -> result<batch_handle> {
    std::unique_lock lock(impl_->mutex);
    auto* source = impl_->find(id);
    if (source == nullptr) {
        return batch_missing(id);
    }
    if (!source->report) {
        return unexpected(error(error_code::batch_not_finished,
                                "Batch " + std::to_string(id.value) + " has not finished"));
    }

    std::vector<transfer_job> jobs;
    for (const auto& job : source->jobs) {
        if (job.state() != job_state::failed) {
            continue;
        }
        auto retry = transfer_job::resubmit(job, job_id(impl_->next_job_id++));
        if (!retry) {
            return unexpected(retry.error());
        }
        jobs.push_back(std::move(retry.value()));
    }
    if (jobs.empty()) {
        return unexpected(error(error_code::invalid_state_transition,
                                "Batch " + std::to_string(id.value) + " has no failed jobs"));
    }

    auto count = jobs.size();
    auto& ctx = impl_->create_batch(std::move(jobs));
    auto new_id = ctx.id;
    SD_LOG_INFO(log_category::orchestrator,
                "Batch " + std::to_string(new_id.value) + " resubmits " +
                std::to_string(count) + " failed jobs of batch " + std::to_string(id.value));
    impl_->emit(ctx, lock);
    return batch_handle(new_id, this);
}

auto transfer_orchestrator::start(batch_id id) -> result<void> {
    std::unique_lock lock(impl_->mutex);
    auto* ctx = impl_->find(id);
    if (ctx == nullptr) {
        return batch_missing(id);
    }
    if (ctx->status != batch_status::pending) {
        return unexpected(error(error_code::batch_already_started,
                                "Batch " + std::to_string(id.value) + " is already " +
                                to_string(ctx->status)));
    }
    if (impl_->stopping) {
        return unexpected(error(error_code::invalid_state_transition,
                                "Orchestrator is shutting down"));
    }

    auto lease = impl_->cfg.keys->lease();
    if (!lease) {
        SD_LOG_ERROR(log_category::orchestrator,
                     "Batch " + std::to_string(id.value) + " not started: " +
                     lease.error().message);
        return unexpected(lease.error());
    }

    ctx->lease.emplace(std::move(lease.value()));
    ctx->status = batch_status::queued;
    impl_->run_queue.push_back(id);

    transfer_log_context log_ctx;
    log_ctx.batch_id = id.value;
    log_ctx.key_fingerprint = ctx->lease->fingerprint();
    SD_LOG_INFO_CTX(log_category::orchestrator, "Batch queued", log_ctx);

    impl_->emit(*ctx, lock);
    lock.unlock();
    impl_->work_cv.notify_all();
    return {};
}

auto transfer_orchestrator::pause(batch_id id) -> result<void> {
    std::lock_guard lock(impl_->mutex);
    auto* ctx = impl_->find(id);
    if (ctx == nullptr) {
        return batch_missing(id);
    }
    if (ctx->report) {
        return unexpected(error(error_code::invalid_state_transition,
                                "Batch " + std::to_string(id.value) + " has already finished"));
    }
    ctx->pause_requested = true;
    return {};
}

auto transfer_orchestrator::resume(batch_id id) -> result<void> {
    {
        std::lock_guard lock(impl_->mutex);
        auto* ctx = impl_->find(id);
        if (ctx == nullptr) {
            return batch_missing(id);
        }
        if (ctx->report) {
            return unexpected(error(error_code::invalid_state_transition,
                                    "Batch " + std::to_string(id.value) + " has already finished"));
        }
        ctx->pause_requested = false;
    }
    impl_->work_cv.notify_all();
    return {};
}

auto transfer_orchestrator::cancel(batch_id id) -> result<void> {
    {
        std::unique_lock lock(impl_->mutex);
        auto* ctx = impl_->find(id);
        if (ctx == nullptr) {
            return batch_missing(id);
        }
        if (ctx->report) {
            return {};
        }
        ctx->cancel_requested = true;
        SD_LOG_INFO(log_category::orchestrator,
                    "Cancellation requested for batch " + std::to_string(id.value));
        if (ctx->status == batch_status::pending) {
            impl_->finalize(*ctx, lock);
        }
    }
    impl_->work_cv.notify_all();
    return {};
}

auto transfer_orchestrator::wait(batch_id id) -> result<batch_report> {
    std::unique_lock lock(impl_->mutex);
    auto* ctx = impl_->find(id);
    if (ctx == nullptr) {
        return batch_missing(id);
    }
    if (ctx->status == batch_status::pending && !ctx->report) {
        return unexpected(error(error_code::batch_not_finished,
                                "Batch " + std::to_string(id.value) + " was never started"));
    }
    impl_->done_cv.wait(lock, [ctx] { return ctx->report.has_value(); });
    return *ctx->report;
}

auto transfer_orchestrator::wait_for(batch_id id, std::chrono::milliseconds timeout)
    -> result<batch_report> {
    std::unique_lock lock(impl_->mutex);
    auto* ctx = impl_->find(id);
    if (ctx == nullptr) {
        return batch_missing(id);
    }
    if (ctx->status == batch_status::pending && !ctx->report) {
        return unexpected(error(error_code::batch_not_finished,
                                "Batch " + std::to_string(id.value) + " was never started"));
    }
    if (!impl_->done_cv.wait_for(lock, timeout, [ctx] { return ctx->report.has_value(); })) {
        return unexpected(error(error_code::timeout,
                                "Batch " + std::to_string(id.value) + " still " +
                                to_string(ctx->status)));
    }
    return *ctx->report;
}

auto transfer_orchestrator::progress(batch_id id) const -> result<progress_snapshot> {
    std::lock_guard lock(impl_->mutex);
    auto* ctx = impl_->find(id);
    if (ctx == nullptr) {
        return batch_missing(id);
    }
    return ctx->latest;
}

auto transfer_orchestrator::jobs(batch_id id) const
    -> result<std::vector<transfer_job_snapshot>> {
    std::lock_guard lock(impl_->mutex);
    auto* ctx = impl_->find(id);
    if (ctx == nullptr) {
        return batch_missing(id);
    }
    std::vector<transfer_job_snapshot> out;
    out.reserve(ctx->jobs.size());
    for (const auto& job : ctx->jobs) {
        out.push_back(job.snapshot());
    }
    return out;
}

auto transfer_orchestrator::status(batch_id id) const -> result<batch_status> {
    std::lock_guard lock(impl_->mutex);
    auto* ctx = impl_->find(id);
    if (ctx == nullptr) {
        return batch_missing(id);
    }
    return ctx->status;
}

auto transfer_orchestrator::batches() const -> std::vector<batch_id> {
    std::lock_guard lock(impl_->mutex);
    std::vector<batch_id> ids;
    ids.reserve(impl_->batches.size());
    for (const auto& [id, ctx] : impl_->batches) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

}  // namespace secure_drive
