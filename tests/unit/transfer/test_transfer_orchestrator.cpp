/**
 * @file test_transfer_orchestrator.cpp
 * @brief Unit tests for batch orchestration: ordering, isolation, control
 */

#include <gtest/gtest.h>

#include "integration/test_fixtures.h"

#include <secure_drive/transfer/transfer_orchestrator.h>

#include <atomic>
#include <optional>
#include <string>
#include <vector>

namespace secure_drive {
namespace {

namespace fs = std::filesystem;
using namespace std::chrono_literals;

class TransferOrchestratorTest : public test::PipelineFixture {
protected:
    auto submit_files(const std::vector<fs::path>& files) -> batch_handle {
        auto batch = orchestrator_->submit(files);
        EXPECT_TRUE(batch.has_value());
        return batch.has_value() ? batch.value() : batch_handle();
    }

    auto make_files(std::size_t count, std::size_t size) -> std::vector<fs::path> {
        std::vector<fs::path> files;
        for (std::size_t i = 0; i < count; ++i) {
            files.push_back(create_test_file("file" + std::to_string(i + 1) + ".bin", size));
        }
        return files;
    }

    auto run_to_end(batch_handle& handle) -> batch_report {
        EXPECT_TRUE(handle.start().has_value());
        auto report = handle.wait_for(30s);
        EXPECT_TRUE(report.has_value()) << report.error().message;
        return report.has_value() ? report.value() : batch_report{};
    }

    auto small_chunks(std::size_t chunk = 1024) -> transfer_orchestrator::builder {
        codec_config codec;
        codec.chunk_size = chunk;
        auto b = default_builder();
        b.with_codec_config(codec);
        return b;
    }
};

// ============================================================================
// Builder
// ============================================================================

TEST_F(TransferOrchestratorTest, BuildRequiresKeyStore) {
    transfer_orchestrator::builder b;
    b.with_upload_client(client_);
    auto built = b.build();
    ASSERT_FALSE(built.has_value());
    EXPECT_EQ(built.error().code, error_code::invalid_configuration);
}

TEST_F(TransferOrchestratorTest, BuildRequiresUploadClient) {
    transfer_orchestrator::builder b;
    b.with_key_store(keys_);
    auto built = b.build();
    ASSERT_FALSE(built.has_value());
    EXPECT_EQ(built.error().code, error_code::invalid_configuration);
}

TEST_F(TransferOrchestratorTest, BuildRejectsBadSettings) {
    codec_config zero;
    zero.chunk_size = 0;
    EXPECT_FALSE(default_builder().with_codec_config(zero).build().has_value());
    EXPECT_FALSE(default_builder().with_throughput_interval(0ms).build().has_value());
    EXPECT_FALSE(default_builder().with_throughput_window(1).build().has_value());

    auto not_a_dir = create_text_file("plain.txt", "x");
    auto built = default_builder().with_staging_directory(not_a_dir).build();
    ASSERT_FALSE(built.has_value());
    EXPECT_EQ(built.error().code, error_code::invalid_configuration);
}

TEST_F(TransferOrchestratorTest, BuildWithoutReporter) {
    transfer_orchestrator::builder b;
    b.with_key_store(keys_).with_upload_client(client_).with_staging_directory(staging_dir_);
    build(b);

    auto handle = submit_files(make_files(1, 100));
    auto report = run_to_end(handle);
    EXPECT_TRUE(report.all_succeeded());
}

// ============================================================================
// Submission
// ============================================================================

TEST_F(TransferOrchestratorTest, SubmitEmptyRejected) {
    build();
    auto batch = orchestrator_->submit(std::vector<fs::path>{});
    ASSERT_FALSE(batch.has_value());
    EXPECT_EQ(batch.error().code, error_code::invalid_configuration);
}

TEST_F(TransferOrchestratorTest, SubmitCreatesPendingBatch) {
    build();
    auto files = make_files(2, 100);
    auto handle = submit_files(files);

    ASSERT_TRUE(handle.is_valid());
    EXPECT_EQ(handle.status().value(), batch_status::pending);

    auto jobs = handle.jobs();
    ASSERT_TRUE(jobs.has_value());
    ASSERT_EQ(jobs.value().size(), 2u);
    EXPECT_EQ(jobs.value()[0].state, job_state::pending);
    EXPECT_EQ(jobs.value()[0].display_name, "file1.bin.encrypted");
    EXPECT_EQ(jobs.value()[1].total_bytes, 100u);

    auto progress = handle.progress();
    ASSERT_TRUE(progress.has_value());
    EXPECT_EQ(progress.value().status, batch_status::pending);
    EXPECT_EQ(progress.value().files_total, 2u);
    EXPECT_EQ(progress.value().bytes_total,
              2 * (100 + stream_codec::container_size(100)));
    EXPECT_FALSE(progress.value().eta.has_value());

    auto published = reporter_->snapshots_for(handle.id());
    ASSERT_EQ(published.size(), 1u);
    EXPECT_EQ(published[0].sequence, 1u);
}

TEST_F(TransferOrchestratorTest, SubmitWithDisplayNames) {
    build();
    std::vector<upload_entry> entries{
        {create_test_file("a.txt", 10), "first"},
        {create_test_file("b.txt", 20), ""},
    };
    auto batch = orchestrator_->submit(entries);
    ASSERT_TRUE(batch.has_value());
    auto handle = batch.value();

    auto report = run_to_end(handle);
    ASSERT_TRUE(report.all_succeeded());

    auto records = client_->records();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].display_name, "first");
    EXPECT_EQ(records[1].display_name, "b.txt.encrypted");
}

TEST_F(TransferOrchestratorTest, UnknownBatch) {
    build();
    batch_id missing(999);
    EXPECT_EQ(orchestrator_->start(missing).error().code, error_code::batch_not_found);
    EXPECT_EQ(orchestrator_->pause(missing).error().code, error_code::batch_not_found);
    EXPECT_EQ(orchestrator_->progress(missing).error().code, error_code::batch_not_found);
    EXPECT_EQ(orchestrator_->resubmit_failed(missing).error().code,
              error_code::batch_not_found);

    batch_handle invalid;
    EXPECT_FALSE(invalid.is_valid());
    EXPECT_EQ(invalid.start().error().code, error_code::batch_not_found);
}

// ============================================================================
// Running batches
// ============================================================================

TEST_F(TransferOrchestratorTest, UploadsEveryFileInOrder) {
    build();
    auto files = make_files(3, 5000);
    files.push_back(create_test_file("empty.bin", 0));
    auto handle = submit_files(files);

    auto report = run_to_end(handle);
    EXPECT_EQ(report.status, batch_status::completed);
    EXPECT_TRUE(report.all_succeeded());
    ASSERT_EQ(report.jobs.size(), 4u);

    auto records = client_->records();
    ASSERT_EQ(records.size(), 4u);
    for (std::size_t i = 0; i < files.size(); ++i) {
        EXPECT_EQ(records[i].display_name, files[i].filename().string() + ".encrypted");
        EXPECT_EQ(report.jobs[i].remote_id.value(), records[i].remote_id);

        auto plaintext = decrypt_container(records[i].content);
        ASSERT_TRUE(plaintext.has_value()) << plaintext.error().message;
        auto original = test::read_file(files[i]);
        EXPECT_EQ(plaintext.value(), std::string(original.begin(), original.end()));
    }
    EXPECT_EQ(records[3].content.size(), 32u);

    auto final_snapshot = handle.progress().value();
    EXPECT_EQ(final_snapshot.status, batch_status::completed);
    EXPECT_EQ(final_snapshot.files_completed, 4u);
    EXPECT_EQ(final_snapshot.bytes_transferred, final_snapshot.bytes_total);
    EXPECT_EQ(report.bytes_transferred, final_snapshot.bytes_total);
    ASSERT_TRUE(final_snapshot.eta.has_value());
    EXPECT_EQ(final_snapshot.eta->count(), 0);

    EXPECT_EQ(keys_->active_leases(), 0u);
}

TEST_F(TransferOrchestratorTest, ContainersKeptInStagingByDefault) {
    build();
    auto handle = submit_files(make_files(2, 100));
    auto report = run_to_end(handle);
    ASSERT_TRUE(report.all_succeeded());

    EXPECT_EQ(files_with_suffix(staging_dir_, ".encrypted").size(), 2u);
    EXPECT_TRUE(files_with_suffix(staging_dir_, ".part").empty());
    ASSERT_TRUE(report.jobs[0].container.has_value());
    EXPECT_TRUE(fs::exists(*report.jobs[0].container));
}

TEST_F(TransferOrchestratorTest, RemoveContainerAfterUpload) {
    build(default_builder().with_remove_container_after_upload(true));
    auto handle = submit_files(make_files(2, 100));
    auto report = run_to_end(handle);
    ASSERT_TRUE(report.all_succeeded());

    EXPECT_TRUE(files_with_suffix(staging_dir_, ".encrypted").empty());
    EXPECT_FALSE(report.jobs[0].container.has_value());
}

TEST_F(TransferOrchestratorTest, ContainerBesideSourceWithoutStaging) {
    transfer_orchestrator::builder b;
    b.with_key_store(keys_).with_upload_client(client_).with_progress_reporter(reporter_);
    build(b);

    auto source = create_test_file("photo.jpg", 300);
    auto handle = submit_files({source});
    auto report = run_to_end(handle);
    ASSERT_TRUE(report.all_succeeded());
    EXPECT_TRUE(fs::exists(source_dir_ / "photo.jpg.encrypted"));
}

TEST_F(TransferOrchestratorTest, BatchesRunInStartOrder) {
    build();
    auto first = submit_files({create_test_file("a1.bin", 100), create_test_file("a2.bin", 100)});
    auto second = submit_files({create_test_file("b1.bin", 100)});

    ASSERT_TRUE(first.start().has_value());
    ASSERT_TRUE(second.start().has_value());
    ASSERT_TRUE(second.wait_for(30s).has_value());
    ASSERT_TRUE(first.wait_for(30s).has_value());

    auto records = client_->records();
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[0].display_name, "a1.bin.encrypted");
    EXPECT_EQ(records[1].display_name, "a2.bin.encrypted");
    EXPECT_EQ(records[2].display_name, "b1.bin.encrypted");

    auto ids = orchestrator_->batches();
    ASSERT_EQ(ids.size(), 2u);
    EXPECT_TRUE(ids[0] < ids[1]);
}

TEST_F(TransferOrchestratorTest, StartTwiceRejected) {
    build();
    auto handle = submit_files(make_files(1, 10));
    ASSERT_TRUE(handle.start().has_value());

    auto again = handle.start();
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, error_code::batch_already_started);
    ASSERT_TRUE(handle.wait_for(30s).has_value());
}

TEST_F(TransferOrchestratorTest, StartWithoutKey) {
    build();
    ASSERT_TRUE(keys_->invalidate().has_value());

    auto handle = submit_files(make_files(1, 10));
    auto started = handle.start();
    ASSERT_FALSE(started.has_value());
    EXPECT_EQ(started.error().code, error_code::key_not_loaded);
    EXPECT_EQ(handle.status().value(), batch_status::pending);
    EXPECT_EQ(client_->calls(), 0u);

    ASSERT_TRUE(keys_->get_or_create().has_value());
    auto report = run_to_end(handle);
    EXPECT_TRUE(report.all_succeeded());
}

// ============================================================================
// Failure isolation
// ============================================================================

TEST_F(TransferOrchestratorTest, UploadFailureIsolatedToOneJob) {
    build();
    auto files = make_files(5, 2000);
    client_->fail_call(2, error_code::transport_quota_exceeded);

    auto handle = submit_files(files);
    auto report = run_to_end(handle);

    EXPECT_EQ(report.status, batch_status::completed);
    EXPECT_EQ(report.completed_count(), 4u);
    EXPECT_EQ(report.failed_count(), 1u);
    EXPECT_FALSE(report.all_succeeded());

    const auto& failed = report.jobs[2];
    EXPECT_EQ(failed.final_state, job_state::failed);
    ASSERT_TRUE(failed.failure.has_value());
    EXPECT_EQ(failed.failure->code, error_code::transport_quota_exceeded);
    EXPECT_EQ(kind_of(*failed.failure), error_kind::transport);
    ASSERT_TRUE(failed.container.has_value());
    EXPECT_TRUE(fs::exists(*failed.container));
    EXPECT_FALSE(failed.remote_id.has_value());

    EXPECT_EQ(report.jobs[3].final_state, job_state::completed);
    EXPECT_EQ(report.jobs[4].final_state, job_state::completed);
    EXPECT_EQ(client_->records().size(), 4u);

    auto final_snapshot = handle.progress().value();
    EXPECT_EQ(final_snapshot.files_failed, 1u);
    EXPECT_EQ(final_snapshot.files_completed, 4u);
    EXPECT_EQ(final_snapshot.bytes_transferred,
              final_snapshot.bytes_total - stream_codec::container_size(2000));
    ASSERT_TRUE(final_snapshot.eta.has_value());
    EXPECT_EQ(final_snapshot.eta->count(), 0);
}

TEST_F(TransferOrchestratorTest, MissingSourceFailsOnlyThatJob) {
    build();
    auto good = create_test_file("good.bin", 100);
    auto missing = source_dir_ / "missing.bin";

    auto handle = submit_files({good, missing, good});
    auto report = run_to_end(handle);

    EXPECT_EQ(report.completed_count(), 2u);
    ASSERT_EQ(report.jobs[1].final_state, job_state::failed);
    EXPECT_EQ(report.jobs[1].failure->code, error_code::file_not_found);
    EXPECT_FALSE(report.jobs[1].container.has_value());
}

TEST_F(TransferOrchestratorTest, ThrowingClientIsolated) {
    build();
    client_->throw_on_call(0);

    auto handle = submit_files(make_files(2, 100));
    auto report = run_to_end(handle);

    EXPECT_EQ(report.jobs[0].final_state, job_state::failed);
    EXPECT_EQ(report.jobs[0].failure->code, error_code::internal_error);
    EXPECT_NE(report.jobs[0].failure->message.find("simulated client crash"),
              std::string::npos);
    EXPECT_EQ(report.jobs[1].final_state, job_state::completed);
}

TEST_F(TransferOrchestratorTest, UnwritableStagingFailsOnlyThatJob) {
    build();
    auto files = make_files(2, 2000);

    // A regular file in place of the staging directory blocks the container
    fs::remove_all(staging_dir_);
    test::write_file(staging_dir_, std::vector<char>(1, 'x'));

    std::atomic<bool> restored{false};
    reporter_->set_hook([&](const progress_snapshot& s) {
        if (s.files_failed == 1 && !restored.exchange(true)) {
            std::error_code ec;
            fs::remove(staging_dir_, ec);
            fs::create_directory(staging_dir_, ec);
        }
    });

    auto handle = submit_files(files);
    auto report = run_to_end(handle);

    EXPECT_EQ(report.status, batch_status::completed);
    ASSERT_EQ(report.jobs.size(), 2u);

    const auto& failed = report.jobs[0];
    EXPECT_EQ(failed.final_state, job_state::failed);
    ASSERT_TRUE(failed.failure.has_value());
    EXPECT_EQ(failed.failure->code, error_code::destination_unwritable);
    EXPECT_EQ(kind_of(*failed.failure), error_kind::io);
    EXPECT_FALSE(failed.container.has_value());
    EXPECT_FALSE(failed.remote_id.has_value());

    EXPECT_TRUE(restored.load());
    EXPECT_EQ(report.jobs[1].final_state, job_state::completed);
    EXPECT_TRUE(report.jobs[1].remote_id.has_value());
    ASSERT_EQ(client_->records().size(), 1u);
    EXPECT_TRUE(files_with_suffix(staging_dir_, ".part").empty());
}

// ============================================================================
// Resubmission
// ============================================================================

TEST_F(TransferOrchestratorTest, ResubmitReusesContainer) {
    build();
    auto files = make_files(3, 3000);
    client_->fail_call(1, error_code::transport_network_error);

    auto first = submit_files(files);
    auto first_report = run_to_end(first);
    ASSERT_EQ(first_report.failed_count(), 1u);
    auto container_bytes = test::read_file(*first_report.jobs[1].container);

    // The source is no longer needed once the container exists
    fs::remove(files[1]);

    auto retry = orchestrator_->resubmit_failed(first.id());
    ASSERT_TRUE(retry.has_value()) << retry.error().message;
    auto retry_handle = retry.value();
    auto retry_jobs = retry_handle.jobs().value();
    ASSERT_EQ(retry_jobs.size(), 1u);
    EXPECT_EQ(retry_jobs[0].display_name, "file2.bin.encrypted");

    auto report = run_to_end(retry_handle);
    ASSERT_TRUE(report.all_succeeded());

    auto records = client_->records();
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records.back().display_name, "file2.bin.encrypted");
    EXPECT_EQ(records.back().content, container_bytes);
}

TEST_F(TransferOrchestratorTest, ResubmitReencryptsWhenNoContainer) {
    build();
    auto late = source_dir_ / "late.bin";
    auto first = submit_files({late});
    auto first_report = run_to_end(first);
    ASSERT_EQ(first_report.failed_count(), 1u);

    create_test_file("late.bin", 700);
    auto retry = orchestrator_->resubmit_failed(first.id());
    ASSERT_TRUE(retry.has_value());
    auto retry_handle = retry.value();
    auto report = run_to_end(retry_handle);
    ASSERT_TRUE(report.all_succeeded());

    auto plaintext = decrypt_container(client_->records().back().content);
    ASSERT_TRUE(plaintext.has_value());
    EXPECT_EQ(plaintext.value().size(), 700u);
}

TEST_F(TransferOrchestratorTest, ResubmitErrors) {
    build();
    auto handle = submit_files(make_files(1, 10));

    auto unfinished = orchestrator_->resubmit_failed(handle.id());
    ASSERT_FALSE(unfinished.has_value());
    EXPECT_EQ(unfinished.error().code, error_code::batch_not_finished);

    ASSERT_TRUE(run_to_end(handle).all_succeeded());
    auto nothing_failed = orchestrator_->resubmit_failed(handle.id());
    ASSERT_FALSE(nothing_failed.has_value());
    EXPECT_EQ(nothing_failed.error().code, error_code::invalid_state_transition);
}

// ============================================================================
// Pause and resume
// ============================================================================

TEST_F(TransferOrchestratorTest, PauseDuringEncryptionHoldsProgress) {
    constexpr std::size_t chunk = 1024;
    build(small_chunks(chunk));
    auto source = create_test_file("large.bin", 64 * 1024);
    auto handle = submit_files({source});

    std::atomic<bool> pause_sent{false};
    std::atomic<uint64_t> bytes_at_request{0};
    reporter_->set_hook([&](const progress_snapshot& s) {
        if (s.batch == handle.id() && s.status == batch_status::running &&
            s.current_file_status == job_state::encrypting &&
            s.bytes_transferred >= 4 * chunk && !pause_sent.exchange(true)) {
            bytes_at_request = s.bytes_transferred;
            EXPECT_TRUE(orchestrator_->pause(handle.id()).has_value());
        }
    });

    ASSERT_TRUE(handle.start().has_value());
    ASSERT_TRUE(test::wait_until([&] {
        return handle.status().value() == batch_status::paused;
    }));

    auto paused = handle.progress().value();
    EXPECT_EQ(paused.status, batch_status::paused);
    EXPECT_LE(paused.bytes_transferred - bytes_at_request.load(), chunk);

    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(handle.progress().value().bytes_transferred, paused.bytes_transferred);
    EXPECT_EQ(handle.jobs().value()[0].state, job_state::encrypting);
    EXPECT_EQ(client_->calls(), 0u);

    auto waited = handle.wait_for(20ms);
    ASSERT_FALSE(waited.has_value());
    EXPECT_EQ(waited.error().code, error_code::timeout);

    ASSERT_TRUE(handle.resume().has_value());
    auto report = handle.wait_for(30s);
    ASSERT_TRUE(report.has_value());
    ASSERT_TRUE(report.value().all_succeeded());

    auto plaintext = decrypt_container(client_->records()[0].content);
    ASSERT_TRUE(plaintext.has_value());
    auto original = test::read_file(source);
    EXPECT_EQ(plaintext.value(), std::string(original.begin(), original.end()));

    bool saw_resume = false;
    bool after_pause = false;
    for (const auto& s : reporter_->snapshots_for(handle.id())) {
        if (s.status == batch_status::paused) after_pause = true;
        if (after_pause && s.status == batch_status::running) saw_resume = true;
    }
    EXPECT_TRUE(saw_resume);
}

TEST_F(TransferOrchestratorTest, PauseBeforeStart) {
    build();
    auto handle = submit_files(make_files(2, 100));
    ASSERT_TRUE(handle.pause().has_value());
    ASSERT_TRUE(handle.start().has_value());

    ASSERT_TRUE(test::wait_until([&] {
        return handle.status().value() == batch_status::paused;
    }));
    EXPECT_EQ(client_->calls(), 0u);
    EXPECT_EQ(handle.jobs().value()[0].state, job_state::pending);

    ASSERT_TRUE(handle.resume().has_value());
    auto report = handle.wait_for(30s);
    ASSERT_TRUE(report.has_value());
    EXPECT_TRUE(report.value().all_succeeded());
}

TEST_F(TransferOrchestratorTest, ControlOnFinishedBatch) {
    build();
    auto handle = submit_files(make_files(1, 10));
    ASSERT_TRUE(run_to_end(handle).all_succeeded());

    EXPECT_EQ(handle.pause().error().code, error_code::invalid_state_transition);
    EXPECT_EQ(handle.resume().error().code, error_code::invalid_state_transition);
    EXPECT_TRUE(handle.cancel().has_value());
    EXPECT_EQ(handle.status().value(), batch_status::completed);

    // wait() on a finished batch returns the same report again
    auto again = handle.wait();
    ASSERT_TRUE(again.has_value());
    EXPECT_TRUE(again.value().all_succeeded());
}

// ============================================================================
// Cancellation
// ============================================================================

TEST_F(TransferOrchestratorTest, CancelNeverStarted) {
    build();
    auto handle = submit_files(make_files(3, 100));

    auto waited = handle.wait();
    ASSERT_FALSE(waited.has_value());
    EXPECT_EQ(waited.error().code, error_code::batch_not_finished);

    ASSERT_TRUE(handle.cancel().has_value());
    EXPECT_EQ(handle.status().value(), batch_status::cancelled);

    auto report = handle.wait();
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report.value().status, batch_status::cancelled);
    EXPECT_EQ(report.value().cancelled_count(), 3u);
    EXPECT_EQ(client_->calls(), 0u);

    EXPECT_EQ(handle.start().error().code, error_code::batch_already_started);
    EXPECT_EQ(reporter_->snapshots_for(handle.id()).back().status, batch_status::cancelled);
}

TEST_F(TransferOrchestratorTest, CancelDuringEncryptionCleansUp) {
    constexpr std::size_t chunk = 1024;
    build(small_chunks(chunk));
    auto handle = submit_files(make_files(2, 32 * 1024));

    std::atomic<bool> cancel_sent{false};
    reporter_->set_hook([&](const progress_snapshot& s) {
        if (s.current_file_status == job_state::encrypting &&
            s.bytes_transferred >= 4 * chunk && !cancel_sent.exchange(true)) {
            EXPECT_TRUE(orchestrator_->cancel(s.batch).has_value());
        }
    });

    auto report = run_to_end(handle);
    EXPECT_EQ(report.status, batch_status::cancelled);
    EXPECT_EQ(report.cancelled_count(), 2u);
    EXPECT_EQ(client_->calls(), 0u);

    EXPECT_TRUE(files_with_suffix(staging_dir_, ".encrypted").empty());
    EXPECT_TRUE(files_with_suffix(staging_dir_, ".part").empty());
    EXPECT_FALSE(report.jobs[0].container.has_value());

    auto final_snapshot = handle.progress().value();
    EXPECT_EQ(final_snapshot.status, batch_status::cancelled);
    EXPECT_EQ(final_snapshot.files_cancelled, 2u);
    EXPECT_EQ(keys_->active_leases(), 0u);
}

TEST_F(TransferOrchestratorTest, CancelDuringUploadFinishesThatUpload) {
    build();
    auto handle = submit_files(make_files(4, 500));

    client_->set_upload_hook([&](std::size_t call) {
        if (call == 1) {
            EXPECT_TRUE(orchestrator_->cancel(handle.id()).has_value());
        }
    });

    auto report = run_to_end(handle);
    EXPECT_EQ(report.status, batch_status::cancelled);
    EXPECT_EQ(report.jobs[0].final_state, job_state::completed);
    EXPECT_EQ(report.jobs[1].final_state, job_state::completed);
    EXPECT_EQ(report.jobs[2].final_state, job_state::cancelled);
    EXPECT_EQ(report.jobs[3].final_state, job_state::cancelled);
    EXPECT_EQ(client_->records().size(), 2u);

    // Only completed jobs leave containers behind
    EXPECT_EQ(files_with_suffix(staging_dir_, ".encrypted").size(), 2u);
    EXPECT_TRUE(files_with_suffix(staging_dir_, ".part").empty());
}

// ============================================================================
// Waiting
// ============================================================================

TEST_F(TransferOrchestratorTest, WaitForTimesOutWhileUploadBlocked) {
    build();
    std::atomic<bool> release{false};
    client_->set_upload_hook([&](std::size_t) {
        test::wait_until([&] { return release.load(); });
    });

    auto handle = submit_files(make_files(1, 100));
    ASSERT_TRUE(handle.start().has_value());

    auto waited = handle.wait_for(30ms);
    ASSERT_FALSE(waited.has_value());
    EXPECT_EQ(waited.error().code, error_code::timeout);

    release = true;
    auto report = handle.wait_for(30s);
    ASSERT_TRUE(report.has_value());
    EXPECT_TRUE(report.value().all_succeeded());
}

// ============================================================================
// Progress, throughput and ETA
// ============================================================================

TEST_F(TransferOrchestratorTest, SnapshotsAreOrderedAndMonotonic) {
    build(small_chunks(512));
    auto handle = submit_files(make_files(3, 4096));
    auto report = run_to_end(handle);
    ASSERT_TRUE(report.all_succeeded());

    auto snaps = reporter_->snapshots_for(handle.id());
    ASSERT_GT(snaps.size(), 10u);
    for (std::size_t i = 1; i < snaps.size(); ++i) {
        EXPECT_EQ(snaps[i].sequence, snaps[i - 1].sequence + 1);
        EXPECT_GE(snaps[i].bytes_transferred, snaps[i - 1].bytes_transferred);
        EXPECT_GE(snaps[i].files_finished(), snaps[i - 1].files_finished());
        EXPECT_LE(snaps[i].bytes_transferred, snaps[i].bytes_total);
    }
    EXPECT_EQ(snaps.front().status, batch_status::pending);
    EXPECT_EQ(snaps.back().status, batch_status::completed);
    EXPECT_EQ(snaps.back().sequence, handle.progress().value().sequence);
}

TEST_F(TransferOrchestratorTest, EtaUnknownWhileClockFrozen) {
    test::manual_clock clock;
    build(default_builder().with_clock(clock.source()));
    auto handle = submit_files(make_files(2, 2048));
    auto report = run_to_end(handle);
    ASSERT_TRUE(report.all_succeeded());

    for (const auto& s : reporter_->snapshots_for(handle.id())) {
        if (s.bytes_transferred < s.bytes_total) {
            EXPECT_FALSE(s.eta.has_value()) << "sequence " << s.sequence;
            EXPECT_DOUBLE_EQ(s.throughput_bytes_per_sec, 0.0);
        }
    }
    EXPECT_EQ(report.elapsed.count(), 0);
}

TEST_F(TransferOrchestratorTest, ThroughputFromClock) {
    test::manual_clock clock;
    build(default_builder().with_clock(clock.source()).with_throughput_interval(100ms));
    client_->set_upload_hook([&](std::size_t) { clock.advance(1000ms); });

    auto handle = submit_files(make_files(2, 2048));
    auto report = run_to_end(handle);
    ASSERT_TRUE(report.all_succeeded());

    bool saw_estimate = false;
    for (const auto& s : reporter_->snapshots_for(handle.id())) {
        if (s.bytes_transferred < s.bytes_total && s.eta.has_value()) {
            saw_estimate = true;
            EXPECT_GT(s.throughput_bytes_per_sec, 0.0);
        }
    }
    EXPECT_TRUE(saw_estimate);
    EXPECT_EQ(report.elapsed.count(), 2000);
}

TEST_F(TransferOrchestratorTest, PausedBatchReportsNoThroughputOrEta) {
    constexpr std::size_t chunk = 1024;
    test::manual_clock clock;
    build(small_chunks(chunk).with_clock(clock.source()).with_throughput_interval(100ms));
    auto handle = submit_files({create_test_file("large.bin", 64 * 1024)});

    std::atomic<bool> pause_sent{false};
    reporter_->set_hook([&](const progress_snapshot& s) {
        if (s.batch != handle.id() || s.status != batch_status::running ||
            s.current_file_status != job_state::encrypting) {
            return;
        }
        if (s.throughput_bytes_per_sec > 0.0 && s.bytes_transferred >= 4 * chunk &&
            !pause_sent.exchange(true)) {
            EXPECT_TRUE(orchestrator_->pause(handle.id()).has_value());
            return;
        }
        clock.advance(100ms);
    });

    ASSERT_TRUE(handle.start().has_value());
    ASSERT_TRUE(test::wait_until([&] {
        return handle.status().value() == batch_status::paused;
    }));

    // Time spent paused must not leave a stale rate or estimate behind
    clock.advance(10000ms);
    auto paused = handle.progress().value();
    EXPECT_EQ(paused.status, batch_status::paused);
    EXPECT_FALSE(paused.eta.has_value());
    EXPECT_DOUBLE_EQ(paused.throughput_bytes_per_sec, 0.0);

    ASSERT_TRUE(handle.resume().has_value());
    auto report = handle.wait_for(30s);
    ASSERT_TRUE(report.has_value());
    ASSERT_TRUE(report.value().all_succeeded());

    bool saw_paused = false;
    bool saw_rate_after_resume = false;
    for (const auto& s : reporter_->snapshots_for(handle.id())) {
        if (s.status == batch_status::paused) {
            saw_paused = true;
            EXPECT_FALSE(s.eta.has_value()) << "sequence " << s.sequence;
            EXPECT_DOUBLE_EQ(s.throughput_bytes_per_sec, 0.0);
        } else if (saw_paused && s.status == batch_status::running &&
                   s.throughput_bytes_per_sec > 0.0) {
            // One chunk per 100 ms; the paused ten seconds are not averaged in
            saw_rate_after_resume = true;
            EXPECT_NEAR(s.throughput_bytes_per_sec, 10240.0, 1.0) << "sequence " << s.sequence;
        }
    }
    EXPECT_TRUE(saw_paused);
    EXPECT_TRUE(saw_rate_after_resume);
}

// ============================================================================
// Key lease
// ============================================================================

TEST_F(TransferOrchestratorTest, KeyLockedWhileBatchRuns) {
    build();
    std::optional<error_code> regenerate_result;
    client_->set_upload_hook([&](std::size_t call) {
        if (call == 0) {
            auto regenerated = keys_->regenerate();
            regenerate_result = regenerated ? error_code::success : regenerated.error().code;
        }
    });

    auto handle = submit_files(make_files(1, 100));
    auto report = run_to_end(handle);
    ASSERT_TRUE(report.all_succeeded());

    ASSERT_TRUE(regenerate_result.has_value());
    EXPECT_EQ(*regenerate_result, error_code::key_in_use);
    EXPECT_EQ(keys_->active_leases(), 0u);
    EXPECT_TRUE(keys_->regenerate().has_value());
}

// ============================================================================
// Shutdown
// ============================================================================

TEST_F(TransferOrchestratorTest, DestructionCancelsPendingBatches) {
    build();
    auto handle = submit_files(make_files(2, 100));
    auto id = handle.id();

    auto before = reporter_->snapshots_for(id).size();
    orchestrator_.reset();

    auto snaps = reporter_->snapshots_for(id);
    ASSERT_GT(snaps.size(), before);
    EXPECT_EQ(snaps.back().status, batch_status::cancelled);
    EXPECT_EQ(snaps.back().files_cancelled, 2u);
}

}  // namespace
}  // namespace secure_drive
