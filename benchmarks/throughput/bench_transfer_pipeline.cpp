/**
 * @file bench_transfer_pipeline.cpp
 * @brief End-to-end batch throughput: file encryption plus local upload
 *
 * Each iteration runs one batch through the orchestrator with a
 * directory_upload_client, so the figures include container staging,
 * progress publishing and the copy into the upload directory.
 */

#include <benchmark/benchmark.h>

#include <secure_drive/secure_drive.h>

#include "utils/benchmark_helpers.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace secure_drive::benchmark {

namespace {

struct pipeline_setup {
    std::shared_ptr<key_store> keys;
    std::shared_ptr<directory_upload_client> client;
};

auto make_pipeline(const std::filesystem::path& base) -> std::optional<pipeline_setup> {
    get_logger().set_level(log_level::warn);

    pipeline_setup setup;
    setup.keys = key_store::create(memory_key_storage::create());
    if (!setup.keys || !setup.keys->get_or_create().has_value()) {
        return std::nullopt;
    }

    auto client = directory_upload_client::create(base / "remote");
    if (!client.has_value()) {
        return std::nullopt;
    }
    setup.client = std::move(client.value());
    return setup;
}

}  // namespace

/**
 * @brief Batch throughput; range(0) = file count, range(1) = file size
 */
static void BM_Pipeline_Batch(::benchmark::State& state) {
    const auto file_count = static_cast<std::size_t>(state.range(0));
    const auto file_size = static_cast<std::size_t>(state.range(1));

    temp_file_manager temp_files;
    auto setup = make_pipeline(temp_files.base_dir());
    if (!setup) {
        state.SkipWithError("Failed to set up pipeline");
        return;
    }

    std::vector<std::filesystem::path> files;
    for (std::size_t i = 0; i < file_count; ++i) {
        files.push_back(temp_files.create_random_file(
            "input_" + std::to_string(i) + ".bin", file_size, static_cast<uint32_t>(i + 1)));
    }

    auto staging = temp_files.base_dir() / "staging";
    auto built = transfer_orchestrator::builder()
                     .with_key_store(setup->keys)
                     .with_upload_client(setup->client)
                     .with_staging_directory(staging)
                     .with_codec_config(codec_config{64 * 1024})
                     .with_remove_container_after_upload(true)
                     .build();
    if (!built.has_value()) {
        state.SkipWithError("Failed to build orchestrator");
        return;
    }
    auto orchestrator = std::move(built.value());

    for (auto _ : state) {
        auto batch = orchestrator.submit(files);
        if (!batch.has_value() || !batch.value().start().has_value()) {
            state.SkipWithError("Failed to start batch");
            return;
        }
        auto report = batch.value().wait();
        if (!report.has_value() || !report.value().all_succeeded()) {
            state.SkipWithError("Batch did not complete");
            return;
        }
        ::benchmark::DoNotOptimize(report.value().bytes_transferred);
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_count * file_size) *
                            static_cast<int64_t>(state.iterations()));
    state.counters["files"] = static_cast<double>(file_count);
}

BENCHMARK(BM_Pipeline_Batch)
    ->Args({1, static_cast<int64_t>(sizes::large_file)})
    ->Args({16, static_cast<int64_t>(sizes::medium_file)})
    ->Args({128, static_cast<int64_t>(sizes::small_file)})
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

}  // namespace secure_drive::benchmark
