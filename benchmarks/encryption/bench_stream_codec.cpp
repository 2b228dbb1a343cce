/**
 * @file bench_stream_codec.cpp
 * @brief Benchmarks for AES-256-CBC container encryption/decryption throughput
 *
 * Runs over in-memory streams so the numbers reflect the codec rather than
 * the file system. The chunk size is varied to show the cost of the
 * per-chunk callback and buffer refills.
 */

#include <benchmark/benchmark.h>

#include <secure_drive/encryption/stream_codec.h>

#include "utils/benchmark_helpers.h"

#include <cstddef>
#include <optional>
#include <sstream>
#include <string>

namespace secure_drive::benchmark {

// ============================================================================
// Global Test Setup
// ============================================================================

namespace {

class codec_benchmark_fixture {
public:
    codec_benchmark_fixture() {
        auto key = test_data_generator::benchmark_key();
        if (key.has_value()) {
            key_.emplace(std::move(key.value()));
        }
    }

    [[nodiscard]] auto key() const -> const encryption_key* {
        return key_ ? &*key_ : nullptr;
    }

private:
    std::optional<encryption_key> key_;
};

auto get_fixture() -> codec_benchmark_fixture& {
    static codec_benchmark_fixture fixture;
    return fixture;
}

}  // namespace

// ============================================================================
// Stream Benchmarks
// ============================================================================

/**
 * @brief Encryption throughput; range(0) = data size, range(1) = chunk size
 */
static void BM_StreamCodec_Encrypt(::benchmark::State& state) {
    const auto* key = get_fixture().key();
    auto codec = stream_codec::create(codec_config{static_cast<std::size_t>(state.range(1))});
    if (!key || !codec) {
        state.SkipWithError("Codec not initialized");
        return;
    }

    const auto data_size = static_cast<std::size_t>(state.range(0));
    const auto plaintext = test_data_generator::generate_random_data(data_size, 42);

    for (auto _ : state) {
        std::istringstream in(plaintext);
        std::ostringstream out;
        auto result = codec->encrypt(in, out, *key);
        if (!result.has_value()) {
            state.SkipWithError("Encryption failed");
            return;
        }
        ::benchmark::DoNotOptimize(out);
    }

    state.SetBytesProcessed(static_cast<int64_t>(data_size) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Decryption throughput; range(0) = data size, range(1) = chunk size
 */
static void BM_StreamCodec_Decrypt(::benchmark::State& state) {
    const auto* key = get_fixture().key();
    auto codec = stream_codec::create(codec_config{static_cast<std::size_t>(state.range(1))});
    if (!key || !codec) {
        state.SkipWithError("Codec not initialized");
        return;
    }

    const auto data_size = static_cast<std::size_t>(state.range(0));
    const auto plaintext = test_data_generator::generate_random_data(data_size, 42);

    // Pre-encrypt data
    std::string container;
    {
        std::istringstream in(plaintext);
        std::ostringstream out;
        if (!codec->encrypt(in, out, *key).has_value()) {
            state.SkipWithError("Failed to prepare container");
            return;
        }
        container = out.str();
    }

    for (auto _ : state) {
        std::istringstream in(container);
        std::ostringstream out;
        auto result = codec->decrypt(in, out, *key);
        if (!result.has_value()) {
            state.SkipWithError("Decryption failed");
            return;
        }
        ::benchmark::DoNotOptimize(out);
    }

    state.SetBytesProcessed(static_cast<int64_t>(data_size) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Cost of the per-chunk callback at small chunk sizes
 */
static void BM_StreamCodec_EncryptWithCallback(::benchmark::State& state) {
    const auto* key = get_fixture().key();
    auto codec = stream_codec::create(codec_config{static_cast<std::size_t>(state.range(0))});
    if (!key || !codec) {
        state.SkipWithError("Codec not initialized");
        return;
    }

    const auto plaintext = test_data_generator::generate_random_data(sizes::medium_file, 7);

    uint64_t last = 0;
    for (auto _ : state) {
        std::istringstream in(plaintext);
        std::ostringstream out;
        auto result = codec->encrypt(in, out, *key, [&](uint64_t processed) {
            last = processed;
            return true;
        });
        if (!result.has_value()) {
            state.SkipWithError("Encryption failed");
            return;
        }
        ::benchmark::DoNotOptimize(last);
    }

    state.SetBytesProcessed(static_cast<int64_t>(sizes::medium_file) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_StreamCodec_Encrypt)
    ->ArgsProduct({{static_cast<int64_t>(sizes::small_file),
                    static_cast<int64_t>(sizes::medium_file),
                    static_cast<int64_t>(sizes::large_file)},
                   {4 * 1024, 8 * 1024, 64 * 1024, 1024 * 1024}})
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_StreamCodec_Decrypt)
    ->ArgsProduct({{static_cast<int64_t>(sizes::small_file),
                    static_cast<int64_t>(sizes::medium_file),
                    static_cast<int64_t>(sizes::large_file)},
                   {8 * 1024, 64 * 1024}})
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_StreamCodec_EncryptWithCallback)
    ->Arg(1024)
    ->Arg(8 * 1024)
    ->Arg(64 * 1024)
    ->Unit(::benchmark::kMillisecond);

}  // namespace secure_drive::benchmark
