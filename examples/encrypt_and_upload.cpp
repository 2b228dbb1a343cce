/**
 * @file encrypt_and_upload.cpp
 * @brief Encrypt files and upload them to a local directory "remote"
 *
 * This example demonstrates:
 * - Loading or creating the encryption key with file-backed key storage
 * - Building a transfer orchestrator with a queued progress reporter
 * - Rendering progress snapshots from the main thread
 * - Pausing, resuming and cancelling a batch from the command line flags
 * - Inspecting the per-file batch report
 * - Decrypting an uploaded object back for verification
 */

#include <secure_drive/secure_drive.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace secure_drive;

namespace {

void print_usage(const char* program) {
    std::cout << "Encrypt and Upload Example - secure_drive" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <file1> [file2] ..." << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -k, --key-dir <dir>     Key directory (default: $HOME/.securedrive)" << std::endl;
    std::cout << "  -u, --upload-dir <dir>  Directory that receives containers (default: ./remote)" << std::endl;
    std::cout << "  -s, --staging <dir>     Write containers here instead of beside each file" << std::endl;
    std::cout << "  --chunk <bytes>         Codec chunk size (default: 8192)" << std::endl;
    std::cout << "  --pause-ms <ms>         Pause the batch for <ms> after it starts" << std::endl;
    std::cout << "  --cancel-after <ms>     Cancel the batch <ms> after it starts" << std::endl;
    std::cout << "  --verify                Download and decrypt each upload afterwards" << std::endl;
    std::cout << "  --regenerate-key        Replace the key before uploading" << std::endl;
    std::cout << "  --json-log              Emit log records as JSON" << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
}

void print_report(const batch_report& report) {
    std::cout << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "       Batch " << report.batch.value << " Summary" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "Status: " << to_string(report.status) << std::endl;
    std::cout << "Completed: " << report.completed_count()
              << "  Failed: " << report.failed_count()
              << "  Cancelled: " << report.cancelled_count() << std::endl;
    std::cout << "Transferred: " << format_bytes(report.bytes_transferred)
              << " in " << report.elapsed.count() << " ms" << std::endl;
    std::cout << std::endl;

    for (const auto& job : report.jobs) {
        std::cout << "  " << std::setw(32) << std::left << job.display_name
                  << " " << std::setw(10) << to_string(job.final_state);
        if (job.remote_id) {
            std::cout << " -> " << *job.remote_id;
        }
        if (job.failure) {
            std::cout << " (" << to_string(job.failure->code) << ": "
                      << job.failure->message << ")";
        }
        std::cout << std::endl;
    }
}

auto verify_uploads(const batch_report& report,
                    upload_client_interface& client,
                    key_store& keys,
                    const std::filesystem::path& scratch) -> int {
    auto lease = keys.lease();
    if (!lease) {
        std::cerr << "Cannot verify: " << lease.error().message << std::endl;
        return 1;
    }

    std::filesystem::create_directories(scratch);
    auto codec = stream_codec::create();
    int mismatches = 0;

    for (const auto& job : report.jobs) {
        if (!job.remote_id) {
            continue;
        }
        auto container = scratch / (*job.remote_id + ".encrypted");
        auto plain = scratch / *job.remote_id;

        auto fetched = client.download(*job.remote_id, container);
        if (!fetched) {
            std::cerr << "  " << *job.remote_id << ": " << fetched.error().message << std::endl;
            ++mismatches;
            continue;
        }
        auto decrypted = codec->decrypt_file(container, plain, lease.value().key());
        if (!decrypted) {
            std::cerr << "  " << *job.remote_id << ": " << decrypted.error().message << std::endl;
            ++mismatches;
            continue;
        }

        std::error_code ec;
        auto expected = std::filesystem::file_size(job.source, ec);
        bool ok = !ec && expected == decrypted.value();
        std::cout << "  " << job.display_name << ": "
                  << (ok ? "verified" : "size mismatch") << std::endl;
        if (!ok) {
            ++mismatches;
        }
    }
    return mismatches == 0 ? 0 : 1;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::filesystem::path key_dir = file_key_storage::default_directory();
    std::filesystem::path upload_dir = "./remote";
    std::filesystem::path staging_dir;
    std::size_t chunk_size = DEFAULT_CODEC_CHUNK_SIZE;
    std::optional<int> pause_ms;
    std::optional<int> cancel_after_ms;
    bool verify = false;
    bool regenerate = false;
    bool json_log = false;
    std::vector<std::filesystem::path> files;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto need_value = [&](const char* name) -> const char* {
            if (++i >= argc) {
                std::cerr << "Error: " << name << " requires an argument" << std::endl;
                std::exit(1);
            }
            return argv[i];
        };

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-k" || arg == "--key-dir") {
            key_dir = need_value("--key-dir");
        } else if (arg == "-u" || arg == "--upload-dir") {
            upload_dir = need_value("--upload-dir");
        } else if (arg == "-s" || arg == "--staging") {
            staging_dir = need_value("--staging");
        } else if (arg == "--chunk") {
            chunk_size = static_cast<std::size_t>(std::stoul(need_value("--chunk")));
        } else if (arg == "--pause-ms") {
            pause_ms = std::stoi(need_value("--pause-ms"));
        } else if (arg == "--cancel-after") {
            cancel_after_ms = std::stoi(need_value("--cancel-after"));
        } else if (arg == "--verify") {
            verify = true;
        } else if (arg == "--regenerate-key") {
            regenerate = true;
        } else if (arg == "--json-log") {
            json_log = true;
        } else if (arg[0] != '-') {
            files.emplace_back(arg);
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            return 1;
        }
    }

    if (files.empty()) {
        std::cerr << "Error: No files specified for upload" << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    get_logger().set_level(log_level::warn);
    if (json_log) {
        get_logger().enable_json_output(true);
    }

    // Key
    std::cout << "[1/4] Loading key from " << key_dir << "..." << std::endl;
    std::shared_ptr<key_store> keys = key_store::create(file_key_storage::create(key_dir));
    auto info = regenerate ? keys->regenerate() : keys->get_or_create();
    if (!info) {
        std::cerr << "Key error (" << to_string(info.error().code) << "): "
                  << info.error().message << std::endl;
        return 1;
    }
    std::cout << "  " << info.value().algorithm << ", fingerprint "
              << info.value().fingerprint << std::endl;
    if (info.value().warning) {
        std::cout << "  Warning: " << *info.value().warning << std::endl;
    }

    // Upload client
    std::cout << "[2/4] Opening upload directory " << upload_dir << "..." << std::endl;
    auto client_result = directory_upload_client::create(upload_dir);
    if (!client_result) {
        std::cerr << "Failed to open upload directory: "
                  << client_result.error().message << std::endl;
        return 1;
    }
    std::shared_ptr<directory_upload_client> client = std::move(client_result.value());

    // Orchestrator
    auto queue = std::make_shared<queued_progress_reporter>(256);
    auto builder = transfer_orchestrator::builder();
    builder.with_key_store(keys)
        .with_upload_client(client)
        .with_progress_reporter(queue)
        .with_codec_config(codec_config{chunk_size});
    if (!staging_dir.empty()) {
        builder.with_staging_directory(staging_dir);
    }
    auto orchestrator_result = builder.build();
    if (!orchestrator_result) {
        std::cerr << "Failed to create orchestrator: "
                  << orchestrator_result.error().message << std::endl;
        return 1;
    }
    auto& orchestrator = orchestrator_result.value();

    std::cout << "[3/4] Submitting " << files.size() << " file(s)..." << std::endl;
    auto batch_result = orchestrator.submit(files);
    if (!batch_result) {
        std::cerr << "Failed to submit batch: " << batch_result.error().message << std::endl;
        return 1;
    }
    auto batch = batch_result.value();

    auto started = batch.start();
    if (!started) {
        std::cerr << "Failed to start batch: " << started.error().message << std::endl;
        return 1;
    }

    // Control thread for the demo flags
    std::thread control([&] {
        if (pause_ms) {
            (void)batch.pause();
            std::this_thread::sleep_for(std::chrono::milliseconds(*pause_ms));
            (void)batch.resume();
        }
        if (cancel_after_ms) {
            std::this_thread::sleep_for(std::chrono::milliseconds(*cancel_after_ms));
            (void)batch.cancel();
        }
    });

    std::cout << "[4/4] Transferring..." << std::endl;
    while (true) {
        auto snapshot = queue->wait_pop(std::chrono::milliseconds(200));
        if (!snapshot) {
            auto status = batch.status();
            if (status && is_finished(status.value())) {
                break;
            }
            continue;
        }
        std::cout << "\r" << format_progress(*snapshot) << "        " << std::flush;
        if (snapshot->batch == batch.id() && is_finished(snapshot->status)) {
            break;
        }
    }
    std::cout << std::endl;

    control.join();

    auto report = batch.wait();
    if (!report) {
        std::cerr << "Error waiting for batch: " << report.error().message << std::endl;
        return 1;
    }
    print_report(report.value());

    if (verify) {
        std::cout << std::endl << "Verifying uploads..." << std::endl;
        return verify_uploads(report.value(), *client, *keys, upload_dir / ".verify");
    }

    return report.value().all_succeeded() ? 0 : 2;
}
