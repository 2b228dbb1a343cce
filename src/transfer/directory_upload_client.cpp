/**
 * @file directory_upload_client.cpp
 * @brief Local directory implementation of upload_client_interface
 */

#include "secure_drive/transfer/upload_client.h"

#include "secure_drive/core/logging.h"

#include <algorithm>
#include <array>
#include <fstream>
#include <mutex>
#include <optional>
#include <string_view>
#include <system_error>

namespace secure_drive {

namespace {

constexpr std::string_view object_prefix = "obj-";
constexpr std::string_view name_suffix = ".name";
constexpr std::size_t copy_buffer_size = 64 * 1024;

auto parse_object_number(const std::string& filename) -> std::optional<uint64_t> {
    if (filename.rfind(object_prefix, 0) != 0) {
        return std::nullopt;
    }
    auto digits = filename.substr(object_prefix.size());
    if (digits.empty() ||
        !std::all_of(digits.begin(), digits.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return std::nullopt;
    }
    return std::stoull(digits);
}

}  // namespace

struct directory_upload_client::impl {
    std::filesystem::path root;
    std::mutex mutex;
    uint64_t next_object = 1;

    explicit impl(std::filesystem::path r) : root(std::move(r)) {}

    [[nodiscard]] auto object_path(const std::string& remote_id) const -> std::filesystem::path {
        return root / remote_id;
    }

    [[nodiscard]] auto name_path(const std::string& remote_id) const -> std::filesystem::path {
        return root / (remote_id + std::string(name_suffix));
    }

    void scan_existing() {
        std::error_code ec;
        for (const auto& entry : std::filesystem::directory_iterator(root, ec)) {
            auto number = parse_object_number(entry.path().filename().string());
            if (number && *number >= next_object) {
                next_object = *number + 1;
            }
        }
    }

    [[nodiscard]] auto read_display_name(const std::string& remote_id) const -> std::string {
        std::ifstream in(name_path(remote_id));
        std::string name;
        std::getline(in, name);
        return name.empty() ? remote_id : name;
    }
};

directory_upload_client::directory_upload_client(std::filesystem::path root)
    : impl_(std::make_unique<impl>(std::move(root))) {}

directory_upload_client::~directory_upload_client() = default;

auto directory_upload_client::create(const std::filesystem::path& root)
    -> result<std::unique_ptr<directory_upload_client>> {
    std::error_code ec;
    std::filesystem::create_directories(root, ec);
    if (ec || !std::filesystem::is_directory(root, ec)) {
        return unexpected(error(error_code::destination_unwritable,
                                "Failed to create upload directory: " + root.string()));
    }

    auto client = std::unique_ptr<directory_upload_client>(new directory_upload_client(root));
    client->impl_->scan_existing();
    return client;
}

auto directory_upload_client::upload(
    const std::filesystem::path& container_path,
    const std::string& display_name,
    const upload_progress_callback& on_progress) -> result<std::string> {
    std::error_code ec;
    auto total = std::filesystem::file_size(container_path, ec);
    if (ec) {
        return unexpected(error(error_code::file_not_found,
                                "Container not found: " + container_path.string()));
    }

    std::string remote_id;
    {
        std::lock_guard lock(impl_->mutex);
        remote_id = std::string(object_prefix) + std::to_string(impl_->next_object++);
    }

    std::ifstream in(container_path, std::ios::binary);
    if (!in) {
        return unexpected(error(error_code::source_unreadable,
                                "Failed to open container: " + container_path.string()));
    }

    auto target = impl_->object_path(remote_id);
    auto staging = target;
    staging += ".upload";
    std::ofstream out(staging, std::ios::binary | std::ios::trunc);
    if (!out) {
        return unexpected(error(error_code::transport_rejected,
                                "Failed to create remote object: " + staging.string()));
    }

    std::array<char, copy_buffer_size> buffer{};
    upload_progress progress;
    progress.total_bytes = total;
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto got = in.gcount();
        if (got <= 0) {
            break;
        }
        out.write(buffer.data(), got);
        if (!out) {
            out.close();
            std::filesystem::remove(staging, ec);
            return unexpected(error(error_code::transport_network_error,
                                    "Write failed while storing " + display_name));
        }
        progress.bytes_transferred += static_cast<uint64_t>(got);
        if (on_progress) {
            on_progress(progress);
        }
    }
    if (in.bad()) {
        out.close();
        std::filesystem::remove(staging, ec);
        return unexpected(error(error_code::source_unreadable,
                                "Read failed on container: " + container_path.string()));
    }

    out.close();
    std::filesystem::rename(staging, target, ec);
    if (ec) {
        std::filesystem::remove(staging, ec);
        return unexpected(error(error_code::transport_rejected,
                                "Failed to commit remote object " + remote_id));
    }

    {
        std::ofstream name(impl_->name_path(remote_id), std::ios::trunc);
        name << display_name << '\n';
    }

    SD_LOG_DEBUG(log_category::upload, "Stored " + display_name + " as " + remote_id);
    return remote_id;
}

auto directory_upload_client::list() -> result<std::vector<remote_file>> {
    std::vector<remote_file> files;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(impl_->root, ec)) {
        auto filename = entry.path().filename().string();
        std::error_code entry_ec;
        if (!parse_object_number(filename) || !entry.is_regular_file(entry_ec)) {
            continue;
        }

        remote_file file;
        file.remote_id = filename;
        file.display_name = impl_->read_display_name(filename);
        file.size = entry.file_size(entry_ec);
        auto written = entry.last_write_time(entry_ec);
        if (!entry_ec) {
            file.uploaded_at = std::chrono::file_clock::to_sys(written);
        }
        files.push_back(std::move(file));
    }
    if (ec) {
        return unexpected(error(error_code::transport_network_error,
                                "Failed to list " + impl_->root.string() + ": " + ec.message()));
    }

    std::sort(files.begin(), files.end(), [](const remote_file& a, const remote_file& b) {
        return *parse_object_number(a.remote_id) < *parse_object_number(b.remote_id);
    });
    return files;
}

auto directory_upload_client::remove(const std::string& remote_id) -> result<void> {
    if (!parse_object_number(remote_id)) {
        return unexpected(error(error_code::transport_rejected,
                                "Invalid remote id: " + remote_id));
    }

    std::error_code ec;
    if (!std::filesystem::remove(impl_->object_path(remote_id), ec) || ec) {
        return unexpected(error(error_code::transport_rejected,
                                "Remote object not found: " + remote_id));
    }
    std::filesystem::remove(impl_->name_path(remote_id), ec);
    return {};
}

auto directory_upload_client::download(
    const std::string& remote_id,
    const std::filesystem::path& destination) -> result<void> {
    if (!parse_object_number(remote_id)) {
        return unexpected(error(error_code::transport_rejected,
                                "Invalid remote id: " + remote_id));
    }

    auto source = impl_->object_path(remote_id);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(source, ec)) {
        return unexpected(error(error_code::transport_rejected,
                                "Remote object not found: " + remote_id));
    }

    std::filesystem::copy_file(source, destination,
                               std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        return unexpected(error(error_code::destination_unwritable,
                                "Failed to write " + destination.string() + ": " + ec.message()));
    }
    return {};
}

auto directory_upload_client::root() const -> const std::filesystem::path& {
    return impl_->root;
}

}  // namespace secure_drive
