/**
 * @file benchmark_helpers.cpp
 * @brief Implementation of benchmark helper utilities
 */

#include "utils/benchmark_helpers.h"

#include <array>
#include <fstream>

namespace secure_drive::benchmark {

// test_data_generator implementation

auto test_data_generator::generate_random_data(std::size_t size, uint32_t seed)
    -> std::string {
    std::string data(size, '\0');

    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed);
    std::uniform_int_distribution<uint16_t> dis(0, 255);

    for (auto& c : data) {
        c = static_cast<char>(dis(gen));
    }

    return data;
}

auto test_data_generator::benchmark_key() -> result<encryption_key> {
    std::array<std::byte, AES_256_KEY_SIZE> material{};
    for (std::size_t i = 0; i < material.size(); ++i) {
        material[i] = static_cast<std::byte>(i & 0xFF);
    }
    return encryption_key::from_bytes(material);
}

// temp_file_manager implementation

temp_file_manager::temp_file_manager(const std::filesystem::path& base_dir) {
    if (base_dir.empty()) {
        base_dir_ = std::filesystem::temp_directory_path() /
                    ("secure_drive_benchmarks_" + std::to_string(std::random_device{}()));
        owns_dir_ = true;
    } else {
        base_dir_ = base_dir;
        owns_dir_ = false;
    }

    std::error_code ec;
    std::filesystem::create_directories(base_dir_, ec);
}

temp_file_manager::~temp_file_manager() {
    if (owns_dir_) {
        std::error_code ec;
        std::filesystem::remove_all(base_dir_, ec);
    }
}

auto temp_file_manager::create_random_file(
    const std::string& name,
    std::size_t size,
    uint32_t seed) -> std::filesystem::path {
    auto path = base_dir_ / name;
    auto data = test_data_generator::generate_random_data(size, seed);
    std::ofstream file(path, std::ios::binary);
    file.write(data.data(), static_cast<std::streamsize>(data.size()));
    return path;
}

auto temp_file_manager::base_dir() const -> const std::filesystem::path& {
    return base_dir_;
}

void temp_file_manager::cleanup() {
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(base_dir_, ec)) {
        std::error_code remove_ec;
        std::filesystem::remove_all(entry.path(), remove_ec);
    }
}

}  // namespace secure_drive::benchmark
