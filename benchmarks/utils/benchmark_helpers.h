/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef SECURE_DRIVE_BENCHMARKS_BENCHMARK_HELPERS_H
#define SECURE_DRIVE_BENCHMARKS_BENCHMARK_HELPERS_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <random>
#include <string>
#include <vector>

#include <secure_drive/encryption/encryption_key.h>

namespace secure_drive::benchmark {

/**
 * @brief Helper class for generating test data for benchmarks
 */
class test_data_generator {
public:
    /**
     * @brief Generate random binary data
     * @param size Size in bytes
     * @param seed Random seed (0 for random)
     * @return String holding random bytes, ready for a std::istringstream
     */
    static auto generate_random_data(std::size_t size, uint32_t seed = 0) -> std::string;

    /**
     * @brief Deterministic key for repeatable runs
     */
    static auto benchmark_key() -> result<encryption_key>;
};

/**
 * @brief Helper class for managing temporary benchmark files
 */
class temp_file_manager {
public:
    /**
     * @param base_dir Base directory for temporary files; a fresh temp dir when empty
     */
    explicit temp_file_manager(const std::filesystem::path& base_dir = {});

    /**
     * @brief Destructor - cleans up temporary files
     */
    ~temp_file_manager();

    // Non-copyable
    temp_file_manager(const temp_file_manager&) = delete;
    auto operator=(const temp_file_manager&) -> temp_file_manager& = delete;

    /**
     * @brief Create a temporary file with random data
     */
    auto create_random_file(const std::string& name, std::size_t size, uint32_t seed = 0)
        -> std::filesystem::path;

    [[nodiscard]] auto base_dir() const -> const std::filesystem::path&;

    /**
     * @brief Remove everything under the base directory
     */
    void cleanup();

private:
    std::filesystem::path base_dir_;
    bool owns_dir_ = false;
};

/**
 * @brief Size constants for benchmarks
 */
namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;

constexpr std::size_t small_file = 64 * KB;
constexpr std::size_t medium_file = 4 * MB;
constexpr std::size_t large_file = 32 * MB;
}  // namespace sizes

}  // namespace secure_drive::benchmark

#endif  // SECURE_DRIVE_BENCHMARKS_BENCHMARK_HELPERS_H
