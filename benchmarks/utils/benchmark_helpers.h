/**
 * @file benchmark_helpers.h
 * @brief Data and temporary file helpers for benchmarks
 */

#ifndef KCENON_BLOB_BENCHMARKS_BENCHMARK_HELPERS_H
#define KCENON_BLOB_BENCHMARKS_BENCHMARK_HELPERS_H

#include <kcenon/blob/core/chunk_source.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <random>
#include <string>
#include <vector>

namespace kcenon::blob::benchmark {

/**
 * @brief Generate random binary data
 * @param size Size in bytes
 * @param seed Random seed (0 for random)
 */
auto generate_random_data(std::size_t size, uint32_t seed = 0) -> byte_buffer;

/**
 * @brief Temporary files removed on destruction
 */
class temp_file_manager {
public:
    explicit temp_file_manager(const std::filesystem::path& base_dir = {});
    ~temp_file_manager();

    temp_file_manager(const temp_file_manager&) = delete;
    auto operator=(const temp_file_manager&) -> temp_file_manager& = delete;

    auto create_file(const std::string& name, const byte_buffer& data)
        -> std::filesystem::path;

    auto create_random_file(const std::string& name, std::size_t size, uint32_t seed = 0)
        -> std::filesystem::path;

    void cleanup();

private:
    std::filesystem::path base_dir_;
    std::vector<std::filesystem::path> created_files_;
    bool owns_dir_ = false;
};

namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;

constexpr std::size_t small_body = 64 * KB;
constexpr std::size_t medium_body = 16 * MB;
constexpr std::size_t large_body = 64 * MB;
}  // namespace sizes

}  // namespace kcenon::blob::benchmark

#endif  // KCENON_BLOB_BENCHMARKS_BENCHMARK_HELPERS_H
