/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef KCENON_OMICS_TRANSFER_BENCHMARKS_BENCHMARK_HELPERS_H
#define KCENON_OMICS_TRANSFER_BENCHMARKS_BENCHMARK_HELPERS_H

#include <kcenon/omics_transfer/client/omics_storage_client.h>

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <map>
#include <mutex>
#include <random>
#include <string>
#include <vector>

namespace kcenon::omics_transfer::benchmark {

/**
 * @brief Helper class for generating test data for benchmarks
 */
class test_data_generator {
public:
    /**
     * @brief Generate random binary data
     * @param size Size in bytes
     * @param seed Random seed (0 for random)
     */
    static auto generate_random_data(std::size_t size, uint32_t seed = 0)
        -> std::vector<std::byte>;

    /**
     * @brief Generate FASTQ records until size bytes are produced
     * @param size Size in bytes; the last record is truncated
     * @param read_length Bases per read
     * @param seed Random seed (0 for random)
     */
    static auto generate_fastq_data(std::size_t size, std::size_t read_length = 150,
                                    uint32_t seed = 0) -> std::vector<std::byte>;
};

/**
 * @brief Scratch directory removed on destruction
 */
class scratch_directory {
public:
    explicit scratch_directory(const std::string& name);
    ~scratch_directory();

    scratch_directory(const scratch_directory&) = delete;
    auto operator=(const scratch_directory&) -> scratch_directory& = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

    /**
     * @brief Remove every entry, keeping the directory
     */
    void clear();

private:
    std::filesystem::path path_;
};

/**
 * @brief Storage client serving files from memory without delays or faults
 *
 * Uploaded parts are checksummed by the engine and discarded here.
 */
class memory_storage_client : public omics_storage_client {
public:
    void add_file(const resource_ref& resource,
                  const std::string& file_key,
                  std::vector<std::byte> content,
                  uint64_t part_size);

    auto get_file_metadata(const resource_ref& resource) -> result<file_metadata_map> override;

    auto get_part(const resource_ref& resource, std::string_view file_key, uint64_t part_number)
        -> result<std::unique_ptr<part_stream>> override;

    auto create_multipart_read_set_upload(const create_read_set_upload_request& request)
        -> result<std::string> override;

    auto upload_read_set_part(const upload_part_request& request)
        -> result<std::string> override;

    auto complete_multipart_read_set_upload(std::string_view store_id,
                                            std::string_view upload_id,
                                            const std::vector<completed_part>& parts)
        -> result<std::string> override;

    auto abort_multipart_read_set_upload(std::string_view store_id, std::string_view upload_id)
        -> result<void> override;

private:
    struct file_entry {
        file_part_info info;
        std::vector<std::byte> content;
    };

    static auto key_of(const resource_ref& resource) -> std::string;

    mutable std::mutex mutex_;
    std::map<std::string, std::map<std::string, file_entry, std::less<>>> files_;
    std::atomic<uint64_t> next_upload_{1};
};

/**
 * @brief Size constants for benchmarks
 */
namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;
constexpr std::size_t GB = 1024 * MB;

constexpr std::size_t small_file = 1 * MB;
constexpr std::size_t medium_file = 32 * MB;
constexpr std::size_t large_file = 256 * MB;

// Remote part sizes
constexpr std::size_t small_part = 1 * MB;
constexpr std::size_t default_part = 8 * MB;

// Upload part sizes
constexpr std::size_t min_upload_part = 5 * MB;
}  // namespace sizes

}  // namespace kcenon::omics_transfer::benchmark

#endif  // KCENON_OMICS_TRANSFER_BENCHMARKS_BENCHMARK_HELPERS_H
