/**
 * @file transfer_config.h
 * @brief Configuration for the omics transfer manager
 */

#ifndef KCENON_OMICS_TRANSFER_CORE_TRANSFER_CONFIG_H
#define KCENON_OMICS_TRANSFER_CORE_TRANSFER_CONFIG_H

#include <kcenon/omics_transfer/core/types.h>

#include <cstddef>
#include <filesystem>
#include <string>
#include <utility>

namespace kcenon::omics_transfer {

/**
 * @brief Configuration for the transfer manager and its pools
 */
struct transfer_config {
    static constexpr std::size_t kib = 1024;
    static constexpr std::size_t mib = 1024 * kib;

    /// Default io chunk size (256KB)
    static constexpr std::size_t default_io_chunksize = 256 * kib;

    /// Default multipart upload part size (100MB)
    static constexpr std::size_t default_multipart_chunksize = 100 * mib;

    /// Run every task on worker threads; false runs all work inline in the caller
    bool use_threads = true;

    /// Directory for downloads without an explicit destination
    std::filesystem::path directory = ".";

    /// Maximum concurrent remote API requests
    std::size_t max_request_concurrency = 10;

    /// Maximum threads processing manager calls
    std::size_t max_submission_concurrency = 5;

    /// Maximum remote API requests queued at a time
    std::size_t max_request_queue_size = 1000;

    /// Maximum manager calls queued at a time
    std::size_t max_submission_queue_size = 1000;

    /// Maximum chunks queued for writing
    std::size_t max_io_queue_size = 1000;

    /// Size of each chunk in the io queue
    std::size_t io_chunksize = default_io_chunksize;

    /// Attempts per part for transient streaming errors
    std::size_t num_download_attempts = 5;

    /// Target part size for multipart uploads, adjusted upward as needed
    std::size_t multipart_chunksize = default_multipart_chunksize;

    /// Upload parts from stream sources that may be held in memory at once
    std::size_t max_in_memory_upload_chunks = 10;

    /**
     * @brief Validate configuration
     * @return Success if every numeric field is greater than 0
     */
    [[nodiscard]] auto validate() const -> result<void> {
        const std::pair<const char*, std::size_t> fields[] = {
            {"max_request_concurrency", max_request_concurrency},
            {"max_submission_concurrency", max_submission_concurrency},
            {"max_request_queue_size", max_request_queue_size},
            {"max_submission_queue_size", max_submission_queue_size},
            {"max_io_queue_size", max_io_queue_size},
            {"io_chunksize", io_chunksize},
            {"num_download_attempts", num_download_attempts},
            {"multipart_chunksize", multipart_chunksize},
            {"max_in_memory_upload_chunks", max_in_memory_upload_chunks},
        };

        for (const auto& [name, value] : fields) {
            if (value == 0) {
                return unexpected(error{
                    error_code::invalid_configuration,
                    std::string("Provided parameter ") + name + " of value " +
                        std::to_string(value) + " must be greater than 0."});
            }
        }
        if (directory.empty()) {
            return unexpected(error{error_code::invalid_configuration,
                                    "directory must not be empty"});
        }
        return {};
    }
};

}  // namespace kcenon::omics_transfer

#endif  // KCENON_OMICS_TRANSFER_CORE_TRANSFER_CONFIG_H
