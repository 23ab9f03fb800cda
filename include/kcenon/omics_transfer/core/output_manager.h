/**
 * @file output_manager.h
 * @brief Download destinations: named file, seekable stream, non-seekable stream
 *
 * One output_manager is selected per download when the download is
 * submitted. Every write it performs runs on the single io worker, so the
 * strategies themselves need no locking around the destination handle.
 */

#ifndef KCENON_OMICS_TRANSFER_CORE_OUTPUT_MANAGER_H
#define KCENON_OMICS_TRANSFER_CORE_OUTPUT_MANAGER_H

#include "kcenon/omics_transfer/core/bounded_executor.h"
#include "kcenon/omics_transfer/core/transfer_coordinator.h"
#include "kcenon/omics_transfer/core/transfer_task.h"
#include "kcenon/omics_transfer/core/types.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace kcenon::omics_transfer {

/**
 * @brief Where a download is written
 *
 * A path selects the named-file strategy; a stream is checked for seeking.
 */
using download_destination = std::variant<std::filesystem::path, std::shared_ptr<std::ostream>>;

/**
 * @brief Destination strategy
 */
enum class output_kind {
    named_file,
    seekable_stream,
    non_seekable_stream,
};

[[nodiscard]] constexpr auto to_string(output_kind kind) -> const char* {
    switch (kind) {
        case output_kind::named_file: return "named_file";
        case output_kind::seekable_stream: return "seekable_stream";
        case output_kind::non_seekable_stream: return "non_seekable_stream";
        default: return "unknown";
    }
}

/**
 * @brief Releases out-of-order chunks in strict offset order
 *
 * Chunks that overlap data already released are trimmed; chunks fully
 * covered by released data are dropped. This absorbs the bytes a retried
 * part sends a second time.
 */
class defer_queue {
public:
    struct pending_write {
        uint64_t offset;
        std::vector<std::byte> data;
    };

    /**
     * @brief Offer a chunk
     * @return Chunks that can now be written, in order
     */
    [[nodiscard]] auto request_writes(uint64_t offset, std::vector<std::byte> data)
        -> std::vector<pending_write>;

    [[nodiscard]] auto next_offset() const -> uint64_t { return next_offset_; }
    [[nodiscard]] auto pending_count() const -> std::size_t { return pending_.size(); }

private:
    uint64_t next_offset_ = 0;
    std::map<uint64_t, std::vector<std::byte>> pending_;
};

/**
 * @brief Check the gzip magic bytes of a file
 * @return false for files shorter than two bytes or unreadable files
 */
[[nodiscard]] auto is_gzip_file(const std::filesystem::path& path) -> bool;

/**
 * @brief Destination handle shared by every task of one download
 */
class output_manager : public std::enable_shared_from_this<output_manager> {
public:
    struct named_file_output {
        std::filesystem::path final_path;
        std::filesystem::path temp_path;
        std::unique_ptr<std::ofstream> file;
    };

    struct seekable_stream_output {
        std::shared_ptr<std::ostream> stream;
        std::streamoff base_offset = 0;
    };

    struct non_seekable_stream_output {
        std::shared_ptr<std::ostream> stream;
        defer_queue queue;
    };

    using strategy = std::variant<named_file_output, seekable_stream_output, non_seekable_stream_output>;

    explicit output_manager(strategy selected);

    /**
     * @brief Pick the strategy for a destination
     *
     * Checks in order: named file, seekable stream, non-seekable stream.
     * @return unsupported_output for an empty path, a null stream or a
     *         stream in a failed state
     */
    [[nodiscard]] static auto select(download_destination destination)
        -> result<std::shared_ptr<output_manager>>;

    [[nodiscard]] auto kind() const -> output_kind;

    /**
     * @brief Final file name before gzip detection; empty for streams
     */
    [[nodiscard]] auto final_path() const -> std::filesystem::path;

    /**
     * @brief Temporary file name once opened; empty for streams
     */
    [[nodiscard]] auto temp_path() const -> std::filesystem::path;

    /**
     * @brief Prepare the destination for writes
     *
     * The named-file strategy creates its temporary file and registers
     * failure cleanups that close and remove it.
     */
    [[nodiscard]] auto open(transfer_coordinator& coordinator) -> result<void>;

    /**
     * @brief Queue a chunk for writing on the io pool
     */
    [[nodiscard]] auto queue_write(const std::shared_ptr<transfer_coordinator>& coordinator,
                                   bounded_executor& io_executor,
                                   uint64_t offset,
                                   std::vector<std::byte> data) -> result<void>;

    /**
     * @brief Build the task that completes the destination after all parts
     * @param content_length Expected size of the finished file
     */
    [[nodiscard]] auto make_final_task(std::shared_ptr<transfer_coordinator> coordinator,
                                       uint64_t content_length)
        -> std::shared_ptr<transfer_task>;

    /**
     * @brief Write a chunk at its absolute offset (io worker only)
     */
    [[nodiscard]] auto write(uint64_t offset, std::span<const std::byte> data) -> result<void>;

    /**
     * @brief Complete the destination (io worker only)
     * @return Final path for files, empty for streams
     */
    [[nodiscard]] auto finalize(uint64_t content_length) -> result<std::string>;

    /**
     * @brief Finalize and record the outcome on the coordinator (io worker only)
     *
     * When the transfer ended while the file was being renamed, the renamed
     * file is removed again so no final name outlives a cancelled transfer.
     */
    [[nodiscard]] auto commit(transfer_coordinator& coordinator, uint64_t content_length)
        -> result<void>;

private:
    void discard_temp_file();

    strategy strategy_;

    // Serializes handing non-seekable writes to the io pool so they reach it in order
    std::mutex io_submit_mutex_;
};

}  // namespace kcenon::omics_transfer

#endif  // KCENON_OMICS_TRANSFER_CORE_OUTPUT_MANAGER_H
