/**
 * @file transfer_types.h
 * @brief Transfer request and subscriber types for omics_transfer
 *
 * This file defines the immutable description of a transfer and the
 * subscriber interface that receives its lifecycle events.
 */

#ifndef KCENON_OMICS_TRANSFER_CORE_TRANSFER_TYPES_H
#define KCENON_OMICS_TRANSFER_CORE_TRANSFER_TYPES_H

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "omics_file_types.h"
#include "types.h"

namespace kcenon::omics_transfer {

class transfer_future;

/**
 * @brief Transfer direction
 */
enum class transfer_direction {
    download,  // Remote -> local
    upload,    // Local -> remote
};

[[nodiscard]] constexpr auto to_string(transfer_direction dir) noexcept
    -> std::string_view {
    switch (dir) {
        case transfer_direction::download:
            return "download";
        case transfer_direction::upload:
            return "upload";
        default:
            return "unknown";
    }
}

/**
 * @brief Receives transfer lifecycle events
 *
 * All methods have empty defaults; override the ones of interest.
 * Callbacks run on pool worker threads and must be thread-safe.
 */
class transfer_subscriber {
public:
    virtual ~transfer_subscriber() = default;

    /**
     * @brief Called once when the submission task starts processing
     */
    virtual void on_queued([[maybe_unused]] const transfer_future& future) {}

    /**
     * @brief Called as bytes are transferred
     * @param bytes Bytes since the last call; negative when a retried part
     *              discards bytes already reported
     */
    virtual void on_progress([[maybe_unused]] const transfer_future& future,
                             [[maybe_unused]] int64_t bytes) {}

    /**
     * @brief Called once after the transfer is done, successful or not
     */
    virtual void on_done([[maybe_unused]] const transfer_future& future) {}
};

using subscriber_list = std::vector<std::shared_ptr<transfer_subscriber>>;

/**
 * @brief Immutable description of one logical transfer
 */
struct transfer_request {
    transfer_direction direction = transfer_direction::download;

    /// Store and resource; for uploads the resource id is empty until completion
    resource_ref resource;

    /// Lowercase file key, e.g. "source1" or "index"
    std::string file_name;

    subscriber_list subscribers;

    /// Precomputed layout; when set, no metadata lookup is made
    std::optional<file_part_info> file_metadata;
};

}  // namespace kcenon::omics_transfer

#endif  // KCENON_OMICS_TRANSFER_CORE_TRANSFER_TYPES_H
