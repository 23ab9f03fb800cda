/**
 * @file chunksize_adjuster.h
 * @brief Part size selection for multipart uploads
 */

#ifndef KCENON_OMICS_TRANSFER_CORE_CHUNKSIZE_ADJUSTER_H
#define KCENON_OMICS_TRANSFER_CORE_CHUNKSIZE_ADJUSTER_H

#include <kcenon/omics_transfer/config/feature_flags.h>

#include <cstddef>
#include <cstdint>
#include <optional>

namespace kcenon::omics_transfer {

/**
 * @brief Adjusts the upload part size to the remote API limits
 *
 * The part size only grows: it starts at the requested size (raised to the
 * minimum), then doubles until the part count fits under the ceiling.
 */
class chunksize_adjuster {
public:
    /// Minimum part size (5MB)
    static constexpr uint64_t min_part_size = 5ULL * 1024 * 1024;

    /// Maximum part size (5GB)
    static constexpr uint64_t max_part_size = 5ULL * 1024 * 1024 * 1024;

    /// Maximum number of parts per upload
    static constexpr uint64_t default_max_parts = OMICS_TRANS_MAX_UPLOAD_PARTS;

    explicit chunksize_adjuster(uint64_t max_parts = default_max_parts,
                                uint64_t min_size = min_part_size,
                                uint64_t max_size = max_part_size);

    /**
     * @brief Compute the part size for an upload
     * @param requested Target part size
     * @param file_size Total size, if known
     * @return Adjusted part size
     */
    [[nodiscard]] auto adjust(uint64_t requested, std::optional<uint64_t> file_size) const
        -> uint64_t;

    /**
     * @brief Number of parts for a size, at least 1
     */
    [[nodiscard]] static auto part_count(uint64_t file_size, uint64_t part_size) -> uint64_t;

private:
    uint64_t max_parts_;
    uint64_t min_size_;
    uint64_t max_size_;
};

}  // namespace kcenon::omics_transfer

#endif  // KCENON_OMICS_TRANSFER_CORE_CHUNKSIZE_ADJUSTER_H
