/**
 * @file chunksize_adjuster.cpp
 * @brief Implementation of upload part size selection
 */

#include <kcenon/omics_transfer/core/chunksize_adjuster.h>

#include <kcenon/omics_transfer/core/logging.h>

#include <algorithm>
#include <string>

namespace kcenon::omics_transfer {

chunksize_adjuster::chunksize_adjuster(uint64_t max_parts, uint64_t min_size, uint64_t max_size)
    : max_parts_(std::max<uint64_t>(max_parts, 1)),
      min_size_(std::max<uint64_t>(min_size, 1)),
      max_size_(std::max(max_size, min_size)) {}

auto chunksize_adjuster::adjust(uint64_t requested, std::optional<uint64_t> file_size) const
    -> uint64_t {
    uint64_t part_size = std::clamp(requested, min_size_, max_size_);

    if (file_size) {
        while (part_size < max_size_ && part_count(*file_size, part_size) > max_parts_) {
            part_size = std::min(part_size * 2, max_size_);
        }
    }

    if (part_size != requested) {
        OT_LOG_DEBUG(log_category::upload,
                     "Part size adjusted from " + std::to_string(requested) + " to " +
                         std::to_string(part_size));
    }
    return part_size;
}

auto chunksize_adjuster::part_count(uint64_t file_size, uint64_t part_size) -> uint64_t {
    if (file_size == 0 || part_size == 0) return 1;
    return (file_size + part_size - 1) / part_size;
}

}  // namespace kcenon::omics_transfer
