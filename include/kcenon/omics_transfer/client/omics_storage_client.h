/**
 * @file omics_storage_client.h
 * @brief Remote omics storage API consumed by the transfer engine
 *
 * The engine does not speak HTTP. Applications provide an implementation
 * of omics_storage_client that maps these calls onto the remote service and
 * translates its failures into error codes:
 * - timeouts, resets and short reads map to the transient range (retried)
 * - not-found, access-denied, throttling and friends map to the remote range
 */

#ifndef KCENON_OMICS_TRANSFER_CLIENT_OMICS_STORAGE_CLIENT_H
#define KCENON_OMICS_TRANSFER_CLIENT_OMICS_STORAGE_CLIENT_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "kcenon/omics_transfer/core/omics_file_types.h"
#include "kcenon/omics_transfer/core/types.h"

namespace kcenon::omics_transfer {

/**
 * @brief Which source of a read set an uploaded part belongs to
 */
enum class part_source {
    source1,  ///< Primary reads
    source2,  ///< Paired reads
};

[[nodiscard]] constexpr auto to_string(part_source source) -> const char* {
    switch (source) {
        case part_source::source1: return "SOURCE1";
        case part_source::source2: return "SOURCE2";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Metadata of each file of a resource, keyed by lowercase file key
 */
using file_metadata_map = std::map<std::string, file_part_info, std::less<>>;

/**
 * @brief Arguments of a multipart read set upload session
 */
struct create_read_set_upload_request {
    std::string store_id;
    read_set_file_type source_file_type = read_set_file_type::fastq;
    std::string subject_id;
    std::string sample_id;
    std::string generated_from;
    std::string reference_arn;
    std::string name;
    std::string description;
    std::map<std::string, std::string> tags;
};

/**
 * @brief One part of a multipart read set upload
 */
struct upload_part_request {
    std::string store_id;
    std::string upload_id;
    part_source source = part_source::source1;
    uint64_t part_number = 1;
    std::vector<std::byte> payload;

    /// Lowercase hex SHA-256 of payload
    std::string payload_sha256;
};

/**
 * @brief Uploaded part as referenced by the completion call
 */
struct completed_part {
    part_source source = part_source::source1;
    uint64_t part_number = 1;
    std::string checksum;

    [[nodiscard]] auto operator==(const completed_part& other) const -> bool = default;
};

/**
 * @brief Body of one fetched part
 */
class part_stream {
public:
    virtual ~part_stream() = default;

    /**
     * @brief Read up to max_bytes
     * @return Bytes read; an empty vector marks the end of the part
     */
    [[nodiscard]] virtual auto read(std::size_t max_bytes) -> result<std::vector<std::byte>> = 0;
};

/**
 * @brief Remote omics storage operations
 *
 * @note Implementations must be thread-safe; the request pool calls them
 *       concurrently.
 */
class omics_storage_client {
public:
    virtual ~omics_storage_client() = default;

    /**
     * @brief Look up size and part layout of every file of a resource
     */
    [[nodiscard]] virtual auto get_file_metadata(const resource_ref& resource)
        -> result<file_metadata_map> = 0;

    /**
     * @brief Start fetching one part of one file
     * @param part_number 1-based part number
     */
    [[nodiscard]] virtual auto get_part(const resource_ref& resource,
                                        std::string_view file_key,
                                        uint64_t part_number)
        -> result<std::unique_ptr<part_stream>> = 0;

    /**
     * @brief Create a multipart upload session
     * @return Upload id
     */
    [[nodiscard]] virtual auto create_multipart_read_set_upload(
        const create_read_set_upload_request& request) -> result<std::string> = 0;

    /**
     * @brief Upload one part
     * @return Checksum the service assigned to the part
     */
    [[nodiscard]] virtual auto upload_read_set_part(const upload_part_request& request)
        -> result<std::string> = 0;

    /**
     * @brief Complete a session
     * @param parts Parts ordered by source, then part number
     * @return Id of the new read set
     */
    [[nodiscard]] virtual auto complete_multipart_read_set_upload(
        std::string_view store_id,
        std::string_view upload_id,
        const std::vector<completed_part>& parts) -> result<std::string> = 0;

    /**
     * @brief Abort a session and discard its parts
     */
    [[nodiscard]] virtual auto abort_multipart_read_set_upload(std::string_view store_id,
                                                               std::string_view upload_id)
        -> result<void> = 0;
};

}  // namespace kcenon::omics_transfer

#endif  // KCENON_OMICS_TRANSFER_CLIENT_OMICS_STORAGE_CLIENT_H
