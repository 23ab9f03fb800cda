/**
 * @file checksum.h
 * @brief Payload digests for upload integrity
 */

#ifndef KCENON_OMICS_TRANSFER_CORE_CHECKSUM_H
#define KCENON_OMICS_TRANSFER_CORE_CHECKSUM_H

#include <kcenon/omics_transfer/core/types.h>

#include <cstddef>
#include <span>
#include <string>

namespace kcenon::omics_transfer {

/**
 * @brief SHA-256 helpers backed by OpenSSL
 *
 * Upload parts carry the hex SHA-256 of their payload so the remote side
 * can reject a body corrupted in flight.
 */
class checksum {
public:
    /**
     * @brief Calculate SHA-256 hash of data
     * @param data Input data span
     * @return Lowercase hex digest, or error if the digest could not be computed
     */
    [[nodiscard]] static auto sha256(std::span<const std::byte> data) -> result<std::string>;

    /**
     * @brief Verify SHA-256 hash of data
     * @param data Input data span
     * @param expected Expected lowercase hex digest
     * @return true if hash matches, false otherwise
     */
    [[nodiscard]] static auto verify_sha256(
        std::span<const std::byte> data, const std::string& expected) -> bool;
};

}  // namespace kcenon::omics_transfer

#endif  // KCENON_OMICS_TRANSFER_CORE_CHECKSUM_H
