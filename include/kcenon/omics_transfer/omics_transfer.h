/**
 * @file omics_transfer.h
 * @brief Main header for the omics_transfer library
 * @version 0.1.0
 *
 * Include this header to access the transfer manager, its futures and
 * subscribers, and the storage client contract.
 *
 * @code
 * #include <kcenon/omics_transfer/omics_transfer.h>
 *
 * using namespace kcenon::omics_transfer;
 *
 * auto manager = transfer_manager::builder()
 *     .with_client(std::make_shared<my_storage_client>())
 *     .build();
 *
 * auto future = manager.value().download_read_set_file(
 *     "1234567890", "0987654321", read_set_file::source1);
 * auto path = future.value().result();
 * @endcode
 */

#ifndef KCENON_OMICS_TRANSFER_OMICS_TRANSFER_H
#define KCENON_OMICS_TRANSFER_OMICS_TRANSFER_H

#include <string>

// Core types
#include "kcenon/omics_transfer/core/types.h"
#include "kcenon/omics_transfer/core/omics_file_types.h"
#include "kcenon/omics_transfer/core/transfer_config.h"
#include "kcenon/omics_transfer/core/transfer_types.h"
#include "kcenon/omics_transfer/core/transfer_coordinator.h"
#include "kcenon/omics_transfer/core/output_manager.h"
#include "kcenon/omics_transfer/core/logging.h"

// Client
#include "kcenon/omics_transfer/client/omics_storage_client.h"
#include "kcenon/omics_transfer/client/read_set_upload.h"
#include "kcenon/omics_transfer/client/transfer_manager.h"

namespace kcenon::omics_transfer {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::omics_transfer

#endif  // KCENON_OMICS_TRANSFER_OMICS_TRANSFER_H
