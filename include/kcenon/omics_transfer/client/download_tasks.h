/**
 * @file download_tasks.h
 * @brief Tasks that fan out a file download and fetch its parts
 */

#ifndef KCENON_OMICS_TRANSFER_CLIENT_DOWNLOAD_TASKS_H
#define KCENON_OMICS_TRANSFER_CLIENT_DOWNLOAD_TASKS_H

#include "kcenon/omics_transfer/client/omics_storage_client.h"
#include "kcenon/omics_transfer/core/bounded_executor.h"
#include "kcenon/omics_transfer/core/output_manager.h"
#include "kcenon/omics_transfer/core/transfer_config.h"
#include "kcenon/omics_transfer/core/transfer_coordinator.h"
#include "kcenon/omics_transfer/core/transfer_task.h"
#include "kcenon/omics_transfer/core/types.h"

#include <cstdint>
#include <functional>
#include <memory>

namespace kcenon::omics_transfer {

/**
 * @brief Collaborators shared by the tasks of one download
 *
 * The executors are owned by the transfer manager, which outlives every
 * task it submits.
 */
struct download_context {
    std::shared_ptr<omics_storage_client> client;
    transfer_config config;
    bounded_executor* request_executor = nullptr;
    bounded_executor* io_executor = nullptr;
};

/**
 * @brief Check that a part layout is self-consistent
 *
 * total_parts must be max(1, ceil(content_length / part_size)). An empty
 * file may report zero parts.
 */
[[nodiscard]] auto validate_file_part_info(const file_part_info& info) -> result<void>;

/**
 * @brief Select one file from a metadata lookup
 * @return file_not_found when the key is absent
 */
[[nodiscard]] auto find_file_part_info(const file_metadata_map& files,
                                       std::string_view file_key,
                                       std::string_view store_id) -> result<file_part_info>;

/**
 * @brief Split a file into part descriptors
 */
[[nodiscard]] auto make_part_descriptors(const file_part_info& info, std::size_t max_attempts)
    -> std::vector<part_descriptor>;

/**
 * @brief Fans one download out into part tasks
 *
 * Resolves the file layout (skipping the lookup when the request carries
 * it), opens the destination, queues one get_part_task per part on the
 * request pool and, once every part finished, one final task on the io pool.
 */
class download_submission_task : public submission_task {
public:
    download_submission_task(transfer_future future,
                             download_context context,
                             std::shared_ptr<output_manager> output);

protected:
    auto submit() -> result<void> override;

private:
    auto resolve_file_part_info() -> result<file_part_info>;

    download_context context_;
    std::shared_ptr<output_manager> output_;
};

/**
 * @brief Fetches one part and streams it to the destination
 *
 * Transient errors restart the part from its first byte, up to the
 * attempt budget, after withdrawing the progress already reported for
 * bytes handed to the destination.
 */
class get_part_task : public transfer_task {
public:
    get_part_task(transfer_future future,
                  download_context context,
                  std::shared_ptr<output_manager> output,
                  part_descriptor part,
                  std::vector<std::function<void()>> done_callbacks = {});

    [[nodiscard]] auto part() const -> const part_descriptor& { return part_; }

protected:
    auto execute() -> result<void> override;

private:
    /**
     * @brief One attempt; current advances as chunks are queued
     */
    auto attempt(uint64_t& current) -> result<void>;

    transfer_future future_;
    download_context context_;
    std::shared_ptr<output_manager> output_;
    part_descriptor part_;
};

}  // namespace kcenon::omics_transfer

#endif  // KCENON_OMICS_TRANSFER_CLIENT_DOWNLOAD_TASKS_H
