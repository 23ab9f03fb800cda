/**
 * @file transfer_manager.h
 * @brief Public entry point for omics downloads and uploads
 */

#ifndef KCENON_OMICS_TRANSFER_CLIENT_TRANSFER_MANAGER_H
#define KCENON_OMICS_TRANSFER_CLIENT_TRANSFER_MANAGER_H

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "kcenon/omics_transfer/client/omics_storage_client.h"
#include "kcenon/omics_transfer/client/read_set_upload.h"
#include "kcenon/omics_transfer/core/omics_file_types.h"
#include "kcenon/omics_transfer/core/output_manager.h"
#include "kcenon/omics_transfer/core/transfer_config.h"
#include "kcenon/omics_transfer/core/transfer_coordinator.h"
#include "kcenon/omics_transfer/core/transfer_types.h"
#include "kcenon/omics_transfer/core/types.h"

namespace kcenon::omics_transfer {

/**
 * @brief Arguments of a single-file download
 */
struct download_request {
    resource_ref resource;

    /// File key, case-insensitive ("source1", "index", ...)
    std::string file_name;

    /// Defaults to <config.directory>/<store>_<resource>_<file>
    std::optional<download_destination> destination;

    subscriber_list subscribers;

    /// Skips the metadata lookup when set
    std::optional<file_part_info> file_metadata;
};

/**
 * @brief Runs omics transfers on three bounded pools
 *
 * Submission methods validate their arguments synchronously and return a
 * transfer_future; the work continues on the pools. With use_threads set
 * to false, every transfer runs to completion inside the submitting call.
 *
 * @code
 * auto manager = transfer_manager::builder()
 *     .with_client(client)
 *     .with_config(config)
 *     .build();
 *
 * auto outcome = manager.value().guarded([](transfer_manager& m) -> result<void> {
 *     auto future = m.download_read_set_file("store", "readset", read_set_file::source1);
 *     if (!future) {
 *         return unexpected(future.error());
 *     }
 *     auto path = future.value().result();
 *     ...
 * });
 * @endcode
 */
class transfer_manager {
public:
    /**
     * @brief Builder for transfer_manager
     */
    class builder {
    public:
        builder();

        /**
         * @brief Set the remote storage client (required)
         */
        auto with_client(std::shared_ptr<omics_storage_client> client) -> builder&;

        /**
         * @brief Set pool sizes, chunk sizes and attempt budget
         */
        auto with_config(transfer_config config) -> builder&;

        /**
         * @brief Build the manager and start its pools
         * @return The manager, or invalid_configuration
         */
        [[nodiscard]] auto build() -> result<transfer_manager>;

    private:
        std::shared_ptr<omics_storage_client> client_;
        transfer_config config_;
    };

    // Non-copyable, movable
    transfer_manager(const transfer_manager&) = delete;
    auto operator=(const transfer_manager&) -> transfer_manager& = delete;
    transfer_manager(transfer_manager&&) noexcept;
    auto operator=(transfer_manager&&) noexcept -> transfer_manager&;

    /**
     * @brief Shuts down without cancelling, waiting for in-flight transfers
     */
    ~transfer_manager();

    /**
     * @brief Download one file of a read set
     * @param destination Path or stream; defaults to the configured directory
     */
    [[nodiscard]] auto download_read_set_file(
        const std::string& store_id,
        const std::string& read_set_id,
        read_set_file file,
        std::optional<download_destination> destination = std::nullopt,
        subscriber_list subscribers = {},
        std::optional<file_part_info> file_metadata = std::nullopt) -> result<transfer_future>;

    /**
     * @brief Download one file of a reference
     * @param destination Path or stream; defaults to the configured directory
     */
    [[nodiscard]] auto download_reference_file(
        const std::string& store_id,
        const std::string& reference_id,
        reference_file file,
        std::optional<download_destination> destination = std::nullopt,
        subscriber_list subscribers = {},
        std::optional<file_part_info> file_metadata = std::nullopt) -> result<transfer_future>;

    /**
     * @brief Download one file of any resource
     *
     * Fails synchronously on an unknown file key or an unsupported
     * destination; nothing is queued in that case.
     */
    [[nodiscard]] auto download_file(download_request request) -> result<transfer_future>;

    /**
     * @brief Download every file of a read set into a directory
     * @param directory Created if missing; defaults to the configured directory
     * @param wait Block until every file finished; the first failure is returned
     */
    [[nodiscard]] auto download_read_set(const std::string& store_id,
                                         const std::string& read_set_id,
                                         std::optional<std::filesystem::path> directory = std::nullopt,
                                         subscriber_list subscribers = {},
                                         bool wait = true)
        -> result<std::vector<transfer_future>>;

    /**
     * @brief Download every file of a reference into a directory
     * @param directory Created if missing; defaults to the configured directory
     * @param wait Block until every file finished; the first failure is returned
     */
    [[nodiscard]] auto download_reference(const std::string& store_id,
                                          const std::string& reference_id,
                                          std::optional<std::filesystem::path> directory = std::nullopt,
                                          subscriber_list subscribers = {},
                                          bool wait = true)
        -> result<std::vector<transfer_future>>;

    /**
     * @brief Upload a read set through a multipart session
     *
     * The future's result is the id of the new read set.
     */
    [[nodiscard]] auto upload_read_set(read_set_upload_request request) -> result<transfer_future>;

    /**
     * @brief Cancel every in-flight transfer
     */
    void cancel_all(const std::string& message = {});

    /**
     * @brief Wait for in-flight transfers and stop the pools
     * @param cancel Cancel in-flight transfers first
     * @param cancel_message Message stored in the cancellation error
     * @return interrupted when request_interrupt() was called while waiting
     *
     * Pools stop in order: submission, request, io. Idempotent.
     */
    auto shutdown(bool cancel = false, const std::string& cancel_message = {}) -> result<void>;

    /**
     * @brief Ask a waiting shutdown to give up and cancel everything
     *
     * Only stores an atomic flag, so it may be called from a signal handler.
     */
    void request_interrupt() noexcept;

    /**
     * @brief Run a body and shut down afterwards
     *
     * On success the manager shuts down normally. When the body fails or
     * throws, in-flight transfers are cancelled (fatal_error, or cancelled
     * when the body was interrupted) and a fatal_error wrapping the
     * triggering error is returned.
     */
    auto guarded(const std::function<result<void>(transfer_manager&)>& body) -> result<void>;

    [[nodiscard]] auto config() const -> const transfer_config&;

    /**
     * @brief Number of transfers not yet done
     */
    [[nodiscard]] auto in_flight() const -> std::size_t;

private:
    transfer_manager(std::shared_ptr<omics_storage_client> client, transfer_config config);

    auto download_resource(const resource_ref& resource,
                           std::optional<std::filesystem::path> directory,
                           subscriber_list subscribers,
                           bool wait) -> result<std::vector<transfer_future>>;

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::omics_transfer

#endif  // KCENON_OMICS_TRANSFER_CLIENT_TRANSFER_MANAGER_H
