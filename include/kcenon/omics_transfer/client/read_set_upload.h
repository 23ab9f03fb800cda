/**
 * @file read_set_upload.h
 * @brief Multipart read set upload: create, upload parts, complete or abort
 *
 * The pipeline runs as one transfer:
 * 1. create_upload_task allocates the remote session and registers an
 *    abort as failure cleanup.
 * 2. upload_part_task uploads one part of source1 or source2 once the
 *    session exists.
 * 3. complete_upload_task waits for every part and completes the session;
 *    it is the final task of the transfer.
 */

#ifndef KCENON_OMICS_TRANSFER_CLIENT_READ_SET_UPLOAD_H
#define KCENON_OMICS_TRANSFER_CLIENT_READ_SET_UPLOAD_H

#include "kcenon/omics_transfer/client/omics_storage_client.h"
#include "kcenon/omics_transfer/core/bounded_executor.h"
#include "kcenon/omics_transfer/core/chunksize_adjuster.h"
#include "kcenon/omics_transfer/core/omics_file_types.h"
#include "kcenon/omics_transfer/core/transfer_config.h"
#include "kcenon/omics_transfer/core/transfer_coordinator.h"
#include "kcenon/omics_transfer/core/transfer_task.h"
#include "kcenon/omics_transfer/core/transfer_types.h"
#include "kcenon/omics_transfer/core/types.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <future>
#include <istream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace kcenon::omics_transfer {

/**
 * @brief Data to upload: a file path or an input stream
 *
 * Paths are read part by part inside the part tasks. Streams are read on
 * the submission thread, so each of their parts is held in memory until
 * uploaded.
 */
using upload_source = std::variant<std::filesystem::path, std::shared_ptr<std::istream>>;

/**
 * @brief Arguments of a read set upload
 */
struct read_set_upload_request {
    std::string store_id;
    read_set_file_type file_type = read_set_file_type::fastq;
    std::string subject_id;
    std::string sample_id;
    std::string generated_from;

    /// Required unless file_type is FASTQ or UBAM
    std::string reference_arn;

    std::string name;
    std::string description;
    std::map<std::string, std::string> tags;

    upload_source source1;

    /// Paired reads
    std::optional<upload_source> source2;

    subscriber_list subscribers;
};

/**
 * @brief Check an upload request before anything is queued
 */
[[nodiscard]] auto validate_upload_request(const read_set_upload_request& request)
    -> result<void>;

/**
 * @brief Session arguments derived from an upload request
 */
[[nodiscard]] auto make_create_request(const read_set_upload_request& request)
    -> create_read_set_upload_request;

/**
 * @brief State shared by the tasks of one upload
 */
class upload_session {
public:
    explicit upload_session(std::string store_id);

    [[nodiscard]] auto store_id() const -> const std::string& { return store_id_; }

    void set_upload_id(std::string upload_id);
    [[nodiscard]] auto upload_id() const -> std::optional<std::string>;

    void add_completed_part(completed_part part);

    /**
     * @brief Uploaded parts ordered by source, then part number
     */
    [[nodiscard]] auto completed_parts() const -> std::vector<completed_part>;

private:
    const std::string store_id_;
    mutable std::mutex mutex_;
    std::optional<std::string> upload_id_;
    std::vector<completed_part> parts_;
};

/**
 * @brief Collaborators shared by the tasks of one upload
 */
struct upload_context {
    std::shared_ptr<omics_storage_client> client;
    transfer_config config;
    bounded_executor* request_executor = nullptr;
};

/**
 * @brief Creates the remote multipart session
 */
class create_upload_task : public transfer_task {
public:
    create_upload_task(std::shared_ptr<transfer_coordinator> coordinator,
                       std::shared_ptr<omics_storage_client> client,
                       create_read_set_upload_request request,
                       std::shared_ptr<upload_session> session);

protected:
    auto execute() -> result<void> override;

private:
    std::shared_ptr<omics_storage_client> client_;
    create_read_set_upload_request request_;
    std::shared_ptr<upload_session> session_;
};

/**
 * @brief Uploads one part once the session exists
 */
class upload_part_task : public transfer_task {
public:
    /// Byte range of a file, read when the task runs
    struct file_range {
        std::filesystem::path path;
        uint64_t offset = 0;
        uint64_t size = 0;
    };

    using part_body = std::variant<file_range, std::vector<std::byte>>;

    upload_part_task(transfer_future future,
                     std::shared_ptr<omics_storage_client> client,
                     std::shared_ptr<upload_session> session,
                     std::shared_future<void> created,
                     part_source source,
                     uint64_t part_number,
                     part_body body);

protected:
    void wait_for_dependencies() override;
    auto execute() -> result<void> override;

private:
    auto load_payload() -> result<std::vector<std::byte>>;

    transfer_future future_;
    std::shared_ptr<omics_storage_client> client_;
    std::shared_ptr<upload_session> session_;
    std::shared_future<void> created_;
    part_source source_;
    uint64_t part_number_;
    part_body body_;
};

/**
 * @brief Completes the session after every part was uploaded
 */
class complete_upload_task : public transfer_task {
public:
    complete_upload_task(std::shared_ptr<transfer_coordinator> coordinator,
                         std::shared_ptr<omics_storage_client> client,
                         std::shared_ptr<upload_session> session,
                         std::vector<std::shared_future<void>> pending);

protected:
    void wait_for_dependencies() override;
    auto execute() -> result<void> override;

private:
    std::shared_ptr<omics_storage_client> client_;
    std::shared_ptr<upload_session> session_;
    std::vector<std::shared_future<void>> pending_;
};

/**
 * @brief Queues create, part and complete tasks of one upload
 */
class read_set_upload_submission_task : public submission_task {
public:
    read_set_upload_submission_task(transfer_future future,
                                    upload_context context,
                                    read_set_upload_request request);

protected:
    auto submit() -> result<void> override;

private:
    /**
     * @brief Queue the part tasks of one source
     * @return Futures of the queued tasks
     */
    auto submit_source(const upload_source& source,
                       part_source tag,
                       const std::shared_future<void>& created)
        -> result<std::vector<std::shared_future<void>>>;

    auto submit_part(part_source tag,
                     uint64_t part_number,
                     upload_part_task::part_body body,
                     const std::shared_future<void>& created,
                     std::string_view pool_tag) -> result<std::shared_future<void>>;

    upload_context context_;
    read_set_upload_request request_;
    std::shared_ptr<upload_session> session_;
    chunksize_adjuster adjuster_;

    // Unset once a source of unknown size is seen
    std::optional<uint64_t> total_size_{0};
};

}  // namespace kcenon::omics_transfer

#endif  // KCENON_OMICS_TRANSFER_CLIENT_READ_SET_UPLOAD_H
