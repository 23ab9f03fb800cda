/**
 * @file read_set_upload.cpp
 * @brief Implementation of the multipart read set upload pipeline
 */

#include "kcenon/omics_transfer/client/read_set_upload.h"

#include "kcenon/omics_transfer/core/checksum.h"
#include "kcenon/omics_transfer/core/logging.h"

#include <algorithm>
#include <fstream>

namespace kcenon::omics_transfer {

namespace {

auto source_size(const std::shared_ptr<std::istream>& stream) -> std::optional<uint64_t> {
    auto start = stream->tellg();
    if (start == std::istream::pos_type(-1)) {
        stream->clear();
        return std::nullopt;
    }
    stream->seekg(0, std::ios::end);
    auto end = stream->tellg();
    stream->seekg(start);
    if (!*stream || end == std::istream::pos_type(-1)) {
        stream->clear();
        stream->seekg(start);
        return std::nullopt;
    }
    auto length = static_cast<std::streamoff>(end) - static_cast<std::streamoff>(start);
    return static_cast<uint64_t>(std::max<std::streamoff>(length, 0));
}

}  // namespace

auto validate_upload_request(const read_set_upload_request& request) -> result<void> {
    if (request.store_id.empty()) {
        return unexpected(error{error_code::invalid_argument, "store_id must not be empty"});
    }
    if (request.reference_arn.empty() && !is_unlinked_file_type(request.file_type)) {
        return unexpected(error{error_code::missing_reference_arn,
                                std::string("Read sets of type ") + to_string(request.file_type) +
                                    " must specify a reference ARN"});
    }

    auto check_source = [](const upload_source& source, const char* name) -> result<void> {
        if (const auto* path = std::get_if<std::filesystem::path>(&source)) {
            std::error_code ec;
            if (path->empty() || !std::filesystem::is_regular_file(*path, ec)) {
                return unexpected(error{error_code::file_not_found,
                                        std::string(name) + " file not found: " + path->string()});
            }
            return {};
        }
        const auto& stream = std::get<std::shared_ptr<std::istream>>(source);
        if (!stream || !stream->good()) {
            return unexpected(error{error_code::invalid_argument,
                                    std::string(name) + " stream is not readable"});
        }
        return {};
    };

    if (auto checked = check_source(request.source1, "source1"); !checked) {
        return checked;
    }
    if (request.source2) {
        return check_source(*request.source2, "source2");
    }
    return {};
}

auto make_create_request(const read_set_upload_request& request)
    -> create_read_set_upload_request {
    create_read_set_upload_request create;
    create.store_id = request.store_id;
    create.source_file_type = request.file_type;
    create.subject_id = request.subject_id;
    create.sample_id = request.sample_id;
    create.generated_from = request.generated_from;
    create.reference_arn = request.reference_arn;
    create.name = request.name;
    create.description = request.description;
    create.tags = request.tags;
    return create;
}

// ============================================================================
// upload_session
// ============================================================================

upload_session::upload_session(std::string store_id) : store_id_(std::move(store_id)) {}

void upload_session::set_upload_id(std::string upload_id) {
    std::lock_guard lock(mutex_);
    upload_id_ = std::move(upload_id);
}

auto upload_session::upload_id() const -> std::optional<std::string> {
    std::lock_guard lock(mutex_);
    return upload_id_;
}

void upload_session::add_completed_part(completed_part part) {
    std::lock_guard lock(mutex_);
    parts_.push_back(std::move(part));
}

auto upload_session::completed_parts() const -> std::vector<completed_part> {
    std::vector<completed_part> parts;
    {
        std::lock_guard lock(mutex_);
        parts = parts_;
    }
    std::sort(parts.begin(), parts.end(), [](const completed_part& a, const completed_part& b) {
        if (a.source != b.source) {
            return a.source < b.source;
        }
        return a.part_number < b.part_number;
    });
    return parts;
}

// ============================================================================
// create_upload_task
// ============================================================================

create_upload_task::create_upload_task(std::shared_ptr<transfer_coordinator> coordinator,
                                       std::shared_ptr<omics_storage_client> client,
                                       create_read_set_upload_request request,
                                       std::shared_ptr<upload_session> session)
    : transfer_task(std::move(coordinator)),
      client_(std::move(client)),
      request_(std::move(request)),
      session_(std::move(session)) {}

auto create_upload_task::execute() -> result<void> {
    auto created = client_->create_multipart_read_set_upload(request_);
    if (!created) {
        return unexpected(created.error());
    }

    const auto upload_id = created.value();
    session_->set_upload_id(upload_id);

    auto client = client_;
    auto store_id = request_.store_id;
    coordinator_->add_failure_cleanup([client, store_id, upload_id] {
        auto aborted = client->abort_multipart_read_set_upload(store_id, upload_id);
        if (!aborted) {
            OT_LOG_WARN(log_category::upload, "Failed to abort upload " + upload_id + ": " +
                                                  aborted.error().message);
            return;
        }
        OT_LOG_INFO(log_category::upload, "Aborted upload " + upload_id);
    });

    OT_LOG_DEBUG(log_category::upload,
                 "Created upload " + upload_id + " in store " + request_.store_id);
    return {};
}

// ============================================================================
// upload_part_task
// ============================================================================

upload_part_task::upload_part_task(transfer_future future,
                                   std::shared_ptr<omics_storage_client> client,
                                   std::shared_ptr<upload_session> session,
                                   std::shared_future<void> created,
                                   part_source source,
                                   uint64_t part_number,
                                   part_body body)
    : transfer_task(future.coordinator()),
      future_(std::move(future)),
      client_(std::move(client)),
      session_(std::move(session)),
      created_(std::move(created)),
      source_(source),
      part_number_(part_number),
      body_(std::move(body)) {}

void upload_part_task::wait_for_dependencies() {
    created_.wait();
}

auto upload_part_task::load_payload() -> result<std::vector<std::byte>> {
    if (auto* buffer = std::get_if<std::vector<std::byte>>(&body_)) {
        return std::move(*buffer);
    }

    const auto& range = std::get<file_range>(body_);
    std::vector<std::byte> payload(range.size);
    if (range.size == 0) {
        return payload;
    }

    std::ifstream file(range.path, std::ios::binary);
    if (!file) {
        return unexpected(error{error_code::file_open_error,
                                "Failed to open " + range.path.string()});
    }
    file.seekg(static_cast<std::streamoff>(range.offset));
    file.read(reinterpret_cast<char*>(payload.data()), static_cast<std::streamsize>(range.size));
    if (static_cast<uint64_t>(file.gcount()) != range.size) {
        return unexpected(error{error_code::file_read_error,
                                "Short read from " + range.path.string() + " at offset " +
                                    std::to_string(range.offset)});
    }
    return payload;
}

auto upload_part_task::execute() -> result<void> {
    auto upload_id = session_->upload_id();
    if (!upload_id) {
        return unexpected(error{error_code::internal_error, "Upload session was not created"});
    }

    auto payload = load_payload();
    if (!payload) {
        return unexpected(payload.error());
    }

    auto digest = checksum::sha256(payload.value());
    if (!digest) {
        return unexpected(digest.error());
    }

    upload_part_request request;
    request.store_id = session_->store_id();
    request.upload_id = *upload_id;
    request.source = source_;
    request.part_number = part_number_;
    request.payload = std::move(payload.value());
    request.payload_sha256 = std::move(digest.value());

    auto uploaded = client_->upload_read_set_part(request);
    if (!uploaded) {
        return unexpected(uploaded.error());
    }

    session_->add_completed_part(completed_part{source_, part_number_, uploaded.value()});
    notify_progress(future_, static_cast<int64_t>(request.payload.size()));

    transfer_log_context ctx;
    ctx.transfer_id = future_.transfer_id();
    ctx.store_id = session_->store_id();
    ctx.part_number = part_number_;
    ctx.bytes = request.payload.size();
    OT_LOG_TRACE_CTX(log_category::upload,
                     std::string("Uploaded ") + to_string(source_) + " part", ctx);
    return {};
}

// ============================================================================
// complete_upload_task
// ============================================================================

complete_upload_task::complete_upload_task(std::shared_ptr<transfer_coordinator> coordinator,
                                           std::shared_ptr<omics_storage_client> client,
                                           std::shared_ptr<upload_session> session,
                                           std::vector<std::shared_future<void>> pending)
    : transfer_task(std::move(coordinator), true),
      client_(std::move(client)),
      session_(std::move(session)),
      pending_(std::move(pending)) {}

void complete_upload_task::wait_for_dependencies() {
    for (const auto& future : pending_) {
        future.wait();
    }
}

auto complete_upload_task::execute() -> result<void> {
    auto upload_id = session_->upload_id();
    if (!upload_id) {
        return unexpected(error{error_code::internal_error, "Upload session was not created"});
    }

    auto parts = session_->completed_parts();
    auto completed =
        client_->complete_multipart_read_set_upload(session_->store_id(), *upload_id, parts);
    if (!completed) {
        return unexpected(completed.error());
    }

    OT_LOG_INFO(log_category::upload,
                "Completed upload " + *upload_id + " as read set " + completed.value() + " (" +
                    std::to_string(parts.size()) + " parts)");
    coordinator_->set_result(std::move(completed.value()));
    return {};
}

// ============================================================================
// read_set_upload_submission_task
// ============================================================================

read_set_upload_submission_task::read_set_upload_submission_task(transfer_future future,
                                                                 upload_context context,
                                                                 read_set_upload_request request)
    : submission_task(std::move(future)),
      context_(std::move(context)),
      request_(std::move(request)),
      session_(std::make_shared<upload_session>(request_.store_id)) {}

auto read_set_upload_submission_task::submit() -> result<void> {
    auto create = std::make_shared<create_upload_task>(
        coordinator_, context_.client, make_create_request(request_), session_);
    auto created = submit_task(*context_.request_executor, std::move(create));
    if (!created) {
        return unexpected(created.error());
    }

    auto pending = submit_source(request_.source1, part_source::source1, created.value());
    if (!pending) {
        return unexpected(pending.error());
    }
    auto part_futures = std::move(pending.value());

    if (request_.source2) {
        auto paired = submit_source(*request_.source2, part_source::source2, created.value());
        if (!paired) {
            return unexpected(paired.error());
        }
        part_futures.insert(part_futures.end(), paired.value().begin(), paired.value().end());
    }

    if (total_size_) {
        future_.meta().provide_transfer_size(*total_size_);
    }

    OT_LOG_DEBUG(log_category::upload,
                 "Submitted " + std::to_string(part_futures.size()) + " upload parts to store " +
                     request_.store_id);

    auto complete = std::make_shared<complete_upload_task>(coordinator_, context_.client, session_,
                                                           std::move(part_futures));
    auto completed = submit_task(*context_.request_executor, std::move(complete));
    if (!completed) {
        return unexpected(completed.error());
    }
    return {};
}

auto read_set_upload_submission_task::submit_part(part_source tag,
                                                  uint64_t part_number,
                                                  upload_part_task::part_body body,
                                                  const std::shared_future<void>& created,
                                                  std::string_view pool_tag)
    -> result<std::shared_future<void>> {
    auto task = std::make_shared<upload_part_task>(future_, context_.client, session_, created,
                                                   tag, part_number, std::move(body));
    return submit_task(*context_.request_executor, std::move(task), pool_tag);
}

auto read_set_upload_submission_task::submit_source(const upload_source& source,
                                                    part_source tag,
                                                    const std::shared_future<void>& created)
    -> result<std::vector<std::shared_future<void>>> {
    std::vector<std::shared_future<void>> futures;

    if (const auto* path = std::get_if<std::filesystem::path>(&source)) {
        std::error_code ec;
        auto size = std::filesystem::file_size(*path, ec);
        if (ec) {
            return unexpected(error{error_code::file_read_error,
                                    "Failed to stat " + path->string() + ": " + ec.message()});
        }
        if (total_size_) {
            *total_size_ += size;
        }

        auto part_size = adjuster_.adjust(context_.config.multipart_chunksize, size);
        auto count = chunksize_adjuster::part_count(size, part_size);
        for (uint64_t i = 0; i < count; ++i) {
            upload_part_task::file_range range;
            range.path = *path;
            range.offset = i * part_size;
            range.size = size == 0 ? 0 : std::min(part_size, size - range.offset);

            auto submitted = submit_part(tag, i + 1, std::move(range), created, {});
            if (!submitted) {
                return unexpected(submitted.error());
            }
            futures.push_back(std::move(submitted.value()));
        }
        return futures;
    }

    const auto& stream = std::get<std::shared_ptr<std::istream>>(source);
    auto size = source_size(stream);
    if (total_size_) {
        if (size) {
            *total_size_ += *size;
        } else {
            total_size_.reset();
        }
    }

    auto part_size = adjuster_.adjust(context_.config.multipart_chunksize, size);
    uint64_t part_number = 0;
    uint64_t remaining = size.value_or(part_size);
    for (;;) {
        auto want = size ? std::min(part_size, remaining) : part_size;
        std::vector<std::byte> buffer(want);
        stream->read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(want));
        if (stream->bad()) {
            return unexpected(error{error_code::file_read_error,
                                    std::string("Failed to read ") + to_string(tag) + " stream"});
        }

        auto got = static_cast<uint64_t>(stream->gcount());
        if (got == 0 && part_number > 0) {
            break;
        }
        buffer.resize(got);
        if (size) {
            remaining -= std::min(remaining, got);
        }

        auto submitted = submit_part(tag, ++part_number, std::move(buffer), created,
                                     task_tag::in_memory_upload);
        if (!submitted) {
            return unexpected(submitted.error());
        }
        futures.push_back(std::move(submitted.value()));

        if (stream->eof() || (size && remaining == 0)) {
            break;
        }
    }
    return futures;
}

}  // namespace kcenon::omics_transfer
