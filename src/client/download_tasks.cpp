/**
 * @file download_tasks.cpp
 * @brief Implementation of download fan-out and part tasks
 */

#include "kcenon/omics_transfer/client/download_tasks.h"

#include "kcenon/omics_transfer/core/logging.h"

#include <algorithm>

namespace kcenon::omics_transfer {

namespace {

auto expected_part_count(const file_part_info& info) -> uint64_t {
    if (info.content_length == 0) {
        return 1;
    }
    return (info.content_length + info.part_size - 1) / info.part_size;
}

auto make_log_context(const transfer_future& future) -> transfer_log_context {
    const auto& request = future.meta().request();
    transfer_log_context ctx;
    ctx.transfer_id = future.transfer_id();
    ctx.store_id = request.resource.store_id;
    ctx.resource_id = request.resource.resource_id;
    ctx.file_name = request.file_name;
    return ctx;
}

}  // namespace

auto validate_file_part_info(const file_part_info& info) -> result<void> {
    if (info.content_length > 0 && info.part_size == 0) {
        return unexpected(error{error_code::invalid_file_metadata,
                                "Part size must be greater than 0 for a non-empty file"});
    }

    auto expected = expected_part_count(info);
    bool empty_without_parts = info.content_length == 0 && info.total_parts == 0;
    if (info.total_parts != expected && !empty_without_parts) {
        return unexpected(error{error_code::invalid_file_metadata,
                                "Expected " + std::to_string(expected) + " parts for " +
                                    std::to_string(info.content_length) + " bytes, got " +
                                    std::to_string(info.total_parts)});
    }
    return {};
}

auto find_file_part_info(const file_metadata_map& files,
                         std::string_view file_key,
                         std::string_view store_id) -> result<file_part_info> {
    auto it = files.find(file_key);
    if (it == files.end()) {
        return unexpected(error{error_code::file_not_found,
                                "File '" + std::string(file_key) +
                                    "' was not found in store: " + std::string(store_id)});
    }
    return it->second;
}

auto make_part_descriptors(const file_part_info& info, std::size_t max_attempts)
    -> std::vector<part_descriptor> {
    auto count = expected_part_count(info);
    std::vector<part_descriptor> parts;
    parts.reserve(count);
    for (uint64_t i = 0; i < count; ++i) {
        part_descriptor part;
        part.part_number = i + 1;
        part.offset = i * info.part_size;
        part.size = info.content_length == 0
                        ? 0
                        : std::min(info.part_size, info.content_length - part.offset);
        part.max_attempts = max_attempts;
        parts.push_back(part);
    }
    return parts;
}

// ============================================================================
// download_submission_task
// ============================================================================

download_submission_task::download_submission_task(transfer_future future,
                                                   download_context context,
                                                   std::shared_ptr<output_manager> output)
    : submission_task(std::move(future)),
      context_(std::move(context)),
      output_(std::move(output)) {}

auto download_submission_task::resolve_file_part_info() -> result<file_part_info> {
    const auto& request = future_.meta().request();

    if (request.file_metadata && validate_file_part_info(*request.file_metadata)) {
        return *request.file_metadata;
    }

    auto files = context_.client->get_file_metadata(request.resource);
    if (!files) {
        return unexpected(files.error());
    }

    auto info = find_file_part_info(files.value(), request.file_name, request.resource.store_id);
    if (!info) {
        return info;
    }
    if (auto valid = validate_file_part_info(info.value()); !valid) {
        return unexpected(valid.error());
    }
    return info;
}

auto download_submission_task::submit() -> result<void> {
    auto info = resolve_file_part_info();
    if (!info) {
        return unexpected(info.error());
    }
    const auto layout = info.value();

    future_.meta().provide_transfer_size(layout.content_length);

    if (auto opened = output_->open(*coordinator_); !opened) {
        return opened;
    }

    auto parts = make_part_descriptors(layout, context_.config.num_download_attempts);

    auto ctx = make_log_context(future_);
    ctx.total_parts = parts.size();
    ctx.bytes = layout.content_length;
    OT_LOG_DEBUG_CTX(log_category::download, "Submitting download", ctx);

    auto coordinator = coordinator_;
    auto output = output_;
    auto* io_executor = context_.io_executor;
    auto finalize_download = std::make_shared<count_callback_invoker>(
        [coordinator, output, io_executor, length = layout.content_length]() {
            auto submitted =
                submit_task(*io_executor, output->make_final_task(coordinator, length));
            if (!submitted) {
                coordinator->set_exception(submitted.error());
                coordinator->announce_done();
            }
        });

    for (const auto& part : parts) {
        if (auto counted = finalize_download->increment(); !counted) {
            return counted;
        }

        auto task = std::make_shared<get_part_task>(
            future_, context_, output_, part,
            std::vector<std::function<void()>>{[finalize_download] {
                finalize_download->decrement();
            }});

        auto submitted = submit_task(*context_.request_executor, std::move(task));
        if (!submitted) {
            finalize_download->decrement();
            return unexpected(submitted.error());
        }
    }

    finalize_download->finalize();
    return {};
}

// ============================================================================
// get_part_task
// ============================================================================

get_part_task::get_part_task(transfer_future future,
                             download_context context,
                             std::shared_ptr<output_manager> output,
                             part_descriptor part,
                             std::vector<std::function<void()>> done_callbacks)
    : transfer_task(future.coordinator(), false, std::move(done_callbacks)),
      future_(std::move(future)),
      context_(std::move(context)),
      output_(std::move(output)),
      part_(part) {}

auto get_part_task::attempt(uint64_t& current) -> result<void> {
    const auto& request = future_.meta().request();

    auto stream = context_.client->get_part(request.resource, request.file_name, part_.part_number);
    if (!stream) {
        return unexpected(stream.error());
    }

    for (;;) {
        auto chunk = stream.value()->read(context_.config.io_chunksize);
        if (!chunk) {
            return unexpected(chunk.error());
        }
        if (chunk.value().empty()) {
            break;
        }

        auto size = chunk.value().size();
        notify_progress(future_, static_cast<int64_t>(size));

        // Cancelled or failed elsewhere: stop handing bytes to the destination.
        if (coordinator_->done()) {
            return {};
        }

        auto queued = output_->queue_write(coordinator_, *context_.io_executor, current,
                                           std::move(chunk.value()));
        if (!queued) {
            return queued;
        }
        current += size;
    }

    auto received = current - part_.offset;
    if (received < part_.size) {
        return unexpected(error{error_code::truncated_read,
                                "Part " + std::to_string(part_.part_number) + " ended after " +
                                    std::to_string(received) + " of " +
                                    std::to_string(part_.size) + " bytes"});
    }
    return {};
}

auto get_part_task::execute() -> result<void> {
    error last_error{error_code::retries_exceeded};

    for (std::size_t i = 0; i < part_.max_attempts; ++i) {
        uint64_t current = part_.offset;

        auto outcome = attempt(current);
        if (outcome) {
            return {};
        }
        if (!is_retryable(outcome.error().code)) {
            return outcome;
        }

        auto ctx = make_log_context(future_);
        ctx.part_number = part_.part_number;
        ctx.attempt = i + 1;
        ctx.error_message = outcome.error().message;
        OT_LOG_DEBUG_CTX(log_category::download,
                         "Retrying part after " + std::string(to_string(outcome.error().code)) +
                             " (attempt " + std::to_string(i + 1) + " / " +
                             std::to_string(part_.max_attempts) + ")",
                         ctx);

        last_error = outcome.error();

        // Bytes already handed to the destination will be sent again.
        auto correction = static_cast<int64_t>(part_.offset) - static_cast<int64_t>(current);
        if (correction != 0) {
            notify_progress(future_, correction);
        }
    }

    auto ctx = make_log_context(future_);
    ctx.part_number = part_.part_number;
    ctx.error_message = last_error.message;
    OT_LOG_ERROR_CTX(log_category::download, "Part retries exhausted", ctx);

    return unexpected(error{error_code::retries_exceeded,
                            "Max retries exceeded with error: " + last_error.message,
                            last_error});
}

}  // namespace kcenon::omics_transfer
