/**
 * @file transfer_task.cpp
 * @brief Implementation of transfer task base classes
 */

#include "kcenon/omics_transfer/core/transfer_task.h"

#include "kcenon/omics_transfer/core/logging.h"

#include <exception>

namespace kcenon::omics_transfer {

namespace {

auto run_body(const std::function<result<void>()>& body) -> result<void> {
    try {
        return body();
    } catch (const std::exception& e) {
        return unexpected(error{error_code::internal_error, e.what()});
    }
}

}  // namespace

transfer_task::transfer_task(std::shared_ptr<transfer_coordinator> coordinator,
                             bool is_final,
                             std::vector<std::function<void()>> done_callbacks)
    : coordinator_(std::move(coordinator)),
      is_final_(is_final),
      done_callbacks_(std::move(done_callbacks)) {}

void transfer_task::operator()() {
    wait_for_dependencies();

    if (!coordinator_->done()) {
        auto outcome = run_body([this] { return execute(); });
        if (!outcome) {
            transfer_log_context ctx;
            ctx.transfer_id = coordinator_->transfer_id();
            ctx.error_message = outcome.error().message;
            OT_LOG_DEBUG_CTX(log_category::coordinator,
                             std::string("Task failed: ") + to_string(outcome.error().code), ctx);
            coordinator_->set_exception(outcome.error());
        }
    }

    for (const auto& callback : done_callbacks_) {
        try {
            callback();
        } catch (const std::exception& e) {
            OT_LOG_ERROR(log_category::coordinator,
                         std::string("Task done callback raised: ") + e.what());
        }
    }

    if (is_final_) {
        coordinator_->announce_done();
    }
}

submission_task::submission_task(transfer_future future)
    : transfer_task(future.coordinator()), future_(std::move(future)) {}

auto submission_task::execute() -> result<void> {
    auto outcome = run_body([this]() -> result<void> {
        if (auto queued = coordinator_->set_status_to_queued(); !queued) {
            return queued;
        }
        for (const auto& subscriber : future_.meta().request().subscribers) {
            subscriber->on_queued(future_);
        }
        if (auto running = coordinator_->set_status_to_running(); !running) {
            return running;
        }
        return submit();
    });

    if (!outcome) {
        transfer_log_context ctx;
        ctx.transfer_id = coordinator_->transfer_id();
        ctx.error_message = outcome.error().message;
        OT_LOG_ERROR_CTX(log_category::coordinator, "Submission failed", ctx);

        coordinator_->set_exception(outcome.error());
        coordinator_->wait_for_associated_futures();
        coordinator_->announce_done();
    }
    return {};
}

auto submit_task(bounded_executor& executor,
                 std::shared_ptr<transfer_task> task,
                 std::string_view tag) -> result<std::shared_future<void>> {
    auto coordinator = task->coordinator();
    return coordinator->submit(executor, [task = std::move(task)]() { (*task)(); }, tag);
}

void notify_progress(const transfer_future& future, int64_t bytes) {
    for (const auto& subscriber : future.meta().request().subscribers) {
        subscriber->on_progress(future, bytes);
    }
}

void notify_done(const transfer_future& future) {
    for (const auto& subscriber : future.meta().request().subscribers) {
        subscriber->on_done(future);
    }
}

}  // namespace kcenon::omics_transfer
