/**
 * @file transfer_coordinator.cpp
 * @brief Implementation of transfer coordination primitives
 */

#include "kcenon/omics_transfer/core/transfer_coordinator.h"

#include "kcenon/omics_transfer/core/logging.h"

#include <exception>

namespace kcenon::omics_transfer {

namespace {

void run_guarded(const std::function<void()>& callback, const char* what, uint64_t transfer_id) {
    try {
        callback();
    } catch (const std::exception& e) {
        transfer_log_context ctx;
        ctx.transfer_id = transfer_id;
        ctx.error_message = e.what();
        OT_LOG_ERROR_CTX(log_category::coordinator,
                         std::string("Exception raised in ") + what, ctx);
    }
}

}  // namespace

// ============================================================================
// transfer_coordinator
// ============================================================================

transfer_coordinator::transfer_coordinator(uint64_t transfer_id) : transfer_id_(transfer_id) {}

auto transfer_coordinator::state() const -> transfer_state {
    std::lock_guard lock(mutex_);
    return state_;
}

auto transfer_coordinator::done() const -> bool {
    std::lock_guard lock(mutex_);
    return is_terminal_state(state_);
}

auto transfer_coordinator::announced() const -> bool {
    std::lock_guard lock(mutex_);
    return announced_;
}

auto transfer_coordinator::exception() const -> std::optional<error> {
    std::lock_guard lock(mutex_);
    return exception_;
}

auto transfer_coordinator::set_status_to_queued() -> omics_transfer::result<void> {
    std::lock_guard lock(mutex_);
    if (state_ != transfer_state::not_started) {
        return unexpected(error{error_code::internal_error,
                                std::string("Unable to transition from ") + to_string(state_) +
                                    " to queued"});
    }
    state_ = transfer_state::queued;
    return {};
}

auto transfer_coordinator::set_status_to_running() -> omics_transfer::result<void> {
    std::lock_guard lock(mutex_);
    if (!is_terminal_state(state_)) {
        state_ = transfer_state::running;
    }
    return {};
}

auto transfer_coordinator::set_result(std::string value) -> bool {
    std::lock_guard lock(mutex_);
    if (is_terminal_state(state_)) {
        return false;
    }
    result_ = std::move(value);
    state_ = transfer_state::success;
    return true;
}

void transfer_coordinator::set_exception(error err) {
    {
        std::lock_guard lock(mutex_);
        if (is_terminal_state(state_)) {
            return;
        }
        exception_ = err;
        state_ = transfer_state::failed;
    }

    transfer_log_context ctx;
    ctx.transfer_id = transfer_id_;
    ctx.error_message = err.message;
    OT_LOG_DEBUG_CTX(log_category::coordinator,
                     std::string("Transfer failed: ") + to_string(err.code), ctx);
}

void transfer_coordinator::cancel(const std::string& message, error_code code) {
    bool should_announce = false;
    {
        std::lock_guard lock(mutex_);
        if (is_terminal_state(state_)) {
            return;
        }
        should_announce = state_ == transfer_state::not_started;
        exception_ = message.empty() ? error{code} : error{code, message};
        state_ = transfer_state::cancelled;
    }

    OT_LOG_DEBUG(log_category::coordinator,
                 "Transfer " + std::to_string(transfer_id_) + " cancelled (" + to_string(code) + ")");

    if (should_announce) {
        announce_done();
    }
}

void transfer_coordinator::announce_done() {
    std::vector<std::function<void()>> cleanups;
    {
        std::lock_guard lock(mutex_);
        if (announce_started_) {
            return;
        }
        announce_started_ = true;
        if (!is_terminal_state(state_)) {
            state_ = transfer_state::success;
        }
        if (state_ != transfer_state::success) {
            cleanups = std::move(failure_cleanups_);
        }
        failure_cleanups_.clear();
    }

    for (const auto& cleanup : cleanups) {
        run_guarded(cleanup, "failure cleanup", transfer_id_);
    }

    std::vector<std::function<void()>> callbacks;
    {
        std::lock_guard lock(mutex_);
        announced_ = true;
        callbacks = std::move(done_callbacks_);
        done_callbacks_.clear();
    }
    done_cv_.notify_all();

    for (const auto& callback : callbacks) {
        run_guarded(callback, "done callback", transfer_id_);
    }
}

auto transfer_coordinator::result() const -> omics_transfer::result<std::string> {
    std::unique_lock lock(mutex_);
    done_cv_.wait(lock, [this] { return announced_; });
    if (exception_) {
        return unexpected(*exception_);
    }
    return result_.value_or(std::string{});
}

auto transfer_coordinator::wait_for(std::chrono::milliseconds timeout) const -> bool {
    std::unique_lock lock(mutex_);
    return done_cv_.wait_for(lock, timeout, [this] { return announced_; });
}

void transfer_coordinator::add_done_callback(std::function<void()> callback) {
    {
        std::lock_guard lock(mutex_);
        if (!announced_) {
            done_callbacks_.push_back(std::move(callback));
            return;
        }
    }
    run_guarded(callback, "done callback", transfer_id_);
}

void transfer_coordinator::add_failure_cleanup(std::function<void()> cleanup) {
    std::lock_guard lock(mutex_);
    failure_cleanups_.push_back(std::move(cleanup));
}

auto transfer_coordinator::submit(bounded_executor& executor,
                                  std::function<void()> task,
                                  std::string_view tag)
    -> omics_transfer::result<std::shared_future<void>> {
    auto promise = std::make_shared<std::promise<void>>();
    std::shared_future<void> future = promise->get_future().share();

    uint64_t id = 0;
    {
        std::lock_guard lock(mutex_);
        id = ++next_future_id_;
        associated_futures_.emplace(id, future);
    }

    auto self = shared_from_this();
    auto submitted = executor.submit(
        [self, id, promise, task = std::move(task)]() {
            try {
                task();
            } catch (...) {
                self->remove_associated_future(id);
                promise->set_exception(std::current_exception());
                return;
            }
            self->remove_associated_future(id);
            promise->set_value();
        },
        tag);

    if (!submitted) {
        remove_associated_future(id);
        return unexpected(submitted.error());
    }

    OT_LOG_TRACE(log_category::coordinator,
                 "Transfer " + std::to_string(transfer_id_) + " submitted work to pool '" +
                     executor.name() + "'");
    return future;
}

auto transfer_coordinator::associated_futures() const -> std::vector<std::shared_future<void>> {
    std::lock_guard lock(mutex_);
    std::vector<std::shared_future<void>> futures;
    futures.reserve(associated_futures_.size());
    for (const auto& [id, future] : associated_futures_) {
        futures.push_back(future);
    }
    return futures;
}

void transfer_coordinator::wait_for_associated_futures() const {
    // Work finishing while we wait may have queued more work; loop until none.
    for (;;) {
        auto futures = associated_futures();
        if (futures.empty()) {
            return;
        }
        for (const auto& future : futures) {
            future.wait();
        }
    }
}

void transfer_coordinator::remove_associated_future(uint64_t id) {
    std::lock_guard lock(mutex_);
    associated_futures_.erase(id);
}

// ============================================================================
// count_callback_invoker
// ============================================================================

count_callback_invoker::count_callback_invoker(std::function<void()> callback)
    : callback_(std::move(callback)) {}

auto count_callback_invoker::increment() -> omics_transfer::result<void> {
    std::lock_guard lock(mutex_);
    if (finalized_) {
        return unexpected(error{error_code::internal_error,
                                "Counter has been finalized; no more increments allowed"});
    }
    ++count_;
    return {};
}

void count_callback_invoker::decrement() {
    bool invoke = false;
    {
        std::lock_guard lock(mutex_);
        if (count_ == 0) {
            OT_LOG_ERROR(log_category::coordinator, "Counter decremented below zero");
            return;
        }
        --count_;
        if (count_ == 0 && finalized_ && !invoked_) {
            invoked_ = true;
            invoke = true;
        }
    }
    if (invoke) {
        callback_();
    }
}

void count_callback_invoker::finalize() {
    bool invoke = false;
    {
        std::lock_guard lock(mutex_);
        finalized_ = true;
        if (count_ == 0 && !invoked_) {
            invoked_ = true;
            invoke = true;
        }
    }
    if (invoke) {
        callback_();
    }
}

auto count_callback_invoker::current_count() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return count_;
}

// ============================================================================
// transfer_meta / transfer_future
// ============================================================================

transfer_meta::transfer_meta(transfer_request request, uint64_t transfer_id)
    : request_(std::move(request)), transfer_id_(transfer_id) {}

auto transfer_meta::size() const -> std::optional<uint64_t> {
    std::lock_guard lock(mutex_);
    return size_;
}

void transfer_meta::provide_transfer_size(uint64_t size) {
    std::lock_guard lock(mutex_);
    size_ = size;
}

transfer_future::transfer_future(std::shared_ptr<transfer_meta> meta,
                                 std::shared_ptr<transfer_coordinator> coordinator)
    : meta_(std::move(meta)), coordinator_(std::move(coordinator)) {}

auto transfer_future::done() const -> bool {
    return coordinator_->done();
}

auto transfer_future::result() const -> omics_transfer::result<std::string> {
    return coordinator_->result();
}

void transfer_future::cancel(const std::string& message) {
    coordinator_->cancel(message, error_code::cancelled);
}

void transfer_future::set_exception(error err) {
    coordinator_->set_exception(std::move(err));
}

// ============================================================================
// transfer_coordinator_controller
// ============================================================================

void transfer_coordinator_controller::add_transfer_coordinator(
    std::shared_ptr<transfer_coordinator> coordinator) {
    std::lock_guard lock(mutex_);
    coordinators_[coordinator->transfer_id()] = std::move(coordinator);
}

void transfer_coordinator_controller::remove_transfer_coordinator(uint64_t transfer_id) {
    std::lock_guard lock(mutex_);
    coordinators_.erase(transfer_id);
}

auto transfer_coordinator_controller::tracked_transfer_coordinators() const
    -> std::vector<std::shared_ptr<transfer_coordinator>> {
    std::lock_guard lock(mutex_);
    std::vector<std::shared_ptr<transfer_coordinator>> snapshot;
    snapshot.reserve(coordinators_.size());
    for (const auto& [id, coordinator] : coordinators_) {
        snapshot.push_back(coordinator);
    }
    return snapshot;
}

auto transfer_coordinator_controller::size() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return coordinators_.size();
}

void transfer_coordinator_controller::cancel(const std::string& message, error_code code) {
    for (const auto& coordinator : tracked_transfer_coordinators()) {
        coordinator->cancel(message, code);
    }
}

auto transfer_coordinator_controller::wait(const std::atomic<bool>* interrupt,
                                           std::chrono::milliseconds poll_interval)
    -> result<void> {
    for (const auto& coordinator : tracked_transfer_coordinators()) {
        while (!coordinator->wait_for(poll_interval)) {
            if (interrupt != nullptr && interrupt->load()) {
                return unexpected(error{error_code::interrupted, "Wait interrupted"});
            }
        }
    }
    return {};
}

}  // namespace kcenon::omics_transfer
