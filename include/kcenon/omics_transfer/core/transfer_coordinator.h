/**
 * @file transfer_coordinator.h
 * @brief Per-transfer state machine, future handle and coordinator registry
 */

#ifndef KCENON_OMICS_TRANSFER_CORE_TRANSFER_COORDINATOR_H
#define KCENON_OMICS_TRANSFER_CORE_TRANSFER_COORDINATOR_H

#include <kcenon/omics_transfer/core/bounded_executor.h>
#include <kcenon/omics_transfer/core/transfer_types.h>
#include <kcenon/omics_transfer/core/types.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace kcenon::omics_transfer {

/**
 * @brief State of a transfer
 *
 * cancelled, failed and success are terminal ("done").
 */
enum class transfer_state {
    not_started,
    queued,
    running,
    cancelled,
    failed,
    success,
};

[[nodiscard]] constexpr auto to_string(transfer_state state) -> const char* {
    switch (state) {
        case transfer_state::not_started: return "not_started";
        case transfer_state::queued: return "queued";
        case transfer_state::running: return "running";
        case transfer_state::cancelled: return "cancelled";
        case transfer_state::failed: return "failed";
        case transfer_state::success: return "success";
        default: return "unknown";
    }
}

[[nodiscard]] constexpr auto is_terminal_state(transfer_state state) -> bool {
    return state == transfer_state::cancelled ||
           state == transfer_state::failed ||
           state == transfer_state::success;
}

/**
 * @brief Single source of truth for one transfer's outcome
 *
 * Submission, request and io workers race to finish or fail the same
 * transfer; every mutation is guarded by one mutex. The first error wins,
 * a terminal state is never left, and announce_done() runs once.
 */
class transfer_coordinator : public std::enable_shared_from_this<transfer_coordinator> {
public:
    explicit transfer_coordinator(uint64_t transfer_id = 0);
    ~transfer_coordinator() = default;

    transfer_coordinator(const transfer_coordinator&) = delete;
    transfer_coordinator& operator=(const transfer_coordinator&) = delete;

    [[nodiscard]] auto transfer_id() const -> uint64_t { return transfer_id_; }

    [[nodiscard]] auto state() const -> transfer_state;

    /**
     * @brief True once the state is terminal
     *
     * Tasks check this before doing work and before queuing each chunk.
     */
    [[nodiscard]] auto done() const -> bool;

    /**
     * @brief True once announce_done() has released waiters
     */
    [[nodiscard]] auto announced() const -> bool;

    [[nodiscard]] auto exception() const -> std::optional<error>;

    /**
     * @brief Move from not_started to queued
     */
    auto set_status_to_queued() -> omics_transfer::result<void>;

    /**
     * @brief Move to running unless already terminal
     */
    auto set_status_to_running() -> omics_transfer::result<void>;

    /**
     * @brief Record a successful outcome; ignored once done
     * @return false when the transfer had already ended
     */
    auto set_result(std::string value) -> bool;

    /**
     * @brief Record a failure; the first failure wins
     */
    void set_exception(error err);

    /**
     * @brief Request cooperative cancellation
     * @param message Reason stored in the resulting error
     * @param code cancelled for user requests, interrupted or fatal_error otherwise
     *
     * No-op when already done. A transfer that has not started is announced
     * done immediately; a running one finishes through its final task.
     */
    void cancel(const std::string& message = {}, error_code code = error_code::cancelled);

    /**
     * @brief Release waiters and run callbacks
     *
     * Runs failure cleanups (unless successful), then wakes result() waiters,
     * then runs done callbacks in registration order. Only the first call
     * has any effect.
     */
    void announce_done();

    /**
     * @brief Block until announced, then return the outcome
     */
    [[nodiscard]] auto result() const -> omics_transfer::result<std::string>;

    /**
     * @brief Wait until announced or timeout
     * @return true if announced
     */
    [[nodiscard]] auto wait_for(std::chrono::milliseconds timeout) const -> bool;

    /**
     * @brief Add a callback run after the transfer is announced done
     *
     * Runs immediately when the transfer was already announced.
     */
    void add_done_callback(std::function<void()> callback);

    /**
     * @brief Add a compensating action run once if the transfer does not succeed
     */
    void add_failure_cleanup(std::function<void()> cleanup);

    /**
     * @brief Submit work owned by this transfer
     * @param executor Pool to run on
     * @param task Work to run
     * @param tag Optional pool tag
     * @return Future completing when the work finishes
     *
     * The future is tracked until the work finishes so that a failing
     * submission can wait for everything it already queued.
     */
    [[nodiscard]] auto submit(bounded_executor& executor,
                              std::function<void()> task,
                              std::string_view tag = {})
        -> omics_transfer::result<std::shared_future<void>>;

    /**
     * @brief Snapshot of work still in flight
     */
    [[nodiscard]] auto associated_futures() const -> std::vector<std::shared_future<void>>;

    /**
     * @brief Wait until no associated work remains
     */
    void wait_for_associated_futures() const;

private:
    void remove_associated_future(uint64_t id);

    const uint64_t transfer_id_;

    mutable std::mutex mutex_;
    mutable std::condition_variable done_cv_;
    transfer_state state_{transfer_state::not_started};
    std::optional<error> exception_;
    std::optional<std::string> result_;
    bool announce_started_{false};
    bool announced_{false};

    std::vector<std::function<void()>> done_callbacks_;
    std::vector<std::function<void()>> failure_cleanups_;

    uint64_t next_future_id_{0};
    std::map<uint64_t, std::shared_future<void>> associated_futures_;
};

/**
 * @brief Calls a function once every tracked unit is done
 *
 * increment() before each unit, decrement() as each unit finishes, and
 * finalize() after the last increment. The callback fires exactly once,
 * when finalized and the count is zero.
 */
class count_callback_invoker {
public:
    explicit count_callback_invoker(std::function<void()> callback);

    count_callback_invoker(const count_callback_invoker&) = delete;
    count_callback_invoker& operator=(const count_callback_invoker&) = delete;

    auto increment() -> omics_transfer::result<void>;
    void decrement();
    void finalize();

    [[nodiscard]] auto current_count() const -> std::size_t;

private:
    std::function<void()> callback_;
    mutable std::mutex mutex_;
    std::size_t count_{0};
    bool finalized_{false};
    bool invoked_{false};
};

/**
 * @brief Read-only description of a transfer
 */
class transfer_meta {
public:
    transfer_meta(transfer_request request, uint64_t transfer_id);

    [[nodiscard]] auto request() const -> const transfer_request& { return request_; }
    [[nodiscard]] auto transfer_id() const -> uint64_t { return transfer_id_; }

    /**
     * @brief Content length once known
     */
    [[nodiscard]] auto size() const -> std::optional<uint64_t>;

    void provide_transfer_size(uint64_t size);

private:
    const transfer_request request_;
    const uint64_t transfer_id_;
    mutable std::mutex mutex_;
    std::optional<uint64_t> size_;
};

/**
 * @brief Caller-facing handle of one transfer
 *
 * Cheap to copy; all copies observe the same transfer.
 */
class transfer_future {
public:
    transfer_future(std::shared_ptr<transfer_meta> meta,
                    std::shared_ptr<transfer_coordinator> coordinator);

    [[nodiscard]] auto meta() const -> transfer_meta& { return *meta_; }
    [[nodiscard]] auto transfer_id() const -> uint64_t { return meta_->transfer_id(); }

    [[nodiscard]] auto done() const -> bool;

    /**
     * @brief Block until the transfer is done
     * @return Final file path for file downloads, read set id for uploads,
     *         empty for stream downloads; or the categorized error
     */
    [[nodiscard]] auto result() const -> omics_transfer::result<std::string>;

    /**
     * @brief Request user-initiated cancellation
     */
    void cancel(const std::string& message = {});

    /**
     * @brief Fail the transfer with an error
     */
    void set_exception(error err);

    [[nodiscard]] auto coordinator() const -> const std::shared_ptr<transfer_coordinator>& {
        return coordinator_;
    }

private:
    std::shared_ptr<transfer_meta> meta_;
    std::shared_ptr<transfer_coordinator> coordinator_;
};

/**
 * @brief Registry of in-flight coordinators for bulk wait and cancel
 */
class transfer_coordinator_controller {
public:
    transfer_coordinator_controller() = default;

    transfer_coordinator_controller(const transfer_coordinator_controller&) = delete;
    transfer_coordinator_controller& operator=(const transfer_coordinator_controller&) = delete;

    void add_transfer_coordinator(std::shared_ptr<transfer_coordinator> coordinator);
    void remove_transfer_coordinator(uint64_t transfer_id);

    [[nodiscard]] auto tracked_transfer_coordinators() const
        -> std::vector<std::shared_ptr<transfer_coordinator>>;

    [[nodiscard]] auto size() const -> std::size_t;

    /**
     * @brief Cancel every tracked transfer with the same error category
     */
    void cancel(const std::string& message = {}, error_code code = error_code::cancelled);

    /**
     * @brief Wait for every tracked transfer to be announced done
     * @param interrupt Optional flag polled while waiting
     * @param poll_interval How often the flag is checked
     * @return interrupted if the flag was raised; transfer failures are ignored
     */
    auto wait(const std::atomic<bool>* interrupt = nullptr,
              std::chrono::milliseconds poll_interval = std::chrono::milliseconds{50})
        -> result<void>;

private:
    mutable std::mutex mutex_;
    std::unordered_map<uint64_t, std::shared_ptr<transfer_coordinator>> coordinators_;
};

}  // namespace kcenon::omics_transfer

#endif  // KCENON_OMICS_TRANSFER_CORE_TRANSFER_COORDINATOR_H
