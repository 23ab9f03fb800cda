/**
 * @file transfer_task.h
 * @brief Base classes for units of work owned by a transfer
 *
 * Every unit submitted to a pool on behalf of a transfer derives from
 * transfer_task. The base class skips the unit when the transfer is already
 * done, routes failures to the coordinator, and announces the transfer done
 * when the unit is the transfer's final one.
 */

#ifndef KCENON_OMICS_TRANSFER_CORE_TRANSFER_TASK_H
#define KCENON_OMICS_TRANSFER_CORE_TRANSFER_TASK_H

#include "kcenon/omics_transfer/core/bounded_executor.h"
#include "kcenon/omics_transfer/core/transfer_coordinator.h"
#include "kcenon/omics_transfer/core/types.h"

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <string_view>
#include <vector>

namespace kcenon::omics_transfer {

/**
 * @brief Base class for a unit of work of one transfer
 */
class transfer_task {
public:
    /**
     * @brief Construct a task
     * @param coordinator Coordinator of the owning transfer
     * @param is_final Announce the transfer done after running
     * @param done_callbacks Run after the unit, whether it ran or was skipped
     */
    explicit transfer_task(std::shared_ptr<transfer_coordinator> coordinator,
                           bool is_final = false,
                           std::vector<std::function<void()>> done_callbacks = {});

    virtual ~transfer_task() = default;

    transfer_task(const transfer_task&) = delete;
    transfer_task& operator=(const transfer_task&) = delete;

    /**
     * @brief Run the unit
     *
     * Waits for the units this one depends on, then runs execute() unless
     * the transfer is already done. Never throws: errors returned or thrown
     * by execute() are stored on the coordinator.
     */
    void operator()();

    [[nodiscard]] auto coordinator() const -> const std::shared_ptr<transfer_coordinator>& {
        return coordinator_;
    }

    [[nodiscard]] auto is_final() const -> bool { return is_final_; }

protected:
    /**
     * @brief Block until the units whose output this task consumes finish
     */
    virtual void wait_for_dependencies() {}

    /**
     * @brief Task body
     */
    virtual auto execute() -> result<void> = 0;

    std::shared_ptr<transfer_coordinator> coordinator_;

private:
    bool is_final_;
    std::vector<std::function<void()>> done_callbacks_;
};

/**
 * @brief Base class for the per-transfer task that fans out the work
 *
 * Moves the transfer to queued, notifies subscribers, moves it to running,
 * then calls submit(). If submit() fails, the error is stored, all work
 * already queued is awaited, and the transfer is announced done.
 */
class submission_task : public transfer_task {
public:
    explicit submission_task(transfer_future future);

    [[nodiscard]] auto future() const -> const transfer_future& { return future_; }

protected:
    auto execute() -> result<void> final;

    /**
     * @brief Queue the transfer's part tasks and final task
     */
    virtual auto submit() -> result<void> = 0;

    transfer_future future_;
};

/**
 * @brief Submit a task through its coordinator
 */
[[nodiscard]] auto submit_task(bounded_executor& executor,
                               std::shared_ptr<transfer_task> task,
                               std::string_view tag = {})
    -> result<std::shared_future<void>>;

/**
 * @brief Send a progress update to every subscriber of a transfer
 */
void notify_progress(const transfer_future& future, int64_t bytes);

/**
 * @brief Send the done event to every subscriber of a transfer
 */
void notify_done(const transfer_future& future);

}  // namespace kcenon::omics_transfer

#endif  // KCENON_OMICS_TRANSFER_CORE_TRANSFER_TASK_H
