// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file bounded_executor.h
 * @brief Backpressured worker pool for omics transfers
 *
 * The transfer manager runs three independent pools:
 * - submission: fans one transfer out into part tasks
 * - request: performs remote API calls
 * - io: a single worker that serializes all destination writes
 *
 * Each pool bounds the number of queued plus running units. Submitting to a
 * full pool blocks the caller (or fails when non-blocking), so memory use
 * stays bounded under large fan-out.
 *
 * Workers come from thread_system's thread_pool when built with
 * BUILD_WITH_THREAD_SYSTEM, and are plain std::thread workers otherwise.
 */

#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include "types.h"

namespace kcenon::omics_transfer {

/**
 * @brief Tags for units that hold an auxiliary resource
 */
struct task_tag {
    static constexpr std::string_view in_memory_upload = "in_memory_upload";
};

/**
 * @brief Counting semaphore with optional non-blocking acquire
 */
class task_semaphore {
public:
    explicit task_semaphore(std::size_t count);

    task_semaphore(const task_semaphore&) = delete;
    task_semaphore& operator=(const task_semaphore&) = delete;

    /**
     * @brief Acquire one permit
     * @param blocking Wait for a permit when none is available
     * @return true if a permit was acquired
     */
    auto acquire(bool blocking = true) -> bool;

    /**
     * @brief Return one permit
     */
    void release();

    [[nodiscard]] auto available() const -> std::size_t;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::size_t count_;
};

/**
 * @brief Worker pool with a bounded backlog
 *
 * @note Thread-safe: All public methods are safe to call from multiple threads.
 */
class bounded_executor {
public:
    using tag_limits = std::map<std::string, std::size_t, std::less<>>;

    /**
     * @brief Construct and start the pool
     * @param name Pool name for logs
     * @param max_size Maximum queued plus running units
     * @param max_num_threads Number of worker threads
     * @param limits Per-tag permit counts
     * @param use_threads false runs every unit inline in the submitting thread
     */
    bounded_executor(std::string name,
                     std::size_t max_size,
                     std::size_t max_num_threads,
                     tag_limits limits = {},
                     bool use_threads = true);

    ~bounded_executor();

    // Non-copyable
    bounded_executor(const bounded_executor&) = delete;
    bounded_executor& operator=(const bounded_executor&) = delete;

    // Movable
    bounded_executor(bounded_executor&&) noexcept;
    bounded_executor& operator=(bounded_executor&&) noexcept;

    /**
     * @brief Submit a unit of work
     * @param task The task to execute
     * @param tag Optional tag whose permit is held while the unit is in flight
     * @param block Wait for backlog space instead of failing
     * @return Future for the task completion, or executor_full / executor_shutdown
     *
     * An exception thrown by the task is stored in the returned future.
     */
    [[nodiscard]] auto submit(std::function<void()> task,
                              std::string_view tag = {},
                              bool block = true) -> result<std::future<void>>;

    /**
     * @brief Stop accepting work, drain queued units and join the workers
     *
     * Idempotent.
     */
    void shutdown();

    [[nodiscard]] auto name() const -> std::string;
    [[nodiscard]] auto worker_count() const -> std::size_t;
    [[nodiscard]] auto is_running() const -> bool;

    /**
     * @brief Units waiting for a worker
     */
    [[nodiscard]] auto pending_tasks() const -> std::size_t;

    /**
     * @brief Units queued or running
     */
    [[nodiscard]] auto in_flight() const -> std::size_t;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

}  // namespace kcenon::omics_transfer
