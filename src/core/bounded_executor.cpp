// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file bounded_executor.cpp
 * @brief Bounded worker pool implementation for omics_transfer
 */

#include "kcenon/omics_transfer/core/bounded_executor.h"

#include "kcenon/omics_transfer/config/feature_flags.h"
#include "kcenon/omics_transfer/core/logging.h"

#include <algorithm>
#include <atomic>
#include <thread>
#include <vector>

#if KCENON_WITH_THREAD_SYSTEM
// Suppress deprecation warnings from thread_system headers
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_pool.h>
#include <kcenon/thread/core/thread_worker.h>
#pragma GCC diagnostic pop
#else
#include <deque>
#endif

namespace kcenon::omics_transfer {

namespace {

// Pool whose worker is running the current thread, if any
thread_local const void* current_pool = nullptr;

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Job running one unit of a bounded_executor on a thread_system worker
 */
class unit_job : public kcenon::thread::job {
public:
    unit_job(std::function<void()> unit, const std::string& name)
        : job(name), unit_(std::move(unit)) {}

    [[nodiscard]] auto do_work() -> common::VoidResult override {
        unit_();
        return common::ok();
    }

private:
    std::function<void()> unit_;
};

#endif

}  // namespace

// ============================================================================
// task_semaphore implementation
// ============================================================================

task_semaphore::task_semaphore(std::size_t count) : count_(count) {}

auto task_semaphore::acquire(bool blocking) -> bool {
    std::unique_lock<std::mutex> lock(mutex_);
    if (count_ == 0) {
        if (!blocking) {
            return false;
        }
        cv_.wait(lock, [this] { return count_ > 0; });
    }
    --count_;
    return true;
}

void task_semaphore::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++count_;
    }
    cv_.notify_one();
}

auto task_semaphore::available() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_;
}

// ============================================================================
// bounded_executor implementation
// ============================================================================

struct bounded_executor::impl {
    std::string name;
    std::size_t num_threads;
    bool use_threads;

    // Backlog permits; the worker queue itself is unbounded
    task_semaphore capacity;
    std::map<std::string, std::unique_ptr<task_semaphore>, std::less<>> tag_semaphores;

    mutable std::mutex state_mutex;
    bool stopping = false;
    std::atomic<bool> running{true};
    std::atomic<std::size_t> in_flight{0};
    std::mutex idle_mutex;
    std::condition_variable idle_cv;

#if KCENON_WITH_THREAD_SYSTEM
    std::shared_ptr<kcenon::thread::thread_pool> pool;
#else
    std::condition_variable queue_cv;
    std::deque<std::function<void()>> queue;
    std::vector<std::thread> workers;
#endif

    impl(std::string pool_name, std::size_t max_size, std::size_t threads, bool threaded)
        : name(std::move(pool_name)),
          num_threads(std::max<std::size_t>(threads, 1)),
          use_threads(threaded),
          capacity(std::max<std::size_t>(max_size, 1)) {}

    ~impl() { stop(); }

    void release_unit(task_semaphore* tag_semaphore) {
        if (tag_semaphore) {
            tag_semaphore->release();
        }
        if (in_flight.fetch_sub(1) == 1) {
            std::lock_guard<std::mutex> lock(idle_mutex);
            idle_cv.notify_all();
        }
        capacity.release();
    }

    void wait_idle() {
        std::unique_lock<std::mutex> lock(idle_mutex);
        idle_cv.wait(lock, [this] { return in_flight.load() == 0; });
    }

    auto start() -> result<void> {
        if (!use_threads) {
            return {};
        }
#if KCENON_WITH_THREAD_SYSTEM
        pool = std::make_shared<kcenon::thread::thread_pool>("omics_transfer_" + name);
        for (std::size_t i = 0; i < num_threads; ++i) {
            auto worker = std::make_unique<kcenon::thread::thread_worker>();
            worker->set_job_queue(pool->get_job_queue());
            pool->enqueue(std::move(worker));
        }
        auto started = pool->start();
        if (!started.is_ok()) {
            return unexpected(error{error_code::executor_shutdown,
                                    "pool '" + name + "' failed to start"});
        }
#else
        workers.reserve(num_threads);
        for (std::size_t i = 0; i < num_threads; ++i) {
            workers.emplace_back([this] { worker_loop(); });
        }
#endif
        return {};
    }

    /**
     * @brief Hand a wrapped unit to the workers
     * @return false once the pool is stopping
     */
    auto enqueue(std::function<void()> unit) -> bool {
#if KCENON_WITH_THREAD_SYSTEM
        std::lock_guard<std::mutex> lock(state_mutex);
        if (stopping || !pool) {
            return false;
        }
        auto queued = pool->enqueue(std::make_unique<unit_job>(std::move(unit), name));
        return queued.is_ok();
#else
        {
            std::lock_guard<std::mutex> lock(state_mutex);
            if (stopping) {
                return false;
            }
            queue.push_back(std::move(unit));
        }
        queue_cv.notify_one();
        return true;
#endif
    }

    [[nodiscard]] auto queued() const -> std::size_t {
#if KCENON_WITH_THREAD_SYSTEM
        std::lock_guard<std::mutex> lock(state_mutex);
        if (!pool) {
            return 0;
        }
        auto jobs = pool->get_job_queue();
        return jobs ? jobs->size() : 0;
#else
        std::lock_guard<std::mutex> lock(state_mutex);
        return queue.size();
#endif
    }

#if !KCENON_WITH_THREAD_SYSTEM
    void worker_loop() {
        for (;;) {
            std::function<void()> unit;
            {
                std::unique_lock<std::mutex> lock(state_mutex);
                queue_cv.wait(lock, [this] { return stopping || !queue.empty(); });
                if (stopping && queue.empty()) {
                    return;
                }
                unit = std::move(queue.front());
                queue.pop_front();
            }
            unit();
        }
    }
#endif

    void stop() {
        {
            std::lock_guard<std::mutex> lock(state_mutex);
            if (stopping) {
                return;
            }
            stopping = true;
        }
        running = false;

        bool on_own_worker = current_pool == this;
        if (on_own_worker) {
            OT_LOG_ERROR(log_category::executor,
                         "Pool '" + name + "' shut down from its own worker; not joining it");
        }

#if KCENON_WITH_THREAD_SYSTEM
        if (!pool) {
            return;
        }
        if (on_own_worker) {
            // A worker cannot join itself; drain and stop from a helper thread.
            std::thread([pool = std::move(pool)] { pool->stop(false); }).detach();
            return;
        }
        // Queued units still run so their futures are fulfilled.
        wait_idle();
        pool->stop(false);
        pool.reset();
#else
        queue_cv.notify_all();
        auto self = std::this_thread::get_id();
        for (auto& worker : workers) {
            if (worker.get_id() == self) {
                worker.detach();
                continue;
            }
            if (worker.joinable()) {
                worker.join();
            }
        }
        workers.clear();
#endif
    }
};

bounded_executor::bounded_executor(std::string name,
                                   std::size_t max_size,
                                   std::size_t max_num_threads,
                                   tag_limits limits,
                                   bool use_threads)
    : pimpl_(std::make_unique<impl>(std::move(name), max_size, max_num_threads, use_threads)) {
    for (const auto& [tag, count] : limits) {
        pimpl_->tag_semaphores.emplace(
            tag, std::make_unique<task_semaphore>(std::max<std::size_t>(count, 1)));
    }

    if (auto started = pimpl_->start(); !started) {
        OT_LOG_ERROR(log_category::executor, started.error().message);
        pimpl_->running = false;
        return;
    }

    OT_LOG_DEBUG(log_category::executor,
                 "Pool '" + pimpl_->name + "' started with " +
                     std::to_string(use_threads ? pimpl_->num_threads : 0) +
                     " workers, backlog " + std::to_string(max_size));
}

bounded_executor::~bounded_executor() {
    if (pimpl_) {
        pimpl_->stop();
    }
}

bounded_executor::bounded_executor(bounded_executor&&) noexcept = default;
bounded_executor& bounded_executor::operator=(bounded_executor&&) noexcept = default;

auto bounded_executor::submit(std::function<void()> task, std::string_view tag, bool block)
    -> result<std::future<void>> {
    auto* pimpl = pimpl_.get();

    if (!pimpl->running.load()) {
        return unexpected(error{error_code::executor_shutdown,
                                "pool '" + pimpl->name + "' is shut down"});
    }

    if (!pimpl->capacity.acquire(block)) {
        return unexpected(error{error_code::executor_full,
                                "pool '" + pimpl->name + "' backlog is full"});
    }

    task_semaphore* tag_semaphore = nullptr;
    if (!tag.empty()) {
        auto it = pimpl->tag_semaphores.find(tag);
        if (it != pimpl->tag_semaphores.end()) {
            tag_semaphore = it->second.get();
            if (!tag_semaphore->acquire(block)) {
                pimpl->capacity.release();
                return unexpected(error{error_code::executor_full,
                                        "no '" + std::string(tag) + "' permits available"});
            }
        }
    }

    pimpl->in_flight.fetch_add(1);

    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    auto wrapped = [pimpl, tag_semaphore, promise, task = std::move(task)]() {
        auto* previous = current_pool;
        current_pool = pimpl;
        try {
            task();
            promise->set_value();
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
        current_pool = previous;
        pimpl->release_unit(tag_semaphore);
    };

    if (!pimpl->use_threads) {
        wrapped();
        return future;
    }

    if (!pimpl->enqueue(std::move(wrapped))) {
        pimpl->release_unit(tag_semaphore);
        return unexpected(error{error_code::executor_shutdown,
                                "pool '" + pimpl->name + "' is shut down"});
    }
    return future;
}

void bounded_executor::shutdown() {
    if (!pimpl_) {
        return;
    }
    OT_LOG_DEBUG(log_category::executor, "Shutting down pool '" + pimpl_->name + "'");
    pimpl_->stop();
}

auto bounded_executor::name() const -> std::string {
    return pimpl_->name;
}

auto bounded_executor::worker_count() const -> std::size_t {
    return pimpl_->use_threads ? pimpl_->num_threads : 0;
}

auto bounded_executor::is_running() const -> bool {
    return pimpl_ && pimpl_->running.load();
}

auto bounded_executor::pending_tasks() const -> std::size_t {
    return pimpl_->queued();
}

auto bounded_executor::in_flight() const -> std::size_t {
    return pimpl_->in_flight.load();
}

}  // namespace kcenon::omics_transfer
