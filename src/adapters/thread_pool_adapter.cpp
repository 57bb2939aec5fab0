// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief Thread pool adapter implementation for transfer_engine_system
 */

#include "kcenon/transfer_engine/adapters/thread_pool_adapter.h"

#include "kcenon/transfer_engine/core/logging.h"

#include <stdexcept>
#include <thread>

#if KCENON_WITH_THREAD_SYSTEM
// Suppress deprecation warnings from thread_system headers
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#pragma clang diagnostic pop
#endif

namespace kcenon::transfer_engine::adapters {

// ============================================================================
// Stage tracking helper (shared implementation)
// ============================================================================

namespace {

class stage_tracker {
public:
    void increment(const std::string& stage_name) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++counts_[stage_name];
    }

    void decrement(const std::string& stage_name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(stage_name);
        if (it != counts_.end() && it->second > 0) {
            --it->second;
        }
    }

    [[nodiscard]] size_t count(const std::string& stage_name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(stage_name);
        return it != counts_.end() ? it->second : 0;
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, size_t> counts_;
};

auto resolve_worker_count(size_t requested) -> size_t {
    if (requested > 0) {
        return requested;
    }
    auto hw = std::thread::hardware_concurrency();
    return hw > 0 ? hw : 4;
}

}  // namespace

// ============================================================================
// thread_system_transfer_adapter implementation
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Job that wraps a function for thread_system execution
 */
class function_job : public kcenon::thread::job {
public:
    explicit function_job(std::function<void()> func, const std::string& name = "function_job")
        : job(name), func_(std::move(func)) {}

    [[nodiscard]] auto do_work() -> common::VoidResult override {
        if (func_) {
            func_();
        }
        return common::ok();
    }

private:
    std::function<void()> func_;
};

struct thread_system_transfer_adapter::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::string pool_name;
    size_t worker_count{0};
    std::shared_ptr<stage_tracker> tracker = std::make_shared<stage_tracker>();

    auto enqueue(std::function<void()> body, const std::string& job_name)
        -> std::future<void> {
        auto promise = std::make_shared<std::promise<void>>();
        auto future = promise->get_future();

        auto wrapped = [body = std::move(body), promise]() {
            try {
                body();
                promise->set_value();
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        };

        auto enqueue_result =
            pool->enqueue(std::make_unique<function_job>(std::move(wrapped), job_name));
        if (!enqueue_result.is_ok()) {
            promise->set_exception(std::make_exception_ptr(
                std::runtime_error("thread pool rejected job: " + job_name)));
        }
        return future;
    }
};

thread_system_transfer_adapter::thread_system_transfer_adapter(
    std::shared_ptr<kcenon::thread::thread_pool> pool,
    const std::string& pool_name,
    size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->pool_name = pool_name;
    pimpl_->worker_count = worker_count;
}

thread_system_transfer_adapter::~thread_system_transfer_adapter() {
    if (pimpl_ && pimpl_->pool) {
        auto stopped = pimpl_->pool->stop(false);
        if (!stopped.is_ok()) {
            TE_LOG_WARN(log_category::executor,
                        "thread pool '" + pimpl_->pool_name + "' did not stop cleanly");
        }
    }
}

thread_system_transfer_adapter::thread_system_transfer_adapter(
    thread_system_transfer_adapter&&) noexcept = default;

thread_system_transfer_adapter& thread_system_transfer_adapter::operator=(
    thread_system_transfer_adapter&&) noexcept = default;

std::shared_ptr<thread_system_transfer_adapter>
thread_system_transfer_adapter::create_default(size_t worker_count,
                                                const std::string& pool_name) {
    worker_count = resolve_worker_count(worker_count);

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);

    for (size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }

    auto started = pool->start();
    if (!started.is_ok()) {
        TE_LOG_ERROR(log_category::executor,
                     "failed to start thread pool '" + pool_name + "'");
    }

    return std::make_shared<thread_system_transfer_adapter>(std::move(pool), pool_name,
                                                            worker_count);
}

std::future<void> thread_system_transfer_adapter::submit(std::function<void()> task) {
    return pimpl_->enqueue(std::move(task), "transfer_task");
}

std::future<void> thread_system_transfer_adapter::submit_to_stage(
    std::function<void()> task, const std::string& stage_name) {
    auto tracker = pimpl_->tracker;
    tracker->increment(stage_name);

    auto staged = [task = std::move(task), tracker, stage = stage_name]() {
        try {
            task();
        } catch (...) {
            tracker->decrement(stage);
            throw;
        }
        tracker->decrement(stage);
    };
    return pimpl_->enqueue(std::move(staged), stage_name);
}

size_t thread_system_transfer_adapter::worker_count() const {
    return pimpl_->worker_count;
}

bool thread_system_transfer_adapter::is_running() const {
    return pimpl_->pool != nullptr;
}

size_t thread_system_transfer_adapter::pending_tasks() const {
    if (pimpl_->pool) {
        auto queue = pimpl_->pool->get_job_queue();
        return queue ? queue->size() : 0;
    }
    return 0;
}

size_t thread_system_transfer_adapter::pending_tasks(
    const std::string& stage_name) const {
    return pimpl_->tracker->count(stage_name);
}

std::string thread_system_transfer_adapter::pool_name() const {
    return pimpl_->pool_name;
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// async_transfer_pool implementation
// ============================================================================

// Shared with running tasks so a task never outlives its counters
struct async_transfer_pool::impl {
    struct counters {
        std::atomic<size_t> active_tasks{0};
        stage_tracker tracker;
    };

    size_t worker_count{0};
    std::shared_ptr<counters> state = std::make_shared<counters>();
};

async_transfer_pool::async_transfer_pool(size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->worker_count = resolve_worker_count(worker_count);
}

async_transfer_pool::~async_transfer_pool() = default;

std::future<void> async_transfer_pool::submit(std::function<void()> task) {
    auto state = pimpl_->state;
    state->active_tasks.fetch_add(1, std::memory_order_relaxed);

    return std::async(std::launch::async, [state, task = std::move(task)]() {
        try {
            task();
        } catch (...) {
            state->active_tasks.fetch_sub(1, std::memory_order_relaxed);
            throw;
        }
        state->active_tasks.fetch_sub(1, std::memory_order_relaxed);
    });
}

std::future<void> async_transfer_pool::submit_to_stage(
    std::function<void()> task, const std::string& stage_name) {
    auto state = pimpl_->state;
    state->tracker.increment(stage_name);
    state->active_tasks.fetch_add(1, std::memory_order_relaxed);

    return std::async(std::launch::async,
                      [state, task = std::move(task), stage = stage_name]() {
                          try {
                              task();
                          } catch (...) {
                              state->active_tasks.fetch_sub(1, std::memory_order_relaxed);
                              state->tracker.decrement(stage);
                              throw;
                          }
                          state->active_tasks.fetch_sub(1, std::memory_order_relaxed);
                          state->tracker.decrement(stage);
                      });
}

size_t async_transfer_pool::worker_count() const {
    return pimpl_->worker_count;
}

bool async_transfer_pool::is_running() const { return true; }

size_t async_transfer_pool::pending_tasks() const {
    return pimpl_->state->active_tasks.load(std::memory_order_relaxed);
}

size_t async_transfer_pool::pending_tasks(const std::string& stage_name) const {
    return pimpl_->state->tracker.count(stage_name);
}

// ============================================================================
// transfer_pool_factory implementation
// ============================================================================

std::shared_ptr<transfer_thread_pool_interface> transfer_pool_factory::create(
    size_t worker_count, const std::string& pool_name) {
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_transfer_adapter::create_default(worker_count, pool_name);
#else
    (void)pool_name;
    return std::make_shared<async_transfer_pool>(worker_count);
#endif
}

}  // namespace kcenon::transfer_engine::adapters
