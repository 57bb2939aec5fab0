// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Thread pool adapter for transfer_engine_system
 *
 * Supplies the worker threads of the task executor, supporting both
 * thread_system integration and a standalone fallback.
 *
 * Features:
 * - Stage-based task tracking (e.g. "transfer_worker")
 * - Integration with thread_system when available
 * - Fallback to std::async when thread_system is unavailable
 */

#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "../config/feature_flags.h"

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace kcenon::transfer_engine::adapters {

/**
 * @brief Interface for thread pool operations in transfer_engine_system
 */
class transfer_thread_pool_interface {
public:
    virtual ~transfer_thread_pool_interface() = default;

    /**
     * @brief Submit a task for execution
     * @param task The task to execute
     * @return Future for the task completion
     */
    virtual std::future<void> submit(std::function<void()> task) = 0;

    /**
     * @brief Submit a task to a named stage for tracking
     * @param task The task to execute
     * @param stage_name Name of the stage (e.g., "transfer_worker")
     * @return Future for the task completion
     *
     * @note Execution is the same as submit(); only the per-stage counts
     *       differ.
     */
    virtual std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) = 0;

    [[nodiscard]] virtual size_t worker_count() const = 0;

    [[nodiscard]] virtual bool is_running() const = 0;

    /**
     * @brief Get total number of tasks submitted and not yet finished
     */
    [[nodiscard]] virtual size_t pending_tasks() const = 0;

    /**
     * @brief Get number of unfinished tasks for a specific stage
     */
    [[nodiscard]] virtual size_t pending_tasks(const std::string& stage_name) const = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Adapter that wraps thread_system::thread_pool
 *
 * @note Thread-safe: All public methods are safe to call from multiple threads.
 */
class thread_system_transfer_adapter : public transfer_thread_pool_interface {
public:
    /**
     * @brief Construct with an existing thread_pool
     * @param pool Shared pointer to thread_system's thread_pool
     * @param pool_name Name for identification in logs
     * @param worker_count Number of workers in the pool (for reporting)
     */
    explicit thread_system_transfer_adapter(
        std::shared_ptr<kcenon::thread::thread_pool> pool,
        const std::string& pool_name = "transfer_engine_pool",
        size_t worker_count = 0);

    /**
     * @brief Destructor; stops the pool after queued jobs finish
     */
    ~thread_system_transfer_adapter() override;

    thread_system_transfer_adapter(const thread_system_transfer_adapter&) = delete;
    thread_system_transfer_adapter& operator=(const thread_system_transfer_adapter&) = delete;

    thread_system_transfer_adapter(thread_system_transfer_adapter&&) noexcept;
    thread_system_transfer_adapter& operator=(thread_system_transfer_adapter&&) noexcept;

    /**
     * @brief Create an adapter owning a started pool
     * @param worker_count Number of worker threads (0 = auto-detect from hardware)
     * @param pool_name Name for identification
     */
    [[nodiscard]] static std::shared_ptr<thread_system_transfer_adapter> create_default(
        size_t worker_count = 0,
        const std::string& pool_name = "transfer_engine_pool");

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;
    [[nodiscard]] size_t pending_tasks(const std::string& stage_name) const override;

    [[nodiscard]] std::string pool_name() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Fallback implementation using std::async
 *
 * Every task gets its own std::async thread, so worker_count() only reports
 * the requested size. The executor bounds concurrency itself by submitting
 * exactly that many worker loops.
 */
class async_transfer_pool : public transfer_thread_pool_interface {
public:
    explicit async_transfer_pool(size_t worker_count = 0);
    ~async_transfer_pool() override;

    async_transfer_pool(const async_transfer_pool&) = delete;
    async_transfer_pool& operator=(const async_transfer_pool&) = delete;

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;
    [[nodiscard]] size_t pending_tasks(const std::string& stage_name) const override;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

/**
 * @brief Factory for creating the appropriate thread pool adapter
 *
 * Selects thread_system_transfer_adapter when KCENON_WITH_THREAD_SYSTEM is
 * set, async_transfer_pool otherwise.
 */
class transfer_pool_factory {
public:
    /**
     * @brief Create the best available thread pool adapter
     * @param worker_count Number of worker threads (0 = auto-detect)
     * @param pool_name Name for identification
     */
    [[nodiscard]] static std::shared_ptr<transfer_thread_pool_interface> create(
        size_t worker_count = 0,
        const std::string& pool_name = "transfer_engine_pool");

    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace kcenon::transfer_engine::adapters
