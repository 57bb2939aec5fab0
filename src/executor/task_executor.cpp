/**
 * @file task_executor.cpp
 * @brief Implementation of the bounded worker pool for transfer units
 */

#include <kcenon/transfer_engine/executor/task_executor.h>

#include <kcenon/transfer_engine/adapters/thread_pool_adapter.h>
#include <kcenon/transfer_engine/core/logging.h>
#include <kcenon/transfer_engine/manifest/manifest_store.h>
#include <kcenon/transfer_engine/progress/progress_reporter.h>

#include <condition_variable>
#include <deque>
#include <exception>
#include <future>
#include <mutex>
#include <optional>
#include <unordered_set>
#include <vector>

namespace kcenon::transfer_engine {

namespace {

constexpr const char* worker_stage = "transfer_worker";

struct queued_unit {
    unit_id id;
    transfer_unit unit;
};

auto make_context(const transfer_unit& unit, unit_id id, uint32_t attempt)
    -> transfer_log_context {
    transfer_log_context ctx;
    ctx.unit_id = id.value;
    ctx.source = unit.source();
    ctx.destination = unit.destination();
    ctx.attempt = attempt;
    return ctx;
}

}  // namespace

struct task_executor::impl {
    executor_config config;
    unit_function execute;
    executor_sinks sinks;

    std::shared_ptr<adapters::transfer_thread_pool_interface> pool;
    std::vector<std::future<void>> workers;
    bool joined = false;

    cancellation_token cancel_token;

    mutable std::mutex mutex;
    std::condition_variable work_cv;     // workers: runnable unit, close or cancel
    std::condition_variable space_cv;    // submitters: queue below max_pending
    std::condition_variable backoff_cv;  // retry waits, woken by cancel
    std::deque<queued_unit> pending;
    std::unordered_set<unit_identity> running;
    bool closed = false;
    uint64_t next_id = 1;
    std::optional<error> fatal;
    executor_statistics stats;

    // Serializes terminal forwarding so manifest rows follow termination order.
    std::mutex forward_mutex;

    impl(executor_config cfg, unit_function fn, executor_sinks s)
        : config(std::move(cfg)), execute(std::move(fn)), sinks(std::move(s)) {}

    [[nodiscard]] auto is_retryable(const error& e) const -> bool {
        if (config.retryable_classifier) {
            return config.retryable_classifier(e);
        }
        return is_retryable_error(e.code);
    }

    [[nodiscard]] auto is_fatal(const error& e) const -> bool {
        if (config.fatal_classifier) {
            return config.fatal_classifier(e);
        }
        return is_batch_fatal_error(e.code);
    }

    void request_cancel(error reason) {
        bool first = !cancel_token.is_cancelled();
        cancel_token.cancel(reason);

        std::size_t dropped = 0;
        {
            std::lock_guard<std::mutex> lock(mutex);
            dropped = pending.size();
            stats.dropped += dropped;
            pending.clear();
        }
        work_cv.notify_all();
        space_cv.notify_all();
        backoff_cv.notify_all();

        if (first) {
            TE_LOG_WARN(log_category::executor,
                        "cancelling batch (" + reason.describe() + "), dropped " +
                            std::to_string(dropped) + " queued unit(s)");
        }
    }

    void record_fatal(const error& e) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!fatal) {
                fatal = e;
            }
        }
        TE_LOG_ERROR(log_category::executor, "fatal error: " + e.describe());
        request_cancel(e);
    }

    /**
     * @brief Take the first queued unit whose identity is not running
     */
    auto take_runnable_locked() -> std::optional<queued_unit> {
        for (auto it = pending.begin(); it != pending.end(); ++it) {
            if (running.count(it->unit.identity()) == 0) {
                queued_unit item = std::move(*it);
                pending.erase(it);
                running.insert(item.unit.identity());
                ++stats.executing;
                stats.peak_executing = std::max(stats.peak_executing, stats.executing);
                return item;
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] auto has_runnable_locked() const -> bool {
        for (const auto& item : pending) {
            if (running.count(item.unit.identity()) == 0) {
                return true;
            }
        }
        return false;
    }

    auto attempt(const queued_unit& item, uint32_t attempt_no) -> transfer_result {
        unit_context ctx;
        ctx.attempt = attempt_no;
        ctx.cancel = cancel_token;
        if (sinks.progress) {
            auto progress = sinks.progress;
            auto id = item.id;
            ctx.on_progress = [progress, id](uint64_t bytes, std::optional<uint64_t> total) {
                progress->report(id, bytes, total);
            };
        }

        auto start = std::chrono::system_clock::now();
        try {
            return execute(item.unit, ctx);
        } catch (const std::exception& e) {
            auto log_ctx = make_context(item.unit, item.id, attempt_no);
            log_ctx.error_message = e.what();
            TE_LOG_ERROR_CTX(log_category::executor, "unit execution threw", log_ctx);
            return transfer_result::make_error(
                item.unit,
                error(error_code::internal_error, std::string("unit execution threw: ") + e.what()),
                0, start, std::chrono::system_clock::now());
        }
    }

    /**
     * @brief Wait out a backoff delay; false when cancelled meanwhile
     */
    auto backoff(std::chrono::milliseconds delay) -> bool {
        std::unique_lock<std::mutex> lock(mutex);
        backoff_cv.wait_for(lock, delay, [this] { return cancel_token.is_cancelled(); });
        return !cancel_token.is_cancelled();
    }

    auto run_with_retries(const queued_unit& item) -> transfer_result {
        uint32_t attempt_no = 0;
        while (true) {
            auto outcome = attempt(item, attempt_no);
            outcome.retries = attempt_no;

            if (!outcome.is_error() || !outcome.err) {
                return outcome;
            }
            const auto& err = *outcome.err;

            if (is_fatal(err)) {
                record_fatal(err);
                return outcome;
            }
            if (cancel_token.is_cancelled() || !is_retryable(err) ||
                attempt_no >= config.retry.max_retries) {
                return outcome;
            }

            ++attempt_no;
            auto delay = config.retry.delay_for(attempt_no);
            {
                std::lock_guard<std::mutex> lock(mutex);
                ++stats.retried;
            }

            auto log_ctx = make_context(item.unit, item.id, attempt_no);
            log_ctx.error_message = err.describe();
            TE_LOG_WARN_CTX(log_category::executor,
                            "retrying in " + std::to_string(delay.count()) + "ms", log_ctx);

            if (!backoff(delay)) {
                return outcome;
            }
        }
    }

    void forward(const queued_unit& item, const transfer_result& outcome) {
        std::lock_guard<std::mutex> lock(forward_mutex);

        if (sinks.manifest) {
            auto appended = sinks.manifest->append(outcome);
            if (!appended) {
                record_fatal(appended.error());
            }
        }
        if (sinks.progress) {
            sinks.progress->complete_unit(item.id, outcome.status, outcome.bytes_transferred);
        }
        if (sinks.on_result) {
            try {
                sinks.on_result(outcome);
            } catch (const std::exception& e) {
                TE_LOG_WARN(log_category::executor,
                            std::string("result observer threw: ") + e.what());
            }
        }
    }

    void finish(const queued_unit& item, const transfer_result& outcome) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            running.erase(item.unit.identity());
            --stats.executing;
            ++stats.completed;
            switch (outcome.status) {
                case transfer_status::ok:
                    ++stats.ok;
                    stats.bytes_transferred += outcome.bytes_transferred;
                    break;
                case transfer_status::skipped:
                    ++stats.skipped;
                    break;
                case transfer_status::error:
                    ++stats.failed;
                    break;
            }
        }
        work_cv.notify_all();
    }

    void worker_loop() {
        while (true) {
            std::optional<queued_unit> item;
            {
                std::unique_lock<std::mutex> lock(mutex);
                work_cv.wait(lock, [this] {
                    return cancel_token.is_cancelled() || (closed && pending.empty()) ||
                           has_runnable_locked();
                });
                if (cancel_token.is_cancelled() || (closed && pending.empty())) {
                    return;
                }
                item = take_runnable_locked();
            }
            if (!item) {
                continue;
            }
            space_cv.notify_one();

            auto outcome = run_with_retries(*item);

            auto log_ctx = make_context(item->unit, item->id, outcome.retries);
            log_ctx.bytes_transferred = outcome.bytes_transferred;
            log_ctx.duration_ms = static_cast<uint64_t>(outcome.elapsed().count());
            if (outcome.is_error() && outcome.err) {
                log_ctx.error_message = outcome.err->describe();
                TE_LOG_INFO_CTX(log_category::executor, "unit failed", log_ctx);
            } else {
                TE_LOG_DEBUG_CTX(log_category::executor,
                                 "unit finished: " + std::string(to_string(outcome.status)),
                                 log_ctx);
            }

            forward(*item, outcome);
            finish(*item, outcome);
        }
    }

    auto join() -> void {
        if (joined) {
            return;
        }
        joined = true;
        for (auto& worker : workers) {
            try {
                worker.get();
            } catch (const std::exception& e) {
                record_fatal(error(error_code::internal_error,
                                   std::string("worker failed: ") + e.what()));
            }
        }
        workers.clear();
        pool.reset();
    }
};

task_executor::task_executor(executor_config config, unit_function execute,
                             executor_sinks sinks)
    : impl_(std::make_unique<impl>(std::move(config), std::move(execute), std::move(sinks))) {}

task_executor::~task_executor() {
    if (impl_ && !impl_->joined) {
        bool drained = false;
        {
            std::lock_guard<std::mutex> lock(impl_->mutex);
            drained = impl_->closed && impl_->pending.empty() && impl_->stats.executing == 0;
        }
        if (!drained) {
            impl_->request_cancel(error(error_code::transfer_cancelled, "executor destroyed"));
        }
        impl_->join();
    }
}

auto task_executor::create(executor_config config, unit_function execute, executor_sinks sinks)
    -> result<std::unique_ptr<task_executor>> {
    auto valid = config.validate();
    if (!valid) {
        return unexpected(valid.error());
    }
    if (!execute) {
        return unexpected(error(error_code::invalid_argument, "unit function is empty"));
    }

    std::unique_ptr<task_executor> executor(
        new task_executor(std::move(config), std::move(execute), std::move(sinks)));
    auto& state = *executor->impl_;

    auto workers = state.config.max_concurrency;
    state.pool = adapters::transfer_pool_factory::create(workers, "transfer_executor");
    if (!state.pool || !state.pool->is_running()) {
        return unexpected(error(error_code::internal_error, "failed to start worker pool"));
    }

    state.workers.reserve(workers);
    for (std::size_t i = 0; i < workers; ++i) {
        auto* target = &state;
        state.workers.push_back(
            state.pool->submit_to_stage([target]() { target->worker_loop(); }, worker_stage));
    }

    TE_LOG_INFO(log_category::executor,
                "executor started with " + std::to_string(workers) + " worker(s)" +
                    (adapters::transfer_pool_factory::has_thread_system() ? " (thread_system)"
                                                                          : ""));
    return executor;
}

auto task_executor::submit(transfer_unit unit) -> result<unit_id> {
    unit_id id;
    {
        std::unique_lock<std::mutex> lock(impl_->mutex);
        if (impl_->config.max_pending > 0) {
            impl_->space_cv.wait(lock, [this] {
                return impl_->cancel_token.is_cancelled() || impl_->closed ||
                       impl_->pending.size() < impl_->config.max_pending;
            });
        }
        if (impl_->cancel_token.is_cancelled()) {
            auto reason = impl_->cancel_token.reason();
            return unexpected(error(error_code::executor_closed,
                                    "executor cancelled: " +
                                        (reason ? reason->describe() : std::string("unknown"))));
        }
        if (impl_->closed) {
            return unexpected(error(error_code::executor_closed, "executor is closed"));
        }

        id = unit_id{impl_->next_id++};
        if (impl_->sinks.progress) {
            impl_->sinks.progress->register_unit(id, unit.expected_length());
        }
        impl_->pending.push_back(queued_unit{id, std::move(unit)});
        ++impl_->stats.submitted;
    }
    impl_->work_cv.notify_all();
    return id;
}

void task_executor::close() {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (impl_->closed) {
            return;
        }
        impl_->closed = true;
    }
    impl_->work_cv.notify_all();
    impl_->space_cv.notify_all();
}

auto task_executor::wait() -> result<void> {
    close();
    impl_->join();

    auto stats = statistics();
    TE_LOG_INFO(log_category::executor,
                "executor drained: " + std::to_string(stats.ok) + " ok, " +
                    std::to_string(stats.skipped) + " skipped, " +
                    std::to_string(stats.failed) + " failed, " +
                    std::to_string(stats.dropped) + " dropped, " +
                    std::to_string(stats.retried) + " retries, peak concurrency " +
                    std::to_string(stats.peak_executing));

    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->fatal) {
        return unexpected(*impl_->fatal);
    }
    if (impl_->cancel_token.is_cancelled()) {
        auto reason = impl_->cancel_token.reason();
        return unexpected(reason ? *reason : error(error_code::transfer_cancelled));
    }
    return {};
}

void task_executor::cancel(error reason) {
    impl_->request_cancel(std::move(reason));
}

auto task_executor::is_cancelled() const -> bool {
    return impl_->cancel_token.is_cancelled();
}

auto task_executor::cancellation() const -> cancellation_token {
    return impl_->cancel_token;
}

auto task_executor::statistics() const -> executor_statistics {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->stats;
}

auto task_executor::config() const -> const executor_config& {
    return impl_->config;
}

}  // namespace kcenon::transfer_engine
