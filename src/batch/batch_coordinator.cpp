/**
 * @file batch_coordinator.cpp
 * @brief Implementation of the batch driver
 */

#include <kcenon/transfer_engine/batch/batch_coordinator.h>

#include <kcenon/transfer_engine/core/checksum.h>
#include <kcenon/transfer_engine/core/logging.h>
#include <kcenon/transfer_engine/manifest/manifest_store.h>

#include <map>
#include <mutex>
#include <sstream>
#include <utility>

namespace kcenon::transfer_engine {

namespace {

/**
 * @brief Promote a probe failure to a batch-fatal error
 */
auto probe_failure(const error& e, std::string_view role, error_code fallback) -> error {
    if (is_batch_fatal_error(e.code)) {
        return error(e.code, std::string(role) + " backend probe failed: " + e.message);
    }
    return error(fallback, std::string(role) + " backend probe failed: " + e.describe());
}

}  // namespace

// ============================================================================
// batch_summary
// ============================================================================

auto batch_summary::format_summary() const -> std::string {
    std::ostringstream oss;
    oss << "Transferred " << total_units << " unit(s): " << ok << " OK, " << skipped
        << " skipped";
    if (resumed > 0) {
        oss << " (" << resumed << " already completed)";
    }
    oss << ", " << errors << " failed, " << not_started << " not started; "
        << format_bytes(bytes_transferred) << " in " << format_duration(duration);
    if (retries > 0) {
        oss << ", " << retries << " retries";
    }
    if (assembled > 0) {
        oss << ", " << assembled << " split object(s) assembled";
    }
    if (cancelled) {
        oss << " [cancelled]";
    }
    oss << "\n";

    if (!failures.empty()) {
        oss << "Failed transfers:\n";
        for (const auto& failure : failures) {
            oss << "  " << failure.source << " -> " << failure.destination;
            if (failure.range) {
                oss << " [" << failure.range->to_string() << "]";
            }
            oss << ": " << failure.err.describe();
            if (failure.retries > 0) {
                oss << " (after " << failure.retries << " retries)";
            }
            oss << "\n";
        }
    }
    return oss.str();
}

// ============================================================================
// batch_coordinator::impl
// ============================================================================

struct batch_coordinator::impl {
    batch_config config;
    std::shared_ptr<storage_backend> source;
    std::shared_ptr<storage_backend> destination;
    unit_function execute;

    std::mutex run_mutex;

    // Guards active_executor and pending_cancel.
    std::mutex executor_mutex;
    task_executor* active_executor = nullptr;
    bool pending_cancel = false;

    impl(batch_config cfg, std::shared_ptr<storage_backend> src,
         std::shared_ptr<storage_backend> dst, unit_function fn)
        : config(std::move(cfg)),
          source(std::move(src)),
          destination(std::move(dst)),
          execute(std::move(fn)) {}

    using object_key = std::pair<std::string, std::string>;

    /**
     * @brief Ranges of one split object still to be accounted for
     */
    struct split_object {
        transfer_unit whole;
        uint64_t size = 0;
        std::size_t ranges = 0;
        std::size_t done = 0;
        bool failed = false;
    };

    /**
     * @brief Per-run bookkeeping shared with the result observer
     */
    struct run_state {
        std::mutex mutex;
        std::vector<failed_transfer> failures;
        std::map<object_key, split_object> splits;
        uint64_t resumed = 0;
        uint64_t rejected = 0;
        uint64_t unsubmitted = 0;
        uint64_t unfinalized = 0;  // split objects whose assembled copy failed verification
    };

    /**
     * @brief Publishes the executor to cancel() for the scope of one run
     *
     * A cancel() that arrived before the executor existed is applied here.
     */
    class executor_registration {
    public:
        executor_registration(impl& owner, task_executor& executor) : owner_(owner) {
            std::lock_guard<std::mutex> lock(owner_.executor_mutex);
            owner_.active_executor = &executor;
            if (owner_.pending_cancel) {
                owner_.pending_cancel = false;
                executor.cancel(user_cancel());
            }
        }

        ~executor_registration() {
            std::lock_guard<std::mutex> lock(owner_.executor_mutex);
            owner_.active_executor = nullptr;
        }

        executor_registration(const executor_registration&) = delete;
        auto operator=(const executor_registration&) -> executor_registration& = delete;

    private:
        impl& owner_;
    };

    static auto user_cancel() -> error {
        return error(error_code::transfer_cancelled, "batch cancelled by user");
    }

    void cancel() {
        std::lock_guard<std::mutex> lock(executor_mutex);
        if (active_executor) {
            active_executor->cancel(user_cancel());
        } else {
            pending_cancel = true;
        }
    }

    auto probe_backends() -> result<void> {
        auto src = source->probe();
        if (!src) {
            return unexpected(probe_failure(src.error(), "source", error_code::fatal_error));
        }
        auto dst = destination->probe();
        if (!dst) {
            return unexpected(
                probe_failure(dst.error(), "destination", error_code::destination_unreachable));
        }
        return {};
    }

    /**
     * @brief Empty the destination of a split object before its ranges land
     *
     * Ranged writes keep existing bytes, so a longer leftover object
     * would otherwise survive past the new end.
     */
    auto prepare_destination(const transfer_request& request) -> result<void> {
        write_options options;
        options.metadata = request.metadata;
        auto writer = destination->open_write_stream(request.destination, options);
        if (!writer) {
            return unexpected(writer.error());
        }
        return writer.value()->close();
    }

    /**
     * @brief Expand one request into its units
     */
    auto plan_units(const transfer_request& request, const completed_set& completed,
                    run_state& state) -> result<std::vector<transfer_unit>> {
        std::vector<transfer_unit> units;

        auto whole = [&]() -> result<void> {
            auto unit = transfer_unit::create(request.source, request.destination, request.range,
                                              request.expected_size, request.content_hash,
                                              request.metadata);
            if (!unit) {
                return unexpected(unit.error());
            }
            units.push_back(std::move(unit.value()));
            return {};
        };

        // An assembled object is resumed as one unit.
        if (!config.split || request.range ||
            completed.contains(request.source, request.destination)) {
            if (auto r = whole(); !r) return unexpected(r.error());
            return units;
        }

        // An existing destination under no_clobber is skipped as one unit.
        if (config.runner.no_clobber) {
            auto exists = destination->exists(request.destination);
            if (exists && exists.value()) {
                if (auto r = whole(); !r) return unexpected(r.error());
                return units;
            }
        }

        auto size = request.expected_size;
        if (!size) {
            auto st = source->stat(request.source);
            if (!st) {
                // The runner reports the stat failure for the whole unit.
                if (auto r = whole(); !r) return unexpected(r.error());
                return units;
            }
            size = st.value().size;
        }

        range_splitter splitter(*config.split);
        auto ranges = splitter.split(*size);
        if (ranges.empty()) {
            if (auto r = whole(); !r) return unexpected(r.error());
            return units;
        }

        auto object = transfer_unit::create(request.source, request.destination, std::nullopt,
                                            size, request.content_hash, request.metadata);
        if (!object) {
            return unexpected(object.error());
        }

        bool fresh = true;
        for (const auto& range : ranges) {
            auto unit = transfer_unit::create(request.source, request.destination, range, size,
                                              request.content_hash, request.metadata);
            if (!unit) {
                return unexpected(unit.error());
            }
            if (completed.ranges.count(unit.value().identity()) > 0) {
                fresh = false;
            }
            units.push_back(std::move(unit.value()));
        }

        if (fresh) {
            if (auto prepared = prepare_destination(request); !prepared) {
                return unexpected(prepared.error());
            }
        }

        TE_LOG_DEBUG(log_category::coordinator,
                     "splitting " + request.source + " (" + std::to_string(*size) +
                         " bytes) into " + std::to_string(ranges.size()) + " ranges");

        std::lock_guard<std::mutex> lock(state.mutex);
        object_key key{request.source, request.destination};
        auto tracked = state.splits.find(key);
        if (tracked == state.splits.end()) {
            state.splits.emplace(
                key, split_object{std::move(object.value()), *size, units.size(), 0, false});
        } else {
            tracked->second.ranges += units.size();
        }
        return units;
    }

    /**
     * @brief Count one range of a split object as settled
     */
    static void settle_range(run_state& state, const transfer_unit& unit, bool succeeded) {
        if (!unit.is_ranged()) {
            return;
        }
        std::lock_guard<std::mutex> lock(state.mutex);
        auto tracked = state.splits.find(object_key{unit.source(), unit.destination()});
        if (tracked == state.splits.end()) {
            return;
        }
        if (succeeded) {
            ++tracked->second.done;
        } else {
            tracked->second.failed = true;
        }
    }

    auto digest_destination(const std::string& locator) -> result<std::string> {
        auto reader = destination->open_read_stream(locator, 0, std::nullopt);
        if (!reader) {
            return unexpected(reader.error());
        }
        md5_hasher hasher;
        std::vector<std::byte> buffer(config.runner.chunk_size);
        while (true) {
            auto got = reader.value()->read(buffer);
            if (!got) {
                return unexpected(got.error());
            }
            if (got.value() == 0) {
                break;
            }
            if (!hasher.update(std::span<const std::byte>(buffer.data(), got.value()))) {
                return unexpected(error(error_code::internal_error, "md5 update failed"));
            }
        }
        return hasher.finalize();
    }

    /**
     * @brief Verify an object whose ranges all landed
     *
     * Checks the assembled size and, when verification is on, the
     * content hash. The result is recorded as one row without a range.
     */
    auto finalize_object(const split_object& object) -> transfer_result {
        const auto& unit = object.whole;
        auto start = std::chrono::system_clock::now();
        auto fail = [&](error e) {
            return transfer_result::make_error(unit, std::move(e), 0, start,
                                               std::chrono::system_clock::now());
        };

        auto st = destination->stat(unit.destination());
        if (!st) {
            return fail(st.error());
        }
        if (st.value().size != object.size) {
            return fail(error(error_code::incomplete_transfer,
                              "assembled size=" + std::to_string(st.value().size) +
                                  ", expected=" + std::to_string(object.size)));
        }

        auto digest = st.value().md5;
        if (!digest && config.runner.verify_checksum) {
            auto computed = digest_destination(unit.destination());
            if (!computed) {
                return fail(computed.error());
            }
            digest = computed.value();
        }

        if (config.runner.verify_checksum && unit.content_hash() && digest &&
            !checksum::digests_equal(*digest, *unit.content_hash())) {
            return fail(error(error_code::checksum_mismatch,
                              "expected md5 " + *unit.content_hash() + ", assembled object has " +
                                  *digest));
        }

        auto result = transfer_result::make_ok(unit, object.size, start,
                                               std::chrono::system_clock::now());
        result.md5 = digest;
        result.source_size = object.size;
        result.description = "assembled from " + std::to_string(object.ranges) + " ranges";
        return result;
    }

    /**
     * @brief Finalize every split object whose ranges all succeeded
     * @return Number of objects assembled, or a manifest write failure
     */
    auto finalize_split_objects(run_state& state, manifest_store* manifest)
        -> result<uint64_t> {
        std::map<object_key, split_object> splits;
        {
            std::lock_guard<std::mutex> lock(state.mutex);
            splits = std::move(state.splits);
        }

        uint64_t assembled = 0;
        for (const auto& [key, object] : splits) {
            if (object.failed || object.done < object.ranges) {
                continue;
            }
            auto outcome = finalize_object(object);
            if (outcome.is_ok()) {
                ++assembled;
                TE_LOG_DEBUG(log_category::coordinator,
                             "assembled " + key.second + ": " + outcome.description);
            } else {
                TE_LOG_ERROR(log_category::coordinator,
                             "cannot finalize " + key.second + ": " + outcome.err->describe());
                std::lock_guard<std::mutex> lock(state.mutex);
                ++state.unfinalized;
                state.failures.push_back(failed_transfer{key.first, key.second, std::nullopt,
                                                         *outcome.err, 0});
            }
            if (manifest) {
                if (auto appended = manifest->append(outcome); !appended) {
                    return unexpected(appended.error());
                }
            }
        }
        return assembled;
    }

    /**
     * @brief Record a request that could not become a unit
     */
    void reject(const transfer_request& request, const error& e, manifest_store* manifest,
                run_state& state) {
        TE_LOG_ERROR(log_category::coordinator, "rejected request " + request.source + " -> " +
                                                    request.destination + ": " + e.describe());
        if (manifest) {
            manifest_entry entry;
            entry.source = request.source;
            entry.destination = request.destination;
            entry.start_time = std::chrono::system_clock::now();
            entry.end_time = entry.start_time;
            entry.source_size = request.expected_size;
            entry.status = transfer_status::error;
            entry.description = e.describe();
            auto appended = manifest->append(entry);
            if (!appended) {
                TE_LOG_ERROR(log_category::coordinator, appended.error().describe());
            }
        }

        std::lock_guard<std::mutex> lock(state.mutex);
        ++state.rejected;
        state.failures.push_back(
            failed_transfer{request.source, request.destination, request.range, e, 0});
    }

    void notify_observer(const transfer_result& outcome) {
        if (!config.on_result) {
            return;
        }
        try {
            config.on_result(outcome);
        } catch (const std::exception& e) {
            TE_LOG_WARN(log_category::coordinator,
                        std::string("result observer threw: ") + e.what());
        }
    }

    /**
     * @brief Pull requests and submit their units until the source ends
     */
    auto feed(request_source& next, task_executor& executor, const completed_set& completed,
              manifest_store* manifest, run_state& state) -> result<void> {
        while (!executor.is_cancelled()) {
            std::optional<transfer_request> request;
            try {
                request = next();
            } catch (const std::exception& e) {
                error failure(error_code::internal_error,
                              std::string("request source threw: ") + e.what());
                executor.cancel(failure);
                return unexpected(failure);
            }
            if (!request) {
                break;
            }

            auto planned = plan_units(*request, completed, state);
            if (!planned) {
                reject(*request, planned.error(), manifest, state);
                continue;
            }

            auto& units = planned.value();
            for (std::size_t i = 0; i < units.size(); ++i) {
                auto& unit = units[i];
                if (!completed.empty() && completed.contains(unit)) {
                    TE_LOG_DEBUG(log_category::coordinator,
                                 "already completed, skipping: " + unit.identity().to_string());
                    {
                        std::lock_guard<std::mutex> lock(state.mutex);
                        ++state.resumed;
                    }
                    settle_range(state, unit, true);
                    notify_observer(transfer_result::make_skipped(
                        unit, "already completed according to manifest",
                        std::chrono::system_clock::now()));
                    continue;
                }

                auto submitted = executor.submit(std::move(unit));
                if (!submitted) {
                    std::lock_guard<std::mutex> lock(state.mutex);
                    state.unsubmitted += units.size() - i;
                    break;
                }
            }
        }
        return {};
    }

    auto run(request_source& next) -> result<batch_summary> {
        auto started = std::chrono::steady_clock::now();

        TE_LOG_INFO(log_category::coordinator,
                    std::string("starting batch: ") + std::string(source->name()) + " -> " +
                        std::string(destination->name()) + ", " +
                        std::to_string(config.executor.max_concurrency) + " worker(s)");

        if (auto probed = probe_backends(); !probed) {
            TE_LOG_ERROR(log_category::coordinator, probed.error().describe());
            return unexpected(probed.error());
        }

        completed_set completed;
        if (config.resume && config.manifest_path) {
            auto loaded = manifest_store::load_completed(*config.manifest_path);
            if (!loaded) {
                TE_LOG_ERROR(log_category::coordinator,
                             "cannot resume: " + loaded.error().describe());
                return unexpected(loaded.error());
            }
            completed = std::move(loaded.value());
        }

        std::shared_ptr<manifest_store> manifest;
        if (config.manifest_path) {
            auto opened = manifest_store::open(*config.manifest_path);
            if (!opened) {
                TE_LOG_ERROR(log_category::coordinator, opened.error().describe());
                return unexpected(opened.error());
            }
            manifest = std::move(opened.value());
        }

        auto progress = std::make_shared<progress_reporter>(config.progress, config.on_progress);
        if (auto r = progress->start(); !r) {
            return unexpected(r.error());
        }

        auto state = std::make_shared<run_state>();

        executor_config exec_config = config.executor;
        if (!exec_config.retryable_classifier) {
            auto src = source;
            auto dst = destination;
            exec_config.retryable_classifier = [src, dst](const error& e) {
                return src->is_retryable(e) || dst->is_retryable(e);
            };
        }

        executor_sinks sinks;
        sinks.manifest = manifest;
        sinks.progress = progress;
        sinks.on_result = [this, state](const transfer_result& outcome) {
            if (outcome.is_error() && outcome.err) {
                std::lock_guard<std::mutex> lock(state->mutex);
                state->failures.push_back(failed_transfer{
                    outcome.unit.source(), outcome.unit.destination(), outcome.unit.range(),
                    *outcome.err, outcome.retries});
            }
            settle_range(*state, outcome.unit, !outcome.is_error());
            notify_observer(outcome);
        };

        auto created = task_executor::create(exec_config, execute, sinks);
        if (!created) {
            progress->stop();
            return unexpected(created.error());
        }
        auto& executor = *created.value();

        result<void> fed;
        result<void> finished;
        {
            executor_registration registration(*this, executor);
            fed = feed(next, executor, completed, manifest.get(), *state);
            finished = executor.wait();
        }
        progress->stop();

        if (!fed) {
            TE_LOG_ERROR(log_category::coordinator, "batch aborted: " + fed.error().describe());
            return unexpected(fed.error());
        }
        if (!finished && !is_cancellation_error(finished.error().code)) {
            TE_LOG_ERROR(log_category::coordinator,
                         "batch aborted: " + finished.error().describe());
            return unexpected(finished.error());
        }

        auto assembled = finalize_split_objects(*state, manifest.get());
        if (!assembled) {
            TE_LOG_ERROR(log_category::coordinator,
                         "batch aborted: " + assembled.error().describe());
            return unexpected(assembled.error());
        }

        auto stats = executor.statistics();
        batch_summary summary;
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            summary.ok = stats.ok;
            summary.resumed = state->resumed;
            summary.skipped = stats.skipped + state->resumed;
            summary.errors = stats.failed + state->rejected + state->unfinalized;
            summary.not_started = stats.dropped + state->unsubmitted;
            summary.total_units = stats.submitted + state->resumed + state->rejected +
                                  state->unsubmitted;
            summary.retries = stats.retried;
            summary.bytes_transferred = stats.bytes_transferred;
            summary.assembled = assembled.value();
            summary.failures = std::move(state->failures);
        }
        summary.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        summary.cancelled = !finished;

        TE_LOG_INFO(log_category::coordinator, summary.format_summary());
        return summary;
    }
};

// ============================================================================
// batch_coordinator::builder
// ============================================================================

batch_coordinator::builder::builder(std::shared_ptr<storage_backend> source,
                                    std::shared_ptr<storage_backend> destination)
    : source_(std::move(source)), destination_(std::move(destination)) {}

auto batch_coordinator::builder::with_config(batch_config config) -> builder& {
    config_ = std::move(config);
    return *this;
}

auto batch_coordinator::builder::with_max_concurrency(std::size_t workers) -> builder& {
    config_.executor.max_concurrency = workers;
    return *this;
}

auto batch_coordinator::builder::with_retry_policy(retry_policy policy) -> builder& {
    config_.executor.retry = policy;
    return *this;
}

auto batch_coordinator::builder::with_max_pending(std::size_t limit) -> builder& {
    config_.executor.max_pending = limit;
    return *this;
}

auto batch_coordinator::builder::with_manifest(std::filesystem::path path) -> builder& {
    config_.manifest_path = std::move(path);
    return *this;
}

auto batch_coordinator::builder::with_resume(bool enable) -> builder& {
    config_.resume = enable;
    return *this;
}

auto batch_coordinator::builder::with_range_split(range_split_policy policy) -> builder& {
    config_.split = policy;
    return *this;
}

auto batch_coordinator::builder::with_chunk_size(std::size_t size) -> builder& {
    config_.runner.chunk_size = size;
    return *this;
}

auto batch_coordinator::builder::with_checksum_verification(bool enable) -> builder& {
    config_.runner.verify_checksum = enable;
    return *this;
}

auto batch_coordinator::builder::with_no_clobber(bool enable) -> builder& {
    config_.runner.no_clobber = enable;
    return *this;
}

auto batch_coordinator::builder::with_progress_callback(progress_callback callback)
    -> builder& {
    config_.on_progress = std::move(callback);
    return *this;
}

auto batch_coordinator::builder::with_progress_interval(std::chrono::milliseconds interval)
    -> builder& {
    config_.progress.tick_interval = interval;
    return *this;
}

auto batch_coordinator::builder::with_result_observer(result_observer observer) -> builder& {
    config_.on_result = std::move(observer);
    return *this;
}

auto batch_coordinator::builder::with_unit_function(unit_function execute) -> builder& {
    execute_ = std::move(execute);
    return *this;
}

auto batch_coordinator::builder::build() -> result<batch_coordinator> {
    if (!source_ || !destination_) {
        return unexpected(
            error(error_code::invalid_argument, "source and destination backends are required"));
    }
    if (auto valid = config_.validate(); !valid) {
        return unexpected(valid.error());
    }

    auto execute = execute_;
    if (!execute) {
        auto runner = std::make_shared<unit_runner>(source_, destination_, config_.runner);
        execute = [runner](const transfer_unit& unit, unit_context& ctx) {
            return runner->run(unit, ctx);
        };
    }

    return batch_coordinator{std::move(config_), source_, destination_, std::move(execute)};
}

// ============================================================================
// batch_coordinator
// ============================================================================

batch_coordinator::batch_coordinator(batch_config config,
                                     std::shared_ptr<storage_backend> source,
                                     std::shared_ptr<storage_backend> destination,
                                     unit_function execute)
    : impl_(std::make_unique<impl>(std::move(config), std::move(source),
                                   std::move(destination), std::move(execute))) {}

batch_coordinator::batch_coordinator(batch_coordinator&&) noexcept = default;
auto batch_coordinator::operator=(batch_coordinator&&) noexcept -> batch_coordinator& = default;
batch_coordinator::~batch_coordinator() = default;

auto batch_coordinator::run(const std::vector<transfer_request>& requests)
    -> result<batch_summary> {
    std::size_t index = 0;
    return run([&requests, &index]() -> std::optional<transfer_request> {
        if (index >= requests.size()) {
            return std::nullopt;
        }
        return requests[index++];
    });
}

auto batch_coordinator::run(request_source next) -> result<batch_summary> {
    if (!next) {
        return unexpected(error(error_code::invalid_argument, "request source is empty"));
    }
    std::unique_lock<std::mutex> lock(impl_->run_mutex, std::try_to_lock);
    if (!lock.owns_lock()) {
        return unexpected(error(error_code::already_running, "a batch is already running"));
    }
    return impl_->run(next);
}

void batch_coordinator::cancel() {
    impl_->cancel();
}

auto batch_coordinator::config() const -> const batch_config& {
    return impl_->config;
}

}  // namespace kcenon::transfer_engine
