/**
 * @file unit_runner.cpp
 * @brief Implementation of single transfer unit execution
 */

#include <kcenon/transfer_engine/core/unit_runner.h>

#include <kcenon/transfer_engine/core/checksum.h>
#include <kcenon/transfer_engine/core/logging.h>

#include <algorithm>
#include <exception>
#include <vector>

namespace kcenon::transfer_engine {

namespace {

auto now() -> time_point { return std::chrono::system_clock::now(); }

auto make_context(const transfer_unit& unit, const unit_context& ctx) -> transfer_log_context {
    transfer_log_context log_ctx;
    log_ctx.source = unit.source();
    log_ctx.destination = unit.destination();
    log_ctx.attempt = ctx.attempt;
    return log_ctx;
}

auto cancelled_error(const unit_context& ctx) -> error {
    auto reason = ctx.cancel.reason();
    if (reason && reason->code != error_code::transfer_cancelled) {
        return error(error_code::transfer_cancelled, "cancelled: " + reason->describe());
    }
    return error(error_code::transfer_cancelled);
}

}  // namespace

unit_runner::unit_runner(std::shared_ptr<storage_backend> source,
                         std::shared_ptr<storage_backend> destination,
                         runner_config config)
    : source_(std::move(source)), destination_(std::move(destination)), config_(config) {}

auto unit_runner::run(const transfer_unit& unit, unit_context& ctx) const -> transfer_result {
    auto start = now();
    try {
        return run_unchecked(unit, ctx);
    } catch (const std::exception& e) {
        auto log_ctx = make_context(unit, ctx);
        log_ctx.error_message = e.what();
        TE_LOG_ERROR_CTX(log_category::unit, "unexpected exception during transfer", log_ctx);
        return transfer_result::make_error(
            unit, error(error_code::internal_error, std::string("unexpected exception: ") + e.what()),
            0, start, now());
    }
}

auto unit_runner::run_unchecked(const transfer_unit& unit, unit_context& ctx) const
    -> transfer_result {
    auto start = now();
    auto fail = [&](struct error e, uint64_t bytes) {
        auto log_ctx = make_context(unit, ctx);
        log_ctx.bytes_transferred = bytes;
        log_ctx.error_message = e.describe();
        TE_LOG_DEBUG_CTX(log_category::unit, "transfer unit failed", log_ctx);
        return transfer_result::make_error(unit, std::move(e), bytes, start, now());
    };

    if (ctx.cancel.is_cancelled()) {
        return fail(cancelled_error(ctx), 0);
    }

    if (!source_ || !destination_) {
        return fail(error(error_code::not_initialized, "backend not configured"), 0);
    }

    // Ranged units of one object share a destination, so only whole-object
    // units can be judged by existence.
    if (config_.no_clobber && !unit.is_ranged()) {
        auto exists = destination_->exists(unit.destination());
        if (!exists) {
            return fail(exists.error(), 0);
        }
        if (exists.value()) {
            TE_LOG_DEBUG(log_category::unit,
                         "destination exists, skipping: " + unit.destination());
            return transfer_result::make_skipped(unit, "destination already exists", start);
        }
    }

    auto st = source_->stat(unit.source());
    std::optional<uint64_t> total;
    std::optional<std::string> source_md5;
    if (st) {
        total = st.value().size;
        source_md5 = st.value().md5;
    } else if (unit.is_ranged() && unit.expected_size() &&
               unit.range()->start >= *unit.expected_size()) {
        total = unit.expected_size();
    } else {
        return fail(st.error(), 0);
    }

    // Nothing left to fetch in this range.
    if (unit.is_ranged() && unit.range()->start >= *total) {
        auto result = transfer_result::make_ok(unit, *total, start, now());
        result.source_size = st ? std::optional<uint64_t>(*total) : std::nullopt;
        result.description = "range starts past end of object";
        return result;
    }

    uint64_t read_start = unit.is_ranged() ? unit.range()->start : 0;
    uint64_t read_end = unit.is_ranged() ? std::min(unit.range()->end, *total) : *total;
    uint64_t window = read_end - read_start;

    // Per-unit progress never exceeds what this unit is expected to move.
    uint64_t progress_cap = window;
    if (!unit.is_ranged() && unit.expected_size()) {
        progress_cap = *unit.expected_size();
    }

    auto reader = source_->open_read_stream(unit.source(), read_start, read_end);
    if (!reader) {
        return fail(reader.error(), 0);
    }

    write_options options;
    options.offset = read_start;
    options.truncate = !unit.is_ranged();
    options.metadata = unit.metadata();
    auto writer = destination_->open_write_stream(unit.destination(), options);
    if (!writer) {
        return fail(writer.error(), 0);
    }

    bool hash_stream = config_.verify_checksum && !unit.is_ranged();
    md5_hasher hasher;
    std::vector<std::byte> buffer(std::min<uint64_t>(config_.chunk_size, std::max<uint64_t>(window, 1)));
    uint64_t moved = 0;

    while (true) {
        if (ctx.cancel.is_cancelled()) {
            return fail(cancelled_error(ctx), moved);
        }

        auto got = reader.value()->read(buffer);
        if (!got) {
            return fail(got.error(), moved);
        }
        auto count = got.value();
        if (count == 0) {
            break;
        }

        auto chunk = std::span<const std::byte>(buffer.data(), count);
        auto put = writer.value()->write(chunk);
        if (!put) {
            return fail(put.error(), moved);
        }
        if (put.value() != count) {
            return fail(error(error_code::destination_write_error,
                              "short write to " + unit.destination()),
                        moved + put.value());
        }

        if (hash_stream) {
            hasher.update(chunk);
        }
        moved += count;

        if (ctx.on_progress) {
            ctx.on_progress(std::min(moved, progress_cap), progress_cap);
        }
    }

    auto flushed = writer.value()->flush();
    if (!flushed) {
        return fail(flushed.error(), moved);
    }
    auto closed = writer.value()->close();
    if (!closed) {
        return fail(closed.error(), moved);
    }

    if (moved != window) {
        return fail(error(error_code::incomplete_transfer,
                          "Download not completed. Target size=" + std::to_string(window) +
                              ", downloaded data=" + std::to_string(moved)),
                    moved);
    }

    auto result = transfer_result::make_ok(unit, moved, start, start);
    result.source_size = total;

    if (hash_stream) {
        auto digest = hasher.finalize();
        if (digest) {
            result.md5 = digest.value();
        } else {
            TE_LOG_WARN(log_category::unit, "streamed digest unavailable: " +
                                                digest.error().describe());
        }
    } else if (!unit.is_ranged() && source_md5) {
        result.md5 = source_md5;
    }

    if (config_.verify_checksum && unit.content_hash() && !unit.is_ranged()) {
        std::optional<std::string> actual;
        auto dest_stat = destination_->stat(unit.destination());
        if (dest_stat && dest_stat.value().md5) {
            actual = dest_stat.value().md5;
        } else {
            actual = result.md5;
        }

        if (!actual) {
            return fail(error(error_code::checksum_mismatch,
                              "no digest available to verify " + unit.destination()),
                        moved);
        }
        if (!checksum::digests_equal(*actual, *unit.content_hash())) {
            return fail(error(error_code::checksum_mismatch,
                              "expected md5 " + *unit.content_hash() + ", got " + *actual),
                        moved);
        }
    }

    result.end_time = now();

    auto log_ctx = make_context(unit, ctx);
    log_ctx.bytes_transferred = moved;
    log_ctx.total_bytes = window;
    log_ctx.duration_ms = static_cast<uint64_t>(result.elapsed().count());
    TE_LOG_DEBUG_CTX(log_category::unit, "transfer unit completed", log_ctx);
    return result;
}

}  // namespace kcenon::transfer_engine
