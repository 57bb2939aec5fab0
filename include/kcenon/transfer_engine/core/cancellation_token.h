/**
 * @file cancellation_token.h
 * @brief Shared cancellation flag observed by running transfer units
 */

#ifndef KCENON_TRANSFER_ENGINE_CORE_CANCELLATION_TOKEN_H
#define KCENON_TRANSFER_ENGINE_CORE_CANCELLATION_TOKEN_H

#include <kcenon/transfer_engine/core/types.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>

namespace kcenon::transfer_engine {

/**
 * @brief Cooperative cancellation flag
 *
 * Copies share the same state. The first cancel() records its reason; later
 * calls are ignored. Units poll is_cancelled() at chunk boundaries.
 */
class cancellation_token {
public:
    cancellation_token() : state_(std::make_shared<state>()) {}

    void cancel(struct error reason = error(error_code::transfer_cancelled)) {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->cancelled.load()) {
            return;
        }
        state_->reason = std::move(reason);
        state_->cancelled.store(true);
    }

    [[nodiscard]] auto is_cancelled() const noexcept -> bool {
        return state_->cancelled.load();
    }

    [[nodiscard]] auto reason() const -> std::optional<struct error> {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->reason;
    }

private:
    struct state {
        std::atomic<bool> cancelled{false};
        std::optional<struct error> reason;
        mutable std::mutex mutex;
    };

    std::shared_ptr<state> state_;
};

}  // namespace kcenon::transfer_engine

#endif  // KCENON_TRANSFER_ENGINE_CORE_CANCELLATION_TOKEN_H
