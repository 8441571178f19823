#pragma once

#include "blockship/core/result.hpp"

#include <atomic>
#include <chrono>
#include <optional>
#include <string>

namespace blockship {

/**
 * @brief Cooperative cancellation handed to every remote operation
 *
 * Long-running operations (existence checks, uploads) call check() between
 * steps and abort with an error once the context is cancelled or its
 * deadline has passed. cancel() only stores to a lock-free atomic, so it can
 * be called from a signal handler.
 */
class Context {
public:
    Context() = default;

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    static Context with_timeout(std::chrono::steady_clock::duration timeout) {
        Context ctx;
        ctx.deadline_ = std::chrono::steady_clock::now() + timeout;
        return ctx;
    }

    void cancel() noexcept { cancelled_.store(true, std::memory_order_relaxed); }

    [[nodiscard]] bool cancelled() const noexcept {
        if (cancelled_.load(std::memory_order_relaxed)) {
            return true;
        }
        return deadline_.has_value() && std::chrono::steady_clock::now() >= *deadline_;
    }

    [[nodiscard]] Result<void> check() const {
        if (cancelled_.load(std::memory_order_relaxed)) {
            return Err<void>(std::string("context canceled"));
        }
        if (deadline_.has_value() && std::chrono::steady_clock::now() >= *deadline_) {
            return Err<void>(std::string("context deadline exceeded"));
        }
        return Ok();
    }

private:
    Context(Context&& other) noexcept
        : cancelled_(other.cancelled_.load()), deadline_(other.deadline_) {}

    std::atomic<bool> cancelled_{false};
    std::optional<std::chrono::steady_clock::time_point> deadline_;
};

} // namespace blockship
