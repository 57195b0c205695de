//! # Cooperative Cancellation
//!
//! `CancellationToken` lets a caller abort a long-running decode. The parser
//! and binder poll the token at container boundaries; once it reports
//! cancelled the operation unwinds with a `Cancelled` error.
//!
//! A token can be cancelled explicitly from another thread, or carry a
//! deadline on the monotonic clock.
//!
//! ## Example
//!
//! ```cpp
//! auto token = CancellationToken::with_timeout(std::chrono::milliseconds(50));
//! auto result = decoder.decode(bytes, &token);
//! ```

#ifndef STRICTJSON_COMMON_CANCELLATION_HPP
#define STRICTJSON_COMMON_CANCELLATION_HPP

#include <atomic>
#include <chrono>
#include <optional>

namespace strictjson {

class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    auto operator=(const CancellationToken&) -> CancellationToken& = delete;

    /// Creates a token that expires `timeout` from now. Timeouts past the
    /// end of the steady clock saturate to `Clock::time_point::max()`.
    [[nodiscard]] static auto with_timeout(std::chrono::milliseconds timeout) -> CancellationToken {
        CancellationToken token;
        auto now = Clock::now();
        auto room = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::time_point::max() -
                                                                          now);
        token.deadline_ = timeout >= room ? Clock::time_point::max()
                                          : now + std::chrono::duration_cast<Clock::duration>(timeout);
        return token;
    }

    /// Creates a token that expires at the given point on the steady clock.
    [[nodiscard]] static auto with_deadline(Clock::time_point deadline) -> CancellationToken {
        CancellationToken token;
        token.deadline_ = deadline;
        return token;
    }

    CancellationToken(CancellationToken&& other) noexcept
        : cancelled_(other.cancelled_.load(std::memory_order_relaxed)), deadline_(other.deadline_) {}

    /// Requests cancellation. Safe to call from any thread.
    void cancel() noexcept {
        cancelled_.store(true, std::memory_order_relaxed);
    }

    /// Returns `true` once `cancel()` was called or the deadline has passed.
    [[nodiscard]] auto is_cancelled() const noexcept -> bool {
        if (cancelled_.load(std::memory_order_relaxed)) {
            return true;
        }
        return deadline_ && Clock::now() >= *deadline_;
    }

    [[nodiscard]] auto deadline() const -> std::optional<Clock::time_point> {
        return deadline_;
    }

private:
    std::atomic<bool> cancelled_{false};
    std::optional<Clock::time_point> deadline_;
};

} // namespace strictjson

#endif // STRICTJSON_COMMON_CANCELLATION_HPP
