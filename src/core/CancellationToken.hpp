/**
 * @file CancellationToken.hpp
 * @brief Caller-owned cancellation flag with an optional deadline
 *
 * The generator polls the token between categories. A tripped token never
 * interrupts a grid computation in progress; the batch is abandoned at the
 * next check and all partial results are dropped.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <optional>

namespace dkmz {

class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    CancellationToken() = default;

    /**
     * @brief Token that also trips once the given time budget is spent
     * @param timeout Budget measured from construction
     */
    explicit CancellationToken(std::chrono::milliseconds timeout)
        : deadline_(Clock::now() + timeout) {}

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() { cancelled_.store(true, std::memory_order_relaxed); }

    bool is_cancelled() const {
        if (cancelled_.load(std::memory_order_relaxed)) {
            return true;
        }
        return deadline_.has_value() && Clock::now() >= *deadline_;
    }

    bool has_deadline() const { return deadline_.has_value(); }

private:
    std::atomic<bool> cancelled_{false};
    std::optional<Clock::time_point> deadline_;
};

} // namespace dkmz
