// ============================================================================
// handoff/core/deadline.hpp - Timeouts to Steady-Clock Deadlines
// ============================================================================
//
// Every timed wait in handoff goes through SteadyDeadline(). Handing a raw
// duration to std::condition_variable::wait_for converts it to clock ticks,
// which overflows for large values (hours::max() and the like) and makes the
// wait return at once. Here such timeouts mean "no bound" instead.
//
// ============================================================================

#pragma once

#include <chrono>
#include <optional>
#include <type_traits>

namespace handoff::detail {

// Deadline `timeout` from now, or nullopt when it lies beyond what
// steady_clock can represent. Zero and negative timeouts expire now.
template <typename Rep, typename Period>
std::optional<std::chrono::steady_clock::time_point> SteadyDeadline(
    const std::chrono::duration<Rep, Period>& timeout) {
    using Clock = std::chrono::steady_clock;

    const auto now = Clock::now();
    if (timeout <= std::chrono::duration<Rep, Period>::zero()) {
        return now;
    }

    // Compared in floating point: the tick conversion is what overflows.
    const auto headroom = Clock::time_point::max() - now - std::chrono::seconds(1);
    if (std::chrono::duration<double>(timeout) >= std::chrono::duration<double>(headroom)) {
        return std::nullopt;
    }
    return now + std::chrono::ceil<Clock::duration>(timeout);
}

// Same for an absolute deadline on any clock. Native steady_clock deadlines
// pass through unchanged; others are measured against their own clock.
template <typename Clock, typename Duration>
std::optional<std::chrono::steady_clock::time_point> SteadyDeadline(
    const std::chrono::time_point<Clock, Duration>& deadline) {
    if constexpr (std::is_same_v<std::chrono::time_point<Clock, Duration>, std::chrono::steady_clock::time_point>) {
        return deadline;
    } else {
        const std::chrono::duration<double> remaining =
            std::chrono::duration<double>(deadline.time_since_epoch()) -
            std::chrono::duration<double>(Clock::now().time_since_epoch());
        return SteadyDeadline(remaining);
    }
}

}  // namespace handoff::detail
