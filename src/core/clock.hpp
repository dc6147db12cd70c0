/**
 * @file clock.hpp
 * @brief Run-relative wall clock and interruptible timed waits.
 */

#pragma once

#include "core/types.hpp"

#include <stop_token>

namespace tracie {

/**
 * @brief Immutable reference instant of a replay run (T0).
 *
 * Copied into every component that logs run-relative times. Reads go through
 * std::chrono::steady_clock, so elapsed values never go backwards.
 */
class RunClock {
public:
    explicit RunClock(SteadyTime origin) noexcept : origin_(origin) {}

    /// Start a new run at the current instant.
    [[nodiscard]] static RunClock start_now() noexcept;

    [[nodiscard]] SteadyTime origin() const noexcept { return origin_; }

    /// Absolute instant `offset_sec` seconds after T0.
    [[nodiscard]] SteadyTime at(double offset_sec) const noexcept;

    /// Seconds since T0.
    [[nodiscard]] double elapsed_sec() const noexcept;

private:
    SteadyTime origin_;
};

/// Convert seconds (as stored in traces and configs) to a steady-clock duration.
[[nodiscard]] std::chrono::steady_clock::duration to_duration(double seconds) noexcept;

/**
 * @brief Block until `deadline` or until `stop` is requested.
 *
 * Returns immediately when the deadline has already passed. Never polls:
 * waits on a condition variable that the stop token wakes.
 *
 * @return true when the deadline was reached, false when stop was requested.
 */
bool sleep_until(SteadyTime deadline, std::stop_token stop);

/// sleep_until(now + seconds, stop).
bool sleep_for(double seconds, std::stop_token stop);

}  // namespace tracie
