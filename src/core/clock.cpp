/**
 * @file clock.cpp
 * @brief RunClock and stop-aware sleeps.
 */

#include "core/clock.hpp"

#include <condition_variable>
#include <mutex>

namespace tracie {

RunClock RunClock::start_now() noexcept {
    return RunClock{std::chrono::steady_clock::now()};
}

SteadyTime RunClock::at(double offset_sec) const noexcept {
    auto offset = to_duration(offset_sec);
    if (offset > SteadyTime::max() - origin_) return SteadyTime::max();
    return origin_ + offset;
}

double RunClock::elapsed_sec() const noexcept {
    return Seconds(std::chrono::steady_clock::now() - origin_).count();
}

std::chrono::steady_clock::duration to_duration(double seconds) noexcept {
    using Duration = std::chrono::steady_clock::duration;
    if (!(seconds > 0.0)) return Duration::zero();
    // Saturate instead of overflowing the integer tick count.
    if (seconds >= std::chrono::duration_cast<Seconds>(Duration::max()).count()) {
        return Duration::max();
    }
    return std::chrono::duration_cast<std::chrono::steady_clock::duration>(Seconds{seconds});
}

bool sleep_until(SteadyTime deadline, std::stop_token stop) {
    if (stop.stop_requested()) return false;
    if (std::chrono::steady_clock::now() >= deadline) return true;

    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock lock(mutex);
    // The predicate never becomes true: only the deadline or a stop request ends the wait.
    cv.wait_until(lock, stop, deadline, [] { return false; });
    return !stop.stop_requested();
}

bool sleep_for(double seconds, std::stop_token stop) {
    return sleep_until(std::chrono::steady_clock::now() + to_duration(seconds), stop);
}

}  // namespace tracie
