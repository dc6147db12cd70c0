/**
 * @file task_group.hpp
 * @brief Fan-out/join-all group of std::jthread units with shared cancellation.
 *
 * One thread per unit, no pooling: replay dispatches one unit per job and one
 * per interactive task. All units observe a single group-wide stop token.
 */

#pragma once

#include <concepts>
#include <exception>
#include <future>
#include <memory>
#include <stop_token>
#include <thread>
#include <type_traits>
#include <vector>

namespace tracie {

/**
 * @brief Spawn N independent units, await all.
 *
 * spawn() and wait_all() belong to the owning thread; request_stop() may be
 * called from any thread. A unit's exception is delivered through its future
 * and never cancels its siblings.
 */
class TaskGroup {
public:
    TaskGroup() = default;
    ~TaskGroup();

    // Non-copyable, non-movable
    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

    /// Start a unit on its own thread. The callable receives the group stop token.
    template <std::invocable<std::stop_token> F>
    std::future<std::invoke_result_t<F, std::stop_token>> spawn(F&& func);

    /// Join every unit spawned so far.
    void wait_all();

    /// Ask every unit, running or future, to stop.
    void request_stop() noexcept { stop_source_.request_stop(); }

    /**
     * @brief Request stop and detach every unit without joining.
     *
     * Abrupt-shutdown path: units keep running until they observe the stop
     * token (or their blocking call returns) and must not reference state
     * that dies before the process exits.
     */
    void abandon() noexcept;

    [[nodiscard]] bool stop_requested() const noexcept { return stop_source_.stop_requested(); }
    [[nodiscard]] std::stop_token stop_token() const noexcept { return stop_source_.get_token(); }
    [[nodiscard]] size_t size() const noexcept { return units_.size(); }

private:
    std::stop_source stop_source_;
    std::vector<std::jthread> units_;
};

// ── Template implementations ─────────────────

template <std::invocable<std::stop_token> F>
std::future<std::invoke_result_t<F, std::stop_token>> TaskGroup::spawn(F&& func) {
    using ReturnType = std::invoke_result_t<F, std::stop_token>;
    auto promise = std::make_shared<std::promise<ReturnType>>();
    auto future = promise->get_future();

    units_.emplace_back([p = std::move(promise), f = std::forward<F>(func),
                         stop = stop_source_.get_token()]() mutable {
        try {
            if constexpr (std::is_void_v<ReturnType>) {
                f(stop);
                p->set_value();
            } else {
                p->set_value(f(stop));
            }
        } catch (...) {
            p->set_exception(std::current_exception());
        }
    });
    return future;
}

}  // namespace tracie
