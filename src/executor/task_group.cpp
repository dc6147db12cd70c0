/**
 * @file task_group.cpp
 * @brief TaskGroup implementation.
 */

#include "executor/task_group.hpp"

namespace tracie {

TaskGroup::~TaskGroup() {
    // Only reached with live units on an error path; make them wind down
    // before the jthread destructors join.
    bool pending = false;
    for (const auto& unit : units_) {
        if (unit.joinable()) {
            pending = true;
            break;
        }
    }
    if (pending) request_stop();
}

void TaskGroup::wait_all() {
    for (auto& unit : units_) {
        if (unit.joinable()) unit.join();
    }
}

void TaskGroup::abandon() noexcept {
    request_stop();
    for (auto& unit : units_) {
        if (unit.joinable()) unit.detach();
    }
}

}  // namespace tracie
