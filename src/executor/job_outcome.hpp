/**
 * @file job_outcome.hpp
 * @brief Dispatch modes and per-job results of a replay.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace tracie {

enum class DispatchMode : uint8_t {
    SimulatedTasks,   ///< Interactive: one sleeping unit per task
    Engine,           ///< Batch with a command template: run the external engine
    SimulatedBatch    ///< Batch without a template: one aggregated sleep
};

[[nodiscard]] constexpr std::string_view to_string(DispatchMode mode) noexcept {
    switch (mode) {
        case DispatchMode::SimulatedTasks: return "simulated_tasks";
        case DispatchMode::Engine:         return "engine";
        case DispatchMode::SimulatedBatch: return "simulated_batch";
    }
    return "unknown";
}

struct JobOutcome {
    JobId job_id{0};
    JobClass job_class{JobClass::Interactive};
    AppId app_type;
    DispatchMode mode{DispatchMode::SimulatedTasks};
    JobState state{JobState::Pending};
    double dispatched_at_sec{0.0};    ///< Run-relative instant the job unit started
    double elapsed_sec{0.0};          ///< Wall time spent inside the job
    uint32_t tasks_completed{0};      ///< Interactive tasks that ran to completion
    std::optional<Error> error;       ///< JobExecutionFailure / EngineNotFound / Interrupted
    std::string diagnostics;          ///< Engine stderr on failure
};

}  // namespace tracie
