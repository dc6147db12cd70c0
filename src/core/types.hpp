/**
 * @file types.hpp
 * @brief Fundamental types used throughout Tracie.
 *
 * Defines JobId, JobClass, JobRecord and the task arrival table shared by the
 * generator and the replay executor. All records are plain values: created
 * once by the generator (or the trace loader) and read-only afterwards.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tracie {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using JobId = uint64_t;
using AppId = std::string;
using SteadyTime = std::chrono::steady_clock::time_point;
using Seconds = std::chrono::duration<double>;

// ─────────────────────────────────────────────
// Job Class
// ─────────────────────────────────────────────

enum class JobClass : uint8_t {
    Batch,        ///< Throughput job ("B")
    Interactive   ///< User-facing service job ("UF")
};

/**
 * @brief Trace file token for a job class.
 */
[[nodiscard]] constexpr std::string_view to_token(JobClass job_class) noexcept {
    switch (job_class) {
        case JobClass::Batch:       return "B";
        case JobClass::Interactive: return "UF";
    }
    return "?";
}

[[nodiscard]] constexpr std::optional<JobClass> parse_job_class(std::string_view token) noexcept {
    if (token == "B") return JobClass::Batch;
    if (token == "UF") return JobClass::Interactive;
    return std::nullopt;
}

// ─────────────────────────────────────────────
// Job Record
// ─────────────────────────────────────────────

/**
 * @brief One row of the jobs table.
 *
 * arrival_time_sec is relative to the start of the trace. task_count is
 * always >= 1 and equals the length of the job's task arrival list.
 */
struct JobRecord {
    JobId job_id{0};
    double arrival_time_sec{0.0};
    JobClass job_class{JobClass::Interactive};
    AppId app_type;
    uint32_t task_count{1};

    bool operator==(const JobRecord&) const = default;
};

/// Task arrival offsets of one job, in seconds from the job's own start.
using TaskOffsets = std::vector<double>;

/// job_id -> ordered task arrival offsets.
using TaskArrivalTable = std::unordered_map<JobId, TaskOffsets>;

// ─────────────────────────────────────────────
// Job State
// ─────────────────────────────────────────────

enum class JobState : uint8_t {
    Pending,
    Running,
    Completed,
    Failed,
    Cancelled
};

[[nodiscard]] constexpr std::string_view to_string(JobState state) noexcept {
    switch (state) {
        case JobState::Pending:   return "pending";
        case JobState::Running:   return "running";
        case JobState::Completed: return "completed";
        case JobState::Failed:    return "failed";
        case JobState::Cancelled: return "cancelled";
    }
    return "unknown";
}

}  // namespace tracie
