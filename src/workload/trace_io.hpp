/**
 * @file trace_io.hpp
 * @brief CSV persistence of generated traces (jobs table + tasks table).
 *
 * Jobs table:  job_id,arrival_time_sec,job_type,app_type,task_count
 * Tasks table: job_id,task_arrival_timestamps_within_job
 *              then one row per job: job_id,offset_0,offset_1,...
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "workload/generator.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace tracie {

/**
 * @brief A loaded trace, ready for replay.
 *
 * jobs is sorted by (arrival_time_sec, job_id); every job has an entry in
 * tasks whose length equals its task_count.
 */
struct Trace {
    std::vector<JobRecord> jobs;
    TaskArrivalTable tasks;

    [[nodiscard]] const TaskOffsets& offsets_for(JobId id) const { return tasks.at(id); }
    [[nodiscard]] bool empty() const noexcept { return jobs.empty(); }
};

/// Order jobs by arrival time, ties by job id.
void sort_by_arrival(std::vector<JobRecord>& jobs);

/**
 * @brief Write both trace tables. Jobs are sorted by arrival before writing.
 *
 * Fails with ErrorCode::TraceFileError when a file cannot be written.
 */
Result<void> write_trace(const std::vector<GeneratedJob>& jobs,
                         const std::filesystem::path& jobs_path,
                         const std::filesystem::path& tasks_path);

/**
 * @brief Read and validate both trace tables.
 *
 * Fails with ErrorCode::TraceFileError for a missing file, a missing column,
 * an unparsable field, an unknown job type token, a task count below 1, a
 * duplicate job id, or a job whose task row is absent or has the wrong length.
 */
Result<Trace> load_trace(const std::filesystem::path& jobs_path,
                         const std::filesystem::path& tasks_path);

// ── CSV helpers (exposed for tests) ──────────

/// Split one CSV line into fields, honoring double-quoted fields.
[[nodiscard]] std::vector<std::string> split_csv_line(std::string_view line);

/// Quote a field when it contains a comma, quote or line break.
[[nodiscard]] std::string csv_field(std::string_view value);

/// Shortest decimal representation that round-trips the double.
[[nodiscard]] std::string format_seconds(double seconds);

}  // namespace tracie
