/**
 * @file metrics_collector.hpp
 * @brief Structured replay events for telemetry.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"
#include "executor/engine_command.hpp"
#include "executor/job_outcome.hpp"

#include <memory>
#include <mutex>
#include <string_view>

namespace tracie {

/**
 * @brief Collects and logs structured replay events as NDJSON.
 *
 * Every event carries "t", the run-relative time in seconds.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_job_dispatched(const JobRecord& job, double t);
    void record_job_started(const JobRecord& job, DispatchMode mode, double t);
    void record_job_finished(const JobOutcome& outcome, double t);
    void record_task_event(JobId job, size_t task_index, std::string_view phase,
                           double t, double duration_sec);
    void record_engine_command(JobId job, const EngineCommand& command, double t);
    void record_custom(std::string_view event, std::string_view json_payload);

    void flush();

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;

    void emit(std::string_view json_line);
};

}  // namespace tracie
