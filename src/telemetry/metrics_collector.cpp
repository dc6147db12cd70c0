/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 */

#include "telemetry/metrics_collector.hpp"

#include <format>
#include <sstream>

namespace tracie {

namespace {

// Shortest round-trip form, no precision cut.
std::string seconds_field(double seconds) {
    return std::format("{}", seconds);
}

}  // anonymous namespace

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_job_dispatched(const JobRecord& job, double t) {
    std::ostringstream oss;
    oss << R"({"event":"job_dispatched")"
        << R"(,"t":)" << seconds_field(t)
        << R"(,"job":)" << job.job_id
        << R"(,"arrival_sec":)" << seconds_field(job.arrival_time_sec)
        << R"(,"type":")" << to_token(job.job_class) << "\""
        << R"(,"app":")" << json_escape(job.app_type) << "\""
        << R"(,"tasks":)" << job.task_count
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_job_started(const JobRecord& job, DispatchMode mode, double t) {
    std::ostringstream oss;
    oss << R"({"event":"job_started")"
        << R"(,"t":)" << seconds_field(t)
        << R"(,"job":)" << job.job_id
        << R"(,"mode":")" << to_string(mode) << "\""
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_job_finished(const JobOutcome& outcome, double t) {
    std::ostringstream oss;
    oss << R"({"event":"job_state_change")"
        << R"(,"t":)" << seconds_field(t)
        << R"(,"job":)" << outcome.job_id
        << R"(,"app":")" << json_escape(outcome.app_type) << "\""
        << R"(,"mode":")" << to_string(outcome.mode) << "\""
        << R"(,"state":")" << to_string(outcome.state) << "\""
        << R"(,"elapsed_sec":)" << seconds_field(outcome.elapsed_sec);
    if (outcome.job_class == JobClass::Interactive) {
        oss << R"(,"tasks_completed":)" << outcome.tasks_completed;
    }
    if (outcome.error) {
        oss << R"(,"error":")" << to_string(outcome.error->code) << "\""
            << R"(,"message":")" << json_escape(outcome.error->message) << "\"";
    }
    if (!outcome.diagnostics.empty()) {
        oss << R"(,"stderr":")" << json_escape(outcome.diagnostics) << "\"";
    }
    oss << "}";
    emit(oss.str());
}

void MetricsCollector::record_task_event(JobId job, size_t task_index, std::string_view phase,
                                         double t, double duration_sec) {
    std::ostringstream oss;
    oss << R"({"event":"task_)" << phase << "\""
        << R"(,"t":)" << seconds_field(t)
        << R"(,"job":)" << job
        << R"(,"task":)" << task_index
        << R"(,"duration_sec":)" << seconds_field(duration_sec)
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_engine_command(JobId job, const EngineCommand& command, double t) {
    std::ostringstream oss;
    oss << R"({"event":"engine_command")"
        << R"(,"t":)" << seconds_field(t)
        << R"(,"job":)" << job
        << R"(,"command":")" << json_escape(command.to_string()) << "\""
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_custom(std::string_view event, std::string_view json_payload) {
    std::ostringstream oss;
    oss << R"({"event":")" << event << "\""
        << R"(,"data":)" << json_payload
        << "}";
    emit(oss.str());
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace tracie
