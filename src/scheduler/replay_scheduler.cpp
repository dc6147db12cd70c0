/**
 * @file replay_scheduler.cpp
 * @brief ReplayScheduler implementation.
 */

#include "scheduler/replay_scheduler.hpp"
#include "core/clock.hpp"
#include "executor/task_group.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <future>

namespace tracie {

ReplayScheduler::ReplayScheduler(JobRunner& runner, Logger& logger, MetricsCollector& metrics)
    : runner_(runner), logger_(logger), metrics_(metrics) {}

Result<ReplaySummary> ReplayScheduler::replay(const Trace& trace, std::stop_token stop) {
    // Replay order: arrival time, ties by job id.
    std::vector<const JobRecord*> order;
    order.reserve(trace.jobs.size());
    for (const auto& job : trace.jobs) {
        if (!trace.tasks.contains(job.job_id)) {
            return Error{ErrorCode::TraceFileError,
                         std::format("Job {} has no task arrival entry", job.job_id)};
        }
        order.push_back(&job);
    }
    std::stable_sort(order.begin(), order.end(), [](const JobRecord* a, const JobRecord* b) {
        if (a->arrival_time_sec != b->arrival_time_sec) {
            return a->arrival_time_sec < b->arrival_time_sec;
        }
        return a->job_id < b->job_id;
    });

    const RunClock clock = RunClock::start_now();
    logger_.info(std::format("Replay started: {} jobs", order.size()));

    std::vector<std::future<JobOutcome>> pending;
    pending.reserve(order.size());

    TaskGroup jobs;
    std::stop_callback forward_stop(stop, [&jobs] { jobs.request_stop(); });

    for (const JobRecord* record : order) {
        if (!sleep_until(clock.at(record->arrival_time_sec), stop)) {
            logger_.error(std::format("{:.2f}s | Interrupted: {} of {} jobs dispatched, "
                                      "abandoning running jobs",
                                      clock.elapsed_sec(), pending.size(), order.size()));
            jobs.abandon();
            return Error{ErrorCode::Interrupted,
                         std::format("Replay interrupted after {} of {} jobs",
                                     pending.size(), order.size())};
        }

        metrics_.record_job_dispatched(*record, clock.elapsed_sec());
        pending.push_back(jobs.spawn(
            [this, clock, job = *record, offsets = trace.tasks.at(record->job_id)](std::stop_token unit_stop) {
                return runner_.run(job, offsets, clock, unit_stop);
            }));
    }

    logger_.info(std::format("{:.2f}s | All {} jobs dispatched, waiting for completion",
                             clock.elapsed_sec(), pending.size()));
    jobs.wait_all();

    ReplaySummary summary;
    summary.dispatched = pending.size();
    summary.outcomes.reserve(pending.size());
    for (size_t i = 0; i < pending.size(); ++i) {
        try {
            summary.outcomes.push_back(pending[i].get());
        } catch (const std::exception& e) {
            const JobRecord& job = *order[i];
            JobOutcome failed{
                .job_id = job.job_id,
                .job_class = job.job_class,
                .app_type = job.app_type,
                .mode = runner_.dispatch_mode(job),
                .state = JobState::Failed,
            };
            failed.error = Error{ErrorCode::Unknown, e.what()};
            logger_.error(std::format("Job {} unit failed: {}", job.job_id, e.what()));
            summary.outcomes.push_back(std::move(failed));
        }

        switch (summary.outcomes.back().state) {
            case JobState::Completed: ++summary.completed; break;
            case JobState::Cancelled: ++summary.cancelled; break;
            default:                  ++summary.failed; break;
        }
    }
    summary.elapsed_sec = clock.elapsed_sec();

    metrics_.record_custom("replay_summary",
        std::format(R"({{"dispatched":{},"completed":{},"failed":{},"cancelled":{},"elapsed_sec":{}}})",
                    summary.dispatched, summary.completed, summary.failed,
                    summary.cancelled, summary.elapsed_sec));

    if (stop.stop_requested()) {
        return Error{ErrorCode::Interrupted,
                     std::format("Replay interrupted while waiting for {} jobs", summary.dispatched)};
    }
    return summary;
}

}  // namespace tracie
