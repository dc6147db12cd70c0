/**
 * @file replay_scheduler.hpp
 * @brief Open-loop, wall-clock-synchronized replay of a trace.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "executor/job_outcome.hpp"
#include "executor/job_runner.hpp"
#include "telemetry/metrics_collector.hpp"
#include "workload/trace_io.hpp"

#include <stop_token>
#include <vector>

namespace tracie {

struct ReplaySummary {
    size_t dispatched{0};
    size_t completed{0};
    size_t failed{0};
    size_t cancelled{0};
    double elapsed_sec{0.0};
    std::vector<JobOutcome> outcomes;   ///< In dispatch order
};

/**
 * @brief Dispatches each job of a trace at T0 + arrival_time_sec.
 *
 * The scheduling thread sleeps until a job's arrival instant (not at all if
 * the instant has passed; late jobs are not bunched up), starts the job on
 * its own thread and moves on. Completion order is unconstrained.
 */
class ReplayScheduler {
public:
    ReplayScheduler(JobRunner& runner, Logger& logger, MetricsCollector& metrics);

    /**
     * @brief Replay the trace and wait for every job to finish.
     *
     * T0 is the instant of the call. Fails with ErrorCode::Interrupted when
     * `stop` is requested: during the arrival wait no further job is
     * dispatched and running jobs are detached without being joined; during
     * the final join running jobs are cancelled and joined.
     *
     * Job units copy their record and offsets. The runner, logger and metrics
     * collector must stay alive until the process exits when the interrupted
     * path detaches jobs.
     */
    Result<ReplaySummary> replay(const Trace& trace, std::stop_token stop);

private:
    JobRunner& runner_;
    Logger& logger_;
    MetricsCollector& metrics_;
};

}  // namespace tracie
