/**
 * @file job_runner.hpp
 * @brief Executes one replayed job: simulated tasks, engine run, or simulated batch.
 */

#pragma once

#include "core/clock.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "executor/engine_command.hpp"
#include "executor/job_outcome.hpp"
#include "executor/process_launcher.hpp"
#include "telemetry/metrics_collector.hpp"

#include <stop_token>

namespace tracie {

/**
 * @brief Pick how a job is executed.
 *
 * Depends only on the job class, the application identifier and the
 * registry; never on the task count.
 */
[[nodiscard]] DispatchMode select_dispatch_mode(JobClass job_class,
                                                const AppId& app,
                                                const CommandRegistry& registry);

/**
 * @brief Per-job execution logic shared by all job units of a replay.
 *
 * Stateless across jobs; run() is called concurrently from many job threads.
 * Failures are returned in the JobOutcome and never thrown.
 */
class JobRunner {
public:
    JobRunner(SimulationConfig simulation,
              EngineConfig engine,
              CommandRegistry registry,
              IProcessLauncher& launcher,
              Logger& logger,
              MetricsCollector& metrics);

    /**
     * @brief Run a job to completion on the calling thread.
     *
     * @param offsets Task arrival offsets relative to the job start.
     * @param clock   Run clock of the replay, for run-relative timestamps.
     * @param stop    Cancels simulated sleeps; an engine run is not interrupted.
     */
    JobOutcome run(const JobRecord& job, const TaskOffsets& offsets,
                   const RunClock& clock, std::stop_token stop);

    [[nodiscard]] DispatchMode dispatch_mode(const JobRecord& job) const;
    [[nodiscard]] const CommandRegistry& registry() const noexcept { return registry_; }
    [[nodiscard]] const SimulationConfig& simulation() const noexcept { return simulation_; }

private:
    void run_interactive(const JobRecord& job, const TaskOffsets& offsets,
                         const RunClock& clock, std::stop_token stop, JobOutcome& outcome);
    void run_engine(const JobRecord& job, const RunClock& clock, JobOutcome& outcome);
    void run_simulated_batch(const JobRecord& job, const RunClock& clock,
                             std::stop_token stop, JobOutcome& outcome);

    SimulationConfig simulation_;
    EngineConfig engine_;
    CommandRegistry registry_;
    IProcessLauncher& launcher_;
    Logger& logger_;
    MetricsCollector& metrics_;
};

}  // namespace tracie
