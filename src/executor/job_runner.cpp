/**
 * @file job_runner.cpp
 * @brief JobRunner implementation.
 */

#include "executor/job_runner.hpp"
#include "executor/task_group.hpp"

#include <chrono>
#include <exception>
#include <format>
#include <future>
#include <vector>

namespace tracie {

namespace {

double seconds_since(SteadyTime start) {
    return Seconds(std::chrono::steady_clock::now() - start).count();
}

std::string_view trim_trailing(std::string_view text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == ' ')) {
        text.remove_suffix(1);
    }
    return text;
}

}  // anonymous namespace

DispatchMode select_dispatch_mode(JobClass job_class, const AppId& app,
                                  const CommandRegistry& registry) {
    if (job_class == JobClass::Interactive) return DispatchMode::SimulatedTasks;
    return registry.contains(app) ? DispatchMode::Engine : DispatchMode::SimulatedBatch;
}

JobRunner::JobRunner(SimulationConfig simulation,
                     EngineConfig engine,
                     CommandRegistry registry,
                     IProcessLauncher& launcher,
                     Logger& logger,
                     MetricsCollector& metrics)
    : simulation_(simulation)
    , engine_(std::move(engine))
    , registry_(std::move(registry))
    , launcher_(launcher)
    , logger_(logger)
    , metrics_(metrics) {}

DispatchMode JobRunner::dispatch_mode(const JobRecord& job) const {
    return select_dispatch_mode(job.job_class, job.app_type, registry_);
}

JobOutcome JobRunner::run(const JobRecord& job, const TaskOffsets& offsets,
                          const RunClock& clock, std::stop_token stop) {
    JobOutcome outcome{
        .job_id = job.job_id,
        .job_class = job.job_class,
        .app_type = job.app_type,
        .mode = dispatch_mode(job),
        .state = JobState::Running,
        .dispatched_at_sec = clock.elapsed_sec(),
    };
    metrics_.record_job_started(job, outcome.mode, outcome.dispatched_at_sec);

    auto start = std::chrono::steady_clock::now();
    try {
        switch (outcome.mode) {
            case DispatchMode::SimulatedTasks:
                run_interactive(job, offsets, clock, stop, outcome);
                break;
            case DispatchMode::Engine:
                run_engine(job, clock, outcome);
                break;
            case DispatchMode::SimulatedBatch:
                run_simulated_batch(job, clock, stop, outcome);
                break;
        }
    } catch (const std::exception& e) {
        outcome.state = JobState::Failed;
        outcome.error = Error{ErrorCode::Unknown, e.what()};
        logger_.error(std::format("{:.2f}s | Job {} aborted: {}",
                                  clock.elapsed_sec(), job.job_id, e.what()));
    }
    outcome.elapsed_sec = seconds_since(start);

    metrics_.record_job_finished(outcome, clock.elapsed_sec());
    return outcome;
}

// ─────────────────────────────────────────────
// Interactive: one unit per task
// ─────────────────────────────────────────────

void JobRunner::run_interactive(const JobRecord& job, const TaskOffsets& offsets,
                                const RunClock& clock, std::stop_token stop,
                                JobOutcome& outcome) {
    auto job_start = std::chrono::steady_clock::now();
    logger_.info(std::format("{:.2f}s | [service start] Job {} (type {}, app {}) waiting for {} tasks",
                             clock.elapsed_sec(), job.job_id, to_token(job.job_class),
                             job.app_type, job.task_count));

    std::vector<std::future<bool>> tasks_done;
    tasks_done.reserve(offsets.size());
    {
        TaskGroup tasks;
        std::stop_callback forward_stop(stop, [&tasks] { tasks.request_stop(); });

        for (size_t i = 0; i < offsets.size(); ++i) {
            tasks_done.push_back(tasks.spawn(
                [this, &job, &clock, job_start, offset = offsets[i], i](std::stop_token task_stop) {
                    if (!sleep_until(job_start + to_duration(offset), task_stop)) return false;

                    auto task_start = std::chrono::steady_clock::now();
                    metrics_.record_task_event(job.job_id, i, "start", clock.elapsed_sec(), 0.0);
                    logger_.debug(std::format("{:.2f}s |   Job {} (UF) -> Task {} arrived",
                                              clock.elapsed_sec(), job.job_id, i));

                    bool finished = sleep_for(simulation_.interactive_task_sec, task_stop);
                    double took = seconds_since(task_start);
                    metrics_.record_task_event(job.job_id, i, finished ? "end" : "cancelled",
                                               clock.elapsed_sec(), took);
                    logger_.debug(std::format("{:.2f}s |   Job {} (UF) <- Task {} {} ({:.3f}s)",
                                              clock.elapsed_sec(), job.job_id, i,
                                              finished ? "done" : "cancelled", took));
                    return finished;
                }));
        }
        tasks.wait_all();
    }

    for (auto& done : tasks_done) {
        if (done.get()) ++outcome.tasks_completed;
    }

    if (outcome.tasks_completed == offsets.size()) {
        outcome.state = JobState::Completed;
        logger_.info(std::format("{:.2f}s | [service done] Job {} (UF) finished all {} tasks ({:.2f}s)",
                                 clock.elapsed_sec(), job.job_id, outcome.tasks_completed,
                                 seconds_since(job_start)));
    } else {
        outcome.state = JobState::Cancelled;
        outcome.error = Error{ErrorCode::Interrupted,
                              std::format("{} of {} tasks cancelled",
                                          offsets.size() - outcome.tasks_completed, offsets.size())};
        logger_.warn(std::format("{:.2f}s | [service cancelled] Job {} (UF) after {} of {} tasks",
                                 clock.elapsed_sec(), job.job_id, outcome.tasks_completed,
                                 offsets.size()));
    }
}

// ─────────────────────────────────────────────
// Batch: external engine
// ─────────────────────────────────────────────

void JobRunner::run_engine(const JobRecord& job, const RunClock& clock, JobOutcome& outcome) {
    auto command = registry_.build(job, engine_);
    if (!command) {
        // dispatch_mode() only selects Engine for registered applications.
        outcome.state = JobState::Failed;
        outcome.error = Error{ErrorCode::ConfigurationError,
                              "No command template for application " + job.app_type};
        return;
    }

    auto start = std::chrono::steady_clock::now();
    logger_.info(std::format("{:.2f}s | [engine] Job {} (app {}) starting",
                             clock.elapsed_sec(), job.job_id, job.app_type));
    logger_.info(std::format("           command: {}", command->to_string()));
    metrics_.record_engine_command(job.job_id, *command, clock.elapsed_sec());

    auto result = launcher_.run(*command);
    double took = seconds_since(start);

    if (!result) {
        outcome.state = JobState::Failed;
        outcome.error = result.error();
        if (result.error().code == ErrorCode::EngineNotFound) {
            logger_.error(std::format("{:.2f}s | [engine] Job {} configuration error: {} "
                                      "(check engine.executable and engine.examples_jar)",
                                      clock.elapsed_sec(), job.job_id, result.error().message));
        } else {
            logger_.error(std::format("{:.2f}s | [engine] Job {} could not start: {}",
                                      clock.elapsed_sec(), job.job_id, result.error().message));
        }
        return;
    }

    if (result->succeeded()) {
        outcome.state = JobState::Completed;
        logger_.info(std::format("{:.2f}s | [engine] Job {} (app {}) completed ({:.2f}s)",
                                 clock.elapsed_sec(), job.job_id, job.app_type, took));
        return;
    }

    outcome.state = JobState::Failed;
    outcome.error = Error{ErrorCode::JobExecutionFailure,
                          std::format("{} exited with status {}", command->executable,
                                      result->exit_code)};
    outcome.diagnostics = std::string{trim_trailing(result->stderr_output)};
    logger_.error(std::format("{:.2f}s | [engine] Job {} (app {}) failed with status {} ({:.2f}s)",
                              clock.elapsed_sec(), job.job_id, job.app_type,
                              result->exit_code, took));
    if (!outcome.diagnostics.empty()) {
        logger_.error(std::format("           stderr: {}", outcome.diagnostics));
    }
}

// ─────────────────────────────────────────────
// Batch: simulated
// ─────────────────────────────────────────────

void JobRunner::run_simulated_batch(const JobRecord& job, const RunClock& clock,
                                    std::stop_token stop, JobOutcome& outcome) {
    double total = static_cast<double>(job.task_count) * simulation_.batch_task_sec;
    auto start = std::chrono::steady_clock::now();
    logger_.info(std::format("{:.2f}s | [simulated] Job {} (type {}, app {}) processing {} tasks",
                             clock.elapsed_sec(), job.job_id, to_token(job.job_class),
                             job.app_type, job.task_count));

    if (!sleep_for(total, stop)) {
        outcome.state = JobState::Cancelled;
        outcome.error = Error{ErrorCode::Interrupted, "Simulated batch job cancelled"};
        logger_.warn(std::format("{:.2f}s | [simulated] Job {} (B) cancelled after {:.2f}s",
                                 clock.elapsed_sec(), job.job_id, seconds_since(start)));
        return;
    }

    outcome.state = JobState::Completed;
    logger_.info(std::format("{:.2f}s | [simulated] Job {} (B) completed ({:.2f}s total)",
                             clock.elapsed_sec(), job.job_id, seconds_since(start)));
}

}  // namespace tracie
