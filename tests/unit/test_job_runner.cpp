/**
 * @file test_job_runner.cpp
 * @brief Unit tests for per-job dispatch: simulated tasks, engine, simulated batch.
 */

#include "executor/job_runner.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using namespace tracie;
using namespace std::chrono_literals;

namespace {

/**
 * @brief Launcher that records commands and replies with a canned result.
 */
class ScriptedLauncher : public IProcessLauncher {
public:
    explicit ScriptedLauncher(Result<ProcessResult> reply) : reply_(std::move(reply)) {}

    Result<ProcessResult> run(const EngineCommand& command) override {
        std::lock_guard lock(mutex_);
        commands_.push_back(command);
        return reply_;
    }

    std::vector<EngineCommand> commands() const {
        std::lock_guard lock(mutex_);
        return commands_;
    }

private:
    Result<ProcessResult> reply_;
    mutable std::mutex mutex_;
    std::vector<EngineCommand> commands_;
};

JobRecord make_job(JobId id, JobClass job_class, AppId app, uint32_t tasks) {
    return JobRecord{.job_id = id, .arrival_time_sec = 0.0, .job_class = job_class,
                     .app_type = std::move(app), .task_count = tasks};
}

}  // namespace

class JobRunnerTest : public ::testing::Test {
protected:
    Logger logger_{std::make_unique<NullSink>()};
    MetricsCollector metrics_{std::make_unique<NullSink>()};
    SimulationConfig simulation_{.interactive_task_sec = 0.05, .batch_task_sec = 0.1};

    JobRunner make_runner(IProcessLauncher& launcher,
                          CommandRegistry registry = CommandRegistry::hadoop_examples()) {
        return JobRunner(simulation_, EngineConfig{}, std::move(registry), launcher, logger_, metrics_);
    }

    static double seconds(std::chrono::steady_clock::duration d) {
        return std::chrono::duration<double>(d).count();
    }
};

// ─────────────────────────────────────────────
// Dispatch selection
// ─────────────────────────────────────────────

TEST(DispatchModeSelectionTest, InteractiveAlwaysSimulatesTasks) {
    auto registry = CommandRegistry::hadoop_examples();
    EXPECT_EQ(select_dispatch_mode(JobClass::Interactive, "pi", registry),
              DispatchMode::SimulatedTasks);
    EXPECT_EQ(select_dispatch_mode(JobClass::Interactive, "web", registry),
              DispatchMode::SimulatedTasks);
}

TEST(DispatchModeSelectionTest, BatchFollowsRegistry) {
    auto registry = CommandRegistry::hadoop_examples();
    EXPECT_EQ(select_dispatch_mode(JobClass::Batch, "pi", registry), DispatchMode::Engine);
    EXPECT_EQ(select_dispatch_mode(JobClass::Batch, "kmeans", registry),
              DispatchMode::SimulatedBatch);
    EXPECT_EQ(select_dispatch_mode(JobClass::Batch, "pi", CommandRegistry{}),
              DispatchMode::SimulatedBatch);
}

TEST(DispatchModeSelectionTest, IndependentOfTaskCount) {
    ScriptedLauncher launcher(ProcessResult{});
    Logger logger(std::make_unique<NullSink>());
    MetricsCollector metrics(std::make_unique<NullSink>());
    JobRunner runner(SimulationConfig{}, EngineConfig{}, CommandRegistry::hadoop_examples(),
                     launcher, logger, metrics);

    for (uint32_t tasks : {1u, 10u, 100000u}) {
        EXPECT_EQ(runner.dispatch_mode(make_job(0, JobClass::Batch, "grep", tasks)),
                  DispatchMode::Engine);
        EXPECT_EQ(runner.dispatch_mode(make_job(0, JobClass::Batch, "other", tasks)),
                  DispatchMode::SimulatedBatch);
    }
}

// ─────────────────────────────────────────────
// Simulated batch
// ─────────────────────────────────────────────

TEST_F(JobRunnerTest, UnmappedBatchSleepsTaskCountTimesDuration) {
    ScriptedLauncher launcher(ProcessResult{});
    auto runner = make_runner(launcher);
    std::stop_source stop;

    auto start = std::chrono::steady_clock::now();
    auto outcome = runner.run(make_job(1, JobClass::Batch, "kmeans", 10), TaskOffsets(10, 0.0),
                              RunClock::start_now(), stop.get_token());
    double took = seconds(std::chrono::steady_clock::now() - start);

    EXPECT_EQ(outcome.mode, DispatchMode::SimulatedBatch);
    EXPECT_EQ(outcome.state, JobState::Completed);
    EXPECT_GE(took, 1.0);
    EXPECT_LT(took, 1.5);
    EXPECT_TRUE(launcher.commands().empty());
}

TEST_F(JobRunnerTest, SimulatedBatchCancelledByStop) {
    ScriptedLauncher launcher(ProcessResult{});
    simulation_.batch_task_sec = 10.0;
    auto runner = make_runner(launcher);
    std::stop_source stop;

    std::jthread stopper([&stop] {
        std::this_thread::sleep_for(50ms);
        stop.request_stop();
    });
    auto outcome = runner.run(make_job(2, JobClass::Batch, "kmeans", 5), TaskOffsets(5, 0.0),
                              RunClock::start_now(), stop.get_token());

    EXPECT_EQ(outcome.state, JobState::Cancelled);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->code, ErrorCode::Interrupted);
    EXPECT_LT(outcome.elapsed_sec, 5.0);
}

// ─────────────────────────────────────────────
// Engine
// ─────────────────────────────────────────────

TEST_F(JobRunnerTest, EngineSuccess) {
    ScriptedLauncher launcher(ProcessResult{.exit_code = 0, .stderr_output = ""});
    auto runner = make_runner(launcher);
    std::stop_source stop;

    auto outcome = runner.run(make_job(5, JobClass::Batch, "pi", 5), TaskOffsets(5, 0.0),
                              RunClock::start_now(), stop.get_token());

    EXPECT_EQ(outcome.mode, DispatchMode::Engine);
    EXPECT_EQ(outcome.state, JobState::Completed);
    EXPECT_FALSE(outcome.error.has_value());

    auto commands = launcher.commands();
    ASSERT_EQ(commands.size(), 1u);
    EXPECT_EQ(commands[0].executable, "hadoop");
    ASSERT_GE(commands[0].args.size(), 5u);
    EXPECT_EQ(commands[0].args[2], "pi");
    EXPECT_EQ(commands[0].args[3], "5");
    EXPECT_EQ(commands[0].args[4], "1000");
}

TEST_F(JobRunnerTest, EngineFailureIsContained) {
    ScriptedLauncher launcher(ProcessResult{.exit_code = 2,
                                            .stderr_output = "Input path does not exist\n"});
    auto runner = make_runner(launcher);
    std::stop_source stop;

    auto outcome = runner.run(make_job(6, JobClass::Batch, "wordcount", 3), TaskOffsets(3, 0.0),
                              RunClock::start_now(), stop.get_token());

    EXPECT_EQ(outcome.state, JobState::Failed);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->code, ErrorCode::JobExecutionFailure);
    EXPECT_EQ(outcome.diagnostics, "Input path does not exist");
}

TEST_F(JobRunnerTest, MissingEngineIsContained) {
    ScriptedLauncher launcher(Error{ErrorCode::EngineNotFound, "Engine executable not found: hadoop"});
    auto runner = make_runner(launcher);
    std::stop_source stop;

    auto outcome = runner.run(make_job(7, JobClass::Batch, "grep", 1), TaskOffsets(1, 0.0),
                              RunClock::start_now(), stop.get_token());

    EXPECT_EQ(outcome.state, JobState::Failed);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->code, ErrorCode::EngineNotFound);
}

TEST_F(JobRunnerTest, EngineWithRealProcessFailure) {
    PosixProcessLauncher launcher;
    CommandRegistry registry;
    registry.add("fail", MapCountCommand{.operation = "pi", .samples_per_map = 1});
    JobRunner runner(simulation_, EngineConfig{.enabled = true, .executable = "/bin/sh",
                                               .examples_jar = "/dev/null"},
                     std::move(registry), launcher, logger_, metrics_);
    std::stop_source stop;

    // Runs `/bin/sh jar /dev/null pi 1 1`: the shell cannot open a script named jar.
    auto outcome = runner.run(make_job(8, JobClass::Batch, "fail", 1), TaskOffsets(1, 0.0),
                              RunClock::start_now(), stop.get_token());

    EXPECT_EQ(outcome.mode, DispatchMode::Engine);
    EXPECT_EQ(outcome.state, JobState::Failed);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->code, ErrorCode::JobExecutionFailure);
    EXPECT_FALSE(outcome.diagnostics.empty());
}

// ─────────────────────────────────────────────
// Interactive
// ─────────────────────────────────────────────

TEST_F(JobRunnerTest, InteractiveRunsEveryTask) {
    ScriptedLauncher launcher(ProcessResult{});
    auto runner = make_runner(launcher);
    std::stop_source stop;

    // Even an app with an engine template is simulated for interactive jobs.
    auto start = std::chrono::steady_clock::now();
    auto outcome = runner.run(make_job(9, JobClass::Interactive, "pi", 4),
                              TaskOffsets{0.0, 0.1, 0.1, 0.2},
                              RunClock::start_now(), stop.get_token());
    double took = seconds(std::chrono::steady_clock::now() - start);

    EXPECT_EQ(outcome.mode, DispatchMode::SimulatedTasks);
    EXPECT_EQ(outcome.state, JobState::Completed);
    EXPECT_EQ(outcome.tasks_completed, 4u);
    // Last task arrives at 0.2s and takes 0.05s; tasks overlap.
    EXPECT_GE(took, 0.25);
    EXPECT_LT(took, 1.0);
    EXPECT_TRUE(launcher.commands().empty());
}

TEST_F(JobRunnerTest, InteractiveCancelledMidway) {
    ScriptedLauncher launcher(ProcessResult{});
    auto runner = make_runner(launcher);
    std::stop_source stop;

    std::jthread stopper([&stop] {
        std::this_thread::sleep_for(150ms);
        stop.request_stop();
    });
    auto outcome = runner.run(make_job(10, JobClass::Interactive, "web", 3),
                              TaskOffsets{0.0, 5.0, 10.0},
                              RunClock::start_now(), stop.get_token());

    EXPECT_EQ(outcome.state, JobState::Cancelled);
    EXPECT_EQ(outcome.tasks_completed, 1u);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->code, ErrorCode::Interrupted);
    EXPECT_LT(outcome.elapsed_sec, 3.0);
}
