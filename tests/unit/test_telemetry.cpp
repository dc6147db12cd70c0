/**
 * @file test_telemetry.cpp
 * @brief Unit tests for the event collector and the rotating file sink.
 */

#include "executor/engine_command.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

using namespace tracie;

namespace {

class CaptureSink : public ILogSink {
public:
    explicit CaptureSink(std::shared_ptr<std::vector<std::string>> out) : out_(std::move(out)) {}
    void write(std::string_view line) override { out_->emplace_back(line); }
    void flush() override {}

private:
    std::shared_ptr<std::vector<std::string>> out_;
};

bool contains(const std::string& haystack, std::string_view needle) {
    return haystack.find(needle) != std::string::npos;
}

}  // namespace

// ═══════════════════════════════════════════════
// MetricsCollector
// ═══════════════════════════════════════════════

class MetricsCollectorTest : public ::testing::Test {
protected:
    std::shared_ptr<std::vector<std::string>> lines_ = std::make_shared<std::vector<std::string>>();
    MetricsCollector metrics_{std::make_unique<CaptureSink>(lines_)};
};

TEST_F(MetricsCollectorTest, JobDispatchedEvent) {
    JobRecord job{.job_id = 7, .arrival_time_sec = 1.25, .job_class = JobClass::Batch,
                  .app_type = "pi", .task_count = 3};
    metrics_.record_job_dispatched(job, 1.3);

    ASSERT_EQ(lines_->size(), 1u);
    const auto& line = lines_->front();
    EXPECT_TRUE(contains(line, R"("event":"job_dispatched")"));
    EXPECT_TRUE(contains(line, R"("job":7)"));
    EXPECT_TRUE(contains(line, R"("type":"B")"));
    EXPECT_TRUE(contains(line, R"("app":"pi")"));
    EXPECT_TRUE(contains(line, R"("tasks":3)"));
}

TEST_F(MetricsCollectorTest, LongRunTimesKeepFullPrecision) {
    JobRecord job{.job_id = 1, .arrival_time_sec = 1234567.5, .job_class = JobClass::Interactive,
                  .app_type = "web", .task_count = 1};
    metrics_.record_job_dispatched(job, 1234567.891);

    ASSERT_EQ(lines_->size(), 1u);
    const auto& line = lines_->front();
    EXPECT_TRUE(contains(line, R"("t":1234567.891)")) << line;
    EXPECT_TRUE(contains(line, R"("arrival_sec":1234567.5)")) << line;
}

TEST_F(MetricsCollectorTest, FailedOutcomeCarriesErrorAndStderr) {
    JobOutcome outcome{
        .job_id = 4,
        .job_class = JobClass::Batch,
        .app_type = "wordcount",
        .mode = DispatchMode::Engine,
        .state = JobState::Failed,
    };
    outcome.error = Error{ErrorCode::JobExecutionFailure, "hadoop exited with status 2"};
    outcome.diagnostics = "Input path \"/inputs\" does not exist";

    metrics_.record_job_finished(outcome, 9.0);

    ASSERT_EQ(lines_->size(), 1u);
    const auto& line = lines_->front();
    EXPECT_TRUE(contains(line, R"("state":"failed")"));
    EXPECT_TRUE(contains(line, R"("mode":"engine")"));
    EXPECT_TRUE(contains(line, R"("error":"job_execution_failure")"));
    EXPECT_TRUE(contains(line, R"("stderr":"Input path \"/inputs\" does not exist")"));
    EXPECT_FALSE(contains(line, "tasks_completed"));
}

TEST_F(MetricsCollectorTest, InteractiveOutcomeReportsTasks) {
    JobOutcome outcome{
        .job_id = 2,
        .job_class = JobClass::Interactive,
        .app_type = "web",
        .mode = DispatchMode::SimulatedTasks,
        .state = JobState::Completed,
        .tasks_completed = 5,
    };
    metrics_.record_job_finished(outcome, 3.0);
    ASSERT_EQ(lines_->size(), 1u);
    EXPECT_TRUE(contains(lines_->front(), R"("tasks_completed":5)"));
}

TEST_F(MetricsCollectorTest, TaskAndCommandEvents) {
    metrics_.record_task_event(3, 0, "start", 0.5, 0.0);
    metrics_.record_engine_command(3, EngineCommand{"hadoop", {"jar", "x.jar", "pi"}}, 0.6);
    metrics_.record_custom("replay_summary", R"({"dispatched":1})");

    ASSERT_EQ(lines_->size(), 3u);
    EXPECT_TRUE(contains((*lines_)[0], R"("event":"task_start")"));
    EXPECT_TRUE(contains((*lines_)[1], R"("command":"hadoop jar x.jar pi")"));
    EXPECT_TRUE(contains((*lines_)[2], R"("data":{"dispatched":1})"));
}

// ═══════════════════════════════════════════════
// JsonFileSink
// ═══════════════════════════════════════════════

class JsonFileSinkTest : public ::testing::Test {
protected:
    std::filesystem::path dir_;

    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / "tracie_test_sink";
        std::filesystem::remove_all(dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    static size_t count_lines(const std::filesystem::path& path) {
        std::ifstream in(path);
        size_t n = 0;
        for (std::string line; std::getline(in, line);) ++n;
        return n;
    }
};

TEST_F(JsonFileSinkTest, CreatesDirectoryAndWritesLines) {
    {
        JsonFileSink sink(dir_, "events");
        ASSERT_TRUE(sink.is_open());
        sink.write(R"({"event":"a"})");
        sink.write(R"({"event":"b"})");
        sink.flush();
        EXPECT_EQ(sink.current_path(), dir_ / "events.ndjson");
    }
    EXPECT_EQ(count_lines(dir_ / "events.ndjson"), 2u);
}

TEST_F(JsonFileSinkTest, RotatesWhenFull) {
    {
        // Zero-megabyte limit: every write after the first rotates.
        JsonFileSink sink(dir_, "events", 0, 2);
        sink.write("one");
        sink.write("two");
        sink.write("three");
    }
    EXPECT_EQ(count_lines(dir_ / "events.ndjson"), 1u);
    EXPECT_TRUE(std::filesystem::exists(dir_ / "events.1.ndjson"));
    EXPECT_TRUE(std::filesystem::exists(dir_ / "events.2.ndjson"));
    EXPECT_FALSE(std::filesystem::exists(dir_ / "events.3.ndjson"));
}
