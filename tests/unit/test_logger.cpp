/**
 * @file test_logger.cpp
 * @brief Unit tests for the Logger front-end and JSON escaping.
 */

#include "core/logger.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace tracie;

namespace {

struct CapturedLines {
    std::vector<std::string> lines;
    int flushes = 0;
};

class CaptureSink : public ILogSink {
public:
    explicit CaptureSink(std::shared_ptr<CapturedLines> out) : out_(std::move(out)) {}
    void write(std::string_view line) override { out_->lines.emplace_back(line); }
    void flush() override { ++out_->flushes; }

private:
    std::shared_ptr<CapturedLines> out_;
};

}  // namespace

TEST(LoggerTest, JsonLineLayout) {
    auto captured = std::make_shared<CapturedLines>();
    Logger logger(std::make_unique<CaptureSink>(captured), LogLevel::Debug, LogFormat::Json);

    logger.info("job 3 started");
    ASSERT_EQ(captured->lines.size(), 1u);
    const auto& line = captured->lines.front();
    EXPECT_EQ(line.rfind(R"({"level":"info","ts":")", 0), 0u);
    EXPECT_NE(line.find(R"("msg":"job 3 started"})"), std::string::npos);
}

TEST(LoggerTest, TextLineLayout) {
    auto captured = std::make_shared<CapturedLines>();
    Logger logger(std::make_unique<CaptureSink>(captured), LogLevel::Debug, LogFormat::Text);

    logger.warn("engine slow");
    ASSERT_EQ(captured->lines.size(), 1u);
    EXPECT_NE(captured->lines.front().find("Z [warn] engine slow"), std::string::npos);
}

TEST(LoggerTest, LevelFilter) {
    auto captured = std::make_shared<CapturedLines>();
    Logger logger(std::make_unique<CaptureSink>(captured), LogLevel::Warn);

    logger.debug("hidden");
    logger.info("hidden");
    logger.warn("shown");
    logger.error("shown");
    EXPECT_EQ(captured->lines.size(), 2u);

    logger.set_level(LogLevel::Debug);
    logger.debug("now shown");
    EXPECT_EQ(captured->lines.size(), 3u);
    EXPECT_EQ(logger.level(), LogLevel::Debug);
}

TEST(LoggerTest, JsonMessageIsEscaped) {
    auto captured = std::make_shared<CapturedLines>();
    Logger logger(std::make_unique<CaptureSink>(captured), LogLevel::Info, LogFormat::Json);

    logger.error("stderr: \"boom\"\nline two");
    ASSERT_EQ(captured->lines.size(), 1u);
    EXPECT_NE(captured->lines.front().find(R"(stderr: \"boom\"\nline two)"), std::string::npos);
}

TEST(LoggerTest, ConcurrentWritesKeepWholeLines) {
    auto captured = std::make_shared<CapturedLines>();
    Logger logger(std::make_unique<CaptureSink>(captured), LogLevel::Info, LogFormat::Text);

    {
        std::vector<std::jthread> writers;
        for (int w = 0; w < 4; ++w) {
            writers.emplace_back([&logger, w] {
                for (int i = 0; i < 100; ++i) logger.info("writer " + std::to_string(w));
            });
        }
    }
    EXPECT_EQ(captured->lines.size(), 400u);
}

TEST(LoggerTest, FlushReachesSink) {
    auto captured = std::make_shared<CapturedLines>();
    Logger logger(std::make_unique<CaptureSink>(captured));
    logger.flush();
    EXPECT_EQ(captured->flushes, 1);
}

TEST(LogNamesTest, ParseLevelAndFormat) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("error"), LogLevel::Error);
    EXPECT_FALSE(parse_log_level("loud").has_value());
    EXPECT_EQ(parse_log_format("json"), LogFormat::Json);
    EXPECT_EQ(parse_log_format("text"), LogFormat::Text);
    EXPECT_FALSE(parse_log_format("yaml").has_value());
}

TEST(JsonEscapeTest, SpecialCharacters) {
    EXPECT_EQ(json_escape("plain"), "plain");
    EXPECT_EQ(json_escape("a\"b"), "a\\\"b");
    EXPECT_EQ(json_escape("back\\slash"), "back\\\\slash");
    EXPECT_EQ(json_escape("tab\there"), "tab\\there");
    EXPECT_EQ(json_escape(std::string_view("\x01", 1)), "\\u0001");
}
