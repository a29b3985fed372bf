/**
 * @file test_logging.cpp
 * @brief Unit tests for the Logger, its sinks and the RunRecorder.
 */

#include "core/logger.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/run_recorder.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace cut_shoot;

// Logger owns its sink; keep a raw view for inspection.
struct CapturedLogger {
    MemorySink* sink;
    Logger logger;

    explicit CapturedLogger(LogLevel level = LogLevel::Debug)
        : CapturedLogger(std::make_unique<MemorySink>(), level) {}

private:
    CapturedLogger(std::unique_ptr<MemorySink> owned, LogLevel level)
        : sink(owned.get()), logger(std::move(owned), level) {}
};

// ─── Logger ──────────────────────────────────

TEST(LoggerTest, WritesNdjsonLines) {
    CapturedLogger captured;
    captured.logger.info("partitioner", "Partitioned into 3 partitions");

    ASSERT_EQ(captured.sink->lines().size(), 1u);
    const auto& line = captured.sink->lines()[0];
    EXPECT_EQ(line.front(), '{');
    EXPECT_EQ(line.back(), '}');
    EXPECT_NE(line.find(R"("level":"info")"), std::string::npos);
    EXPECT_NE(line.find(R"("component":"partitioner")"), std::string::npos);
    EXPECT_NE(line.find(R"("msg":"Partitioned into 3 partitions")"), std::string::npos);
    EXPECT_NE(line.find(R"("ts":")"), std::string::npos);
}

TEST(LoggerTest, FiltersBelowMinimumLevel) {
    CapturedLogger captured(LogLevel::Warn);
    captured.logger.debug("milp", "dropped");
    captured.logger.info("milp", "dropped");
    captured.logger.warn("milp", "kept");
    captured.logger.error("milp", "kept");
    EXPECT_EQ(captured.sink->lines().size(), 2u);

    captured.logger.set_level(LogLevel::Debug);
    EXPECT_TRUE(captured.logger.enabled(LogLevel::Debug));
    captured.logger.debug("milp", "kept");
    EXPECT_EQ(captured.sink->lines().size(), 3u);
}

TEST(LoggerTest, LevelChangesRaceFreeWithLogging) {
    CapturedLogger captured(LogLevel::Warn);
    constexpr int kWriters = 4;
    constexpr int kLinesPerWriter = 200;

    std::vector<std::thread> threads;
    threads.emplace_back([&captured] {
        for (int i = 0; i < 1000; ++i) {
            captured.logger.set_level(i % 2 == 0 ? LogLevel::Debug : LogLevel::Warn);
        }
    });
    for (int w = 0; w < kWriters; ++w) {
        threads.emplace_back([&captured] {
            for (int i = 0; i < kLinesPerWriter; ++i) {
                captured.logger.error("sweep", "always kept");
                (void)captured.logger.enabled(LogLevel::Debug);
            }
        });
    }
    for (auto& t : threads) t.join();

    // Error passes every level the toggler sets.
    EXPECT_EQ(captured.sink->lines().size(), static_cast<size_t>(kWriters * kLinesPerWriter));
    EXPECT_EQ(captured.logger.level(), LogLevel::Warn);
}

TEST(LoggerTest, EscapesMessages) {
    EXPECT_EQ(json_escape(R"(say "hi")"), R"(say \"hi\")");
    EXPECT_EQ(json_escape("a\\b\nc"), "a\\\\b\\nc");
    EXPECT_EQ(json_escape(std::string(1, '\x01')), "\\u0001");
}

TEST(LoggerTest, EventsAreWrittenVerbatim) {
    CapturedLogger captured(LogLevel::Error);
    captured.logger.event(R"({"event":"custom"})");
    ASSERT_EQ(captured.sink->lines().size(), 1u);
    EXPECT_EQ(captured.sink->lines()[0], R"({"event":"custom"})");
}

TEST(LoggerTest, LevelNames) {
    EXPECT_EQ(parse_log_level("warn"), LogLevel::Warn);
    EXPECT_FALSE(parse_log_level("trace").has_value());
    EXPECT_EQ(to_string(LogLevel::Error), "error");
}

// ─── StreamSink ──────────────────────────────

TEST(StreamSinkTest, WritesToTheGivenStream) {
    std::ostringstream out;
    Logger logger(std::make_unique<StreamSink>(out), LogLevel::Info);
    logger.info("main", "to stderr in report mode");
    logger.flush();

    const auto text = out.str();
    EXPECT_NE(text.find(R"("msg":"to stderr in report mode")"), std::string::npos);
    EXPECT_EQ(text.back(), '\n');
}

// ─── JsonFileSink ────────────────────────────

TEST(JsonFileSinkTest, WritesAndRotates) {
    auto dir = std::filesystem::temp_directory_path() / "cs_test_sink";
    std::filesystem::remove_all(dir);
    {
        // 1 MB threshold; two large lines force one rotation.
        JsonFileSink sink(dir, "run", 1, 2);
        std::string big(600 * 1024, 'x');
        sink.write(big);
        sink.write(big);
        sink.write(R"({"after":"rotation"})");
        sink.flush();
    }

    EXPECT_TRUE(std::filesystem::exists(dir / "run.ndjson"));
    EXPECT_TRUE(std::filesystem::exists(dir / "run.1.ndjson"));

    std::ifstream current(dir / "run.ndjson");
    std::string line;
    std::getline(current, line);
    EXPECT_EQ(line, R"({"after":"rotation"})");
    std::filesystem::remove_all(dir);
}

// ─── RunRecorder ─────────────────────────────

TEST(RunRecorderTest, RecordsFinishedRun) {
    CapturedLogger captured(LogLevel::Error);
    RunRecorder recorder(captured.logger);

    OptimizationReport report;
    report.pipeline = Pipeline::Staged;
    report.mode = ObjectiveMode::JointUniform;
    report.objective = 12.5;
    report.partition.cut_count = 2;
    recorder.record(report);

    ASSERT_EQ(captured.sink->lines().size(), 1u);
    const auto& line = captured.sink->lines()[0];
    EXPECT_NE(line.find(R"("event":"run_finished")"), std::string::npos);
    EXPECT_NE(line.find(R"("mode":"joint_uniform")"), std::string::npos);
    EXPECT_NE(line.find(R"("cuts":2)"), std::string::npos);
    EXPECT_EQ(recorder.recorded(), 1u);
}

TEST(RunRecorderTest, RecordsFailureWithCause) {
    CapturedLogger captured(LogLevel::Error);
    RunRecorder recorder(captured.logger);
    recorder.record_failure(Pipeline::Joint, infeasible("no \"room\"", "predicate"));

    ASSERT_EQ(captured.sink->lines().size(), 1u);
    const auto& line = captured.sink->lines()[0];
    EXPECT_NE(line.find(R"("event":"run_failed")"), std::string::npos);
    EXPECT_NE(line.find(R"("code":"infeasible")"), std::string::npos);
    EXPECT_NE(line.find(R"("likely_cause":"predicate")"), std::string::npos);
    EXPECT_NE(line.find(R"(no \"room\")"), std::string::npos);
}
