#include <catch2/catch_test_macros.hpp>

#include <cashlog/core/log.hpp>

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace cashlog;

// ===========================================================================
// Helper: a sink that captures messages into a vector.
// ===========================================================================

struct CapturedMessage {
    LogLevel level;
    std::string component;
    std::string message;
};

class CaptureSink : public ILogSink {
public:
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override {
        messages.push_back(
            {level, std::string(component), std::string(message)});
    }

    std::vector<CapturedMessage> messages;
};

// ===========================================================================
// StreamSink
// ===========================================================================

TEST_CASE("StreamSink: writes level, component and message", "[log]") {
    std::ostringstream oss;
    StreamSink sink(oss);

    sink.Write(LogLevel::Warn, "store", "Query timed out");

    auto line = oss.str();
    CHECK(line.find(" [WARN] [store] Query timed out\n") != std::string::npos);
    // ISO-8601 UTC timestamp first: 2024-01-01T00:00:00.000Z
    REQUIRE(line.size() > 24);
    CHECK(line[4] == '-');
    CHECK(line[10] == 'T');
    CHECK(line[23] == 'Z');
}

// ===========================================================================
// JsonSink
// ===========================================================================

TEST_CASE("JsonSink: writes valid JSON lines", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Info, "rules", "started");

    auto line = oss.str();
    CHECK(line.find("\"level\":\"INFO\"") != std::string::npos);
    CHECK(line.find("\"component\":\"rules\"") != std::string::npos);
    CHECK(line.find("\"message\":\"started\"") != std::string::npos);
    CHECK(line.find("\"ts\":\"") != std::string::npos);
    REQUIRE(!line.empty());
    CHECK(line.back() == '\n');
}

TEST_CASE("JsonSink: each write produces one line", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Debug, "a", "first");
    sink.Write(LogLevel::Warn, "b", "second\nwith newline");

    auto output = oss.str();
    CHECK(std::count(output.begin(), output.end(), '\n') == 2);
}

TEST_CASE("JsonSink: escapes special characters in message", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Info, "esc", "line1\nline2\ttab \"quoted\" back\\slash");

    auto output = oss.str();
    CHECK(output.find("\\n") != std::string::npos);
    CHECK(output.find("\\t") != std::string::npos);
    CHECK(output.find("\\\"quoted\\\"") != std::string::npos);
    CHECK(output.find("back\\\\slash") != std::string::npos);
}

// ===========================================================================
// FileSink
// ===========================================================================

TEST_CASE("FileSink: appends to the log file", "[log]") {
    auto path = (std::filesystem::temp_directory_path() /
                 "cashlog_test_filesink.log").string();
    std::remove(path.c_str());

    {
        FileSink sink(path, false);
        REQUIRE(sink.IsOpen());
        sink.Write(LogLevel::Error, "main", "first");
    }
    {
        FileSink sink(path, true);
        sink.Write(LogLevel::Info, "main", "second");
    }

    std::ifstream in(path);
    std::string first, second;
    std::getline(in, first);
    std::getline(in, second);
    CHECK(first.find("[ERROR] [main] first") != std::string::npos);
    CHECK(second.find("\"message\":\"second\"") != std::string::npos);
    std::remove(path.c_str());
}

TEST_CASE("FileSink: reports an unopenable path", "[log]") {
    FileSink sink("/nonexistent-dir/cashlog/x.log", false);
    CHECK_FALSE(sink.IsOpen());
    sink.Write(LogLevel::Error, "main", "dropped");
}

// ===========================================================================
// Logger: level filtering
// ===========================================================================

TEST_CASE("Logger: respects min_level", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Warn);

    logger.Debug("c", "should be filtered");
    logger.Info("c", "should be filtered");
    logger.Warn("c", "should pass");
    logger.Error("c", "should pass");

    REQUIRE(sink_ptr->messages.size() == 2);
    CHECK(sink_ptr->messages[0].level == LogLevel::Warn);
    CHECK(sink_ptr->messages[1].level == LogLevel::Error);
}

TEST_CASE("Logger: SetLevel changes filtering dynamically", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Error);

    logger.Info("c", "filtered");
    CHECK(sink_ptr->messages.empty());

    logger.SetLevel(LogLevel::Info);
    logger.Info("mcp", "now passes");
    REQUIRE(sink_ptr->messages.size() == 1);
    CHECK(sink_ptr->messages[0].component == "mcp");
    CHECK(sink_ptr->messages[0].message == "now passes");
}

TEST_CASE("Logger: concurrent logging keeps every message", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Debug);

    constexpr int kThreads = 8;
    constexpr int kMessagesPerThread = 100;

    std::vector<std::thread> threads;
    threads.reserve(kThreads);
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&logger, t]() {
            for (int i = 0; i < kMessagesPerThread; ++i) {
                logger.Info("thread-" + std::to_string(t),
                            "msg-" + std::to_string(i));
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    CHECK(sink_ptr->messages.size() == kThreads * kMessagesPerThread);
}

// ===========================================================================
// Global logger
// ===========================================================================

TEST_CASE("GlobalLogger: routes free functions to the installed sink", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    InitGlobalLogger(std::move(sink), LogLevel::Info);

    LogDebug("store", "hidden");
    LogInfo("store", "opened");
    LogError("mcp", "broken pipe");

    REQUIRE(sink_ptr->messages.size() == 2);
    CHECK(sink_ptr->messages[0].message == "opened");
    CHECK(sink_ptr->messages[1].level == LogLevel::Error);

    // Leave a quiet logger behind for the other tests.
    InitGlobalLogger(std::make_unique<CaptureSink>(), LogLevel::Error);
}
