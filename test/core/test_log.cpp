#include <catch2/catch_test_macros.hpp>

#include <docfed/core/log.hpp>

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

using namespace docfed;

namespace {

struct Captured {
    LogLevel level;
    std::string component;
    std::string message;
};

class CaptureSink : public ILogSink {
public:
    explicit CaptureSink(std::vector<Captured>* out) : out_(out) {}

    void Write(const LogRecord& record) override {
        out_->push_back({record.level, std::string(record.component),
                         std::string(record.message)});
    }

private:
    std::vector<Captured>* out_;
};

// 2023-05-15T10:20:30.250Z
constexpr Timestamp kFixedTime{1684146030250};

LogRecord Record(LogLevel level, std::string_view component, std::string_view message) {
    return LogRecord{kFixedTime, level, component, message};
}

std::string TempLogPath(const std::string& name) {
    return (std::filesystem::temp_directory_path() / ("docfed_test_" + name + ".log")).string();
}

} // anonymous namespace

// ===========================================================================
// ParseLogLevel
// ===========================================================================

TEST_CASE("ParseLogLevel: accepts level names case-insensitively", "[log]") {
    CHECK(ParseLogLevel("debug").Value() == LogLevel::Debug);
    CHECK(ParseLogLevel("INFO").Value() == LogLevel::Info);
    CHECK(ParseLogLevel("Warn").Value() == LogLevel::Warn);
    CHECK(ParseLogLevel("warning").Value() == LogLevel::Warn);
    CHECK(ParseLogLevel("error").Value() == LogLevel::Error);
}

TEST_CASE("ParseLogLevel: unknown token is a config error", "[log]") {
    auto r = ParseLogLevel("verbose");
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Config);
    CHECK(r.Error().target == "verbose");
}

// ===========================================================================
// TextSink
// ===========================================================================

TEST_CASE("TextSink: plain line carries timestamp, level and component", "[log]") {
    std::ostringstream oss;
    TextSink sink(false, oss);

    sink.Write(Record(LogLevel::Warn, "loader", "Serving snapshot [crm]"));

    CHECK(oss.str() == "2023-05-15T10:20:30.250Z WARN  [loader] Serving snapshot [crm]\n");
}

TEST_CASE("TextSink: colored output", "[log]") {
    std::ostringstream info_oss, error_oss;
    TextSink(true, info_oss).Write(Record(LogLevel::Info, "engine", "m"));
    TextSink(true, error_oss).Write(Record(LogLevel::Error, "engine", "m"));

    const auto info = info_oss.str();
    CHECK(info.find("10:20:30") != std::string::npos);
    CHECK(info.find("2023-05-15") == std::string::npos);
    CHECK(info.find("\033[36mINFO ") != std::string::npos);

    // The message of an error is red too.
    const auto error = error_oss.str();
    auto first = error.find("\033[1;31m");
    REQUIRE(first != std::string::npos);
    CHECK(error.find("\033[1;31mm\033[0m", first + 1) != std::string::npos);
}

// ===========================================================================
// JsonLinesSink
// ===========================================================================

TEST_CASE("JsonLinesSink: one object per record", "[log]") {
    std::ostringstream oss;
    JsonLinesSink sink(oss);

    sink.Write(Record(LogLevel::Info, "loader", "fetched 3 row(s)"));
    sink.Write(Record(LogLevel::Warn, "strategy", "refresh failed"));

    std::istringstream lines(oss.str());
    std::string first, second;
    REQUIRE(std::getline(lines, first));
    REQUIRE(std::getline(lines, second));

    auto j = Json::parse(first);
    CHECK(j["ts"] == "2023-05-15T10:20:30.250Z");
    CHECK(j["level"] == "INFO");
    CHECK(j["component"] == "loader");
    CHECK(j["message"] == "fetched 3 row(s)");
    CHECK(Json::parse(second)["level"] == "WARN");
}

TEST_CASE("JsonLinesSink: special characters survive a parse", "[log]") {
    std::ostringstream oss;
    JsonLinesSink(oss).Write(Record(LogLevel::Error, "parser", "near \"FROM\"\nat C:\\q"));

    const std::string output = oss.str();
    CHECK(std::count(output.begin(), output.end(), '\n') == 1);
    CHECK(Json::parse(output)["message"] == "near \"FROM\"\nat C:\\q");
}

// ===========================================================================
// FileSink / FanOutSink
// ===========================================================================

TEST_CASE("FileSink: appends JSON lines to the file", "[log]") {
    const auto path = TempLogPath("file_sink");
    std::remove(path.c_str());

    for (int run = 0; run < 2; ++run) {
        auto sink = FileSink::Open(path);
        REQUIRE(sink.IsOk());
        sink.Value()->Write(Record(LogLevel::Warn, "loader", "served from snapshot"));
    }

    std::ifstream in(path);
    std::vector<std::string> lines;
    for (std::string line; std::getline(in, line);) lines.push_back(line);
    REQUIRE(lines.size() == 2);
    CHECK(Json::parse(lines[1])["component"] == "loader");
    std::remove(path.c_str());
}

TEST_CASE("FileSink: only Open constructs a sink", "[log]") {
    STATIC_REQUIRE_FALSE(std::is_constructible_v<FileSink, std::ofstream>);
    STATIC_REQUIRE_FALSE(std::is_default_constructible_v<FileSink>);
}

TEST_CASE("FileSink: unwritable path is a config error", "[log]") {
    auto sink = FileSink::Open("/nonexistent-dir/docfed/x.log");
    REQUIRE(sink.IsErr());
    CHECK(sink.Error().category == ErrorCategory::Config);
    CHECK(sink.Error().ExitCode() == 5);
}

TEST_CASE("FanOutSink: forwards to every sink", "[log]") {
    std::vector<Captured> first;
    std::vector<Captured> second;
    FanOutSink fan;
    fan.Add(std::make_unique<CaptureSink>(&first));
    fan.Add(nullptr);
    fan.Add(std::make_unique<CaptureSink>(&second));

    fan.Write(Record(LogLevel::Info, "cli", "hello"));

    REQUIRE(first.size() == 1);
    REQUIRE(second.size() == 1);
    CHECK(second[0].component == "cli");
}

// ===========================================================================
// Logger
// ===========================================================================

TEST_CASE("Logger: filters below the minimum level", "[log]") {
    std::vector<Captured> messages;
    Logger logger(std::make_unique<CaptureSink>(&messages), LogLevel::Warn);

    logger.Log(LogLevel::Debug, "c", "d");
    logger.Log(LogLevel::Info, "c", "i");
    logger.Log(LogLevel::Warn, "c", "w");
    logger.Log(LogLevel::Error, "c", "e");

    REQUIRE(messages.size() == 2);
    CHECK(messages[0].level == LogLevel::Warn);
    CHECK(messages[1].level == LogLevel::Error);
    CHECK_FALSE(logger.IsEnabled(LogLevel::Info));
}

TEST_CASE("Logger: SetLevel changes filtering", "[log]") {
    std::vector<Captured> messages;
    Logger logger(std::make_unique<CaptureSink>(&messages), LogLevel::Error);

    logger.Log(LogLevel::Info, "executor", "filtered");
    CHECK(messages.empty());

    logger.SetLevel(LogLevel::Info);
    logger.Log(LogLevel::Info, "executor", "passes");
    REQUIRE(messages.size() == 1);
    CHECK(messages[0].component == "executor");
    CHECK(messages[0].message == "passes");
}

TEST_CASE("Logger: concurrent logging keeps every message", "[log]") {
    std::vector<Captured> messages;
    Logger logger(std::make_unique<CaptureSink>(&messages), LogLevel::Debug);

    constexpr int kThreads = 8;
    constexpr int kMessagesPerThread = 100;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&logger, t]() {
            for (int i = 0; i < kMessagesPerThread; ++i) {
                logger.Log(LogLevel::Info, "worker-" + std::to_string(t),
                           "msg-" + std::to_string(i));
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    CHECK(messages.size() == kThreads * kMessagesPerThread);
}
