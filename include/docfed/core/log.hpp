#pragma once

#include <docfed/core/result.hpp>
#include <docfed/core/value.hpp>

#include <atomic>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace docfed {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

/// Parse "debug", "info", "warn"/"warning" or "error" (case-insensitive).
Result<LogLevel, Error> ParseLogLevel(std::string_view token);

const char* LogLevelName(LogLevel level);

// One log event. The logger stamps the time once; every sink sees the same
// record.
struct LogRecord {
    Timestamp time;
    LogLevel level = LogLevel::Info;
    std::string_view component;  // "parser", "loader", "strategy", ...
    std::string_view message;
};

class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void Write(const LogRecord& record) = 0;
};

// ---------------------------------------------------------------------------
// TextSink: one human-readable line per record.
//
// Plain:   2023-05-15T10:20:30.250Z WARN  [loader] message
// Colored: 10:20:30 WARN  [loader] message   (level tag colored, errors red)
// ---------------------------------------------------------------------------
class TextSink : public ILogSink {
public:
    explicit TextSink(bool use_color, std::ostream& out = std::cerr);
    void Write(const LogRecord& record) override;

private:
    bool use_color_;
    std::ostream& out_;
};

// JSON lines: {"ts", "level", "component", "message"}.
class JsonLinesSink : public ILogSink {
public:
    explicit JsonLinesSink(std::ostream& out);
    void Write(const LogRecord& record) override;

private:
    std::ostream& out_;
};

// Appends JSON lines to a file it owns, flushing after every record.
class FileSink : public ILogSink {
    struct OpenKey {
        explicit OpenKey() = default;
    };

public:
    static Result<std::unique_ptr<FileSink>, Error> Open(const std::string& path);

    FileSink(OpenKey, std::ofstream file);
    void Write(const LogRecord& record) override;

private:
    std::ofstream file_;
    JsonLinesSink json_;
};

// Forwards every record to each of its sinks in order.
class FanOutSink : public ILogSink {
public:
    FanOutSink() = default;
    void Add(std::unique_ptr<ILogSink> sink);
    void Write(const LogRecord& record) override;

private:
    std::vector<std::unique_ptr<ILogSink>> sinks_;
};

// Thread-safe front end. Level checks do not lock; writes are serialized.
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink,
                    LogLevel min_level = LogLevel::Warn);

    void SetLevel(LogLevel level) noexcept;
    [[nodiscard]] bool IsEnabled(LogLevel level) const noexcept;

    void Log(LogLevel level, std::string_view component, std::string_view message);

private:
    std::unique_ptr<ILogSink> sink_;
    std::atomic<LogLevel> min_level_;
    std::mutex write_mutex_;
};

// ---------------------------------------------------------------------------
// Process-wide logger, installed by main. Until then messages are dropped.
// ---------------------------------------------------------------------------
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level);
Logger& GlobalLogger();

void LogDebug(std::string_view component, std::string_view message);
void LogInfo(std::string_view component, std::string_view message);
void LogWarn(std::string_view component, std::string_view message);
void LogError(std::string_view component, std::string_view message);

} // namespace docfed
