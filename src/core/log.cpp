#include <docfed/core/log.hpp>
#include <docfed/core/ansi.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>

namespace docfed {

namespace {

Timestamp WallClockNow() {
    const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return Timestamp{
        std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count()};
}

const char* LevelColor(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return ansi::kDim;
        case LogLevel::Info:  return ansi::kCyan;
        case LogLevel::Warn:  return ansi::kYellow;
        case LogLevel::Error: return ansi::kRed;
    }
    return "";
}

// Level names padded to the width of the longest one.
std::string PaddedLevel(LogLevel level) {
    std::string name = LogLevelName(level);
    name.resize(5, ' ');
    return name;
}

class DiscardSink : public ILogSink {
public:
    void Write(const LogRecord&) override {}
};

std::unique_ptr<Logger>& GlobalLoggerSlot() {
    static auto slot = std::make_unique<Logger>(std::make_unique<DiscardSink>(), LogLevel::Error);
    return slot;
}

} // anonymous namespace

Result<LogLevel, Error> ParseLogLevel(std::string_view token) {
    std::string lower(token);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return Result<LogLevel, Error>::Ok(LogLevel::Debug);
    if (lower == "info") return Result<LogLevel, Error>::Ok(LogLevel::Info);
    if (lower == "warn" || lower == "warning") {
        return Result<LogLevel, Error>::Ok(LogLevel::Warn);
    }
    if (lower == "error") return Result<LogLevel, Error>::Ok(LogLevel::Error);
    return Result<LogLevel, Error>::Err(Error::Make(
        ErrorCategory::Config, "ParseLogLevel", std::string(token),
        "Unknown log level, expected one of: debug, info, warn, error"));
}

const char* LogLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

// ===========================================================================
// Sinks
// ===========================================================================

TextSink::TextSink(bool use_color, std::ostream& out) : use_color_(use_color), out_(out) {}

void TextSink::Write(const LogRecord& record) {
    const std::string stamp = FormatTimestamp(record.time);
    if (!use_color_) {
        out_ << stamp << ' ' << PaddedLevel(record.level) << " [" << record.component << "] "
             << record.message << '\n';
        return;
    }

    // Time of day only: "2023-05-15T10:20:30.250Z" -> "10:20:30".
    const char* color = LevelColor(record.level);
    out_ << ansi::kDim << stamp.substr(11, 8) << ansi::kReset << ' '
         << color << PaddedLevel(record.level) << ansi::kReset << ' '
         << ansi::kDim << '[' << record.component << ']' << ansi::kReset << ' ';
    if (record.level == LogLevel::Error) {
        out_ << color << record.message << ansi::kReset;
    } else {
        out_ << record.message;
    }
    out_ << '\n';
}

JsonLinesSink::JsonLinesSink(std::ostream& out) : out_(out) {}

void JsonLinesSink::Write(const LogRecord& record) {
    Json line;
    line["ts"] = FormatTimestamp(record.time);
    line["level"] = LogLevelName(record.level);
    line["component"] = std::string(record.component);
    line["message"] = std::string(record.message);
    out_ << line.dump(-1, ' ', false, Json::error_handler_t::replace) << '\n';
}

FileSink::FileSink(OpenKey, std::ofstream file) : file_(std::move(file)), json_(file_) {}

Result<std::unique_ptr<FileSink>, Error> FileSink::Open(const std::string& path) {
    std::ofstream file(path, std::ios::app);
    if (!file.is_open()) {
        return Result<std::unique_ptr<FileSink>, Error>::Err(Error::Make(
            ErrorCategory::Config, "OpenLogFile", path, "Cannot open log file for writing"));
    }
    return Result<std::unique_ptr<FileSink>, Error>::Ok(
        std::make_unique<FileSink>(OpenKey{}, std::move(file)));
}

void FileSink::Write(const LogRecord& record) {
    json_.Write(record);
    file_.flush();
}

void FanOutSink::Add(std::unique_ptr<ILogSink> sink) {
    if (sink) sinks_.push_back(std::move(sink));
}

void FanOutSink::Write(const LogRecord& record) {
    for (auto& sink : sinks_) {
        sink->Write(record);
    }
}

// ===========================================================================
// Logger
// ===========================================================================

Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : sink_(std::move(sink)), min_level_(min_level) {}

void Logger::SetLevel(LogLevel level) noexcept {
    min_level_.store(level);
}

bool Logger::IsEnabled(LogLevel level) const noexcept {
    return static_cast<int>(level) >= static_cast<int>(min_level_.load());
}

void Logger::Log(LogLevel level, std::string_view component, std::string_view message) {
    if (!IsEnabled(level)) return;
    const LogRecord record{WallClockNow(), level, component, message};
    std::lock_guard<std::mutex> lock(write_mutex_);
    sink_->Write(record);
}

void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level) {
    GlobalLoggerSlot() = std::make_unique<Logger>(std::move(sink), min_level);
}

Logger& GlobalLogger() {
    return *GlobalLoggerSlot();
}

void LogDebug(std::string_view component, std::string_view message) {
    GlobalLogger().Log(LogLevel::Debug, component, message);
}

void LogInfo(std::string_view component, std::string_view message) {
    GlobalLogger().Log(LogLevel::Info, component, message);
}

void LogWarn(std::string_view component, std::string_view message) {
    GlobalLogger().Log(LogLevel::Warn, component, message);
}

void LogError(std::string_view component, std::string_view message) {
    GlobalLogger().Log(LogLevel::Error, component, message);
}

} // namespace docfed
