#pragma once

#include <atomic>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>

namespace workflow_tracker {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

/// Upper-case level name as written by every sink ("DEBUG", "INFO", ...).
const char* LogLevelName(LogLevel level);

class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void Write(LogLevel level, std::string_view component,
                       std::string_view message) = 0;
};

// "<iso8601> [LEVEL] [component] message" on stderr.
class ConsoleSink : public ILogSink {
public:
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
};

// Compact "HH:MM:SS LEVEL [component] message" with ANSI colors. Writes the
// ConsoleSink format when use_color is false.
class ColorConsoleSink : public ILogSink {
public:
    explicit ColorConsoleSink(bool use_color, std::ostream& out = std::cerr);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;

private:
    bool use_color_;
    std::ostream& out_;
};

// One JSON object per line: {"component","level","message","ts"}.
class JsonSink : public ILogSink {
public:
    explicit JsonSink(std::ostream& out);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;

private:
    std::ostream& out_;
};

// Appends ConsoleSink-format lines to the file named by `log_file`.
class FileSink : public ILogSink {
public:
    explicit FileSink(const std::string& path);
    [[nodiscard]] bool IsOpen() const { return out_.is_open(); }
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;

private:
    std::ofstream out_;
};

class TeeSink : public ILogSink {
public:
    TeeSink(std::unique_ptr<ILogSink> first, std::unique_ptr<ILogSink> second);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;

private:
    std::unique_ptr<ILogSink> first_;
    std::unique_ptr<ILogSink> second_;
};

/// Filters by level and forwards to one sink. Scan workers share the
/// process logger, so sink writes are serialized.
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink,
                    LogLevel min_level = LogLevel::Info);

    void SetLevel(LogLevel level) { min_level_.store(level); }
    [[nodiscard]] bool IsEnabled(LogLevel level) const {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void Log(LogLevel level, std::string_view component, std::string_view message);

    void Debug(std::string_view component, std::string_view message) {
        Log(LogLevel::Debug, component, message);
    }
    void Info(std::string_view component, std::string_view message) {
        Log(LogLevel::Info, component, message);
    }
    void Warn(std::string_view component, std::string_view message) {
        Log(LogLevel::Warn, component, message);
    }
    void Error(std::string_view component, std::string_view message) {
        Log(LogLevel::Error, component, message);
    }

private:
    std::unique_ptr<ILogSink> sink_;
    std::atomic<LogLevel> min_level_;
    std::mutex write_mutex_;
};

/// Replaces the process logger. Call once from main before the scan thread
/// starts; until then all logging is discarded.
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level);

Logger& GlobalLogger();

void LogDebug(std::string_view component, std::string_view message);
void LogInfo(std::string_view component, std::string_view message);
void LogWarn(std::string_view component, std::string_view message);
void LogError(std::string_view component, std::string_view message);

} // namespace workflow_tracker
