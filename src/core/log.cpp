#include <workflow_tracker/core/log.hpp>
#include <workflow_tracker/core/terminal.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace workflow_tracker {

namespace {

struct LevelStyle {
    const char* name;
    const char* padded;
    const char* color;
};

LevelStyle StyleOf(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return {"DEBUG", "DEBUG", ansi::kDim};
        case LogLevel::Info:  return {"INFO", "INFO ", ansi::kCyan};
        case LogLevel::Warn:  return {"WARN", "WARN ", ansi::kYellow};
        case LogLevel::Error: return {"ERROR", "ERROR", ansi::kRed};
    }
    return {"UNKNOWN", "?????", ""};
}

// UTC with milliseconds for persisted lines, local wall clock for the
// interactive console.
std::string Timestamp(bool utc) {
    using Clock = std::chrono::system_clock;
    const auto now = Clock::now();
    const std::time_t secs = Clock::to_time_t(now);
    std::tm parts{};
    if (utc) {
        gmtime_r(&secs, &parts);
    } else {
        localtime_r(&secs, &parts);
    }

    std::ostringstream out;
    if (!utc) {
        out << std::put_time(&parts, "%H:%M:%S");
        return out.str();
    }
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            now.time_since_epoch()).count() % 1000;
    out << std::put_time(&parts, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setw(3) << std::setfill('0') << millis << 'Z';
    return out.str();
}

void WriteRecord(std::ostream& out, LogLevel level, std::string_view component,
                 std::string_view message) {
    out << Timestamp(true) << " [" << StyleOf(level).name << "] [" << component
        << "] " << message << '\n';
}

class DiscardSink : public ILogSink {
public:
    void Write(LogLevel, std::string_view, std::string_view) override {}
};

std::unique_ptr<Logger>& ProcessLogger() {
    static std::unique_ptr<Logger> logger =
        std::make_unique<Logger>(std::make_unique<DiscardSink>(), LogLevel::Error);
    return logger;
}

} // namespace

const char* LogLevelName(LogLevel level) {
    return StyleOf(level).name;
}

void ConsoleSink::Write(LogLevel level, std::string_view component,
                        std::string_view message) {
    WriteRecord(std::cerr, level, component, message);
}

ColorConsoleSink::ColorConsoleSink(bool use_color, std::ostream& out)
    : use_color_(use_color), out_(out) {}

void ColorConsoleSink::Write(LogLevel level, std::string_view component,
                             std::string_view message) {
    if (!use_color_) {
        WriteRecord(out_, level, component, message);
        return;
    }
    const auto style = StyleOf(level);
    out_ << ansi::kDim << Timestamp(false) << ansi::kReset << ' '
         << style.color << style.padded << ansi::kReset << ' '
         << ansi::kDim << '[' << component << ']' << ansi::kReset << ' ';
    // Errors stay red through the message text.
    if (level == LogLevel::Error) {
        out_ << style.color << message << ansi::kReset << '\n';
    } else {
        out_ << message << '\n';
    }
}

JsonSink::JsonSink(std::ostream& out) : out_(out) {}

void JsonSink::Write(LogLevel level, std::string_view component,
                     std::string_view message) {
    const nlohmann::json record = {
        {"ts", Timestamp(true)},
        {"level", StyleOf(level).name},
        {"component", std::string(component)},
        {"message", std::string(message)},
    };
    out_ << record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
         << '\n';
}

FileSink::FileSink(const std::string& path) : out_(path, std::ios::app) {}

void FileSink::Write(LogLevel level, std::string_view component,
                     std::string_view message) {
    if (out_.is_open()) {
        WriteRecord(out_, level, component, message);
        out_.flush();
    }
}

TeeSink::TeeSink(std::unique_ptr<ILogSink> first, std::unique_ptr<ILogSink> second)
    : first_(std::move(first)), second_(std::move(second)) {}

void TeeSink::Write(LogLevel level, std::string_view component,
                    std::string_view message) {
    for (auto* sink : {first_.get(), second_.get()}) {
        if (sink != nullptr) {
            sink->Write(level, component, message);
        }
    }
}

Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : sink_(std::move(sink)), min_level_(min_level) {}

void Logger::Log(LogLevel level, std::string_view component,
                 std::string_view message) {
    if (!IsEnabled(level)) {
        return;
    }
    std::lock_guard<std::mutex> lock(write_mutex_);
    sink_->Write(level, component, message);
}

void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level) {
    ProcessLogger() = std::make_unique<Logger>(std::move(sink), min_level);
}

Logger& GlobalLogger() { return *ProcessLogger(); }

void LogDebug(std::string_view component, std::string_view message) {
    GlobalLogger().Debug(component, message);
}

void LogInfo(std::string_view component, std::string_view message) {
    GlobalLogger().Info(component, message);
}

void LogWarn(std::string_view component, std::string_view message) {
    GlobalLogger().Warn(component, message);
}

void LogError(std::string_view component, std::string_view message) {
    GlobalLogger().Error(component, message);
}

} // namespace workflow_tracker
