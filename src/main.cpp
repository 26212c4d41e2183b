#include <workflow_tracker/cli/output_formatter.hpp>
#include <workflow_tracker/config/config_loader.hpp>
#include <workflow_tracker/core/cancellation.hpp>
#include <workflow_tracker/core/log.hpp>
#include <workflow_tracker/core/terminal.hpp>
#include <workflow_tracker/core/version.hpp>
#include <workflow_tracker/graph/graph_builder.hpp>
#include <workflow_tracker/graph/progress_channel.hpp>
#include <workflow_tracker/graph/result_json.hpp>

#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace {

constexpr int kExitSuccess   = 0;
constexpr int kExitCancelled = 130;

// Set from the SIGINT handler; std::atomic<bool> is lock-free here.
workflow_tracker::CancellationToken g_cancel;

void HandleSigint(int /*signal*/) {
    g_cancel.RequestCancel();
}

workflow_tracker::LogLevel LevelFor(const workflow_tracker::AppConfig& config) {
    using workflow_tracker::LogLevel;
    if (config.verbose) {
        return LogLevel::Debug;
    }
    return config.quiet ? LogLevel::Error : LogLevel::Info;
}

// Console sink (JSON lines in --json mode), teed into --log-file if given.
void SetupLogging(const workflow_tracker::AppConfig& config) {
    using namespace workflow_tracker;
    std::unique_ptr<ILogSink> console;
    if (config.json_output) {
        console = std::make_unique<JsonSink>(std::cerr);
    } else {
        console = std::make_unique<ColorConsoleSink>(ShouldUseColor(config.color, IsStderrTty()));
    }

    if (!config.log_file.has_value()) {
        InitGlobalLogger(std::move(console), LevelFor(config));
        return;
    }
    auto file = std::make_unique<FileSink>(*config.log_file);
    const bool opened = file->IsOpen();
    if (opened) {
        InitGlobalLogger(std::make_unique<TeeSink>(std::move(console), std::move(file)),
                         LevelFor(config));
    } else {
        InitGlobalLogger(std::move(console), LevelFor(config));
        LogWarn("cli", "cannot open log file " + *config.log_file);
    }
}

} // namespace

int main(int argc, const char* argv[]) {
    using namespace workflow_tracker;

    auto cli = LoadFromCli(argc, argv);
    if (cli.IsErr()) {
        OutputFormatter(false, ShouldUseColor(ColorMode::Auto, IsStderrTty()))
            .PrintError(cli.Error());
        return cli.Error().ExitCode();
    }
    if (cli.Value().show_version) {
        std::cout << "workflow-tracker " << kVersion << "\n";
        return 0;
    }

    auto resolved = ResolveConfig(cli.Value());
    if (resolved.IsErr()) {
        const auto& options = cli.Value();
        OutputFormatter(options.json_output,
                        ShouldUseColor(options.color.value_or(ColorMode::Auto), IsStderrTty()))
            .PrintError(resolved.Error());
        return resolved.Error().ExitCode();
    }
    const AppConfig config = std::move(resolved).Value();

    SetupLogging(config);
    const OutputFormatter formatter(config.json_output,
                                    ShouldUseColor(config.color, IsStdoutTty()));
    std::signal(SIGINT, HandleSigint);

    // The scan runs on its own thread; this thread only drains progress.
    ProgressChannel channel;
    std::optional<Result<ScanResult, Error>> outcome;
    const GraphBuilder builder(config.scan);
    std::thread scan_thread([&]() {
        try {
            outcome.emplace(builder.Build(config.repository_path, channel.Callback(), &g_cancel));
        } catch (const std::exception& e) {
            outcome.emplace(Result<ScanResult, Error>::Err(
                Error{"Build", config.repository_path, "scan aborted", std::string(e.what()),
                      ErrorCategory::Internal}));
        }
        channel.Close();
    });

    for (;;) {
        auto event = channel.WaitPop(std::chrono::milliseconds(200));
        if (event.has_value()) {
            if (!config.quiet) {
                formatter.PrintProgress(*event);
            }
            continue;
        }
        if (channel.IsClosed()) {
            break;
        }
    }
    scan_thread.join();
    if (channel.Dropped() > 0) {
        LogDebug("cli", "dropped " + std::to_string(channel.Dropped()) + " progress events");
    }

    if (!outcome.has_value() || outcome->IsErr()) {
        const Error error = outcome.has_value()
            ? outcome->Error()
            : Error{"Build", config.repository_path, "scan produced no result", std::nullopt,
                    ErrorCategory::Internal};
        formatter.PrintError(error);
        return error.ExitCode();
    }
    const ScanResult& result = outcome->Value();

    if (config.output_path.has_value()) {
        auto written = WriteScanResult(result, *config.output_path);
        if (written.IsErr()) {
            formatter.PrintError(written.Error());
            return written.Error().ExitCode();
        }
        LogInfo("cli", "results written to " + *config.output_path);
    }

    formatter.PrintScanSummary(result);
    if (config.print_stories) {
        formatter.PrintStories(result.workflows);
    }

    if (result.status == ScanStatus::Cancelled) {
        formatter.PrintWarning("scan cancelled; results are partial");
        return kExitCancelled;
    }
    return kExitSuccess;
}
