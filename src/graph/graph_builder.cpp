#include <workflow_tracker/graph/graph_builder.hpp>

#include <workflow_tracker/config/config_loader.hpp>
#include <workflow_tracker/core/log.hpp>
#include <workflow_tracker/graph/file_discovery.hpp>
#include <workflow_tracker/schema/schema_resolver.hpp>
#include <workflow_tracker/workflow/workflow_analyzer.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <iterator>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>

namespace workflow_tracker {

namespace {

using Clock = std::chrono::steady_clock;

double SecondsSince(Clock::time_point start) {
    return std::chrono::duration<double>(Clock::now() - start).count();
}

std::size_t WorkerCount(int configured, std::size_t files) {
    std::size_t workers = configured > 0 ? static_cast<std::size_t>(configured)
                                         : std::thread::hardware_concurrency();
    workers = std::max<std::size_t>(workers, 1);
    return std::min(workers, std::max<std::size_t>(files, 1));
}

Result<WorkflowGraph, Error> ScanOne(const IScanner& scanner, const std::string& file,
                                     const SchemaRegistry& schemas) {
    // Regex complexity limits, allocation failures and filesystem errors
    // stay confined to the file that raised them.
    try {
        return scanner.ScanFile(file, &schemas);
    } catch (const std::exception& e) {
        return Result<WorkflowGraph, Error>::Err(
            Error{"ScanFile", file, "scanner failed", std::string(e.what()),
                  ErrorCategory::Scan});
    }
}

void RecordFailure(ScanResult& result, const Error& error) {
    LogWarn("builder", error.ToString());
    result.errors.push_back(error.ToString());
}

} // namespace

ProgressCallback MakeProgressCallback(std::function<void(int, int, const std::string&)> fn) {
    return [fn = std::move(fn)](const ProgressEvent& event) {
        fn(event.current, event.total, event.message);
    };
}

GraphBuilder::GraphBuilder(ScanConfig config)
    : config_(std::move(config)), scanners_(ScannerRegistry::CreateDefault(config_)) {}

GraphBuilder::GraphBuilder(ScanConfig config, ScannerRegistry scanners)
    : config_(std::move(config)), scanners_(std::move(scanners)) {}

Result<ScanResult, Error> GraphBuilder::Build(const std::string& repository_path,
                                              const ProgressCallback& progress,
                                              const CancellationToken* cancel) const {
    const auto started = Clock::now();

    auto valid = ValidateScanConfig(config_);
    if (valid.IsErr()) {
        LogError("builder", valid.Error().ToString());
        return Result<ScanResult, Error>::Err(valid.Error());
    }

    LogInfo("builder", "Scanning repository " + repository_path);
    auto discovered = DiscoverFiles(repository_path, config_, cancel);
    if (discovered.IsErr()) {
        return Result<ScanResult, Error>::Err(discovered.Error());
    }
    auto discovery = std::move(discovered).Value();

    ScanResult result;
    result.repository_path = repository_path;
    result.total_files = discovery.files.size();
    result.warnings = std::move(discovery.warnings);
    const int total = static_cast<int>(result.total_files);
    auto report = [&](ProgressEvent event) {
        if (!progress) {
            return;
        }
        try {
            progress(event);
        } catch (const std::exception& e) {
            RecordFailure(result, Error{"Progress", repository_path, "progress listener failed",
                                        std::string(e.what()), ErrorCategory::Internal});
        }
    };

    report({0, total, "Found " + std::to_string(total) + " files to scan", "discovery", 0, 0});

    auto finish = [&](ScanStatus status) {
        result.status = status;
        result.scan_time_seconds = SecondsSince(started);
        LogInfo("builder", std::string("Scan ") + ScanStatusName(status) + ": " +
                               std::to_string(result.files_scanned) + " files, " +
                               std::to_string(result.graph.NodeCount()) + " nodes, " +
                               std::to_string(result.graph.EdgeCount()) + " edges, " +
                               std::to_string(result.errors.size()) + " errors");
        report({static_cast<int>(result.files_scanned), total,
                status == ScanStatus::Completed ? "Scan complete" : "Scan cancelled",
                "complete", result.files_scanned, result.graph.NodeCount()});
        return Result<ScanResult, Error>::Ok(std::move(result));
    };

    if (IsCancelled(cancel)) {
        return finish(ScanStatus::Cancelled);
    }

    // Schema pre-pass. Must finish before any file resolves a table name.
    if (config_.detect.database) {
        SchemaResolver resolver(config_);
        auto resolution = resolver.Resolve(discovery.files, cancel);
        result.schemas = std::move(resolution.registry);
        result.warnings.insert(result.warnings.end(),
                               std::make_move_iterator(resolution.warnings.begin()),
                               std::make_move_iterator(resolution.warnings.end()));
        report({0, total, "Discovered " + std::to_string(result.schemas.Size()) + " schemas",
                "schema", 0, 0});
    }
    if (IsCancelled(cancel)) {
        return finish(ScanStatus::Cancelled);
    }

    ScanFiles(discovery.files, result.schemas, result, progress, cancel);
    report({static_cast<int>(result.files_scanned), total,
            "Scanned " + std::to_string(result.files_scanned) + " files", "scan",
            result.files_scanned, result.graph.NodeCount()});
    if (IsCancelled(cancel)) {
        return finish(ScanStatus::Cancelled);
    }

    if (config_.edge_inference.enabled) {
        try {
            result.inference = InferEdges(result.graph, config_.edge_inference);
        } catch (const std::exception& e) {
            result.errors.push_back(
                Error{"InferEdges", repository_path, "edge inference failed",
                      std::string(e.what()), ErrorCategory::Internal}.ToString());
        }
        report({total, total,
                "Inferred " + std::to_string(result.inference.Total()) + " edges", "inference",
                result.files_scanned, result.graph.NodeCount()});
    }
    if (IsCancelled(cancel)) {
        return finish(ScanStatus::Cancelled);
    }

    if (config_.analyze_workflows) {
        try {
            result.workflows = AnalyzeWorkflows(result.graph);
        } catch (const std::exception& e) {
            result.errors.push_back(
                Error{"AnalyzeWorkflows", repository_path, "workflow analysis failed",
                      std::string(e.what()), ErrorCategory::Internal}.ToString());
        }
        report({total, total,
                "Built " + std::to_string(result.workflows.size()) + " workflows", "workflows",
                result.files_scanned, result.graph.NodeCount()});
    }

    return finish(ScanStatus::Completed);
}

void GraphBuilder::ScanFiles(const std::vector<std::string>& files,
                             const SchemaRegistry& schemas, ScanResult& result,
                             const ProgressCallback& progress,
                             const CancellationToken* cancel) const {
    const int total = static_cast<int>(files.size());
    const auto every = static_cast<std::size_t>(std::max(config_.progress.every_files, 1));
    const auto interval = std::chrono::duration<double>(config_.progress.interval_seconds);

    std::atomic<std::size_t> next{0};
    std::mutex merge_mutex;
    std::size_t processed = 0;  // guarded by merge_mutex
    auto last_report = Clock::now();

    auto worker = [&]() {
        while (!IsCancelled(cancel)) {
            const std::size_t index = next.fetch_add(1);
            if (index >= files.size()) {
                return;
            }
            const auto& file = files[index];
            const IScanner* scanner = scanners_.Select(file);
            std::optional<Result<WorkflowGraph, Error>> scanned;
            if (scanner != nullptr) {
                scanned.emplace(ScanOne(*scanner, file, schemas));
            }

            // The aggregate graph is the only shared mutable state; the
            // progress callback is called under the same lock.
            std::lock_guard lock(merge_mutex);
            ++processed;
            if (scanner == nullptr) {
                LogDebug("builder", "No scanner for " + file);
            } else if (scanned->IsErr()) {
                LogWarn("builder", scanned->Error().ToString());
                result.errors.push_back(scanned->Error().ToString());
            } else {
                try {
                    result.graph.Merge(scanned->Value());
                    ++result.files_scanned;
                } catch (const std::exception& e) {
                    RecordFailure(result, Error{"Merge", file, "merge failed",
                                                std::string(e.what()), ErrorCategory::Internal});
                }
            }

            const auto now = Clock::now();
            if (progress && (processed % every == 0 || now - last_report >= interval)) {
                last_report = now;
                try {
                    progress({static_cast<int>(processed), total,
                              "Scanning " + file, "scan", result.files_scanned,
                              result.graph.NodeCount()});
                } catch (const std::exception& e) {
                    RecordFailure(result, Error{"Progress", file, "progress listener failed",
                                                std::string(e.what()), ErrorCategory::Internal});
                }
            }
        }
    };

    const auto workers = WorkerCount(config_.workers, files.size());
    LogDebug("builder", "Scanning " + std::to_string(files.size()) + " files on " +
                            std::to_string(workers) + " worker(s)");
    if (workers == 1) {
        worker();
        return;
    }
    std::vector<std::thread> pool;
    pool.reserve(workers);
    for (std::size_t i = 0; i < workers; ++i) {
        pool.emplace_back(worker);
    }
    for (auto& thread : pool) {
        thread.join();
    }
}

Result<ScanResult, Error> BuildGraph(const std::string& repository_path,
                                     const ScanConfig& config,
                                     const ProgressCallback& progress,
                                     const CancellationToken* cancel) {
    GraphBuilder builder(config);
    return builder.Build(repository_path, progress, cancel);
}

} // namespace workflow_tracker
