#pragma once

#include <workflow_tracker/config/app_config.hpp>
#include <workflow_tracker/core/cancellation.hpp>
#include <workflow_tracker/core/result.hpp>
#include <workflow_tracker/graph/progress_channel.hpp>
#include <workflow_tracker/graph/scan_result.hpp>
#include <workflow_tracker/scanner/scanner_registry.hpp>

#include <functional>
#include <string>
#include <vector>

namespace workflow_tracker {

/// Adapts a plain (current, total, message) listener.
ProgressCallback MakeProgressCallback(std::function<void(int, int, const std::string&)> fn);

// ---------------------------------------------------------------------------
// GraphBuilder: runs one full scan of a repository.
//
// Phases, in order: file discovery, schema resolution over C# files, the
// scan loop (scanner dispatch and fragment merge, on `workers` threads),
// edge inference, workflow analysis. Cancellation is checked before every
// file and between phases; a cancelled scan still returns Ok with
// ScanStatus::Cancelled and whatever was merged so far.
//
// Only an invalid ScanConfig (ValidateScanConfig) or an unusable repository
// path is an Err, returned before discovery. Per-file scan and merge failures
// and exceptions from the progress callback land in ScanResult::errors.
//
// The progress callback may run on a worker thread but is never invoked
// concurrently. Use ProgressChannel to move events to another thread.
// ---------------------------------------------------------------------------
class GraphBuilder {
public:
    explicit GraphBuilder(ScanConfig config);
    GraphBuilder(ScanConfig config, ScannerRegistry scanners);

    GraphBuilder(const GraphBuilder&) = delete;
    GraphBuilder& operator=(const GraphBuilder&) = delete;

    [[nodiscard]] Result<ScanResult, Error> Build(
        const std::string& repository_path,
        const ProgressCallback& progress = {},
        const CancellationToken* cancel = nullptr) const;

    [[nodiscard]] const ScanConfig& Config() const noexcept { return config_; }

private:
    void ScanFiles(const std::vector<std::string>& files, const SchemaRegistry& schemas,
                   ScanResult& result, const ProgressCallback& progress,
                   const CancellationToken* cancel) const;

    ScanConfig config_;
    ScannerRegistry scanners_;
};

/// One-shot convenience over GraphBuilder.
[[nodiscard]] Result<ScanResult, Error> BuildGraph(
    const std::string& repository_path, const ScanConfig& config,
    const ProgressCallback& progress = {}, const CancellationToken* cancel = nullptr);

} // namespace workflow_tracker
