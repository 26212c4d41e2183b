#pragma once

#include <workflow_tracker/config/app_config.hpp>
#include <workflow_tracker/scanner/i_scanner.hpp>

#include <memory>
#include <string>
#include <vector>

namespace workflow_tracker {

// ---------------------------------------------------------------------------
// ScannerRegistry: ordered scanner list; the first CanScan match wins.
//
// Default order, most specific first:
//   wpf (.xaml, .xaml.cs), angular (.component.ts, .service.ts, .module.ts,
//   .html), react (.tsx, .jsx), csharp (.cs), typescript (.ts, .js).
// ---------------------------------------------------------------------------
class ScannerRegistry {
public:
    ScannerRegistry() = default;

    /// Registry holding the five built-in scanners in default order.
    static ScannerRegistry CreateDefault(const ScanConfig& config);

    void Register(std::unique_ptr<IScanner> scanner);

    /// Scanner for `file_path`, or nullptr when none claims it.
    [[nodiscard]] const IScanner* Select(const std::string& file_path) const;

    [[nodiscard]] std::size_t Size() const noexcept { return scanners_.size(); }

private:
    std::vector<std::unique_ptr<IScanner>> scanners_;
};

} // namespace workflow_tracker
