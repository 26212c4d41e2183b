#pragma once

#include <workflow_tracker/core/result.hpp>
#include <workflow_tracker/graph/progress_channel.hpp>
#include <workflow_tracker/graph/scan_result.hpp>

#include <iostream>
#include <string>
#include <vector>

namespace workflow_tracker {

/// Renders scan results for the terminal. Reports go to `out`; progress,
/// warnings and errors go to `err`. JSON mode turns color off.
class OutputFormatter {
public:
    explicit OutputFormatter(bool json_mode, bool color_mode = false,
                             std::ostream& out = std::cout,
                             std::ostream& err = std::cerr);

    bool IsJsonMode() const { return json_mode_; }
    bool IsColorMode() const { return color_mode_; }

    void PrintScanSummary(const ScanResult& result) const;
    void PrintStories(const std::vector<UIWorkflow>& workflows) const;
    void PrintProgress(const ProgressEvent& event) const;

    /// Generic table; a JSON array of header-keyed objects in JSON mode.
    void PrintTable(const std::vector<std::string>& headers,
                    const std::vector<std::vector<std::string>>& rows) const;

    void PrintError(const Error& error) const;
    void PrintWarning(const std::string& message) const;
    void PrintSuccess(const std::string& message) const;

private:
    std::ostream& out_;
    std::ostream& err_;
    bool json_mode_;
    bool color_mode_;
};

} // namespace workflow_tracker
