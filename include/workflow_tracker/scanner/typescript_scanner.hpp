#pragma once

#include <workflow_tracker/config/app_config.hpp>
#include <workflow_tracker/scanner/i_scanner.hpp>
#include <workflow_tracker/scanner/pattern_table.hpp>
#include <workflow_tracker/scanner/source_file.hpp>

#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace workflow_tracker {

// ---------------------------------------------------------------------------
// TypeScriptScanner: generic TypeScript/JavaScript: HttpClient/fetch/axios
// calls, browser file APIs, local/session storage and RxJS/array transforms.
//
// The React and Angular scanners reuse ScanSource for the categories they do
// not detect themselves.
// ---------------------------------------------------------------------------
class TypeScriptScanner : public IScanner {
public:
    explicit TypeScriptScanner(const ScanConfig& config);

    [[nodiscard]] std::string_view Name() const override { return "typescript"; }
    [[nodiscard]] bool CanScan(const std::string& file_path) const override;
    [[nodiscard]] Result<WorkflowGraph, Error> ScanFile(
        const std::string& file_path,
        const SchemaRegistry* schemas) const override;

    void ScanSource(const SourceText& source, const DetectionToggles& detect,
                    WorkflowGraph& fragment) const;

    /// Every enabled category for one line, in the order ScanSource uses.
    void ScanLine(const SourceText& source, int line_number,
                  const DetectionToggles& detect, WorkflowGraph& fragment) const;

    /// Generic API-call detection for one line. Returns true if a node was added.
    bool ScanHttpLine(const SourceText& source, int line_number,
                      WorkflowGraph& fragment) const;

    [[nodiscard]] const DetectionToggles& Detect() const noexcept { return detect_; }

private:
    void ScanFileLine(const SourceText& source, int line_number, WorkflowGraph& fragment) const;
    void ScanStorageLine(const SourceText& source, int line_number, WorkflowGraph& fragment) const;
    void ScanTransformLine(const SourceText& source, int line_number, WorkflowGraph& fragment) const;

    std::optional<std::string> ExtractEndpoint(const std::vector<std::string>& lines,
                                               int line_number) const;
    std::string ExtractHttpMethod(const std::string& line) const;

    DetectionToggles detect_;
    std::size_t max_line_length_;

    PatternTable http_;
    PatternTable storage_;
    PatternTable files_;
    PatternTable transforms_;
    PatternTable http_methods_;

    std::regex endpoint_;
    std::regex template_literal_;
    std::regex api_endpoint_;
    std::regex file_read_hint_;
    std::regex storage_read_hint_;
    std::regex storage_key_;
    std::regex operator_name_;
};

} // namespace workflow_tracker
