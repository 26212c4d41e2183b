#pragma once

#include <workflow_tracker/config/app_config.hpp>
#include <workflow_tracker/scanner/i_scanner.hpp>
#include <workflow_tracker/scanner/pattern_table.hpp>
#include <workflow_tracker/scanner/scanner_support.hpp>
#include <workflow_tracker/scanner/typescript_scanner.hpp>

#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace workflow_tracker {

// ---------------------------------------------------------------------------
// ReactScanner: single-file React components (.tsx/.jsx).
//
// Emits a trigger node per event-handler binding and an API node per
// fetch/axios/http call, then links each trigger to the calls within the
// single-file window. Lines without a React-style call fall back to the
// generic TypeScript detections.
// ---------------------------------------------------------------------------
class ReactScanner : public IScanner {
public:
    explicit ReactScanner(const ScanConfig& config);

    [[nodiscard]] std::string_view Name() const override { return "react"; }
    [[nodiscard]] bool CanScan(const std::string& file_path) const override;
    [[nodiscard]] Result<WorkflowGraph, Error> ScanFile(
        const std::string& file_path,
        const SchemaRegistry* schemas) const override;

    [[nodiscard]] std::string DetectComponentName(const SourceText& source) const;
    [[nodiscard]] std::optional<std::string> DetectRoute(const SourceText& source) const;

private:
    std::optional<UiTrigger> ScanTriggerLine(const SourceText& source, int line_number,
                                             const std::string& component,
                                             const std::optional<std::string>& url,
                                             WorkflowGraph& fragment) const;
    bool ScanCallLine(const SourceText& source, int line_number,
                      WorkflowGraph& fragment) const;
    std::optional<std::string> MethodFromContext(const std::vector<std::string>& lines,
                                                 int line_number) const;
    void LinkTriggers(const std::vector<UiTrigger>& triggers,
                      const std::vector<OutboundCall>& calls,
                      WorkflowGraph& fragment) const;

    TypeScriptScanner generic_;
    DetectionToggles detect_;
    int window_;
    std::size_t max_line_length_;

    PatternTable event_handlers_;
    PatternTable calls_;
    std::vector<std::regex> component_patterns_;
    std::vector<std::regex> route_patterns_;
    std::regex method_option_;
};

} // namespace workflow_tracker
