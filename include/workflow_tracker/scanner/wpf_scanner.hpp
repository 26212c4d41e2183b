#pragma once

#include <workflow_tracker/config/app_config.hpp>
#include <workflow_tracker/scanner/csharp_scanner.hpp>
#include <workflow_tracker/scanner/i_scanner.hpp>
#include <workflow_tracker/scanner/pattern_table.hpp>
#include <workflow_tracker/scanner/scanner_support.hpp>

#include <map>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace workflow_tracker {

// ---------------------------------------------------------------------------
// WpfScanner: XAML views and their .xaml.cs code-behind.
//
// XAML is parsed with tinyxml2; markup that is not well-formed falls back to
// line patterns. Event attributes and Command bindings become trigger nodes
// owned by the .xaml file. The code-behind yields handler locations, HTTP
// call nodes and the regular C# detections.
//
// A trigger whose handler method is found links to calls within the paired
// window of that method. Otherwise it links to every call in the code-behind,
// labelled as a proximity guess.
// ---------------------------------------------------------------------------
class WpfScanner : public IScanner {
public:
    explicit WpfScanner(const ScanConfig& config);

    [[nodiscard]] std::string_view Name() const override { return "wpf"; }
    [[nodiscard]] bool CanScan(const std::string& file_path) const override;
    [[nodiscard]] Result<WorkflowGraph, Error> ScanFile(
        const std::string& file_path,
        const SchemaRegistry* schemas) const override;

    [[nodiscard]] std::string DetectWindowName(const SourceText& markup) const;

private:
    void ScanUnit(const SourceText* markup, const SourceText* code,
                  const SchemaRegistry* schemas, WorkflowGraph& fragment) const;
    std::vector<UiTrigger> ScanMarkup(const SourceText& markup, WorkflowGraph& fragment) const;
    std::vector<UiTrigger> ScanMarkupLines(const SourceText& markup,
                                           const std::string& window,
                                           WorkflowGraph& fragment) const;
    std::optional<UiTrigger> AddTrigger(const SourceText& markup, int line_number,
                                        const std::string& trigger_type,
                                        const std::string& handler,
                                        const std::string& window,
                                        WorkflowGraph& fragment) const;
    std::map<std::string, int> FindHandlers(const SourceText& code) const;
    void ScanCode(const SourceText& code, const SchemaRegistry* schemas,
                  WorkflowGraph& fragment) const;
    bool ScanHttpLine(const SourceText& code, int line_number, WorkflowGraph& fragment) const;
    std::optional<std::string> TriggerTypeFor(const std::string& attribute) const;
    std::optional<std::string> CommandName(const std::string& binding) const;

    CSharpScanner csharp_;
    DetectionToggles detect_;
    int window_;
    std::size_t max_line_length_;

    std::map<std::string, std::string> event_attributes_;
    PatternTable event_lines_;
    PatternTable handler_methods_;
    PatternTable http_;
    std::vector<std::regex> window_patterns_;
    std::regex command_binding_;
    std::regex command_property_;
};

} // namespace workflow_tracker
