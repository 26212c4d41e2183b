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
// AngularScanner: components, services, modules and their HTML templates.
//
// A component and its template form one unit: trigger nodes belong to the
// template file, call nodes to the component file. Scanning either half
// loads the other and emits the whole unit, so both scans produce the same
// nodes and merge without duplicates.
//
// A trigger is linked to every call that lies within the paired window after
// its handler method's definition. Without a definition the trigger line
// and call line are compared directly.
// ---------------------------------------------------------------------------
class AngularScanner : public IScanner {
public:
    explicit AngularScanner(const ScanConfig& config);

    [[nodiscard]] std::string_view Name() const override { return "angular"; }
    [[nodiscard]] bool CanScan(const std::string& file_path) const override;
    [[nodiscard]] Result<WorkflowGraph, Error> ScanFile(
        const std::string& file_path,
        const SchemaRegistry* schemas) const override;

    /// Template owned by a component source: templateUrl first, then the
    /// sibling .component.html / .html. nullopt for non-components.
    [[nodiscard]] std::optional<std::string> TemplatePathFor(const SourceText& code) const;

    /// "order-list.component.html" -> "Order List".
    [[nodiscard]] static std::string ComponentNameFromPath(const std::string& path);

private:
    void ScanUnit(const SourceText* markup, const SourceText* code,
                  WorkflowGraph& fragment) const;
    std::vector<UiTrigger> ScanTemplate(const SourceText& markup,
                                        WorkflowGraph& fragment) const;
    void ScanCode(const SourceText& code, WorkflowGraph& fragment) const;
    bool ScanHttpClientLine(const SourceText& code, int line_number,
                            WorkflowGraph& fragment) const;
    std::optional<int> FindHandlerDefinition(const SourceText& code,
                                             const std::string& handler) const;
    std::optional<std::string> DetectRoute(const SourceText& code) const;

    TypeScriptScanner generic_;
    DetectionToggles detect_;
    int window_;
    std::size_t max_line_length_;

    PatternTable event_bindings_;
    PatternTable http_client_;
    std::vector<std::regex> route_patterns_;
    std::regex template_url_;
    std::regex handler_identifier_;
};

} // namespace workflow_tracker
