#pragma once

#include <workflow_tracker/core/result.hpp>
#include <workflow_tracker/model/workflow_graph.hpp>
#include <workflow_tracker/scanner/source_file.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace workflow_tracker {

/// Read a source file and cut lines longer than `max_line_length` before
/// any pattern sees them.
[[nodiscard]] Result<SourceText, Error> LoadSource(const std::string& path,
                                                   std::size_t max_line_length);

/// Like LoadSource, but a missing counterpart file is nullopt rather than
/// an error. Used for the other half of a markup/code pair.
[[nodiscard]] std::optional<SourceText> LoadCounterpart(const std::string& path,
                                                        std::size_t max_line_length);

/// Truncate long lines in place; returns how many were cut.
std::size_t TruncateLines(std::vector<std::string>& lines, std::size_t max_line_length);

/// A node with id, type, name, description, location and snippet filled in.
[[nodiscard]] WorkflowNode MakeNode(const SourceText& source, std::string_view category,
                                    int line_number, WorkflowType type,
                                    std::string name, std::string description);

/// "ui_click" -> "Click", "page_load" -> "Page_Load".
[[nodiscard]] std::string TriggerTitle(std::string_view trigger_type);

/// Capitalize the first letter of every word and lower the rest. Separators
/// are kept ("my-orders" -> "My-Orders").
[[nodiscard]] std::string TitleCase(std::string_view text);

/// Upper-case ASCII copy.
[[nodiscard]] std::string ToUpper(std::string_view text);

/// Remove every occurrence of `what` from `text`.
[[nodiscard]] std::string RemoveAll(std::string text, std::string_view what);

[[nodiscard]] std::string Trim(std::string_view text);

// ---------------------------------------------------------------------------
// UiTrigger / OutboundCall: what UI scanners pair up before emitting edges.
// ---------------------------------------------------------------------------
struct UiTrigger {
    std::string node_id;
    int line_number = 0;
    std::string trigger_type;
    std::string handler;
    std::optional<std::string> url;
};

struct OutboundCall {
    std::string node_id;
    int line_number = 0;
};

/// Every ApiCall node in `fragment` owned by `file_path`, in line order.
[[nodiscard]] std::vector<OutboundCall> CollectCalls(const WorkflowGraph& fragment,
                                                     const std::string& file_path);

} // namespace workflow_tracker
