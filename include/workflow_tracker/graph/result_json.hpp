#pragma once

#include <workflow_tracker/core/result.hpp>
#include <workflow_tracker/graph/scan_result.hpp>

#include <nlohmann/json.hpp>

#include <string>

namespace workflow_tracker {

// JSON encoders for the persisted scan output. Absent optional fields are
// written as null so every node object has the same shape.

[[nodiscard]] nlohmann::json LocationToJson(const CodeLocation& location);
[[nodiscard]] nlohmann::json NodeToJson(const WorkflowNode& node);
[[nodiscard]] nlohmann::json EdgeToJson(const WorkflowEdge& edge);

/// {"nodes": [...], "edges": [...]}
[[nodiscard]] nlohmann::json GraphToJson(const WorkflowGraph& graph);

[[nodiscard]] nlohmann::json SchemaToJson(const TableSchema& schema);
[[nodiscard]] nlohmann::json WorkflowToJson(const UIWorkflow& workflow);
[[nodiscard]] nlohmann::json ScanResultToJson(const ScanResult& result);

/// Write ScanResultToJson(result) to `path`, pretty-printed.
[[nodiscard]] Result<void, Error> WriteScanResult(const ScanResult& result,
                                                  const std::string& path);

} // namespace workflow_tracker
