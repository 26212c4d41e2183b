#pragma once

#include <workflow_tracker/graph/edge_inference.hpp>
#include <workflow_tracker/model/workflow_graph.hpp>
#include <workflow_tracker/schema/table_schema.hpp>
#include <workflow_tracker/workflow/workflow_analyzer.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace workflow_tracker {

enum class ScanStatus {
    Completed,
    Cancelled,  // partial graph; later phases skipped
};

[[nodiscard]] inline const char* ScanStatusName(ScanStatus status) {
    return status == ScanStatus::Completed ? "completed" : "cancelled";
}

// ---------------------------------------------------------------------------
// ScanResult: everything one Build produces. `errors` holds per-file scan
// failures and `warnings` holds resolver and discovery problems; neither
// stops the scan.
// ---------------------------------------------------------------------------
struct ScanResult {
    std::string repository_path;
    ScanStatus status = ScanStatus::Completed;
    WorkflowGraph graph;
    std::size_t files_scanned = 0;
    std::size_t total_files = 0;
    SchemaRegistry schemas;
    InferenceStats inference;
    std::vector<UIWorkflow> workflows;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    double scan_time_seconds = 0.0;
};

} // namespace workflow_tracker
