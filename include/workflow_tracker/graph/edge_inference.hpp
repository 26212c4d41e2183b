#pragma once

#include <workflow_tracker/config/app_config.hpp>
#include <workflow_tracker/model/workflow_graph.hpp>

#include <cstddef>

namespace workflow_tracker {

struct InferenceStats {
    std::size_t proximity_edges = 0;
    std::size_t ingestion_edges = 0;   // API call -> DB write
    std::size_t processing_edges = 0;  // DB read -> transform

    [[nodiscard]] std::size_t Total() const noexcept {
        return proximity_edges + ingestion_edges + processing_edges;
    }
};

// ---------------------------------------------------------------------------
// Edge inference over a finished graph. Both passes are file-scoped and
// never connect nodes from different files. Running them again on the same
// graph adds nothing: an existing (source, target) pair is never re-added,
// whatever its label.
// ---------------------------------------------------------------------------

/// Link each node to its successor by line when the gap is at most
/// `max_line_distance`. Label "Sequential (N lines)".
std::size_t AddProximityEdges(WorkflowGraph& graph, int max_line_distance);

/// API call -> later DB write within `ingestion_window` lines ("Data
/// Ingestion") and DB read -> later transform within `processing_window`
/// lines ("Data Processing"). Windows are exclusive.
InferenceStats AddDataFlowEdges(WorkflowGraph& graph, int ingestion_window,
                                int processing_window);

/// Run the passes enabled in `config`.
InferenceStats InferEdges(WorkflowGraph& graph, const EdgeInferenceConfig& config);

} // namespace workflow_tracker
