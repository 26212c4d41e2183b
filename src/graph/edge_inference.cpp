#include <workflow_tracker/graph/edge_inference.hpp>

#include <workflow_tracker/core/log.hpp>

#include <algorithm>
#include <map>
#include <string>
#include <vector>

namespace workflow_tracker {

namespace {

using FileGroups = std::map<std::string, std::vector<NodePtr>>;

FileGroups GroupByFile(const WorkflowGraph& graph) {
    FileGroups groups;
    for (const auto& node : graph.Nodes()) {
        groups[node->location.file_path].push_back(node);
    }
    return groups;
}

void SortByLine(std::vector<NodePtr>& nodes) {
    std::stable_sort(nodes.begin(), nodes.end(), [](const NodePtr& a, const NodePtr& b) {
        return a->location.line_number < b->location.line_number;
    });
}

// Connects every `from` node to the `to` nodes strictly after it and less
// than `window` lines away. Both inputs must be sorted by line.
std::size_t LinkWithinWindow(WorkflowGraph& graph,
                             const std::vector<NodePtr>& from,
                             const std::vector<NodePtr>& to,
                             int window, const char* label, const char* pattern) {
    std::size_t added = 0;
    for (const auto& source : from) {
        const int line = source->location.line_number;
        auto it = std::upper_bound(to.begin(), to.end(), line,
                                   [](int value, const NodePtr& node) {
                                       return value < node->location.line_number;
                                   });
        for (; it != to.end() && (*it)->location.line_number - line < window; ++it) {
            if (graph.HasEdge(source->id, (*it)->id)) {
                continue;
            }
            WorkflowEdge edge{source->id, (*it)->id, std::string(label), {}};
            edge.metadata["pattern"] = pattern;
            if (graph.AddEdge(std::move(edge))) {
                ++added;
            }
        }
    }
    return added;
}

} // namespace

std::size_t AddProximityEdges(WorkflowGraph& graph, int max_line_distance) {
    std::size_t added = 0;
    for (auto& [file, nodes] : GroupByFile(graph)) {
        SortByLine(nodes);
        for (std::size_t i = 0; i + 1 < nodes.size(); ++i) {
            const auto& current = nodes[i];
            const auto& next = nodes[i + 1];
            const int distance = next->location.line_number - current->location.line_number;
            if (distance > max_line_distance || current->id == next->id) {
                continue;
            }
            WorkflowEdge edge{current->id, next->id,
                              "Sequential (" + std::to_string(distance) + " lines)", {}};
            edge.metadata["distance"] = std::to_string(distance);
            if (graph.AddEdge(std::move(edge))) {
                ++added;
            }
        }
    }
    LogDebug("inference", "Added " + std::to_string(added) + " proximity edges");
    return added;
}

InferenceStats AddDataFlowEdges(WorkflowGraph& graph, int ingestion_window,
                                int processing_window) {
    InferenceStats stats;
    for (auto& [file, nodes] : GroupByFile(graph)) {
        std::map<WorkflowType, std::vector<NodePtr>> by_type;
        for (auto& node : nodes) {
            by_type[node->type].push_back(node);
        }
        for (auto& [type, bucket] : by_type) {
            SortByLine(bucket);
        }

        stats.ingestion_edges += LinkWithinWindow(
            graph, by_type[WorkflowType::ApiCall], by_type[WorkflowType::DatabaseWrite],
            ingestion_window, "Data Ingestion", "api_to_db");
        stats.processing_edges += LinkWithinWindow(
            graph, by_type[WorkflowType::DatabaseRead], by_type[WorkflowType::DataTransform],
            processing_window, "Data Processing", "db_to_transform");
    }
    LogDebug("inference", "Added " + std::to_string(stats.ingestion_edges) +
                              " data ingestion edges, " +
                              std::to_string(stats.processing_edges) +
                              " data processing edges");
    return stats;
}

InferenceStats InferEdges(WorkflowGraph& graph, const EdgeInferenceConfig& config) {
    InferenceStats stats;
    if (!config.enabled) {
        return stats;
    }
    if (config.proximity_edges) {
        stats.proximity_edges = AddProximityEdges(graph, config.max_line_distance);
    }
    if (config.data_flow_edges) {
        auto flow = AddDataFlowEdges(graph, config.ingestion_window, config.processing_window);
        stats.ingestion_edges = flow.ingestion_edges;
        stats.processing_edges = flow.processing_edges;
    }
    LogInfo("inference", "Inferred " + std::to_string(stats.Total()) + " edges");
    return stats;
}

} // namespace workflow_tracker
