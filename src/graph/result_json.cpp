#include <workflow_tracker/graph/result_json.hpp>

#include <fstream>

namespace workflow_tracker {

namespace {

template <typename T>
nlohmann::json OptionalToJson(const std::optional<T>& value) {
    return value.has_value() ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

} // namespace

nlohmann::json LocationToJson(const CodeLocation& location) {
    nlohmann::json j;
    j["file_path"] = location.file_path;
    j["line_number"] = location.line_number;
    if (location.column.has_value()) {
        j["column"] = *location.column;
    }
    if (location.end_line.has_value()) {
        j["end_line"] = *location.end_line;
    }
    return j;
}

nlohmann::json NodeToJson(const WorkflowNode& node) {
    nlohmann::json j;
    j["id"] = node.id;
    j["type"] = WorkflowTypeName(node.type);
    j["name"] = node.name;
    j["description"] = node.description;
    j["location"] = LocationToJson(node.location);
    j["metadata"] = node.metadata;
    j["code_snippet"] = OptionalToJson(node.code_snippet);
    j["table_name"] = OptionalToJson(node.table_name);
    j["query"] = OptionalToJson(node.query);
    j["endpoint"] = OptionalToJson(node.endpoint);
    j["method"] = OptionalToJson(node.method);
    j["http_method"] = j["method"];  // alias read by existing dashboards
    j["file_path"] = OptionalToJson(node.file_path);
    j["queue_name"] = OptionalToJson(node.queue_name);
    j["topic"] = OptionalToJson(node.topic);
    return j;
}

nlohmann::json EdgeToJson(const WorkflowEdge& edge) {
    nlohmann::json j;
    j["source"] = edge.source;
    j["target"] = edge.target;
    j["label"] = OptionalToJson(edge.label);
    j["edge_type"] = j["label"];
    j["metadata"] = edge.metadata;
    return j;
}

nlohmann::json GraphToJson(const WorkflowGraph& graph) {
    nlohmann::json nodes = nlohmann::json::array();
    for (const auto& node : graph.Nodes()) {
        nodes.push_back(NodeToJson(*node));
    }
    nlohmann::json edges = nlohmann::json::array();
    for (const auto& edge : graph.Edges()) {
        edges.push_back(EdgeToJson(edge));
    }
    nlohmann::json j;
    j["nodes"] = std::move(nodes);
    j["edges"] = std::move(edges);
    return j;
}

nlohmann::json SchemaToJson(const TableSchema& schema) {
    nlohmann::json j;
    j["entity_name"] = schema.entity_name;
    j["table_name"] = schema.table_name;
    j["file_path"] = schema.file_path;
    j["line_number"] = schema.line_number;
    j["dbset_name"] = OptionalToJson(schema.dbset_name);
    j["properties"] = schema.properties;
    j["metadata"] = schema.metadata;
    return j;
}

nlohmann::json WorkflowToJson(const UIWorkflow& workflow) {
    nlohmann::json trigger;
    trigger["id"] = workflow.trigger.id;
    trigger["name"] = workflow.trigger.name;
    trigger["description"] = workflow.trigger.description;
    trigger["interaction_type"] = workflow.trigger.interaction_type;
    trigger["component"] = workflow.trigger.component;
    trigger["location"] = workflow.trigger.location;

    nlohmann::json steps = nlohmann::json::array();
    for (const auto& step : workflow.steps) {
        nlohmann::json s;
        s["step_number"] = step.step_number;
        s["title"] = step.title;
        s["description"] = step.description;
        s["technical_details"] = step.technical_details;
        s["icon"] = step.icon;
        s["node_id"] = step.node ? step.node->id : std::string();
        steps.push_back(std::move(s));
    }

    nlohmann::json j;
    j["id"] = workflow.id;
    j["name"] = workflow.name;
    j["summary"] = workflow.summary;
    j["outcome"] = workflow.outcome;
    j["trigger"] = std::move(trigger);
    j["steps"] = std::move(steps);
    j["story"] = workflow.Story();
    return j;
}

nlohmann::json ScanResultToJson(const ScanResult& result) {
    nlohmann::json j;
    j["repository_path"] = result.repository_path;
    j["status"] = ScanStatusName(result.status);
    j["files_scanned"] = result.files_scanned;
    j["total_files"] = result.total_files;

    nlohmann::json schemas = nlohmann::json::array();
    for (const auto& schema : result.schemas.Schemas()) {
        schemas.push_back(SchemaToJson(*schema));
    }
    j["schemas"] = std::move(schemas);

    auto graph = GraphToJson(result.graph);
    j["nodes"] = std::move(graph["nodes"]);
    j["edges"] = std::move(graph["edges"]);

    nlohmann::json workflows = nlohmann::json::array();
    for (const auto& workflow : result.workflows) {
        workflows.push_back(WorkflowToJson(workflow));
    }
    j["workflows"] = std::move(workflows);

    j["inference"] = {
        {"proximity_edges", result.inference.proximity_edges},
        {"ingestion_edges", result.inference.ingestion_edges},
        {"processing_edges", result.inference.processing_edges},
    };
    j["errors"] = result.errors;
    j["warnings"] = result.warnings;
    j["scan_time_seconds"] = result.scan_time_seconds;
    return j;
}

Result<void, Error> WriteScanResult(const ScanResult& result, const std::string& path) {
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) {
        return Result<void, Error>::Err(
            Error{"WriteScanResult", path, "cannot open output file", std::nullopt,
                  ErrorCategory::Output});
    }
    // Truncated lines can end mid code point; replace rather than throw.
    out << ScanResultToJson(result).dump(2, ' ', false,
                                         nlohmann::json::error_handler_t::replace)
        << "\n";
    if (!out) {
        return Result<void, Error>::Err(
            Error{"WriteScanResult", path, "write failed", std::nullopt,
                  ErrorCategory::Output});
    }
    return Result<void, Error>::Ok();
}

} // namespace workflow_tracker
