#include <workflow_tracker/model/workflow_graph.hpp>

#include <array>

namespace workflow_tracker {

namespace {

struct TypeName {
    WorkflowType type;
    const char* name;
};

constexpr std::array<TypeName, 10> kTypeNames = {{
    {WorkflowType::DatabaseRead, "database_read"},
    {WorkflowType::DatabaseWrite, "database_write"},
    {WorkflowType::ApiCall, "api_call"},
    {WorkflowType::FileRead, "file_read"},
    {WorkflowType::FileWrite, "file_write"},
    {WorkflowType::MessageSend, "message_send"},
    {WorkflowType::MessageReceive, "message_receive"},
    {WorkflowType::DataTransform, "data_transform"},
    {WorkflowType::CacheRead, "cache_read"},
    {WorkflowType::CacheWrite, "cache_write"},
}};

} // namespace

const char* WorkflowTypeName(WorkflowType type) {
    for (const auto& entry : kTypeNames) {
        if (entry.type == type) {
            return entry.name;
        }
    }
    return "unknown";
}

std::optional<WorkflowType> ParseWorkflowType(std::string_view name) {
    for (const auto& entry : kTypeNames) {
        if (name == entry.name) {
            return entry.type;
        }
    }
    return std::nullopt;
}

std::string CodeLocation::ToString() const {
    return file_path + ":" + std::to_string(line_number);
}

std::string WorkflowNode::MakeId(const std::string& file_path,
                                 std::string_view category, int line_number) {
    std::string id = file_path;
    id += ':';
    id.append(category.data(), category.size());
    id += ':';
    id += std::to_string(line_number);
    return id;
}

bool WorkflowNode::operator==(const WorkflowNode& other) const {
    return id == other.id &&
           type == other.type &&
           name == other.name &&
           description == other.description &&
           location == other.location &&
           metadata == other.metadata &&
           code_snippet == other.code_snippet &&
           table_name == other.table_name &&
           query == other.query &&
           endpoint == other.endpoint &&
           method == other.method &&
           file_path == other.file_path &&
           queue_name == other.queue_name &&
           topic == other.topic;
}

// ---------------------------------------------------------------------------
// WorkflowGraph
// ---------------------------------------------------------------------------

bool WorkflowGraph::AddNode(NodePtr node) {
    if (!node) {
        return false;
    }
    auto& same_id = nodes_by_id_[node->id];
    for (auto index : same_id) {
        if (nodes_[index] == node || *nodes_[index] == *node) {
            return false;
        }
    }
    same_id.push_back(nodes_.size());
    nodes_.push_back(std::move(node));
    return true;
}

bool WorkflowGraph::AddNode(WorkflowNode node) {
    return AddNode(std::make_shared<const WorkflowNode>(std::move(node)));
}

bool WorkflowGraph::AddEdge(WorkflowEdge edge) {
    if (!edge_pairs_.emplace(edge.source, edge.target).second) {
        return false;
    }
    const auto index = edges_.size();
    outgoing_[edge.source].push_back(index);
    incoming_[edge.target].push_back(index);
    edges_.push_back(std::move(edge));
    return true;
}

void WorkflowGraph::Merge(const WorkflowGraph& fragment) {
    for (const auto& node : fragment.nodes_) {
        AddNode(node);
    }
    for (const auto& edge : fragment.edges_) {
        AddEdge(edge);
    }
}

bool WorkflowGraph::HasEdge(const std::string& source,
                            const std::string& target) const {
    return edge_pairs_.count({source, target}) > 0;
}

NodePtr WorkflowGraph::GetNode(const std::string& id) const {
    auto it = nodes_by_id_.find(id);
    if (it == nodes_by_id_.end() || it->second.empty()) {
        return nullptr;
    }
    return nodes_[it->second.front()];
}

std::vector<NodePtr> WorkflowGraph::GetNodesByType(WorkflowType type) const {
    std::vector<NodePtr> result;
    for (const auto& node : nodes_) {
        if (node->type == type) {
            result.push_back(node);
        }
    }
    return result;
}

std::vector<WorkflowEdge> WorkflowGraph::GetOutgoingEdges(const std::string& id) const {
    std::vector<WorkflowEdge> result;
    auto it = outgoing_.find(id);
    if (it == outgoing_.end()) {
        return result;
    }
    result.reserve(it->second.size());
    for (auto index : it->second) {
        result.push_back(edges_[index]);
    }
    return result;
}

std::vector<WorkflowEdge> WorkflowGraph::GetIncomingEdges(const std::string& id) const {
    std::vector<WorkflowEdge> result;
    auto it = incoming_.find(id);
    if (it == incoming_.end()) {
        return result;
    }
    result.reserve(it->second.size());
    for (auto index : it->second) {
        result.push_back(edges_[index]);
    }
    return result;
}

} // namespace workflow_tracker
