#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace workflow_tracker {

// ---------------------------------------------------------------------------
// WorkflowType: the kind of runtime behavior a node stands for.
// ---------------------------------------------------------------------------
enum class WorkflowType {
    DatabaseRead,
    DatabaseWrite,
    ApiCall,
    FileRead,
    FileWrite,
    MessageSend,
    MessageReceive,
    DataTransform,
    CacheRead,
    CacheWrite,
};

/// snake_case wire name, e.g. "database_read".
[[nodiscard]] const char* WorkflowTypeName(WorkflowType type);

/// Inverse of WorkflowTypeName; nullopt for unknown names.
[[nodiscard]] std::optional<WorkflowType> ParseWorkflowType(std::string_view name);

// ---------------------------------------------------------------------------
// CodeLocation: a position in a source file. Displayed as "file:line".
// ---------------------------------------------------------------------------
struct CodeLocation {
    std::string file_path;
    int line_number = 0;
    std::optional<int> column;
    std::optional<int> end_line;

    [[nodiscard]] std::string ToString() const;

    bool operator==(const CodeLocation& other) const {
        return file_path == other.file_path &&
               line_number == other.line_number &&
               column == other.column &&
               end_line == other.end_line;
    }
    bool operator!=(const CodeLocation& other) const { return !(*this == other); }
};

using Metadata = std::map<std::string, std::string>;

// ---------------------------------------------------------------------------
// WorkflowNode: one detected operation. Built by a scanner while reading a
// single file and never modified afterwards; graphs share it by pointer.
// ---------------------------------------------------------------------------
struct WorkflowNode {
    std::string id;
    WorkflowType type = WorkflowType::DataTransform;
    std::string name;
    std::string description;
    CodeLocation location;
    Metadata metadata;
    std::optional<std::string> code_snippet;

    // Database operations
    std::optional<std::string> table_name;
    std::optional<std::string> query;

    // API calls
    std::optional<std::string> endpoint;
    std::optional<std::string> method;

    // File operations
    std::optional<std::string> file_path;

    // Message queues
    std::optional<std::string> queue_name;
    std::optional<std::string> topic;

    /// Convention for scanner-generated ids: "{file_path}:{category}:{line}".
    static std::string MakeId(const std::string& file_path,
                              std::string_view category, int line_number);

    bool operator==(const WorkflowNode& other) const;
    bool operator!=(const WorkflowNode& other) const { return !(*this == other); }
};

using NodePtr = std::shared_ptr<const WorkflowNode>;

// ---------------------------------------------------------------------------
// WorkflowEdge: directed relationship between two node ids. Identity is
// the ordered (source, target) pair; label and metadata do not take part.
// ---------------------------------------------------------------------------
struct WorkflowEdge {
    std::string source;
    std::string target;
    std::optional<std::string> label;
    Metadata metadata;

    bool operator==(const WorkflowEdge& other) const {
        return source == other.source && target == other.target;
    }
    bool operator!=(const WorkflowEdge& other) const { return !(*this == other); }
};

// ---------------------------------------------------------------------------
// WorkflowGraph: insertion-ordered nodes and edges with set-add semantics.
//
// AddNode skips a node structurally equal to one already present (two
// different nodes sharing an id are both kept; GetNode returns the first).
// AddEdge skips an edge whose ordered pair already exists, so the first
// label written for a pair wins.
//
// Lookups are served from indexes maintained on insert. The graph is not
// synchronized; concurrent writers must serialize externally.
// ---------------------------------------------------------------------------
class WorkflowGraph {
public:
    WorkflowGraph() = default;

    /// Returns true if the node was inserted.
    bool AddNode(NodePtr node);
    bool AddNode(WorkflowNode node);

    /// Returns true if the edge was inserted.
    bool AddEdge(WorkflowEdge edge);

    /// Adds every node and edge of `fragment` (by reference for nodes).
    void Merge(const WorkflowGraph& fragment);

    [[nodiscard]] bool HasEdge(const std::string& source,
                               const std::string& target) const;

    [[nodiscard]] NodePtr GetNode(const std::string& id) const;
    [[nodiscard]] std::vector<NodePtr> GetNodesByType(WorkflowType type) const;
    [[nodiscard]] std::vector<WorkflowEdge> GetOutgoingEdges(const std::string& id) const;
    [[nodiscard]] std::vector<WorkflowEdge> GetIncomingEdges(const std::string& id) const;

    [[nodiscard]] const std::vector<NodePtr>& Nodes() const noexcept { return nodes_; }
    [[nodiscard]] const std::vector<WorkflowEdge>& Edges() const noexcept { return edges_; }
    [[nodiscard]] std::size_t NodeCount() const noexcept { return nodes_.size(); }
    [[nodiscard]] std::size_t EdgeCount() const noexcept { return edges_.size(); }
    [[nodiscard]] bool Empty() const noexcept { return nodes_.empty() && edges_.empty(); }

private:
    std::vector<NodePtr> nodes_;
    std::vector<WorkflowEdge> edges_;

    std::unordered_map<std::string, std::vector<std::size_t>> nodes_by_id_;
    std::unordered_map<std::string, std::vector<std::size_t>> outgoing_;
    std::unordered_map<std::string, std::vector<std::size_t>> incoming_;
    std::set<std::pair<std::string, std::string>> edge_pairs_;
};

} // namespace workflow_tracker
