#pragma once

#include <workflow_tracker/model/workflow_graph.hpp>

#include <optional>
#include <string>
#include <vector>

namespace workflow_tracker {

// ---------------------------------------------------------------------------
// UIInteraction: an entry point: a node the user triggers directly.
// ---------------------------------------------------------------------------
struct UIInteraction {
    std::string id;                // node id
    std::string name;              // "Save Order"
    std::string component;         // "OrderForm"
    std::string interaction_type;  // button_click, form_submit, page_load
    std::string location;          // file path
    std::string description;       // "User clicks Save Order"
    NodePtr node;
};

struct WorkflowStep {
    int step_number = 0;
    std::string title;
    std::string description;
    std::string technical_details;
    std::string icon;
    NodePtr node;
};

// ---------------------------------------------------------------------------
// UIWorkflow: steps reachable from one trigger, in (file, line) order.
// ---------------------------------------------------------------------------
struct UIWorkflow {
    std::string id;
    std::string name;
    UIInteraction trigger;
    std::vector<WorkflowStep> steps;
    std::string summary;
    std::string outcome;

    [[nodiscard]] bool IsTrivial() const { return steps.empty(); }

    /// Markdown narrative: title, summary, user action, steps, result.
    [[nodiscard]] std::string Story() const;
};

/// Nodes whose name carries an interaction keyword, plus nodes scanners
/// tagged as UI triggers.
[[nodiscard]] bool IsUiInteraction(const WorkflowNode& node);

[[nodiscard]] UIInteraction MakeInteraction(const NodePtr& node);

/// Breadth-first reachability from `start` over outgoing edges. Each id is
/// visited once, so cycles terminate. Result is in visit order.
[[nodiscard]] std::vector<NodePtr> ReachableNodes(const WorkflowGraph& graph,
                                                  const NodePtr& start);

/// Workflow for one entry point; an entry point reaching nothing but itself
/// still yields its own step.
[[nodiscard]] UIWorkflow BuildWorkflow(const WorkflowGraph& graph,
                                       const UIInteraction& trigger);

/// One workflow per entry point, trivial ones discarded.
[[nodiscard]] std::vector<UIWorkflow> AnalyzeWorkflows(const WorkflowGraph& graph);

/// "handleSaveOrder" -> "Save Order".
[[nodiscard]] std::string HumanizeName(const std::string& name);

/// Last two non-placeholder path segments, title-cased:
/// "/api/customer-orders/{id}" -> "Api Customer Orders". "service" if none.
[[nodiscard]] std::string HumanizeEndpoint(const std::optional<std::string>& endpoint);

} // namespace workflow_tracker
