#include <catch2/catch_test_macros.hpp>

#include <workflow_tracker/model/workflow_graph.hpp>

#include "support/graph_fixtures.hpp"

#include <memory>

using namespace workflow_tracker;
using workflow_tracker::testing::MakeTestEdge;
using workflow_tracker::testing::MakeTestNode;

// ===========================================================================
// WorkflowType / CodeLocation / ids
// ===========================================================================

TEST_CASE("WorkflowTypeName: snake_case names round-trip", "[model]") {
    CHECK(std::string(WorkflowTypeName(WorkflowType::DatabaseRead)) == "database_read");
    CHECK(std::string(WorkflowTypeName(WorkflowType::CacheWrite)) == "cache_write");
    CHECK(ParseWorkflowType("api_call") == WorkflowType::ApiCall);
    CHECK_FALSE(ParseWorkflowType("teleport").has_value());
}

TEST_CASE("CodeLocation: displays as file:line", "[model]") {
    CodeLocation loc{"src/Orders.cs", 42, std::nullopt, std::nullopt};
    CHECK(loc.ToString() == "src/Orders.cs:42");
}

TEST_CASE("WorkflowNode: MakeId follows file:category:line", "[model]") {
    CHECK(WorkflowNode::MakeId("a.cs", "db_write", 3) == "a.cs:db_write:3");
}

// ===========================================================================
// Set-add semantics
// ===========================================================================

TEST_CASE("WorkflowGraph: adding an equal node twice is a no-op", "[model][graph]") {
    WorkflowGraph graph;
    auto node = MakeTestNode("a.cs", 3, WorkflowType::DatabaseWrite);

    CHECK(graph.AddNode(node));
    CHECK_FALSE(graph.AddNode(node));
    CHECK(graph.NodeCount() == 1);
}

TEST_CASE("WorkflowGraph: same id with different content keeps both", "[model][graph]") {
    WorkflowGraph graph;
    auto first = MakeTestNode("a.cs", 3, WorkflowType::DatabaseWrite, "first");
    auto second = first;
    second.name = "second";

    CHECK(graph.AddNode(first));
    CHECK(graph.AddNode(second));
    CHECK(graph.NodeCount() == 2);
    REQUIRE(graph.GetNode(first.id) != nullptr);
    CHECK(graph.GetNode(first.id)->name == "first");
}

TEST_CASE("WorkflowGraph: edge identity is the ordered pair", "[model][graph]") {
    WorkflowGraph graph;
    auto a = MakeTestNode("a.cs", 1, WorkflowType::ApiCall);
    auto b = MakeTestNode("a.cs", 2, WorkflowType::DatabaseWrite);
    graph.AddNode(a);
    graph.AddNode(b);

    CHECK(graph.AddEdge(MakeTestEdge(a, b, "Sequential (1 lines)")));
    CHECK_FALSE(graph.AddEdge(MakeTestEdge(a, b, "Data Ingestion")));
    CHECK(graph.AddEdge(MakeTestEdge(b, a)));

    REQUIRE(graph.EdgeCount() == 2);
    // First writer keeps its label.
    CHECK(graph.Edges()[0].label == std::optional<std::string>("Sequential (1 lines)"));
    CHECK(graph.HasEdge(a.id, b.id));
    CHECK(graph.HasEdge(b.id, a.id));
}

// ===========================================================================
// Queries
// ===========================================================================

TEST_CASE("WorkflowGraph: queries by id, type and direction", "[model][graph]") {
    WorkflowGraph graph;
    auto call = MakeTestNode("a.ts", 1, WorkflowType::ApiCall);
    auto read = MakeTestNode("a.ts", 5, WorkflowType::DatabaseRead);
    auto write = MakeTestNode("a.ts", 9, WorkflowType::DatabaseWrite);
    graph.AddNode(call);
    graph.AddNode(read);
    graph.AddNode(write);
    graph.AddEdge(MakeTestEdge(call, read));
    graph.AddEdge(MakeTestEdge(call, write));
    graph.AddEdge(MakeTestEdge(read, write));

    CHECK(graph.GetNode("missing") == nullptr);
    REQUIRE(graph.GetNodesByType(WorkflowType::DatabaseRead).size() == 1);
    CHECK(graph.GetNodesByType(WorkflowType::DatabaseRead)[0]->id == read.id);
    CHECK(graph.GetOutgoingEdges(call.id).size() == 2);
    CHECK(graph.GetIncomingEdges(write.id).size() == 2);
    CHECK(graph.GetIncomingEdges(call.id).empty());
}

TEST_CASE("WorkflowGraph: Merge shares node instances", "[model][graph]") {
    WorkflowGraph fragment;
    fragment.AddNode(MakeTestNode("a.cs", 1, WorkflowType::FileRead));
    auto shared = fragment.Nodes()[0];

    WorkflowGraph aggregate;
    aggregate.Merge(fragment);
    aggregate.Merge(fragment);

    REQUIRE(aggregate.NodeCount() == 1);
    CHECK(aggregate.Nodes()[0].get() == shared.get());
}

TEST_CASE("WorkflowGraph: empty graph", "[model][graph]") {
    WorkflowGraph graph;
    CHECK(graph.Empty());
    CHECK(graph.NodeCount() == 0);
    CHECK(graph.EdgeCount() == 0);
}
