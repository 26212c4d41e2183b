#include <catch2/catch_test_macros.hpp>

#include <workflow_tracker/graph/edge_inference.hpp>

#include "support/graph_fixtures.hpp"

using namespace workflow_tracker;
using testing::MakeTestNode;

// ===========================================================================
// Proximity
// ===========================================================================

TEST_CASE("AddProximityEdges: links successors within the threshold", "[graph][inference]") {
    WorkflowGraph graph;
    const auto a = MakeTestNode("Orders.cs", 10, WorkflowType::DatabaseRead);
    const auto b = MakeTestNode("Orders.cs", 15, WorkflowType::ApiCall);
    const auto c = MakeTestNode("Orders.cs", 40, WorkflowType::DatabaseWrite);
    // Insertion order differs from line order on purpose.
    graph.AddNode(c);
    graph.AddNode(a);
    graph.AddNode(b);

    CHECK(AddProximityEdges(graph, 20) == 1);
    REQUIRE(graph.HasEdge(a.id, b.id));
    CHECK_FALSE(graph.HasEdge(b.id, c.id));

    const auto edges = graph.GetOutgoingEdges(a.id);
    REQUIRE(edges.size() == 1);
    CHECK(edges[0].label == std::optional<std::string>("Sequential (5 lines)"));
    CHECK(edges[0].metadata.at("distance") == "5");
}

TEST_CASE("AddProximityEdges: threshold is inclusive", "[graph][inference]") {
    WorkflowGraph graph;
    const auto a = MakeTestNode("a.ts", 1, WorkflowType::ApiCall);
    const auto b = MakeTestNode("a.ts", 21, WorkflowType::DataTransform);
    graph.AddNode(a);
    graph.AddNode(b);
    CHECK(AddProximityEdges(graph, 20) == 1);
}

TEST_CASE("AddProximityEdges: never crosses files", "[graph][inference]") {
    WorkflowGraph graph;
    graph.AddNode(MakeTestNode("a.cs", 10, WorkflowType::ApiCall));
    graph.AddNode(MakeTestNode("b.cs", 11, WorkflowType::DatabaseWrite));
    CHECK(AddProximityEdges(graph, 20) == 0);
    CHECK(graph.EdgeCount() == 0);
}

TEST_CASE("AddProximityEdges: second run adds nothing", "[graph][inference]") {
    WorkflowGraph graph;
    graph.AddNode(MakeTestNode("a.cs", 1, WorkflowType::ApiCall));
    graph.AddNode(MakeTestNode("a.cs", 2, WorkflowType::DatabaseWrite));
    graph.AddNode(MakeTestNode("a.cs", 3, WorkflowType::DatabaseRead));
    CHECK(AddProximityEdges(graph, 20) == 2);
    CHECK(AddProximityEdges(graph, 20) == 0);
    CHECK(graph.EdgeCount() == 2);
}

// ===========================================================================
// Data flow
// ===========================================================================

TEST_CASE("AddDataFlowEdges: never crosses files", "[graph][inference]") {
    WorkflowGraph graph;
    graph.AddNode(MakeTestNode("a.cs", 5, WorkflowType::ApiCall));
    graph.AddNode(MakeTestNode("b.cs", 10, WorkflowType::DatabaseWrite));
    graph.AddNode(MakeTestNode("c.cs", 5, WorkflowType::DatabaseRead));
    graph.AddNode(MakeTestNode("d.ts", 8, WorkflowType::DataTransform));

    const auto stats = AddDataFlowEdges(graph, 50, 30);
    CHECK(stats.ingestion_edges == 0);
    CHECK(stats.processing_edges == 0);
    CHECK(graph.EdgeCount() == 0);
}

TEST_CASE("AddDataFlowEdges: API call feeds a later write", "[graph][inference]") {
    WorkflowGraph graph;
    const auto call = MakeTestNode("Import.cs", 5, WorkflowType::ApiCall);
    const auto near_write = MakeTestNode("Import.cs", 30, WorkflowType::DatabaseWrite);
    const auto far_write = MakeTestNode("Import.cs", 200, WorkflowType::DatabaseWrite);
    const auto early_write = MakeTestNode("Import.cs", 2, WorkflowType::DatabaseWrite);
    graph.AddNode(call);
    graph.AddNode(near_write);
    graph.AddNode(far_write);
    graph.AddNode(early_write);

    const auto stats = AddDataFlowEdges(graph, 50, 30);
    CHECK(stats.ingestion_edges == 1);
    CHECK(stats.processing_edges == 0);
    REQUIRE(graph.HasEdge(call.id, near_write.id));
    CHECK_FALSE(graph.HasEdge(call.id, far_write.id));
    CHECK_FALSE(graph.HasEdge(call.id, early_write.id));

    const auto edges = graph.GetOutgoingEdges(call.id);
    REQUIRE(edges.size() == 1);
    CHECK(edges[0].label == std::optional<std::string>("Data Ingestion"));
    CHECK(edges[0].metadata.at("pattern") == "api_to_db");
}

TEST_CASE("AddDataFlowEdges: read feeds transforms inside an exclusive window", "[graph][inference]") {
    WorkflowGraph graph;
    const auto read = MakeTestNode("list.ts", 10, WorkflowType::DatabaseRead);
    const auto inside = MakeTestNode("list.ts", 39, WorkflowType::DataTransform);
    const auto edge_of_window = MakeTestNode("list.ts", 40, WorkflowType::DataTransform);
    graph.AddNode(read);
    graph.AddNode(inside);
    graph.AddNode(edge_of_window);

    const auto stats = AddDataFlowEdges(graph, 50, 30);
    CHECK(stats.processing_edges == 1);
    CHECK(graph.HasEdge(read.id, inside.id));
    CHECK_FALSE(graph.HasEdge(read.id, edge_of_window.id));
    CHECK(graph.GetOutgoingEdges(read.id)[0].label ==
          std::optional<std::string>("Data Processing"));
}

TEST_CASE("AddDataFlowEdges: existing pairs keep their first label", "[graph][inference]") {
    WorkflowGraph graph;
    const auto call = MakeTestNode("a.cs", 1, WorkflowType::ApiCall);
    const auto write = MakeTestNode("a.cs", 2, WorkflowType::DatabaseWrite);
    graph.AddNode(call);
    graph.AddNode(write);

    EdgeInferenceConfig config;
    const auto stats = InferEdges(graph, config);
    CHECK(stats.proximity_edges == 1);
    CHECK(stats.ingestion_edges == 0);
    CHECK(graph.EdgeCount() == 1);
    CHECK(graph.GetOutgoingEdges(call.id)[0].label ==
          std::optional<std::string>("Sequential (1 lines)"));
}

TEST_CASE("InferEdges: respects the configuration switches", "[graph][inference]") {
    auto make_graph = [] {
        WorkflowGraph graph;
        graph.AddNode(MakeTestNode("a.cs", 1, WorkflowType::ApiCall));
        graph.AddNode(MakeTestNode("a.cs", 30, WorkflowType::DatabaseWrite));
        return graph;
    };

    EdgeInferenceConfig config;
    config.enabled = false;
    auto disabled = make_graph();
    CHECK(InferEdges(disabled, config).Total() == 0);
    CHECK(disabled.EdgeCount() == 0);

    config.enabled = true;
    config.data_flow_edges = false;
    auto proximity_only = make_graph();
    CHECK(InferEdges(proximity_only, config).Total() == 0);

    config.data_flow_edges = true;
    auto full = make_graph();
    const auto stats = InferEdges(full, config);
    CHECK(stats.proximity_edges == 0);
    CHECK(stats.ingestion_edges == 1);
    CHECK(stats.Total() == 1);
}
