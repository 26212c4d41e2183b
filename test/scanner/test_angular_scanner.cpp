#include <catch2/catch_test_macros.hpp>

#include <workflow_tracker/scanner/angular_scanner.hpp>

#include "support/temp_repo.hpp"

#include <filesystem>
#include <string>

using namespace workflow_tracker;

namespace {

constexpr const char* kComponent = R"(import { Component } from '@angular/core';

@Component({
  selector: 'app-order-list',
  templateUrl: './order-list.component.html'
})
export class OrderListComponent {
  constructor(private http: HttpClient) {}

  refresh() {
    this.http.get<Order[]>('/api/orders').subscribe();
  }

  save(order: Order) {
    this.http.post('/api/orders', order).subscribe();
  }
}
)";

constexpr const char* kTemplate = R"html(<div class="orders">
  <button (click)="save(order)">Save</button>
  <button (click)="refresh()">Refresh</button>
</div>
)html";

std::string Normal(const std::string& path) {
    return std::filesystem::path(path).lexically_normal().string();
}

} // namespace

TEST_CASE("AngularScanner: claims component files and templates", "[scanner][angular]") {
    AngularScanner scanner(ScanConfig{});
    CHECK(scanner.Name() == "angular");
    CHECK(scanner.CanScan("app/order-list.component.ts"));
    CHECK(scanner.CanScan("app/orders.service.ts"));
    CHECK(scanner.CanScan("app/app.module.ts"));
    CHECK(scanner.CanScan("app/order-list.component.html"));
    CHECK_FALSE(scanner.CanScan("app/util.ts"));
}

TEST_CASE("AngularScanner: component name from file path", "[scanner][angular]") {
    CHECK(AngularScanner::ComponentNameFromPath("src/order-list.component.html") == "Order List");
    CHECK(AngularScanner::ComponentNameFromPath("src/home.html") == "Home");
}

TEST_CASE("AngularScanner: template events link to calls in their handler", "[scanner][angular]") {
    testing::TempRepo repo;
    const auto code = repo.Write("app/order-list.component.ts", kComponent);
    const auto markup = Normal(repo.Write("app/order-list.component.html", kTemplate));

    AngularScanner scanner(ScanConfig{});
    auto result = scanner.ScanFile(code, nullptr);
    REQUIRE(result.IsOk());
    const auto& graph = result.Value();

    const auto save_id = WorkflowNode::MakeId(markup, "ui_trigger", 2);
    const auto refresh_id = WorkflowNode::MakeId(markup, "ui_trigger", 3);
    const auto get_id = WorkflowNode::MakeId(code, "http", 11);
    const auto post_id = WorkflowNode::MakeId(code, "http", 15);

    auto save = graph.GetNode(save_id);
    REQUIRE(save);
    CHECK(save->name == "Angular: Click");
    CHECK(save->metadata.at("handler") == "save(order)");
    CHECK(save->metadata.at("component") == "Order List");
    CHECK(save->metadata.at("framework") == "Angular");

    auto get = graph.GetNode(get_id);
    REQUIRE(get);
    CHECK(get->name == "Angular HTTP GET");
    CHECK(get->endpoint == std::optional<std::string>("/api/orders"));
    auto post = graph.GetNode(post_id);
    REQUIRE(post);
    CHECK(post->method == std::optional<std::string>("POST"));

    // save() is defined after refresh(), so only the POST follows it.
    CHECK(graph.HasEdge(save_id, post_id));
    CHECK_FALSE(graph.HasEdge(save_id, get_id));
    CHECK(graph.HasEdge(refresh_id, get_id));

    const auto edges = graph.GetOutgoingEdges(save_id);
    REQUIRE(edges.size() == 1);
    CHECK(edges[0].label == std::optional<std::string>("Angular Event → HTTP Call"));
    CHECK(edges[0].metadata.at("workflow_type") == "angular_ui_to_api");
    CHECK(edges[0].metadata.at("handler") == "save(order)");
}

TEST_CASE("AngularScanner: either half of the pair yields the same fragment", "[scanner][angular]") {
    testing::TempRepo repo;
    const auto code = repo.Write("app/order-list.component.ts", kComponent);
    const auto markup = repo.Write("app/order-list.component.html", kTemplate);

    AngularScanner scanner(ScanConfig{});
    auto from_code = scanner.ScanFile(code, nullptr);
    auto from_markup = scanner.ScanFile(markup, nullptr);
    REQUIRE(from_code.IsOk());
    REQUIRE(from_markup.IsOk());
    CHECK(from_code.Value().NodeCount() == from_markup.Value().NodeCount());
    CHECK(from_code.Value().EdgeCount() == from_markup.Value().EdgeCount());

    WorkflowGraph merged;
    merged.Merge(from_code.Value());
    merged.Merge(from_markup.Value());
    CHECK(merged.EdgeCount() == from_code.Value().EdgeCount());
}

TEST_CASE("AngularScanner: services without a template", "[scanner][angular]") {
    testing::TempRepo repo;
    const auto path = repo.Write("app/orders.service.ts", R"(@Injectable()
export class OrdersService {
  remove(id: number) {
    return this.http.delete(`/api/orders/${id}`);
  }
}
)");
    AngularScanner scanner(ScanConfig{});
    auto result = scanner.ScanFile(path, nullptr);
    REQUIRE(result.IsOk());
    const auto calls = result.Value().GetNodesByType(WorkflowType::ApiCall);
    REQUIRE(calls.size() == 1);
    CHECK(calls[0]->method == std::optional<std::string>("DELETE"));
    CHECK(result.Value().EdgeCount() == 0);
}

TEST_CASE("AngularScanner: template not claimed by the component", "[scanner][angular]") {
    testing::TempRepo repo;
    repo.Write("app/widget.ts", "export const x = 1;\n");
    const auto markup = repo.Write("app/widget.html", "<a (click)=\"go()\">Go</a>\n");

    AngularScanner scanner(ScanConfig{});
    auto result = scanner.ScanFile(markup, nullptr);
    REQUIRE(result.IsOk());
    CHECK(result.Value().NodeCount() == 1);
    CHECK(result.Value().EdgeCount() == 0);
}
