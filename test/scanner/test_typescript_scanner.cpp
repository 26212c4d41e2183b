#include <catch2/catch_test_macros.hpp>

#include <workflow_tracker/scanner/typescript_scanner.hpp>

#include "support/temp_repo.hpp"

using namespace workflow_tracker;

namespace {

constexpr const char* kApiModule = R"(export class Api {
  load() {
    return this.http.get('/api/orders').pipe(map(x => x));
  }
  save(o) {
    localStorage.setItem('draft', JSON.stringify(o));
    return fetch(`/api/orders/${o.id}`, { method: 'POST' });
  }
  restore() {
    return sessionStorage.getItem('draft');
  }
}
)";

} // namespace

TEST_CASE("TypeScriptScanner: claims script extensions", "[scanner][typescript]") {
    TypeScriptScanner scanner(ScanConfig{});
    CHECK(scanner.Name() == "typescript");
    CHECK(scanner.CanScan("src/api.ts"));
    CHECK(scanner.CanScan("lib/util.js"));
    CHECK_FALSE(scanner.CanScan("Program.cs"));
}

TEST_CASE("TypeScriptScanner: HTTP, storage and transforms", "[scanner][typescript]") {
    testing::TempRepo repo;
    const auto path = repo.Write("api.ts", kApiModule);

    TypeScriptScanner scanner(ScanConfig{});
    auto result = scanner.ScanFile(path, nullptr);
    REQUIRE(result.IsOk());
    const auto& graph = result.Value();

    auto get = graph.GetNode(WorkflowNode::MakeId(path, "api", 3));
    REQUIRE(get);
    CHECK(get->method == std::optional<std::string>("GET"));
    CHECK(get->endpoint == std::optional<std::string>("/api/orders"));
    CHECK(get->name == "API GET: /api/orders");

    auto pipe = graph.GetNode(WorkflowNode::MakeId(path, "transform", 3));
    REQUIRE(pipe);
    CHECK(pipe->type == WorkflowType::DataTransform);
    CHECK(pipe->metadata.at("operator") == "pipe");

    auto store = graph.GetNode(WorkflowNode::MakeId(path, "cache", 6));
    REQUIRE(store);
    CHECK(store->type == WorkflowType::CacheWrite);
    CHECK(store->name == "Cache Write: draft");
    CHECK(store->metadata.at("key") == "draft");

    auto fetch = graph.GetNode(WorkflowNode::MakeId(path, "api", 7));
    REQUIRE(fetch);
    CHECK(fetch->endpoint == std::optional<std::string>("/api/orders/${o.id}"));

    auto restore = graph.GetNode(WorkflowNode::MakeId(path, "cache", 10));
    REQUIRE(restore);
    CHECK(restore->type == WorkflowType::CacheRead);
}

TEST_CASE("TypeScriptScanner: toggles switch categories off", "[scanner][typescript]") {
    testing::TempRepo repo;
    const auto path = repo.Write("api.ts", kApiModule);

    ScanConfig config;
    config.detect.data_transforms = false;
    config.detect.cache = false;
    TypeScriptScanner scanner(config);
    auto result = scanner.ScanFile(path, nullptr);
    REQUIRE(result.IsOk());
    CHECK(result.Value().GetNodesByType(WorkflowType::DataTransform).empty());
    CHECK(result.Value().GetNodesByType(WorkflowType::CacheWrite).empty());
    CHECK(result.Value().GetNodesByType(WorkflowType::ApiCall).size() == 2);
}

TEST_CASE("TypeScriptScanner: empty file yields an empty fragment", "[scanner][typescript]") {
    testing::TempRepo repo;
    const auto path = repo.Write("empty.js", "");
    TypeScriptScanner scanner(ScanConfig{});
    auto result = scanner.ScanFile(path, nullptr);
    REQUIRE(result.IsOk());
    CHECK(result.Value().Empty());
}
