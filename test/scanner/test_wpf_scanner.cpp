#include <catch2/catch_test_macros.hpp>

#include <workflow_tracker/scanner/wpf_scanner.hpp>
#include <workflow_tracker/scanner/xaml_document.hpp>

#include "support/temp_repo.hpp"

#include <string>

using namespace workflow_tracker;

namespace {

constexpr const char* kWindow = R"(<Window x:Class="Shop.Desktop.MainWindow"
        xmlns="http://schemas.microsoft.com/winfx/2006/xaml/presentation"
        xmlns:x="http://schemas.microsoft.com/winfx/2006/xaml">
    <StackPanel>
        <Button Content="Save" Click="SaveButton_Click" />
        <Button Content="Sync" Command="{Binding SyncCommand}" />
    </StackPanel>
</Window>
)";

constexpr const char* kCodeBehind = R"(using System.Net.Http;

public partial class MainWindow : Window
{
    private readonly HttpClient _client = new HttpClient();

    private async void SaveButton_Click(object sender, RoutedEventArgs e)
    {
        await _client.PostAsync("/api/orders", null);
    }
}
)";

} // namespace

TEST_CASE("ParseXaml: attributes carry line numbers", "[scanner][wpf]") {
    auto result = ParseXaml(kWindow, "MainWindow.xaml");
    REQUIRE(result.IsOk());
    const auto& doc = result.Value();
    CHECK(doc.class_name == std::optional<std::string>("Shop.Desktop.MainWindow"));

    bool found_click = false;
    for (const auto& attr : doc.attributes) {
        if (attr.name == "Click") {
            found_click = true;
            CHECK(attr.element == "Button");
            CHECK(attr.value == "SaveButton_Click");
            CHECK(attr.line_number == 5);
        }
    }
    CHECK(found_click);
}

TEST_CASE("ParseXaml: malformed markup is an error", "[scanner][wpf]") {
    auto result = ParseXaml("<Window><Button Click=\"Go\">", "Broken.xaml");
    REQUIRE(result.IsErr());
    CHECK(result.Error().path == "Broken.xaml");
}

TEST_CASE("WpfScanner: claims XAML and its code-behind", "[scanner][wpf]") {
    WpfScanner scanner(ScanConfig{});
    CHECK(scanner.Name() == "wpf");
    CHECK(scanner.CanScan("Views/MainWindow.xaml"));
    CHECK(scanner.CanScan("Views/MainWindow.xaml.cs"));
    CHECK_FALSE(scanner.CanScan("Views/ViewModel.cs"));
}

TEST_CASE("WpfScanner: event handlers link to calls in the code-behind", "[scanner][wpf]") {
    testing::TempRepo repo;
    const auto markup = repo.Write("MainWindow.xaml", kWindow);
    const auto code = repo.Write("MainWindow.xaml.cs", kCodeBehind);

    WpfScanner scanner(ScanConfig{});
    auto result = scanner.ScanFile(markup, nullptr);
    REQUIRE(result.IsOk());
    const auto& graph = result.Value();

    const auto click_id = WorkflowNode::MakeId(markup, "ui_trigger", 5);
    const auto command_id = WorkflowNode::MakeId(markup, "ui_trigger", 6);
    const auto call_id = WorkflowNode::MakeId(code, "http", 9);

    auto click = graph.GetNode(click_id);
    REQUIRE(click);
    CHECK(click->name == "WPF: Click");
    CHECK(click->metadata.at("window") == "MainWindow");
    CHECK(click->metadata.at("handler") == "SaveButton_Click");
    CHECK(click->metadata.at("framework") == "WPF");

    auto command = graph.GetNode(command_id);
    REQUIRE(command);
    CHECK(command->name == "WPF: Command");
    CHECK(command->metadata.at("handler") == "SyncCommand");

    auto call = graph.GetNode(call_id);
    REQUIRE(call);
    CHECK(call->name == "WPF HTTP POST");
    CHECK(call->endpoint == std::optional<std::string>("/api/orders"));

    const auto click_edges = graph.GetOutgoingEdges(click_id);
    REQUIRE(click_edges.size() == 1);
    CHECK(click_edges[0].target == call_id);
    CHECK(click_edges[0].label == std::optional<std::string>("WPF Event → HTTP Call"));
    CHECK(click_edges[0].metadata.at("workflow_type") == "wpf_ui_to_api");

    // No handler named SyncCommand in the code-behind: falls back to proximity.
    const auto command_edges = graph.GetOutgoingEdges(command_id);
    REQUIRE(command_edges.size() == 1);
    CHECK(command_edges[0].metadata.at("workflow_type") == "wpf_ui_to_api_proximity");
}

TEST_CASE("WpfScanner: code-behind and markup give the same fragment", "[scanner][wpf]") {
    testing::TempRepo repo;
    const auto markup = repo.Write("MainWindow.xaml", kWindow);
    const auto code = repo.Write("MainWindow.xaml.cs", kCodeBehind);

    WpfScanner scanner(ScanConfig{});
    auto from_markup = scanner.ScanFile(markup, nullptr);
    auto from_code = scanner.ScanFile(code, nullptr);
    REQUIRE(from_markup.IsOk());
    REQUIRE(from_code.IsOk());
    CHECK(from_markup.Value().NodeCount() == from_code.Value().NodeCount());
    CHECK(from_markup.Value().EdgeCount() == from_code.Value().EdgeCount());
}

TEST_CASE("WpfScanner: malformed XAML falls back to line patterns", "[scanner][wpf]") {
    testing::TempRepo repo;
    const auto markup = repo.Write("Broken.xaml",
                                   "<Window x:Class=\"Shop.Broken\">\n"
                                   "  <Button Click=\"Go_Click\">\n");

    WpfScanner scanner(ScanConfig{});
    auto result = scanner.ScanFile(markup, nullptr);
    REQUIRE(result.IsOk());
    const auto& graph = result.Value();
    REQUIRE(graph.NodeCount() == 1);
    auto trigger = graph.GetNode(WorkflowNode::MakeId(markup, "ui_trigger", 2));
    REQUIRE(trigger);
    CHECK(trigger->metadata.at("window") == "Broken");
    CHECK(trigger->metadata.at("handler") == "Go_Click");
    CHECK(graph.EdgeCount() == 0);
}
