#include <workflow_tracker/cli/output_formatter.hpp>
#include <workflow_tracker/core/terminal.hpp>

#include <algorithm>
#include <iomanip>
#include <map>
#include <sstream>

#include <ftxui/dom/elements.hpp>
#include <ftxui/dom/table.hpp>
#include <ftxui/screen/screen.hpp>
#include <nlohmann/json.hpp>

namespace workflow_tracker {

namespace {

using namespace workflow_tracker::ansi;

constexpr WorkflowType kAllTypes[] = {
    WorkflowType::DatabaseRead,   WorkflowType::DatabaseWrite,
    WorkflowType::ApiCall,        WorkflowType::FileRead,
    WorkflowType::FileWrite,      WorkflowType::MessageSend,
    WorkflowType::MessageReceive, WorkflowType::DataTransform,
    WorkflowType::CacheRead,      WorkflowType::CacheWrite,
};

std::string FormatSeconds(double seconds) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << seconds << "s";
    return oss.str();
}

// Paths and messages can carry bytes that are not UTF-8.
std::string DumpLine(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // anonymous namespace

OutputFormatter::OutputFormatter(bool json_mode, bool color_mode,
                                 std::ostream& out, std::ostream& err)
    : out_(out), err_(err), json_mode_(json_mode),
      color_mode_(color_mode && !json_mode) {}

void OutputFormatter::PrintTable(
    const std::vector<std::string>& headers,
    const std::vector<std::vector<std::string>>& rows) const {

    if (json_mode_) {
        nlohmann::json array = nlohmann::json::array();
        for (const auto& row : rows) {
            nlohmann::json obj = nlohmann::json::object();
            for (size_t c = 0; c < headers.size() && c < row.size(); ++c) {
                obj[headers[c]] = row[c];
            }
            array.push_back(std::move(obj));
        }
        out_ << DumpLine(array) << "\n";
        return;
    }

    if (color_mode_) {
        std::vector<std::vector<std::string>> table_data;
        table_data.push_back(headers);
        for (const auto& row : rows) {
            table_data.push_back(row);
        }

        auto table = ftxui::Table(table_data);
        table.SelectRow(0).Decorate(ftxui::bold);
        table.SelectRow(0).SeparatorVertical(ftxui::LIGHT);
        table.SelectRow(0).BorderBottom(ftxui::LIGHT);
        // Right-align the value column.
        if (headers.size() > 1) {
            table.SelectColumn(static_cast<int>(headers.size()) - 1)
                .DecorateCells(ftxui::align_right);
        }

        auto element = table.Render();
        auto screen = ftxui::Screen::Create(ftxui::Dimension::Fit(element));
        ftxui::Render(screen, element);
        out_ << screen.ToString() << "\n";
        return;
    }

    std::vector<size_t> widths(headers.size(), 0);
    for (size_t c = 0; c < headers.size(); ++c) {
        widths[c] = headers[c].size();
    }
    for (const auto& row : rows) {
        for (size_t c = 0; c < headers.size() && c < row.size(); ++c) {
            widths[c] = std::max(widths[c], row[c].size());
        }
    }

    for (size_t c = 0; c < headers.size(); ++c) {
        if (c > 0) out_ << "  ";
        out_ << std::left << std::setw(static_cast<int>(widths[c])) << headers[c];
    }
    out_ << "\n";
    for (size_t c = 0; c < headers.size(); ++c) {
        if (c > 0) out_ << "  ";
        out_ << std::string(widths[c], '-');
    }
    out_ << "\n";
    for (const auto& row : rows) {
        for (size_t c = 0; c < headers.size() && c < row.size(); ++c) {
            if (c > 0) out_ << "  ";
            out_ << std::left << std::setw(static_cast<int>(widths[c])) << row[c];
        }
        out_ << "\n";
    }
}

void OutputFormatter::PrintScanSummary(const ScanResult& result) const {
    std::map<WorkflowType, size_t> per_type;
    for (const auto& node : result.graph.Nodes()) {
        ++per_type[node->type];
    }

    if (json_mode_) {
        nlohmann::json nodes = nlohmann::json::object();
        for (auto type : kAllTypes) {
            nodes[WorkflowTypeName(type)] = per_type[type];
        }
        nlohmann::json j;
        j["repository_path"] = result.repository_path;
        j["status"] = ScanStatusName(result.status);
        j["files_scanned"] = result.files_scanned;
        j["total_files"] = result.total_files;
        j["node_count"] = result.graph.NodeCount();
        j["nodes_by_type"] = std::move(nodes);
        j["edge_count"] = result.graph.EdgeCount();
        j["schemas"] = result.schemas.Size();
        j["workflows"] = result.workflows.size();
        j["errors"] = result.errors;
        j["warnings"] = result.warnings.size();
        j["scan_time_seconds"] = result.scan_time_seconds;
        out_ << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
        return;
    }

    std::vector<std::vector<std::string>> rows;
    rows.push_back({"Files scanned", std::to_string(result.files_scanned) + " / " +
                                         std::to_string(result.total_files)});
    for (auto type : kAllTypes) {
        if (per_type[type] > 0) {
            rows.push_back({std::string("  ") + WorkflowTypeName(type),
                            std::to_string(per_type[type])});
        }
    }
    rows.push_back({"Nodes", std::to_string(result.graph.NodeCount())});
    rows.push_back({"Edges", std::to_string(result.graph.EdgeCount())});
    rows.push_back({"Schemas", std::to_string(result.schemas.Size())});
    rows.push_back({"Workflows", std::to_string(result.workflows.size())});
    rows.push_back({"Errors", std::to_string(result.errors.size())});
    rows.push_back({"Warnings", std::to_string(result.warnings.size())});
    rows.push_back({"Time", FormatSeconds(result.scan_time_seconds)});

    if (color_mode_) {
        out_ << kBold << result.repository_path << kReset << " ("
             << ScanStatusName(result.status) << ")\n";
    } else {
        out_ << result.repository_path << " (" << ScanStatusName(result.status) << ")\n";
    }
    PrintTable({"Metric", "Value"}, rows);

    for (const auto& error : result.errors) {
        if (color_mode_) {
            out_ << kRed << "  x " << kReset << error << "\n";
        } else {
            out_ << "  x " << error << "\n";
        }
    }
}

void OutputFormatter::PrintStories(const std::vector<UIWorkflow>& workflows) const {
    if (json_mode_) {
        return;
    }
    for (size_t i = 0; i < workflows.size(); ++i) {
        if (i > 0) {
            out_ << "\n---\n\n";
        }
        out_ << workflows[i].Story();
    }
}

void OutputFormatter::PrintProgress(const ProgressEvent& event) const {
    if (json_mode_) {
        return;
    }
    const int width = static_cast<int>(std::to_string(event.total).size());
    std::ostringstream counter;
    counter << "[" << std::setw(width) << event.current << "/" << event.total << "]";
    if (color_mode_) {
        err_ << kDim << counter.str() << kReset << " " << kCyan << event.phase << kReset
             << " " << event.message << "\n";
        return;
    }
    err_ << counter.str() << " " << event.phase << " " << event.message << "\n";
}

void OutputFormatter::PrintError(const Error& error) const {
    if (json_mode_) {
        nlohmann::json j;
        j["error"] = {
            {"operation", error.operation},
            {"path", error.path},
            {"message", error.message},
            {"category", error.CategoryName()},
            {"exit_code", error.ExitCode()},
        };
        if (error.detail.has_value()) {
            j["error"]["detail"] = *error.detail;
        }
        err_ << DumpLine(j) << "\n";
        return;
    }

    if (color_mode_) {
        err_ << kRed << "Error: " << kReset << kBold << error.operation << kReset;
        if (!error.path.empty()) {
            err_ << kDim << " [" << error.path << "]" << kReset;
        }
        err_ << "\n  " << error.message << "\n";
        if (error.detail.has_value() && !error.detail->empty()) {
            err_ << "  " << kDim << error.detail.value() << kReset << "\n";
        }
        return;
    }

    err_ << "Error: " << error.operation;
    if (!error.path.empty()) {
        err_ << " [" << error.path << "]";
    }
    err_ << "\n  " << error.message << "\n";
    if (error.detail.has_value() && !error.detail->empty()) {
        err_ << "  " << error.detail.value() << "\n";
    }
}

void OutputFormatter::PrintWarning(const std::string& message) const {
    if (json_mode_) {
        return;
    }
    if (color_mode_) {
        err_ << kYellow << "Warning: " << kReset << message << "\n";
        return;
    }
    err_ << "Warning: " << message << "\n";
}

void OutputFormatter::PrintSuccess(const std::string& message) const {
    if (json_mode_) {
        nlohmann::json j;
        j["success"] = true;
        j["message"] = message;
        out_ << DumpLine(j) << "\n";
        return;
    }
    if (color_mode_) {
        out_ << kGreen << "OK" << kReset << " " << message << "\n";
        return;
    }
    out_ << message << "\n";
}

} // namespace workflow_tracker
