#include <workflow_tracker/scanner/react_scanner.hpp>

#include <algorithm>
#include <cstdlib>

namespace workflow_tracker {

namespace {

constexpr const char* kFetch = "fetch";

std::string JoinWithSpaces(const std::vector<std::string>& lines, int first, int last) {
    std::string out;
    for (int i = first; i < last; ++i) {
        if (i > first) {
            out += ' ';
        }
        out += lines[static_cast<std::size_t>(i)];
    }
    return out;
}

} // namespace

ReactScanner::ReactScanner(const ScanConfig& config)
    : generic_(config),
      detect_(config.detect),
      window_(config.ui_linking.single_file_window),
      max_line_length_(static_cast<std::size_t>(config.max_line_length)),
      event_handlers_(BuildTable({
          {R"(onClick\s*=\s*\{([^\}]+)\})", "ui_click"},
          {R"(onSubmit\s*=\s*\{([^\}]+)\})", "ui_submit"},
          {R"(onChange\s*=\s*\{([^\}]+)\})", "ui_change"},
          {R"(onLoad\s*=\s*\{([^\}]+)\})", "page_load"},
      })),
      calls_(BuildTable({
          {R"(fetch\s*\(\s*['"]([^'"]+)['"](?:.*?method\s*:\s*['"](\w+)['"])?)", kFetch},
          {R"(axios\.(get|post|put|delete|patch)\s*\(\s*['"]([^'"]+)['"])", "axios"},
          {R"(http\.(get|post|put|delete|patch)\s*\(\s*['"]([^'"]+)['"])", "http"},
      }, /*icase=*/true)),
      component_patterns_{
          std::regex(R"(export\s+(?:default\s+)?(?:function|const)\s+(\w+))"),
          std::regex(R"(const\s+(\w+)\s*[=:]\s*\([^)]*\)\s*(?:=>|:))"),
          std::regex(R"(function\s+(\w+)\s*\([^)]*\))"),
      },
      route_patterns_{
          std::regex(R"(<Route\s+path\s*=\s*['"]([^'"]+)['"])"),
          std::regex(R"(path\s*:\s*['"]([^'"]+)['"])"),
          std::regex(R"(href\s*=\s*['"]([^'"]+)['"])"),
      },
      method_option_(R"(method\s*:\s*['"](\w+)['"])", std::regex::icase) {}

bool ReactScanner::CanScan(const std::string& file_path) const {
    return EndsWith(file_path, ".tsx") || EndsWith(file_path, ".jsx");
}

std::string ReactScanner::DetectComponentName(const SourceText& source) const {
    for (const auto& pattern : component_patterns_) {
        if (auto name = SearchGroup(pattern, source.text)) {
            return *name;
        }
    }
    return FileStem(source.path);
}

std::optional<std::string> ReactScanner::DetectRoute(const SourceText& source) const {
    for (const auto& pattern : route_patterns_) {
        if (auto route = SearchGroup(pattern, source.text)) {
            return route;
        }
    }
    return std::nullopt;
}

Result<WorkflowGraph, Error> ReactScanner::ScanFile(
    const std::string& file_path, const SchemaRegistry* /*schemas*/) const {
    auto loaded = LoadSource(file_path, max_line_length_);
    if (loaded.IsErr()) {
        return Result<WorkflowGraph, Error>::Err(std::move(loaded).Error());
    }
    const auto& source = loaded.Value();

    const auto component = DetectComponentName(source);
    const auto url = DetectRoute(source);

    WorkflowGraph fragment;
    std::vector<UiTrigger> triggers;

    DetectionToggles rest = detect_;
    rest.api_calls = false;

    const int count = static_cast<int>(source.lines.size());
    for (int line = 1; line <= count; ++line) {
        if (auto trigger = ScanTriggerLine(source, line, component, url, fragment)) {
            triggers.push_back(std::move(*trigger));
        }
        if (detect_.api_calls && !ScanCallLine(source, line, fragment)) {
            generic_.ScanHttpLine(source, line, fragment);
        }
        generic_.ScanLine(source, line, rest, fragment);
    }

    LinkTriggers(triggers, CollectCalls(fragment, source.path), fragment);
    return Result<WorkflowGraph, Error>::Ok(std::move(fragment));
}

std::optional<UiTrigger> ReactScanner::ScanTriggerLine(
    const SourceText& source, int line_number, const std::string& component,
    const std::optional<std::string>& url, WorkflowGraph& fragment) const {
    const auto& text = source.lines[static_cast<std::size_t>(line_number - 1)];
    std::smatch match;
    const auto* rule = FirstMatch(event_handlers_, text, &match);
    if (rule == nullptr) {
        return std::nullopt;
    }

    auto handler = Trim(match[1].str());
    handler = RemoveAll(RemoveAll(RemoveAll(std::move(handler), "()"), "("), ")");

    auto node = MakeNode(source, "ui_trigger", line_number, WorkflowType::DataTransform,
                         "UI: " + TriggerTitle(rule->value),
                         "User interaction in " + component);
    node.metadata["trigger_type"] = rule->value;
    node.metadata["component"] = component;
    node.metadata["handler"] = handler;
    node.metadata["is_ui_trigger"] = "true";
    node.metadata["framework"] = "React";
    if (url.has_value()) {
        node.metadata["url"] = *url;
    }

    UiTrigger trigger{node.id, line_number, rule->value, handler, url};
    fragment.AddNode(std::move(node));
    return trigger;
}

bool ReactScanner::ScanCallLine(const SourceText& source, int line_number,
                                WorkflowGraph& fragment) const {
    const auto& text = source.lines[static_cast<std::size_t>(line_number - 1)];
    std::smatch match;
    const auto* rule = FirstMatch(calls_, text, &match);
    if (rule == nullptr) {
        return false;
    }

    std::string endpoint;
    std::string method;
    if (rule->value == kFetch) {
        endpoint = match[1].str();
        if (match[2].matched) {
            method = ToUpper(match[2].str());
        } else {
            method = MethodFromContext(source.lines, line_number).value_or("GET");
        }
    } else {
        method = ToUpper(match[1].str());
        endpoint = match[2].str();
    }

    auto node = MakeNode(source, "http", line_number, WorkflowType::ApiCall,
                         "HTTP " + method, "Frontend API call to " + endpoint);
    node.endpoint = endpoint;
    node.method = method;
    node.metadata["library"] = rule->value;
    node.metadata["is_frontend_call"] = "true";
    fragment.AddNode(std::move(node));
    return true;
}

std::optional<std::string> ReactScanner::MethodFromContext(
    const std::vector<std::string>& lines, int line_number) const {
    const int count = static_cast<int>(lines.size());
    const auto context = JoinWithSpaces(lines, std::max(0, line_number - 3),
                                        std::min(count, line_number + 3));
    if (auto method = SearchGroup(method_option_, context)) {
        return ToUpper(*method);
    }
    return std::nullopt;
}

void ReactScanner::LinkTriggers(const std::vector<UiTrigger>& triggers,
                                const std::vector<OutboundCall>& calls,
                                WorkflowGraph& fragment) const {
    for (const auto& trigger : triggers) {
        for (const auto& call : calls) {
            if (std::abs(call.line_number - trigger.line_number) > window_) {
                continue;
            }
            WorkflowEdge edge{trigger.node_id, call.node_id, "User Action → API Call", {}};
            edge.metadata["workflow_type"] = "ui_to_api";
            edge.metadata["trigger_type"] = trigger.trigger_type;
            if (trigger.url.has_value()) {
                edge.metadata["url"] = *trigger.url;
            }
            fragment.AddEdge(std::move(edge));
        }
    }
}

} // namespace workflow_tracker
