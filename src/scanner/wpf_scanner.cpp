#include <workflow_tracker/scanner/wpf_scanner.hpp>

#include <workflow_tracker/core/log.hpp>
#include <workflow_tracker/scanner/xaml_document.hpp>

#include <cstdlib>
#include <set>

namespace workflow_tracker {

namespace {

constexpr const char* kCommand = "ui_command";

// Rules without a value only instantiate a client and are not calls.
constexpr const char* kInstantiation = "";

} // namespace

WpfScanner::WpfScanner(const ScanConfig& config)
    : csharp_(config),
      detect_(config.detect),
      window_(config.ui_linking.paired_file_window),
      max_line_length_(static_cast<std::size_t>(config.max_line_length)),
      event_attributes_{
          {"Click", "ui_click"},
          {"MouseDown", "ui_click"},
          {"MouseUp", "ui_click"},
          {"PreviewMouseDown", "ui_click"},
          {"SelectionChanged", "ui_change"},
          {"TextChanged", "ui_change"},
          {"KeyDown", "ui_keypress"},
          {"KeyUp", "ui_keypress"},
          {"Loaded", "page_load"},
      },
      event_lines_(BuildTable({
          {R"lit(\bClick\s*=\s*"([^"]+)")lit", "ui_click"},
          {R"lit(\bMouseDown\s*=\s*"([^"]+)")lit", "ui_click"},
          {R"lit(\bMouseUp\s*=\s*"([^"]+)")lit", "ui_click"},
          {R"lit(\bSelectionChanged\s*=\s*"([^"]+)")lit", "ui_change"},
          {R"lit(\bTextChanged\s*=\s*"([^"]+)")lit", "ui_change"},
          {R"lit(\bKeyDown\s*=\s*"([^"]+)")lit", "ui_keypress"},
          {R"lit(\bKeyUp\s*=\s*"([^"]+)")lit", "ui_keypress"},
          {R"lit(\bLoaded\s*=\s*"([^"]+)")lit", "page_load"},
          {R"lit(\bPreviewMouseDown\s*=\s*"([^"]+)")lit", "ui_click"},
          {R"lit(\bCommand\s*=\s*"(\{Binding[^"]+)")lit", kCommand},
      })),
      handler_methods_(BuildTable({
          R"(private\s+(?:async\s+)?void\s+(\w+)\s*\(\s*object\s+sender\s*,\s*(?:Routed)?EventArgs\s+\w+\s*\))",
          R"(private\s+(?:async\s+)?void\s+(\w+)\s*\(\s*object\s+sender\s*,\s*\w+EventArgs\s+\w+\s*\))",
      })),
      http_(BuildTable({
          {R"(HttpClient\s*\(\s*\))", kInstantiation},
          {R"(\.GetAsync\s*\(\s*['"]([^'"]+)['"])", "GET"},
          {R"(\.PostAsync\s*\(\s*['"]([^'"]+)['"])", "POST"},
          {R"(\.PutAsync\s*\(\s*['"]([^'"]+)['"])", "PUT"},
          {R"(\.DeleteAsync\s*\(\s*['"]([^'"]+)['"])", "DELETE"},
          {R"(WebClient\s*\(\s*\))", kInstantiation},
          {R"(\.DownloadString\s*\(\s*['"]([^'"]+)['"])", "GET"},
          {R"(\.UploadString\s*\(\s*['"]([^'"]+)['"])", "POST"},
      })),
      window_patterns_{
          std::regex(R"lit(<Window\s+x:Class\s*=\s*"([^"]+)")lit"),
          std::regex(R"lit(<Page\s+x:Class\s*=\s*"([^"]+)")lit"),
          std::regex(R"lit(<UserControl\s+x:Class\s*=\s*"([^"]+)")lit"),
      },
      command_binding_(R"(\{Binding\s+(?:Path\s*=\s*)?(\w+))"),
      command_property_(
          R"((?:public|private|protected|internal)\s+\w*Command\w*(?:<[^>]*>)?\s+(\w+)\s*(?:\{|=))") {}

bool WpfScanner::CanScan(const std::string& file_path) const {
    return EndsWith(file_path, ".xaml") || EndsWith(file_path, ".xaml.cs");
}

std::string WpfScanner::DetectWindowName(const SourceText& markup) const {
    std::optional<std::string> name;
    auto parsed = ParseXaml(markup.text, markup.path);
    if (parsed.IsOk()) {
        name = parsed.Value().class_name;
    }
    if (!name.has_value()) {
        for (const auto& pattern : window_patterns_) {
            name = SearchGroup(pattern, markup.text);
            if (name.has_value()) {
                break;
            }
        }
    }
    if (name.has_value()) {
        const auto dot = name->rfind('.');
        return dot == std::string::npos ? *name : name->substr(dot + 1);
    }
    return ReplaceSuffix(FileStem(markup.path), ".xaml", "");
}

Result<WorkflowGraph, Error> WpfScanner::ScanFile(
    const std::string& file_path, const SchemaRegistry* schemas) const {
    auto loaded = LoadSource(file_path, max_line_length_);
    if (loaded.IsErr()) {
        return Result<WorkflowGraph, Error>::Err(std::move(loaded).Error());
    }

    std::optional<SourceText> markup;
    std::optional<SourceText> code;
    if (EndsWith(file_path, ".xaml.cs")) {
        code = std::move(loaded).Value();
        markup = LoadCounterpart(ReplaceSuffix(file_path, ".xaml.cs", ".xaml"), max_line_length_);
    } else {
        markup = std::move(loaded).Value();
        code = LoadCounterpart(file_path + ".cs", max_line_length_);
    }

    WorkflowGraph fragment;
    ScanUnit(markup ? &*markup : nullptr, code ? &*code : nullptr, schemas, fragment);
    return Result<WorkflowGraph, Error>::Ok(std::move(fragment));
}

void WpfScanner::ScanUnit(const SourceText* markup, const SourceText* code,
                          const SchemaRegistry* schemas, WorkflowGraph& fragment) const {
    std::vector<UiTrigger> triggers;
    if (markup != nullptr) {
        triggers = ScanMarkup(*markup, fragment);
    }
    if (code == nullptr) {
        return;
    }
    ScanCode(*code, schemas, fragment);

    const auto handlers = FindHandlers(*code);
    const auto calls = CollectCalls(fragment, code->path);
    for (const auto& trigger : triggers) {
        const auto handler = handlers.find(trigger.handler);
        const bool found = handler != handlers.end();
        for (const auto& call : calls) {
            if (found && std::abs(call.line_number - handler->second) > window_) {
                continue;
            }
            WorkflowEdge edge{trigger.node_id, call.node_id,
                              found ? "WPF Event → HTTP Call"
                                    : "WPF Event → HTTP Call (proximity)",
                              {}};
            edge.metadata["workflow_type"] = found ? "wpf_ui_to_api" : "wpf_ui_to_api_proximity";
            edge.metadata["trigger_type"] = trigger.trigger_type;
            edge.metadata["handler"] = trigger.handler;
            edge.metadata["framework"] = "WPF";
            fragment.AddEdge(std::move(edge));
        }
    }
}

std::optional<std::string> WpfScanner::TriggerTypeFor(const std::string& attribute) const {
    if (attribute == "Command") {
        return std::string(kCommand);
    }
    auto it = event_attributes_.find(attribute);
    if (it == event_attributes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> WpfScanner::CommandName(const std::string& binding) const {
    return SearchGroup(command_binding_, binding);
}

std::vector<UiTrigger> WpfScanner::ScanMarkup(const SourceText& markup,
                                              WorkflowGraph& fragment) const {
    const auto window = DetectWindowName(markup);

    auto parsed = ParseXaml(markup.text, markup.path);
    if (parsed.IsErr()) {
        LogDebug("scanner", parsed.Error().ToString() + "; using line patterns");
        return ScanMarkupLines(markup, window, fragment);
    }

    std::vector<UiTrigger> triggers;
    std::set<int> seen_lines;
    for (const auto& attr : parsed.Value().attributes) {
        auto trigger_type = TriggerTypeFor(attr.name);
        if (!trigger_type.has_value() || seen_lines.count(attr.line_number) > 0) {
            continue;
        }
        std::string handler = Trim(attr.value);
        if (*trigger_type == kCommand) {
            auto command = CommandName(attr.value);
            if (!command.has_value()) {
                continue;
            }
            handler = *command;
        }
        if (auto trigger = AddTrigger(markup, attr.line_number, *trigger_type, handler,
                                      window, fragment)) {
            seen_lines.insert(attr.line_number);
            triggers.push_back(std::move(*trigger));
        }
    }
    return triggers;
}

std::vector<UiTrigger> WpfScanner::ScanMarkupLines(const SourceText& markup,
                                                   const std::string& window,
                                                   WorkflowGraph& fragment) const {
    std::vector<UiTrigger> triggers;
    const int count = static_cast<int>(markup.lines.size());
    for (int line = 1; line <= count; ++line) {
        std::smatch match;
        const auto* rule =
            FirstMatch(event_lines_, markup.lines[static_cast<std::size_t>(line - 1)], &match);
        if (rule == nullptr) {
            continue;
        }
        auto handler = Trim(match[1].str());
        if (rule->value == kCommand) {
            auto command = CommandName(handler);
            if (!command.has_value()) {
                continue;
            }
            handler = *command;
        }
        if (auto trigger = AddTrigger(markup, line, rule->value, handler, window, fragment)) {
            triggers.push_back(std::move(*trigger));
        }
    }
    return triggers;
}

std::optional<UiTrigger> WpfScanner::AddTrigger(const SourceText& markup, int line_number,
                                                const std::string& trigger_type,
                                                const std::string& handler,
                                                const std::string& window,
                                                WorkflowGraph& fragment) const {
    if (line_number < 1 || line_number > static_cast<int>(markup.lines.size())) {
        return std::nullopt;
    }
    auto node = MakeNode(markup, "ui_trigger", line_number, WorkflowType::DataTransform,
                         "WPF: " + TriggerTitle(trigger_type),
                         "WPF event binding in " + window);
    node.metadata["trigger_type"] = trigger_type;
    node.metadata["window"] = window;
    node.metadata["handler"] = handler;
    node.metadata["is_ui_trigger"] = "true";
    node.metadata["framework"] = "WPF";

    UiTrigger trigger{node.id, line_number, trigger_type, handler, std::nullopt};
    fragment.AddNode(std::move(node));
    return trigger;
}

std::map<std::string, int> WpfScanner::FindHandlers(const SourceText& code) const {
    std::map<std::string, int> handlers;
    const int count = static_cast<int>(code.lines.size());
    for (int line = 1; line <= count; ++line) {
        const auto& text = code.lines[static_cast<std::size_t>(line - 1)];
        std::smatch match;
        if (FirstMatch(handler_methods_, text, &match) != nullptr) {
            handlers.emplace(match[1].str(), line);
        } else if (auto command = SearchGroup(command_property_, text)) {
            handlers.emplace(*command, line);
        }
    }
    return handlers;
}

void WpfScanner::ScanCode(const SourceText& code, const SchemaRegistry* schemas,
                          WorkflowGraph& fragment) const {
    DetectionToggles rest = detect_;
    rest.api_calls = false;

    const int count = static_cast<int>(code.lines.size());
    for (int line = 1; line <= count; ++line) {
        if (detect_.api_calls) {
            ScanHttpLine(code, line, fragment);
        }
        csharp_.ScanLine(code, line, schemas, rest, fragment);
    }
}

bool WpfScanner::ScanHttpLine(const SourceText& code, int line_number,
                              WorkflowGraph& fragment) const {
    const auto& text = code.lines[static_cast<std::size_t>(line_number - 1)];
    for (const auto& rule : http_) {
        std::smatch match;
        if (rule.value == kInstantiation || !std::regex_search(text, match, rule.regex)) {
            continue;
        }
        const auto endpoint = Group(match, 1).value_or("unknown");
        auto node = MakeNode(code, "http", line_number, WorkflowType::ApiCall,
                             "WPF HTTP " + rule.value, "WPF HTTP call to " + endpoint);
        node.endpoint = endpoint;
        node.method = rule.value;
        node.metadata["library"] = "HttpClient/WebClient";
        node.metadata["is_frontend_call"] = "true";
        node.metadata["framework"] = "WPF";
        fragment.AddNode(std::move(node));
        return true;
    }
    return false;
}

} // namespace workflow_tracker
