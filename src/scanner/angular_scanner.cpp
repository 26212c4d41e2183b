#include <workflow_tracker/scanner/angular_scanner.hpp>

#include <filesystem>
#include <cstdlib>

namespace workflow_tracker {

namespace fs = std::filesystem;

namespace {

std::string EscapeRegex(const std::string& text) {
    static const std::string kSpecial = R"(\^$.|?*+()[]{})";
    std::string out;
    for (char ch : text) {
        if (kSpecial.find(ch) != std::string::npos) {
            out += '\\';
        }
        out += ch;
    }
    return out;
}

} // namespace

AngularScanner::AngularScanner(const ScanConfig& config)
    : generic_(config),
      detect_(config.detect),
      window_(config.ui_linking.paired_file_window),
      max_line_length_(static_cast<std::size_t>(config.max_line_length)),
      event_bindings_(BuildTable({
          {R"lit(\(click\)\s*=\s*"([^"]+)")lit", "ui_click"},
          {R"lit(\(submit\)\s*=\s*"([^"]+)")lit", "ui_submit"},
          {R"lit(\(ngSubmit\)\s*=\s*"([^"]+)")lit", "ui_submit"},
          {R"lit(\(change\)\s*=\s*"([^"]+)")lit", "ui_change"},
          {R"lit(\(input\)\s*=\s*"([^"]+)")lit", "ui_change"},
          {R"lit(\(mousedown\)\s*=\s*"([^"]+)")lit", "ui_click"},
          {R"lit(\(keyup\)\s*=\s*"([^"]+)")lit", "ui_keypress"},
      })),
      http_client_(BuildTable({
          {R"(this\.http\.get\s*<[^>]+>\s*\(\s*['"`]([^'"` ]+)['"`])", "GET"},
          {R"(this\.http\.post\s*<[^>]+>\s*\(\s*['"`]([^'"` ]+)['"`])", "POST"},
          {R"(this\.http\.put\s*<[^>]+>\s*\(\s*['"`]([^'"` ]+)['"`])", "PUT"},
          {R"(this\.http\.delete\s*<[^>]+>\s*\(\s*['"`]([^'"` ]+)['"`])", "DELETE"},
          {R"(this\.http\.patch\s*<[^>]+>\s*\(\s*['"`]([^'"` ]+)['"`])", "PATCH"},
          {R"(this\.http\.get\s*\(\s*['"`]([^'"` ]+)['"`])", "GET"},
          {R"(this\.http\.post\s*\(\s*['"`]([^'"` ]+)['"`])", "POST"},
          {R"(this\.http\.put\s*\(\s*['"`]([^'"` ]+)['"`])", "PUT"},
          {R"(this\.http\.delete\s*\(\s*['"`]([^'"` ]+)['"`])", "DELETE"},
          {R"(this\.http\.patch\s*\(\s*['"`]([^'"` ]+)['"`])", "PATCH"},
      })),
      route_patterns_{
          std::regex(R"(path\s*:\s*['"]([^'"]+)['"])"),
          std::regex(R"(this\.router\.navigate\s*\(\s*\[['"]([^'"]+)['"])"),
      },
      template_url_(R"(templateUrl\s*:\s*['"]([^'"]+)['"])"),
      handler_identifier_(R"(^\s*(?:this\.)?([A-Za-z_$][\w$]*))") {}

bool AngularScanner::CanScan(const std::string& file_path) const {
    return EndsWith(file_path, ".component.ts") || EndsWith(file_path, ".service.ts") ||
           EndsWith(file_path, ".module.ts") || EndsWith(file_path, ".html");
}

std::string AngularScanner::ComponentNameFromPath(const std::string& path) {
    auto stem = FileStem(path);
    constexpr std::string_view kSuffix = ".component";
    if (EndsWith(stem, kSuffix)) {
        stem.resize(stem.size() - kSuffix.size());
    }
    for (auto& ch : stem) {
        if (ch == '-') {
            ch = ' ';
        }
    }
    return TitleCase(stem);
}

std::optional<std::string> AngularScanner::TemplatePathFor(const SourceText& code) const {
    if (code.text.find("@Component") == std::string::npos) {
        return std::nullopt;
    }
    if (auto url = SearchGroup(template_url_, code.text)) {
        return (fs::path(code.path).parent_path() / *url).lexically_normal().string();
    }
    if (EndsWith(code.path, ".component.ts")) {
        return ReplaceSuffix(code.path, ".component.ts", ".component.html");
    }
    return ReplaceSuffix(code.path, ".ts", ".html");
}

Result<WorkflowGraph, Error> AngularScanner::ScanFile(
    const std::string& file_path, const SchemaRegistry* /*schemas*/) const {
    auto loaded = LoadSource(file_path, max_line_length_);
    if (loaded.IsErr()) {
        return Result<WorkflowGraph, Error>::Err(std::move(loaded).Error());
    }

    std::optional<SourceText> markup;
    std::optional<SourceText> code;
    if (EndsWith(file_path, ".html")) {
        markup = std::move(loaded).Value();
        code = LoadCounterpart(ReplaceSuffix(file_path, ".html", ".ts"), max_line_length_);
        // The component must claim this template, otherwise it is not our pair.
        if (code.has_value()) {
            const auto owned = TemplatePathFor(*code);
            if (!owned.has_value() ||
                fs::path(*owned).lexically_normal() != fs::path(file_path).lexically_normal()) {
                code.reset();
            }
        }
    } else {
        code = std::move(loaded).Value();
        if (auto template_path = TemplatePathFor(*code)) {
            markup = LoadCounterpart(*template_path, max_line_length_);
        }
    }

    WorkflowGraph fragment;
    ScanUnit(markup ? &*markup : nullptr, code ? &*code : nullptr, fragment);
    return Result<WorkflowGraph, Error>::Ok(std::move(fragment));
}

void AngularScanner::ScanUnit(const SourceText* markup, const SourceText* code,
                              WorkflowGraph& fragment) const {
    std::vector<UiTrigger> triggers;
    if (markup != nullptr) {
        triggers = ScanTemplate(*markup, fragment);
    }
    if (code == nullptr) {
        return;
    }
    ScanCode(*code, fragment);

    const auto calls = CollectCalls(fragment, code->path);
    const auto url = DetectRoute(*code);
    for (const auto& trigger : triggers) {
        const auto definition = FindHandlerDefinition(*code, trigger.handler);
        for (const auto& call : calls) {
            bool linked = false;
            if (definition.has_value()) {
                linked = call.line_number >= *definition &&
                         call.line_number - *definition <= window_;
            } else {
                linked = std::abs(call.line_number - trigger.line_number) <= window_;
            }
            if (!linked) {
                continue;
            }
            WorkflowEdge edge{trigger.node_id, call.node_id, "Angular Event → HTTP Call", {}};
            edge.metadata["workflow_type"] = "angular_ui_to_api";
            edge.metadata["trigger_type"] = trigger.trigger_type;
            edge.metadata["handler"] = trigger.handler;
            edge.metadata["framework"] = "Angular";
            if (url.has_value()) {
                edge.metadata["url"] = *url;
            }
            fragment.AddEdge(std::move(edge));
        }
    }
}

std::vector<UiTrigger> AngularScanner::ScanTemplate(const SourceText& markup,
                                                    WorkflowGraph& fragment) const {
    std::vector<UiTrigger> triggers;
    const auto component = ComponentNameFromPath(markup.path);
    const int count = static_cast<int>(markup.lines.size());
    for (int line = 1; line <= count; ++line) {
        std::smatch match;
        const auto* rule =
            FirstMatch(event_bindings_, markup.lines[static_cast<std::size_t>(line - 1)], &match);
        if (rule == nullptr) {
            continue;
        }
        auto handler = Trim(RemoveAll(RemoveAll(match[1].str(), "($event)"), "()"));

        auto node = MakeNode(markup, "ui_trigger", line, WorkflowType::DataTransform,
                             "Angular: " + TriggerTitle(rule->value),
                             "Angular event binding in " + component);
        node.metadata["trigger_type"] = rule->value;
        node.metadata["component"] = component;
        node.metadata["handler"] = handler;
        node.metadata["is_ui_trigger"] = "true";
        node.metadata["framework"] = "Angular";

        triggers.push_back(UiTrigger{node.id, line, rule->value, handler, std::nullopt});
        fragment.AddNode(std::move(node));
    }
    return triggers;
}

void AngularScanner::ScanCode(const SourceText& code, WorkflowGraph& fragment) const {
    DetectionToggles rest = detect_;
    rest.api_calls = false;

    const int count = static_cast<int>(code.lines.size());
    for (int line = 1; line <= count; ++line) {
        if (detect_.api_calls && !ScanHttpClientLine(code, line, fragment)) {
            generic_.ScanHttpLine(code, line, fragment);
        }
        generic_.ScanLine(code, line, rest, fragment);
    }
}

bool AngularScanner::ScanHttpClientLine(const SourceText& code, int line_number,
                                        WorkflowGraph& fragment) const {
    std::smatch match;
    const auto* rule =
        FirstMatch(http_client_, code.lines[static_cast<std::size_t>(line_number - 1)], &match);
    if (rule == nullptr) {
        return false;
    }
    const auto endpoint = match[1].str();
    auto node = MakeNode(code, "http", line_number, WorkflowType::ApiCall,
                         "Angular HTTP " + rule->value,
                         "Angular HttpClient call to " + endpoint);
    node.endpoint = endpoint;
    node.method = rule->value;
    node.metadata["library"] = "HttpClient";
    node.metadata["is_frontend_call"] = "true";
    node.metadata["framework"] = "Angular";
    fragment.AddNode(std::move(node));
    return true;
}

std::optional<int> AngularScanner::FindHandlerDefinition(const SourceText& code,
                                                         const std::string& handler) const {
    auto name = SearchGroup(handler_identifier_, handler);
    if (!name.has_value()) {
        return std::nullopt;
    }
    // A method header: optional modifiers, the name, an opening parenthesis,
    // and no statement terminator.
    const std::regex definition(
        R"(^\s*(?:(?:public|private|protected|static|async|override)\s+)*)" +
        EscapeRegex(*name) + R"(\s*\([^;]*$)");
    const int count = static_cast<int>(code.lines.size());
    for (int line = 1; line <= count; ++line) {
        if (std::regex_search(code.lines[static_cast<std::size_t>(line - 1)], definition)) {
            return line;
        }
    }
    return std::nullopt;
}

std::optional<std::string> AngularScanner::DetectRoute(const SourceText& code) const {
    for (const auto& pattern : route_patterns_) {
        if (auto route = SearchGroup(pattern, code.text)) {
            return route;
        }
    }
    return std::nullopt;
}

} // namespace workflow_tracker
