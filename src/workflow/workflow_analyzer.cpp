#include <workflow_tracker/workflow/workflow_analyzer.hpp>

#include <workflow_tracker/core/log.hpp>
#include <workflow_tracker/scanner/scanner_support.hpp>

#include <algorithm>
#include <cctype>
#include <deque>
#include <filesystem>
#include <map>
#include <unordered_set>

namespace workflow_tracker {

namespace {

constexpr const char* kInteractionKeywords[] = {
    "onclick", "onsubmit", "button", "click", "submit", "handlesubmit",
    "handleclick", "onsave", "onload", "ondelete", "eventhandler", "handler",
    "command", "action",
};

std::string ToLower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

bool Contains(const std::string& haystack, std::string_view needle) {
    return haystack.find(needle) != std::string::npos;
}

std::string MetadataOr(const WorkflowNode& node, const std::string& key,
                       const std::string& fallback) {
    auto it = node.metadata.find(key);
    if (it == node.metadata.end() || it->second.empty()) {
        return fallback;
    }
    return it->second;
}

// Upper-cases the first letter of each space-separated word, leaving the
// rest alone so acronyms survive ("UI: Click").
std::string CapitalizeWords(const std::string& text) {
    std::string out = text;
    bool word_start = true;
    for (auto& ch : out) {
        if (ch == ' ') {
            word_start = true;
        } else if (word_start) {
            ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
            word_start = false;
        }
    }
    return out;
}

bool HasUpperAt(const std::string& text, std::size_t pos) {
    return pos < text.size() && std::isupper(static_cast<unsigned char>(text[pos]));
}

// Leading identifier of a handler expression: "this.save($event)" -> "save",
// "() => submitForm" -> "submitForm".
std::string HandlerIdentifier(std::string handler) {
    const auto arrow = handler.find("=>");
    if (arrow != std::string::npos) {
        handler = handler.substr(arrow + 2);
    }
    handler = Trim(handler);
    if (handler.rfind("this.", 0) == 0) {
        handler = handler.substr(5);
    }
    std::size_t end = 0;
    while (end < handler.size()) {
        const auto c = static_cast<unsigned char>(handler[end]);
        if (!(std::isalnum(c) || c == '_' || c == '$')) {
            break;
        }
        ++end;
    }
    return handler.substr(0, end);
}

std::string Or(const std::optional<std::string>& value, const char* fallback) {
    return value.has_value() && !value->empty() ? *value : std::string(fallback);
}

const char* IconFor(WorkflowType type) {
    static const std::map<WorkflowType, const char*> kIcons = {
        {WorkflowType::DatabaseRead, "\xF0\x9F\x93\x96"},    // open book
        {WorkflowType::DatabaseWrite, "\xF0\x9F\x92\xBE"},   // floppy disk
        {WorkflowType::ApiCall, "\xF0\x9F\x8C\x90"},         // globe
        {WorkflowType::FileRead, "\xF0\x9F\x93\x84"},        // page
        {WorkflowType::FileWrite, "\xF0\x9F\x93\x9D"},       // memo
        {WorkflowType::MessageSend, "\xF0\x9F\x93\xA4"},     // outbox
        {WorkflowType::MessageReceive, "\xF0\x9F\x93\xA5"},  // inbox
        {WorkflowType::DataTransform, "\xE2\x9A\x99\xEF\xB8\x8F"},  // gear
        {WorkflowType::CacheRead, "\xF0\x9F\x94\x8D"},       // magnifier
        {WorkflowType::CacheWrite, "\xF0\x9F\x92\xBF"},      // disc
    };
    auto it = kIcons.find(type);
    return it != kIcons.end() ? it->second : "\xE2\x80\xA2";
}

WorkflowStep MakeStep(const NodePtr& node, int step_number) {
    WorkflowStep step;
    step.step_number = step_number;
    step.icon = IconFor(node->type);
    step.node = node;

    switch (node->type) {
        case WorkflowType::DatabaseWrite: {
            const auto table = Or(node->table_name, "database");
            step.title = "Save data to " + table;
            step.description = "The system saves the information to the " + table + " table.";
            step.technical_details = "Database INSERT/UPDATE: " + Or(node->table_name, "unknown");
            break;
        }
        case WorkflowType::DatabaseRead: {
            const auto table = Or(node->table_name, "database");
            step.title = "Retrieve data from " + table;
            step.description =
                "The system looks up existing information from the " + table + " table.";
            step.technical_details = "Database SELECT: " + Or(node->table_name, "unknown");
            break;
        }
        case WorkflowType::ApiCall:
            step.title = "Call " + Or(node->method, "API") + " " + HumanizeEndpoint(node->endpoint);
            step.description = "The system communicates with an external service at " +
                               Or(node->endpoint, "an external endpoint") + ".";
            step.technical_details =
                "API " + Or(node->method, "HTTP") + ": " + Or(node->endpoint, "unknown");
            break;
        case WorkflowType::DataTransform:
            step.title = "Process and transform data";
            step.description = "The system transforms the data into the required format.";
            step.technical_details = "Data transformation: " + node->name;
            break;
        case WorkflowType::FileWrite:
            step.title = "Write to file";
            step.description = "The system saves information to a file.";
            step.technical_details = "File write: " + Or(node->file_path, "unknown");
            break;
        case WorkflowType::FileRead:
            step.title = "Read from file";
            step.description = "The system reads information from a file.";
            step.technical_details = "File read: " + Or(node->file_path, "unknown");
            break;
        default:
            step.title = HumanizeName(node->name);
            step.description = node->description.empty()
                                   ? "The system performs an operation."
                                   : node->description;
            step.technical_details = std::string(WorkflowTypeName(node->type)) + ": " + node->name;
            break;
    }
    return step;
}

std::string Summarize(const std::vector<WorkflowStep>& steps) {
    if (steps.empty()) {
        return "This workflow performs a simple operation.";
    }
    std::size_t reads = 0;
    std::size_t calls = 0;
    std::size_t writes = 0;
    for (const auto& step : steps) {
        switch (step.node->type) {
            case WorkflowType::DatabaseRead:  ++reads; break;
            case WorkflowType::ApiCall:       ++calls; break;
            case WorkflowType::DatabaseWrite: ++writes; break;
            default: break;
        }
    }
    std::vector<std::string> parts;
    if (reads > 0) {
        parts.push_back("retrieves data from " + std::to_string(reads) + " database table(s)");
    }
    if (calls > 0) {
        parts.push_back("calls " + std::to_string(calls) + " external service(s)");
    }
    if (writes > 0) {
        parts.push_back("saves data to " + std::to_string(writes) + " database table(s)");
    }
    if (parts.empty()) {
        return "This workflow performs " + std::to_string(steps.size()) + " operation(s).";
    }
    std::string summary = "This workflow ";
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            summary += ", then ";
        }
        summary += parts[i];
    }
    return summary + ".";
}

std::string Outcome(const std::vector<WorkflowStep>& steps) {
    if (steps.empty()) {
        return "The action completes.";
    }
    switch (steps.back().node->type) {
        case WorkflowType::DatabaseWrite:
            return "The data is saved and the user sees a success confirmation.";
        case WorkflowType::DatabaseRead:
            return "The data is retrieved and displayed to the user.";
        case WorkflowType::ApiCall:
            return "The external service responds and the result is shown to the user.";
        default:
            return "The action completes and the user sees the result.";
    }
}

} // namespace

std::string HumanizeName(const std::string& name) {
    std::string text = Trim(name);
    for (std::string_view prefix : {std::string_view("handle"), std::string_view("on")}) {
        if (text.compare(0, prefix.size(), prefix) == 0 && HasUpperAt(text, prefix.size())) {
            text.erase(0, prefix.size());
            break;
        }
    }

    std::string spaced;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const auto c = static_cast<unsigned char>(text[i]);
        if (c == '_' || c == '-') {
            spaced += ' ';
            continue;
        }
        if (i > 0 && std::isupper(c)) {
            const auto prev = static_cast<unsigned char>(text[i - 1]);
            if (std::islower(prev) || std::isdigit(prev)) {
                spaced += ' ';
            }
        }
        spaced += static_cast<char>(c);
    }

    // Collapse runs of spaces.
    std::string collapsed;
    for (char ch : spaced) {
        if (ch == ' ' && (collapsed.empty() || collapsed.back() == ' ')) {
            continue;
        }
        collapsed += ch;
    }
    return CapitalizeWords(Trim(collapsed));
}

std::string HumanizeEndpoint(const std::optional<std::string>& endpoint) {
    if (!endpoint.has_value() || endpoint->empty()) {
        return "service";
    }
    std::vector<std::string> meaningful;
    std::size_t start = 0;
    while (start <= endpoint->size()) {
        auto end = endpoint->find('/', start);
        if (end == std::string::npos) {
            end = endpoint->size();
        }
        auto part = endpoint->substr(start, end - start);
        if (!part.empty() && part.front() != '{') {
            meaningful.push_back(std::move(part));
        }
        start = end + 1;
    }
    if (meaningful.empty()) {
        return "service";
    }
    const std::size_t first = meaningful.size() > 2 ? meaningful.size() - 2 : 0;
    std::string joined;
    for (std::size_t i = first; i < meaningful.size(); ++i) {
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += meaningful[i];
    }
    std::replace(joined.begin(), joined.end(), '-', ' ');
    return TitleCase(joined);
}

bool IsUiInteraction(const WorkflowNode& node) {
    if (MetadataOr(node, "is_ui_trigger", "") == "true") {
        return true;
    }
    const auto lower = ToLower(node.name);
    return std::any_of(std::begin(kInteractionKeywords), std::end(kInteractionKeywords),
                       [&](const char* keyword) { return Contains(lower, keyword); });
}

UIInteraction MakeInteraction(const NodePtr& node) {
    UIInteraction interaction;
    interaction.id = node->id;
    interaction.node = node;
    interaction.location = node->location.file_path;

    const auto handler = HandlerIdentifier(MetadataOr(*node, "handler", ""));
    interaction.name = HumanizeName(handler.empty() ? node->name : handler);

    const auto stem = std::filesystem::path(node->location.file_path).stem().string();
    interaction.component =
        MetadataOr(*node, "component", MetadataOr(*node, "window", stem));

    const auto lower = ToLower(node->name + " " + handler + " " +
                               MetadataOr(*node, "trigger_type", ""));
    if (Contains(lower, "submit")) {
        interaction.interaction_type = "form_submit";
        interaction.description = "User submits " + interaction.name;
    } else if (Contains(lower, "save") || Contains(lower, "delete")) {
        interaction.interaction_type = "button_click";
        interaction.description = "User clicks " + interaction.name;
    } else if (Contains(lower, "load")) {
        interaction.interaction_type = "page_load";
        interaction.description = "User navigates to " + interaction.name;
    } else {
        interaction.interaction_type = "button_click";
        interaction.description = "User interacts with " + interaction.name;
    }
    return interaction;
}

std::vector<NodePtr> ReachableNodes(const WorkflowGraph& graph, const NodePtr& start) {
    std::vector<NodePtr> reachable;
    std::unordered_set<std::string> visited;
    std::deque<NodePtr> queue{start};

    while (!queue.empty()) {
        auto current = queue.front();
        queue.pop_front();
        if (!visited.insert(current->id).second) {
            continue;
        }
        reachable.push_back(current);
        for (const auto& edge : graph.GetOutgoingEdges(current->id)) {
            if (visited.count(edge.target) != 0) {
                continue;
            }
            if (auto target = graph.GetNode(edge.target)) {
                queue.push_back(std::move(target));
            }
        }
    }
    return reachable;
}

UIWorkflow BuildWorkflow(const WorkflowGraph& graph, const UIInteraction& trigger) {
    UIWorkflow workflow;
    workflow.id = "workflow_" + trigger.id;
    workflow.name = trigger.name;
    workflow.trigger = trigger;

    if (trigger.node) {
        auto nodes = ReachableNodes(graph, trigger.node);
        std::stable_sort(nodes.begin(), nodes.end(), [](const NodePtr& a, const NodePtr& b) {
            if (a->location.file_path != b->location.file_path) {
                return a->location.file_path < b->location.file_path;
            }
            return a->location.line_number < b->location.line_number;
        });
        int step_number = 1;
        for (const auto& node : nodes) {
            workflow.steps.push_back(MakeStep(node, step_number++));
        }
    }

    workflow.summary = Summarize(workflow.steps);
    workflow.outcome = Outcome(workflow.steps);
    return workflow;
}

std::vector<UIWorkflow> AnalyzeWorkflows(const WorkflowGraph& graph) {
    std::vector<UIWorkflow> workflows;
    std::size_t interactions = 0;
    for (const auto& node : graph.Nodes()) {
        if (!IsUiInteraction(*node)) {
            continue;
        }
        ++interactions;
        auto workflow = BuildWorkflow(graph, MakeInteraction(node));
        if (!workflow.IsTrivial()) {
            workflows.push_back(std::move(workflow));
        }
    }
    LogInfo("workflow", "Found " + std::to_string(interactions) + " UI interactions, built " +
                            std::to_string(workflows.size()) + " workflows");
    return workflows;
}

std::string UIWorkflow::Story() const {
    std::vector<std::string> parts = {
        "# " + name + "\n",
        "\n**What happens:** " + summary + "\n",
        "\n**User action:** " + trigger.description + "\n",
        "\n## Workflow Steps:\n",
    };
    for (const auto& step : steps) {
        parts.push_back("\n" + step.icon + " **Step " + std::to_string(step.step_number) +
                        ": " + step.title + "**");
        parts.push_back("\n" + step.description);
        parts.push_back("\n_Technical: " + step.technical_details + "_\n");
    }
    parts.push_back("\n**Result:** " + outcome + "\n");

    std::string story;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            story += '\n';
        }
        story += parts[i];
    }
    return story;
}

} // namespace workflow_tracker
