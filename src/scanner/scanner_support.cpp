#include <workflow_tracker/scanner/scanner_support.hpp>

#include <workflow_tracker/core/log.hpp>

#include <algorithm>
#include <cctype>

namespace workflow_tracker {

Result<SourceText, Error> LoadSource(const std::string& path, std::size_t max_line_length) {
    auto source = ReadSourceFile(path);
    if (source.IsErr()) {
        return source;
    }
    auto text = std::move(source).Value();
    TruncateLines(text.lines, max_line_length);
    return Result<SourceText, Error>::Ok(std::move(text));
}

std::optional<SourceText> LoadCounterpart(const std::string& path,
                                          std::size_t max_line_length) {
    if (!FileExists(path)) {
        return std::nullopt;
    }
    auto source = LoadSource(path, max_line_length);
    if (source.IsErr()) {
        LogDebug("scanner", "skipping counterpart: " + source.Error().ToString());
        return std::nullopt;
    }
    return std::move(source).Value();
}

std::size_t TruncateLines(std::vector<std::string>& lines, std::size_t max_line_length) {
    std::size_t truncated = 0;
    for (auto& line : lines) {
        if (line.size() > max_line_length) {
            line.resize(max_line_length);
            ++truncated;
        }
    }
    return truncated;
}

WorkflowNode MakeNode(const SourceText& source, std::string_view category,
                      int line_number, WorkflowType type,
                      std::string name, std::string description) {
    WorkflowNode node;
    node.id = WorkflowNode::MakeId(source.path, category, line_number);
    node.type = type;
    node.name = std::move(name);
    node.description = std::move(description);
    node.location.file_path = source.path;
    node.location.line_number = line_number;
    node.code_snippet = ExtractSnippet(source.lines, line_number);
    return node;
}

std::string TitleCase(std::string_view text) {
    std::string out(text);
    bool word_start = true;
    for (auto& ch : out) {
        const auto c = static_cast<unsigned char>(ch);
        if (std::isalpha(c)) {
            ch = static_cast<char>(word_start ? std::toupper(c) : std::tolower(c));
            word_start = false;
        } else {
            word_start = true;
        }
    }
    return out;
}

std::string TriggerTitle(std::string_view trigger_type) {
    constexpr std::string_view kPrefix = "ui_";
    if (trigger_type.substr(0, kPrefix.size()) == kPrefix) {
        trigger_type.remove_prefix(kPrefix.size());
    }
    return TitleCase(trigger_type);
}

std::string ToUpper(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return out;
}

std::string RemoveAll(std::string text, std::string_view what) {
    if (what.empty()) {
        return text;
    }
    for (auto pos = text.find(what); pos != std::string::npos; pos = text.find(what, pos)) {
        text.erase(pos, what.size());
    }
    return text;
}

std::string Trim(std::string_view text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return std::string(text.substr(first, last - first + 1));
}

std::vector<OutboundCall> CollectCalls(const WorkflowGraph& fragment,
                                       const std::string& file_path) {
    std::vector<OutboundCall> calls;
    for (const auto& node : fragment.Nodes()) {
        if (node->type == WorkflowType::ApiCall &&
            node->location.file_path == file_path) {
            calls.push_back(OutboundCall{node->id, node->location.line_number});
        }
    }
    std::stable_sort(calls.begin(), calls.end(),
                     [](const OutboundCall& a, const OutboundCall& b) {
                         return a.line_number < b.line_number;
                     });
    return calls;
}

} // namespace workflow_tracker
