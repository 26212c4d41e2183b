#include <workflow_tracker/scanner/pattern_table.hpp>

namespace workflow_tracker {

namespace {

std::regex::flag_type Flags(bool icase) {
    auto flags = std::regex::ECMAScript | std::regex::optimize;
    if (icase) {
        flags |= std::regex::icase;
    }
    return flags;
}

} // namespace

PatternTable BuildTable(std::initializer_list<PatternSpec> entries, bool icase) {
    PatternTable table;
    table.reserve(entries.size());
    for (const auto& entry : entries) {
        table.push_back(PatternRule{std::regex(entry.pattern, Flags(icase)),
                                    entry.pattern,
                                    entry.value});
    }
    return table;
}

PatternTable BuildTable(std::initializer_list<const char*> patterns, bool icase) {
    PatternTable table;
    table.reserve(patterns.size());
    for (const char* pattern : patterns) {
        table.push_back(PatternRule{std::regex(pattern, Flags(icase)), pattern, ""});
    }
    return table;
}

const PatternRule* FirstMatch(const PatternTable& table, const std::string& line,
                              std::smatch* match) {
    for (const auto& rule : table) {
        if (match != nullptr) {
            if (std::regex_search(line, *match, rule.regex)) {
                return &rule;
            }
        } else if (std::regex_search(line, rule.regex)) {
            return &rule;
        }
    }
    return nullptr;
}

bool Contains(const std::regex& pattern, const std::string& text) {
    return std::regex_search(text, pattern);
}

std::optional<std::string> FirstGroup(const std::smatch& match) {
    for (std::size_t i = 1; i < match.size(); ++i) {
        if (match[i].matched) {
            return match[i].str();
        }
    }
    return std::nullopt;
}

std::optional<std::string> Group(const std::smatch& match, std::size_t index) {
    if (index < match.size() && match[index].matched) {
        return match[index].str();
    }
    return std::nullopt;
}

std::optional<std::string> SearchGroup(const std::regex& pattern, const std::string& text) {
    std::smatch match;
    if (std::regex_search(text, match, pattern)) {
        return FirstGroup(match);
    }
    return std::nullopt;
}

} // namespace workflow_tracker
