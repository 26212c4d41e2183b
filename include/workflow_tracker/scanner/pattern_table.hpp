#pragma once

#include <initializer_list>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace workflow_tracker {

// ---------------------------------------------------------------------------
// PatternRule: one detection pattern. `label` is the source pattern text
// (reported in node metadata); `value` is the rule payload, e.g. the HTTP
// method or trigger type the rule implies.
// ---------------------------------------------------------------------------
struct PatternRule {
    std::regex regex;
    std::string label;
    std::string value;
};

struct PatternSpec {
    const char* pattern;
    const char* value;
};

using PatternTable = std::vector<PatternRule>;

/// Compile a table once at scanner construction. Tables are read-only
/// afterwards and safe to share between threads.
[[nodiscard]] PatternTable BuildTable(std::initializer_list<PatternSpec> entries,
                                      bool icase = false);
[[nodiscard]] PatternTable BuildTable(std::initializer_list<const char*> patterns,
                                      bool icase = false);

/// First rule whose regex occurs in `line`, or nullptr. Fills `match` on hit.
const PatternRule* FirstMatch(const PatternTable& table, const std::string& line,
                              std::smatch* match = nullptr);

/// True if `pattern` occurs anywhere in `text`.
[[nodiscard]] bool Contains(const std::regex& pattern, const std::string& text);

/// Text of the first participating capture group, if any.
[[nodiscard]] std::optional<std::string> FirstGroup(const std::smatch& match);

/// Capture group `index` if it participated in the match.
[[nodiscard]] std::optional<std::string> Group(const std::smatch& match, std::size_t index);

/// First participating group of the first occurrence of `pattern` in `text`.
[[nodiscard]] std::optional<std::string> SearchGroup(const std::regex& pattern,
                                                     const std::string& text);

} // namespace workflow_tracker
