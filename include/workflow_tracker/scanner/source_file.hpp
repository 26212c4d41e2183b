#pragma once

#include <workflow_tracker/core/result.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace workflow_tracker {

enum class SourceEncoding {
    Utf8,
    Latin1,  // fallback: bytes re-decoded as ISO-8859-1
};

struct SourceText {
    std::string path;
    std::string text;  // always UTF-8
    SourceEncoding encoding = SourceEncoding::Utf8;
    std::vector<std::string> lines;
};

/// Read a file as UTF-8, retrying once as Latin-1 when the bytes are not
/// valid UTF-8. Files with NUL bytes are rejected as binary.
[[nodiscard]] Result<SourceText, Error> ReadSourceFile(const std::string& path);

/// Decode a byte buffer the same way ReadSourceFile does (used by tests).
[[nodiscard]] Result<SourceText, Error> DecodeSource(const std::string& path,
                                                     std::string bytes);

[[nodiscard]] bool IsValidUtf8(std::string_view bytes);
[[nodiscard]] std::string Latin1ToUtf8(std::string_view bytes);

/// Split on '\n', dropping a trailing '\r' from each line.
[[nodiscard]] std::vector<std::string> SplitLines(std::string_view text);

/// Lines [line - context, line + context] (1-based), joined with '\n'.
[[nodiscard]] std::string ExtractSnippet(const std::vector<std::string>& lines,
                                         int line_number, int context = 2);

/// Path helpers shared by the scanners.
[[nodiscard]] bool EndsWith(std::string_view text, std::string_view suffix);
[[nodiscard]] std::string FileStem(const std::string& path);
[[nodiscard]] std::string ReplaceSuffix(const std::string& path,
                                        std::string_view suffix,
                                        std::string_view replacement);
[[nodiscard]] bool FileExists(const std::string& path);

} // namespace workflow_tracker
