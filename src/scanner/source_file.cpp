#include <workflow_tracker/scanner/source_file.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace workflow_tracker {

namespace fs = std::filesystem;

namespace {

Error SourceError(const std::string& path, std::string message,
                  ErrorCategory category) {
    return Error{"ReadSourceFile", path, std::move(message), std::nullopt, category};
}

} // namespace

bool IsValidUtf8(std::string_view bytes) {
    std::size_t i = 0;
    while (i < bytes.size()) {
        const auto c = static_cast<unsigned char>(bytes[i]);
        std::size_t extra = 0;
        unsigned int code_point = 0;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            extra = 1;
            code_point = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
            code_point = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3;
            code_point = c & 0x07;
        } else {
            return false;
        }
        if (i + extra >= bytes.size()) {
            return false;
        }
        for (std::size_t k = 1; k <= extra; ++k) {
            const auto cc = static_cast<unsigned char>(bytes[i + k]);
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            code_point = (code_point << 6) | (cc & 0x3F);
        }
        // Reject overlong encodings, surrogates and out-of-range values.
        if ((extra == 1 && code_point < 0x80) ||
            (extra == 2 && code_point < 0x800) ||
            (extra == 3 && code_point < 0x10000) ||
            (code_point >= 0xD800 && code_point <= 0xDFFF) ||
            code_point > 0x10FFFF) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

std::string Latin1ToUtf8(std::string_view bytes) {
    std::string out;
    out.reserve(bytes.size() + bytes.size() / 8);
    for (char ch : bytes) {
        const auto c = static_cast<unsigned char>(ch);
        if (c < 0x80) {
            out += ch;
        } else {
            out += static_cast<char>(0xC0 | (c >> 6));
            out += static_cast<char>(0x80 | (c & 0x3F));
        }
    }
    return out;
}

std::vector<std::string> SplitLines(std::string_view text) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start < text.size()) {
        auto end = text.find('\n', start);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        auto line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.emplace_back(line);
        start = end + 1;
    }
    return lines;
}

std::string ExtractSnippet(const std::vector<std::string>& lines,
                           int line_number, int context) {
    const int total = static_cast<int>(lines.size());
    const int first = std::max(1, line_number - context);
    const int last = std::min(total, line_number + context);
    std::string snippet;
    for (int i = first; i <= last; ++i) {
        if (i > first) {
            snippet += '\n';
        }
        snippet += lines[static_cast<std::size_t>(i - 1)];
    }
    return snippet;
}

Result<SourceText, Error> DecodeSource(const std::string& path, std::string bytes) {
    if (bytes.find('\0') != std::string::npos) {
        return Result<SourceText, Error>::Err(
            SourceError(path, "binary content (NUL byte)", ErrorCategory::Encoding));
    }

    SourceText source;
    source.path = path;
    if (IsValidUtf8(bytes)) {
        source.text = std::move(bytes);
        source.encoding = SourceEncoding::Utf8;
    } else {
        source.text = Latin1ToUtf8(bytes);
        source.encoding = SourceEncoding::Latin1;
    }
    // Strip a UTF-8 byte order mark.
    if (source.text.size() >= 3 && source.text.compare(0, 3, "\xEF\xBB\xBF") == 0) {
        source.text.erase(0, 3);
    }
    source.lines = SplitLines(source.text);
    return Result<SourceText, Error>::Ok(std::move(source));
}

Result<SourceText, Error> ReadSourceFile(const std::string& path) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in.is_open()) {
        return Result<SourceText, Error>::Err(
            SourceError(path, "cannot open file", ErrorCategory::FileRead));
    }
    std::string bytes{std::istreambuf_iterator<char>(in),
                      std::istreambuf_iterator<char>()};
    if (in.bad()) {
        return Result<SourceText, Error>::Err(
            SourceError(path, "read failed", ErrorCategory::FileRead));
    }
    return DecodeSource(path, std::move(bytes));
}

bool EndsWith(std::string_view text, std::string_view suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string FileStem(const std::string& path) {
    return fs::path(path).stem().string();
}

std::string ReplaceSuffix(const std::string& path, std::string_view suffix,
                          std::string_view replacement) {
    if (!EndsWith(path, suffix)) {
        return path;
    }
    return path.substr(0, path.size() - suffix.size()) + std::string(replacement);
}

bool FileExists(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

} // namespace workflow_tracker
