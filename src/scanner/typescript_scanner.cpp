#include <workflow_tracker/scanner/typescript_scanner.hpp>

#include <workflow_tracker/scanner/scanner_support.hpp>

#include <algorithm>

namespace workflow_tracker {

TypeScriptScanner::TypeScriptScanner(const ScanConfig& config)
    : detect_(config.detect),
      max_line_length_(static_cast<std::size_t>(config.max_line_length)),
      http_(BuildTable({
          R"(http\.get)",
          R"(http\.post)",
          R"(http\.put)",
          R"(http\.delete)",
          R"(http\.patch)",
          R"(fetch\s*\()",
          R"(axios\.)",
      }, /*icase=*/true)),
      storage_(BuildTable({
          R"(localStorage\.setItem)",
          R"(localStorage\.getItem)",
          R"(sessionStorage\.setItem)",
          R"(sessionStorage\.getItem)",
          R"(indexedDB)",
      })),
      files_(BuildTable({
          R"(FileReader)",
          R"(\.readAsText)",
          R"(\.readAsDataURL)",
          R"(Blob)",
      })),
      transforms_(BuildTable({
          R"(\.pipe\s*\()",
          R"(\.map\s*\()",
          R"(\.filter\s*\()",
          R"(\.reduce\s*\()",
          R"(\.switchMap\s*\()",
          R"(\.mergeMap\s*\()",
          R"(\.concatMap\s*\()",
      })),
      http_methods_(BuildTable({
          {R"(\.get\s*\()", "GET"},
          {R"(\.post\s*\()", "POST"},
          {R"(\.put\s*\()", "PUT"},
          {R"(\.delete\s*\()", "DELETE"},
          {R"(\.patch\s*\()", "PATCH"},
      }, /*icase=*/true)),
      endpoint_(R"(['"`](https?://[^'"`]+|/[^'"`]*)['"`])"),
      template_literal_(R"(`([^`]*)`)"),
      api_endpoint_(R"(['"`](https?://[^'"`]+|/api/[^'"`]*)['"`])"),
      file_read_hint_(R"(read|Reader)", std::regex::icase),
      storage_read_hint_(R"(getItem|get)"),
      storage_key_(R"((?:getItem|setItem)\s*\(\s*['"]([^'"]+)['"])"),
      operator_name_(R"(\.(pipe|map|filter|reduce|switchMap|mergeMap|concatMap))") {}

bool TypeScriptScanner::CanScan(const std::string& file_path) const {
    return EndsWith(file_path, ".ts") || EndsWith(file_path, ".js") ||
           EndsWith(file_path, ".tsx") || EndsWith(file_path, ".jsx");
}

Result<WorkflowGraph, Error> TypeScriptScanner::ScanFile(
    const std::string& file_path, const SchemaRegistry* /*schemas*/) const {
    auto source = LoadSource(file_path, max_line_length_);
    if (source.IsErr()) {
        return Result<WorkflowGraph, Error>::Err(std::move(source).Error());
    }
    WorkflowGraph fragment;
    ScanSource(source.Value(), detect_, fragment);
    return Result<WorkflowGraph, Error>::Ok(std::move(fragment));
}

void TypeScriptScanner::ScanSource(const SourceText& source, const DetectionToggles& detect,
                                   WorkflowGraph& fragment) const {
    const int count = static_cast<int>(source.lines.size());
    for (int line = 1; line <= count; ++line) {
        ScanLine(source, line, detect, fragment);
    }
}

void TypeScriptScanner::ScanLine(const SourceText& source, int line_number,
                                 const DetectionToggles& detect,
                                 WorkflowGraph& fragment) const {
    if (detect.api_calls) {
        ScanHttpLine(source, line_number, fragment);
    }
    if (detect.file_io) {
        ScanFileLine(source, line_number, fragment);
    }
    if (detect.cache) {
        ScanStorageLine(source, line_number, fragment);
    }
    if (detect.data_transforms) {
        ScanTransformLine(source, line_number, fragment);
    }
}

bool TypeScriptScanner::ScanHttpLine(const SourceText& source, int line_number,
                                     WorkflowGraph& fragment) const {
    const auto& text = source.lines[static_cast<std::size_t>(line_number - 1)];
    if (FirstMatch(http_, text) == nullptr) {
        return false;
    }
    auto endpoint = ExtractEndpoint(source.lines, line_number);
    auto method = ExtractHttpMethod(text);
    auto node = MakeNode(source, "api", line_number, WorkflowType::ApiCall,
                         "API " + method + ": " + endpoint.value_or("Unknown"),
                         "HTTP API call from TypeScript");
    node.endpoint = std::move(endpoint);
    node.method = std::move(method);
    return fragment.AddNode(std::move(node));
}

void TypeScriptScanner::ScanFileLine(const SourceText& source, int line_number,
                                     WorkflowGraph& fragment) const {
    const auto& text = source.lines[static_cast<std::size_t>(line_number - 1)];
    if (FirstMatch(files_, text) == nullptr) {
        return;
    }
    const bool is_read = Contains(file_read_hint_, text);
    fragment.AddNode(MakeNode(source, "file", line_number,
                              is_read ? WorkflowType::FileRead : WorkflowType::FileWrite,
                              is_read ? "File Read" : "File Write",
                              "Browser file API operation"));
}

void TypeScriptScanner::ScanStorageLine(const SourceText& source, int line_number,
                                        WorkflowGraph& fragment) const {
    const auto& text = source.lines[static_cast<std::size_t>(line_number - 1)];
    if (FirstMatch(storage_, text) == nullptr) {
        return;
    }
    const bool is_read = Contains(storage_read_hint_, text);
    auto key = SearchGroup(storage_key_, text);
    auto node = MakeNode(source, "cache", line_number,
                         is_read ? WorkflowType::CacheRead : WorkflowType::CacheWrite,
                         std::string(is_read ? "Cache Read: " : "Cache Write: ") +
                             key.value_or("Unknown"),
                         "Browser storage operation");
    if (key.has_value()) {
        node.metadata["key"] = *key;
    }
    fragment.AddNode(std::move(node));
}

void TypeScriptScanner::ScanTransformLine(const SourceText& source, int line_number,
                                          WorkflowGraph& fragment) const {
    const auto& text = source.lines[static_cast<std::size_t>(line_number - 1)];
    if (FirstMatch(transforms_, text) == nullptr) {
        return;
    }
    const auto op = SearchGroup(operator_name_, text).value_or("transform");
    auto node = MakeNode(source, "transform", line_number, WorkflowType::DataTransform,
                         "Data Transform: " + op,
                         "Data transformation using " + op);
    node.metadata["operator"] = op;
    fragment.AddNode(std::move(node));
}

std::optional<std::string> TypeScriptScanner::ExtractEndpoint(
    const std::vector<std::string>& lines, int line_number) const {
    const auto& text = lines[static_cast<std::size_t>(line_number - 1)];
    if (auto url = SearchGroup(endpoint_, text)) {
        return url;
    }
    if (auto templ = SearchGroup(template_literal_, text)) {
        return templ;
    }
    const int count = static_cast<int>(lines.size());
    for (int i = std::max(0, line_number - 3); i < std::min(count, line_number + 1); ++i) {
        if (auto url = SearchGroup(api_endpoint_, lines[static_cast<std::size_t>(i)])) {
            return url;
        }
    }
    return std::nullopt;
}

std::string TypeScriptScanner::ExtractHttpMethod(const std::string& line) const {
    if (const auto* rule = FirstMatch(http_methods_, line)) {
        return rule->value;
    }
    return "HTTP";
}

} // namespace workflow_tracker
