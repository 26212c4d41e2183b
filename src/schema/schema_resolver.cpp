#include <workflow_tracker/schema/schema_resolver.hpp>

#include <workflow_tracker/core/log.hpp>
#include <workflow_tracker/scanner/scanner_support.hpp>

#include <exception>
#include <optional>
#include <set>

namespace workflow_tracker {

namespace {

const std::set<std::string>& CommonEntityProperties() {
    static const std::set<std::string> kProps = {
        "Id", "ID", "Name", "CreatedAt", "UpdatedAt", "Created", "Modified"};
    return kProps;
}

} // namespace

SchemaResolver::SchemaResolver(const ScanConfig& config)
    : limits_(config.schema),
      max_line_length_(static_cast<std::size_t>(config.max_line_length)),
      db_context_(R"(class\s+\w+\s*:\s*DbContext)"),
      db_set_(R"(DbSet<(\w+)>\s+(\w+))"),
      table_attribute_(R"lit(\[Table\("([^"]+)"\)\])lit"),
      class_decl_(R"(class\s+(\w+))"),
      property_(R"(public\s+\w+\??(\[\])?\s+(\w+)\s*\{\s*get;)") {}

bool SchemaResolver::LooksLikeEntity(const std::vector<std::string>& properties) {
    if (properties.size() < 2) {
        return false;
    }
    const auto& common = CommonEntityProperties();
    for (const auto& prop : properties) {
        if (common.count(prop) > 0) {
            return true;
        }
    }
    return properties.size() >= 3;
}

std::vector<TableSchema> SchemaResolver::DetectSchemas(const SourceText& source) const {
    auto schemas = DetectDbSets(source);
    auto entities = DetectEntities(source);
    schemas.insert(schemas.end(), std::make_move_iterator(entities.begin()),
                   std::make_move_iterator(entities.end()));
    return schemas;
}

std::vector<TableSchema> SchemaResolver::DetectDbSets(const SourceText& source) const {
    std::vector<TableSchema> schemas;
    bool in_context = false;

    const int count = static_cast<int>(source.lines.size());
    for (int line = 1; line <= count; ++line) {
        const auto& text = source.lines[static_cast<std::size_t>(line - 1)];
        if (std::regex_search(text, db_context_)) {
            in_context = true;
            continue;
        }
        if (!in_context) {
            continue;
        }

        std::smatch match;
        if (std::regex_search(text, match, db_set_)) {
            TableSchema schema;
            schema.entity_name = match[1].str();
            schema.table_name = match[2].str();
            schema.dbset_name = match[2].str();
            schema.file_path = source.path;
            schema.line_number = line;
            schema.metadata["source"] = "DbContext";
            schema.metadata["detected_from"] = "DbSet";
            schemas.push_back(std::move(schema));
        }

        // A line holding only a closing brace ends the context body.
        if (Trim(text) == "}") {
            in_context = false;
        }
    }
    return schemas;
}

std::vector<TableSchema> SchemaResolver::DetectEntities(const SourceText& source) const {
    std::vector<TableSchema> schemas;

    std::optional<std::string> current_class;
    int current_line = 0;
    std::optional<std::string> current_table;
    std::optional<std::string> pending_table;
    std::vector<std::string> properties;

    auto flush = [&]() {
        if (!current_class.has_value() || !LooksLikeEntity(properties)) {
            return;
        }
        TableSchema schema;
        schema.entity_name = *current_class;
        schema.table_name = current_table.value_or(*current_class);
        schema.file_path = source.path;
        schema.line_number = current_line;
        schema.properties = properties;
        schema.metadata["source"] = "Entity";
        schema.metadata["has_table_attribute"] = current_table.has_value() ? "true" : "false";
        schemas.push_back(std::move(schema));
    };

    const int count = static_cast<int>(source.lines.size());
    for (int line = 1; line <= count; ++line) {
        const auto& text = source.lines[static_cast<std::size_t>(line - 1)];

        std::smatch match;
        if (std::regex_search(text, match, table_attribute_)) {
            pending_table = match[1].str();
            continue;
        }

        if (std::regex_search(text, match, class_decl_)) {
            flush();
            current_class = match[1].str();
            current_line = line;
            current_table = std::move(pending_table);
            pending_table.reset();
            properties.clear();
        }

        if (current_class.has_value() && std::regex_search(text, match, property_)) {
            properties.push_back(match[2].str());
        }
    }
    flush();
    return schemas;
}

SchemaResolution SchemaResolver::Resolve(const std::vector<std::string>& files,
                                         const CancellationToken* cancel) const {
    SchemaResolution resolution;
    const auto max_files = static_cast<std::size_t>(limits_.max_files);
    const auto max_schemas = static_cast<std::size_t>(limits_.max_schemas);

    for (const auto& path : files) {
        if (!EndsWith(path, ".cs")) {
            continue;
        }
        if (IsCancelled(cancel)) {
            break;
        }
        if (resolution.files_examined >= max_files) {
            resolution.truncated = true;
            resolution.warnings.push_back("Schema resolution stopped after " +
                                          std::to_string(max_files) + " files");
            break;
        }
        ++resolution.files_examined;

        auto source = LoadSource(path, max_line_length_);
        if (source.IsErr()) {
            resolution.warnings.push_back(source.Error().ToString());
            continue;
        }

        std::vector<TableSchema> found;
        try {
            found = DetectSchemas(source.Value());
        } catch (const std::exception& e) {
            resolution.warnings.push_back(
                Error{"DetectSchemas", path, e.what(), std::nullopt, ErrorCategory::Schema}
                    .ToString());
            continue;
        }

        for (auto& schema : found) {
            if (resolution.registry.Size() >= max_schemas) {
                resolution.truncated = true;
                break;
            }
            LogDebug("schema", schema.entity_name + " -> " + schema.table_name + " (" +
                                   path + ":" + std::to_string(schema.line_number) + ")");
            resolution.registry.Add(std::move(schema));
        }
        if (resolution.registry.Size() >= max_schemas && resolution.truncated) {
            resolution.warnings.push_back("Schema resolution stopped at " +
                                          std::to_string(max_schemas) + " schemas");
            break;
        }
    }

    LogInfo("schema", "Discovered " + std::to_string(resolution.registry.Size()) +
                          " schemas in " + std::to_string(resolution.files_examined) +
                          " files");
    return resolution;
}

} // namespace workflow_tracker
