#pragma once

#include <workflow_tracker/config/app_config.hpp>
#include <workflow_tracker/core/cancellation.hpp>
#include <workflow_tracker/scanner/source_file.hpp>
#include <workflow_tracker/schema/table_schema.hpp>

#include <cstddef>
#include <regex>
#include <string>
#include <vector>

namespace workflow_tracker {

// Output of the resolver pre-pass.
struct SchemaResolution {
    SchemaRegistry registry;
    std::vector<std::string> warnings;
    std::size_t files_examined = 0;
    bool truncated = false;  // a cap in SchemaLimits was hit
};

// ---------------------------------------------------------------------------
// SchemaResolver: discovers entity/table declarations in C# sources before
// the main scan.
//
// Two shapes are recognised:
//   * DbContext subclasses: every `DbSet<Entity> Property` maps Entity to a
//     table named after the property.
//   * Entity classes: a class with at least two auto-properties that either
//     has a common identity/audit member (Id, Name, CreatedAt, ...) or at
//     least three properties. A preceding [Table("x")] attribute names the
//     table; otherwise the class name is used.
//
// Per-file failures become warnings; the pass always completes.
// ---------------------------------------------------------------------------
class SchemaResolver {
public:
    explicit SchemaResolver(const ScanConfig& config);

    /// Schemas declared in one already loaded file, DbSets first.
    [[nodiscard]] std::vector<TableSchema> DetectSchemas(const SourceText& source) const;

    /// Resolve over the candidate list; only .cs files are examined.
    [[nodiscard]] SchemaResolution Resolve(const std::vector<std::string>& files,
                                           const CancellationToken* cancel = nullptr) const;

    [[nodiscard]] static bool LooksLikeEntity(const std::vector<std::string>& properties);

private:
    std::vector<TableSchema> DetectDbSets(const SourceText& source) const;
    std::vector<TableSchema> DetectEntities(const SourceText& source) const;

    SchemaLimits limits_;
    std::size_t max_line_length_;

    std::regex db_context_;
    std::regex db_set_;
    std::regex table_attribute_;
    std::regex class_decl_;
    std::regex property_;
};

} // namespace workflow_tracker
