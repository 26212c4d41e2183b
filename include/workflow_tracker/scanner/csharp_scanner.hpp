#pragma once

#include <workflow_tracker/config/app_config.hpp>
#include <workflow_tracker/scanner/i_scanner.hpp>
#include <workflow_tracker/scanner/pattern_table.hpp>
#include <workflow_tracker/scanner/source_file.hpp>

#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace workflow_tracker {

// ---------------------------------------------------------------------------
// CSharpScanner: backend C#: Entity Framework reads and writes, raw ADO.NET
// SQL, HttpClient calls, file I/O, Service Bus and RabbitMQ messaging.
//
// Table names are taken from the line itself (DbSet<T>, _context.X, _db.X)
// or from a `var x = y.Z` declaration in the preceding lines, then mapped
// through the schema registry when one is supplied.
// ---------------------------------------------------------------------------
class CSharpScanner : public IScanner {
public:
    explicit CSharpScanner(const ScanConfig& config);

    [[nodiscard]] std::string_view Name() const override { return "csharp"; }
    [[nodiscard]] bool CanScan(const std::string& file_path) const override;
    [[nodiscard]] Result<WorkflowGraph, Error> ScanFile(
        const std::string& file_path,
        const SchemaRegistry* schemas) const override;

    /// Line-by-line detection over already loaded text. Shared with the WPF
    /// scanner for code-behind files.
    void ScanSource(const SourceText& source, const SchemaRegistry* schemas,
                    const DetectionToggles& detect, WorkflowGraph& fragment) const;

    /// Every enabled category for one line (1-based).
    void ScanLine(const SourceText& source, int line_number, const SchemaRegistry* schemas,
                  const DetectionToggles& detect, WorkflowGraph& fragment) const;

    [[nodiscard]] const DetectionToggles& Detect() const noexcept { return detect_; }

    /// Entity or table name referenced at `line_number` (1-based), resolved
    /// through `schemas` when possible.
    [[nodiscard]] std::optional<std::string> ExtractTableName(
        const std::vector<std::string>& lines, int line_number,
        const SchemaRegistry* schemas) const;

private:
    void ScanDatabase(const SourceText& source, int line_number,
                      const SchemaRegistry* schemas, WorkflowGraph& fragment) const;
    void ScanHttp(const SourceText& source, int line_number, WorkflowGraph& fragment) const;
    void ScanFileIo(const SourceText& source, int line_number, WorkflowGraph& fragment) const;
    void ScanMessaging(const SourceText& source, int line_number, WorkflowGraph& fragment) const;

    std::optional<std::string> ExtractSqlQuery(const std::vector<std::string>& lines,
                                               int line_number) const;
    std::optional<std::string> ExtractEndpoint(const std::vector<std::string>& lines,
                                               int line_number) const;
    std::string ExtractHttpMethod(const std::string& line) const;
    std::optional<std::string> ExtractQueueName(const std::vector<std::string>& lines,
                                                int line_number) const;

    DetectionToggles detect_;
    std::size_t max_line_length_;

    PatternTable ef_reads_;
    PatternTable ef_writes_;
    PatternTable http_;
    PatternTable file_io_;
    PatternTable messaging_;
    PatternTable http_methods_;

    std::regex raw_sql_;
    std::regex sql_literal_;
    std::regex table_ref_;
    std::regex var_decl_;
    std::regex endpoint_;
    std::regex api_endpoint_;
    std::regex file_literal_;
    std::regex read_hint_;
    std::regex send_hint_;
    std::regex publish_hint_;
    std::regex string_literal_;
    std::regex queue_decl_;
};

} // namespace workflow_tracker
