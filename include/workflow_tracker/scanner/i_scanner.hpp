#pragma once

#include <workflow_tracker/core/result.hpp>
#include <workflow_tracker/model/workflow_graph.hpp>
#include <workflow_tracker/schema/table_schema.hpp>

#include <string>
#include <string_view>

namespace workflow_tracker {

// ---------------------------------------------------------------------------
// IScanner: one source dialect.
//
// CanScan is a pure function of the path. ScanFile reads the file (and, for
// markup/code pairs, its counterpart) and returns a fragment holding only
// what was found there. Implementations are immutable after construction, so
// one instance serves every worker thread.
//
// ScanFile returns Err for files that cannot be read or decoded; pattern
// misses are not errors.
// ---------------------------------------------------------------------------
class IScanner {
public:
    virtual ~IScanner() = default;

    IScanner() = default;
    IScanner(const IScanner&) = delete;
    IScanner& operator=(const IScanner&) = delete;
    IScanner(IScanner&&) = delete;
    IScanner& operator=(IScanner&&) = delete;

    [[nodiscard]] virtual std::string_view Name() const = 0;

    [[nodiscard]] virtual bool CanScan(const std::string& file_path) const = 0;

    [[nodiscard]] virtual Result<WorkflowGraph, Error> ScanFile(
        const std::string& file_path,
        const SchemaRegistry* schemas) const = 0;
};

} // namespace workflow_tracker
