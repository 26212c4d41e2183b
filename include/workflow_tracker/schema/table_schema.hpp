#pragma once

#include <workflow_tracker/model/workflow_graph.hpp>

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace workflow_tracker {

// ---------------------------------------------------------------------------
// TableSchema: an entity/table declaration found by the schema resolver.
// ---------------------------------------------------------------------------
struct TableSchema {
    std::string entity_name;
    std::string table_name;
    std::string file_path;
    int line_number = 0;
    std::optional<std::string> dbset_name;
    std::vector<std::string> properties;
    Metadata metadata;
};

// ---------------------------------------------------------------------------
// SchemaRegistry: name -> schema map keyed by both entity and table name.
//
// Filled once by the resolver, then read concurrently by scan workers
// without locking; callers must not Add() after the main pass has started.
// The first schema registered under a name keeps it.
// ---------------------------------------------------------------------------
class SchemaRegistry {
public:
    void Add(TableSchema schema);

    /// Lookup by entity or table name; nullptr if unknown.
    [[nodiscard]] const TableSchema* Find(const std::string& name) const;

    /// Canonical table name for `name`, or `name` itself when unregistered.
    [[nodiscard]] std::string ResolveTableName(const std::string& name) const;

    /// Distinct schemas in registration order.
    [[nodiscard]] const std::vector<std::shared_ptr<const TableSchema>>& Schemas() const noexcept {
        return schemas_;
    }
    [[nodiscard]] std::size_t Size() const noexcept { return schemas_.size(); }
    [[nodiscard]] bool Empty() const noexcept { return schemas_.empty(); }

private:
    std::vector<std::shared_ptr<const TableSchema>> schemas_;
    std::map<std::string, std::shared_ptr<const TableSchema>> by_name_;
};

} // namespace workflow_tracker
