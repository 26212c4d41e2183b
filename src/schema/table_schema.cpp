#include <workflow_tracker/schema/table_schema.hpp>

namespace workflow_tracker {

void SchemaRegistry::Add(TableSchema schema) {
    auto shared = std::make_shared<const TableSchema>(std::move(schema));
    schemas_.push_back(shared);
    by_name_.emplace(shared->entity_name, shared);
    if (shared->table_name != shared->entity_name) {
        by_name_.emplace(shared->table_name, shared);
    }
}

const TableSchema* SchemaRegistry::Find(const std::string& name) const {
    auto it = by_name_.find(name);
    return it == by_name_.end() ? nullptr : it->second.get();
}

std::string SchemaRegistry::ResolveTableName(const std::string& name) const {
    const auto* schema = Find(name);
    return schema ? schema->table_name : name;
}

} // namespace workflow_tracker
