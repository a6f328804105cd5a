#include "namewise/table_mapping.hpp"
#include <algorithm>

namespace namewise {

namespace {

bool owns_table(const entity_type& entity, const store_object_id& table) {
    if (entity.find_table_sharing_ownership(table)) {
        return false;
    }
    auto* base = entity.base_type();
    if (!base) {
        return true;
    }
    auto base_table = store_object_id::create(*base, store_object_kind::table);
    return !base_table || *base_table != table;
}

// The properties an entity type contributes to `table`.
std::vector<property*> mapped_properties(const entity_type& entity, const table_mapping& mapping) {
    std::vector<property*> result;
    if (&entity == mapping.owner && entity.base_type()) {
        // TPT: the derived table repeats the primary key.
        if (auto* pk = entity.find_primary_key()) {
            result = pk->properties();
        }
    } else if (&entity == mapping.owner) {
        result = entity.properties();
        return result;
    }
    for (auto* prop : entity.declared_properties()) {
        if (!prop->find_shared_column_principal(mapping.table)) {
            result.push_back(prop);
        }
    }
    return result;
}

void add_column(table_mapping& mapping, property* prop) {
    auto name = prop->column_name(mapping.table);
    auto it = std::find_if(mapping.columns.begin(), mapping.columns.end(),
                           [&](const column_mapping& column) { return column.name == name; });
    if (it == mapping.columns.end()) {
        mapping.columns.push_back(column_mapping{name, {prop}});
    } else if (std::find(it->properties.begin(), it->properties.end(), prop) == it->properties.end()) {
        it->properties.push_back(prop);
    }
}

} // namespace

const column_mapping* table_mapping::find_column(const std::string& name) const {
    for (const auto& column : columns) {
        if (column.name == name) return &column;
    }
    return nullptr;
}

std::vector<table_mapping> map_tables(const schema_model& model) {
    std::vector<table_mapping> tables;

    for (auto* entity : model.entity_types()) {
        auto table = store_object_id::create(*entity, store_object_kind::table);
        if (!table) continue;

        auto it = std::find_if(tables.begin(), tables.end(),
                               [&](const table_mapping& mapping) { return mapping.table == *table; });
        if (it == tables.end()) {
            tables.push_back(table_mapping{*table, nullptr, {}, {}});
            it = tables.end() - 1;
        }
        it->entity_types.push_back(entity);
        if (!it->owner && owns_table(*entity, *table)) {
            it->owner = entity;
        }
    }

    for (auto& mapping : tables) {
        // The owner's columns come first.
        if (mapping.owner) {
            for (auto* prop : mapped_properties(*mapping.owner, mapping)) {
                add_column(mapping, prop);
            }
        }
        for (auto* entity : mapping.entity_types) {
            if (entity == mapping.owner) continue;
            for (auto* prop : mapped_properties(*entity, mapping)) {
                add_column(mapping, prop);
            }
        }
    }
    return tables;
}

} // namespace namewise
