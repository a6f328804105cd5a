#include "namewise/schema_writer.hpp"
#include "namewise/db.hpp"
#include "namewise/log.hpp"
#include "namewise/table_mapping.hpp"
#include <algorithm>
#include <sstream>

namespace namewise {

namespace {

std::string quote(const std::string& identifier) {
    std::string result = "\"";
    for (char c : identifier) {
        if (c == '"') result += '"';
        result += c;
    }
    result += '"';
    return result;
}

const char* sql_type(column_type type) {
    switch (type) {
        case column_type::integer: return "INTEGER";
        case column_type::real: return "REAL";
        case column_type::text: return "TEXT";
        case column_type::blob: return "BLOB";
    }
    return "BLOB";
}

std::string column_list(const std::vector<property*>& properties, const store_object_id& table) {
    std::string result;
    for (size_t i = 0; i < properties.size(); ++i) {
        if (i > 0) result += ", ";
        result += quote(properties[i]->column_name(table));
    }
    return result;
}

// Columns of types other than the owner (TPH derived types, split owned
// types) hold NULL for rows of the other types.
bool is_required(const column_mapping& column, const table_mapping& mapping) {
    if (!mapping.owner) return false;
    auto owner_props = mapping.owner->properties();
    for (auto* prop : column.properties) {
        if (prop->is_nullable()) return false;
        if (std::find(owner_props.begin(), owner_props.end(), prop) == owner_props.end()) return false;
    }
    return true;
}

void write_foreign_keys(std::ostringstream& sql, const table_mapping& mapping) {
    for (auto* entity : mapping.entity_types) {
        for (auto* fk : entity->foreign_keys()) {
            if (fk->is_row_internal(mapping.table)) continue;
            auto principal_table = store_object_id::create(fk->principal_entity_type(), store_object_kind::table);
            if (!principal_table) continue;

            sql << ",\n    ";
            if (auto name = fk->constraint_name()) {
                sql << "CONSTRAINT " << quote(*name) << " ";
            }
            sql << "FOREIGN KEY (" << column_list(fk->properties(), mapping.table) << ") REFERENCES "
                << quote(principal_table->name)
                << " (" << column_list(fk->principal_key().properties(), *principal_table) << ")";
        }
    }
}

table_statements statements_for(const table_mapping& mapping) {
    table_statements result;
    result.table = mapping.table.name;
    if (mapping.table.schema) {
        LOG_DEBUG("schema", "Ignoring schema '%s' of table '%s'",
                  mapping.table.schema->c_str(), mapping.table.name.c_str());
    }

    std::ostringstream sql;
    sql << "CREATE TABLE " << quote(mapping.table.name) << " (";

    bool first = true;
    for (const auto& column : mapping.columns) {
        sql << (first ? "\n    " : ",\n    ");
        first = false;
        sql << quote(column.name) << " " << sql_type(column.properties.front()->type());
        result.columns.push_back(column.name);
        if (is_required(column, mapping)) {
            sql << " NOT NULL";
        }
    }

    if (mapping.owner) {
        if (auto* pk = mapping.owner->find_primary_key()) {
            sql << ",\n    ";
            if (auto name = pk->name(mapping.table)) {
                sql << "CONSTRAINT " << quote(*name) << " ";
            }
            sql << "PRIMARY KEY (" << column_list(pk->properties(), mapping.table) << ")";
        }
        if (!mapping.owner->base_type()) {
            for (auto* k : mapping.owner->declared_keys()) {
                if (k->is_primary_key()) continue;
                sql << ",\n    ";
                if (auto name = k->name(mapping.table)) {
                    sql << "CONSTRAINT " << quote(*name) << " ";
                }
                sql << "UNIQUE (" << column_list(k->properties(), mapping.table) << ")";
            }
        }
    }

    write_foreign_keys(sql, mapping);
    sql << "\n)";
    result.create_table = sql.str();

    for (auto* entity : mapping.entity_types) {
        for (auto* index : entity->indexes()) {
            auto name = index->database_name();
            if (!name) continue;
            std::ostringstream stmt;
            stmt << "CREATE " << (index->is_unique() ? "UNIQUE " : "") << "INDEX " << quote(*name)
                 << " ON " << quote(mapping.table.name)
                 << " (" << column_list(index->properties(), mapping.table) << ")";
            result.create_indexes.push_back({*name, stmt.str()});
        }
    }
    return result;
}

} // namespace

std::vector<table_statements> create_statements(const schema_model& model) {
    if (!model.is_finalized()) {
        throw model_error("Cannot generate DDL for a model that has not been finalized");
    }

    std::vector<table_statements> result;
    for (const auto& mapping : map_tables(model)) {
        if (mapping.columns.empty()) {
            LOG_WARN("schema", "Table '%s' has no columns, skipping", mapping.table.name.c_str());
            continue;
        }
        result.push_back(statements_for(mapping));
    }
    return result;
}

namespace {

// Existing tables keep their columns; only missing indexes are added.
void reconcile_table(database& db, const table_statements& table) {
    auto existing = db.get_table_info(table.table);
    for (const auto& column : table.columns) {
        auto found = std::find_if(existing.begin(), existing.end(),
                                  [&](const auto& info) { return info.first == column; });
        if (found == existing.end()) {
            LOG_WARN("schema", "Table '%s' exists without column '%s'", table.table.c_str(), column.c_str());
        }
    }

    auto indexes = db.get_index_names(table.table);
    for (const auto& index : table.create_indexes) {
        if (std::find(indexes.begin(), indexes.end(), index.name) != indexes.end()) continue;
        LOG_INFO("schema", "Creating index '%s' on '%s'", index.name.c_str(), table.table.c_str());
        db.execute(index.sql);
    }
}

} // namespace

size_t ensure_schema(database& db, const schema_model& model) {
    auto statements = create_statements(model);

    size_t created = 0;
    transaction txn(db);
    for (const auto& table : statements) {
        if (db.table_exists(table.table)) {
            LOG_DEBUG("schema", "Table '%s' already exists", table.table.c_str());
            reconcile_table(db, table);
            continue;
        }
        LOG_INFO("schema", "Creating table '%s'", table.table.c_str());
        db.execute(table.create_table);
        for (const auto& index : table.create_indexes) {
            db.execute(index.sql);
        }
        ++created;
    }
    txn.commit();
    return created;
}

} // namespace namewise
