#include "namewise/model.hpp"
#include "namewise/table_mapping.hpp"
#include "namewise/log.hpp"
#include <map>
#include <set>

namespace namewise {

namespace {

std::string describe(const property& prop) {
    return prop.declaring_entity_type().short_name() + "." + prop.name();
}

// Constraint names (keys and foreign keys) share one namespace per schema.
class constraint_names {
public:
    explicit constraint_names(std::vector<std::string>& errors) : errors_(errors) {}

    void add(const std::optional<std::string>& schema, const std::string& name, const std::string& owner) {
        auto [it, inserted] = names_.emplace(std::make_pair(schema.value_or(""), name), owner);
        if (!inserted) {
            errors_.push_back("Constraint name '" + name + "' is used by both " + it->second + " and " + owner);
        }
    }

private:
    std::vector<std::string>& errors_;
    std::map<std::pair<std::string, std::string>, std::string> names_;
};

bool all_explicit(const column_mapping& column, const store_object_id& table) {
    for (auto* prop : column.properties) {
        if (prop->column_name_source(table) != name_source::explicit_set) return false;
    }
    return true;
}

} // namespace

void schema_model::validate() const {
    std::vector<std::string> errors;
    constraint_names constraints(errors);

    for (const auto& mapping : map_tables(*this)) {
        const auto table_name = mapping.table.display_name();

        for (const auto& column : mapping.columns) {
            if (column.properties.size() > 1 && !all_explicit(column, mapping.table)) {
                std::string owners;
                for (auto* prop : column.properties) {
                    if (!owners.empty()) owners += ", ";
                    owners += describe(*prop);
                }
                errors.push_back("Table '" + table_name + "': column '" + column.name +
                                 "' is mapped by " + owners);
            }
        }

        if (mapping.owner) {
            if (auto* pk = mapping.owner->find_primary_key()) {
                if (auto name = pk->name(mapping.table)) {
                    constraints.add(mapping.table.schema, *name, "the primary key of '" + table_name + "'");
                }
            }
            if (!mapping.owner->base_type()) {
                for (auto* k : mapping.owner->declared_keys()) {
                    if (k->is_primary_key()) continue;
                    if (auto name = k->name(mapping.table)) {
                        constraints.add(mapping.table.schema, *name, "an alternate key of '" + table_name + "'");
                    }
                }
            }
        }

        std::set<std::string> index_names;
        for (auto* entity : mapping.entity_types) {
            for (auto* fk : entity->foreign_keys()) {
                if (fk->is_row_internal(mapping.table)) continue;
                if (!store_object_id::create(fk->principal_entity_type(), store_object_kind::table)) continue;
                if (auto name = fk->constraint_name()) {
                    constraints.add(mapping.table.schema, *name,
                                    "a foreign key of '" + entity->short_name() + "'");
                }
            }
            for (auto* index : entity->indexes()) {
                auto name = index->database_name();
                if (name && !index_names.insert(*name).second) {
                    errors.push_back("Table '" + table_name + "': index name '" + *name + "' is used twice");
                }
            }
        }
    }

    if (!errors.empty()) {
        std::string message = "Model validation failed: ";
        for (size_t i = 0; i < errors.size(); ++i) {
            LOG_WARN("validation", "%s", errors[i].c_str());
            if (i > 0) message += "; ";
            message += errors[i];
        }
        throw model_validation_error(message);
    }
}

} // namespace namewise
