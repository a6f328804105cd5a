#include "namewise/snapshot.hpp"
#include "namewise/mapping_classifier.hpp"
#include <nlohmann/json.hpp>

namespace namewise {

using json = nlohmann::json;

namespace {

json optional_string(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

json source_of(const std::optional<name_source>& source) {
    return source ? json(to_string(*source)) : json(nullptr);
}

json describe(const property& prop) {
    auto& entity = prop.declaring_entity_type();
    json j = json::object();
    j["name"] = prop.name();
    j["column"] = prop.column_base_name();
    j["source"] = source_of(prop.column_name_source());

    json columns = json::object();
    for (auto kind : all_store_object_kinds) {
        if (auto store = store_object_id::create(entity, kind)) {
            columns[std::string(to_string(kind)) + ":" + store->display_name()] = {
                {"name", prop.column_name(*store)},
                {"source", source_of(prop.column_name_source(*store))}
            };
        }
    }
    j["columns"] = columns;
    return j;
}

json describe(const entity_type& entity) {
    json j = json::object();
    j["name"] = entity.short_name();
    j["base_type"] = entity.base_type() ? json(entity.base_type()->short_name()) : json(nullptr);
    j["mapping"] = to_string(classify(entity));

    json annotations = json::object();
    for (auto kind : {annotation_kind::table_name, annotation_kind::schema, annotation_kind::view_name,
                      annotation_kind::view_schema, annotation_kind::function_name, annotation_kind::sql_query}) {
        if (auto* annotation = entity.find_annotation(kind)) {
            annotations[to_string(kind)] = {
                {"value", optional_string(annotation->value)},
                {"source", to_string(annotation->source)}
            };
        }
    }
    j["annotations"] = annotations;
    j["table"] = optional_string(entity.table_name());
    j["schema"] = optional_string(entity.schema());
    j["view"] = optional_string(entity.view_name());

    json properties = json::array();
    for (auto* prop : entity.declared_properties()) {
        properties.push_back(describe(*prop));
    }
    j["properties"] = properties;

    json keys = json::array();
    for (auto* k : entity.declared_keys()) {
        keys.push_back({
            {"name", optional_string(k->name())},
            {"primary", k->is_primary_key()},
            {"source", source_of(k->key_name_source())}
        });
    }
    j["keys"] = keys;

    json foreign_keys = json::array();
    for (auto* fk : entity.foreign_keys()) {
        foreign_keys.push_back({
            {"name", optional_string(fk->constraint_name())},
            {"principal", fk->principal_entity_type().short_name()},
            {"ownership", fk->is_ownership()},
            {"source", source_of(fk->constraint_name_source())}
        });
    }
    j["foreign_keys"] = foreign_keys;

    json indexes = json::array();
    for (auto* index : entity.indexes()) {
        indexes.push_back({
            {"name", optional_string(index->database_name())},
            {"unique", index->is_unique()},
            {"source", source_of(index->database_name_source())}
        });
    }
    j["indexes"] = indexes;
    return j;
}

} // namespace

std::string to_json(const schema_model& model, int indent) {
    json j = json::object();
    j["default_schema"] = optional_string(model.default_schema());
    json entity_types = json::array();
    for (auto* entity : model.entity_types()) {
        entity_types.push_back(describe(*entity));
    }
    j["entity_types"] = entity_types;
    return j.dump(indent);
}

} // namespace namewise
