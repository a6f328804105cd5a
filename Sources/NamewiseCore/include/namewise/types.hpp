#pragma once

#include <cstdint>
#include <string>
#include <optional>
#include <stdexcept>
#include <tuple>

namespace namewise {

class entity_type;

// Column type enumeration
enum class column_type {
    integer,
    real,
    text,
    blob
};

const char* to_string(column_type type);

// Who set a name. Explicit names are never overwritten by a convention.
enum class name_source {
    convention,
    explicit_set
};

const char* to_string(name_source source);

// A name override stored on the model. `value` may be absent: an override
// with no value hides the default (e.g. a table name cleared in favour of a
// view mapping).
struct name_override {
    std::optional<std::string> value;
    name_source source = name_source::convention;
};

// Physical targets an entity type can map to
enum class store_object_kind {
    table,
    view,
    function,
    sql_query
};

constexpr store_object_kind all_store_object_kinds[] = {
    store_object_kind::table,
    store_object_kind::view,
    store_object_kind::function,
    store_object_kind::sql_query
};

const char* to_string(store_object_kind kind);

struct store_object_id {
    store_object_kind kind = store_object_kind::table;
    std::string name;
    std::optional<std::string> schema;

    /// The store object of `kind` the entity type currently maps to, if any.
    static std::optional<store_object_id> create(const entity_type& entity, store_object_kind kind);

    static store_object_id table(std::string name, std::optional<std::string> schema = std::nullopt) {
        return store_object_id{store_object_kind::table, std::move(name), std::move(schema)};
    }

    std::string display_name() const {
        return schema ? *schema + "." + name : name;
    }

    bool operator==(const store_object_id& other) const {
        return kind == other.kind && name == other.name && schema == other.schema;
    }
    bool operator!=(const store_object_id& other) const { return !(*this == other); }

    bool operator<(const store_object_id& other) const {
        return std::tie(kind, name, schema) < std::tie(other.kind, other.name, other.schema);
    }
};

// Store-object annotations on an entity type
enum class annotation_kind {
    table_name,
    schema,
    view_name,
    view_schema,
    function_name,
    sql_query
};

const char* to_string(annotation_kind kind);

// How an entity type currently maps to the database
enum class mapping_mode {
    standalone_table,
    tph_root,
    tph_derived,
    tpt,
    owned_split_table,
    owned_separate_table,
    mapped_to_view,
    mapped_to_function,
    mapped_to_query
};

const char* to_string(mapping_mode mode);

// ============================================================================
// Errors
// ============================================================================

// Invalid mutation of the schema model
class model_error : public std::runtime_error {
public:
    explicit model_error(const std::string& msg) : std::runtime_error(msg) {}
};

// Raised by schema_model::finalize() when names collide
class model_validation_error : public model_error {
public:
    explicit model_validation_error(const std::string& msg) : model_error(msg) {}
};

class config_error : public std::runtime_error {
public:
    explicit config_error(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace namewise
