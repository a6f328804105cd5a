#pragma once

#include "types.hpp"
#include "convention.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace namewise {

class schema_model;
class entity_type;
class key;

// ============================================================================
// property - a scalar property mapped to one column per store object
// ============================================================================

class property {
public:
    property(entity_type& declaring, std::string name, column_type type, bool nullable);

    property(const property&) = delete;
    property& operator=(const property&) = delete;

    const std::string& name() const { return name_; }
    column_type type() const { return type_; }
    bool is_nullable() const { return nullable_; }
    entity_type& declaring_entity_type() const { return declaring_; }

    /// True if this property is part of its hierarchy's primary key.
    bool is_primary_key() const;

    // Default (unrewritten) column names
    const std::string& default_column_base_name() const { return name_; }
    std::string default_column_name(const store_object_id& store) const;

    // Resolved column names: store override, else base override, else default
    std::string column_base_name() const;
    std::string column_name(const store_object_id& store) const;

    std::optional<name_source> column_name_source() const;
    std::optional<name_source> column_name_source(const store_object_id& store) const;

    // Base column name (applies to every store object without an override)
    bool set_column_name(std::optional<std::string> name, name_source source = name_source::explicit_set);
    bool remove_column_name(name_source source = name_source::explicit_set);
    bool can_set_column_name(name_source source) const;

    // Store-object specific column name
    bool set_column_name(std::optional<std::string> name,
                         const store_object_id& store,
                         name_source source = name_source::explicit_set);
    bool remove_column_name(const store_object_id& store, name_source source = name_source::explicit_set);
    const name_override* find_column_name_override(const store_object_id& store) const;

    /// Under table splitting, a key property of the owned type that is also its
    /// ownership foreign key shares the principal key's column. Returns that
    /// principal property, or nullptr.
    const property* find_shared_column_principal(const store_object_id& store) const;

private:
    entity_type& declaring_;
    std::string name_;
    column_type type_;
    bool nullable_;
    std::optional<name_override> column_name_;
    std::map<store_object_id, name_override> column_name_overrides_;
};

// ============================================================================
// key - primary or alternate key, declared on a hierarchy root
// ============================================================================

class key {
public:
    key(entity_type& declaring, std::vector<property*> properties, bool primary);

    key(const key&) = delete;
    key& operator=(const key&) = delete;

    entity_type& declaring_entity_type() const { return declaring_; }
    const std::vector<property*>& properties() const { return properties_; }
    bool is_primary_key() const { return primary_; }

    /// PK_<table> or AK_<table>_<columns>, at the declaring type's table.
    std::optional<std::string> default_name() const;
    std::optional<std::string> default_name(const store_object_id& store) const;

    std::optional<std::string> name() const;
    /// Name at another table of the hierarchy: the override if any, else the
    /// default for that table.
    std::optional<std::string> name(const store_object_id& store) const;

    std::optional<name_source> key_name_source() const;
    bool set_name(std::optional<std::string> name, name_source source = name_source::explicit_set);
    bool remove_name(name_source source = name_source::explicit_set);

private:
    entity_type& declaring_;
    std::vector<property*> properties_;
    bool primary_;
    std::optional<name_override> name_;
};

// ============================================================================
// foreign_key - declared on the dependent entity type
// ============================================================================

class foreign_key {
public:
    foreign_key(entity_type& declaring,
                std::vector<property*> properties,
                entity_type& principal,
                key& principal_key,
                bool unique);

    foreign_key(const foreign_key&) = delete;
    foreign_key& operator=(const foreign_key&) = delete;

    entity_type& declaring_entity_type() const { return declaring_; }
    entity_type& principal_entity_type() const { return principal_; }
    const std::vector<property*>& properties() const { return properties_; }
    key& principal_key() const { return principal_key_; }

    /// One dependent per principal (the principal's navigation is not a collection).
    bool is_unique() const { return unique_; }
    bool is_ownership() const { return ownership_; }

    /// Raises on_foreign_key_ownership_changed when the flag flips.
    void set_is_ownership(bool ownership);

    /// Principal-to-dependent navigation, e.g. Person.HomeAddress.
    const std::optional<std::string>& navigation_name() const { return navigation_name_; }
    void set_navigation_name(std::optional<std::string> name);

    /// Column prefix used by table splitting: the navigation name, or the
    /// principal's short name when there is no navigation.
    const std::string& dependent_prefix() const;

    /// True when this links two entity types sharing `table` row by row
    /// (dependent primary key to principal primary key), as table splitting does.
    bool is_row_internal(const store_object_id& table) const;

    /// FK_<table>_<principal table>_<columns>
    std::optional<std::string> default_constraint_name() const;
    std::optional<std::string> constraint_name() const;
    std::optional<name_source> constraint_name_source() const;
    bool set_constraint_name(std::optional<std::string> name, name_source source = name_source::explicit_set);
    bool remove_constraint_name(name_source source = name_source::explicit_set);

private:
    entity_type& declaring_;
    std::vector<property*> properties_;
    entity_type& principal_;
    key& principal_key_;
    bool unique_;
    bool ownership_ = false;
    std::optional<std::string> navigation_name_;
    std::optional<name_override> constraint_name_;
};

// ============================================================================
// table_index
// ============================================================================

class table_index {
public:
    table_index(entity_type& declaring, std::vector<property*> properties, bool unique);

    table_index(const table_index&) = delete;
    table_index& operator=(const table_index&) = delete;

    entity_type& declaring_entity_type() const { return declaring_; }
    const std::vector<property*>& properties() const { return properties_; }
    bool is_unique() const { return unique_; }

    /// IX_<table>_<columns>
    std::optional<std::string> default_database_name() const;
    std::optional<std::string> database_name() const;
    std::optional<name_source> database_name_source() const;
    bool set_database_name(std::optional<std::string> name, name_source source = name_source::explicit_set);
    bool remove_database_name(name_source source = name_source::explicit_set);

private:
    entity_type& declaring_;
    std::vector<property*> properties_;
    bool unique_;
    std::optional<name_override> database_name_;
};

// ============================================================================
// entity_type
// ============================================================================

class entity_type {
public:
    entity_type(schema_model& model, std::string short_name);

    entity_type(const entity_type&) = delete;
    entity_type& operator=(const entity_type&) = delete;

    const std::string& short_name() const { return short_name_; }
    schema_model& model() const { return model_; }

    // Hierarchy. The base type is a lookup-only back reference; the model owns
    // every entity type.
    entity_type* base_type() const { return base_; }
    const std::vector<entity_type*>& direct_derived_types() const { return derived_; }
    std::vector<entity_type*> derived_types() const;
    std::vector<entity_type*> derived_types_inclusive();
    entity_type& root_type();
    const entity_type& root_type() const;
    bool is_in_hierarchy_of(const entity_type& other) const;

    /// Raises on_base_type_changed. Throws model_error on cycles or when this
    /// type declares a primary key.
    void set_base_type(entity_type* base);

    // Store-object annotations with provenance
    const name_override* find_annotation(annotation_kind kind) const;
    std::optional<name_source> annotation_source(annotation_kind kind) const;
    bool set_annotation(annotation_kind kind,
                        std::optional<std::string> value,
                        name_source source = name_source::explicit_set);
    bool remove_annotation(annotation_kind kind, name_source source = name_source::explicit_set);

    std::optional<std::string> table_name() const;
    std::optional<std::string> default_table_name() const;
    std::optional<name_source> table_name_source() const { return annotation_source(annotation_kind::table_name); }
    bool set_table_name(std::optional<std::string> name, name_source source = name_source::explicit_set) {
        return set_annotation(annotation_kind::table_name, std::move(name), source);
    }

    std::optional<std::string> schema() const;
    std::optional<std::string> default_schema() const;
    bool set_schema(std::optional<std::string> name, name_source source = name_source::explicit_set) {
        return set_annotation(annotation_kind::schema, std::move(name), source);
    }

    std::optional<std::string> view_name() const;
    std::optional<name_source> view_name_source() const { return annotation_source(annotation_kind::view_name); }
    bool set_view_name(std::optional<std::string> name, name_source source = name_source::explicit_set) {
        return set_annotation(annotation_kind::view_name, std::move(name), source);
    }
    std::optional<std::string> view_schema() const;

    std::optional<std::string> function_name() const;
    bool set_function_name(std::optional<std::string> name, name_source source = name_source::explicit_set) {
        return set_annotation(annotation_kind::function_name, std::move(name), source);
    }

    std::optional<std::string> sql_query() const;
    bool set_sql_query(std::optional<std::string> sql, name_source source = name_source::explicit_set) {
        return set_annotation(annotation_kind::sql_query, std::move(sql), source);
    }

    // Properties
    property& add_property(const std::string& name, column_type type, bool nullable = false);
    property* find_property(const std::string& name) const;
    std::vector<property*> declared_properties() const;
    /// Declared plus inherited, base types first.
    std::vector<property*> properties() const;

    // Keys
    key& set_primary_key(const std::vector<property*>& properties);
    key& set_primary_key(const std::vector<std::string>& property_names);
    /// The hierarchy root's primary key.
    key* find_primary_key() const;
    key& add_key(const std::vector<property*>& properties);
    std::vector<key*> declared_keys() const;

    // Foreign keys
    foreign_key& add_foreign_key(const std::vector<property*>& properties, entity_type& principal, bool unique = false);
    std::vector<foreign_key*> foreign_keys() const;
    foreign_key* find_ownership() const;

    /// The ownership this type shares `store` through (table splitting), or nullptr.
    foreign_key* find_table_sharing_ownership(const store_object_id& store) const;
    /// Column prefix accumulated over every table-sharing ownership edge.
    std::string column_prefix(const store_object_id& store) const;

    // Indexes
    table_index& add_index(const std::vector<property*>& properties, bool unique = false);
    std::vector<table_index*> indexes() const;

private:
    void check_owned(const std::vector<property*>& properties, const char* what) const;

    schema_model& model_;
    std::string short_name_;
    entity_type* base_ = nullptr;
    std::vector<entity_type*> derived_;
    std::map<annotation_kind, name_override> annotations_;
    std::vector<std::unique_ptr<property>> properties_;
    std::unique_ptr<key> primary_key_;
    std::vector<std::unique_ptr<key>> keys_;
    std::vector<std::unique_ptr<foreign_key>> foreign_keys_;
    std::vector<std::unique_ptr<table_index>> indexes_;
};

// ============================================================================
// schema_model - owns the entity types and dispatches mutation events
// ============================================================================

class schema_model {
public:
    /// Registers the shared-table column disambiguation convention first, so
    /// every convention added afterwards finalizes after it.
    schema_model();
    ~schema_model();

    schema_model(const schema_model&) = delete;
    schema_model& operator=(const schema_model&) = delete;

    entity_type& add_entity_type(const std::string& name);
    entity_type* find_entity_type(const std::string& name) const;
    std::vector<entity_type*> entity_types() const;

    const std::optional<std::string>& default_schema() const { return default_schema_; }
    void set_default_schema(std::optional<std::string> schema);

    convention_set& conventions() { return conventions_; }
    const convention_set& conventions() const { return conventions_; }

    /// Runs every convention's on_model_finalizing in registration order, then
    /// validate(). Further mutation throws model_error.
    void finalize();
    bool is_finalized() const { return finalized_; }

    /// Throws model_validation_error listing every name conflict.
    void validate() const;

    void ensure_mutable() const;

    // Event dispatch (called by the model's elements)
    void dispatch_entity_type_added(entity_type& entity);
    void dispatch_base_type_changed(entity_type& entity, entity_type* new_base, entity_type* old_base);
    void dispatch_property_added(property& prop);
    void dispatch_foreign_key_ownership_changed(foreign_key& fk);
    void dispatch_entity_annotation_changed(entity_type& entity,
                                            annotation_kind kind,
                                            const std::optional<std::string>& new_value,
                                            const std::optional<std::string>& old_value);
    void dispatch_foreign_key_added(foreign_key& fk);
    void dispatch_key_added(key& k);
    void dispatch_index_added(table_index& index);

private:
    template<typename Fn>
    void dispatch(Fn&& fn);

    std::vector<std::unique_ptr<entity_type>> entity_types_;
    std::optional<std::string> default_schema_;
    convention_set conventions_;
    bool finalized_ = false;
};

// Shared helper: joins column names with '_' as default names do
std::string join_column_names(const std::vector<property*>& properties, const store_object_id& store);

} // namespace namewise
