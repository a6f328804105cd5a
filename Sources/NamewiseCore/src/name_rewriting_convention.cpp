#include "namewise/name_rewriting_convention.hpp"
#include "namewise/mapping_classifier.hpp"
#include "namewise/model.hpp"
#include "namewise/config.hpp"
#include "namewise/log.hpp"
#include <vector>

namespace namewise {

namespace {

// Appends the owned types split into `principal`'s table, nested ones included.
void add_split_dependents(entity_type& principal, std::vector<entity_type*>& types) {
    for (auto* entity : principal.model().entity_types()) {
        auto* ownership = entity->find_ownership();
        if (ownership && &ownership->principal_entity_type() == &principal && is_table_split(*entity)) {
            types.push_back(entity);
            add_split_dependents(*entity, types);
        }
    }
}

} // namespace

name_rewriting_convention::name_rewriting_convention(std::shared_ptr<const name_rewriter> rewriter)
    : rewriter_(std::move(rewriter)) {
    if (!rewriter_) {
        throw config_error("name_rewriting_convention needs a rewriter");
    }
}

std::optional<std::string> name_rewriting_convention::rewrite(const std::optional<std::string>& name) const {
    // An absent default means there is nothing to rewrite yet.
    if (!name) return std::nullopt;
    return rewriter_->rewrite_name(*name);
}

// ============================================================================
// Event handlers
// ============================================================================

void name_rewriting_convention::on_entity_type_added(entity_type& entity) {
    // New entity types have no base type yet; it arrives through on_base_type_changed.
    // A split owned type takes its table from the principal.
    if (entity.base_type() || is_table_split(entity)) return;

    rewrite_table_name(entity);

    // A convention-sourced view name has no separate default; rewrite what is there.
    if (entity.view_name_source() == name_source::convention) {
        if (auto view_name = rewrite(entity.view_name())) {
            entity.set_view_name(view_name, name_source::convention);
        }
    }
}

void name_rewriting_convention::on_base_type_changed(entity_type& entity, entity_type* new_base, entity_type* old_base) {
    if (!new_base) {
        // Leaving a hierarchy: the type owns a table again, and the old
        // hierarchy may have stopped being TPT.
        rewrite_table_name(entity);
        if (old_base) {
            refresh_primary_key_name(old_base->root_type());
        }
        return;
    }

    // Joining a hierarchy. Under TPH the table and schema now come from the
    // root; under TPT they were set explicitly and these removals are refused.
    entity.remove_annotation(annotation_kind::table_name, name_source::convention);
    entity.remove_annotation(annotation_kind::schema, name_source::convention);
    refresh_primary_key_name(entity);
    LOG_DEBUG("naming", "%s joined %s as %s", entity.short_name().c_str(),
              new_base->short_name().c_str(), to_string(classify(entity)));
}

void name_rewriting_convention::on_property_added(property& prop) {
    rewrite_column_name(prop);
}

void name_rewriting_convention::on_foreign_key_ownership_changed(foreign_key& fk) {
    auto& owned = fk.declaring_entity_type();
    if (!fk.is_unique() || owned.table_name_source() == name_source::explicit_set) {
        return;
    }

    if (!fk.is_ownership()) {
        // No longer owned: the type gets its own table back.
        rewrite_table_name(owned);
        for (auto* prop : owned.properties()) {
            rewrite_column_name(*prop);
        }
        rewrite_column_derived_names(owned);
        rewrite_owned_dependents(owned);
        return;
    }

    // Becoming owned through a reference navigation: table splitting. Drop
    // the table, schema and key names set while the type stood alone so they
    // follow the principal, then prefix every column.
    LOG_DEBUG("naming", "%s splits into the table of %s", owned.short_name().c_str(),
              fk.principal_entity_type().short_name().c_str());
    owned.remove_annotation(annotation_kind::table_name, name_source::convention);
    owned.remove_annotation(annotation_kind::schema, name_source::convention);
    split_into_principal_table(owned);
}

void name_rewriting_convention::on_entity_annotation_changed(entity_type& entity,
                                                             annotation_kind kind,
                                                             const std::optional<std::string>& new_value,
                                                             const std::optional<std::string>& old_value) {
    switch (kind) {
        case annotation_kind::view_name:
        case annotation_kind::function_name:
        case annotation_kind::sql_query:
            // Mapped to another store object: a table name set by convention
            // (by us, when the type was added) no longer applies.
            if (new_value && entity.table_name_source() == name_source::convention) {
                LOG_DEBUG("naming", "%s: %s set, clearing table name", entity.short_name().c_str(), to_string(kind));
                entity.set_table_name(std::nullopt, name_source::convention);
            }
            return;
        case annotation_kind::schema:
        case annotation_kind::view_schema:
            return;
        case annotation_kind::table_name:
            on_table_name_changed(entity, new_value, old_value);
            return;
    }
}

void name_rewriting_convention::on_foreign_key_added(foreign_key& fk) {
    rewrite_constraint_name(fk);
}

void name_rewriting_convention::on_key_added(key& k) {
    if (k.is_primary_key()) {
        refresh_primary_key_name(k.declaring_entity_type());
        return;
    }
    rewrite_key_name(k);
}

void name_rewriting_convention::on_index_added(table_index& index) {
    rewrite_index_name(index);
}

void name_rewriting_convention::on_model_finalizing(schema_model& model) {
    for (auto* entity : model.entity_types()) {
        for (auto* prop : entity->declared_properties()) {
            rewrite_entity_prefix(*prop, entity->short_name());
        }
    }
}

// ============================================================================
// Table names
// ============================================================================

void name_rewriting_convention::rewrite_table_name(entity_type& entity) const {
    if (entity.table_name_source() == name_source::explicit_set) return;

    auto table_name = rewrite(entity.default_table_name());
    if (!table_name) return;

    LOG_DEBUG("naming", "%s: table %s", entity.short_name().c_str(), table_name->c_str());
    entity.set_table_name(table_name, name_source::convention);
}

void name_rewriting_convention::on_table_name_changed(entity_type& entity,
                                                      const std::optional<std::string>& new_value,
                                                      const std::optional<std::string>& old_value) const {
    auto table = store_object_id::create(entity, store_object_kind::table);
    if (!table) return;

    // An owned type given a table other than its principal's leaves table
    // splitting. One that had such a table and now resolves to the
    // principal's (its table removed, or set to the principal's) enters it.
    auto* ownership = entity.find_ownership();
    bool leaves_split = new_value && ownership &&
                        *new_value != ownership->principal_entity_type().table_name();
    bool enters_split = !leaves_split && old_value && ownership && is_table_split(entity) &&
                        *old_value != ownership->principal_entity_type().table_name();
    if (leaves_split) {
        LOG_DEBUG("naming", "%s leaves the table of %s", entity.short_name().c_str(),
                  ownership->principal_entity_type().short_name().c_str());
        restore_own_table_columns(entity);
    } else if (enters_split) {
        LOG_DEBUG("naming", "%s returns to the table of %s", entity.short_name().c_str(),
                  ownership->principal_entity_type().short_name().c_str());
        split_into_principal_table(entity);
    }

    refresh_primary_key_name(entity);

    // Foreign key, alternate key and index defaults embed the table name: on
    // this type, on the TPH types and split owned types sharing its table,
    // and on foreign keys pointing at any of them.
    std::vector<entity_type*> sharing;
    for (auto* type : entity.derived_types_inclusive()) {
        if (type != &entity && store_object_id::create(*type, store_object_kind::table) != table) {
            continue;
        }
        sharing.push_back(type);
        add_split_dependents(*type, sharing);
    }
    for (auto* type : sharing) {
        rewrite_column_derived_names(*type);
        for (auto* other : entity.model().entity_types()) {
            for (auto* fk : other->foreign_keys()) {
                if (&fk->principal_entity_type() == type && other != type) {
                    rewrite_constraint_name(*fk);
                }
            }
        }
    }

    if (leaves_split) {
        if (auto* pk = entity.find_primary_key()) {
            rewrite_key_name(*pk);
        }
    }
}

void name_rewriting_convention::refresh_primary_key_name(entity_type& entity) const {
    auto* pk = entity.find_primary_key();
    auto table = store_object_id::create(entity, store_object_kind::table);
    if (!pk || !table) return;

    auto& root = entity.root_type();
    if (row_internal_foreign_keys(entity, *table).empty() && !is_tpt_hierarchy(root)) {
        rewrite_key_name(*pk);
        return;
    }

    // TPT or a shared row: a key name of ours on one table would be picked up
    // by the others as well, so every type in the hierarchy falls back to the
    // default for its own table.
    for (auto* type : root.derived_types_inclusive()) {
        if (auto* type_pk = type->find_primary_key()) {
            type_pk->remove_name(name_source::convention);
        }
    }
    LOG_DEBUG("naming", "%s: cleared key names of hierarchy %s (%s)", entity.short_name().c_str(),
              root.short_name().c_str(), to_string(classify(entity)));
}

void name_rewriting_convention::rewrite_column_derived_names(entity_type& entity) const {
    for (auto* k : entity.declared_keys()) {
        if (!k->is_primary_key()) {
            rewrite_key_name(*k);
        }
    }
    for (auto* fk : entity.foreign_keys()) {
        rewrite_constraint_name(*fk);
    }
    for (auto* index : entity.indexes()) {
        rewrite_index_name(*index);
    }
}

// ============================================================================
// Column names
// ============================================================================

void name_rewriting_convention::rewrite_column_name(property& prop) const {
    auto& entity = prop.declaring_entity_type();

    // Drop our previous base name so nothing below reads it.
    prop.remove_column_name(name_source::convention);

    auto table = store_object_id::create(entity, store_object_kind::table);
    if (table && prop.find_shared_column_principal(*table)) {
        // The column is the principal's key column; it is named there.
        for (auto kind : all_store_object_kinds) {
            if (auto store = store_object_id::create(entity, kind)) {
                prop.remove_column_name(*store, name_source::convention);
            }
        }
        return;
    }

    if (prop.can_set_column_name(name_source::convention)) {
        auto base_name = table ? prop.default_column_name(*table) : prop.default_column_base_name();
        prop.set_column_name(rewriter_->rewrite_name(base_name), name_source::convention);
    }

    // Other store objects only get a name of their own where their default
    // differs from the base name.
    for (auto kind : all_store_object_kinds) {
        auto store = store_object_id::create(entity, kind);
        if (!store) continue;
        auto* store_override = prop.find_column_name_override(*store);
        if (store_override && store_override->source == name_source::explicit_set) continue;
        if (prop.column_name_source() == name_source::explicit_set) {
            prop.remove_column_name(*store, name_source::convention);
            continue;
        }
        auto column = rewriter_->rewrite_name(prop.default_column_name(*store));
        if (column == prop.column_base_name()) {
            prop.remove_column_name(*store, name_source::convention);
        } else {
            prop.set_column_name(column, *store, name_source::convention);
        }
    }
    LOG_DEBUG("naming", "%s.%s: column %s", entity.short_name().c_str(), prop.name().c_str(),
              prop.column_base_name().c_str());
}

void name_rewriting_convention::split_into_principal_table(entity_type& owned) const {
    // The key column is the principal's now and the key name follows its table.
    if (auto* pk = owned.find_primary_key()) {
        pk->remove_name(name_source::convention);
    }
    for (auto* prop : owned.properties()) {
        rewrite_column_name(*prop);
    }
    rewrite_column_derived_names(owned);
    rewrite_owned_dependents(owned);
}

void name_rewriting_convention::restore_own_table_columns(entity_type& owned) const {
    // Splitting prefixed the non-key columns; recompute them for the new table.
    for (auto* prop : owned.properties()) {
        if (!prop->is_primary_key() && prop->can_set_column_name(name_source::convention)) {
            rewrite_column_name(*prop);
        }
    }
    // Key columns shared the principal's column and carry no name of their own.
    for (auto* prop : owned.properties()) {
        if (prop->is_primary_key() && !prop->column_name_source()) {
            rewrite_column_name(*prop);
        }
    }
    rewrite_owned_dependents(owned);
}

void name_rewriting_convention::rewrite_owned_dependents(entity_type& principal) const {
    // Types split into `principal` prefix their columns with its prefix too.
    for (auto* entity : principal.model().entity_types()) {
        auto* ownership = entity->find_ownership();
        if (!ownership || &ownership->principal_entity_type() != &principal || !is_table_split(*entity)) {
            continue;
        }
        for (auto* prop : entity->properties()) {
            rewrite_column_name(*prop);
        }
        rewrite_column_derived_names(*entity);
        rewrite_owned_dependents(*entity);
    }
}

void name_rewriting_convention::rewrite_entity_prefix(property& prop, const std::string& short_name) const {
    const auto prefix = short_name + "_";
    auto replace_prefix = [&](const std::string& column) -> std::optional<std::string> {
        if (column.compare(0, prefix.size(), prefix) != 0) return std::nullopt;
        return rewriter_->rewrite_name(short_name) + column.substr(short_name.size());
    };

    if (prop.column_name_source() == name_source::convention) {
        if (auto column = replace_prefix(prop.column_base_name())) {
            prop.set_column_name(column, name_source::convention);
        }
    }

    auto& entity = prop.declaring_entity_type();
    for (auto kind : all_store_object_kinds) {
        auto store = store_object_id::create(entity, kind);
        if (!store || prop.column_name_source(*store) != name_source::convention) {
            continue;
        }
        if (auto column = replace_prefix(prop.column_name(*store))) {
            LOG_DEBUG("naming", "%s: column %s -> %s", store->display_name().c_str(),
                      prop.column_name(*store).c_str(), column->c_str());
            prop.set_column_name(column, *store, name_source::convention);
        }
    }
}

// ============================================================================
// Keys, foreign keys, indexes
// ============================================================================

void name_rewriting_convention::rewrite_key_name(key& k) const {
    if (k.key_name_source() == name_source::explicit_set) return;
    if (auto name = rewrite(k.default_name())) {
        k.set_name(name, name_source::convention);
    }
}

void name_rewriting_convention::rewrite_constraint_name(foreign_key& fk) const {
    if (fk.constraint_name_source() == name_source::explicit_set) return;
    if (auto name = rewrite(fk.default_constraint_name())) {
        fk.set_constraint_name(name, name_source::convention);
    }
}

void name_rewriting_convention::rewrite_index_name(table_index& index) const {
    if (index.database_name_source() == name_source::explicit_set) return;
    if (auto name = rewrite(index.default_database_name())) {
        index.set_database_name(name, name_source::convention);
    }
}

// ============================================================================
// Registration
// ============================================================================

std::shared_ptr<name_rewriting_convention> use_naming_convention(schema_model& model,
                                                                 std::shared_ptr<const name_rewriter> rewriter) {
    auto naming = std::make_shared<name_rewriting_convention>(std::move(rewriter));
    model.conventions().add(naming);
    return naming;
}

std::shared_ptr<name_rewriting_convention> use_naming_convention(schema_model& model, naming_convention convention) {
    LOG_INFO("naming", "using %s naming", to_string(convention));
    return use_naming_convention(model, make_rewriter(convention));
}

std::shared_ptr<name_rewriting_convention> use_naming_convention(schema_model& model, const naming_options& options) {
    set_log_level(options.level);
    return use_naming_convention(model, options.convention);
}

} // namespace namewise
