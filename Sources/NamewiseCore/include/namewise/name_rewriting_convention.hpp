#pragma once

#include "convention.hpp"
#include "name_rewriter.hpp"
#include <memory>
#include <optional>
#include <string>

namespace namewise {

struct naming_options;

// ============================================================================
// name_rewriting_convention
//
// Keeps every convention-sourced table, column, key, foreign key and index
// name equal to rewrite(default name) while the model is being built. Each
// handler re-derives the defaults from the model's current state, so events
// may arrive in any order and any number of times. Explicit names are never
// touched.
// ============================================================================

class name_rewriting_convention : public convention {
public:
    explicit name_rewriting_convention(std::shared_ptr<const name_rewriter> rewriter);

    const name_rewriter& rewriter() const { return *rewriter_; }

    void on_entity_type_added(entity_type& entity) override;
    void on_base_type_changed(entity_type& entity, entity_type* new_base, entity_type* old_base) override;
    void on_property_added(property& prop) override;
    void on_foreign_key_ownership_changed(foreign_key& fk) override;
    void on_entity_annotation_changed(entity_type& entity,
                                      annotation_kind kind,
                                      const std::optional<std::string>& new_value,
                                      const std::optional<std::string>& old_value) override;
    void on_foreign_key_added(foreign_key& fk) override;
    void on_key_added(key& k) override;
    void on_index_added(table_index& index) override;

    /// Rewrites the <ShortName>_ prefixes shared_table_convention put on
    /// colliding columns of a shared table.
    ///
    /// Precondition: shared_table_convention has already finalized. The model
    /// finalizes conventions in registration order and registers that one at
    /// construction, so this holds for any convention added afterwards.
    void on_model_finalizing(schema_model& model) override;

private:
    std::optional<std::string> rewrite(const std::optional<std::string>& name) const;

    void rewrite_table_name(entity_type& entity) const;
    void rewrite_column_name(property& prop) const;
    void rewrite_key_name(key& k) const;
    void rewrite_constraint_name(foreign_key& fk) const;
    void rewrite_index_name(table_index& index) const;

    void on_table_name_changed(entity_type& entity,
                               const std::optional<std::string>& new_value,
                               const std::optional<std::string>& old_value) const;
    void refresh_primary_key_name(entity_type& entity) const;
    void rewrite_column_derived_names(entity_type& entity) const;
    void split_into_principal_table(entity_type& owned) const;
    void restore_own_table_columns(entity_type& owned) const;
    void rewrite_owned_dependents(entity_type& principal) const;
    void rewrite_entity_prefix(property& prop, const std::string& short_name) const;

    std::shared_ptr<const name_rewriter> rewriter_;
};

/// Registers a name_rewriting_convention on `model`. Entity types added before
/// this call are not renamed.
std::shared_ptr<name_rewriting_convention> use_naming_convention(schema_model& model,
                                                                 std::shared_ptr<const name_rewriter> rewriter);
std::shared_ptr<name_rewriting_convention> use_naming_convention(schema_model& model, naming_convention convention);
/// Also applies the options' log level.
std::shared_ptr<name_rewriting_convention> use_naming_convention(schema_model& model, const naming_options& options);

} // namespace namewise
