#pragma once

#include "model.hpp"
#include <vector>

namespace namewise {

// ============================================================================
// Structural state classification
//
// Pure functions of the model's current state. Nothing is cached: a table
// name change on any member of a hierarchy can flip the verdict for all of it.
// ============================================================================

/// How `entity` maps right now. Priority: alternate store object without a
/// table, ownership, inheritance, standalone.
mapping_mode classify(const entity_type& entity);

/// TPT when any direct derived type of `root` resolves a table name other
/// than the root's.
bool is_tpt_hierarchy(const entity_type& root);

/// Owned through a non-collection ownership and sharing the principal's table.
bool is_table_split(const entity_type& entity);

/// Foreign keys declared on `entity` that link rows sharing `table`.
std::vector<foreign_key*> row_internal_foreign_keys(const entity_type& entity, const store_object_id& table);

} // namespace namewise
