#include "namewise/mapping_classifier.hpp"

namespace namewise {

mapping_mode classify(const entity_type& entity) {
    auto table = store_object_id::create(entity, store_object_kind::table);
    if (!table) {
        if (entity.view_name()) return mapping_mode::mapped_to_view;
        if (entity.function_name()) return mapping_mode::mapped_to_function;
        if (entity.sql_query()) return mapping_mode::mapped_to_query;
    }

    if (entity.find_ownership()) {
        return table && entity.find_table_sharing_ownership(*table)
            ? mapping_mode::owned_split_table
            : mapping_mode::owned_separate_table;
    }

    const auto& root = entity.root_type();
    if (entity.base_type()) {
        return is_tpt_hierarchy(root) ? mapping_mode::tpt : mapping_mode::tph_derived;
    }
    if (!entity.direct_derived_types().empty()) {
        return is_tpt_hierarchy(root) ? mapping_mode::tpt : mapping_mode::tph_root;
    }
    return mapping_mode::standalone_table;
}

bool is_tpt_hierarchy(const entity_type& root) {
    auto root_table = root.table_name();
    for (auto* derived : root.direct_derived_types()) {
        if (derived->table_name() != root_table) {
            return true;
        }
    }
    return false;
}

bool is_table_split(const entity_type& entity) {
    auto table = store_object_id::create(entity, store_object_kind::table);
    return table && entity.find_table_sharing_ownership(*table) != nullptr;
}

std::vector<foreign_key*> row_internal_foreign_keys(const entity_type& entity, const store_object_id& table) {
    std::vector<foreign_key*> result;
    for (auto* fk : entity.foreign_keys()) {
        if (fk->is_row_internal(table)) {
            result.push_back(fk);
        }
    }
    return result;
}

} // namespace namewise
