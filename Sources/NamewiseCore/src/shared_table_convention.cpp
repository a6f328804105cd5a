#include "namewise/shared_table_convention.hpp"
#include "namewise/table_mapping.hpp"
#include "namewise/log.hpp"
#include <algorithm>

namespace namewise {

void shared_table_convention::on_model_finalizing(schema_model& model) {
    for (const auto& mapping : map_tables(model)) {
        if (mapping.entity_types.size() < 2) continue;

        std::vector<property*> owner_properties;
        if (mapping.owner) {
            owner_properties = mapping.owner->properties();
        }

        for (const auto& column : mapping.columns) {
            if (column.properties.size() < 2) continue;

            for (auto* prop : column.properties) {
                if (std::find(owner_properties.begin(), owner_properties.end(), prop) != owner_properties.end()) {
                    continue;
                }
                if (prop->column_name_source(mapping.table) == name_source::explicit_set) {
                    continue;
                }
                auto unique_name = prop->declaring_entity_type().short_name() + "_" + column.name;
                LOG_DEBUG("shared_table", "%s: column %s of %s.%s -> %s",
                          mapping.table.display_name().c_str(), column.name.c_str(),
                          prop->declaring_entity_type().short_name().c_str(), prop->name().c_str(),
                          unique_name.c_str());
                prop->set_column_name(unique_name, mapping.table, name_source::convention);
            }
        }
    }
}

} // namespace namewise
