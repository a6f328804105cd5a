#pragma once

#include "model.hpp"
#include <string>
#include <vector>

namespace namewise {

// One physical column of a table and the properties mapped to it. More than
// one property means a collision, unless the users mapped them there on purpose.
struct column_mapping {
    std::string name;
    std::vector<property*> properties;
};

// Every entity type sharing one table, as the model resolves it right now.
struct table_mapping {
    store_object_id table;
    /// The type the table belongs to: a hierarchy root, a TPT derived type or a
    /// standalone type. Null if only split owned types map here.
    entity_type* owner = nullptr;
    std::vector<entity_type*> entity_types;
    std::vector<column_mapping> columns;

    const column_mapping* find_column(const std::string& name) const;
};

/// Groups the model's entity types by the table they map to, in model order.
std::vector<table_mapping> map_tables(const schema_model& model);

} // namespace namewise
