#pragma once

#include "convention.hpp"

namespace namewise {

// Finalization pass that keeps columns of a shared table apart: when
// properties of different entity types mapped to one table resolve the same
// column name, every one of them not belonging to the table's owner is
// renamed to <ShortName>_<column> at that table. Explicit column names are
// left alone.
//
// schema_model registers this convention before any other, so conventions
// added later see its result in on_model_finalizing.
class shared_table_convention : public convention {
public:
    void on_model_finalizing(schema_model& model) override;
};

} // namespace namewise
