#pragma once

#include "types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace namewise {

class schema_model;
class entity_type;
class property;
class key;
class foreign_key;
class table_index;

// ============================================================================
// convention - listener for structural mutations of a schema_model
//
// The model calls these synchronously, inline with the mutation, in the
// order the mutations happen. A convention may mutate the model from inside
// a callback; the resulting events are dispatched before the call returns.
// ============================================================================

class convention {
public:
    virtual ~convention() = default;

    virtual void on_entity_type_added(entity_type&) {}
    virtual void on_base_type_changed(entity_type&, entity_type* /*new_base*/, entity_type* /*old_base*/) {}
    virtual void on_property_added(property&) {}
    virtual void on_foreign_key_ownership_changed(foreign_key&) {}
    virtual void on_entity_annotation_changed(entity_type&,
                                              annotation_kind,
                                              const std::optional<std::string>& /*new_value*/,
                                              const std::optional<std::string>& /*old_value*/) {}
    virtual void on_foreign_key_added(foreign_key&) {}
    virtual void on_key_added(key&) {}
    virtual void on_index_added(table_index&) {}

    /// Called once from schema_model::finalize(), in registration order.
    virtual void on_model_finalizing(schema_model&) {}
};

// Ordered set of conventions. Dispatch and finalization follow insertion
// order, which is how a convention states that it runs after another.
class convention_set {
public:
    void add(std::shared_ptr<convention> c) {
        conventions_.push_back(std::move(c));
    }

    const std::vector<std::shared_ptr<convention>>& all() const { return conventions_; }
    size_t size() const { return conventions_.size(); }

private:
    std::vector<std::shared_ptr<convention>> conventions_;
};

} // namespace namewise
