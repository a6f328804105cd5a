#include "namewise/model.hpp"
#include "namewise/log.hpp"
#include "namewise/shared_table_convention.hpp"
#include <algorithm>

namespace namewise {

namespace {

bool refuses(const std::optional<name_override>& current, name_source source) {
    return current && current->source == name_source::explicit_set && source == name_source::convention;
}

// Returns false when an explicit value blocks a convention write.
bool assign(std::optional<name_override>& slot, std::optional<std::string> value, name_source source) {
    if (refuses(slot, source)) {
        return false;
    }
    slot = name_override{std::move(value), source};
    return true;
}

bool clear(std::optional<name_override>& slot, name_source source) {
    if (refuses(slot, source)) {
        return false;
    }
    slot.reset();
    return true;
}

} // namespace

std::optional<store_object_id> store_object_id::create(const entity_type& entity, store_object_kind kind) {
    switch (kind) {
        case store_object_kind::table:
            if (auto name = entity.table_name()) {
                return store_object_id{kind, *name, entity.schema()};
            }
            return std::nullopt;
        case store_object_kind::view:
            if (auto name = entity.view_name()) {
                return store_object_id{kind, *name, entity.view_schema()};
            }
            return std::nullopt;
        case store_object_kind::function:
            if (auto name = entity.function_name()) {
                return store_object_id{kind, *name, std::nullopt};
            }
            return std::nullopt;
        case store_object_kind::sql_query:
            // Queries have no name of their own; they are identified by the root type.
            if (entity.sql_query()) {
                return store_object_id{kind, entity.root_type().short_name() + ".MappedSqlQuery", std::nullopt};
            }
            return std::nullopt;
    }
    return std::nullopt;
}

std::string join_column_names(const std::vector<property*>& properties, const store_object_id& store) {
    std::string result;
    for (size_t i = 0; i < properties.size(); ++i) {
        if (i > 0) result += '_';
        result += properties[i]->column_name(store);
    }
    return result;
}

// ============================================================================
// property
// ============================================================================

property::property(entity_type& declaring, std::string name, column_type type, bool nullable)
    : declaring_(declaring), name_(std::move(name)), type_(type), nullable_(nullable) {}

bool property::is_primary_key() const {
    auto* pk = declaring_.find_primary_key();
    if (!pk) return false;
    const auto& props = pk->properties();
    return std::find(props.begin(), props.end(), this) != props.end();
}

const property* property::find_shared_column_principal(const store_object_id& store) const {
    auto* ownership = declaring_.find_table_sharing_ownership(store);
    if (!ownership || !is_primary_key()) {
        return nullptr;
    }
    const auto& fk_props = ownership->properties();
    const auto& principal_props = ownership->principal_key().properties();
    for (size_t i = 0; i < fk_props.size() && i < principal_props.size(); ++i) {
        if (fk_props[i] == this) {
            return principal_props[i];
        }
    }
    return nullptr;
}

std::string property::default_column_name(const store_object_id& store) const {
    if (const auto* shared = find_shared_column_principal(store)) {
        return shared->column_name(store);
    }
    return declaring_.column_prefix(store) + name_;
}

std::string property::column_base_name() const {
    if (column_name_ && column_name_->value) {
        return *column_name_->value;
    }
    return name_;
}

std::string property::column_name(const store_object_id& store) const {
    auto it = column_name_overrides_.find(store);
    if (it != column_name_overrides_.end() && it->second.value) {
        return *it->second.value;
    }
    if (column_name_ && column_name_->value) {
        return *column_name_->value;
    }
    return default_column_name(store);
}

std::optional<name_source> property::column_name_source() const {
    if (!column_name_) return std::nullopt;
    return column_name_->source;
}

std::optional<name_source> property::column_name_source(const store_object_id& store) const {
    auto it = column_name_overrides_.find(store);
    if (it != column_name_overrides_.end()) {
        return it->second.source;
    }
    return column_name_source();
}

bool property::set_column_name(std::optional<std::string> name, name_source source) {
    declaring_.model().ensure_mutable();
    return assign(column_name_, std::move(name), source);
}

bool property::remove_column_name(name_source source) {
    declaring_.model().ensure_mutable();
    return clear(column_name_, source);
}

bool property::can_set_column_name(name_source source) const {
    return !refuses(column_name_, source);
}

bool property::set_column_name(std::optional<std::string> name, const store_object_id& store, name_source source) {
    declaring_.model().ensure_mutable();
    auto it = column_name_overrides_.find(store);
    if (it != column_name_overrides_.end()) {
        if (it->second.source == name_source::explicit_set && source == name_source::convention) {
            return false;
        }
        it->second = name_override{std::move(name), source};
        return true;
    }
    column_name_overrides_.emplace(store, name_override{std::move(name), source});
    return true;
}

bool property::remove_column_name(const store_object_id& store, name_source source) {
    declaring_.model().ensure_mutable();
    auto it = column_name_overrides_.find(store);
    if (it == column_name_overrides_.end()) {
        return true;
    }
    if (it->second.source == name_source::explicit_set && source == name_source::convention) {
        return false;
    }
    column_name_overrides_.erase(it);
    return true;
}

const name_override* property::find_column_name_override(const store_object_id& store) const {
    auto it = column_name_overrides_.find(store);
    return it == column_name_overrides_.end() ? nullptr : &it->second;
}

// ============================================================================
// key
// ============================================================================

key::key(entity_type& declaring, std::vector<property*> properties, bool primary)
    : declaring_(declaring), properties_(std::move(properties)), primary_(primary) {}

std::optional<std::string> key::default_name() const {
    auto table = store_object_id::create(declaring_, store_object_kind::table);
    if (!table) return std::nullopt;
    return default_name(*table);
}

std::optional<std::string> key::default_name(const store_object_id& store) const {
    if (primary_) {
        return "PK_" + store.name;
    }
    return "AK_" + store.name + "_" + join_column_names(properties_, store);
}

std::optional<std::string> key::name() const {
    if (name_ && name_->value) return name_->value;
    return default_name();
}

std::optional<std::string> key::name(const store_object_id& store) const {
    if (name_ && name_->value) return name_->value;
    return default_name(store);
}

std::optional<name_source> key::key_name_source() const {
    if (!name_) return std::nullopt;
    return name_->source;
}

bool key::set_name(std::optional<std::string> name, name_source source) {
    declaring_.model().ensure_mutable();
    return assign(name_, std::move(name), source);
}

bool key::remove_name(name_source source) {
    declaring_.model().ensure_mutable();
    return clear(name_, source);
}

// ============================================================================
// foreign_key
// ============================================================================

foreign_key::foreign_key(entity_type& declaring,
                         std::vector<property*> properties,
                         entity_type& principal,
                         key& principal_key,
                         bool unique)
    : declaring_(declaring)
    , properties_(std::move(properties))
    , principal_(principal)
    , principal_key_(principal_key)
    , unique_(unique)
{}

void foreign_key::set_is_ownership(bool ownership) {
    declaring_.model().ensure_mutable();
    if (ownership_ == ownership) return;
    if (ownership && declaring_.find_ownership() != nullptr) {
        throw model_error("Entity type '" + declaring_.short_name() + "' already has an owner");
    }
    ownership_ = ownership;
    declaring_.model().dispatch_foreign_key_ownership_changed(*this);
}

void foreign_key::set_navigation_name(std::optional<std::string> name) {
    declaring_.model().ensure_mutable();
    navigation_name_ = std::move(name);
}

const std::string& foreign_key::dependent_prefix() const {
    return navigation_name_ ? *navigation_name_ : principal_.short_name();
}

bool foreign_key::is_row_internal(const store_object_id& table) const {
    if (principal_.is_in_hierarchy_of(declaring_)) {
        return false;
    }
    auto principal_table = store_object_id::create(principal_, store_object_kind::table);
    if (!principal_table || *principal_table != table || !principal_key_.is_primary_key()) {
        return false;
    }
    auto* pk = declaring_.find_primary_key();
    return pk && pk->properties() == properties_;
}

std::optional<std::string> foreign_key::default_constraint_name() const {
    auto table = store_object_id::create(declaring_, store_object_kind::table);
    auto principal_table = store_object_id::create(principal_, store_object_kind::table);
    if (!table || !principal_table) return std::nullopt;
    return "FK_" + table->name + "_" + principal_table->name + "_" + join_column_names(properties_, *table);
}

std::optional<std::string> foreign_key::constraint_name() const {
    if (constraint_name_ && constraint_name_->value) return constraint_name_->value;
    return default_constraint_name();
}

std::optional<name_source> foreign_key::constraint_name_source() const {
    if (!constraint_name_) return std::nullopt;
    return constraint_name_->source;
}

bool foreign_key::set_constraint_name(std::optional<std::string> name, name_source source) {
    declaring_.model().ensure_mutable();
    return assign(constraint_name_, std::move(name), source);
}

bool foreign_key::remove_constraint_name(name_source source) {
    declaring_.model().ensure_mutable();
    return clear(constraint_name_, source);
}

// ============================================================================
// table_index
// ============================================================================

table_index::table_index(entity_type& declaring, std::vector<property*> properties, bool unique)
    : declaring_(declaring), properties_(std::move(properties)), unique_(unique) {}

std::optional<std::string> table_index::default_database_name() const {
    auto table = store_object_id::create(declaring_, store_object_kind::table);
    if (!table) return std::nullopt;
    return "IX_" + table->name + "_" + join_column_names(properties_, *table);
}

std::optional<std::string> table_index::database_name() const {
    if (database_name_ && database_name_->value) return database_name_->value;
    return default_database_name();
}

std::optional<name_source> table_index::database_name_source() const {
    if (!database_name_) return std::nullopt;
    return database_name_->source;
}

bool table_index::set_database_name(std::optional<std::string> name, name_source source) {
    declaring_.model().ensure_mutable();
    return assign(database_name_, std::move(name), source);
}

bool table_index::remove_database_name(name_source source) {
    declaring_.model().ensure_mutable();
    return clear(database_name_, source);
}

// ============================================================================
// entity_type
// ============================================================================

entity_type::entity_type(schema_model& model, std::string short_name)
    : model_(model), short_name_(std::move(short_name)) {}

std::vector<entity_type*> entity_type::derived_types() const {
    std::vector<entity_type*> result;
    std::vector<entity_type*> pending(derived_.begin(), derived_.end());
    while (!pending.empty()) {
        auto* type = pending.front();
        pending.erase(pending.begin());
        result.push_back(type);
        pending.insert(pending.end(), type->derived_.begin(), type->derived_.end());
    }
    return result;
}

std::vector<entity_type*> entity_type::derived_types_inclusive() {
    std::vector<entity_type*> result{this};
    auto derived = derived_types();
    result.insert(result.end(), derived.begin(), derived.end());
    return result;
}

entity_type& entity_type::root_type() {
    entity_type* type = this;
    while (type->base_) type = type->base_;
    return *type;
}

const entity_type& entity_type::root_type() const {
    const entity_type* type = this;
    while (type->base_) type = type->base_;
    return *type;
}

bool entity_type::is_in_hierarchy_of(const entity_type& other) const {
    return &root_type() == &other.root_type();
}

void entity_type::set_base_type(entity_type* base) {
    model_.ensure_mutable();
    if (base == base_) return;

    if (base) {
        if (&base->model() != &model_) {
            throw model_error("Base type '" + base->short_name() + "' belongs to another model");
        }
        for (auto* type = base; type; type = type->base_) {
            if (type == this) {
                throw model_error("Setting '" + base->short_name() + "' as base type of '" +
                                  short_name_ + "' would create a cycle");
            }
        }
        if (primary_key_) {
            throw model_error("Entity type '" + short_name_ +
                              "' declares a primary key and cannot become a derived type");
        }
    }

    auto* old_base = base_;
    if (old_base) {
        auto& siblings = old_base->derived_;
        siblings.erase(std::remove(siblings.begin(), siblings.end(), this), siblings.end());
    }
    base_ = base;
    if (base) {
        base->derived_.push_back(this);
    }

    LOG_DEBUG("model", "%s: base type %s -> %s", short_name_.c_str(),
              old_base ? old_base->short_name().c_str() : "(none)",
              base ? base->short_name().c_str() : "(none)");
    model_.dispatch_base_type_changed(*this, base, old_base);
}

const name_override* entity_type::find_annotation(annotation_kind kind) const {
    auto it = annotations_.find(kind);
    return it == annotations_.end() ? nullptr : &it->second;
}

std::optional<name_source> entity_type::annotation_source(annotation_kind kind) const {
    auto* annotation = find_annotation(kind);
    if (!annotation) return std::nullopt;
    return annotation->source;
}

bool entity_type::set_annotation(annotation_kind kind, std::optional<std::string> value, name_source source) {
    model_.ensure_mutable();

    std::optional<std::string> old_value;
    auto it = annotations_.find(kind);
    if (it != annotations_.end()) {
        if (it->second.source == name_source::explicit_set && source == name_source::convention) {
            return false;
        }
        if (it->second.value == value) {
            // Same value: only provenance changes, nothing to announce.
            it->second.source = source;
            return true;
        }
        old_value = it->second.value;
        it->second = name_override{value, source};
    } else {
        annotations_.emplace(kind, name_override{value, source});
    }

    LOG_DEBUG("model", "%s: %s = %s (%s)", short_name_.c_str(), to_string(kind),
              value ? value->c_str() : "(null)", to_string(source));
    model_.dispatch_entity_annotation_changed(*this, kind, value, old_value);
    return true;
}

bool entity_type::remove_annotation(annotation_kind kind, name_source source) {
    model_.ensure_mutable();

    auto it = annotations_.find(kind);
    if (it == annotations_.end()) {
        return true;
    }
    if (it->second.source == name_source::explicit_set && source == name_source::convention) {
        return false;
    }
    auto old_value = std::move(it->second.value);
    annotations_.erase(it);

    LOG_DEBUG("model", "%s: %s removed", short_name_.c_str(), to_string(kind));
    model_.dispatch_entity_annotation_changed(*this, kind, std::nullopt, old_value);
    return true;
}

std::optional<std::string> entity_type::table_name() const {
    if (auto* annotation = find_annotation(annotation_kind::table_name)) {
        return annotation->value;
    }
    return default_table_name();
}

std::optional<std::string> entity_type::default_table_name() const {
    if (base_) {
        return base_->table_name();
    }
    if (auto* ownership = find_ownership(); ownership && ownership->is_unique()) {
        return ownership->principal_entity_type().table_name();
    }
    if (view_name() || function_name() || sql_query()) {
        return std::nullopt;
    }
    return short_name_;
}

std::optional<std::string> entity_type::schema() const {
    if (auto* annotation = find_annotation(annotation_kind::schema)) {
        return annotation->value;
    }
    return default_schema();
}

std::optional<std::string> entity_type::default_schema() const {
    if (base_) {
        return base_->schema();
    }
    if (auto* ownership = find_ownership(); ownership && ownership->is_unique()) {
        auto& principal = ownership->principal_entity_type();
        if (table_name() == principal.table_name()) {
            return principal.schema();
        }
    }
    return model_.default_schema();
}

std::optional<std::string> entity_type::view_name() const {
    if (auto* annotation = find_annotation(annotation_kind::view_name)) {
        return annotation->value;
    }
    return base_ ? base_->view_name() : std::nullopt;
}

std::optional<std::string> entity_type::view_schema() const {
    if (auto* annotation = find_annotation(annotation_kind::view_schema)) {
        return annotation->value;
    }
    if (base_) {
        return base_->view_schema();
    }
    return view_name() ? model_.default_schema() : std::nullopt;
}

std::optional<std::string> entity_type::function_name() const {
    if (auto* annotation = find_annotation(annotation_kind::function_name)) {
        return annotation->value;
    }
    return std::nullopt;
}

std::optional<std::string> entity_type::sql_query() const {
    if (auto* annotation = find_annotation(annotation_kind::sql_query)) {
        return annotation->value;
    }
    return base_ ? base_->sql_query() : std::nullopt;
}

property& entity_type::add_property(const std::string& name, column_type type, bool nullable) {
    model_.ensure_mutable();
    if (find_property(name)) {
        throw model_error("Property '" + short_name_ + "." + name + "' already exists");
    }
    properties_.push_back(std::make_unique<property>(*this, name, type, nullable));
    auto& prop = *properties_.back();
    model_.dispatch_property_added(prop);
    return prop;
}

property* entity_type::find_property(const std::string& name) const {
    for (const auto& prop : properties_) {
        if (prop->name() == name) return prop.get();
    }
    return base_ ? base_->find_property(name) : nullptr;
}

std::vector<property*> entity_type::declared_properties() const {
    std::vector<property*> result;
    result.reserve(properties_.size());
    for (const auto& prop : properties_) {
        result.push_back(prop.get());
    }
    return result;
}

std::vector<property*> entity_type::properties() const {
    std::vector<property*> result = base_ ? base_->properties() : std::vector<property*>{};
    for (const auto& prop : properties_) {
        result.push_back(prop.get());
    }
    return result;
}

void entity_type::check_owned(const std::vector<property*>& properties, const char* what) const {
    if (properties.empty()) {
        throw model_error(std::string("A ") + what + " on '" + short_name_ + "' needs at least one property");
    }
    for (auto* prop : properties) {
        if (!prop || find_property(prop->name()) != prop) {
            throw model_error(std::string("A ") + what + " on '" + short_name_ +
                              "' references a property it does not have");
        }
    }
}

key& entity_type::set_primary_key(const std::vector<property*>& properties) {
    model_.ensure_mutable();
    if (base_) {
        throw model_error("Derived type '" + short_name_ + "' cannot declare a primary key");
    }
    check_owned(properties, "primary key");
    primary_key_ = std::make_unique<key>(*this, properties, true);
    model_.dispatch_key_added(*primary_key_);
    return *primary_key_;
}

key& entity_type::set_primary_key(const std::vector<std::string>& property_names) {
    std::vector<property*> props;
    for (const auto& name : property_names) {
        auto* prop = find_property(name);
        if (!prop) {
            throw model_error("Property '" + short_name_ + "." + name + "' does not exist");
        }
        props.push_back(prop);
    }
    return set_primary_key(props);
}

key* entity_type::find_primary_key() const {
    return root_type().primary_key_.get();
}

key& entity_type::add_key(const std::vector<property*>& properties) {
    model_.ensure_mutable();
    if (base_) {
        throw model_error("Derived type '" + short_name_ + "' cannot declare a key");
    }
    check_owned(properties, "key");
    keys_.push_back(std::make_unique<key>(*this, properties, false));
    auto& k = *keys_.back();
    model_.dispatch_key_added(k);
    return k;
}

std::vector<key*> entity_type::declared_keys() const {
    std::vector<key*> result;
    if (primary_key_) result.push_back(primary_key_.get());
    for (const auto& k : keys_) {
        result.push_back(k.get());
    }
    return result;
}

foreign_key& entity_type::add_foreign_key(const std::vector<property*>& properties, entity_type& principal, bool unique) {
    model_.ensure_mutable();
    check_owned(properties, "foreign key");
    if (&principal.model() != &model_) {
        throw model_error("Principal '" + principal.short_name() + "' belongs to another model");
    }
    auto* principal_key = principal.find_primary_key();
    if (!principal_key) {
        throw model_error("Principal '" + principal.short_name() + "' has no primary key");
    }
    if (principal_key->properties().size() != properties.size()) {
        throw model_error("Foreign key on '" + short_name_ + "' does not match the primary key of '" +
                          principal.short_name() + "'");
    }
    foreign_keys_.push_back(std::make_unique<foreign_key>(*this, properties, principal, *principal_key, unique));
    auto& fk = *foreign_keys_.back();
    model_.dispatch_foreign_key_added(fk);
    return fk;
}

std::vector<foreign_key*> entity_type::foreign_keys() const {
    std::vector<foreign_key*> result;
    result.reserve(foreign_keys_.size());
    for (const auto& fk : foreign_keys_) {
        result.push_back(fk.get());
    }
    return result;
}

foreign_key* entity_type::find_ownership() const {
    for (const auto& fk : foreign_keys_) {
        if (fk->is_ownership()) return fk.get();
    }
    return nullptr;
}

foreign_key* entity_type::find_table_sharing_ownership(const store_object_id& store) const {
    auto* ownership = find_ownership();
    if (!ownership || !ownership->is_unique()) {
        return nullptr;
    }
    auto principal_store = store_object_id::create(ownership->principal_entity_type(), store.kind);
    return principal_store && *principal_store == store ? ownership : nullptr;
}

std::string entity_type::column_prefix(const store_object_id& store) const {
    auto* ownership = find_table_sharing_ownership(store);
    if (!ownership) {
        return {};
    }
    return ownership->principal_entity_type().column_prefix(store) + ownership->dependent_prefix() + "_";
}

table_index& entity_type::add_index(const std::vector<property*>& properties, bool unique) {
    model_.ensure_mutable();
    check_owned(properties, "index");
    indexes_.push_back(std::make_unique<table_index>(*this, properties, unique));
    auto& index = *indexes_.back();
    model_.dispatch_index_added(index);
    return index;
}

std::vector<table_index*> entity_type::indexes() const {
    std::vector<table_index*> result;
    result.reserve(indexes_.size());
    for (const auto& index : indexes_) {
        result.push_back(index.get());
    }
    return result;
}

// ============================================================================
// schema_model
// ============================================================================

schema_model::schema_model() {
    conventions_.add(std::make_shared<shared_table_convention>());
}

schema_model::~schema_model() = default;

void schema_model::ensure_mutable() const {
    if (finalized_) {
        throw model_error("The model is finalized and can no longer be changed");
    }
}

template<typename Fn>
void schema_model::dispatch(Fn&& fn) {
    // Copy: a convention may register another one while handling an event.
    auto conventions = conventions_.all();
    for (const auto& c : conventions) {
        fn(*c);
    }
}

entity_type& schema_model::add_entity_type(const std::string& name) {
    ensure_mutable();
    if (name.empty()) {
        throw model_error("Entity type name must not be empty");
    }
    if (find_entity_type(name)) {
        throw model_error("Entity type '" + name + "' already exists");
    }
    entity_types_.push_back(std::make_unique<entity_type>(*this, name));
    auto& entity = *entity_types_.back();
    LOG_DEBUG("model", "entity type %s added", name.c_str());
    dispatch_entity_type_added(entity);
    return entity;
}

entity_type* schema_model::find_entity_type(const std::string& name) const {
    for (const auto& entity : entity_types_) {
        if (entity->short_name() == name) return entity.get();
    }
    return nullptr;
}

std::vector<entity_type*> schema_model::entity_types() const {
    std::vector<entity_type*> result;
    result.reserve(entity_types_.size());
    for (const auto& entity : entity_types_) {
        result.push_back(entity.get());
    }
    return result;
}

void schema_model::set_default_schema(std::optional<std::string> schema) {
    ensure_mutable();
    default_schema_ = std::move(schema);
}

void schema_model::finalize() {
    ensure_mutable();
    LOG_DEBUG("model", "finalizing %zu entity types with %zu conventions",
              entity_types_.size(), conventions_.size());
    dispatch([this](convention& c) { c.on_model_finalizing(*this); });
    validate();
    finalized_ = true;
}

void schema_model::dispatch_entity_type_added(entity_type& entity) {
    dispatch([&](convention& c) { c.on_entity_type_added(entity); });
}

void schema_model::dispatch_base_type_changed(entity_type& entity, entity_type* new_base, entity_type* old_base) {
    dispatch([&](convention& c) { c.on_base_type_changed(entity, new_base, old_base); });
}

void schema_model::dispatch_property_added(property& prop) {
    dispatch([&](convention& c) { c.on_property_added(prop); });
}

void schema_model::dispatch_foreign_key_ownership_changed(foreign_key& fk) {
    dispatch([&](convention& c) { c.on_foreign_key_ownership_changed(fk); });
}

void schema_model::dispatch_entity_annotation_changed(entity_type& entity,
                                                      annotation_kind kind,
                                                      const std::optional<std::string>& new_value,
                                                      const std::optional<std::string>& old_value) {
    dispatch([&](convention& c) { c.on_entity_annotation_changed(entity, kind, new_value, old_value); });
}

void schema_model::dispatch_foreign_key_added(foreign_key& fk) {
    dispatch([&](convention& c) { c.on_foreign_key_added(fk); });
}

void schema_model::dispatch_key_added(key& k) {
    dispatch([&](convention& c) { c.on_key_added(k); });
}

void schema_model::dispatch_index_added(table_index& index) {
    dispatch([&](convention& c) { c.on_index_added(index); });
}

} // namespace namewise
