#include <NamewiseCore.hpp>
#include <cassert>
#include <iostream>
#include <vector>

using namespace namewise;

// ============================================================================
// Helpers
// ============================================================================

// Records every annotation change the model announces.
class recording_convention : public convention {
public:
    struct annotation_event {
        std::string entity;
        annotation_kind kind;
        std::optional<std::string> new_value;
        std::optional<std::string> old_value;
    };

    void on_entity_annotation_changed(entity_type& entity,
                                      annotation_kind kind,
                                      const std::optional<std::string>& new_value,
                                      const std::optional<std::string>& old_value) override {
        annotations.push_back({entity.short_name(), kind, new_value, old_value});
    }

    void on_property_added(property& prop) override {
        properties.push_back(prop.name());
    }

    std::vector<annotation_event> annotations;
    std::vector<std::string> properties;
};

entity_type& add_keyed_entity(schema_model& model, const std::string& name) {
    auto& entity = model.add_entity_type(name);
    auto& id = entity.add_property("Id", column_type::integer);
    entity.set_primary_key({&id});
    return entity;
}

template<typename Fn>
bool throws_model_error(Fn&& fn) {
    try {
        fn();
    } catch (const model_error&) {
        return true;
    }
    return false;
}

// ============================================================================
// Defaults and provenance
// ============================================================================

void test_default_names() {
    std::cout << "Testing default names..." << std::endl;

    schema_model model;
    auto& blog = add_keyed_entity(model, "Blog");
    auto& title = blog.add_property("Title", column_type::text);
    auto& index = blog.add_index({&title}, true);

    auto& post = add_keyed_entity(model, "Post");
    auto& blog_id = post.add_property("BlogId", column_type::integer);
    auto& fk = post.add_foreign_key({&blog_id}, blog);

    assert(blog.table_name() == "Blog");
    assert(!blog.table_name_source().has_value());
    assert(title.column_name(store_object_id::table("Blog")) == "Title");
    assert(blog.find_primary_key()->name() == "PK_Blog");
    assert(index.database_name() == "IX_Blog_Title");
    assert(fk.constraint_name() == "FK_Post_Blog_BlogId");

    auto& ak = blog.add_key({&title});
    assert(ak.name() == "AK_Blog_Title");

    std::cout << "  default names test passed!" << std::endl;
}

void test_explicit_names_refuse_convention() {
    std::cout << "Testing explicit names refuse convention writes..." << std::endl;

    schema_model model;
    auto& blog = add_keyed_entity(model, "Blog");
    auto& title = blog.add_property("Title", column_type::text);

    assert(blog.set_table_name("Blogs"));
    assert(blog.table_name_source() == name_source::explicit_set);
    assert(!blog.set_table_name("blog", name_source::convention));
    assert(!blog.remove_annotation(annotation_kind::table_name, name_source::convention));
    assert(blog.table_name() == "Blogs");

    assert(title.set_column_name("TheTitle"));
    assert(!title.can_set_column_name(name_source::convention));
    assert(!title.set_column_name("title", name_source::convention));
    assert(title.column_base_name() == "TheTitle");

    // A convention value can be replaced by an explicit one
    auto* pk = blog.find_primary_key();
    assert(pk->set_name("pk_blog", name_source::convention));
    assert(pk->set_name("MyKey"));
    assert(pk->name() == "MyKey");
    assert(pk->key_name_source() == name_source::explicit_set);

    std::cout << "  explicit names test passed!" << std::endl;
}

void test_annotation_events() {
    std::cout << "Testing annotation change events..." << std::endl;

    schema_model model;
    auto recorder = std::make_shared<recording_convention>();
    model.conventions().add(recorder);

    auto& blog = model.add_entity_type("Blog");
    blog.set_table_name("blogs");
    assert(recorder->annotations.size() == 1);
    assert(recorder->annotations[0].kind == annotation_kind::table_name);
    assert(recorder->annotations[0].new_value == "blogs");
    assert(!recorder->annotations[0].old_value.has_value());

    // Same value: provenance only, no event
    blog.set_table_name("blogs");
    assert(recorder->annotations.size() == 1);

    blog.set_table_name("posts");
    assert(recorder->annotations.size() == 2);
    assert(recorder->annotations[1].old_value == "blogs");

    blog.remove_annotation(annotation_kind::table_name);
    assert(recorder->annotations.size() == 3);
    assert(!recorder->annotations[2].new_value.has_value());
    assert(blog.table_name() == "Blog");

    // Removing an absent annotation is a no-op
    blog.remove_annotation(annotation_kind::table_name);
    assert(recorder->annotations.size() == 3);

    blog.add_property("Title", column_type::text);
    assert(recorder->properties.size() == 1);
    assert(recorder->properties[0] == "Title");

    std::cout << "  annotation change events test passed!" << std::endl;
}

// ============================================================================
// Hierarchies and ownership
// ============================================================================

void test_hierarchy_defaults() {
    std::cout << "Testing hierarchy defaults..." << std::endl;

    schema_model model;
    model.set_default_schema("zoo");
    auto& animal = add_keyed_entity(model, "Animal");
    auto& dog = model.add_entity_type("Dog");
    auto& puppy = model.add_entity_type("Puppy");
    dog.set_base_type(&animal);
    puppy.set_base_type(&dog);

    assert(&puppy.root_type() == &animal);
    assert(dog.table_name() == "Animal");
    assert(puppy.table_name() == "Animal");
    assert(puppy.schema() == "zoo");
    assert(puppy.find_primary_key() == animal.find_primary_key());
    assert(animal.derived_types().size() == 2);
    assert(animal.derived_types_inclusive().front() == &animal);
    assert(puppy.find_property("Id") == animal.find_property("Id"));
    assert(puppy.properties().size() == 1);

    assert(classify(animal) == mapping_mode::tph_root);
    assert(classify(dog) == mapping_mode::tph_derived);
    assert(!is_tpt_hierarchy(animal));

    dog.set_table_name("Dogs");
    assert(is_tpt_hierarchy(animal));
    assert(classify(animal) == mapping_mode::tpt);
    assert(classify(dog) == mapping_mode::tpt);
    assert(puppy.table_name() == "Dogs");

    auto* pk = animal.find_primary_key();
    assert(pk->name(store_object_id::table("Animal", "zoo")) == "PK_Animal");
    assert(pk->name(store_object_id::table("Dogs", "zoo")) == "PK_Dogs");

    dog.set_base_type(nullptr);
    assert(animal.direct_derived_types().empty());
    assert(classify(animal) == mapping_mode::standalone_table);

    std::cout << "  hierarchy defaults test passed!" << std::endl;
}

void test_hierarchy_errors() {
    std::cout << "Testing hierarchy errors..." << std::endl;

    schema_model model;
    auto& animal = add_keyed_entity(model, "Animal");
    auto& dog = model.add_entity_type("Dog");
    auto& cat = add_keyed_entity(model, "Cat");
    dog.set_base_type(&animal);

    assert(throws_model_error([&] { animal.set_base_type(&dog); }));
    assert(throws_model_error([&] { cat.set_base_type(&animal); }));
    assert(throws_model_error([&] { dog.set_primary_key(std::vector<std::string>{"Id"}); }));
    assert(throws_model_error([&] { model.add_entity_type("Dog"); }));
    assert(throws_model_error([&] { animal.add_property("Id", column_type::integer); }));
    assert(throws_model_error([&] { cat.set_primary_key(std::vector<std::string>{"Missing"}); }));

    auto& other = model.add_entity_type("Other");
    auto& bad_fk = other.add_property("AnimalId", column_type::integer);
    assert(throws_model_error([&] { animal.add_index({&bad_fk}); }));
    assert(throws_model_error([&] { other.add_foreign_key({&bad_fk}, other); }));

    std::cout << "  hierarchy errors test passed!" << std::endl;
}

void test_ownership_defaults() {
    std::cout << "Testing ownership defaults..." << std::endl;

    schema_model model;
    auto& person = add_keyed_entity(model, "Person");
    auto& address = model.add_entity_type("Address");
    auto& person_id = address.add_property("PersonId", column_type::integer);
    auto& street = address.add_property("Street", column_type::text);
    address.set_primary_key({&person_id});
    auto& fk = address.add_foreign_key({&person_id}, person, true);

    assert(classify(address) == mapping_mode::standalone_table);
    fk.set_is_ownership(true);

    auto table = store_object_id::table("Person");
    assert(address.table_name() == "Person");
    assert(classify(address) == mapping_mode::owned_split_table);
    assert(is_table_split(address));
    assert(fk.is_row_internal(table));
    assert(row_internal_foreign_keys(address, table).size() == 1);
    assert(street.column_name(table) == "Person_Street");
    assert(person_id.column_name(table) == "Id");

    fk.set_navigation_name("HomeAddress");
    assert(street.column_name(table) == "HomeAddress_Street");

    auto& other_owner = add_keyed_entity(model, "Company");
    auto& company_id = address.add_property("CompanyId", column_type::integer, true);
    auto& second = address.add_foreign_key({&company_id}, other_owner, true);
    assert(throws_model_error([&] { second.set_is_ownership(true); }));

    address.set_table_name("Addresses");
    assert(classify(address) == mapping_mode::owned_separate_table);
    assert(street.column_name(store_object_id::table("Addresses")) == "Street");

    std::cout << "  ownership defaults test passed!" << std::endl;
}

void test_alternate_store_objects() {
    std::cout << "Testing views, functions and queries..." << std::endl;

    schema_model model;
    auto& report = model.add_entity_type("Report");
    report.set_view_name("ReportView");
    assert(!report.table_name().has_value());
    assert(classify(report) == mapping_mode::mapped_to_view);

    auto& usage = model.add_entity_type("Usage");
    usage.set_function_name("GetUsage");
    assert(classify(usage) == mapping_mode::mapped_to_function);

    auto& summary = model.add_entity_type("Summary");
    summary.set_sql_query("SELECT 1");
    assert(classify(summary) == mapping_mode::mapped_to_query);
    auto store = store_object_id::create(summary, store_object_kind::sql_query);
    assert(store.has_value());
    assert(store->name == "Summary.MappedSqlQuery");

    std::cout << "  alternate store objects test passed!" << std::endl;
}

// ============================================================================
// Table mapping and validation
// ============================================================================

void test_table_mapping() {
    std::cout << "Testing table mapping..." << std::endl;

    schema_model model;
    auto& animal = add_keyed_entity(model, "Animal");
    animal.add_property("Name", column_type::text);
    auto& dog = model.add_entity_type("Dog");
    dog.add_property("Breed", column_type::text);
    dog.set_base_type(&animal);
    auto& cat = model.add_entity_type("Cat");
    cat.add_property("Lives", column_type::integer);
    cat.set_base_type(&animal);
    cat.set_table_name("Cats");

    auto tables = map_tables(model);
    assert(tables.size() == 2);

    const auto& animals = tables[0];
    assert(animals.table.name == "Animal");
    assert(animals.owner == &animal);
    assert(animals.entity_types.size() == 2);
    assert(animals.columns.size() == 3);
    assert(animals.find_column("Breed") != nullptr);
    assert(animals.find_column("Lives") == nullptr);

    const auto& cats = tables[1];
    assert(cats.table.name == "Cats");
    assert(cats.owner == &cat);
    assert(cats.columns.size() == 2);
    assert(cats.columns[0].name == "Id");
    assert(cats.columns[1].name == "Lives");

    std::cout << "  table mapping test passed!" << std::endl;
}

void test_validation_rejects_collisions() {
    std::cout << "Testing validation of colliding names..." << std::endl;

    {
        // TPT with one explicit key name used by both tables
        schema_model model;
        auto& animal = add_keyed_entity(model, "Animal");
        auto& dog = model.add_entity_type("Dog");
        dog.set_base_type(&animal);
        dog.set_table_name("Dogs");
        animal.find_primary_key()->set_name("PK_Shared");

        bool failed = false;
        try {
            model.finalize();
        } catch (const model_validation_error& e) {
            failed = std::string(e.what()).find("PK_Shared") != std::string::npos;
        }
        assert(failed);
        assert(!model.is_finalized());
    }
    {
        // Two indexes named alike on one table
        schema_model model;
        auto& blog = add_keyed_entity(model, "Blog");
        auto& title = blog.add_property("Title", column_type::text);
        auto& url = blog.add_property("Url", column_type::text);
        blog.add_index({&title}).set_database_name("IX_Same");
        blog.add_index({&url}).set_database_name("IX_Same");

        bool failed = false;
        try {
            model.finalize();
        } catch (const model_validation_error&) {
            failed = true;
        }
        assert(failed);
    }
    {
        // Explicitly shared columns are allowed
        schema_model model;
        auto& animal = add_keyed_entity(model, "Animal");
        auto& dog = model.add_entity_type("Dog");
        auto& cat = model.add_entity_type("Cat");
        dog.add_property("Name", column_type::text).set_column_name("Name");
        cat.add_property("Name", column_type::text).set_column_name("Name");
        dog.set_base_type(&animal);
        cat.set_base_type(&animal);

        model.finalize();
        assert(model.is_finalized());
        assert(throws_model_error([&] { model.add_entity_type("Late"); }));
    }

    std::cout << "  validation test passed!" << std::endl;
}

void test_shared_table_disambiguation() {
    std::cout << "Testing shared table column disambiguation..." << std::endl;

    schema_model model;
    auto& person = add_keyed_entity(model, "Person");
    auto& employee = model.add_entity_type("Employee");
    auto& manager = model.add_entity_type("Manager");
    auto& employee_name = employee.add_property("Name", column_type::text);
    auto& manager_name = manager.add_property("Name", column_type::text);
    employee.set_base_type(&person);
    manager.set_base_type(&person);

    model.finalize();

    auto table = store_object_id::table("Person");
    assert(employee_name.column_name(table) == "Employee_Name");
    assert(manager_name.column_name(table) == "Manager_Name");
    assert(employee_name.column_name_source(table) == name_source::convention);

    std::cout << "  shared table disambiguation test passed!" << std::endl;
}

// ============================================================================
// Main Test Runner
// ============================================================================

int main() {
    std::cout << "=== Model Tests ===" << std::endl;
    std::cout << std::endl;

    try {
        test_default_names();
        test_explicit_names_refuse_convention();
        test_annotation_events();
        test_hierarchy_defaults();
        test_hierarchy_errors();
        test_ownership_defaults();
        test_alternate_store_objects();
        test_table_mapping();
        test_validation_rejects_collisions();
        test_shared_table_disambiguation();

        std::cout << std::endl;
        std::cout << "All tests passed!" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
