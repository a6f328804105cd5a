#include <NamewiseCore.hpp>
#include <algorithm>
#include <cassert>
#include <iostream>

using namespace namewise;

// ============================================================================
// Model Definitions
// ============================================================================

// Blog 1-n Post, Post owns an Address split into its table, Post is indexed
// on its foreign key, Blog has a unique index on Url.
void build_blogging_model(schema_model& model) {
    use_naming_convention(model, naming_convention::snake_case);

    auto& blog = model.add_entity_type("Blog");
    auto& blog_id = blog.add_property("Id", column_type::integer);
    auto& url = blog.add_property("Url", column_type::text);
    blog.add_property("Rating", column_type::real, true);
    blog.set_primary_key({&blog_id});
    blog.add_index({&url}, true);

    auto& post = model.add_entity_type("BlogPost");
    auto& post_id = post.add_property("Id", column_type::integer);
    auto& post_blog_id = post.add_property("BlogId", column_type::integer);
    post.add_property("Title", column_type::text);
    post.set_primary_key({&post_id});
    post.add_foreign_key({&post_blog_id}, blog);
    post.add_index({&post_blog_id});

    auto& location = model.add_entity_type("Location");
    auto& location_id = location.add_property("BlogPostId", column_type::integer);
    location.add_property("City", column_type::text);
    location.set_primary_key({&location_id});
    location.add_foreign_key({&location_id}, post, true).set_is_ownership(true);
}

// First column of every row `sql` returns, as text
std::vector<std::string> select_text(database& db, const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db.handle(), sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        throw db_error("Failed to prepare: " + sql);
    }
    std::vector<std::string> values;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        values.emplace_back(text ? text : "");
    }
    sqlite3_finalize(stmt);
    return values;
}

bool has_column(const std::vector<std::pair<std::string, std::string>>& columns,
                const std::string& name, const std::string& type) {
    return std::find(columns.begin(), columns.end(), std::make_pair(name, type)) != columns.end();
}

// ============================================================================
// Tests
// ============================================================================

void test_requires_finalized_model() {
    std::cout << "Testing DDL needs a finalized model..." << std::endl;

    schema_model model;
    build_blogging_model(model);

    bool threw = false;
    try {
        create_statements(model);
    } catch (const model_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  finalized model test passed!" << std::endl;
}

void test_create_statements() {
    std::cout << "Testing generated DDL..." << std::endl;

    schema_model model;
    build_blogging_model(model);
    model.finalize();

    auto statements = create_statements(model);
    assert(statements.size() == 2);
    assert(statements[0].table == "blog");
    assert(statements[1].table == "blog_post");

    const auto& blog_sql = statements[0].create_table;
    assert(blog_sql.find("CREATE TABLE \"blog\"") == 0);
    assert(blog_sql.find("\"id\" INTEGER NOT NULL") != std::string::npos);
    assert(blog_sql.find("\"rating\" REAL,") != std::string::npos);
    assert(blog_sql.find("CONSTRAINT \"pk_blog\" PRIMARY KEY (\"id\")") != std::string::npos);
    assert(statements[0].create_indexes.size() == 1);
    assert(statements[0].create_indexes[0].name == "ix_blog_url");
    assert(statements[0].create_indexes[0].sql == "CREATE UNIQUE INDEX \"ix_blog_url\" ON \"blog\" (\"url\")");
    assert(statements[1].columns.size() == 4);
    assert(statements[1].columns.back() == "blog_post_city");

    const auto& post_sql = statements[1].create_table;
    assert(post_sql.find("\"blog_post_city\" TEXT") != std::string::npos);
    assert(post_sql.find("CONSTRAINT \"fk_blog_post_blog_blog_id\" FOREIGN KEY (\"blog_id\") "
                         "REFERENCES \"blog\" (\"id\")") != std::string::npos);
    // The split owned type links rows of the same table: no constraint for it
    assert(post_sql.find("REFERENCES \"blog_post\"") == std::string::npos);

    std::cout << "  generated DDL test passed!" << std::endl;
}

void test_ensure_schema() {
    std::cout << "Testing schema materialization..." << std::endl;

    schema_model model;
    build_blogging_model(model);
    model.finalize();

    database db(":memory:");
    assert(ensure_schema(db, model) == 2);
    assert(!db.is_in_transaction());

    assert(db.table_exists("blog"));
    assert(db.table_exists("blog_post"));
    assert(!db.table_exists("location"));

    auto blog_columns = db.get_table_info("blog");
    assert(blog_columns.size() == 3);
    assert(blog_columns[0].first == "id");
    assert(has_column(blog_columns, "url", "TEXT"));
    assert(has_column(blog_columns, "rating", "REAL"));

    auto post_columns = db.get_table_info("blog_post");
    assert(post_columns.size() == 4);
    assert(has_column(post_columns, "blog_id", "INTEGER"));
    assert(has_column(post_columns, "title", "TEXT"));
    assert(has_column(post_columns, "blog_post_city", "TEXT"));

    auto post_indexes = db.get_index_names("blog_post");
    assert(post_indexes.size() == 1);
    assert(post_indexes[0] == "ix_blog_post_blog_id");

    // Constraint names end up in the stored DDL
    auto rows = select_text(db, "SELECT sql FROM sqlite_master WHERE type='table' AND name='blog_post'");
    assert(rows.size() == 1);
    assert(rows[0].find("pk_blog_post") != std::string::npos);
    assert(rows[0].find("fk_blog_post_blog_blog_id") != std::string::npos);

    // Rows go in under the rewritten names
    db.execute("INSERT INTO blog (id, url) VALUES (1, 'https://example.com')");
    db.execute("INSERT INTO blog_post (id, blog_id, title, blog_post_city) VALUES (7, 1, 'Hello', 'Lisbon')");
    auto cities = select_text(db, "SELECT blog_post_city FROM blog_post WHERE blog_id = 1");
    assert(cities.size() == 1);
    assert(cities[0] == "Lisbon");

    // Running it again creates nothing
    assert(ensure_schema(db, model) == 0);

    std::cout << "  schema materialization test passed!" << std::endl;
}

void test_existing_tables_reconciled() {
    std::cout << "Testing existing tables gain missing indexes..." << std::endl;

    schema_model model;
    build_blogging_model(model);
    model.finalize();

    database db(":memory:");
    // An older blog table without the url index and without the rating column
    db.execute("CREATE TABLE \"blog\" (\"id\" INTEGER NOT NULL, \"url\" TEXT NOT NULL, "
               "CONSTRAINT \"pk_blog\" PRIMARY KEY (\"id\"))");
    assert(db.get_index_names("blog").empty());

    assert(ensure_schema(db, model) == 1);
    assert(db.table_exists("blog_post"));

    auto blog_indexes = db.get_index_names("blog");
    assert(blog_indexes.size() == 1);
    assert(blog_indexes[0] == "ix_blog_url");

    // The table itself is left as it was
    auto blog_columns = db.get_table_info("blog");
    assert(blog_columns.size() == 2);
    assert(!has_column(blog_columns, "rating", "REAL"));

    // Nothing left to do
    assert(ensure_schema(db, model) == 0);
    assert(db.get_index_names("blog").size() == 1);

    std::cout << "  existing table reconciliation test passed!" << std::endl;
}

void test_foreign_keys_enforced() {
    std::cout << "Testing foreign keys are enforced..." << std::endl;

    schema_model model;
    build_blogging_model(model);
    model.finalize();

    database db(":memory:");
    ensure_schema(db, model);

    bool threw = false;
    try {
        db.execute("INSERT INTO blog_post (id, blog_id, title) VALUES (1, 42, 'Orphan')");
    } catch (const db_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  foreign key enforcement test passed!" << std::endl;
}

void test_transaction_rollback() {
    std::cout << "Testing transaction rollback..." << std::endl;

    database db(":memory:");
    db.execute("CREATE TABLE note (id INTEGER PRIMARY KEY, body TEXT)");
    {
        transaction txn(db);
        db.execute("INSERT INTO note (id, body) VALUES (1, 'draft')");
        assert(db.is_in_transaction());
        // Destroyed without commit
    }
    assert(!db.is_in_transaction());
    assert(select_text(db, "SELECT body FROM note").empty());

    {
        transaction txn(db);
        db.execute("INSERT INTO note (id, body) VALUES (2, 'kept')");
        txn.commit();
    }
    auto bodies = select_text(db, "SELECT body FROM note");
    assert(bodies.size() == 1);
    assert(bodies[0] == "kept");

    std::cout << "  transaction rollback test passed!" << std::endl;
}

void test_tpt_materialization() {
    std::cout << "Testing TPT tables materialize with distinct key names..." << std::endl;

    schema_model model;
    use_naming_convention(model, naming_convention::snake_case);
    auto& animal = model.add_entity_type("Animal");
    auto& id = animal.add_property("Id", column_type::integer);
    animal.add_property("Name", column_type::text);
    animal.set_primary_key({&id});
    auto& dog = model.add_entity_type("Dog");
    dog.add_property("GoodBoy", column_type::integer);
    dog.set_base_type(&animal);
    dog.set_table_name("dogs");
    model.finalize();

    database db(":memory:");
    assert(ensure_schema(db, model) == 2);

    auto dog_columns = db.get_table_info("dogs");
    assert(dog_columns.size() == 2);
    assert(has_column(dog_columns, "id", "INTEGER"));
    assert(has_column(dog_columns, "good_boy", "INTEGER"));

    auto statements = create_statements(model);
    assert(statements[0].create_table.find("CONSTRAINT \"PK_animal\"") != std::string::npos);
    assert(statements[1].create_table.find("CONSTRAINT \"PK_dogs\"") != std::string::npos);

    std::cout << "  TPT materialization test passed!" << std::endl;
}

// ============================================================================
// Main Test Runner
// ============================================================================

int main() {
    std::cout << "=== Schema Writer Tests ===" << std::endl;
    std::cout << std::endl;

    try {
        test_requires_finalized_model();
        test_create_statements();
        test_ensure_schema();
        test_existing_tables_reconciled();
        test_foreign_keys_enforced();
        test_transaction_rollback();
        test_tpt_materialization();

        std::cout << std::endl;
        std::cout << "All tests passed!" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
