#pragma once

#include "model.hpp"
#include <string>
#include <vector>

namespace namewise {

class database;

struct index_statement {
    std::string name;
    std::string sql;
};

// DDL for one table of a finalized model
struct table_statements {
    std::string table;
    std::vector<std::string> columns;
    std::string create_table;
    std::vector<index_statement> create_indexes;
};

/// SQLite DDL for every table the model maps to, in model order. Views,
/// functions and SQL queries are not materialized. Throws model_error if the
/// model has not been finalized.
std::vector<table_statements> create_statements(const schema_model& model);

/// Creates the tables and indexes that don't exist yet, in one transaction.
/// Existing tables are not altered: columns the model maps to that a table
/// lacks are logged as warnings. Returns the number of tables created.
size_t ensure_schema(database& db, const schema_model& model);

} // namespace namewise
