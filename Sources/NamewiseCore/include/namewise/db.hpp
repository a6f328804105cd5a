#pragma once

#include <sqlite3.h>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace namewise {

class db_error : public std::runtime_error {
public:
    explicit db_error(const std::string& msg) : std::runtime_error(msg) {}
};

// Thin RAII wrapper over a SQLite connection, used to materialize a
// finalized schema_model.
class database {
public:
    explicit database(const std::string& path);
    ~database();

    database(const database&) = delete;
    database& operator=(const database&) = delete;

    bool table_exists(const std::string& name) const;

    // Column name -> SQL type (uppercase), in declaration order
    std::vector<std::pair<std::string, std::string>> get_table_info(const std::string& table) const;

    // Names of the indexes declared on `table`, excluding SQLite's autoindexes
    std::vector<std::string> get_index_names(const std::string& table) const;

    void execute(const std::string& sql);

    // Transaction support
    void begin_transaction();
    void commit();
    void rollback();
    bool is_in_transaction() const;

    sqlite3* handle() const { return db_; }

private:
    sqlite3* db_ = nullptr;
};

// RAII transaction guard
class transaction {
public:
    explicit transaction(database& db);
    ~transaction();

    transaction(const transaction&) = delete;
    transaction& operator=(const transaction&) = delete;

    void commit();
    void rollback();

private:
    database& db_;
    bool completed_ = false;
};

} // namespace namewise
