#include "namewise/types.hpp"

namespace namewise {

const char* to_string(column_type type) {
    switch (type) {
        case column_type::integer: return "INTEGER";
        case column_type::real: return "REAL";
        case column_type::text: return "TEXT";
        case column_type::blob: return "BLOB";
    }
    return "BLOB";
}

const char* to_string(name_source source) {
    switch (source) {
        case name_source::convention: return "convention";
        case name_source::explicit_set: return "explicit";
    }
    return "convention";
}

const char* to_string(store_object_kind kind) {
    switch (kind) {
        case store_object_kind::table: return "table";
        case store_object_kind::view: return "view";
        case store_object_kind::function: return "function";
        case store_object_kind::sql_query: return "sql_query";
    }
    return "table";
}

const char* to_string(annotation_kind kind) {
    switch (kind) {
        case annotation_kind::table_name: return "TableName";
        case annotation_kind::schema: return "Schema";
        case annotation_kind::view_name: return "ViewName";
        case annotation_kind::view_schema: return "ViewSchema";
        case annotation_kind::function_name: return "FunctionName";
        case annotation_kind::sql_query: return "SqlQuery";
    }
    return "TableName";
}

const char* to_string(mapping_mode mode) {
    switch (mode) {
        case mapping_mode::standalone_table: return "standalone_table";
        case mapping_mode::tph_root: return "tph_root";
        case mapping_mode::tph_derived: return "tph_derived";
        case mapping_mode::tpt: return "tpt";
        case mapping_mode::owned_split_table: return "owned_split_table";
        case mapping_mode::owned_separate_table: return "owned_separate_table";
        case mapping_mode::mapped_to_view: return "mapped_to_view";
        case mapping_mode::mapped_to_function: return "mapped_to_function";
        case mapping_mode::mapped_to_query: return "mapped_to_query";
    }
    return "standalone_table";
}

} // namespace namewise
