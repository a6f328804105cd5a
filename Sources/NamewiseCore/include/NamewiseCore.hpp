#pragma once

// NamewiseCore - database naming conventions for a relational schema model
//
// Usage:
//   #include <NamewiseCore.hpp>
//
//   int main() {
//       namewise::schema_model model;
//       namewise::use_naming_convention(model, namewise::naming_convention::snake_case);
//
//       auto& post = model.add_entity_type("BlogPost");       // table blog_post
//       auto& id = post.add_property("Id", namewise::column_type::integer);
//       post.set_primary_key({&id});                          // pk_blog_post
//       post.add_property("PublishedAt", namewise::column_type::text);  // published_at
//
//       model.finalize();
//
//       namewise::database db(":memory:");
//       namewise::ensure_schema(db, model);
//   }

#include "namewise/types.hpp"
#include "namewise/log.hpp"
#include "namewise/convention.hpp"
#include "namewise/model.hpp"
#include "namewise/name_rewriter.hpp"
#include "namewise/config.hpp"
#include "namewise/mapping_classifier.hpp"
#include "namewise/name_rewriting_convention.hpp"
#include "namewise/shared_table_convention.hpp"
#include "namewise/table_mapping.hpp"
#include "namewise/snapshot.hpp"
#include "namewise/db.hpp"
#include "namewise/schema_writer.hpp"
