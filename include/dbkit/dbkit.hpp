// Copyright (c) 2024 liudegui. MIT License.
//
// dbkit -- database abstraction and batched access over SQLite3, MySQL /
// MariaDB and PostgreSQL.
//
// Usage:
//   #include "dbkit/dbkit.hpp"
//   dbkit::Schema schema{dbkit::TableDef("person")
//       .Add(dbkit::ColumnDef::Integer("id").PrimaryKey().AutoIncrement())
//       .Add(dbkit::ColumnDef::Text("name", 64).NotNull())};
//   dbkit::Error err;
//   auto db = dbkit::Database::Create("sqlite:////tmp/app.db", schema,
//                                     /*must_exist=*/false, {}, &err);
//   err = db->WithSession(true, [](dbkit::Session& s) {
//     return s.Insert("person", {{"name", "Alice"}});
//   });
//
// MySQL / MariaDB support requires DBKIT_HAS_MARIADB=1.

#pragma once

#include "dbkit/batched_query.hpp"
#include "dbkit/connection.hpp"
#include "dbkit/database.hpp"
#include "dbkit/descriptor.hpp"
#include "dbkit/engine.hpp"
#include "dbkit/error.hpp"
#include "dbkit/log.hpp"
#include "dbkit/message_mapping.hpp"
#include "dbkit/schema.hpp"
#include "dbkit/session.hpp"
#include "dbkit/value.hpp"
