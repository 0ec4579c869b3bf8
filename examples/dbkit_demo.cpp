// Copyright (c) 2024 liudegui. MIT License.
//
// dbkit demo -- schema, sessions, get-or-create and batched reads.
//
// Usage:
//   ./dbkit_demo                          (in-memory SQLite)
//   ./dbkit_demo sqlite:////tmp/demo.db
//   ./dbkit_demo file:///etc/app/db_url.txt
//
// DBKIT_SQL_ECHO=1 logs every statement.

#include <cstdio>
#include <string>

#include "dbkit/dbkit.hpp"

namespace {

struct Employee {
  int64_t empno = 0;
  std::string name;
  std::string hired;

  static const char* TableName() { return "employee"; }

  dbkit::Fields ToFields() const {
    dbkit::Fields fields{{"name", name}, {"hired", hired}};
    if (empno != 0) { fields["empno"] = empno; }
    return fields;
  }

  static Employee FromFields(const dbkit::Fields& fields) {
    Employee e;
    e.empno = dbkit::FieldOr(fields, "empno").AsInt64();
    e.name = dbkit::FieldOr(fields, "name").AsString();
    e.hired = dbkit::FieldOr(fields, "hired").AsString();
    return e;
  }
};

dbkit::Schema DemoSchema() {
  return dbkit::Schema{
      dbkit::TableDef(dbkit::TableNameFromCamelCaps("Employee"))
          .Add(dbkit::ColumnDef::Integer("empno").PrimaryKey().AutoIncrement())
          .Add(dbkit::ColumnDef::Text("name", 64).NotNull().Unique())
          .Add(dbkit::ColumnDef::MillisecondDatetime("hired"))};
}

}  // namespace

int main(int argc, char** argv) {
  std::string url = (argc > 1) ? argv[1] : "sqlite://";
  dbkit::Error err;

  auto db = dbkit::Database::Create(url, DemoSchema(), false,
                                    dbkit::EngineOptions::FromEnvironment(),
                                    &err);
  if (db == nullptr) {
    std::fprintf(stderr, "Open failed: %s (%s)\n", err.message,
                 dbkit::ErrorCodeName(err.code));
    return 1;
  }
  std::printf("Opened %s backend\n", dbkit::BackendKindName(db->Kind()));

  // Insert ten employees in one transaction
  err = db->WithSession(true, [](dbkit::Session& s) {
    for (int32_t i = 0; i < 10; ++i) {
      char name[32];
      std::snprintf(name, sizeof(name), "Employee%02d", i);
      Employee e = s.GetOrCreate<Employee>(
          {{"name", name}}, {{"hired", dbkit::UtcMillisecondsNow()}});
      if (e.empno == 0) {
        return dbkit::Error::Make(dbkit::ErrorCode::kError, "insert failed");
      }
    }
    return dbkit::Error::Ok();
  });
  if (!err.ok()) {
    std::fprintf(stderr, "Insert failed: %s\n", err.message);
    return 1;
  }

  // Rolled back: the session reports an error
  err = db->WithSession(true, [](dbkit::Session& s) {
    dbkit::Error e = s.Insert("employee", {{"name", "Temp"}});
    if (!e.ok()) { return e; }
    return dbkit::Error::Make(dbkit::ErrorCode::kError, "changed my mind");
  });
  std::printf("Rolled back: %s\n", err.message);

  // Read back in windows of four
  std::printf("\n--- Batched ---\n");
  err = db->WithSession(false, [](dbkit::Session& s) {
    dbkit::BatchOptions options;
    options.batch_size = 4;
    options.compute_max_rows = true;
    dbkit::BatchedQuery query(
        s, "SELECT empno, name FROM employee ORDER BY empno", options);
    dbkit::Batch batch;
    dbkit::Error e;
    while (query.Next(&batch, &e)) {
      std::printf("batch %lld (rows %lld..%lld of %lld)\n",
                  static_cast<long long>(batch.batch_num),
                  static_cast<long long>(batch.offset),
                  static_cast<long long>(batch.limit),
                  static_cast<long long>(batch.max_rows));
      for (const dbkit::Row& row : batch.rows) {
        std::printf("  empno=%lld  name=%s\n",
                    static_cast<long long>(row.GetInt64(0)),
                    row.GetString(1).c_str());
      }
    }
    return e;
  });
  if (!err.ok()) {
    std::fprintf(stderr, "Query failed: %s\n", err.message);
    return 1;
  }

  if (db->Kind() == dbkit::BackendKind::kMemory ||
      db->Kind() == dbkit::BackendKind::kSqliteFile) {
    err = db->Drop(true);
    std::printf("\nDropped: %s\n", err.ok() ? "yes" : err.message);
  }
  return 0;
}
