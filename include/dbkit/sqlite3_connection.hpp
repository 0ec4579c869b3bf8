// Copyright (c) 2024 liudegui. MIT License.
//
// dbkit::Sqlite3Connection -- SQLite3 connection with RAII.
//
// Design:
//   - Wraps sqlite3* with RAII
//   - Non-copyable, owned through std::unique_ptr<Connection>
//   - Prepared statements finalized by a scope guard on every path
//   - Serves both in-memory ("sqlite://") and file databases

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "sqlite3.h"

#include "dbkit/connection.hpp"

namespace dbkit {

// ---------------------------------------------------------------------------
// Sqlite3Connection
// ---------------------------------------------------------------------------

class Sqlite3Connection final : public Connection {
 public:
  using Connection::ExecDml;
  using Connection::Query;

  Sqlite3Connection() = default;

  ~Sqlite3Connection() override { Close(); }

  // No copy
  Sqlite3Connection(const Sqlite3Connection&) = delete;
  Sqlite3Connection& operator=(const Sqlite3Connection&) = delete;

  // --- Open / Close ---

  /// Open `path`, or a private in-memory database for kMemory.
  Error Open(BackendKind kind, const std::string& path) {
    Close();
    kind_ = kind;
    const char* target =
        (kind == BackendKind::kMemory) ? ":memory:" : path.c_str();
    int32_t rc = sqlite3_open_v2(target, &db_,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE,
                                 nullptr);
    if (rc != SQLITE_OK) {
      Error err = Error::Format(
          ErrorCode::kError, "sqlite3_open('%s') failed: %s", target,
          db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
      if (db_ != nullptr) {
        sqlite3_close(db_);
        db_ = nullptr;
      }
      return err;
    }
    sqlite3_extended_result_codes(db_, 0);
    return Error::Ok();
  }

  void Close() override {
    if (db_ != nullptr) {
      sqlite3_close_v2(db_);
      db_ = nullptr;
    }
  }

  BackendKind Kind() const override { return kind_; }
  bool IsOpen() const override { return db_ != nullptr; }

  void SetBusyTimeout(int32_t ms) {
    if (db_ != nullptr) { sqlite3_busy_timeout(db_, ms); }
  }

  // --- DML ---

  int64_t ExecDml(const std::string& sql, const Params& params,
                  Error* out_error) override {
    Echo(sql, params);
    StatementGuard stmt;
    Error err = Prepare(sql, params, &stmt.handle);
    if (!err.ok()) {
      Report(out_error, err);
      return -1;
    }

    int32_t rc = sqlite3_step(stmt.handle);
    while (rc == SQLITE_ROW) { rc = sqlite3_step(stmt.handle); }
    if (rc != SQLITE_DONE) {
      Report(out_error, LastError(rc));
      return -1;
    }
    return static_cast<int64_t>(sqlite3_changes(db_));
  }

  // --- Query ---

  Rows Query(const std::string& sql, const Params& params,
             Error* out_error) override {
    Echo(sql, params);
    Rows rows;
    StatementGuard stmt;
    Error err = Prepare(sql, params, &stmt.handle);
    if (!err.ok()) {
      Report(out_error, err);
      return rows;
    }

    int32_t num_fields = sqlite3_column_count(stmt.handle);
    auto names = std::make_shared<std::vector<std::string>>();
    for (int32_t i = 0; i < num_fields; ++i) {
      const char* name = sqlite3_column_name(stmt.handle, i);
      names->emplace_back(name != nullptr ? name : "");
    }
    ColumnNames columns = names;

    int32_t rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt.handle)) == SQLITE_ROW) {
      std::vector<Value> values;
      values.reserve(static_cast<size_t>(num_fields));
      for (int32_t i = 0; i < num_fields; ++i) {
        values.push_back(ColumnValue(stmt.handle, i));
      }
      rows.emplace_back(columns, std::move(values));
    }
    if (rc != SQLITE_DONE) {
      Report(out_error, LastError(rc));
      rows.clear();
    }
    return rows;
  }

  // --- Table exists ---

  bool TableExists(const std::string& table, Error* out_error) override {
    return ExecScalar("SELECT count(*) FROM sqlite_master "
                      "WHERE type='table' AND name=?",
                      Params{table}, 0, out_error) > 0;
  }

  // --- Transaction ---

  Error BeginTransaction() override {
    Error err;
    ExecDml("BEGIN TRANSACTION", &err);
    return err;
  }

  Error Commit() override {
    Error err;
    ExecDml("COMMIT TRANSACTION", &err);
    return err;
  }

  Error Rollback() override {
    Error err;
    ExecDml("ROLLBACK", &err);
    return err;
  }

  bool InTransaction() const override {
    if (db_ == nullptr) { return false; }
    return sqlite3_get_autocommit(db_) == 0;
  }

  sqlite3* Handle() const { return db_; }

 private:
  struct StatementGuard {
    sqlite3_stmt* handle = nullptr;
    ~StatementGuard() {
      if (handle != nullptr) { sqlite3_finalize(handle); }
    }
  };

  Error Prepare(const std::string& sql, const Params& params,
                sqlite3_stmt** out) {
    if (db_ == nullptr) {
      return Error::Make(ErrorCode::kNotOpen, "Database not open");
    }
    int32_t rc = sqlite3_prepare_v2(db_, sql.c_str(),
                                    static_cast<int>(sql.size()), out,
                                    nullptr);
    if (rc != SQLITE_OK) { return LastError(rc); }
    if (*out == nullptr) {
      return Error::Make(ErrorCode::kMisuse, "Empty statement");
    }
    if (static_cast<int32_t>(params.size()) !=
        sqlite3_bind_parameter_count(*out)) {
      return Error::Format(ErrorCode::kRange,
                           "Statement expects %d parameters, got %zu",
                           sqlite3_bind_parameter_count(*out), params.size());
    }
    for (size_t i = 0; i < params.size(); ++i) {
      rc = Bind(*out, static_cast<int32_t>(i + 1), params[i]);
      if (rc != SQLITE_OK) { return LastError(rc); }
    }
    return Error::Ok();
  }

  static int32_t Bind(sqlite3_stmt* stmt, int32_t param, const Value& v) {
    switch (v.type()) {
      case ValueType::kInteger:
        return sqlite3_bind_int64(stmt, param, v.AsInt64());
      case ValueType::kReal:
        return sqlite3_bind_double(stmt, param, v.AsDouble());
      case ValueType::kText:
        return sqlite3_bind_text(stmt, param, v.Bytes().data(),
                                 static_cast<int>(v.Bytes().size()),
                                 SQLITE_TRANSIENT);
      case ValueType::kBlob:
        return sqlite3_bind_blob(stmt, param, v.Bytes().data(),
                                 static_cast<int>(v.Bytes().size()),
                                 SQLITE_TRANSIENT);
      case ValueType::kNull:
        break;
    }
    return sqlite3_bind_null(stmt, param);
  }

  static Value ColumnValue(sqlite3_stmt* stmt, int32_t col) {
    switch (sqlite3_column_type(stmt, col)) {
      case SQLITE_INTEGER:
        return Value(static_cast<int64_t>(sqlite3_column_int64(stmt, col)));
      case SQLITE_FLOAT:
        return Value(sqlite3_column_double(stmt, col));
      case SQLITE_TEXT: {
        const char* text =
            reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
        int32_t len = sqlite3_column_bytes(stmt, col);
        if (text == nullptr) { return Value(std::string()); }
        return Value(std::string(text, static_cast<size_t>(len)));
      }
      case SQLITE_BLOB: {
        const void* blob = sqlite3_column_blob(stmt, col);
        int32_t len = sqlite3_column_bytes(stmt, col);
        if (blob == nullptr) { return Value::Blob(std::string()); }
        return Value::Blob(static_cast<const uint8_t*>(blob),
                           static_cast<size_t>(len));
      }
      default:
        return Value::Null();
    }
  }

  Error LastError(int32_t rc) const {
    ErrorCode code = ErrorCode::kError;
    if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
      code = ErrorCode::kBusy;
    } else if (rc == SQLITE_CONSTRAINT) {
      code = ErrorCode::kConstraint;
    } else if (rc == SQLITE_MISMATCH) {
      code = ErrorCode::kMismatch;
    } else if (rc == SQLITE_RANGE) {
      code = ErrorCode::kRange;
    } else if (rc == SQLITE_IOERR) {
      code = ErrorCode::kIoError;
    } else if (rc == SQLITE_FULL) {
      code = ErrorCode::kFull;
    }
    return Error::Make(code, db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
  }

  sqlite3* db_ = nullptr;
  BackendKind kind_ = BackendKind::kMemory;
};

}  // namespace dbkit
