// Copyright (c) 2024 liudegui. MIT License.
//
// dbkit::TableDef / dbkit::Schema -- declarative table definitions.
//
// Design:
//   - Plain value types, built with chained setters
//   - DDL rendered per backend kind; columns keep a portable type and each
//     dialect picks its own spelling (e.g. DATETIME(3) on MySQL)
//   - Only CREATE TABLE is generated: existing tables are never altered

#pragma once

#include <cctype>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

#include "dbkit/connection.hpp"

namespace dbkit {

// ---------------------------------------------------------------------------
// ColumnType
// ---------------------------------------------------------------------------

enum class ColumnType : uint8_t {
  kInteger = 0,
  kBigInteger,
  kBoolean,
  kReal,
  kText,               // VARCHAR(length) when length > 0, else TEXT
  kUnboundedText,      // LONGTEXT on MySQL
  kBinaryArray,        // fixed-size binary, BINARY(length) on MySQL
  kBlob,
  kMillisecondDatetime,
};

// ---------------------------------------------------------------------------
// ColumnDef
// ---------------------------------------------------------------------------

struct ColumnDef {
  std::string name;
  ColumnType type = ColumnType::kText;
  uint32_t length = 0;
  bool nullable = true;
  bool primary_key = false;
  bool autoincrement = false;
  bool unique = false;

  ColumnDef() = default;
  ColumnDef(std::string n, ColumnType t, uint32_t len = 0)
      : name(std::move(n)), type(t), length(len) {}

  static ColumnDef Integer(std::string n) {
    return ColumnDef(std::move(n), ColumnType::kInteger);
  }
  static ColumnDef BigInteger(std::string n) {
    return ColumnDef(std::move(n), ColumnType::kBigInteger);
  }
  static ColumnDef Boolean(std::string n) {
    return ColumnDef(std::move(n), ColumnType::kBoolean);
  }
  static ColumnDef Real(std::string n) {
    return ColumnDef(std::move(n), ColumnType::kReal);
  }
  static ColumnDef Text(std::string n, uint32_t len = 0) {
    return ColumnDef(std::move(n), ColumnType::kText, len);
  }
  static ColumnDef UnboundedText(std::string n) {
    return ColumnDef(std::move(n), ColumnType::kUnboundedText);
  }
  static ColumnDef BinaryArray(std::string n, uint32_t len) {
    return ColumnDef(std::move(n), ColumnType::kBinaryArray, len);
  }
  static ColumnDef Blob(std::string n) {
    return ColumnDef(std::move(n), ColumnType::kBlob);
  }
  static ColumnDef MillisecondDatetime(std::string n) {
    return ColumnDef(std::move(n), ColumnType::kMillisecondDatetime);
  }

  ColumnDef& NotNull() {
    nullable = false;
    return *this;
  }
  ColumnDef& PrimaryKey() {
    primary_key = true;
    nullable = false;
    return *this;
  }
  ColumnDef& AutoIncrement() {
    autoincrement = true;
    return *this;
  }
  ColumnDef& Unique() {
    unique = true;
    return *this;
  }

  /// Column type spelled for `kind`.
  std::string SqlType(BackendKind kind) const {
    bool mysql = (kind == BackendKind::kMySql);
    bool pg = (kind == BackendKind::kPostgres);
    switch (type) {
      case ColumnType::kInteger:
        if (pg && autoincrement) { return "SERIAL"; }
        return mysql ? "INT" : "INTEGER";
      case ColumnType::kBigInteger:
        if (pg && autoincrement) { return "BIGSERIAL"; }
        // SQLite only auto-increments a column declared exactly INTEGER.
        return IsSqlite(kind) ? "INTEGER" : "BIGINT";
      case ColumnType::kBoolean:
        if (mysql) { return "TINYINT(1)"; }
        return pg ? "BOOLEAN" : "INTEGER";
      case ColumnType::kReal:
        if (mysql) { return "DOUBLE"; }
        return pg ? "DOUBLE PRECISION" : "REAL";
      case ColumnType::kText:
        if (length > 0) { return "VARCHAR(" + std::to_string(length) + ")"; }
        return "TEXT";
      case ColumnType::kUnboundedText:
        return mysql ? "LONGTEXT" : "TEXT";
      case ColumnType::kBinaryArray:
        if (mysql) { return "BINARY(" + std::to_string(length) + ")"; }
        return pg ? "BYTEA" : "BLOB";
      case ColumnType::kBlob:
        if (mysql) { return "LONGBLOB"; }
        return pg ? "BYTEA" : "BLOB";
      case ColumnType::kMillisecondDatetime:
        if (mysql) { return "DATETIME(3)"; }
        return pg ? "TIMESTAMP(3)" : "DATETIME";
    }
    return "TEXT";
  }
};

// ---------------------------------------------------------------------------
// TableDef
// ---------------------------------------------------------------------------

struct TableDef {
  std::string name;
  std::vector<ColumnDef> columns;
  std::vector<std::vector<std::string>> unique_constraints;

  TableDef() = default;
  explicit TableDef(std::string n) : name(std::move(n)) {}

  TableDef& Add(ColumnDef column) {
    columns.push_back(std::move(column));
    return *this;
  }

  /// Multi-column UNIQUE constraint.
  TableDef& UniqueTogether(std::vector<std::string> column_names) {
    unique_constraints.push_back(std::move(column_names));
    return *this;
  }

  /// CREATE TABLE statement in the dialect of `conn`.
  std::string CreateSql(const Connection& conn) const {
    BackendKind kind = conn.Kind();
    std::vector<std::string> pk;
    for (const ColumnDef& c : columns) {
      if (c.primary_key) { pk.push_back(c.name); }
    }

    std::string sql = "CREATE TABLE " + conn.QuoteIdentifier(name) + " (";
    bool first = true;
    for (const ColumnDef& c : columns) {
      if (!first) { sql += ", "; }
      first = false;
      sql += conn.QuoteIdentifier(c.name) + " " + c.SqlType(kind);
      // SQLite wants the key inline to turn the column into the rowid alias.
      bool inline_pk = c.primary_key && pk.size() == 1 && IsSqlite(kind);
      if (inline_pk) {
        sql += " PRIMARY KEY";
        if (c.autoincrement) { sql += " AUTOINCREMENT"; }
      } else {
        if (!c.nullable) { sql += " NOT NULL"; }
        if (c.autoincrement && kind == BackendKind::kMySql) {
          sql += " AUTO_INCREMENT";
        }
      }
      if (c.unique) { sql += " UNIQUE"; }
    }

    if (!pk.empty() && !(pk.size() == 1 && IsSqlite(kind))) {
      sql += ", PRIMARY KEY (" + JoinQuoted(conn, pk) + ")";
    }
    for (const std::vector<std::string>& uc : unique_constraints) {
      sql += ", UNIQUE (" + JoinQuoted(conn, uc) + ")";
    }
    sql += ")";
    return sql;
  }

  const ColumnDef* FindColumn(const std::string& column) const {
    for (const ColumnDef& c : columns) {
      if (c.name == column) { return &c; }
    }
    return nullptr;
  }

 private:
  static std::string JoinQuoted(const Connection& conn,
                                const std::vector<std::string>& names) {
    std::string out;
    for (size_t i = 0; i < names.size(); ++i) {
      if (i > 0) { out += ", "; }
      out += conn.QuoteIdentifier(names[i]);
    }
    return out;
  }
};

// ---------------------------------------------------------------------------
// Schema
// ---------------------------------------------------------------------------

struct Schema {
  std::vector<TableDef> tables;

  Schema() = default;
  Schema(std::initializer_list<TableDef> defs) : tables(defs) {}

  Schema& Add(TableDef table) {
    tables.push_back(std::move(table));
    return *this;
  }

  /// Create every table that does not exist yet. Returns the number of
  /// tables created, or -1 on error.
  int32_t CreateMissing(Connection* conn, Error* out_error) const {
    int32_t created = 0;
    for (const TableDef& table : tables) {
      Error err;
      bool exists = conn->TableExists(table.name, &err);
      if (!err.ok()) {
        Report(out_error, err);
        return -1;
      }
      if (exists) { continue; }
      conn->ExecDml(table.CreateSql(*conn), &err);
      if (!err.ok()) {
        Report(out_error, err);
        return -1;
      }
      log::Debug("Created table {}", table.name);
      ++created;
    }
    return created;
  }
};

// ---------------------------------------------------------------------------
// Table naming helpers
// ---------------------------------------------------------------------------

/// "FooBar" -> "foobar".
inline std::string TableNameFromClassName(const std::string& class_name) {
  std::string out;
  out.reserve(class_name.size());
  for (char c : class_name) {
    out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

/// "FooBar" -> "foo_bar", "HTTPServer" -> "http_server".
inline std::string TableNameFromCamelCaps(const std::string& class_name) {
  std::string out;
  size_t n = class_name.size();
  for (size_t i = 0; i < n; ++i) {
    unsigned char c = static_cast<unsigned char>(class_name[i]);
    if (std::isupper(c) && i > 0) {
      unsigned char prev = static_cast<unsigned char>(class_name[i - 1]);
      bool next_lower =
          i + 1 < n &&
          std::islower(static_cast<unsigned char>(class_name[i + 1]));
      if (std::islower(prev) || std::isdigit(prev) ||
          (std::isupper(prev) && next_lower)) {
        out += '_';
      }
    }
    out += static_cast<char>(std::tolower(c));
  }
  return out;
}

}  // namespace dbkit
