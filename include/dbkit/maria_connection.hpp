// Copyright (c) 2024 liudegui. MIT License.
//
// dbkit::MariaConnection -- MariaDB/MySQL connection with RAII.
//
// Design:
//   - Wraps MYSQL* with RAII
//   - Text protocol only: '?' placeholders are replaced by escaped literals
//     (mysql_real_escape_string), which keeps SELECT and DML on one path
//   - Transaction state tracked locally (autocommit stays on outside
//     explicit transactions)
//   - Only compiled when DBKIT_HAS_MARIADB is set

#pragma once

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

#include <mysql.h>

#include "dbkit/connection.hpp"

namespace dbkit {

// ---------------------------------------------------------------------------
// MariaConnection
// ---------------------------------------------------------------------------

class MariaConnection final : public Connection {
 public:
  using Connection::ExecDml;
  using Connection::Query;

  MariaConnection() = default;

  ~MariaConnection() override { Close(); }

  // No copy
  MariaConnection(const MariaConnection&) = delete;
  MariaConnection& operator=(const MariaConnection&) = delete;

  // --- Open / Close ---

  /// Connect to the server in `desc`. An empty `database` connects to the
  /// server without selecting a schema (used for existence checks).
  Error Open(const ResolvedDescriptor& desc, const std::string& database) {
    Close();

    conn_ = mysql_init(nullptr);
    if (conn_ == nullptr) {
      return Error::Make(ErrorCode::kError, "mysql_init failed");
    }

    const char* password =
        desc.password.empty() ? nullptr : desc.password.c_str();
    const char* db = database.empty() ? nullptr : database.c_str();
    if (mysql_real_connect(conn_, desc.host.c_str(), desc.user.c_str(),
                           password, db, desc.port, nullptr, 0) == nullptr) {
      Error err = Error::Format(ErrorCode::kError, "mysql://%s:%u: %s",
                                desc.host.c_str(),
                                static_cast<unsigned>(desc.port),
                                mysql_error(conn_));
      mysql_close(conn_);
      conn_ = nullptr;
      return err;
    }

    std::string charset = ParamValue(desc.params, "charset");
    if (charset.empty()) { charset = "utf8mb4"; }
    if (mysql_set_character_set(conn_, charset.c_str()) != 0) {
      Error err = Error::Format(ErrorCode::kConfiguration,
                                "Unknown charset '%s': %s", charset.c_str(),
                                mysql_error(conn_));
      Close();
      return err;
    }
    return Error::Ok();
  }

  void Close() override {
    if (conn_ != nullptr) {
      mysql_close(conn_);
      conn_ = nullptr;
    }
    in_transaction_ = false;
  }

  BackendKind Kind() const override { return BackendKind::kMySql; }
  bool IsOpen() const override { return conn_ != nullptr; }

  // --- DML ---

  int64_t ExecDml(const std::string& sql, const Params& params,
                  Error* out_error) override {
    Echo(sql, params);
    Error err = Run(sql, params);
    if (!err.ok()) {
      Report(out_error, err);
      return -1;
    }
    MYSQL_RES* res = mysql_store_result(conn_);
    if (res != nullptr) { mysql_free_result(res); }
    return static_cast<int64_t>(mysql_affected_rows(conn_));
  }

  // --- Query ---

  Rows Query(const std::string& sql, const Params& params,
             Error* out_error) override {
    Echo(sql, params);
    Rows rows;
    Error err = Run(sql, params);
    if (!err.ok()) {
      Report(out_error, err);
      return rows;
    }

    MYSQL_RES* res = mysql_store_result(conn_);
    if (res == nullptr) {
      if (mysql_field_count(conn_) > 0) {
        Report(out_error, Error::Make(ErrorCode::kError, mysql_error(conn_)));
      }
      return rows;
    }

    uint32_t num_fields = mysql_num_fields(res);
    MYSQL_FIELD* fields = mysql_fetch_fields(res);
    auto names = std::make_shared<std::vector<std::string>>();
    for (uint32_t i = 0; i < num_fields; ++i) {
      names->emplace_back(fields[i].name);
    }
    ColumnNames columns = names;

    rows.reserve(static_cast<size_t>(mysql_num_rows(res)));
    MYSQL_ROW row = nullptr;
    while ((row = mysql_fetch_row(res)) != nullptr) {
      unsigned long* lengths = mysql_fetch_lengths(res);
      std::vector<Value> values;
      values.reserve(num_fields);
      for (uint32_t i = 0; i < num_fields; ++i) {
        values.push_back(FieldValue(fields[i], row[i], lengths[i]));
      }
      rows.emplace_back(columns, std::move(values));
    }
    mysql_free_result(res);
    return rows;
  }

  // --- Table exists ---

  bool TableExists(const std::string& table, Error* out_error) override {
    return ExecScalar("SELECT COUNT(*) FROM information_schema.tables "
                      "WHERE table_schema = DATABASE() AND table_name = ?",
                      Params{table}, 0, out_error) > 0;
  }

  // --- Transaction ---

  Error BeginTransaction() override {
    Error err;
    ExecDml("START TRANSACTION", &err);
    if (err.ok()) { in_transaction_ = true; }
    return err;
  }

  Error Commit() override {
    Error err;
    ExecDml("COMMIT", &err);
    in_transaction_ = false;
    return err;
  }

  Error Rollback() override {
    Error err;
    ExecDml("ROLLBACK", &err);
    in_transaction_ = false;
    return err;
  }

  bool InTransaction() const override { return in_transaction_; }

  // --- Dialect ---

  std::string QuoteIdentifier(const std::string& name) const override {
    std::string out = "`";
    for (char c : name) {
      if (c == '`') { out += '`'; }
      out += c;
    }
    out += '`';
    return out;
  }

  /// Escaped SQL literal for `v`.
  std::string Literal(const Value& v) const {
    switch (v.type()) {
      case ValueType::kNull:
        return "NULL";
      case ValueType::kInteger:
      case ValueType::kReal:
        return v.AsString();
      case ValueType::kText: {
        const std::string& s = v.Bytes();
        std::string buf(s.size() * 2 + 1, '\0');
        unsigned long n = mysql_real_escape_string(
            conn_, &buf[0], s.data(), static_cast<unsigned long>(s.size()));
        return "'" + buf.substr(0, n) + "'";
      }
      case ValueType::kBlob: {
        static const char kHex[] = "0123456789ABCDEF";
        const std::string& s = v.Bytes();
        std::string out = "X'";
        for (unsigned char c : s) {
          out += kHex[c >> 4];
          out += kHex[c & 0x0F];
        }
        out += "'";
        return out;
      }
    }
    return "NULL";
  }

  MYSQL* Handle() const { return conn_; }

 private:
  /// Substitute '?' outside quoted sections and send the statement.
  Error Run(const std::string& sql, const Params& params) {
    if (conn_ == nullptr) {
      return Error::Make(ErrorCode::kNotOpen, "Database not open");
    }

    std::string text;
    text.reserve(sql.size());
    size_t next = 0;
    char quote = '\0';
    bool escaped = false;
    for (char c : sql) {
      if (quote != '\0') {
        if (escaped) {
          escaped = false;
        } else if (c == '\\') {
          escaped = true;
        } else if (c == quote) {
          quote = '\0';
        }
        text += c;
      } else if (c == '\'' || c == '"' || c == '`') {
        quote = c;
        text += c;
      } else if (c == '?') {
        if (next >= params.size()) {
          return Error::Format(ErrorCode::kRange,
                               "Statement expects more than %zu parameters",
                               params.size());
        }
        text += Literal(params[next++]);
      } else {
        text += c;
      }
    }
    if (next != params.size()) {
      return Error::Format(ErrorCode::kRange,
                           "Statement expects %zu parameters, got %zu", next,
                           params.size());
    }

    if (mysql_real_query(conn_, text.data(),
                         static_cast<unsigned long>(text.size())) != 0) {
      uint32_t errnum = mysql_errno(conn_);
      // ER_DUP_ENTRY, ER_NO_REFERENCED_ROW_2, ER_ROW_IS_REFERENCED_2
      ErrorCode code = (errnum == 1062 || errnum == 1451 || errnum == 1452)
                           ? ErrorCode::kConstraint
                           : ErrorCode::kError;
      return Error::Make(code, mysql_error(conn_));
    }
    return Error::Ok();
  }

  static Value FieldValue(const MYSQL_FIELD& field, const char* data,
                          unsigned long len) {
    if (data == nullptr) { return Value::Null(); }
    switch (field.type) {
      case MYSQL_TYPE_TINY:
      case MYSQL_TYPE_SHORT:
      case MYSQL_TYPE_LONG:
      case MYSQL_TYPE_INT24:
      case MYSQL_TYPE_LONGLONG:
      case MYSQL_TYPE_YEAR:
        return Value(static_cast<int64_t>(std::strtoll(data, nullptr, 10)));
      case MYSQL_TYPE_FLOAT:
      case MYSQL_TYPE_DOUBLE:
        return Value(std::strtod(data, nullptr));
      case MYSQL_TYPE_TINY_BLOB:
      case MYSQL_TYPE_MEDIUM_BLOB:
      case MYSQL_TYPE_LONG_BLOB:
      case MYSQL_TYPE_BLOB:
      case MYSQL_TYPE_STRING:
      case MYSQL_TYPE_VAR_STRING:
        // charset 63 is "binary": BLOB / BINARY / VARBINARY columns.
        if (field.charsetnr == 63) {
          return Value::Blob(std::string(data, len));
        }
        return Value(std::string(data, len));
      default:
        return Value(std::string(data, len));
    }
  }

  /// Value of `key` in a "k1=v1&k2=v2" parameter string.
  static std::string ParamValue(const std::string& params,
                                const std::string& key) {
    size_t pos = 0;
    while (pos <= params.size()) {
      size_t amp = params.find('&', pos);
      std::string item = params.substr(
          pos, amp == std::string::npos ? std::string::npos : amp - pos);
      size_t eq = item.find('=');
      if (eq != std::string::npos && item.substr(0, eq) == key) {
        return item.substr(eq + 1);
      }
      if (amp == std::string::npos) { break; }
      pos = amp + 1;
    }
    return std::string();
  }

  MYSQL* conn_ = nullptr;
  bool in_transaction_ = false;
};

}  // namespace dbkit
