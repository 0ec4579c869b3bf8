// Copyright (c) 2024 liudegui. MIT License.
//
// dbkit::PgConnection -- PostgreSQL connection with RAII.
//
// Design:
//   - Wraps PGconn* with RAII, PGresult* released by a scope guard
//   - Server-side parameter binding via PQexecParams ($1, $2, ...)
//   - Text result format, converted to typed Values by column type OID
//   - Transaction state read back from the server (PQtransactionStatus)
//   - Server notices are routed to the dbkit logger instead of stderr

#pragma once

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

#include <libpq-fe.h>

#include "dbkit/connection.hpp"

namespace dbkit {

// ---------------------------------------------------------------------------
// PgConnection
// ---------------------------------------------------------------------------

class PgConnection final : public Connection {
 public:
  using Connection::ExecDml;
  using Connection::Query;

  PgConnection() = default;

  ~PgConnection() override { Close(); }

  // No copy
  PgConnection(const PgConnection&) = delete;
  PgConnection& operator=(const PgConnection&) = delete;

  // --- Open / Close ---

  /// Connect to `database` on the server described by `desc`.
  Error Open(const ResolvedDescriptor& desc, const std::string& database) {
    Close();
    std::string conninfo = desc.ServerUrl(database);
    conn_ = PQconnectdb(conninfo.c_str());
    if (conn_ == nullptr) {
      return Error::Make(ErrorCode::kError, "PQconnectdb failed");
    }
    if (PQstatus(conn_) != CONNECTION_OK) {
      Error err = Error::Format(ErrorCode::kError, "postgresql://%s:%u/%s: %s",
                                desc.host.c_str(),
                                static_cast<unsigned>(desc.port),
                                database.c_str(), PQerrorMessage(conn_));
      Close();
      return err;
    }
    PQsetNoticeProcessor(conn_, &PgConnection::OnNotice, nullptr);
    return Error::Ok();
  }

  void Close() override {
    if (conn_ != nullptr) {
      PQfinish(conn_);
      conn_ = nullptr;
    }
  }

  BackendKind Kind() const override { return BackendKind::kPostgres; }

  bool IsOpen() const override {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
  }

  // --- DML ---

  int64_t ExecDml(const std::string& sql, const Params& params,
                  Error* out_error) override {
    Echo(sql, params);
    ResultGuard res;
    Error err = Exec(sql, params, &res.handle);
    if (!err.ok()) {
      Report(out_error, err);
      return -1;
    }
    const char* affected = PQcmdTuples(res.handle);
    if (affected == nullptr || affected[0] == '\0') { return 0; }
    return static_cast<int64_t>(std::strtoll(affected, nullptr, 10));
  }

  // --- Query ---

  Rows Query(const std::string& sql, const Params& params,
             Error* out_error) override {
    Echo(sql, params);
    Rows rows;
    ResultGuard res;
    Error err = Exec(sql, params, &res.handle);
    if (!err.ok()) {
      Report(out_error, err);
      return rows;
    }

    int32_t num_fields = PQnfields(res.handle);
    int32_t num_rows = PQntuples(res.handle);
    auto names = std::make_shared<std::vector<std::string>>();
    for (int32_t i = 0; i < num_fields; ++i) {
      names->emplace_back(PQfname(res.handle, i));
    }
    ColumnNames columns = names;

    rows.reserve(static_cast<size_t>(num_rows));
    for (int32_t r = 0; r < num_rows; ++r) {
      std::vector<Value> values;
      values.reserve(static_cast<size_t>(num_fields));
      for (int32_t c = 0; c < num_fields; ++c) {
        values.push_back(FieldValue(res.handle, r, c));
      }
      rows.emplace_back(columns, std::move(values));
    }
    return rows;
  }

  // --- Table exists ---

  bool TableExists(const std::string& table, Error* out_error) override {
    return ExecScalar("SELECT count(*) FROM information_schema.tables "
                      "WHERE table_schema = current_schema() "
                      "AND table_name = $1",
                      Params{table}, 0, out_error) > 0;
  }

  // --- Transaction ---

  Error BeginTransaction() override {
    Error err;
    ExecDml("BEGIN", &err);
    return err;
  }

  Error Commit() override {
    Error err;
    ExecDml("COMMIT", &err);
    return err;
  }

  Error Rollback() override {
    Error err;
    ExecDml("ROLLBACK", &err);
    return err;
  }

  bool InTransaction() const override {
    if (conn_ == nullptr) { return false; }
    PGTransactionStatusType status = PQtransactionStatus(conn_);
    return status == PQTRANS_INTRANS || status == PQTRANS_INERROR;
  }

  // --- Dialect ---

  std::string Placeholder(int32_t index) const override {
    return "$" + std::to_string(index);
  }

  PGconn* Handle() const { return conn_; }

 private:
  // Built-in type OIDs (catalog/pg_type_d.h is a server header).
  static constexpr Oid kBoolOid = 16;
  static constexpr Oid kByteaOid = 17;
  static constexpr Oid kInt8Oid = 20;
  static constexpr Oid kInt2Oid = 21;
  static constexpr Oid kInt4Oid = 23;
  static constexpr Oid kOidOid = 26;
  static constexpr Oid kFloat4Oid = 700;
  static constexpr Oid kFloat8Oid = 701;
  static constexpr Oid kNumericOid = 1700;

  struct ResultGuard {
    PGresult* handle = nullptr;
    ~ResultGuard() {
      if (handle != nullptr) { PQclear(handle); }
    }
  };

  Error Exec(const std::string& sql, const Params& params, PGresult** out) {
    if (conn_ == nullptr) {
      return Error::Make(ErrorCode::kNotOpen, "Database not open");
    }

    // Text values point into `params`, which outlives the call.
    std::vector<std::string> scratch(params.size());
    std::vector<const char*> values(params.size(), nullptr);
    std::vector<int> lengths(params.size(), 0);
    std::vector<int> formats(params.size(), 0);
    for (size_t i = 0; i < params.size(); ++i) {
      const Value& v = params[i];
      switch (v.type()) {
        case ValueType::kNull:
          break;
        case ValueType::kBlob:
          values[i] = v.Bytes().data();
          lengths[i] = static_cast<int>(v.Bytes().size());
          formats[i] = 1;
          break;
        case ValueType::kText:
          values[i] = v.Bytes().c_str();
          break;
        default:
          scratch[i] = v.AsString();
          values[i] = scratch[i].c_str();
          break;
      }
    }

    *out = PQexecParams(conn_, sql.c_str(), static_cast<int>(params.size()),
                        nullptr, values.data(), lengths.data(),
                        formats.data(), 0);
    if (*out == nullptr) {
      return Error::Make(ErrorCode::kError, PQerrorMessage(conn_));
    }
    ExecStatusType status = PQresultStatus(*out);
    if (status == PGRES_COMMAND_OK || status == PGRES_TUPLES_OK) {
      return Error::Ok();
    }

    // SQLSTATE class 23: integrity constraint violation.
    const char* state = PQresultErrorField(*out, PG_DIAG_SQLSTATE);
    ErrorCode code = (state != nullptr && std::strncmp(state, "23", 2) == 0)
                         ? ErrorCode::kConstraint
                         : ErrorCode::kError;
    return Error::Make(code, PQresultErrorMessage(*out));
  }

  static Value FieldValue(const PGresult* res, int32_t row, int32_t col) {
    if (PQgetisnull(res, row, col)) { return Value::Null(); }
    const char* data = PQgetvalue(res, row, col);
    int32_t len = PQgetlength(res, row, col);
    switch (PQftype(res, col)) {
      case kBoolOid:
        return Value(data[0] == 't');
      case kInt2Oid:
      case kInt4Oid:
      case kInt8Oid:
      case kOidOid:
        return Value(static_cast<int64_t>(std::strtoll(data, nullptr, 10)));
      case kFloat4Oid:
      case kFloat8Oid:
      case kNumericOid:
        return Value(std::strtod(data, nullptr));
      case kByteaOid: {
        size_t n = 0;
        unsigned char* raw = PQunescapeBytea(
            reinterpret_cast<const unsigned char*>(data), &n);
        if (raw == nullptr) { return Value::Blob(std::string()); }
        Value v = Value::Blob(raw, n);
        PQfreemem(raw);
        return v;
      }
      default:
        return Value(std::string(data, static_cast<size_t>(len)));
    }
  }

  static void OnNotice(void* /*arg*/, const char* message) {
    log::Debug("postgresql: {}", message);
  }

  PGconn* conn_ = nullptr;
};

}  // namespace dbkit
