// Copyright (c) 2024 liudegui. MIT License.
//
// dbkit::Session -- transactional unit of work on one pooled connection.
//
// Design:
//   - Move-only RAII: the constructor leases a connection and begins a
//     transaction, the destructor rolls back whatever was not committed and
//     hands the connection back to the pool (also during stack unwinding)
//   - Commit() / Rollback() end the current transaction and start the next
//   - Not internally locked: one session belongs to one thread at a time
//
// Record types used with Get/GetOrCreate/Add provide:
//   static const char* TableName();
//   dbkit::Fields ToFields() const;
//   static T FromFields(const dbkit::Fields&);

#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include "dbkit/connection.hpp"
#include "dbkit/engine.hpp"
#include "dbkit/error.hpp"
#include "dbkit/log.hpp"
#include "dbkit/value.hpp"

namespace dbkit {

class BatchedQuery;
class Database;
struct BatchOptions;

// ---------------------------------------------------------------------------
// Session
// ---------------------------------------------------------------------------

class Session {
 public:
  Session() = default;

  ~Session() { Close(); }

  // Move
  Session(Session&& other) noexcept : lease_(std::move(other.lease_)) {}

  Session& operator=(Session&& other) noexcept {
    if (this != &other) {
      Close();
      lease_ = std::move(other.lease_);
    }
    return *this;
  }

  // No copy
  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  bool IsOpen() const { return lease_.Valid(); }
  /// kMemory once closed.
  BackendKind Kind() const {
    return IsOpen() ? lease_->Kind() : BackendKind::kMemory;
  }
  bool InTransaction() const { return IsOpen() && lease_->InTransaction(); }

  /// The leased connection. Only valid while IsOpen().
  Connection& connection() const { return *lease_; }

  // --- Statements ---

  int64_t ExecDml(const std::string& sql, const Params& params = Params{},
                  Error* out_error = nullptr) {
    if (!CheckOpen(out_error)) { return -1; }
    return lease_->ExecDml(sql, params, out_error);
  }

  Rows Query(const std::string& sql, const Params& params = Params{},
             Error* out_error = nullptr) {
    if (!CheckOpen(out_error)) { return Rows{}; }
    return lease_->Query(sql, params, out_error);
  }

  int64_t ExecScalar(const std::string& sql, const Params& params = Params{},
                     int64_t null_value = 0, Error* out_error = nullptr) {
    if (!CheckOpen(out_error)) { return null_value; }
    return lease_->ExecScalar(sql, params, null_value, out_error);
  }

  /// Dialect placeholder for the 1-based parameter `index`; "?" once closed.
  std::string Placeholder(int32_t index) const {
    if (!IsOpen()) { return "?"; }
    return lease_->Placeholder(index);
  }

  // --- Transaction ---

  /// Commit the current transaction and begin a new one.
  Error Commit() {
    Error err;
    if (!CheckOpen(&err)) { return err; }
    err = lease_->Commit();
    if (!err.ok()) { return err; }
    return lease_->BeginTransaction();
  }

  /// Discard the current transaction and begin a new one.
  Error Rollback() {
    Error err;
    if (!CheckOpen(&err)) { return err; }
    if (lease_->InTransaction()) {
      err = lease_->Rollback();
      if (!err.ok()) { return err; }
    }
    return lease_->BeginTransaction();
  }

  /// Roll back anything uncommitted and return the connection to the pool.
  void Close() {
    if (!lease_.Valid()) { return; }
    if (lease_->IsOpen() && lease_->InTransaction()) {
      Error err = lease_->Rollback();
      if (!err.ok()) {
        log::Warn("Rollback on session close failed: {}", err.message);
        lease_->Close();
      }
    }
    lease_.Release();
  }

  /// Windowed iteration over `sql` (defined in batched_query.hpp).
  BatchedQuery Batched(std::string sql, const BatchOptions& options);

  // --- Records ---

  /// INSERT one row built from `fields`.
  Error Insert(const std::string& table, const Fields& fields) {
    Error err;
    if (!CheckOpen(&err)) { return err; }
    Connection& conn = *lease_;
    std::string sql = "INSERT INTO " + conn.QuoteIdentifier(table);
    Params params;
    if (fields.empty()) {
      sql += conn.Kind() == BackendKind::kMySql ? " () VALUES ()"
                                                : " DEFAULT VALUES";
    } else {
      std::string columns;
      std::string values;
      for (const auto& kv : fields) {
        if (!params.empty()) {
          columns += ", ";
          values += ", ";
        }
        params.push_back(kv.second);
        columns += conn.QuoteIdentifier(kv.first);
        values += conn.Placeholder(static_cast<int32_t>(params.size()));
      }
      sql += " (" + columns + ") VALUES (" + values + ")";
    }
    conn.ExecDml(sql, params, &err);
    return err;
  }

  /// Stage `record` for insertion in the current transaction.
  template <typename T>
  Error Add(const T& record) {
    return Insert(T::TableName(), record.ToFields());
  }

  /// First record of type T whose columns equal `filter`. Returns false and
  /// leaves `*out` untouched when there is none.
  template <typename T>
  bool Get(const Fields& filter, T* out, Error* out_error = nullptr) {
    Fields row;
    if (!FindFirst(T::TableName(), filter, &row, out_error)) { return false; }
    if (out != nullptr) { *out = T::FromFields(row); }
    return true;
  }

  /// The record of type T matching `filter`, created from `filter` merged
  /// over `defaults` when absent. Nothing is committed: the new row becomes
  /// durable only when this session commits.
  ///
  /// Two sessions racing on the same filter may both insert unless the
  /// table has a UNIQUE constraint on the filter columns.
  template <typename T>
  T GetOrCreate(const Fields& filter, const Fields& defaults = Fields{},
                Error* out_error = nullptr) {
    Error err;
    T record;
    if (Get<T>(filter, &record, &err)) { return record; }
    if (!err.ok()) {
      Report(out_error, err);
      return T{};
    }

    Fields params = defaults;
    for (const auto& kv : filter) { params[kv.first] = kv.second; }
    record = T::FromFields(params);
    err = Add(record);
    if (!err.ok()) {
      Report(out_error, err);
      return T{};
    }
    if (log::Logger()->should_log(spdlog::level::debug)) {
      log::Debug("New record: {}({})", T::TableName(), Describe(params));
    }

    // Read the row back so that generated columns are populated.
    Get<T>(filter, &record, &err);
    Report(out_error, err);
    return record;
  }

 private:
  friend class BatchedQuery;
  friend class Database;

  explicit Session(PooledConnection lease) : lease_(std::move(lease)) {}

  bool CheckOpen(Error* out_error) const {
    if (lease_.Valid()) { return true; }
    Report(out_error, Error::Make(ErrorCode::kNotOpen, "Session closed"));
    return false;
  }

  bool FindFirst(const std::string& table, const Fields& filter, Fields* out,
                 Error* out_error) {
    if (!CheckOpen(out_error)) { return false; }
    Connection& conn = *lease_;
    std::string sql = "SELECT * FROM " + conn.QuoteIdentifier(table);
    Params params;
    bool first = true;
    for (const auto& kv : filter) {
      sql += first ? " WHERE " : " AND ";
      first = false;
      sql += conn.QuoteIdentifier(kv.first);
      if (kv.second.IsNull()) {
        sql += " IS NULL";
      } else {
        params.push_back(kv.second);
        sql += " = " + conn.Placeholder(static_cast<int32_t>(params.size()));
      }
    }
    sql += " LIMIT 1";

    Error err;
    Rows rows = conn.Query(sql, params, &err);
    if (!err.ok()) {
      Report(out_error, err);
      return false;
    }
    if (rows.empty()) { return false; }
    *out = rows.front().ToFields();
    return true;
  }

  static std::string Describe(const Fields& fields) {
    std::string out;
    for (const auto& kv : fields) {
      if (!out.empty()) { out += ", "; }
      out += kv.first + "=" + kv.second.AsString("NULL");
    }
    return out;
  }

  PooledConnection lease_;
};

}  // namespace dbkit
