// Copyright (c) 2024 liudegui. MIT License.
//
// dbkit::Connection -- one live backend connection.
//
// Design:
//   - Abstract interface, one implementation per BackendKind
//   - Error reporting via Error* output parameter (no exceptions)
//   - Parameters are positional Values; placeholders are dialect specific,
//     generated SQL asks the connection via Placeholder()/QuoteIdentifier()
//   - Not thread-safe: a connection belongs to one session at a time

#pragma once

#include <cstdint>
#include <string>

#include "dbkit/descriptor.hpp"
#include "dbkit/error.hpp"
#include "dbkit/log.hpp"
#include "dbkit/value.hpp"

namespace dbkit {

// ---------------------------------------------------------------------------
// Connection
// ---------------------------------------------------------------------------

class Connection {
 public:
  virtual ~Connection() = default;

  virtual BackendKind Kind() const = 0;
  virtual bool IsOpen() const = 0;
  virtual void Close() = 0;

  /// Execute a statement that returns no rows.
  /// Returns the number of affected rows, or -1 on error.
  virtual int64_t ExecDml(const std::string& sql, const Params& params,
                          Error* out_error) = 0;

  /// Execute a query and materialize every row it returns.
  virtual Rows Query(const std::string& sql, const Params& params,
                     Error* out_error) = 0;

  virtual bool TableExists(const std::string& table, Error* out_error) = 0;

  // --- Transaction ---

  virtual Error BeginTransaction() = 0;
  virtual Error Commit() = 0;
  virtual Error Rollback() = 0;
  virtual bool InTransaction() const = 0;

  // --- Dialect ---

  /// Positional placeholder for the 1-based parameter `index`.
  virtual std::string Placeholder(int32_t index) const {
    (void)index;
    return "?";
  }

  virtual std::string QuoteIdentifier(const std::string& name) const {
    std::string out = "\"";
    for (char c : name) {
      if (c == '"') { out += '"'; }
      out += c;
    }
    out += '"';
    return out;
  }

  // --- Convenience ---

  int64_t ExecDml(const std::string& sql, Error* out_error = nullptr) {
    return ExecDml(sql, Params{}, out_error);
  }

  Rows Query(const std::string& sql, Error* out_error = nullptr) {
    return Query(sql, Params{}, out_error);
  }

  /// First column of the first row, or `null_value`.
  int64_t ExecScalar(const std::string& sql, const Params& params,
                     int64_t null_value = 0, Error* out_error = nullptr) {
    Error err;
    Rows rows = Query(sql, params, &err);
    if (!err.ok()) {
      Report(out_error, err);
      return null_value;
    }
    if (rows.empty() || rows.front().NumFields() < 1) {
      Report(out_error,
             Error::Make(ErrorCode::kError, "Invalid scalar query"));
      return null_value;
    }
    return rows.front().Get(0).AsInt64(null_value);
  }

  void SetEcho(bool echo) { echo_ = echo; }
  bool echo() const { return echo_; }

 protected:
  void Echo(const std::string& sql, const Params& params) const {
    if (!echo_) { return; }
    log::Info("[{}] {} ({} params)", BackendKindName(Kind()), sql,
              params.size());
  }

 private:
  bool echo_ = false;
};

}  // namespace dbkit
