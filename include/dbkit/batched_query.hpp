// Copyright (c) 2024 liudegui. MIT License.
//
// dbkit::BatchedQuery -- walk a large result set in LIMIT/OFFSET windows.
//
// Design:
//   - Pull iterator: Next() runs one window query per call
//   - Window i..i+k is "<query> LIMIT k OFFSET i"; the offset advances by the
//     number of rows actually returned and iteration stops on the first
//     empty window
//   - Optional up-front COUNT(*) reports the total row count in each batch
//   - Without a deterministic ORDER BY in the query, windows may overlap or
//     skip rows; nothing here adds one

#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include "dbkit/error.hpp"
#include "dbkit/session.hpp"
#include "dbkit/value.hpp"

namespace dbkit {

// ---------------------------------------------------------------------------
// Batch / BatchOptions
// ---------------------------------------------------------------------------

struct BatchOptions {
  int64_t batch_size = 1000;
  int64_t start_at = 0;
  bool compute_max_rows = false;
};

struct Batch {
  int64_t batch_num = 0;  // 1-based
  int64_t offset = 0;     // first row of the window
  int64_t limit = 0;      // offset + batch_size
  bool has_max_rows = false;
  int64_t max_rows = 0;   // total rows, only with compute_max_rows
  Rows rows;
};

// ---------------------------------------------------------------------------
// BatchedQuery
// ---------------------------------------------------------------------------

class BatchedQuery {
 public:
  /// `session` must outlive the iterator.
  BatchedQuery(Session& session, std::string sql,
               const BatchOptions& options = BatchOptions{})
      : session_(&session), sql_(StripTerminator(std::move(sql))),
        options_(options), offset_(options.start_at) {}

  /// Fetch the next window into `*out`. Returns false once the result set is
  /// exhausted or on error (reported through `out_error`).
  bool Next(Batch* out, Error* out_error = nullptr) {
    if (out == nullptr) {
      Report(out_error, Error::Make(ErrorCode::kNullParam, "out is null"));
      return false;
    }
    if (done_) { return false; }
    if (options_.batch_size <= 0 || options_.start_at < 0) {
      done_ = true;
      Report(out_error, Error::Format(ErrorCode::kConfiguration,
                                      "Invalid batch window: size=%lld "
                                      "start_at=%lld",
                                      static_cast<long long>(
                                          options_.batch_size),
                                      static_cast<long long>(
                                          options_.start_at)));
      return false;
    }

    Error err;
    if (options_.compute_max_rows && !counted_) {
      max_rows_ = session_->ExecScalar(
          "SELECT COUNT(*) FROM (" + sql_ + ") AS dbkit_batched_count",
          Params{}, 0, &err);
      if (!err.ok()) {
        done_ = true;
        Report(out_error, err);
        return false;
      }
      counted_ = true;
    }

    std::string window = sql_ + " LIMIT " +
                         std::to_string(options_.batch_size) + " OFFSET " +
                         std::to_string(offset_);
    Rows rows = session_->Query(window, Params{}, &err);
    if (!err.ok()) {
      done_ = true;
      Report(out_error, err);
      return false;
    }
    if (rows.empty()) {
      done_ = true;
      return false;
    }

    ++batch_num_;
    out->batch_num = batch_num_;
    out->offset = offset_;
    out->limit = offset_ + options_.batch_size;
    out->has_max_rows = counted_;
    out->max_rows = counted_ ? max_rows_ : 0;
    offset_ += static_cast<int64_t>(rows.size());
    out->rows = std::move(rows);
    return true;
  }

  /// Number of windows produced so far.
  int64_t batches() const { return batch_num_; }

 private:
  static std::string StripTerminator(std::string sql) {
    while (!sql.empty() && (sql.back() == ';' || sql.back() == ' ' ||
                            sql.back() == '\n' || sql.back() == '\t' ||
                            sql.back() == '\r')) {
      sql.pop_back();
    }
    return sql;
  }

  Session* session_;
  std::string sql_;
  BatchOptions options_;
  int64_t offset_;
  int64_t batch_num_ = 0;
  int64_t max_rows_ = 0;
  bool counted_ = false;
  bool done_ = false;
};

inline BatchedQuery Session::Batched(std::string sql,
                                    const BatchOptions& options) {
  return BatchedQuery(*this, std::move(sql), options);
}

}  // namespace dbkit
