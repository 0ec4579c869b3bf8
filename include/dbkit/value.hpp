// Copyright (c) 2024 liudegui. MIT License.
//
// dbkit::Value / dbkit::Row -- backend-neutral column values.
//
// Design:
//   - Value: tagged scalar (null, integer, real, text, blob), copyable
//   - Fields: column name -> Value, ordered by name so generated SQL is stable
//   - Row: one materialized result row, column names shared across a result
//   - Typed accessors with null defaults, same convention as the drivers

#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace dbkit {

// ---------------------------------------------------------------------------
// Value
// ---------------------------------------------------------------------------

enum class ValueType : uint8_t {
  kNull = 0,
  kInteger,
  kReal,
  kText,
  kBlob,
};

class Value {
 public:
  Value() = default;

  Value(int32_t v) : type_(ValueType::kInteger), int_(v) {}
  Value(int64_t v) : type_(ValueType::kInteger), int_(v) {}
  Value(uint32_t v) : type_(ValueType::kInteger), int_(v) {}
  Value(bool v) : type_(ValueType::kInteger), int_(v ? 1 : 0) {}
  Value(double v) : type_(ValueType::kReal), real_(v) {}
  Value(const char* v) {
    if (v != nullptr) {
      type_ = ValueType::kText;
      bytes_ = v;
    }
  }
  Value(std::string v) : type_(ValueType::kText), bytes_(std::move(v)) {}

  static Value Null() { return Value(); }

  static Value Blob(std::string bytes) {
    Value v(std::move(bytes));
    v.type_ = ValueType::kBlob;
    return v;
  }

  static Value Blob(const uint8_t* data, size_t len) {
    return Blob(std::string(reinterpret_cast<const char*>(data), len));
  }

  ValueType type() const { return type_; }
  bool IsNull() const { return type_ == ValueType::kNull; }

  int64_t AsInt64(int64_t null_value = 0) const {
    switch (type_) {
      case ValueType::kInteger: return int_;
      case ValueType::kReal: return static_cast<int64_t>(real_);
      case ValueType::kText: return std::strtoll(bytes_.c_str(), nullptr, 10);
      default: return null_value;
    }
  }

  int32_t AsInt(int32_t null_value = 0) const {
    return static_cast<int32_t>(AsInt64(null_value));
  }

  bool AsBool(bool null_value = false) const {
    if (IsNull()) { return null_value; }
    return AsInt64() != 0;
  }

  double AsDouble(double null_value = 0.0) const {
    switch (type_) {
      case ValueType::kInteger: return static_cast<double>(int_);
      case ValueType::kReal: return real_;
      case ValueType::kText: return std::strtod(bytes_.c_str(), nullptr);
      default: return null_value;
    }
  }

  /// Text or blob bytes. Numbers are rendered as SQL literals.
  std::string AsString(const std::string& null_value = "") const {
    switch (type_) {
      case ValueType::kInteger: return std::to_string(int_);
      case ValueType::kReal: return FormatReal(real_);
      case ValueType::kText:
      case ValueType::kBlob: return bytes_;
      default: return null_value;
    }
  }

  /// Raw bytes of a text or blob value; empty for other types.
  const std::string& Bytes() const { return bytes_; }

  bool operator==(const Value& other) const {
    if (type_ != other.type_) { return false; }
    switch (type_) {
      case ValueType::kNull: return true;
      case ValueType::kInteger: return int_ == other.int_;
      case ValueType::kReal: return real_ == other.real_;
      default: return bytes_ == other.bytes_;
    }
  }

  bool operator!=(const Value& other) const { return !(*this == other); }

  static std::string FormatReal(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.17g", v);
    return buf;
  }

 private:
  ValueType type_ = ValueType::kNull;
  int64_t int_ = 0;
  double real_ = 0.0;
  std::string bytes_;
};

using Fields = std::map<std::string, Value>;
using Params = std::vector<Value>;

/// Value of `name` in `fields`, or Null when absent.
inline const Value& FieldOr(const Fields& fields, const std::string& name) {
  static const Value kNullValue;
  auto it = fields.find(name);
  return (it != fields.end()) ? it->second : kNullValue;
}

/// Current UTC time as "YYYY-MM-DD HH:MM:SS.mmm", the text form stored in
/// millisecond datetime columns.
inline Value UtcMillisecondsNow() {
  using std::chrono::duration_cast;
  using std::chrono::milliseconds;
  auto now = std::chrono::system_clock::now();
  int64_t ms = duration_cast<milliseconds>(now.time_since_epoch()).count();
  std::time_t secs = static_cast<std::time_t>(ms / 1000);
  std::tm tm_utc{};
  gmtime_r(&secs, &tm_utc);
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d.%03d",
                tm_utc.tm_year + 1900, tm_utc.tm_mon + 1, tm_utc.tm_mday,
                tm_utc.tm_hour, tm_utc.tm_min, tm_utc.tm_sec,
                static_cast<int>(ms % 1000));
  return Value(std::string(buf));
}

// ---------------------------------------------------------------------------
// Row
// ---------------------------------------------------------------------------

using ColumnNames = std::shared_ptr<const std::vector<std::string>>;

class Row {
 public:
  Row() = default;
  Row(ColumnNames columns, std::vector<Value> values)
      : columns_(std::move(columns)), values_(std::move(values)) {}

  int32_t NumFields() const { return static_cast<int32_t>(values_.size()); }

  int32_t FieldIndex(const std::string& name) const {
    if (columns_ == nullptr) { return -1; }
    for (size_t i = 0; i < columns_->size(); ++i) {
      if ((*columns_)[i] == name) { return static_cast<int32_t>(i); }
    }
    return -1;
  }

  const std::string& FieldName(int32_t col) const { return columns_->at(col); }

  const Value& Get(int32_t col) const {
    static const Value kNullValue;
    if (col < 0 || col >= NumFields()) { return kNullValue; }
    return values_[static_cast<size_t>(col)];
  }

  const Value& Get(const std::string& name) const {
    return Get(FieldIndex(name));
  }

  int64_t GetInt64(int32_t col, int64_t null_value = 0) const {
    return Get(col).AsInt64(null_value);
  }

  std::string GetString(int32_t col, const std::string& null_value = "") const {
    return Get(col).AsString(null_value);
  }

  Fields ToFields() const {
    Fields fields;
    for (int32_t i = 0; i < NumFields(); ++i) {
      fields[FieldName(i)] = values_[static_cast<size_t>(i)];
    }
    return fields;
  }

  const std::vector<Value>& values() const { return values_; }

  bool operator==(const Row& other) const { return values_ == other.values_; }

 private:
  ColumnNames columns_;
  std::vector<Value> values_;
};

using Rows = std::vector<Row>;

}  // namespace dbkit
