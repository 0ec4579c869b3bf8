// Copyright (c) 2024 liudegui. MIT License.
// Shared fixtures for the dbkit tests.

#pragma once

#include <unistd.h>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

#include "dbkit/dbkit.hpp"
#include "dbkit_test.pb.h"

namespace dbkit_test {

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
 public:
  TempDir() {
    static std::atomic<int32_t> counter{0};
    path_ = std::filesystem::temp_directory_path() /
            ("dbkit_test_" + std::to_string(::getpid()) + "_" +
             std::to_string(counter.fetch_add(1)));
    std::filesystem::create_directories(path_);
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& path() const { return path_; }

  std::string File(const std::string& name) const {
    return (path_ / name).string();
  }

  // "sqlite:////abs/dir/name"
  std::string SqliteUrl(const std::string& name) const {
    return "sqlite:///" + File(name);
  }

  std::string Write(const std::string& name, const std::string& content) const {
    std::string file = File(name);
    std::ofstream out(file, std::ios::binary);
    out << content;
    return file;
  }

 private:
  std::filesystem::path path_;
};

// Record type mapped to the "person" table and to PersonProto.
struct Person : dbkit::MessageMapping<Person, PersonProto> {
  int64_t id = 0;  // 0 until stored
  std::string name;
  int64_t age = 0;
  double score = 0.0;
  std::string avatar;
  bool active = false;

  static const char* TableName() { return "person"; }

  dbkit::Fields ToFields() const {
    dbkit::Fields fields;
    if (id != 0) { fields["id"] = id; }
    fields["name"] = name;
    fields["age"] = age;
    fields["score"] = score;
    fields["avatar"] = dbkit::Value::Blob(avatar);
    fields["active"] = active;
    return fields;
  }

  static Person FromFields(const dbkit::Fields& fields) {
    Person p;
    p.id = dbkit::FieldOr(fields, "id").AsInt64();
    p.name = dbkit::FieldOr(fields, "name").AsString();
    p.age = dbkit::FieldOr(fields, "age").AsInt64();
    p.score = dbkit::FieldOr(fields, "score").AsDouble();
    p.avatar = dbkit::FieldOr(fields, "avatar").AsString();
    p.active = dbkit::FieldOr(fields, "active").AsBool();
    return p;
  }

  dbkit::Error SetMessage(PersonProto* out) const {
    out->set_id(id);
    out->set_name(name);
    out->set_age(age);
    out->set_score(score);
    out->set_avatar(avatar);
    out->set_active(active);
    return dbkit::Error::Ok();
  }

  static dbkit::Error FromMessage(const PersonProto& message,
                                  dbkit::Fields* out) {
    Person p;
    p.id = message.id();
    p.name = message.name();
    p.age = message.age();
    p.score = message.score();
    p.avatar = message.avatar();
    p.active = message.active();
    *out = p.ToFields();
    return dbkit::Error::Ok();
  }
};

// Mapping capability without any conversion provided.
struct Tag : dbkit::MessageMapping<Tag, TagProto> {
  std::string label;
};

inline dbkit::TableDef PersonTable() {
  return dbkit::TableDef("person")
      .Add(dbkit::ColumnDef::Integer("id").PrimaryKey().AutoIncrement())
      .Add(dbkit::ColumnDef::Text("name", 64).NotNull().Unique())
      .Add(dbkit::ColumnDef::Integer("age"))
      .Add(dbkit::ColumnDef::Real("score"))
      .Add(dbkit::ColumnDef::Blob("avatar"))
      .Add(dbkit::ColumnDef::Boolean("active"));
}

inline dbkit::Schema PersonSchema() { return dbkit::Schema{PersonTable()}; }

inline dbkit::TableDef NumbersTable() {
  return dbkit::TableDef("numbers")
      .Add(dbkit::ColumnDef::Integer("n").PrimaryKey());
}

// Insert 0..count-1 into "numbers" and commit.
inline dbkit::Error FillNumbers(dbkit::Database* db, int32_t count) {
  return db->WithSession(true, [count](dbkit::Session& s) {
    dbkit::Error err;
    for (int32_t i = 0; i < count; ++i) {
      s.ExecDml("INSERT INTO numbers (n) VALUES (" + s.Placeholder(1) + ")",
                dbkit::Params{i}, &err);
      if (!err.ok()) { return err; }
    }
    return dbkit::Error::Ok();
  });
}

}  // namespace dbkit_test
