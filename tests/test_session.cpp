// Copyright (c) 2024 liudegui. MIT License.
// Tests for dbkit::Session.

#include <catch2/catch_test_macros.hpp>
#include <string>
#include <utility>

#include "dbkit/database.hpp"
#include "test_support.hpp"

using namespace dbkit;
using dbkit_test::Person;
using dbkit_test::PersonSchema;
using dbkit_test::TempDir;

static std::unique_ptr<Database> OpenMemoryDb() {
  Error err;
  auto db = Database::Create("sqlite://", PersonSchema(), false,
                             EngineOptions{}, &err);
  REQUIRE(db != nullptr);
  return db;
}

TEST_CASE("Session: opens inside a transaction", "[session]") {
  auto db = OpenMemoryDb();
  Error err;
  Session s = db->OpenSession(&err);
  REQUIRE(err.ok());
  REQUIRE(s.IsOpen());
  REQUIRE(s.InTransaction());
  REQUIRE(s.Kind() == BackendKind::kMemory);
}

TEST_CASE("Session: Commit starts the next transaction", "[session]") {
  auto db = OpenMemoryDb();
  Session s = db->OpenSession();
  REQUIRE(s.Insert("person", {{"name", "Alice"}}).ok());
  REQUIRE(s.Commit().ok());
  REQUIRE(s.InTransaction());

  REQUIRE(s.Insert("person", {{"name", "Bob"}}).ok());
  REQUIRE(s.Rollback().ok());
  REQUIRE(s.InTransaction());
  REQUIRE(s.ExecScalar("SELECT COUNT(*) FROM person") == 1);
}

TEST_CASE("Session: Close rolls back and returns the connection",
          "[session]") {
  auto db = OpenMemoryDb();
  {
    Session s = db->OpenSession();
    REQUIRE(s.Insert("person", {{"name", "Alice"}}).ok());
    s.Close();
    REQUIRE_FALSE(s.IsOpen());

    Error err;
    REQUIRE(s.Insert("person", {{"name", "Bob"}}).code == ErrorCode::kNotOpen);
    REQUIRE(s.Query("SELECT 1", Params{}, &err).empty());
    REQUIRE(err.code == ErrorCode::kNotOpen);
    REQUIRE(s.Commit().code == ErrorCode::kNotOpen);
  }
  REQUIRE(db->engine()->idle_count() == 1);
  Session s = db->OpenSession();
  REQUIRE(s.ExecScalar("SELECT COUNT(*) FROM person") == 0);
}

TEST_CASE("Session: dialect accessors on a closed session", "[session]") {
  auto db = OpenMemoryDb();
  Session s = db->OpenSession();
  REQUIRE(s.Placeholder(1) == "?");
  s.Close();
  REQUIRE(s.Kind() == BackendKind::kMemory);
  REQUIRE(s.Placeholder(1) == "?");

  Session never_opened;
  REQUIRE_FALSE(never_opened.IsOpen());
  REQUIRE_FALSE(never_opened.InTransaction());
  REQUIRE(never_opened.Kind() == BackendKind::kMemory);
  REQUIRE(never_opened.Placeholder(2) == "?");
}

TEST_CASE("Session: move transfers the lease", "[session]") {
  auto db = OpenMemoryDb();
  Session a = db->OpenSession();
  REQUIRE(a.Insert("person", {{"name", "Alice"}}).ok());

  Session b(std::move(a));
  REQUIRE_FALSE(a.IsOpen());
  REQUIRE(b.IsOpen());
  REQUIRE(b.ExecScalar("SELECT COUNT(*) FROM person") == 1);

  Session c;
  c = std::move(b);
  REQUIRE(c.IsOpen());
  REQUIRE(c.Commit().ok());
}

TEST_CASE("Session: Add and Get", "[session]") {
  auto db = OpenMemoryDb();
  Session s = db->OpenSession();

  Person alice;
  alice.name = "Alice";
  alice.age = 30;
  alice.score = 2.5;
  alice.avatar = std::string("\x89PNG\x00", 5);
  alice.active = true;
  REQUIRE(s.Add(alice).ok());

  Person found;
  Error err;
  REQUIRE(s.Get<Person>({{"name", "Alice"}}, &found, &err));
  REQUIRE(err.ok());
  REQUIRE(found.id > 0);
  REQUIRE(found.age == 30);
  REQUIRE(found.score == 2.5);
  REQUIRE(found.avatar == alice.avatar);
  REQUIRE(found.active);

  Person missing;
  REQUIRE_FALSE(s.Get<Person>({{"name", "Nobody"}}, &missing, &err));
  REQUIRE(err.ok());
  REQUIRE(missing.id == 0);
}

TEST_CASE("Session: Get with a null filter value", "[session]") {
  auto db = OpenMemoryDb();
  Session s = db->OpenSession();
  REQUIRE(s.Insert("person", {{"name", "Anon"}}).ok());

  Person found;
  REQUIRE(s.Get<Person>({{"age", Value::Null()}}, &found));
  REQUIRE(found.name == "Anon");
}

TEST_CASE("Session: Get on an unknown column reports the error",
          "[session]") {
  auto db = OpenMemoryDb();
  Session s = db->OpenSession();
  Person found;
  Error err;
  REQUIRE_FALSE(s.Get<Person>({{"height", 180}}, &found, &err));
  REQUIRE_FALSE(err.ok());
}

TEST_CASE("Session: GetOrCreate inserts once", "[session]") {
  TempDir dir;
  Error err;
  auto db = Database::Create(dir.SqliteUrl("goc.db"), PersonSchema(), false,
                             EngineOptions{}, &err);
  REQUIRE(db != nullptr);

  int64_t first_id = 0;
  err = db->WithSession(true, [&first_id](Session& s) {
    Error e;
    Person p = s.GetOrCreate<Person>({{"name", "Alice"}}, {{"age", 30}}, &e);
    first_id = p.id;
    return e;
  });
  REQUIRE(err.ok());
  REQUIRE(first_id > 0);

  err = db->WithSession(true, [first_id](Session& s) {
    Error e;
    Person p = s.GetOrCreate<Person>({{"name", "Alice"}}, {{"age", 99}}, &e);
    REQUIRE(p.id == first_id);
    // Defaults only apply to new records.
    REQUIRE(p.age == 30);
    REQUIRE(s.ExecScalar("SELECT COUNT(*) FROM person") == 1);
    return e;
  });
  REQUIRE(err.ok());
}

TEST_CASE("Session: GetOrCreate filter wins over defaults", "[session]") {
  auto db = OpenMemoryDb();
  Session s = db->OpenSession();
  Error err;
  Person p = s.GetOrCreate<Person>({{"name", "Bob"}, {"age", 41}},
                                   {{"name", "Ignored"}, {"age", 1},
                                    {"score", 9.5}},
                                   &err);
  REQUIRE(err.ok());
  REQUIRE(p.name == "Bob");
  REQUIRE(p.age == 41);
  REQUIRE(p.score == 9.5);
}

TEST_CASE("Session: GetOrCreate does not commit", "[session]") {
  auto db = OpenMemoryDb();
  {
    Session s = db->OpenSession();
    Error err;
    Person p = s.GetOrCreate<Person>({{"name", "Temp"}}, Fields{}, &err);
    REQUIRE(err.ok());
    REQUIRE(p.id > 0);
  }
  Session s = db->OpenSession();
  Person p;
  REQUIRE_FALSE(s.Get<Person>({{"name", "Temp"}}, &p));
}

TEST_CASE("Session: GetOrCreate propagates insert errors", "[session]") {
  auto db = OpenMemoryDb();
  Session s = db->OpenSession();
  Error err;
  // Matches nothing, and the merged record collides on the unique name.
  REQUIRE(s.Insert("person", {{"name", "Dup"}, {"age", 1}}).ok());
  Person p = s.GetOrCreate<Person>({{"name", "Dup"}, {"age", 2}}, Fields{},
                                   &err);
  REQUIRE(err.code == ErrorCode::kConstraint);
  REQUIRE(p.id == 0);
}
