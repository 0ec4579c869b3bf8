// Copyright (c) 2024 liudegui. MIT License.
// Tests for dbkit::MessageMapping.

#include <catch2/catch_test_macros.hpp>
#include <cstdint>
#include <string>

#include "dbkit/message_mapping.hpp"
#include "test_support.hpp"

using namespace dbkit;
using dbkit_test::Person;
using dbkit_test::PersonProto;
using dbkit_test::TempDir;

static Person Alice() {
  Person p;
  p.id = 12;
  p.name = "Alice";
  p.age = 30;
  p.score = 0.75;
  p.avatar = std::string("\x00\x10\xFF", 3);
  p.active = true;
  return p;
}

static void RequireRoundTrip(const Person& record) {
  PersonProto message;
  REQUIRE(record.ToMessage(&message).ok());
  Fields fields;
  REQUIRE(Person::FromMessage(message, &fields).ok());
  REQUIRE(fields == record.ToFields());
}

TEST_CASE("MessageMapping: round trip of a populated record",
          "[message_mapping]") {
  RequireRoundTrip(Alice());
}

TEST_CASE("MessageMapping: round trip of an empty record",
          "[message_mapping]") {
  RequireRoundTrip(Person{});
}

TEST_CASE("MessageMapping: round trip at value boundaries",
          "[message_mapping]") {
  Person p;
  p.id = INT64_MAX;
  p.name = std::string(100000, 'n');
  p.age = INT64_MIN;
  p.score = -1e308;
  p.avatar = std::string(4096, '\0');
  RequireRoundTrip(p);
}

TEST_CASE("MessageMapping: ToMessage clears the target", "[message_mapping]") {
  PersonProto message;
  message.set_name("stale");
  message.set_age(99);

  Person p;
  p.name = "fresh";
  REQUIRE(p.ToMessage(&message).ok());
  REQUIRE(message.name() == "fresh");
  REQUIRE(message.age() == 0);
  REQUIRE(p.ToMessage(nullptr).code == ErrorCode::kNullParam);
}

TEST_CASE("MessageMapping: unmapped type reports not implemented",
          "[message_mapping]") {
  dbkit_test::Tag tag;
  tag.label = "x";
  dbkit_test::TagProto message;
  REQUIRE(tag.ToMessage(&message).code == ErrorCode::kNotImplemented);

  Fields fields;
  REQUIRE(dbkit_test::Tag::FromMessage(message, &fields).code ==
          ErrorCode::kNotImplemented);
}

TEST_CASE("MessageMapping: FromSerializedFile text format",
          "[message_mapping]") {
  TempDir dir;
  std::string path = dir.Write("alice.pbtxt",
                               "name: \"Alice\"\n"
                               "age: 30\n"
                               "active: true\n");
  Fields fields;
  REQUIRE(Person::FromSerializedFile(path, &fields).ok());
  Person p = Person::FromFields(fields);
  REQUIRE(p.name == "Alice");
  REQUIRE(p.age == 30);
  REQUIRE(p.active);
  REQUIRE(p.id == 0);
}

TEST_CASE("MessageMapping: FromSerializedFile binary format",
          "[message_mapping]") {
  TempDir dir;
  PersonProto message;
  REQUIRE(Alice().ToMessage(&message).ok());
  std::string path = dir.Write("alice.pb", message.SerializeAsString());

  Fields fields;
  REQUIRE(Person::FromSerializedFile(path, &fields).ok());
  REQUIRE(fields == Alice().ToFields());
}

TEST_CASE("MessageMapping: FromSerializedFile json format",
          "[message_mapping]") {
  TempDir dir;
  std::string path =
      dir.Write("bob.json", R"({"name": "Bob", "age": "41", "score": 1.5})");
  Fields fields;
  REQUIRE(Person::FromSerializedFile(path, &fields).ok());
  Person p = Person::FromFields(fields);
  REQUIRE(p.name == "Bob");
  REQUIRE(p.age == 41);
  REQUIRE(p.score == 1.5);
}

TEST_CASE("MessageMapping: FromSerializedFile failures",
          "[message_mapping]") {
  TempDir dir;
  Fields fields;
  REQUIRE(Person::FromSerializedFile(dir.File("absent.pbtxt"), &fields).code ==
          ErrorCode::kDeserialization);

  std::string bad_text = dir.Write("bad.pbtxt", "name: [not a string\n");
  REQUIRE(Person::FromSerializedFile(bad_text, &fields).code ==
          ErrorCode::kDeserialization);

  std::string bad_json = dir.Write("bad.json", "{\"name\": ");
  REQUIRE(Person::FromSerializedFile(bad_json, &fields).code ==
          ErrorCode::kDeserialization);

  std::string unknown = dir.Write("unknown.pbtxt", "height: 180\n");
  REQUIRE(Person::FromSerializedFile(unknown, &fields).code ==
          ErrorCode::kDeserialization);
}

TEST_CASE("MessageMapping: FromSerializedFile on an unmapped type",
          "[message_mapping]") {
  TempDir dir;
  std::string path = dir.Write("tag.pbtxt", "label: \"x\"\n");
  Fields fields;
  REQUIRE(dbkit_test::Tag::FromSerializedFile(path, &fields).code ==
          ErrorCode::kNotImplemented);
}
