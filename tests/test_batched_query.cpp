// Copyright (c) 2024 liudegui. MIT License.
// Tests for dbkit::BatchedQuery.

#include <catch2/catch_test_macros.hpp>
#include <memory>
#include <vector>

#include "dbkit/batched_query.hpp"
#include "dbkit/database.hpp"
#include "test_support.hpp"

using namespace dbkit;

static std::unique_ptr<Database> OpenNumbers(int32_t count) {
  Error err;
  auto db = Database::Create("sqlite://", Schema{dbkit_test::NumbersTable()},
                             false, EngineOptions{}, &err);
  REQUIRE(db != nullptr);
  REQUIRE(dbkit_test::FillNumbers(db.get(), count).ok());
  return db;
}

static std::vector<Batch> Drain(BatchedQuery* query, Error* err) {
  std::vector<Batch> batches;
  Batch batch;
  while (query->Next(&batch, err)) { batches.push_back(batch); }
  return batches;
}

TEST_CASE("BatchedQuery: number of batches", "[batched_query]") {
  auto db = OpenNumbers(25);
  Session s = db->OpenSession();

  struct Case {
    int64_t batch_size;
    size_t expected;
  };
  for (const Case& c : {Case{1, 25}, Case{5, 5}, Case{7, 4}, Case{25, 1},
                        Case{1000, 1}}) {
    BatchOptions options;
    options.batch_size = c.batch_size;
    BatchedQuery query(s, "SELECT n FROM numbers ORDER BY n", options);
    Error err;
    std::vector<Batch> batches = Drain(&query, &err);
    REQUIRE(err.ok());
    REQUIRE(batches.size() == c.expected);
    REQUIRE(query.batches() == static_cast<int64_t>(c.expected));
  }
}

TEST_CASE("BatchedQuery: batches concatenate to the full result",
          "[batched_query]") {
  auto db = OpenNumbers(23);
  Session s = db->OpenSession();

  Error err;
  Rows full = s.Query("SELECT n FROM numbers ORDER BY n", Params{}, &err);
  REQUIRE(full.size() == 23);

  BatchOptions options;
  options.batch_size = 4;
  BatchedQuery query(s, "SELECT n FROM numbers ORDER BY n", options);
  Rows joined;
  int64_t expected_num = 1;
  for (const Batch& batch : Drain(&query, &err)) {
    REQUIRE(batch.batch_num == expected_num++);
    REQUIRE(batch.offset == static_cast<int64_t>(joined.size()));
    REQUIRE(batch.limit == batch.offset + 4);
    REQUIRE_FALSE(batch.has_max_rows);
    REQUIRE(batch.rows.size() <= 4);
    joined.insert(joined.end(), batch.rows.begin(), batch.rows.end());
  }
  REQUIRE(err.ok());
  REQUIRE(joined == full);
}

TEST_CASE("BatchedQuery: start_at skips leading rows", "[batched_query]") {
  auto db = OpenNumbers(10);
  Session s = db->OpenSession();

  BatchOptions options;
  options.batch_size = 3;
  options.start_at = 4;
  BatchedQuery query(s, "SELECT n FROM numbers ORDER BY n", options);
  Error err;
  std::vector<Batch> batches = Drain(&query, &err);
  REQUIRE(batches.size() == 2);
  REQUIRE(batches[0].offset == 4);
  REQUIRE(batches[0].limit == 7);
  REQUIRE(batches[0].rows.front().GetInt64(0) == 4);
  REQUIRE(batches[1].rows.size() == 3);
  REQUIRE(batches[1].rows.back().GetInt64(0) == 9);
}

TEST_CASE("BatchedQuery: start_at past the end yields nothing",
          "[batched_query]") {
  auto db = OpenNumbers(3);
  Session s = db->OpenSession();
  BatchOptions options;
  options.start_at = 3;
  BatchedQuery query(s, "SELECT n FROM numbers", options);
  Batch batch;
  Error err;
  REQUIRE_FALSE(query.Next(&batch, &err));
  REQUIRE(err.ok());
}

TEST_CASE("BatchedQuery: max_rows on every batch", "[batched_query]") {
  auto db = OpenNumbers(12);
  Session s = db->OpenSession();

  BatchOptions options;
  options.batch_size = 5;
  options.compute_max_rows = true;
  BatchedQuery query(s, "SELECT n FROM numbers WHERE n >= 2 ORDER BY n;",
                     options);
  Error err;
  std::vector<Batch> batches = Drain(&query, &err);
  REQUIRE(err.ok());
  REQUIRE(batches.size() == 2);
  for (const Batch& batch : batches) {
    REQUIRE(batch.has_max_rows);
    REQUIRE(batch.max_rows == 10);
  }
}

TEST_CASE("BatchedQuery: empty result", "[batched_query]") {
  auto db = OpenNumbers(0);
  Session s = db->OpenSession();
  BatchedQuery query = s.Batched("SELECT n FROM numbers", BatchOptions{});
  Batch batch;
  Error err;
  REQUIRE_FALSE(query.Next(&batch, &err));
  REQUIRE(err.ok());
  REQUIRE(query.batches() == 0);
}

TEST_CASE("BatchedQuery: invalid window", "[batched_query]") {
  auto db = OpenNumbers(3);
  Session s = db->OpenSession();

  BatchOptions zero;
  zero.batch_size = 0;
  BatchedQuery a(s, "SELECT n FROM numbers", zero);
  Batch batch;
  Error err;
  REQUIRE_FALSE(a.Next(&batch, &err));
  REQUIRE(err.code == ErrorCode::kConfiguration);

  BatchOptions negative;
  negative.start_at = -1;
  BatchedQuery b(s, "SELECT n FROM numbers", negative);
  err.Clear();
  REQUIRE_FALSE(b.Next(&batch, &err));
  REQUIRE(err.code == ErrorCode::kConfiguration);
}

TEST_CASE("BatchedQuery: query error stops iteration", "[batched_query]") {
  auto db = OpenNumbers(3);
  Session s = db->OpenSession();
  BatchedQuery query(s, "SELECT nope FROM numbers");
  Batch batch;
  Error err;
  REQUIRE_FALSE(query.Next(&batch, &err));
  REQUIRE_FALSE(err.ok());

  err.Clear();
  REQUIRE_FALSE(query.Next(&batch, &err));
  REQUIRE(err.ok());
}

TEST_CASE("BatchedQuery: null output batch", "[batched_query]") {
  auto db = OpenNumbers(3);
  Session s = db->OpenSession();
  BatchedQuery query = s.Batched("SELECT n FROM numbers ORDER BY n",
                                 BatchOptions{});
  Error err;
  REQUIRE_FALSE(query.Next(nullptr, &err));
  REQUIRE(err.code == ErrorCode::kNullParam);

  // The iterator is still usable afterwards.
  Batch batch;
  err.Clear();
  REQUIRE(query.Next(&batch, &err));
  REQUIRE(err.ok());
  REQUIRE(batch.rows.size() == 3);
}
