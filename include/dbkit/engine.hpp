// Copyright (c) 2024 liudegui. MIT License.
//
// dbkit::Engine -- backend bootstrap and bounded connection pool.
//
// Design:
//   - Engine::Create() performs the backend specific existence check,
//     creates the database when allowed, then opens one probe connection to
//     force eager side effects (e.g. SQLite file creation)
//   - Bounded pool: Acquire() blocks while pool_size connections are leased
//   - PooledConnection is a move-only RAII lease that returns its
//     connection on destruction, rolling back a transaction left open
//   - In-memory SQLite pools hold exactly one connection: the database lives
//     and dies with it
//   - Existence check and CREATE DATABASE are two steps; concurrent creators
//     in other processes can race between them

#pragma once

#include <condition_variable>
#include <cstdint>
#include <cstdlib>
#include <deque>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include "dbkit/connection.hpp"
#include "dbkit/descriptor.hpp"
#include "dbkit/error.hpp"
#include "dbkit/log.hpp"
#include "dbkit/pg_connection.hpp"
#include "dbkit/sqlite3_connection.hpp"

#if defined(DBKIT_HAS_MARIADB) && DBKIT_HAS_MARIADB
#include "dbkit/maria_connection.hpp"
#endif

namespace dbkit {

// ---------------------------------------------------------------------------
// EngineOptions
// ---------------------------------------------------------------------------

struct EngineOptions {
  uint32_t pool_size = 5;
  int32_t busy_timeout_ms = 5000;  // SQLite only
  bool echo = false;               // log every statement

  /// Defaults overlaid with DBKIT_POOL_SIZE, DBKIT_BUSY_TIMEOUT_MS and
  /// DBKIT_SQL_ECHO when set.
  static EngineOptions FromEnvironment() {
    EngineOptions options;
    if (const char* v = std::getenv("DBKIT_POOL_SIZE")) {
      long n = std::strtol(v, nullptr, 10);
      if (n > 0) { options.pool_size = static_cast<uint32_t>(n); }
    }
    if (const char* v = std::getenv("DBKIT_BUSY_TIMEOUT_MS")) {
      long n = std::strtol(v, nullptr, 10);
      if (n >= 0) { options.busy_timeout_ms = static_cast<int32_t>(n); }
    }
    if (const char* v = std::getenv("DBKIT_SQL_ECHO")) {
      options.echo = (v[0] == '1' || v[0] == 't' || v[0] == 'T' ||
                      v[0] == 'y' || v[0] == 'Y');
    }
    return options;
  }
};

/// Open a new connection to `database` on the backend of `desc`. For
/// MySQL an empty `database` connects to the server without a schema.
inline std::unique_ptr<Connection> OpenConnectionTo(
    const ResolvedDescriptor& desc, const std::string& database,
    const EngineOptions& options, Error* out_error) {
  Error err;
  std::unique_ptr<Connection> conn;
  switch (desc.kind) {
    case BackendKind::kMemory:
    case BackendKind::kSqliteFile: {
      auto sqlite = std::make_unique<Sqlite3Connection>();
      err = sqlite->Open(desc.kind, desc.path);
      if (err.ok()) { sqlite->SetBusyTimeout(options.busy_timeout_ms); }
      conn = std::move(sqlite);
      break;
    }
    case BackendKind::kMySql: {
#if defined(DBKIT_HAS_MARIADB) && DBKIT_HAS_MARIADB
      auto maria = std::make_unique<MariaConnection>();
      err = maria->Open(desc, database);
      conn = std::move(maria);
#else
      (void)database;
      err = Error::Make(ErrorCode::kUnsupportedBackend,
                        "dbkit was built without MariaDB/MySQL support");
#endif
      break;
    }
    case BackendKind::kPostgres: {
      auto pg = std::make_unique<PgConnection>();
      err = pg->Open(desc, database);
      conn = std::move(pg);
      break;
    }
  }
  if (!err.ok()) {
    Report(out_error, err);
    return nullptr;
  }
  conn->SetEcho(options.echo);
  return conn;
}

/// Open a new connection to the database named by `desc`.
inline std::unique_ptr<Connection> OpenConnection(
    const ResolvedDescriptor& desc, const EngineOptions& options,
    Error* out_error) {
  return OpenConnectionTo(desc, desc.database, options, out_error);
}

class Engine;

// ---------------------------------------------------------------------------
// PooledConnection
// ---------------------------------------------------------------------------

class PooledConnection {
 public:
  PooledConnection() = default;

  ~PooledConnection() { Release(); }

  // Move
  PooledConnection(PooledConnection&& other) noexcept
      : engine_(other.engine_), conn_(std::move(other.conn_)) {
    other.engine_ = nullptr;
  }

  PooledConnection& operator=(PooledConnection&& other) noexcept {
    if (this != &other) {
      Release();
      engine_ = other.engine_;
      conn_ = std::move(other.conn_);
      other.engine_ = nullptr;
    }
    return *this;
  }

  // No copy
  PooledConnection(const PooledConnection&) = delete;
  PooledConnection& operator=(const PooledConnection&) = delete;

  bool Valid() const { return conn_ != nullptr; }
  Connection* get() const { return conn_.get(); }
  Connection* operator->() const { return conn_.get(); }
  Connection& operator*() const { return *conn_; }

  /// Hand the connection back to the pool now.
  inline void Release();

 private:
  friend class Engine;

  PooledConnection(Engine* engine, std::unique_ptr<Connection> conn)
      : engine_(engine), conn_(std::move(conn)) {}

  Engine* engine_ = nullptr;
  std::unique_ptr<Connection> conn_;
};

// ---------------------------------------------------------------------------
// Engine
// ---------------------------------------------------------------------------

class Engine {
 public:
  ~Engine() { Dispose(); }

  // No copy, no move: leases hold a pointer to the engine.
  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;

  /// Build an engine for `desc`. With `must_exist` the database must already
  /// be present; otherwise it is created when absent.
  static std::unique_ptr<Engine> Create(const ResolvedDescriptor& desc,
                                        bool must_exist,
                                        const EngineOptions& options,
                                        Error* out_error) {
    Error err = EnsureExists(desc, must_exist, options);
    if (!err.ok()) {
      Report(out_error, err);
      return nullptr;
    }

    std::unique_ptr<Engine> engine(new Engine(desc, options));

    // The first connection creates SQLite files; fail here rather than in
    // the first session.
    std::unique_ptr<Connection> probe = OpenConnection(desc, options, &err);
    if (probe == nullptr) {
      Report(out_error, err);
      return nullptr;
    }
    if (desc.kind == BackendKind::kMemory) {
      engine->idle_.push_back(std::move(probe));
      engine->open_count_ = 1;
    } else {
      probe->Close();
    }

    log::Debug("Engine ready for {} ({})", desc.Redacted(),
               BackendKindName(desc.kind));
    return engine;
  }

  /// Lease a connection, blocking while the pool is exhausted.
  PooledConnection Acquire(Error* out_error) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] {
      return disposed_ || !idle_.empty() || open_count_ < capacity_;
    });
    if (disposed_) {
      Report(out_error, Error::Make(ErrorCode::kNotOpen, "Engine disposed"));
      return PooledConnection{};
    }

    if (!idle_.empty()) {
      std::unique_ptr<Connection> conn = std::move(idle_.front());
      idle_.pop_front();
      return PooledConnection(this, std::move(conn));
    }

    // Reserve the slot, then connect without holding the lock.
    ++open_count_;
    lock.unlock();
    Error err;
    std::unique_ptr<Connection> conn = OpenConnection(desc_, options_, &err);
    if (conn == nullptr) {
      lock.lock();
      --open_count_;
      lock.unlock();
      cv_.notify_one();
      Report(out_error, err);
      return PooledConnection{};
    }
    return PooledConnection(this, std::move(conn));
  }

  /// Close every idle connection and refuse further leases. Leased
  /// connections are closed as they come back.
  void Dispose() {
    std::deque<std::unique_ptr<Connection>> idle;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (disposed_) { return; }
      disposed_ = true;
      open_count_ -= static_cast<uint32_t>(idle_.size());
      std::swap(idle, idle_);
    }
    cv_.notify_all();
    for (std::unique_ptr<Connection>& conn : idle) { conn->Close(); }
  }

  bool disposed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return disposed_;
  }

  uint32_t capacity() const { return capacity_; }

  uint32_t open_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_count_;
  }

  uint32_t idle_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint32_t>(idle_.size());
  }

  const ResolvedDescriptor& descriptor() const { return desc_; }
  const EngineOptions& options() const { return options_; }

 private:
  friend class PooledConnection;

  Engine(const ResolvedDescriptor& desc, const EngineOptions& options)
      : desc_(desc), options_(options) {
    capacity_ = (desc.kind == BackendKind::kMemory)
                    ? 1
                    : (options.pool_size > 0 ? options.pool_size : 1);
  }

  void Return(std::unique_ptr<Connection> conn) {
    if (conn->IsOpen() && conn->InTransaction()) {
      Error err = conn->Rollback();
      if (!err.ok()) {
        log::Warn("Rollback on connection return failed: {}", err.message);
        conn->Close();
      }
    }
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (disposed_ || !conn->IsOpen()) {
        conn->Close();
        --open_count_;
      } else {
        idle_.push_back(std::move(conn));
      }
    }
    cv_.notify_one();
  }

  static Error EnsureExists(const ResolvedDescriptor& desc, bool must_exist,
                            const EngineOptions& options) {
    switch (desc.kind) {
      case BackendKind::kMemory:
        if (must_exist) {
          return Error::Make(ErrorCode::kConfiguration,
                             "must_exist=true not valid for in-memory "
                             "SQLite database");
        }
        return Error::Ok();

      case BackendKind::kSqliteFile: {
        std::filesystem::path path(desc.path);
        std::error_code ec;
        if (std::filesystem::is_regular_file(path, ec)) { return Error::Ok(); }
        if (must_exist) {
          return Error::Format(ErrorCode::kDatabaseNotFound,
                               "Database not found: '%s'",
                               desc.Redacted().c_str());
        }
        if (path.has_parent_path()) {
          std::filesystem::create_directories(path.parent_path(), ec);
          if (ec) {
            return Error::Format(ErrorCode::kIoError,
                                 "Cannot create directory '%s': %s",
                                 path.parent_path().c_str(),
                                 ec.message().c_str());
          }
        }
        return Error::Ok();
      }

      case BackendKind::kMySql:
        return EnsureServerDatabase(
            desc, must_exist, options, std::string(),
            "SELECT SCHEMA_NAME FROM INFORMATION_SCHEMA.SCHEMATA "
            "WHERE SCHEMA_NAME = ?");

      case BackendKind::kPostgres:
        return EnsureServerDatabase(
            desc, must_exist, options, "postgres",
            "SELECT 1 FROM pg_database WHERE datname = $1");
    }
    return Error::Make(ErrorCode::kUnsupportedBackend, "Unknown backend");
  }

  /// Look `desc.database` up through a server-level connection and create
  /// it when absent.
  static Error EnsureServerDatabase(const ResolvedDescriptor& desc,
                                    bool must_exist,
                                    const EngineOptions& options,
                                    const std::string& maintenance_db,
                                    const char* lookup_sql) {
    Error err;
    std::unique_ptr<Connection> server =
        OpenConnectionTo(desc, maintenance_db, options, &err);
    if (server == nullptr) { return err; }

    Rows rows = server->Query(lookup_sql, Params{desc.database}, &err);
    if (!err.ok()) { return err; }
    if (!rows.empty()) { return Error::Ok(); }

    if (must_exist) {
      return Error::Format(ErrorCode::kDatabaseNotFound,
                           "Database not found: '%s'",
                           desc.Redacted().c_str());
    }
    // CREATE DATABASE cannot be parameterized, and PostgreSQL refuses it
    // inside a transaction block (the server connection is in autocommit).
    server->ExecDml("CREATE DATABASE " + server->QuoteIdentifier(desc.database),
                    &err);
    if (!err.ok()) { return err; }
    log::Info("Created database '{}'", desc.database);
    return Error::Ok();
  }

  ResolvedDescriptor desc_;
  EngineOptions options_;
  uint32_t capacity_ = 1;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::unique_ptr<Connection>> idle_;
  uint32_t open_count_ = 0;  // idle + leased
  bool disposed_ = false;
};

inline void PooledConnection::Release() {
  if (engine_ != nullptr && conn_ != nullptr) {
    engine_->Return(std::move(conn_));
  }
  engine_ = nullptr;
  conn_.reset();
}

}  // namespace dbkit
