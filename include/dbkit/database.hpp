// Copyright (c) 2024 liudegui. MIT License.
//
// dbkit::Database -- descriptor + engine + schema, the entry point.
//
// Design:
//   - Create() resolves the descriptor, builds the engine (creating the
//     database when allowed) and creates missing tables of the schema
//   - Sessions are leased from the engine pool; WithSession() wraps one in
//     a commit-or-rollback scope
//   - Drop() needs explicit confirmation; afterwards the object is inert and
//     every call reports kNotOpen

#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <utility>

#include "dbkit/descriptor.hpp"
#include "dbkit/engine.hpp"
#include "dbkit/error.hpp"
#include "dbkit/log.hpp"
#include "dbkit/schema.hpp"
#include "dbkit/session.hpp"

namespace dbkit {

// ---------------------------------------------------------------------------
// Database
// ---------------------------------------------------------------------------

class Database {
 public:
  ~Database() = default;

  // No copy
  Database(const Database&) = delete;
  Database& operator=(const Database&) = delete;

  /// Open the database at `url`. With `must_exist` a missing database is an
  /// error (kDatabaseNotFound); otherwise it is created. Tables of `schema`
  /// that do not exist yet are created; existing ones are left untouched.
  static std::unique_ptr<Database> Create(
      const std::string& url, const Schema& schema, bool must_exist,
      const EngineOptions& options = EngineOptions{},
      Error* out_error = nullptr) {
    ResolvedDescriptor desc;
    Error err = Resolve(url, &desc);
    if (!err.ok()) {
      Report(out_error, err);
      return nullptr;
    }

    std::unique_ptr<Engine> engine =
        Engine::Create(desc, must_exist, options, &err);
    if (engine == nullptr) {
      Report(out_error, err);
      return nullptr;
    }

    {
      PooledConnection conn = engine->Acquire(&err);
      if (!conn.Valid()) {
        Report(out_error, err);
        return nullptr;
      }
      int32_t created = schema.CreateMissing(conn.get(), &err);
      if (created < 0) {
        Report(out_error, err);
        return nullptr;
      }
      if (conn->InTransaction()) {
        err = conn->Commit();
        if (!err.ok()) {
          Report(out_error, err);
          return nullptr;
        }
      }
    }

    return std::unique_ptr<Database>(
        new Database(url, std::move(desc), std::move(engine)));
  }

  /// Lease a connection and begin a transaction on it.
  Session OpenSession(Error* out_error = nullptr) {
    if (engine_ == nullptr) {
      Report(out_error, Error::Make(ErrorCode::kNotOpen, "Database dropped"));
      return Session{};
    }
    Error err;
    PooledConnection conn = engine_->Acquire(&err);
    if (!conn.Valid()) {
      Report(out_error, err);
      return Session{};
    }
    err = conn->BeginTransaction();
    if (!err.ok()) {
      Report(out_error, err);
      return Session{};
    }
    return Session(std::move(conn));
  }

  /// Run `fn(Session&) -> Error` in a fresh session. A non-ok result rolls
  /// back and is returned unchanged; otherwise the work is committed when
  /// `commit` is set and discarded when it is not. An exception escaping
  /// `fn` rolls back as the session unwinds.
  template <typename Fn>
  Error WithSession(bool commit, Fn&& fn) {
    Error err;
    Session session = OpenSession(&err);
    if (!session.IsOpen()) { return err; }

    err = fn(session);
    if (!err.ok()) {
      log::Debug("Session rolled back: {} ({})", err.message,
                 ErrorCodeName(err.code));
      Error rb = session.Rollback();
      if (!rb.ok()) {
        log::Warn("Rollback failed: {}", rb.message);
      }
      return err;
    }
    if (commit) {
      err = session.Commit();
      if (!err.ok()) { return err; }
    }
    return Error::Ok();
  }

  /// Permanently delete the database. Requires `are_you_sure`. Every
  /// session must be closed first. Once the engine is disposed the object is
  /// inert, even when removing the storage then fails.
  Error Drop(bool are_you_sure) {
    if (!are_you_sure) {
      return Error::Make(ErrorCode::kConfirmationRequired,
                         "Drop() requires are_you_sure=true");
    }
    if (engine_ == nullptr) {
      return Error::Make(ErrorCode::kNotOpen, "Database dropped");
    }

    Error err;
    switch (desc_.kind) {
      case BackendKind::kMemory:
        engine_->Dispose();
        break;

      case BackendKind::kSqliteFile: {
        engine_->Dispose();
        std::error_code ec;
        std::filesystem::remove(desc_.path, ec);
        if (ec) {
          err = Error::Format(ErrorCode::kIoError, "Cannot remove '%s': %s",
                              desc_.path.c_str(), ec.message().c_str());
        }
        break;
      }

      case BackendKind::kMySql:
        engine_->Dispose();
        err = DropServerDatabase(std::string());
        break;

      case BackendKind::kPostgres:
        // PostgreSQL refuses to drop a database with open sessions.
        engine_->Dispose();
        err = DropServerDatabase("postgres");
        break;

      default:
        return Error::Format(ErrorCode::kUnsupportedOperation,
                             "Drop() not supported for %s",
                             BackendKindName(desc_.kind));
    }
    engine_.reset();
    if (!err.ok()) {
      log::Warn("Drop of '{}' failed: {}", desc_.Redacted(), err.message);
      return err;
    }

    log::Info("Dropped database '{}'", desc_.Redacted());
    return Error::Ok();
  }

  bool IsOpen() const { return engine_ != nullptr; }

  /// The descriptor this database was opened with.
  const std::string& url() const { return url_; }
  const ResolvedDescriptor& descriptor() const { return desc_; }
  BackendKind Kind() const { return desc_.kind; }

  /// Null once dropped.
  Engine* engine() const { return engine_.get(); }

 private:
  Database(std::string url, ResolvedDescriptor desc,
           std::unique_ptr<Engine> engine)
      : url_(std::move(url)),
        desc_(std::move(desc)),
        engine_(std::move(engine)) {}

  Error DropServerDatabase(const std::string& maintenance_db) {
    Error err;
    std::unique_ptr<Connection> server =
        OpenConnectionTo(desc_, maintenance_db, engine_->options(), &err);
    if (server == nullptr) { return err; }
    server->ExecDml(
        "DROP DATABASE IF EXISTS " + server->QuoteIdentifier(desc_.database),
        &err);
    return err;
  }

  std::string url_;
  ResolvedDescriptor desc_;
  std::unique_ptr<Engine> engine_;
};

}  // namespace dbkit
