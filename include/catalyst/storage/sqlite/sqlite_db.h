#pragma once

#ifdef CATALYST_BACKEND_BOUNDARY_GUARD
#error "Concrete storage header included in a guarded translation unit; use interfaces only."
#endif

#include "catalyst/core/result.h"

#include <cstdint>
#include <memory>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace catalyst::storage::sqlite {

inline constexpr int kSchemaVersion = 1;

// Milliseconds a statement waits on a lock held by another process (two CLI runs writing
// the same history database).
inline constexpr int kBusyTimeoutMs = 2000;

// SqliteDb is one connection to a catalyst database file (or ":memory:").
// Audit log and history sink share the connection through shared_ptr; each store
// serializes its own statements.
class SqliteDb {
 public:
  [[nodiscard]] static core::Result<std::shared_ptr<SqliteDb>, std::string> open(
      const std::string& path);

  ~SqliteDb() = default;

  SqliteDb(const SqliteDb&) = delete;
  SqliteDb& operator=(const SqliteDb&) = delete;
  SqliteDb(SqliteDb&&) = delete;
  SqliteDb& operator=(SqliteDb&&) = delete;

  // 0 until ensure_schema() has run.
  [[nodiscard]] int get_schema_version() const;

  // Creates audit_events and history_records in one transaction. No-op when the schema is
  // already current.
  [[nodiscard]] core::Result<bool, std::string> ensure_schema();

  [[nodiscard]] core::Result<bool, std::string> exec(const std::string& sql);

  [[nodiscard]] sqlite3* connection() const { return db_.get(); }

  // Message of the last failed call on this connection.
  [[nodiscard]] std::string last_error() const;

 private:
  struct ConnectionCloser {
    void operator()(sqlite3* db) const;
  };

  explicit SqliteDb(sqlite3* db);

  std::unique_ptr<sqlite3, ConnectionCloser> db_;
};

// PreparedStatement owns one compiled statement. Binds copy their arguments, so
// temporaries are safe to pass. Parameter indices are 1-based as in SQLite.
class PreparedStatement {
 public:
  PreparedStatement(sqlite3* db, const std::string& sql);
  ~PreparedStatement() = default;

  PreparedStatement(const PreparedStatement&) = delete;
  PreparedStatement& operator=(const PreparedStatement&) = delete;
  PreparedStatement(PreparedStatement&&) = delete;
  PreparedStatement& operator=(PreparedStatement&&) = delete;

  [[nodiscard]] bool is_valid() const { return stmt_ != nullptr; }
  [[nodiscard]] const std::string& error() const { return error_; }
  [[nodiscard]] sqlite3_stmt* get() const { return stmt_.get(); }

  void bind_text(int index, const std::string& value);
  void bind_int(int index, int value);
  void bind_int64(int index, std::int64_t value);

  // Advances one row. Returns true while a row is available; once it returns false,
  // done() separates normal completion from an error.
  bool step();
  [[nodiscard]] bool done() const { return last_rc_is_done_; }

  [[nodiscard]] std::string column_text(int column) const;
  [[nodiscard]] bool column_is_null(int column) const;
  [[nodiscard]] int column_int(int column) const;

 private:
  struct StatementFinalizer {
    void operator()(sqlite3_stmt* stmt) const;
  };

  std::unique_ptr<sqlite3_stmt, StatementFinalizer> stmt_;
  std::string error_;
  bool last_rc_is_done_{false};
};

}  // namespace catalyst::storage::sqlite
