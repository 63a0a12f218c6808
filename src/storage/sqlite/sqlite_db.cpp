#include "catalyst/storage/sqlite/sqlite_db.h"

#include <sqlite3.h>

namespace catalyst::storage::sqlite {

namespace {

using Status = core::Result<bool, std::string>;

constexpr const char* kSchema = R"(
CREATE TABLE IF NOT EXISTS schema_version (
  version INTEGER PRIMARY KEY,
  applied_at TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS audit_events (
  event_id TEXT PRIMARY KEY,
  trace_id TEXT NOT NULL,
  event_type TEXT NOT NULL,
  payload TEXT NOT NULL,
  created_at TEXT NOT NULL,
  refs_json TEXT NOT NULL,
  idx INTEGER NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_audit_events_trace ON audit_events(trace_id, idx);

CREATE TABLE IF NOT EXISTS history_records (
  record_id INTEGER PRIMARY KEY AUTOINCREMENT,
  session_id TEXT NOT NULL,
  domain TEXT NOT NULL,
  project_identifier TEXT NOT NULL,
  recorded_at TEXT NOT NULL,
  health_score INTEGER NOT NULL,
  record_json TEXT NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_history_scope
  ON history_records(session_id, domain, project_identifier, record_id);

INSERT OR IGNORE INTO schema_version (version, applied_at)
VALUES (1, strftime('%Y-%m-%dT%H:%M:%SZ', 'now'));
)";

}  // namespace

// ── SqliteDb ─────────────────────────────────────────────────────

void SqliteDb::ConnectionCloser::operator()(sqlite3* db) const {
  sqlite3_close(db);
}

SqliteDb::SqliteDb(sqlite3* db) : db_(db) {}

core::Result<std::shared_ptr<SqliteDb>, std::string> SqliteDb::open(const std::string& path) {
  using OpenResult = core::Result<std::shared_ptr<SqliteDb>, std::string>;

  sqlite3* raw = nullptr;
  if (sqlite3_open(path.c_str(), &raw) != SQLITE_OK) {
    const std::string reason = raw != nullptr ? sqlite3_errmsg(raw) : "out of memory";
    sqlite3_close(raw);
    return OpenResult::err("Cannot open database " + path + ": " + reason);
  }
  sqlite3_busy_timeout(raw, kBusyTimeoutMs);
  return OpenResult::ok(std::shared_ptr<SqliteDb>(new SqliteDb(raw)));
}

int SqliteDb::get_schema_version() const {
  PreparedStatement stmt(db_.get(), "SELECT MAX(version) FROM schema_version");
  if (!stmt.is_valid() || !stmt.step() || stmt.column_is_null(0)) {
    return 0;
  }
  return stmt.column_int(0);
}

core::Result<bool, std::string> SqliteDb::ensure_schema() {
  if (get_schema_version() >= kSchemaVersion) {
    return Status::ok(true);
  }

  if (auto begun = exec("BEGIN IMMEDIATE"); !begun.has_value()) {
    return begun;
  }
  if (auto applied = exec(kSchema); !applied.has_value()) {
    (void)exec("ROLLBACK");
    return Status::err("Schema setup failed: " + applied.error());
  }
  return exec("COMMIT");
}

core::Result<bool, std::string> SqliteDb::exec(const std::string& sql) {
  char* message = nullptr;
  if (sqlite3_exec(db_.get(), sql.c_str(), nullptr, nullptr, &message) != SQLITE_OK) {
    std::string error = message != nullptr ? message : last_error();
    sqlite3_free(message);
    return Status::err(std::move(error));
  }
  return Status::ok(true);
}

std::string SqliteDb::last_error() const {
  return sqlite3_errmsg(db_.get());
}

// ── PreparedStatement ────────────────────────────────────────────

void PreparedStatement::StatementFinalizer::operator()(sqlite3_stmt* stmt) const {
  sqlite3_finalize(stmt);
}

PreparedStatement::PreparedStatement(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
    error_ = sqlite3_errmsg(db);
    sqlite3_finalize(raw);
    return;
  }
  stmt_.reset(raw);
}

void PreparedStatement::bind_text(const int index, const std::string& value) {
  sqlite3_bind_text(stmt_.get(), index, value.c_str(), static_cast<int>(value.size()),
                    SQLITE_TRANSIENT);
}

void PreparedStatement::bind_int(const int index, const int value) {
  sqlite3_bind_int(stmt_.get(), index, value);
}

void PreparedStatement::bind_int64(const int index, const std::int64_t value) {
  sqlite3_bind_int64(stmt_.get(), index, static_cast<sqlite3_int64>(value));
}

bool PreparedStatement::step() {
  const int rc = sqlite3_step(stmt_.get());
  last_rc_is_done_ = rc == SQLITE_DONE;
  return rc == SQLITE_ROW;
}

std::string PreparedStatement::column_text(const int column) const {
  const unsigned char* text = sqlite3_column_text(stmt_.get(), column);
  if (text == nullptr) {
    return {};
  }
  return {reinterpret_cast<const char*>(text),  // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
          static_cast<std::size_t>(sqlite3_column_bytes(stmt_.get(), column))};
}

bool PreparedStatement::column_is_null(const int column) const {
  return sqlite3_column_type(stmt_.get(), column) == SQLITE_NULL;
}

int PreparedStatement::column_int(const int column) const {
  return sqlite3_column_int(stmt_.get(), column);
}

}  // namespace catalyst::storage::sqlite
