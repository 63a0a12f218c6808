#include "catalyst/storage/sqlite/sqlite_audit_log.h"

#include <nlohmann/json.hpp>

namespace catalyst::storage::sqlite {

namespace {

constexpr const char* kSelectColumns =
    "SELECT event_id, trace_id, event_type, payload, created_at, refs_json FROM audit_events";

AuditEvent read_event(const PreparedStatement& stmt) {
  AuditEvent event;
  event.event_id = stmt.column_text(0);
  event.trace_id = stmt.column_text(1);
  event.event_type = stmt.column_text(2);
  event.payload = stmt.column_text(3);
  event.created_at = stmt.column_text(4);

  const auto refs = nlohmann::json::parse(stmt.column_text(5), nullptr, false);
  if (refs.is_array()) {
    for (const auto& ref : refs) {
      if (ref.is_string()) {
        event.refs.push_back(ref.get<std::string>());
      }
    }
  }
  return event;
}

}  // namespace

SqliteAuditLog::SqliteAuditLog(std::shared_ptr<SqliteDb> db) : db_(std::move(db)) {}

void SqliteAuditLog::append(const AuditEvent& event) {
  std::lock_guard<std::mutex> lock(mutex_);
  const int idx = next_index(event.trace_id);

  PreparedStatement stmt(db_->connection(), R"(
    INSERT INTO audit_events
      (event_id, trace_id, event_type, payload, created_at, refs_json, idx)
    VALUES (?, ?, ?, ?, ?, ?, ?)
  )");
  if (!stmt.is_valid()) {
    trace_indices_[event.trace_id] = idx;
    return;
  }

  stmt.bind_text(1, event.event_id);
  stmt.bind_text(2, event.trace_id);
  stmt.bind_text(3, event.event_type);
  stmt.bind_text(4, event.payload);
  stmt.bind_text(5, event.created_at);
  stmt.bind_text(6, nlohmann::json(event.refs).dump());
  stmt.bind_int(7, idx);

  stmt.step();
  if (!stmt.done()) {
    // Not stored: hand the same index to the next event of this trace.
    trace_indices_[event.trace_id] = idx;
  }
}

std::vector<AuditEvent> SqliteAuditLog::query(const std::string& trace_id) const {
  std::lock_guard<std::mutex> lock(mutex_);

  const std::string sql = std::string(kSelectColumns) +
                          (trace_id.empty() ? " ORDER BY trace_id, idx"
                                            : " WHERE trace_id = ? ORDER BY idx");
  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return {};
  }
  if (!trace_id.empty()) {
    stmt.bind_text(1, trace_id);
  }

  std::vector<AuditEvent> events;
  while (stmt.step()) {
    events.push_back(read_event(stmt));
  }
  return events;
}

std::vector<std::string> SqliteAuditLog::list_trace_ids() const {
  std::lock_guard<std::mutex> lock(mutex_);

  PreparedStatement stmt(db_->connection(),
                         "SELECT DISTINCT trace_id FROM audit_events ORDER BY trace_id");
  std::vector<std::string> ids;
  if (!stmt.is_valid()) {
    return ids;
  }
  while (stmt.step()) {
    ids.push_back(stmt.column_text(0));
  }
  return ids;
}

// Caller holds mutex_. The first event of a trace seen by this process continues after
// the highest index an earlier run stored for it.
int SqliteAuditLog::next_index(const std::string& trace_id) {
  if (auto it = trace_indices_.find(trace_id); it != trace_indices_.end()) {
    return it->second++;
  }

  int idx = 0;
  PreparedStatement stmt(db_->connection(),
                         "SELECT MAX(idx) FROM audit_events WHERE trace_id = ?");
  if (stmt.is_valid()) {
    stmt.bind_text(1, trace_id);
    if (stmt.step() && !stmt.column_is_null(0)) {
      idx = stmt.column_int(0) + 1;
    }
  }
  trace_indices_[trace_id] = idx + 1;
  return idx;
}

}  // namespace catalyst::storage::sqlite
