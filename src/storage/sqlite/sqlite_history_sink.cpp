#include "catalyst/storage/sqlite/sqlite_history_sink.h"

#include <nlohmann/json.hpp>

#include <cstdint>

namespace catalyst::storage::sqlite {

namespace {

history::HistoryError backend_error(std::string message) {
  return history::HistoryError{history::HistoryErrorKind::kBackendFailure, std::move(message),
                               std::nullopt};
}

}  // namespace

SqliteHistorySink::SqliteHistorySink(std::shared_ptr<SqliteDb> db) : db_(std::move(db)) {}

core::Result<bool, history::HistoryError> SqliteHistorySink::do_put(
    const history::HistoryRecord& record, const history::IsolationContext& isolation) {
  using PutResult = core::Result<bool, history::HistoryError>;
  std::lock_guard<std::mutex> lock(mutex_);

  PreparedStatement stmt(db_->connection(), R"(
    INSERT INTO history_records
      (session_id, domain, project_identifier, recorded_at, health_score, record_json)
    VALUES (?, ?, ?, ?, ?, ?)
  )");
  if (!stmt.is_valid()) {
    return PutResult::err(backend_error("Failed to prepare history insert: " + stmt.error()));
  }

  stmt.bind_text(1, isolation.session_id());
  stmt.bind_text(2, isolation.domain());
  stmt.bind_text(3, record.project_identifier);
  stmt.bind_text(4, record.timestamp);
  stmt.bind_int(5, record.health_score);
  stmt.bind_text(6, history::record_to_json(record).dump());

  stmt.step();
  if (!stmt.done()) {
    return PutResult::err(backend_error("Failed to insert history record: " + db_->last_error()));
  }
  return PutResult::ok(true);
}

core::Result<std::vector<history::HistoryRecord>, history::HistoryError>
SqliteHistorySink::do_history(const history::HistoryQuery& query) const {
  using HistoryResult = core::Result<std::vector<history::HistoryRecord>, history::HistoryError>;
  std::lock_guard<std::mutex> lock(mutex_);

  PreparedStatement stmt(db_->connection(), R"(
    SELECT record_json FROM history_records
     WHERE session_id = ? AND domain = ? AND project_identifier = ?
     ORDER BY record_id DESC
     LIMIT ?
  )");
  if (!stmt.is_valid()) {
    return HistoryResult::err(backend_error("Failed to prepare history query: " + stmt.error()));
  }

  stmt.bind_text(1, query.isolation().session_id());
  stmt.bind_text(2, query.isolation().domain());
  stmt.bind_text(3, query.project_identifier());
  stmt.bind_int64(4, static_cast<std::int64_t>(query.limit()));

  std::vector<history::HistoryRecord> records;
  while (stmt.step()) {
    const auto doc = nlohmann::json::parse(stmt.column_text(0), nullptr, false);
    if (doc.is_discarded()) {
      return HistoryResult::err(backend_error("Corrupt history record payload"));
    }
    try {
      records.push_back(history::record_from_json(doc));
    } catch (const std::exception& e) {
      return HistoryResult::err(backend_error(std::string("Corrupt history record: ") + e.what()));
    }
  }
  if (!stmt.done()) {
    return HistoryResult::err(backend_error("Failed to read history: " + db_->last_error()));
  }
  return HistoryResult::ok(std::move(records));
}

}  // namespace catalyst::storage::sqlite
