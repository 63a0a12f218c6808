#pragma once

#ifdef CATALYST_BACKEND_BOUNDARY_GUARD
#error "Concrete storage header included in a guarded translation unit; use interfaces only."
#endif

#include "catalyst/history/history_sink.h"
#include "catalyst/storage/sqlite/sqlite_db.h"

#include <memory>
#include <mutex>

namespace catalyst::storage::sqlite {

// SqliteHistorySink stores one row per record in history_records. The full record is
// kept as JSON; session, domain and project are indexed columns used for scoping.
class SqliteHistorySink final : public history::IHistorySink {
 public:
  explicit SqliteHistorySink(std::shared_ptr<SqliteDb> db);

  [[nodiscard]] std::string backend_name() const override { return "sqlite"; }

 protected:
  core::Result<bool, history::HistoryError> do_put(
      const history::HistoryRecord& record, const history::IsolationContext& isolation) override;
  [[nodiscard]] core::Result<std::vector<history::HistoryRecord>, history::HistoryError>
  do_history(const history::HistoryQuery& query) const override;

 private:
  std::shared_ptr<SqliteDb> db_;
  mutable std::mutex mutex_;
};

}  // namespace catalyst::storage::sqlite
