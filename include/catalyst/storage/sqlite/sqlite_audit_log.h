#pragma once

#ifdef CATALYST_BACKEND_BOUNDARY_GUARD
#error "Concrete storage header included in a guarded translation unit; use interfaces only."
#endif

#include "catalyst/storage/audit_log.h"
#include "catalyst/storage/sqlite/sqlite_db.h"

#include <map>
#include <memory>
#include <mutex>

namespace catalyst::storage::sqlite {

// SqliteAuditLog implements IAuditLog on the audit_events table.
// Ordering within a trace comes from the idx column, assigned under mutex_.
class SqliteAuditLog final : public IAuditLog {
 public:
  explicit SqliteAuditLog(std::shared_ptr<SqliteDb> db);

  void append(const AuditEvent& event) override;
  [[nodiscard]] std::vector<AuditEvent> query(const std::string& trace_id) const override;
  [[nodiscard]] std::vector<std::string> list_trace_ids() const override;

 private:
  std::shared_ptr<SqliteDb> db_;

  mutable std::mutex mutex_;
  std::map<std::string, int> trace_indices_;

  int next_index(const std::string& trace_id);
};

}  // namespace catalyst::storage::sqlite
