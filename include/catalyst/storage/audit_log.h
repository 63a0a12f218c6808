#pragma once

#include "catalyst/storage/audit_event.h"

#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace catalyst::storage {

// IAuditLog is the pipeline's diagnostic trail: append-only, queried per trace.
class IAuditLog {
 public:
  virtual ~IAuditLog() = default;
  virtual void append(const AuditEvent& event) = 0;
  // Events for trace_id in append order. An empty trace_id returns every event.
  [[nodiscard]] virtual std::vector<AuditEvent> query(const std::string& trace_id) const = 0;
  [[nodiscard]] virtual std::vector<std::string> list_trace_ids() const = 0;

 protected:
  IAuditLog() = default;
  IAuditLog(const IAuditLog&) = default;
  IAuditLog& operator=(const IAuditLog&) = default;
  IAuditLog(IAuditLog&&) = default;
  IAuditLog& operator=(IAuditLog&&) = default;
};

class InMemoryAuditLog final : public IAuditLog {
 public:
  void append(const AuditEvent& event) override;
  [[nodiscard]] std::vector<AuditEvent> query(const std::string& trace_id) const override;
  [[nodiscard]] std::vector<std::string> list_trace_ids() const override;

 private:
  mutable std::mutex mutex_;
  std::vector<AuditEvent> events_;
  std::set<std::string> trace_ids_;
};

}  // namespace catalyst::storage
