#pragma once

#include "catalyst/history/history_sink.h"

#include <mutex>
#include <vector>

namespace catalyst::history {

// Process-local sink. Records are kept in insertion order.
class InMemoryHistorySink final : public IHistorySink {
 public:
  [[nodiscard]] std::string backend_name() const override { return "inmemory"; }

  // Total records across all sessions. Test helper.
  [[nodiscard]] std::size_t size() const;

 protected:
  core::Result<bool, HistoryError> do_put(const HistoryRecord& record,
                                          const IsolationContext& isolation) override;
  [[nodiscard]] core::Result<std::vector<HistoryRecord>, HistoryError> do_history(
      const HistoryQuery& query) const override;

 private:
  mutable std::mutex mutex_;
  std::vector<HistoryRecord> records_;
};

}  // namespace catalyst::history
