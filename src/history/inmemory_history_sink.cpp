#include "catalyst/history/inmemory_history_sink.h"

namespace catalyst::history {

std::size_t InMemoryHistorySink::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.size();
}

core::Result<bool, HistoryError> InMemoryHistorySink::do_put(
    const HistoryRecord& record, const IsolationContext& /*isolation*/) {
  std::lock_guard<std::mutex> lock(mutex_);
  records_.push_back(record);
  return core::Result<bool, HistoryError>::ok(true);
}

core::Result<std::vector<HistoryRecord>, HistoryError> InMemoryHistorySink::do_history(
    const HistoryQuery& query) const {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<HistoryRecord> matches;
  for (auto it = records_.rbegin(); it != records_.rend() && matches.size() < query.limit();
       ++it) {
    if (it->session_id == query.isolation().session_id() &&
        it->domain == query.isolation().domain() &&
        it->project_identifier == query.project_identifier()) {
      matches.push_back(*it);
    }
  }
  return core::Result<std::vector<HistoryRecord>, HistoryError>::ok(std::move(matches));
}

}  // namespace catalyst::history
