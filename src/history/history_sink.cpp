#include "catalyst/history/history_sink.h"

#include <algorithm>

namespace catalyst::history {

namespace {

bool is_session_char(const char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '.' ||
         c == '_' || c == ':' || c == '-';
}

HistoryError to_history_error(IsolationViolation violation) {
  HistoryError error;
  error.kind = HistoryErrorKind::kIsolationViolation;
  error.message = "Isolation violation: " + violation.message;
  error.violation = std::move(violation);
  return error;
}

}  // namespace

std::optional<IsolationViolation> validate_isolation(const IsolationContext& isolation) {
  const auto& session_id = isolation.session_id();
  if (session_id.empty()) {
    return IsolationViolation{IsolationViolationKind::kMissingSessionId, "session id is required"};
  }
  if (session_id.size() > kMaxSessionIdLength) {
    return IsolationViolation{IsolationViolationKind::kMalformedSessionId,
                              "session id exceeds 128 characters"};
  }
  if (!std::all_of(session_id.begin(), session_id.end(), is_session_char)) {
    return IsolationViolation{IsolationViolationKind::kMalformedSessionId,
                              "session id may only contain [A-Za-z0-9._:-]"};
  }
  if (isolation.domain().empty()) {
    return IsolationViolation{IsolationViolationKind::kMissingDomain, "domain is required"};
  }
  return std::nullopt;
}

core::Result<bool, HistoryError> IHistorySink::put(const PutHistoryRequest& request) {
  if (auto violation = validate_isolation(request.isolation())) {
    return core::Result<bool, HistoryError>::err(to_history_error(std::move(violation.value())));
  }

  HistoryRecord stamped = request.record();
  stamped.session_id = request.isolation().session_id();
  stamped.domain = request.isolation().domain();
  return do_put(stamped, request.isolation());
}

core::Result<std::vector<HistoryRecord>, HistoryError> IHistorySink::history(
    const HistoryQuery& query) const {
  if (auto violation = validate_isolation(query.isolation())) {
    return core::Result<std::vector<HistoryRecord>, HistoryError>::err(
        to_history_error(std::move(violation.value())));
  }
  return do_history(query);
}

core::Result<HistoryBinding, IsolationViolation> HistoryBinding::bind(
    IHistorySink& sink, IsolationContext isolation) {
  if (auto violation = validate_isolation(isolation)) {
    return core::Result<HistoryBinding, IsolationViolation>::err(std::move(violation.value()));
  }
  return core::Result<HistoryBinding, IsolationViolation>::ok(
      HistoryBinding(sink, std::move(isolation)));
}

}  // namespace catalyst::history
