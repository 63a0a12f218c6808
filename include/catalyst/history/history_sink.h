#pragma once

#include "catalyst/core/result.h"
#include "catalyst/history/history_record.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace catalyst::history {

// Domain tag the analyzer always writes under.
inline constexpr std::string_view kHistoryDomain = "project-catalyst";

inline constexpr std::size_t kMaxSessionIdLength = 128;

// IsolationContext scopes every history operation to one session within one domain.
// There is deliberately no default constructor: a request cannot be built without one.
class IsolationContext {
 public:
  IsolationContext(std::string session_id, std::string domain)
      : session_id_(std::move(session_id)), domain_(std::move(domain)) {}

  [[nodiscard]] const std::string& session_id() const noexcept { return session_id_; }
  [[nodiscard]] const std::string& domain() const noexcept { return domain_; }

 private:
  std::string session_id_;
  std::string domain_;
};

enum class IsolationViolationKind {
  kMissingSessionId,
  kMalformedSessionId,
  kMissingDomain,
};

struct IsolationViolation {
  IsolationViolationKind kind{IsolationViolationKind::kMissingSessionId};
  std::string message;
};

// Session ids are 1-128 characters from [A-Za-z0-9._:-]; the domain must be non-empty.
[[nodiscard]] std::optional<IsolationViolation> validate_isolation(
    const IsolationContext& isolation);

class PutHistoryRequest {
 public:
  PutHistoryRequest(HistoryRecord record, IsolationContext isolation)
      : record_(std::move(record)), isolation_(std::move(isolation)) {}

  [[nodiscard]] const HistoryRecord& record() const noexcept { return record_; }
  [[nodiscard]] const IsolationContext& isolation() const noexcept { return isolation_; }

 private:
  HistoryRecord record_;
  IsolationContext isolation_;
};

class HistoryQuery {
 public:
  HistoryQuery(std::string project_identifier, IsolationContext isolation, std::size_t limit = 20)
      : project_identifier_(std::move(project_identifier)),
        isolation_(std::move(isolation)),
        limit_(limit) {}

  [[nodiscard]] const std::string& project_identifier() const noexcept {
    return project_identifier_;
  }
  [[nodiscard]] const IsolationContext& isolation() const noexcept { return isolation_; }
  [[nodiscard]] std::size_t limit() const noexcept { return limit_; }

 private:
  std::string project_identifier_;
  IsolationContext isolation_;
  std::size_t limit_;
};

enum class HistoryErrorKind {
  kIsolationViolation,
  kBackendFailure,
};

struct HistoryError {
  HistoryErrorKind kind{HistoryErrorKind::kBackendFailure};
  std::string message;
  std::optional<IsolationViolation> violation;  // set for kIsolationViolation
};

// IHistorySink is an append-only store of past analyses.
//
// put() and history() are non-virtual: they validate isolation and reject a bad context
// before the backend hook is ever reached. Backends implement do_put / do_history and may
// assume the isolation they receive is valid.
class IHistorySink {
 public:
  virtual ~IHistorySink() = default;

  // The stored copy of the record carries the request's session id and domain.
  [[nodiscard]] core::Result<bool, HistoryError> put(const PutHistoryRequest& request);

  // Records for the query's project within the same session and domain, newest first,
  // at most limit entries.
  [[nodiscard]] core::Result<std::vector<HistoryRecord>, HistoryError> history(
      const HistoryQuery& query) const;

  [[nodiscard]] virtual std::string backend_name() const = 0;

 protected:
  IHistorySink() = default;
  IHistorySink(const IHistorySink&) = default;
  IHistorySink& operator=(const IHistorySink&) = default;
  IHistorySink(IHistorySink&&) = default;
  IHistorySink& operator=(IHistorySink&&) = default;

  virtual core::Result<bool, HistoryError> do_put(const HistoryRecord& record,
                                                  const IsolationContext& isolation) = 0;
  [[nodiscard]] virtual core::Result<std::vector<HistoryRecord>, HistoryError> do_history(
      const HistoryQuery& query) const = 0;
};

// HistoryBinding pairs a sink with the isolation that every pipeline call through it uses.
// bind() is the only way to build one and validates the isolation up front, so a bound
// sink can never be handed an empty or malformed session id.
class HistoryBinding {
 public:
  [[nodiscard]] static core::Result<HistoryBinding, IsolationViolation> bind(
      IHistorySink& sink, IsolationContext isolation);

  [[nodiscard]] IHistorySink& sink() const noexcept { return *sink_; }
  [[nodiscard]] const IsolationContext& isolation() const noexcept { return isolation_; }

 private:
  HistoryBinding(IHistorySink& sink, IsolationContext isolation)
      : sink_(&sink), isolation_(std::move(isolation)) {}

  IHistorySink* sink_;
  IsolationContext isolation_;
};

}  // namespace catalyst::history
