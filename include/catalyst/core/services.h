#pragma once

#include "catalyst/history/history_sink.h"
#include "catalyst/storage/audit_log.h"

#include <optional>
#include <utility>

namespace catalyst::core {

// Services is a composition root that bundles the pipeline's collaborators.
// It holds references (not ownership); the CLI or a test creates the concrete instances
// and manages their lifetimes.
//
// history is optional: std::nullopt means "no history configured". When present, the sink
// is already bound to a validated isolation context.
struct Services {
  storage::IAuditLog& audit_log;                 // NOLINT(readability-identifier-naming)
  std::optional<history::HistoryBinding> history;  // NOLINT(readability-identifier-naming)

  explicit Services(storage::IAuditLog& audit_log,
                    std::optional<history::HistoryBinding> history = std::nullopt)
      : audit_log(audit_log), history(std::move(history)) {}

  ~Services() = default;

  // Prevent copying and moving to avoid accidental lifetime issues
  Services(const Services&) = delete;
  Services& operator=(const Services&) = delete;
  Services(Services&&) = delete;
  Services& operator=(Services&&) = delete;
};

}  // namespace catalyst::core
