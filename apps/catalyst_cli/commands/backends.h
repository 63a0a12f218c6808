#pragma once

#include "catalyst/history/history_sink.h"
#include "catalyst/storage/audit_log.h"

#include <memory>
#include <optional>
#include <string>

// Backend selection shared by the subcommands that touch history.
//
// --history-db opens (or creates) a SQLite file that holds both the history records and
// the audit trail. --redis keeps history in Redis and the audit trail in memory.
// The two flags are mutually exclusive; with neither, history is disabled.
struct BackendFlags {
  std::optional<std::string> history_db;  // NOLINT(readability-identifier-naming)
  std::optional<std::string> redis_uri;   // NOLINT(readability-identifier-naming)
};

struct Backends {
  std::unique_ptr<catalyst::storage::IAuditLog> audit_log;       // NOLINT(readability-identifier-naming)
  std::unique_ptr<catalyst::history::IHistorySink> history_sink;  // NOLINT(readability-identifier-naming)
};

// Prints the reason to stderr and returns nullopt when a backend cannot be opened.
std::optional<Backends> open_backends(const BackendFlags& flags);
