#include "backends.h"

#include "catalyst/history/redis_config.h"
#include "catalyst/storage/sqlite/sqlite_audit_log.h"
#include "catalyst/storage/sqlite/sqlite_db.h"
#include "catalyst/storage/sqlite/sqlite_history_sink.h"

#ifdef CATALYST_WITH_REDIS
#include "catalyst/history/redis_history_sink.h"
#endif

#include <iostream>
#include <stdexcept>

namespace {

std::optional<Backends> open_sqlite(const std::string& path) {
  auto db_result = catalyst::storage::sqlite::SqliteDb::open(path);
  if (!db_result.has_value()) {
    std::cerr << "Error: failed to open database: " << db_result.error() << "\n";
    return std::nullopt;
  }
  auto db = db_result.value();
  auto schema_result = db->ensure_schema();
  if (!schema_result.has_value()) {
    std::cerr << "Error: failed to initialize schema: " << schema_result.error() << "\n";
    return std::nullopt;
  }

  Backends backends;
  backends.audit_log = std::make_unique<catalyst::storage::sqlite::SqliteAuditLog>(db);
  backends.history_sink = std::make_unique<catalyst::storage::sqlite::SqliteHistorySink>(db);
  return backends;
}

std::optional<Backends> open_redis(const std::string& uri) {
  const auto parsed = catalyst::history::parse_redis_uri(uri);
  if (!parsed.has_value()) {
    std::cerr << "Error: invalid Redis URI '" << uri << "'\n"
              << "Accepted formats: tcp://host:port, redis://host:port/N, tcp://host\n";
    return std::nullopt;
  }
#ifdef CATALYST_WITH_REDIS
  Backends backends;
  backends.audit_log = std::make_unique<catalyst::storage::InMemoryAuditLog>();
  try {
    backends.history_sink = std::make_unique<catalyst::history::RedisHistorySink>(parsed.value());
  } catch (const std::runtime_error& e) {
    std::cerr << "Error: Redis unavailable at "
              << catalyst::history::redis_config_to_log_string(parsed.value()) << ": "
              << e.what() << "\n";
    return std::nullopt;
  }
  return backends;
#else
  std::cerr << "Error: this build has no Redis support (configure with CATALYST_WITH_REDIS=ON)\n";
  return std::nullopt;
#endif
}

}  // namespace

std::optional<Backends> open_backends(const BackendFlags& flags) {
  if (flags.history_db.has_value()) {
    return open_sqlite(flags.history_db.value());
  }
  if (flags.redis_uri.has_value()) {
    return open_redis(flags.redis_uri.value());
  }
  Backends backends;
  backends.audit_log = std::make_unique<catalyst::storage::InMemoryAuditLog>();
  return backends;
}
