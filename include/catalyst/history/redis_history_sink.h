#pragma once

#ifdef CATALYST_BACKEND_BOUNDARY_GUARD
#error "Concrete storage header included in a guarded translation unit; use interfaces only."
#endif

#include "catalyst/history/history_sink.h"
#include "catalyst/history/redis_config.h"

#include <memory>
#include <string>

// Forward declare Redis++ types to avoid exposing them in header
namespace sw {
namespace redis {
class Redis;
}
}  // namespace sw

namespace catalyst::history {

// RedisHistorySink keeps one list per isolation scope and project:
//
//   catalyst:history:{len}:{domain}:{len}:{session_id}:{len}:{project_identifier}
//
// Each part carries its byte length, so a ':' inside a session id or project identifier
// cannot make two scopes share a list. New records are LPUSHed as JSON, so
// LRANGE 0..limit-1 yields newest first. Reads also drop any record whose stamped
// session_id or domain differs from the query's.
class RedisHistorySink final : public IHistorySink {
 public:
  // Throws std::runtime_error if the connection or the initial PING fails.
  explicit RedisHistorySink(const RedisConfig& config);

  ~RedisHistorySink() override;

  RedisHistorySink(const RedisHistorySink&) = delete;
  RedisHistorySink& operator=(const RedisHistorySink&) = delete;
  RedisHistorySink(RedisHistorySink&&) = delete;
  RedisHistorySink& operator=(RedisHistorySink&&) = delete;

  [[nodiscard]] std::string backend_name() const override { return "redis"; }

  [[nodiscard]] static std::string list_key(const IsolationContext& isolation,
                                            const std::string& project_identifier);

 protected:
  core::Result<bool, HistoryError> do_put(const HistoryRecord& record,
                                          const IsolationContext& isolation) override;
  [[nodiscard]] core::Result<std::vector<HistoryRecord>, HistoryError> do_history(
      const HistoryQuery& query) const override;

 private:
  std::unique_ptr<sw::redis::Redis> redis_;
};

}  // namespace catalyst::history
