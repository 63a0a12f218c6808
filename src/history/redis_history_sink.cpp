#include "catalyst/history/redis_history_sink.h"

#include <nlohmann/json.hpp>

#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>
#include <sw/redis++/redis++.h>

namespace catalyst::history {

namespace {

HistoryError backend_error(std::string message) {
  return HistoryError{HistoryErrorKind::kBackendFailure, std::move(message), std::nullopt};
}

// "<byte length>:<part>", so no choice of separators inside a part can alias another key.
std::string length_prefixed(const std::string& part) {
  return std::to_string(part.size()) + ":" + part;
}

}  // namespace

RedisHistorySink::RedisHistorySink(const RedisConfig& config) {
  sw::redis::ConnectionOptions options;
  options.host = config.host;
  options.port = config.port;
  options.db = config.redis_db;

  try {
    redis_ = std::make_unique<sw::redis::Redis>(options);
    redis_->ping();
  } catch (const sw::redis::Error& e) {
    throw std::runtime_error("Failed to connect to Redis at " +
                             redis_config_to_log_string(config) + ": " + e.what());
  }
}

RedisHistorySink::~RedisHistorySink() = default;

std::string RedisHistorySink::list_key(const IsolationContext& isolation,
                                       const std::string& project_identifier) {
  return "catalyst:history:" + length_prefixed(isolation.domain()) + ":" +
         length_prefixed(isolation.session_id()) + ":" + length_prefixed(project_identifier);
}

core::Result<bool, HistoryError> RedisHistorySink::do_put(const HistoryRecord& record,
                                                          const IsolationContext& isolation) {
  try {
    redis_->lpush(list_key(isolation, record.project_identifier),
                  record_to_json(record).dump());
  } catch (const sw::redis::Error& e) {
    return core::Result<bool, HistoryError>::err(
        backend_error(std::string("Redis LPUSH failed: ") + e.what()));
  }
  return core::Result<bool, HistoryError>::ok(true);
}

core::Result<std::vector<HistoryRecord>, HistoryError> RedisHistorySink::do_history(
    const HistoryQuery& query) const {
  using HistoryResult = core::Result<std::vector<HistoryRecord>, HistoryError>;
  if (query.limit() == 0) {
    return HistoryResult::ok({});
  }

  std::vector<std::string> payloads;
  try {
    redis_->lrange(list_key(query.isolation(), query.project_identifier()), 0,
                   static_cast<long long>(query.limit()) - 1, std::back_inserter(payloads));
  } catch (const sw::redis::Error& e) {
    return HistoryResult::err(backend_error(std::string("Redis LRANGE failed: ") + e.what()));
  }

  std::vector<HistoryRecord> records;
  records.reserve(payloads.size());
  for (const auto& payload : payloads) {
    const auto doc = nlohmann::json::parse(payload, nullptr, false);
    if (doc.is_discarded()) {
      return HistoryResult::err(backend_error("Corrupt history record payload"));
    }
    HistoryRecord record;
    try {
      record = record_from_json(doc);
    } catch (const std::exception& e) {
      return HistoryResult::err(backend_error(std::string("Corrupt history record: ") + e.what()));
    }
    if (record.session_id != query.isolation().session_id() ||
        record.domain != query.isolation().domain()) {
      continue;
    }
    records.push_back(std::move(record));
  }
  return HistoryResult::ok(std::move(records));
}

}  // namespace catalyst::history
