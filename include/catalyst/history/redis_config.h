#pragma once

#include <optional>
#include <string>

namespace catalyst::history {

inline constexpr int kDefaultRedisPort = 6379;

// Connection settings for RedisHistorySink, parsed from the --redis flag.
// Accepted: "tcp://host[:port]" and "redis://host[:port][/db]".
struct RedisConfig {
  std::string uri;                // as given, for diagnostics
  std::string host;
  int port{kDefaultRedisPort};
  int redis_db{0};  // NOLINT(readability-identifier-naming)
};

// nullopt for an empty or scheme-less URI, an empty host, a port outside 1..65535, a
// database suffix on tcp://, or a non-numeric database index. Does not touch the network.
[[nodiscard]] std::optional<RedisConfig> parse_redis_uri(const std::string& uri);

// "host:port", with "/db" appended for a non-default database.
[[nodiscard]] std::string redis_config_to_log_string(const RedisConfig& config);

}  // namespace catalyst::history
