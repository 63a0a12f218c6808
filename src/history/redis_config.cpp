#include "catalyst/history/redis_config.h"

#include <charconv>
#include <string_view>

namespace catalyst::history {

namespace {

// Parses a run of decimal digits. Rejects empty input, signs and trailing characters.
std::optional<int> parse_decimal(std::string_view text) {
  if (text.empty() || text.size() > 5) {
    return std::nullopt;
  }
  int value = 0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

std::optional<RedisConfig> parse_redis_uri(const std::string& uri) {
  if (uri.empty()) {
    return std::nullopt;
  }

  std::string_view view{uri};
  bool redis_scheme = false;
  if (view.starts_with("tcp://")) {
    view.remove_prefix(6);
  } else if (view.starts_with("redis://")) {
    view.remove_prefix(8);
    redis_scheme = true;
  } else {
    return std::nullopt;
  }

  RedisConfig config;
  config.uri = uri;

  // Optional "/N" database suffix.
  const auto slash = view.find('/');
  if (slash != std::string_view::npos) {
    if (!redis_scheme) {
      return std::nullopt;
    }
    const auto db = parse_decimal(view.substr(slash + 1));
    if (!db.has_value()) {
      return std::nullopt;
    }
    config.redis_db = db.value();
    view = view.substr(0, slash);
  }

  // Split on last colon to separate host from port.
  const auto colon = view.rfind(':');
  if (colon == std::string_view::npos) {
    config.host = std::string{view};
  } else {
    config.host = std::string{view.substr(0, colon)};
    const auto port = parse_decimal(view.substr(colon + 1));
    if (!port.has_value() || port.value() < 1 || port.value() > 65535) {
      return std::nullopt;
    }
    config.port = port.value();
  }

  if (config.host.empty()) {
    return std::nullopt;
  }
  return config;
}

std::string redis_config_to_log_string(const RedisConfig& config) {
  std::string text = config.host + ":" + std::to_string(config.port);
  if (config.redis_db != 0) {
    text += "/" + std::to_string(config.redis_db);
  }
  return text;
}

}  // namespace catalyst::history
