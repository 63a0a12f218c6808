#include "catalyst/core/id_generator.h"

#include <chrono>

namespace catalyst::core {

namespace {

std::string join_id(std::string_view prefix, const std::string& suffix) {
  std::string id;
  id.reserve(prefix.size() + 1 + suffix.size());
  id.append(prefix);
  id.push_back('-');
  id.append(suffix);
  return id;
}

}  // namespace

std::string SystemIdGenerator::next(std::string_view prefix) {
  const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
                          std::chrono::system_clock::now().time_since_epoch())
                          .count();
  const auto n = sequence_.fetch_add(1, std::memory_order_relaxed);
  return join_id(prefix, std::to_string(micros) + "-" + std::to_string(n));
}

std::string DeterministicIdGenerator::next(std::string_view prefix) {
  return join_id(prefix, std::to_string(sequence_.fetch_add(1, std::memory_order_relaxed)));
}

}  // namespace catalyst::core
