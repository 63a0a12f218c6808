#pragma once

#include "catalyst/core/id_generator.h"

#include <string>

namespace catalyst::core {

// Strong ID types: vocabulary types that keep trace and run identifiers from being swapped.

struct TraceId {
  std::string value;
  auto operator<=>(const TraceId&) const = default;
};

struct RunId {
  std::string value;
  auto operator<=>(const RunId&) const = default;
};

inline TraceId new_trace_id(IIdGenerator& gen) { return TraceId{gen.next("trace")}; }
inline RunId new_run_id(IIdGenerator& gen) { return RunId{gen.next("run")}; }

}  // namespace catalyst::core
