#include "catalyst/core/clock.h"
#include "catalyst/core/id_generator.h"
#include "catalyst/core/ids.h"

#include <catch2/catch_test_macros.hpp>

TEST_CASE("ID generators produce prefixed values", "[ids]") {
  SECTION("SystemIdGenerator ids are unique and prefixed") {
    catalyst::core::SystemIdGenerator gen;
    const auto first = catalyst::core::new_trace_id(gen);
    const auto second = catalyst::core::new_trace_id(gen);
    const auto run = catalyst::core::new_run_id(gen);

    REQUIRE(first.value.rfind("trace-", 0) == 0);
    REQUIRE(run.value.rfind("run-", 0) == 0);
    REQUIRE(first != second);
  }

  SECTION("DeterministicIdGenerator follows the call sequence") {
    catalyst::core::DeterministicIdGenerator gen;
    CHECK(catalyst::core::new_trace_id(gen).value == "trace-0");
    CHECK(catalyst::core::new_run_id(gen).value == "run-1");

    catalyst::core::DeterministicIdGenerator replay;
    CHECK(catalyst::core::new_trace_id(replay).value == "trace-0");
  }
}

TEST_CASE("Clocks", "[clock]") {
  catalyst::core::FixedClock fixed("2026-01-01T00:00:00Z");
  CHECK(fixed.now_iso8601() == "2026-01-01T00:00:00Z");

  catalyst::core::SystemClock system;
  const auto now = system.now_iso8601();
  REQUIRE(now.size() == 20);
  CHECK(now[4] == '-');
  CHECK(now[10] == 'T');
  CHECK(now.back() == 'Z');
}
