#include "catalyst/history/redis_history_sink.h"

#include <catch2/catch_test_macros.hpp>

using namespace catalyst::history;

// Key layout only; exercising the sink itself needs a live server.
TEST_CASE("RedisHistorySink: list key is scoped by domain, session and project",
          "[redis][history]") {
  const IsolationContext isolation{"s-1", "project-catalyst"};
  CHECK(RedisHistorySink::list_key(isolation, "demo") ==
        "catalyst:history:16:project-catalyst:3:s-1:4:demo");

  const IsolationContext other{"s-2", "project-catalyst"};
  CHECK(RedisHistorySink::list_key(other, "demo") != RedisHistorySink::list_key(isolation, "demo"));
}

TEST_CASE("RedisHistorySink: colons in session or project cannot alias another scope",
          "[redis][history]") {
  const IsolationContext short_session{"a", "project-catalyst"};
  const IsolationContext long_session{"a:b", "project-catalyst"};
  CHECK(RedisHistorySink::list_key(short_session, "b:c") !=
        RedisHistorySink::list_key(long_session, "c"));

  const IsolationContext plain{"a", "project-catalyst"};
  const IsolationContext prefixed{"1:a", "project-catalyst"};
  CHECK(RedisHistorySink::list_key(plain, "x") != RedisHistorySink::list_key(prefixed, "x"));
}
