#include "catalyst/storage/sqlite/sqlite_audit_log.h"
#include "catalyst/storage/sqlite/sqlite_db.h"

#include "test_support.h"

#include <catch2/catch_test_macros.hpp>

using namespace catalyst;

namespace {

std::shared_ptr<storage::sqlite::SqliteDb> open_memory_db() {
  auto db_result = storage::sqlite::SqliteDb::open(":memory:");
  REQUIRE(db_result.has_value());
  auto db = db_result.value();
  REQUIRE(db->ensure_schema().has_value());
  return db;
}

}  // namespace

TEST_CASE("SqliteDb: schema is applied once", "[sqlite]") {
  auto db = open_memory_db();
  CHECK(db->get_schema_version() == 1);
  REQUIRE(db->ensure_schema().has_value());
  CHECK(db->get_schema_version() == 1);
  CHECK_FALSE(db->exec("SELECT * FROM no_such_table").has_value());
}

TEST_CASE("SqliteAuditLog: events come back in append order with refs", "[sqlite][audit]") {
  auto db = open_memory_db();
  storage::sqlite::SqliteAuditLog log(db);

  log.append({"e-1", "trace-1", storage::kEventAnalysisStarted, R"({"root":"/p"})", "t0", {}});
  log.append({"e-2", "trace-2", storage::kEventAnalysisStarted, "{}", "t0", {}});
  log.append({"e-3", "trace-1", storage::kEventScanCompleted, R"({"files":12})", "t1",
              {"README.md", "src"}});
  log.append({"e-4", "trace-1", storage::kEventAnalysisCompleted, "{}", "t2", {}});

  const auto events = log.query("trace-1");
  REQUIRE(events.size() == 3);
  CHECK(events[0].event_id == "e-1");
  CHECK(events[1].event_id == "e-3");
  CHECK(events[2].event_id == "e-4");
  CHECK(events[0].payload == R"({"root":"/p"})");
  CHECK(events[1].refs == std::vector<std::string>{"README.md", "src"});
  CHECK(events[2].refs.empty());

  CHECK(log.query("").size() == 4);
  CHECK(log.list_trace_ids() == std::vector<std::string>{"trace-1", "trace-2"});
}

TEST_CASE("SqliteAuditLog: ordering survives reopening the database", "[sqlite][audit]") {
  const test::TempProject scratch("audit-db");
  const auto path = (scratch.path() / "audit.db").string();

  {
    auto db_result = storage::sqlite::SqliteDb::open(path);
    REQUIRE(db_result.has_value());
    REQUIRE(db_result.value()->ensure_schema().has_value());
    storage::sqlite::SqliteAuditLog log(db_result.value());
    log.append({"e-1", "trace-1", storage::kEventAnalysisStarted, "{}", "t0", {}});
    log.append({"e-2", "trace-1", storage::kEventAnalysisCompleted, "{}", "t1", {}});
  }

  auto db_result = storage::sqlite::SqliteDb::open(path);
  REQUIRE(db_result.has_value());
  REQUIRE(db_result.value()->ensure_schema().has_value());
  storage::sqlite::SqliteAuditLog log(db_result.value());
  log.append({"e-3", "trace-1", storage::kEventAnalysisStarted, "{}", "t2", {}});

  const auto events = log.query("trace-1");
  REQUIRE(events.size() == 3);
  CHECK(events[0].event_id == "e-1");
  CHECK(events[2].event_id == "e-3");
}
