#define CATALYST_BACKEND_BOUNDARY_GUARD
#include "history_logic.h"

#include "catalyst/app/app_service.h"
#include "catalyst/history/history_record.h"

#include <nlohmann/json.hpp>

#include "exit_codes.h"
#include <iostream>

int execute_history(const std::string& project_identifier, const std::string& session_id,
                    const std::size_t limit, catalyst::history::IHistorySink& sink) {
  const auto records = catalyst::app::fetch_history(project_identifier, session_id, limit, sink);
  if (!records.has_value()) {
    const auto& error = records.error();
    std::cerr << "Error: " << error.message << "\n";
    return error.kind == catalyst::history::HistoryErrorKind::kIsolationViolation ? kExitUsage
                                                                                 : kExitError;
  }

  nlohmann::json out;
  out["backend"] = sink.backend_name();
  out["project_identifier"] = project_identifier;
  out["records"] = nlohmann::json::array();
  for (const auto& record : records.value()) {
    out["records"].push_back(catalyst::history::record_to_json(record));
  }
  std::cout << out.dump(2) << "\n";
  return kExitOk;
}
