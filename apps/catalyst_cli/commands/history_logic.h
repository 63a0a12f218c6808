#pragma once

#include "catalyst/history/history_sink.h"

#include <cstddef>
#include <string>

// execute_history: fetch and print history records, newest first, as a JSON document.
// Takes only interface types; no concrete storage headers may be included in this TU.
int execute_history(const std::string& project_identifier, const std::string& session_id,
                    std::size_t limit, catalyst::history::IHistorySink& sink);
