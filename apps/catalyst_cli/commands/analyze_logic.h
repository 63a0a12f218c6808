#pragma once

#include "catalyst/app/app_service.h"
#include "catalyst/core/clock.h"
#include "catalyst/core/id_generator.h"
#include "catalyst/core/services.h"

#include "report_output.h"

struct AnalyzeOutputOptions {
  OutputFormat format{OutputFormat::kText};
  int fail_below{30};  // NOLINT(readability-identifier-naming)
  // Dump the run's audit trail to stderr after the report.
  bool show_audit{false};  // NOLINT(readability-identifier-naming)
};

// execute_analyze: run the pipeline and print the report.
// Takes only interface types; no concrete storage headers may be included in this TU.
int execute_analyze(const catalyst::app::AnalysisRequest& request,
                    const AnalyzeOutputOptions& output, catalyst::core::Services& services,
                    catalyst::core::IIdGenerator& id_gen, catalyst::core::IClock& clock);
