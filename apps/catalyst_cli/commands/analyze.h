#pragma once

// cmd_analyze: scan <root>, evaluate the rule set and print the health report.
int cmd_analyze(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
