#pragma once

// cmd_rules: `rules validate` loads a rule source and reports rejected entries.
// `rules list` prints the accepted rules as JSON.
int cmd_rules(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
