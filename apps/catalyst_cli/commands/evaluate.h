#pragma once

// cmd_evaluate: evaluate the rule set against a snapshot written by `scan`.
int cmd_evaluate(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
