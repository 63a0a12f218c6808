#pragma once

// cmd_history: print the stored history records for one project within a session.
int cmd_history(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
