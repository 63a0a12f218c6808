#pragma once

// cmd_scan: walk <root> and print the snapshot exchange document.
int cmd_scan(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
