#include "catalyst/core/version.h"

#include "commands/analyze.h"
#include "commands/evaluate.h"
#include "commands/exit_codes.h"
#include "commands/history.h"
#include "commands/rules.h"
#include "commands/scan.h"
#include <iostream>
#include <string>

namespace {

void print_usage(std::ostream& out) {
  out << "Usage: catalyst_cli <command> [options]\n"
      << "\n"
      << "Commands:\n"
      << "  analyze <root>               Scan, evaluate and print the health report\n"
      << "  scan <root>                  Print the project snapshot as JSON\n"
      << "  evaluate --snapshot <file>   Evaluate rules against a saved snapshot\n"
      << "  rules validate|list          Check or list a rule source\n"
      << "  history                      Print stored history records\n"
      << "  version                      Print the version\n"
      << "\n"
      << "Exit codes: 0 ok, 1 error, 2 invalid arguments, 3 health below --fail-below\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage(std::cerr);
    return kExitUsage;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "analyze") {
    return cmd_analyze(argc, argv);
  }
  if (subcommand == "scan") {
    return cmd_scan(argc, argv);
  }
  if (subcommand == "evaluate") {
    return cmd_evaluate(argc, argv);
  }
  if (subcommand == "rules") {
    return cmd_rules(argc, argv);
  }
  if (subcommand == "history") {
    return cmd_history(argc, argv);
  }
  if (subcommand == "version" || subcommand == "--version") {
    std::cout << catalyst::core::kToolName << " " << catalyst::core::kBuildVersion << "\n";
    return kExitOk;
  }
  if (subcommand == "help" || subcommand == "--help" || subcommand == "-h") {
    print_usage(std::cout);
    return kExitOk;
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_usage(std::cerr);
  return kExitUsage;
}
