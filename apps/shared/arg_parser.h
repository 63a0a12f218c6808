#pragma once

#include <functional>
#include <iostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace catalyst::apps {

// Option describes a single command-line flag accepted by a subcommand.
// Config is the caller-defined configuration struct that handlers populate.
//
// handler returns true on success, false on validation failure. A handler that rejects
// its value is expected to print the reason itself.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

template <typename Config>
struct ParsedArgs {
  Config config;
  std::vector<std::string> positionals;
  // False when any flag was unknown, lacked its value or was rejected by its handler.
  bool ok{true};
};

// parse_options iterates argv[start..argc-1], dispatches each recognised flag to its
// handler and collects the remaining non-flag tokens as positionals.
// Unknown flags and missing values are reported to stderr; parsing continues so that
// every problem is reported in one pass.
template <typename Config>
ParsedArgs<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                 const std::vector<Option<Config>>& options, int start = 1,
                                 Config default_config = {}) {
  ParsedArgs<Config> parsed{std::move(default_config), {}, true};

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    auto it = option_map.find(arg);
    if (it != option_map.end()) {
      const Option<Config>* opt = it->second;
      if (opt->requires_value) {
        if (i + 1 < argc) {
          const std::string value =
              argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
          parsed.ok = opt->handler(parsed.config, value) && parsed.ok;
        } else {
          std::cerr << "Option " << arg << " requires a value\n";
          parsed.ok = false;
        }
      } else {
        parsed.ok = opt->handler(parsed.config, "") && parsed.ok;
      }
    } else if (arg.size() > 1 && arg[0] == '-') {
      std::cerr << "Unknown option: " << arg << "\n";
      parsed.ok = false;
    } else {
      parsed.positionals.push_back(std::move(arg));
    }
  }

  return parsed;
}

// Prints one "  --flag <value>  description" line per option.
template <typename Config>
void print_options(std::ostream& out, const std::vector<Option<Config>>& options) {
  for (const auto& opt : options) {
    out << "  " << opt.name << (opt.requires_value ? " <value>" : "") << "\n      "
        << opt.description << "\n";
  }
}

// Parses a non-negative decimal integer flag value. Prints an error naming the flag on failure.
inline bool parse_count(const std::string& flag, const std::string& value, std::size_t& out) {
  if (value.empty() || value.size() > 9 ||
      value.find_first_not_of("0123456789") != std::string::npos) {
    std::cerr << "Invalid " << flag << ": " << value << " (expected a non-negative integer)\n";
    return false;
  }
  out = static_cast<std::size_t>(std::stoul(value));
  return true;
}

}  // namespace catalyst::apps
