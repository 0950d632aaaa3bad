#pragma once

#include <functional>
#include <iomanip>
#include <iostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace fitscore::apps {

// Option describes a single command-line flag accepted by a subcommand.
// Config is the caller-defined configuration struct that handlers populate.
//
// handler returns true on success, false on validation failure.
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
  Config config;   // NOLINT(readability-identifier-naming)
  bool ok{true};   // false if any flag was unknown, lacked a value, or failed validation
};

// parse_options iterates argv[start..argc-1] and dispatches each recognised flag to its
// handler. Problems are reported to stderr and clear `ok`; parsing continues so that every
// problem is reported in one pass.
template <typename Config>
ParsedArgs<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                 const std::vector<Option<Config>>& options, int start = 2,
                                 Config default_config = {}) {
  ParsedArgs<Config> parsed{std::move(default_config), true};

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    const std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    const auto it = option_map.find(arg);
    if (it == option_map.end()) {
      std::cerr << "Unknown argument: " << arg << "\n";
      parsed.ok = false;
      continue;
    }

    const Option<Config>* opt = it->second;
    if (!opt->requires_value) {
      parsed.ok = opt->handler(parsed.config, "") && parsed.ok;
      continue;
    }
    if (i + 1 >= argc) {
      std::cerr << "Option " << arg << " requires a value\n";
      parsed.ok = false;
      continue;
    }
    const std::string value = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    parsed.ok = opt->handler(parsed.config, value) && parsed.ok;
  }

  return parsed;
}

// print_usage writes "usage" followed by one line per option and its description.
template <typename Config>
void print_usage(std::ostream& out, const std::string& usage,
                 const std::vector<Option<Config>>& options) {
  out << "Usage: " << usage << "\n";
  for (const auto& opt : options) {
    const std::string flag = opt.requires_value ? opt.name + " <value>" : opt.name;
    out << "  " << std::left << std::setw(24) << flag << opt.description << "\n";
  }
}

}  // namespace fitscore::apps
