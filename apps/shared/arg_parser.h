#pragma once

#include <charconv>
#include <exception>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <vector>

namespace sme::apps {

// Option describes a single command-line flag accepted by a subcommand.
// Config is the caller-defined configuration struct that handlers populate.
//
// handler returns false when the value is rejected; parse_options records the
// failure and keeps going so every bad flag is reported in one run.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

// ParseOutcome carries the populated config plus whether any flag failed.
template <typename Config>
struct ParseOutcome {
  Config config;       // NOLINT(readability-identifier-naming)
  bool ok{true};       // NOLINT(readability-identifier-naming)
};

// parse_options iterates argv[start..argc-1] and dispatches each recognised flag
// to its handler. Unknown flags, missing values and rejected values are reported
// to stderr and make the outcome not ok. Non-flag tokens are skipped.
template <typename Config>
ParseOutcome<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                   const std::vector<Option<Config>>& options, int start = 1,
                                   Config default_config = {}) {
  ParseOutcome<Config> outcome{std::move(default_config), true};

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
          if (!opt->handler(outcome.config,
                            argv[++i])) {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            outcome.ok = false;
          }
        } else {
          std::cerr << "Option " << arg << " requires a value\n";
          outcome.ok = false;
        }
      } else if (!opt->handler(outcome.config, "")) {
        outcome.ok = false;
      }
    } else if (!arg.empty() && arg[0] == '-') {
      std::cerr << "Unknown option: " << arg << "\n";
      outcome.ok = false;
    }
  }

  return outcome;
}

// print_options writes one "  --flag <value>  description" line per option.
template <typename Config>
void print_options(std::ostream& os, const std::vector<Option<Config>>& options) {
  for (const auto& opt : options) {
    os << "  " << opt.name << (opt.requires_value ? " <value>" : "") << "  " << opt.description
       << "\n";
  }
}

// parse_int accepts a whole decimal integer with no trailing characters.
inline std::optional<int> parse_int(const std::string& text) {
  int value = 0;
  const char* first = text.data();
  const char* last = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc{} || ptr != last || text.empty()) {
    return std::nullopt;
  }
  return value;
}

// parse_double accepts a decimal number with no trailing characters.
inline std::optional<double> parse_double(const std::string& text) {
  if (text.empty()) {
    return std::nullopt;
  }
  try {
    std::size_t consumed = 0;
    const double value = std::stod(text, &consumed);
    if (consumed != text.size()) {
      return std::nullopt;
    }
    return value;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

}  // namespace sme::apps
