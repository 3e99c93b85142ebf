#pragma once

#include <algorithm>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace cintel::apps {

// One command-line flag. The handler writes into the caller's Config and
// returns false when the value is rejected; rejection bookkeeping is the
// handler's job.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

// Called for flags the table does not know and for value flags at the end of argv.
template <typename Config>
using ProblemSink = std::function<void(Config&, const std::string& message)>;

// Walks argv[start..argc-1] once. Bare tokens (no leading '-') are ignored.
template <typename Config>
Config parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                     const std::vector<Option<Config>>& options, const ProblemSink<Config>& on_problem,
                     int start = 1, Config config = {}) {
  std::unordered_map<std::string, const Option<Config>*> by_name;
  by_name.reserve(options.size());
  for (const auto& option : options) {
    by_name.emplace(option.name, &option);
  }

  int i = start;
  while (i < argc) {
    const std::string token = argv[i++];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    const auto found = by_name.find(token);
    if (found == by_name.end()) {
      if (token.size() > 1 && token.front() == '-') {
        on_problem(config, "Unknown option: " + token);
      }
      continue;
    }

    const Option<Config>& option = *found->second;
    if (!option.requires_value) {
      option.handler(config, std::string{});
      continue;
    }
    if (i >= argc) {
      on_problem(config, "Option " + token + " requires a value");
      break;
    }
    option.handler(config, argv[i++]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  }
  return config;
}

// Two-column "  --flag <value>  description" listing for --help.
template <typename Config>
std::string format_options(const std::vector<Option<Config>>& options) {
  const auto label = [](const Option<Config>& option) {
    return option.requires_value ? option.name + " <value>" : option.name;
  };
  std::size_t width = 0;
  for (const auto& option : options) {
    width = std::max(width, label(option).size());
  }
  std::string out;
  for (const auto& option : options) {
    std::string column = label(option);
    column.resize(width, ' ');
    out += "  " + column + "  " + option.description + "\n";
  }
  return out;
}

}  // namespace cintel::apps
