#include "process_filter.hpp"

#include <optional>
#include <regex>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "errors.hpp"

namespace memwatch {

namespace {
std::optional<std::regex> compile(const std::optional<std::string> &pattern,
                                  const char *which) {
  if (!pattern) {
    return std::nullopt;
  }
  try {
    return std::regex(pattern.value(), std::regex::ECMAScript);
  } catch (const std::regex_error &e) {
    throw Invalid_pattern_error(
        fmt::format("Invalid {} pattern '{}': {}", which, pattern.value(),
                    e.what()));
  }
}
} // namespace

Process_filter::Process_filter() : Process_filter(filter_spec{}) {}

Process_filter::Process_filter(filter_spec spec)
    : spec_(std::move(spec)),
      exclude_re_(compile(spec_.exclude_pattern, "exclude")),
      include_re_(compile(spec_.include_pattern, "include")) {}

bool Process_filter::keep(const std::string &command) const {
  if (include_re_ && !std::regex_search(command, include_re_.value())) {
    return false;
  }
  // Exclude can veto an include match
  if (exclude_re_ && std::regex_search(command, exclude_re_.value())) {
    return false;
  }
  return true;
}

filter_result Process_filter::apply(std::vector<process_stats> stats) const {
  filter_result out{{}, 0ul, 0ull};
  for (auto &proc : stats) {
    if (keep(proc.command)) {
      out.kept.push_back(std::move(proc));
    } else {
      out.excluded_count++;
      out.excluded_total_kib += proc.max_rss_kib;
    }
  }
  return out;
}

} // namespace memwatch
