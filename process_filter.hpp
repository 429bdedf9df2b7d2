#pragma once

#include <cstdint>
#include <optional>
#include <regex>
#include <string>
#include <vector>

#include "mem_types.hpp"

namespace memwatch {

struct filter_result {
  std::vector<process_stats> kept;
  std::size_t excluded_count;
  uint64_t excluded_total_kib;
};

// A process is kept when it matches the include pattern (if any) and does
// not match the exclude pattern (if any). Patterns are compiled on
// construction so a bad pattern is reported before any work is done.
class Process_filter {
public:
  Process_filter();
  Process_filter(filter_spec spec);
  const filter_spec &spec() const { return spec_; }
  bool active() const { return !spec_.empty(); }
  bool keep(const std::string &command) const;
  filter_result apply(std::vector<process_stats> stats) const;

private:
  filter_spec spec_;
  std::optional<std::regex> exclude_re_;
  std::optional<std::regex> include_re_;
};

} // namespace memwatch
