#pragma once

#include <string>
#include <vector>

#include "mem_types.hpp"
#include "process_inspector.hpp"

namespace memwatch {

// Parses "PID PPID RSS COMMAND..." lines, skipping anything that does not
// start with three numeric fields (headers, truncated lines)
std::vector<process_sample> parse_ps_output(const std::string &output);

class Ps_inspector : public Process_inspector {
public:
  Ps_inspector();
  Ps_inspector(std::string ps_path);
  std::vector<process_sample> snapshot_all() override;

private:
  const std::string ps_path_;
  std::string run_ps();
};

} // namespace memwatch
