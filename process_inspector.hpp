#pragma once

#include <memory>
#include <string>
#include <vector>

#include "mem_types.hpp"

namespace memwatch {

// Flat, unordered view of every process on the system. Processes that
// disappear while being read are left out of the result; only a failure to
// enumerate the process table at all throws Inspection_error.
class Process_inspector {
public:
  virtual ~Process_inspector() = default;
  virtual std::vector<process_sample> snapshot_all() = 0;
};

// kind is one of "proc", "ps" or "auto"
std::unique_ptr<Process_inspector> make_inspector(const std::string &kind);

} // namespace memwatch
