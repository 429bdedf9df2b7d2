#pragma once

#include <cstdint>
#include <map>
#include <set>
#include <sys/types.h>
#include <vector>

#include "mem_types.hpp"

namespace memwatch {

typedef std::map<pid_t, std::vector<pid_t>> pid_map_t;

// parent pid -> child pids
pid_map_t get_pid_map(const std::vector<process_sample> &all);

// root_pid plus every pid reachable from it through live parent links.
// root_pid is always present, even when it is missing from all.
std::set<pid_t> resolve_job_pids(pid_t root_pid,
                                 const std::vector<process_sample> &all);

// Restricts all to the job tree of root_pid and sums its RSS
job_snapshot build_job_snapshot(pid_t root_pid,
                                const std::vector<process_sample> &all,
                                int64_t timestamp);

} // namespace memwatch
