#include "job_tree.hpp"

#include <cstdint>
#include <set>
#include <sys/types.h>
#include <vector>

namespace memwatch {

pid_map_t get_pid_map(const std::vector<process_sample> &all) {
  pid_map_t out;
  for (const auto &proc : all) {
    // A pid that is its own parent would otherwise loop forever
    if (proc.pid != proc.ppid) {
      out[proc.ppid].push_back(proc.pid);
    }
  }
  return out;
}

std::set<pid_t> resolve_job_pids(pid_t root_pid,
                                 const std::vector<process_sample> &all) {
  auto pid_map = get_pid_map(all);
  std::set<pid_t> out{root_pid};
  std::vector<pid_t> pids{root_pid};
  for (auto i_pid = 0ul; i_pid < pids.size(); ++i_pid) {
    auto children = pid_map.find(pids[i_pid]);
    if (children == pid_map.end()) {
      continue;
    }
    for (const auto &j_pid : children->second) {
      if (out.insert(j_pid).second) {
        pids.push_back(j_pid);
      }
    }
  }
  return out;
}

job_snapshot build_job_snapshot(pid_t root_pid,
                                const std::vector<process_sample> &all,
                                int64_t timestamp) {
  auto job_pids = resolve_job_pids(root_pid, all);
  job_snapshot out{timestamp, 0ull, {}};
  std::set<pid_t> seen;
  for (const auto &proc : all) {
    if (job_pids.contains(proc.pid) && seen.insert(proc.pid).second) {
      out.total_rss_kib += proc.rss_kib;
      out.processes.push_back(proc);
    }
  }
  return out;
}

} // namespace memwatch
