#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <sys/types.h>
#include <unordered_map>
#include <vector>

#include "mem_types.hpp"
#include "process_filter.hpp"

namespace memwatch {

class Job_state {
public:
  const int64_t start_time;
  Job_state(bool track_timeline);
  Job_state(bool track_timeline, int64_t start);
  void fold(const job_snapshot &snapshot);
  // Consumes the accumulated statistics; no fold may follow
  job_profile finalize(std::vector<std::string> command, uint64_t interval_ms,
                       std::optional<int32_t> exit_code,
                       const Process_filter &filter, int64_t end_time);
  uint64_t max_total_rss_kib() const { return max_total_rss_kib_; }
  std::size_t samples() const { return samples_; }
  const std::unordered_map<pid_t, process_stats> &process_stats_map() const {
    return process_stats_;
  }
  const std::optional<std::vector<timeline_point>> &timeline() const {
    return timeline_;
  }

private:
  uint64_t max_total_rss_kib_;
  std::size_t samples_;
  std::unordered_map<pid_t, process_stats> process_stats_;
  std::optional<std::vector<timeline_point>> timeline_;
  bool finalized_;
};

} // namespace memwatch
