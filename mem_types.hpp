#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace memwatch {

// All times are microseconds since the epoch, see now()

struct process_sample {
  pid_t pid;
  pid_t ppid;
  uint64_t rss_kib;
  std::string command;
};

struct job_snapshot {
  int64_t timestamp;
  uint64_t total_rss_kib;
  std::vector<process_sample> processes;
};

struct process_stats {
  pid_t pid;
  pid_t ppid;
  std::string command;
  uint64_t max_rss_kib;
  int64_t peak_time;
  int64_t first_seen;
  int64_t last_seen;
};

struct timeline_point {
  int64_t timestamp;
  double elapsed_seconds;
  uint64_t total_rss_kib;
  std::size_t process_count;
};

struct filter_spec {
  std::optional<std::string> exclude_pattern;
  std::optional<std::string> include_pattern;

  bool empty() const { return !exclude_pattern && !include_pattern; }
};

struct job_profile {
  std::vector<std::string> command;
  int64_t start_time;
  int64_t end_time;
  double duration_seconds;
  uint64_t interval_ms;
  uint64_t max_total_rss_kib;
  std::size_t samples;
  // Sorted by max_rss_kib descending, then pid ascending
  std::vector<process_stats> processes;
  std::optional<std::vector<timeline_point>> timeline;
  std::optional<int32_t> exit_code;
  std::optional<filter_spec> filter;
  std::optional<std::size_t> filtered_process_count;
  std::optional<uint64_t> filtered_total_rss_kib;
};

} // namespace memwatch
