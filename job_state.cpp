#include "job_state.hpp"

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "functions.hpp"

namespace memwatch {

Job_state::Job_state(bool track_timeline) : Job_state(track_timeline, now()) {}

Job_state::Job_state(bool track_timeline, int64_t start)
    : start_time(start), max_total_rss_kib_(0ull), samples_(0ul),
      finalized_(false) {
  if (track_timeline) {
    timeline_.emplace();
  }
}

void Job_state::fold(const job_snapshot &snapshot) {
  if (finalized_) {
    throw std::logic_error("Attempted to fold a snapshot into a finalized job");
  }
  samples_++;
  max_total_rss_kib_ = std::max(max_total_rss_kib_, snapshot.total_rss_kib);

  if (timeline_) {
    timeline_->push_back(
        {snapshot.timestamp,
         static_cast<double>(snapshot.timestamp - start_time) / 1e6,
         snapshot.total_rss_kib, snapshot.processes.size()});
  }

  for (const auto &proc : snapshot.processes) {
    auto [it, inserted] = process_stats_.try_emplace(
        proc.pid, process_stats{proc.pid, proc.ppid, proc.command,
                                proc.rss_kib, snapshot.timestamp,
                                snapshot.timestamp, snapshot.timestamp});
    if (inserted) {
      continue;
    }
    auto &stats = it->second;
    // Peak time only moves on a strictly higher reading
    if (proc.rss_kib > stats.max_rss_kib) {
      stats.max_rss_kib = proc.rss_kib;
      stats.peak_time = snapshot.timestamp;
    }
    stats.last_seen = std::max(stats.last_seen, snapshot.timestamp);
  }
}

job_profile Job_state::finalize(std::vector<std::string> command,
                                uint64_t interval_ms,
                                std::optional<int32_t> exit_code,
                                const Process_filter &filter,
                                int64_t end_time) {
  if (finalized_) {
    throw std::logic_error("Job has already been finalized");
  }
  finalized_ = true;

  std::vector<process_stats> all_processes;
  all_processes.reserve(process_stats_.size());
  for (auto &[pid, stats] : process_stats_) {
    all_processes.push_back(std::move(stats));
  }
  process_stats_.clear();
  std::sort(all_processes.begin(), all_processes.end(),
            [](const process_stats &a, const process_stats &b) {
              if (a.max_rss_kib != b.max_rss_kib) {
                return a.max_rss_kib > b.max_rss_kib;
              }
              return a.pid < b.pid;
            });

  job_profile out;
  out.command = std::move(command);
  out.start_time = start_time;
  out.end_time = end_time;
  out.duration_seconds = static_cast<double>(end_time - start_time) / 1e6;
  out.interval_ms = interval_ms;
  out.max_total_rss_kib = max_total_rss_kib_;
  out.samples = samples_;
  out.timeline = std::move(timeline_);
  timeline_.reset();
  out.exit_code = exit_code;

  if (filter.active()) {
    auto filtered = filter.apply(std::move(all_processes));
    out.processes = std::move(filtered.kept);
    out.filter = filter.spec();
    out.filtered_process_count = filtered.excluded_count;
    out.filtered_total_rss_kib = filtered.excluded_total_kib;
  } else {
    out.processes = std::move(all_processes);
  }
  return out;
}

} // namespace memwatch
