#include "report_writing.hpp"

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "functions.hpp"
#include "run_cmd.hpp"

namespace memwatch {

constexpr std::size_t max_command_width = 60;

std::string truncate_command(const std::string &cmd, std::size_t max_len) {
  if (cmd.size() <= max_len) {
    return cmd;
  }
  auto cut = max_len > 3 ? max_len - 3 : 0;
  // Back up off UTF-8 continuation bytes so no character is split
  while (cut > 0 && (static_cast<unsigned char>(cmd[cut]) & 0xC0) == 0x80) {
    cut--;
  }
  return cmd.substr(0, cut) + "...";
}

void print_summary(const job_profile &profile, std::ostream &out) {
  out << "\nJob: " << Run_cmd{profile.command}.print() << "\n";
  out << "Duration:        " << format_duration(profile.duration_seconds)
      << "\n";
  out << "Samples:         " << profile.samples << "\n";
  if (profile.exit_code) {
    out << "Exit status:     " << profile.exit_code.value() << "\n";
  }
  if (profile.filter) {
    if (profile.filter->exclude_pattern) {
      out << "Exclude pattern: '" << profile.filter->exclude_pattern.value()
          << "'\n";
    }
    if (profile.filter->include_pattern) {
      out << "Include pattern: '" << profile.filter->include_pattern.value()
          << "'\n";
    }
    out << "Filtered out:    " << profile.filtered_process_count.value_or(0)
        << " processes ("
        << format_memory(profile.filtered_total_rss_kib.value_or(0)) << ")\n";
  }
  out << "\n";

  std::vector<const process_stats *> shown;
  for (const auto &proc : profile.processes) {
    if (proc.max_rss_kib > 0) {
      shown.push_back(&proc);
    }
  }

  if (profile.max_total_rss_kib == 0 || shown.empty()) {
    out << "Max total RSS:   " << format_memory(profile.max_total_rss_kib)
        << " (process exited too quickly to measure)\n";
    out << "\nNote: The command completed before memory could be sampled.\n";
    out << "For very short-running commands, try using a shorter sampling "
           "interval (-i).\n";
  } else {
    out << "Max total RSS:   " << format_memory(profile.max_total_rss_kib)
        << "\n";
    out << "Max per process: " << format_memory(shown.front()->max_rss_kib)
        << " (pid " << shown.front()->pid << ")\n";
    out << "\nPer-process peak RSS:\n";
    for (const auto proc : shown) {
      out << fmt::format("  pid {:5}  {:>10}  {}\n", proc->pid,
                         format_memory(proc->max_rss_kib),
                         truncate_command(proc->command, max_command_width));
    }
  }
  out << std::endl;
}

nlohmann::json profile_to_json(const job_profile &profile) {
  nlohmann::json j;
  j["command"] = profile.command;
  j["start_time"] = format_timestamp(profile.start_time);
  j["end_time"] = format_timestamp(profile.end_time);
  j["duration_seconds"] = profile.duration_seconds;
  j["interval_ms"] = profile.interval_ms;
  j["max_total_rss_kib"] = profile.max_total_rss_kib;
  j["samples"] = profile.samples;
  j["processes"] = nlohmann::json::array();
  for (const auto &proc : profile.processes) {
    j["processes"].push_back({{"pid", proc.pid},
                              {"ppid", proc.ppid},
                              {"command", proc.command},
                              {"max_rss_kib", proc.max_rss_kib},
                              {"first_seen", format_timestamp(proc.first_seen)},
                              {"last_seen", format_timestamp(proc.last_seen)},
                              {"peak_time", format_timestamp(proc.peak_time)}});
  }
  if (profile.timeline) {
    j["timeline"] = nlohmann::json::array();
    for (const auto &point : profile.timeline.value()) {
      j["timeline"].push_back(
          {{"timestamp", format_timestamp(point.timestamp)},
           {"elapsed_seconds", point.elapsed_seconds},
           {"total_rss_kib", point.total_rss_kib},
           {"process_count", point.process_count}});
    }
  }
  if (profile.exit_code) {
    j["exit_code"] = profile.exit_code.value();
  }
  if (profile.filter) {
    auto &filter = j["filter"] = nlohmann::json::object();
    if (profile.filter->exclude_pattern) {
      filter["exclude_pattern"] = profile.filter->exclude_pattern.value();
    }
    if (profile.filter->include_pattern) {
      filter["include_pattern"] = profile.filter->include_pattern.value();
    }
  }
  if (profile.filtered_process_count) {
    j["filtered_process_count"] = profile.filtered_process_count.value();
  }
  if (profile.filtered_total_rss_kib) {
    j["filtered_total_rss_kib"] = profile.filtered_total_rss_kib.value();
  }
  return j;
}

void print_json(const job_profile &profile, std::ostream &out) {
  // Commands from a profile built elsewhere may still carry raw bytes
  out << profile_to_json(profile).dump(
             2, ' ', false, nlohmann::json::error_handler_t::replace)
      << std::endl;
}

} // namespace memwatch
