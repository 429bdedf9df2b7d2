#include "csv_writer.hpp"

#include <filesystem>
#include <fstream>
#include <ostream>
#include <stdexcept>
#include <string>

#include <fmt/core.h>

#include "errors.hpp"
#include "functions.hpp"

namespace memwatch {

namespace {
void write_filter_comment(const filter_spec &filter, std::ostream &out) {
  out << "# Filter: ";
  if (filter.exclude_pattern) {
    out << "exclude='" << filter.exclude_pattern.value() << "' ";
  }
  if (filter.include_pattern) {
    out << "include='" << filter.include_pattern.value() << "' ";
  }
}

std::ofstream open_csv(const std::filesystem::path &path) {
  std::ofstream out(path);
  if (!out.is_open()) {
    throw std::runtime_error("Failed to create CSV file: " + path.string());
  }
  return out;
}

// The ofstream destructor would swallow a failed flush (e.g. a full disk)
void close_csv(std::ofstream &out, const std::filesystem::path &path) {
  out.flush();
  if (!out) {
    throw std::runtime_error("Failed to write CSV file: " + path.string());
  }
  out.close();
  if (!out) {
    throw std::runtime_error("Failed to close CSV file: " + path.string());
  }
}

void require_timeline(const job_profile &profile) {
  if (!profile.timeline) {
    throw Timeline_not_tracked_error(
        "Timeline data not available: time-series tracking was not enabled "
        "for this run");
  }
}
} // namespace

std::string escape_csv(const std::string &field) {
  std::string out;
  out.reserve(field.size());
  for (const auto c : field) {
    if (c == '"') {
      out += '"';
    }
    out += c;
  }
  return out;
}

void write_process_csv(const job_profile &profile, std::ostream &out) {
  if (profile.filter) {
    write_filter_comment(profile.filter.value(), out);
    out << fmt::format("({} processes filtered out, {} KiB total)\n",
                       profile.filtered_process_count.value_or(0),
                       profile.filtered_total_rss_kib.value_or(0));
  }
  out << "pid,ppid,command,max_rss_kib,max_rss_mib,first_seen,last_seen\n";
  for (const auto &proc : profile.processes) {
    if (proc.max_rss_kib == 0) {
      continue;
    }
    out << fmt::format("{},{},\"{}\",{},{:.2f},{},{}\n", proc.pid, proc.ppid,
                       escape_csv(proc.command), proc.max_rss_kib,
                       static_cast<double>(proc.max_rss_kib) / 1024.0,
                       format_timestamp(proc.first_seen),
                       format_timestamp(proc.last_seen));
  }
}

void write_timeline_csv(const job_profile &profile, std::ostream &out) {
  require_timeline(profile);
  if (profile.filter) {
    write_filter_comment(profile.filter.value(), out);
    out << "\n# Note: total_rss_kib and process_count both show all "
           "processes (unfiltered)\n";
  }
  out << "timestamp,elapsed_seconds,total_rss_kib,total_rss_mib,"
         "process_count\n";
  for (const auto &point : profile.timeline.value()) {
    out << fmt::format("{},{:.3f},{},{:.2f},{}\n",
                       format_timestamp(point.timestamp),
                       point.elapsed_seconds, point.total_rss_kib,
                       static_cast<double>(point.total_rss_kib) / 1024.0,
                       point.process_count);
  }
}

void export_process_csv(const job_profile &profile,
                        const std::filesystem::path &path) {
  auto out = open_csv(path);
  write_process_csv(profile, out);
  close_csv(out, path);
}

void export_timeline_csv(const job_profile &profile,
                         const std::filesystem::path &path) {
  // Check before creating the file so no empty export is left behind
  require_timeline(profile);
  auto out = open_csv(path);
  write_timeline_csv(profile, out);
  close_csv(out, path);
}

} // namespace memwatch
