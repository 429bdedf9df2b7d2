#include "linux_proc_tools.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "errors.hpp"
#include "functions.hpp"

namespace memwatch {

std::optional<stat_fields> parse_stat_line(const std::string &stat_line) {
  // pid (comm) state ppid ...
  // comm may itself contain spaces and parentheses, so take everything
  // between the first '(' and the last ')'
  auto comm_start = stat_line.find('(');
  auto comm_end = stat_line.rfind(')');
  if (comm_start == std::string::npos || comm_end == std::string::npos ||
      comm_end < comm_start) {
    return std::nullopt;
  }
  stat_fields out;
  out.comm = stat_line.substr(comm_start + 1, comm_end - comm_start - 1);
  std::stringstream ss(stat_line.substr(comm_end + 1));
  std::string state;
  std::string ppid;
  if (!(ss >> state >> ppid)) {
    return std::nullopt;
  }
  try {
    out.ppid = static_cast<pid_t>(std::stol(ppid));
  } catch (const std::exception &e) {
    return std::nullopt;
  }
  return out;
}

std::optional<uint64_t> parse_kib_line(const std::string &line) {
  // e.g. "VmRSS:\t    1234 kB"
  auto second_field_start = line.find(':');
  if (second_field_start == std::string::npos) {
    return std::nullopt;
  }
  try {
    return std::stoull(line.substr(second_field_start + 1));
  } catch (const std::exception &e) {
    return std::nullopt;
  }
}

std::string join_cmdline(const std::string &raw) {
  std::string out;
  std::string seg;
  std::stringstream ss(raw);
  while (std::getline(ss, seg, '\0')) {
    if (seg.empty()) {
      continue;
    }
    if (!out.empty()) {
      out += ' ';
    }
    out += seg;
  }
  // argv is raw bytes; reports need text
  return to_valid_utf8(out);
}

Proc_inspector::Proc_inspector() : Proc_inspector("/proc") {}

Proc_inspector::Proc_inspector(std::filesystem::path proc_root)
    : proc_root_(std::move(proc_root)) {}

std::optional<uint64_t>
Proc_inspector::read_rss(const std::filesystem::path &pid_dir) {
  std::ifstream status_file(pid_dir / "status");
  if (!status_file.is_open()) {
    // Process went away
    return std::nullopt;
  }
  std::string line;
  while (std::getline(status_file, line)) {
    if (line.starts_with("VmRSS:")) {
      return parse_kib_line(line);
    }
  }
  // Kernel threads and zombies have no VmRSS
  return 0ull;
}

std::string Proc_inspector::read_cmdline(const std::filesystem::path &pid_dir) {
  std::ifstream cmdline_file(pid_dir / "cmdline", std::ios::binary);
  if (!cmdline_file.is_open()) {
    return {};
  }
  std::string raw{std::istreambuf_iterator<char>(cmdline_file),
                  std::istreambuf_iterator<char>()};
  return join_cmdline(raw);
}

std::optional<process_sample> Proc_inspector::read_process(pid_t pid) {
  auto pid_dir = proc_root_ / std::to_string(pid);
  std::ifstream stat_file(pid_dir / "stat");
  if (!stat_file.is_open()) {
    return std::nullopt;
  }
  std::string line;
  std::getline(stat_file, line);
  auto stat = parse_stat_line(line);
  if (!stat) {
    return std::nullopt;
  }
  auto rss = read_rss(pid_dir);
  if (!rss) {
    return std::nullopt;
  }
  auto cmd = read_cmdline(pid_dir);
  if (cmd.empty()) {
    cmd = to_valid_utf8(stat->comm);
  }
  return process_sample{pid, stat->ppid, rss.value(), std::move(cmd)};
}

std::vector<process_sample> Proc_inspector::snapshot_all() {
  std::vector<process_sample> out;
  std::error_code ec;
  auto dir_it = std::filesystem::directory_iterator(proc_root_, ec);
  if (ec) {
    throw Inspection_error(fmt::format("Unable to read {}: {}",
                                       proc_root_.string(), ec.message()));
  }
  for (; dir_it != std::filesystem::directory_iterator(); dir_it.increment(ec)) {
    if (ec) {
      throw Inspection_error(fmt::format("Error while iterating {}: {}",
                                         proc_root_.string(), ec.message()));
    }
    auto name = dir_it->path().filename().string();
    if (name.empty() ||
        !std::all_of(name.begin(), name.end(),
                     [](unsigned char c) { return std::isdigit(c); })) {
      // self, thread-self, meminfo, ...
      continue;
    }
    pid_t pid;
    try {
      pid = static_cast<pid_t>(std::stol(name));
    } catch (const std::exception &e) {
      continue;
    }
    if (auto sample = read_process(pid)) {
      out.push_back(std::move(sample.value()));
    }
  }
  if (ec) {
    throw Inspection_error(fmt::format("Error while iterating {}: {}",
                                       proc_root_.string(), ec.message()));
  }
  return out;
}

} // namespace memwatch
