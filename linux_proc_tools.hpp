#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <sys/types.h>
#include <unistd.h>
#include <vector>

#include "mem_types.hpp"
#include "process_inspector.hpp"

namespace memwatch {

struct stat_fields {
  pid_t ppid;
  std::string comm;
};

std::optional<stat_fields> parse_stat_line(const std::string &stat_line);
std::optional<uint64_t> parse_kib_line(const std::string &line);
std::string join_cmdline(const std::string &raw);

class Proc_inspector : public Process_inspector {
public:
  Proc_inspector();
  Proc_inspector(std::filesystem::path proc_root);
  std::vector<process_sample> snapshot_all() override;
  std::optional<process_sample> read_process(pid_t pid);

private:
  const std::filesystem::path proc_root_;
  std::optional<uint64_t> read_rss(const std::filesystem::path &pid_dir);
  std::string read_cmdline(const std::filesystem::path &pid_dir);
};

} // namespace memwatch
