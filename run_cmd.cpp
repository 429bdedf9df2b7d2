#include "run_cmd.hpp"

#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace memwatch {
Run_cmd::Run_cmd(char *cmdline[], int start, int end) {
  for (int i = start; i < end; i++) {
    proc_to_run_.emplace_back(cmdline[i]);
  }
}

Run_cmd::Run_cmd(std::vector<std::string> argv)
    : proc_to_run_(std::move(argv)) {}

Run_cmd::Run_cmd(const Run_cmd &other) : proc_to_run_(other.proc_to_run_) {}

std::vector<std::string> Run_cmd::get() const { return proc_to_run_; }

std::string Run_cmd::print() const {
  std::stringstream out;
  for (const auto &i : proc_to_run_) {
    if (i.empty()) {
      continue;
    }
    if (out.tellp() > 0) {
      out << " ";
    }
    out << i;
  }
  return out.str();
}

const char *Run_cmd::get_argv_0() { return proc_to_run_[0].c_str(); }

char **Run_cmd::get_argv() {
  if (argv_holder_.empty()) {
    for (auto &p : proc_to_run_) {
      argv_holder_.push_back(p.data());
    }
    argv_holder_.push_back(nullptr);
  }
  return argv_holder_.data();
}

} // namespace memwatch
