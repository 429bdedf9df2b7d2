#include "ps_inspector.hpp"

#include <cerrno>
#include <cstring>
#include <sstream>
#include <string>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "errors.hpp"
#include "functions.hpp"

namespace memwatch {

std::vector<process_sample> parse_ps_output(const std::string &output) {
  std::vector<process_sample> out;
  std::stringstream lines(output);
  std::string line;
  while (std::getline(lines, line)) {
    std::stringstream ss(line);
    std::string pid_s, ppid_s, rss_s;
    if (!(ss >> pid_s >> ppid_s >> rss_s)) {
      continue;
    }
    process_sample sample;
    try {
      std::size_t used;
      sample.pid = static_cast<pid_t>(std::stol(pid_s, &used));
      if (used != pid_s.size()) {
        continue;
      }
      sample.ppid = static_cast<pid_t>(std::stol(ppid_s, &used));
      if (used != ppid_s.size()) {
        continue;
      }
      sample.rss_kib = std::stoull(rss_s, &used);
      if (used != rss_s.size()) {
        continue;
      }
    } catch (const std::exception &e) {
      // Header line or garbage
      continue;
    }
    std::getline(ss, sample.command);
    auto first = sample.command.find_first_not_of(" \t");
    if (first == std::string::npos) {
      continue;
    }
    sample.command.erase(0, first);
    auto last = sample.command.find_last_not_of(" \t\r");
    sample.command.erase(last + 1);
    sample.command = to_valid_utf8(sample.command);
    out.push_back(std::move(sample));
  }
  return out;
}

Ps_inspector::Ps_inspector() : Ps_inspector("ps") {}

Ps_inspector::Ps_inspector(std::string ps_path) : ps_path_(std::move(ps_path)) {}

std::string Ps_inspector::run_ps() {
  int pipefd[2];
  if (pipe(pipefd) == -1) {
    throw Inspection_error(
        fmt::format("Unable to create pipe for ps: {}", strerror(errno)));
  }
  pid_t fork_pid = fork();
  if (fork_pid == -1) {
    auto err = errno;
    close(pipefd[0]);
    close(pipefd[1]);
    throw Inspection_error(
        fmt::format("Unable to fork for ps: {}", strerror(err)));
  }
  if (fork_pid == 0) {
    close(pipefd[0]);
    dup2(pipefd[1], 1);
    close(pipefd[1]);
    execlp(ps_path_.c_str(), ps_path_.c_str(), "-A", "-o",
           "pid=,ppid=,rss=,command=", nullptr);
    _exit(127);
  }
  close(pipefd[1]);
  std::string ps_output;
  char buffer[4096];
  for (;;) {
    auto nread = read(pipefd[0], buffer, sizeof(buffer));
    if (nread == 0) {
      break;
    }
    if (nread == -1) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }
    ps_output.append(buffer, static_cast<std::size_t>(nread));
  }
  close(pipefd[0]);
  int ps_stat;
  while (waitpid(fork_pid, &ps_stat, 0) == -1) {
    if (errno != EINTR) {
      throw Inspection_error(
          fmt::format("Error waiting for ps: {}", strerror(errno)));
    }
  }
  if (!WIFEXITED(ps_stat) || WEXITSTATUS(ps_stat) != 0) {
    throw Inspection_error(
        fmt::format("{} failed with status {}", ps_path_, ps_stat));
  }
  return ps_output;
}

std::vector<process_sample> Ps_inspector::snapshot_all() {
  return parse_ps_output(run_ps());
}

} // namespace memwatch
