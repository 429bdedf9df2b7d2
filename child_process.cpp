#include "child_process.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <signal.h>
#include <string>
#include <sys/types.h>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>

#include <fmt/core.h>

#include "errors.hpp"

namespace memwatch {

int32_t exit_code_from_status(int child_stat) {
  if (WIFEXITED(child_stat)) {
    return WEXITSTATUS(child_stat);
  } else if (WIFSIGNALED(child_stat)) {
    // PBSPro convention - status = 128 + signal
    return 128 + WTERMSIG(child_stat);
  }
  return -1;
}

pid_t Child_process::spawn(Run_cmd &cmd) {
  if (cmd.empty()) {
    throw Spawn_error("Command cannot be empty");
  }
  // The child reports a failed exec through this pipe. On a successful exec
  // the write end is closed by FD_CLOEXEC and the parent reads EOF.
  int pipefd[2];
  if (pipe(pipefd) == -1) {
    throw Spawn_error(fmt::format("Unable to create pipe: {}", strerror(errno)));
  }
  if (fcntl(pipefd[1], F_SETFD, FD_CLOEXEC) == -1) {
    auto err = errno;
    close(pipefd[0]);
    close(pipefd[1]);
    throw Spawn_error(fmt::format("Unable to set FD_CLOEXEC: {}", strerror(err)));
  }
  auto argv = cmd.get_argv();
  pid_t child_pid = fork();
  if (child_pid == -1) {
    auto err = errno;
    close(pipefd[0]);
    close(pipefd[1]);
    throw Spawn_error(fmt::format("Error: could not fork subprocess to exec {}: {}",
                                  cmd.get_argv_0(), strerror(err)));
  }
  if (child_pid == 0) {
    close(pipefd[0]);
    execvp(argv[0], argv);
    int err = errno;
    auto written = write(pipefd[1], &err, sizeof(err));
    (void)written;
    _exit(127);
  }
  close(pipefd[1]);
  int exec_errno = 0;
  ssize_t nread;
  do {
    nread = read(pipefd[0], &exec_errno, sizeof(exec_errno));
  } while (nread == -1 && errno == EINTR);
  close(pipefd[0]);
  if (nread > 0) {
    int child_stat;
    while (waitpid(child_pid, &child_stat, 0) == -1 && errno == EINTR) {
    }
    throw Spawn_error(fmt::format("Error: could not exec {}: {}",
                                  cmd.get_argv_0(), strerror(exec_errno)));
  }
  return child_pid;
}

Child_process::Child_process(Run_cmd &cmd) : pid(spawn(cmd)) {}

Child_process::~Child_process() {
  if (exit_code_) {
    return;
  }
  if (kill(pid, SIGTERM) == -1 && errno != ESRCH) {
    std::cerr << "Warning: unable to terminate child " << pid << ": "
              << strerror(errno) << std::endl;
  }
  int child_stat;
  while (waitpid(pid, &child_stat, 0) == -1) {
    if (errno != EINTR) {
      std::cerr << "Warning: unable to reap child " << pid << ": "
                << strerror(errno) << std::endl;
      break;
    }
  }
}

bool Child_process::has_exited() {
  if (exit_code_) {
    return true;
  }
  siginfo_t info{};
  while (waitid(P_PID, static_cast<id_t>(pid), &info,
                WEXITED | WNOHANG | WNOWAIT) == -1) {
    if (errno != EINTR) {
      throw std::system_error(errno, std::generic_category(),
                              fmt::format("waitid on pid {}", pid));
    }
  }
  // si_pid stays 0 while the child is still running
  return info.si_pid == pid;
}

int32_t Child_process::wait() {
  if (exit_code_) {
    return exit_code_.value();
  }
  int child_stat;
  while (waitpid(pid, &child_stat, 0) == -1) {
    if (errno != EINTR) {
      throw std::system_error(errno, std::generic_category(),
                              fmt::format("waitpid on pid {}", pid));
    }
  }
  exit_code_ = exit_code_from_status(child_stat);
  return exit_code_.value();
}

} // namespace memwatch
