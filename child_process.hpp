#pragma once

#include <cstdint>
#include <optional>
#include <sys/types.h>
#include <unistd.h>

#include "run_cmd.hpp"

namespace memwatch {

// Owns a forked and exec'd command. A child that has not been reaped by the
// time this is destroyed is sent SIGTERM and reaped.
class Child_process {
public:
  const pid_t pid;
  Child_process(Run_cmd &cmd);
  Child_process(const Child_process &) = delete;
  Child_process &operator=(const Child_process &) = delete;
  ~Child_process();
  // Non-blocking, leaves the child waitable so it can still be sampled
  bool has_exited();
  // Blocks until the child is reaped; signal N is reported as 128 + N
  int32_t wait();

private:
  std::optional<int32_t> exit_code_;
  static pid_t spawn(Run_cmd &cmd);
};

int32_t exit_code_from_status(int child_stat);

} // namespace memwatch
