#pragma once

#include <cstdint>
#include <sys/types.h>

#include "job_state.hpp"
#include "mem_types.hpp"
#include "process_inspector.hpp"
#include "run_cmd.hpp"

namespace memwatch {

enum class Sampler_state { idle, spawning, sampling, draining, finalized };

struct sampler_options {
  uint64_t interval_ms = 500;
  bool track_timeline = false;
  filter_spec filter{};
  bool verbose = false;
};

// Runs one command to completion, sampling the memory of its process tree.
// The sampling sequence is: spawn, one immediate sample, then poll/sample/
// sleep until the child exits, one final sample, and a blocking reap.
class Sampler {
public:
  Sampler(Process_inspector &inspector, sampler_options opts);
  job_profile run(Run_cmd cmd);
  Sampler_state state() const { return state_; }

private:
  Process_inspector &inspector_;
  const sampler_options opts_;
  Sampler_state state_;
  bool sample_and_fold(Job_state &job, pid_t root_pid);
};

} // namespace memwatch
