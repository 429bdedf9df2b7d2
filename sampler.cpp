#include "sampler.hpp"

#include <chrono>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

#include "child_process.hpp"
#include "functions.hpp"
#include "job_tree.hpp"
#include "process_filter.hpp"

namespace memwatch {

Sampler::Sampler(Process_inspector &inspector, sampler_options opts)
    : inspector_(inspector), opts_(std::move(opts)),
      state_(Sampler_state::idle) {}

bool Sampler::sample_and_fold(Job_state &job, pid_t root_pid) {
  try {
    auto all = inspector_.snapshot_all();
    auto snapshot = build_job_snapshot(root_pid, all, now());
    if (opts_.verbose) {
      std::cerr << "Sampled " << snapshot.processes.size()
                << " job processes out of " << all.size() << ", total RSS "
                << format_memory(snapshot.total_rss_kib) << std::endl;
    }
    job.fold(snapshot);
    return true;
  } catch (const std::exception &e) {
    // Process table read races are expected, the run carries on
    std::cerr << "Warning: Failed to sample processes: " << e.what()
              << std::endl;
    return false;
  }
}

job_profile Sampler::run(Run_cmd cmd) {
  if (state_ != Sampler_state::idle) {
    throw std::logic_error("A Sampler can only run one command");
  }
  if (cmd.empty()) {
    throw std::invalid_argument("Command cannot be empty");
  }
  if (opts_.interval_ms == 0) {
    throw std::invalid_argument("Sampling interval must be positive");
  }
  // Bad patterns must fail before anything is started
  auto filter = Process_filter{opts_.filter};
  auto interval = std::chrono::milliseconds(opts_.interval_ms);
  auto job = Job_state{opts_.track_timeline};

  state_ = Sampler_state::spawning;
  auto child = Child_process{cmd};
  if (opts_.verbose) {
    std::cerr << "Started " << cmd.print() << " as pid " << child.pid
              << std::endl;
  }

  state_ = Sampler_state::sampling;
  // Catches commands that finish inside the first interval
  sample_and_fold(job, child.pid);
  for (;;) {
    bool exited;
    try {
      exited = child.has_exited();
    } catch (const std::system_error &e) {
      std::cerr << "Warning: Failed to check process status: " << e.what()
                << std::endl;
      break;
    }
    sample_and_fold(job, child.pid);
    if (exited) {
      break;
    }
    std::this_thread::sleep_for(interval);
  }

  state_ = Sampler_state::draining;
  auto exit_code = child.wait();
  if (job.samples() == 0) {
    // Every sample failed; record an empty one rather than report none
    std::cerr << "Warning: No sample of the job could be taken" << std::endl;
    job.fold(job_snapshot{now(), 0ull, {}});
  }
  if (opts_.verbose) {
    std::cerr << "Job " << cmd.print() << " finished in "
              << format_hh_mm_ss(now() - job.start_time) << " with status "
              << exit_code << std::endl;
  }

  state_ = Sampler_state::finalized;
  return job.finalize(cmd.get(), opts_.interval_ms, exit_code, filter, now());
}

} // namespace memwatch
