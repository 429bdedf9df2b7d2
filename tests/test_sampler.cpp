#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <vector>

#include <gtest/gtest.h>

#include "errors.hpp"
#include "linux_proc_tools.hpp"
#include "process_inspector.hpp"
#include "run_cmd.hpp"
#include "sampler.hpp"

using memwatch::Run_cmd;
using memwatch::Sampler;
using memwatch::sampler_options;
using memwatch::Sampler_state;

namespace {

// Scripted inspector: fails the first fail_first calls, then returns table
class Fake_inspector : public memwatch::Process_inspector {
public:
  int calls = 0;
  int fail_first = 0;
  std::vector<memwatch::process_sample> table;

  std::vector<memwatch::process_sample> snapshot_all() override {
    calls++;
    if (calls <= fail_first) {
      throw memwatch::Inspection_error("process table unreadable");
    }
    return table;
  }
};

Run_cmd sh(const std::string &script) {
  return Run_cmd{std::vector<std::string>{"sh", "-c", script}};
}

sampler_options fast(bool timeline = false) {
  sampler_options opts;
  opts.interval_ms = 20;
  opts.track_timeline = timeline;
  return opts;
}

} // namespace

TEST(Sampler, InvalidPatternFailsBeforeSpawn) {
  auto marker = std::filesystem::temp_directory_path() /
                ("memwatch_sampler_marker_" + std::to_string(getpid()));
  std::filesystem::remove(marker);
  Fake_inspector inspector;
  auto opts = fast();
  opts.filter.include_pattern = "(unclosed";
  Sampler sampler(inspector, opts);

  EXPECT_THROW(sampler.run(sh("touch " + marker.string())),
               memwatch::Invalid_pattern_error);
  EXPECT_EQ(inspector.calls, 0);
  EXPECT_FALSE(std::filesystem::exists(marker));
}

TEST(Sampler, RejectsBadArguments) {
  Fake_inspector inspector;
  Sampler empty_cmd(inspector, fast());
  EXPECT_THROW(empty_cmd.run(Run_cmd{std::vector<std::string>{}}),
               std::invalid_argument);

  auto opts = fast();
  opts.interval_ms = 0;
  Sampler zero_interval(inspector, opts);
  EXPECT_THROW(zero_interval.run(sh("true")), std::invalid_argument);
  EXPECT_EQ(inspector.calls, 0);
}

TEST(Sampler, SpawnFailureIsReported) {
  Fake_inspector inspector;
  Sampler sampler(inspector, fast());
  EXPECT_THROW(
      sampler.run(Run_cmd{std::vector<std::string>{"/nonexistent/memwatch"}}),
      memwatch::Spawn_error);
  EXPECT_EQ(inspector.calls, 0);
}

TEST(Sampler, QuickCommandStillGetsSampled) {
  Fake_inspector inspector;
  Sampler sampler(inspector, fast());
  auto profile = sampler.run(sh("exit 0"));
  // One immediate sample and at least one after the exit was seen
  EXPECT_GE(profile.samples, 2u);
  EXPECT_EQ(static_cast<int>(profile.samples), inspector.calls);
  EXPECT_EQ(profile.exit_code, 0);
  EXPECT_EQ(sampler.state(), Sampler_state::finalized);
}

TEST(Sampler, SampleFailuresAreTolerated) {
  Fake_inspector inspector;
  inspector.fail_first = 1;
  Sampler sampler(inspector, fast(true));
  auto profile = sampler.run(sh("sleep 0.1"));
  EXPECT_EQ(static_cast<int>(profile.samples), inspector.calls - 1);
  EXPECT_GE(profile.samples, 1u);
  ASSERT_TRUE(profile.timeline);
  EXPECT_EQ(profile.timeline->size(), profile.samples);
}

TEST(Sampler, AllSamplesFailingStillGivesOneSample) {
  Fake_inspector inspector;
  inspector.fail_first = 1000000;
  Sampler sampler(inspector, fast());
  auto profile = sampler.run(sh("exit 4"));
  EXPECT_EQ(profile.samples, 1u);
  EXPECT_EQ(profile.max_total_rss_kib, 0u);
  EXPECT_TRUE(profile.processes.empty());
  EXPECT_EQ(profile.exit_code, 4);
}

TEST(Sampler, RunsOnlyOnce) {
  Fake_inspector inspector;
  Sampler sampler(inspector, fast());
  EXPECT_EQ(sampler.state(), Sampler_state::idle);
  sampler.run(sh("true"));
  EXPECT_THROW(sampler.run(sh("true")), std::logic_error);
}

class ProcSampler : public ::testing::Test {
protected:
  void SetUp() override {
#ifndef __linux__
    GTEST_SKIP() << "/proc is only read on linux";
#endif
  }
  memwatch::Proc_inspector inspector;
};

TEST_F(ProcSampler, TracksRunningCommand) {
  Sampler sampler(inspector, fast(true));
  auto profile = sampler.run(sh("sleep 0.3"));

  EXPECT_EQ(profile.exit_code, 0);
  EXPECT_GE(profile.samples, 3u);
  ASSERT_FALSE(profile.processes.empty());
  EXPECT_GT(profile.max_total_rss_kib, 0u);
  EXPECT_GE(profile.max_total_rss_kib, profile.processes.front().max_rss_kib);
  ASSERT_TRUE(profile.timeline);
  EXPECT_EQ(profile.timeline->size(), profile.samples);
  EXPECT_GE(profile.duration_seconds, 0.3);
  for (std::size_t i = 1; i < profile.processes.size(); ++i) {
    EXPECT_GE(profile.processes[i - 1].max_rss_kib,
              profile.processes[i].max_rss_kib);
  }
}

TEST_F(ProcSampler, FollowsDescendants) {
  Sampler sampler(inspector, fast());
  auto profile = sampler.run(sh("sleep 0.4 & sleep 0.4; wait"));
  auto sleeps = std::count_if(
      profile.processes.begin(), profile.processes.end(),
      [](const auto &p) { return p.command.find("sleep") == 0; });
  EXPECT_GE(sleeps, 2);
  // Every recorded process descends from the job, not from the test runner
  for (const auto &p : profile.processes) {
    EXPECT_NE(p.pid, getpid());
  }
}

TEST_F(ProcSampler, FilterKeepsMatchingProcesses) {
  auto opts = fast();
  opts.filter.include_pattern = "^sleep";
  Sampler sampler(inspector, opts);
  auto profile = sampler.run(sh("sleep 0.3; true"));

  ASSERT_TRUE(profile.filter);
  ASSERT_TRUE(profile.filtered_process_count);
  EXPECT_GE(profile.filtered_process_count.value(), 1u);
  for (const auto &p : profile.processes) {
    EXPECT_EQ(p.command.find("sleep"), 0u);
  }
}

TEST_F(ProcSampler, RecordsExitCode) {
  Sampler sampler(inspector, fast());
  auto profile = sampler.run(sh("sleep 0.05; exit 7"));
  EXPECT_EQ(profile.exit_code, 7);
}
