#include <algorithm>
#include <cstdint>
#include <map>
#include <optional>
#include <random>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "job_state.hpp"
#include "process_filter.hpp"

using memwatch::job_snapshot;
using memwatch::Job_state;
using memwatch::process_sample;
using memwatch::Process_filter;

namespace {

job_snapshot snap(int64_t ts, std::vector<process_sample> procs) {
  uint64_t total = 0;
  for (const auto &p : procs) {
    total += p.rss_kib;
  }
  return {ts, total, std::move(procs)};
}

} // namespace

TEST(JobState, PeakTracksHighestReading) {
  Job_state job(false, 1000);
  job.fold(snap(2000, {{7, 1, 500, "a"}}));
  job.fold(snap(3000, {{7, 1, 300, "a"}}));
  job.fold(snap(4000, {{7, 1, 900, "a"}}));

  const auto &stats = job.process_stats_map().at(7);
  EXPECT_EQ(stats.max_rss_kib, 900u);
  EXPECT_EQ(stats.peak_time, 4000);
  EXPECT_EQ(stats.first_seen, 2000);
  EXPECT_EQ(stats.last_seen, 4000);
  EXPECT_EQ(job.samples(), 3u);
  EXPECT_EQ(job.max_total_rss_kib(), 900u);
}

TEST(JobState, EqualReadingKeepsFirstPeakTime) {
  Job_state job(false, 0);
  job.fold(snap(10, {{7, 1, 500, "a"}}));
  job.fold(snap(20, {{7, 1, 500, "a"}}));
  EXPECT_EQ(job.process_stats_map().at(7).peak_time, 10);
  EXPECT_EQ(job.process_stats_map().at(7).last_seen, 20);
}

TEST(JobState, CommandFixedAtFirstObservation) {
  Job_state job(false, 0);
  job.fold(snap(10, {{7, 1, 100, "sh -c worker"}}));
  job.fold(snap(20, {{7, 1, 200, "worker"}}));
  EXPECT_EQ(job.process_stats_map().at(7).command, "sh -c worker");
}

TEST(JobState, MaxTotalIsMaxOfSnapshotTotals) {
  Job_state job(false, 0);
  job.fold(snap(10, {{1, 0, 100, "a"}, {2, 1, 100, "b"}}));
  job.fold(snap(20, {{1, 0, 150, "a"}}));
  job.fold(snap(30, {{2, 1, 120, "b"}}));
  EXPECT_EQ(job.max_total_rss_kib(), 200u);
  EXPECT_EQ(job.process_stats_map().at(1).max_rss_kib, 150u);
  EXPECT_EQ(job.process_stats_map().at(2).max_rss_kib, 120u);
}

TEST(JobState, EmptySnapshotStillCountsAsSample) {
  Job_state job(true, 0);
  job.fold(snap(10, {}));
  EXPECT_EQ(job.samples(), 1u);
  EXPECT_EQ(job.max_total_rss_kib(), 0u);
  ASSERT_TRUE(job.timeline());
  EXPECT_EQ(job.timeline()->size(), 1u);
}

TEST(JobState, TimelineRecordsEverySample) {
  Job_state job(true, 1000000);
  job.fold(snap(1500000, {{1, 0, 100, "a"}}));
  job.fold(snap(3000000, {{1, 0, 100, "a"}, {2, 1, 50, "b"}}));

  ASSERT_TRUE(job.timeline());
  const auto &timeline = job.timeline().value();
  ASSERT_EQ(timeline.size(), 2u);
  EXPECT_DOUBLE_EQ(timeline[0].elapsed_seconds, 0.5);
  EXPECT_EQ(timeline[0].total_rss_kib, 100u);
  EXPECT_EQ(timeline[0].process_count, 1u);
  EXPECT_DOUBLE_EQ(timeline[1].elapsed_seconds, 2.0);
  EXPECT_EQ(timeline[1].total_rss_kib, 150u);
  EXPECT_EQ(timeline[1].process_count, 2u);
}

TEST(JobState, NoTimelineWhenNotTracking) {
  Job_state job(false, 0);
  job.fold(snap(10, {{1, 0, 100, "a"}}));
  EXPECT_FALSE(job.timeline());
  auto profile = job.finalize({"a"}, 500, 0, Process_filter(), 20);
  EXPECT_FALSE(profile.timeline);
}

TEST(JobState, FinalizeSortsByPeakThenPid) {
  Job_state job(false, 0);
  job.fold(snap(10, {{30, 1, 100, "c"},
                     {10, 1, 500, "a"},
                     {20, 1, 100, "b"},
                     {5, 1, 0, "z"}}));
  auto profile = job.finalize({"cmd", "arg"}, 250, 3, Process_filter(),
                              2500000);

  ASSERT_EQ(profile.processes.size(), 4u);
  EXPECT_EQ(profile.processes[0].pid, 10);
  EXPECT_EQ(profile.processes[1].pid, 20);
  EXPECT_EQ(profile.processes[2].pid, 30);
  EXPECT_EQ(profile.processes[3].pid, 5);
  EXPECT_EQ(profile.command, (std::vector<std::string>{"cmd", "arg"}));
  EXPECT_EQ(profile.interval_ms, 250u);
  EXPECT_EQ(profile.exit_code, 3);
  EXPECT_EQ(profile.samples, 1u);
  EXPECT_DOUBLE_EQ(profile.duration_seconds, 2.5);
  EXPECT_FALSE(profile.filter);
  EXPECT_FALSE(profile.filtered_process_count);
  EXPECT_FALSE(profile.filtered_total_rss_kib);
}

TEST(JobState, FinalizeAppliesFilterButKeepsUnfilteredTotal) {
  Job_state job(false, 0);
  job.fold(snap(10, {{1, 0, 100, "python main.py"},
                     {2, 1, 400, "worker-1"},
                     {3, 1, 300, "worker-debug"}}));
  memwatch::filter_spec spec;
  spec.include_pattern = "worker";
  spec.exclude_pattern = "worker-debug";
  auto profile = job.finalize({"python"}, 500, 0, Process_filter(spec), 20);

  ASSERT_EQ(profile.processes.size(), 1u);
  EXPECT_EQ(profile.processes[0].pid, 2);
  ASSERT_TRUE(profile.filter);
  EXPECT_EQ(profile.filter->include_pattern, "worker");
  EXPECT_EQ(profile.filtered_process_count, 2u);
  EXPECT_EQ(profile.filtered_total_rss_kib, 400u);
  EXPECT_EQ(profile.max_total_rss_kib, 800u);
}

TEST(JobState, FoldAfterFinalizeThrows) {
  Job_state job(false, 0);
  job.fold(snap(10, {{1, 0, 100, "a"}}));
  auto profile = job.finalize({"a"}, 500, std::nullopt, Process_filter(), 20);
  EXPECT_FALSE(profile.exit_code);
  EXPECT_THROW(job.fold(snap(30, {{1, 0, 100, "a"}})), std::logic_error);
  EXPECT_THROW(job.finalize({"a"}, 500, 0, Process_filter(), 40),
               std::logic_error);
}

TEST(JobState, RandomFoldsKeepInvariants) {
  std::mt19937 rng(42);
  std::uniform_int_distribution<uint64_t> rss(0, 10000);
  std::uniform_int_distribution<pid_t> pid(1, 8);
  Job_state job(true, 0);
  uint64_t expected_max_total = 0;
  for (int64_t ts = 1; ts <= 200; ++ts) {
    std::vector<process_sample> procs;
    std::set<pid_t> used;
    for (int i = 0; i < 4; ++i) {
      auto p = pid(rng);
      if (used.insert(p).second) {
        procs.push_back({p, 1, rss(rng), "p"});
      }
    }
    auto s = snap(ts * 1000, procs);
    expected_max_total = std::max(expected_max_total, s.total_rss_kib);
    std::map<pid_t, uint64_t> before;
    for (const auto &[p, st] : job.process_stats_map()) {
      before[p] = st.max_rss_kib;
    }
    job.fold(s);
    for (const auto &[p, st] : job.process_stats_map()) {
      EXPECT_GE(st.max_rss_kib, before[p]);
      EXPECT_LE(st.first_seen, st.peak_time);
      EXPECT_LE(st.peak_time, st.last_seen);
    }
    for (const auto &proc : procs) {
      EXPECT_GE(job.process_stats_map().at(proc.pid).max_rss_kib, proc.rss_kib);
      EXPECT_EQ(job.process_stats_map().at(proc.pid).last_seen, ts * 1000);
    }
  }
  EXPECT_EQ(job.samples(), 200u);
  EXPECT_EQ(job.max_total_rss_kib(), expected_max_total);
  EXPECT_EQ(job.timeline()->size(), job.samples());
}
