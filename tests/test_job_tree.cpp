#include <algorithm>
#include <random>
#include <set>
#include <vector>

#include <gtest/gtest.h>

#include "job_tree.hpp"

using memwatch::process_sample;

namespace {

std::vector<process_sample>
make_table(std::vector<std::pair<pid_t, pid_t>> pid_ppid) {
  std::vector<process_sample> out;
  for (const auto &[pid, ppid] : pid_ppid) {
    out.push_back({pid, ppid, static_cast<uint64_t>(pid) * 10, "cmd"});
  }
  return out;
}

// Reference closure: rescan until nothing new is added
std::set<pid_t> naive_closure(pid_t root,
                              const std::vector<process_sample> &all) {
  std::set<pid_t> out{root};
  bool changed = true;
  while (changed) {
    changed = false;
    for (const auto &p : all) {
      if (!out.contains(p.pid) && out.contains(p.ppid)) {
        out.insert(p.pid);
        changed = true;
      }
    }
  }
  return out;
}

} // namespace

TEST(JobTree, ResolvesChildrenAndGrandchildren) {
  auto all = make_table({{100, 1}, {200, 100}, {300, 100}, {400, 200}, {500, 50}});
  auto pids = memwatch::resolve_job_pids(100, all);
  EXPECT_EQ(pids, (std::set<pid_t>{100, 200, 300, 400}));
  EXPECT_FALSE(pids.contains(500));
}

TEST(JobTree, DeepChainStopsAtRoot) {
  auto all = make_table({{1, 0}, {10, 1}, {20, 10}, {30, 20}, {40, 30}});
  auto pids = memwatch::resolve_job_pids(10, all);
  EXPECT_EQ(pids, (std::set<pid_t>{10, 20, 30, 40}));
  EXPECT_FALSE(pids.contains(1));
}

TEST(JobTree, RootIncludedWhenAbsentFromTable) {
  auto all = make_table({{1000, 999}, {5, 1}});
  EXPECT_EQ(memwatch::resolve_job_pids(999, all),
            (std::set<pid_t>{999, 1000}));
  EXPECT_EQ(memwatch::resolve_job_pids(4242, all), (std::set<pid_t>{4242}));
}

TEST(JobTree, OrphanedGrandchildIsLost) {
  // 200 has exited and 400 was reparented to init
  auto all = make_table({{100, 1}, {400, 1}});
  EXPECT_EQ(memwatch::resolve_job_pids(100, all), (std::set<pid_t>{100}));
}

TEST(JobTree, SelfParentedEntryTerminates) {
  auto all = make_table({{0, 0}, {1, 0}, {2, 1}});
  EXPECT_EQ(memwatch::resolve_job_pids(1, all), (std::set<pid_t>{1, 2}));
}

TEST(JobTree, ResolvingTwiceGivesSameSet) {
  auto all = make_table({{100, 1}, {200, 100}, {300, 200}, {7, 3}});
  EXPECT_EQ(memwatch::resolve_job_pids(100, all),
            memwatch::resolve_job_pids(100, all));
}

TEST(JobTree, MatchesFixedPointClosureOnRandomForests) {
  std::mt19937 rng(12345);
  for (int round = 0; round < 200; ++round) {
    std::vector<std::pair<pid_t, pid_t>> table;
    auto nprocs = std::uniform_int_distribution<int>(1, 60)(rng);
    for (pid_t pid = 2; pid < nprocs + 2; ++pid) {
      // Parent is an earlier pid or one of a few outside roots
      auto ppid = std::uniform_int_distribution<pid_t>(-3, pid - 1)(rng);
      table.push_back({pid, ppid < 1 ? ppid + 3 : ppid});
    }
    std::shuffle(table.begin(), table.end(), rng);
    auto all = make_table(table);
    auto root = std::uniform_int_distribution<pid_t>(1, nprocs + 1)(rng);
    auto pids = memwatch::resolve_job_pids(root, all);
    EXPECT_EQ(pids, naive_closure(root, all)) << "round " << round;
    EXPECT_TRUE(pids.contains(root));
  }
}

TEST(JobTree, SnapshotRestrictsAndSumsRss) {
  auto all = make_table({{100, 1}, {200, 100}, {300, 100}, {400, 200}, {500, 50}});
  auto snap = memwatch::build_job_snapshot(100, all, 1234);
  EXPECT_EQ(snap.timestamp, 1234);
  EXPECT_EQ(snap.processes.size(), 4u);
  EXPECT_EQ(snap.total_rss_kib, 1000u + 2000u + 3000u + 4000u);
  for (const auto &p : snap.processes) {
    EXPECT_NE(p.pid, 500);
  }
}

TEST(JobTree, SnapshotOfVanishedRootIsEmpty) {
  auto all = make_table({{5, 1}});
  auto snap = memwatch::build_job_snapshot(100, all, 1);
  EXPECT_TRUE(snap.processes.empty());
  EXPECT_EQ(snap.total_rss_kib, 0u);
}

TEST(JobTree, PidMapGroupsChildrenByParent) {
  auto all = make_table({{100, 1}, {200, 100}, {300, 100}, {0, 0}});
  auto pid_map = memwatch::get_pid_map(all);
  EXPECT_EQ(pid_map.at(100), (std::vector<pid_t>{200, 300}));
  EXPECT_EQ(pid_map.at(1), (std::vector<pid_t>{100}));
  EXPECT_FALSE(pid_map.contains(0));
}
