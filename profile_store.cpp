#include "profile_store.hpp"

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <map>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <vector>

#include "errors.hpp"
#include "sqlite_statement_manager.hpp"

namespace memwatch {

Profile_store::Profile_store(std::filesystem::path db_path) {
  int sqlite_ret;
  if ((sqlite_ret = sqlite3_open_v2(
           db_path.c_str(), &conn_,
           SQLITE_OPEN_FULLMUTEX | SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE,
           nullptr)) != SQLITE_OK) {
    sqlite3_close_v2(conn_);
    conn_ = nullptr;
    throw_sqlite_err("Unable to open database " + db_path.string(), sqlite_ret,
                     std::string_view{});
  }
  // Wait a long time if we have to
  if ((sqlite_ret = sqlite3_busy_timeout(conn_, 10000)) != SQLITE_OK) {
    sqlite3_close_v2(conn_);
    conn_ = nullptr;
    throw_sqlite_err("Unable to set busy timeout", sqlite_ret,
                     std::string_view{});
  }
  try {
    // Use exec here as db_initialise contains many statements.
    exec(db_initialise);
  } catch (const Store_error &e) {
    sqlite3_close_v2(conn_);
    conn_ = nullptr;
    throw;
  }
}

Profile_store::~Profile_store() {
  if (conn_) {
    sqlite3_close_v2(conn_);
  }
}

void Profile_store::exec(std::string_view sql) {
  char *sqlite_err = nullptr;
  int sqlite_ret;
  if ((sqlite_ret = sqlite3_exec(conn_, std::string{sql}.c_str(), nullptr,
                                 nullptr, &sqlite_err)) != SQLITE_OK) {
    std::string msg = sqlite_err ? sqlite_err : "sqlite3_exec failed";
    sqlite3_free(sqlite_err);
    throw_sqlite_err(msg, sqlite_ret, sql);
  }
}

int64_t Profile_store::save(const job_profile &profile) {
  exec("BEGIN;");
  try {
    std::optional<std::string> exclude;
    std::optional<std::string> include;
    if (profile.filter) {
      exclude = profile.filter->exclude_pattern;
      include = profile.filter->include_pattern;
    }
    std::optional<uint64_t> filtered_count;
    if (profile.filtered_process_count) {
      filtered_count = profile.filtered_process_count.value();
    }
    Sqlite_statement_manager(conn_, insert_job_stmt)
        .step(Run_cmd{profile.command}.print(), profile.command,
              profile.start_time, profile.end_time, profile.interval_ms,
              profile.max_total_rss_kib, uint64_t{profile.samples},
              profile.exit_code, exclude, include, filtered_count,
              profile.filtered_total_rss_kib);
    int64_t jobid = sqlite3_last_insert_rowid(conn_);

    auto proc_ssm = Sqlite_statement_manager(conn_, insert_process_stmt);
    for (const auto &proc : profile.processes) {
      proc_ssm.step(jobid, int32_t{proc.pid}, int32_t{proc.ppid}, proc.command,
                    proc.max_rss_kib, proc.peak_time, proc.first_seen,
                    proc.last_seen);
    }
    if (profile.timeline) {
      auto memprof_ssm = Sqlite_statement_manager(conn_, insert_memprof_data);
      for (const auto &point : profile.timeline.value()) {
        memprof_ssm.step(jobid, point.timestamp, point.elapsed_seconds,
                         point.total_rss_kib, uint64_t{point.process_count});
      }
    }
    exec("COMMIT;");
    return jobid;
  } catch (const Store_error &e) {
    char *sqlite_err = nullptr;
    if (sqlite3_exec(conn_, "ROLLBACK;", nullptr, nullptr, &sqlite_err) !=
        SQLITE_OK) {
      std::cerr << "Warning: rollback failed: "
                << (sqlite_err ? sqlite_err : "unknown error") << std::endl;
      sqlite3_free(sqlite_err);
    }
    throw;
  }
}

int64_t Profile_store::count_jobs() {
  return Sqlite_statement_manager(conn_, count_jobs_stmt).fetch_one<int64_t>();
}

std::map<int64_t, uint64_t> Profile_store::get_max_rss() {
  std::map<int64_t, uint64_t> out;
  auto ssm = Sqlite_statement_manager(conn_, get_max_rss_stmt);
  while (auto t = ssm.step<int64_t, uint64_t>()) {
    out[std::get<0>(t.value())] = std::get<1>(t.value());
  }
  return out;
}

Run_cmd Profile_store::get_command(int64_t jobid) {
  return Run_cmd{Sqlite_statement_manager(conn_, get_cmd_stmt)
                     .fetch_one<std::vector<std::string>>(jobid)};
}

std::vector<process_stats> Profile_store::get_processes(int64_t jobid) {
  std::vector<process_stats> out;
  auto ssm = Sqlite_statement_manager(conn_, get_processes_stmt);
  while (auto t = ssm.step<int32_t, int32_t, std::string, uint64_t, int64_t,
                           int64_t, int64_t>(jobid)) {
    auto &[pid, ppid, command, max_rss_kib, peak_time, first_seen,
           last_seen] = t.value();
    out.push_back({pid, ppid, command, max_rss_kib, peak_time, first_seen,
                   last_seen});
  }
  return out;
}

int64_t Profile_store::count_timeline_points(int64_t jobid) {
  return Sqlite_statement_manager(conn_, count_memprof_stmt)
      .fetch_one<int64_t>(jobid);
}

} // namespace memwatch
