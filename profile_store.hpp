#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <sqlite3.h>
#include <string_view>
#include <vector>

#include "mem_types.hpp"
#include "run_cmd.hpp"

namespace memwatch {

constexpr std::string_view db_name("memwatch_db.sqlite3");
constexpr std::string_view db_initialise(
    // Ensure foreign keys are respected
    "PRAGMA foreign_keys = ON;"
    // Create job table
    "CREATE TABLE IF NOT EXISTS jobs (id INTEGER PRIMARY KEY AUTOINCREMENT, "
    "command TEXT, command_raw BLOB, start_time INTEGER, end_time INTEGER, "
    "interval_ms INTEGER, max_total_rss_kib INTEGER, samples INTEGER, "
    "exit_status INTEGER, exclude_pattern TEXT, include_pattern TEXT, "
    "filtered_count INTEGER, filtered_rss_kib INTEGER);"
    // Create per-process peak table
    "CREATE TABLE IF NOT EXISTS processes (jobid INTEGER NOT NULL, pid "
    "INTEGER, ppid INTEGER, command TEXT, max_rss_kib INTEGER, peak_time "
    "INTEGER, first_seen INTEGER, last_seen INTEGER, FOREIGN KEY(jobid) "
    "REFERENCES jobs(id) ON DELETE CASCADE);"
    // Create memprof (timeline) table
    "CREATE TABLE IF NOT EXISTS memprof (jobid INTEGER NOT NULL, time "
    "INTEGER, elapsed REAL, total_rss_kib INTEGER, process_count INTEGER, "
    "FOREIGN KEY(jobid) REFERENCES jobs(id) ON DELETE CASCADE);");

constexpr std::string_view insert_job_stmt(
    "INSERT INTO jobs(command,command_raw,start_time,end_time,interval_ms,"
    "max_total_rss_kib,samples,exit_status,exclude_pattern,include_pattern,"
    "filtered_count,filtered_rss_kib) VALUES (?,?,?,?,?,?,?,?,?,?,?,?);");

constexpr std::string_view insert_process_stmt(
    "INSERT INTO processes(jobid,pid,ppid,command,max_rss_kib,peak_time,"
    "first_seen,last_seen) VALUES (?,?,?,?,?,?,?,?);");

constexpr std::string_view insert_memprof_data(
    "INSERT INTO memprof(jobid,time,elapsed,total_rss_kib,process_count) "
    "VALUES (?,?,?,?,?);");

constexpr std::string_view count_jobs_stmt("SELECT COUNT(*) FROM jobs;");

constexpr std::string_view
    get_max_rss_stmt("SELECT id,max_total_rss_kib FROM jobs;");

constexpr std::string_view
    get_cmd_stmt("SELECT command_raw FROM jobs WHERE id = ?;");

constexpr std::string_view get_processes_stmt(
    "SELECT pid,ppid,command,max_rss_kib,peak_time,first_seen,last_seen FROM "
    "processes WHERE jobid = ? ORDER BY max_rss_kib DESC, pid ASC;");

constexpr std::string_view
    count_memprof_stmt("SELECT COUNT(*) FROM memprof WHERE jobid = ?;");

// Appends finished profiles to an SQLite database
class Profile_store {
public:
  Profile_store(std::filesystem::path db_path);
  Profile_store(const Profile_store &) = delete;
  Profile_store &operator=(const Profile_store &) = delete;
  ~Profile_store();
  int64_t save(const job_profile &profile);
  int64_t count_jobs();
  std::map<int64_t, uint64_t> get_max_rss();
  Run_cmd get_command(int64_t jobid);
  std::vector<process_stats> get_processes(int64_t jobid);
  int64_t count_timeline_points(int64_t jobid);

private:
  sqlite3 *conn_ = nullptr;
  void exec(std::string_view sql);
};

} // namespace memwatch
