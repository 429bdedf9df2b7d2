#include "sqlite_statement_manager.hpp"

#include <cstdint>
#include <iostream>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>

#include "errors.hpp"

namespace memwatch {

void throw_sqlite_err(std::string_view msg, int ret, std::string_view stmt) {
  auto what = std::string(msg);
  if (!stmt.empty()) {
    what += fmt::format("\n{}", stmt);
  }
  what += fmt::format("\n{}: {}", ret, sqlite3_errstr(ret));
  throw Store_error(what);
}

void throw_sqlite_err(std::string_view msg, int ret, sqlite3_stmt *stmt) {
  std::string sql;
  if (stmt) {
    auto expanded = sqlite3_expanded_sql(stmt);
    if (expanded) {
      sql = expanded;
      sqlite3_free(expanded);
    }
  }
  throw_sqlite_err(msg, ret, std::string_view{sql});
}

Sqlite_statement_manager::Sqlite_statement_manager(sqlite3 *conn,
                                                   std::string_view sql)
    : sqlite_ret_(SQLITE_OK), stmt_(nullptr), conn_(conn) {
  if ((sqlite_ret_ = sqlite3_prepare_v2(conn_, sql.data(),
                                        static_cast<int>(sql.length()), &stmt_,
                                        nullptr)) != SQLITE_OK) {
    throw_sqlite_err("Could not prepare the following sql statement:",
                     sqlite_ret_, sql);
  }
}

Sqlite_statement_manager::~Sqlite_statement_manager() {
  // sqlite3_finalize repeats the error of the last failed step, which has
  // already been reported
  sqlite3_finalize(stmt_);
}

void Sqlite_statement_manager::reset() {
  if ((sqlite_ret_ = sqlite3_reset(stmt_)) != SQLITE_OK) {
    throw_sqlite_err("SQLite reset failed:", sqlite_ret_, stmt_);
  }
}

/*
Output param specialisations
*/

template <>
void Sqlite_statement_manager::bind_param<sql_param_out>(int param_idx,
                                                         int32_t &val) {
  val = sqlite3_column_int(stmt_, param_idx);
}

template <>
void Sqlite_statement_manager::bind_param<sql_param_out>(int param_idx,
                                                         uint32_t &val) {
  val = static_cast<uint32_t>(sqlite3_column_int(stmt_, param_idx));
}

template <>
void Sqlite_statement_manager::bind_param<sql_param_out>(int param_idx,
                                                         int64_t &val) {
  val = sqlite3_column_int64(stmt_, param_idx);
}

template <>
void Sqlite_statement_manager::bind_param<sql_param_out>(int param_idx,
                                                         uint64_t &val) {
  val = static_cast<uint64_t>(sqlite3_column_int64(stmt_, param_idx));
}

template <>
void Sqlite_statement_manager::bind_param<sql_param_out>(int param_idx,
                                                         double &val) {
  val = sqlite3_column_double(stmt_, param_idx);
}

template <>
void Sqlite_statement_manager::bind_param<sql_param_out>(int param_idx,
                                                         std::string &val) {
  auto tmp = sqlite3_column_text(stmt_, param_idx);
  val = tmp ? reinterpret_cast<const char *>(tmp) : "";
}

template <>
void Sqlite_statement_manager::bind_param<sql_param_out>(
    int param_idx, std::optional<int32_t> &val) {
  val.reset();
  if (sqlite3_column_type(stmt_, param_idx) != SQLITE_NULL) {
    val.emplace(sqlite3_column_int(stmt_, param_idx));
  }
}

template <>
void Sqlite_statement_manager::bind_param<sql_param_out>(
    int param_idx, std::optional<std::string> &val) {
  val.reset();
  if (sqlite3_column_type(stmt_, param_idx) != SQLITE_NULL) {
    val.emplace(
        reinterpret_cast<const char *>(sqlite3_column_text(stmt_, param_idx)));
  }
}

template <>
void Sqlite_statement_manager::bind_param<sql_param_out>(
    int param_idx, std::vector<std::string> &val) {
  // '\0' terminated arguments, see the matching input specialisation
  val.clear();
  auto blob = static_cast<const char *>(sqlite3_column_blob(stmt_, param_idx));
  auto nbytes = static_cast<size_t>(sqlite3_column_bytes(stmt_, param_idx));
  if (blob == nullptr) {
    return;
  }
  std::string raw(blob, nbytes);
  auto start = 0ul;
  auto end = raw.find('\0');
  while (end != std::string::npos) {
    val.emplace_back(raw.substr(start, end - start));
    start = end + 1;
    end = raw.find('\0', start);
  }
}

/*
Input param specialisations
*/
template <>
void Sqlite_statement_manager::bind_param<sql_param_in>(int param_idx,
                                                        std::string &val) {
  if ((sqlite_ret_ = sqlite3_bind_text(stmt_, param_idx, val.c_str(), -1,
                                       SQLITE_TRANSIENT)) != SQLITE_OK) {
    throw_sqlite_err("Unable bind string in statement", sqlite_ret_, stmt_);
  }
}

template <>
void Sqlite_statement_manager::bind_param<sql_param_in>(int param_idx,
                                                        int32_t &val) {
  if ((sqlite_ret_ = sqlite3_bind_int(stmt_, param_idx, val)) != SQLITE_OK) {
    throw_sqlite_err("Unable bind int in statement", sqlite_ret_, stmt_);
  }
}

template <>
void Sqlite_statement_manager::bind_param<sql_param_in>(int param_idx,
                                                        int64_t &val) {
  if ((sqlite_ret_ = sqlite3_bind_int64(stmt_, param_idx, val)) != SQLITE_OK) {
    throw_sqlite_err("Unable bind int in statement", sqlite_ret_, stmt_);
  }
}

template <>
void Sqlite_statement_manager::bind_param<sql_param_in>(int param_idx,
                                                        uint64_t &val) {
  if ((sqlite_ret_ = sqlite3_bind_int64(stmt_, param_idx,
                                        static_cast<sqlite3_int64>(val))) !=
      SQLITE_OK) {
    throw_sqlite_err("Unable bind int in statement", sqlite_ret_, stmt_);
  }
}

template <>
void Sqlite_statement_manager::bind_param<sql_param_in>(int param_idx,
                                                        double &val) {
  if ((sqlite_ret_ = sqlite3_bind_double(stmt_, param_idx, val)) !=
      SQLITE_OK) {
    throw_sqlite_err("Unable bind double in statement", sqlite_ret_, stmt_);
  }
}

template <>
void Sqlite_statement_manager::bind_param<sql_param_in>(
    int param_idx, std::optional<int32_t> &val) {
  if (!val) {
    sqlite_ret_ = sqlite3_bind_null(stmt_, param_idx);
  } else {
    sqlite_ret_ = sqlite3_bind_int(stmt_, param_idx, val.value());
  }
  if (sqlite_ret_ != SQLITE_OK) {
    throw_sqlite_err("Unable bind optional int in statement", sqlite_ret_,
                     stmt_);
  }
}

template <>
void Sqlite_statement_manager::bind_param<sql_param_in>(
    int param_idx, std::optional<uint64_t> &val) {
  if (!val) {
    sqlite_ret_ = sqlite3_bind_null(stmt_, param_idx);
  } else {
    sqlite_ret_ = sqlite3_bind_int64(stmt_, param_idx,
                                     static_cast<sqlite3_int64>(val.value()));
  }
  if (sqlite_ret_ != SQLITE_OK) {
    throw_sqlite_err("Unable bind optional int in statement", sqlite_ret_,
                     stmt_);
  }
}

template <>
void Sqlite_statement_manager::bind_param<sql_param_in>(
    int param_idx, std::optional<std::string> &val) {
  if (!val) {
    sqlite_ret_ = sqlite3_bind_null(stmt_, param_idx);
  } else {
    sqlite_ret_ = sqlite3_bind_text(stmt_, param_idx, val->c_str(), -1,
                                    SQLITE_TRANSIENT);
  }
  if (sqlite_ret_ != SQLITE_OK) {
    throw_sqlite_err("Unable bind optional string in statement", sqlite_ret_,
                     stmt_);
  }
}

template <>
void Sqlite_statement_manager::bind_param<sql_param_in>(
    int param_idx, std::vector<std::string> &val) {
  std::string tmp;
  for (const auto &i : val) {
    tmp += i;
    tmp += '\0';
  }
  if ((sqlite_ret_ = sqlite3_bind_blob(stmt_, param_idx, tmp.data(),
                                       static_cast<int>(tmp.size()),
                                       SQLITE_TRANSIENT)) != SQLITE_OK) {
    throw_sqlite_err("Unable bind raw command", sqlite_ret_, stmt_);
  }
}

} // namespace memwatch
