#pragma once

#include <ostream>
#include <string>

#include <nlohmann/json.hpp>

#include "mem_types.hpp"

namespace memwatch {

void print_summary(const job_profile &profile, std::ostream &out);
nlohmann::json profile_to_json(const job_profile &profile);
void print_json(const job_profile &profile, std::ostream &out);
std::string truncate_command(const std::string &cmd, std::size_t max_len);

} // namespace memwatch
