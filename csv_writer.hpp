#pragma once

#include <filesystem>
#include <ostream>
#include <string>

#include "mem_types.hpp"

namespace memwatch {

std::string escape_csv(const std::string &field);
void write_process_csv(const job_profile &profile, std::ostream &out);
// Throws Timeline_not_tracked_error if the profile carries no timeline
void write_timeline_csv(const job_profile &profile, std::ostream &out);
void export_process_csv(const job_profile &profile,
                        const std::filesystem::path &path);
void export_timeline_csv(const job_profile &profile,
                         const std::filesystem::path &path);

} // namespace memwatch
