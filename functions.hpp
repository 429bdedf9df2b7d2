#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace memwatch {

const std::filesystem::path get_tmp();
void die_with_err(std::string_view msg, int status);
int64_t now();
std::string format_hh_mm_ss(int64_t us_duration);
std::string format_duration(double seconds);
std::string format_memory(uint64_t kib);
std::string format_timestamp(int64_t us_since_epoch);
// Replaces each invalid UTF-8 sequence with U+FFFD
std::string to_valid_utf8(const std::string &raw);

} // namespace memwatch
