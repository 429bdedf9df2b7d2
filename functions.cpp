#include "functions.hpp"

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>

#include <fmt/core.h>

namespace memwatch {

constexpr double kib_per_mib = 1024.0;
constexpr double kib_per_gib = 1024.0 * 1024.0;

const std::filesystem::path get_tmp() {
  auto tmp = std::getenv("TMPDIR");
  if (tmp != nullptr) {
    return std::filesystem::path{tmp};
  }
  return std::filesystem::path{"/tmp"};
};

void die_with_err(std::string_view msg, int status) {
  std::cerr << msg << std::endl;
  std::cerr << "stat=" << status << std::endl;
  std::exit(EXIT_FAILURE);
};

int64_t now() {
  return std::chrono::duration_cast<std::chrono::microseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::string format_hh_mm_ss(int64_t us_duration) {
  auto hh = us_duration / 3600000000ll;
  auto mm = (us_duration / 60000000ll) % 60ll;
  auto ss = (us_duration / 1000000ll) % 60ll;
  auto us = (us_duration % 1000000ll) / 1000ll;

  if (us_duration > 3599999999ll) {
    return fmt::format("{}:{:02}:{:02}.{:03}", hh, mm, ss, us);
  } else if (us_duration > 59999999ll) {
    return fmt::format("{}:{:02}.{:03}", mm, ss, us);
  } else if (us_duration > 999999ll) {
    return fmt::format("{}.{:03}", ss, us);
  } else {
    return fmt::format("0.{:03}", us);
  }
}

std::string format_duration(double seconds) {
  auto total = seconds > 0.0 ? static_cast<uint64_t>(seconds) : 0ull;
  return fmt::format("{:02}:{:02}:{:02}", total / 3600, (total % 3600) / 60,
                     total % 60);
}

std::string format_memory(uint64_t kib) {
  auto kib_d = static_cast<double>(kib);
  if (kib_d >= kib_per_gib) {
    return fmt::format("{:.1f} GiB", kib_d / kib_per_gib);
  } else if (kib_d >= kib_per_mib) {
    return fmt::format("{:.1f} MiB", kib_d / kib_per_mib);
  }
  return fmt::format("{} KiB", kib);
}

std::string format_timestamp(int64_t us_since_epoch) {
  // RFC 3339, UTC, microsecond precision
  auto secs = static_cast<std::time_t>(us_since_epoch / 1000000ll);
  auto us = us_since_epoch % 1000000ll;
  if (us < 0) {
    secs -= 1;
    us += 1000000ll;
  }
  std::tm tm{};
  gmtime_r(&secs, &tm);
  return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:06}Z",
                     tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                     tm.tm_min, tm.tm_sec, us);
}

std::string to_valid_utf8(const std::string &raw) {
  constexpr std::string_view replacement{"\xEF\xBF\xBD"};
  std::string out;
  out.reserve(raw.size());
  std::size_t i = 0;
  while (i < raw.size()) {
    auto lead = static_cast<unsigned char>(raw[i]);
    if (lead < 0x80) {
      out += raw[i++];
      continue;
    }
    // Length of the sequence and the allowed range of its second byte
    std::size_t len = 0;
    unsigned char lo = 0x80, hi = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
      len = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
      len = 3;
      if (lead == 0xE0) {
        lo = 0xA0;
      } else if (lead == 0xED) {
        hi = 0x9F;
      }
    } else if (lead >= 0xF0 && lead <= 0xF4) {
      len = 4;
      if (lead == 0xF0) {
        lo = 0x90;
      } else if (lead == 0xF4) {
        hi = 0x8F;
      }
    }
    if (len == 0) {
      out += replacement;
      i++;
      continue;
    }
    // A truncated or broken sequence is replaced once, up to the bad byte
    std::size_t valid = 1;
    while (valid < len && i + valid < raw.size()) {
      auto c = static_cast<unsigned char>(raw[i + valid]);
      auto min = valid == 1 ? lo : static_cast<unsigned char>(0x80);
      auto max = valid == 1 ? hi : static_cast<unsigned char>(0xBF);
      if (c < min || c > max) {
        break;
      }
      valid++;
    }
    if (valid == len) {
      out.append(raw, i, len);
    } else {
      out += replacement;
    }
    i += valid;
  }
  return out;
}

} // namespace memwatch
