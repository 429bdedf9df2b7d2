#pragma once

#include <cstdint>
#include <optional>

#include "generic_config.hpp"

namespace memwatch {

class Profiler_config : public Generic_config {
public:
  Profiler_config();
};

int do_profile(Profiler_config conf, int argc, int optind, char *argv[]);
// Positive millisecond count, or nothing if arg is not one
std::optional<int32_t> parse_interval(const char *arg);
// Parses the command line and runs the profile; returns the exit status
int parse_args(int argc, char *argv[]);

} // namespace memwatch
