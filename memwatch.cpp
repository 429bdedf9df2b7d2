#include <cstdlib>
#include <exception>

#include <fmt/core.h>

#include "functions.hpp"
#include "profiler.hpp"

int main(int argc, char *argv[]) {
  try {
    return memwatch::parse_args(argc, argv);
  } catch (const std::exception &e) {
    memwatch::die_with_err(fmt::format("Error: {}", e.what()), -1);
  }
  return EXIT_FAILURE;
}
