#include "profiler.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#include <getopt.h>

#include <fmt/core.h>

#include "csv_writer.hpp"
#include "functions.hpp"
#include "help.hpp"
#include "process_inspector.hpp"
#include "profile_store.hpp"
#include "report_writing.hpp"
#include "run_cmd.hpp"
#include "sampler.hpp"

#ifndef MEMWATCH_VERSION
#define MEMWATCH_VERSION "unknown"
#endif

namespace memwatch {

static struct option long_options[] = {
    {"interval", required_argument, nullptr, 'i'},
    {"json", no_argument, nullptr, 'j'},
    {"quiet", no_argument, nullptr, 'q'},
    {"csv", required_argument, nullptr, 'c'},
    {"timeline", required_argument, nullptr, 't'},
    {"db", optional_argument, nullptr, 'd'},
    {"db-path", no_argument, nullptr, 0},
    {"exclude", required_argument, nullptr, 'x'},
    {"include", required_argument, nullptr, 'n'},
    {"inspector", required_argument, nullptr, 0},
    {"verbose", no_argument, nullptr, 'v'},
    {"version", no_argument, nullptr, 'V'},
    {"help", no_argument, nullptr, 'h'},
    {nullptr, 0, nullptr, 0}};

Profiler_config::Profiler_config() {
  bool_vars = {{"verbose", false}, {"json", false}, {"quiet", false}};
  int_vars = {{"interval_ms", 500}};
  str_vars = {{"inspector", "auto"}};
}

int do_profile(Profiler_config conf, int argc, int optind, char *argv[]) {

  if (optind == argc) {
    std::cerr << fmt::format(fmt::runtime(help), argv[0]) << std::endl;
    die_with_err(
        "ERROR! Requested to run a command, but no command specified", -1);
  }
  if (conf.get_int("interval_ms") <= 0) {
    die_with_err("ERROR! Sampling interval must be a positive number of "
                 "milliseconds",
                 conf.get_int("interval_ms"));
  }

  auto cmd = Run_cmd{argv, optind, argc};
  auto csv_path = conf.find_string("csv_path");
  auto timeline_path = conf.find_string("timeline_path");
  auto db_path = conf.find_string("db_path");

  auto opts = sampler_options{};
  opts.interval_ms = static_cast<uint64_t>(conf.get_int("interval_ms"));
  opts.track_timeline = timeline_path.has_value();
  opts.verbose = conf.get_bool("verbose");
  opts.filter.exclude_pattern = conf.find_string("exclude_pattern");
  opts.filter.include_pattern = conf.find_string("include_pattern");

  auto inspector = make_inspector(conf.get_string("inspector"));
  auto sampler = Sampler{*inspector, opts};
  auto profile = sampler.run(cmd);

  auto chatty = !conf.get_bool("quiet") && !conf.get_bool("json");
  if (conf.get_bool("json")) {
    print_json(profile, std::cout);
  } else if (!conf.get_bool("quiet")) {
    print_summary(profile, std::cout);
  }

  if (csv_path) {
    export_process_csv(profile, csv_path.value());
    if (chatty) {
      std::cerr << "Per-process CSV exported to: " << csv_path.value()
                << std::endl;
    }
  }
  if (timeline_path) {
    export_timeline_csv(profile, timeline_path.value());
    if (chatty) {
      std::cerr << "Timeline CSV exported to: " << timeline_path.value()
                << std::endl;
    }
  }
  if (db_path) {
    auto store = Profile_store{db_path.value()};
    auto jobid = store.save(profile);
    if (chatty) {
      std::cerr << "Profile stored as job " << jobid << " in "
                << db_path.value() << std::endl;
    }
  }
  return EXIT_SUCCESS;
}

std::optional<int32_t> parse_interval(const char *arg) {
  char *end = nullptr;
  errno = 0;
  auto val = std::strtoll(arg, &end, 10);
  if (end == arg || *end != '\0' || errno == ERANGE || val <= 0 ||
      val > INT32_MAX) {
    return std::nullopt;
  }
  return static_cast<int32_t>(val);
}

int parse_args(int argc, char *argv[]) {

  auto conf = Profiler_config();

  // Restart the scan, parse_args may be called more than once per process
  optind = 0;
  opterr = 0;
  int c;
  int option_index;
  // '+' stops option parsing at the first word of COMMAND
  while ((c = getopt_long(argc, argv, "+i:jqc:t:d::x:n:vVh", long_options,
                          &option_index)) != -1) {
    switch (c) {
    case 'i': {
      auto interval = parse_interval(optarg);
      if (!interval) {
        std::cerr << "Invalid sampling interval '" << optarg
                  << "': must be a positive number of milliseconds"
                  << std::endl;
        std::cerr << fmt::format(fmt::runtime(help), argv[0]) << std::endl;
        return EXIT_FAILURE;
      }
      conf.set_int("interval_ms", interval.value());
      break;
    }
    case 'j':
      conf.set_bool("json", true);
      break;
    case 'q':
      conf.set_bool("quiet", true);
      break;
    case 'c':
      conf.set_string("csv_path", {optarg});
      break;
    case 't':
      conf.set_string("timeline_path", {optarg});
      break;
    case 'd':
      if (optarg != nullptr) {
        conf.set_string("db_path", {optarg});
      } else {
        conf.set_string("db_path", (get_tmp() / db_name).string());
      }
      break;
    case 'x':
      conf.set_string("exclude_pattern", {optarg});
      break;
    case 'n':
      conf.set_string("include_pattern", {optarg});
      break;
    case 'v':
      conf.set_bool("verbose", true);
      break;
    case 'V':
      std::cout << "memwatch " << MEMWATCH_VERSION << std::endl;
      return EXIT_SUCCESS;
    case 'h':
      std::cout << fmt::format(fmt::runtime(help), argv[0]) << std::endl;
      return EXIT_SUCCESS;
    case 0:
      if (std::string{"db-path"} == long_options[option_index].name) {
        std::cout << (get_tmp() / db_name).string() << std::endl;
        return EXIT_SUCCESS;
      }
      if (std::string{"inspector"} == long_options[option_index].name) {
        conf.set_string("inspector", {optarg});
      }
      break;
    case '?':
    default:
      std::cerr << "Unknown option or missing argument: " << argv[optind - 1]
                << std::endl;
      std::cerr << fmt::format(fmt::runtime(help), argv[0]) << std::endl;
      return EXIT_FAILURE;
    }
  };
  return do_profile(conf, argc, optind, argv);
}

} // namespace memwatch
