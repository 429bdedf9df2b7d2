#pragma once

#include <string_view>

namespace memwatch {
constexpr std::string_view help{
    "  == memwatch: job-level memory profiler == \n"
    " Runs COMMAND, follows every process it spawns, and reports the peak\n"
    " resident memory (RSS) of each process and of the whole job. The\n"
    " process table is sampled once straight after launch, every INTERVAL\n"
    " milliseconds while the command runs, and once more when it exits.\n\n"
    "Usage: {} [OPTION]... [--] COMMAND [ARG]...\n\n"
    "Sampling Options:\n"
    "  -i, --interval=MS      Sampling interval in milliseconds (default "
    "500)\n"
    "      --inspector=KIND   Process table source: proc, ps or auto "
    "(default)\n\n"
    "Filtering Options:\n"
    "  -x, --exclude=REGEX    Drop processes whose command matches REGEX\n"
    "  -n, --include=REGEX    Keep only processes whose command matches "
    "REGEX\n\n"
    "Output Options:\n"
    "  -j, --json             Print the profile as JSON\n"
    "  -q, --quiet            Do not print the human-readable summary\n"
    "  -c, --csv=PATH         Write per-process peaks to a CSV file\n"
    "  -t, --timeline=PATH    Track total RSS over time and write it to a "
    "CSV file\n"
    "  -d, --db[=PATH]        Append the profile to an sqlite3 database\n"
    "      --db-path          Output the default path of the database\n\n"
    "Other Options:\n"
    "  -v, --verbose          Report every sample on stderr\n"
    "  -V, --version          Output version information and exit\n"
    "  -h, --help             Display this help and exit\n"};
} // namespace memwatch
