#pragma once
#include <string>
#include <vector>

namespace memwatch {
class Run_cmd {
public:
  Run_cmd(char *cmdline[], int start, int end);
  Run_cmd(std::vector<std::string> argv);
  Run_cmd(const Run_cmd &other);
  Run_cmd &operator=(const Run_cmd &) = delete;
  std::vector<std::string> get() const;
  std::string print() const;
  bool empty() const { return proc_to_run_.empty(); }
  const char *get_argv_0();
  char **get_argv();

private:
  std::vector<std::string> proc_to_run_;
  std::vector<char *> argv_holder_;
};
} // namespace memwatch
