#include "process_inspector.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "linux_proc_tools.hpp"
#include "ps_inspector.hpp"

namespace memwatch {

std::unique_ptr<Process_inspector> make_inspector(const std::string &kind) {
  if (kind == "proc") {
    return std::make_unique<Proc_inspector>();
  }
  if (kind == "ps") {
    return std::make_unique<Ps_inspector>();
  }
  if (kind == "auto" || kind.empty()) {
// /proc only carries the fields we need on linux
#ifdef __linux__
    return std::make_unique<Proc_inspector>();
#else
    return std::make_unique<Ps_inspector>();
#endif
  }
  throw std::invalid_argument("Unknown process inspector: " + kind);
}

} // namespace memwatch
