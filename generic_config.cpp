#include "generic_config.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace memwatch {

namespace {
template <typename T>
const T &lookup(const std::map<std::string, T> &vars, const std::string &key) {
  auto it = vars.find(key);
  if (it == vars.end()) {
    throw std::out_of_range("Unknown configuration option '" + key + "'");
  }
  return it->second;
}
} // namespace

Generic_config::Generic_config() {};

int32_t Generic_config::get_int(const std::string &key) const {
  return lookup(int_vars, key);
}

bool Generic_config::get_bool(const std::string &key) const {
  return lookup(bool_vars, key);
}

std::string Generic_config::get_string(const std::string &key) const {
  return lookup(str_vars, key);
}

std::optional<std::string>
Generic_config::find_string(const std::string &key) const {
  auto it = str_vars.find(key);
  if (it == str_vars.end()) {
    return std::nullopt;
  }
  return it->second;
}

void Generic_config::set_int(const std::string &key, int32_t val) {
  int_vars[key] = val;
}

void Generic_config::set_string(const std::string &key, std::string val) {
  str_vars[key] = std::move(val);
}

void Generic_config::set_bool(const std::string &key, bool val) {
  bool_vars[key] = val;
}

} // namespace memwatch
