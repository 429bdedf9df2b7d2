#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace memwatch {

// Typed option store. Every bool and int option must be seeded by the
// derived class; string options may be left unset.
class Generic_config {
public:
  Generic_config();
  int32_t get_int(const std::string &key) const;
  bool get_bool(const std::string &key) const;
  std::string get_string(const std::string &key) const;
  std::optional<std::string> find_string(const std::string &key) const;
  void set_int(const std::string &key, int32_t val);
  void set_string(const std::string &key, std::string val);
  void set_bool(const std::string &key, bool val);

protected:
  std::map<std::string, bool> bool_vars{};
  std::map<std::string, std::int32_t> int_vars{};
  std::map<std::string, std::string> str_vars{};
};

} // namespace memwatch
