#pragma once

#include <stdexcept>

namespace memwatch {

// Command could not be started
class Spawn_error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// The process table as a whole could not be read
class Inspection_error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class Invalid_pattern_error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Time series export requested for a profile taken without tracking
class Timeline_not_tracked_error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class Store_error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

} // namespace memwatch
