#pragma once
#include <stdexcept>

namespace chronolog {

// Bad or conflicting user input: unknown tag or commit, mutually exclusive
// flags, unsupported log options. Always raised before any output is produced.
class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// The run was interrupted; nothing has been written.
class Cancelled : public std::runtime_error {
public:
  Cancelled() : std::runtime_error("interrupted") {}
};

} // namespace chronolog
