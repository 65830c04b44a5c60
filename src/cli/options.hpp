#pragma once
#include "chronolog/consts.hpp"

#include <optional>
#include <string>
#include <vector>

namespace chronolog::cli {

struct Options {
  bool all = false;          // -a
  bool list = false;         // -l
  bool no_merges = false;    // -n
  bool merges_only = false;  // -m
  bool prune_old = false;    // -p
  bool to_stdout = false;    // -x
  bool help = false;         // -h
  std::string untagged_title = std::string(consts::kDefaultUntaggedTitle);
  std::optional<std::string> final_tag;
  std::optional<std::string> start_tag;
  std::optional<std::string> start_commit;
  std::optional<std::string> file;
};

// Parse everything after the program name. Long options take "--opt value" or
// "--opt=value"; short flags may be bundled ("-lx", "-tv2.0").
// Unknown or conflicting options throw ConfigError.
Options parse_options(const std::vector<std::string>& args);

std::string usage();

} // namespace chronolog::cli
