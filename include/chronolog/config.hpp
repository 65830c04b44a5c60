#pragma once
#include "chronolog/time.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace chronolog {

class Repository; // fwd

// Key/value view over git's INI-style config files. Keys are canonicalized to
// "section.key" or "section.<subsection>.key" (section and key lowercased,
// subsection kept verbatim). Later files and later lines win.
class GitConfig {
public:
  // Missing files are ignored; unreadable or malformed ones throw.
  void load_file(const std::filesystem::path& path);
  void load_text(std::string_view text, std::string_view origin = "<text>");

  [[nodiscard]] std::optional<std::string> get(std::string_view key) const;

  // System, XDG, global and repository files, in that order.
  static GitConfig load_for(const Repository& repo);

private:
  std::map<std::string, std::string> values_;
};

enum class MergeFilter : std::uint8_t { Any, NoMerges, MergesOnly };

// Options accepted in changelog.opts / GIT_CHANGELOG_OPTS.
struct LogOptions {
  MergeFilter merges = MergeFilter::Any;
  bool first_parent = false;
  timeutil::DateMode date_mode = timeutil::DateMode::Default;
};

// Whitespace separated "--no-merges --merges --first-parent --date=<mode>".
// Anything else is a ConfigError.
LogOptions parse_log_options(std::string_view opts);

struct ChangelogSettings {
  std::string format;         // changelog.format
  std::string merge_format;   // changelog.mergeformat
  LogOptions log;             // changelog.opts
  std::string editor;         // core.editor (may be empty)
};

// Apply defaults, then config keys, then GIT_CHANGELOG_{FORMAT,MERGEFORMAT,OPTS}.
ChangelogSettings load_settings(const GitConfig& config);

} // namespace chronolog
