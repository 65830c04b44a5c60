#pragma once
#include "chronolog/config.hpp"
#include "cli/options.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace chronolog {
class CancellationToken;
class Repository;
} // namespace chronolog

namespace chronolog::cli {

// First regular file in `root` (sorted by name) whose name contains "change" or
// "history", ignoring case; History.md when there is none.
std::filesystem::path find_changelog_file(const std::filesystem::path& root);

// Build the complete changelog text. Every bound is resolved before the first
// section is fetched, so a bad tag or commit throws before anything is produced.
std::string generate(const Repository& repo, const Options& opts,
                     const ChangelogSettings& settings,
                     const std::optional<std::string>& prior, const std::string& today,
                     const CancellationToken* cancel = nullptr);

// git-changelog entry point; returns the process exit status.
int cmd_changelog(int argc, char** argv);

} // namespace chronolog::cli
