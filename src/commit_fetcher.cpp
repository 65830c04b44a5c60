#include "chronolog/commit_fetcher.hpp"

#include "chronolog/pretty.hpp"
#include "chronolog/repo.hpp"
#include "chronolog/revwalk.hpp"
#include "chronolog/util.hpp"

#include <utility>

namespace chronolog {

RepoCommitFetcher::RepoCommitFetcher(const Repository &repo, LogSettings settings)
    : repo_(repo), settings_(std::move(settings)) {}

std::vector<std::string> RepoCommitFetcher::fetch(const RangeExpression &range) {
  const RevWalk walk(repo_);
  const auto ids = walk.commits(range, WalkOptions{.merges = settings_.merges,
                                                   .first_parent = settings_.first_parent});
  const std::string &format =
      settings_.merges == MergeFilter::MergesOnly ? settings_.merge_format : settings_.format;

  std::vector<std::string> lines;
  for (const auto &id : ids) {
    auto text = pretty::format_commit(format, id, repo_.read_commit(id), settings_.date_mode);
    auto commit_lines = strutil::split_lines(text);
    while (!commit_lines.empty() && strutil::trim(commit_lines.back()).empty())
      commit_lines.pop_back();
    for (auto &line : commit_lines)
      lines.push_back(std::move(line));
  }
  return lines;
}

} // namespace chronolog
