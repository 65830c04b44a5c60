#include "cli/command.hpp"

#include "chronolog/cancel.hpp"
#include "chronolog/changelog.hpp"
#include "chronolog/commit_fetcher.hpp"
#include "chronolog/error.hpp"
#include "chronolog/fs.hpp"
#include "chronolog/range_selector.hpp"
#include "chronolog/repo.hpp"
#include "chronolog/tag_index.hpp"
#include "chronolog/time.hpp"
#include "chronolog/util.hpp"
#include "cli/editor.hpp"

#include <algorithm>
#include <ctime>
#include <iostream>
#include <utility>
#include <vector>

#include <unistd.h>

namespace chronolog::cli {

std::filesystem::path find_changelog_file(const std::filesystem::path &root) {
  std::vector<std::filesystem::path> candidates;
  std::error_code ec;
  for (const auto &entry : std::filesystem::directory_iterator(root, ec)) {
    if (!entry.is_regular_file(ec))
      continue;
    const std::string name = strutil::to_lower(entry.path().filename().string());
    if (name.find("change") != std::string::npos || name.find("history") != std::string::npos)
      candidates.push_back(entry.path());
  }
  if (candidates.empty())
    return root / consts::kDefaultChangelogFile;
  return *std::ranges::min_element(candidates);
}

std::string generate(const Repository &repo, const Options &opts,
                     const ChangelogSettings &settings, const std::optional<std::string> &prior,
                     const std::string &today, const CancellationToken *cancel) {
  const TagIndex index = TagIndex::build(collect_decorations(repo));

  ResolvedBounds bounds;
  if (!opts.all && !index.empty()) {
    std::optional<std::string> start_tag = opts.start_tag;
    // with no bounds at all, show the unreleased commits and the latest release
    if (!start_tag && !opts.start_commit && !opts.final_tag)
      start_tag = index[0].name;
    BoundsRequest request{.start = start_bound(start_tag, opts.start_commit)};
    if (opts.final_tag)
      request.final = TagName{*opts.final_tag};
    bounds = resolve_bounds(repo, index, request);
  }

  LogSettings log{
      .format = settings.format,
      .merge_format = settings.merge_format,
      .merges = settings.log.merges,
      .date_mode = settings.log.date_mode,
      .first_parent = settings.log.first_parent,
  };
  if (opts.no_merges)
    log.merges = MergeFilter::NoMerges;
  if (opts.merges_only)
    log.merges = MergeFilter::MergesOnly;

  RepoCommitFetcher fetcher(repo, std::move(log));
  RangeSelector selector(index, std::move(bounds),
                         SelectorOptions{.list_all = opts.all,
                                         .untagged_title = opts.untagged_title,
                                         .today = today});
  ChangelogAssembler assembler(fetcher, opts.list ? RenderMode::Plain : RenderMode::Titled,
                               cancel);
  return assembler.assemble(selector, prior);
}

int cmd_changelog(int argc, char **argv) {
  try {
    const Options opts = parse_options(std::vector<std::string>(argv + 1, argv + argc));
    if (opts.help) {
      std::cerr << usage();
      return 1;
    }

    const Repository repo = Repository::discover(std::filesystem::current_path());
    const ChangelogSettings settings = load_settings(GitConfig::load_for(repo));
    const std::filesystem::path file =
        opts.file ? std::filesystem::path(*opts.file) : find_changelog_file(repo.root());

    std::optional<std::string> prior;
    if (!opts.prune_old && fs::is_regular(file))
      prior = fs::read_text(file);

    CancellationToken token;
    const SignalCancellation on_signals(token);

    const std::string out =
        generate(repo, opts, settings, prior, timeutil::local_date(std::time(nullptr)), &token);

    if (opts.to_stdout) {
      std::cout << out;
      return 0;
    }
    fs::write_text_atomic(file, out);

    if (isatty(STDIN_FILENO) != 0 && isatty(STDOUT_FILENO) != 0) {
      const int status = launch_editor(pick_editor(settings.editor), file);
      if (status != 0)
        std::cerr << "changelog: warning: editor exited with status " << status << "\n";
    }
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "changelog: " << e.what() << "\n";
    return 1;
  }
}

} // namespace chronolog::cli
