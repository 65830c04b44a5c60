#pragma once
#include "chronolog/config.hpp"
#include "chronolog/range.hpp"
#include "chronolog/time.hpp"

#include <string>
#include <vector>

namespace chronolog {

class Repository; // fwd

// Source of formatted commit lines for one range. Lines are opaque to callers.
class CommitFetcher {
public:
  virtual ~CommitFetcher() = default;
  virtual std::vector<std::string> fetch(const RangeExpression& range) = 0;
};

struct LogSettings {
  std::string format;
  std::string merge_format;     // used instead of `format` when listing merges only
  MergeFilter merges = MergeFilter::Any;
  timeutil::DateMode date_mode = timeutil::DateMode::Default;
  bool first_parent = false;
};

// Fetches from a repository on disk: RevWalk for selection, pretty formats for text.
class RepoCommitFetcher final : public CommitFetcher {
public:
  RepoCommitFetcher(const Repository& repo, LogSettings settings);

  std::vector<std::string> fetch(const RangeExpression& range) override;

private:
  const Repository& repo_;
  const LogSettings settings_;
};

} // namespace chronolog
