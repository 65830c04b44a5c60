#pragma once
#include "chronolog/config.hpp"
#include "chronolog/range.hpp"

#include <string>
#include <vector>

namespace chronolog {

class Repository; // fwd

struct WalkOptions {
  MergeFilter merges = MergeFilter::Any;
  bool first_parent = false;
};

// Commit listing in `git log` order: newest committer date first, ties in the
// order commits were discovered. Unresolvable range endpoints throw ConfigError.
class RevWalk {
public:
  explicit RevWalk(const Repository& repo) : repo_(repo) {}

  [[nodiscard]] std::vector<std::string> commits(const RangeExpression& range,
                                                 const WalkOptions& opts = {}) const;

  // Everything reachable from any of `tips` (full commit ids), same ordering.
  [[nodiscard]] std::vector<std::string> commits_from(const std::vector<std::string>& tips,
                                                      const WalkOptions& opts = {}) const;

private:
  [[nodiscard]] std::string resolve(const std::string& ref, const RangeExpression& range) const;
  [[nodiscard]] std::vector<std::string> walk(const std::vector<std::string>& tips,
                                              const std::vector<std::string>& hidden,
                                              const WalkOptions& opts) const;

  const Repository& repo_;
};

} // namespace chronolog
