#pragma once
#include "chronolog/consts.hpp"
#include "chronolog/range.hpp"
#include "chronolog/tag_index.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace chronolog {

class Repository; // fwd

// A start bound is a tag or a commit, never both.
// Throws ConfigError when both are given.
RangeBound start_bound(const std::optional<std::string>& start_tag,
                       const std::optional<std::string>& start_commit);

struct BoundsRequest {
  RangeBound start;  // NoBound, TagName or CommitRef
  RangeBound final;  // NoBound or TagName
};

// User bounds pinned to tags of the index and full commit ids.
struct ResolvedBounds {
  std::optional<std::string> start_tag;
  std::optional<std::string> final_tag;
  std::optional<std::string> start_commit;   // full id
  std::optional<std::string> start_parent;   // first parent of start_commit; none for a root
  std::optional<std::string> enclosing_tag;  // oldest tag containing start_commit, final bound only
  std::optional<std::string> head;           // HEAD commit; none on an unborn branch
};

// Resolve every bound against the repository before any section is produced.
// Unknown tags or commits, a start commit without an enclosing tag and a start
// newer than the final tag are ConfigErrors.
ResolvedBounds resolve_bounds(const Repository& repo, const TagIndex& index,
                              const BoundsRequest& request);

struct SelectorOptions {
  bool list_all = false;
  std::string untagged_title = std::string(consts::kDefaultUntaggedTitle);
  std::string today; // YYYY-MM-DD, date of untagged sections
};

// One output section: its heading and the commits it covers.
struct Boundary {
  std::string title;
  std::string date;
  RangeExpression range;
  bool tagged = false; // title is a release tag rather than the untagged label

  bool operator==(const Boundary&) const = default;
};

// Walks the index newest to oldest and yields one Boundary per section, lazily.
// Each tag is visited at most once; at most index.size() + 1 boundaries come out.
class RangeSelector {
public:
  RangeSelector(const TagIndex& index, ResolvedBounds bounds, SelectorOptions opts);

  // Next section, or nullopt once the walk is over.
  std::optional<Boundary> next();

private:
  enum class State : std::uint8_t { Start, SeekFinal, Accumulating, Done };

  [[nodiscard]] Boundary untagged(RangeExpression range) const;
  std::optional<Boundary> start();
  std::optional<Boundary> walk();

  const TagIndex& index_;
  const ResolvedBounds bounds_;
  const SelectorOptions opts_;
  State state_ = State::Start;
  std::size_t pos_ = 0;
};

} // namespace chronolog
