#pragma once
#include "chronolog/consts.hpp"
#include "chronolog/hash.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace chronolog {

class Repository; // fwd

// One line of `git log --simplify-by-decoration`: a commit, its short date and
// its decoration string, e.g. " (HEAD -> master, tag: v1.0, origin/master)".
struct DecoratedCommit {
  std::string commit;
  std::string date;
  std::string decoration;
};

struct Tag {
  std::string name;
  std::string commit; // full 40-hex id
  std::string date;   // YYYY-MM-DD

  [[nodiscard]] std::string abbrev() const { return chronolog::abbrev(commit, consts::kAbbrevLen); }
};

// Release tags, newest first. Built once per run and never modified.
class TagIndex {
public:
  using const_iterator = std::vector<Tag>::const_iterator;

  TagIndex() = default;

  // Records must already be newest first. Records without a tag decoration are
  // dropped; on a commit carrying several tags only the first listed one is kept;
  // a commit or tag name seen before is skipped.
  static TagIndex build(const std::vector<DecoratedCommit>& records);

  [[nodiscard]] const Tag* find(std::string_view name) const;
  [[nodiscard]] const Tag* tag_at_commit(std::string_view commit) const;

  // Position in newest-first order, or size() when absent.
  [[nodiscard]] std::size_t position(std::string_view name) const;

  [[nodiscard]] bool empty() const { return tags_.empty(); }
  [[nodiscard]] std::size_t size() const { return tags_.size(); }
  [[nodiscard]] const Tag& operator[](std::size_t i) const { return tags_[i]; }
  [[nodiscard]] const_iterator begin() const { return tags_.begin(); }
  [[nodiscard]] const_iterator end() const { return tags_.end(); }

private:
  explicit TagIndex(std::vector<Tag> tags) : tags_(std::move(tags)) {}

  std::vector<Tag> tags_;
};

// Tag names from one decoration string, in the order they are listed.
std::vector<std::string> decoration_tags(std::string_view decoration);

// Every decorated commit reachable from a tag, newest committer date first.
// Equivalent to `git log --tags --simplify-by-decoration --date=short`.
std::vector<DecoratedCommit> collect_decorations(const Repository& repo);

} // namespace chronolog
