#include "chronolog/range_selector.hpp"

#include "chronolog/error.hpp"
#include "chronolog/repo.hpp"

#include <deque>
#include <set>
#include <utility>
#include <vector>

namespace chronolog {

namespace {

// Nearest commit at or behind `commit` carrying an index tag (breadth-first),
// the `git describe --tags --abbrev=0` answer.
const Tag *nearest_tag(const Repository &repo, const TagIndex &index, const std::string &commit) {
  std::deque<std::string> queue{commit};
  std::set<std::string, std::less<>> seen{commit};
  while (!queue.empty()) {
    const std::string cur = std::move(queue.front());
    queue.pop_front();
    if (const Tag *tag = index.tag_at_commit(cur))
      return tag;
    for (const auto &p : repo.read_commit(cur).parents) {
      if (seen.insert(p).second)
        queue.push_back(p);
    }
  }
  return nullptr;
}

std::string resolve_tag(const Repository &repo, const TagIndex &index, const std::string &name) {
  if (index.find(name) != nullptr)
    return name;
  const auto commit = repo.resolve_revision(name);
  if (!commit)
    throw ConfigError("unknown tag or revision: " + name);
  const Tag *tag = nearest_tag(repo, index, *commit);
  if (tag == nullptr)
    throw ConfigError("no tag found at or before " + name);
  return tag->name;
}

// Oldest tag whose history contains `commit`, i.e. the first release shipping it.
// Commits explored by a failed search cannot reach `commit`, so later searches
// skip them and the whole lookup visits each commit at most once.
std::optional<std::string> enclosing_tag(const Repository &repo, const TagIndex &index,
                                         const std::string &commit) {
  std::set<std::string, std::less<>> barren;
  for (std::size_t i = index.size(); i-- > 0;) {
    std::vector<std::string> stack{index[i].commit};
    while (!stack.empty()) {
      std::string cur = std::move(stack.back());
      stack.pop_back();
      if (cur == commit)
        return index[i].name;
      if (!barren.insert(cur).second)
        continue;
      for (const auto &p : repo.read_commit(cur).parents)
        stack.push_back(p);
    }
  }
  return std::nullopt;
}

} // namespace

RangeBound start_bound(const std::optional<std::string> &start_tag,
                       const std::optional<std::string> &start_commit) {
  if (start_tag && start_commit)
    throw ConfigError("--start-tag and --start-commit are mutually exclusive");
  if (start_tag)
    return TagName{*start_tag};
  if (start_commit)
    return CommitRef{*start_commit};
  return NoBound{};
}

ResolvedBounds resolve_bounds(const Repository &repo, const TagIndex &index,
                              const BoundsRequest &request) {
  ResolvedBounds out;
  if (std::holds_alternative<CommitRef>(request.final))
    throw ConfigError("final bound must be a tag");
  if (auto head = repo.head().commit; !head.empty())
    out.head = std::move(head);

  if (const auto *tag = std::get_if<TagName>(&request.final))
    out.final_tag = resolve_tag(repo, index, tag->name);

  if (const auto *tag = std::get_if<TagName>(&request.start)) {
    out.start_tag = resolve_tag(repo, index, tag->name);
  } else if (const auto *ref = std::get_if<CommitRef>(&request.start)) {
    const auto commit = repo.resolve_revision(ref->ref);
    if (!commit)
      throw ConfigError("unknown commit: " + ref->ref);
    out.start_commit = commit;
    const auto &parents = repo.read_commit(*commit).parents;
    if (!parents.empty())
      out.start_parent = parents.front();
    if (out.final_tag) {
      out.enclosing_tag = enclosing_tag(repo, index, *commit);
      if (!out.enclosing_tag)
        throw ConfigError("commit " + ref->ref + " is not contained in any tag");
    }
  }

  const auto &oldest = out.start_tag ? out.start_tag : out.enclosing_tag;
  if (out.final_tag && oldest && index.position(*oldest) < index.position(*out.final_tag)) {
    throw ConfigError("start " + *oldest + " is newer than final tag " + *out.final_tag);
  }
  return out;
}

RangeSelector::RangeSelector(const TagIndex &index, ResolvedBounds bounds, SelectorOptions opts)
    : index_(index), bounds_(std::move(bounds)), opts_(std::move(opts)) {}

Boundary RangeSelector::untagged(RangeExpression range) const {
  return Boundary{.title = opts_.untagged_title, .date = opts_.today, .range = std::move(range)};
}

std::optional<Boundary> RangeSelector::next() {
  switch (state_) {
  case State::Start:
    return start();
  case State::SeekFinal:
  case State::Accumulating:
    return walk();
  case State::Done:
    break;
  }
  return std::nullopt;
}

std::optional<Boundary> RangeSelector::start() {
  if (opts_.list_all || index_.empty()) {
    state_ = State::Done;
    return untagged(AllHistory{});
  }

  if (bounds_.start_commit && !bounds_.final_tag && !bounds_.start_tag) {
    state_ = State::Done;
    if (!bounds_.start_parent)
      return untagged(AllHistory{});
    return untagged(Between{.from = *bounds_.start_parent, .to = {}});
  }

  if (bounds_.final_tag) {
    state_ = State::SeekFinal;
    return walk();
  }

  // Nothing newer than the final bound is wanted, so the unreleased commits only
  // appear when no final bound is set.
  const bool unbounded = !bounds_.start_tag && !bounds_.start_commit;
  state_ = unbounded ? State::Done : State::Accumulating;
  // HEAD on the newest tag: nothing is unreleased
  if (bounds_.head == index_[0].commit)
    return unbounded ? std::nullopt : walk();
  return untagged(Between{.from = index_[0].name, .to = {}});
}

std::optional<Boundary> RangeSelector::walk() {
  while (pos_ < index_.size()) {
    const Tag &tag = index_[pos_];
    const Tag *older = pos_ + 1 < index_.size() ? &index_[pos_ + 1] : nullptr;
    ++pos_;

    if (state_ == State::SeekFinal) {
      if (tag.name != *bounds_.final_tag)
        continue;
      state_ = State::Accumulating;
    }

    Boundary out{.title = tag.name, .date = tag.date, .tagged = true};
    if (bounds_.start_commit && bounds_.enclosing_tag == tag.name) {
      if (bounds_.start_parent)
        out.range = Between{.from = *bounds_.start_parent, .to = tag.name};
      else
        out.range = UpTo{tag.name};
      state_ = State::Done;
      return out;
    }

    if (older != nullptr)
      out.range = Between{.from = older->name, .to = tag.name};
    else
      out.range = UpTo{tag.name};
    if (bounds_.start_tag == tag.name)
      state_ = State::Done;
    return out;
  }
  state_ = State::Done;
  return std::nullopt;
}

} // namespace chronolog
