#include "chronolog/revwalk.hpp"

#include "chronolog/error.hpp"
#include "chronolog/repo.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <map>
#include <queue>
#include <vector>

namespace chronolog {

namespace {

struct Pending {
  std::int64_t when;
  std::uint64_t seq;
  std::string id;
};

// Newest first; on equal dates, first discovered first.
struct Older {
  bool operator()(const Pending &a, const Pending &b) const {
    if (a.when != b.when)
      return a.when < b.when;
    return a.seq > b.seq;
  }
};

} // namespace

std::string RevWalk::resolve(const std::string &ref, const RangeExpression &range) const {
  auto id = repo_.resolve_revision(ref.empty() ? "HEAD" : ref);
  if (!id) {
    throw ConfigError("unknown revision " + (ref.empty() ? std::string("HEAD") : ref) +
                      " in range " + to_string(range));
  }
  return *id;
}

std::vector<std::string> RevWalk::commits(const RangeExpression &range,
                                          const WalkOptions &opts) const {
  std::string tip;
  std::vector<std::string> hidden;

  if (std::holds_alternative<AllHistory>(range)) {
    const auto head = repo_.head();
    if (head.commit.empty())
      return {}; // unborn branch: no history yet
    tip = head.commit;
  } else if (const auto *up = std::get_if<UpTo>(&range)) {
    tip = resolve(up->ref, range);
  } else {
    const auto &between = std::get<Between>(range);
    if (between.to.empty() && repo_.head().commit.empty())
      return {};
    tip = resolve(between.to, range);
    hidden.push_back(resolve(between.from, range));
  }
  return walk({tip}, hidden, opts);
}

std::vector<std::string> RevWalk::commits_from(const std::vector<std::string> &tips,
                                               const WalkOptions &opts) const {
  return walk(tips, {}, opts);
}

std::vector<std::string> RevWalk::walk(const std::vector<std::string> &tips,
                                       const std::vector<std::string> &hidden,
                                       const WalkOptions &opts) const {
  struct Mark {
    bool hidden = false;
    bool done = false;
  };
  std::map<std::string, Mark, std::less<>> marks;
  std::priority_queue<Pending, std::vector<Pending>, Older> queue;
  std::uint64_t seq = 0;
  std::size_t live = 0; // queued and not hidden
  std::vector<std::string> shown;
  std::int64_t oldest_shown = std::numeric_limits<std::int64_t>::max();

  const auto push = [&](const std::string &id) {
    queue.push(Pending{repo_.read_commit(id).committer.when, seq++, id});
  };
  const auto enqueue = [&](const std::string &id) {
    if (!marks.try_emplace(id).second)
      return;
    ++live;
    push(id);
  };
  // Hide `id`. Commits already shown pass the mark on to their parents.
  const auto hide = [&](const std::string &id) {
    std::vector<std::string> stack{id};
    while (!stack.empty()) {
      std::string cur = std::move(stack.back());
      stack.pop_back();
      const auto [it, fresh] = marks.try_emplace(cur);
      Mark &mark = it->second;
      if (mark.hidden)
        continue;
      mark.hidden = true;
      if (fresh) {
        push(cur);
      } else if (!mark.done) {
        --live;
      } else {
        for (const auto &p : repo_.read_commit(cur).parents)
          stack.push_back(p);
      }
    }
  };

  for (const auto &id : hidden)
    hide(id);
  for (const auto &tip : tips)
    enqueue(tip);

  // Stop once only hidden commits remain and all of them are older than
  // anything shown; they cannot lead back to a shown commit.
  while (!queue.empty()) {
    if (live == 0 && (shown.empty() || queue.top().when < oldest_shown))
      break;
    const Pending cur = queue.top();
    queue.pop();
    Mark &mark = marks.find(cur.id)->second;
    mark.done = true;
    const auto &info = repo_.read_commit(cur.id);

    if (mark.hidden) {
      for (const auto &p : info.parents)
        hide(p);
      continue;
    }
    --live;
    shown.push_back(cur.id);
    oldest_shown = std::min(oldest_shown, cur.when);

    if (opts.first_parent) {
      if (!info.parents.empty())
        enqueue(info.parents.front());
    } else {
      for (const auto &p : info.parents)
        enqueue(p);
    }
  }

  std::vector<std::string> out;
  for (const auto &id : shown) {
    if (marks.find(id)->second.hidden)
      continue;
    const bool is_merge = repo_.read_commit(id).parents.size() > 1;
    const bool keep = opts.merges == MergeFilter::Any ||
                      (opts.merges == MergeFilter::NoMerges && !is_merge) ||
                      (opts.merges == MergeFilter::MergesOnly && is_merge);
    if (keep)
      out.push_back(id);
  }
  return out;
}

} // namespace chronolog
