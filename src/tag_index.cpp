#include "chronolog/tag_index.hpp"

#include "chronolog/repo.hpp"
#include "chronolog/revwalk.hpp"
#include "chronolog/util.hpp"

#include <algorithm>
#include <functional>
#include <map>
#include <set>
#include <utility>

namespace chronolog {

namespace {

constexpr std::string_view kHeadArrow = " -> ";

// Labels git attaches to one commit; rendered in a fixed order.
struct Labels {
  std::string head;                   // "HEAD" or "HEAD -> master"
  std::vector<std::string> tags;      // bare names
  std::vector<std::string> branches;  // local, then remote ("origin/x")
};

std::string render(Labels labels) {
  std::ranges::sort(labels.tags, std::greater<>{});
  std::vector<std::string> parts;
  if (!labels.head.empty())
    parts.push_back(labels.head);
  for (const auto &t : labels.tags)
    parts.push_back(std::string(consts::kDecorationTag) + t);
  for (auto &b : labels.branches)
    parts.push_back(std::move(b));
  if (parts.empty())
    return {};
  std::string out = " (";
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i != 0)
      out += ", ";
    out += parts[i];
  }
  out += ")";
  return out;
}

} // namespace

std::vector<std::string> decoration_tags(std::string_view decoration) {
  std::string text = strutil::trim(decoration);
  if (!text.empty() && text.front() == '(')
    text.erase(0, 1);
  if (!text.empty() && text.back() == ')')
    text.pop_back();

  std::vector<std::string> tags;
  std::size_t pos = 0;
  while (pos <= text.size()) {
    auto comma = text.find(',', pos);
    if (comma == std::string::npos)
      comma = text.size();
    const std::string entry = strutil::trim(std::string_view(text).substr(pos, comma - pos));
    // "HEAD" and "HEAD -> branch" markers fall through with branches and remotes
    if (entry.rfind(consts::kDecorationTag, 0) == 0) {
      std::string name = strutil::trim(entry.substr(consts::kDecorationTag.size()));
      if (!name.empty())
        tags.push_back(std::move(name));
    }
    pos = comma + 1;
  }
  return tags;
}

TagIndex TagIndex::build(const std::vector<DecoratedCommit> &records) {
  std::vector<Tag> tags;
  std::set<std::string, std::less<>> seen_commits;
  std::set<std::string, std::less<>> seen_names;
  for (const auto &rec : records) {
    const auto names = decoration_tags(rec.decoration);
    if (names.empty())
      continue;
    const std::string &name = names.front();
    if (seen_commits.contains(rec.commit) || seen_names.contains(name))
      continue;
    seen_commits.insert(rec.commit);
    seen_names.insert(name);
    tags.push_back(Tag{.name = name, .commit = rec.commit, .date = rec.date});
  }
  return TagIndex(std::move(tags));
}

const Tag *TagIndex::find(std::string_view name) const {
  const auto it = std::ranges::find(tags_, name, &Tag::name);
  return it == tags_.end() ? nullptr : &*it;
}

const Tag *TagIndex::tag_at_commit(std::string_view commit) const {
  const auto it = std::ranges::find(tags_, commit, &Tag::commit);
  return it == tags_.end() ? nullptr : &*it;
}

std::size_t TagIndex::position(std::string_view name) const {
  const auto it = std::ranges::find(tags_, name, &Tag::name);
  return static_cast<std::size_t>(it - tags_.begin());
}

std::vector<DecoratedCommit> collect_decorations(const Repository &repo) {
  const auto &gitdir = repo.git_dir();
  std::map<std::string, Labels> labels;
  std::vector<std::string> tips;

  for (const auto &[ref, hex] : list_refs(gitdir, consts::kTagsPrefix)) {
    const auto commit = repo.peel_to_commit(hex);
    if (!commit)
      continue; // tags on trees or blobs are not releases
    labels[*commit].tags.push_back(ref.substr(consts::kTagsPrefix.size()));
    tips.push_back(*commit);
  }

  const auto head = repo.head();
  for (const auto &[ref, hex] : list_refs(gitdir, consts::kHeadsPrefix)) {
    if (ref == head.branch)
      continue;
    labels[hex].branches.push_back(ref.substr(consts::kHeadsPrefix.size()));
  }
  for (const auto &[ref, hex] : list_refs(gitdir, consts::kRemotesPrefix)) {
    labels[hex].branches.push_back(ref.substr(consts::kRemotesPrefix.size()));
  }
  if (!head.commit.empty()) {
    auto &entry = labels[head.commit].head;
    entry = std::string(consts::kDecorationHead);
    if (!head.branch.empty())
      entry += std::string(kHeadArrow) + head.branch.substr(consts::kHeadsPrefix.size());
  }

  std::vector<DecoratedCommit> out;
  const RevWalk walk(repo);
  for (const auto &id : walk.commits_from(tips)) {
    const auto it = labels.find(id);
    if (it == labels.end())
      continue;
    out.push_back(DecoratedCommit{
        .commit = id,
        .date = timeutil::format_date(repo.read_commit(id).author, timeutil::DateMode::Short),
        .decoration = render(it->second),
    });
  }
  return out;
}

} // namespace chronolog
