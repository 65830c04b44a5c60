#include "chronolog/repo.hpp"

#include "chronolog/consts.hpp"
#include "chronolog/error.hpp"
#include "chronolog/fs.hpp"
#include "chronolog/refs.hpp"
#include "chronolog/util.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cstdio>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace stdfs = std::filesystem;
namespace cfs   = chronolog::fs;

namespace {

constexpr int kMaxPeelDepth = 8;

// ".git" directory, or the target of a ".git" file ("gitdir: ../x/.git").
[[nodiscard]] auto locate_git_dir(const stdfs::path& root) -> stdfs::path {
  const auto dotgit = root / chronolog::consts::kGitDir;
  if (!cfs::is_regular(dotgit)) {
    return dotgit;
  }
  std::string txt = cfs::read_text(dotgit);
  chronolog::strutil::rstrip_newlines(txt);
  if (txt.rfind(chronolog::consts::kGitdirPrefix, 0) != 0) {
    throw std::runtime_error("invalid gitfile format: " + dotgit.string());
  }
  stdfs::path target = txt.substr(chronolog::consts::kGitdirPrefix.size());
  if (target.is_relative()) {
    target = root / target;
  }
  return target.lexically_normal();
}

[[nodiscard]] auto as_bytes(std::string_view s) -> std::span<const std::uint8_t> {
  return {reinterpret_cast<const std::uint8_t*>(s.data()), s.size()};
}

} // namespace

namespace chronolog {

Repository::Repository(stdfs::path root)
    : root_(std::move(root)), git_dir_(locate_git_dir(root_)), store_(git_dir_) {}

Repository Repository::discover(const stdfs::path& start) {
  std::error_code ec;
  stdfs::path cur = stdfs::absolute(start, ec);
  if (ec) {
    throw std::runtime_error("cannot resolve path: " + start.string());
  }
  for (;;) {
    if (cfs::exists(cur / consts::kGitDir)) {
      return Repository{cur};
    }
    if (!cur.has_parent_path() || cur.parent_path() == cur) {
      break;
    }
    cur = cur.parent_path();
  }
  throw std::runtime_error("not a git repository (or any of the parent directories): " +
                           start.string());
}

auto Repository::is_initialized() const -> bool {
  return stdfs::is_directory(git_dir_) && cfs::exists(git_dir_ / consts::kHeadFile);
}

void Repository::init() const {
  if (cfs::exists(root_ / consts::kGitDir)) {
    throw std::runtime_error("a git repository already exists at: " + git_dir_.string());
  }

  for (const auto& dir : {objects_dir(), heads_dir(), tags_dir()}) {
    std::error_code ec;
    stdfs::create_directories(dir, ec);
    if (ec) {
      throw std::runtime_error("create " + dir.string() + " failed: " + ec.message());
    }
  }
  set_HEAD_symbolic(git_dir_, heads_ref(consts::kDefaultBranch));
}

auto Repository::mode_to_ascii_octal(std::uint32_t mode) -> std::string {
  std::array<char, 16> buf{};
  std::snprintf(buf.data(), buf.size(), "%o", mode);
  return {buf.data()};
}

// Writers

auto Repository::write_blob(std::span<const std::uint8_t> bytes) const -> std::string {
  return store_.write(consts::kTypeBlob, bytes);
}

auto Repository::write_tree(const std::vector<TreeEntry>& entries_in) const -> std::string {
  auto entries = entries_in;
  std::ranges::sort(entries,
                    [](const TreeEntry& a, const TreeEntry& b) { return a.name < b.name; });

  std::string data;
  for (const auto& e : entries) {
    data.append(mode_to_ascii_octal(e.mode));
    data.push_back(consts::kSpace);
    data.append(e.name);
    data.push_back(consts::kNul);
    data.append(reinterpret_cast<const char*>(e.id.data()), consts::kOidRawLen);
  }
  return store_.write(consts::kTypeTree, as_bytes(data));
}

auto Repository::write_commit(std::string_view tree_hex,
                              const std::vector<std::string>& parent_hexes,
                              std::string_view author_line,
                              std::string_view committer_line,
                              std::string_view message) const -> std::string {
  std::string txt;
  txt += consts::kTreePrefix;
  txt += tree_hex;
  txt += '\n';
  for (const auto& p : parent_hexes) {
    txt += consts::kParentPrefix;
    txt += p;
    txt += '\n';
  }
  txt += consts::kAuthorPrefix;
  txt += author_line;
  txt += '\n';
  txt += consts::kCommitterPrefix;
  txt += committer_line;
  txt += "\n\n";
  txt += message;
  return store_.write(consts::kTypeCommit, as_bytes(txt));
}

auto Repository::write_tag(std::string_view object_hex, std::string_view object_type,
                           std::string_view name, std::string_view tagger_line,
                           std::string_view message) const -> std::string {
  std::string txt;
  txt += consts::kObjectPrefix;
  txt += object_hex;
  txt += '\n';
  txt += consts::kTypePrefix;
  txt += object_type;
  txt += '\n';
  txt += consts::kTagPrefix;
  txt += name;
  txt += '\n';
  txt += consts::kTaggerPrefix;
  txt += tagger_line;
  txt += "\n\n";
  txt += message;
  return store_.write(consts::kTypeTag, as_bytes(txt));
}

// Readers

auto Repository::read_commit(std::string_view commit_hex) const -> const CommitInfo& {
  if (const auto it = commit_cache_.find(commit_hex); it != commit_cache_.end()) {
    return it->second;
  }

  const auto obj = store_.read(commit_hex);
  if (obj.type != consts::kTypeCommit) {
    throw std::runtime_error("object is not a commit: " + std::string(commit_hex));
  }
  const std::string text(obj.data.begin(), obj.data.end());

  CommitInfo info{};
  std::size_t pos = 0;
  for (;;) {
    const std::size_t nl = text.find('\n', pos);
    const std::string line =
        (nl == std::string::npos) ? text.substr(pos) : text.substr(pos, nl - pos);

    if (line.empty()) {
      if (nl != std::string::npos) {
        info.message = text.substr(nl + 1);
      }
      break;
    }

    if (line.rfind(consts::kTreePrefix, 0) == 0) {
      info.tree_hex = line.substr(consts::kTreePrefix.size(), consts::kOidHexLen);
    } else if (line.rfind(consts::kParentPrefix, 0) == 0) {
      info.parents.push_back(line.substr(consts::kParentPrefix.size(), consts::kOidHexLen));
    } else if (line.rfind(consts::kAuthorPrefix, 0) == 0) {
      info.author = timeutil::parse_signature(line.substr(consts::kAuthorPrefix.size()));
    } else if (line.rfind(consts::kCommitterPrefix, 0) == 0) {
      info.committer = timeutil::parse_signature(line.substr(consts::kCommitterPrefix.size()));
    }
    // gpgsig/mergetag continuation lines start with a space and are skipped

    if (nl == std::string::npos) break;
    pos = nl + 1;
  }

  return commit_cache_.emplace(std::string(commit_hex), std::move(info)).first->second;
}

auto Repository::read_tag(std::string_view tag_hex) const -> TagInfo {
  const auto obj = store_.read(tag_hex);
  if (obj.type != consts::kTypeTag) {
    throw std::runtime_error("object is not a tag: " + std::string(tag_hex));
  }
  const std::string text(obj.data.begin(), obj.data.end());

  TagInfo info{};
  std::size_t pos = 0;
  for (;;) {
    const std::size_t nl = text.find('\n', pos);
    const std::string line =
        (nl == std::string::npos) ? text.substr(pos) : text.substr(pos, nl - pos);
    if (line.empty()) {
      if (nl != std::string::npos) {
        info.message = text.substr(nl + 1);
      }
      break;
    }
    if (line.rfind(consts::kObjectPrefix, 0) == 0) {
      info.object_hex = line.substr(consts::kObjectPrefix.size(), consts::kOidHexLen);
    } else if (line.rfind(consts::kTypePrefix, 0) == 0) {
      info.object_type = line.substr(consts::kTypePrefix.size());
    } else if (line.rfind(consts::kTagPrefix, 0) == 0) {
      info.name = line.substr(consts::kTagPrefix.size());
    } else if (line.rfind(consts::kTaggerPrefix, 0) == 0) {
      info.tagger = line.substr(consts::kTaggerPrefix.size());
    }
    if (nl == std::string::npos) break;
    pos = nl + 1;
  }
  return info;
}

auto Repository::peel_to_commit(std::string_view hex) const -> std::optional<std::string> {
  std::string cur(hex);
  for (int depth = 0; depth < kMaxPeelDepth; ++depth) {
    const auto obj = store_.try_read(cur);
    if (!obj) {
      return std::nullopt;
    }
    if (obj->type == consts::kTypeCommit) {
      return cur;
    }
    if (obj->type != consts::kTypeTag) {
      return std::nullopt;
    }
    cur = read_tag(cur).object_hex;
    if (!looks_hex40(cur)) {
      return std::nullopt;
    }
  }
  return std::nullopt;
}

// Revisions

auto Repository::resolve_base(std::string_view name) const -> std::optional<std::string> {
  if (name.empty()) {
    return std::nullopt;
  }
  if (name == consts::kHeadFile) {
    const auto st = head();
    if (st.commit.empty()) return std::nullopt;
    return st.commit;
  }

  if (looks_hex40(name)) {
    const std::string hex = normalize_hex(name);
    if (store_.contains(hex)) return hex;
  }

  const std::string n(name);
  const std::array<std::string, 5> candidates = {
      n,
      "refs/" + n,
      tags_ref(n),
      heads_ref(n),
      std::string(consts::kRemotesPrefix) + n,
  };
  for (const auto& refname : candidates) {
    if (refname.rfind("refs/", 0) != 0) continue;
    if (auto hex = read_ref(git_dir_, refname); hex) return normalize_hex(*hex);
  }
  if (auto hex = read_ref(git_dir_, std::string(consts::kRemotesPrefix) + n + "/HEAD"); hex) {
    return normalize_hex(*hex);
  }

  if (looks_hex_prefix(name)) {
    const auto matches = store_.match_prefix(normalize_hex(name));
    if (matches.size() > 1) {
      throw ConfigError("short object ID " + n + " is ambiguous");
    }
    if (matches.size() == 1) return matches.front();
  }
  return std::nullopt;
}

auto Repository::resolve_revision(std::string_view spec) const -> std::optional<std::string> {
  const auto cut = spec.find_first_of("~^");
  auto base = resolve_base(spec.substr(0, cut));
  if (!base) {
    return std::nullopt;
  }
  auto commit = peel_to_commit(*base);
  if (!commit) {
    return std::nullopt;
  }

  std::string_view rest = cut == std::string_view::npos ? std::string_view{} : spec.substr(cut);
  while (!rest.empty()) {
    const char op = rest.front();
    rest.remove_prefix(1);
    std::size_t digits = 0;
    while (digits < rest.size() && rest[digits] >= '0' && rest[digits] <= '9') ++digits;
    int n = 1;
    if (digits > 0 &&
        std::from_chars(rest.data(), rest.data() + digits, n).ec != std::errc{}) {
      return std::nullopt;
    }
    rest.remove_prefix(digits);

    if (op == '~') {
      for (int i = 0; i < n; ++i) {
        const auto& info = read_commit(*commit);
        if (info.parents.empty()) return std::nullopt;
        commit = info.parents.front();
      }
    } else if (op == '^') {
      if (n == 0) continue;
      const auto& info = read_commit(*commit);
      if (static_cast<std::size_t>(n) > info.parents.size()) return std::nullopt;
      commit = info.parents[static_cast<std::size_t>(n) - 1];
    } else {
      return std::nullopt;
    }
  }
  return commit;
}

} // namespace chronolog
