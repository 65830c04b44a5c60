#pragma once
#include "chronolog/consts.hpp"
#include "chronolog/hash.hpp"
#include "chronolog/object_store.hpp"
#include "chronolog/refs.hpp"
#include "chronolog/time.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace chronolog {

struct TreeEntry {
  std::uint32_t mode; // e.g. consts::kModeFile, or 040000 for a directory (octal)
  std::string name;   // filename (no '/')
  oid id;             // 20-byte raw SHA-1 of referenced object
};

class Repository {
public:
  // `root` is the work tree; its `.git` may be a directory or a "gitdir: <path>" file.
  explicit Repository(std::filesystem::path root);

  // Walk up from `start` to the first directory holding `.git`.
  // Throws std::runtime_error("not a git repository ...") when there is none.
  static Repository discover(const std::filesystem::path &start);

  // Core paths
  [[nodiscard]] const std::filesystem::path &root() const { return root_; }
  [[nodiscard]] const std::filesystem::path &git_dir() const { return git_dir_; }
  [[nodiscard]] auto objects_dir() const -> std::filesystem::path {
    return git_dir_ / consts::kObjectsDir;
  }
  [[nodiscard]] auto refs_dir() const -> std::filesystem::path {
    return git_dir_ / consts::kRefsDir;
  }
  [[nodiscard]] auto heads_dir() const -> std::filesystem::path {
    return refs_dir() / consts::kHeadsDir;
  }
  [[nodiscard]] auto tags_dir() const -> std::filesystem::path {
    return refs_dir() / consts::kTagsDir;
  }
  [[nodiscard]] auto config_file() const -> std::filesystem::path {
    return git_dir_ / consts::kConfigFile;
  }

  // Create an empty repository (objects/, refs/heads, refs/tags, HEAD -> master).
  // Fails if .git already exists.
  void init() const;

  [[nodiscard]] auto is_initialized() const -> bool;
  [[nodiscard]] const ObjectStore &store() const { return store_; }

  // Object writers
  [[nodiscard]] auto write_blob(std::span<const std::uint8_t> bytes) const -> std::string;
  [[nodiscard]] auto write_tree(const std::vector<TreeEntry> &entries) const -> std::string;
  [[nodiscard]] auto write_commit(std::string_view tree_hex,
                                  const std::vector<std::string> &parent_hexes,
                                  std::string_view author_line, std::string_view committer_line,
                                  std::string_view message) const -> std::string;
  [[nodiscard]] auto write_tag(std::string_view object_hex, std::string_view object_type,
                               std::string_view name, std::string_view tagger_line,
                               std::string_view message) const -> std::string;

  struct CommitInfo {
    std::string tree_hex;
    std::vector<std::string> parents; // zero or more parents (40-hex each)
    timeutil::Signature author;
    timeutil::Signature committer;
    std::string message;              // raw message (may contain newlines)
  };

  struct TagInfo {
    std::string object_hex;
    std::string object_type;
    std::string name;
    std::string tagger;               // raw line after "tagger ", may be empty
    std::string message;
  };

  // Parsed commits are memoized for the lifetime of the repository handle.
  [[nodiscard]] auto read_commit(std::string_view commit_hex) const -> const CommitInfo &;
  [[nodiscard]] auto read_tag(std::string_view tag_hex) const -> TagInfo;

  // Follow annotated tags down to a commit; nullopt for trees, blobs or missing ids.
  [[nodiscard]] auto peel_to_commit(std::string_view hex) const -> std::optional<std::string>;

  // Resolve revision syntax to a commit id:
  //   40-hex | unique hex prefix | HEAD | <ref> | tags/<t> | refs/...  followed by ~N, ^, ^N
  // nullopt when nothing matches; ConfigError for an ambiguous prefix.
  [[nodiscard]] auto resolve_revision(std::string_view spec) const -> std::optional<std::string>;

  [[nodiscard]] auto head() const -> HeadState { return resolve_head(git_dir_); }

private:
  [[nodiscard]] auto resolve_base(std::string_view name) const -> std::optional<std::string>;
  static auto mode_to_ascii_octal(std::uint32_t mode) -> std::string;

  std::filesystem::path root_;
  std::filesystem::path git_dir_;
  ObjectStore store_;
  mutable std::map<std::string, CommitInfo, std::less<>> commit_cache_;
};

} // namespace chronolog
