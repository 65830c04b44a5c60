#pragma once
// Scratch repositories for the tests, written through the library's own object
// and ref writers. All timestamps are fixed so output is reproducible.

#include "chronolog/refs.hpp"
#include "chronolog/repo.hpp"
#include "chronolog/time.hpp"

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace chronolog::test {

namespace stdfs = std::filesystem;

// 2024-01-01T12:00:00Z
inline constexpr std::int64_t kJan2024 = 1704110400;
inline constexpr std::int64_t kDay = 86400;

class TempRepo {
public:
  explicit TempRepo(std::string_view name)
      : root_(stdfs::temp_directory_path() /
              ("chronolog_" + std::string(name) + "_" + std::to_string(std::random_device{}()))) {
    stdfs::create_directories(root_);
    repo_.emplace(root_);
    repo_->init();
  }
  ~TempRepo() {
    std::error_code ec;
    stdfs::remove_all(root_, ec);
  }
  TempRepo(const TempRepo &) = delete;
  TempRepo &operator=(const TempRepo &) = delete;

  [[nodiscard]] const stdfs::path &root() const { return root_; }
  [[nodiscard]] const Repository &repo() const { return *repo_; }

  // Commit on top of HEAD (or `parents` when given) and advance the current branch.
  std::string commit(std::string_view message, std::int64_t when,
                     std::optional<std::vector<std::string>> parents = std::nullopt) {
    std::vector<std::string> ps;
    if (parents) {
      ps = *parents;
    } else if (const auto head = repo_->head(); !head.commit.empty()) {
      ps.push_back(head.commit);
    }
    const std::string sig = timeutil::make_signature(
        timeutil::Signature{.name = "Jane Roe", .email = "jane@example.com", .when = when});
    const std::string id =
        repo_->write_commit(empty_tree(), ps, sig, sig, std::string(message) + "\n");
    advance(id);
    return id;
  }

  // Lightweight tag
  void tag(const std::string &name, const std::string &commit) const {
    update_ref(repo_->git_dir(), tags_ref(name), commit);
  }

  // Annotated tag object plus its ref
  std::string annotated_tag(const std::string &name, const std::string &commit,
                            std::int64_t when) const {
    const std::string tagger = timeutil::make_signature(
        timeutil::Signature{.name = "Rel Eng", .email = "rel@example.com", .when = when});
    const std::string id =
        repo_->write_tag(commit, consts::kTypeCommit, name, tagger, "release " + name + "\n");
    update_ref(repo_->git_dir(), tags_ref(name), id);
    return id;
  }

  void branch(const std::string &name, const std::string &commit) const {
    update_ref(repo_->git_dir(), heads_ref(name), commit);
  }

  void checkout(const std::string &name) const {
    set_HEAD_symbolic(repo_->git_dir(), heads_ref(name));
  }

private:
  std::string empty_tree() {
    if (tree_.empty())
      tree_ = repo_->write_tree({});
    return tree_;
  }

  void advance(const std::string &id) const {
    const auto head = repo_->head();
    if (head.branch.empty())
      set_HEAD_detached(repo_->git_dir(), id);
    else
      update_ref(repo_->git_dir(), head.branch, id);
  }

  stdfs::path root_;
  std::optional<Repository> repo_;
  std::string tree_;
};

inline bool expect(bool cond, std::string_view what) {
  if (!cond)
    std::cerr << "FAILED: " << what << "\n";
  return cond;
}

} // namespace chronolog::test
