#include "chronolog/error.hpp"
#include "chronolog/fs.hpp"
#include "chronolog/refs.hpp"
#include "chronolog/repo.hpp"

#include "fixture.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>

namespace fs = std::filesystem;
using chronolog::test::expect;
using chronolog::test::kDay;
using chronolog::test::kJan2024;

int main() {
  const fs::path root =
      fs::temp_directory_path() / ("chronolog_store_" + std::to_string(std::random_device{}()));

  try {
    fs::create_directories(root / "work" / "sub");

    chronolog::Repository repo{root / "work"};
    if (repo.is_initialized()) {
      std::cerr << "repo unexpectedly initialized before init()\n";
      return 1;
    }
    repo.init();

    const fs::path gitdir = root / "work" / ".git";
    if (!fs::is_directory(gitdir / "objects") || !fs::is_directory(gitdir / "refs" / "tags")) {
      std::cerr << "layout missing\n";
      return 1;
    }
    if (chronolog::fs::read_text(gitdir / "HEAD") != "ref: refs/heads/master\n") {
      std::cerr << "HEAD not symbolic to master\n";
      return 1;
    }

    // blob round trip; the id is the one git computes for "hello\n"
    const std::string content = "hello\n";
    const std::string blob = repo.write_blob(std::span<const std::uint8_t>(
        reinterpret_cast<const std::uint8_t *>(content.data()), content.size()));
    if (blob != "ce013625030ba8dba906f756967f9e9ca394464a") {
      std::cerr << "unexpected blob id " << blob << "\n";
      return 1;
    }
    const auto obj = repo.store().read(blob);
    if (obj.type != "blob" || std::string(obj.data.begin(), obj.data.end()) != content) {
      std::cerr << "blob read back mismatch\n";
      return 1;
    }
    if (repo.store().try_read(std::string(40, '0'))) {
      std::cerr << "missing object reported present\n";
      return 1;
    }

    chronolog::TreeEntry entry{.mode = chronolog::consts::kModeFile, .name = "hello.txt", .id = {}};
    if (!chronolog::from_hex(blob, entry.id)) {
      std::cerr << "from_hex failed\n";
      return 1;
    }
    const std::string tree = repo.write_tree({entry});
    if (repo.store().read(tree).type != "tree") {
      std::cerr << "tree not stored\n";
      return 1;
    }

    // commits and revision syntax
    const auto sig = [](std::int64_t when) {
      return chronolog::timeutil::make_signature({.name = "T", .email = "t@x", .when = when});
    };
    const std::string c1 = repo.write_commit(tree, {}, sig(kJan2024), sig(kJan2024), "one\n");
    const std::string c2 = repo.write_commit(tree, {c1}, sig(kJan2024 + kDay),
                                             sig(kJan2024 + kDay), "two\n");
    const std::string side = repo.write_commit(tree, {c1}, sig(kJan2024 + kDay),
                                               sig(kJan2024 + kDay), "side\n");
    const std::string merge = repo.write_commit(tree, {c2, side}, sig(kJan2024 + 2 * kDay),
                                                sig(kJan2024 + 2 * kDay), "merge\n");
    chronolog::update_ref(repo.git_dir(), chronolog::heads_ref("master"), merge);
    const std::string tag_obj =
        repo.write_tag(c2, "commit", "v1", sig(kJan2024 + kDay), "release\n");
    chronolog::update_ref(repo.git_dir(), chronolog::tags_ref("v1"), tag_obj);

    bool ok = expect(repo.resolve_revision("HEAD") == merge, "HEAD");
    ok = ok && expect(repo.resolve_revision("master") == merge, "branch name");
    ok = ok && expect(repo.resolve_revision("HEAD^2") == side, "second parent");
    ok = ok && expect(repo.resolve_revision("HEAD~2") == c1, "first-parent ancestry");
    ok = ok && expect(repo.resolve_revision("HEAD^^") == c1, "chained carets");
    ok = ok && expect(repo.resolve_revision("v1") == c2, "annotated tag peeled");
    ok = ok && expect(repo.resolve_revision("tags/v1~1") == c1, "tags/ prefix with suffix");
    ok = ok && expect(repo.resolve_revision(merge.substr(0, 10)) == merge, "unique prefix");
    ok = ok && expect(!repo.resolve_revision("HEAD~9"), "walking past the root");
    ok = ok && expect(!repo.resolve_revision("nosuchref"), "unknown name");
    ok = ok && expect(!repo.resolve_revision(blob), "blob is not a commit");

    const auto &info = repo.read_commit(merge);
    ok = ok && expect(info.parents.size() == 2 && info.message == "merge\n", "commit parsed");
    ok = ok && expect(info.author.when == kJan2024 + 2 * kDay, "author time parsed");
    ok = ok && expect(repo.read_tag(tag_obj).name == "v1", "tag object parsed");

    // discovery from a nested directory, and through a ".git" file
    const auto found = chronolog::Repository::discover(root / "work" / "sub");
    ok = ok && expect(fs::equivalent(found.git_dir(), gitdir), "discover walks up");

    fs::create_directories(root / "linked");
    std::ofstream(root / "linked" / ".git") << "gitdir: ../work/.git\n";
    const chronolog::Repository linked{root / "linked"};
    ok = ok && expect(linked.resolve_revision("HEAD") == merge, "gitdir file followed");

    bool threw = false;
    try {
      (void)chronolog::Repository::discover(fs::path("/"));
    } catch (const std::runtime_error &) {
      threw = true;
    }
    ok = ok && expect(threw || fs::exists("/.git"), "no repository above /");

    if (!ok) {
      fs::remove_all(root);
      return 1;
    }
    std::cout << "object store OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(root);
    return 1;
  }

  std::error_code ec;
  fs::remove_all(root, ec);
  return 0;
}
