#include "cli/options.hpp"

#include "chronolog/error.hpp"
#include "cli/command.hpp"
#include "cli/editor.hpp"
#include "fixture.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using chronolog::ConfigError;
using chronolog::cli::Options;
using chronolog::cli::parse_options;
using chronolog::test::expect;

namespace {

bool rejected(const std::vector<std::string> &args) {
  try {
    (void)parse_options(args);
  } catch (const ConfigError &) {
    return true;
  }
  return false;
}

bool flags() {
  const Options d = parse_options({});
  bool ok = expect(!d.all && !d.list && !d.to_stdout && d.untagged_title == "n.n.n", "defaults");
  ok = ok && expect(!d.file && !d.start_tag && !d.final_tag && !d.start_commit, "no bounds");

  const Options o = parse_options({"-lx", "--tag=v2.0.0", "-s", "v1.0", "--final-tag", "v1.5",
                                   "-np", "CHANGES.md"});
  ok = ok && expect(o.list && o.to_stdout, "bundled short flags");
  ok = ok && expect(o.untagged_title == "v2.0.0", "--opt=value");
  ok = ok && expect(o.start_tag == "v1.0" && o.final_tag == "v1.5", "tag bounds");
  ok = ok && expect(o.no_merges && o.prune_old, "-np");
  ok = ok && expect(o.file == "CHANGES.md", "positional file");

  const Options c = parse_options({"--start-commit", "abc123", "-tnext", "-am"});
  ok = ok && expect(c.start_commit == "abc123", "--start-commit");
  ok = ok && expect(c.untagged_title == "next", "value glued to short flag");
  ok = ok && expect(c.all && c.merges_only, "-am");

  const Options h = parse_options({"--help"});
  ok = ok && expect(h.help, "--help");

  const Options dash = parse_options({"--", "-weird-name"});
  ok = ok && expect(dash.file == "-weird-name", "-- ends options");
  return ok;
}

bool errors() {
  bool ok = expect(rejected({"-n", "-m"}), "no-merges with merges-only");
  ok = ok && expect(rejected({"-s", "v1", "--start-commit", "abc"}), "start tag with commit");
  ok = ok && expect(rejected({"--bogus"}), "unknown long option");
  ok = ok && expect(rejected({"-q"}), "unknown short option");
  ok = ok && expect(rejected({"-f"}), "missing value");
  ok = ok && expect(rejected({"--list=yes"}), "value on a plain flag");
  ok = ok && expect(rejected({"a.md", "b.md"}), "two files");
  return ok;
}

bool changelog_file() {
  namespace stdfs = std::filesystem;
  const stdfs::path dir = stdfs::temp_directory_path() /
                          ("chronolog_cli_" + std::to_string(std::random_device{}()));
  stdfs::create_directories(dir / "changes-dir");
  bool ok = expect(chronolog::cli::find_changelog_file(dir) == dir / "History.md",
                   "default file name; directories ignored");
  std::ofstream(dir / "README.md") << "x";
  std::ofstream(dir / "ReleaseHistory.txt") << "x";
  std::ofstream(dir / "CHANGELOG.md") << "x";
  ok = ok && expect(chronolog::cli::find_changelog_file(dir) == dir / "CHANGELOG.md",
                    "first match in sorted order, case-insensitive");
  std::error_code ec;
  stdfs::remove_all(dir, ec);
  return ok;
}

bool editor() {
  ::unsetenv("GIT_EDITOR");
  ::unsetenv("VISUAL");
  ::unsetenv("EDITOR");
  bool ok = expect(chronolog::cli::pick_editor("") == "vi", "fallback editor");
  ::setenv("EDITOR", "nano", 1);
  ok = ok && expect(chronolog::cli::pick_editor("") == "nano", "EDITOR");
  ok = ok && expect(chronolog::cli::pick_editor("emacs") == "emacs", "core.editor beats EDITOR");
  ::setenv("GIT_EDITOR", "true", 1);
  ok = ok && expect(chronolog::cli::pick_editor("emacs") == "true", "GIT_EDITOR first");
  ::unsetenv("GIT_EDITOR");
  ::unsetenv("EDITOR");

  ok = ok && expect(chronolog::cli::launch_editor("true", "/dev/null") == 0, "editor exit 0");
  ok = ok && expect(chronolog::cli::launch_editor("exit 3;", "/dev/null") == 3,
                    "editor exit status reported");
  return ok;
}

} // namespace

int main() {
  try {
    if (!flags() || !errors() || !changelog_file() || !editor())
      return 1;
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }
  std::cout << "cli options OK\n";
  return 0;
}
