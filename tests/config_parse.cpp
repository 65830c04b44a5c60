#include "chronolog/config.hpp"

#include "chronolog/error.hpp"
#include "fixture.hpp"

#include <cstdlib>
#include <iostream>
#include <string>

using chronolog::ChangelogSettings;
using chronolog::ConfigError;
using chronolog::GitConfig;
using chronolog::MergeFilter;
using chronolog::test::expect;

namespace {

bool parsing() {
  GitConfig cfg;
  cfg.load_text("# leading comment\n"
                "[core]\n"
                "\teditor = nano -w   ; trailing comment\n"
                "\tbare\n"
                "[Changelog]\n"
                "  format = \"  * %s (%an)\"\n"
                "  mergeFormat = \"  * %s%n\\\n"
                "%b\"\n"
                "[remote \"Origin.Main\"]\n"
                "  url = a\\tb \"#not a comment\"\n",
                "test");

  bool ok = expect(cfg.get("core.editor") == "nano -w", "value trimmed, comment dropped");
  ok = ok && expect(cfg.get("core.bare") == "true", "bare key is boolean true");
  ok = ok && expect(cfg.get("changelog.format") == "  * %s (%an)", "quotes keep spaces");
  ok = ok && expect(cfg.get("CHANGELOG.MERGEFORMAT") == "  * %s%n%b",
                    "case-insensitive keys, line continuation");
  ok = ok && expect(cfg.get("remote.Origin.Main.url") == "a\tb #not a comment",
                    "subsection keeps case, escapes and quoted '#'");
  ok = ok && expect(!cfg.get("remote.origin.main.url"), "subsection is case-sensitive");

  cfg.load_text("[core]\neditor = vim\n", "later");
  ok = ok && expect(cfg.get("core.editor") == "vim", "later files win");

  const auto rejects = [](std::string_view text) {
    GitConfig c;
    try {
      c.load_text(text, "bad");
    } catch (const std::runtime_error &) {
      return true;
    }
    return false;
  };
  ok = ok && expect(rejects("key = outside\n"), "key before any section");
  ok = ok && expect(rejects("[core\n"), "unterminated header");
  ok = ok && expect(rejects("[core]\nx = \"open\n"), "unterminated quote");
  ok = ok && expect(rejects("[core]\nx = \\q\n"), "bad escape");
  return ok;
}

bool log_options() {
  const auto o = chronolog::parse_log_options("  --no-merges --first-parent --date=short ");
  bool ok = expect(o.merges == MergeFilter::NoMerges, "--no-merges");
  ok = ok && expect(o.first_parent, "--first-parent");
  ok = ok && expect(o.date_mode == chronolog::timeutil::DateMode::Short, "--date=short");

  bool threw = false;
  try {
    (void)chronolog::parse_log_options("--graph");
  } catch (const ConfigError &) {
    threw = true;
  }
  ok = ok && expect(threw, "unsupported option rejected");
  return ok;
}

bool settings() {
  ::unsetenv("GIT_CHANGELOG_FORMAT");
  ::unsetenv("GIT_CHANGELOG_MERGEFORMAT");
  ::unsetenv("GIT_CHANGELOG_OPTS");

  GitConfig empty;
  ChangelogSettings s = chronolog::load_settings(empty);
  bool ok = expect(s.format == "  * %s", "default format");
  ok = ok && expect(s.merge_format == "  * %s%n%w(64,4,4)%b", "default merge format");
  ok = ok && expect(s.log.merges == MergeFilter::Any, "default log options");

  GitConfig cfg;
  cfg.load_text("[changelog]\nformat = - %s\nopts = --merges\n[core]\neditor = ed\n");
  s = chronolog::load_settings(cfg);
  ok = ok && expect(s.format == "- %s", "format from config");
  ok = ok && expect(s.log.merges == MergeFilter::MergesOnly, "opts from config");
  ok = ok && expect(s.editor == "ed", "core.editor");

  ::setenv("GIT_CHANGELOG_FORMAT", "* %h %s", 1);
  ::setenv("GIT_CHANGELOG_OPTS", "", 1);
  s = chronolog::load_settings(cfg);
  ok = ok && expect(s.format == "* %h %s", "environment overrides config");
  ok = ok && expect(s.log.merges == MergeFilter::Any, "empty GIT_CHANGELOG_OPTS clears opts");
  ::unsetenv("GIT_CHANGELOG_FORMAT");
  ::unsetenv("GIT_CHANGELOG_OPTS");
  return ok;
}

} // namespace

int main() {
  try {
    if (!parsing() || !log_options() || !settings())
      return 1;
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }
  std::cout << "config OK\n";
  return 0;
}
