#include "chronolog/tag_index.hpp"

#include "fixture.hpp"

#include <iostream>
#include <string>
#include <vector>

using chronolog::DecoratedCommit;
using chronolog::TagIndex;
using chronolog::test::expect;

namespace {

std::string hex_of(char c) { return std::string(40, c); }

bool parse_records() {
  const std::vector<DecoratedCommit> records = {
      {hex_of('e'), "2024-03-01", " (HEAD -> master, tag: v2.0.0, tag: v2.0.0-rc1, origin/master)"},
      {hex_of('d'), "2024-02-15", " (feature, origin/feature)"},
      {hex_of('c'), "2024-02-01", " (tag: v1.1.0)"},
      {hex_of('b'), "2024-01-01", "(HEAD, tag: v1.0.0)"},
      {hex_of('b'), "2024-01-01", " (tag: v1.0.0-again)"},
      {hex_of('a'), "2023-12-01", " (tag: v1.1.0)"},
      {hex_of('9'), "2023-06-01", ""},
  };
  const TagIndex index = TagIndex::build(records);

  bool ok = expect(index.size() == 3, "three distinct tags");
  ok = ok && expect(index[0].name == "v2.0.0", "first listed tag on a commit wins");
  ok = ok && expect(index[0].date == "2024-03-01", "date carried");
  ok = ok && expect(index[1].name == "v1.1.0", "branch-only record dropped");
  ok = ok && expect(index[2].name == "v1.0.0", "HEAD marker stripped");
  ok = ok && expect(index[2].commit == hex_of('b'), "full commit kept");
  ok = ok && expect(index[2].abbrev() == "bbbbbbb", "short ref is 7 chars");
  ok = ok && expect(index.find("v1.0.0-again") == nullptr, "second record on same commit skipped");
  ok = ok && expect(index.tag_at_commit(hex_of('a')) == nullptr, "duplicate name skipped");
  ok = ok && expect(index.position("v1.1.0") == 1, "position");
  ok = ok && expect(index.position("nope") == index.size(), "position of unknown name");
  return ok;
}

bool empty_index() {
  const TagIndex index = TagIndex::build({{hex_of('1'), "2024-01-01", " (HEAD -> master)"}});
  return expect(index.empty(), "no tag decorations means an empty index");
}

bool from_repository() {
  chronolog::test::TempRepo t("tag_index");
  using chronolog::test::kDay;
  using chronolog::test::kJan2024;

  const auto c1 = t.commit("first", kJan2024);
  const auto c2 = t.commit("second", kJan2024 + kDay);
  const auto c3 = t.commit("third", kJan2024 + 2 * kDay);
  t.commit("fourth", kJan2024 + 3 * kDay);
  t.tag("v0.1", c1);
  t.annotated_tag("v0.2", c2, kJan2024 + kDay);
  t.tag("v0.3", c3);
  t.tag("v0.3-alias", c3);
  t.branch("topic", c2);

  const auto records = chronolog::collect_decorations(t.repo());
  bool ok = expect(records.size() == 3, "one record per decorated tagged commit");
  if (!ok)
    return false;
  ok = ok && expect(records[0].commit == c3, "newest first");
  ok = ok && expect(records[0].decoration == " (tag: v0.3-alias, tag: v0.3)",
                    "tags in descending name order");
  ok = ok && expect(records[1].decoration == " (tag: v0.2, topic)", "branches after tags");
  ok = ok && expect(records[1].date == "2024-01-02", "author date, short");

  const TagIndex index = TagIndex::build(records);
  ok = ok && expect(index.size() == 3, "three tags");
  ok = ok && expect(index[0].name == "v0.3-alias", "first listed tag on c3");
  ok = ok && expect(index[1].name == "v0.2" && index[1].commit == c2, "annotated tag peeled");
  ok = ok && expect(index[2].name == "v0.1", "oldest last");
  return ok;
}

} // namespace

int main() {
  try {
    if (!parse_records() || !empty_index() || !from_repository())
      return 1;
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }
  std::cout << "tag index OK\n";
  return 0;
}
