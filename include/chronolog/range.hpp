#pragma once
#include <string>
#include <variant>

namespace chronolog {

// What a user asked to bound the changelog by.
struct NoBound {};
struct TagName {
  std::string name;
};
struct CommitRef {
  std::string ref;
};
using RangeBound = std::variant<NoBound, TagName, CommitRef>;

// Which commits one section covers. Refs are revision strings (tag names or ids).
struct AllHistory {            // everything reachable from HEAD
  bool operator==(const AllHistory &) const = default;
};
struct UpTo {                  // everything reachable from `ref`
  std::string ref;
  bool operator==(const UpTo &) const = default;
};
struct Between {               // reachable from `to` (HEAD when empty) but not from `from`
  std::string from;
  std::string to;
  bool operator==(const Between &) const = default;
};
using RangeExpression = std::variant<AllHistory, UpTo, Between>;

// git-style spelling: "HEAD", "v1.0", "v0.9..v1.0", "v1.0.."
std::string to_string(const RangeExpression &range);

} // namespace chronolog
