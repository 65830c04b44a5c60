#include "chronolog/range.hpp"

namespace chronolog {

namespace {

struct RangeSpelling {
  std::string operator()(const AllHistory &) const { return "HEAD"; }
  std::string operator()(const UpTo &r) const { return r.ref; }
  std::string operator()(const Between &r) const { return r.from + ".." + r.to; }
};

} // namespace

std::string to_string(const RangeExpression &range) { return std::visit(RangeSpelling{}, range); }

} // namespace chronolog
