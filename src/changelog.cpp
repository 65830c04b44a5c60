#include "chronolog/changelog.hpp"

#include "chronolog/cancel.hpp"
#include "chronolog/commit_fetcher.hpp"
#include "chronolog/consts.hpp"
#include "chronolog/range_selector.hpp"

namespace chronolog {

std::string ChangelogAssembler::assemble(RangeSelector &selector,
                                         const std::optional<std::string> &prior) {
  std::string out;
  bool first = true;
  for (;;) {
    if (cancel_ != nullptr)
      cancel_->throw_if_cancelled();
    const auto boundary = selector.next();
    if (!boundary)
      break;
    const auto lines = fetcher_.fetch(boundary->range);
    if (mode_ == RenderMode::Titled && !first)
      out += consts::kLF;
    out += render_section(mode_, boundary->title, boundary->date, lines);
    first = false;
  }

  if (prior && !prior->empty()) {
    if (!out.empty())
      out += consts::kLF;
    out += *prior;
  }
  return out;
}

} // namespace chronolog
