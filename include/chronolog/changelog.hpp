#pragma once
#include "chronolog/section.hpp"

#include <optional>
#include <string>

namespace chronolog {

class CancellationToken; // fwd
class CommitFetcher;     // fwd
class RangeSelector;     // fwd

// Pulls boundaries from a selector one at a time, fetches and renders each
// section, and appends the previous changelog text after the new sections.
// Titled sections are separated by a blank line; plain ones form one list.
class ChangelogAssembler {
public:
  ChangelogAssembler(CommitFetcher& fetcher, RenderMode mode,
                     const CancellationToken* cancel = nullptr)
      : fetcher_(fetcher), mode_(mode), cancel_(cancel) {}

  // Throws Cancelled if the token fires; nothing is returned in that case.
  std::string assemble(RangeSelector& selector, const std::optional<std::string>& prior);

private:
  CommitFetcher& fetcher_;
  RenderMode mode_;
  const CancellationToken* cancel_;
};

} // namespace chronolog
