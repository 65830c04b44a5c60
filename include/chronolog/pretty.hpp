#pragma once
#include "chronolog/repo.hpp"
#include "chronolog/time.hpp"

#include <string>
#include <string_view>

namespace chronolog::pretty {

// Expand a `git log --pretty=format:` template for one commit.
//
//   %H %h  commit id / abbreviated       %T %t  tree id / abbreviated
//   %P %p  parent ids / abbreviated      %an %ae %ad %at %ai %aI %as  author
//   %cn %ce %cd %ct %ci %cI %cs  committer (same letters as author)
//   %s subject   %b body   %B raw message   %n newline   %% percent   %xNN byte
//   %w(width,indent1,indent2)  wrap everything that follows
//   %C...  colors; dropped, output is never colored
//
// Anything else after '%' is copied through unchanged, as git does.
std::string format_commit(std::string_view format, std::string_view commit_hex,
                          const Repository::CommitInfo& info, timeutil::DateMode date_mode);

// First paragraph of a message with its lines joined by single spaces.
std::string subject_of(std::string_view message);

// Everything after the first paragraph, leading blank lines removed.
std::string body_of(std::string_view message);

// Reflow `text` to `width` columns; the first output line is indented by
// `indent1`, every later one by `indent2`. Blank lines and lines starting with
// punctuation keep their hard breaks. With width <= 0 lines are only indented.
std::string wrap_text(std::string_view text, int width, int indent1, int indent2);

} // namespace chronolog::pretty
