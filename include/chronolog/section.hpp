#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace chronolog {

enum class RenderMode : unsigned char { Plain, Titled };

// "  * * x" -> "  * x" and "- - x" -> "- x"; other lines are returned unchanged.
std::string normalize_bullet(std::string_view line);

// Plain: the lines, one per row. Titled: "title / date", a '=' underline as
// long as that heading in characters, a blank line, then the lines.
// The block always ends with a newline; an empty Plain section is empty.
std::string render_section(RenderMode mode, std::string_view title, std::string_view date,
                           const std::vector<std::string>& lines);

} // namespace chronolog
