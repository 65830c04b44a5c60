#include "chronolog/section.hpp"

#include "chronolog/consts.hpp"
#include "chronolog/util.hpp"

namespace chronolog {

namespace {

constexpr std::string_view kBullets[] = {"* ", "- "};

} // namespace

std::string normalize_bullet(std::string_view line) {
  const auto indent = line.find_first_not_of(' ');
  if (indent == std::string_view::npos)
    return std::string(line);
  const auto rest = line.substr(indent);
  for (const auto bullet : kBullets) {
    if (rest.substr(0, bullet.size()) == bullet &&
        rest.substr(bullet.size(), bullet.size()) == bullet)
      return std::string(line.substr(0, indent)) + std::string(rest.substr(bullet.size()));
  }
  return std::string(line);
}

std::string render_section(RenderMode mode, std::string_view title, std::string_view date,
                           const std::vector<std::string> &lines) {
  std::string out;
  if (mode == RenderMode::Titled) {
    std::string heading = std::string(title) + " / " + std::string(date);
    out += heading;
    out += consts::kLF;
    out.append(strutil::utf8_length(heading), consts::kUnderline);
    out += consts::kLF;
    out += consts::kLF;
  }
  for (const auto &line : lines) {
    out += normalize_bullet(line);
    out += consts::kLF;
  }
  return out;
}

} // namespace chronolog
