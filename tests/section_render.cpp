#include "chronolog/section.hpp"

#include "chronolog/util.hpp"
#include "fixture.hpp"

#include <iostream>
#include <string>
#include <vector>

using chronolog::RenderMode;
using chronolog::render_section;
using chronolog::test::expect;

int main() {
  const std::vector<std::string> lines = {"  * Add parser", "  * * Fix crash", "  * *ptr deref"};

  const auto plain = render_section(RenderMode::Plain, "ignored", "ignored", lines);
  if (!expect(plain == "  * Add parser\n  * Fix crash\n  * *ptr deref\n", "plain list"))
    return 1;

  const auto titled = render_section(RenderMode::Titled, "v1.0.0", "2024-01-01", lines);
  const std::string expected = "v1.0.0 / 2024-01-01\n"
                               "===================\n"
                               "\n"
                               "  * Add parser\n"
                               "  * Fix crash\n"
                               "  * *ptr deref\n";
  if (!expect(titled == expected, "titled block"))
    return 1;

  // underline counts characters, not bytes
  const auto unicode = render_section(RenderMode::Titled, "versión-ß", "2024-01-01", {});
  const auto nl = unicode.find('\n');
  const std::string heading = unicode.substr(0, nl);
  const std::string underline = unicode.substr(nl + 1, unicode.find('\n', nl + 1) - nl - 1);
  if (!expect(underline.size() == chronolog::strutil::utf8_length(heading) &&
                  underline.size() < heading.size(),
              "underline length equals heading character count"))
    return 1;
  if (!expect(underline.find_first_not_of('=') == std::string::npos, "underline is all '='"))
    return 1;

  if (!expect(render_section(RenderMode::Plain, "", "", {}).empty(), "empty plain section"))
    return 1;
  if (!expect(chronolog::normalize_bullet("* * top") == "* top", "unindented double bullet"))
    return 1;
  if (!expect(chronolog::normalize_bullet("    ") == "    ", "blank line untouched"))
    return 1;
  if (!expect(chronolog::normalize_bullet("  - - Drop flag") == "  - Drop flag", "dash bullets"))
    return 1;
  if (!expect(chronolog::normalize_bullet("  * - mixed") == "  * - mixed", "mixed bullets kept"))
    return 1;

  std::cout << "section render OK\n";
  return 0;
}
