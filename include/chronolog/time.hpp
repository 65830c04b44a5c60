#pragma once
#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <string_view>

namespace chronolog::timeutil {

// "Name <email> 1714412345 +0300" as found on author/committer/tagger lines
struct Signature {
  std::string name;
  std::string email;
  std::int64_t when = 0;  // seconds since the epoch
  int tz_minutes = 0;     // minutes east of UTC
};

enum class DateMode : std::uint8_t { Default, Short, Iso, IsoStrict, Rfc, Unix, Raw };

// Format ±HHMM from minutes (e.g., +180 -> "+0300", -420 -> "-0700")
auto tz_offset_string(int minutes) -> std::string;

// Build "Name <email> 1714412345 +0300"
auto make_signature(const Signature& sig) -> std::string;

// Inverse of make_signature. Malformed trailers leave when/tz at zero.
auto parse_signature(std::string_view line) -> Signature;

// "short", "iso", "iso8601", "iso-strict", "rfc", "rfc2822", "unix", "raw", "default".
auto parse_date_mode(std::string_view name) -> std::optional<DateMode>;

// Render the signature's timestamp in its own zone.
auto format_date(const Signature& sig, DateMode mode) -> std::string;

// Local calendar date of `now` as YYYY-MM-DD.
auto local_date(std::time_t now) -> std::string;

} // namespace chronolog::timeutil
