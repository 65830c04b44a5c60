#include "chronolog/time.hpp"

#include <array>
#include <charconv>
#include <cstdio>
#include <system_error>

#if defined(_WIN32)
#include <time.h>
#include <windows.h>
static void gmtime_portable(const std::time_t *t, std::tm *out) { gmtime_s(out, t); }
static void localtime_portable(const std::time_t *t, std::tm *out) { localtime_s(out, t); }
#else
static void gmtime_portable(const std::time_t *t, std::tm *out) { gmtime_r(t, out); }
static void localtime_portable(const std::time_t *t, std::tm *out) { localtime_r(t, out); }
#endif

namespace chronolog::timeutil {

namespace {

constexpr std::array<const char *, 7> kWeekdays = {"Sun", "Mon", "Tue", "Wed",
                                                   "Thu", "Fri", "Sat"};
constexpr std::array<const char *, 12> kMonths = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                                  "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

// Broken-down wall clock time in the zone `tz_minutes` east of UTC.
std::tm wall_clock(std::int64_t when, int tz_minutes) {
  const auto shifted = static_cast<std::time_t>(when + static_cast<std::int64_t>(tz_minutes) * 60);
  std::tm tm{};
  gmtime_portable(&shifted, &tm);
  return tm;
}

std::string tz_colon_string(int minutes) {
  std::array<char, 8> buf{};
  const char sign = minutes >= 0 ? '+' : '-';
  const int m = minutes >= 0 ? minutes : -minutes;
  std::snprintf(buf.data(), buf.size(), "%c%02d:%02d", sign, m / 60, m % 60);
  return {buf.data()};
}

} // namespace

std::string tz_offset_string(int minutes) {
  std::array<char, 8> buf{};
  const char sign = minutes >= 0 ? '+' : '-';
  const int m = minutes >= 0 ? minutes : -minutes;
  std::snprintf(buf.data(), buf.size(), "%c%02d%02d", sign, m / 60, m % 60);
  return {buf.data()};
}

std::string make_signature(const Signature &sig) {
  return sig.name + " <" + sig.email + "> " + std::to_string(static_cast<long long>(sig.when)) +
         " " + tz_offset_string(sig.tz_minutes);
}

Signature parse_signature(std::string_view line) {
  Signature sig;
  const auto lt = line.find('<');
  const auto gt = line.find('>', lt == std::string_view::npos ? 0 : lt);
  if (lt == std::string_view::npos || gt == std::string_view::npos) {
    sig.name = std::string(line);
    return sig;
  }
  std::string_view name = line.substr(0, lt);
  while (!name.empty() && name.back() == ' ')
    name.remove_suffix(1);
  sig.name = std::string(name);
  sig.email = std::string(line.substr(lt + 1, gt - lt - 1));

  std::string_view rest = line.substr(gt + 1);
  while (!rest.empty() && rest.front() == ' ')
    rest.remove_prefix(1);
  const auto sp = rest.find(' ');
  const std::string_view epoch = rest.substr(0, sp);
  std::int64_t when = 0;
  if (std::from_chars(epoch.data(), epoch.data() + epoch.size(), when).ec != std::errc{})
    return sig;
  sig.when = when;

  if (sp == std::string_view::npos)
    return sig;
  const std::string_view tz = rest.substr(sp + 1);
  if (tz.size() == 5 && (tz[0] == '+' || tz[0] == '-')) {
    int hhmm = 0;
    if (std::from_chars(tz.data() + 1, tz.data() + tz.size(), hhmm).ec == std::errc{}) {
      const int minutes = (hhmm / 100) * 60 + (hhmm % 100);
      sig.tz_minutes = tz[0] == '-' ? -minutes : minutes;
    }
  }
  return sig;
}

std::optional<DateMode> parse_date_mode(std::string_view name) {
  if (name == "default" || name == "normal")
    return DateMode::Default;
  if (name == "short")
    return DateMode::Short;
  if (name == "iso" || name == "iso8601")
    return DateMode::Iso;
  if (name == "iso-strict" || name == "iso8601-strict")
    return DateMode::IsoStrict;
  if (name == "rfc" || name == "rfc2822")
    return DateMode::Rfc;
  if (name == "unix")
    return DateMode::Unix;
  if (name == "raw")
    return DateMode::Raw;
  return std::nullopt;
}

std::string format_date(const Signature &sig, DateMode mode) {
  if (mode == DateMode::Unix)
    return std::to_string(static_cast<long long>(sig.when));
  if (mode == DateMode::Raw)
    return std::to_string(static_cast<long long>(sig.when)) + " " +
           tz_offset_string(sig.tz_minutes);

  const std::tm tm = wall_clock(sig.when, sig.tz_minutes);
  std::array<char, 64> buf{};
  switch (mode) {
  case DateMode::Short:
    std::snprintf(buf.data(), buf.size(), "%04d-%02d-%02d", tm.tm_year + 1900, tm.tm_mon + 1,
                  tm.tm_mday);
    return {buf.data()};
  case DateMode::Iso:
    std::snprintf(buf.data(), buf.size(), "%04d-%02d-%02d %02d:%02d:%02d %s", tm.tm_year + 1900,
                  tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec,
                  tz_offset_string(sig.tz_minutes).c_str());
    return {buf.data()};
  case DateMode::IsoStrict: {
    const std::string zone = sig.tz_minutes == 0 ? "Z" : tz_colon_string(sig.tz_minutes);
    std::snprintf(buf.data(), buf.size(), "%04d-%02d-%02dT%02d:%02d:%02d%s", tm.tm_year + 1900,
                  tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, zone.c_str());
    return {buf.data()};
  }
  case DateMode::Rfc:
    std::snprintf(buf.data(), buf.size(), "%s, %d %s %04d %02d:%02d:%02d %s",
                  kWeekdays[tm.tm_wday], tm.tm_mday, kMonths[tm.tm_mon], tm.tm_year + 1900,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, tz_offset_string(sig.tz_minutes).c_str());
    return {buf.data()};
  default:
    std::snprintf(buf.data(), buf.size(), "%s %s %d %02d:%02d:%02d %04d %s",
                  kWeekdays[tm.tm_wday], kMonths[tm.tm_mon], tm.tm_mday, tm.tm_hour, tm.tm_min,
                  tm.tm_sec, tm.tm_year + 1900, tz_offset_string(sig.tz_minutes).c_str());
    return {buf.data()};
  }
}

std::string local_date(std::time_t now) {
  std::tm tm{};
  localtime_portable(&now, &tm);
  std::array<char, 16> buf{};
  std::snprintf(buf.data(), buf.size(), "%04d-%02d-%02d", tm.tm_year + 1900, tm.tm_mon + 1,
                tm.tm_mday);
  return {buf.data()};
}

} // namespace chronolog::timeutil
