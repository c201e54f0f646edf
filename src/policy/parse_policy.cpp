#include "csv_pager/parse_policy.hpp"
#include "csv_pager/date_parse.hpp"
#include <charconv>
#include <cctype>
#include <cmath>
#include <string_view>
#include <fast_float/fast_float.h>

namespace cp {

static bool ieq(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
  return true;
}

// fast_float and from_chars reject a leading '+'.
static std::string_view drop_plus(std::string_view s) {
  if (s.size() > 1 && s[0] == '+' && s[1] != '-' && s[1] != '+') s.remove_prefix(1);
  return s;
}

std::optional<double> ParsePolicy::parse_number(std::string_view s) const {
  s = drop_plus(s);
  if (s.empty()) return std::nullopt;
  double out;
  auto [ptr, ec] = fast_float::from_chars(s.data(), s.data() + s.size(), out);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return out;
}

std::optional<std::int64_t> ParsePolicy::parse_int64(std::string_view s) const {
  std::string_view t = drop_plus(s);
  std::int64_t v = 0;
  auto [ptr, ec] = std::from_chars(t.data(), t.data() + t.size(), v);
  if (!t.empty() && ec == std::errc() && ptr == t.data() + t.size()) return v;

  auto d = parse_number(s);
  if (!d || !std::isfinite(*d) || std::trunc(*d) != *d) return std::nullopt;
  // [-2^63, 2^63) is exactly representable at both ends.
  if (*d < -9223372036854775808.0 || *d >= 9223372036854775808.0) return std::nullopt;
  return static_cast<std::int64_t>(*d);
}

std::optional<std::int64_t> ParsePolicy::parse_date(std::string_view s) const {
  if (dates.mode == "iso8601") return parse_iso8601_ms(s);
  return std::nullopt;
}

std::optional<bool> ParsePolicy::parse_bool(std::string_view s) const {
  for (const auto& t : bools.true_tokens) {
    if (bools.case_sensitive ? (s == t) : ieq(s, t)) return true;
  }
  for (const auto& f : bools.false_tokens) {
    if (bools.case_sensitive ? (s == f) : ieq(s, f)) return false;
  }
  return std::nullopt;
}

}
