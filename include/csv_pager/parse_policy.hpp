#pragma once
#include <cstdint>
#include <optional>
#include <string_view>
#include <string>
#include <vector>

namespace cp {

struct DatePolicy {
  // e.g. "iso8601"
  std::string mode = "iso8601";
};

struct BoolPolicy {
  std::vector<std::string> true_tokens  = {"true","1"};
  std::vector<std::string> false_tokens = {"false","0"};
  bool case_sensitive = false;
};

struct ParsePolicy {
  DatePolicy dates;
  BoolPolicy bools;

  // Off: Bool, DateTime and ListOfObject columns pass the raw cell through
  // as a string. On: they are parsed and a bad cell fails the page.
  bool extended_types = false;

  // Whole input must be a number (fast_float).
  std::optional<double> parse_number(std::string_view s) const;

  // Exact integer; integral floating literals ("4.0", "1e3") within range
  // are accepted as well. Non-integral input is nullopt.
  std::optional<std::int64_t> parse_int64(std::string_view s) const;

  // Milliseconds since epoch.
  std::optional<std::int64_t> parse_date(std::string_view s) const;

  std::optional<bool> parse_bool(std::string_view s) const;
};

}
