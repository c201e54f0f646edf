#include "csv_pager/date_parse.hpp"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <string_view>

// Small ISO-8601 subset (YYYY-MM-DD[THH:MM:SS[.fff]][Z|+HH:MM|-HH:MM]).
// Fractions beyond milliseconds are truncated.

namespace cp {

static bool is_digit(char c){ return c>='0' && c<='9'; }

static int days_in_month(int y, int m) {
  static const int kDays[] = {31,28,31,30,31,30,31,31,30,31,30,31};
  const bool leap = (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
  return (m == 2 && leap) ? 29 : kDays[m - 1];
}

static bool parse_int(std::string_view s, int& out) {
  if (s.empty()) return false;
  int v = 0;
  for (char c : s) { if (!is_digit(c)) return false; v = v*10 + (c - '0'); }
  out = v; return true;
}

std::optional<std::int64_t> parse_iso8601_ms(std::string_view s) {
  if (s.size() < 10) return std::nullopt;
  int Y,M,D,h=0,m=0,sec=0,ms=0;

  if (!(parse_int(s.substr(0,4), Y) && s[4]=='-' && parse_int(s.substr(5,2), M) && s[7]=='-' && parse_int(s.substr(8,2), D)))
    return std::nullopt;
  if (M < 1 || M > 12 || D < 1 || D > days_in_month(Y, M)) return std::nullopt;

  size_t i = 10;
  int offset_min = 0;
  if (i < s.size() && (s[i]=='T' || s[i]==' ')) {
    ++i;
    if (i+8 > s.size()) return std::nullopt;
    if (!(parse_int(s.substr(i,2), h) && s[i+2]==':' && parse_int(s.substr(i+3,2), m) && s[i+5]==':' && parse_int(s.substr(i+6,2), sec)))
      return std::nullopt;
    if (h > 23 || m > 59 || sec > 60) return std::nullopt;
    i += 8;
    if (i < s.size() && s[i]=='.') {
      size_t j=i+1, k=j;
      while (k < s.size() && is_digit(s[k])) ++k;
      if (k == j) return std::nullopt;
      int frac=0; parse_int(s.substr(j, std::min<size_t>(k-j, 3)), frac);
      if ((k-j)==1) ms = frac*100;
      else if ((k-j)==2) ms = frac*10;
      else ms = frac;
      i = k;
    }
    if (i < s.size() && s[i]=='Z') {
      ++i;
    } else if (i < s.size() && (s[i]=='+' || s[i]=='-')) {
      const int sign = (s[i]=='-') ? -1 : 1;
      int oh=0, om=0;
      std::string_view rest = s.substr(i+1);
      if (rest.size()==5 && rest[2]==':' && parse_int(rest.substr(0,2), oh) && parse_int(rest.substr(3,2), om)) {
        i += 6;
      } else if (rest.size()==4 && parse_int(rest.substr(0,2), oh) && parse_int(rest.substr(2,2), om)) {
        i += 5;
      } else {
        return std::nullopt;
      }
      if (oh > 23 || om > 59) return std::nullopt;
      offset_min = sign * (oh*60 + om);
    }
  }
  if (i != s.size()) return std::nullopt;

  std::tm tm{}; tm.tm_year = Y - 1900; tm.tm_mon = M - 1; tm.tm_mday = D;
  tm.tm_hour = h; tm.tm_min = m; tm.tm_sec = sec;

#if defined(_WIN32)
  std::time_t t = _mkgmtime(&tm);
#else
  std::time_t t = timegm(&tm);
#endif
  // -1 is also 1969-12-31T23:59:59Z.
  if (t == (std::time_t)-1 && !(Y == 1969 && M == 12 && D == 31 && h == 23 && m == 59 && sec == 59))
    return std::nullopt;

  using namespace std::chrono;
  auto ms_epoch = duration_cast<milliseconds>(system_clock::from_time_t(t).time_since_epoch()).count();
  return static_cast<std::int64_t>(ms_epoch + ms) - static_cast<std::int64_t>(offset_min) * 60 * 1000;
}

}
