#include "csv_pager/json_writer.hpp"
#include <cmath> // std::isfinite
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <type_traits>

namespace cp {

void write_json_string(std::ostringstream& o, std::string_view s){
  o << '"';
  for (char c : s){
    switch(c){
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      case '\b': o << "\\b";  break;
      case '\f': o << "\\f";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          o << buf;
        } else {
          o << c;
        }
        break;
    }
  }
  o << '"';
}

void write_json_number(std::ostringstream& o, double v){
  if (!std::isfinite(v)) { o << "null"; return; }
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.17g", v);
  // Prefer the shortest representation that reads back identically.
  for (int prec = 1; prec < 17; ++prec) {
    char shorter[32];
    std::snprintf(shorter, sizeof(shorter), "%.*g", prec, v);
    if (std::strtod(shorter, nullptr) == v) { o << shorter; return; }
  }
  o << buf;
}

std::string format_iso8601_ms(std::int64_t epoch_ms) {
  std::int64_t secs = epoch_ms / 1000;
  std::int64_t ms = epoch_ms % 1000;
  if (ms < 0) { ms += 1000; --secs; }
  std::time_t t = static_cast<std::time_t>(secs);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif
  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms));
  return buf;
}

static void write_child(std::ostringstream& o, const ChildValue& v){
  std::visit([&](const auto& x){
    using T = std::decay_t<decltype(x)>;
    if constexpr (std::is_same_v<T, std::nullptr_t>) o << "null";
    else if constexpr (std::is_same_v<T, bool>)      o << (x ? "true" : "false");
    else if constexpr (std::is_same_v<T, double>)    write_json_number(o, x);
    else if constexpr (std::is_same_v<T, std::string>) write_json_string(o, x);
    else o << x.text; // RawJson
  }, v);
}

void write_json_value(std::ostringstream& o, const Value& v){
  std::visit([&](const auto& x){
    using T = std::decay_t<decltype(x)>;
    if constexpr (std::is_same_v<T, std::string>)       write_json_string(o, x);
    else if constexpr (std::is_same_v<T, std::int64_t>) o << x;
    else if constexpr (std::is_same_v<T, double>)       write_json_number(o, x);
    else if constexpr (std::is_same_v<T, bool>)         o << (x ? "true" : "false");
    else if constexpr (std::is_same_v<T, DateTime>)     write_json_string(o, format_iso8601_ms(x.epoch_ms));
    else {
      o << "[";
      for (size_t i=0;i<x.size();++i){
        if (i) o << ",";
        o << "{";
        for (size_t j=0;j<x[i].size();++j){
          if (j) o << ",";
          write_json_string(o, x[i][j].first);
          o << ":";
          write_child(o, x[i][j].second);
        }
        o << "}";
      }
      o << "]";
    }
  }, v);
}

std::string JsonWriter::to_json(const Record& r) {
  std::ostringstream o;
  o << "{";
  bool first=true;
  for (const auto& f : r) {
    if (!first) o << ",";
    first=false;
    write_json_string(o, f.name); o << ":";
    write_json_value(o, f.value);
  }
  o << "}";
  return o.str();
}

std::string JsonWriter::to_json(const PageStats& s) {
  std::ostringstream o;
  o << "{";
  o << "\"rows\":" << s.rows << ",";
  o << "\"blank_rows\":" << s.blank_rows << ",";
  o << "\"bytes\":" << s.bytes << ",";
  o << "\"header_bytes\":" << s.header_bytes << ",";
  o << "\"range_requests\":" << s.range_requests << ",";
  o << "\"headers_from_cursor\":" << (s.headers_from_cursor ? "true" : "false") << ",";
  o << "\"wall_time_ms\":"; write_json_number(o, s.wall_time_ms); o << ",";

  o << "\"stage_times\":[";
  for (size_t i=0;i<s.stages.size();++i){
    if (i) o << ",";
    o << "{\"stage\":"; write_json_string(o, s.stages[i].name);
    o << ",\"duration_ms\":"; write_json_number(o, s.stages[i].duration_ms);
    o << "}";
  }
  o << "],";

  o << "\"errors_by_field\":{";
  bool first=true;
  for (auto& kv : s.errors_by_field) {
    if (!first) o << ",";
    first=false;
    write_json_string(o, kv.first); o << ":" << kv.second;
  }
  o << "}";

  o << "}";
  return o.str();
}

}
