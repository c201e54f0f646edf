#pragma once
#include "csv_pager/metrics.hpp"
#include "csv_pager/value.hpp"
#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>

namespace cp {

// Quoted, escaped JSON string.
void write_json_string(std::ostringstream& o, std::string_view s);

// Shortest round-tripping form; non-finite values become null.
void write_json_number(std::ostringstream& o, double v);

void write_json_value(std::ostringstream& o, const Value& v);

class JsonWriter {
public:
  // One record as a JSON object, keys in header order. DateTime is written as
  // an ISO-8601 UTC string.
  static std::string to_json(const Record& r);
  static std::string to_json(const PageStats& s);
};

// Epoch millis -> "YYYY-MM-DDTHH:MM:SS.fffZ".
std::string format_iso8601_ms(std::int64_t epoch_ms);

}
