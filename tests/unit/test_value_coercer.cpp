#include "csv_pager/value_coercer.hpp"
#include <cstdint>
#include <iostream>
#include <string>
#include <variant>

static const char* kAliases =
  "[{\"alias\": \"Shane Hester\", \"primary\": true},{\"alias\": \"Cheyne Hester\", \"primary\": false}]";

int main(){
  const std::vector<std::string> headers = {
    "Score", "Count", "Active", "Joined", "KnownAliases", "Raw", "Notes"};
  cp::AttributeTypeMap types = {
    {"Score", cp::AttributeType::Double},
    {"Count", cp::AttributeType::Int64},
    {"Active", cp::AttributeType::Bool},
    {"Joined", cp::AttributeType::DateTime},
    {"Raw", cp::AttributeType::ListOfObject},
    {"Notes", cp::AttributeType::String},
    {"NotInHeader", cp::AttributeType::Int64},
  };
  cp::ValueCoercer co(headers, types);
  cp::ParsePolicy strict;
  strict.extended_types = true;
  cp::ValueCoercer ext(headers, types, strict);
  if (co.type_for(4).has_value()) { std::cerr << "[FAIL] untyped column got a type\n"; return 1; }

  cp::Value v;
  cp::Error err;

  // --- Double
  if (!co.coerce(0, "1.1", v, &err) || std::get<double>(v) != 1.1) { std::cerr << "[FAIL] 1.1\n"; return 1; }
  if (!co.coerce(0, "-3e2", v, &err) || std::get<double>(v) != -300.0) { std::cerr << "[FAIL] -3e2\n"; return 1; }
  if (co.coerce(0, "not_a_number", v, &err)) { std::cerr << "[FAIL] not_a_number accepted\n"; return 1; }
  if (err.kind != cp::ErrorKind::ValueCoercion ||
      err.message.find("invalid numeric value \"not_a_number\" in column \"Score\"") == std::string::npos) {
    std::cerr << "[FAIL] numeric error message: " << err.message << "\n"; return 1;
  }
  if (co.coerce(0, "", v, &err)) { std::cerr << "[FAIL] empty numeric cell accepted\n"; return 1; }
  if (co.coerce(0, "1.5x", v, &err)) { std::cerr << "[FAIL] trailing junk accepted\n"; return 1; }

  // --- Int64
  if (!co.coerce(1, "25", v, &err) || std::get<std::int64_t>(v) != 25) { std::cerr << "[FAIL] 25\n"; return 1; }
  if (!co.coerce(1, "+7", v, &err) || std::get<std::int64_t>(v) != 7) { std::cerr << "[FAIL] +7\n"; return 1; }
  if (!co.coerce(1, "4.0", v, &err) || std::get<std::int64_t>(v) != 4) { std::cerr << "[FAIL] 4.0\n"; return 1; }
  if (!co.coerce(1, "9223372036854775807", v, &err) || std::get<std::int64_t>(v) != INT64_MAX) {
    std::cerr << "[FAIL] int64 max\n"; return 1;
  }
  // Any other float literal is kept as a double.
  if (!co.coerce(1, "4.5", v, &err) || std::get<double>(v) != 4.5) { std::cerr << "[FAIL] 4.5 as Int64\n"; return 1; }
  if (!co.coerce(1, "1e30", v, &err) || std::get<double>(v) != 1e30) { std::cerr << "[FAIL] 1e30 as Int64\n"; return 1; }
  if (co.coerce(1, "seven", v, &err) || err.kind != cp::ErrorKind::ValueCoercion ||
      err.message.find("invalid numeric value \"seven\" in column \"Count\"") == std::string::npos) {
    std::cerr << "[FAIL] non-numeric Int64: " << err.message << "\n"; return 1;
  }

  // --- Bool, DateTime, ListOfObject pass through unless extended typing is on
  if (!co.coerce(2, "yes", v, &err) || std::get<std::string>(v) != "yes") { std::cerr << "[FAIL] bool passthrough\n"; return 1; }
  if (!co.coerce(2, "TRUE", v, &err) || std::get<std::string>(v) != "TRUE") { std::cerr << "[FAIL] TRUE passthrough\n"; return 1; }
  if (!co.coerce(3, "12/23/2021", v, &err) || std::get<std::string>(v) != "12/23/2021") {
    std::cerr << "[FAIL] date passthrough\n"; return 1;
  }
  if (!co.coerce(5, "plain text", v, &err) || std::get<std::string>(v) != "plain text") {
    std::cerr << "[FAIL] list passthrough\n"; return 1;
  }
  {
    cp::ValueCoercer mixed({"i", "b", "d", "l"}, {{"i", cp::AttributeType::Int64},
                                                  {"b", cp::AttributeType::Bool},
                                                  {"d", cp::AttributeType::DateTime},
                                                  {"l", cp::AttributeType::ListOfObject}});
    const char* cells[] = {"1.5", "yes", "12/23/2021", "plain text"};
    for (std::size_t i = 0; i < 4; ++i) {
      if (!mixed.coerce(i, cells[i], v, &err)) { std::cerr << "[FAIL] mixed " << cells[i] << ": " << err.message << "\n"; return 1; }
    }
    if (std::get<std::string>(v) != "plain text") { std::cerr << "[FAIL] mixed list cell\n"; return 1; }
  }

  // --- Bool (extended)
  if (!ext.coerce(2, "TRUE", v, &err) || std::get<bool>(v) != true) { std::cerr << "[FAIL] TRUE\n"; return 1; }
  if (!ext.coerce(2, "0", v, &err) || std::get<bool>(v) != false) { std::cerr << "[FAIL] 0\n"; return 1; }
  if (ext.coerce(2, "yes", v, &err) || err.message.find("invalid boolean value") == std::string::npos) {
    std::cerr << "[FAIL] yes accepted\n"; return 1;
  }

  // --- DateTime (extended)
  if (!ext.coerce(3, "2021-12-23", v, &err) || std::get<cp::DateTime>(v).epoch_ms != 1640217600000LL) {
    std::cerr << "[FAIL] date only\n"; return 1;
  }
  if (!ext.coerce(3, "2020-03-30T12:30:15+02:00", v, &err) || std::get<cp::DateTime>(v).epoch_ms != 1585564215000LL) {
    std::cerr << "[FAIL] date with offset\n"; return 1;
  }
  if (ext.coerce(3, "2020-13-01", v, &err)) { std::cerr << "[FAIL] month 13 accepted\n"; return 1; }
  if (ext.coerce(3, "2024-02-30", v, &err)) { std::cerr << "[FAIL] Feb 30 accepted\n"; return 1; }

  // --- untyped JSON detection
  if (!co.coerce(4, kAliases, v, &err)) { std::cerr << "[FAIL] aliases: " << err.message << "\n"; return 1; }
  {
    const auto& list = std::get<cp::ListOfObject>(v);
    if (list.size() != 2 || list[0].size() != 2) { std::cerr << "[FAIL] aliases shape\n"; return 1; }
    if (list[0][0].first != "alias" || std::get<std::string>(list[0][0].second) != "Shane Hester") {
      std::cerr << "[FAIL] alias field\n"; return 1;
    }
    if (list[0][1].first != "primary" || std::get<bool>(list[0][1].second) != true) { std::cerr << "[FAIL] primary field\n"; return 1; }
    if (std::get<bool>(list[1][1].second) != false) { std::cerr << "[FAIL] second primary\n"; return 1; }
  }
  // Not closed with }] -> stays a string.
  const std::string truncated = "[{\"alias\": \"Decker Jaime\", \"primary\": true}";
  if (!co.coerce(4, truncated, v, &err) || std::get<std::string>(v) != truncated) {
    std::cerr << "[FAIL] truncated JSON should stay a string\n"; return 1;
  }
  if (co.coerce(4, "[{\"alias\":\"X\",}]", v, &err) || err.kind != cp::ErrorKind::ValueCoercion) {
    std::cerr << "[FAIL] malformed JSON accepted\n"; return 1;
  }
  if (!co.coerce(4, "  [{\"a\":1}]  ", v, &err) || std::get<cp::ListOfObject>(v).size() != 1) {
    std::cerr << "[FAIL] surrounding whitespace\n"; return 1;
  }

  // --- explicit ListOfObject (extended): nested values kept raw, last duplicate wins
  if (!ext.coerce(5, "[{\"n\":null,\"o\":{\"b\":1},\"k\":1,\"k\":2}]", v, &err)) {
    std::cerr << "[FAIL] nested: " << err.message << "\n"; return 1;
  }
  {
    const auto& obj = std::get<cp::ListOfObject>(v).at(0);
    if (obj.size() != 3) { std::cerr << "[FAIL] nested field count " << obj.size() << "\n"; return 1; }
    if (!std::holds_alternative<std::nullptr_t>(obj[0].second)) { std::cerr << "[FAIL] null\n"; return 1; }
    if (std::get<cp::RawJson>(obj[1].second) != cp::RawJson{"{\"b\":1}"}) { std::cerr << "[FAIL] raw nested\n"; return 1; }
    if (std::get<double>(obj[2].second) != 2.0) { std::cerr << "[FAIL] duplicate key\n"; return 1; }
  }
  if (!ext.coerce(5, "[]", v, &err) || !std::get<cp::ListOfObject>(v).empty()) { std::cerr << "[FAIL] empty list\n"; return 1; }
  if (ext.coerce(5, "[1,2]", v, &err)) { std::cerr << "[FAIL] non-object elements accepted\n"; return 1; }

  // --- explicit String keeps JSON-looking text
  if (!co.coerce(6, kAliases, v, &err) || std::get<std::string>(v) != kAliases) {
    std::cerr << "[FAIL] String column was expanded\n"; return 1;
  }

  std::cout << "[PASS] value coercion\n";
  return 0;
}
