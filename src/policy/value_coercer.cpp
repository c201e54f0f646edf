#include "csv_pager/value_coercer.hpp"
#include <simdjson.h>
#include <string>
#include <string_view>

namespace cp {

namespace {

std::string_view trim(std::string_view s) {
  const char* ws = " \t\r\n";
  auto b = s.find_first_not_of(ws);
  if (b == std::string_view::npos) return {};
  auto e = s.find_last_not_of(ws);
  return s.substr(b, e - b + 1);
}

bool looks_like_list_of_objects(std::string_view s) {
  s = trim(s);
  return s.size() >= 4 && s.substr(0, 2) == "[{" && s.substr(s.size() - 2) == "}]";
}

ChildValue child_value(simdjson::ondemand::value v) {
  switch (v.type().value()) {
    case simdjson::ondemand::json_type::number:
      return double(v.get_double());
    case simdjson::ondemand::json_type::string:
      return std::string(std::string_view(v.get_string()));
    case simdjson::ondemand::json_type::boolean:
      return bool(v.get_bool());
    case simdjson::ondemand::json_type::null:
      if (!v.is_null()) throw simdjson::simdjson_error(simdjson::INCORRECT_TYPE);
      return nullptr;
    default: {
      std::string_view raw = v.raw_json();
      return RawJson{std::string(trim(raw))};
    }
  }
}

}

bool parse_list_of_objects(std::string_view json, ListOfObject& out, std::string* err_out) {
  thread_local simdjson::ondemand::parser parser;
  thread_local std::string scratch;

  scratch.assign(json.data(), json.size());
  scratch.resize(json.size() + simdjson::SIMDJSON_PADDING, '\0');
  simdjson::padded_string_view view(scratch.data(), json.size(), scratch.size());

  ListOfObject list;
  try {
    simdjson::ondemand::document doc = parser.iterate(view);
    simdjson::ondemand::array arr = doc.get_array();
    for (auto elem : arr) {
      simdjson::ondemand::object obj = elem.get_object();
      ChildObject child;
      for (auto field : obj) {
        std::string key(std::string_view(field.unescaped_key()));
        ChildValue cv = child_value(field.value());
        bool replaced = false;
        for (auto& kv : child) {
          if (kv.first == key) { kv.second = std::move(cv); replaced = true; break; } // last one wins
        }
        if (!replaced) child.emplace_back(std::move(key), std::move(cv));
      }
      list.push_back(std::move(child));
    }
    if (!doc.at_end()) {
      if (err_out) *err_out = "trailing content after JSON array";
      return false;
    }
  } catch (const simdjson::simdjson_error& e) {
    if (err_out) *err_out = e.what();
    return false;
  }
  out = std::move(list);
  return true;
}

ValueCoercer::ValueCoercer(std::vector<std::string> headers, const AttributeTypeMap& types,
                           ParsePolicy policy)
  : headers_(std::move(headers)), types_(headers_.size()), policy_(std::move(policy)) {
  for (std::size_t i = 0; i < headers_.size(); ++i) {
    auto it = types.find(headers_[i]);
    if (it != types.end()) types_[i] = it->second;
  }
}

static bool coercion_error(Error* err_out, const std::string& col, std::string_view raw,
                           const char* what, const std::string& detail = {}) {
  std::string msg = "CSV contains invalid ";
  msg += what;
  msg += " value \"";
  msg.append(raw.data(), raw.size());
  msg += "\" in column \"" + col + "\"";
  if (!detail.empty()) msg += ": " + detail;
  return fail(err_out, ErrorKind::ValueCoercion, std::move(msg));
}

bool ValueCoercer::coerce(std::size_t col, std::string_view raw, Value& out, Error* err_out) const {
  const std::string& name = headers_[col];
  const auto type = types_[col];

  if (!type || *type == AttributeType::String) {
    if (!type && looks_like_list_of_objects(raw)) {
      ListOfObject list;
      std::string jerr;
      if (!parse_list_of_objects(trim(raw), list, &jerr)) {
        return coercion_error(err_out, name, raw, "JSON", jerr);
      }
      out = std::move(list);
      return true;
    }
    out = std::string(raw);
    return true;
  }

  switch (*type) {
    case AttributeType::Double: {
      auto v = policy_.parse_number(raw);
      if (!v) return coercion_error(err_out, name, raw, "numeric");
      out = *v;
      return true;
    }
    case AttributeType::Int64: {
      // Exact when the cell is an integer; any other float literal is kept
      // as a double rather than rejected.
      if (auto i = policy_.parse_int64(raw)) { out = *i; return true; }
      auto v = policy_.parse_number(raw);
      if (!v) return coercion_error(err_out, name, raw, "numeric");
      out = *v;
      return true;
    }
    case AttributeType::Bool: {
      if (!policy_.extended_types) break;
      auto v = policy_.parse_bool(raw);
      if (!v) return coercion_error(err_out, name, raw, "boolean");
      out = *v;
      return true;
    }
    case AttributeType::DateTime: {
      if (!policy_.extended_types) break;
      auto v = policy_.parse_date(raw);
      if (!v) return coercion_error(err_out, name, raw, "datetime");
      out = DateTime{*v};
      return true;
    }
    case AttributeType::ListOfObject: {
      if (!policy_.extended_types) break;
      ListOfObject list;
      std::string jerr;
      if (!parse_list_of_objects(trim(raw), list, &jerr)) {
        return coercion_error(err_out, name, raw, "JSON", jerr);
      }
      out = std::move(list);
      return true;
    }
    case AttributeType::String:
      break;
  }
  out = std::string(raw);
  return true;
}

}
