#include "csv_pager/value.hpp"
#include <cctype>

namespace cp {

std::string_view to_string(AttributeType t) noexcept {
  switch (t) {
    case AttributeType::String:       return "String";
    case AttributeType::Int64:        return "Int64";
    case AttributeType::Double:       return "Double";
    case AttributeType::Bool:         return "Bool";
    case AttributeType::DateTime:     return "DateTime";
    case AttributeType::ListOfObject: return "ListOfObject";
  }
  return "String";
}

std::optional<AttributeType> parse_attribute_type(std::string_view s) {
  std::string k;
  k.reserve(s.size());
  for (char c : s) if (c != '_' && c != '-') k.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  if (k == "string" || k == "str")                  return AttributeType::String;
  if (k == "int64" || k == "int" || k == "integer") return AttributeType::Int64;
  if (k == "double" || k == "float" || k == "number") return AttributeType::Double;
  if (k == "bool" || k == "boolean")                return AttributeType::Bool;
  if (k == "datetime" || k == "date")               return AttributeType::DateTime;
  if (k == "listofobject" || k == "list" || k == "json") return AttributeType::ListOfObject;
  return std::nullopt;
}

AttributeType type_of(const Value& v) noexcept {
  return static_cast<AttributeType>(v.index());
}

const Value* Record::find(std::string_view name) const {
  for (const auto& f : fields_) if (f.name == name) return &f.value;
  return nullptr;
}

}
