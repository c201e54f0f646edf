#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace cp {

enum class AttributeType { String, Int64, Double, Bool, DateTime, ListOfObject };

std::string_view to_string(AttributeType t) noexcept;
// Accepts the names above case-insensitively, plus "int"/"float"/"datetime".
std::optional<AttributeType> parse_attribute_type(std::string_view s);

// Column name -> requested type. Columns not listed pass through as strings.
using AttributeTypeMap = std::unordered_map<std::string, AttributeType>;

struct DateTime {
  std::int64_t epoch_ms = 0;
  bool operator==(const DateTime& o) const noexcept { return epoch_ms == o.epoch_ms; }
  bool operator!=(const DateTime& o) const noexcept { return !(*this == o); }
};

// Nested arrays/objects inside a ListOfObject element are kept verbatim.
struct RawJson {
  std::string text;
  bool operator==(const RawJson& o) const { return text == o.text; }
  bool operator!=(const RawJson& o) const { return !(*this == o); }
};

using ChildValue   = std::variant<std::nullptr_t, bool, double, std::string, RawJson>;
using ChildObject  = std::vector<std::pair<std::string, ChildValue>>;
using ListOfObject = std::vector<ChildObject>;

// Alternatives are in AttributeType order.
using Value = std::variant<std::string, std::int64_t, double, bool, DateTime, ListOfObject>;

AttributeType type_of(const Value& v) noexcept;

struct Field {
  std::string name;
  Value value;
  bool operator==(const Field& o) const { return name == o.name && value == o.value; }
  bool operator!=(const Field& o) const { return !(*this == o); }
};

// One CSV row keyed by header name, in header order.
class Record {
public:
  void add(std::string name, Value v) { fields_.push_back(Field{std::move(name), std::move(v)}); }
  const Value* find(std::string_view name) const;

  std::size_t size() const noexcept { return fields_.size(); }
  const std::vector<Field>& fields() const noexcept { return fields_; }
  auto begin() const noexcept { return fields_.begin(); }
  auto end() const noexcept { return fields_.end(); }

  bool operator==(const Record& o) const { return fields_ == o.fields_; }
  bool operator!=(const Record& o) const { return !(*this == o); }

private:
  std::vector<Field> fields_;
};

}
