#pragma once
#include "csv_pager/errors.hpp"
#include "csv_pager/parse_policy.hpp"
#include "csv_pager/value.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cp {

// Parse `[{...},...]` into a ListOfObject (simdjson). Elements must be objects.
bool parse_list_of_objects(std::string_view json, ListOfObject& out,
                           std::string* err_out = nullptr);

// Resolves the AttributeTypeMap against one header list once, then coerces
// cells by column position.
class ValueCoercer {
public:
  ValueCoercer(std::vector<std::string> headers, const AttributeTypeMap& types,
               ParsePolicy policy = {});

  // err_out names the column and the raw value.
  bool coerce(std::size_t col, std::string_view raw, Value& out,
              Error* err_out = nullptr) const;

  std::size_t columns() const noexcept { return headers_.size(); }
  const std::string& column(std::size_t col) const { return headers_[col]; }
  std::optional<AttributeType> type_for(std::size_t col) const { return types_[col]; }

private:
  std::vector<std::string> headers_;
  std::vector<std::optional<AttributeType>> types_;
  ParsePolicy policy_;
};

}
