#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace cp {

struct CsvDialect {
  char delimiter = ',';
  char quote     = '"';
};

// Split one raw row (as produced by RowTokenizer, terminator optional) into
// unescaped fields. A blank row yields zero fields. On a quoting violation
// returns false and describes it (with 1-based column) in *err_out.
bool split_fields(std::string_view row, std::vector<std::string>& out,
                  std::string* err_out = nullptr, const CsvDialect& d = {});

}
