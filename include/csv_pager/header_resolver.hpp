#pragma once
#include "csv_pager/counting_reader.hpp"
#include "csv_pager/errors.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace cp {

struct HeaderInfo {
  std::vector<std::string> names;
  std::size_t   bom_bytes = 0;
  std::uint64_t row_bytes = 0;         // header row incl. terminator
  std::uint64_t first_data_offset = 0; // bom_bytes + row_bytes
};

// `in` must be positioned at object offset 0. Strips a BOM, then reads and
// splits the header row. Any failure other than a read error is MalformedHeader.
bool resolve_headers(CountingReader& in, std::size_t max_row_bytes,
                     HeaderInfo& out, Error* err_out = nullptr);

}
