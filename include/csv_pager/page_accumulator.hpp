#pragma once
#include "csv_pager/counting_reader.hpp"
#include "csv_pager/errors.hpp"
#include "csv_pager/metrics.hpp"
#include "csv_pager/value.hpp"
#include "csv_pager/value_coercer.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace cp {

struct PageLimits {
  std::size_t   page_size = 0;
  std::size_t   max_row_bytes = 1024 * 1024;
  std::uint64_t max_bytes_per_page = 200ull * 1024 * 1024;
};

struct PageResult {
  std::vector<Record> records;
  std::uint64_t bytes_consumed = 0; // resume at start offset + bytes_consumed
  bool has_next = false;
};

// Build one page from `in`, which sits at object offset `base_offset` (used in
// error messages only). All-or-nothing: on failure `out` is left untouched.
bool accumulate_page(CountingReader& in, std::uint64_t base_offset,
                     const ValueCoercer& coercer, const PageLimits& limits,
                     PageResult& out, Error* err_out = nullptr,
                     MetricsRegistry* metrics = nullptr);

}
