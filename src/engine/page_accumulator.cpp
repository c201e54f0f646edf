#include "csv_pager/page_accumulator.hpp"
#include "csv_pager/csv_fields.hpp"
#include "csv_pager/row_tokenizer.hpp"
#include <algorithm>
#include <string>

namespace cp {

static std::string where(std::uint64_t row_no, std::uint64_t offset) {
  return " (row " + std::to_string(row_no) + " of page, byte offset " + std::to_string(offset) + ")";
}

bool accumulate_page(CountingReader& in, std::uint64_t base_offset,
                     const ValueCoercer& coercer, const PageLimits& limits,
                     PageResult& out, Error* err_out, MetricsRegistry* metrics) {
  RowTokenizer tok(limits.max_row_bytes);
  PageResult page;
  page.records.reserve(std::min<std::size_t>(limits.page_size, 1024));
  page.has_next = true;

  std::string row;
  std::vector<std::string> cells;
  std::uint64_t row_no = 0;
  std::uint64_t blank_rows = 0;

  while (page.records.size() < limits.page_size) {
    const std::uint64_t row_offset = base_offset + in.consumed();
    std::uint64_t bytes = 0;
    Error rerr;
    const auto st = tok.next(in, row, bytes, &rerr);
    ++row_no;
    if (st == RowTokenizer::Status::Failed) {
      return fail(err_out, rerr.kind, "CSV row error: " + rerr.message + where(row_no, row_offset));
    }
    if (st == RowTokenizer::Status::End) {
      page.has_next = false;
      break;
    }

    // Over budget: stop before this row and leave it for the next page,
    // whose range starts exactly at row_offset.
    if (page.bytes_consumed + bytes > limits.max_bytes_per_page) {
      if (page.bytes_consumed == 0) {
        return fail(err_out, ErrorKind::RowTooLarge,
                    "CSV row error: row of " + std::to_string(bytes) +
                    " bytes exceeds the page budget of " +
                    std::to_string(limits.max_bytes_per_page) + " bytes" + where(row_no, row_offset));
      }
      break;
    }
    page.bytes_consumed += bytes;

    std::string ferr;
    if (!split_fields(row, cells, &ferr)) {
      return fail(err_out, ErrorKind::MalformedRow,
                  "CSV file format is invalid or corrupted: " + ferr + where(row_no, row_offset));
    }
    if (cells.empty()) { ++blank_rows; continue; }

    Record rec;
    const std::size_t n = std::min(cells.size(), coercer.columns());
    for (std::size_t i = 0; i < n; ++i) {
      Value v;
      Error cerr;
      if (!coercer.coerce(i, cells[i], v, &cerr)) {
        if (metrics) metrics->add_field_error(coercer.column(i));
        return fail(err_out, cerr.kind, cerr.message + where(row_no, row_offset));
      }
      rec.add(coercer.column(i), std::move(v));
    }
    page.records.push_back(std::move(rec));
  }

  // A full page that ends exactly at end-of-object must not hand out a
  // cursor that would only yield an empty page.
  if (page.has_next && page.records.size() == limits.page_size) {
    char c;
    const auto ps = in.peek(c);
    if (ps == CountingReader::Status::Failed) return fail_read(err_out, in.error());
    if (ps == CountingReader::Status::End) page.has_next = false;
  }

  if (metrics) {
    metrics->add_rows(page.records.size());
    metrics->add_blank_rows(blank_rows);
    metrics->add_bytes(page.bytes_consumed);
  }
  out = std::move(page);
  return true;
}

}
