#pragma once
#include "csv_pager/counting_reader.hpp"
#include "csv_pager/errors.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

namespace cp {

// Quote tracking for one logical row. AfterQuoteInQuotes means "saw a quote
// while quoted": a second quote is an escape, anything else closed the field.
enum class QuoteState { Normal, InQuotes, AfterQuoteInQuotes };

struct Transition {
  QuoteState next;
  bool ends_row; // unquoted CR or LF
};

Transition step(QuoteState s, char c) noexcept;

class RowTokenizer {
public:
  enum class Status { Row, End, Failed };

  explicit RowTokenizer(std::size_t max_row_bytes) : max_row_bytes_(max_row_bytes) {}

  // Read one logical row (terminator included, CR normalized to LF) into
  // `row`; `bytes` gets the exact number of bytes consumed from `in`.
  // End: stream exhausted before any byte. Failed: RowTooLarge or a read error.
  Status next(CountingReader& in, std::string& row, std::uint64_t& bytes,
              Error* err_out = nullptr) const;

  std::size_t max_row_bytes() const noexcept { return max_row_bytes_; }

private:
  std::size_t max_row_bytes_;
};

// Map a failed CountingReader read to Timeout/SourceUnavailable.
bool fail_read(Error* out, const SourceError& e);

}
