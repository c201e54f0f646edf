#include "csv_pager/row_tokenizer.hpp"

namespace cp {

Transition step(QuoteState s, char c) noexcept {
  switch (s) {
    case QuoteState::InQuotes:
      // Embedded CR/LF and delimiters are data while quoted.
      return {c == '"' ? QuoteState::AfterQuoteInQuotes : QuoteState::InQuotes, false};
    case QuoteState::AfterQuoteInQuotes:
      // "" is an escaped quote; anything else closed the field and is
      // handled as an unquoted byte.
      if (c == '"') return {QuoteState::InQuotes, false};
      [[fallthrough]];
    case QuoteState::Normal:
      if (c == '"') return {QuoteState::InQuotes, false};
      if (c == '\n' || c == '\r') return {QuoteState::Normal, true};
      return {QuoteState::Normal, false};
  }
  return {QuoteState::Normal, false};
}

bool fail_read(Error* out, const SourceError& e) {
  std::string msg = "read failed: ";
  msg += describe(e.failure);
  if (!e.detail.empty()) { msg += " ("; msg += e.detail; msg += ")"; }
  return fail(out, e.failure == SourceFailure::Timeout ? ErrorKind::Timeout
                                                       : ErrorKind::SourceUnavailable,
              std::move(msg));
}

static bool too_large(Error* out, std::size_t limit) {
  return fail(out, ErrorKind::RowTooLarge,
              "row exceeds size limit of " + std::to_string(limit) + " bytes");
}

RowTokenizer::Status RowTokenizer::next(CountingReader& in, std::string& row,
                                        std::uint64_t& bytes, Error* err_out) const {
  row.clear();
  bytes = 0;
  QuoteState st = QuoteState::Normal;

  while (true) {
    char c;
    auto rs = in.get(c);
    if (rs == CountingReader::Status::Failed) { fail_read(err_out, in.error()); return Status::Failed; }
    if (rs == CountingReader::Status::End) {
      if (bytes == 0) return Status::End;
      break; // unterminated last row
    }
    if (bytes + 1 > max_row_bytes_) { too_large(err_out, max_row_bytes_); return Status::Failed; }
    row.push_back(c);
    ++bytes;

    const Transition t = step(st, c);
    st = t.next;
    if (!t.ends_row) continue;

    if (c == '\r') {
      char nx;
      auto ps = in.peek(nx);
      if (ps == CountingReader::Status::Failed) { fail_read(err_out, in.error()); return Status::Failed; }
      if (ps == CountingReader::Status::Ok && nx == '\n') {
        if (bytes + 1 > max_row_bytes_) { too_large(err_out, max_row_bytes_); return Status::Failed; }
        if (in.get(nx) != CountingReader::Status::Ok) { fail_read(err_out, in.error()); return Status::Failed; }
        row.push_back(nx);
        ++bytes;
      }
    }
    break;
  }

  if (!row.empty() && row.back() == '\r') row.back() = '\n';
  return Status::Row;
}

}
