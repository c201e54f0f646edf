#include "csv_pager/csv_fields.hpp"

namespace cp {

static bool field_error(std::string* err_out, const char* what, std::size_t col) {
  if (err_out) *err_out = std::string(what) + " at column " + std::to_string(col);
  return false;
}

bool split_fields(std::string_view row, std::vector<std::string>& out,
                  std::string* err_out, const CsvDialect& d) {
  out.clear();
  if (!row.empty() && row.back() == '\n') row.remove_suffix(1);
  if (!row.empty() && row.back() == '\r') row.remove_suffix(1);
  if (row.empty()) return true; // blank row

  enum class Mode { FieldStart, Unquoted, Quoted, QuoteEscape } mode = Mode::FieldStart;
  std::string cur;
  const std::size_t n = row.size();

  for (std::size_t i = 0; i < n; ++i) {
    const char c = row[i];
    switch (mode) {
      case Mode::FieldStart:
        if (c == d.quote) { mode = Mode::Quoted; break; }
        mode = Mode::Unquoted;
        [[fallthrough]];
      case Mode::Unquoted:
        if (c == d.delimiter) {
          out.push_back(std::move(cur));
          cur.clear();
          mode = Mode::FieldStart;
        } else if (c == d.quote) {
          return field_error(err_out, "bare \" in non-quoted field", i + 1);
        } else {
          cur.push_back(c);
        }
        break;
      case Mode::Quoted:
        if (c == d.quote) {
          mode = Mode::QuoteEscape;
        } else if (c == '\r' && i + 1 < n && row[i + 1] == '\n') {
          // CRLF inside a quoted field reads as LF.
        } else {
          cur.push_back(c);
        }
        break;
      case Mode::QuoteEscape:
        if (c == d.quote) {
          cur.push_back(c); // escaped quote
          mode = Mode::Quoted;
        } else if (c == d.delimiter) {
          out.push_back(std::move(cur));
          cur.clear();
          mode = Mode::FieldStart;
        } else {
          return field_error(err_out, "extraneous or missing \" in quoted-field", i + 1);
        }
        break;
    }
  }

  if (mode == Mode::Quoted) {
    return field_error(err_out, "extraneous or missing \" in quoted-field", n + 1);
  }
  out.push_back(std::move(cur)); // last field (possibly empty after a trailing delimiter)
  return true;
}

}
