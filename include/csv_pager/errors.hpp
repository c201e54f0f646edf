#pragma once
#include <string>
#include <string_view>

namespace cp {

enum class ErrorKind {
  None,
  InvalidRequest,    // caller supplied a bad key/page size/budget
  SourceUnavailable, // byte source failed (missing, forbidden, redirected, other)
  EmptyObject,       // object exists but has zero bytes
  MalformedHeader,   // header row empty, unreadable or oversized
  MalformedRow,      // quoting violation in a data row
  RowTooLarge,       // row exceeds max_row_bytes (or the whole page budget)
  ValueCoercion,     // cell could not be coerced to its configured type
  CursorDecode,      // cursor token is not valid base64/JSON
  Timeout            // request deadline elapsed
};

struct Error {
  ErrorKind kind = ErrorKind::None;
  std::string message;

  bool ok() const noexcept { return kind == ErrorKind::None; }
};

// Stable name for logs and CLI output, e.g. "RowTooLarge".
std::string_view to_string(ErrorKind k) noexcept;

// Fill *out (when non-null) and return false, so callers can `return fail(...)`.
bool fail(Error* out, ErrorKind kind, std::string message);

}
