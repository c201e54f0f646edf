#include "csv_pager/errors.hpp"

namespace cp {

std::string_view to_string(ErrorKind k) noexcept {
  switch (k) {
    case ErrorKind::None:              return "None";
    case ErrorKind::InvalidRequest:    return "InvalidRequest";
    case ErrorKind::SourceUnavailable: return "SourceUnavailable";
    case ErrorKind::EmptyObject:       return "EmptyObject";
    case ErrorKind::MalformedHeader:   return "MalformedHeader";
    case ErrorKind::MalformedRow:      return "MalformedRow";
    case ErrorKind::RowTooLarge:       return "RowTooLarge";
    case ErrorKind::ValueCoercion:     return "ValueCoercionError";
    case ErrorKind::CursorDecode:      return "CursorDecodeError";
    case ErrorKind::Timeout:           return "Timeout";
  }
  return "Unknown";
}

bool fail(Error* out, ErrorKind kind, std::string message) {
  if (out) {
    out->kind = kind;
    out->message = std::move(message);
  }
  return false;
}

}
