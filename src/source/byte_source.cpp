#include "csv_pager/byte_source.hpp"

namespace cp {

std::string_view describe(SourceFailure f) noexcept {
  switch (f) {
    case SourceFailure::None:                return "no error";
    case SourceFailure::NotFound:            return "object does not exist";
    case SourceFailure::PermissionDenied:    return "missing permissions";
    case SourceFailure::Redirected:          return "request was redirected";
    case SourceFailure::RangeNotSatisfiable: return "requested byte range is not satisfiable";
    case SourceFailure::Timeout:             return "deadline exceeded";
    case SourceFailure::Other:               return "transport error";
  }
  return "transport error";
}

}
