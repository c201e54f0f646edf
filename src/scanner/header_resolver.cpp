#include "csv_pager/header_resolver.hpp"
#include "csv_pager/bom.hpp"
#include "csv_pager/csv_fields.hpp"
#include "csv_pager/row_tokenizer.hpp"

namespace cp {

bool resolve_headers(CountingReader& in, std::size_t max_row_bytes,
                     HeaderInfo& out, Error* err_out) {
  std::size_t bom = 0;
  if (!strip_bom(in, bom, err_out)) return false;

  RowTokenizer tok(max_row_bytes);
  std::string row;
  std::uint64_t bytes = 0;
  Error rerr;
  switch (tok.next(in, row, bytes, &rerr)) {
    case RowTokenizer::Status::End:
      return fail(err_out, ErrorKind::MalformedHeader, "CSV header error: empty or missing");
    case RowTokenizer::Status::Failed:
      if (rerr.kind != ErrorKind::RowTooLarge) return fail(err_out, rerr.kind, std::move(rerr.message));
      return fail(err_out, ErrorKind::MalformedHeader, "CSV header error: " + rerr.message);
    case RowTokenizer::Status::Row:
      break;
  }

  std::vector<std::string> names;
  std::string ferr;
  if (!split_fields(row, names, &ferr)) {
    return fail(err_out, ErrorKind::MalformedHeader, "CSV header is invalid or corrupted: " + ferr);
  }
  if (names.empty()) {
    return fail(err_out, ErrorKind::MalformedHeader, "CSV header error: header row is blank");
  }

  out.names = std::move(names);
  out.bom_bytes = bom;
  out.row_bytes = bytes;
  out.first_data_offset = bom + bytes;
  return true;
}

}
