#include "csv_pager/bom.hpp"
#include "csv_pager/row_tokenizer.hpp"

namespace cp {

namespace {

struct BomPattern {
  Bom kind;
  std::string_view bytes;
};

// Priority order: 4-byte forms before their 2-byte prefixes.
constexpr BomPattern kPatterns[] = {
  {Bom::Utf32LE, std::string_view("\xFF\xFE\x00\x00", 4)},
  {Bom::Utf32BE, std::string_view("\x00\x00\xFE\xFF", 4)},
  {Bom::Utf8,    std::string_view("\xEF\xBB\xBF", 3)},
  {Bom::Utf16LE, std::string_view("\xFF\xFE", 2)},
  {Bom::Utf16BE, std::string_view("\xFE\xFF", 2)},
};

}

Bom detect_bom(std::string_view prefix) noexcept {
  for (const auto& p : kPatterns) {
    if (prefix.substr(0, p.bytes.size()) == p.bytes) return p.kind;
  }
  return Bom::None;
}

std::size_t bom_length(Bom b) noexcept {
  for (const auto& p : kPatterns) if (p.kind == b) return p.bytes.size();
  return 0;
}

std::string_view to_string(Bom b) noexcept {
  switch (b) {
    case Bom::None:    return "none";
    case Bom::Utf32LE: return "UTF-32LE";
    case Bom::Utf32BE: return "UTF-32BE";
    case Bom::Utf8:    return "UTF-8";
    case Bom::Utf16LE: return "UTF-16LE";
    case Bom::Utf16BE: return "UTF-16BE";
  }
  return "none";
}

bool strip_bom(CountingReader& in, std::size_t& bom_len_out, Error* err_out) {
  bom_len_out = 0;
  std::string_view head;
  auto st = in.peek_n(4, head);
  if (st == CountingReader::Status::Failed) return fail_read(err_out, in.error());
  if (st == CountingReader::Status::End) return true;

  const std::size_t len = bom_length(detect_bom(head));
  if (len == 0) return true;
  if (in.skip(len) != CountingReader::Status::Ok) return fail_read(err_out, in.error());
  bom_len_out = len;
  return true;
}

}
