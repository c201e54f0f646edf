#pragma once
#include "csv_pager/errors.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cp {

// Resume point for one sync. Both parts are optional: a cursor without
// headers (older tokens) makes the next request re-read the header row.
struct Cursor {
  std::optional<std::uint64_t> byte_offset;
  std::optional<std::vector<std::string>> headers;

  bool operator==(const Cursor& o) const {
    return byte_offset == o.byte_offset && headers == o.headers;
  }
  bool operator!=(const Cursor& o) const { return !(*this == o); }
};

// {"cursor":N,"headers":[...]}; absent members are omitted.
std::string cursor_to_json(const Cursor& c);

// base64(cursor_to_json(c)); an absent cursor encodes to "".
std::string encode_cursor(const std::optional<Cursor>& c);

// "" decodes to std::nullopt. Unknown members (collectionId,
// collectionCursor, ...) are ignored. Bad base64/JSON is CursorDecode.
bool decode_cursor(std::string_view token, std::optional<Cursor>& out,
                   Error* err_out = nullptr);

// Standard alphabet with padding (OpenSSL EVP).
std::string base64_encode(std::string_view bytes);
bool base64_decode(std::string_view text, std::string& out);

}
