#include "csv_pager/cursor_codec.hpp"
#include "csv_pager/json_writer.hpp"
#include <openssl/evp.h>
#include <simdjson.h>
#include <cctype>
#include <sstream>

namespace cp {

std::string base64_encode(std::string_view bytes) {
  if (bytes.empty()) return {};
  std::string out(4 * ((bytes.size() + 2) / 3) + 1, '\0');
  const int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                reinterpret_cast<const unsigned char*>(bytes.data()),
                                static_cast<int>(bytes.size()));
  out.resize(n > 0 ? static_cast<std::size_t>(n) : 0);
  return out;
}

static bool is_b64(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/';
}

bool base64_decode(std::string_view text, std::string& out) {
  out.clear();
  if (text.empty()) return true;
  if (text.size() % 4 != 0) return false;

  std::size_t pad = 0;
  if (text.back() == '=') ++pad;
  if (text.size() >= 2 && text[text.size() - 2] == '=') ++pad;
  for (std::size_t i = 0; i < text.size() - pad; ++i) if (!is_b64(text[i])) return false;

  std::string buf(3 * (text.size() / 4), '\0');
  const int n = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(buf.data()),
                                reinterpret_cast<const unsigned char*>(text.data()),
                                static_cast<int>(text.size()));
  if (n < 0 || static_cast<std::size_t>(n) < pad) return false;
  // EVP_DecodeBlock counts the zero bytes produced by padding.
  buf.resize(static_cast<std::size_t>(n) - pad);
  out = std::move(buf);
  return true;
}

std::string cursor_to_json(const Cursor& c) {
  std::ostringstream o;
  o << "{";
  bool first = true;
  if (c.byte_offset) {
    o << "\"cursor\":" << *c.byte_offset;
    first = false;
  }
  if (c.headers) {
    if (!first) o << ",";
    o << "\"headers\":[";
    for (std::size_t i = 0; i < c.headers->size(); ++i) {
      if (i) o << ",";
      write_json_string(o, (*c.headers)[i]);
    }
    o << "]";
  }
  o << "}";
  return o.str();
}

std::string encode_cursor(const std::optional<Cursor>& c) {
  if (!c) return {};
  return base64_encode(cursor_to_json(*c));
}

// Member names match case-insensitively, as older producers did.
static bool key_is(std::string_view key, std::string_view want) {
  if (key.size() != want.size()) return false;
  for (std::size_t i = 0; i < key.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(key[i])) != want[i]) return false;
  }
  return true;
}

static bool decode_error(Error* err_out, const std::string& what) {
  return fail(err_out, ErrorKind::CursorDecode, what);
}

bool decode_cursor(std::string_view token, std::optional<Cursor>& out, Error* err_out) {
  if (token.empty()) { out.reset(); return true; }

  std::string json;
  if (!base64_decode(token, json)) return decode_error(err_out, "Failed to decode base64 cursor.");

  simdjson::ondemand::parser parser;
  simdjson::padded_string padded(json);
  Cursor c;
  try {
    simdjson::ondemand::document doc = parser.iterate(padded);
    simdjson::ondemand::object obj = doc.get_object();
    for (auto field : obj) {
      std::string_view key = field.unescaped_key();
      simdjson::ondemand::value v = field.value();
      if (key_is(key, "cursor")) {
        if (v.is_null()) { c.byte_offset.reset(); continue; }
        c.byte_offset = std::uint64_t(v.get_uint64());
      } else if (key_is(key, "headers")) {
        if (v.is_null()) { c.headers.reset(); continue; }
        std::vector<std::string> names;
        for (auto h : v.get_array()) names.emplace_back(std::string_view(h.get_string()));
        c.headers = std::move(names);
      }
      // collectionId, collectionCursor and anything newer are skipped.
    }
    if (!doc.at_end()) return decode_error(err_out, "Failed to unmarshal JSON cursor: trailing content.");
  } catch (const simdjson::simdjson_error& e) {
    return decode_error(err_out, std::string("Failed to unmarshal JSON cursor: ") + e.what() + ".");
  }
  out = std::move(c);
  return true;
}

}
