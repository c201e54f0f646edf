#pragma once
#include "csv_pager/counting_reader.hpp"
#include "csv_pager/errors.hpp"
#include <cstddef>
#include <string_view>

namespace cp {

enum class Bom { None, Utf32LE, Utf32BE, Utf8, Utf16LE, Utf16BE };

// Longest match first: UTF-16LE's FF FE is a prefix of UTF-32LE's FF FE 00 00.
Bom detect_bom(std::string_view prefix) noexcept;
std::size_t bom_length(Bom b) noexcept;
std::string_view to_string(Bom b) noexcept;

// Discard a leading BOM from `in`; bom_len_out gets the number of bytes dropped
// (0 if none). Fails only on a read error, not on a short stream.
bool strip_bom(CountingReader& in, std::size_t& bom_len_out, Error* err_out = nullptr);

}
