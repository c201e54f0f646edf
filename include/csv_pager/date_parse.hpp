#pragma once
#include <cstdint>
#include <optional>
#include <string_view>

namespace cp {

// ISO-8601 subset: YYYY-MM-DD[(T| )HH:MM:SS[.fff]][Z|+HH:MM|-HH:MM].
// Returns UTC epoch millis on success.
std::optional<std::int64_t> parse_iso8601_ms(std::string_view s);

}
