#pragma once
#include <filesystem>
#include <string>
#include <string_view>

namespace cp {

inline constexpr std::string_view kDefaultFileType = "csv";

// Join and normalize a/b to an fs::path.
std::filesystem::path join(const std::filesystem::path& a,
                           const std::filesystem::path& b);

// Only "csv" is supported.
bool is_supported_file_type(std::string_view file_type);

// Object key for an entity: clean(prefix)/<entity>.<file_type>, using '/'
// separators regardless of platform. An empty or "." prefix yields a bare name.
std::string object_key(std::string_view prefix, std::string_view entity,
                       std::string_view file_type = kDefaultFileType);

}
