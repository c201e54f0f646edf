#include "csv_pager/path_utils.hpp"
#include <cctype>

namespace cp {

std::filesystem::path join(const std::filesystem::path& a,
                           const std::filesystem::path& b) {
  return (a / b).lexically_normal();
}

bool is_supported_file_type(std::string_view file_type) {
  if (file_type.size() != kDefaultFileType.size()) return false;
  for (std::size_t i = 0; i < file_type.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(file_type[i])) != kDefaultFileType[i]) return false;
  }
  return true;
}

std::string object_key(std::string_view prefix, std::string_view entity,
                       std::string_view file_type) {
  std::string name(entity);
  name += '.';
  name += file_type;

  auto clean = std::filesystem::path(std::string(prefix)).lexically_normal().generic_string();
  while (!clean.empty() && clean.back() == '/' && clean.size() > 1) clean.pop_back();
  if (clean.empty() || clean == ".") return name;
  if (clean == "/") return "/" + name;
  return join(clean, name).generic_string();
}

}
