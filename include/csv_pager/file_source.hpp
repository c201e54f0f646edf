#pragma once
#include "csv_pager/byte_source.hpp"
#include <filesystem>

namespace cp {

// Serves objects from a local directory; keys are paths relative to `root`.
class FileByteSource : public ByteSource {
public:
  explicit FileByteSource(std::filesystem::path root);

  bool exists(std::string_view key, Deadline deadline,
              std::uint64_t& size_out, SourceError& err) override;

  std::unique_ptr<ByteStream> open_range(std::string_view key,
                                         std::uint64_t start,
                                         std::optional<std::uint64_t> end,
                                         Deadline deadline,
                                         SourceError& err) override;

private:
  std::filesystem::path resolve(std::string_view key) const;

  std::filesystem::path root_;
};

}
