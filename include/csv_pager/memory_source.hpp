#pragma once
#include "csv_pager/byte_source.hpp"
#include <map>
#include <memory>
#include <string>

namespace cp {

// In-process object store. Objects can be made to fail on demand so callers
// can exercise the error paths without a network. An open stream keeps the
// bytes it was opened on alive: a later put() on the same key, or destroying
// the source, does not affect it.
class MemoryByteSource : public ByteSource {
public:
  void put(std::string key, std::string bytes);
  void fail_with(std::string key, SourceFailure f);
  void clear_failure(std::string_view key);

  // Number of open_range() calls served; lets tests assert header caching.
  std::size_t range_requests() const noexcept { return range_requests_; }

  bool exists(std::string_view key, Deadline deadline,
              std::uint64_t& size_out, SourceError& err) override;

  std::unique_ptr<ByteStream> open_range(std::string_view key,
                                         std::uint64_t start,
                                         std::optional<std::uint64_t> end,
                                         Deadline deadline,
                                         SourceError& err) override;

private:
  bool check(std::string_view key, Deadline deadline, SourceError& err) const;

  std::map<std::string, std::shared_ptr<const std::string>, std::less<>> objects_;
  std::map<std::string, SourceFailure, std::less<>> failures_;
  std::size_t range_requests_{0};
};

}
