#pragma once
#include "csv_pager/byte_source.hpp"
#include <string>
#include <vector>
#include <utility>

namespace cp {

// Object store reached over HTTP: HEAD for size, GET with a Range header for
// data. Works against S3-compatible gateways and plain static file servers.
// Streams copy the config and may outlive the source. A server that ignores
// Range and answers 200 is read once; later windows come from that body.
class HttpByteSource : public ByteSource {
public:
  struct Config {
    std::string base_url;                   // scheme://host[:port]
    std::string path_prefix;                // prepended to every key, e.g. "/bucket"
    std::size_t window_bytes = 1024 * 1024; // bytes per ranged GET
    std::vector<std::pair<std::string, std::string>> headers; // e.g. Authorization
  };

  explicit HttpByteSource(Config cfg);
  ~HttpByteSource() override;
  HttpByteSource(const HttpByteSource&) = delete;
  HttpByteSource& operator=(const HttpByteSource&) = delete;

  bool exists(std::string_view key, Deadline deadline,
              std::uint64_t& size_out, SourceError& err) override;

  std::unique_ptr<ByteStream> open_range(std::string_view key,
                                         std::uint64_t start,
                                         std::optional<std::uint64_t> end,
                                         Deadline deadline,
                                         SourceError& err) override;

  // Status code -> failure class (404 NotFound, 403 PermissionDenied, ...).
  static SourceFailure classify_status(int status) noexcept;

private:
  struct Impl; Impl* p_;
};

}
