#pragma once
#include "csv_pager/byte_source.hpp"
#include "csv_pager/counting_reader.hpp"
#include "csv_pager/errors.hpp"
#include "csv_pager/metrics.hpp"
#include "csv_pager/parse_policy.hpp"
#include "csv_pager/value.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cp {

struct PageRequest {
  std::string key;            // object key in the byte source
  std::size_t page_size = 0;  // rows, > 0
  AttributeTypeMap types;
  std::string cursor;         // "" on the first page
  std::optional<std::size_t>   max_row_bytes;      // engine default if unset
  std::optional<std::uint64_t> max_bytes_per_page; // 200 x max_row_bytes if unset
};

struct PageResponse {
  std::vector<Record> records;
  std::string next_cursor;          // "" on the final page
  bool has_next = false;
  std::vector<std::string> headers; // header list used for this page
  std::uint64_t start_offset = 0;
  PageStats stats;
};

// Turns one (key, cursor) pair into one page of typed records. Holds no
// per-request state; every call opens its own streams.
class PageEngine {
public:
  struct Config {
    std::size_t   max_row_bytes      = 1024 * 1024; // 1 MiB
    std::uint64_t max_bytes_per_page = 0;           // 0 -> 200 x max_row_bytes
    std::size_t   max_page_size      = 1000;
    std::chrono::milliseconds request_timeout{120 * 1000};
    CountingReader::Config reader;
    ParsePolicy policy;
  };

  explicit PageEngine(ByteSource& source);
  PageEngine(ByteSource& source, Config cfg);

  // All-or-nothing: on failure `out` is untouched and the caller may retry
  // with the same cursor.
  bool get_page(const PageRequest& req, PageResponse& out, Error* err_out = nullptr) const;

  const Config& config() const noexcept { return cfg_; }

private:
  ByteSource& source_;
  Config cfg_;
};

}
