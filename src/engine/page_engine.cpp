#include "csv_pager/page_engine.hpp"
#include "csv_pager/cursor_codec.hpp"
#include "csv_pager/header_resolver.hpp"
#include "csv_pager/page_accumulator.hpp"
#include "csv_pager/value_coercer.hpp"
#include <algorithm>

namespace cp {

namespace {

// Largest BOM; the header range covers BOM + one maximal header row.
constexpr std::uint64_t kMaxBomBytes = 4;

bool source_failed(Error* err_out, std::string_view key, std::string_view op,
                   const SourceError& e) {
  std::string msg(key);
  msg += ": ";
  msg += op;
  msg += " failed: ";
  msg += describe(e.failure);
  if (!e.detail.empty()) { msg += " ("; msg += e.detail; msg += ")"; }
  return fail(err_out, e.failure == SourceFailure::Timeout ? ErrorKind::Timeout
                                                           : ErrorKind::SourceUnavailable,
              std::move(msg));
}

// Keep the kind, prefix the object key so every message names its object.
bool with_key(Error* err_out, std::string_view key, Error e) {
  return fail(err_out, e.kind, std::string(key) + ": " + e.message);
}

}

PageEngine::PageEngine(ByteSource& source) : PageEngine(source, Config{}) {}

PageEngine::PageEngine(ByteSource& source, Config cfg) : source_(source), cfg_(std::move(cfg)) {}

bool PageEngine::get_page(const PageRequest& req, PageResponse& out, Error* err_out) const {
  const auto t0 = Clock::now();
  const Deadline deadline = t0 + cfg_.request_timeout;
  MetricsRegistry metrics;

  // --- request
  const std::size_t max_row = req.max_row_bytes.value_or(cfg_.max_row_bytes);
  std::uint64_t max_page = req.max_bytes_per_page.value_or(cfg_.max_bytes_per_page);
  if (max_page == 0) max_page = 200ull * max_row;

  if (req.key.empty()) return fail(err_out, ErrorKind::InvalidRequest, "object key is empty");
  if (req.page_size == 0 || req.page_size > cfg_.max_page_size) {
    return fail(err_out, ErrorKind::InvalidRequest,
                req.key + ": provided page size (" + std::to_string(req.page_size) +
                ") must be between 1 and " + std::to_string(cfg_.max_page_size) + ".");
  }
  if (max_row == 0) return fail(err_out, ErrorKind::InvalidRequest, req.key + ": max_row_bytes must be positive");

  std::optional<Cursor> cursor;
  {
    Error e;
    if (!decode_cursor(req.cursor, cursor, &e)) return with_key(err_out, req.key, std::move(e));
  }

  // --- existence / size
  std::uint64_t size = 0;
  {
    StageTimer st(&metrics, "exists");
    SourceError se;
    if (!source_.exists(req.key, deadline, size, se)) return source_failed(err_out, req.key, "exists", se);
  }
  if (size == 0) {
    return fail(err_out, ErrorKind::EmptyObject, req.key + ": the object is empty");
  }

  // --- headers: cached in the cursor, or re-read from the object start
  std::vector<std::string> headers;
  std::uint64_t start = 0;
  const bool cached = cursor && cursor->byte_offset && cursor->headers;
  if (cached) {
    headers = *cursor->headers;
    start = *cursor->byte_offset;
    metrics.set_headers_from_cursor(true);
  } else {
    StageTimer st(&metrics, "header_fetch");
    const std::uint64_t last = std::min<std::uint64_t>(size, max_row + kMaxBomBytes) - 1;
    SourceError se;
    metrics.add_range_request();
    auto stream = source_.open_range(req.key, 0, last, deadline, se);
    if (!stream) return source_failed(err_out, req.key, "open header range", se);

    CountingReader in(*stream, deadline, cfg_.reader);
    HeaderInfo info;
    Error e;
    if (!resolve_headers(in, max_row, info, &e)) return with_key(err_out, req.key, std::move(e));
    metrics.add_header_bytes(info.first_data_offset);
    headers = std::move(info.names);
    start = (cursor && cursor->byte_offset) ? *cursor->byte_offset : info.first_data_offset;
  }

  PageResponse resp;
  resp.headers = headers;
  resp.start_offset = start;

  // --- data
  if (start < size) {
    SourceError se;
    std::unique_ptr<ByteStream> stream;
    {
      StageTimer st(&metrics, "data_fetch");
      metrics.add_range_request();
      stream = source_.open_range(req.key, start, std::nullopt, deadline, se);
    }
    if (!stream) return source_failed(err_out, req.key, "open data range", se);

    StageTimer st(&metrics, "decode");
    CountingReader in(*stream, deadline, cfg_.reader);
    ValueCoercer coercer(headers, req.types, cfg_.policy);
    PageLimits limits{req.page_size, max_row, max_page};
    PageResult page;
    Error e;
    if (!accumulate_page(in, start, coercer, limits, page, &e, &metrics)) {
      return with_key(err_out, req.key, std::move(e));
    }

    const std::uint64_t next = start + page.bytes_consumed;
    resp.records = std::move(page.records);
    resp.has_next = page.has_next && next < size;
    if (resp.has_next) resp.next_cursor = encode_cursor(Cursor{next, headers});
  }

  const std::chrono::duration<double, std::milli> wall = Clock::now() - t0;
  resp.stats = metrics.snapshot(wall.count());
  out = std::move(resp);
  return true;
}

}
