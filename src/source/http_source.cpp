#include "csv_pager/http_source.hpp"
#include <httplib.h>
#include <algorithm>
#include <charconv>
#include <cstring>

namespace cp {

namespace {

using Millis = std::chrono::milliseconds;

std::string make_path(const HttpByteSource::Config& cfg, std::string_view key) {
  std::string path = cfg.path_prefix;
  if (path.empty() || path.back() != '/') path.push_back('/');
  if (!key.empty() && key.front() == '/') key.remove_prefix(1);
  path.append(key.data(), key.size());
  return path;
}

httplib::Headers make_headers(const HttpByteSource::Config& cfg) {
  httplib::Headers h;
  for (const auto& kv : cfg.headers) h.emplace(kv.first, kv.second);
  return h;
}

// Fresh client per call: requests never share a connection or its state.
std::unique_ptr<httplib::Client> make_client(const HttpByteSource::Config& cfg,
                                             Deadline deadline) {
  auto cli = std::make_unique<httplib::Client>(cfg.base_url);
  auto left = std::chrono::duration_cast<Millis>(deadline - Clock::now());
  if (left < Millis(1)) left = Millis(1);
  const auto sec  = static_cast<time_t>(left.count() / 1000);
  const auto usec = static_cast<time_t>((left.count() % 1000) * 1000);
  cli->set_connection_timeout(sec, usec);
  cli->set_read_timeout(sec, usec);
  cli->set_write_timeout(sec, usec);
  cli->set_follow_location(false);
  return cli;
}

SourceError transport_error(const httplib::Result& res, Deadline deadline) {
  SourceError e;
  e.failure = expired(deadline) ? SourceFailure::Timeout : SourceFailure::Other;
  e.detail = httplib::to_string(res.error());
  return e;
}

SourceError status_error(int status) {
  return SourceError{HttpByteSource::classify_status(status), "HTTP " + std::to_string(status)};
}

std::string range_header(std::uint64_t first, std::uint64_t last) {
  return "bytes=" + std::to_string(first) + "-" + std::to_string(last);
}

class HttpStream : public ByteStream {
public:
  HttpStream(const HttpByteSource::Config& cfg, std::string path,
             std::uint64_t start, std::optional<std::uint64_t> end)
    : cfg_(cfg), path_(std::move(path)), next_(start), end_(end) {}

  // First window is fetched eagerly so open_range() reports missing objects
  // and bad ranges itself.
  bool prime(Deadline deadline, SourceError& err) { return fetch(deadline, err, /*first=*/true); }

  long long read(char* buf, std::size_t n, Deadline deadline, SourceError& err) override {
    if (pos_ == window_.size()) {
      if (done_) return 0;
      if (!fetch(deadline, err, /*first=*/false)) return -1;
      if (pos_ == window_.size()) return 0;
    }
    std::size_t k = std::min(n, window_.size() - pos_);
    std::memcpy(buf, window_.data() + pos_, k);
    pos_ += k;
    return static_cast<long long>(k);
  }

private:
  bool fetch(Deadline deadline, SourceError& err, bool first) {
    window_.clear();
    pos_ = 0;
    if (end_ && next_ > *end_) { done_ = true; return true; }

    std::uint64_t last = next_ + cfg_.window_bytes - 1;
    if (end_ && *end_ < last) last = *end_;
    if (whole_body_) return slice_whole(last);
    if (expired(deadline)) { err = {SourceFailure::Timeout, "deadline elapsed before range fetch"}; return false; }

    auto cli = make_client(cfg_, deadline);
    auto headers = make_headers(cfg_);
    headers.emplace("Range", range_header(next_, last));
    auto res = cli->Get(path_, headers);
    if (!res) { err = transport_error(res, deadline); return false; }

    if (res->status == 416 && !first) { done_ = true; return true; }
    if (res->status == 200) {
      // Server ignored the Range header and sent the whole object; serve the
      // remaining windows from that body instead of fetching it again.
      whole_ = std::move(res->body);
      whole_body_ = true;
      return slice_whole(last);
    } else if (res->status == 206) {
      window_ = std::move(res->body);
    } else {
      err = status_error(res->status);
      return false;
    }

    const std::uint64_t asked = last - next_ + 1;
    if (window_.size() > asked) window_.resize(static_cast<std::size_t>(asked));
    if (window_.size() < asked) done_ = true;
    next_ += window_.size();
    if (window_.empty()) done_ = true;
    return true;
  }

  bool slice_whole(std::uint64_t last) {
    if (next_ >= whole_.size()) { done_ = true; whole_.clear(); return true; }
    const std::size_t from = static_cast<std::size_t>(next_);
    const std::size_t upto = static_cast<std::size_t>(std::min<std::uint64_t>(last + 1, whole_.size()));
    window_.assign(whole_, from, upto - from);
    next_ += window_.size();
    return true;
  }

  HttpByteSource::Config cfg_; // copied: the stream may outlive its source
  std::string path_;
  std::uint64_t next_;
  std::optional<std::uint64_t> end_;
  std::string window_;
  std::size_t pos_{0};
  bool done_{false};
  std::string whole_; // full body of a 200 answer
  bool whole_body_{false};
};

}

struct HttpByteSource::Impl {
  Config cfg;
};

HttpByteSource::HttpByteSource(Config cfg) : p_(new Impl{std::move(cfg)}) {
  if (p_->cfg.window_bytes == 0) p_->cfg.window_bytes = 1024 * 1024;
}

HttpByteSource::~HttpByteSource() { delete p_; }

SourceFailure HttpByteSource::classify_status(int status) noexcept {
  if (status == 404) return SourceFailure::NotFound;
  if (status == 401 || status == 403) return SourceFailure::PermissionDenied;
  if (status == 416) return SourceFailure::RangeNotSatisfiable;
  if (status == 408 || status == 504) return SourceFailure::Timeout;
  if (status >= 300 && status < 400) return SourceFailure::Redirected;
  return SourceFailure::Other;
}

bool HttpByteSource::exists(std::string_view key, Deadline deadline,
                            std::uint64_t& size_out, SourceError& err) {
  if (expired(deadline)) { err = {SourceFailure::Timeout, "deadline elapsed before HEAD"}; return false; }
  auto cli = make_client(p_->cfg, deadline);
  auto res = cli->Head(make_path(p_->cfg, key), make_headers(p_->cfg));
  if (!res) { err = transport_error(res, deadline); return false; }
  if (res->status != 200) { err = status_error(res->status); return false; }

  const std::string len = res->get_header_value("Content-Length");
  std::uint64_t size = 0;
  auto [ptr, ec] = std::from_chars(len.data(), len.data() + len.size(), size);
  if (len.empty() || ec != std::errc() || ptr != len.data() + len.size()) {
    err = {SourceFailure::Other, "unable to determine object size"};
    return false;
  }
  size_out = size;
  return true;
}

std::unique_ptr<ByteStream> HttpByteSource::open_range(std::string_view key,
                                                       std::uint64_t start,
                                                       std::optional<std::uint64_t> end,
                                                       Deadline deadline,
                                                       SourceError& err) {
  if (end && *end < start) {
    err = {SourceFailure::RangeNotSatisfiable, range_header(start, *end)};
    return nullptr;
  }
  auto s = std::make_unique<HttpStream>(p_->cfg, make_path(p_->cfg, key), start, end);
  if (!s->prime(deadline, err)) return nullptr;
  return s;
}

}
