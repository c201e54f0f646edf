#include "csv_pager/memory_source.hpp"
#include <algorithm>
#include <cstring>

namespace cp {

namespace {

class MemoryStream : public ByteStream {
public:
  MemoryStream(std::shared_ptr<const std::string> obj, std::size_t start, std::size_t len)
    : obj_(std::move(obj)), bytes_(std::string_view(*obj_).substr(start, len)) {}

  long long read(char* buf, std::size_t n, Deadline deadline, SourceError& err) override {
    if (expired(deadline)) {
      err = {SourceFailure::Timeout, "deadline elapsed before read"};
      return -1;
    }
    std::size_t k = std::min(n, bytes_.size() - pos_);
    std::memcpy(buf, bytes_.data() + pos_, k);
    pos_ += k;
    return static_cast<long long>(k);
  }

private:
  std::shared_ptr<const std::string> obj_;
  std::string_view bytes_; // into *obj_
  std::size_t pos_{0};
};

}

void MemoryByteSource::put(std::string key, std::string bytes) {
  objects_[std::move(key)] = std::make_shared<const std::string>(std::move(bytes));
}

void MemoryByteSource::fail_with(std::string key, SourceFailure f) {
  failures_[std::move(key)] = f;
}

void MemoryByteSource::clear_failure(std::string_view key) {
  auto it = failures_.find(key);
  if (it != failures_.end()) failures_.erase(it);
}

bool MemoryByteSource::check(std::string_view key, Deadline deadline, SourceError& err) const {
  if (expired(deadline)) { err = {SourceFailure::Timeout, "deadline elapsed"}; return false; }
  auto f = failures_.find(key);
  if (f != failures_.end()) { err = {f->second, "injected"}; return false; }
  if (objects_.find(key) == objects_.end()) { err = {SourceFailure::NotFound, ""}; return false; }
  return true;
}

bool MemoryByteSource::exists(std::string_view key, Deadline deadline,
                              std::uint64_t& size_out, SourceError& err) {
  if (!check(key, deadline, err)) return false;
  size_out = objects_.find(key)->second->size();
  return true;
}

std::unique_ptr<ByteStream> MemoryByteSource::open_range(std::string_view key,
                                                         std::uint64_t start,
                                                         std::optional<std::uint64_t> end,
                                                         Deadline deadline,
                                                         SourceError& err) {
  ++range_requests_;
  if (!check(key, deadline, err)) return nullptr;
  const auto& obj = objects_.find(key)->second;
  if (start >= obj->size() || (end && *end < start)) {
    err = {SourceFailure::RangeNotSatisfiable, "bytes=" + std::to_string(start) + "-"};
    return nullptr;
  }
  std::uint64_t last = end ? std::min<std::uint64_t>(*end, obj->size() - 1) : obj->size() - 1;
  return std::make_unique<MemoryStream>(obj, static_cast<std::size_t>(start),
                                        static_cast<std::size_t>(last - start + 1));
}

}
