#include "csv_pager/counting_reader.hpp"
#include <algorithm>
#include <cstring>

namespace cp {

CountingReader::CountingReader(ByteStream& in, Deadline deadline)
  : CountingReader(in, deadline, Config{}) {}

CountingReader::CountingReader(ByteStream& in, Deadline deadline, Config cfg)
  : in_(in), deadline_(deadline), buf_(std::max<std::size_t>(cfg.buffer_bytes, 4)) {}

bool CountingReader::fill(std::size_t want) {
  if (failed_) return false;
  if (tail_ - head_ >= want) return true;

  // Slide the unread tail to the front so a peek can span a refill.
  if (head_ > 0) {
    std::memmove(buf_.data(), buf_.data() + head_, tail_ - head_);
    tail_ -= head_;
    head_ = 0;
  }
  while (!eof_ && tail_ < want) {
    if (expired(deadline_)) {
      err_ = {SourceFailure::Timeout, "deadline elapsed while reading"};
      failed_ = true;
      return false;
    }
    long long n = in_.read(buf_.data() + tail_, buf_.size() - tail_, deadline_, err_);
    if (n < 0) { failed_ = true; return false; }
    if (n == 0) { eof_ = true; break; }
    tail_ += static_cast<std::size_t>(n);
  }
  return tail_ > head_;
}

CountingReader::Status CountingReader::peek_n(std::size_t n, std::string_view& out) {
  n = std::min(n, buf_.size());
  if (!fill(n)) {
    out = {};
    return failed_ ? Status::Failed : Status::End;
  }
  out = std::string_view(buf_.data() + head_, std::min(n, tail_ - head_));
  return Status::Ok;
}

CountingReader::Status CountingReader::skip(std::size_t n) {
  while (n > 0) {
    if (head_ == tail_ && !fill(1)) return failed_ ? Status::Failed : Status::End;
    std::size_t k = std::min(n, tail_ - head_);
    head_ += k;
    consumed_ += k;
    n -= k;
  }
  return Status::Ok;
}

}
