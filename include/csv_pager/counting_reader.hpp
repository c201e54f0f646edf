#pragma once
#include "csv_pager/byte_source.hpp"
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace cp {

// Buffered pull reader over one ByteStream. consumed() is the exact number of
// bytes handed out by get()/skip(); peeks never move it.
class CountingReader {
public:
  struct Config {
    std::size_t buffer_bytes = 64 * 1024; // refill size; at least 4 (BOM peek)
  };

  enum class Status { Ok, End, Failed };

  CountingReader(ByteStream& in, Deadline deadline);
  CountingReader(ByteStream& in, Deadline deadline, Config cfg);

  Status get(char& c) {
    if (head_ == tail_ && !fill(1)) return failed_ ? Status::Failed : Status::End;
    c = buf_[head_++];
    ++consumed_;
    return Status::Ok;
  }

  Status peek(char& c) {
    if (head_ == tail_ && !fill(1)) return failed_ ? Status::Failed : Status::End;
    c = buf_[head_];
    return Status::Ok;
  }

  // View of up to n buffered bytes (fewer only at end of stream). Valid until
  // the next call on this reader.
  Status peek_n(std::size_t n, std::string_view& out);

  Status skip(std::size_t n);

  std::uint64_t consumed() const noexcept { return consumed_; }
  const SourceError& error() const noexcept { return err_; }

private:
  // Make at least `want` bytes available unless the stream ends first.
  // Returns false when nothing is buffered afterwards.
  bool fill(std::size_t want);

  ByteStream& in_;
  Deadline deadline_;
  std::vector<char> buf_;
  std::size_t head_{0};
  std::size_t tail_{0};
  std::uint64_t consumed_{0};
  bool eof_{false};
  bool failed_{false};
  SourceError err_;
};

}
