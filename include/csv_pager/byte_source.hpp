#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace cp {

using Clock = std::chrono::steady_clock;
using Deadline = Clock::time_point;

// Classified byte source failures.
enum class SourceFailure {
  None,
  NotFound,
  PermissionDenied,
  Redirected,
  RangeNotSatisfiable,
  Timeout,
  Other
};

struct SourceError {
  SourceFailure failure = SourceFailure::None;
  std::string detail; // transport-specific text, may be empty
};

// Human-readable reason, e.g. "object not found".
std::string_view describe(SourceFailure f) noexcept;

inline bool expired(Deadline d) noexcept { return Clock::now() >= d; }

// One open byte range. read() returns the number of bytes copied into `buf`,
// 0 at end of range, or -1 on failure (with `err` filled).
class ByteStream {
public:
  virtual ~ByteStream() = default;
  virtual long long read(char* buf, std::size_t n, Deadline deadline, SourceError& err) = 0;
};

// Object store seen as a key -> bytes map with ranged access.
class ByteSource {
public:
  virtual ~ByteSource() = default;

  // Size of the object in bytes.
  virtual bool exists(std::string_view key, Deadline deadline,
                      std::uint64_t& size_out, SourceError& err) = 0;

  // Open [start, end] (inclusive); std::nullopt means "to the end of object".
  virtual std::unique_ptr<ByteStream> open_range(std::string_view key,
                                                 std::uint64_t start,
                                                 std::optional<std::uint64_t> end,
                                                 Deadline deadline,
                                                 SourceError& err) = 0;
};

}
