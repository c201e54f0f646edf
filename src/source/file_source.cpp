#include "csv_pager/file_source.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <system_error>

namespace cp {

namespace {

SourceFailure classify_errno(int e) {
  switch (e) {
    case ENOENT:
    case ENOTDIR: return SourceFailure::NotFound;
    case EACCES:
    case EPERM:   return SourceFailure::PermissionDenied;
    default:      return SourceFailure::Other;
  }
}

class FileStream : public ByteStream {
public:
  FileStream(std::FILE* f, std::uint64_t remaining) : f_(f), remaining_(remaining) {}
  ~FileStream() override { if (f_) std::fclose(f_); }
  FileStream(const FileStream&) = delete;
  FileStream& operator=(const FileStream&) = delete;

  long long read(char* buf, std::size_t n, Deadline deadline, SourceError& err) override {
    if (expired(deadline)) {
      err = {SourceFailure::Timeout, "deadline elapsed before read"};
      return -1;
    }
    if (remaining_ == 0) return 0;
    if (n > remaining_) n = static_cast<std::size_t>(remaining_);
    std::size_t got = std::fread(buf, 1, n, f_);
    if (got == 0 && std::ferror(f_)) {
      err = {classify_errno(errno), std::strerror(errno)};
      return -1;
    }
    remaining_ -= got;
    return static_cast<long long>(got);
  }

private:
  std::FILE* f_;
  std::uint64_t remaining_;
};

}

FileByteSource::FileByteSource(std::filesystem::path root) : root_(std::move(root)) {}

std::filesystem::path FileByteSource::resolve(std::string_view key) const {
  std::filesystem::path rel = std::filesystem::path(std::string(key)).lexically_normal();
  if (rel.is_absolute() || (!rel.empty() && *rel.begin() == "..")) return {};
  return root_ / rel;
}

bool FileByteSource::exists(std::string_view key, Deadline deadline,
                            std::uint64_t& size_out, SourceError& err) {
  if (expired(deadline)) { err = {SourceFailure::Timeout, "deadline elapsed"}; return false; }
  auto p = resolve(key);
  if (p.empty()) { err = {SourceFailure::PermissionDenied, "key escapes root"}; return false; }
  std::error_code ec;
  auto st = std::filesystem::status(p, ec);
  if (ec || !std::filesystem::exists(st)) {
    err = {ec ? classify_errno(ec.value()) : SourceFailure::NotFound, p.string()};
    return false;
  }
  if (!std::filesystem::is_regular_file(st)) {
    err = {SourceFailure::NotFound, "not a regular file: " + p.string()};
    return false;
  }
  size_out = std::filesystem::file_size(p, ec);
  if (ec) { err = {classify_errno(ec.value()), ec.message()}; return false; }
  return true;
}

std::unique_ptr<ByteStream> FileByteSource::open_range(std::string_view key,
                                                       std::uint64_t start,
                                                       std::optional<std::uint64_t> end,
                                                       Deadline deadline,
                                                       SourceError& err) {
  std::uint64_t size = 0;
  if (!exists(key, deadline, size, err)) return nullptr;
  if (start >= size || (end && *end < start)) {
    err = {SourceFailure::RangeNotSatisfiable, "bytes=" + std::to_string(start) + "-"};
    return nullptr;
  }
  std::uint64_t last = (end && *end < size) ? *end : size - 1;

  const auto p = resolve(key);
  std::FILE* f = std::fopen(p.string().c_str(), "rb");
  if (!f) { err = {classify_errno(errno), std::strerror(errno)}; return nullptr; }
  if (std::fseek(f, static_cast<long>(start), SEEK_SET) != 0) {
    err = {classify_errno(errno), std::strerror(errno)};
    std::fclose(f);
    return nullptr;
  }
  return std::make_unique<FileStream>(f, last - start + 1);
}

}
