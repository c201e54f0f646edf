#include "csv_pager/memory_source.hpp"
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

static std::string drain(cp::ByteStream& s, cp::Deadline deadline) {
  std::string out;
  char buf[4];
  cp::SourceError se;
  for (long long n; (n = s.read(buf, sizeof(buf), deadline, se)) > 0;) out.append(buf, static_cast<std::size_t>(n));
  return out;
}

int main(){
  const auto deadline = cp::Clock::now() + std::chrono::seconds(30);
  cp::SourceError se;

  // --- put() on an open key does not move the stream's bytes
  cp::MemoryByteSource src;
  src.put("k.csv", "a,b\n1,2\n");
  auto s = src.open_range("k.csv", 4, std::nullopt, deadline, se);
  if (!s) { std::cerr << "[FAIL] open\n"; return 1; }
  src.put("k.csv", "x\n");
  if (drain(*s, deadline) != "1,2\n") { std::cerr << "[FAIL] stream saw replaced bytes\n"; return 1; }

  std::uint64_t size = 0;
  if (!src.exists("k.csv", deadline, size, se) || size != 2) { std::cerr << "[FAIL] replaced size\n"; return 1; }

  // --- stream outlives its source
  std::unique_ptr<cp::ByteStream> orphan;
  {
    cp::MemoryByteSource scoped;
    scoped.put("o.csv", "id\n7\n8\n");
    orphan = scoped.open_range("o.csv", 3, 5, deadline, se);
  }
  if (!orphan || drain(*orphan, deadline) != "7\n8") { std::cerr << "[FAIL] stream after source destroyed\n"; return 1; }

  // --- failures
  src.fail_with("k.csv", cp::SourceFailure::PermissionDenied);
  if (src.open_range("k.csv", 0, std::nullopt, deadline, se) || se.failure != cp::SourceFailure::PermissionDenied) {
    std::cerr << "[FAIL] injected failure\n"; return 1;
  }
  src.clear_failure("k.csv");
  if (src.open_range("k.csv", 2, std::nullopt, deadline, se) || se.failure != cp::SourceFailure::RangeNotSatisfiable) {
    std::cerr << "[FAIL] range past the end\n"; return 1;
  }
  if (src.range_requests() != 3) { std::cerr << "[FAIL] range request count\n"; return 1; }

  std::cout << "[PASS] memory byte source\n";
  return 0;
}
