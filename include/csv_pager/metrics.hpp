#pragma once
#include <cstdint>
#include <chrono>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cp {

struct StageTiming {
  std::string name;
  double duration_ms = 0.0;
};

struct PageStats {
  std::uint64_t rows = 0;
  std::uint64_t blank_rows = 0;
  std::uint64_t bytes = 0;        // data bytes attributed to the page
  std::uint64_t header_bytes = 0; // BOM + header row, when re-resolved
  std::uint64_t range_requests = 0;
  bool headers_from_cursor = false;
  double wall_time_ms = 0.0;

  std::vector<StageTiming> stages; // in the order they first ran
  std::unordered_map<std::string, std::uint64_t> errors_by_field;
};

// Per-request counters. Not shared between requests.
class MetricsRegistry {
public:
  void add_rows(std::uint64_t n) noexcept { rows_ += n; }
  void add_blank_rows(std::uint64_t n) noexcept { blank_rows_ += n; }
  void add_bytes(std::uint64_t b) noexcept { bytes_ += b; }
  void add_header_bytes(std::uint64_t b) noexcept { header_bytes_ += b; }
  void add_range_request() noexcept { ++range_requests_; }
  void set_headers_from_cursor(bool v) noexcept { headers_from_cursor_ = v; }

  void start_stage(std::string_view name);
  void end_stage(std::string_view name);

  void add_field_error(std::string_view field);
  PageStats snapshot(double wall_ms) const;

private:
  std::uint64_t rows_{0};
  std::uint64_t blank_rows_{0};
  std::uint64_t bytes_{0};
  std::uint64_t header_bytes_{0};
  std::uint64_t range_requests_{0};
  bool headers_from_cursor_{false};
  std::unordered_map<std::string, std::uint64_t> field_errs_;
  std::vector<std::string> stage_order_;
  std::unordered_map<std::string, double> stage_accum_ms_;
  std::unordered_map<std::string, std::chrono::steady_clock::time_point> stage_starts_;
};

// Times one stage for the lifetime of the object; no-op on a null registry.
class StageTimer {
public:
  StageTimer(MetricsRegistry* m, std::string_view name) : m_(m), name_(name) {
    if (m_) m_->start_stage(name_);
  }
  ~StageTimer() { if (m_) m_->end_stage(name_); }
  StageTimer(const StageTimer&) = delete;
  StageTimer& operator=(const StageTimer&) = delete;

private:
  MetricsRegistry* m_;
  std::string_view name_;
};

}
