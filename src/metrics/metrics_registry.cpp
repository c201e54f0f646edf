#include "csv_pager/metrics.hpp"
#include <algorithm>
#include <chrono>

namespace cp {

void MetricsRegistry::start_stage(std::string_view name) {
  auto key = std::string(name);
  if (stage_accum_ms_.find(key) == stage_accum_ms_.end()) {
    stage_accum_ms_[key] = 0.0;
    stage_order_.push_back(key);
  }
  stage_starts_[key] = std::chrono::steady_clock::now();
}

void MetricsRegistry::end_stage(std::string_view name) {
  auto key = std::string(name);
  auto it = stage_starts_.find(key);
  if (it == stage_starts_.end()) return;
  std::chrono::duration<double, std::milli> ms = std::chrono::steady_clock::now() - it->second;
  stage_accum_ms_[key] += ms.count();
  stage_starts_.erase(it);
}

void MetricsRegistry::add_field_error(std::string_view field) {
  ++field_errs_[std::string(field)];
}

PageStats MetricsRegistry::snapshot(double wall_ms) const {
  PageStats s;
  s.rows = rows_;
  s.blank_rows = blank_rows_;
  s.bytes = bytes_;
  s.header_bytes = header_bytes_;
  s.range_requests = range_requests_;
  s.headers_from_cursor = headers_from_cursor_;
  s.wall_time_ms = wall_ms;
  s.errors_by_field = field_errs_;
  s.stages.reserve(stage_order_.size());
  for (const auto& name : stage_order_) s.stages.push_back(StageTiming{name, stage_accum_ms_.at(name)});
  return s;
}

}
