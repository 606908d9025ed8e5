#include "jsonl_resumable/metrics.hpp"
#include <chrono>

namespace jr {

void MetricsRegistry::reset() {
  file_opens_ = bytes_scanned_ = lines_scanned_ = 0;
  rebuilds_ = updates_ = resolves_ = 0;
  std::lock_guard<std::mutex> lk(mu_);
  stage_accum_ms_.clear();
  stage_starts_.clear();
}

void MetricsRegistry::start_stage(std::string_view name) {
  std::lock_guard<std::mutex> lk(mu_);
  stage_starts_[std::string(name)] = std::chrono::steady_clock::now();
}

void MetricsRegistry::end_stage(std::string_view name) {
  std::lock_guard<std::mutex> lk(mu_);
  auto key = std::string(name);
  auto it = stage_starts_.find(key);
  if (it == stage_starts_.end()) return;
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
              std::chrono::steady_clock::now() - it->second).count();
  stage_accum_ms_[key] += static_cast<std::uint64_t>(ms);
  stage_starts_.erase(it);
}

IndexStats MetricsRegistry::snapshot() const {
  IndexStats s;
  s.file_opens = file_opens_;
  s.bytes_scanned = bytes_scanned_;
  s.lines_scanned = lines_scanned_;
  s.rebuilds = rebuilds_;
  s.updates = updates_;
  s.resolves = resolves_;

  std::lock_guard<std::mutex> lk(mu_);
  s.stages.reserve(stage_accum_ms_.size());
  for (auto& kv : stage_accum_ms_) s.stages.push_back(StageTiming{kv.first, kv.second});
  return s;
}

}
