#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace jr {

struct StageTiming {
  std::string name;
  std::uint64_t duration_ms = 0;
};

struct IndexStats {
  std::uint64_t file_opens = 0;
  std::uint64_t bytes_scanned = 0;
  std::uint64_t lines_scanned = 0;
  std::uint64_t rebuilds = 0;
  std::uint64_t updates = 0;
  std::uint64_t resolves = 0;
  std::vector<StageTiming> stages;
};

// Counters are atomic; readers update them concurrently.
class MetricsRegistry {
public:
  void reset();
  void add_file_open() noexcept { ++file_opens_; }
  void add_scan(std::uint64_t bytes, std::uint64_t lines) noexcept {
    bytes_scanned_ += bytes;
    lines_scanned_ += lines;
  }
  void add_rebuild() noexcept { ++rebuilds_; }
  void add_update() noexcept { ++updates_; }
  void add_resolve() noexcept { ++resolves_; }

  void start_stage(std::string_view name);
  void end_stage(std::string_view name);

  std::uint64_t file_opens() const noexcept { return file_opens_; }
  std::uint64_t bytes_scanned() const noexcept { return bytes_scanned_; }
  std::uint64_t lines_scanned() const noexcept { return lines_scanned_; }
  std::uint64_t rebuilds() const noexcept { return rebuilds_; }

  IndexStats snapshot() const;

private:
  std::atomic<std::uint64_t> file_opens_{0};
  std::atomic<std::uint64_t> bytes_scanned_{0};
  std::atomic<std::uint64_t> lines_scanned_{0};
  std::atomic<std::uint64_t> rebuilds_{0};
  std::atomic<std::uint64_t> updates_{0};
  std::atomic<std::uint64_t> resolves_{0};

  mutable std::mutex mu_;
  std::unordered_map<std::string, std::uint64_t> stage_accum_ms_;
  std::unordered_map<std::string, std::chrono::steady_clock::time_point> stage_starts_;
};

}
