#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "jsonl_resumable/index_meta.hpp"

namespace jr {

enum class JobStatus { NotStarted, Running, Paused, Completed, Failed };

std::string_view to_string(JobStatus s) noexcept;
std::optional<JobStatus> parse_job_status(std::string_view s) noexcept;

// Persisted state of one batch job.
struct JobProgress {
  static constexpr int kFormatVersion = 1;

  std::string job_id;
  FileIdentity identity;               // data file the job was started against
  std::uint64_t next_line = 0;         // first line not yet confirmed
  std::uint64_t total_processed = 0;
  JobStatus status = JobStatus::NotStarted;
  std::string created_at;
  std::string updated_at;
  std::string completed_at;            // empty until completed
};

// Summary row for job listings.
struct JobInfo {
  std::string job_id;
  JobStatus status = JobStatus::NotStarted;
  std::uint64_t next_line = 0;
  std::uint64_t total_processed = 0;
  std::uint64_t total_lines = 0;
  double progress_pct = 0.0;
  bool is_stale = false;               // recorded identity differs from the index
  std::string created_at;
  std::string updated_at;
  std::string completed_at;
};

// One JSON file per job under `dir`:
// {"format_version":1,"job_id":"..","source_size":N,"source_mtime_ns":N,
//  "next_line":N,"total_processed":N,"status":"..","created_at":"..",
//  "updated_at":"..","completed_at":".."|null}
class ProgressStore {
public:
  explicit ProgressStore(std::filesystem::path dir);

  const std::filesystem::path& dir() const noexcept { return dir_; }
  std::filesystem::path path_for(std::string_view job_id) const;

  // Atomic replace. Throws Error on I/O failure.
  void save(const JobProgress& p) const;

  // nullopt when no record exists. Throws InvalidCheckpointError when the
  // record is unreadable or malformed.
  std::optional<JobProgress> load(std::string_view job_id) const;

  // Every readable record in the directory; malformed files are skipped.
  std::vector<JobProgress> list() const;

  // Returns true when a record was removed.
  bool remove(std::string_view job_id) const;

  static std::string to_json(const JobProgress& p);
  static JobProgress from_json(std::string_view json, const std::string& origin = "<memory>");

private:
  std::filesystem::path dir_;
};

}
