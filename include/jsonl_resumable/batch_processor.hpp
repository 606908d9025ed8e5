#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "jsonl_resumable/decode_policy.hpp"
#include "jsonl_resumable/jsonl_index.hpp"
#include "jsonl_resumable/progress_store.hpp"

namespace jr {

// Resumable walk over an indexed file with persisted progress.
//
// Delivery is at-least-once: progress is persisted every
// `checkpoint_every_lines` lines or `checkpoint_every`, whichever comes
// first, and on pause, failure and completion. Lines confirmed after the
// last persisted checkpoint are delivered again if the process dies before
// the next one. Handlers should be idempotent or deduplicate by line number.
class BatchProcessor {
public:
  struct Config {
    std::filesystem::path progress_dir;              // empty -> "<source>.progress"
    std::uint64_t checkpoint_every_lines = 1000;     // 0 disables the line trigger
    std::chrono::milliseconds checkpoint_every{5000}; // 0 disables the time trigger
    bool remove_on_complete = false;                 // delete the record instead of marking it
    bool verbose = false;                            // "[batch]" lines on stderr
  };

  // Returning false pauses the job after that line has been confirmed.
  using LineHandler   = std::function<bool(std::uint64_t line, std::string_view text)>;
  using RecordHandler = std::function<bool(std::uint64_t line, const Record& rec)>;

  // `index` must outlive the processor.
  BatchProcessor(JsonlIndex& index, std::string job_id);
  BatchProcessor(JsonlIndex& index, std::string job_id, Config cfg);

  // Load the job record or create one at line 0 (persisted immediately).
  // Throws StaleCheckpointError when the record was written against a
  // different (size, mtime) than the index holds, InvalidCheckpointError
  // when it is malformed or points past the end.
  JobStatus start_or_resume();

  // Feed lines from next_line() to `handler`. Calls start_or_resume() when
  // needed. A handler exception persists the last confirmed line, moves the
  // job to Failed and is rethrown. Throws StaleCheckpointError, touching
  // nothing, if the index was updated to a different (size, mtime) since the
  // job was started.
  JobStatus run(const LineHandler& handler,
                std::uint64_t max_lines = JsonlIndex::kUnbounded);

  // Like run() with each line decoded first. Lines dropped by a Skip policy
  // advance the job without reaching the handler.
  JobStatus run_parsed(const RecordHandler& handler, DecodePolicy policy = {},
                       std::uint64_t max_lines = JsonlIndex::kUnbounded);

  // Persist now.
  void checkpoint();

  // Delete the record and return to NotStarted at line 0.
  void reset();

  const std::string& job_id() const noexcept { return progress_.job_id; }
  JobStatus status() const noexcept { return progress_.status; }
  std::uint64_t next_line() const noexcept { return progress_.next_line; }
  std::uint64_t total_processed() const noexcept { return progress_.total_processed; }
  std::uint64_t total_lines() const { return index_.total_lines(); }
  double progress_pct() const;
  const JobProgress& progress() const noexcept { return progress_; }
  const ProgressStore& store() const noexcept { return store_; }

  // Job management over a progress directory (empty -> "<source>.progress").
  static std::vector<JobInfo> list_jobs(const JsonlIndex& index,
                                        const std::filesystem::path& progress_dir = {});
  static std::optional<JobInfo> get_job(const JsonlIndex& index, std::string_view job_id,
                                        const std::filesystem::path& progress_dir = {});
  static bool remove_job(const JsonlIndex& index, std::string_view job_id,
                         const std::filesystem::path& progress_dir = {});
  static std::size_t remove_completed_jobs(const JsonlIndex& index,
                                           const std::filesystem::path& progress_dir = {});

private:
  using Step = std::function<bool(const Line&)>;
  JobStatus drive(const Step& step, std::uint64_t max_lines);
  void persist();
  void log(const std::string& msg) const;

  JsonlIndex& index_;
  Config cfg_;
  ProgressStore store_;
  JobProgress progress_;
  bool started_ = false;
};

}
