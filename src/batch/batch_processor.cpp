#include "jsonl_resumable/batch_processor.hpp"
#include "jsonl_resumable/chunk_reader.hpp"
#include "jsonl_resumable/date_parse.hpp"
#include "jsonl_resumable/errors.hpp"
#include "jsonl_resumable/path_utils.hpp"

#include <iostream>
#include <utility>

namespace jr {

namespace {

std::filesystem::path resolve_dir(const JsonlIndex& index, const std::filesystem::path& dir) {
  return dir.empty() ? default_progress_dir(index.source_path()) : dir;
}

double pct(std::uint64_t next, std::uint64_t total) {
  if (total == 0) return 100.0;
  return static_cast<double>(next) * 100.0 / static_cast<double>(total);
}

StaleCheckpointError stale(const std::string& job, const FileIdentity& recorded, const FileIdentity& now) {
  return StaleCheckpointError(
      "job \"" + job + "\" was checkpointed against size=" + std::to_string(recorded.size) +
      " mtime_ns=" + std::to_string(recorded.mtime_ns) + ", data file is now size=" +
      std::to_string(now.size) + " mtime_ns=" + std::to_string(now.mtime_ns) +
      "; reset the job to start over");
}

JobInfo to_info(const JobProgress& p, const FileIdentity& current, std::uint64_t total) {
  JobInfo i;
  i.job_id = p.job_id;
  i.status = p.status;
  i.next_line = p.next_line;
  i.total_processed = p.total_processed;
  i.total_lines = total;
  i.progress_pct = pct(p.next_line, total);
  i.is_stale = p.identity != current;
  i.created_at = p.created_at;
  i.updated_at = p.updated_at;
  i.completed_at = p.completed_at;
  return i;
}

}

BatchProcessor::BatchProcessor(JsonlIndex& index, std::string job_id)
  : BatchProcessor(index, std::move(job_id), Config{}) {}

BatchProcessor::BatchProcessor(JsonlIndex& index, std::string job_id, Config cfg)
  : index_(index), cfg_(std::move(cfg)), store_(resolve_dir(index, cfg_.progress_dir)) {
  if (job_id.empty()) throw Error("job_id must not be empty");
  progress_.job_id = std::move(job_id);
}

void BatchProcessor::log(const std::string& msg) const {
  if (cfg_.verbose) std::cerr << "[batch] " << progress_.job_id << ": " << msg << "\n";
}

void BatchProcessor::persist() {
  progress_.updated_at = now_iso8601();
  store_.save(progress_);
}

JobStatus BatchProcessor::start_or_resume() {
  const FileIdentity id = index_.identity();
  const std::uint64_t total = index_.total_lines();

  auto rec = store_.load(progress_.job_id);
  if (rec) {
    if (rec->identity != id) throw stale(progress_.job_id, rec->identity, id);
    if (rec->next_line > total) {
      throw InvalidCheckpointError(
          "job \"" + progress_.job_id + "\" next_line " + std::to_string(rec->next_line) +
          " exceeds total_lines " + std::to_string(total));
    }
    progress_ = std::move(*rec);
    // A record left in Running belongs to a process that died mid-run.
    if (progress_.status == JobStatus::Running) progress_.status = JobStatus::Paused;
    log("resuming at line " + std::to_string(progress_.next_line) + " (" +
        std::string(to_string(progress_.status)) + ")");
  } else {
    const std::string job = progress_.job_id;
    progress_ = JobProgress{};
    progress_.job_id = job;
    progress_.identity = id;
    progress_.created_at = now_iso8601();
    persist();
    log("new job over " + std::to_string(total) + " lines");
  }
  started_ = true;
  return progress_.status;
}

JobStatus BatchProcessor::drive(const Step& step, std::uint64_t max_lines) {
  if (!started_) start_or_resume();
  // The index may have been updated since start_or_resume().
  const FileIdentity id = index_.identity();
  if (id != progress_.identity) throw stale(progress_.job_id, progress_.identity, id);
  if (progress_.status == JobStatus::Completed) return progress_.status;

  const std::uint64_t total = index_.total_lines();
  progress_.status = JobStatus::Running;
  persist();

  using clock = std::chrono::steady_clock;
  auto last_save = clock::now();
  std::uint64_t since_save = 0;
  std::uint64_t done = 0;

  LineCursor cursor = index_.iterate_from(static_cast<std::int64_t>(progress_.next_line));
  Line line;
  while (done < max_lines && cursor.next(line)) {
    bool keep_going = true;
    try {
      keep_going = step(line);
    } catch (const std::exception& e) {
      cursor.close();
      progress_.status = JobStatus::Failed;
      persist();
      log("failed at line " + std::to_string(line.record.line_number) + ": " + e.what());
      throw;
    }
    progress_.next_line = line.record.line_number + 1;
    ++done;
    ++since_save;

    if (!keep_going) {
      progress_.status = JobStatus::Paused;
      persist();
      log("paused by handler at line " + std::to_string(progress_.next_line));
      return progress_.status;
    }

    const bool by_lines = cfg_.checkpoint_every_lines && since_save >= cfg_.checkpoint_every_lines;
    const bool by_time = cfg_.checkpoint_every.count() > 0 &&
                         clock::now() - last_save >= cfg_.checkpoint_every;
    if (by_lines || by_time) {
      persist();
      since_save = 0;
      last_save = clock::now();
    }
  }
  cursor.close();

  if (progress_.next_line >= total) {
    progress_.status = JobStatus::Completed;
    progress_.completed_at = now_iso8601();
    if (cfg_.remove_on_complete) {
      store_.remove(progress_.job_id);
    } else {
      persist();
    }
    log("completed, " + std::to_string(progress_.total_processed) + " lines processed");
  } else {
    progress_.status = JobStatus::Paused;
    persist();
    log("paused at line " + std::to_string(progress_.next_line));
  }
  return progress_.status;
}

JobStatus BatchProcessor::run(const LineHandler& handler, std::uint64_t max_lines) {
  return drive([&](const Line& l) {
    bool r = handler(l.record.line_number, trim_eol(l.bytes));
    ++progress_.total_processed;
    return r;
  }, max_lines);
}

JobStatus BatchProcessor::run_parsed(const RecordHandler& handler, DecodePolicy policy,
                                     std::uint64_t max_lines) {
  return drive([&](const Line& l) {
    auto rec = policy.decode(l.record.line_number, l.bytes);
    if (!rec) return true;
    bool r = handler(l.record.line_number, *rec);
    ++progress_.total_processed;
    return r;
  }, max_lines);
}

void BatchProcessor::checkpoint() {
  if (!started_) start_or_resume();
  persist();
}

void BatchProcessor::reset() {
  store_.remove(progress_.job_id);
  const std::string job = progress_.job_id;
  progress_ = JobProgress{};
  progress_.job_id = job;
  started_ = false;
  log("reset");
}

double BatchProcessor::progress_pct() const {
  return pct(progress_.next_line, index_.total_lines());
}

std::vector<JobInfo> BatchProcessor::list_jobs(const JsonlIndex& index,
                                               const std::filesystem::path& progress_dir) {
  ProgressStore store(resolve_dir(index, progress_dir));
  const FileIdentity current = index.live_identity();
  const std::uint64_t total = index.total_lines();
  std::vector<JobInfo> out;
  for (const auto& p : store.list()) out.push_back(to_info(p, current, total));
  return out;
}

std::optional<JobInfo> BatchProcessor::get_job(const JsonlIndex& index, std::string_view job_id,
                                               const std::filesystem::path& progress_dir) {
  ProgressStore store(resolve_dir(index, progress_dir));
  auto p = store.load(job_id);
  if (!p) return std::nullopt;
  return to_info(*p, index.live_identity(), index.total_lines());
}

bool BatchProcessor::remove_job(const JsonlIndex& index, std::string_view job_id,
                                const std::filesystem::path& progress_dir) {
  ProgressStore store(resolve_dir(index, progress_dir));
  return store.remove(job_id);
}

std::size_t BatchProcessor::remove_completed_jobs(const JsonlIndex& index,
                                                  const std::filesystem::path& progress_dir) {
  ProgressStore store(resolve_dir(index, progress_dir));
  std::size_t n = 0;
  for (const auto& p : store.list()) {
    if (p.status == JobStatus::Completed && store.remove(p.job_id)) ++n;
  }
  return n;
}

}
