#include "jsonl_resumable/batch_processor.hpp"
#include "jsonl_resumable/errors.hpp"
#include "jsonl_resumable/jsonl_index.hpp"
#include "test_support.hpp"

#include <stdexcept>
#include <thread>
#include <vector>

using jr::JobStatus;
using jr_test::TempDir;

static int pause_and_resume() {
  TempDir dir("batch");
  const fs::path f = dir / "data.jsonl";
  jr_test::write_text(f, jr_test::numbered_jsonl(0, 100));
  jr::JsonlIndex idx(f.string());

  std::vector<std::uint64_t> seen;
  bool trimmed = true;
  {
    jr::BatchProcessor bp(idx, "embed");
    JR_CHECK(bp.start_or_resume() == JobStatus::NotStarted, "new job");
    JR_CHECK(fs::exists(bp.store().path_for("embed")), "new record persisted immediately");
    auto st = bp.run([&](std::uint64_t n, std::string_view text) {
      if (text.empty() || text.back() != '}') trimmed = false;
      seen.push_back(n);
      return true;
    }, 30);
    JR_CHECK(st == JobStatus::Paused && bp.next_line() == 30, "max_lines pauses");
    JR_CHECK(trimmed, "handler gets text without the terminator");
  }
  {
    jr::BatchProcessor bp(idx, "embed");
    JR_CHECK(bp.start_or_resume() == JobStatus::Paused, "paused job resumes");
    JR_CHECK(bp.next_line() == 30 && bp.progress_pct() == 30.0, "resume point");
    auto st = bp.run([&](std::uint64_t n, std::string_view) { seen.push_back(n); return true; });
    JR_CHECK(st == JobStatus::Completed, "runs to completion");
    JR_CHECK(bp.total_processed() == 100, "processed count carried across runs");
    JR_CHECK(!bp.progress().completed_at.empty(), "completed_at set");
  }
  JR_CHECK(seen.size() == 100, "every line exactly once without a crash");
  for (std::uint64_t i = 0; i < 100; ++i) JR_CHECK(seen[i] == i, "order at " << i);

  {
    jr::BatchProcessor bp(idx, "embed");
    std::uint64_t calls = 0;
    auto st = bp.run([&](std::uint64_t, std::string_view) { ++calls; return true; });
    JR_CHECK(st == JobStatus::Completed && calls == 0, "completed job does nothing");
    bp.reset();
    JR_CHECK(bp.status() == JobStatus::NotStarted && bp.next_line() == 0, "reset");
    JR_CHECK(!fs::exists(bp.store().path_for("embed")), "reset removes the record");
  }
  {
    jr::BatchProcessor bp(idx, "stop-early");
    auto st = bp.run([&](std::uint64_t n, std::string_view) { return n < 10; });
    JR_CHECK(st == JobStatus::Paused && bp.next_line() == 11, "handler pause confirms its own line");
  }
  return 0;
}

static int failure_persists_last_confirmed() {
  TempDir dir("batch");
  const fs::path f = dir / "data.jsonl";
  jr_test::write_text(f, jr_test::numbered_jsonl(0, 60));
  jr::JsonlIndex idx(f.string());

  {
    jr::BatchProcessor bp(idx, "flaky");
    bool threw = false;
    try {
      bp.run([&](std::uint64_t n, std::string_view) -> bool {
        if (n == 25) throw std::runtime_error("downstream unavailable");
        return true;
      });
    } catch (const std::runtime_error& e) {
      threw = std::string(e.what()) == "downstream unavailable";
    }
    JR_CHECK(threw, "handler exception is rethrown unchanged");
    JR_CHECK(bp.status() == JobStatus::Failed && bp.next_line() == 25, "failed at 25");
  }
  {
    auto info = jr::BatchProcessor::get_job(idx, "flaky");
    JR_CHECK(info && info->status == JobStatus::Failed && info->next_line == 25, "failure persisted");
    jr::BatchProcessor bp(idx, "flaky");
    std::uint64_t first = 0;
    bool got = false;
    bp.run([&](std::uint64_t n, std::string_view) {
      if (!got) { first = n; got = true; }
      return true;
    });
    JR_CHECK(first == 25, "resume re-delivers the failed line");
    JR_CHECK(bp.status() == JobStatus::Completed, "then completes");
  }
  return 0;
}

static int crash_redelivers_from_last_checkpoint() {
  TempDir dir("batch");
  const fs::path f = dir / "data.jsonl";
  jr_test::write_text(f, jr_test::numbered_jsonl(0, 80));
  jr::JsonlIndex idx(f.string());

  jr::BatchProcessor::Config cfg;
  cfg.checkpoint_every_lines = 10;
  cfg.checkpoint_every = std::chrono::milliseconds(0);

  std::string snapshot;
  fs::path record;
  {
    jr::BatchProcessor bp(idx, "crashy", cfg);
    record = bp.store().path_for("crashy");
    bp.run([&](std::uint64_t n, std::string_view) {
      if (n == 47) snapshot = jr_test::read_text(record);   // state on disk if we died here
      return true;
    });
    JR_CHECK(bp.status() == JobStatus::Completed, "first pass completes");
  }
  JR_CHECK(snapshot.find("\"next_line\":40") != std::string::npos, "checkpoint every 10 lines: " << snapshot);

  jr_test::write_text(record, snapshot);
  jr::BatchProcessor bp(idx, "crashy", cfg);
  std::vector<std::uint64_t> again;
  bp.run([&](std::uint64_t n, std::string_view) { again.push_back(n); return true; });
  JR_CHECK(!again.empty() && again.front() == 40 && again.back() == 79, "redelivery starts at the persisted line");
  JR_CHECK(again.size() == 40, "lines 40..79 delivered again");
  return 0;
}

static int time_trigger() {
  TempDir dir("batch");
  const fs::path f = dir / "data.jsonl";
  jr_test::write_text(f, jr_test::numbered_jsonl(0, 12));
  jr::JsonlIndex idx(f.string());

  jr::BatchProcessor::Config cfg;
  cfg.checkpoint_every_lines = 0;
  cfg.checkpoint_every = std::chrono::milliseconds(1);
  jr::BatchProcessor bp(idx, "timed", cfg);
  std::uint64_t persisted_at_10 = 0;
  bp.run([&](std::uint64_t n, std::string_view) {
    std::this_thread::sleep_for(std::chrono::milliseconds(3));
    if (n == 10) persisted_at_10 = bp.store().load("timed")->next_line;
    return true;
  });
  JR_CHECK(persisted_at_10 >= 5, "elapsed time triggers saves, got " << persisted_at_10);
  return 0;
}

static int staleness_and_validation() {
  TempDir dir("batch");
  const fs::path f = dir / "data.jsonl";
  jr_test::write_text(f, jr_test::numbered_jsonl(0, 40));
  jr::JsonlIndex idx(f.string());

  {
    jr::BatchProcessor bp(idx, "old");
    bp.run([](std::uint64_t, std::string_view) { return true; }, 10);
  }
  jr_test::append_text(f, jr_test::numbered_jsonl(40, 45));
  jr_test::bump_mtime(f);
  idx.update();

  auto info = jr::BatchProcessor::get_job(idx, "old");
  JR_CHECK(info && info->is_stale, "job listed as stale");
  {
    jr::BatchProcessor bp(idx, "old");
    JR_CHECK(jr_test::throws<jr::StaleCheckpointError>([&]{ bp.start_or_resume(); }), "stale job refuses to resume");
    bp.reset();
    JR_CHECK(bp.start_or_resume() == JobStatus::NotStarted, "reset clears staleness");
  }

  // Identity matches but next_line points past the end.
  {
    jr::BatchProcessor bp(idx, "bogus");
    bp.start_or_resume();
    jr::JobProgress p = bp.progress();
    p.next_line = 1000;
    bp.store().save(p);
    jr::BatchProcessor again(idx, "bogus");
    JR_CHECK(jr_test::throws<jr::InvalidCheckpointError>([&]{ again.start_or_resume(); }), "next_line > total");
  }
  {
    jr::BatchProcessor bp(idx, "garbled");
    jr_test::write_text(bp.store().path_for("garbled"), "{\"format_version\":1,");
    JR_CHECK(jr_test::throws<jr::InvalidCheckpointError>([&]{ bp.start_or_resume(); }), "malformed record");
  }
  return 0;
}

static int index_updated_after_start() {
  TempDir dir("batch");
  const fs::path f = dir / "data.jsonl";
  jr_test::write_text(f, jr_test::numbered_jsonl(0, 10));
  jr::JsonlIndex idx(f.string());

  jr::BatchProcessor bp(idx, "job");
  JR_CHECK(bp.start_or_resume() == JobStatus::NotStarted, "started on 10 lines");
  jr_test::append_text(f, jr_test::numbered_jsonl(10, 15));
  jr_test::bump_mtime(f);
  JR_CHECK(idx.update() == 5 && idx.total_lines() == 15, "index now sees 15 lines");

  std::uint64_t calls = 0;
  JR_CHECK(jr_test::throws<jr::StaleCheckpointError>([&]{
    bp.run([&](std::uint64_t, std::string_view) { ++calls; return true; }, 12);
  }), "run refuses a job started against the old file");
  JR_CHECK(calls == 0 && bp.next_line() == 0, "no line delivered");

  auto rec = bp.store().load("job");
  JR_CHECK(rec && rec->next_line == 0 && rec->status == JobStatus::NotStarted, "record untouched");

  bp.reset();
  auto st = bp.run([&](std::uint64_t, std::string_view) { ++calls; return true; });
  JR_CHECK(st == JobStatus::Completed && calls == 15, "reset job runs over the new file");
  jr::BatchProcessor again(idx, "job");
  JR_CHECK(again.start_or_resume() == JobStatus::Completed, "record matches the updated file");
  return 0;
}

static int parsed_runs_and_job_management() {
  TempDir dir("batch");
  const fs::path f = dir / "data.jsonl";
  jr_test::write_text(f, "{\"v\":1}\nnot json\n{\"v\":3}\n");
  jr::JsonlIndex idx(f.string());

  jr::BatchProcessor::Config cfg;
  cfg.progress_dir = dir / "jobs";
  {
    jr::BatchProcessor bp(idx, "parse-skip", cfg);
    jr::DecodePolicy skip;
    skip.on_error = jr::OnDecodeError::Skip;
    std::vector<std::string> vals;
    auto st = bp.run_parsed([&](std::uint64_t, const jr::Record& r) { vals.push_back(*r.get("v")); return true; }, skip);
    JR_CHECK(st == JobStatus::Completed && (vals == std::vector<std::string>{"1", "3"}), "skip in run_parsed");
    JR_CHECK(bp.total_processed() == 2 && bp.next_line() == 3, "skipped line advances without counting");
  }
  {
    jr::BatchProcessor bp(idx, "parse-raise", cfg);
    JR_CHECK(jr_test::throws<jr::DecodeError>([&]{
      bp.run_parsed([](std::uint64_t, const jr::Record&) { return true; });
    }), "raise policy fails the job");
    JR_CHECK(bp.status() == JobStatus::Failed && bp.next_line() == 1, "failed at the bad line");
  }
  {
    jr::BatchProcessor bp(idx, "paused", cfg);
    bp.run([](std::uint64_t, std::string_view) { return true; }, 1);
  }

  auto jobs = jr::BatchProcessor::list_jobs(idx, cfg.progress_dir);
  JR_CHECK(jobs.size() == 3, "three jobs, got " << jobs.size());
  JR_CHECK(jobs[0].job_id == "parse-raise" && jobs[1].job_id == "parse-skip" && jobs[2].job_id == "paused",
           "sorted by id");
  JR_CHECK(jobs[1].status == JobStatus::Completed && jobs[1].progress_pct == 100.0, "completed info");
  JR_CHECK(jobs[2].total_lines == 3 && jobs[2].next_line == 1 && !jobs[2].is_stale, "paused info");

  JR_CHECK(jr::BatchProcessor::remove_completed_jobs(idx, cfg.progress_dir) == 1, "one completed job removed");
  JR_CHECK(jr::BatchProcessor::list_jobs(idx, cfg.progress_dir).size() == 2, "two left");
  JR_CHECK(jr::BatchProcessor::remove_job(idx, "paused", cfg.progress_dir), "remove job");
  JR_CHECK(!jr::BatchProcessor::get_job(idx, "paused", cfg.progress_dir), "gone");

  cfg.remove_on_complete = true;
  {
    jr::BatchProcessor bp(idx, "ephemeral", cfg);
    bp.run([](std::uint64_t, std::string_view) { return true; });
    JR_CHECK(bp.status() == JobStatus::Completed && !fs::exists(bp.store().path_for("ephemeral")),
             "remove_on_complete deletes the record");
  }

  const fs::path empty = dir / "empty.jsonl";
  jr_test::write_text(empty, "");
  jr::JsonlIndex e(empty.string());
  jr::BatchProcessor eb(e, "nothing");
  JR_CHECK(eb.run([](std::uint64_t, std::string_view) { return true; }) == JobStatus::Completed,
           "empty file completes immediately");
  JR_CHECK(eb.progress_pct() == 100.0, "empty file is 100%");
  return 0;
}

int main() {
  if (pause_and_resume()) return 1;
  if (failure_persists_last_confirmed()) return 1;
  if (crash_redelivers_from_last_checkpoint()) return 1;
  if (time_trigger()) return 1;
  if (staleness_and_validation()) return 1;
  if (index_updated_after_start()) return 1;
  if (parsed_runs_and_job_management()) return 1;
  std::cout << "[PASS] batch_resume\n";
  return 0;
}
