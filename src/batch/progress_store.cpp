#include "jsonl_resumable/progress_store.hpp"
#include "jsonl_resumable/date_parse.hpp"
#include "jsonl_resumable/errors.hpp"
#include "jsonl_resumable/json_record.hpp"
#include "jsonl_resumable/path_utils.hpp"

#include <simdjson.h>
#include <algorithm>
#include <system_error>
#include <utility>

namespace jr {

std::string_view to_string(JobStatus s) noexcept {
  switch (s) {
    case JobStatus::NotStarted: return "not_started";
    case JobStatus::Running:    return "running";
    case JobStatus::Paused:     return "paused";
    case JobStatus::Completed:  return "completed";
    case JobStatus::Failed:     return "failed";
  }
  return "not_started";
}

std::optional<JobStatus> parse_job_status(std::string_view s) noexcept {
  if (s == "not_started") return JobStatus::NotStarted;
  if (s == "running")     return JobStatus::Running;
  if (s == "paused")      return JobStatus::Paused;
  if (s == "completed")   return JobStatus::Completed;
  if (s == "failed")      return JobStatus::Failed;
  return std::nullopt;
}

ProgressStore::ProgressStore(std::filesystem::path dir) : dir_(std::move(dir)) {}

std::filesystem::path ProgressStore::path_for(std::string_view job_id) const {
  return dir_ / job_file_name(job_id);
}

std::string ProgressStore::to_json(const JobProgress& p) {
  std::string o;
  o.reserve(320);
  o += "{\"format_version\":" + std::to_string(JobProgress::kFormatVersion) + ",";
  o += "\"job_id\":"; append_json_string(o, p.job_id); o += ",";
  o += "\"source_size\":" + std::to_string(p.identity.size) + ",";
  o += "\"source_mtime_ns\":" + std::to_string(p.identity.mtime_ns) + ",";
  o += "\"next_line\":" + std::to_string(p.next_line) + ",";
  o += "\"total_processed\":" + std::to_string(p.total_processed) + ",";
  o += "\"status\":"; append_json_string(o, to_string(p.status)); o += ",";
  o += "\"created_at\":"; append_json_string(o, p.created_at); o += ",";
  o += "\"updated_at\":"; append_json_string(o, p.updated_at); o += ",";
  o += "\"completed_at\":";
  if (p.completed_at.empty()) o += "null";
  else append_json_string(o, p.completed_at);
  o += "}";
  return o;
}

JobProgress ProgressStore::from_json(std::string_view json, const std::string& origin) {
  JobProgress p;
  bool has_version = false, has_id = false, has_size = false, has_mtime = false,
       has_next = false, has_status = false;

  try {
    simdjson::ondemand::parser parser;
    simdjson::padded_string padded(json);
    simdjson::ondemand::document doc = parser.iterate(padded);
    simdjson::ondemand::object root = doc.get_object();

    for (simdjson::ondemand::field f : root) {
      std::string_view key = f.unescaped_key();
      simdjson::ondemand::value v = f.value();
      if (key == "format_version") {
        std::int64_t ver = v.get_int64();
        if (ver != JobProgress::kFormatVersion)
          throw InvalidCheckpointError(origin + ": unsupported format_version " + std::to_string(ver));
        has_version = true;
      } else if (key == "job_id") {
        p.job_id = std::string(std::string_view(v.get_string()));
        has_id = true;
      } else if (key == "source_size") {
        p.identity.size = v.get_uint64();
        has_size = true;
      } else if (key == "source_mtime_ns") {
        p.identity.mtime_ns = v.get_int64();
        has_mtime = true;
      } else if (key == "next_line") {
        p.next_line = v.get_uint64();
        has_next = true;
      } else if (key == "total_processed") {
        p.total_processed = v.get_uint64();
      } else if (key == "status") {
        std::string_view s = v.get_string();
        auto st = parse_job_status(s);
        if (!st) throw InvalidCheckpointError(origin + ": unknown status \"" + std::string(s) + "\"");
        p.status = *st;
        has_status = true;
      } else if (key == "created_at") {
        p.created_at = std::string(std::string_view(v.get_string()));
      } else if (key == "updated_at") {
        p.updated_at = std::string(std::string_view(v.get_string()));
      } else if (key == "completed_at") {
        bool is_null = v.is_null();
        if (!is_null) p.completed_at = std::string(std::string_view(v.get_string()));
      }
    }
    if (!doc.at_end()) throw InvalidCheckpointError(origin + ": trailing content");
  } catch (const simdjson::simdjson_error& e) {
    throw InvalidCheckpointError(origin + ": malformed progress record: " + e.what());
  }

  if (!has_version) throw InvalidCheckpointError(origin + ": missing format_version");
  if (!has_id)      throw InvalidCheckpointError(origin + ": missing job_id");
  if (!has_size)    throw InvalidCheckpointError(origin + ": missing source_size");
  if (!has_mtime)   throw InvalidCheckpointError(origin + ": missing source_mtime_ns");
  if (!has_next)    throw InvalidCheckpointError(origin + ": missing next_line");
  if (!has_status)  throw InvalidCheckpointError(origin + ": missing status");

  for (const std::string* stamp : {&p.created_at, &p.updated_at, &p.completed_at}) {
    if (!stamp->empty() && !parse_iso8601_ms(*stamp))
      throw InvalidCheckpointError(origin + ": bad timestamp \"" + *stamp + "\"");
  }
  if (p.status == JobStatus::Completed && p.completed_at.empty())
    throw InvalidCheckpointError(origin + ": completed job without completed_at");
  return p;
}

void ProgressStore::save(const JobProgress& p) const {
  std::string err;
  if (!write_file_atomic(path_for(p.job_id), to_json(p), &err))
    throw Error("progress save failed for job \"" + p.job_id + "\": " + err);
}

std::optional<JobProgress> ProgressStore::load(std::string_view job_id) const {
  const auto path = path_for(job_id);
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) return std::nullopt;

  simdjson::padded_string text;
  auto err = simdjson::padded_string::load(path.string()).get(text);
  if (err) throw InvalidCheckpointError(path.string() + ": unreadable: " + simdjson::error_message(err));
  JobProgress p = from_json(std::string_view(text), path.string());
  if (p.job_id != job_id)
    throw InvalidCheckpointError(path.string() + ": record belongs to job \"" + p.job_id + "\"");
  return p;
}

std::vector<JobProgress> ProgressStore::list() const {
  std::vector<JobProgress> out;
  std::error_code ec;
  if (!std::filesystem::is_directory(dir_, ec)) return out;

  for (const auto& entry : std::filesystem::directory_iterator(dir_, ec)) {
    if (!entry.is_regular_file(ec) || entry.path().extension() != ".json") continue;
    simdjson::padded_string text;
    if (simdjson::padded_string::load(entry.path().string()).get(text)) continue;
    try {
      out.push_back(from_json(std::string_view(text), entry.path().string()));
    } catch (const InvalidCheckpointError&) {
      continue;   // foreign or damaged file
    }
  }
  std::sort(out.begin(), out.end(),
            [](const JobProgress& a, const JobProgress& b){ return a.job_id < b.job_id; });
  return out;
}

bool ProgressStore::remove(std::string_view job_id) const {
  std::error_code ec;
  bool removed = std::filesystem::remove(path_for(job_id), ec);
  if (ec) throw Error("cannot remove progress for job \"" + std::string(job_id) + "\": " + ec.message());
  return removed;
}

}
